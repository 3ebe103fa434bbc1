#include "codeexec/util.h"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <exception>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>
#if defined(__linux__)
  #include <sys/random.h>
#endif

namespace codeexec {

int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

int64_t now_sec() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

std::string iso_utc(int64_t epoch_ms) {
    std::time_t t = (std::time_t)(epoch_ms / 1000);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << (epoch_ms % 1000) << "Z";
    return oss.str();
}

int64_t getenv_i64(const char* k, int64_t defv) {
    if (const char* v = std::getenv(k)) {
        try { return std::stoll(v); } catch (const std::exception&) { return defv; }
    }
    return defv;
}

std::string getenv_str(const char* k, const std::string& defv) {
    const char* v = std::getenv(k);
    if (!v || !*v) return defv;
    return v;
}

bool getenv_bool(const char* k, bool defv) {
    const char* v = std::getenv(k);
    if (!v) return defv;
    std::string s = lower_ascii(v);
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return defv;
}

uint32_t secure_rand32() {
    uint32_t v = 0;
#if defined(__linux__)
    if (::getrandom(&v, sizeof(v), 0) == (ssize_t)sizeof(v)) return v;
#endif
    FILE* f = std::fopen("/dev/urandom", "rb");
    if (f) {
        size_t got = std::fread(&v, sizeof(v), 1, f);
        std::fclose(f);
        if (got == 1) return v;
    }
    // Both getrandom and /dev/urandom failed — abort rather than return predictable 0
    std::fprintf(stderr, "FATAL: secure_rand32() cannot obtain random bytes\n");
    std::abort();
}

std::string random_hex(size_t bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < bytes; i += 4) {
        uint32_t r = secure_rand32();
        size_t use = (bytes - i) < 4 ? (bytes - i) : 4;
        for (size_t j = 0; j < use; j++) {
            oss << std::setw(2) << ((r >> (j * 8)) & 0xFF);
        }
    }
    return oss.str();
}

std::string write_atomic_file(const std::filesystem::path& dst, const std::string& body, bool fsync_data) {
    std::error_code ec;
    std::filesystem::create_directories(dst.parent_path(), ec);
    if (ec) return std::string("create_directories: ") + ec.message();

    auto tmp = dst;
    tmp += ".tmp." + random_hex(4);

    int fd = ::open(tmp.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) return std::string("open: ") + std::strerror(errno);

    const char* p = body.data();
    size_t off = 0;
    while (off < body.size()) {
        ssize_t w = ::write(fd, p + off, body.size() - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            std::string err = std::string("write: ") + std::strerror(errno);
            ::close(fd);
            std::filesystem::remove(tmp, ec);
            return err;
        }
        off += (size_t)w;
    }
    if (fsync_data && ::fsync(fd) != 0) {
        std::string err = std::string("fsync: ") + std::strerror(errno);
        ::close(fd);
        std::filesystem::remove(tmp, ec);
        return err;
    }
    if (::close(fd) != 0) {
        std::string err = std::string("close: ") + std::strerror(errno);
        std::filesystem::remove(tmp, ec);
        return err;
    }

    std::filesystem::rename(tmp, dst, ec);
    if (ec) {
        std::string err = std::string("rename: ") + ec.message();
        std::filesystem::remove(tmp, ec);
        return err;
    }
    return "";
}

bool read_file(const std::filesystem::path& p, std::string* out) {
    std::ifstream f(p, std::ios::binary);
    if (!f) return false;
    std::ostringstream ss;
    ss << f.rdbuf();
    *out = ss.str();
    return true;
}

std::string lower_ascii(std::string s) {
    for (char& c : s) {
        if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
    }
    return s;
}

std::string truncate_utf8(const std::string& s, size_t max_bytes, bool* truncated) {
    if (truncated) *truncated = false;
    if (s.size() <= max_bytes) return s;
    if (truncated) *truncated = true;

    size_t cut = max_bytes;
    // Walk back over continuation bytes to the lead byte of the last sequence.
    size_t lead = cut;
    while (lead > 0 && ((unsigned char)s[lead - 1] & 0xC0) == 0x80 && cut - lead < 3) lead--;
    if (lead > 0) {
        unsigned char c = (unsigned char)s[lead - 1];
        size_t need = 1;
        if ((c & 0xE0) == 0xC0) need = 2;
        else if ((c & 0xF0) == 0xE0) need = 3;
        else if ((c & 0xF8) == 0xF0) need = 4;
        size_t have = cut - (lead - 1);
        if (need > 1 && have < need) cut = lead - 1;
    }
    return s.substr(0, cut);
}

int64_t backoff_delay_ms(int attempt, int64_t base_ms, int64_t max_ms) {
    if (base_ms < 0) base_ms = 0;
    if (attempt < 1) attempt = 1;
    int64_t d = base_ms;
    for (int i = 1; i < attempt; i++) {
        d *= 2;
        if (max_ms > 0 && d >= max_ms) return max_ms;
    }
    if (max_ms > 0 && d > max_ms) d = max_ms;
    return d;
}

} // namespace codeexec
