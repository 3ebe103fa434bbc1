#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace codeexec {

// ---- Time ----

int64_t now_ms();
int64_t now_sec();

// "2026-01-31T12:00:00.123Z"
std::string iso_utc(int64_t epoch_ms);
inline std::string iso_utc_now() { return iso_utc(now_ms()); }

// ---- Environment ----

int64_t getenv_i64(const char* k, int64_t defv);
std::string getenv_str(const char* k, const std::string& defv = "");
bool getenv_bool(const char* k, bool defv);

// ---- Randomness / ids ----

// Cryptographically secure 32-bit random (getrandom, then /dev/urandom).
uint32_t secure_rand32();
std::string random_hex(size_t bytes = 8);

// ---- Files ----

// Write body to dst.tmp, optionally fsync, then rename over dst.
// Returns empty string on success.
std::string write_atomic_file(const std::filesystem::path& dst, const std::string& body, bool fsync_data = false);

// Reads a whole file. Returns false if it cannot be opened.
bool read_file(const std::filesystem::path& p, std::string* out);

// ---- Strings ----

std::string lower_ascii(std::string s);

// Keep at most max_bytes of s (prefix). A UTF-8 sequence split by the cut is dropped.
// Sets *truncated when anything was removed.
std::string truncate_utf8(const std::string& s, size_t max_bytes, bool* truncated = nullptr);

// Exponential backoff: base * 2^(attempt-1), capped at max_ms (attempt >= 1).
int64_t backoff_delay_ms(int attempt, int64_t base_ms, int64_t max_ms);

} // namespace codeexec
