#include "codeexec/queue.h"
#include "codeexec/json_mini.h"
#include "codeexec/log.h"
#include "codeexec/util.h"

#include <algorithm>
#include <cstdlib>
#include <thread>

namespace codeexec {

namespace fs = std::filesystem;

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool parse_i64(const std::string& s, int64_t* out) {
    if (s.empty()) return false;
    char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (!end || *end != '\0') return false;
    *out = (int64_t)v;
    return true;
}

// "<id>.r<count>.json"
bool parse_spool_name(const std::string& name, std::string* id, int* count) {
    if (!ends_with(name, ".json")) return false;
    std::string stem = name.substr(0, name.size() - 5);
    size_t r = stem.rfind(".r");
    if (r == std::string::npos || r == 0) return false;
    int64_t n = 0;
    if (!parse_i64(stem.substr(r + 2), &n) || n < 0) return false;
    *id = stem.substr(0, r);
    *count = (int)n;
    return true;
}

// "<deadline_ms>_<receipt>_<id>.r<count>.json"; *spool_name = "<id>.r<count>.json"
bool parse_inflight_name(const std::string& name, int64_t* deadline_ms, std::string* spool_name) {
    size_t a = name.find('_');
    if (a == std::string::npos) return false;
    size_t b = name.find('_', a + 1);
    if (b == std::string::npos) return false;
    if (!parse_i64(name.substr(0, a), deadline_ms)) return false;
    *spool_name = name.substr(b + 1);
    std::string id;
    int count = 0;
    return parse_spool_name(*spool_name, &id, &count);
}

// Sorted *.json file names in dir. Temp files from write_atomic_file are skipped.
std::string list_json(const fs::path& dir, std::vector<std::string>* names) {
    names->clear();
    std::error_code ec;
    for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::string n = it->path().filename().string();
        if (ends_with(n, ".json")) names->push_back(std::move(n));
    }
    if (ec) return "list " + dir.string() + ": " + ec.message();
    std::sort(names->begin(), names->end());
    return "";
}

size_t count_json(const fs::path& dir) {
    std::vector<std::string> names;
    if (!list_json(dir, &names).empty()) return 0;
    return names.size();
}

void decode_envelope(const std::string& raw, Message* m) {
    auto doc = json_mini::parse(raw);
    auto body = doc ? json_mini::get_string(doc.root, "body") : std::nullopt;
    if (!body) {
        // A damaged spool file is still delivered so the consumer can discard it.
        m->body = raw;
        return;
    }
    m->body = *body;
    if (json_object* attrs = json_mini::field(doc.root, "attributes")) {
        if (json_mini::is_object(attrs)) {
            json_object_object_foreach(attrs, key, val) {
                if (json_object_is_type(val, json_type_string)) m->attributes[key] = json_object_get_string(val);
            }
        }
    }
}

} // namespace

FileQueue::FileQueue(fs::path root, int max_receives)
    : root_(std::move(root)),
      inbox_(root_ / "inbox"),
      inflight_(root_ / "inflight"),
      dlq_(root_ / "dlq"),
      max_receives_(max_receives) {}

std::string FileQueue::init() {
    std::error_code ec;
    for (const auto& d : {inbox_, inflight_, dlq_}) {
        fs::create_directories(d, ec);
        if (ec) return "create " + d.string() + ": " + ec.message();
    }
    return "";
}

std::string FileQueue::send(const std::string& body, const Attributes& attributes, std::string* message_id) {
    const int64_t sent = now_ms();
    const std::string id = std::to_string(sent) + "-" + random_hex(6);

    json_mini::Doc env(json_object_new_object());
    json_mini::set_string(env.root, "message_id", id);
    json_mini::set_string(env.root, "body", body);
    json_mini::Doc attrs(json_object_new_object());
    for (const auto& kv : attributes) json_mini::set_string(attrs.root, kv.first.c_str(), kv.second);
    json_object_object_add(env.root, "attributes", attrs.release());
    json_mini::set_int(env.root, "sent_at_ms", sent);

    std::string err = write_atomic_file(inbox_ / (id + ".r0.json"), json_mini::to_string(env.root));
    if (!err.empty()) return "send: " + err;
    if (message_id) *message_id = id;
    return "";
}

size_t FileQueue::requeue_expired(int64_t now_epoch_ms) {
    std::vector<std::string> names;
    if (!list_json(inflight_, &names).empty()) return 0;
    size_t n = 0;
    for (const auto& name : names) {
        int64_t deadline = 0;
        std::string spool;
        if (!parse_inflight_name(name, &deadline, &spool)) continue;
        if (deadline > now_epoch_ms) continue;
        std::error_code ec;
        fs::rename(inflight_ / name, inbox_ / spool, ec);
        if (!ec) n++; // ENOENT: acked or requeued by someone else meanwhile
    }
    return n;
}

std::string FileQueue::claim_visible(const ReceiveOptions& opts, std::vector<Message>* out) {
    std::vector<std::string> names;
    std::string err = list_json(inbox_, &names);
    if (!err.empty()) return err;

    for (const auto& name : names) {
        if ((int)out->size() >= opts.max_messages) break;

        std::string id;
        int count = 0;
        std::error_code ec;
        if (!parse_spool_name(name, &id, &count)) {
            fs::rename(inbox_ / name, dlq_ / name, ec);
            log_warn("queue", "unrecognized spool file moved to dlq: " + name);
            continue;
        }
        if (max_receives_ > 0 && count >= max_receives_) {
            fs::rename(inbox_ / name, dlq_ / name, ec);
            if (!ec) log_warn("queue", "message " + id + " received " + std::to_string(count) + " times; moved to dlq");
            continue;
        }

        const int next = count + 1;
        const std::string receipt = random_hex(8);
        const int64_t deadline = now_ms() + (int64_t)opts.visibility_timeout_seconds * 1000;
        const std::string claimed = std::to_string(deadline) + "_" + receipt + "_" + id + ".r" + std::to_string(next) + ".json";

        fs::rename(inbox_ / name, inflight_ / claimed, ec);
        if (ec) {
            if (ec == std::errc::no_such_file_or_directory) continue; // another consumer won
            return "claim " + name + ": " + ec.message();
        }

        std::string raw;
        if (!read_file(inflight_ / claimed, &raw)) {
            // left in flight; it becomes visible again after the deadline
            log_warn("queue", "claimed message " + id + " unreadable");
            continue;
        }
        Message m;
        m.message_id = id;
        m.receipt = claimed;
        m.receive_count = next;
        decode_envelope(raw, &m);
        out->push_back(std::move(m));
    }
    return "";
}

std::string FileQueue::receive(const ReceiveOptions& opts, std::vector<Message>* out, CancellationToken* cancel) {
    if (!out) return "null output";
    out->clear();

    ReceiveOptions o = opts;
    o.max_messages = std::clamp(o.max_messages, 1, 10);
    o.wait_seconds = std::clamp(o.wait_seconds, 0, 20);
    if (o.visibility_timeout_seconds < 1) o.visibility_timeout_seconds = 1;

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(o.wait_seconds);
    while (true) {
        requeue_expired(now_ms());
        std::string err = claim_visible(o, out);
        if (!err.empty()) return err;
        if (!out->empty()) return "";

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return "";
        auto slice = std::min<std::chrono::steady_clock::duration>(std::chrono::milliseconds(100), deadline - now);
        if (cancel) {
            if (cancel->wait_for(slice)) return "";
        } else {
            std::this_thread::sleep_for(slice);
        }
    }
}

std::string FileQueue::ack(const std::string& receipt) {
    if (receipt.empty() || receipt.find('/') != std::string::npos || receipt[0] == '.') {
        return "ack: invalid receipt";
    }
    std::error_code ec;
    bool removed = fs::remove(inflight_ / receipt, ec);
    if (ec) return "ack: " + ec.message();
    if (!removed) return "ack: receipt " + receipt + " no longer in flight (visibility timeout expired)";
    return "";
}

size_t FileQueue::inbox_count() const { return count_json(inbox_); }
size_t FileQueue::inflight_count() const { return count_json(inflight_); }
size_t FileQueue::dlq_count() const { return count_json(dlq_); }

} // namespace codeexec
