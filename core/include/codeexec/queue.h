#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "codeexec/cancel.h"

namespace codeexec {

using Attributes = std::map<std::string, std::string>;

struct Message {
    std::string message_id;
    std::string receipt;   // opaque ack token, valid until the visibility timeout expires
    std::string body;
    Attributes attributes;
    int receive_count{0};  // approximate; includes this delivery
};

struct ReceiveOptions {
    int max_messages{1};
    int wait_seconds{20};
    int visibility_timeout_seconds{30};
};

// At-least-once message queue. All calls return an empty string on success.
class IMessageQueue {
public:
    virtual ~IMessageQueue() = default;

    // Long-poll for up to opts.wait_seconds. An empty *out with an empty error
    // means nothing arrived (or cancel fired before anything was claimed).
    virtual std::string receive(const ReceiveOptions& opts,
                                std::vector<Message>* out,
                                CancellationToken* cancel) = 0;

    // Permanently remove a received message.
    virtual std::string ack(const std::string& receipt) = 0;

    virtual std::string send(const std::string& body,
                             const Attributes& attributes,
                             std::string* message_id) = 0;
};

// Spool-directory broker shared by any number of worker processes.
//
//   inbox/<sent_ms>-<rand>.r<count>.json                     visible
//   inflight/<deadline_ms>_<receipt>_<id>.r<count>.json      claimed, hidden until deadline
//   dlq/<id>.r<count>.json                                   exceeded max_receives
//
// Every state change is a rename(2) within one filesystem, so exactly one
// consumer wins a claim and file contents are never rewritten.
class FileQueue : public IMessageQueue {
public:
    explicit FileQueue(std::filesystem::path root, int max_receives = 0);

    // Create the spool layout. Empty string on success.
    std::string init();

    std::string receive(const ReceiveOptions& opts,
                        std::vector<Message>* out,
                        CancellationToken* cancel) override;
    std::string ack(const std::string& receipt) override;
    std::string send(const std::string& body,
                     const Attributes& attributes,
                     std::string* message_id) override;

    // Return in-flight messages whose visibility deadline passed to inbox/.
    // Returns the number requeued.
    size_t requeue_expired(int64_t now_epoch_ms);

    size_t inbox_count() const;
    size_t inflight_count() const;
    size_t dlq_count() const;

    const std::filesystem::path& root() const { return root_; }

private:
    std::string claim_visible(const ReceiveOptions& opts, std::vector<Message>* out);

    std::filesystem::path root_;
    std::filesystem::path inbox_;
    std::filesystem::path inflight_;
    std::filesystem::path dlq_;
    int max_receives_{0};
};

} // namespace codeexec
