#include "codeexec/consumer.h"

#include <exception>

namespace codeexec {

const char* disposition_name(Disposition d) {
    switch (d) {
        case Disposition::Discarded: return "discarded";
        case Disposition::Rejected:  return "rejected";
        case Disposition::Completed: return "completed";
        case Disposition::Deferred:  return "deferred";
    }
    return "deferred";
}

QueueConsumer::QueueConsumer(IMessageQueue& queue,
                             IExecutor& executor,
                             ResultWriter& writer,
                             const LimitsTable& limits,
                             ReceiveOptions opts,
                             EventLog* events)
    : queue_(queue), executor_(executor), writer_(writer), limits_(limits), opts_(opts), events_(events) {}

void QueueConsumer::event(const std::string& name, const std::string& job_id, const Message& msg,
                          const std::vector<std::pair<std::string, std::string>>& fields,
                          const std::vector<std::pair<std::string, int64_t>>& numbers) {
    if (events_) events_->event(name, job_id, msg.message_id, fields, numbers);
}

void QueueConsumer::ack(const Message& msg, const std::string& job_id) {
    std::string err = queue_.ack(msg.receipt);
    if (!err.empty()) {
        // The message will come back; the record write it carries is idempotent.
        log_error("consumer", "ack of message " + msg.message_id + " failed: " + err);
        return;
    }
    log_debug("consumer", "acked message " + msg.message_id);
    event("acked", job_id, msg);
}

Disposition QueueConsumer::handle(const Message& msg) {
    event("received", "", msg, {}, {{"receive_count", msg.receive_count}});
    std::string job_id;
    try {
        ParseResult pr = parse_job(msg.body, limits_.max_timeout_sec);
        if (pr.malformed) {
            log_error("consumer", "malformed message " + msg.message_id + " discarded");
            event("malformed", "", msg);
            ack(msg, "");
            return Disposition::Discarded;
        }

        const Job& job = pr.job;
        job_id = job.job_id;
        log_info("consumer", "processing job " + (job_id.empty() ? std::string("unknown") : job_id) +
                 " (message " + msg.message_id + ", receive " + std::to_string(msg.receive_count) + ")");

        JobMetadata meta{job.language, job.submitted_at};

        std::string verr = validate_job(job, limits_);
        if (!verr.empty()) {
            log_error("consumer", "invalid job " + job_id + ": " + verr);
            event("rejected", job_id, msg, {{"reason", verr}});
            if (check_job_id(job_id).empty()) {
                Outcome o;
                o.status = Status::ERROR;
                o.error = "Validation error: " + verr;
                o.exit_code = -1;
                o.execution_time_ms = 0;
                if (writer_.write(job_id, o, meta)) {
                    event("persisted", job_id, msg, {{"status", status_name(o.status)}});
                } else {
                    event("persist_failed", job_id, msg, {{"error", writer_.last_error()}});
                }
            }
            ack(msg, job_id);
            return Disposition::Rejected;
        }

        Outcome o = executor_.execute(job.language, job.code, job.timeout_sec);
        event("executed", job_id, msg, {{"status", status_name(o.status)}},
              {{"exit_code", o.exit_code}, {"execution_time_ms", o.execution_time_ms}});

        if (!writer_.write(job_id, o, meta)) {
            log_error("consumer", "result for job " + job_id + " not stored; leaving message for redelivery");
            event("persist_failed", job_id, msg, {{"error", writer_.last_error()}});
            event("deferred", job_id, msg);
            return Disposition::Deferred;
        }
        event("persisted", job_id, msg, {{"status", status_name(o.status)}});
        ack(msg, job_id);
        log_info("consumer", "completed job " + job_id + " with status " + status_name(o.status));
        return Disposition::Completed;
    } catch (const std::exception& e) {
        log_error("consumer", "error processing message " + msg.message_id + ": " + e.what());
        event("deferred", job_id, msg, {{"error", e.what()}});
        return Disposition::Deferred;
    }
}

std::string QueueConsumer::poll_once(CancellationToken& token, size_t* handled) {
    if (handled) *handled = 0;
    std::vector<Message> msgs;
    std::string err = queue_.receive(opts_, &msgs, &token);
    if (!err.empty()) return err;
    if (msgs.empty()) {
        log_debug("consumer", "no messages available");
        return "";
    }
    log_info("consumer", "received " + std::to_string(msgs.size()) + " message(s)");
    for (const auto& m : msgs) {
        if (token.cancelled()) {
            // unhandled messages reappear after their visibility timeout
            log_info("consumer", "shutdown requested; stopping message processing");
            break;
        }
        handle(m);
        if (handled) (*handled)++;
    }
    return "";
}

} // namespace codeexec
