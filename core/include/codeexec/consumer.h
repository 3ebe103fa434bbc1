#pragma once

#include <string>

#include "codeexec/cancel.h"
#include "codeexec/job.h"
#include "codeexec/limits.h"
#include "codeexec/log.h"
#include "codeexec/queue.h"
#include "codeexec/result_writer.h"
#include "codeexec/sandbox.h"

namespace codeexec {

// What happened to one delivered message.
enum class Disposition {
    Discarded, // malformed payload; acknowledged, nothing stored
    Rejected,  // failed validation; ERROR record attempted, acknowledged
    Completed, // executed and stored; acknowledged
    Deferred,  // left unacknowledged for redelivery
};

const char* disposition_name(Disposition d);

// Per-message pipeline: parse -> validate -> execute -> persist -> ack.
// A message is never acknowledged before its terminal record is durable,
// except when it is classified as malformed or invalid.
class QueueConsumer {
public:
    QueueConsumer(IMessageQueue& queue,
                  IExecutor& executor,
                  ResultWriter& writer,
                  const LimitsTable& limits,
                  ReceiveOptions opts,
                  EventLog* events = nullptr);

    Disposition handle(const Message& msg);

    // One receive plus handling of everything received. The token is checked
    // between messages, never inside one. Returns the receive error (empty when
    // the cycle itself succeeded).
    std::string poll_once(CancellationToken& token, size_t* handled = nullptr);

private:
    void ack(const Message& msg, const std::string& job_id);
    void event(const std::string& name, const std::string& job_id, const Message& msg,
               const std::vector<std::pair<std::string, std::string>>& fields = {},
               const std::vector<std::pair<std::string, int64_t>>& numbers = {});

    IMessageQueue& queue_;
    IExecutor& executor_;
    ResultWriter& writer_;
    const LimitsTable& limits_;
    ReceiveOptions opts_;
    EventLog* events_{nullptr};
};

} // namespace codeexec
