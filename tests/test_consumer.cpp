#include "test_common.h"
#include "test_fakes.h"

#include "codeexec/consumer.h"
#include "codeexec/util.h"

using namespace codeexec;

namespace {

struct Rig {
    MemoryQueue queue;
    FakeExecutor exec;
    FlakyStore store;
    LimitsTable limits = default_limits();
    ResultWriter writer{store, "worker-test", RetryPolicy{3, 0, 0}};
    ReceiveOptions opts;
    QueueConsumer consumer{queue, exec, writer, limits, opts};

    Rig() {
        writer.set_sleeper([](int64_t) {});
        exec.next.status = Status::SUCCESS;
        exec.next.output = "hello world\n";
        exec.next.exit_code = 0;
        exec.next.execution_time_ms = 15;
    }

    Message receive_one() {
        std::vector<Message> got;
        std::string err = queue.receive(opts, &got, nullptr);
        if (!err.empty() || got.size() != 1) die("expected one message: " + err);
        return got[0];
    }
};

const char* kValid = R"json({"job_id":"job-ok","language":"python","code":"print('hello world')","timeout":5})json";

} // namespace

int main() {
    // Scenario D: malformed message acked, nothing stored, nothing executed
    {
        Rig rig;
        rig.queue.push("m1", "this is not json");
        Message m = rig.receive_one();
        expect_true(rig.consumer.handle(m) == Disposition::Discarded, "malformed is discarded");
        expect_true(rig.queue.acked_ids.count("m1") == 1, "malformed acked");
        expect_eq_ll(rig.store.put_calls, 0, "no store write");
        expect_eq_ll(rig.exec.calls, 0, "no execution");

        rig.queue.push("m2", "[\"array\"]");
        expect_true(rig.consumer.handle(rig.receive_one()) == Disposition::Discarded, "non-object discarded");
    }

    // Scenario E: invalid language -> exactly one ERROR record, acked, never executed
    {
        Rig rig;
        rig.queue.push("m1", R"({"job_id":"job-hs","language":"haskell","code":"main = print 1"})");
        expect_true(rig.consumer.handle(rig.receive_one()) == Disposition::Rejected, "invalid job rejected");
        expect_true(rig.queue.acked_ids.count("m1") == 1, "rejected job acked");
        expect_eq_ll(rig.exec.calls, 0, "never executed");
        expect_eq_ll(rig.store.successful_puts, 1, "exactly one record");
        auto r = rig.store.get("job-hs");
        expect_true(r && r->status == Status::ERROR, "ERROR record");
        expect_true(contains(r->error, "Validation error: Unsupported language: haskell"), "error names the problem: " + r->error);
        expect_eq_ll(r->exit_code, -1, "no exit code");
        expect_eq_str(r->language, "haskell", "language kept");
    }

    // Invalid job whose record cannot be written is still acked (best effort)
    {
        Rig rig;
        rig.store.always_fail = true;
        rig.queue.push("m1", R"({"job_id":"job-big","language":"python","code":"x","timeout":60})");
        expect_true(rig.consumer.handle(rig.receive_one()) == Disposition::Rejected, "rejected");
        expect_true(rig.queue.acked_ids.count("m1") == 1, "acked despite store failure");
        expect_eq_ll(rig.store.put_calls, 3, "bounded attempts, not retried forever");
    }

    // Invalid job without a usable job_id: acked without a write
    {
        Rig rig;
        rig.queue.push("m1", R"({"language":"python","code":"x"})");
        expect_true(rig.consumer.handle(rig.receive_one()) == Disposition::Rejected, "rejected");
        expect_true(rig.queue.acked_ids.count("m1") == 1, "acked");
        expect_eq_ll(rig.store.put_calls, 0, "no record without a key");
    }

    // Valid job: executed with its parameters, stored, then acked
    {
        Rig rig;
        rig.queue.push("m1", kValid);
        expect_true(rig.consumer.handle(rig.receive_one()) == Disposition::Completed, "completed");
        expect_eq_str(rig.exec.last_language, "python", "language passed");
        expect_eq_str(rig.exec.last_code, "print('hello world')", "code passed");
        expect_true(rig.exec.last_timeout == 5.0, "timeout passed");
        auto r = rig.store.get("job-ok");
        expect_true(r && r->status == Status::SUCCESS, "SUCCESS stored");
        expect_true(contains(r->output, "hello world"), "output stored");
        expect_true(rig.queue.acked_ids.count("m1") == 1, "acked after write");
    }

    // Execution ERROR/TIMEOUT outcomes are legitimate terminal results
    {
        Rig rig;
        rig.exec.next.status = Status::TIMEOUT;
        rig.exec.next.error = "Execution exceeded time limit of 2s";
        rig.exec.next.exit_code = -1;
        rig.queue.push("m1", R"({"job_id":"spin","language":"python","code":"while True: pass","timeout":2})");
        expect_true(rig.consumer.handle(rig.receive_one()) == Disposition::Completed, "timeout is completed");
        expect_true(rig.store.get("spin")->status == Status::TIMEOUT, "TIMEOUT stored");
    }

    // At-least-once: store down -> not acked; redelivery re-executes; one terminal record
    {
        Rig rig;
        rig.queue.push("m1", kValid);
        rig.store.always_fail = true;
        expect_true(rig.consumer.handle(rig.receive_one()) == Disposition::Deferred, "deferred on write failure");
        expect_true(rig.queue.acked_ids.empty(), "not acked");
        expect_true(!rig.store.get("job-ok"), "nothing stored yet");

        rig.queue.redeliver();
        Message again = rig.receive_one();
        expect_eq_ll(again.receive_count, 2, "second delivery");
        expect_true(rig.consumer.handle(again) == Disposition::Deferred, "still deferred");

        rig.store.always_fail = false;
        rig.exec.next.output = "final attempt\n";
        rig.queue.redeliver();
        expect_true(rig.consumer.handle(rig.receive_one()) == Disposition::Completed, "eventually completed");
        expect_eq_ll(rig.exec.calls, 3, "re-executed on each delivery");
        expect_eq_ll((long long)rig.store.records.size(), 1, "exactly one terminal record");
        expect_eq_str(rig.store.get("job-ok")->output, "final attempt\n", "record matches the successful attempt");
        expect_true(rig.queue.acked_ids.count("m1") == 1, "acked once stored");
    }

    // Idempotence: the same job processed twice leaves the same record content
    {
        Rig rig;
        rig.queue.push("m1", kValid);
        rig.queue.push("m2", kValid);
        expect_true(rig.consumer.handle(rig.receive_one()) == Disposition::Completed, "first");
        JobRecord first = *rig.store.get("job-ok");
        expect_true(rig.consumer.handle(rig.receive_one()) == Disposition::Completed, "duplicate");
        JobRecord second = *rig.store.get("job-ok");
        expect_eq_ll((long long)rig.store.records.size(), 1, "one key");
        expect_true(first.status == second.status && first.output == second.output &&
                    first.exit_code == second.exit_code && first.error == second.error,
                    "same terminal content");
    }

    // Unexpected exception: logged, left for redelivery
    {
        Rig rig;
        rig.exec.throw_on_execute = true;
        rig.queue.push("m1", kValid);
        expect_true(rig.consumer.handle(rig.receive_one()) == Disposition::Deferred, "exception defers");
        expect_true(rig.queue.acked_ids.empty(), "not acked");
        expect_eq_ll(rig.store.put_calls, 0, "nothing written");
    }

    // poll_once: handles a batch, checks cancellation only between messages
    {
        Rig rig;
        rig.opts.max_messages = 3;
        QueueConsumer batch(rig.queue, rig.exec, rig.writer, rig.limits, rig.opts);
        rig.queue.push("a", R"({"job_id":"a","language":"python","code":"1"})");
        rig.queue.push("b", R"({"job_id":"b","language":"python","code":"2"})");
        rig.queue.push("c", R"({"job_id":"c","language":"python","code":"3"})");
        CancellationToken token;
        size_t handled = 0;
        expect_eq_str(batch.poll_once(token, &handled), "", "poll ok");
        expect_eq_ll((long long)handled, 3, "all handled");

        rig.queue.push("d", R"({"job_id":"d","language":"python","code":"4"})");
        rig.queue.push("e", R"({"job_id":"e","language":"python","code":"5"})");
        token.cancel();
        expect_eq_str(batch.poll_once(token, &handled), "", "poll ok when cancelled");
        expect_eq_ll((long long)handled, 0, "no new message started after cancellation");
        expect_eq_ll((long long)rig.queue.inflight.size(), 2, "unstarted messages left for redelivery");

        rig.queue.receive_errors = 1;
        CancellationToken fresh;
        expect_true(!batch.poll_once(fresh, &handled).empty(), "receive failure reported");
    }

    // Event journal records the lifecycle
    {
        auto dir = fresh_dir("codeexec_test_consumer");
        Rig rig;
        {
            EventLog events("worker-test", (dir / "events.jsonl").string());
            QueueConsumer logged(rig.queue, rig.exec, rig.writer, rig.limits, rig.opts, &events);
            rig.queue.push("m1", kValid);
            expect_true(logged.handle(rig.receive_one()) == Disposition::Completed, "completed");
        }
        std::string journal;
        expect_true(read_file(dir / "events.jsonl", &journal), "journal written");
        expect_true(contains(journal, "\"event\":\"received\""), "received event");
        expect_true(contains(journal, "\"event\":\"executed\""), "executed event");
        expect_true(contains(journal, "\"event\":\"persisted\""), "persisted event");
        expect_true(contains(journal, "\"event\":\"acked\""), "acked event");
        expect_true(contains(journal, "\"job_id\":\"job-ok\""), "job id in journal");
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    std::cerr << "test_consumer: ALL PASSED" << std::endl;
    return 0;
}
