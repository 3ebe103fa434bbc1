#include "test_common.h"

#include "codeexec/queue.h"
#include "codeexec/util.h"

#include <thread>

using namespace codeexec;
namespace fs = std::filesystem;

int main() {
    auto root = fresh_dir("codeexec_test_queue");

    FileQueue q(root / "spool");
    expect_eq_str(q.init(), "", "init");

    ReceiveOptions fast;
    fast.wait_seconds = 0;
    fast.visibility_timeout_seconds = 30;

    // send -> receive -> ack
    {
        std::string id;
        expect_eq_str(q.send(R"({"job_id":"a"})", {{"job_id", "a"}, {"language", "python"}}, &id), "", "send");
        expect_true(!id.empty(), "message id assigned");
        expect_eq_ll((long long)q.inbox_count(), 1, "one visible");

        std::vector<Message> got;
        expect_eq_str(q.receive(fast, &got, nullptr), "", "receive");
        expect_eq_ll((long long)got.size(), 1, "one received");
        expect_eq_str(got[0].message_id, id, "same id");
        expect_eq_str(got[0].body, R"({"job_id":"a"})", "body intact");
        expect_eq_str(got[0].attributes["language"], "python", "attributes carried");
        expect_eq_ll(got[0].receive_count, 1, "first receive");
        expect_eq_ll((long long)q.inbox_count(), 0, "claimed message hidden");
        expect_eq_ll((long long)q.inflight_count(), 1, "claimed message in flight");

        std::vector<Message> again;
        expect_eq_str(q.receive(fast, &again, nullptr), "", "receive while hidden");
        expect_true(again.empty(), "hidden message not redelivered before visibility timeout");

        expect_eq_str(q.ack(got[0].receipt), "", "ack");
        expect_eq_ll((long long)q.inflight_count(), 0, "acked message gone");
        expect_true(!q.ack(got[0].receipt).empty(), "double ack reports an error");
        expect_true(!q.ack("../inbox/x.json").empty(), "receipt cannot escape the spool");
    }

    // Visibility timeout expiry redelivers with a higher receive count; stale receipt fails
    {
        std::string id;
        expect_eq_str(q.send("payload", {}, &id), "", "send 2");
        std::vector<Message> first;
        expect_eq_str(q.receive(fast, &first, nullptr), "", "receive 2");
        expect_eq_ll((long long)first.size(), 1, "got it");

        expect_eq_ll((long long)q.requeue_expired(now_ms() + 31 * 1000), 1, "expired in-flight requeued");
        std::vector<Message> second;
        expect_eq_str(q.receive(fast, &second, nullptr), "", "receive redelivery");
        expect_eq_ll((long long)second.size(), 1, "redelivered");
        expect_eq_str(second[0].message_id, id, "same message");
        expect_eq_ll(second[0].receive_count, 2, "receive count grows");
        expect_true(second[0].receipt != first[0].receipt, "new receipt");
        expect_true(!q.ack(first[0].receipt).empty(), "stale receipt rejected");
        expect_eq_str(q.ack(second[0].receipt), "", "current receipt acks");
    }

    // FIFO by send time and max_messages honored
    {
        for (int i = 0; i < 3; i++) {
            expect_eq_str(q.send("m" + std::to_string(i), {}, nullptr), "", "send batch");
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        ReceiveOptions two = fast;
        two.max_messages = 2;
        std::vector<Message> got;
        expect_eq_str(q.receive(two, &got, nullptr), "", "batch receive");
        expect_eq_ll((long long)got.size(), 2, "max_messages respected");
        expect_eq_str(got[0].body, "m0", "oldest first");
        expect_eq_str(got[1].body, "m1", "then next");
        for (auto& m : got) expect_eq_str(q.ack(m.receipt), "", "ack batch");
        got.clear();
        expect_eq_str(q.receive(two, &got, nullptr), "", "rest");
        expect_eq_ll((long long)got.size(), 1, "remaining one");
        expect_eq_str(q.ack(got[0].receipt), "", "ack last");
    }

    // Long poll returns when a message arrives
    {
        ReceiveOptions wait = fast;
        wait.wait_seconds = 5;
        std::thread producer([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
            (void)q.send("late", {}, nullptr);
        });
        auto start = std::chrono::steady_clock::now();
        std::vector<Message> got;
        std::string err = q.receive(wait, &got, nullptr);
        auto took = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
        producer.join();
        expect_eq_str(err, "", "long poll ok");
        expect_eq_ll((long long)got.size(), 1, "late message received");
        expect_true(took < 4000, "returned before the wait expired");
        expect_eq_str(q.ack(got[0].receipt), "", "ack late");
    }

    // Long poll gives up early on cancellation
    {
        ReceiveOptions wait = fast;
        wait.wait_seconds = 20;
        CancellationToken token;
        std::thread canceller([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            token.cancel();
        });
        auto start = std::chrono::steady_clock::now();
        std::vector<Message> got;
        std::string err = q.receive(wait, &got, &token);
        auto took = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
        canceller.join();
        expect_eq_str(err, "", "cancelled poll is not an error");
        expect_true(got.empty(), "nothing received");
        expect_true(took < 2000, "cancellation interrupts the wait");
    }

    // Two consumers never claim the same message
    {
        for (int i = 0; i < 20; i++) (void)q.send("c" + std::to_string(i), {}, nullptr);
        FileQueue other(root / "spool");
        std::vector<std::string> a_ids, b_ids;
        auto drain = [&](FileQueue& fq, std::vector<std::string>* ids) {
            ReceiveOptions o = fast;
            while (true) {
                std::vector<Message> got;
                if (!fq.receive(o, &got, nullptr).empty() || got.empty()) return;
                for (auto& m : got) {
                    ids->push_back(m.message_id);
                    (void)fq.ack(m.receipt);
                }
            }
        };
        std::thread ta([&] { drain(q, &a_ids); });
        std::thread tb([&] { drain(other, &b_ids); });
        ta.join();
        tb.join();
        expect_eq_ll((long long)(a_ids.size() + b_ids.size()), 20, "every message delivered exactly once");
        for (auto& id : a_ids) {
            for (auto& jd : b_ids) expect_true(id != jd, "no double claim: " + id);
        }
    }

    // Redrive to the dead-letter directory after max receives
    {
        FileQueue capped(root / "capped", 2);
        expect_eq_str(capped.init(), "", "init capped");
        expect_eq_str(capped.send("poison", {}, nullptr), "", "send poison");
        for (int i = 0; i < 2; i++) {
            std::vector<Message> got;
            expect_eq_str(capped.receive(fast, &got, nullptr), "", "receive poison");
            expect_eq_ll((long long)got.size(), 1, "poison delivered");
            capped.requeue_expired(now_ms() + 3600 * 1000);
        }
        std::vector<Message> got;
        expect_eq_str(capped.receive(fast, &got, nullptr), "", "receive after cap");
        expect_true(got.empty(), "not delivered a third time");
        expect_eq_ll((long long)capped.dlq_count(), 1, "moved to dlq");
    }

    // Damaged spool file is still delivered so it can be discarded
    {
        expect_eq_str(write_atomic_file(root / "spool" / "inbox" / "0000000000001-bad.r0.json", "garbage{"), "", "plant garbage");
        std::vector<Message> got;
        expect_eq_str(q.receive(fast, &got, nullptr), "", "receive garbage");
        expect_eq_ll((long long)got.size(), 1, "garbage delivered");
        expect_eq_str(got[0].body, "garbage{", "raw body");
        expect_eq_str(q.ack(got[0].receipt), "", "ack garbage");
    }

    // Missing spool is an infrastructure error
    {
        FileQueue gone(root / "does-not-exist");
        std::vector<Message> got;
        expect_true(!gone.receive(fast, &got, nullptr).empty(), "receive on missing spool fails");
    }

    std::error_code ec;
    fs::remove_all(root, ec);
    std::cerr << "test_queue: ALL PASSED" << std::endl;
    return 0;
}
