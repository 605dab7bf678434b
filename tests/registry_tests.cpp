#include "TestSupport.hpp"
#include "rdpvisor/SessionRegistry.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using testsupport::TestContext;
using testsupport::eventually;
using namespace std::chrono_literals;

namespace {

using rdpvisor::SessionRegistry;
using rdpvisor::SessionTask;

// Task whose state queries fail, as if its state were unobservable.
class BrokenStateTask : public SessionTask {
public:
    explicit BrokenStateTask(std::string key) : SessionTask(std::move(key)) {}

    bool isCompleted() const override {
        throw std::runtime_error("state query failed");
    }
    bool isCancellationRequested() const override {
        throw std::runtime_error("state query failed");
    }
    void cancel() override {
        ++cancels;
        SessionTask::cancel();
    }

    std::atomic<int> cancels{0};
};

// Runs until cancelled.
std::shared_ptr<SessionTask> startLooping(const std::string &key) {
    auto task = std::make_shared<SessionTask>(key);
    task->start([](SessionTask &self) {
        while (!self.isCancellationRequested())
            std::this_thread::sleep_for(2ms);
    });
    return task;
}

void test_replace_returns_previous_once(TestContext &t) {
    SessionRegistry reg;
    auto a = std::make_shared<SessionTask>("k");
    auto b = std::make_shared<SessionTask>("k");

    t.check(reg.replace("k", a) == nullptr, "first replace has no previous");
    t.check(reg.replace("k", b) == a, "second replace returns the first task");
    t.check(reg.tryGet("k") == b, "latest task wins");
    t.check(reg.count() == 1, "one task per key");
    t.check(reg.tryGet("other") == nullptr, "unknown key is empty");
}

void test_concurrent_replace_never_loses_a_task(TestContext &t) {
    SessionRegistry reg;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 50;

    std::vector<std::shared_ptr<SessionTask>> created;
    for (int i = 0; i < kThreads * kPerThread; ++i)
        created.push_back(std::make_shared<SessionTask>("shared"));

    std::vector<std::vector<std::shared_ptr<SessionTask>>> returned(kThreads);
    std::vector<std::thread> threads;
    for (int th = 0; th < kThreads; ++th) {
        threads.emplace_back([&, th] {
            for (int i = 0; i < kPerThread; ++i) {
                auto prev = reg.replace("shared", created[th * kPerThread + i]);
                if (prev)
                    returned[th].push_back(prev);
            }
        });
    }
    for (auto &th : threads)
        th.join();

    std::set<SessionTask *> seen;
    std::size_t total = 0;
    for (const auto &v : returned) {
        for (const auto &p : v) {
            seen.insert(p.get());
            ++total;
        }
    }
    seen.insert(reg.tryGet("shared").get());
    t.check(total == created.size() - 1,
            "every task but the survivor is returned by a replace");
    t.check(seen.size() == created.size(),
            "each task is returned exactly once or survives");
    t.check(reg.count() == 1, "still one entry after concurrent replaces");
}

void test_remove_is_compare_and_remove(TestContext &t) {
    SessionRegistry reg;
    auto a = std::make_shared<SessionTask>("k");
    auto b = std::make_shared<SessionTask>("k");
    reg.replace("k", a);
    reg.replace("k", b);

    t.check(!reg.remove("k", a), "stale task cannot remove its successor");
    t.check(reg.tryGet("k") == b, "successor still registered");
    t.check(reg.remove("k", b), "current task removes itself");
    t.check(reg.count() == 0, "registry empty after removal");
    t.check(!reg.remove("k", b), "second removal is a no-op");
}

void test_wait_all_zero_timeout(TestContext &t) {
    SessionRegistry reg;
    t.check(reg.waitAll(0ms), "nothing pending returns true");

    auto done = std::make_shared<SessionTask>("done");
    done->complete();
    reg.replace("done", done);
    t.check(reg.waitAll(0ms), "completed tasks do not block");

    auto never = std::make_shared<SessionTask>("never");
    reg.replace("never", never);
    const auto started = std::chrono::steady_clock::now();
    t.check(!reg.waitAll(0ms), "never-completing task returns false");
    t.check(std::chrono::steady_clock::now() - started < 1s,
            "zero timeout returns immediately");
    t.check(!reg.isCompleted(), "aggregate not completed");
    t.check(!reg.waitAll(20ms), "bounded wait times out");
    never->complete();
    t.check(reg.waitAll(std::nullopt), "infinite wait returns once completed");
    t.check(reg.isCompleted(), "aggregate completed");
}

void test_wait_all_huge_timeout_waits(TestContext &t) {
    SessionRegistry reg;
    auto task = std::make_shared<SessionTask>("slow");
    task->start([](SessionTask &) { std::this_thread::sleep_for(100ms); });
    reg.replace("slow", task);

    t.check(reg.waitAll(std::chrono::milliseconds::max()),
            "maximal timeout waits for completion");
    t.check(task->isCompleted(), "task completed after the wait");
    t.check(task->wait(std::chrono::milliseconds::max()),
            "maximal task wait returns once completed");
    t.check(reg.waitAll(-5ms), "negative timeout with nothing pending");
}

void test_cancel_all_signals_pending_only(TestContext &t) {
    SessionRegistry reg;
    auto pending = std::make_shared<SessionTask>("pending");
    auto done = std::make_shared<SessionTask>("done");
    done->complete();
    auto broken = std::make_shared<BrokenStateTask>("broken");
    reg.replace("pending", pending);
    reg.replace("done", done);
    reg.replace("broken", broken);

    reg.cancelAll();
    t.check(pending->isCancellationRequested(), "pending task cancelled");
    t.check(!done->isCancellationRequested(), "completed task left alone");
    t.check(broken->cancels.load() == 1,
            "task with failing state query is cancellation-eligible");
}

void test_wait_all_treats_failing_state_query_as_completed(TestContext &t) {
    SessionRegistry reg;
    reg.replace("broken", std::make_shared<BrokenStateTask>("broken"));
    t.check(reg.waitAll(0ms), "failing state query does not block waitAll");
    t.check(reg.isCompleted(), "failing state query counts as completed");
}

void test_started_task_runs_and_completes(TestContext &t) {
    SessionRegistry reg;
    auto task = startLooping("loop");
    reg.replace("loop", task);
    t.check(!reg.waitAll(10ms), "looping task still running");
    reg.cancelAll();
    t.check(reg.waitAll(2000ms), "task completes after cancellation");
    t.check(task->isCompleted(), "completion observed");
    task->release();
}

void test_body_exception_still_completes(TestContext &t) {
    auto task = std::make_shared<SessionTask>("throws");
    task->start([](SessionTask &) { throw std::runtime_error("boom"); });
    t.check(task->wait(2000ms), "task completes after its body threw");
    task->release();
}

void test_retire_drains_in_background(TestContext &t) {
    SessionRegistry reg(300ms);
    auto stuck = startLooping("stuck");

    const auto started = std::chrono::steady_clock::now();
    reg.retire(stuck);
    t.check(std::chrono::steady_clock::now() - started < 250ms,
            "retire does not block the caller");
    t.check(eventually([&] { return stuck->isCancellationRequested(); }),
            "drain cancels a task that outlives the timeout");
    t.check(eventually([&] { return stuck->isCompleted(); }),
            "cancelled task finishes");

    auto quick = std::make_shared<SessionTask>("quick");
    quick->start([](SessionTask &) {});
    reg.retire(quick);
    t.check(eventually([&] { return quick->isCompleted(); }),
            "finished task drained");
    t.check(!quick->isCancellationRequested(),
            "task finishing within the timeout is not cancelled");
    reg.retire(nullptr);
}

} // namespace

int main() {
    TestContext t;
    test_replace_returns_previous_once(t);
    test_concurrent_replace_never_loses_a_task(t);
    test_remove_is_compare_and_remove(t);
    test_wait_all_zero_timeout(t);
    test_wait_all_huge_timeout_waits(t);
    test_cancel_all_signals_pending_only(t);
    test_wait_all_treats_failing_state_query_as_completed(t);
    test_started_task_runs_and_completes(t);
    test_body_exception_still_completes(t);
    test_retire_drains_in_background(t);

    if (t.failures > 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] registry_tests\n";
    return EXIT_SUCCESS;
}
