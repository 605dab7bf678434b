// Deduplicating registry of in-flight sessions keyed by session identity.
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace rdpvisor {

// One supervised session running on its own thread. The state queries are virtual
// so tests can substitute tasks whose state cannot be observed.
class SessionTask : public std::enable_shared_from_this<SessionTask> {
public:
    using Body = std::function<void(SessionTask &)>;

    explicit SessionTask(std::string key);
    virtual ~SessionTask();

    SessionTask(const SessionTask &) = delete;
    SessionTask &operator=(const SessionTask &) = delete;

    const std::string &key() const { return key_; }

    // Runs body on a new thread; the task keeps itself alive until the body
    // returns. Exceptions escaping the body are logged.
    void start(Body body);

    virtual bool isCompleted() const;
    virtual bool isCancellationRequested() const;
    virtual void cancel();

    // nullopt waits without bound. True once completed.
    virtual bool wait(std::optional<std::chrono::milliseconds> timeout);

    // Joins a finished thread, detaches a running one.
    virtual void release();

    // Marks the task finished and wakes waiters.
    void complete();

private:
    std::string key_;
    std::atomic<bool> cancelRequested_{false};

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool completed_ = false;

    std::mutex threadMutex_;
    std::thread thread_;
};

class SessionRegistry {
public:
    using TaskPtr = std::shared_ptr<SessionTask>;

    explicit SessionRegistry(
        std::chrono::milliseconds drainTimeout = std::chrono::seconds(10));
    // Joins pending drainers.
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry &) = delete;
    SessionRegistry &operator=(const SessionRegistry &) = delete;

    TaskPtr tryGet(const std::string &key) const;

    // Atomic swap. Returns the task previously stored under key, if any;
    // the caller hands it to retire().
    TaskPtr replace(const std::string &key, TaskPtr task);

    // Removes key only while it still maps to this very task.
    bool remove(const std::string &key, const TaskPtr &task);

    void cancelAll();
    bool waitAll(std::optional<std::chrono::milliseconds> timeout);

    std::size_t count() const;
    bool isCompleted() const;
    std::vector<std::pair<std::string, TaskPtr>> snapshot() const;

    // Drains task in the background: bounded wait, then cancel and release.
    // Never blocks the caller.
    void retire(TaskPtr task);

    std::chrono::milliseconds drainTimeout() const { return drainTimeout_; }

private:
    void drain(const TaskPtr &task);

    std::chrono::milliseconds drainTimeout_;

    mutable std::mutex mtx_;  // protects tasks_
    std::map<std::string, TaskPtr> tasks_;

    struct Drainer {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    std::mutex drainMutex_;  // protects drainers_
    std::vector<Drainer> drainers_;
};

} // namespace rdpvisor
