// Session tasks and the registry that deduplicates, cancels and drains them.
#include "rdpvisor/SessionRegistry.hpp"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(rvReg, "rdpvisor.registry")

namespace rdpvisor {

namespace {

// Timeouts too large to be added to the current time mean "no bound";
// negative ones mean "do not wait".
std::optional<std::chrono::milliseconds>
boundedTimeout(std::optional<std::chrono::milliseconds> timeout) {
    using Clock = std::chrono::steady_clock;
    if (!timeout)
        return std::nullopt;
    if (*timeout <= std::chrono::milliseconds(0))
        return std::chrono::milliseconds(0);
    const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::time_point::max() - Clock::now());
    if (*timeout >= headroom / 2)
        return std::nullopt;
    return timeout;
}

} // namespace

SessionTask::SessionTask(std::string key) : key_(std::move(key)) {}

SessionTask::~SessionTask() {
    std::lock_guard<std::mutex> lk(threadMutex_);
    if (!thread_.joinable())
        return;
    // The last reference can be dropped by the task's own thread.
    if (thread_.get_id() == std::this_thread::get_id())
        thread_.detach();
    else
        thread_.join();
}

void SessionTask::start(Body body) {
    std::shared_ptr<SessionTask> self = shared_from_this();
    std::lock_guard<std::mutex> lk(threadMutex_);
    thread_ = std::thread([self, body = std::move(body)]() mutable {
        try {
            body(*self);
        } catch (const std::exception &e) {
            qCCritical(rvReg) << "session body failed"
                              << "key=" << self->key().c_str()
                              << "error=" << e.what();
        }
        self->complete();
    });
}

bool SessionTask::isCompleted() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return completed_;
}

bool SessionTask::isCancellationRequested() const {
    return cancelRequested_.load();
}

void SessionTask::cancel() { cancelRequested_ = true; }

bool SessionTask::wait(std::optional<std::chrono::milliseconds> timeout) {
    timeout = boundedTimeout(timeout);
    std::unique_lock<std::mutex> lk(mtx_);
    if (!timeout) {
        cv_.wait(lk, [this] { return completed_; });
        return true;
    }
    return cv_.wait_for(lk, *timeout, [this] { return completed_; });
}

void SessionTask::release() {
    std::lock_guard<std::mutex> lk(threadMutex_);
    if (!thread_.joinable())
        return;
    if (isCompleted() && thread_.get_id() != std::this_thread::get_id())
        thread_.join();
    else
        thread_.detach();
}

void SessionTask::complete() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        completed_ = true;
    }
    cv_.notify_all();
}

SessionRegistry::SessionRegistry(std::chrono::milliseconds drainTimeout)
    : drainTimeout_(drainTimeout) {}

SessionRegistry::~SessionRegistry() {
    std::vector<Drainer> drainers;
    {
        std::lock_guard<std::mutex> lk(drainMutex_);
        drainers.swap(drainers_);
    }
    for (Drainer &d : drainers) {
        if (d.thread.joinable())
            d.thread.join();
    }
}

SessionRegistry::TaskPtr SessionRegistry::tryGet(const std::string &key) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = tasks_.find(key);
    return it == tasks_.end() ? nullptr : it->second;
}

SessionRegistry::TaskPtr SessionRegistry::replace(const std::string &key,
                                                  TaskPtr task) {
    TaskPtr previous;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        TaskPtr &slot = tasks_[key];
        previous = std::move(slot);
        slot = std::move(task);
    }
    if (previous)
        qCInfo(rvReg) << "session superseded" << "key=" << key.c_str();
    return previous;
}

bool SessionRegistry::remove(const std::string &key, const TaskPtr &task) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = tasks_.find(key);
    if (it == tasks_.end() || it->second != task)
        return false;
    tasks_.erase(it);
    return true;
}

std::vector<std::pair<std::string, SessionRegistry::TaskPtr>>
SessionRegistry::snapshot() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return {tasks_.begin(), tasks_.end()};
}

std::size_t SessionRegistry::count() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return tasks_.size();
}

void SessionRegistry::cancelAll() {
    for (const auto &[key, task] : snapshot()) {
        bool eligible = true;
        try {
            eligible = !task->isCompleted() && !task->isCancellationRequested();
        } catch (const std::exception &e) {
            qCWarning(rvReg) << "state query failed, cancelling"
                             << "key=" << key.c_str() << "error=" << e.what();
        }
        if (!eligible)
            continue;
        try {
            task->cancel();
        } catch (const std::exception &e) {
            qCWarning(rvReg) << "cancel failed" << "key=" << key.c_str()
                             << "error=" << e.what();
        }
    }
}

bool SessionRegistry::waitAll(std::optional<std::chrono::milliseconds> timeout) {
    using Clock = std::chrono::steady_clock;
    timeout = boundedTimeout(timeout);
    std::vector<TaskPtr> pending;
    for (const auto &[key, task] : snapshot()) {
        try {
            if (!task->isCompleted())
                pending.push_back(task);
        } catch (const std::exception &e) {
            // Unobservable state must not block the aggregate wait.
            qCWarning(rvReg) << "state query failed, treating as completed"
                             << "key=" << key.c_str() << "error=" << e.what();
        }
    }
    if (pending.empty())
        return true;

    const auto deadline =
        timeout ? Clock::now() + *timeout : Clock::time_point::max();
    for (const TaskPtr &task : pending) {
        std::optional<std::chrono::milliseconds> remaining;
        if (timeout) {
            const auto left = deadline - Clock::now();
            remaining = left > Clock::duration::zero()
                            ? std::chrono::duration_cast<std::chrono::milliseconds>(left)
                            : std::chrono::milliseconds(0);
        }
        try {
            if (!task->wait(remaining))
                return false;
        } catch (const std::exception &e) {
            qCWarning(rvReg) << "wait failed, treating as completed"
                             << "key=" << task->key().c_str()
                             << "error=" << e.what();
        }
    }
    return true;
}

bool SessionRegistry::isCompleted() const {
    for (const auto &[key, task] : snapshot()) {
        try {
            if (!task->isCompleted())
                return false;
        } catch (const std::exception &e) {
            qCWarning(rvReg) << "state query failed, treating as completed"
                             << "key=" << key.c_str() << "error=" << e.what();
        }
    }
    return true;
}

void SessionRegistry::retire(TaskPtr task) {
    if (!task)
        return;
    std::lock_guard<std::mutex> lk(drainMutex_);
    for (auto it = drainers_.begin(); it != drainers_.end();) {
        if (it->done->load()) {
            it->thread.join();
            it = drainers_.erase(it);
        } else {
            ++it;
        }
    }
    auto done = std::make_shared<std::atomic<bool>>(false);
    Drainer d;
    d.done = done;
    d.thread = std::thread([this, done, task = std::move(task)] {
        drain(task);
        done->store(true);
    });
    drainers_.push_back(std::move(d));
}

void SessionRegistry::drain(const TaskPtr &task) {
    try {
        if (!task->wait(drainTimeout_)) {
            qCWarning(rvReg) << "drain timed out, forcing release"
                             << "key=" << task->key().c_str();
            task->cancel();
        }
        task->release();
    } catch (const std::exception &e) {
        qCWarning(rvReg) << "drain failed" << "key=" << task->key().c_str()
                         << "error=" << e.what();
    }
}

} // namespace rdpvisor
