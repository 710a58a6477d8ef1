// Queue implementation: std::thread per running task, state behind mtx_,
// scheduler re-entered on the queue's thread.
#include "TransferQueue.hpp"
#include "ferry/Log.hpp"
#include <QMetaObject>
#include <QThread>
#include <QTimer>
#include <chrono>

const char* toString(TransferTask::Status s) {
    switch (s) {
        case TransferTask::Status::Queued: return "queued";
        case TransferTask::Status::Running: return "running";
        case TransferTask::Status::Succeeded: return "succeeded";
        case TransferTask::Status::Failed: return "failed";
        case TransferTask::Status::Cancelled: return "cancelled";
    }
    return "?";
}

// ---- ProgressSubscription ----

void ProgressSubscription::push(const ProgressEvent& ev) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (terminalQueued_) return;
        events_.push_back(ev);
        if (ev.isTerminal()) terminalQueued_ = true;
    }
    cv_.notify_all();
}

bool ProgressSubscription::next(ProgressEvent& ev, int timeoutMs) {
    std::unique_lock<std::mutex> lk(mu_);
    if (finished_) return false;
    auto ready = [this] { return !events_.empty(); };
    if (timeoutMs < 0) {
        cv_.wait(lk, ready);
    } else if (!cv_.wait_for(lk, std::chrono::milliseconds(timeoutMs), ready)) {
        return false;
    }
    ev = events_.front();
    events_.pop_front();
    if (ev.isTerminal()) finished_ = true;
    return true;
}

bool ProgressSubscription::finished() const {
    std::lock_guard<std::mutex> lk(mu_);
    return finished_;
}

// ---- TransferQueue ----

TransferQueue::TransferQueue(ConnectionLookup lookup, QObject* parent)
    : QObject(parent), lookup_(std::move(lookup)) {
    qRegisterMetaType<ProgressEvent>("ProgressEvent");
}

TransferQueue::~TransferQueue() {
    shuttingDown_ = true;
    std::vector<ConnectionHandle> active;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (const auto& t : tasks_) {
            if (t.status == TransferTask::Status::Running) {
                canceledTasks_.insert(t.id);
                active.push_back(t.connection);
            }
        }
    }
    // Workers blocked in I/O never see the cooperative flag.
    for (ConnectionHandle h : active) {
        if (auto c = lookup_(h)) c->abort();
    }
    for (auto& kv : workers_) {
        if (kv.second.joinable()) kv.second.join();
    }
    workers_.clear();
}

int TransferQueue::indexForId(TaskId id) const {
    for (int i = 0; i < tasks_.size(); ++i)
        if (tasks_[i].id == id) return i;
    return -1;
}

ProgressEvent TransferQueue::eventFor(const TransferTask& t) {
    ProgressEvent ev;
    ev.id = t.id;
    ev.done = t.done;
    ev.total = t.total;
    ev.status = t.status;
    ev.errorKind = t.error.kind;
    ev.error = QString::fromStdString(t.error.message);
    return ev;
}

void TransferQueue::publishLocked(const ProgressEvent& ev) {
    auto it = subscribers_.find(ev.id);
    if (it == subscribers_.end()) return;
    auto& subs = it->second;
    for (auto s = subs.begin(); s != subs.end();) {
        if (auto sp = s->lock()) {
            sp->push(ev);
            ++s;
        } else {
            s = subs.erase(s);
        }
    }
    if (ev.isTerminal()) subscribers_.erase(it);
}

void TransferQueue::scheduleSoon() {
    if (shuttingDown_) return;
    if (QThread::currentThread() == thread()) schedule();
    else QMetaObject::invokeMethod(this, "schedule", Qt::QueuedConnection);
}

TaskId TransferQueue::enqueue(ConnectionHandle conn, ferry::TransferDirection dir,
                              const QString& local, const QString& remote) {
    TaskId id = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        TransferTask t;
        t.id = id = nextId_++;
        t.direction = dir;
        t.local = local;
        t.remote = remote;
        t.connection = conn;
        tasks_.push_back(t);
    }
    LOGD("Queued task %llu: %s %s <-> %s", (unsigned long long)id, ferry::toString(dir),
         local.toLocal8Bit().constData(), remote.toLocal8Bit().constData());
    emit tasksChanged();
    scheduleSoon();
    return id;
}

bool TransferQueue::finish(TaskId id, TransferTask::Status status, const ferry::TransferError& err) {
    ProgressEvent ev;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        const int i = indexForId(id);
        if (i < 0 || tasks_[i].isTerminal()) return false;
        TransferTask& t = tasks_[i];
        t.status = status;
        t.error = status == TransferTask::Status::Failed ? err : ferry::TransferError{};
        if (status == TransferTask::Status::Cancelled) t.error.set(ferry::TransferErrorKind::Cancelled, "Cancelled by user");
        if (status == TransferTask::Status::Succeeded) {
            if (t.total == 0 || t.done > t.total) t.total = t.done;
            t.done = t.total;
        }
        canceledTasks_.erase(id);
        ev = eventFor(t);
        publishLocked(ev);
    }
    if (status == TransferTask::Status::Failed) {
        LOGW("Task %llu failed (%s): %s", (unsigned long long)id, ferry::toString(err.kind), err.message.c_str());
    } else {
        LOGI("Task %llu %s", (unsigned long long)id, toString(status));
    }
    emit taskProgress(id, ev);
    emit taskFinished(id);
    emit tasksChanged();
    return true;
}

bool TransferQueue::cancel(TaskId id) {
    bool queued = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        const int i = indexForId(id);
        if (i < 0 || tasks_[i].isTerminal()) return false;
        queued = tasks_[i].status == TransferTask::Status::Queued;
        if (!queued) canceledTasks_.insert(id);
    }
    if (queued) {
        finish(id, TransferTask::Status::Cancelled, ferry::TransferError{});
        return true;
    }
    // Running: the cooperative flag is set; abort if it has not stopped in time.
    QMetaObject::invokeMethod(this, [this, id]() { armForcedAbort(id); }, Qt::QueuedConnection);
    emit tasksChanged();
    return true;
}

void TransferQueue::armForcedAbort(TaskId id) {
    QTimer::singleShot(cancelLatencyMs_, this, [this, id]() {
        ConnectionHandle h = 0;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            const int i = indexForId(id);
            if (i < 0 || tasks_[i].status != TransferTask::Status::Running || !canceledTasks_.count(id)) return;
            h = tasks_[i].connection;
        }
        if (auto c = lookup_(h)) {
            LOGW("Task %llu did not stop after %d ms; aborting transport", (unsigned long long)id, cancelLatencyMs_);
            c->abort();
        }
    });
}

void TransferQueue::cancelAll() {
    std::vector<TaskId> ids;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (const auto& t : tasks_)
            if (!t.isTerminal()) ids.push_back(t.id);
    }
    for (TaskId id : ids) cancel(id);
}

void TransferQueue::dropConnection(ConnectionHandle conn) {
    std::vector<TaskId> queued;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (const auto& t : tasks_) {
            if (t.connection != conn || t.isTerminal()) continue;
            if (t.status == TransferTask::Status::Queued) queued.push_back(t.id);
            else canceledTasks_.insert(t.id);
        }
    }
    ferry::TransferError err;
    err.set(ferry::TransferErrorKind::ConnectionLost, "Connection closed");
    for (TaskId id : queued) finish(id, TransferTask::Status::Failed, err);
}

TaskId TransferQueue::requeue(TaskId id) {
    TaskId nid = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        const int i = indexForId(id);
        if (i < 0 || !tasks_[i].isTerminal()) return 0;
        TransferTask t;
        t.id = nid = nextId_++;
        t.direction = tasks_[i].direction;
        t.local = tasks_[i].local;
        t.remote = tasks_[i].remote;
        t.connection = tasks_[i].connection;
        tasks_.push_back(t);
    }
    emit tasksChanged();
    scheduleSoon();
    return nid;
}

void TransferQueue::clearFinished() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        QVector<TransferTask> next;
        next.reserve(tasks_.size());
        for (const auto& t : tasks_) {
            if (!t.isTerminal()) next.push_back(t);
        }
        tasks_.swap(next);
    }
    emit tasksChanged();
}

std::shared_ptr<ProgressSubscription> TransferQueue::subscribe(TaskId id) {
    std::lock_guard<std::mutex> lk(mtx_);
    const int i = indexForId(id);
    if (i < 0) return nullptr;
    auto sub = std::make_shared<ProgressSubscription>(id);
    const TransferTask& t = tasks_[i];
    if (t.isTerminal()) {
        sub->push(eventFor(t));
        return sub;
    }
    if (t.status == TransferTask::Status::Running) sub->push(eventFor(t));
    subscribers_[id].push_back(sub);
    return sub;
}

QVector<TransferTask> TransferQueue::tasks() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return tasks_;
}

bool TransferQueue::task(TaskId id, TransferTask& out) const {
    std::lock_guard<std::mutex> lk(mtx_);
    const int i = indexForId(id);
    if (i < 0) return false;
    out = tasks_[i];
    return true;
}

void TransferQueue::reapWorkers() {
    std::unordered_set<TaskId> done;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        done.swap(finishedWorkers_);
    }
    for (TaskId id : done) {
        auto it = workers_.find(id);
        if (it == workers_.end()) continue;
        if (it->second.joinable()) it->second.join();
        workers_.erase(it);
    }
}

void TransferQueue::schedule() {
    if (shuttingDown_) return;
    reapWorkers();

    while (running_.load() < maxConcurrent_) {
        // Next queued task whose connection is free, in FIFO order
        TransferTask t;
        int idx = -1;
        bool orphan = false;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            for (int i = 0; i < tasks_.size(); ++i) {
                if (tasks_[i].status != TransferTask::Status::Queued) continue;
                auto conn = lookup_(tasks_[i].connection);
                if (!conn) {
                    idx = i;
                    orphan = true;
                    t = tasks_[i];
                    break;
                }
                const bool shared = conn->transfer().supportsConcurrentChannels();
                if (!shared && busyConnections_[tasks_[i].connection] > 0) continue;
                idx = i;
                t = tasks_[i];
                break;
            }
            if (idx >= 0 && !orphan) {
                tasks_[idx].status = TransferTask::Status::Running;
                tasks_[idx].done = 0;
                tasks_[idx].error.clear();
                busyConnections_[t.connection] += 1;
                running_.fetch_add(1);
            }
        }
        if (idx < 0) break;
        if (orphan) {
            ferry::TransferError err;
            err.set(ferry::TransferErrorKind::ConnectionLost, "Connection closed");
            finish(t.id, TransferTask::Status::Failed, err);
            continue;
        }
        emit tasksChanged();

        const TaskId taskId = t.id;
        // Clean any previous worker with the same id (should not happen)
        if (workers_.count(taskId) && workers_[taskId].joinable()) {
            workers_[taskId].join();
        }
        workers_[taskId] = std::thread([this, t]() { runTask(t); });
    }
}

void TransferQueue::onProgress(TaskId id, quint64 done, quint64 total) {
    ProgressEvent ev;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        const int i = indexForId(id);
        if (i < 0 || tasks_[i].status != TransferTask::Status::Running) return;
        TransferTask& t = tasks_[i];
        if (total > 0) t.total = total;
        // Bytes done never go backwards while a task runs.
        if (done < t.done) return;
        if (done == t.done && t.done != 0) return;
        t.done = done;
        ev = eventFor(t);
        publishLocked(ev);
    }
    emit taskProgress(id, ev);
}

void TransferQueue::runTask(TransferTask t) {
    const TaskId taskId = t.id;
    auto release = [this, &t]() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            auto it = busyConnections_.find(t.connection);
            if (it != busyConnections_.end() && --it->second <= 0) busyConnections_.erase(it);
            finishedWorkers_.insert(t.id);
        }
        running_.fetch_sub(1);
        // Reschedule on the queue's thread
        if (!shuttingDown_) QMetaObject::invokeMethod(this, "schedule", Qt::QueuedConnection);
    };

    auto conn = lookup_(t.connection);
    if (!conn) {
        ferry::TransferError err;
        err.set(ferry::TransferErrorKind::ConnectionLost, "Connection closed");
        finish(taskId, TransferTask::Status::Failed, err);
        release();
        return;
    }

    auto isCanceled = [this, taskId]() -> bool {
        std::lock_guard<std::mutex> lk(mtx_);
        return canceledTasks_.count(taskId) > 0;
    };
    auto progress = [this, taskId](std::uint64_t done, std::uint64_t total) {
        onProgress(taskId, done, total);
    };

    LOGI("Task %llu started (%s, %s mode)", (unsigned long long)taskId, ferry::toString(t.direction),
         ferry::toString(conn->mode()));

    ferry::TransferError err;
    bool ok = false;
    {
        std::lock_guard<std::mutex> slk(conn->mutex());
        if (isCanceled()) {
            err.set(ferry::TransferErrorKind::Cancelled, "Cancelled by user");
        } else if (t.direction == ferry::TransferDirection::Upload) {
            ok = conn->transfer().put(t.local.toStdString(), t.remote.toStdString(), err, progress, isCanceled);
        } else {
            ok = conn->transfer().get(t.remote.toStdString(), t.local.toStdString(), err, progress, isCanceled);
        }
    }

    // Only this task's own cancel request makes it Cancelled. A backend that
    // was aborted under another task reports a dead connection.
    if (ok) {
        finish(taskId, TransferTask::Status::Succeeded, err);
    } else if (isCanceled()) {
        if (err.kind != ferry::TransferErrorKind::Cancelled) err.set(ferry::TransferErrorKind::Cancelled, "Cancelled by user");
        finish(taskId, TransferTask::Status::Cancelled, err);
    } else {
        if (err.kind == ferry::TransferErrorKind::Cancelled)
            err.set(ferry::TransferErrorKind::ConnectionLost, "Connection aborted");
        finish(taskId, TransferTask::Status::Failed, err);
    }
    release();
}
