// Transfer queue: FIFO dispatch with a concurrency limit, one running task per
// connection, progress fan-out and cancellation with a forced-abort fallback.
#pragma once
#include <QObject>
#include <QString>
#include <QVector>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include "ferry/Connector.hpp"

using ConnectionHandle = quint64;
using TaskId = quint64;

// Transfer queue item.
struct TransferTask {
    // Task state:
    //  - Queued: waiting for a free slot
    //  - Running: a worker owns it
    //  - Succeeded / Failed / Cancelled: terminal
    enum class Status { Queued, Running, Succeeded, Failed, Cancelled };

    TaskId id = 0;
    ferry::TransferDirection direction = ferry::TransferDirection::Upload;
    QString local;
    QString remote;               // absolute, already resolved against the base path
    ConnectionHandle connection = 0;
    quint64 total = 0;            // 0 = unknown
    quint64 done = 0;
    Status status = Status::Queued;
    ferry::TransferError error;   // set when Failed

    bool isTerminal() const {
        return status == Status::Succeeded || status == Status::Failed || status == Status::Cancelled;
    }
};

const char* toString(TransferTask::Status s);

// One progress notification. Terminal events carry the final status.
struct ProgressEvent {
    TaskId id = 0;
    quint64 done = 0;
    quint64 total = 0;
    TransferTask::Status status = TransferTask::Status::Running;
    ferry::TransferErrorKind errorKind = ferry::TransferErrorKind::None;
    QString error;

    bool isTerminal() const {
        return status == TransferTask::Status::Succeeded || status == TransferTask::Status::Failed ||
               status == TransferTask::Status::Cancelled;
    }
};
Q_DECLARE_METATYPE(ProgressEvent)

// Pull-style view of one task's events, usable from any thread.
class ProgressSubscription {
public:
    explicit ProgressSubscription(TaskId id) : id_(id) {}

    TaskId taskId() const { return id_; }

    // Waits up to timeoutMs (< 0: forever) for the next event. Returns false on
    // timeout or once the terminal event has already been delivered.
    bool next(ProgressEvent& ev, int timeoutMs = -1);
    // True after the terminal event has been handed out by next().
    bool finished() const;

private:
    friend class TransferQueue;
    void push(const ProgressEvent& ev);

    TaskId id_;
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<ProgressEvent> events_;
    bool terminalQueued_ = false;
    bool finished_ = false;
};

class TransferQueue : public QObject {
    Q_OBJECT
public:
    // Looks up a live connection by handle (null once disconnected).
    using ConnectionLookup = std::function<std::shared_ptr<ferry::Connection>(ConnectionHandle)>;

    explicit TransferQueue(ConnectionLookup lookup, QObject* parent = nullptr);
    ~TransferQueue();

    // Concurrency: maximum number of simultaneous tasks
    void setMaxConcurrent(int n) { if (n < 1) n = 1; maxConcurrent_ = n; }
    int maxConcurrent() const { return maxConcurrent_; }
    // Delay between a cancel request on a running task and the forced abort
    void setCancelLatencyMs(int ms) { cancelLatencyMs_ = ms < 0 ? 0 : ms; }
    int cancelLatencyMs() const { return cancelLatencyMs_; }

    TaskId enqueue(ConnectionHandle conn, ferry::TransferDirection dir,
                   const QString& local, const QString& remote);

    // Cancel a task. Queued tasks end immediately; running tasks are asked to
    // stop and aborted after cancelLatencyMs(). False if unknown or terminal.
    bool cancel(TaskId id);
    // Cancel all active or queued tasks
    void cancelAll();
    // Fails every non-terminal task of a connection that is going away.
    void dropConnection(ConnectionHandle conn);

    // New Queued task copying a terminal one. Returns 0 if id is not terminal.
    TaskId requeue(TaskId id);
    // Removes terminal tasks.
    void clearFinished();

    std::shared_ptr<ProgressSubscription> subscribe(TaskId id);

    // Snapshot copies; the live list is shared with workers.
    QVector<TransferTask> tasks() const;
    bool task(TaskId id, TransferTask& out) const;
    int runningCount() const { return running_.load(); }

signals:
    // Emitted when the task list/state changes (to refresh observers)
    void tasksChanged();
    void taskProgress(quint64 id, const ProgressEvent& ev);
    void taskFinished(quint64 id);

public slots:
    void schedule(); // launch queued tasks up to maxConcurrent

private:
    void runTask(TransferTask t);
    void onProgress(TaskId id, quint64 done, quint64 total);
    // Moves a task to a terminal state once. Returns false if it already was.
    bool finish(TaskId id, TransferTask::Status status, const ferry::TransferError& err);
    void publishLocked(const ProgressEvent& ev);
    void armForcedAbort(TaskId id);
    void reapWorkers();
    void scheduleSoon();
    int indexForId(TaskId id) const;
    static ProgressEvent eventFor(const TransferTask& t);

    ConnectionLookup lookup_;
    QVector<TransferTask> tasks_;
    std::atomic<int> running_{0};
    int maxConcurrent_ = 1;
    int cancelLatencyMs_ = 750;
    std::atomic<bool> shuttingDown_{false};

    // Worker threads per task
    std::unordered_map<TaskId, std::thread> workers_;
    std::unordered_set<TaskId> finishedWorkers_;
    // Auxiliary state for worker cooperation
    std::unordered_set<TaskId> canceledTasks_;
    std::unordered_map<ConnectionHandle, int> busyConnections_;
    std::unordered_map<TaskId, std::vector<std::weak_ptr<ProgressSubscription>>> subscribers_;
    // Synchronization
    mutable std::mutex mtx_;   // protects everything above except workers_
    TaskId nextId_ = 1;
};
