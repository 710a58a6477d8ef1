#include <QtTest>
#include <QTemporaryDir>
#include <QSignalSpy>
#include <QElapsedTimer>
#include <QFile>

#include <map>
#include <mutex>

#include "TransferQueue.hpp"
#include "ferry/MockFileTransfer.hpp"

using namespace ferry;
using Status = TransferTask::Status;

class TestTransferQueue : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir *tempDir = nullptr;
    TransferQueue *queue = nullptr;
    std::shared_ptr<MockFileTransfer::Script> script;
    std::mutex connMutex;
    std::map<ConnectionHandle, std::shared_ptr<Connection>> conns;

    // Mock connection with fine-grained progress reporting.
    ConnectionHandle addConnection(ConnectionHandle h)
    {
        ServerProfile p;
        p.host = "files.example.net";
        p.username = "deploy";
        TransportOptions opt;
        opt.progressThresholdBytes = 1;
        opt.progressIntervalMs = 1;
        script->acceptedAuth = {AuthMethod::Kind::Password};

        auto ft = std::make_unique<MockFileTransfer>(TransportMode::Library, script);
        ConnectErrorKind kind = ConnectErrorKind::None;
        std::string err;
        bool lost = false;
        if (!ft->open(p, opt, kind, err) || !ft->authenticate(AuthMethod::password(), err, lost)) return 0;
        std::lock_guard<std::mutex> lk(connMutex);
        conns[h] = std::make_shared<Connection>(p, std::move(ft), AuthMethod::password(), opt);
        return h;
    }

    void dropConnection(ConnectionHandle h)
    {
        std::lock_guard<std::mutex> lk(connMutex);
        conns.erase(h);
    }

    QString makeLocalFile(const QString& name, int size)
    {
        const QString path = tempDir->path() + "/" + name;
        QFile f(path);
        if (!f.open(QIODevice::WriteOnly)) return QString();
        QByteArray data(size, '\0');
        for (int i = 0; i < size; ++i) data[i] = char('a' + i % 26);
        f.write(data);
        return path;
    }

    TransferTask taskOf(TaskId id) const
    {
        TransferTask t;
        queue->task(id, t);
        return t;
    }

    // Runs the event loop until the task reaches a terminal state.
    bool waitForTerminal(TaskId id, int timeoutMs = 5000)
    {
        QElapsedTimer timer;
        timer.start();
        while (timer.elapsed() < timeoutMs) {
            if (taskOf(id).isTerminal()) return true;
            QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
            QThread::msleep(2);
        }
        return taskOf(id).isTerminal();
    }

    bool waitForStatus(TaskId id, Status status, int timeoutMs = 5000)
    {
        QElapsedTimer timer;
        timer.start();
        while (timer.elapsed() < timeoutMs) {
            if (taskOf(id).status == status) return true;
            QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
            QThread::msleep(1);
        }
        return false;
    }

    // Everything a subscription has buffered so far.
    static QVector<ProgressEvent> drain(ProgressSubscription& sub)
    {
        QVector<ProgressEvent> out;
        ProgressEvent ev;
        while (sub.next(ev, 0)) out.push_back(ev);
        return out;
    }

    void slowDown(std::size_t chunk, int delayMs)
    {
        std::lock_guard<std::mutex> lk(script->mu);
        script->chunkSize = chunk;
        script->chunkDelayMs = delayMs;
    }

private slots:
    void init()
    {
        tempDir = new QTemporaryDir();
        QVERIFY(tempDir->isValid());
        script = std::make_shared<MockFileTransfer::Script>();
        queue = new TransferQueue([this](ConnectionHandle h) -> std::shared_ptr<Connection> {
            std::lock_guard<std::mutex> lk(connMutex);
            auto it = conns.find(h);
            return it == conns.end() ? nullptr : it->second;
        });
        QCOMPARE(addConnection(1), ConnectionHandle(1));
    }

    void cleanup()
    {
        delete queue;
        queue = nullptr;
        {
            std::lock_guard<std::mutex> lk(connMutex);
            conns.clear();
        }
        delete tempDir;
        tempDir = nullptr;
    }

    // ========== Defaults ==========

    void testDefaults()
    {
        QCOMPARE(queue->maxConcurrent(), 1);
        QCOMPARE(queue->cancelLatencyMs(), 750);
        queue->setMaxConcurrent(0);
        QCOMPARE(queue->maxConcurrent(), 1);
    }

    // ========== Single transfers ==========

    void testUploadCompletesWithFullSize()
    {
        const int size = 300 * 1024 + 17;
        const QString local = makeLocalFile("upload.bin", size);
        slowDown(16 * 1024, 1);

        const TaskId id = queue->enqueue(1, TransferDirection::Upload, local, "/srv/in/upload.bin");
        auto sub = queue->subscribe(id);
        QVERIFY(sub);
        QVERIFY(waitForTerminal(id));

        const QVector<ProgressEvent> events = drain(*sub);
        QVERIFY(!events.isEmpty());
        quint64 last = 0;
        int terminal = 0;
        for (const auto& ev : events) {
            QVERIFY2(ev.done >= last, "progress went backwards");
            last = ev.done;
            if (ev.isTerminal()) ++terminal;
        }
        QCOMPARE(terminal, 1);
        QVERIFY(events.last().isTerminal());
        QCOMPARE(events.last().status, Status::Succeeded);
        QCOMPARE(events.last().done, quint64(size));
        QCOMPARE(events.last().total, quint64(size));
        QVERIFY(sub->finished());

        QVERIFY(script->hasFile("/srv/in/upload.bin"));
        QCOMPARE(script->fileData("/srv/in/upload.bin").size(), static_cast<size_t>(size));
        QCOMPARE(taskOf(id).done, quint64(size));
    }

    void testDownloadWritesLocalFile()
    {
        script->addFile("/srv/report.csv", std::string(5000, 'x'));
        const QString local = tempDir->path() + "/nested/dir/report.csv";

        const TaskId id = queue->enqueue(1, TransferDirection::Download, local, "/srv/report.csv");
        QVERIFY(waitForTerminal(id));
        QCOMPARE(taskOf(id).status, Status::Succeeded);
        QCOMPARE(QFileInfo(local).size(), qint64(5000));
    }

    void testZeroByteUpload()
    {
        const QString local = makeLocalFile("empty.txt", 0);
        const TaskId id = queue->enqueue(1, TransferDirection::Upload, local, "/srv/empty.txt");
        QVERIFY(waitForTerminal(id));
        QCOMPARE(taskOf(id).status, Status::Succeeded);
        QVERIFY(script->hasFile("/srv/empty.txt"));
    }

    // ========== Failures ==========

    void testMissingRemoteSourceFails()
    {
        const TaskId id = queue->enqueue(1, TransferDirection::Download, tempDir->path() + "/x", "/srv/missing");
        QVERIFY(waitForTerminal(id));
        const TransferTask t = taskOf(id);
        QCOMPARE(t.status, Status::Failed);
        QCOMPARE(t.error.kind, TransferErrorKind::SourceNotFound);
    }

    void testMissingLocalSourceFails()
    {
        const TaskId id = queue->enqueue(1, TransferDirection::Upload, tempDir->path() + "/nope", "/srv/nope");
        QVERIFY(waitForTerminal(id));
        QCOMPARE(taskOf(id).status, Status::Failed);
        QCOMPARE(taskOf(id).error.kind, TransferErrorKind::SourceNotFound);
    }

    void testRemoteQuotaReported()
    {
        {
            std::lock_guard<std::mutex> lk(script->mu);
            script->failPaths["/srv/full.bin"] = TransferErrorKind::RemoteQuotaExceeded;
        }
        const QString local = makeLocalFile("full.bin", 10);
        const TaskId id = queue->enqueue(1, TransferDirection::Upload, local, "/srv/full.bin");
        auto sub = queue->subscribe(id);
        QVERIFY(waitForTerminal(id));
        const QVector<ProgressEvent> events = drain(*sub);
        QCOMPARE(events.last().status, Status::Failed);
        QCOMPARE(events.last().errorKind, TransferErrorKind::RemoteQuotaExceeded);
    }

    void testFailureDoesNotStopTheQueue()
    {
        const TaskId bad = queue->enqueue(1, TransferDirection::Download, tempDir->path() + "/a", "/srv/missing");
        script->addFile("/srv/ok.txt", "ok");
        const TaskId good = queue->enqueue(1, TransferDirection::Download, tempDir->path() + "/ok.txt", "/srv/ok.txt");
        QVERIFY(waitForTerminal(good));
        QCOMPARE(taskOf(bad).status, Status::Failed);
        QCOMPARE(taskOf(good).status, Status::Succeeded);
    }

    // ========== Scheduling ==========

    void testConcurrencyLimitOne()
    {
        slowDown(8 * 1024, 2);
        QSignalSpy finished(queue, &TransferQueue::taskFinished);
        QVector<TaskId> ids;
        for (int i = 0; i < 3; ++i) {
            const QString local = makeLocalFile(QString("f%1.bin").arg(i), 64 * 1024);
            ids << queue->enqueue(1, TransferDirection::Upload, local, QString("/srv/f%1.bin").arg(i));
        }

        int maxRunning = 0;
        QElapsedTimer timer;
        timer.start();
        while (!taskOf(ids.last()).isTerminal() && timer.elapsed() < 10000) {
            int running = 0;
            for (const auto& t : queue->tasks())
                if (t.status == Status::Running) ++running;
            maxRunning = qMax(maxRunning, running);
            QCoreApplication::processEvents(QEventLoop::AllEvents, 5);
            QThread::msleep(1);
        }
        QVERIFY(waitForTerminal(ids.last()));
        QCOMPARE(maxRunning, 1);
        for (TaskId id : ids) QCOMPARE(taskOf(id).status, Status::Succeeded);

        // FIFO completion order
        QTRY_COMPARE(finished.count(), 3);
        for (int i = 0; i < 3; ++i) QCOMPARE(finished.at(i).at(0).toULongLong(), quint64(ids[i]));
    }

    void testOneRunningTaskPerConnection()
    {
        QCOMPARE(addConnection(2), ConnectionHandle(2));
        queue->setMaxConcurrent(3);
        slowDown(8 * 1024, 2);

        const QString a = makeLocalFile("a.bin", 64 * 1024);
        const TaskId a1 = queue->enqueue(1, TransferDirection::Upload, a, "/srv/a1.bin");
        const TaskId a2 = queue->enqueue(1, TransferDirection::Upload, a, "/srv/a2.bin");
        const TaskId b1 = queue->enqueue(2, TransferDirection::Upload, a, "/srv/b1.bin");

        // Connection 2 is not held back by connection 1's backlog
        QVERIFY(waitForStatus(b1, Status::Running));
        QVERIFY(taskOf(a2).status == Status::Queued || taskOf(a1).isTerminal());

        int perConn1 = 0;
        QElapsedTimer timer;
        timer.start();
        while (!(taskOf(a2).isTerminal() && taskOf(b1).isTerminal()) && timer.elapsed() < 10000) {
            int running = 0;
            for (const auto& t : queue->tasks())
                if (t.connection == 1 && t.status == Status::Running) ++running;
            perConn1 = qMax(perConn1, running);
            QCoreApplication::processEvents(QEventLoop::AllEvents, 5);
            QThread::msleep(1);
        }
        QCOMPARE(perConn1, 1);
        QCOMPARE(taskOf(a1).status, Status::Succeeded);
        QCOMPARE(taskOf(a2).status, Status::Succeeded);
        QCOMPARE(taskOf(b1).status, Status::Succeeded);
    }

    void testTasksChangedEmitted()
    {
        QSignalSpy changed(queue, &TransferQueue::tasksChanged);
        script->addFile("/srv/s.txt", "s");
        const TaskId id = queue->enqueue(1, TransferDirection::Download, tempDir->path() + "/s.txt", "/srv/s.txt");
        QVERIFY(waitForTerminal(id));
        QVERIFY(changed.count() >= 3); // queued, running, finished
    }

    // ========== Cancellation ==========

    void testCancelQueuedTask()
    {
        slowDown(4 * 1024, 10);
        const QString local = makeLocalFile("big.bin", 128 * 1024);
        const TaskId first = queue->enqueue(1, TransferDirection::Upload, local, "/srv/first.bin");
        const TaskId second = queue->enqueue(1, TransferDirection::Upload, local, "/srv/second.bin");
        auto sub = queue->subscribe(second);

        QCOMPARE(taskOf(second).status, Status::Queued);
        QVERIFY(queue->cancel(second));
        QCOMPARE(taskOf(second).status, Status::Cancelled);
        const QVector<ProgressEvent> events = drain(*sub);
        QCOMPARE(events.size(), 1);
        QCOMPARE(events.first().status, Status::Cancelled);

        // Terminal tasks cannot be cancelled again
        QVERIFY(!queue->cancel(second));
        QVERIFY(queue->cancel(first));
        QVERIFY(waitForTerminal(first));
        QVERIFY(!script->hasFile("/srv/second.bin"));
    }

    void testCancelRunningTaskCooperatively()
    {
        slowDown(4 * 1024, 20);
        const QString local = makeLocalFile("slow.bin", 512 * 1024);
        const TaskId id = queue->enqueue(1, TransferDirection::Upload, local, "/srv/slow.bin");
        auto sub = queue->subscribe(id);
        QVERIFY(waitForStatus(id, Status::Running));
        QTRY_VERIFY(taskOf(id).done > 0);

        QElapsedTimer timer;
        timer.start();
        QVERIFY(queue->cancel(id));
        QVERIFY(waitForTerminal(id));
        QVERIFY(timer.elapsed() < 700); // stopped before the forced abort was due

        const TransferTask t = taskOf(id);
        QCOMPARE(t.status, Status::Cancelled);
        QCOMPARE(t.error.kind, TransferErrorKind::Cancelled);
        QVERIFY(t.done < quint64(512 * 1024));

        int terminal = 0;
        for (const auto& ev : drain(*sub))
            if (ev.isTerminal()) ++terminal;
        QCOMPARE(terminal, 1);
    }

    void testForcedAbortWhenTransferIgnoresCancel()
    {
        queue->setCancelLatencyMs(100);
        slowDown(4 * 1024, 20);
        {
            std::lock_guard<std::mutex> lk(script->mu);
            script->ignoreCooperativeCancel = true;
        }
        const QString local = makeLocalFile("stuck.bin", 512 * 1024);
        const TaskId id = queue->enqueue(1, TransferDirection::Upload, local, "/srv/stuck.bin");
        QVERIFY(waitForStatus(id, Status::Running));

        QElapsedTimer timer;
        timer.start();
        QVERIFY(queue->cancel(id));
        QVERIFY(waitForTerminal(id));
        // Full transfer would take about 2.5 s
        QVERIFY(timer.elapsed() < 2000);
        QCOMPARE(taskOf(id).status, Status::Cancelled);
    }

    void testTaskAfterForcedAbortFailsWithConnectionLost()
    {
        queue->setCancelLatencyMs(100);
        slowDown(4 * 1024, 20);
        {
            std::lock_guard<std::mutex> lk(script->mu);
            script->ignoreCooperativeCancel = true;
        }
        const QString local = makeLocalFile("stuck.bin", 512 * 1024);
        const TaskId stuck = queue->enqueue(1, TransferDirection::Upload, local, "/srv/stuck.bin");
        const TaskId next = queue->enqueue(1, TransferDirection::Upload, local, "/srv/next.bin");
        QVERIFY(waitForStatus(stuck, Status::Running));

        QVERIFY(queue->cancel(stuck));
        QVERIFY(waitForTerminal(stuck));
        QVERIFY(waitForTerminal(next));

        QCOMPARE(taskOf(stuck).status, Status::Cancelled);
        QCOMPARE(taskOf(stuck).error.kind, TransferErrorKind::Cancelled);
        // Nobody cancelled the second task; the session died under it
        const TransferTask t = taskOf(next);
        QCOMPARE(t.status, Status::Failed);
        QCOMPARE(t.error.kind, TransferErrorKind::ConnectionLost);
        QVERIFY(!script->hasFile("/srv/next.bin"));
    }

    void testCancelAll()
    {
        slowDown(4 * 1024, 10);
        const QString local = makeLocalFile("c.bin", 256 * 1024);
        QVector<TaskId> ids;
        for (int i = 0; i < 4; ++i)
            ids << queue->enqueue(1, TransferDirection::Upload, local, QString("/srv/c%1.bin").arg(i));
        QVERIFY(waitForStatus(ids[0], Status::Running));

        queue->cancelAll();
        for (TaskId id : ids) {
            QVERIFY(waitForTerminal(id));
            QCOMPARE(taskOf(id).status, Status::Cancelled);
        }
        QTRY_COMPARE(queue->runningCount(), 0);
    }

    // ========== Subscriptions ==========

    void testSubscribeAfterCompletion()
    {
        script->addFile("/srv/done.txt", "done");
        const TaskId id = queue->enqueue(1, TransferDirection::Download, tempDir->path() + "/done.txt", "/srv/done.txt");
        QVERIFY(waitForTerminal(id));

        auto sub = queue->subscribe(id);
        QVERIFY(sub);
        ProgressEvent ev;
        QVERIFY(sub->next(ev, 0));
        QCOMPARE(ev.status, Status::Succeeded);
        QCOMPARE(ev.done, quint64(4));
        QVERIFY(!sub->next(ev, 0));
        QVERIFY(sub->finished());
    }

    void testSubscribeUnknownTask()
    {
        QVERIFY(!queue->subscribe(12345));
    }

    void testNextTimesOut()
    {
        slowDown(1024, 50);
        const QString local = makeLocalFile("t.bin", 8 * 1024);
        const TaskId first = queue->enqueue(1, TransferDirection::Upload, local, "/srv/t1.bin");
        const TaskId second = queue->enqueue(1, TransferDirection::Upload, local, "/srv/t2.bin");
        auto sub = queue->subscribe(second);
        ProgressEvent ev;
        // Still queued behind the first task: nothing to report yet
        QVERIFY(!sub->next(ev, 20));
        QVERIFY(!sub->finished());
        QVERIFY(waitForTerminal(first));
        QVERIFY(waitForTerminal(second));
    }

    // ========== Queue maintenance ==========

    void testRequeueAndClearFinished()
    {
        const TaskId failed = queue->enqueue(1, TransferDirection::Download, tempDir->path() + "/r.txt", "/srv/r.txt");
        QVERIFY(waitForTerminal(failed));
        QCOMPARE(taskOf(failed).status, Status::Failed);

        script->addFile("/srv/r.txt", "now here");
        const TaskId retry = queue->requeue(failed);
        QVERIFY(retry != 0);
        QVERIFY(retry != failed);
        QVERIFY(waitForTerminal(retry));
        QCOMPARE(taskOf(retry).status, Status::Succeeded);

        QCOMPARE(queue->tasks().size(), 2);
        queue->clearFinished();
        QCOMPARE(queue->tasks().size(), 0);
    }

    void testQueuedTasksFailWhenConnectionGoes()
    {
        slowDown(4 * 1024, 10);
        const QString local = makeLocalFile("d.bin", 128 * 1024);
        const TaskId running = queue->enqueue(1, TransferDirection::Upload, local, "/srv/d1.bin");
        const TaskId queued = queue->enqueue(1, TransferDirection::Upload, local, "/srv/d2.bin");
        QVERIFY(waitForStatus(running, Status::Running));

        queue->dropConnection(1);
        QCOMPARE(taskOf(queued).status, Status::Failed);
        QCOMPARE(taskOf(queued).error.kind, TransferErrorKind::ConnectionLost);
        QVERIFY(waitForTerminal(running));
        QCOMPARE(taskOf(running).status, Status::Cancelled);
    }

    void testTaskForUnknownConnectionFails()
    {
        dropConnection(1);
        const TaskId id = queue->enqueue(1, TransferDirection::Upload, makeLocalFile("o.bin", 1), "/srv/o.bin");
        QVERIFY(waitForTerminal(id));
        QCOMPARE(taskOf(id).status, Status::Failed);
        QCOMPARE(taskOf(id).error.kind, TransferErrorKind::ConnectionLost);
    }
};

QTEST_GUILESS_MAIN(TestTransferQueue)
#include "test_transferqueue.moc"
