#include <QtTest>
#include <QTemporaryDir>
#include <QSignalSpy>
#include <QSettings>
#include <QFile>
#include <QDir>
#include <QFileInfo>
#include <QElapsedTimer>
#include <QThread>
#include <QStandardPaths>

#include "Engine.hpp"
#include "EngineSettings.hpp"
#include "ProfileStore.hpp"
#include "SecretStore.hpp"
#include "ferry/MockFileTransfer.hpp"

using namespace ferry;
using Status = TransferTask::Status;

class TestEngine : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir *tempDir = nullptr;
    std::shared_ptr<MockFileTransfer::Script> library;
    std::shared_ptr<MockFileTransfer::Script> native;
    Engine *engine = nullptr;

    TransferFactory factory()
    {
        auto lib = library;
        auto nat = native;
        return [lib, nat](TransportMode mode) -> std::unique_ptr<FileTransfer> {
            return std::make_unique<MockFileTransfer>(mode, mode == TransportMode::Library ? lib : nat);
        };
    }

    static ServerProfile profile()
    {
        ServerProfile p;
        p.host = "files.example.net";
        p.username = "deploy";
        p.password = "pw";
        p.remote_base_path = "/home/deploy";
        return p;
    }

    ConnectionHandle connectOk()
    {
        ConnectError err;
        return engine->connect(profile(), err);
    }

    QString writeLocal(const QString& rel, const QByteArray& data)
    {
        const QString path = tempDir->path() + "/" + rel;
        QDir().mkpath(QFileInfo(path).absolutePath());
        QFile f(path);
        if (!f.open(QIODevice::WriteOnly)) return QString();
        f.write(data);
        return path;
    }

    bool waitAll(const QVector<TaskId>& ids, int timeoutMs = 5000)
    {
        QElapsedTimer timer;
        timer.start();
        while (timer.elapsed() < timeoutMs) {
            bool done = true;
            for (TaskId id : ids) {
                TransferTask t;
                if (!engine->queue().task(id, t) || !t.isTerminal()) done = false;
            }
            if (done) return true;
            QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
            QThread::msleep(2);
        }
        return false;
    }

    Status statusOf(TaskId id)
    {
        TransferTask t;
        engine->queue().task(id, t);
        return t.status;
    }

private slots:
    void initTestCase()
    {
        QStandardPaths::setTestModeEnabled(true);
    }

    void init()
    {
        tempDir = new QTemporaryDir();
        QVERIFY(tempDir->isValid());
        QSettings::setPath(QSettings::NativeFormat, QSettings::UserScope, tempDir->path() + "/config");
        QSettings::setPath(QSettings::IniFormat, QSettings::UserScope, tempDir->path() + "/config");
        qunsetenv("FERRY_ENABLE_INSECURE_FALLBACK");

        library = std::make_shared<MockFileTransfer::Script>();
        native = std::make_shared<MockFileTransfer::Script>();
        library->acceptedAuth = {AuthMethod::Kind::Password};
        library->addDir("/home/deploy");

        EngineSettings settings;
        engine = new Engine(settings, factory());
        ResolverEnv env;
        env.sshDir = (tempDir->path() + "/no-ssh").toStdString();
        engine->setResolverEnv(env);
    }

    void cleanup()
    {
        delete engine;
        engine = nullptr;
        delete tempDir;
        tempDir = nullptr;
    }

    // ========== Settings ==========

    void testSettingsDefaults()
    {
        QSettings s(tempDir->path() + "/empty.ini", QSettings::IniFormat);
        const EngineSettings e = EngineSettings::load(s);
        QCOMPARE(e.maxConcurrent, 1);
        QCOMPARE(e.cancelLatencyMs, 750);
        QCOMPARE(e.transport.connectTimeoutSec, 10);
        QCOMPARE(e.transport.authTimeoutSec, 20);
        QCOMPARE(e.transport.listTimeoutSec, 30);
        QVERIFY(e.transport.sshPath.empty());
    }

    void testSettingsRoundTripAndClamping()
    {
        const QString path = tempDir->path() + "/ferry.ini";
        {
            QSettings s(path, QSettings::IniFormat);
            EngineSettings e;
            e.maxConcurrent = 4;
            e.transport.sshpassPath = "/opt/bin/sshpass";
            e.save(s);
            s.setValue("Network/connectTimeoutSec", -5);
        }
        QSettings s(path, QSettings::IniFormat);
        const EngineSettings e = EngineSettings::load(s);
        QCOMPARE(e.maxConcurrent, 4);
        QCOMPARE(QString::fromStdString(e.transport.sshpassPath), QString("/opt/bin/sshpass"));
        QCOMPARE(e.transport.connectTimeoutSec, 1);
    }

    // ========== Saved sites ==========

    void testProfileStoreReadsSites()
    {
        QSettings s(tempDir->path() + "/sites.ini", QSettings::IniFormat);
        s.beginWriteArray("sites");
        s.setArrayIndex(0);
        s.setValue("name", "prod");
        s.setValue("host", "prod.example.net");
        s.setValue("port", 2200);
        s.setValue("user", "ops");
        s.setValue("keyPath", "/keys/ops");
        s.setValue("khPolicy", (int)KnownHostsPolicy::Strict);
        s.setValue("basePath", "/var/www");
        s.setArrayIndex(1);
        s.setValue("name", "lab");
        s.setValue("host", "10.0.0.7");
        s.endArray();

        ProfileStore store;
        store.load(s);
        QCOMPARE(store.profiles().size(), 2);

        ServerProfile p;
        QVERIFY(store.find("prod", p, nullptr));
        QCOMPARE(QString::fromStdString(p.host), QString("prod.example.net"));
        QCOMPARE(p.port, std::uint16_t(2200));
        QCOMPARE(QString::fromStdString(*p.private_key_path), QString("/keys/ops"));
        QCOMPARE(p.known_hosts_policy, KnownHostsPolicy::Strict);
        QCOMPARE(QString::fromStdString(p.remote_base_path), QString("/var/www"));
        QVERIFY(!p.password);

        QVERIFY(store.find("lab", p, nullptr));
        QCOMPARE(p.port, std::uint16_t(22));
        QCOMPARE(p.known_hosts_policy, KnownHostsPolicy::AcceptNew);
        QCOMPARE(QString::fromStdString(p.remote_base_path), QString("/"));
        QVERIFY(!store.find("missing", p, nullptr));
    }

    void testSecretsOnlyWithFallbackEnabled()
    {
        {
            QSettings stored("Ferry", "Secrets");
            stored.setValue(SecretStore::passwordKey("prod"), "hunter2");
            stored.setValue(SecretStore::passphraseKey("prod"), "");
        }
        SecretStore secrets;
        QVERIFY(!SecretStore::insecureFallbackActive());
        QVERIFY(!secrets.password("prod"));

        qputenv("FERRY_ENABLE_INSECURE_FALLBACK", "1");
        auto pw = secrets.password("prod");
        QVERIFY(pw);
        QCOMPARE(QString::fromStdString(*pw), QString("hunter2"));
        // Empty values count as absent
        QVERIFY(!secrets.keyPassphrase("prod"));
        QVERIFY(!secrets.password("staging"));

        QSettings s(tempDir->path() + "/sites.ini", QSettings::IniFormat);
        s.beginWriteArray("sites");
        s.setArrayIndex(0);
        s.setValue("name", "prod");
        s.setValue("host", "prod.example.net");
        s.endArray();
        ProfileStore store;
        store.load(s);
        ServerProfile p;
        QVERIFY(store.find("prod", p, &secrets));
        QCOMPARE(QString::fromStdString(*p.password), QString("hunter2"));
        QVERIFY(!p.private_key_passphrase);

        ServerProfile bare;
        QCOMPARE(secrets.applyTo("staging", bare), 0);
        QVERIFY(!bare.password);
        qunsetenv("FERRY_ENABLE_INSECURE_FALLBACK");
    }

    // ========== Connections ==========

    void testConnectAndMode()
    {
        const ConnectionHandle h = connectOk();
        QVERIFY(h != 0);
        TransportMode mode = TransportMode::NativeTool;
        QVERIFY(engine->connectionMode(h, mode));
        QCOMPARE(mode, TransportMode::Library);
        QVERIFY(!engine->connectionMode(h + 100, mode));
    }

    void testConnectFailureReturnsZero()
    {
        library->acceptedAuth.clear();
        ConnectError err;
        QCOMPARE(engine->connect(profile(), err), ConnectionHandle(0));
        QCOMPARE(err.kind, ConnectErrorKind::AllAuthMethodsExhausted);
        QVERIFY(!err.message().empty());
    }

    void testNativeFallbackThroughEngine()
    {
        library->acceptedAuth.clear();
        native->acceptedAuth = {AuthMethod::Kind::Password};
        native->addFile("/home/deploy/n.txt", "native");
        const ConnectionHandle h = connectOk();
        QVERIFY(h != 0);
        TransportMode mode = TransportMode::Library;
        QVERIFY(engine->connectionMode(h, mode));
        QCOMPARE(mode, TransportMode::NativeTool);

        std::vector<RemoteEntry> out;
        ListError err;
        QVERIFY(engine->list(h, "", out, err));
        QCOMPARE(out.size(), static_cast<size_t>(1));
    }

    void testListUnknownHandle()
    {
        std::vector<RemoteEntry> out;
        ListError err;
        QVERIFY(!engine->list(42, "/", out, err));
        QCOMPARE(err.kind, ListErrorKind::NotConnected);
        QCOMPARE(engine->enqueueTransfer(42, TransferDirection::Upload, "/tmp/a", "/a"), TaskId(0));
    }

    void testDisconnectFailsQueuedTasks()
    {
        const ConnectionHandle h = connectOk();
        library->chunkSize = 1024;
        library->chunkDelayMs = 10;
        const QString local = writeLocal("big.bin", QByteArray(200 * 1024, 'b'));
        const TaskId running = engine->enqueueTransfer(h, TransferDirection::Upload, local, "big1.bin");
        const TaskId queued = engine->enqueueTransfer(h, TransferDirection::Upload, local, "big2.bin");

        QVERIFY(engine->disconnect(h));
        QVERIFY(!engine->disconnect(h));
        QVERIFY(waitAll({running, queued}));
        QCOMPARE(statusOf(queued), Status::Failed);
        QVERIFY(statusOf(running) != Status::Succeeded);
    }

    // ========== Transfers ==========

    void testRelativeRemotePathUsesBase()
    {
        const ConnectionHandle h = connectOk();
        QSignalSpy finished(engine, &Engine::taskFinished);
        const QString local = writeLocal("hello.txt", "hello");
        const TaskId id = engine->enqueueTransfer(h, TransferDirection::Upload, local, "docs/hello.txt");
        QVERIFY(id != 0);
        QVERIFY(waitAll({id}));
        QCOMPARE(statusOf(id), Status::Succeeded);
        QCOMPARE(QString::fromStdString(library->fileData("/home/deploy/docs/hello.txt")), QString("hello"));
        QTRY_COMPARE(finished.count(), 1);

        auto sub = engine->subscribeProgress(id);
        ProgressEvent ev;
        QVERIFY(sub->next(ev, 0));
        QCOMPARE(ev.status, Status::Succeeded);
        QCOMPARE(ev.done, quint64(5));
    }

    void testUploadTree()
    {
        const ConnectionHandle h = connectOk();
        writeLocal("site/index.html", "<html/>");
        writeLocal("site/css/app.css", "body{}");
        writeLocal("site/.well-known/x", "x");
        QString err;
        const QVector<TaskId> ids = engine->enqueueUploadTree(h, tempDir->path() + "/site", "/srv/site", err);
        QVERIFY(err.isEmpty());
        QCOMPARE(ids.size(), 3);
        QVERIFY(waitAll(ids));
        QVERIFY(library->hasFile("/srv/site/index.html"));
        QVERIFY(library->hasFile("/srv/site/css/app.css"));
        QVERIFY(library->hasFile("/srv/site/.well-known/x"));

        engine->enqueueUploadTree(h, tempDir->path() + "/nothing-here", "/srv", err);
        QVERIFY(!err.isEmpty());
    }

    void testDownloadTree()
    {
        const ConnectionHandle h = connectOk();
        library->addFile("/data/a.txt", "a");
        library->addFile("/data/sub/b.txt", "bb");
        library->addFile("/data/sub/deeper/c.txt", "ccc");
        ListError lerr;
        const QVector<TaskId> ids = engine->enqueueDownloadTree(h, "/data", tempDir->path() + "/out", lerr);
        QCOMPARE(lerr.kind, ListErrorKind::None);
        QCOMPARE(ids.size(), 3);
        QVERIFY(waitAll(ids));
        QCOMPARE(QFileInfo(tempDir->path() + "/out/sub/deeper/c.txt").size(), qint64(3));
        QCOMPARE(QFileInfo(tempDir->path() + "/out/a.txt").size(), qint64(1));

        engine->enqueueDownloadTree(h, "/missing", tempDir->path() + "/out2", lerr);
        QCOMPARE(lerr.kind, ListErrorKind::PathNotFound);
    }

    void testDownloadTreeCarriesWarning()
    {
        const ConnectionHandle h = connectOk();
        library->addFile("/data/a.txt", "a");
        library->badListLines = 1;
        ListError lerr;
        const QVector<TaskId> ids = engine->enqueueDownloadTree(h, "/data", tempDir->path() + "/out", lerr);
        QVERIFY(lerr.isWarning());
        QCOMPARE(ids.size(), 1);
        QVERIFY(waitAll(ids));
    }

    // ========== Remote file operations ==========

    void testMakeDirectoryCreatesParents()
    {
        const ConnectionHandle h = connectOk();
        std::string err;
        QVERIFY(engine->makeDirectory(h, "a/b/c", err));
        std::vector<RemoteEntry> out;
        ListError lerr;
        QVERIFY(engine->list(h, "/home/deploy/a/b", out, lerr));
        QCOMPARE(out.size(), static_cast<size_t>(1));
        QVERIFY(out[0].is_dir);
        // Existing directories are fine
        QVERIFY(engine->makeDirectory(h, "a/b", err));
    }

    void testRemoveFileAndTree()
    {
        const ConnectionHandle h = connectOk();
        library->addFile("/srv/t/one.txt", "1");
        library->addFile("/srv/t/sub/two.txt", "2");
        library->addFile("/srv/keep.txt", "k");
        std::string err;

        QVERIFY(engine->remove(h, "/srv/keep.txt", err));
        QVERIFY(!library->hasFile("/srv/keep.txt"));
        QVERIFY(engine->remove(h, "/srv/t", err));
        std::vector<RemoteEntry> out;
        ListError lerr;
        QVERIFY(engine->list(h, "/srv", out, lerr));
        QVERIFY(out.empty());

        QVERIFY(!engine->remove(h, "/srv/gone", err));
        QVERIFY(!err.empty());
        QVERIFY(!engine->remove(h, "/", err));
    }

    void testRemoveLinkLeavesTargetIntact()
    {
        const ConnectionHandle h = connectOk();
        library->addFile("/srv/data/a.txt", "a");
        library->addFile("/srv/data/sub/b.txt", "b");
        library->addLink("/srv/t/current", "/srv/data");
        library->addFile("/srv/t/c.txt", "c");
        std::string err;

        // The link itself, by path
        QVERIFY(engine->remove(h, "/srv/t/current", err));
        QVERIFY(library->hasFile("/srv/data/a.txt"));
        QVERIFY(library->hasFile("/srv/data/sub/b.txt"));

        // A link met while removing a tree
        library->addLink("/srv/t/again", "../data");
        QVERIFY(engine->remove(h, "/srv/t", err));
        QVERIFY(library->hasFile("/srv/data/a.txt"));
        QVERIFY(library->hasFile("/srv/data/sub/b.txt"));
        std::vector<RemoteEntry> out;
        ListError lerr;
        QVERIFY(engine->list(h, "/srv", out, lerr));
        QCOMPARE(out.size(), static_cast<size_t>(1));
        QCOMPARE(QString::fromStdString(out[0].name), QString("data"));
    }

    void testRename()
    {
        const ConnectionHandle h = connectOk();
        library->addFile("/srv/old.txt", "o");
        library->addFile("/srv/taken.txt", "t");
        std::string err;
        QVERIFY(engine->rename(h, "/srv/old.txt", "/srv/new.txt", err));
        QVERIFY(library->hasFile("/srv/new.txt"));
        QVERIFY(!library->hasFile("/srv/old.txt"));

        QVERIFY(!engine->rename(h, "/srv/new.txt", "/srv/taken.txt", err));
        QVERIFY(engine->rename(h, "/srv/new.txt", "/srv/taken.txt", err, true));
        QCOMPARE(QString::fromStdString(library->fileData("/srv/taken.txt")), QString("o"));
    }

    // ========== Cancellation ==========

    void testCancelAllThroughEngine()
    {
        const ConnectionHandle h = connectOk();
        library->chunkSize = 1024;
        library->chunkDelayMs = 10;
        const QString local = writeLocal("c.bin", QByteArray(100 * 1024, 'c'));
        QVector<TaskId> ids;
        for (int i = 0; i < 3; ++i)
            ids << engine->enqueueTransfer(h, TransferDirection::Upload, local, QString("c%1.bin").arg(i));
        QVERIFY(engine->cancel(ids[2]));
        engine->cancelAll();
        QVERIFY(waitAll(ids));
        for (TaskId id : ids) QCOMPARE(statusOf(id), Status::Cancelled);
    }
};

QTEST_GUILESS_MAIN(TestEngine)
#include "test_engine.moc"
