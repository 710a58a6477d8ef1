// Ferry command-line driver: connects with the engine and runs one command.
// The command runs on a QtConcurrent thread; the main thread keeps the event
// loop that drives the transfer queue.
#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFutureWatcher>
#include <QtConcurrent/QtConcurrentRun>
#include <QDateTime>
#include <QTextStream>
#include <cstdio>
#include <cstdlib>
#include "Engine.hpp"
#include "ProfileStore.hpp"
#include "SecretStore.hpp"
#include "ferry/Log.hpp"

static QTextStream& out() {
    static QTextStream s(stdout);
    return s;
}

static QTextStream& errOut() {
    static QTextStream s(stderr);
    return s;
}

static QString humanSize(quint64 n) {
    const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double v = (double)n;
    int u = 0;
    while (v >= 1024.0 && u < 4) {
        v /= 1024.0;
        ++u;
    }
    return u == 0 ? QString("%1 B").arg(n) : QString("%1 %2").arg(v, 0, 'f', 1).arg(units[u]);
}

static bool parsePolicy(const QString& s, ferry::KnownHostsPolicy& p) {
    if (s == "strict") p = ferry::KnownHostsPolicy::Strict;
    else if (s == "accept-new") p = ferry::KnownHostsPolicy::AcceptNew;
    else if (s == "off") p = ferry::KnownHostsPolicy::Off;
    else return false;
    return true;
}

// Waits for every task, printing progress lines. Returns the number of failures.
static int waitForTasks(Engine& engine, const QVector<TaskId>& ids, bool quiet) {
    int failures = 0;
    for (TaskId id : ids) {
        auto sub = engine.subscribeProgress(id);
        if (!sub) {
            ++failures;
            continue;
        }
        TransferTask t;
        engine.queue().task(id, t);
        const QString label = t.direction == ferry::TransferDirection::Upload ? t.local : t.remote;
        ProgressEvent ev;
        while (sub->next(ev)) {
            if (!ev.isTerminal()) {
                if (quiet) continue;
                if (ev.total > 0) {
                    out() << "\r" << label << "  " << (ev.done * 100 / ev.total) << "% ("
                          << humanSize(ev.done) << " / " << humanSize(ev.total) << ")" << Qt::flush;
                } else {
                    out() << "\r" << label << "  " << humanSize(ev.done) << Qt::flush;
                }
                continue;
            }
            if (ev.status == TransferTask::Status::Succeeded) {
                if (!quiet) out() << "\r" << label << "  done (" << humanSize(ev.done) << ")" << Qt::endl;
            } else {
                ++failures;
                if (!quiet) out() << Qt::endl;
                errOut() << label << ": " << toString(ev.status);
                if (!ev.error.isEmpty()) errOut() << " (" << ev.error << ")";
                errOut() << Qt::endl;
            }
        }
    }
    return failures;
}

static void printListing(const std::vector<ferry::RemoteEntry>& entries) {
    for (const auto& e : entries) {
        const QString when = e.mtime
            ? QDateTime::fromSecsSinceEpoch((qint64)e.mtime).toString("yyyy-MM-dd HH:mm")
            : QString("                ");
        const QString size = e.size ? QString::number((qulonglong)*e.size) : QString("-");
        QString name = QString::fromStdString(e.name);
        if (e.is_dir) name += '/';
        if (!e.link_target.empty()) name += " -> " + QString::fromStdString(e.link_target);
        out() << QString::fromStdString(e.permissions.empty() ? std::string("----------") : e.permissions)
              << "  " << size.rightJustified(12) << "  " << when << "  " << name << Qt::endl;
    }
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("Ferry");
    QCoreApplication::setApplicationName("Ferry");
    QCoreApplication::setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Remote file transfer over SSH (libssh2, with native ssh/scp fallback).\n\n"
        "Commands:\n"
        "  ls [path]                 list a remote directory\n"
        "  get <remote> <local>      download a file\n"
        "  put <local> <remote>      upload a file\n"
        "  get-tree <remote> <local> download a directory tree\n"
        "  put-tree <local> <remote> upload a directory tree\n"
        "  mkdir <path>              create a remote directory (with parents)\n"
        "  rm <path>                 remove a remote file or directory tree\n"
        "  mv <from> <to>            rename a remote path");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption siteOpt("site", "Use the saved site <name>.", "name");
    QCommandLineOption hostOpt("host", "Remote host.", "host");
    QCommandLineOption portOpt({"p", "port"}, "Remote port (default 22).", "port", "22");
    QCommandLineOption userOpt({"u", "user"}, "Remote user name.", "user");
    QCommandLineOption keyOpt({"i", "identity"}, "Private key file.", "path");
    QCommandLineOption pwEnvOpt("password-env", "Read the password from environment variable <var>.", "var");
    QCommandLineOption ppEnvOpt("passphrase-env", "Read the key passphrase from environment variable <var>.", "var");
    QCommandLineOption baseOpt("base", "Remote base path for relative paths.", "path");
    QCommandLineOption khOpt("known-hosts", "known_hosts file.", "path");
    QCommandLineOption policyOpt("host-key-policy", "strict, accept-new (default) or off.", "policy");
    QCommandLineOption jobsOpt({"j", "jobs"}, "Maximum concurrent transfers.", "n");
    QCommandLineOption quietOpt({"q", "quiet"}, "Do not print progress.");
    parser.addOptions({siteOpt, hostOpt, portOpt, userOpt, keyOpt, pwEnvOpt, ppEnvOpt, baseOpt,
                       khOpt, policyOpt, jobsOpt, quietOpt});
    parser.addPositionalArgument("command", "Command to run.");
    parser.addPositionalArgument("args", "Command arguments.", "[args...]");
    parser.process(app);

    const QStringList pos = parser.positionalArguments();
    if (pos.isEmpty()) parser.showHelp(1);
    const QString cmd = pos.first();
    const QStringList args = pos.mid(1);
    struct Arity { const char* name; int n; };
    static const Arity arity[] = {{"ls", -1}, {"get", 2}, {"put", 2}, {"get-tree", 2}, {"put-tree", 2},
                                  {"mkdir", 1}, {"rm", 1}, {"mv", 2}};
    bool known = false;
    for (const auto& a : arity) {
        if (cmd != a.name) continue;
        known = true;
        if ((a.n < 0 && args.size() > 1) || (a.n >= 0 && args.size() != a.n)) {
            errOut() << "ferry: wrong number of arguments for " << cmd << Qt::endl;
            return 2;
        }
    }
    if (!known) {
        errOut() << "ferry: unknown command " << cmd << Qt::endl;
        return 2;
    }

    // Profile: saved site first, then command-line overrides
    ferry::ServerProfile profile;
    if (parser.isSet(siteOpt)) {
        ProfileStore store;
        store.load();
        SecretStore secrets;
        if (!store.find(parser.value(siteOpt), profile, &secrets)) {
            errOut() << "ferry: no saved site named " << parser.value(siteOpt) << Qt::endl;
            return 2;
        }
    }
    if (parser.isSet(hostOpt)) profile.host = parser.value(hostOpt).toStdString();
    if (parser.isSet(portOpt) || !parser.isSet(siteOpt)) {
        bool ok = false;
        const uint port = parser.value(portOpt).toUInt(&ok);
        if (!ok || port == 0 || port > 65535) {
            errOut() << "ferry: invalid port " << parser.value(portOpt) << Qt::endl;
            return 2;
        }
        profile.port = (std::uint16_t)port;
    }
    if (parser.isSet(userOpt)) profile.username = parser.value(userOpt).toStdString();
    if (profile.username.empty()) {
        const char* u = std::getenv("USER");
        if (u) profile.username = u;
    }
    if (parser.isSet(keyOpt)) profile.private_key_path = parser.value(keyOpt).toStdString();
    if (parser.isSet(pwEnvOpt)) {
        const QByteArray v = qgetenv(parser.value(pwEnvOpt).toLocal8Bit().constData());
        if (!v.isEmpty()) profile.password = v.toStdString();
    }
    if (parser.isSet(ppEnvOpt)) {
        const QByteArray v = qgetenv(parser.value(ppEnvOpt).toLocal8Bit().constData());
        if (!v.isEmpty()) profile.private_key_passphrase = v.toStdString();
    }
    if (parser.isSet(baseOpt)) profile.remote_base_path = parser.value(baseOpt).toStdString();
    if (parser.isSet(khOpt)) profile.known_hosts_path = parser.value(khOpt).toStdString();
    if (parser.isSet(policyOpt) && !parsePolicy(parser.value(policyOpt), profile.known_hosts_policy)) {
        errOut() << "ferry: invalid host key policy " << parser.value(policyOpt) << Qt::endl;
        return 2;
    }
    if (profile.host.empty()) {
        errOut() << "ferry: no host given (use --host or --site)" << Qt::endl;
        return 2;
    }

    EngineSettings settings = EngineSettings::load();
    if (parser.isSet(jobsOpt)) settings.maxConcurrent = qMax(1, parser.value(jobsOpt).toInt());
    Engine engine(settings);
    const bool quiet = parser.isSet(quietOpt);

    // The job blocks (connect, listing, waiting for tasks); the queue is
    // scheduled on this thread's event loop meanwhile.
    QFutureWatcher<int> watcher;
    QObject::connect(&watcher, &QFutureWatcher<int>::finished, &app, [&]() { app.exit(watcher.result()); });
    watcher.setFuture(QtConcurrent::run([&]() -> int {
        ferry::ConnectError cerr;
        const ConnectionHandle h = engine.connect(profile, cerr);
        if (!h) {
            errOut() << "ferry: " << QString::fromStdString(cerr.message()) << Qt::endl;
            return 1;
        }
        ferry::TransportMode mode = ferry::TransportMode::Library;
        engine.connectionMode(h, mode);
        LOGI("Connected (%s mode)", ferry::toString(mode));

        int rc = 0;
        std::string err;
        if (cmd == "ls") {
            std::vector<ferry::RemoteEntry> entries;
            ferry::ListError lerr;
            if (!engine.list(h, args.isEmpty() ? std::string() : args[0].toStdString(), entries, lerr)) {
                errOut() << "ferry: " << ferry::toString(lerr.kind) << ": " << QString::fromStdString(lerr.message) << Qt::endl;
                rc = 1;
            } else {
                printListing(entries);
                if (lerr.isWarning()) {
                    errOut() << "ferry: warning: " << QString::fromStdString(lerr.message) << Qt::endl;
                }
            }
        } else if (cmd == "get" || cmd == "put") {
            const bool up = cmd == "put";
            const TaskId id = up ? engine.enqueueTransfer(h, ferry::TransferDirection::Upload, args[0], args[1])
                                 : engine.enqueueTransfer(h, ferry::TransferDirection::Download, args[1], args[0]);
            rc = waitForTasks(engine, {id}, quiet) ? 1 : 0;
        } else if (cmd == "put-tree") {
            QString terr;
            const QVector<TaskId> ids = engine.enqueueUploadTree(h, args[0], args[1], terr);
            if (!terr.isEmpty()) {
                errOut() << "ferry: " << terr << Qt::endl;
                rc = 1;
            } else {
                rc = waitForTasks(engine, ids, quiet) ? 1 : 0;
            }
        } else if (cmd == "get-tree") {
            ferry::ListError lerr;
            const QVector<TaskId> ids = engine.enqueueDownloadTree(h, args[0], args[1], lerr);
            if (lerr.kind != ferry::ListErrorKind::None && !lerr.isWarning()) {
                errOut() << "ferry: " << QString::fromStdString(lerr.message) << Qt::endl;
                rc = 1;
            } else {
                if (lerr.isWarning()) errOut() << "ferry: warning: " << QString::fromStdString(lerr.message) << Qt::endl;
                rc = waitForTasks(engine, ids, quiet) ? 1 : 0;
            }
        } else if (cmd == "mkdir") {
            rc = engine.makeDirectory(h, args[0].toStdString(), err) ? 0 : 1;
        } else if (cmd == "rm") {
            rc = engine.remove(h, args[0].toStdString(), err) ? 0 : 1;
        } else if (cmd == "mv") {
            rc = engine.rename(h, args[0].toStdString(), args[1].toStdString(), err) ? 0 : 1;
        }
        if (rc != 0 && !err.empty()) errOut() << "ferry: " << QString::fromStdString(err) << Qt::endl;
        engine.disconnect(h);
        return rc;
    }));

    return app.exec();
}
