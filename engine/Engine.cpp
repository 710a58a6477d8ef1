#include "Engine.hpp"
#include "ferry/RemoteListing.hpp"
#include "ferry/Log.hpp"
#include <QDir>
#include <QDirIterator>
#include <QFileInfo>

// Guard against symlink loops in recursive walks.
static constexpr int kMaxTreeDepth = 64;

Engine::Engine(const EngineSettings& settings, ferry::TransferFactory factory, QObject* parent)
    : QObject(parent),
      settings_(settings),
      connector_(settings.transport, std::move(factory)),
      resolverEnv_(ferry::ResolverEnv::fromProcess()),
      queue_([this](ConnectionHandle h) { return connection(h); }) {
    queue_.setMaxConcurrent(settings_.maxConcurrent);
    queue_.setCancelLatencyMs(settings_.cancelLatencyMs);
    QObject::connect(&queue_, &TransferQueue::tasksChanged, this, &Engine::tasksChanged, Qt::DirectConnection);
    QObject::connect(&queue_, &TransferQueue::taskProgress, this, &Engine::taskProgress, Qt::DirectConnection);
    QObject::connect(&queue_, &TransferQueue::taskFinished, this, &Engine::taskFinished, Qt::DirectConnection);
}

Engine::~Engine() {
    queue_.cancelAll();
}

std::shared_ptr<ferry::Connection> Engine::connection(ConnectionHandle h) const {
    std::lock_guard<std::mutex> lk(connMtx_);
    auto it = conns_.find(h);
    return it == conns_.end() ? nullptr : it->second;
}

ConnectionHandle Engine::connect(const ferry::ServerProfile& profile, ferry::ConnectError& err) {
    const ferry::AuthChain chain = ferry::resolveAuthChain(profile, resolverEnv_);
    std::unique_ptr<ferry::Connection> c = connector_.connect(profile, chain, err);
    if (!c) return 0;
    std::lock_guard<std::mutex> lk(connMtx_);
    const ConnectionHandle h = nextHandle_++;
    conns_[h] = std::shared_ptr<ferry::Connection>(std::move(c));
    return h;
}

bool Engine::disconnect(ConnectionHandle h) {
    std::shared_ptr<ferry::Connection> c;
    {
        std::lock_guard<std::mutex> lk(connMtx_);
        auto it = conns_.find(h);
        if (it == conns_.end()) return false;
        c = it->second;
        conns_.erase(it);
    }
    queue_.dropConnection(h);
    // A running worker keeps its own reference; make it return promptly.
    c->abort();
    LOGI("Disconnected handle %llu", (unsigned long long)h);
    return true;
}

bool Engine::connectionMode(ConnectionHandle h, ferry::TransportMode& mode) const {
    auto c = connection(h);
    if (!c) return false;
    mode = c->mode();
    return true;
}

bool Engine::list(ConnectionHandle h, const std::string& path,
                  std::vector<ferry::RemoteEntry>& out, ferry::ListError& err) {
    auto c = connection(h);
    if (!c) {
        err.clear();
        err.kind = ferry::ListErrorKind::NotConnected;
        err.message = "Unknown connection";
        return false;
    }
    return ferry::listRemote(*c, path, out, err);
}

TaskId Engine::enqueueTransfer(ConnectionHandle h, ferry::TransferDirection dir,
                               const QString& local, const QString& remote) {
    auto c = connection(h);
    if (!c) return 0;
    const QString resolved = QString::fromStdString(c->resolvePath(remote.toStdString()));
    return queue_.enqueue(h, dir, QFileInfo(local).absoluteFilePath(), resolved);
}

QVector<TaskId> Engine::enqueueUploadTree(ConnectionHandle h, const QString& localDir,
                                          const QString& remoteDir, QString& err) {
    QVector<TaskId> ids;
    auto c = connection(h);
    if (!c) {
        err = QStringLiteral("Unknown connection");
        return ids;
    }
    const QFileInfo root(localDir);
    if (!root.isDir()) {
        err = QStringLiteral("Not a directory: %1").arg(localDir);
        return ids;
    }
    const QDir base(root.absoluteFilePath());
    const std::string remoteBase = c->resolvePath(remoteDir.toStdString());
    QStringList files;
    QDirIterator it(base.absolutePath(), QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) files << it.next();
    files.sort();
    for (const QString& f : files) {
        const std::string rel = base.relativeFilePath(f).toStdString();
        const QString remote = QString::fromStdString(ferry::joinRemotePath(remoteBase, rel));
        ids.push_back(queue_.enqueue(h, ferry::TransferDirection::Upload, f, remote));
    }
    LOGI("Upload tree %s: %d file(s)", localDir.toLocal8Bit().constData(), (int)ids.size());
    return ids;
}

bool Engine::collectRemoteFiles(ferry::Connection& c, const std::string& dir, const std::string& rel,
                                std::vector<std::pair<std::string, std::string>>& out,
                                ferry::ListError& err, int depth) {
    if (depth > kMaxTreeDepth) {
        err.kind = ferry::ListErrorKind::Failed;
        err.message = "Directory tree too deep: " + dir;
        return false;
    }
    std::vector<ferry::RemoteEntry> entries;
    ferry::ListError e;
    if (!ferry::listRemote(c, dir, entries, e)) {
        err = e;
        return false;
    }
    if (e.isWarning()) {
        err.kind = ferry::ListErrorKind::PartialParseWarning;
        err.badLines += e.badLines;
        err.message = e.message;
    }
    for (const auto& entry : entries) {
        const std::string remote = ferry::joinRemotePath(dir, entry.name);
        const std::string childRel = rel.empty() ? entry.name : rel + "/" + entry.name;
        if (entry.is_dir) {
            if (!collectRemoteFiles(c, remote, childRel, out, err, depth + 1)) return false;
        } else {
            out.emplace_back(remote, childRel);
        }
    }
    return true;
}

QVector<TaskId> Engine::enqueueDownloadTree(ConnectionHandle h, const QString& remoteDir,
                                            const QString& localDir, ferry::ListError& err) {
    err.clear();
    QVector<TaskId> ids;
    auto c = connection(h);
    if (!c) {
        err.kind = ferry::ListErrorKind::NotConnected;
        err.message = "Unknown connection";
        return ids;
    }
    std::vector<std::pair<std::string, std::string>> files;
    if (!collectRemoteFiles(*c, c->resolvePath(remoteDir.toStdString()), std::string(), files, err, 0)) return ids;
    const QDir base(QFileInfo(localDir).absoluteFilePath());
    for (const auto& f : files) {
        const QString local = base.filePath(QString::fromStdString(f.second));
        ids.push_back(queue_.enqueue(h, ferry::TransferDirection::Download, local, QString::fromStdString(f.first)));
    }
    if (err.isWarning()) err.goodEntries = files.size();
    return ids;
}

bool Engine::makeDirectory(ConnectionHandle h, const std::string& path, std::string& err) {
    auto c = connection(h);
    if (!c) {
        err = "Unknown connection";
        return false;
    }
    std::lock_guard<std::mutex> lk(c->mutex());
    return ferry::ensureRemoteDirs(c->transfer(), c->resolvePath(path), err);
}

bool Engine::removeTree(ferry::FileTransfer& ft, const std::string& dir, std::string& err, int depth) {
    if (depth > kMaxTreeDepth) {
        err = "Directory tree too deep: " + dir;
        return false;
    }
    std::vector<ferry::RemoteEntry> entries;
    ferry::ListError le;
    if (!ft.list(dir, entries, le)) {
        err = le.message;
        return false;
    }
    if (le.isWarning()) {
        // Unparsed entries would make rmdir fail anyway.
        err = "Cannot remove " + dir + ": " + le.message;
        return false;
    }
    for (const auto& e : entries) {
        const std::string child = ferry::joinRemotePath(dir, e.name);
        // Symlinks to directories are removed as links, never followed.
        if (e.is_dir && !e.is_link) {
            if (!removeTree(ft, child, err, depth + 1)) return false;
        } else if (!ft.removeFile(child, err)) {
            return false;
        }
    }
    return ft.removeDir(dir, err);
}

bool Engine::remove(ConnectionHandle h, const std::string& path, std::string& err) {
    auto c = connection(h);
    if (!c) {
        err = "Unknown connection";
        return false;
    }
    const std::string target = c->resolvePath(path);
    if (target == "/") {
        err = "Refusing to remove /";
        return false;
    }
    std::lock_guard<std::mutex> lk(c->mutex());
    ferry::RemoteEntry info;
    err.clear();
    if (!c->transfer().stat(target, info, err)) {
        if (err.empty()) err = "No such file or directory: " + target;
        return false;
    }
    if (info.is_dir && !info.is_link) return removeTree(c->transfer(), target, err, 0);
    return c->transfer().removeFile(target, err);
}

bool Engine::rename(ConnectionHandle h, const std::string& from, const std::string& to,
                    std::string& err, bool overwrite) {
    auto c = connection(h);
    if (!c) {
        err = "Unknown connection";
        return false;
    }
    std::lock_guard<std::mutex> lk(c->mutex());
    return c->transfer().rename(c->resolvePath(from), c->resolvePath(to), err, overwrite);
}
