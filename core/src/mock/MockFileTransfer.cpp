// Mock implementation: an in-memory remote tree behind the FileTransfer interface.
#include "ferry/MockFileTransfer.hpp"
#include "ferry/ProgressGate.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <thread>

namespace ferry {

static std::string absPath(const std::string& p) {
    const std::string n = normalizeRemotePath(p.empty() ? "/" : p);
    if (n == ".") return "/";
    return n[0] == '/' ? n : "/" + n;
}

static const int kMaxLinkHops = 16;

using NodeMap = std::map<std::string, MockFileTransfer::Node>;

// Follows symlinks in each component of an absolute path, the last one only
// when followLast. Empty on a link loop.
static std::string resolveLinks(const NodeMap& fs, const std::string& path, bool followLast) {
    int hops = 0;
    std::string done = "/";
    std::string rest = path.substr(1);
    while (!rest.empty()) {
        const auto slash = rest.find('/');
        const std::string comp = rest.substr(0, slash);
        rest = slash == std::string::npos ? std::string() : rest.substr(slash + 1);
        const std::string next = joinRemotePath(done, comp);
        auto it = fs.find(next);
        if (it == fs.end() || it->second.linkTarget.empty() || (rest.empty() && !followLast)) {
            done = next;
            continue;
        }
        if (++hops > kMaxLinkHops) return std::string();
        const std::string& t = it->second.linkTarget;
        std::string target = absPath(t[0] == '/' ? t : joinRemotePath(done, t));
        if (!rest.empty()) target = joinRemotePath(target, rest);
        done = "/";
        rest = target.substr(1);
    }
    return done;
}

static RemoteEntry describe(const NodeMap& fs, const std::string& path, const MockFileTransfer::Node& n) {
    RemoteEntry e;
    e.name = path == "/" ? "/" : path.substr(path.find_last_of('/') + 1);
    const MockFileTransfer::Node* attrs = &n;
    if (!n.linkTarget.empty()) {
        e.is_link = true;
        e.link_target = n.linkTarget;
        e.mode = 0120777;
        e.permissions = permissionString(e.mode);
        auto t = fs.find(resolveLinks(fs, path, true));
        if (t == fs.end()) { // dangling
            e.size = n.linkTarget.size();
            e.mtime = n.mtime;
            return e;
        }
        attrs = &t->second;
    }
    e.is_dir = attrs->isDir;
    if (!e.is_dir) e.size = attrs->data.size();
    e.mtime = attrs->mtime;
    if (!e.is_link) {
        e.mode = attrs->mode | (e.is_dir ? 0040000u : 0100000u);
        e.permissions = permissionString(e.mode);
    }
    return e;
}

static const char* modeTag(TransportMode m) {
    return m == TransportMode::Library ? "library" : "native";
}

static const char* authTag(AuthMethod::Kind k) {
    switch (k) {
        case AuthMethod::Kind::Password: return "password";
        case AuthMethod::Kind::ExplicitKey: return "key";
        case AuthMethod::Kind::Agent: return "agent";
        case AuthMethod::Kind::DefaultKeyProbe: return "default-keys";
    }
    return "?";
}

MockFileTransfer::Script::Script() {
    Node root;
    root.isDir = true;
    root.mode = 0755;
    fs["/"] = root;
}

void MockFileTransfer::Script::addDir(const std::string& path) {
    std::lock_guard<std::mutex> lk(mu);
    std::string cur = absPath(path);
    while (cur != "/" && !fs.count(cur)) {
        Node n;
        n.isDir = true;
        n.mode = 0755;
        fs[cur] = n;
        cur = remoteParent(cur);
    }
}

void MockFileTransfer::Script::addFile(const std::string& path, const std::string& data, std::uint64_t mtime) {
    const std::string p = absPath(path);
    addDir(remoteParent(p));
    std::lock_guard<std::mutex> lk(mu);
    Node n;
    n.data = data;
    n.mtime = mtime;
    fs[p] = n;
}

void MockFileTransfer::Script::addLink(const std::string& path, const std::string& target) {
    const std::string p = absPath(path);
    addDir(remoteParent(p));
    std::lock_guard<std::mutex> lk(mu);
    Node n;
    n.linkTarget = target;
    n.mode = 0777;
    fs[p] = n;
}

bool MockFileTransfer::Script::hasFile(const std::string& path) {
    std::lock_guard<std::mutex> lk(mu);
    auto it = fs.find(absPath(path));
    return it != fs.end() && !it->second.isDir && it->second.linkTarget.empty();
}

std::string MockFileTransfer::Script::fileData(const std::string& path) {
    std::lock_guard<std::mutex> lk(mu);
    auto it = fs.find(absPath(path));
    return it == fs.end() ? std::string() : it->second.data;
}

std::vector<std::string> MockFileTransfer::Script::logSnapshot() {
    std::lock_guard<std::mutex> lk(mu);
    return log;
}

MockFileTransfer::MockFileTransfer(TransportMode mode, std::shared_ptr<Script> script)
    : mode_(mode), script_(std::move(script)) {}

void MockFileTransfer::record(const std::string& what) {
    std::lock_guard<std::mutex> lk(script_->mu);
    script_->log.push_back(std::string(modeTag(mode_)) + ":" + what);
}

bool MockFileTransfer::stopRequested(const CancelFn& shouldCancel, TransferError& err) const {
    if (aborted_) {
        err.set(TransferErrorKind::ConnectionLost, "Connection aborted");
        return true;
    }
    if (script_->ignoreCooperativeCancel || !shouldCancel || !shouldCancel()) return false;
    err.set(TransferErrorKind::Cancelled, "Cancelled by user");
    return true;
}

void MockFileTransfer::abort() {
    aborted_ = true;
    connected_ = false;
}

void MockFileTransfer::pause() const {
    if (script_->chunkDelayMs > 0) std::this_thread::sleep_for(std::chrono::milliseconds(script_->chunkDelayMs));
}

bool MockFileTransfer::open(const ServerProfile& profile,
                            const TransportOptions& opt,
                            ConnectErrorKind& kind,
                            std::string& err) {
    record("open");
    if (profile.host.empty()) {
        kind = ConnectErrorKind::NetworkUnreachable;
        err = "Host is required";
        return false;
    }
    if (!script_->openOk) {
        kind = script_->openErrorKind;
        err = script_->openError;
        return false;
    }
    opt_ = opt;
    opened_ = true;
    aborted_ = false;
    return true;
}

bool MockFileTransfer::authenticate(const AuthMethod& method,
                                    std::string& err,
                                    bool& sessionLost) {
    sessionLost = false;
    if (!opened_) {
        err = "Transport not open";
        sessionLost = true;
        return false;
    }
    const bool ok = script_->acceptedAuth.count(method.kind) > 0;
    record(std::string("auth:") + authTag(method.kind) + (ok ? ":ok" : ":fail"));
    if (ok) {
        connected_ = true;
        return true;
    }
    err = std::string("mock: ") + authTag(method.kind) + " rejected";
    if (script_->loseSessionOnAuthFailure) {
        sessionLost = true;
        opened_ = false;
    }
    return false;
}

void MockFileTransfer::disconnect() {
    if (opened_ || connected_) record("disconnect");
    connected_ = false;
    opened_ = false;
}

bool MockFileTransfer::list(const std::string& remote_path,
                            std::vector<RemoteEntry>& out,
                            ListError& err) {
    err.clear();
    if (aborted_) {
        err.kind = ListErrorKind::ConnectionLost;
        err.message = "Connection aborted";
        return false;
    }
    if (!connected_) {
        err.kind = ListErrorKind::NotConnected;
        err.message = "Not connected";
        return false;
    }
    std::lock_guard<std::mutex> lk(script_->mu);
    const std::string path = resolveLinks(script_->fs, absPath(remote_path), true);
    auto it = script_->fs.find(path);
    if (it == script_->fs.end()) {
        err.kind = ListErrorKind::PathNotFound;
        err.message = "Remote path not found: " + path;
        return false;
    }
    if (!it->second.isDir) {
        err.kind = ListErrorKind::Failed;
        err.message = "Not a directory: " + path;
        return false;
    }
    out.clear();
    for (const auto& kv : script_->fs) {
        if (kv.first == "/" || remoteParent(kv.first) != path) continue;
        out.push_back(describe(script_->fs, kv.first, kv.second));
    }
    if (script_->badListLines > 0) {
        err.kind = ListErrorKind::PartialParseWarning;
        err.goodEntries = out.size();
        err.badLines = script_->badListLines;
        err.message = std::to_string(err.badLines) + " entries could not be parsed";
    }
    return true;
}

bool MockFileTransfer::get(const std::string& remote,
                           const std::string& local,
                           TransferError& err,
                           ProgressFn progress,
                           CancelFn shouldCancel) {
    err.clear();
    if (!connected_) {
        err.set(TransferErrorKind::ConnectionLost, "Not connected");
        return false;
    }
    const std::string path = absPath(remote);
    std::string data;
    {
        std::lock_guard<std::mutex> lk(script_->mu);
        auto f = script_->failPaths.find(path);
        if (f != script_->failPaths.end()) {
            err.set(f->second, std::string("mock: ") + toString(f->second));
            return false;
        }
        auto it = script_->fs.find(resolveLinks(script_->fs, path, true));
        if (it == script_->fs.end() || it->second.isDir) {
            err.set(TransferErrorKind::SourceNotFound, "Remote source not found: " + path);
            return false;
        }
        data = it->second.data;
    }
    if (!prepareLocalDestination(local, err)) return false;

    std::FILE* lf = std::fopen(local.c_str(), "wb");
    if (!lf) {
        const int e = errno;
        err.set(destinationKindFromErrno(e), "Could not open local file for writing: " + std::string(std::strerror(e)));
        return false;
    }
    const std::uint64_t total = data.size();
    ProgressGate gate(progress, opt_.progressThresholdBytes, opt_.progressIntervalMs);
    gate.update(0, total);
    std::uint64_t done = 0;
    bool ok = true;
    while (done < total) {
        if (stopRequested(shouldCancel, err)) {
            ok = false;
            break;
        }
        pause();
        const std::size_t n = (std::size_t)std::min<std::uint64_t>(script_->chunkSize, total - done);
        if (std::fwrite(data.data() + done, 1, n, lf) != n) {
            const int e = errno;
            err.set(destinationKindFromErrno(e), "Local write failed: " + std::string(std::strerror(e)));
            ok = false;
            break;
        }
        done += n;
        gate.update(done, total);
    }
    if (std::fclose(lf) != 0 && ok) {
        err.set(TransferErrorKind::IoError, "Local close failed");
        ok = false;
    }
    if (ok) gate.finish(total, total);
    return ok;
}

bool MockFileTransfer::put(const std::string& local,
                           const std::string& remote,
                           TransferError& err,
                           ProgressFn progress,
                           CancelFn shouldCancel) {
    err.clear();
    if (!connected_) {
        err.set(TransferErrorKind::ConnectionLost, "Not connected");
        return false;
    }
    std::uint64_t total = 0;
    if (!checkLocalSource(local, total, err)) return false;

    std::string path = absPath(remote);
    {
        std::lock_guard<std::mutex> lk(script_->mu);
        auto f = script_->failPaths.find(path);
        if (f != script_->failPaths.end()) {
            err.set(f->second, std::string("mock: ") + toString(f->second));
            return false;
        }
        // Writing through a symlink replaces its target's content.
        path = resolveLinks(script_->fs, path, true);
        if (path.empty()) {
            err.set(TransferErrorKind::IoError, "Too many levels of symbolic links: " + remote);
            return false;
        }
        auto it = script_->fs.find(path);
        if (it != script_->fs.end() && it->second.isDir) {
            err.set(TransferErrorKind::DestinationConflict, "Remote destination is a directory: " + path);
            return false;
        }
    }
    std::string dirErr;
    if (!ensureRemoteDirs(*this, remoteParent(path), dirErr)) {
        err.set(TransferErrorKind::PermissionDenied, dirErr);
        return false;
    }

    std::FILE* lf = std::fopen(local.c_str(), "rb");
    if (!lf) {
        const int e = errno;
        err.set(transferKindFromErrno(e), "Could not open local file: " + std::string(std::strerror(e)));
        return false;
    }
    ProgressGate gate(progress, opt_.progressThresholdBytes, opt_.progressIntervalMs);
    gate.update(0, total);
    std::string data;
    data.reserve((std::size_t)total);
    std::vector<char> buf(script_->chunkSize ? script_->chunkSize : 1);
    bool ok = true;
    while (true) {
        if (stopRequested(shouldCancel, err)) {
            ok = false;
            break;
        }
        pause();
        const std::size_t n = std::fread(buf.data(), 1, buf.size(), lf);
        if (n == 0) {
            if (std::ferror(lf)) {
                err.set(TransferErrorKind::IoError, "Local read failed");
                ok = false;
            }
            break;
        }
        data.append(buf.data(), n);
        // Partial content is visible remotely, as with a real server.
        {
            std::lock_guard<std::mutex> lk(script_->mu);
            script_->fs[path].data = data;
        }
        gate.update(data.size(), total);
    }
    std::fclose(lf);
    if (ok) {
        {
            std::lock_guard<std::mutex> lk(script_->mu);
            script_->fs[path].data = data;
        }
        gate.finish(data.size(), data.size());
    }
    return ok;
}

bool MockFileTransfer::stat(const std::string& remote_path,
                            RemoteEntry& info,
                            std::string& err) {
    err.clear();
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    std::lock_guard<std::mutex> lk(script_->mu);
    const std::string path = resolveLinks(script_->fs, absPath(remote_path), false);
    auto it = script_->fs.find(path);
    if (it == script_->fs.end()) return false;
    info = describe(script_->fs, path, it->second);
    return true;
}

bool MockFileTransfer::exists(const std::string& remote_path,
                              bool& isDir,
                              std::string& err) {
    RemoteEntry e;
    if (!stat(remote_path, e, err)) return false;
    isDir = e.is_dir;
    return true;
}

bool MockFileTransfer::mkdir(const std::string& remote_dir,
                             std::string& err,
                             unsigned int mode) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    std::lock_guard<std::mutex> lk(script_->mu);
    const std::string path = resolveLinks(script_->fs, absPath(remote_dir), false);
    if (script_->fs.count(path)) {
        err = "File exists: " + path;
        return false;
    }
    auto parent = script_->fs.find(remoteParent(path));
    if (parent == script_->fs.end() || !parent->second.isDir) {
        err = "No such directory: " + remoteParent(path);
        return false;
    }
    Node n;
    n.isDir = true;
    n.mode = mode & 07777;
    script_->fs[path] = n;
    return true;
}

bool MockFileTransfer::removeFile(const std::string& remote_path, std::string& err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    // A symlink is unlinked itself, never its target.
    std::lock_guard<std::mutex> lk(script_->mu);
    const std::string path = resolveLinks(script_->fs, absPath(remote_path), false);
    auto it = script_->fs.find(path);
    if (it == script_->fs.end() || it->second.isDir) {
        err = "No such file: " + path;
        return false;
    }
    script_->fs.erase(it);
    return true;
}

bool MockFileTransfer::removeDir(const std::string& remote_dir, std::string& err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    std::lock_guard<std::mutex> lk(script_->mu);
    const std::string path = resolveLinks(script_->fs, absPath(remote_dir), false);
    auto it = script_->fs.find(path);
    if (path == "/" || it == script_->fs.end() || !it->second.isDir) {
        err = "No such directory: " + path;
        return false;
    }
    for (const auto& kv : script_->fs) {
        if (kv.first != "/" && remoteParent(kv.first) == path) {
            err = "Directory not empty: " + path;
            return false;
        }
    }
    script_->fs.erase(it);
    return true;
}

bool MockFileTransfer::rename(const std::string& from,
                              const std::string& to,
                              std::string& err,
                              bool overwrite) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    std::lock_guard<std::mutex> lk(script_->mu);
    const std::string src = resolveLinks(script_->fs, absPath(from), false);
    const std::string dst = resolveLinks(script_->fs, absPath(to), false);
    if (src.empty() || !script_->fs.count(src)) {
        err = "No such file: " + src;
        return false;
    }
    if (dst.empty()) {
        err = "Too many levels of symbolic links: " + to;
        return false;
    }
    if (script_->fs.count(dst) && !overwrite) {
        err = "File exists: " + dst;
        return false;
    }
    // Move the node and everything below it.
    std::map<std::string, Node> moved;
    for (auto it = script_->fs.begin(); it != script_->fs.end();) {
        if (it->first == src || it->first.compare(0, src.size() + 1, src + "/") == 0) {
            moved[dst + it->first.substr(src.size())] = it->second;
            it = script_->fs.erase(it);
        } else {
            ++it;
        }
    }
    for (auto& kv : moved) script_->fs[kv.first] = kv.second;
    return true;
}

} // namespace ferry
