// Native-Tool backend: ssh for auth checks, listings and remote file operations,
// scp for file contents. Child processes are driven synchronously with
// QProcess::waitFor* so the backend works on plain worker threads.
#include "ferry/NativeToolTransfer.hpp"
#include "ferry/NativeOutput.hpp"
#include "ferry/ProgressGate.hpp"
#include "ferry/Log.hpp"

#include <QElapsedTimer>
#include <QProcess>
#include <QProcessEnvironment>
#include <QStringList>

#include <algorithm>
#include <cstdio>
#include <map>
#include <sys/stat.h>

namespace ferry {

static bool mentions(const std::string& hay, const char* needle) {
    return hay.find(needle) != std::string::npos;
}

static bool mentionsBadOption(const std::string& text) {
    return mentions(text, "unrecognized option") || mentions(text, "illegal option") ||
           mentions(text, "invalid option") || mentions(text, "unknown option");
}

static std::uint64_t localFileSize(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return 0;
    return (std::uint64_t)st.st_size;
}

NativeToolTransfer::NativeToolTransfer(NativeTools tools)
    : tools_(std::move(tools)), toolsGiven_(true) {}

std::string NativeToolTransfer::firstLine(const std::string& s) {
    std::size_t b = 0;
    while (b < s.size() && (s[b] == '\n' || s[b] == '\r' || s[b] == ' ')) ++b;
    std::size_t e = s.find_first_of("\r\n", b);
    return s.substr(b, e == std::string::npos ? std::string::npos : e - b);
}

NativeToolTransfer::ProcessResult
NativeToolTransfer::run(const NativeInvocation& inv,
                        int timeoutMs,
                        const CancelFn& shouldCancel,
                        const std::function<void(const std::string&)>& onOutput,
                        const std::function<void()>& onTick) {
    ProcessResult r;
    if (inv.program.empty()) {
        r.err = "executable not found";
        return r;
    }

    QProcess p;
    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    env.insert(QStringLiteral("LC_ALL"), QStringLiteral("C"));
    for (const auto& kv : inv.env) env.insert(QString::fromStdString(kv.first), QString::fromStdString(kv.second));
    p.setProcessEnvironment(env);
    p.setStandardInputFile(QProcess::nullDevice());

    QStringList args;
    for (const auto& a : inv.args) args << QString::fromStdString(a);
    p.start(QString::fromStdString(inv.program), args);
    if (!p.waitForStarted(5000)) {
        r.err = p.errorString().toStdString();
        LOGW("Could not start %s: %s", inv.program.c_str(), r.err.c_str());
        return r;
    }
    r.started = true;

    auto drain = [&]() {
        const QByteArray o = p.readAllStandardOutput();
        const QByteArray e = p.readAllStandardError();
        if (!o.isEmpty()) {
            r.out.append(o.constData(), (std::size_t)o.size());
            if (onOutput) onOutput(std::string(o.constData(), (std::size_t)o.size()));
        }
        if (!e.isEmpty()) {
            r.err.append(e.constData(), (std::size_t)e.size());
            if (onOutput) onOutput(std::string(e.constData(), (std::size_t)e.size()));
        }
    };

    QElapsedTimer timer;
    timer.start();
    while (!p.waitForFinished(100)) {
        drain();
        if (p.state() == QProcess::NotRunning) break;
        if (onTick) onTick();
        if (aborted_ || (shouldCancel && shouldCancel())) {
            r.cancelled = true;
            p.kill();
            p.waitForFinished(2000);
            break;
        }
        if (timeoutMs > 0 && timer.elapsed() > timeoutMs) {
            r.timedOut = true;
            p.kill();
            p.waitForFinished(2000);
            break;
        }
    }
    drain();
    if (onTick && !r.cancelled && !r.timedOut) onTick();
    r.exitCode = (p.exitStatus() == QProcess::NormalExit) ? p.exitCode() : -1;
    return r;
}

bool NativeToolTransfer::open(const ServerProfile& profile,
                              const TransportOptions& opt,
                              ConnectErrorKind& kind,
                              std::string& err) {
    profile_ = profile;
    opt_ = opt;
    aborted_ = false;
    connected_ = false;
    method_.reset();
    if (!toolsGiven_) tools_ = NativeTools::locate(opt);

    if (tools_.ssh.empty()) {
        kind = ConnectErrorKind::TransportUnavailable;
        err = "ssh executable not found";
        return false;
    }
    const ProcessResult v = run(NativeInvocation{tools_.ssh, {"-V"}, {}}, 5000);
    if (!v.started || v.exitCode != 0) {
        kind = ConnectErrorKind::TransportUnavailable;
        err = "ssh is not usable: " + (v.err.empty() ? std::string("exit code ") + std::to_string(v.exitCode)
                                                    : firstLine(v.err));
        return false;
    }
    if (tools_.scp.empty()) {
        kind = ConnectErrorKind::TransportUnavailable;
        err = "scp executable not found";
        return false;
    }
    const std::string banner = firstLine(v.err.empty() ? v.out : v.err);
    tools_.scpSftpMode = scpSupportsSftpMode(banner);
    LOGI("Native tools: %s (%s)%s", tools_.ssh.c_str(), banner.c_str(),
         tools_.scpSftpMode ? "" : "; legacy scp, remote paths are shell-quoted");
    if (tools_.sshpass.empty()) LOGD("sshpass not found; password authentication unavailable in native mode");
    opened_ = true;
    return true;
}

bool NativeToolTransfer::authenticate(const AuthMethod& method,
                                      std::string& err,
                                      bool& sessionLost) {
    sessionLost = false;
    if (!opened_) {
        err = "Transport not open";
        sessionLost = true;
        return false;
    }
    if (needsSshpass(method, profile_) && tools_.sshpass.empty()) {
        err = method.kind == AuthMethod::Kind::Password
                  ? "sshpass not found; cannot pass a password to ssh"
                  : "sshpass not found; cannot pass a key passphrase to ssh";
        return false;
    }
    if (method.kind == AuthMethod::Kind::Password && !profile_.password) {
        err = "No password in profile";
        return false;
    }

    const int timeoutMs = (opt_.connectTimeoutSec + opt_.authTimeoutSec) * 1000;
    const ProcessResult r = run(buildSshCommand(tools_, profile_, method, opt_, "exit 0"), timeoutMs);
    if (r.started && !r.timedOut && !r.cancelled && r.exitCode == 0) {
        method_ = method;
        connected_ = true;
        LOGI("Native ssh authenticated to %s with %s", profile_.host.c_str(), method.describe().c_str());
        return true;
    }
    if (r.timedOut) err = "ssh auth check timed out";
    else if (r.cancelled) err = "ssh auth check aborted";
    else if (!r.err.empty()) err = firstLine(r.err);
    else err = "ssh exited with code " + std::to_string(r.exitCode);
    LOGD("Native auth check with %s failed: %s", method.describe().c_str(), err.c_str());
    return false;
}

void NativeToolTransfer::disconnect() {
    connected_ = false;
    opened_ = false;
    method_.reset();
}

void NativeToolTransfer::abort() {
    aborted_ = true;
}

NativeToolTransfer::ProcessResult NativeToolTransfer::runRemote(const std::string& command, int timeoutMs) {
    return run(buildSshCommand(tools_, profile_, *method_, opt_, command), timeoutMs);
}

NativeToolTransfer::ProcessResult NativeToolTransfer::runLs(const std::string& flags, const std::string& path) {
    const int timeoutMs = opt_.listTimeoutSec * 1000;
    const std::string q = shellQuote(path);
    if (longIsoSupported_) {
        ProcessResult r = runRemote("TZ=UTC0 LC_ALL=C ls " + flags + " --time-style=long-iso -- " + q, timeoutMs);
        if (r.exitCode == 0 || !mentionsBadOption(r.err)) return r;
        longIsoSupported_ = false;
        LOGI("Remote ls lacks --time-style; using its default format");
    }
    return runRemote("TZ=UTC0 LC_ALL=C ls " + flags + " -- " + q, timeoutMs);
}

bool NativeToolTransfer::list(const std::string& remote_path,
                              std::vector<RemoteEntry>& out,
                              ListError& err) {
    err.clear();
    if (!connected_ || !method_) {
        err.kind = ListErrorKind::NotConnected;
        err.message = "Not connected";
        return false;
    }
    aborted_ = false;

    std::string path = remote_path.empty() ? "/" : remote_path;
    // Trailing slash makes ls fail on a regular file instead of listing it.
    if (path.back() != '/') path += '/';

    const ProcessResult r = runLs("-la", path);
    if (!r.started) {
        err.kind = ListErrorKind::Failed;
        err.message = "Could not run ssh: " + r.err;
        return false;
    }
    if (r.cancelled || r.timedOut) {
        err.kind = ListErrorKind::ConnectionLost;
        err.message = r.timedOut ? "Listing timed out" : "Listing aborted";
        return false;
    }
    if (r.exitCode == 255) {
        err.kind = ListErrorKind::ConnectionLost;
        err.message = firstLine(r.err);
        return false;
    }
    if (r.exitCode != 0 && r.out.empty()) {
        err.kind = listKindFromToolText(r.err);
        err.message = firstLine(r.err);
        if (err.message.empty()) err.message = "ls exited with code " + std::to_string(r.exitCode);
        return false;
    }

    LsParseResult parsed = parseLsListing(r.out);
    out = std::move(parsed.entries);
    resolveLinks(path, out);

    // ls may exit non-zero after printing what it could read.
    std::size_t unreadable = 0;
    if (r.exitCode != 0) {
        for (char c : r.err)
            if (c == '\n') ++unreadable;
        if (unreadable == 0) unreadable = 1;
    }
    if (parsed.badLines > 0 || unreadable > 0) {
        err.kind = ListErrorKind::PartialParseWarning;
        err.goodEntries = out.size();
        err.badLines = parsed.badLines + unreadable;
        err.message = std::to_string(err.badLines) + " entr" + (err.badLines == 1 ? "y" : "ies") +
                      " in " + remote_path + " could not be read";
        for (const auto& s : parsed.badSamples) LOGW("Unparsed ls line: %s", s.c_str());
        if (unreadable) LOGW("ls reported: %s", firstLine(r.err).c_str());
    }
    return true;
}

bool NativeToolTransfer::stat(const std::string& remote_path,
                              RemoteEntry& info,
                              std::string& err) {
    err.clear();
    if (!connected_ || !method_) {
        err = "Not connected";
        return false;
    }
    aborted_ = false;
    return statEntry(remote_path, info, err);
}

bool NativeToolTransfer::statEntry(const std::string& remote_path, RemoteEntry& info, std::string& err) {
    err.clear();
    const ProcessResult r = runLs("-ld", remote_path);
    if (!r.started || r.cancelled || r.timedOut) {
        err = r.cancelled ? "Aborted" : r.timedOut ? "stat timed out" : "Could not run ssh";
        return false;
    }
    if (r.exitCode != 0) {
        if (r.exitCode != 255 && mentions(r.err, "No such file")) return false; // absent
        err = firstLine(r.err);
        if (err.empty()) err = "ls exited with code " + std::to_string(r.exitCode);
        return false;
    }
    RemoteEntry e;
    if (parseLsLine(firstLine(r.out), e) != LsLine::Entry) {
        err = "Unrecognized ls output for " + remote_path;
        return false;
    }
    if (e.is_link) {
        RemoteEntry target;
        const ProcessResult t = runLs("-ldL", remote_path);
        if (t.started && !t.cancelled && !t.timedOut && t.exitCode == 0 &&
            parseLsLine(firstLine(t.out), target) == LsLine::Entry)
            takeTargetAttributes(target, e);
    }
    const std::string norm = normalizeRemotePath(remote_path);
    const auto slash = norm.find_last_of('/');
    e.name = (slash == std::string::npos || norm == "/") ? norm : norm.substr(slash + 1);
    info = std::move(e);
    return true;
}

void NativeToolTransfer::takeTargetAttributes(const RemoteEntry& target, RemoteEntry& link) {
    link.is_dir = target.is_dir;
    link.size = target.size;
    link.mtime = target.mtime;
}

void NativeToolTransfer::resolveLinks(const std::string& dir, std::vector<RemoteEntry>& entries) {
    bool anyLink = false;
    for (const auto& e : entries) anyLink = anyLink || e.is_link;
    if (!anyLink) return;
    // A second listing that follows links; dangling ones keep their own attributes.
    const ProcessResult r = runLs("-laL", dir);
    if (!r.started || r.cancelled || r.timedOut || r.out.empty()) {
        LOGW("Could not resolve symlinks in %s", dir.c_str());
        return;
    }
    std::map<std::string, RemoteEntry> followed;
    for (auto& t : parseLsListing(r.out).entries) followed[t.name] = std::move(t);
    for (auto& e : entries) {
        if (!e.is_link) continue;
        auto it = followed.find(e.name);
        if (it != followed.end() && !it->second.is_link) takeTargetAttributes(it->second, e);
    }
}

bool NativeToolTransfer::exists(const std::string& remote_path,
                                bool& isDir,
                                std::string& err) {
    RemoteEntry e;
    if (!stat(remote_path, e, err)) return false;
    isDir = e.is_dir;
    return true;
}

static bool simpleRemote(const NativeToolTransfer::ProcessResult& r, const char* what, std::string& err) {
    if (r.started && !r.cancelled && !r.timedOut && r.exitCode == 0) return true;
    if (r.timedOut) err = std::string(what) + " timed out";
    else if (r.cancelled) err = std::string(what) + " aborted";
    else if (!r.err.empty()) {
        std::size_t e = r.err.find_first_of("\r\n");
        err = r.err.substr(0, e);
    } else {
        err = std::string(what) + " failed with code " + std::to_string(r.exitCode);
    }
    return false;
}

bool NativeToolTransfer::mkdir(const std::string& remote_dir,
                               std::string& err,
                               unsigned int mode) {
    if (!connected_ || !method_) {
        err = "Not connected";
        return false;
    }
    aborted_ = false;
    char octal[16];
    std::snprintf(octal, sizeof(octal), "%o", mode & 07777);
    return simpleRemote(runRemote(std::string("mkdir -m ") + octal + " -- " + shellQuote(remote_dir),
                                  opt_.listTimeoutSec * 1000),
                        "mkdir", err);
}

bool NativeToolTransfer::removeFile(const std::string& remote_path, std::string& err) {
    if (!connected_ || !method_) {
        err = "Not connected";
        return false;
    }
    aborted_ = false;
    return simpleRemote(runRemote("rm -- " + shellQuote(remote_path), opt_.listTimeoutSec * 1000), "rm", err);
}

bool NativeToolTransfer::removeDir(const std::string& remote_dir, std::string& err) {
    if (!connected_ || !method_) {
        err = "Not connected";
        return false;
    }
    aborted_ = false;
    return simpleRemote(runRemote("rmdir -- " + shellQuote(remote_dir), opt_.listTimeoutSec * 1000), "rmdir", err);
}

bool NativeToolTransfer::rename(const std::string& from,
                                const std::string& to,
                                std::string& err,
                                bool overwrite) {
    if (!connected_ || !method_) {
        err = "Not connected";
        return false;
    }
    aborted_ = false;
    const std::string qf = shellQuote(from), qt = shellQuote(to);
    const std::string cmd = overwrite
        ? "mv -f -- " + qf + " " + qt
        : "if [ -e " + qt + " ] || [ -L " + qt + " ]; then echo " + shellQuote(to + ": File exists") +
              " >&2; exit 1; fi; mv -- " + qf + " " + qt;
    return simpleRemote(runRemote(cmd, opt_.listTimeoutSec * 1000), "mv", err);
}

// Maps a failed scp run to the transfer taxonomy.
static void scpFailure(const NativeToolTransfer::ProcessResult& r, TransferError& err) {
    if (!r.started) {
        err.set(TransferErrorKind::IoError, "Could not start scp: " + r.err);
        return;
    }
    std::size_t b = 0;
    while (b < r.err.size() && (r.err[b] == '\n' || r.err[b] == '\r')) ++b;
    std::string msg = r.err.substr(b, r.err.find_first_of("\r\n", b) - b);
    if (msg.empty()) msg = "scp exited with code " + std::to_string(r.exitCode);
    TransferErrorKind k = transferKindFromToolText(r.err);
    if (k == TransferErrorKind::IoError && (r.exitCode == 255 || r.exitCode < 0)) k = TransferErrorKind::ConnectionLost;
    err.set(k, msg);
}

bool NativeToolTransfer::get(const std::string& remote,
                             const std::string& local,
                             TransferError& err,
                             ProgressFn progress,
                             CancelFn shouldCancel) {
    err.clear();
    if (!connected_ || !method_) {
        err.set(TransferErrorKind::ConnectionLost, "Not connected");
        return false;
    }
    aborted_ = false;

    RemoteEntry src;
    std::string serr;
    if (!statEntry(remote, src, serr)) {
        if (aborted_ || (shouldCancel && shouldCancel())) err.set(TransferErrorKind::Cancelled, "Cancelled by user");
        else if (serr.empty()) err.set(TransferErrorKind::SourceNotFound, "Remote source not found: " + remote);
        else err.set(TransferErrorKind::ConnectionLost, serr);
        return false;
    }
    if (src.is_dir) {
        err.set(TransferErrorKind::SourceNotFound, "Remote source is a directory: " + remote);
        return false;
    }
    const std::uint64_t total = src.size.value_or(0);
    if (!prepareLocalDestination(local, err)) return false;

    ProgressGate gate(progress, opt_.progressThresholdBytes, opt_.progressIntervalMs);
    gate.update(0, total);
    ProgressParser parser;
    std::uint64_t last = 0;
    auto onTick = [&]() {
        // scp rarely prints a meter without a tty; the growing local file is the
        // reliable signal.
        std::uint64_t done = localFileSize(local);
        std::uint64_t parsed = 0;
        if (parser.bytesDone(total, parsed)) done = std::max(done, parsed);
        if (total) done = std::min(done, total);
        if (done > last) {
            last = done;
            gate.update(done, total);
        }
    };

    const ProcessResult r = run(buildScpCommand(tools_, profile_, *method_, opt_, scpRemoteSpec(profile_, remote, tools_.scpSftpMode), local),
                                0, shouldCancel, [&](const std::string& chunk) { parser.feed(chunk); }, onTick);
    if (r.cancelled) {
        err.set(TransferErrorKind::Cancelled, "Cancelled by user");
        return false;
    }
    if (r.exitCode != 0) {
        scpFailure(r, err);
        return false;
    }
    const std::uint64_t received = localFileSize(local);
    gate.finish(received, received);
    return true;
}

bool NativeToolTransfer::put(const std::string& local,
                             const std::string& remote,
                             TransferError& err,
                             ProgressFn progress,
                             CancelFn shouldCancel) {
    err.clear();
    if (!connected_ || !method_) {
        err.set(TransferErrorKind::ConnectionLost, "Not connected");
        return false;
    }
    aborted_ = false;

    std::uint64_t total = 0;
    if (!checkLocalSource(local, total, err)) return false;

    RemoteEntry dst;
    std::string serr;
    if (statEntry(remote, dst, serr)) {
        if (dst.is_dir) {
            err.set(TransferErrorKind::DestinationConflict, "Remote destination is a directory: " + remote);
            return false;
        }
    } else if (!serr.empty()) {
        if (aborted_ || (shouldCancel && shouldCancel())) err.set(TransferErrorKind::Cancelled, "Cancelled by user");
        else err.set(TransferErrorKind::ConnectionLost, serr);
        return false;
    }

    const std::string parent = remoteParent(remote);
    if (!parent.empty() && parent != "/" && parent != ".") {
        const ProcessResult m = runRemote("mkdir -p -- " + shellQuote(parent), opt_.listTimeoutSec * 1000);
        if (m.cancelled) {
            err.set(TransferErrorKind::Cancelled, "Cancelled by user");
            return false;
        }
        if (m.exitCode != 0) {
            err.set(transferKindFromToolText(m.err), "Could not create remote directory " + parent + ": " + firstLine(m.err));
            return false;
        }
    }

    ProgressGate gate(progress, opt_.progressThresholdBytes, opt_.progressIntervalMs);
    gate.update(0, total);
    ProgressParser parser;
    std::uint64_t last = 0;
    auto onTick = [&]() {
        std::uint64_t done = 0;
        if (!parser.bytesDone(total, done)) return; // indeterminate
        if (done > last) {
            last = done;
            gate.update(done, total);
        }
    };

    const ProcessResult r = run(buildScpCommand(tools_, profile_, *method_, opt_, local, scpRemoteSpec(profile_, remote, tools_.scpSftpMode)),
                                0, shouldCancel, [&](const std::string& chunk) { parser.feed(chunk); }, onTick);
    if (r.cancelled) {
        err.set(TransferErrorKind::Cancelled, "Cancelled by user");
        return false;
    }
    if (r.exitCode != 0) {
        scpFailure(r, err);
        return false;
    }
    gate.finish(total, total);
    return true;
}

} // namespace ferry
