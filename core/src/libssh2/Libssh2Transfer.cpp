// libssh2 backend: manages TCP socket, SSH session, and SFTP channel.
// Includes keepalive, known_hosts validation, per-method authentication and
// forced abort through socket shutdown.
#include "ferry/Libssh2Transfer.hpp"
#include "ferry/ProgressGate.hpp"
#include "ferry/Log.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <vector>
#include <chrono>
#include <thread>
#include <mutex>
#include <cstdlib>
#include <cstdio>

// POSIX sockets
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <netinet/in.h>
#include <netinet/tcp.h>

namespace ferry {

// Global libssh2 initialization (once per process)
static std::once_flag g_libssh2_once;

// Context for keyboard-interactive: respond with username/password based on the prompt
struct KbdIntCtx {
    const char* user;
    const char* pass;
};

static char* dupResponse(const char* s, size_t len) {
    char* buf = static_cast<char*>(std::malloc(len + 1));
    if (!buf) return nullptr;
    std::memcpy(buf, s, len);
    buf[len] = '\0';
    return buf;
}

// Keyboard-interactive callback: respond to prompts with username/password based on the text
static void kbint_password_callback(const char* name, int name_len,
                                    const char* instruction, int instruction_len,
                                    int num_prompts,
                                    const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                                    LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                                    void** abstract) {
    (void)name; (void)name_len; (void)instruction; (void)instruction_len;
    if (!abstract || !*abstract) return;
    const KbdIntCtx* ctx = static_cast<const KbdIntCtx*>(*abstract);
    const char* user = ctx->user;
    const char* pass = ctx->pass;
    const size_t ulen = user ? std::strlen(user) : 0;
    const size_t plen = pass ? std::strlen(pass) : 0;

    for (int i = 0; i < num_prompts; ++i) {
        const char* prompt = (prompts && prompts[i].text) ? reinterpret_cast<const char*>(prompts[i].text) : "";
        bool wantUser = false;
        // Simple heuristic: if the prompt mentions "user" or "name", send username; otherwise send password
        for (const char* p = prompt; *p; ++p) {
            char c = *p;
            if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
            if (c == 'u' && p[1] == 's' && p[2] == 'e' && p[3] == 'r') {
                wantUser = true;
                break;
            }
            if (c == 'n' && p[1] == 'a' && p[2] == 'm' && p[3] == 'e') {
                wantUser = true;
                break;
            }
        }
        const char* ans = wantUser ? user : pass;
        const size_t alen = wantUser ? ulen : plen;
        char* buf = (ans && alen > 0) ? dupResponse(ans, alen) : nullptr;
        responses[i].text = buf;
        responses[i].length = buf ? (unsigned int)alen : 0;
    }
}

static bool isSessionGone(int rc) {
    return rc == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
           rc == LIBSSH2_ERROR_SOCKET_SEND ||
           rc == LIBSSH2_ERROR_SOCKET_RECV ||
           rc == LIBSSH2_ERROR_TIMEOUT;
}

// Retry a libssh2 call while it reports EAGAIN.
template <typename F>
static int retryEagain(F&& f) {
    int rc;
    for (;;) {
        rc = f();
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return rc;
}

static RemoteEntry entryFromAttrs(const std::string& name, const LIBSSH2_SFTP_ATTRIBUTES& attrs) {
    RemoteEntry e{};
    e.name = name;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
        e.mode = (std::uint32_t)attrs.permissions;
        e.is_dir = ((attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR);
        e.is_link = ((attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFLNK);
        e.permissions = permissionString(e.mode);
    }
    if (!e.is_dir && (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE)) e.size = (std::uint64_t)attrs.filesize;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) e.mtime = (std::uint64_t)attrs.mtime;
    return e;
}

Libssh2Transfer::Libssh2Transfer() {
    std::call_once(g_libssh2_once, []() {
        int rc = libssh2_init(0);
        if (rc != 0) LOGE("libssh2_init failed (%d)", rc);
    });
}

Libssh2Transfer::~Libssh2Transfer() {
    disconnect();
}

bool Libssh2Transfer::tcpConnect(const std::string& host, uint16_t port,
                                 ConnectErrorKind& kind, std::string& err) {
    struct addrinfo hints{};
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        kind = ConnectErrorKind::NetworkUnreachable;
        err = std::string("getaddrinfo: ") + gai_strerror(gai);
        return false;
    }

    bool timedOut = false;
    int s = -1;
    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) continue;
        // Note: avoid setting SO_RCVTIMEO/SO_SNDTIMEO during authentication because
        // it may interfere with userauth on some servers/libc. Rely on
        // libssh2_session_set_timeout to manage timeouts.
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef __APPLE__
        int idle = 60;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#elif defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        // Non-blocking connect so an unreachable host cannot stall past the timeout
        const int flags = ::fcntl(s, F_GETFL, 0);
        ::fcntl(s, F_SETFL, flags | O_NONBLOCK);
        int rc = ::connect(s, rp->ai_addr, rp->ai_addrlen);
        if (rc != 0 && errno == EINPROGRESS) {
            struct pollfd pfd{};
            pfd.fd = s;
            pfd.events = POLLOUT;
            int pr = ::poll(&pfd, 1, opt_.connectTimeoutSec * 1000);
            if (pr == 1) {
                int soErr = 0;
                socklen_t len = sizeof(soErr);
                ::getsockopt(s, SOL_SOCKET, SO_ERROR, &soErr, &len);
                rc = (soErr == 0) ? 0 : -1;
                if (soErr != 0) err = std::string("connect: ") + std::strerror(soErr);
            } else {
                timedOut = (pr == 0);
                rc = -1;
            }
        } else if (rc != 0) {
            err = std::string("connect: ") + std::strerror(errno);
        }
        if (rc == 0) {
            ::fcntl(s, F_SETFL, flags);
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        ::close(s);
        s = -1;
    }
    freeaddrinfo(res);
    if (timedOut) {
        kind = ConnectErrorKind::Timeout;
        err = "TCP connect timed out after " + std::to_string(opt_.connectTimeoutSec) + "s";
    } else {
        kind = ConnectErrorKind::NetworkUnreachable;
        if (err.empty()) err = "Could not connect to host/port";
    }
    return false;
}

bool Libssh2Transfer::open(const ServerProfile& profile,
                           const TransportOptions& opt,
                           ConnectErrorKind& kind,
                           std::string& err) {
    if (session_) {
        kind = ConnectErrorKind::TransportUnavailable;
        err = "Already open";
        return false;
    }
    profile_ = profile;
    opt_ = opt;
    aborted_ = false;
    if (!tcpConnect(profile.host, profile.port, kind, err)) return false;

    session_ = libssh2_session_init();
    if (!session_) {
        kind = ConnectErrorKind::TransportUnavailable;
        err = "libssh2_session_init failed";
        closeSession();
        return false;
    }

    // Blocking mode and a bounded timeout for handshake and each auth attempt
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, (long)opt_.authTimeoutSec * 1000);

    int hrc = libssh2_session_handshake(session_, sock_);
    if (hrc != 0) {
        kind = (hrc == LIBSSH2_ERROR_TIMEOUT) ? ConnectErrorKind::Timeout
                                              : ConnectErrorKind::TransportUnavailable;
        err = "SSH handshake failed: " + lastSessionError();
        closeSession();
        return false;
    }

    // SSH keepalive: request libssh2 to send messages every 30s if the peer allows it
    libssh2_keepalive_config(session_, 1, 30);

    if (!verifyHostKey(kind, err)) {
        closeSession();
        return false;
    }
    LOGD("libssh2 transport up to %s:%u", profile.host.c_str(), (unsigned)profile.port);
    return true;
}

bool Libssh2Transfer::verifyHostKey(ConnectErrorKind& kind, std::string& err) {
    if (profile_.known_hosts_policy == KnownHostsPolicy::Off) return true;

    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session_);
    if (!nh) {
        kind = ConnectErrorKind::TransportUnavailable;
        err = "Could not initialize known_hosts";
        return false;
    }

    // Effective path
    std::string khPath;
    if (profile_.known_hosts_path.has_value()) {
        khPath = *profile_.known_hosts_path;
    } else {
        const char* home = std::getenv("HOME");
        if (home) khPath = std::string(home) + "/.ssh/known_hosts";
    }

    bool khLoaded = false;
    if (!khPath.empty()) {
        khLoaded = (libssh2_knownhost_readfile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0);
    }
    if (!khLoaded && profile_.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        kind = ConnectErrorKind::HostKeyRejected;
        err = "known_hosts missing or unreadable (strict policy)";
        return false;
    }

    size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        kind = ConnectErrorKind::TransportUnavailable;
        err = "Could not obtain host key";
        return false;
    }

    int alg = 0;
    switch (keytype) {
        case LIBSSH2_HOSTKEY_TYPE_RSA: alg = LIBSSH2_KNOWNHOST_KEY_SSHRSA; break;
        case LIBSSH2_HOSTKEY_TYPE_DSS: alg = LIBSSH2_KNOWNHOST_KEY_SSHDSS; break;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_256; break;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_384; break;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_521; break;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
        case LIBSSH2_HOSTKEY_TYPE_ED25519: alg = LIBSSH2_KNOWNHOST_KEY_ED25519; break;
#endif
        default: alg = 0; break;
    }

    int typemask_plain = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    int typemask_hash = LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;

    struct libssh2_knownhost* host = nullptr;
    int check = libssh2_knownhost_checkp(nh, profile_.host.c_str(), profile_.port,
                                         hostkey, keylen, typemask_plain, &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(nh, profile_.host.c_str(), profile_.port,
                                         hostkey, keylen, typemask_hash, &host);
    }

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }
    if (profile_.known_hosts_policy == KnownHostsPolicy::AcceptNew &&
        check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND) {
        // TOFU: record the new host and continue
        if (khPath.empty()) {
            libssh2_knownhost_free(nh);
            kind = ConnectErrorKind::HostKeyRejected;
            err = "known_hosts path not defined";
            return false;
        }
        int addMask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
        int addrc = libssh2_knownhost_addc(nh, profile_.host.c_str(), nullptr,
                                           hostkey, keylen,
                                           nullptr, 0, addMask, nullptr);
        if (addrc != 0 || libssh2_knownhost_writefile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
            // Not fatal: the key is trusted for this session anyway
            LOGW("Could not record %s in %s", profile_.host.c_str(), khPath.c_str());
        } else {
            LOGI("Added %s to %s", profile_.host.c_str(), khPath.c_str());
        }
        libssh2_knownhost_free(nh);
        return true;
    }
    libssh2_knownhost_free(nh);
    if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH || profile_.known_hosts_policy == KnownHostsPolicy::Strict) {
        kind = ConnectErrorKind::HostKeyRejected;
        err = (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH)
                  ? "Host key does not match known_hosts"
                  : "Host unknown in known_hosts";
        return false;
    }
    return true;
}

bool Libssh2Transfer::authenticate(const AuthMethod& method,
                                   std::string& err,
                                   bool& sessionLost) {
    sessionLost = false;
    if (!session_) {
        err = "Transport not open";
        sessionLost = true;
        return false;
    }
    if (connected_) return true;

    bool ok = false;
    switch (method.kind) {
        case AuthMethod::Kind::Password:
            ok = authPassword(err, sessionLost);
            break;
        case AuthMethod::Kind::ExplicitKey:
            ok = authKeyFile(method.keyPath, method.passphrase, err, sessionLost);
            break;
        case AuthMethod::Kind::Agent:
            ok = authAgent(err, sessionLost);
            break;
        case AuthMethod::Kind::DefaultKeyProbe:
            if (method.candidates.empty()) {
                err = "No default keys found";
                break;
            }
            for (const auto& path : method.candidates) {
                ok = authKeyFile(path, method.passphrase, err, sessionLost);
                if (ok || sessionLost) break;
            }
            break;
    }
    if (!ok) return false;

    // Initialize SFTP
    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        err = "Could not initialize SFTP: " + lastSessionError();
        sessionLost = true;
        return false;
    }
    connected_ = true;
    return true;
}

bool Libssh2Transfer::authPassword(std::string& err, bool& sessionLost) {
    if (!profile_.password.has_value()) {
        err = "No password";
        return false;
    }
    const std::string& user = profile_.username;
    int rc_pw = retryEagain([&]() {
        return libssh2_userauth_password(session_, user.c_str(), profile_.password->c_str());
    });
    if (rc_pw == 0) return true;

    // If the server closed after the password attempt, stop: the rest would cascade-fail.
    if (isSessionGone(rc_pw)) {
        err = "Server closed the connection after the password attempt";
        sessionLost = true;
        return false;
    }
    std::string pwLastErr = lastSessionError();

    // Password failed but the session is still alive: try keyboard-interactive if offered.
    char* methods = libssh2_userauth_list(session_, user.c_str(), (unsigned)user.size());
    std::string authlist = methods ? std::string(methods) : std::string();
    int rc_kbd = -1;
    if (authlist.find("keyboard-interactive") != std::string::npos) {
        KbdIntCtx ctx{user.c_str(), profile_.password->c_str()};
        void** abs = libssh2_session_abstract(session_);
        if (abs) *abs = &ctx;
        rc_kbd = retryEagain([&]() {
            return libssh2_userauth_keyboard_interactive(session_, user.c_str(), kbint_password_callback);
        });
        if (abs) *abs = nullptr;
        if (rc_kbd == 0) return true;
        if (isSessionGone(rc_kbd)) sessionLost = true;
    }
    err = std::string("Password/kbd-int auth failed") +
          (authlist.empty() ? std::string() : (" (methods: " + authlist + ")")) +
          (pwLastErr.empty() ? std::string() : (": " + pwLastErr)) +
          " [rc_pw=" + std::to_string(rc_pw) + ", rc_kbd=" + std::to_string(rc_kbd) + "]";
    return false;
}

bool Libssh2Transfer::authKeyFile(const std::string& path,
                                  const std::optional<std::string>& passphrase,
                                  std::string& err, bool& sessionLost) {
    const std::string& user = profile_.username;
    const char* pp = passphrase ? passphrase->c_str() : nullptr;
    int rc = retryEagain([&]() {
        return libssh2_userauth_publickey_fromfile_ex(session_,
                                                      user.c_str(), (unsigned)user.size(),
                                                      nullptr, // public key path derived from the private key
                                                      path.c_str(),
                                                      pp);
    });
    if (rc == 0) return true;
    if (isSessionGone(rc)) sessionLost = true;
    err = "Key auth failed for " + path + ": " + lastSessionError();
    return false;
}

bool Libssh2Transfer::authAgent(std::string& err, bool& sessionLost) {
    const std::string& user = profile_.username;
    LIBSSH2_AGENT* agent = libssh2_agent_init(session_);
    if (!agent) {
        err = "ssh-agent init failed";
        return false;
    }
    bool authed = false;
    if (libssh2_agent_connect(agent) != 0) {
        err = "ssh-agent not reachable";
    } else if (libssh2_agent_list_identities(agent) != 0) {
        err = "ssh-agent: could not list identities";
    } else {
        struct libssh2_agent_publickey* identity = nullptr;
        struct libssh2_agent_publickey* prev = nullptr;
        int tries = 0;
        const int kMaxAgentTries = 3; // conservative limit
        while (libssh2_agent_get_identity(agent, &identity, prev) == 0 && tries < kMaxAgentTries) {
            prev = identity;
            ++tries;
            int arc = retryEagain([&]() {
                return libssh2_agent_userauth(agent, user.c_str(), identity);
            });
            if (arc == 0) {
                authed = true;
                break;
            }
            if (isSessionGone(arc)) {
                sessionLost = true;
                break;
            }
        }
        if (!authed) err = "ssh-agent identities rejected (" + std::to_string(tries) + " tried)";
    }
    libssh2_agent_disconnect(agent);
    libssh2_agent_free(agent);
    return authed;
}

void Libssh2Transfer::closeSession() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        if (!aborted_) libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    int s = sock_.exchange(-1);
    if (s != -1) ::close(s);
    connected_ = false;
}

void Libssh2Transfer::disconnect() {
    closeSession();
}

void Libssh2Transfer::abort() {
    aborted_ = true;
    // The session cannot be resumed after a shutdown; later calls see ConnectionLost.
    connected_ = false;
    int s = sock_.load();
    // Wakes up any blocking libssh2 call on this socket; the owner closes it.
    if (s != -1) ::shutdown(s, SHUT_RDWR);
}

std::string Libssh2Transfer::lastSessionError() const {
    if (!session_) return std::string();
    char* emsgPtr = nullptr;
    int emlen = 0;
    (void)libssh2_session_last_error(session_, &emsgPtr, &emlen, 0);
    return (emsgPtr && emlen > 0) ? std::string(emsgPtr, (size_t)emlen) : std::string();
}

TransferErrorKind Libssh2Transfer::lastTransferErrorKind(TransferErrorKind fallback) const {
    if (aborted_ || !session_) return TransferErrorKind::ConnectionLost;
    int rc = libssh2_session_last_errno(session_);
    if (isSessionGone(rc)) return TransferErrorKind::ConnectionLost;
    if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL && sftp_) {
        switch (libssh2_sftp_last_error(sftp_)) {
            case LIBSSH2_FX_NO_SUCH_FILE:
            case LIBSSH2_FX_NO_SUCH_PATH:
                return TransferErrorKind::SourceNotFound;
            case LIBSSH2_FX_PERMISSION_DENIED:
            case LIBSSH2_FX_WRITE_PROTECT:
                return TransferErrorKind::PermissionDenied;
            case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM:
                return TransferErrorKind::DiskFull;
            case LIBSSH2_FX_QUOTA_EXCEEDED:
                return TransferErrorKind::RemoteQuotaExceeded;
            case LIBSSH2_FX_NO_CONNECTION:
            case LIBSSH2_FX_CONNECTION_LOST:
                return TransferErrorKind::ConnectionLost;
            case LIBSSH2_FX_FILE_IS_A_DIRECTORY:
                return TransferErrorKind::DestinationConflict;
            default:
                break;
        }
    }
    return fallback;
}

bool Libssh2Transfer::list(const std::string& remote_path,
                           std::vector<RemoteEntry>& out,
                           ListError& err) {
    err.clear();
    if (!connected_ || !sftp_) {
        err.kind = ListErrorKind::NotConnected;
        err.message = "Not connected";
        return false;
    }

    std::string path = remote_path.empty() ? "/" : remote_path;

    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        const int rc = libssh2_session_last_errno(session_);
        err.message = "sftp_opendir failed for: " + path;
        if (isSessionGone(rc)) {
            err.kind = ListErrorKind::ConnectionLost;
        } else {
            const unsigned long fx = libssh2_sftp_last_error(sftp_);
            if (fx == LIBSSH2_FX_NO_SUCH_FILE || fx == LIBSSH2_FX_NO_SUCH_PATH) err.kind = ListErrorKind::PathNotFound;
            else if (fx == LIBSSH2_FX_PERMISSION_DENIED) err.kind = ListErrorKind::PermissionDenied;
            else err.kind = ListErrorKind::Failed;
        }
        return false;
    }

    out.clear();
    out.reserve(64);

    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;

    while (true) {
        memset(&attrs, 0, sizeof(attrs));
        int rc = libssh2_sftp_readdir_ex(dir,
                                         filename, sizeof(filename),
                                         longentry, sizeof(longentry),
                                         &attrs);
        if (rc > 0) {
            // rc = name length
            std::string name(filename, (size_t)rc);
            if (name == "." || name == "..") continue;
            RemoteEntry e = entryFromAttrs(name, attrs);
            // readdir reports the link itself
            if (e.is_link) followLink(joinRemotePath(path, name), e);
            out.push_back(std::move(e));
        } else if (rc == 0) {
            // end of directory
            break;
        } else {
            err.kind = isSessionGone(rc) ? ListErrorKind::ConnectionLost : ListErrorKind::Failed;
            err.message = "sftp_readdir_ex failed";
            libssh2_sftp_closedir(dir);
            return false;
        }
    }

    libssh2_sftp_closedir(dir);
    return true;
}

// Download a remote file to local. Reports progress and supports cooperative cancellation.
bool Libssh2Transfer::get(const std::string& remote,
                          const std::string& local,
                          TransferError& err,
                          ProgressFn progress,
                          CancelFn shouldCancel) {
    err.clear();
    if (!connected_ || !sftp_) {
        err.set(TransferErrorKind::ConnectionLost, "Not connected");
        return false;
    }

    // Remote size (for progress)
    LIBSSH2_SFTP_ATTRIBUTES st{};
    if (libssh2_sftp_stat_ex(sftp_, remote.c_str(), (unsigned)remote.size(),
                             LIBSSH2_SFTP_STAT, &st) != 0) {
        err.set(lastTransferErrorKind(TransferErrorKind::SourceNotFound), "Remote stat failed: " + remote);
        return false;
    }
    if ((st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) &&
        (st.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR) {
        err.set(TransferErrorKind::SourceNotFound, "Remote source is a directory: " + remote);
        return false;
    }
    std::uint64_t total = (st.flags & LIBSSH2_SFTP_ATTR_SIZE) ? (std::uint64_t)st.filesize : 0;

    if (!prepareLocalDestination(local, err)) return false;

    // Open remote for reading
    LIBSSH2_SFTP_HANDLE* rh = libssh2_sftp_open_ex(
        sftp_, remote.c_str(), (unsigned)remote.size(),
        LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        err.set(lastTransferErrorKind(TransferErrorKind::IoError), "Could not open remote file for reading");
        return false;
    }

    FILE* lf = ::fopen(local.c_str(), "wb");
    if (!lf) {
        const int e = errno;
        libssh2_sftp_close(rh);
        err.set(destinationKindFromErrno(e), "Could not open local file for writing: " + std::string(std::strerror(e)));
        return false;
    }

    // No hard timeout during transfers; cancellation covers stalls
    libssh2_session_set_timeout(session_, 0);
    ProgressGate gate(progress, opt_.progressThresholdBytes, opt_.progressIntervalMs);
    gate.update(0, total);

    const std::size_t CHUNK = 64 * 1024;
    std::vector<char> buf(CHUNK);
    std::uint64_t done = 0;
    bool ok = true;

    while (true) {
        if (shouldCancel && shouldCancel()) {
            err.set(TransferErrorKind::Cancelled, "Cancelled by user");
            ok = false;
            break;
        }
        ssize_t n = libssh2_sftp_read(rh, buf.data(), buf.size());
        if (n > 0) {
            if (std::fwrite(buf.data(), 1, (size_t)n, lf) != (size_t)n) {
                const int e = errno;
                err.set(destinationKindFromErrno(e), "Local write failed: " + std::string(std::strerror(e)));
                ok = false;
                break;
            }
            done += (std::uint64_t)n;
            gate.update(done, total);
        } else if (n == 0) {
            break; // EOF
        } else {
            err.set(lastTransferErrorKind(TransferErrorKind::ConnectionLost), "Remote read failed");
            ok = false;
            break;
        }
    }

    if (std::fclose(lf) != 0 && ok) {
        const int e = errno;
        err.set(destinationKindFromErrno(e), "Local close failed: " + std::string(std::strerror(e)));
        ok = false;
    }
    if (!aborted_) libssh2_sftp_close(rh);
    libssh2_session_set_timeout(session_, (long)opt_.authTimeoutSec * 1000);
    if (ok) gate.finish(done, total ? total : done);
    return ok;
}

// Upload a local file to remote (create/truncate). Reports progress and supports cancellation.
bool Libssh2Transfer::put(const std::string& local,
                          const std::string& remote,
                          TransferError& err,
                          ProgressFn progress,
                          CancelFn shouldCancel) {
    err.clear();
    if (!connected_ || !sftp_) {
        err.set(TransferErrorKind::ConnectionLost, "Not connected");
        return false;
    }

    std::uint64_t total = 0;
    if (!checkLocalSource(local, total, err)) return false;

    bool isDir = false;
    std::string sErr;
    if (exists(remote, isDir, sErr) && isDir) {
        err.set(TransferErrorKind::DestinationConflict, "Remote destination is a directory: " + remote);
        return false;
    }
    const std::string parent = remoteParent(remote);
    if (!parent.empty() && !ensureRemoteDirs(*this, parent, sErr)) {
        err.set(lastTransferErrorKind(TransferErrorKind::IoError), sErr);
        return false;
    }

    // Open local for reading
    FILE* lf = ::fopen(local.c_str(), "rb");
    if (!lf) {
        const int e = errno;
        err.set(transferKindFromErrno(e), "Could not open local file for reading: " + std::string(std::strerror(e)));
        return false;
    }

    unsigned long flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC;
    LIBSSH2_SFTP_HANDLE* wh = libssh2_sftp_open_ex(
        sftp_, remote.c_str(), (unsigned)remote.size(),
        flags,
        0644, LIBSSH2_SFTP_OPENFILE);
    if (!wh) {
        std::fclose(lf);
        err.set(lastTransferErrorKind(TransferErrorKind::IoError), "Could not open remote file for writing");
        return false;
    }

    libssh2_session_set_timeout(session_, 0);
    ProgressGate gate(progress, opt_.progressThresholdBytes, opt_.progressIntervalMs);
    gate.update(0, total);

    const std::size_t CHUNK = 64 * 1024;
    std::vector<char> buf(CHUNK);
    std::uint64_t done = 0;
    bool ok = true;

    while (ok) {
        size_t n = std::fread(buf.data(), 1, buf.size(), lf);
        if (n > 0) {
            char* p = buf.data();
            size_t remain = n;
            while (remain > 0) {
                if (shouldCancel && shouldCancel()) {
                    err.set(TransferErrorKind::Cancelled, "Cancelled by user");
                    ok = false;
                    break;
                }
                ssize_t w = libssh2_sftp_write(wh, p, remain);
                if (w < 0) {
                    err.set(lastTransferErrorKind(TransferErrorKind::ConnectionLost), "Remote write failed");
                    ok = false;
                    break;
                }
                remain -= (size_t)w;
                p += w;
                done += (std::uint64_t)w;
                gate.update(done, total);
            }
        } else {
            if (std::ferror(lf)) {
                const int e = errno;
                err.set(transferKindFromErrno(e), "Local read failed");
                ok = false;
            }
            break; // EOF
        }
    }

    // Closing flushes pending writes; quota/space errors may only surface here
    if (!aborted_ && libssh2_sftp_close(wh) != 0 && ok) {
        err.set(lastTransferErrorKind(TransferErrorKind::IoError), "Remote close failed");
        ok = false;
    }
    std::fclose(lf);
    libssh2_session_set_timeout(session_, (long)opt_.authTimeoutSec * 1000);
    if (ok) gate.finish(done, total);
    return ok;
}

// Lightweight existence check using sftp_stat.
bool Libssh2Transfer::exists(const std::string& remote_path,
                             bool& isDir,
                             std::string& err) {
    isDir = false;
    RemoteEntry info;
    if (!stat(remote_path, info, err)) return false;
    isDir = info.is_dir;
    return true;
}

// Metadata of the path itself (lstat), with a symlink's target type and size.
// Returns false if the path does not exist.
bool Libssh2Transfer::stat(const std::string& remote_path,
                           RemoteEntry& info,
                           std::string& err) {
    err.clear();
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }

    LIBSSH2_SFTP_ATTRIBUTES st{};
    int rc = libssh2_sftp_stat_ex(
        sftp_, remote_path.c_str(), (unsigned)remote_path.size(),
        LIBSSH2_SFTP_LSTAT, &st);
    if (rc != 0) {
        unsigned long sftp_err = libssh2_sftp_last_error(sftp_);
        if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL &&
            (sftp_err == LIBSSH2_FX_NO_SUCH_FILE || sftp_err == LIBSSH2_FX_NO_SUCH_PATH)) {
            return false; // does not exist
        }
        err = "Remote stat failed";
        return false;
    }
    const std::string norm = normalizeRemotePath(remote_path);
    const auto slash = norm.find_last_of('/');
    info = entryFromAttrs(slash == std::string::npos ? norm : norm.substr(slash + 1), st);
    if (info.is_link) followLink(remote_path, info);
    return true;
}

void Libssh2Transfer::followLink(const std::string& remote_path, RemoteEntry& e) {
    char target[1024];
    const int n = libssh2_sftp_readlink(sftp_, remote_path.c_str(), target, sizeof(target));
    if (n > 0) e.link_target.assign(target, (size_t)n);
    LIBSSH2_SFTP_ATTRIBUTES st{};
    if (libssh2_sftp_stat_ex(sftp_, remote_path.c_str(), (unsigned)remote_path.size(),
                             LIBSSH2_SFTP_STAT, &st) != 0)
        return; // dangling
    const RemoteEntry t = entryFromAttrs(e.name, st);
    e.is_dir = t.is_dir;
    e.size = t.size;
    e.mtime = t.mtime;
}

bool Libssh2Transfer::mkdir(const std::string& remote_dir,
                            std::string& err,
                            unsigned int mode) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    int rc = libssh2_sftp_mkdir(sftp_, remote_dir.c_str(), mode);
    if (rc != 0) {
        err = "sftp_mkdir failed: " + remote_dir;
        return false;
    }
    return true;
}

bool Libssh2Transfer::removeFile(const std::string& remote_path,
                                 std::string& err) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    int rc = libssh2_sftp_unlink(sftp_, remote_path.c_str());
    if (rc != 0) {
        err = "sftp_unlink failed: " + remote_path;
        return false;
    }
    return true;
}

bool Libssh2Transfer::removeDir(const std::string& remote_dir,
                                std::string& err) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    int rc = libssh2_sftp_rmdir(sftp_, remote_dir.c_str());
    if (rc != 0) {
        err = "sftp_rmdir failed (directory not empty?)";
        return false;
    }
    return true;
}

bool Libssh2Transfer::rename(const std::string& from,
                             const std::string& to,
                             std::string& err,
                             bool overwrite) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    long flags = LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE;
    if (overwrite) flags |= LIBSSH2_SFTP_RENAME_OVERWRITE;
    int rc = libssh2_sftp_rename_ex(
        sftp_,
        from.c_str(), (unsigned)from.size(),
        to.c_str(), (unsigned)to.size(),
        flags);
    if (rc != 0) {
        err = "sftp_rename_ex failed";
        return false;
    }
    return true;
}

} // namespace ferry
