#include "ferry/Connector.hpp"
#include "ferry/Libssh2Transfer.hpp"
#include "ferry/NativeToolTransfer.hpp"
#include "ferry/Log.hpp"

namespace ferry {

Connection::Connection(ServerProfile profile,
                       std::unique_ptr<FileTransfer> transfer,
                       AuthMethod method,
                       TransportOptions opt)
    : profile_(std::move(profile)),
      transfer_(std::move(transfer)),
      method_(std::move(method)),
      opt_(std::move(opt)) {}

Connection::~Connection() {
    std::lock_guard<std::mutex> lk(mu_);
    if (transfer_) transfer_->disconnect();
}

std::string Connection::resolvePath(const std::string& path) const {
    const std::string base = profile_.remote_base_path.empty() ? "/" : profile_.remote_base_path;
    if (path.empty()) return normalizeRemotePath(base);
    if (path[0] == '/') return normalizeRemotePath(path);
    return normalizeRemotePath(joinRemotePath(base, path));
}

TransferFactory defaultTransferFactory() {
    return [](TransportMode mode) -> std::unique_ptr<FileTransfer> {
        if (mode == TransportMode::Library) return std::make_unique<Libssh2Transfer>();
        return std::make_unique<NativeToolTransfer>();
    };
}

Connector::Connector(TransportOptions opt, TransferFactory factory)
    : opt_(std::move(opt)), factory_(std::move(factory)) {}

std::unique_ptr<FileTransfer> Connector::attempt(TransportMode mode,
                                                 const ServerProfile& profile,
                                                 const AuthChain& chain,
                                                 AuthMethod& used,
                                                 bool& transportUp,
                                                 ConnectErrorKind& kind,
                                                 std::string& lastErr) const {
    std::unique_ptr<FileTransfer> ft;
    auto openTransport = [&]() -> bool {
        ft = factory_ ? factory_(mode) : nullptr;
        if (!ft) {
            kind = ConnectErrorKind::TransportUnavailable;
            lastErr = std::string("no ") + toString(mode) + " backend";
            return false;
        }
        ConnectErrorKind k = ConnectErrorKind::None;
        std::string e;
        if (!ft->open(profile, opt_, k, e)) {
            kind = k == ConnectErrorKind::None ? ConnectErrorKind::TransportUnavailable : k;
            lastErr = e;
            ft.reset();
            LOGI("%s transport to %s:%u failed: %s", toString(mode), profile.host.c_str(),
                 (unsigned)profile.port, e.c_str());
            return false;
        }
        transportUp = true;
        return true;
    };

    if (!openTransport()) return nullptr;
    for (const auto& method : chain) {
        if (!ft && !openTransport()) return nullptr;
        bool lost = false;
        std::string e;
        if (ft->authenticate(method, e, lost)) {
            used = method;
            return ft;
        }
        LOGI("%s auth with %s failed: %s", toString(mode), method.describe().c_str(), e.c_str());
        lastErr = method.describe() + ": " + e;
        if (lost) {
            ft->disconnect();
            ft.reset();
        }
    }
    if (ft) ft->disconnect();
    kind = ConnectErrorKind::AllAuthMethodsExhausted;
    if (chain.empty()) lastErr = "no authentication methods";
    return nullptr;
}

std::unique_ptr<Connection> Connector::connect(const ServerProfile& profile,
                                               const AuthChain& chain,
                                               ConnectError& err) const {
    err = ConnectError{};
    AuthMethod used;
    bool libraryUp = false, nativeUp = false;
    ConnectErrorKind libraryKind = ConnectErrorKind::None, nativeKind = ConnectErrorKind::None;

    auto ft = attempt(TransportMode::Library, profile, chain, used, libraryUp, libraryKind, err.libraryError);
    if (ft) {
        LOGI("Connected to %s via libssh2 (%s)", profile.host.c_str(), used.describe().c_str());
        return std::make_unique<Connection>(profile, std::move(ft), used, opt_);
    }
    LOGI("Library mode did not bind (%s); trying native tools", toString(libraryKind));

    ft = attempt(TransportMode::NativeTool, profile, chain, used, nativeUp, nativeKind, err.nativeError);
    if (ft) {
        LOGI("Connected to %s via native ssh (%s)", profile.host.c_str(), used.describe().c_str());
        return std::make_unique<Connection>(profile, std::move(ft), used, opt_);
    }

    err.kind = (libraryUp || nativeUp) ? ConnectErrorKind::AllAuthMethodsExhausted : libraryKind;
    LOGW("Connect to %s failed: %s", profile.host.c_str(), err.message().c_str());
    return nullptr;
}

} // namespace ferry
