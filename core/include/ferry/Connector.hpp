// Connection establishment: library mode first, native tools as fallback.
#pragma once
#include "FileTransfer.hpp"
#include "CredentialChain.hpp"
#include "Errors.hpp"
#include <functional>
#include <memory>
#include <mutex>

namespace ferry {

// An authenticated transport bound to exactly one mode. Destroying it
// disconnects the backend.
class Connection {
public:
    Connection(ServerProfile profile,
               std::unique_ptr<FileTransfer> transfer,
               AuthMethod method,
               TransportOptions opt);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    TransportMode mode() const { return transfer_->mode(); }
    const ServerProfile& profile() const { return profile_; }
    const AuthMethod& authMethod() const { return method_; }
    const TransportOptions& options() const { return opt_; }

    // Callers hold mutex() while using transfer(); a session is not re-entrant.
    FileTransfer& transfer() { return *transfer_; }
    std::mutex& mutex() { return mu_; }

    // Forced cancellation of the operation in flight. Does not take mutex().
    void abort() { transfer_->abort(); }

    // Relative paths are resolved against the profile's remote base path.
    std::string resolvePath(const std::string& path) const;

private:
    ServerProfile profile_;
    std::unique_ptr<FileTransfer> transfer_;
    AuthMethod method_;
    TransportOptions opt_;
    std::mutex mu_;
};

// Creates a fresh, unopened backend for a mode.
using TransferFactory = std::function<std::unique_ptr<FileTransfer>(TransportMode)>;
TransferFactory defaultTransferFactory();

class Connector {
public:
    explicit Connector(TransportOptions opt = TransportOptions(),
                       TransferFactory factory = defaultTransferFactory());

    // Walks chain in Library Mode, then in Native-Tool Mode. Returns null and
    // fills err when neither binds.
    std::unique_ptr<Connection> connect(const ServerProfile& profile,
                                        const AuthChain& chain,
                                        ConnectError& err) const;

    const TransportOptions& options() const { return opt_; }

private:
    std::unique_ptr<FileTransfer> attempt(TransportMode mode,
                                          const ServerProfile& profile,
                                          const AuthChain& chain,
                                          AuthMethod& used,
                                          bool& transportUp,
                                          ConnectErrorKind& kind,
                                          std::string& lastErr) const;

    TransportOptions opt_;
    TransferFactory factory_;
};

} // namespace ferry
