// Abstract interface for remote file operations. Both transport backends
// (libssh2 and native ssh/scp) implement it so callers never see which one is active.
#pragma once
#include "Types.hpp"
#include "Errors.hpp"
#include "CredentialChain.hpp"
#include <memory>

namespace ferry {

class FileTransfer {
public:
    virtual ~FileTransfer() = default;

    virtual TransportMode mode() const = 0;

    // Bring up the transport (no authentication yet).
    // On failure fills kind with TransportUnavailable, NetworkUnreachable, Timeout
    // or HostKeyRejected.
    virtual bool open(const ServerProfile& profile,
                      const TransportOptions& opt,
                      ConnectErrorKind& kind,
                      std::string& err) = 0;

    // One authentication attempt. sessionLost is set when the transport must be
    // reopened before another attempt.
    virtual bool authenticate(const AuthMethod& method,
                              std::string& err,
                              bool& sessionLost) = 0;

    virtual void disconnect() = 0;
    // True once authenticated and still usable.
    virtual bool isConnected() const = 0;

    // Whether two transfers may run at the same time over this transport.
    virtual bool supportsConcurrentChannels() const { return false; }

    // Remote directory listing. Returns true with err.kind == PartialParseWarning
    // when some entries could not be parsed.
    virtual bool list(const std::string& remote_path,
                      std::vector<RemoteEntry>& out,
                      ListError& err) = 0;

    // Download a remote file to local (overwrites an existing local file)
    virtual bool get(const std::string& remote,
                     const std::string& local,
                     TransferError& err,
                     ProgressFn progress = {},
                     CancelFn shouldCancel = {}) = 0;

    // Upload a local file to remote (overwrites an existing remote file)
    virtual bool put(const std::string& local,
                     const std::string& remote,
                     TransferError& err,
                     ProgressFn progress = {},
                     CancelFn shouldCancel = {}) = 0;

    // Detailed metadata. Returns false with empty err if the path does not exist.
    virtual bool stat(const std::string& remote_path,
                      RemoteEntry& info,
                      std::string& err) = 0;

    // Check existence (leave err empty if "does not exist")
    virtual bool exists(const std::string& remote_path,
                        bool& isDir,
                        std::string& err) = 0;

    virtual bool mkdir(const std::string& remote_dir,
                       std::string& err,
                       unsigned int mode = 0755) = 0;

    virtual bool removeFile(const std::string& remote_path,
                            std::string& err) = 0;

    virtual bool removeDir(const std::string& remote_dir,
                           std::string& err) = 0;

    virtual bool rename(const std::string& from,
                        const std::string& to,
                        std::string& err,
                        bool overwrite = false) = 0;

    // Forced cancellation of whatever is in flight. Safe to call from any thread.
    // The transport may be unusable afterwards.
    virtual void abort() = 0;
};

// Creates every missing directory of remote_dir (like "mkdir -p").
bool ensureRemoteDirs(FileTransfer& ft, const std::string& remote_dir, std::string& err);

// Checks shared by the backends before a transfer starts.
// Local source must be an existing regular file; size is filled in.
bool checkLocalSource(const std::string& local, std::uint64_t& size, TransferError& err);
// Local destination must not be a directory; missing parent directories are created.
bool prepareLocalDestination(const std::string& local, TransferError& err);

} // namespace ferry
