// FileTransfer implementation using libssh2 for SSH/SFTP (Library Mode).
// Encapsulates the SSH session, SFTP channel, and TCP socket.
#pragma once
#include "FileTransfer.hpp"
#include <atomic>
#include <string>
#include <vector>

// Forward declarations of libssh2 internal types (with leading underscore)
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace ferry {

class Libssh2Transfer : public FileTransfer {
public:
    Libssh2Transfer();
    ~Libssh2Transfer() override;

    TransportMode mode() const override { return TransportMode::Library; }

    bool open(const ServerProfile& profile,
              const TransportOptions& opt,
              ConnectErrorKind& kind,
              std::string& err) override;
    bool authenticate(const AuthMethod& method,
                      std::string& err,
                      bool& sessionLost) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }

    bool list(const std::string& remote_path,
              std::vector<RemoteEntry>& out,
              ListError& err) override;

    bool get(const std::string& remote,
             const std::string& local,
             TransferError& err,
             ProgressFn progress,
             CancelFn shouldCancel) override;

    bool put(const std::string& local,
             const std::string& remote,
             TransferError& err,
             ProgressFn progress,
             CancelFn shouldCancel) override;

    bool stat(const std::string& remote_path,
              RemoteEntry& info,
              std::string& err) override;

    bool exists(const std::string& remote_path,
                bool& isDir,
                std::string& err) override;

    bool mkdir(const std::string& remote_dir,
               std::string& err,
               unsigned int mode = 0755) override;

    bool removeFile(const std::string& remote_path,
                    std::string& err) override;

    bool removeDir(const std::string& remote_dir,
                   std::string& err) override;

    bool rename(const std::string& from,
                const std::string& to,
                std::string& err,
                bool overwrite = false) override;

    void abort() override;

private:
    std::atomic<bool> connected_{false};
    std::atomic<int> sock_{-1};
    std::atomic<bool> aborted_{false};
    _LIBSSH2_SESSION* session_ = nullptr; // <- uses internal libssh2 types
    _LIBSSH2_SFTP*    sftp_    = nullptr; // <- same
    ServerProfile profile_;
    TransportOptions opt_;

    // TCP connection with a bounded connect timeout.
    bool tcpConnect(const std::string& host, uint16_t port,
                    ConnectErrorKind& kind, std::string& err);
    // Host key verification according to known_hosts policy.
    bool verifyHostKey(ConnectErrorKind& kind, std::string& err);

    bool authPassword(std::string& err, bool& sessionLost);
    bool authKeyFile(const std::string& path,
                     const std::optional<std::string>& passphrase,
                     std::string& err, bool& sessionLost);
    bool authAgent(std::string& err, bool& sessionLost);

    // Maps the last libssh2/SFTP failure to the transfer taxonomy.
    TransferErrorKind lastTransferErrorKind(TransferErrorKind fallback) const;
    std::string lastSessionError() const;
    // Fills a symlink entry with its target and the target's type, size and mtime.
    void followLink(const std::string& remote_path, RemoteEntry& e);
    void closeSession();
};

} // namespace ferry
