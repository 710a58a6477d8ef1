// Simulated FileTransfer for tests and offline runs: an in-memory remote
// filesystem plus scripted connection/authentication outcomes.
#pragma once
#include "FileTransfer.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace ferry {

class MockFileTransfer : public FileTransfer {
public:
    struct Node {
        bool isDir = false;
        std::string data;
        std::uint64_t mtime = 0;
        std::uint32_t mode = 0644;
        std::string linkTarget; // non-empty for a symlink
    };

    // Behaviour shared by every instance created with the same script, so a
    // test can drive several connections (and both transport modes) at once.
    struct Script {
        Script();

        std::mutex mu;
        std::map<std::string, Node> fs; // absolute path -> node; "/" always exists

        // open()
        bool openOk = true;
        ConnectErrorKind openErrorKind = ConnectErrorKind::NetworkUnreachable;
        std::string openError = "mock: host unreachable";
        // authenticate(): methods that succeed; others fail
        std::set<AuthMethod::Kind> acceptedAuth;
        bool loseSessionOnAuthFailure = false;

        // Transfers
        std::size_t chunkSize = 64 * 1024;
        int chunkDelayMs = 0;
        // Only abort() stops a transfer (simulates a stuck read).
        bool ignoreCooperativeCancel = false;
        // Remote path -> failure reported when a transfer touches it.
        std::map<std::string, TransferErrorKind> failPaths;

        // Listing: malformed entries reported on every list() call
        std::size_t badListLines = 0;

        // Call log, e.g. "library:open", "native:auth:password:fail"
        std::vector<std::string> log;

        void addDir(const std::string& path);
        void addFile(const std::string& path, const std::string& data, std::uint64_t mtime = 0);
        // target may be relative to the link's directory; it need not exist.
        void addLink(const std::string& path, const std::string& target);
        bool hasFile(const std::string& path);
        std::string fileData(const std::string& path);
        std::vector<std::string> logSnapshot();
    };

    explicit MockFileTransfer(TransportMode mode = TransportMode::Library,
                              std::shared_ptr<Script> script = std::make_shared<Script>());

    TransportMode mode() const override { return mode_; }
    const std::shared_ptr<Script>& script() const { return script_; }

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

    // Kills the session: the operation in flight and every later one fail
    // with ConnectionLost until the next open().
    void abort() override;

private:
    void record(const std::string& what);
    bool stopRequested(const CancelFn& shouldCancel, TransferError& err) const;
    void pause() const;

    TransportMode mode_;
    std::shared_ptr<Script> script_;
    bool opened_ = false;
    std::atomic<bool> connected_{false};
    TransportOptions opt_;
    std::atomic<bool> aborted_{false};
};

} // namespace ferry
