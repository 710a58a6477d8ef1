// FileTransfer implementation driving the host ssh/scp executables
// (Native-Tool Mode). Every operation is one short-lived child process.
#pragma once
#include "FileTransfer.hpp"
#include "NativeCommand.hpp"
#include <atomic>
#include <optional>
#include <string>
#include <vector>

namespace ferry {

class NativeToolTransfer : public FileTransfer {
public:
    NativeToolTransfer() = default;
    // Tests point this at fake executables.
    explicit NativeToolTransfer(NativeTools tools);
    ~NativeToolTransfer() override = default;

    TransportMode mode() const override { return TransportMode::NativeTool; }

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

    // Outcome of one child process.
    struct ProcessResult {
        bool started = false;
        bool timedOut = false;
        bool cancelled = false;
        int exitCode = -1;
        std::string out;
        std::string err;
    };

    // Runs inv to completion. The cancel check and the abort flag are polled at
    // least every 100 ms; timeoutMs <= 0 disables the deadline. onOutput sees
    // stdout and stderr as they arrive.
    ProcessResult run(const NativeInvocation& inv,
                      int timeoutMs,
                      const CancelFn& shouldCancel = {},
                      const std::function<void(const std::string&)>& onOutput = {},
                      const std::function<void()>& onTick = {});

private:
    // Remote shell command over the bound auth method.
    ProcessResult runRemote(const std::string& command, int timeoutMs);
    // "ls -la" (dir) or "ls -ld" (single entry), with the long-iso fallback.
    // An "L" in flags follows symlinks.
    ProcessResult runLs(const std::string& flags, const std::string& path);
    // stat() without clearing a pending abort. An absent path returns false with err empty.
    bool statEntry(const std::string& remote_path, RemoteEntry& info, std::string& err);
    // Symlinks in a parsed listing take the type and size of their targets.
    void resolveLinks(const std::string& dir, std::vector<RemoteEntry>& entries);
    static void takeTargetAttributes(const RemoteEntry& target, RemoteEntry& link);
    static std::string firstLine(const std::string& s);

    NativeTools tools_;
    bool toolsGiven_ = false;
    ServerProfile profile_;
    TransportOptions opt_;
    std::optional<AuthMethod> method_;
    bool opened_ = false;
    bool connected_ = false;
    bool longIsoSupported_ = true;
    std::atomic<bool> aborted_{false};
};

} // namespace ferry
