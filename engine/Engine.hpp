// Engine facade: connection handles, listing, transfer queue, progress.
// connect() and list() block; call them from a background thread.
#pragma once
#include <QObject>
#include <QString>
#include <QVector>
#include <map>
#include <memory>
#include <mutex>
#include "EngineSettings.hpp"
#include "TransferQueue.hpp"
#include "ferry/Connector.hpp"
#include "ferry/CredentialChain.hpp"

class Engine : public QObject {
    Q_OBJECT
public:
    explicit Engine(const EngineSettings& settings,
                    ferry::TransferFactory factory = ferry::defaultTransferFactory(),
                    QObject* parent = nullptr);
    ~Engine();

    // Environment for credential discovery (tests inject a fake ~/.ssh).
    void setResolverEnv(const ferry::ResolverEnv& env) { resolverEnv_ = env; }

    // 0 on failure, with err filled.
    ConnectionHandle connect(const ferry::ServerProfile& profile, ferry::ConnectError& err);
    // Queued tasks of the connection fail with ConnectionLost; running ones are cancelled.
    bool disconnect(ConnectionHandle h);
    // Mode the connection is bound to; false for an unknown handle.
    bool connectionMode(ConnectionHandle h, ferry::TransportMode& mode) const;

    bool list(ConnectionHandle h, const std::string& path,
              std::vector<ferry::RemoteEntry>& out, ferry::ListError& err);

    // 0 for an unknown handle. Relative remote paths use the profile's base path.
    TaskId enqueueTransfer(ConnectionHandle h, ferry::TransferDirection dir,
                           const QString& local, const QString& remote);
    // One task per regular file below localDir, mirrored under remoteDir.
    QVector<TaskId> enqueueUploadTree(ConnectionHandle h, const QString& localDir,
                                      const QString& remoteDir, QString& err);
    // One task per remote file below remoteDir, mirrored under localDir (blocking listing).
    QVector<TaskId> enqueueDownloadTree(ConnectionHandle h, const QString& remoteDir,
                                        const QString& localDir, ferry::ListError& err);

    std::shared_ptr<ProgressSubscription> subscribeProgress(TaskId id) { return queue_.subscribe(id); }
    bool cancel(TaskId id) { return queue_.cancel(id); }
    void cancelAll() { queue_.cancelAll(); }

    // Remote file operations on an idle connection (they wait for a running transfer).
    bool makeDirectory(ConnectionHandle h, const std::string& path, std::string& err);
    // Directories are removed recursively.
    bool remove(ConnectionHandle h, const std::string& path, std::string& err);
    bool rename(ConnectionHandle h, const std::string& from, const std::string& to,
                std::string& err, bool overwrite = false);

    TransferQueue& queue() { return queue_; }
    const EngineSettings& settings() const { return settings_; }

signals:
    void tasksChanged();
    void taskProgress(quint64 id, const ProgressEvent& ev);
    void taskFinished(quint64 id);

private:
    std::shared_ptr<ferry::Connection> connection(ConnectionHandle h) const;
    bool removeTree(ferry::FileTransfer& ft, const std::string& dir, std::string& err, int depth);
    bool collectRemoteFiles(ferry::Connection& c, const std::string& dir, const std::string& rel,
                            std::vector<std::pair<std::string, std::string>>& out,
                            ferry::ListError& err, int depth);

    EngineSettings settings_;
    ferry::Connector connector_;
    ferry::ResolverEnv resolverEnv_;
    mutable std::mutex connMtx_; // protects conns_ and nextHandle_
    std::map<ConnectionHandle, std::shared_ptr<ferry::Connection>> conns_;
    ConnectionHandle nextHandle_ = 1;
    TransferQueue queue_;
};
