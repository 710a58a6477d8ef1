// Basic types shared between the engine layers: server profiles, remote entries,
// transport modes and progress callbacks. Kept plain so they copy cheaply across threads.
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <functional>

namespace ferry {

// known_hosts validation policy for the server host key.
enum class KnownHostsPolicy {
    Strict,     // Requires exact match with known_hosts.
    AcceptNew,  // TOFU: accept and save new hosts; reject key changes.
    Off         // No verification (not recommended).
};

// Which backend a Connection is bound to.
enum class TransportMode {
    Library,    // libssh2 session + SFTP channel
    NativeTool  // host ssh/scp executables
};

enum class TransferDirection { Upload, Download };

// Snapshot of a saved server profile. The engine only reads it.
struct ServerProfile {
    std::string name;  // display name (may be empty)
    std::string host;
    std::uint16_t port = 22;
    std::string username;

    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;

    std::string remote_base_path = "/";

    // SSH security
    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::AcceptNew;
};

struct RemoteEntry {
    std::string   name;     // base name
    bool          is_dir = false;
    std::optional<std::uint64_t> size; // bytes; empty for directories
    std::uint64_t mtime = 0;           // epoch (seconds), 0 if unknown
    std::string   permissions;         // "drwxr-xr-x" style summary
    std::uint32_t mode = 0;            // POSIX bits (permissions/type) when known
    // Symlinks report their target's type, size and mtime; permissions and
    // mode stay those of the link. A dangling link keeps its own attributes.
    bool          is_link = false;
    std::string   link_target;
};

// Connection-level tunables. Filled from EngineSettings by the engine.
struct TransportOptions {
    int connectTimeoutSec = 10;
    int authTimeoutSec = 20;
    int listTimeoutSec = 30;
    std::uint64_t progressThresholdBytes = 256 * 1024;
    int progressIntervalMs = 200;
    // Native tool locations; empty means "search PATH".
    std::string sshPath;
    std::string scpPath;
    std::string sshpassPath;
};

// Progress callback: bytes done so far and total (0 = unknown).
using ProgressFn = std::function<void(std::uint64_t /*done*/, std::uint64_t /*total*/)>;
// Cooperative cancellation check; checked at every progress point.
using CancelFn = std::function<bool()>;

const char* toString(TransportMode m);
const char* toString(TransferDirection d);

// Builds the "drwxr-xr-x" summary from POSIX mode bits.
std::string permissionString(std::uint32_t mode);

// Normalizes a POSIX remote path: collapses "//" and ".", resolves "..",
// strips the trailing slash (except for "/"). Relative paths stay relative.
std::string normalizeRemotePath(const std::string& path);

// Joins a remote directory and a child name with exactly one '/'.
std::string joinRemotePath(const std::string& dir, const std::string& name);

// Parent directory of a normalized remote path ("" for a bare name).
std::string remoteParent(const std::string& path);

} // namespace ferry
