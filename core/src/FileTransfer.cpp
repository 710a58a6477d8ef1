// Helpers shared by every FileTransfer backend.
#include "ferry/FileTransfer.hpp"
#include <cerrno>
#include <cstring>
#include <sys/stat.h>

namespace ferry {

bool ensureRemoteDirs(FileTransfer& ft, const std::string& remote_dir, std::string& err) {
    const std::string dir = normalizeRemotePath(remote_dir);
    if (dir.empty() || dir == "/" || dir == ".") return true;
    std::string cur = (dir[0] == '/') ? "/" : "";
    std::size_t i = (dir[0] == '/') ? 1 : 0;
    while (i <= dir.size()) {
        std::size_t j = dir.find('/', i);
        if (j == std::string::npos) j = dir.size();
        const std::string part = dir.substr(i, j - i);
        i = j + 1;
        if (part.empty()) continue;
        cur = joinRemotePath(cur, part);
        bool isDir = false;
        std::string e;
        if (ft.exists(cur, isDir, e)) {
            if (!isDir) {
                err = "Not a directory: " + cur;
                return false;
            }
            continue;
        }
        if (!e.empty()) {
            err = e;
            return false;
        }
        if (!ft.mkdir(cur, err, 0755)) return false;
    }
    return true;
}

bool checkLocalSource(const std::string& local, std::uint64_t& size, TransferError& err) {
    struct stat st{};
    if (::stat(local.c_str(), &st) != 0) {
        const int e = errno;
        err.set(e == ENOENT ? TransferErrorKind::SourceNotFound : transferKindFromErrno(e),
                "Local source not accessible: " + local + " (" + std::strerror(e) + ")");
        return false;
    }
    if (!S_ISREG(st.st_mode)) {
        err.set(TransferErrorKind::SourceNotFound, "Local source is not a regular file: " + local);
        return false;
    }
    size = (std::uint64_t)st.st_size;
    return true;
}

static bool mkpath(const std::string& dir) {
    if (dir.empty()) return true;
    struct stat st{};
    if (::stat(dir.c_str(), &st) == 0) {
        if (S_ISDIR(st.st_mode)) return true;
        errno = ENOTDIR;
        return false;
    }
    const auto slash = dir.find_last_of('/');
    if (slash != std::string::npos && slash > 0 && !mkpath(dir.substr(0, slash))) return false;
    return ::mkdir(dir.c_str(), 0755) == 0 || errno == EEXIST;
}

bool prepareLocalDestination(const std::string& local, TransferError& err) {
    struct stat st{};
    if (::stat(local.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
        err.set(TransferErrorKind::DestinationConflict, "Local destination is a directory: " + local);
        return false;
    }
    const auto slash = local.find_last_of('/');
    if (slash != std::string::npos && slash > 0 && !mkpath(local.substr(0, slash))) {
        const int e = errno;
        err.set(destinationKindFromErrno(e), "Could not create local directory for: " + local + " (" + std::strerror(e) + ")");
        return false;
    }
    return true;
}

} // namespace ferry
