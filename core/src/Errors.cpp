#include "ferry/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>

namespace ferry {

static std::string lowered(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return out;
}

static bool contains(const std::string& hay, const char* needle) {
    return hay.find(needle) != std::string::npos;
}

const char* toString(ConnectErrorKind k) {
    switch (k) {
        case ConnectErrorKind::None: return "none";
        case ConnectErrorKind::AllAuthMethodsExhausted: return "all authentication methods failed";
        case ConnectErrorKind::TransportUnavailable: return "transport unavailable";
        case ConnectErrorKind::NetworkUnreachable: return "network unreachable";
        case ConnectErrorKind::Timeout: return "timed out";
        case ConnectErrorKind::HostKeyRejected: return "host key rejected";
    }
    return "?";
}

const char* toString(ListErrorKind k) {
    switch (k) {
        case ListErrorKind::None: return "none";
        case ListErrorKind::PermissionDenied: return "permission denied";
        case ListErrorKind::PathNotFound: return "path not found";
        case ListErrorKind::PartialParseWarning: return "some entries could not be parsed";
        case ListErrorKind::ConnectionLost: return "connection lost";
        case ListErrorKind::NotConnected: return "not connected";
        case ListErrorKind::Failed: return "listing failed";
    }
    return "?";
}

const char* toString(TransferErrorKind k) {
    switch (k) {
        case TransferErrorKind::None: return "none";
        case TransferErrorKind::SourceNotFound: return "source not found";
        case TransferErrorKind::DestinationConflict: return "destination conflict";
        case TransferErrorKind::DiskFull: return "disk full";
        case TransferErrorKind::ConnectionLost: return "connection lost";
        case TransferErrorKind::Cancelled: return "cancelled";
        case TransferErrorKind::RemoteQuotaExceeded: return "remote quota exceeded";
        case TransferErrorKind::PermissionDenied: return "permission denied";
        case TransferErrorKind::IoError: return "I/O error";
    }
    return "?";
}

std::string ConnectError::message() const {
    if (kind == ConnectErrorKind::None) return std::string();
    std::string msg = toString(kind);
    if (!libraryError.empty()) msg += ": " + libraryError;
    if (!nativeError.empty()) msg += "; native fallback also failed: " + nativeError;
    return msg;
}

TransferErrorKind transferKindFromErrno(int err) {
    switch (err) {
        case ENOENT: return TransferErrorKind::SourceNotFound;
        case EISDIR: return TransferErrorKind::DestinationConflict;
        case ENOSPC: return TransferErrorKind::DiskFull;
#ifdef EDQUOT
        case EDQUOT: return TransferErrorKind::DiskFull;
#endif
        case EACCES:
        case EPERM:
        case EROFS: return TransferErrorKind::PermissionDenied;
        default: return TransferErrorKind::IoError;
    }
}

TransferErrorKind destinationKindFromErrno(int err) {
    switch (err) {
        case ENOENT: return TransferErrorKind::IoError;
        case ENOTDIR:
        case EEXIST: return TransferErrorKind::DestinationConflict;
        default: return transferKindFromErrno(err);
    }
}

TransferErrorKind transferKindFromToolText(const std::string& text) {
    const std::string t = lowered(text);
    if (contains(t, "disk quota exceeded") || contains(t, "quota exceeded")) return TransferErrorKind::RemoteQuotaExceeded;
    if (contains(t, "no space left")) return TransferErrorKind::DiskFull;
    if (contains(t, "is a directory")) return TransferErrorKind::DestinationConflict;
    if (contains(t, "no such file or directory")) return TransferErrorKind::SourceNotFound;
    if (contains(t, "permission denied") && !contains(t, "(publickey") && !contains(t, "(password")) {
        return TransferErrorKind::PermissionDenied;
    }
    if (contains(t, "connection closed") || contains(t, "connection reset") ||
        contains(t, "broken pipe") || contains(t, "connection timed out") ||
        contains(t, "lost connection") || contains(t, "could not resolve") ||
        contains(t, "connection refused") || contains(t, "permission denied (")) {
        return TransferErrorKind::ConnectionLost;
    }
    return TransferErrorKind::IoError;
}

ListErrorKind listKindFromToolText(const std::string& text) {
    const std::string t = lowered(text);
    if (contains(t, "no such file or directory")) return ListErrorKind::PathNotFound;
    if (contains(t, "permission denied (")) return ListErrorKind::ConnectionLost;
    if (contains(t, "permission denied")) return ListErrorKind::PermissionDenied;
    if (contains(t, "connection closed") || contains(t, "connection reset") ||
        contains(t, "connection timed out") || contains(t, "lost connection") ||
        contains(t, "connection refused")) {
        return ListErrorKind::ConnectionLost;
    }
    return ListErrorKind::Failed;
}

} // namespace ferry
