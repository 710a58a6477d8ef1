// Error taxonomy for connecting, listing and transferring.
// Operations return bool and fill one of these structs, as the rest of the core does.
#pragma once
#include <string>
#include <cstddef>
#include <utility>

namespace ferry {

enum class ConnectErrorKind {
    None,
    AllAuthMethodsExhausted, // a transport came up but no credential was accepted
    TransportUnavailable,    // library/tool missing or SSH negotiation failed
    NetworkUnreachable,      // name resolution / TCP connect failed
    Timeout,
    HostKeyRejected          // known_hosts mismatch or unknown host under Strict
};

enum class ListErrorKind {
    None,
    PermissionDenied,
    PathNotFound,
    PartialParseWarning,     // non-fatal: entries are usable, some lines were skipped
    ConnectionLost,
    NotConnected,
    Failed
};

enum class TransferErrorKind {
    None,
    SourceNotFound,
    DestinationConflict,
    DiskFull,
    ConnectionLost,
    Cancelled,
    RemoteQuotaExceeded,
    PermissionDenied,
    IoError
};

// Aggregate failure of Connector::connect. Individual auth attempts are never
// reported; only the last error of each mode is kept.
struct ConnectError {
    ConnectErrorKind kind = ConnectErrorKind::None;
    std::string libraryError; // last error in Library Mode
    std::string nativeError;  // last error in Native-Tool Mode

    bool ok() const { return kind == ConnectErrorKind::None; }
    // Text meant for the presentation layer.
    std::string message() const;
};

struct ListError {
    ListErrorKind kind = ListErrorKind::None;
    std::size_t goodEntries = 0; // PartialParseWarning only
    std::size_t badLines = 0;    // PartialParseWarning only
    std::string message;

    bool isWarning() const { return kind == ListErrorKind::PartialParseWarning; }
    void clear() { *this = ListError{}; }
};

struct TransferError {
    TransferErrorKind kind = TransferErrorKind::None;
    std::string message;

    void set(TransferErrorKind k, std::string msg) {
        kind = k;
        message = std::move(msg);
    }
    void clear() { *this = TransferError{}; }
};

const char* toString(ConnectErrorKind k);
const char* toString(ListErrorKind k);
const char* toString(TransferErrorKind k);

// Classifies errno values from local file I/O.
TransferErrorKind transferKindFromErrno(int err);

// Same, for errors writing the local destination: a missing path there is
// not a missing source.
TransferErrorKind destinationKindFromErrno(int err);

// Classifies free-form ssh/scp/ls stderr text. Returns IoError when nothing matches.
TransferErrorKind transferKindFromToolText(const std::string& text);
ListErrorKind listKindFromToolText(const std::string& text);

} // namespace ferry
