// Command lines for the host ssh/scp/sshpass executables (Native-Tool Mode).
#pragma once
#include "Types.hpp"
#include "CredentialChain.hpp"
#include <string>
#include <utility>
#include <vector>

namespace ferry {

// Resolved executable paths. ssh and scp are required; sshpass only for
// password and passphrase-protected key authentication.
struct NativeTools {
    std::string ssh;
    std::string scp;
    std::string sshpass;
    // scp accepts -s (OpenSSH 8.7+): remote paths are taken literally.
    // Older scp hands them to the remote shell.
    bool scpSftpMode = false;

    // Uses the configured paths when set, otherwise searches PATH.
    static NativeTools locate(const TransportOptions& opt);
};

// A fully built process invocation: program, arguments and extra environment.
struct NativeInvocation {
    std::string program;
    std::vector<std::string> args;
    std::vector<std::pair<std::string, std::string>> env;
};

// POSIX shell single-quoting: abc -> 'abc', it's -> 'it'\''s'
std::string shellQuote(const std::string& s);

// "user@host" (IPv6 literals are bracketed for scp).
std::string sshDestination(const ServerProfile& profile);
// "user@host:path" for scp. The path is shell-quoted unless scp runs in SFTP mode.
std::string scpRemoteSpec(const ServerProfile& profile, const std::string& remotePath, bool sftpMode);

// True when an "ssh -V" banner names OpenSSH 8.7 or later.
bool scpSupportsSftpMode(const std::string& sshVersion);

// -o options shared by ssh and scp: timeouts, host key policy, and the
// authentication restrictions for method.
std::vector<std::string> commonOptions(const ServerProfile& profile,
                                       const AuthMethod& method,
                                       const TransportOptions& opt);

// True when method has to be fed through sshpass (password, or a key passphrase).
bool needsSshpass(const AuthMethod& method, const ServerProfile& profile);

// ssh [opts] -p PORT -T -- user@host remoteCommand
NativeInvocation buildSshCommand(const NativeTools& tools,
                                 const ServerProfile& profile,
                                 const AuthMethod& method,
                                 const TransportOptions& opt,
                                 const std::string& remoteCommand);

// scp [opts] [-s] -P PORT [-S ssh] -- from to. One side should come from scpRemoteSpec().
NativeInvocation buildScpCommand(const NativeTools& tools,
                                 const ServerProfile& profile,
                                 const AuthMethod& method,
                                 const TransportOptions& opt,
                                 const std::string& from,
                                 const std::string& to);

} // namespace ferry
