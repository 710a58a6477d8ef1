// Credential chain: ordered authentication attempts derived from a ServerProfile.
#pragma once
#include "Types.hpp"
#include <string>
#include <vector>

namespace ferry {

struct AuthMethod {
    enum class Kind { Password, ExplicitKey, Agent, DefaultKeyProbe } kind = Kind::Password;

    std::string keyPath;                  // ExplicitKey
    std::vector<std::string> candidates;  // DefaultKeyProbe (may be empty)
    std::string agentSocket;              // Agent
    // Passphrase offered with ExplicitKey (and with default keys, if the profile has one)
    std::optional<std::string> passphrase;

    static AuthMethod password();
    static AuthMethod explicitKey(std::string path, std::optional<std::string> passphrase);
    static AuthMethod agent(std::string socketPath);
    static AuthMethod defaultKeyProbe(std::vector<std::string> paths,
                                      std::optional<std::string> passphrase);

    // Short label for logs ("password", "key:/home/u/.ssh/id_rsa", ...)
    std::string describe() const;
};

using AuthChain = std::vector<AuthMethod>;

// Environment the resolver inspects. Tests inject a temporary ssh dir and agent socket.
struct ResolverEnv {
    std::string sshDir;       // usually $HOME/.ssh
    std::string agentSocket;  // usually $SSH_AUTH_SOCK

    static ResolverEnv fromProcess();
};

// Default key file names, in the order they are tried.
const std::vector<std::string>& defaultKeyNames();

// Deterministic order: password -> explicit key -> agent (if the socket exists)
// -> default keys (always present, possibly with no candidates).
// Only existence/readability of files is checked; key contents are never read.
AuthChain resolveAuthChain(const ServerProfile& profile,
                           const ResolverEnv& env = ResolverEnv::fromProcess());

} // namespace ferry
