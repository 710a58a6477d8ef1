// Credential chain resolution: fixed priority, filesystem probing only.
#include "ferry/CredentialChain.hpp"
#include "ferry/Log.hpp"
#include <cstdlib>
#include <sys/stat.h>
#include <unistd.h>

namespace ferry {

AuthMethod AuthMethod::password() {
    AuthMethod m;
    m.kind = Kind::Password;
    return m;
}

AuthMethod AuthMethod::explicitKey(std::string path, std::optional<std::string> passphrase) {
    AuthMethod m;
    m.kind = Kind::ExplicitKey;
    m.keyPath = std::move(path);
    m.passphrase = std::move(passphrase);
    return m;
}

AuthMethod AuthMethod::agent(std::string socketPath) {
    AuthMethod m;
    m.kind = Kind::Agent;
    m.agentSocket = std::move(socketPath);
    return m;
}

AuthMethod AuthMethod::defaultKeyProbe(std::vector<std::string> paths,
                                       std::optional<std::string> passphrase) {
    AuthMethod m;
    m.kind = Kind::DefaultKeyProbe;
    m.candidates = std::move(paths);
    m.passphrase = std::move(passphrase);
    return m;
}

std::string AuthMethod::describe() const {
    switch (kind) {
        case Kind::Password: return "password";
        case Kind::ExplicitKey: return "key:" + keyPath;
        case Kind::Agent: return "agent";
        case Kind::DefaultKeyProbe: {
            std::string s = "default-keys[";
            for (std::size_t i = 0; i < candidates.size(); ++i) {
                if (i) s += ',';
                const auto slash = candidates[i].find_last_of('/');
                s += (slash == std::string::npos) ? candidates[i] : candidates[i].substr(slash + 1);
            }
            return s + "]";
        }
    }
    return "?";
}

ResolverEnv ResolverEnv::fromProcess() {
    ResolverEnv env;
    if (const char* home = std::getenv("HOME")) {
        if (*home) env.sshDir = std::string(home) + "/.ssh";
    }
    if (const char* sock = std::getenv("SSH_AUTH_SOCK")) env.agentSocket = sock;
    return env;
}

const std::vector<std::string>& defaultKeyNames() {
    static const std::vector<std::string> names = {"id_ed25519", "id_rsa", "id_ecdsa"};
    return names;
}

static bool isReadableFile(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(path.c_str(), R_OK) == 0;
}

static bool isSocket(const std::string& path) {
    struct stat st{};
    return !path.empty() && ::stat(path.c_str(), &st) == 0 && S_ISSOCK(st.st_mode);
}

AuthChain resolveAuthChain(const ServerProfile& profile, const ResolverEnv& env) {
    AuthChain chain;
    if (profile.password.has_value() && !profile.password->empty()) {
        chain.push_back(AuthMethod::password());
    }
    const bool hasKey = profile.private_key_path.has_value() && !profile.private_key_path->empty();
    if (hasKey) {
        chain.push_back(AuthMethod::explicitKey(*profile.private_key_path, profile.private_key_passphrase));
    }
    if (isSocket(env.agentSocket)) {
        chain.push_back(AuthMethod::agent(env.agentSocket));
    }
    std::vector<std::string> candidates;
    if (!env.sshDir.empty()) {
        for (const auto& name : defaultKeyNames()) {
            const std::string path = env.sshDir + "/" + name;
            if (hasKey && path == *profile.private_key_path) continue;
            if (isReadableFile(path)) candidates.push_back(path);
        }
    }
    chain.push_back(AuthMethod::defaultKeyProbe(std::move(candidates), profile.private_key_passphrase));

    LOGD("Auth chain for %s@%s: %zu method(s)", profile.username.c_str(), profile.host.c_str(), chain.size());
    return chain;
}

} // namespace ferry
