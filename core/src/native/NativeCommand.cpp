#include "ferry/NativeCommand.hpp"
#include <QStandardPaths>
#include <QString>
#include <cstdio>

namespace ferry {

static std::string findTool(const std::string& configured, const char* name) {
    if (!configured.empty()) return configured;
    return QStandardPaths::findExecutable(QString::fromLatin1(name)).toStdString();
}

NativeTools NativeTools::locate(const TransportOptions& opt) {
    NativeTools t;
    t.ssh = findTool(opt.sshPath, "ssh");
    t.scp = findTool(opt.scpPath, "scp");
    t.sshpass = findTool(opt.sshpassPath, "sshpass");
    return t;
}

std::string shellQuote(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out += '\'';
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += '\'';
    return out;
}

std::string sshDestination(const ServerProfile& profile) {
    if (profile.username.empty()) return profile.host;
    return profile.username + "@" + profile.host;
}

std::string scpRemoteSpec(const ServerProfile& profile, const std::string& remotePath, bool sftpMode) {
    std::string host = profile.host;
    if (host.find(':') != std::string::npos && host.front() != '[') host = "[" + host + "]";
    std::string spec = profile.username.empty() ? host : profile.username + "@" + host;
    return spec + ":" + (sftpMode ? remotePath : shellQuote(remotePath));
}

bool scpSupportsSftpMode(const std::string& sshVersion) {
    const auto p = sshVersion.find("OpenSSH_");
    if (p == std::string::npos) return false;
    int major = 0, minor = 0;
    if (std::sscanf(sshVersion.c_str() + p + 8, "%d.%d", &major, &minor) < 1) return false;
    return major > 8 || (major == 8 && minor >= 7);
}

bool needsSshpass(const AuthMethod& method, const ServerProfile& profile) {
    switch (method.kind) {
        case AuthMethod::Kind::Password:
            return profile.password.has_value();
        case AuthMethod::Kind::ExplicitKey:
            return method.passphrase.has_value() && !method.passphrase->empty();
        default:
            return false;
    }
}

static void addOption(std::vector<std::string>& v, const std::string& opt) {
    v.push_back("-o");
    v.push_back(opt);
}

std::vector<std::string> commonOptions(const ServerProfile& profile,
                                       const AuthMethod& method,
                                       const TransportOptions& opt) {
    std::vector<std::string> v;
    addOption(v, "ConnectTimeout=" + std::to_string(opt.connectTimeoutSec > 0 ? opt.connectTimeoutSec : 10));
    addOption(v, "ServerAliveInterval=15");
    addOption(v, "ServerAliveCountMax=3");
    addOption(v, "LogLevel=ERROR");

    switch (profile.known_hosts_policy) {
        case KnownHostsPolicy::Strict:
            addOption(v, "StrictHostKeyChecking=yes");
            break;
        case KnownHostsPolicy::AcceptNew:
            addOption(v, "StrictHostKeyChecking=accept-new");
            break;
        case KnownHostsPolicy::Off:
            addOption(v, "StrictHostKeyChecking=no");
            break;
    }
    if (profile.known_hosts_policy == KnownHostsPolicy::Off) {
        addOption(v, "UserKnownHostsFile=/dev/null");
    } else if (profile.known_hosts_path && !profile.known_hosts_path->empty()) {
        addOption(v, "UserKnownHostsFile=" + *profile.known_hosts_path);
    }

    const bool viaSshpass = needsSshpass(method, profile);
    switch (method.kind) {
        case AuthMethod::Kind::Password:
            addOption(v, "PreferredAuthentications=password,keyboard-interactive");
            addOption(v, "PubkeyAuthentication=no");
            addOption(v, "NumberOfPasswordPrompts=1");
            break;
        case AuthMethod::Kind::ExplicitKey:
            v.push_back("-i");
            v.push_back(method.keyPath);
            addOption(v, "IdentitiesOnly=yes");
            addOption(v, "PreferredAuthentications=publickey");
            break;
        case AuthMethod::Kind::Agent:
            addOption(v, "IdentityAgent=" + method.agentSocket);
            addOption(v, "PreferredAuthentications=publickey");
            break;
        case AuthMethod::Kind::DefaultKeyProbe:
            for (const auto& key : method.candidates) {
                v.push_back("-i");
                v.push_back(key);
            }
            // No candidates: let ssh use its own configuration and defaults.
            if (!method.candidates.empty()) addOption(v, "IdentitiesOnly=yes");
            addOption(v, "PreferredAuthentications=publickey");
            break;
    }
    // sshpass answers exactly one prompt; everything else must never block on a tty.
    addOption(v, viaSshpass ? "BatchMode=no" : "BatchMode=yes");
    return v;
}

static NativeInvocation wrap(const NativeTools& tools,
                             const ServerProfile& profile,
                             const AuthMethod& method,
                             const std::string& program,
                             std::vector<std::string> args) {
    NativeInvocation inv;
    if (needsSshpass(method, profile)) {
        inv.program = tools.sshpass;
        if (method.kind == AuthMethod::Kind::ExplicitKey) {
            inv.args = {"-P", "passphrase", "-e", program};
            inv.env.emplace_back("SSHPASS", *method.passphrase);
        } else {
            inv.args = {"-e", program};
            inv.env.emplace_back("SSHPASS", *profile.password);
        }
        inv.args.insert(inv.args.end(), args.begin(), args.end());
    } else {
        inv.program = program;
        inv.args = std::move(args);
    }
    if (method.kind == AuthMethod::Kind::Agent) inv.env.emplace_back("SSH_AUTH_SOCK", method.agentSocket);
    return inv;
}

NativeInvocation buildSshCommand(const NativeTools& tools,
                                 const ServerProfile& profile,
                                 const AuthMethod& method,
                                 const TransportOptions& opt,
                                 const std::string& remoteCommand) {
    std::vector<std::string> args = commonOptions(profile, method, opt);
    args.push_back("-p");
    args.push_back(std::to_string(profile.port));
    args.push_back("-T");
    args.push_back("--");
    args.push_back(sshDestination(profile));
    args.push_back(remoteCommand);
    return wrap(tools, profile, method, tools.ssh, std::move(args));
}

NativeInvocation buildScpCommand(const NativeTools& tools,
                                 const ServerProfile& profile,
                                 const AuthMethod& method,
                                 const TransportOptions& opt,
                                 const std::string& from,
                                 const std::string& to) {
    std::vector<std::string> args = commonOptions(profile, method, opt);
    if (tools.scpSftpMode) args.push_back("-s");
    args.push_back("-P");
    args.push_back(std::to_string(profile.port));
    if (!tools.ssh.empty()) {
        args.push_back("-S");
        args.push_back(tools.ssh);
    }
    args.push_back("--");
    args.push_back(from);
    args.push_back(to);
    return wrap(tools, profile, method, tools.scp, std::move(args));
}

} // namespace ferry
