// Saved sites: the "sites" array, with credentials fetched from SecretStore
// only when a profile is handed out for connecting.
#include "ProfileStore.hpp"
#include "SecretStore.hpp"
#include <QSettings>

void ProfileStore::load() {
    QSettings s("Ferry", "Ferry");
    load(s);
}

void ProfileStore::load(QSettings& s) {
    sites_.clear();
    const int n = s.beginReadArray("sites");
    for (int i = 0; i < n; ++i) {
        s.setArrayIndex(i);
        ferry::ServerProfile p;
        p.name = s.value("name").toString().toStdString();
        p.host = s.value("host").toString().toStdString();
        p.port = (std::uint16_t)s.value("port", 22).toUInt();
        p.username = s.value("user").toString().toStdString();
        const QString kp = s.value("keyPath").toString();
        if (!kp.isEmpty()) p.private_key_path = kp.toStdString();
        const QString kh = s.value("knownHosts").toString();
        if (!kh.isEmpty()) p.known_hosts_path = kh.toStdString();
        const int pol = s.value("khPolicy", (int)ferry::KnownHostsPolicy::AcceptNew).toInt();
        if (pol >= (int)ferry::KnownHostsPolicy::Strict && pol <= (int)ferry::KnownHostsPolicy::Off)
            p.known_hosts_policy = (ferry::KnownHostsPolicy)pol;
        const QString base = s.value("basePath", "/").toString();
        p.remote_base_path = base.isEmpty() ? std::string("/") : base.toStdString();
        sites_.push_back(p);
    }
    s.endArray();
}

bool ProfileStore::find(const QString& name, ferry::ServerProfile& out, const SecretStore* secrets) const {
    const std::string key = name.toStdString();
    for (const auto& p : sites_) {
        if (p.name != key) continue;
        out = p;
        if (secrets) secrets->applyTo(name, out);
        return true;
    }
    return false;
}
