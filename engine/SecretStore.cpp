#include "SecretStore.hpp"
#include "ferry/Log.hpp"
#include <QSettings>
#include <QVariant>
#include <cstdlib>

bool SecretStore::insecureFallbackActive() {
    const char* v = std::getenv("FERRY_ENABLE_INSECURE_FALLBACK");
    return v && *v == '1';
}

std::optional<std::string> SecretStore::lookup(const QString& key) const {
    if (!insecureFallbackActive()) return std::nullopt;
    QSettings s("Ferry", "Secrets");
    const QVariant v = s.value(key);
    if (!v.isValid() || v.toString().isEmpty()) return std::nullopt;
    return v.toString().toStdString();
}

std::optional<std::string> SecretStore::password(const QString& site) const {
    return lookup(passwordKey(site));
}

std::optional<std::string> SecretStore::keyPassphrase(const QString& site) const {
    return lookup(passphraseKey(site));
}

int SecretStore::applyTo(const QString& site, ferry::ServerProfile& p) const {
    int applied = 0;
    if (auto pw = password(site)) {
        p.password = std::move(*pw);
        ++applied;
    }
    if (auto kp = keyPassphrase(site)) {
        p.private_key_passphrase = std::move(*kp);
        ++applied;
    }
    if (applied) LOGD("Using %d stored credential(s) for site %s", applied, site.toUtf8().constData());
    return applied;
}
