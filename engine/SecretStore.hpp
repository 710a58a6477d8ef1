// Read-only source of saved-site credentials. Ferry never writes secrets;
// another tool puts them in QSettings("Ferry", "Secrets").
#pragma once
#include "ferry/Types.hpp"
#include <QString>
#include <optional>
#include <string>

class SecretStore {
public:
    // Secrets are read only when FERRY_ENABLE_INSECURE_FALLBACK=1: they sit
    // unencrypted in QSettings.
    static bool insecureFallbackActive();

    std::optional<std::string> password(const QString& site) const;
    std::optional<std::string> keyPassphrase(const QString& site) const;

    // Sets whatever the store holds for site on p. Returns the number of
    // credentials applied.
    int applyTo(const QString& site, ferry::ServerProfile& p) const;

    // Settings keys, "site:<name>:password" and "site:<name>:keypass".
    static QString passwordKey(const QString& site) { return QString("site:%1:password").arg(site); }
    static QString passphraseKey(const QString& site) { return QString("site:%1:keypass").arg(site); }

private:
    std::optional<std::string> lookup(const QString& key) const;
};
