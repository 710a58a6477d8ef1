// Read-only view of the saved sites in QSettings("Ferry", "Ferry").
#pragma once
#include "ferry/Types.hpp"
#include <QString>
#include <QVector>

class QSettings;
class SecretStore;

class ProfileStore {
public:
    void load();
    void load(QSettings& s);

    const QVector<ferry::ServerProfile>& profiles() const { return sites_; }

    // Profile by site name with secrets filled in (secrets may be null).
    bool find(const QString& name, ferry::ServerProfile& out, const SecretStore* secrets) const;

private:
    QVector<ferry::ServerProfile> sites_;
};
