#include "EngineSettings.hpp"
#include <QSettings>

EngineSettings EngineSettings::load() {
    QSettings s("Ferry", "Ferry");
    return load(s);
}

EngineSettings EngineSettings::load(QSettings& s) {
    EngineSettings e;
    const ferry::TransportOptions d;
    e.maxConcurrent = qMax(1, s.value("Transfers/maxConcurrent", e.maxConcurrent).toInt());
    e.cancelLatencyMs = qMax(0, s.value("Transfers/cancelLatencyMs", e.cancelLatencyMs).toInt());
    e.transport.progressThresholdBytes =
        s.value("Transfers/progressThresholdBytes", (qulonglong)d.progressThresholdBytes).toULongLong();
    e.transport.progressIntervalMs = qMax(1, s.value("Transfers/progressIntervalMs", d.progressIntervalMs).toInt());
    e.transport.connectTimeoutSec = qMax(1, s.value("Network/connectTimeoutSec", d.connectTimeoutSec).toInt());
    e.transport.authTimeoutSec = qMax(1, s.value("Network/authTimeoutSec", d.authTimeoutSec).toInt());
    e.transport.listTimeoutSec = qMax(1, s.value("Network/listTimeoutSec", d.listTimeoutSec).toInt());
    e.transport.sshPath = s.value("Native/sshPath").toString().toStdString();
    e.transport.scpPath = s.value("Native/scpPath").toString().toStdString();
    e.transport.sshpassPath = s.value("Native/sshpassPath").toString().toStdString();
    return e;
}

void EngineSettings::save(QSettings& s) const {
    s.setValue("Transfers/maxConcurrent", maxConcurrent);
    s.setValue("Transfers/cancelLatencyMs", cancelLatencyMs);
    s.setValue("Transfers/progressThresholdBytes", (qulonglong)transport.progressThresholdBytes);
    s.setValue("Transfers/progressIntervalMs", transport.progressIntervalMs);
    s.setValue("Network/connectTimeoutSec", transport.connectTimeoutSec);
    s.setValue("Network/authTimeoutSec", transport.authTimeoutSec);
    s.setValue("Network/listTimeoutSec", transport.listTimeoutSec);
    s.setValue("Native/sshPath", QString::fromStdString(transport.sshPath));
    s.setValue("Native/scpPath", QString::fromStdString(transport.scpPath));
    s.setValue("Native/sshpassPath", QString::fromStdString(transport.sshpassPath));
}
