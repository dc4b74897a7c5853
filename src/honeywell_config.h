#pragma once

#include <QHash>
#include <QJsonObject>
#include <QString>
#include <QUrl>

#include "honeywell_control.h"
#include "honeywell_coordinator.h"

namespace phicore::honeywell {

struct DeviceOverride {
    QString name;
    double awayTemperatureHeat = 0.0;
    double awayTemperatureCool = 0.0;
};

// Installation options carried in the adapter's bootstrap metaJson.
struct InstallationConfig {
    QString username;
    QString password;
    QUrl baseUrl;

    int pollIntervalSeconds = 60;
    int refreshTimeoutSeconds = 30;
    double awayTemperatureHeat = 61.0;
    double awayTemperatureCool = 88.0;

    // Keyed by device id. Overrides fall back to the installation-wide away
    // temperatures.
    QHash<QString, DeviceOverride> devices;

    QString displayName(const QString &deviceId, const QString &reportedName) const;
    AwayTemperatures awayFor(const QString &deviceId) const;

    CoordinatorSettings toCoordinatorSettings() const;
};

// Parses and clamps the installation options. Returns false with an error if
// credentials are missing; unknown keys are ignored.
bool parseInstallationConfig(const QJsonObject &meta, InstallationConfig *out, QString *error = nullptr);

} // namespace phicore::honeywell
