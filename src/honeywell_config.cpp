#include "honeywell_config.h"

#include <algorithm>

#include "honeywell_tcc_session.h"

namespace phicore::honeywell {

namespace {

int readInt(const QJsonObject &obj, const QString &key, int fallback)
{
    if (!obj.contains(key))
        return fallback;
    bool ok = false;
    const int value = obj.value(key).toVariant().toInt(&ok);
    return ok ? value : fallback;
}

double readDouble(const QJsonObject &obj, const QString &key, double fallback)
{
    if (!obj.contains(key))
        return fallback;
    bool ok = false;
    const double value = obj.value(key).toVariant().toDouble(&ok);
    return ok ? value : fallback;
}

} // namespace

QString InstallationConfig::displayName(const QString &deviceId, const QString &reportedName) const
{
    const auto it = devices.constFind(deviceId);
    if (it != devices.cend() && !it->name.isEmpty())
        return it->name;
    return reportedName;
}

AwayTemperatures InstallationConfig::awayFor(const QString &deviceId) const
{
    AwayTemperatures away;
    away.heat = awayTemperatureHeat;
    away.cool = awayTemperatureCool;

    const auto it = devices.constFind(deviceId);
    if (it == devices.cend())
        return away;
    if (it->awayTemperatureHeat > 0.0)
        away.heat = it->awayTemperatureHeat;
    if (it->awayTemperatureCool > 0.0)
        away.cool = it->awayTemperatureCool;
    return away;
}

CoordinatorSettings InstallationConfig::toCoordinatorSettings() const
{
    CoordinatorSettings settings;
    settings.pollIntervalMs = pollIntervalSeconds * 1000;
    settings.refreshTimeoutMs = refreshTimeoutSeconds * 1000;
    settings.discoveryTimeoutMs = std::max(settings.refreshTimeoutMs, settings.login.loginTimeoutMs);
    return settings;
}

bool parseInstallationConfig(const QJsonObject &meta, InstallationConfig *out, QString *error)
{
    if (!out) {
        if (error)
            *error = QStringLiteral("Output config is null");
        return false;
    }

    InstallationConfig config;
    config.username = meta.value(QStringLiteral("username")).toString().trimmed();
    config.password = meta.value(QStringLiteral("password")).toString();

    const QString baseUrl = meta.value(QStringLiteral("baseUrl")).toString().trimmed();
    config.baseUrl = QUrl(baseUrl.isEmpty() ? QString::fromLatin1(kDefaultPortalUrl) : baseUrl);
    if (!config.baseUrl.isValid() || config.baseUrl.host().isEmpty()) {
        if (error)
            *error = QStringLiteral("Portal URL is invalid: %1").arg(baseUrl);
        return false;
    }

    config.pollIntervalSeconds = std::clamp(readInt(meta, QStringLiteral("pollIntervalSeconds"), 60), 10, 3600);
    config.refreshTimeoutSeconds = std::clamp(readInt(meta, QStringLiteral("refreshTimeoutSeconds"), 30), 5, 120);
    config.awayTemperatureHeat = readDouble(meta, QStringLiteral("awayTemperatureHeat"), 61.0);
    config.awayTemperatureCool = readDouble(meta, QStringLiteral("awayTemperatureCool"), 88.0);

    const QJsonObject devices = meta.value(QStringLiteral("devices")).toObject();
    for (auto it = devices.constBegin(); it != devices.constEnd(); ++it) {
        const QJsonObject entry = it.value().toObject();
        DeviceOverride device;
        device.name = entry.value(QStringLiteral("name")).toString().trimmed();
        device.awayTemperatureHeat = readDouble(entry, QStringLiteral("awayTemperatureHeat"), 0.0);
        device.awayTemperatureCool = readDouble(entry, QStringLiteral("awayTemperatureCool"), 0.0);
        config.devices.insert(it.key(), device);
    }

    if (config.username.isEmpty()) {
        if (error)
            *error = QStringLiteral("Username missing");
        return false;
    }
    if (config.password.isEmpty()) {
        if (error)
            *error = QStringLiteral("Password missing");
        return false;
    }

    *out = config;
    if (error)
        error->clear();
    return true;
}

} // namespace phicore::honeywell
