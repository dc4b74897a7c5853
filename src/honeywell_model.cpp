#include "honeywell_model.h"

#include <QJsonDocument>
#include <QJsonValue>

namespace phicore::honeywell {

namespace {

bool readNumber(const QJsonObject &obj, const QString &key, double *out)
{
    const QJsonValue value = obj.value(key);
    if (value.isDouble()) {
        *out = value.toDouble();
        return true;
    }
    if (value.isString()) {
        bool ok = false;
        const double parsed = value.toString().trimmed().toDouble(&ok);
        if (ok) {
            *out = parsed;
            return true;
        }
    }
    return false;
}

bool readFlag(const QJsonObject &obj, const QString &key, bool fallback)
{
    const QJsonValue value = obj.value(key);
    if (value.isBool())
        return value.toBool();
    if (value.isDouble())
        return value.toInt() != 0;
    return fallback;
}

QString readId(const QJsonValue &value)
{
    if (value.isDouble())
        return QString::number(static_cast<qint64>(value.toDouble()));
    return value.toString().trimmed();
}

SystemMode systemModeFromSwitchPosition(int position)
{
    switch (position) {
    case 0:
        return SystemMode::EmergencyHeat;
    case 1:
        return SystemMode::Heat;
    case 2:
        return SystemMode::Off;
    case 3:
        return SystemMode::Cool;
    case 4:
    case 5:
        return SystemMode::Auto;
    default:
        return SystemMode::Unknown;
    }
}

int switchPositionFromSystemMode(SystemMode mode)
{
    switch (mode) {
    case SystemMode::EmergencyHeat:
        return 0;
    case SystemMode::Heat:
        return 1;
    case SystemMode::Off:
        return 2;
    case SystemMode::Cool:
        return 3;
    case SystemMode::Auto:
        return 4;
    case SystemMode::Unknown:
        break;
    }
    return 2;
}

FanMode fanModeFromIndex(int index)
{
    switch (index) {
    case 0:
        return FanMode::Auto;
    case 1:
        return FanMode::On;
    case 2:
        return FanMode::Circulate;
    case 3:
        return FanMode::FollowSchedule;
    default:
        return FanMode::Unknown;
    }
}

int indexFromFanMode(FanMode mode)
{
    switch (mode) {
    case FanMode::On:
        return 1;
    case FanMode::Circulate:
        return 2;
    case FanMode::FollowSchedule:
        return 3;
    case FanMode::Auto:
    case FanMode::Unknown:
        break;
    }
    return 0;
}

HoldStatus holdFromIndex(int index)
{
    if (index == 1)
        return HoldStatus::Temporary;
    if (index == 2)
        return HoldStatus::Permanent;
    return HoldStatus::Schedule;
}

int indexFromHold(HoldStatus hold)
{
    switch (hold) {
    case HoldStatus::Temporary:
        return 1;
    case HoldStatus::Permanent:
        return 2;
    case HoldStatus::Schedule:
        break;
    }
    return 0;
}

void readLimit(const QJsonObject &obj, const QString &key, int *out)
{
    double value = 0.0;
    if (readNumber(obj, key, &value))
        *out = static_cast<int>(value);
}

HumidityControlMode humidityModeFromIndex(int index)
{
    return index == 0 ? HumidityControlMode::Off : HumidityControlMode::Auto;
}

int indexFromHumidityMode(HumidityControlMode mode)
{
    return mode == HumidityControlMode::Off ? 0 : 1;
}

QJsonValue optionalValue(const std::optional<double> &value)
{
    return value.has_value() ? QJsonValue(*value) : QJsonValue(QJsonValue::Null);
}

QJsonValue optionalValue(const std::optional<int> &value)
{
    return value.has_value() ? QJsonValue(*value) : QJsonValue(QJsonValue::Null);
}

} // namespace

bool ControlChange::isEmpty() const
{
    return !systemMode && !heatSetpoint && !coolSetpoint && !heatHold && !coolHold
        && !heatNextPeriod && !coolNextPeriod && !fanMode && !humidifierSetpoint && !humidifierMode
        && !dehumidifierSetpoint && !dehumidifierMode;
}

bool parseThermostatState(const QJsonObject &checkDataSession, ThermostatState *out, QString *error)
{
    auto fail = [error](const QString &message) {
        if (error)
            *error = message;
        return false;
    };

    if (!out)
        return fail(QStringLiteral("Output state is null"));

    if (checkDataSession.contains(QStringLiteral("success"))
        && !readFlag(checkDataSession, QStringLiteral("success"), false)) {
        return fail(QStringLiteral("Portal reported an unsuccessful data session"));
    }

    const QJsonObject latest = checkDataSession.value(QStringLiteral("latestData")).toObject();
    const QJsonObject ui = latest.value(QStringLiteral("uiData")).toObject();
    if (ui.isEmpty())
        return fail(QStringLiteral("Response has no uiData"));

    ThermostatState state;
    state.name = out->name;
    state.rawUiData = ui;
    state.rawFanData = latest.value(QStringLiteral("fanData")).toObject();
    state.rawDrData = latest.value(QStringLiteral("drData")).toObject();
    state.rawHumData = latest.value(QStringLiteral("humData")).toObject();

    const QString units = ui.value(QStringLiteral("DisplayUnits")).toString().trimmed().toUpper();
    if (!units.isEmpty())
        state.displayUnits = units;

    state.hasIndoorTemperature = readNumber(ui, QStringLiteral("DispTemperature"), &state.indoorTemperature);

    if (readFlag(ui, QStringLiteral("IndoorHumiditySensorAvailable"), false)
        && readFlag(ui, QStringLiteral("IndoorHumiditySensorNotFault"), true)) {
        state.hasIndoorHumidity = readNumber(ui, QStringLiteral("IndoorHumidity"), &state.indoorHumidity);
    }
    if (readFlag(ui, QStringLiteral("OutdoorTemperatureAvailable"), false))
        state.hasOutdoorTemperature = readNumber(ui, QStringLiteral("OutdoorTemperature"), &state.outdoorTemperature);
    if (readFlag(ui, QStringLiteral("OutdoorHumidityAvailable"), false))
        state.hasOutdoorHumidity = readNumber(ui, QStringLiteral("OutdoorHumidity"), &state.outdoorHumidity);

    readNumber(ui, QStringLiteral("HeatSetpoint"), &state.heatSetpoint);
    readNumber(ui, QStringLiteral("CoolSetpoint"), &state.coolSetpoint);
    readNumber(ui, QStringLiteral("HeatLowerSetptLimit"), &state.heatLowerLimit);
    readNumber(ui, QStringLiteral("HeatUpperSetptLimit"), &state.heatUpperLimit);
    readNumber(ui, QStringLiteral("CoolLowerSetptLimit"), &state.coolLowerLimit);
    readNumber(ui, QStringLiteral("CoolUpperSetptLimit"), &state.coolUpperLimit);

    state.systemMode = systemModeFromSwitchPosition(ui.value(QStringLiteral("SystemSwitchPosition")).toInt(-1));
    state.heatHold = holdFromIndex(ui.value(QStringLiteral("StatusHeat")).toInt(0));
    state.coolHold = holdFromIndex(ui.value(QStringLiteral("StatusCool")).toInt(0));

    switch (ui.value(QStringLiteral("EquipmentOutputStatus")).toInt(0)) {
    case 1:
        state.equipment = EquipmentStatus::Heating;
        break;
    case 2:
        state.equipment = EquipmentStatus::Cooling;
        break;
    default:
        state.equipment = EquipmentStatus::Off;
        break;
    }

    state.hasFan = readFlag(latest, QStringLiteral("hasFan"), !state.rawFanData.isEmpty());
    if (!state.rawFanData.isEmpty()) {
        state.fanMode = fanModeFromIndex(state.rawFanData.value(QStringLiteral("fanMode")).toInt(-1));
        state.fanRunning = readFlag(state.rawFanData, QStringLiteral("fanIsRunning"), false);
    }

    const QJsonObject &hum = state.rawHumData;
    state.hasHumidifier = readFlag(latest,
                                   QStringLiteral("hasHumidifier"),
                                   hum.contains(QStringLiteral("HumidifierSetPoint")));
    if (state.hasHumidifier) {
        readLimit(hum, QStringLiteral("HumidifierSetPoint"), &state.humidifierSetpoint);
        readLimit(hum, QStringLiteral("HumidifierLowerLimit"), &state.humidifierLowerLimit);
        readLimit(hum, QStringLiteral("HumidifierUpperLimit"), &state.humidifierUpperLimit);
        state.humidifierMode = humidityModeFromIndex(hum.value(QStringLiteral("HumidifierMode")).toInt(0));
    }
    state.hasDehumidifier = readFlag(latest,
                                     QStringLiteral("hasDehumidifier"),
                                     hum.contains(QStringLiteral("DehumidifierSetPoint")));
    if (state.hasDehumidifier) {
        readLimit(hum, QStringLiteral("DehumidifierSetPoint"), &state.dehumidifierSetpoint);
        readLimit(hum, QStringLiteral("DehumidifierLowerLimit"), &state.dehumidifierLowerLimit);
        readLimit(hum, QStringLiteral("DehumidifierUpperLimit"), &state.dehumidifierUpperLimit);
        state.dehumidifierMode = humidityModeFromIndex(hum.value(QStringLiteral("DehumidifierMode")).toInt(0));
    }

    state.deviceLive = readFlag(checkDataSession, QStringLiteral("deviceLive"), true);
    state.communicationLost = readFlag(checkDataSession, QStringLiteral("communicationLost"), false);

    *out = state;
    if (error)
        error->clear();
    return true;
}

QList<DiscoveredDevice> parseLocationList(const QJsonArray &locations)
{
    QList<DiscoveredDevice> devices;
    for (const QJsonValue &locationValue : locations) {
        if (!locationValue.isObject())
            continue;
        const QJsonObject location = locationValue.toObject();
        const QString locationId = readId(location.value(QStringLiteral("LocationID")));

        const QJsonArray deviceArr = location.value(QStringLiteral("Devices")).toArray();
        for (const QJsonValue &deviceValue : deviceArr) {
            if (!deviceValue.isObject())
                continue;
            const QJsonObject deviceObj = deviceValue.toObject();
            const QString deviceId = readId(deviceObj.value(QStringLiteral("DeviceID")));
            if (deviceId.isEmpty())
                continue;

            DiscoveredDevice device;
            device.deviceId = deviceId;
            device.locationId = locationId;
            device.name = deviceObj.value(QStringLiteral("Name")).toString().trimmed();
            if (device.name.isEmpty())
                device.name = QStringLiteral("Thermostat %1").arg(deviceId);
            device.state.name = device.name;
            devices.append(device);
        }
    }
    return devices;
}

QByteArray buildControlPayload(const QString &deviceId, const ControlChange &change)
{
    QJsonObject body;

    bool numericId = false;
    const qint64 id = deviceId.toLongLong(&numericId);
    body.insert(QStringLiteral("DeviceID"), numericId ? QJsonValue(id) : QJsonValue(deviceId));

    body.insert(QStringLiteral("SystemSwitch"),
                change.systemMode ? QJsonValue(switchPositionFromSystemMode(*change.systemMode))
                                  : QJsonValue(QJsonValue::Null));
    body.insert(QStringLiteral("HeatSetpoint"), optionalValue(change.heatSetpoint));
    body.insert(QStringLiteral("CoolSetpoint"), optionalValue(change.coolSetpoint));
    body.insert(QStringLiteral("HeatNextPeriod"), optionalValue(change.heatNextPeriod));
    body.insert(QStringLiteral("CoolNextPeriod"), optionalValue(change.coolNextPeriod));
    body.insert(QStringLiteral("StatusHeat"),
                change.heatHold ? QJsonValue(indexFromHold(*change.heatHold)) : QJsonValue(QJsonValue::Null));
    body.insert(QStringLiteral("StatusCool"),
                change.coolHold ? QJsonValue(indexFromHold(*change.coolHold)) : QJsonValue(QJsonValue::Null));
    body.insert(QStringLiteral("FanMode"),
                change.fanMode ? QJsonValue(indexFromFanMode(*change.fanMode)) : QJsonValue(QJsonValue::Null));

    // Humidity fields are only sent when written; thermostats without a
    // humidifier reject them.
    if (change.humidifierSetpoint)
        body.insert(QStringLiteral("HumidifierSetpoint"), *change.humidifierSetpoint);
    if (change.humidifierMode)
        body.insert(QStringLiteral("HumidifierMode"), indexFromHumidityMode(*change.humidifierMode));
    if (change.dehumidifierSetpoint)
        body.insert(QStringLiteral("DehumidifierSetpoint"), *change.dehumidifierSetpoint);
    if (change.dehumidifierMode)
        body.insert(QStringLiteral("DehumidifierMode"), indexFromHumidityMode(*change.dehumidifierMode));

    return QJsonDocument(body).toJson(QJsonDocument::Compact);
}

QString systemModeName(SystemMode mode)
{
    switch (mode) {
    case SystemMode::EmergencyHeat:
        return QStringLiteral("emheat");
    case SystemMode::Heat:
        return QStringLiteral("heat");
    case SystemMode::Off:
        return QStringLiteral("off");
    case SystemMode::Cool:
        return QStringLiteral("cool");
    case SystemMode::Auto:
        return QStringLiteral("auto");
    case SystemMode::Unknown:
        break;
    }
    return QStringLiteral("unknown");
}

std::optional<SystemMode> systemModeFromName(const QString &name)
{
    const QString key = name.trimmed().toLower();
    if (key == QLatin1String("emheat"))
        return SystemMode::EmergencyHeat;
    if (key == QLatin1String("heat"))
        return SystemMode::Heat;
    if (key == QLatin1String("off"))
        return SystemMode::Off;
    if (key == QLatin1String("cool"))
        return SystemMode::Cool;
    if (key == QLatin1String("auto") || key == QLatin1String("heat_cool"))
        return SystemMode::Auto;
    return std::nullopt;
}

QString fanModeName(FanMode mode)
{
    switch (mode) {
    case FanMode::Auto:
        return QStringLiteral("auto");
    case FanMode::On:
        return QStringLiteral("on");
    case FanMode::Circulate:
        return QStringLiteral("circulate");
    case FanMode::FollowSchedule:
        return QStringLiteral("follow schedule");
    case FanMode::Unknown:
        break;
    }
    return QStringLiteral("unknown");
}

std::optional<FanMode> fanModeFromName(const QString &name)
{
    const QString key = name.trimmed().toLower();
    if (key == QLatin1String("auto"))
        return FanMode::Auto;
    if (key == QLatin1String("on"))
        return FanMode::On;
    if (key == QLatin1String("circulate"))
        return FanMode::Circulate;
    if (key == QLatin1String("follow schedule") || key == QLatin1String("follow_schedule"))
        return FanMode::FollowSchedule;
    return std::nullopt;
}

QString holdStatusName(HoldStatus hold)
{
    switch (hold) {
    case HoldStatus::Temporary:
        return QStringLiteral("temporary");
    case HoldStatus::Permanent:
        return QStringLiteral("permanent");
    case HoldStatus::Schedule:
        break;
    }
    return QStringLiteral("schedule");
}

std::optional<HoldStatus> holdStatusFromName(const QString &name)
{
    const QString key = name.trimmed().toLower();
    if (key == QLatin1String("schedule") || key == QLatin1String("none"))
        return HoldStatus::Schedule;
    if (key == QLatin1String("temporary"))
        return HoldStatus::Temporary;
    if (key == QLatin1String("permanent"))
        return HoldStatus::Permanent;
    return std::nullopt;
}

QString equipmentStatusName(EquipmentStatus status)
{
    switch (status) {
    case EquipmentStatus::Heating:
        return QStringLiteral("heating");
    case EquipmentStatus::Cooling:
        return QStringLiteral("cooling");
    case EquipmentStatus::Off:
        break;
    }
    return QStringLiteral("off");
}

QString humidityControlModeName(HumidityControlMode mode)
{
    return mode == HumidityControlMode::Auto ? QStringLiteral("auto") : QStringLiteral("off");
}

std::optional<HumidityControlMode> humidityControlModeFromName(const QString &name)
{
    const QString key = name.trimmed().toLower();
    if (key == QLatin1String("off"))
        return HumidityControlMode::Off;
    if (key == QLatin1String("auto") || key == QLatin1String("on"))
        return HumidityControlMode::Auto;
    return std::nullopt;
}

} // namespace phicore::honeywell
