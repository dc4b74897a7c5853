#pragma once

#include <optional>

#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>
#include <QList>
#include <QString>

namespace phicore::honeywell {

enum class SystemMode {
    Unknown,
    EmergencyHeat,
    Heat,
    Off,
    Cool,
    Auto
};

enum class FanMode {
    Unknown,
    Auto,
    On,
    Circulate,
    FollowSchedule
};

enum class HoldStatus {
    Schedule,
    Temporary,
    Permanent
};

// Humidifier and dehumidifier run either off or on automatic control.
enum class HumidityControlMode {
    Off,
    Auto
};

enum class EquipmentStatus {
    Off,
    Heating,
    Cooling
};

// Thermostat state as reported by one CheckDataSession call. Values are kept
// in the device's own display units.
struct ThermostatState {
    QString name;
    QString displayUnits = QStringLiteral("F");

    bool hasIndoorTemperature = false;
    double indoorTemperature = 0.0;
    bool hasIndoorHumidity = false;
    double indoorHumidity = 0.0;
    bool hasOutdoorTemperature = false;
    double outdoorTemperature = 0.0;
    bool hasOutdoorHumidity = false;
    double outdoorHumidity = 0.0;

    double heatSetpoint = 0.0;
    double coolSetpoint = 0.0;
    double heatLowerLimit = 40.0;
    double heatUpperLimit = 90.0;
    double coolLowerLimit = 50.0;
    double coolUpperLimit = 99.0;

    SystemMode systemMode = SystemMode::Unknown;
    HoldStatus heatHold = HoldStatus::Schedule;
    HoldStatus coolHold = HoldStatus::Schedule;
    EquipmentStatus equipment = EquipmentStatus::Off;

    bool hasFan = false;
    FanMode fanMode = FanMode::Unknown;
    bool fanRunning = false;

    bool hasHumidifier = false;
    int humidifierSetpoint = 0;
    int humidifierLowerLimit = 10;
    int humidifierUpperLimit = 60;
    HumidityControlMode humidifierMode = HumidityControlMode::Off;

    bool hasDehumidifier = false;
    int dehumidifierSetpoint = 0;
    int dehumidifierLowerLimit = 40;
    int dehumidifierUpperLimit = 85;
    HumidityControlMode dehumidifierMode = HumidityControlMode::Off;

    bool deviceLive = true;
    bool communicationLost = false;

    QJsonObject rawUiData;
    QJsonObject rawFanData;
    QJsonObject rawDrData;
    QJsonObject rawHumData;
};

struct DiscoveredDevice {
    QString deviceId;
    QString name;
    QString locationId;
    ThermostatState state;
};

// Fields left unset are sent as null, which the portal treats as "unchanged".
struct ControlChange {
    std::optional<SystemMode> systemMode;
    std::optional<double> heatSetpoint;
    std::optional<double> coolSetpoint;
    std::optional<HoldStatus> heatHold;
    std::optional<HoldStatus> coolHold;
    std::optional<int> heatNextPeriod;
    std::optional<int> coolNextPeriod;
    std::optional<FanMode> fanMode;
    std::optional<int> humidifierSetpoint;
    std::optional<HumidityControlMode> humidifierMode;
    std::optional<int> dehumidifierSetpoint;
    std::optional<HumidityControlMode> dehumidifierMode;

    bool isEmpty() const;
};

bool parseThermostatState(const QJsonObject &checkDataSession, ThermostatState *out, QString *error = nullptr);
QList<DiscoveredDevice> parseLocationList(const QJsonArray &locations);

QByteArray buildControlPayload(const QString &deviceId, const ControlChange &change);

QString systemModeName(SystemMode mode);
std::optional<SystemMode> systemModeFromName(const QString &name);
QString fanModeName(FanMode mode);
std::optional<FanMode> fanModeFromName(const QString &name);
QString holdStatusName(HoldStatus hold);
std::optional<HoldStatus> holdStatusFromName(const QString &name);
QString equipmentStatusName(EquipmentStatus status);
QString humidityControlModeName(HumidityControlMode mode);
std::optional<HumidityControlMode> humidityControlModeFromName(const QString &name);

} // namespace phicore::honeywell
