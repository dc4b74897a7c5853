#include <gtest/gtest.h>

#include <QJsonDocument>

#include "honeywell_model.h"

namespace phicore::honeywell {
namespace {

QJsonObject parseObject(const char *json)
{
    return QJsonDocument::fromJson(QByteArray(json)).object();
}

QJsonArray parseArray(const char *json)
{
    return QJsonDocument::fromJson(QByteArray(json)).array();
}

const char kCheckDataSession[] = R"({
    "success": true,
    "deviceLive": true,
    "communicationLost": false,
    "latestData": {
        "uiData": {
            "DisplayUnits": "F",
            "DispTemperature": 71.5,
            "IndoorHumiditySensorAvailable": true,
            "IndoorHumiditySensorNotFault": true,
            "IndoorHumidity": 42,
            "OutdoorTemperatureAvailable": true,
            "OutdoorTemperature": "55",
            "OutdoorHumidityAvailable": false,
            "OutdoorHumidity": 80,
            "HeatSetpoint": 68,
            "CoolSetpoint": 76,
            "HeatLowerSetptLimit": 40,
            "HeatUpperSetptLimit": 90,
            "CoolLowerSetptLimit": 50,
            "CoolUpperSetptLimit": 99,
            "SystemSwitchPosition": 1,
            "StatusHeat": 2,
            "StatusCool": 0,
            "EquipmentOutputStatus": 1,
            "HeatNextPeriod": 66
        },
        "hasFan": true,
        "fanData": {
            "fanMode": 2,
            "fanIsRunning": true
        }
    }
})";

TEST(ModelTest, ParsesCheckDataSession)
{
    ThermostatState state;
    state.name = QStringLiteral("Hallway");
    QString error;
    ASSERT_TRUE(parseThermostatState(parseObject(kCheckDataSession), &state, &error)) << error.toStdString();

    EXPECT_EQ(state.name, QStringLiteral("Hallway"));
    EXPECT_EQ(state.displayUnits, QStringLiteral("F"));
    EXPECT_TRUE(state.hasIndoorTemperature);
    EXPECT_DOUBLE_EQ(state.indoorTemperature, 71.5);
    EXPECT_TRUE(state.hasIndoorHumidity);
    EXPECT_DOUBLE_EQ(state.indoorHumidity, 42.0);
    EXPECT_TRUE(state.hasOutdoorTemperature);
    EXPECT_DOUBLE_EQ(state.outdoorTemperature, 55.0);
    EXPECT_FALSE(state.hasOutdoorHumidity);

    EXPECT_DOUBLE_EQ(state.heatSetpoint, 68.0);
    EXPECT_DOUBLE_EQ(state.coolSetpoint, 76.0);
    EXPECT_EQ(state.systemMode, SystemMode::Heat);
    EXPECT_EQ(state.heatHold, HoldStatus::Permanent);
    EXPECT_EQ(state.coolHold, HoldStatus::Schedule);
    EXPECT_EQ(state.equipment, EquipmentStatus::Heating);

    EXPECT_TRUE(state.hasFan);
    EXPECT_EQ(state.fanMode, FanMode::Circulate);
    EXPECT_TRUE(state.fanRunning);
    EXPECT_TRUE(state.deviceLive);
    EXPECT_FALSE(state.communicationLost);
    EXPECT_EQ(state.rawUiData.value(QStringLiteral("HeatNextPeriod")).toInt(), 66);
}

TEST(ModelTest, RejectsMissingUiData)
{
    ThermostatState state;
    state.indoorTemperature = 12.0;
    QString error;
    EXPECT_FALSE(parseThermostatState(parseObject(R"({"latestData": {}})"), &state, &error));
    EXPECT_FALSE(error.isEmpty());
    EXPECT_DOUBLE_EQ(state.indoorTemperature, 12.0);
}

TEST(ModelTest, RejectsUnsuccessfulSession)
{
    ThermostatState state;
    EXPECT_FALSE(parseThermostatState(
        parseObject(R"({"success": false, "latestData": {"uiData": {"DispTemperature": 70}}})"), &state));
}

TEST(ModelTest, SwitchPositionFiveIsAuto)
{
    ThermostatState state;
    ASSERT_TRUE(parseThermostatState(
        parseObject(R"({"latestData": {"uiData": {"DispTemperature": 20, "DisplayUnits": "c",
                                                  "SystemSwitchPosition": 5}}})"),
        &state));
    EXPECT_EQ(state.systemMode, SystemMode::Auto);
    EXPECT_EQ(state.displayUnits, QStringLiteral("C"));
    EXPECT_FALSE(state.hasFan);
}

TEST(ModelTest, ParsesHumidityControl)
{
    ThermostatState state;
    ASSERT_TRUE(parseThermostatState(parseObject(R"({"latestData": {
        "uiData": {"DispTemperature": 70},
        "hasHumidifier": true,
        "hasDehumidifier": false,
        "humData": {
            "HumidifierSetPoint": 35,
            "HumidifierLowerLimit": 10,
            "HumidifierUpperLimit": 55,
            "HumidifierMode": 1,
            "DehumidifierSetPoint": 50
        }
    }})"),
                                     &state));

    EXPECT_TRUE(state.hasHumidifier);
    EXPECT_EQ(state.humidifierSetpoint, 35);
    EXPECT_EQ(state.humidifierLowerLimit, 10);
    EXPECT_EQ(state.humidifierUpperLimit, 55);
    EXPECT_EQ(state.humidifierMode, HumidityControlMode::Auto);
    EXPECT_FALSE(state.hasDehumidifier);
    EXPECT_EQ(state.dehumidifierSetpoint, 0);
}

TEST(ModelTest, HumidityControlFollowsHumData)
{
    ThermostatState state;
    ASSERT_TRUE(parseThermostatState(parseObject(R"({"latestData": {
        "uiData": {"DispTemperature": 70},
        "humData": {"DehumidifierSetPoint": 60, "DehumidifierMode": 0}
    }})"),
                                     &state));
    EXPECT_FALSE(state.hasHumidifier);
    EXPECT_TRUE(state.hasDehumidifier);
    EXPECT_EQ(state.dehumidifierSetpoint, 60);
    EXPECT_EQ(state.dehumidifierMode, HumidityControlMode::Off);
    EXPECT_EQ(state.dehumidifierLowerLimit, 40);
    EXPECT_EQ(state.dehumidifierUpperLimit, 85);
}

TEST(ModelTest, ParsesLocationList)
{
    const QList<DiscoveredDevice> devices = parseLocationList(parseArray(R"([
        {"LocationID": 100, "Devices": [
            {"DeviceID": 1234, "Name": " Upstairs "},
            {"DeviceID": 5678, "Name": ""},
            {"Name": "No id"}
        ]},
        {"LocationID": "200", "Devices": [{"DeviceID": "9"}]},
        "garbage"
    ])"));

    ASSERT_EQ(devices.size(), 3);
    EXPECT_EQ(devices.at(0).deviceId, QStringLiteral("1234"));
    EXPECT_EQ(devices.at(0).name, QStringLiteral("Upstairs"));
    EXPECT_EQ(devices.at(0).locationId, QStringLiteral("100"));
    EXPECT_EQ(devices.at(1).name, QStringLiteral("Thermostat 5678"));
    EXPECT_EQ(devices.at(2).deviceId, QStringLiteral("9"));
    EXPECT_EQ(devices.at(2).locationId, QStringLiteral("200"));
}

TEST(ModelTest, ControlPayloadSendsNullForUnchangedFields)
{
    ControlChange change;
    change.heatSetpoint = 70.0;
    change.heatHold = HoldStatus::Temporary;
    change.heatNextPeriod = 66;

    const QJsonObject body = QJsonDocument::fromJson(buildControlPayload(QStringLiteral("1234"), change)).object();
    EXPECT_EQ(body.value(QStringLiteral("DeviceID")).toInteger(), 1234);
    EXPECT_DOUBLE_EQ(body.value(QStringLiteral("HeatSetpoint")).toDouble(), 70.0);
    EXPECT_EQ(body.value(QStringLiteral("StatusHeat")).toInt(), 1);
    EXPECT_EQ(body.value(QStringLiteral("HeatNextPeriod")).toInt(), 66);
    EXPECT_TRUE(body.value(QStringLiteral("CoolSetpoint")).isNull());
    EXPECT_TRUE(body.value(QStringLiteral("StatusCool")).isNull());
    EXPECT_TRUE(body.value(QStringLiteral("SystemSwitch")).isNull());
    EXPECT_TRUE(body.value(QStringLiteral("FanMode")).isNull());
}

TEST(ModelTest, ControlPayloadEncodesModes)
{
    ControlChange change;
    change.systemMode = SystemMode::Cool;
    change.fanMode = FanMode::On;
    EXPECT_FALSE(change.isEmpty());

    const QJsonObject body = QJsonDocument::fromJson(buildControlPayload(QStringLiteral("abc"), change)).object();
    EXPECT_EQ(body.value(QStringLiteral("DeviceID")).toString(), QStringLiteral("abc"));
    EXPECT_EQ(body.value(QStringLiteral("SystemSwitch")).toInt(), 3);
    EXPECT_EQ(body.value(QStringLiteral("FanMode")).toInt(), 1);
    EXPECT_TRUE(ControlChange().isEmpty());
}

TEST(ModelTest, ControlPayloadOmitsUnchangedHumidity)
{
    ControlChange heat;
    heat.heatSetpoint = 70.0;
    const QJsonObject plain = QJsonDocument::fromJson(buildControlPayload(QStringLiteral("1"), heat)).object();
    EXPECT_FALSE(plain.contains(QStringLiteral("HumidifierSetpoint")));
    EXPECT_FALSE(plain.contains(QStringLiteral("DehumidifierMode")));

    ControlChange humidity;
    humidity.humidifierSetpoint = 40;
    humidity.dehumidifierMode = HumidityControlMode::Auto;
    EXPECT_FALSE(humidity.isEmpty());
    const QJsonObject body = QJsonDocument::fromJson(buildControlPayload(QStringLiteral("1"), humidity)).object();
    EXPECT_EQ(body.value(QStringLiteral("HumidifierSetpoint")).toInt(), 40);
    EXPECT_EQ(body.value(QStringLiteral("DehumidifierMode")).toInt(), 1);
    EXPECT_FALSE(body.contains(QStringLiteral("HumidifierMode")));
    EXPECT_TRUE(body.value(QStringLiteral("HeatSetpoint")).isNull());
}

TEST(ModelTest, ModeNamesRoundTrip)
{
    for (SystemMode mode : {SystemMode::EmergencyHeat, SystemMode::Heat, SystemMode::Off, SystemMode::Cool,
                            SystemMode::Auto}) {
        EXPECT_EQ(systemModeFromName(systemModeName(mode)), mode);
    }
    EXPECT_EQ(systemModeFromName(QStringLiteral(" Heat_Cool ")), SystemMode::Auto);
    EXPECT_FALSE(systemModeFromName(QStringLiteral("dry")).has_value());
    EXPECT_EQ(fanModeFromName(QStringLiteral("follow_schedule")), FanMode::FollowSchedule);
    EXPECT_EQ(holdStatusFromName(QStringLiteral("none")), HoldStatus::Schedule);
    EXPECT_FALSE(holdStatusFromName(QStringLiteral("vacation")).has_value());
    EXPECT_EQ(humidityControlModeFromName(QStringLiteral("on")), HumidityControlMode::Auto);
    EXPECT_EQ(humidityControlModeFromName(humidityControlModeName(HumidityControlMode::Off)),
              HumidityControlMode::Off);
}

} // namespace
} // namespace phicore::honeywell
