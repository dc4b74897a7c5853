#include "honeywell_channels.h"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>

#include "honeywell_control.h"
#include "honeywell_model.h"

namespace phicore::honeywell::ipc {

namespace {

namespace v1 = phicore::adapter::v1;

v1::Channel makeTemperatureChannel(const char *externalId,
                                   const char *name,
                                   const QString &units,
                                   std::optional<double> value)
{
    v1::Channel channel;
    channel.externalId = externalId;
    channel.name = name;
    channel.kind = v1::ChannelKind::Temperature;
    channel.dataType = v1::ChannelDataType::Float;
    channel.flags = v1::kChannelFlagDefaultRead;
    channel.unit = units.toStdString();
    if (value.has_value()) {
        channel.hasValue = true;
        channel.lastValue = *value;
    }
    return channel;
}

v1::Channel makeHumidityChannel(const char *externalId, const char *name, std::optional<double> value)
{
    v1::Channel channel;
    channel.externalId = externalId;
    channel.name = name;
    channel.kind = v1::ChannelKind::Humidity;
    channel.dataType = v1::ChannelDataType::Float;
    channel.flags = v1::kChannelFlagDefaultRead;
    channel.unit = "%";
    channel.minValue = 0.0;
    channel.maxValue = 100.0;
    if (value.has_value()) {
        channel.hasValue = true;
        channel.lastValue = *value;
    }
    return channel;
}

v1::Channel makeSetpointChannel(const char *externalId,
                                const char *name,
                                const QString &units,
                                double value,
                                double minValue,
                                double maxValue)
{
    v1::Channel channel;
    channel.externalId = externalId;
    channel.name = name;
    channel.kind = v1::ChannelKind::Temperature;
    channel.dataType = v1::ChannelDataType::Float;
    channel.flags = v1::kChannelFlagDefaultWrite;
    channel.unit = units.toStdString();
    channel.minValue = minValue;
    channel.maxValue = maxValue;
    channel.stepValue = units == QLatin1String("C") ? 0.5 : 1.0;
    channel.hasValue = true;
    channel.lastValue = value;
    return channel;
}

v1::Channel makeChoiceChannel(const char *externalId,
                              const char *name,
                              bool writable,
                              const QStringList &choices,
                              const QString &value)
{
    v1::Channel channel;
    channel.externalId = externalId;
    channel.name = name;
    channel.kind = v1::ChannelKind::Unknown;
    channel.dataType = v1::ChannelDataType::Enum;
    channel.flags = writable ? v1::kChannelFlagDefaultWrite : v1::kChannelFlagDefaultRead;
    for (const QString &choice : choices) {
        v1::AdapterConfigOption option;
        option.value = choice.toStdString();
        option.label = choice.toStdString();
        channel.choices.push_back(std::move(option));
    }
    channel.hasValue = true;
    channel.lastValue = value.toStdString();
    return channel;
}

v1::Channel makeBoolChannel(const char *externalId, const char *name, bool writable, bool value)
{
    v1::Channel channel;
    channel.externalId = externalId;
    channel.name = name;
    channel.kind = v1::ChannelKind::Unknown;
    channel.dataType = v1::ChannelDataType::Bool;
    channel.flags = writable ? v1::kChannelFlagDefaultWrite : v1::kChannelFlagDefaultRead;
    channel.hasValue = true;
    channel.lastValue = value;
    return channel;
}

v1::Channel makeHumiditySetpointChannel(const char *externalId,
                                        const char *name,
                                        int value,
                                        int minValue,
                                        int maxValue)
{
    v1::Channel channel = makeHumidityChannel(externalId, name, static_cast<double>(value));
    channel.flags = v1::kChannelFlagDefaultWrite;
    channel.minValue = minValue;
    channel.maxValue = maxValue;
    channel.stepValue = 1.0;
    return channel;
}

std::optional<double> optionalReading(bool has, double value)
{
    if (!has)
        return std::nullopt;
    return value;
}

// Hold of the setpoint that drives the current mode; cool only in cool mode.
HoldStatus activeHold(const ThermostatState &state)
{
    if (state.systemMode == SystemMode::Cool)
        return state.coolHold;
    return state.heatHold;
}

} // namespace

DeviceEntry buildDeviceEntry(const DeviceSnapshot &snapshot, const InstallationConfig &config)
{
    const ThermostatState &state = snapshot.state;
    const QString units = state.displayUnits;

    DeviceEntry entry;
    entry.device.externalId = snapshot.deviceId.toStdString();
    entry.device.name = config.displayName(snapshot.deviceId, state.name).toStdString();
    entry.device.deviceClass = v1::DeviceClass::Unknown;
    entry.device.manufacturer = "Honeywell";
    entry.device.model = "Total Connect Comfort thermostat";

    QJsonObject meta;
    meta.insert(QStringLiteral("type"), QStringLiteral("thermostat"));
    meta.insert(QStringLiteral("displayUnits"), units);
    meta.insert(QStringLiteral("deviceLive"), state.deviceLive);
    meta.insert(QStringLiteral("communicationLost"), state.communicationLost);
    entry.device.metaJson = QJsonDocument(meta).toJson(QJsonDocument::Compact).toStdString();

    entry.channels.push_back(makeTemperatureChannel("temperature",
                                                    "Temperature",
                                                    units,
                                                    optionalReading(state.hasIndoorTemperature,
                                                                    state.indoorTemperature)));
    if (state.hasIndoorHumidity)
        entry.channels.push_back(makeHumidityChannel("humidity", "Humidity", state.indoorHumidity));
    if (state.hasOutdoorTemperature) {
        entry.channels.push_back(makeTemperatureChannel("outdoor_temperature",
                                                        "Outdoor temperature",
                                                        units,
                                                        state.outdoorTemperature));
    }
    if (state.hasOutdoorHumidity)
        entry.channels.push_back(makeHumidityChannel("outdoor_humidity", "Outdoor humidity", state.outdoorHumidity));

    entry.channels.push_back(makeSetpointChannel(kChannelHeatSetpoint,
                                                 "Heat setpoint",
                                                 units,
                                                 state.heatSetpoint,
                                                 state.heatLowerLimit,
                                                 state.heatUpperLimit));
    entry.channels.push_back(makeSetpointChannel(kChannelCoolSetpoint,
                                                 "Cool setpoint",
                                                 units,
                                                 state.coolSetpoint,
                                                 state.coolLowerLimit,
                                                 state.coolUpperLimit));

    entry.channels.push_back(makeChoiceChannel(kChannelSystemMode,
                                               "System mode",
                                               true,
                                               {QStringLiteral("emheat"),
                                                QStringLiteral("heat"),
                                                QStringLiteral("off"),
                                                QStringLiteral("cool"),
                                                QStringLiteral("auto")},
                                               systemModeName(state.systemMode)));
    entry.channels.push_back(makeChoiceChannel(kChannelHold,
                                               "Hold",
                                               true,
                                               {QStringLiteral("schedule"),
                                                QStringLiteral("temporary"),
                                                QStringLiteral("permanent")},
                                               holdStatusName(activeHold(state))));
    entry.channels.push_back(makeBoolChannel(kChannelAway,
                                             "Away",
                                             true,
                                             isAwayActive(state, config.awayFor(snapshot.deviceId))));
    entry.channels.push_back(makeChoiceChannel("equipment",
                                               "Equipment",
                                               false,
                                               {QStringLiteral("off"),
                                                QStringLiteral("heating"),
                                                QStringLiteral("cooling")},
                                               equipmentStatusName(state.equipment)));

    if (state.hasFan) {
        entry.channels.push_back(makeChoiceChannel(kChannelFanMode,
                                                   "Fan mode",
                                                   true,
                                                   {QStringLiteral("auto"),
                                                    QStringLiteral("on"),
                                                    QStringLiteral("circulate"),
                                                    QStringLiteral("follow schedule")},
                                                   fanModeName(state.fanMode)));
        entry.channels.push_back(makeBoolChannel("fan_running", "Fan running", false, state.fanRunning));
    }

    const QStringList humidityModes = {QStringLiteral("off"), QStringLiteral("auto")};
    if (state.hasHumidifier) {
        entry.channels.push_back(makeHumiditySetpointChannel(kChannelHumidifierSetpoint,
                                                             "Humidifier setpoint",
                                                             state.humidifierSetpoint,
                                                             state.humidifierLowerLimit,
                                                             state.humidifierUpperLimit));
        entry.channels.push_back(makeChoiceChannel(kChannelHumidifierMode,
                                                   "Humidifier mode",
                                                   true,
                                                   humidityModes,
                                                   humidityControlModeName(state.humidifierMode)));
    }
    if (state.hasDehumidifier) {
        entry.channels.push_back(makeHumiditySetpointChannel(kChannelDehumidifierSetpoint,
                                                             "Dehumidifier setpoint",
                                                             state.dehumidifierSetpoint,
                                                             state.dehumidifierLowerLimit,
                                                             state.dehumidifierUpperLimit));
        entry.channels.push_back(makeChoiceChannel(kChannelDehumidifierMode,
                                                   "Dehumidifier mode",
                                                   true,
                                                   humidityModes,
                                                   humidityControlModeName(state.dehumidifierMode)));
    }

    entry.channels.push_back(makeBoolChannel("stale", "Stale data", false, snapshot.stale));
    return entry;
}

QVariant scalarToVariant(const v1::ScalarValue &value)
{
    if (const auto *b = std::get_if<bool>(&value))
        return *b;
    if (const auto *i = std::get_if<std::int64_t>(&value))
        return static_cast<qlonglong>(*i);
    if (const auto *d = std::get_if<double>(&value))
        return *d;
    if (const auto *s = std::get_if<std::string>(&value))
        return QString::fromStdString(*s);
    return {};
}

} // namespace phicore::honeywell::ipc
