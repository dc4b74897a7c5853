#include "honeywell_control.h"

#include <cmath>
#include <optional>

#include <QMetaType>

namespace phicore::honeywell {

namespace {

bool fail(QString *error, const QString &message)
{
    if (error)
        *error = message;
    return false;
}

bool readTemperature(const QVariant &value, double *out)
{
    bool ok = false;
    const double temperature = value.toDouble(&ok);
    if (!ok || !std::isfinite(temperature))
        return false;
    *out = temperature;
    return true;
}

bool within(double value, double lower, double upper)
{
    return value >= lower && value <= upper;
}

int nextPeriod(const ThermostatState &state, const QString &key)
{
    return state.rawUiData.value(key).toInt(0);
}

bool applyHeatSetpoint(double temperature, const ThermostatState &state, ControlChange *change, QString *error)
{
    if (!within(temperature, state.heatLowerLimit, state.heatUpperLimit))
        return fail(error, QStringLiteral("Temperature out of range: %1").arg(temperature));
    change->heatSetpoint = temperature;
    if (state.heatHold != HoldStatus::Permanent) {
        change->heatHold = HoldStatus::Temporary;
        change->heatNextPeriod = nextPeriod(state, QStringLiteral("HeatNextPeriod"));
    }
    return true;
}

bool applyCoolSetpoint(double temperature, const ThermostatState &state, ControlChange *change, QString *error)
{
    if (!within(temperature, state.coolLowerLimit, state.coolUpperLimit))
        return fail(error, QStringLiteral("Temperature out of range: %1").arg(temperature));
    change->coolSetpoint = temperature;
    if (state.coolHold != HoldStatus::Permanent) {
        change->coolHold = HoldStatus::Temporary;
        change->coolNextPeriod = nextPeriod(state, QStringLiteral("CoolNextPeriod"));
    }
    return true;
}

void resumeSchedule(ControlChange *change)
{
    change->heatHold = HoldStatus::Schedule;
    change->coolHold = HoldStatus::Schedule;
}

bool applyHold(HoldStatus hold, const ThermostatState &state, ControlChange *change, QString *error)
{
    if (hold == HoldStatus::Schedule) {
        resumeSchedule(change);
        return true;
    }
    if (!heatIsActive(state.systemMode) && !coolIsActive(state.systemMode))
        return fail(error, QStringLiteral("Hold is not available in mode %1").arg(systemModeName(state.systemMode)));

    if (heatIsActive(state.systemMode)) {
        change->heatHold = hold;
        if (hold == HoldStatus::Temporary)
            change->heatNextPeriod = nextPeriod(state, QStringLiteral("HeatNextPeriod"));
    }
    if (coolIsActive(state.systemMode)) {
        change->coolHold = hold;
        if (hold == HoldStatus::Temporary)
            change->coolNextPeriod = nextPeriod(state, QStringLiteral("CoolNextPeriod"));
    }
    return true;
}

bool applyAway(const ThermostatState &state, const AwayTemperatures &away, ControlChange *change, QString *error)
{
    const bool heat = heatIsActive(state.systemMode);
    const bool cool = coolIsActive(state.systemMode);
    if (!heat && !cool)
        return fail(error, QStringLiteral("Away is not available in mode %1").arg(systemModeName(state.systemMode)));

    if (heat) {
        if (!within(away.heat, state.heatLowerLimit, state.heatUpperLimit))
            return fail(error, QStringLiteral("Temperature out of range: %1").arg(away.heat));
        change->heatSetpoint = away.heat;
        change->heatHold = HoldStatus::Permanent;
    }
    if (cool) {
        if (!within(away.cool, state.coolLowerLimit, state.coolUpperLimit))
            return fail(error, QStringLiteral("Temperature out of range: %1").arg(away.cool));
        change->coolSetpoint = away.cool;
        change->coolHold = HoldStatus::Permanent;
    }
    return true;
}

bool readHumidity(const QVariant &value, int lower, int upper, int *out, QString *error)
{
    bool ok = false;
    const double humidity = value.toDouble(&ok);
    if (!ok || !std::isfinite(humidity))
        return fail(error, QStringLiteral("Humidity must be a number"));
    const int rounded = qRound(humidity);
    if (rounded < lower || rounded > upper)
        return fail(error, QStringLiteral("Humidity out of range: %1").arg(rounded));
    *out = rounded;
    return true;
}

bool readHumidityMode(const QVariant &value, HumidityControlMode *out, QString *error)
{
    std::optional<HumidityControlMode> mode;
    if (value.typeId() == QMetaType::Bool)
        mode = value.toBool() ? HumidityControlMode::Auto : HumidityControlMode::Off;
    else
        mode = humidityControlModeFromName(value.toString());
    if (!mode.has_value())
        return fail(error, QStringLiteral("Unknown humidity mode: %1").arg(value.toString()));
    *out = *mode;
    return true;
}

} // namespace

bool heatIsActive(SystemMode mode)
{
    return mode == SystemMode::Heat || mode == SystemMode::EmergencyHeat || mode == SystemMode::Auto;
}

bool coolIsActive(SystemMode mode)
{
    return mode == SystemMode::Cool || mode == SystemMode::Auto;
}

bool isAwayActive(const ThermostatState &state, const AwayTemperatures &away)
{
    const bool heat = heatIsActive(state.systemMode);
    const bool cool = coolIsActive(state.systemMode);
    if (!heat && !cool)
        return false;
    if (heat && (state.heatHold != HoldStatus::Permanent || std::abs(state.heatSetpoint - away.heat) > 0.01))
        return false;
    if (cool && (state.coolHold != HoldStatus::Permanent || std::abs(state.coolSetpoint - away.cool) > 0.01))
        return false;
    return true;
}

bool buildControlChange(const QString &channelId,
                        const QVariant &value,
                        const ThermostatState &state,
                        const AwayTemperatures &away,
                        ControlChange *out,
                        QString *error)
{
    if (!out)
        return fail(error, QStringLiteral("Output change is null"));
    if (!value.isValid())
        return fail(error, QStringLiteral("Value missing"));

    ControlChange change;

    if (channelId == QLatin1String(kChannelHeatSetpoint) || channelId == QLatin1String(kChannelCoolSetpoint)) {
        double temperature = 0.0;
        if (!readTemperature(value, &temperature))
            return fail(error, QStringLiteral("Temperature must be a number"));
        const bool ok = channelId == QLatin1String(kChannelHeatSetpoint)
            ? applyHeatSetpoint(temperature, state, &change, error)
            : applyCoolSetpoint(temperature, state, &change, error);
        if (!ok)
            return false;
    } else if (channelId == QLatin1String(kChannelSystemMode)) {
        const auto mode = systemModeFromName(value.toString());
        if (!mode.has_value())
            return fail(error, QStringLiteral("Unknown system mode: %1").arg(value.toString()));
        change.systemMode = *mode;
    } else if (channelId == QLatin1String(kChannelFanMode)) {
        if (!state.hasFan)
            return fail(error, QStringLiteral("Thermostat has no fan control"));
        const auto mode = fanModeFromName(value.toString());
        if (!mode.has_value())
            return fail(error, QStringLiteral("Unknown fan mode: %1").arg(value.toString()));
        change.fanMode = *mode;
    } else if (channelId == QLatin1String(kChannelHold)) {
        const auto hold = holdStatusFromName(value.toString());
        if (!hold.has_value())
            return fail(error, QStringLiteral("Unknown hold: %1").arg(value.toString()));
        if (!applyHold(*hold, state, &change, error))
            return false;
    } else if (channelId == QLatin1String(kChannelAway)) {
        if (value.toBool()) {
            if (!applyAway(state, away, &change, error))
                return false;
        } else {
            resumeSchedule(&change);
        }
    } else if (channelId == QLatin1String(kChannelHumidifierSetpoint)
               || channelId == QLatin1String(kChannelHumidifierMode)) {
        if (!state.hasHumidifier)
            return fail(error, QStringLiteral("Thermostat has no humidifier"));
        if (channelId == QLatin1String(kChannelHumidifierSetpoint)) {
            int humidity = 0;
            if (!readHumidity(value, state.humidifierLowerLimit, state.humidifierUpperLimit, &humidity, error))
                return false;
            change.humidifierSetpoint = humidity;
        } else {
            HumidityControlMode mode = HumidityControlMode::Off;
            if (!readHumidityMode(value, &mode, error))
                return false;
            change.humidifierMode = mode;
        }
    } else if (channelId == QLatin1String(kChannelDehumidifierSetpoint)
               || channelId == QLatin1String(kChannelDehumidifierMode)) {
        if (!state.hasDehumidifier)
            return fail(error, QStringLiteral("Thermostat has no dehumidifier"));
        if (channelId == QLatin1String(kChannelDehumidifierSetpoint)) {
            int humidity = 0;
            if (!readHumidity(value, state.dehumidifierLowerLimit, state.dehumidifierUpperLimit, &humidity, error))
                return false;
            change.dehumidifierSetpoint = humidity;
        } else {
            HumidityControlMode mode = HumidityControlMode::Off;
            if (!readHumidityMode(value, &mode, error))
                return false;
            change.dehumidifierMode = mode;
        }
    } else {
        return fail(error, QStringLiteral("Channel %1 is read-only").arg(channelId));
    }

    *out = change;
    if (error)
        error->clear();
    return true;
}

} // namespace phicore::honeywell
