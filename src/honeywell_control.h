#pragma once

#include <QString>
#include <QVariant>

#include "honeywell_model.h"

namespace phicore::honeywell {

inline constexpr const char kChannelHeatSetpoint[] = "heat_setpoint";
inline constexpr const char kChannelCoolSetpoint[] = "cool_setpoint";
inline constexpr const char kChannelSystemMode[] = "system_mode";
inline constexpr const char kChannelFanMode[] = "fan_mode";
inline constexpr const char kChannelHold[] = "hold";
inline constexpr const char kChannelAway[] = "away";
inline constexpr const char kChannelHumidifierSetpoint[] = "humidifier_setpoint";
inline constexpr const char kChannelHumidifierMode[] = "humidifier_mode";
inline constexpr const char kChannelDehumidifierSetpoint[] = "dehumidifier_setpoint";
inline constexpr const char kChannelDehumidifierMode[] = "dehumidifier_mode";

struct AwayTemperatures {
    double heat = 61.0;
    double cool = 88.0;
};

bool heatIsActive(SystemMode mode);
bool coolIsActive(SystemMode mode);

// Away is a permanent hold at the away temperatures of the active mode.
bool isAwayActive(const ThermostatState &state, const AwayTemperatures &away);

// Translates a write to one thermostat channel into a control change against
// the current state. Returns false with an error for unknown channels,
// unusable values and setpoints outside the device limits.
bool buildControlChange(const QString &channelId,
                        const QVariant &value,
                        const ThermostatState &state,
                        const AwayTemperatures &away,
                        ControlChange *out,
                        QString *error = nullptr);

} // namespace phicore::honeywell
