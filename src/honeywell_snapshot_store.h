#pragma once

#include <cstdint>
#include <optional>

#include <QHash>
#include <QList>
#include <QReadWriteLock>
#include <QString>
#include <QStringList>

#include "honeywell_model.h"

namespace phicore::honeywell {

struct DeviceSnapshot {
    QString deviceId;
    ThermostatState state;
    std::int64_t lastSuccessAtMs = 0;
    int consecutiveFailures = 0;
    bool stale = false;

    // Served from cache through transient failures; unavailable only until
    // the first successful fetch.
    bool isAvailable() const { return lastSuccessAtMs > 0; }
};

// Last known good state per device. Only the coordinator writes; every call
// takes the lock for that one operation, so readers see either the previous or
// the updated snapshot of a device, never a mix.
class SnapshotStore
{
public:
    std::optional<DeviceSnapshot> get(const QString &deviceId) const;
    void upsert(const QString &deviceId, const ThermostatState &state, std::int64_t nowMs);
    // Returns false if the device is unknown.
    bool markStale(const QString &deviceId);
    bool remove(const QString &deviceId);
    QList<DeviceSnapshot> all() const;

    bool contains(const QString &deviceId) const;
    QStringList ids() const;
    int size() const;
    void clear();

private:
    mutable QReadWriteLock m_lock;
    QHash<QString, DeviceSnapshot> m_snapshots;
};

} // namespace phicore::honeywell
