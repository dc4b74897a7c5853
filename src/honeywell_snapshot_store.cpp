#include "honeywell_snapshot_store.h"

#include <algorithm>

#include <QReadLocker>
#include <QWriteLocker>

namespace phicore::honeywell {

std::optional<DeviceSnapshot> SnapshotStore::get(const QString &deviceId) const
{
    QReadLocker locker(&m_lock);
    const auto it = m_snapshots.constFind(deviceId);
    if (it == m_snapshots.cend())
        return std::nullopt;
    return it.value();
}

void SnapshotStore::upsert(const QString &deviceId, const ThermostatState &state, std::int64_t nowMs)
{
    DeviceSnapshot snapshot;
    snapshot.deviceId = deviceId;
    snapshot.state = state;
    snapshot.lastSuccessAtMs = nowMs;
    snapshot.consecutiveFailures = 0;
    snapshot.stale = false;

    QWriteLocker locker(&m_lock);
    m_snapshots.insert(deviceId, snapshot);
}

bool SnapshotStore::markStale(const QString &deviceId)
{
    QWriteLocker locker(&m_lock);
    auto it = m_snapshots.find(deviceId);
    if (it == m_snapshots.end())
        return false;
    ++it->consecutiveFailures;
    it->stale = true;
    return true;
}

bool SnapshotStore::remove(const QString &deviceId)
{
    QWriteLocker locker(&m_lock);
    return m_snapshots.remove(deviceId) > 0;
}

QList<DeviceSnapshot> SnapshotStore::all() const
{
    QList<DeviceSnapshot> out;
    {
        QReadLocker locker(&m_lock);
        out.reserve(m_snapshots.size());
        for (auto it = m_snapshots.cbegin(); it != m_snapshots.cend(); ++it)
            out.append(it.value());
    }
    std::sort(out.begin(), out.end(), [](const DeviceSnapshot &a, const DeviceSnapshot &b) {
        return a.deviceId < b.deviceId;
    });
    return out;
}

bool SnapshotStore::contains(const QString &deviceId) const
{
    QReadLocker locker(&m_lock);
    return m_snapshots.contains(deviceId);
}

QStringList SnapshotStore::ids() const
{
    QStringList out;
    {
        QReadLocker locker(&m_lock);
        out = m_snapshots.keys();
    }
    out.sort();
    return out;
}

int SnapshotStore::size() const
{
    QReadLocker locker(&m_lock);
    return static_cast<int>(m_snapshots.size());
}

void SnapshotStore::clear()
{
    QWriteLocker locker(&m_lock);
    m_snapshots.clear();
}

} // namespace phicore::honeywell
