#pragma once

#include <QHash>
#include <QString>

#include "honeywell_session.h"
#include "honeywell_snapshot_store.h"

namespace phicore::honeywell {

// Merged outcome of one refresh cycle.
struct CycleResult {
    // Another cycle was in flight; nothing was fetched or notified.
    bool skipped = false;
    // False for the startup pass, which republishes discovery data.
    bool refreshed = false;
    // Credentials were rejected after an inline re-login; the host has to
    // ask for new credentials.
    bool authFailed = false;
    std::int64_t completedAtMs = 0;
    QHash<QString, DeviceSnapshot> snapshots;
    QHash<QString, SessionError> failures;
    QString error;

    int freshCount() const
    {
        int count = 0;
        for (auto it = snapshots.cbegin(); it != snapshots.cend(); ++it) {
            if (!it->stale)
                ++count;
        }
        return count;
    }

    int staleCount() const { return static_cast<int>(snapshots.size()) - freshCount(); }

    bool anyAvailable() const
    {
        for (auto it = snapshots.cbegin(); it != snapshots.cend(); ++it) {
            if (it->isAvailable())
                return true;
        }
        return false;
    }
};

} // namespace phicore::honeywell
