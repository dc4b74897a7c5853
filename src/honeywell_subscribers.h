#pragma once

#include <cstdint>
#include <functional>
#include <map>

#include <QMutex>

#include "honeywell_cycle.h"

namespace phicore::honeywell {

using SubscriptionId = std::uint64_t;
using CycleListener = std::function<void(const CycleResult &)>;

class SubscriberRegistry
{
public:
    SubscriptionId subscribe(CycleListener listener);
    bool unsubscribe(SubscriptionId id);

    // Delivers to every listener registered when the call starts. A listener
    // that throws is logged and skipped.
    void notify(const CycleResult &result) const;

    int size() const;

private:
    mutable QMutex m_mutex;
    std::map<SubscriptionId, CycleListener> m_listeners;
    SubscriptionId m_nextId = 1;
};

} // namespace phicore::honeywell
