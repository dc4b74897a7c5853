#include "honeywell_subscribers.h"

#include <exception>
#include <utility>
#include <vector>

#include <QMutexLocker>

#include "honeywell_log.h"

namespace phicore::honeywell {

SubscriptionId SubscriberRegistry::subscribe(CycleListener listener)
{
    if (!listener)
        return 0;
    QMutexLocker locker(&m_mutex);
    const SubscriptionId id = m_nextId++;
    m_listeners.emplace(id, std::move(listener));
    return id;
}

bool SubscriberRegistry::unsubscribe(SubscriptionId id)
{
    QMutexLocker locker(&m_mutex);
    return m_listeners.erase(id) > 0;
}

void SubscriberRegistry::notify(const CycleResult &result) const
{
    // Copy under the lock so listeners may (un)subscribe while being called.
    std::vector<std::pair<SubscriptionId, CycleListener>> listeners;
    {
        QMutexLocker locker(&m_mutex);
        listeners.assign(m_listeners.begin(), m_listeners.end());
    }

    for (const auto &entry : listeners) {
        try {
            entry.second(result);
        } catch (const std::exception &ex) {
            qCWarning(honeywellLog) << "SubscriberRegistry: listener" << entry.first << "failed:" << ex.what();
        } catch (...) {
            qCWarning(honeywellLog) << "SubscriberRegistry: listener" << entry.first << "threw a non-standard exception";
        }
    }
}

int SubscriberRegistry::size() const
{
    QMutexLocker locker(&m_mutex);
    return static_cast<int>(m_listeners.size());
}

} // namespace phicore::honeywell
