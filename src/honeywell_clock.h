#pragma once

#include <cstdint>
#include <functional>

#include <QDateTime>

namespace phicore::honeywell {

// Wall clock in milliseconds since epoch; injectable for tests.
using Clock = std::function<std::int64_t()>;

inline std::int64_t systemNowMs()
{
    return QDateTime::currentMSecsSinceEpoch();
}

} // namespace phicore::honeywell
