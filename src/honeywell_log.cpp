#include "honeywell_log.h"

Q_LOGGING_CATEGORY(honeywellLog, "phi-core.adapters.honeywell");
