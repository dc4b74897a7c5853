#pragma once

#include <QVariant>

#include "honeywell_config.h"
#include "honeywell_snapshot_store.h"
#include "phi/adapter/sdk/sidecar.h"

namespace phicore::honeywell::ipc {

struct DeviceEntry {
    phicore::adapter::v1::Device device;
    phicore::adapter::v1::ChannelList channels;
};

DeviceEntry buildDeviceEntry(const DeviceSnapshot &snapshot, const InstallationConfig &config);

QVariant scalarToVariant(const phicore::adapter::v1::ScalarValue &value);

} // namespace phicore::honeywell::ipc
