// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "nm_backend.h"

#include "nm_backend_dbus.h"
#include "nm_backend_mock.h"

#include <spdlog/spdlog.h>

namespace vbridge {

std::unique_ptr<NmBackend> NmBackend::create(bool force_mock) {
    if (force_mock) {
        spdlog::debug("[NmBackend] Creating mock backend (force_mock=true)");
        auto mock = std::make_unique<NmBackendMock>();
        mock->add_demo_devices();
        return mock;
    }

    // Never falls back to the mock; start() reports an unreachable service
    spdlog::debug("[NmBackend] Creating D-Bus backend");
    return std::make_unique<NmBackendDbus>();
}

} // namespace vbridge
