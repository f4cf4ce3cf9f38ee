// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

namespace vbridge {

/**
 * @brief Generate a random UUID v4 string
 * @return UUID string in standard format (e.g., "550e8400-e29b-41d4-a716-446655440000")
 */
std::string generate_uuid_v4();

} // namespace vbridge
