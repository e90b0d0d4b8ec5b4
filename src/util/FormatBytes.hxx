// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <string>

/**
 * Format a byte count for humans, with binary units and at most two
 * decimal places, e.g. "0 Bytes", "512 Bytes", "1.5 KB", "5 MB".
 */
[[gnu::const]]
std::string
FormatBytes(uint64_t bytes) noexcept;
