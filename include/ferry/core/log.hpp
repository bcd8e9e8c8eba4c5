// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/config.hpp>
#include <system_error>

namespace ferry::core {

// Install the process-wide spdlog logger (stderr plus optional file sink).
// Safe to call more than once; the last call wins.
[[nodiscard]] std::error_code init_logging(const LogConfig& cfg) noexcept;

} // namespace ferry::core
