// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/log.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <vector>

namespace ferry::core {

std::error_code init_logging(const LogConfig& cfg) noexcept {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (!cfg.file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.file));
        }

        auto logger = std::make_shared<spdlog::logger>("ferry", sinks.begin(), sinks.end());
        logger->set_pattern("%Y-%m-%d %H:%M:%S - %l - %v");
        logger->set_level(spdlog::level::from_str(cfg.level));
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(std::move(logger));
        return {};
    } catch (const std::exception&) {
        return std::make_error_code(std::errc::io_error);
    }
}

} // namespace ferry::core
