#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace ibauth
{
    constexpr const char* LOGGER_NAME = "ibauth";

    // shared "ibauth" logger, created on first use (stderr, level info)
    std::shared_ptr<spdlog::logger> logger();

    // accepts spdlog level names: trace, debug, info, warn, error, critical, off
    void set_log_level(const std::string& level);

    // first few characters of a secret followed by "..."
    std::string redact(const std::string& secret, size_t keep = 4);
} // namespace ibauth
