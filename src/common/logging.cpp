#include "ibauth/common/logging.hpp"

#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "ibauth/common/errors.hpp"

namespace ibauth
{
    namespace
    {
        std::once_flag logger_once;
    }

    std::shared_ptr<spdlog::logger> logger()
    {
        std::call_once(logger_once, []()
        {
            if (!spdlog::get(LOGGER_NAME))
            {
                auto log = spdlog::stderr_color_mt(LOGGER_NAME);
                log->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
                log->set_level(spdlog::level::info);
            }
        });
        return spdlog::get(LOGGER_NAME);
    }

    void set_log_level(const std::string& level)
    {
        auto parsed = spdlog::level::from_str(level);

        // from_str maps unknown names to off
        if (parsed == spdlog::level::off && level != "off")
            throw ConfigurationError("Unknown log level: " + level);

        logger()->set_level(parsed);
    }

    std::string redact(const std::string& secret, const size_t keep)
    {
        if (secret.size() <= keep)
            return "...";
        return secret.substr(0, keep) + "...";
    }
} // namespace ibauth
