#include "ibauth/common/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <stdexcept>

#include "ibauth/common/errors.hpp"

namespace ibauth
{
    namespace
    {
        std::optional<std::string> env(const char* name)
        {
            const char* value = std::getenv(name);
            if (!value || !*value)
                return std::nullopt;
            return std::string(value);
        }

        unsigned parse_unsigned(const std::string& name, const std::string& value)
        {
            const auto invalid = [&]()
            {
                return ConfigurationError(name + " must be a positive integer, got '" + value + "'");
            };

            // stoul would accept a sign or leading blanks and wrap negatives
            if (value.empty() || !std::all_of(value.begin(), value.end(),
                                              [](const unsigned char c) { return std::isdigit(c) != 0; }))
                throw invalid();

            unsigned long parsed = 0;
            try
            {
                parsed = std::stoul(value);
            }
            catch (const std::out_of_range&)
            {
                throw invalid();
            }

            if (parsed == 0 || parsed > std::numeric_limits<unsigned>::max())
                throw invalid();
            return static_cast<unsigned>(parsed);
        }
    }

    std::string Config::default_token_file()
    {
        if (auto home = env("HOME"))
            return (std::filesystem::path(*home) / DEFAULT_TOKEN_FILE_NAME).string();
        return DEFAULT_TOKEN_FILE_NAME;
    }

    Config Config::from_environment()
    {
        Config config;

        if (auto v = env("IB_CONSUMER_KEY")) config.consumer_key = *v;
        if (auto v = env("IB_REALM")) config.realm = *v;
        if (auto v = env("IB_SIGNATURE_KEY_PATH")) config.signature_key_path = *v;
        if (auto v = env("IB_ENCRYPTION_KEY_PATH")) config.encryption_key_path = *v;
        if (auto v = env("IB_DH_PARAM_PATH")) config.dh_param_path = *v;
        if (auto v = env("IB_DH_PRIME")) config.dh_prime_hex = *v;
        if (auto v = env("IB_DH_GENERATOR")) config.dh_generator = parse_unsigned("IB_DH_GENERATOR", *v);
        if (auto v = env("IB_API_BASE_URL")) config.api_base_url = *v;
        if (auto v = env("IB_GATEWAY_BASE_URL")) config.gateway_base_url = *v;
        if (auto v = env("IB_LOG_LEVEL")) config.log_level = *v;

        if (auto v = env("IB_HTTP_TIMEOUT"))
            config.http_timeout = std::chrono::seconds(parse_unsigned("IB_HTTP_TIMEOUT", *v));

        config.token_file = env("IB_TOKEN_FILE").value_or(default_token_file());

        config.access_token        = env("IB_ACCESS_TOKEN");
        config.access_token_secret = env("IB_ACCESS_TOKEN_SECRET");

        return config;
    }
} // namespace ibauth
