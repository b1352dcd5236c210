#pragma once

#include <string>
#include <chrono>
#include <optional>

namespace ibauth
{
    constexpr const char* DEFAULT_REALM            = "limited_poa";
    constexpr const char* DEFAULT_API_BASE_URL     = "https://api.ibkr.com/v1/api";
    constexpr const char* DEFAULT_GATEWAY_BASE_URL = "https://localhost:5000/v1/api";
    constexpr const char* DEFAULT_TOKEN_FILE_NAME  = ".ib_rest_tokens.json";
    constexpr int DEFAULT_HTTP_TIMEOUT_SECONDS     = 30;
    constexpr unsigned DEFAULT_DH_GENERATOR        = 2;

    /**
     * Process configuration, read once at startup
     */
    struct Config
    {
        std::string consumer_key;
        std::string realm{DEFAULT_REALM};

        std::string signature_key_path;
        std::string encryption_key_path;

        // DH domain: either a PEM parameter file or a hex prime
        std::string dh_param_path;
        std::string dh_prime_hex;
        unsigned dh_generator{DEFAULT_DH_GENERATOR};

        std::string token_file;

        // pre-authorized tokens for the fast path
        std::optional<std::string> access_token;
        std::optional<std::string> access_token_secret;

        std::string api_base_url{DEFAULT_API_BASE_URL};
        std::string gateway_base_url{DEFAULT_GATEWAY_BASE_URL};

        std::chrono::seconds http_timeout{DEFAULT_HTTP_TIMEOUT_SECONDS};
        std::string log_level{"info"};

        [[nodiscard]] bool has_preauthorized_tokens() const
        {
            return access_token && access_token_secret &&
                   !access_token->empty() && !access_token_secret->empty();
        }

        // IB_* environment variables over the defaults above
        static Config from_environment();

        // $HOME/.ib_rest_tokens.json, or the bare file name without HOME
        static std::string default_token_file();
    };
} // namespace ibauth
