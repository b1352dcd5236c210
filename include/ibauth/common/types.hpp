#pragma once

#include <string>
#include <map>
#include <chrono>
#include <cstdint>

namespace ibauth
{
    // parameter name -> value; std::map keeps keys sorted for the base string
    using ParamMap = std::map<std::string, std::string>;

    enum class AuthState : uint8_t
    {
        UNAUTHENTICATED,       // nothing obtained yet
        HAS_REQUEST_TOKEN,     // request token obtained
        HAS_ACCESS_TOKEN,      // access token + encrypted secret available
        HAS_LIVE_SESSION_TOKEN, // LST derived
        SESSION_INITIALIZED    // brokerage session active
    };

    // the state transition a step of the token exchange performs
    enum class FlowStep : uint8_t
    {
        REQUEST_TOKEN,
        ACCESS_TOKEN,
        LIVE_SESSION_TOKEN,
        SESSION_INIT,
        AUTHENTICATED_CALL
    };

    enum class SignatureMethod : uint8_t
    {
        RSA_SHA256,
        HMAC_SHA256
    };

    struct RequestToken
    {
        std::string token;
    };

    struct AccessToken
    {
        std::string token;
        std::string encrypted_secret; // base64 ciphertext, never decrypted at rest
    };

    struct LiveSessionToken
    {
        std::string value_b64; // 20-byte HMAC-SHA1 digest, base64
        bool verified{false};  // matched live_session_token_signature
    };

    struct PersistedTokenRecord
    {
        std::string access_token;
        std::string access_token_secret;
        std::string live_session_token;
        std::string consumer_key;
        std::string realm;
        std::string timestamp;

        bool operator==(const PersistedTokenRecord&) const = default;
    };

    struct HttpRequest
    {
        std::string method;
        std::string url;
        std::map<std::string, std::string> headers;
        std::string body;
    };

    struct HttpResponse
    {
        int status{0};
        std::string body;
    };

    std::string auth_state_to_string(AuthState state);
    AuthState string_to_auth_state(const std::string& str);

    std::string flow_step_to_string(FlowStep step);

    std::string signature_method_to_string(SignatureMethod method);
} // namespace ibauth
