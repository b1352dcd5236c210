#pragma once

#include <cstddef>

namespace ibauth::auth
{
    // OAuth endpoints, relative to the API base URL
    constexpr const char* REQUEST_TOKEN_PATH      = "/oauth/request_token";
    constexpr const char* ACCESS_TOKEN_PATH       = "/oauth/access_token";
    constexpr const char* LIVE_SESSION_TOKEN_PATH = "/oauth/live_session_token";
    constexpr const char* SESSION_INIT_PATH       = "/iserver/auth/ssodh/init";
    constexpr const char* LIVENESS_CHECK_PATH     = "/portfolio/accounts";

    // OAuth parameter names
    constexpr const char* OAUTH_CALLBACK         = "oauth_callback";
    constexpr const char* OAUTH_CONSUMER_KEY     = "oauth_consumer_key";
    constexpr const char* OAUTH_NONCE            = "oauth_nonce";
    constexpr const char* OAUTH_SIGNATURE        = "oauth_signature";
    constexpr const char* OAUTH_SIGNATURE_METHOD = "oauth_signature_method";
    constexpr const char* OAUTH_TIMESTAMP        = "oauth_timestamp";
    constexpr const char* OAUTH_TOKEN            = "oauth_token";
    constexpr const char* OAUTH_TOKEN_SECRET     = "oauth_token_secret";
    constexpr const char* OAUTH_VERIFIER         = "oauth_verifier";
    constexpr const char* OAUTH_VERSION          = "oauth_version";
    constexpr const char* REALM                  = "realm";

    constexpr const char* DH_CHALLENGE  = "diffie_hellman_challenge";
    constexpr const char* DH_RESPONSE   = "diffie_hellman_response";
    constexpr const char* LST_SIGNATURE = "live_session_token_signature";

    constexpr const char* OAUTH_CALLBACK_OOB = "oob";
    constexpr const char* OAUTH_VERSION_1_0  = "1.0"; // server rejects HMAC calls without it

    constexpr size_t NONCE_LENGTH = 32;
    constexpr int DH_EXPONENT_BITS = 256;
    constexpr size_t LST_SIZE = 20; // HMAC-SHA1 digest
} // namespace ibauth::auth
