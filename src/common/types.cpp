#include <stdexcept>
#include "ibauth/common/types.hpp"

namespace ibauth
{
    std::string auth_state_to_string(const AuthState state)
    {
        switch (state)
        {
            case AuthState::UNAUTHENTICATED: return "Unauthenticated";
            case AuthState::HAS_REQUEST_TOKEN: return "HasRequestToken";
            case AuthState::HAS_ACCESS_TOKEN: return "HasAccessToken";
            case AuthState::HAS_LIVE_SESSION_TOKEN: return "HasLiveSessionToken";
            case AuthState::SESSION_INITIALIZED: return "SessionInitialized";
            default: throw std::runtime_error("Unknown auth state");
        }
    }

    AuthState string_to_auth_state(const std::string& str)
    {
        if (str == "Unauthenticated") return AuthState::UNAUTHENTICATED;
        if (str == "HasRequestToken") return AuthState::HAS_REQUEST_TOKEN;
        if (str == "HasAccessToken") return AuthState::HAS_ACCESS_TOKEN;
        if (str == "HasLiveSessionToken") return AuthState::HAS_LIVE_SESSION_TOKEN;
        if (str == "SessionInitialized") return AuthState::SESSION_INITIALIZED;
        throw std::runtime_error("Unknown auth state: " + str);
    }

    std::string flow_step_to_string(const FlowStep step)
    {
        switch (step)
        {
            case FlowStep::REQUEST_TOKEN: return "request_token";
            case FlowStep::ACCESS_TOKEN: return "access_token";
            case FlowStep::LIVE_SESSION_TOKEN: return "live_session_token";
            case FlowStep::SESSION_INIT: return "session_init";
            case FlowStep::AUTHENTICATED_CALL: return "authenticated_call";
            default: throw std::runtime_error("Unknown flow step");
        }
    }

    std::string signature_method_to_string(const SignatureMethod method)
    {
        switch (method)
        {
            case SignatureMethod::RSA_SHA256: return "RSA-SHA256";
            case SignatureMethod::HMAC_SHA256: return "HMAC-SHA256";
            default: throw std::runtime_error("Unknown signature method");
        }
    }
} // namespace ibauth
