#include "ibauth/client/auth_session.hpp"

#include <utility>

namespace ibauth::client
{
    AuthState AuthSession::state() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    void AuthSession::set_state(const AuthState state)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = state;
        last_failure_.reset();
    }

    bool AuthSession::is_authenticated() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_ == AuthState::SESSION_INITIALIZED;
    }

    std::optional<FlowStep> AuthSession::last_failure() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_failure_;
    }

    void AuthSession::mark_failed(const FlowStep step)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_failure_ = step;
    }

    std::optional<RequestToken> AuthSession::request_token() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return request_token_;
    }

    void AuthSession::set_request_token(RequestToken token)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        request_token_ = std::move(token);
        state_         = AuthState::HAS_REQUEST_TOKEN;
        last_failure_.reset();
    }

    std::optional<AccessToken> AuthSession::access_token() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return access_token_;
    }

    void AuthSession::set_access_token(AccessToken token)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        access_token_ = std::move(token);
        request_token_.reset();
        live_session_token_.reset();
        state_ = AuthState::HAS_ACCESS_TOKEN;
        last_failure_.reset();
    }

    std::optional<LiveSessionToken> AuthSession::live_session_token() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return live_session_token_;
    }

    void AuthSession::set_live_session_token(LiveSessionToken token)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        live_session_token_ = std::move(token);
        state_              = AuthState::HAS_LIVE_SESSION_TOKEN;
        last_failure_.reset();
        ++generation_;
    }

    void AuthSession::invalidate_live_session_token()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        live_session_token_.reset();
        state_ = access_token_ ? AuthState::HAS_ACCESS_TOKEN : AuthState::UNAUTHENTICATED;
    }

    bool AuthSession::invalidate_if(const uint64_t generation)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation_ != generation || !live_session_token_)
            return false;

        live_session_token_.reset();
        state_ = access_token_ ? AuthState::HAS_ACCESS_TOKEN : AuthState::UNAUTHENTICATED;
        return true;
    }

    uint64_t AuthSession::generation() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return generation_;
    }

    std::optional<AuthSession::SigningMaterial> AuthSession::signing_material() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!access_token_ || !live_session_token_)
            return std::nullopt;
        return SigningMaterial{access_token_->token, live_session_token_->value_b64, generation_};
    }
} // namespace ibauth::client
