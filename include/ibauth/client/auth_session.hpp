#pragma once

#include <string>
#include <optional>
#include <mutex>
#include <cstdint>

#include "ibauth/common/types.hpp"

namespace ibauth::client
{
    /**
     * Mutable authentication state of one credential set
     *
     * Owned by the caller and handed by reference to the flow and the
     * client; all accessors are thread-safe. Live session token derivation
     * is serialized through derivation_mutex().
     */
    class AuthSession
    {
    public:
        // access token + LST pair captured atomically for signing one request
        struct SigningMaterial
        {
            std::string access_token;
            std::string live_session_token;
            uint64_t generation;
        };

    private:
        mutable std::mutex mutex_;
        std::mutex derivation_mutex_;

        AuthState state_{AuthState::UNAUTHENTICATED};
        std::optional<RequestToken> request_token_;
        std::optional<AccessToken> access_token_;
        std::optional<LiveSessionToken> live_session_token_;
        std::optional<FlowStep> last_failure_;
        uint64_t generation_{0};

    public:
        AuthSession() = default;

        AuthSession(const AuthSession&)            = delete;
        AuthSession& operator=(const AuthSession&) = delete;

        [[nodiscard]] AuthState state() const;
        void set_state(AuthState state);

        [[nodiscard]] bool is_authenticated() const;

        // step that made the last attempt fail; cleared by any successful step
        [[nodiscard]] std::optional<FlowStep> last_failure() const;
        void mark_failed(FlowStep step);

        [[nodiscard]] std::optional<RequestToken> request_token() const;
        void set_request_token(RequestToken token);

        // installing an access token drops the request token and any LST
        [[nodiscard]] std::optional<AccessToken> access_token() const;
        void set_access_token(AccessToken token);

        [[nodiscard]] std::optional<LiveSessionToken> live_session_token() const;
        void set_live_session_token(LiveSessionToken token);

        // drop the LST and fall back to HasAccessToken
        void invalidate_live_session_token();

        // as above, but only while the LST is still the one of that generation
        bool invalidate_if(uint64_t generation);

        // bumped on every new LST; lets a waiter see that someone else rederived
        [[nodiscard]] uint64_t generation() const;

        [[nodiscard]] std::optional<SigningMaterial> signing_material() const;

        std::mutex& derivation_mutex() { return derivation_mutex_; }
    };
} // namespace ibauth::client
