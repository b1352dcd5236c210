#pragma once

#include <string>
#include <memory>

#include "ibauth/common/config.hpp"
#include "ibauth/common/types.hpp"
#include "ibauth/auth/credential_store.hpp"
#include "ibauth/auth/token_exchange_flow.hpp"
#include "ibauth/auth/token_store.hpp"
#include "ibauth/client/auth_session.hpp"
#include "ibauth/client/http_transport.hpp"

namespace ibauth::client
{
    /**
     * Entry point for callers: authenticates once, then signs and sends
     * requests to arbitrary endpoints with HMAC-SHA256
     *
     * Thread-safe. A 401 on a signed call triggers exactly one live session
     * token re-derivation (shared between concurrent callers) and one retry.
     */
    class AuthenticatedClient
    {
    private:
        AuthSession& session_;
        HttpTransport& transport_;
        const auth::TokenStore* token_store_;
        auth::TokenExchangeFlow flow_;

    public:
        AuthenticatedClient(
            AuthSession& session,
            std::shared_ptr<const auth::Credentials> credentials,
            Config config,
            HttpTransport& transport,
            const auth::TokenStore* token_store = nullptr);

        /**
         * Reach SessionInitialized: persisted tokens (after a liveness check),
         * else the pre-authorized fast path, else the full OAuth flow
         * @throws AuthError subclass naming the failed step
         */
        void authenticate();

        [[nodiscard]] bool is_authenticated() const;

        /**
         * Build a signed request without sending it
         * @param endpoint Path relative to the API base URL, or an absolute URL
         * @throws NotAuthenticatedError when no live session token exists
         */
        HttpRequest sign_request(
            const std::string& method,
            const std::string& endpoint,
            const ParamMap& query = {},
            const ParamMap& form = {}) const;

        /**
         * Sign and send; any status but 401 is returned to the caller
         * @throws SessionExpiredError if the call is still refused after re-derivation
         * @throws NotAuthenticatedError when no live session token exists
         */
        HttpResponse request(
            const std::string& method,
            const std::string& endpoint,
            const ParamMap& query = {},
            const ParamMap& form = {});

        // signed GET /portfolio/accounts; a 200 marks the session initialized
        bool check_liveness();

        [[nodiscard]] auth::TokenExchangeFlow& flow() { return flow_; }

    private:
        std::string resolve_url(const std::string& endpoint) const;

        HttpRequest sign_with(
            const AuthSession::SigningMaterial& material,
            const std::string& method,
            const std::string& endpoint,
            const ParamMap& query,
            const ParamMap& form) const;

        bool resume_persisted_session();
    };
} // namespace ibauth::client
