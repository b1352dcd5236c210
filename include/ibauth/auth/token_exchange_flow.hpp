#pragma once

#include <string>
#include <memory>
#include <optional>
#include <cstdint>

#include "ibauth/common/config.hpp"
#include "ibauth/common/types.hpp"
#include "ibauth/auth/credential_store.hpp"
#include "ibauth/auth/request_signer.hpp"
#include "ibauth/auth/token_store.hpp"
#include "ibauth/client/auth_session.hpp"
#include "ibauth/client/http_transport.hpp"

namespace ibauth::auth
{
    /**
     * OAuth token exchange state machine
     *
     * Unauthenticated -> HasRequestToken -> HasAccessToken
     *     -> HasLiveSessionToken -> SessionInitialized
     *
     * Every step writes its result into the AuthSession. A failing step
     * records itself with AuthSession::mark_failed() and rethrows; the caller
     * decides whether to start over. Live session token derivation runs
     * under the session's derivation mutex so at most one Diffie-Hellman
     * exchange is in flight per session.
     */
    class TokenExchangeFlow
    {
    private:
        std::shared_ptr<const Credentials> credentials_;
        Config config_;
        client::HttpTransport& transport_;
        client::AuthSession& session_;
        const TokenStore* token_store_; // optional, not owned
        RequestSigner signer_;

    public:
        TokenExchangeFlow(
            std::shared_ptr<const Credentials> credentials,
            Config config,
            client::HttpTransport& transport,
            client::AuthSession& session,
            const TokenStore* token_store = nullptr);

        // Unauthenticated -> HasRequestToken (RSA-signed, oauth_callback=oob)
        RequestToken request_token();

        // HasRequestToken -> HasAccessToken; the verifier is only needed for interactive consent
        AccessToken access_token(const std::optional<std::string>& verifier = std::nullopt);

        // HasAccessToken -> HasLiveSessionToken; persists the new token set
        LiveSessionToken live_session_token();

        /**
         * HasLiveSessionToken -> SessionInitialized
         * Tries the local gateway first, then the cloud API.
         * @throws ProtocolError with status 401 (LST dropped) if any surface rejected the token
         */
        void init_brokerage_session();

        // LST derivation + session init, rederiving once if init answers 401
        void run_from_access_token();

        // full flow, or the fast path when pre-authorized tokens are configured
        void run(const std::optional<std::string>& verifier = std::nullopt);

        /**
         * Replace an LST the server rejected; derives exactly once, even if
         * session init then refuses the new token
         * @param stale_generation AuthSession::generation() of the rejected token
         * @return false when another caller already replaced it while we waited
         */
        bool refresh(uint64_t stale_generation);

        [[nodiscard]] const RequestSigner& signer() const { return signer_; }
        [[nodiscard]] const Config& config() const { return config_; }

    private:
        LiveSessionToken derive_locked();
        void init_locked();
        // a refresh is already the single re-derivation, so it passes false
        void establish_locked(bool retry_on_init_401 = true);

        void persist(const AccessToken& access, const LiveSessionToken& lst) const;

        // send and require a 200
        HttpResponse send_expecting_ok(FlowStep step, const HttpRequest& request);

        template <class Fn>
        auto guarded(FlowStep step, Fn&& fn) -> decltype(fn());
    };
} // namespace ibauth::auth
