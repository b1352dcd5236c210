#include "ibauth/client/authenticated_client.hpp"

#include <mutex>
#include <utility>

#include "ibauth/auth/oauth_types.hpp"
#include "ibauth/common/errors.hpp"
#include "ibauth/common/logging.hpp"

namespace ibauth::client
{
    AuthenticatedClient::AuthenticatedClient(
        AuthSession& session,
        std::shared_ptr<const auth::Credentials> credentials,
        Config config,
        HttpTransport& transport,
        const auth::TokenStore* token_store)
        : session_(session)
          , transport_(transport)
          , token_store_(token_store)
          , flow_(std::move(credentials), std::move(config), transport, session, token_store)
    {
    }

    void AuthenticatedClient::authenticate()
    {
        if (resume_persisted_session())
            return;

        flow_.run();
    }

    bool AuthenticatedClient::resume_persisted_session()
    {
        if (!token_store_)
            return false;

        auto record = token_store_->load();
        if (!record)
            return false;

        const auto& credentials = flow_.signer().credentials();
        const auto& config      = flow_.config();

        if (record->consumer_key != credentials.consumer_key ||
            (!record->realm.empty() && record->realm != credentials.realm))
        {
            logger()->info("Token file {} belongs to another consumer, ignoring it", token_store_->path());
            return false;
        }

        if (config.access_token && *config.access_token != record->access_token)
        {
            logger()->info("Configured access token differs from the token file, ignoring it");
            return false;
        }

        {
            std::lock_guard<std::mutex> lock(session_.derivation_mutex());
            session_.set_access_token(AccessToken{record->access_token, record->access_token_secret});
            session_.set_live_session_token(LiveSessionToken{record->live_session_token, false});
        }

        if (check_liveness())
        {
            logger()->info("Reusing persisted live session token from {}", record->timestamp);
            return true;
        }

        logger()->warn("Persisted live session token is no longer accepted, deriving a new one");
        session_.invalidate_live_session_token();
        flow_.run_from_access_token();
        return true;
    }

    bool AuthenticatedClient::is_authenticated() const
    {
        return session_.is_authenticated();
    }

    std::string AuthenticatedClient::resolve_url(const std::string& endpoint) const
    {
        if (endpoint.rfind("http://", 0) == 0 || endpoint.rfind("https://", 0) == 0)
            return endpoint;

        const auto& base = flow_.config().api_base_url;
        if (!endpoint.empty() && endpoint.front() != '/')
            return base + "/" + endpoint;
        return base + endpoint;
    }

    HttpRequest AuthenticatedClient::sign_with(
        const AuthSession::SigningMaterial& material,
        const std::string& method,
        const std::string& endpoint,
        const ParamMap& query,
        const ParamMap& form) const
    {
        return flow_.signer().hmac_request(method, resolve_url(endpoint), query, form,
                                           material.access_token, material.live_session_token);
    }

    HttpRequest AuthenticatedClient::sign_request(
        const std::string& method,
        const std::string& endpoint,
        const ParamMap& query,
        const ParamMap& form) const
    {
        auto material = session_.signing_material();
        if (!material)
            throw NotAuthenticatedError("No live session token; call authenticate() first");

        return sign_with(*material, method, endpoint, query, form);
    }

    HttpResponse AuthenticatedClient::request(
        const std::string& method,
        const std::string& endpoint,
        const ParamMap& query,
        const ParamMap& form)
    {
        auto material = session_.signing_material();
        if (!material)
            throw NotAuthenticatedError("No live session token; call authenticate() first");

        const auto timeout = flow_.config().http_timeout;

        auto response = transport_.send(sign_with(*material, method, endpoint, query, form), timeout);
        if (response.status != 401)
            return response;

        logger()->warn("{} {} returned 401", method, endpoint);
        flow_.refresh(material->generation);

        material = session_.signing_material();
        if (!material)
            throw NotAuthenticatedError("Live session token re-derivation left no token");

        response = transport_.send(sign_with(*material, method, endpoint, query, form), timeout);
        if (response.status == 401)
        {
            {
                // a token derived by another caller meanwhile is left alone
                std::lock_guard<std::mutex> lock(session_.derivation_mutex());
                session_.invalidate_if(material->generation);
            }
            session_.mark_failed(FlowStep::AUTHENTICATED_CALL);
            throw SessionExpiredError(response.status, response.body);
        }

        return response;
    }

    bool AuthenticatedClient::check_liveness()
    {
        auto material = session_.signing_material();
        if (!material)
            throw NotAuthenticatedError("No live session token to check");

        auto response = transport_.send(sign_with(*material, "GET", auth::LIVENESS_CHECK_PATH, {}, {}),
                                        flow_.config().http_timeout);

        if (response.status == 200)
        {
            session_.set_state(AuthState::SESSION_INITIALIZED);
            return true;
        }

        logger()->info("Liveness check returned HTTP {}", response.status);
        return false;
    }
} // namespace ibauth::client
