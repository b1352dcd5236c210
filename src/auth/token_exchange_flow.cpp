#include "ibauth/auth/token_exchange_flow.hpp"

#include <mutex>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <openssl/crypto.h>

#include "ibauth/auth/dh_exchange.hpp"
#include "ibauth/auth/oauth_types.hpp"
#include "ibauth/common/errors.hpp"
#include "ibauth/common/logging.hpp"

namespace ibauth::auth
{
    using json = nlohmann::json;

    namespace
    {
        json parse_body(const FlowStep step, const HttpResponse& response)
        {
            try
            {
                auto body = json::parse(response.body);
                if (!body.is_object())
                    throw ProtocolError(step, response.status, response.body,
                                        flow_step_to_string(step) + ": response is not a JSON object");
                return body;
            }
            catch (const json::exception& e)
            {
                throw ProtocolError(step, response.status, response.body,
                                    flow_step_to_string(step) + ": malformed JSON response: " + e.what());
            }
        }

        std::string required_string(
            const FlowStep step,
            const HttpResponse& response,
            const json& body,
            const char* key)
        {
            auto it = body.find(key);
            if (it == body.end() || !it->is_string() || it->get<std::string>().empty())
                throw ProtocolError(step, response.status, response.body,
                                    flow_step_to_string(step) + ": response lacks " + key);
            return it->get<std::string>();
        }

        std::optional<std::string> optional_string(const json& body, const char* key)
        {
            auto it = body.find(key);
            if (it == body.end() || !it->is_string())
                return std::nullopt;
            return it->get<std::string>();
        }
    }

    TokenExchangeFlow::TokenExchangeFlow(
        std::shared_ptr<const Credentials> credentials,
        Config config,
        client::HttpTransport& transport,
        client::AuthSession& session,
        const TokenStore* token_store)
        : credentials_(std::move(credentials))
          , config_(std::move(config))
          , transport_(transport)
          , session_(session)
          , token_store_(token_store)
          , signer_(credentials_)
    {
        if (!credentials_)
            throw ConfigurationError("TokenExchangeFlow requires credentials");
    }

    template <class Fn>
    auto TokenExchangeFlow::guarded(const FlowStep step, Fn&& fn) -> decltype(fn())
    {
        try
        {
            return fn();
        }
        catch (const AuthError& e)
        {
            session_.mark_failed(step);
            logger()->error("Step {} failed: {}", flow_step_to_string(step), e.what());
            throw;
        }
    }

    HttpResponse TokenExchangeFlow::send_expecting_ok(const FlowStep step, const HttpRequest& request)
    {
        auto response = transport_.send(request, config_.http_timeout);
        if (response.status != 200)
            throw ProtocolError(step, response.status, response.body,
                                flow_step_to_string(step) + " returned HTTP " + std::to_string(response.status));
        return response;
    }

    RequestToken TokenExchangeFlow::request_token()
    {
        return guarded(FlowStep::REQUEST_TOKEN, [this]
        {
            auto request = signer_.rsa_request(
                config_.api_base_url + REQUEST_TOKEN_PATH,
                {{OAUTH_CALLBACK, OAUTH_CALLBACK_OOB}});

            auto response = send_expecting_ok(FlowStep::REQUEST_TOKEN, request);
            auto body     = parse_body(FlowStep::REQUEST_TOKEN, response);

            RequestToken token{required_string(FlowStep::REQUEST_TOKEN, response, body, OAUTH_TOKEN)};
            session_.set_request_token(token);

            logger()->info("Obtained request token");
            return token;
        });
    }

    AccessToken TokenExchangeFlow::access_token(const std::optional<std::string>& verifier)
    {
        std::lock_guard<std::mutex> lock(session_.derivation_mutex());

        return guarded(FlowStep::ACCESS_TOKEN, [this, &verifier]
        {
            auto request_token = session_.request_token();
            if (!request_token)
                throw AuthError("No request token; call request_token() first");

            ParamMap params{{OAUTH_TOKEN, request_token->token}};
            if (verifier && !verifier->empty())
                params[OAUTH_VERIFIER] = *verifier;

            auto request  = signer_.rsa_request(config_.api_base_url + ACCESS_TOKEN_PATH, params);
            auto response = send_expecting_ok(FlowStep::ACCESS_TOKEN, request);
            auto body     = parse_body(FlowStep::ACCESS_TOKEN, response);

            AccessToken token{
                .token = required_string(FlowStep::ACCESS_TOKEN, response, body, OAUTH_TOKEN),
                .encrypted_secret = required_string(FlowStep::ACCESS_TOKEN, response, body, OAUTH_TOKEN_SECRET)
            };
            session_.set_access_token(token);

            logger()->info("Obtained access token {}", redact(token.token));
            return token;
        });
    }

    LiveSessionToken TokenExchangeFlow::live_session_token()
    {
        std::lock_guard<std::mutex> lock(session_.derivation_mutex());
        return derive_locked();
    }

    void TokenExchangeFlow::init_brokerage_session()
    {
        std::lock_guard<std::mutex> lock(session_.derivation_mutex());
        init_locked();
    }

    void TokenExchangeFlow::run_from_access_token()
    {
        std::lock_guard<std::mutex> lock(session_.derivation_mutex());
        establish_locked();
    }

    void TokenExchangeFlow::run(const std::optional<std::string>& verifier)
    {
        if (config_.has_preauthorized_tokens())
        {
            logger()->info("Using pre-authorized access token {}", redact(*config_.access_token));

            std::lock_guard<std::mutex> lock(session_.derivation_mutex());
            session_.set_access_token(AccessToken{*config_.access_token, *config_.access_token_secret});
            establish_locked();
            return;
        }

        request_token();
        access_token(verifier);
        run_from_access_token();
    }

    bool TokenExchangeFlow::refresh(const uint64_t stale_generation)
    {
        std::lock_guard<std::mutex> lock(session_.derivation_mutex());

        if (session_.generation() != stale_generation && session_.is_authenticated())
        {
            logger()->debug("Live session token already replaced by another caller");
            return false;
        }

        logger()->warn("Live session token rejected, deriving a new one");

        // the rejected token stays in place until its replacement is set
        try
        {
            establish_locked(false);
        }
        catch (const AuthError&)
        {
            session_.invalidate_live_session_token();
            throw;
        }
        return true;
    }

    void TokenExchangeFlow::establish_locked(const bool retry_on_init_401)
    {
        derive_locked();

        try
        {
            init_locked();
        }
        catch (const ProtocolError& e)
        {
            if (e.status() != 401 || !retry_on_init_401)
                throw;

            // the fresh LST was refused: start over from HasAccessToken once
            logger()->warn("Session init rejected the new live session token, rederiving");
            derive_locked();
            init_locked();
        }
    }

    LiveSessionToken TokenExchangeFlow::derive_locked()
    {
        return guarded(FlowStep::LIVE_SESSION_TOKEN, [this]
        {
            auto access = session_.access_token();
            if (!access)
                throw AuthError("No access token; cannot derive a live session token");

            DiffieHellmanExchange dh(*credentials_->dh_prime, *credentials_->dh_generator);

            auto prepend   = DiffieHellmanExchange::decrypt_prepend(*credentials_->encryption_key,
                                                                    access->encrypted_secret);
            auto challenge = dh.generate_challenge();

            auto request = signer_.rsa_request(
                config_.api_base_url + LIVE_SESSION_TOKEN_PATH,
                {{DH_CHALLENGE, challenge}, {OAUTH_TOKEN, access->token}},
                prepend);
            OPENSSL_cleanse(prepend.data(), prepend.size());

            auto response = send_expecting_ok(FlowStep::LIVE_SESSION_TOKEN, request);
            auto body     = parse_body(FlowStep::LIVE_SESSION_TOKEN, response);

            auto dh_response = required_string(FlowStep::LIVE_SESSION_TOKEN, response, body, DH_RESPONSE);

            std::vector<uint8_t> shared_secret;
            try
            {
                shared_secret = dh.compute_shared_secret(dh_response);
            }
            catch (const SignatureError& e)
            {
                throw ProtocolError(FlowStep::LIVE_SESSION_TOKEN, response.status, response.body,
                                    std::string("Invalid ") + DH_RESPONSE + ": " + e.what());
            }

            LiveSessionToken lst{
                .value_b64 = DiffieHellmanExchange::derive_live_session_token(shared_secret, access->encrypted_secret),
                .verified = false
            };

            if (auto signature = optional_string(body, LST_SIGNATURE))
            {
                lst.verified = DiffieHellmanExchange::verify_live_session_token(
                    shared_secret, access->encrypted_secret, *signature);
                if (!lst.verified)
                    logger()->warn("Live session token signature mismatch; using the derived token anyway");
            }
            else
            {
                logger()->warn("Response carries no {}, token unverified", LST_SIGNATURE);
            }

            OPENSSL_cleanse(shared_secret.data(), shared_secret.size());

            session_.set_live_session_token(lst);
            logger()->info("Derived live session token (verified: {})", lst.verified);
            logger()->debug("Live session token {}", redact(lst.value_b64));

            persist(*access, lst);
            return lst;
        });
    }

    void TokenExchangeFlow::init_locked()
    {
        guarded(FlowStep::SESSION_INIT, [this]
        {
            auto material = session_.signing_material();
            if (!material)
                throw NotAuthenticatedError("No live session token; cannot initialize a brokerage session");

            std::vector<std::string> bases;
            if (!config_.gateway_base_url.empty())
                bases.push_back(config_.gateway_base_url);
            if (config_.api_base_url != config_.gateway_base_url)
                bases.push_back(config_.api_base_url);

            const ParamMap form{{"compete", "false"}, {"publish", "true"}};

            std::optional<HttpResponse> rejected;
            std::string transport_failure;

            for (const auto& base : bases)
            {
                auto request = signer_.hmac_request("POST", base + SESSION_INIT_PATH, {}, form,
                                                    material->access_token, material->live_session_token);

                HttpResponse response;
                try
                {
                    response = transport_.send(request, config_.http_timeout);
                }
                catch (const TransportError& e)
                {
                    logger()->warn("Session init unreachable at {}: {}", base, e.what());
                    transport_failure = e.what();
                    continue;
                }

                if (response.status == 200)
                {
                    session_.set_state(AuthState::SESSION_INITIALIZED);
                    logger()->info("Brokerage session initialized via {}", base);
                    return;
                }

                logger()->warn("Session init at {} returned HTTP {}", base, response.status);
                if (!rejected || response.status == 401)
                    rejected = response;
            }

            if (rejected && rejected->status == 401)
            {
                session_.invalidate_live_session_token();
                throw ProtocolError(FlowStep::SESSION_INIT, 401, rejected->body,
                                    "Session init rejected the live session token");
            }

            if (rejected)
                throw ProtocolError(FlowStep::SESSION_INIT, rejected->status, rejected->body,
                                    "Session init returned HTTP " + std::to_string(rejected->status));

            throw TransportError("Session init unreachable: " + transport_failure);
        });
    }

    void TokenExchangeFlow::persist(const AccessToken& access, const LiveSessionToken& lst) const
    {
        if (!token_store_)
            return;

        token_store_->save(PersistedTokenRecord{
            .access_token = access.token,
            .access_token_secret = access.encrypted_secret,
            .live_session_token = lst.value_b64,
            .consumer_key = credentials_->consumer_key,
            .realm = credentials_->realm,
            .timestamp = TokenStore::current_timestamp()
        });
    }
} // namespace ibauth::auth
