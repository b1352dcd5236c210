#pragma once

#include <string>
#include <memory>

#include "ibauth/common/types.hpp"
#include "ibauth/auth/credential_store.hpp"
#include "ibauth/crypto/rsa_engine.hpp"

namespace ibauth::auth
{
    /**
     * Turns (method, url, params) into a fully signed HttpRequest
     *
     * Bootstrap requests are RSA-SHA256 signed bodyless POSTs; everything
     * after the live session token is HMAC-SHA256 signed with oauth_version.
     */
    class RequestSigner
    {
    private:
        std::shared_ptr<const Credentials> credentials_;
        crypto::RsaSigner rsa_signer_;

    public:
        explicit RequestSigner(std::shared_ptr<const Credentials> credentials);

        /**
         * RSA-SHA256 signed POST for the OAuth token endpoints
         * @param url Endpoint URL
         * @param params Step-specific parameters (oauth_callback, oauth_token,
         *               oauth_verifier, diffie_hellman_challenge ...)
         * @param prepend Hex prepend for the live session token step, else empty
         */
        HttpRequest rsa_request(
            const std::string& url,
            const ParamMap& params,
            const std::string& prepend = "") const;

        /**
         * HMAC-SHA256 signed request for any endpoint
         * @param verb HTTP method, any case
         * @param query Sent in the URL and signed
         * @param form Sent as application/x-www-form-urlencoded (non-GET only) and signed
         */
        HttpRequest hmac_request(
            const std::string& verb,
            const std::string& url,
            const ParamMap& query,
            const ParamMap& form,
            const std::string& access_token,
            const std::string& live_session_token_b64) const;

        // k1=enc(v1)&k2=enc(v2), used for query strings and form bodies
        static std::string encode_form(const ParamMap& params);

        [[nodiscard]] const Credentials& credentials() const { return *credentials_; }

    private:
        ParamMap base_oauth_params(SignatureMethod method) const;
    };
} // namespace ibauth::auth
