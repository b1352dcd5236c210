#include "ibauth/auth/request_signer.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "ibauth/auth/canonical_request.hpp"
#include "ibauth/auth/oauth_header.hpp"
#include "ibauth/auth/oauth_types.hpp"
#include "ibauth/common/errors.hpp"
#include "ibauth/common/logging.hpp"
#include "ibauth/crypto/hmac_signer.hpp"

namespace ibauth::auth
{
    RequestSigner::RequestSigner(std::shared_ptr<const Credentials> credentials)
        : credentials_(std::move(credentials))
          , rsa_signer_(credentials_ ? credentials_->signing_key : nullptr)
    {
    }

    ParamMap RequestSigner::base_oauth_params(const SignatureMethod method) const
    {
        return {
            {OAUTH_CONSUMER_KEY, credentials_->consumer_key},
            {OAUTH_NONCE, OAuthHeader::generate_nonce()},
            {OAUTH_SIGNATURE_METHOD, signature_method_to_string(method)},
            {OAUTH_TIMESTAMP, OAuthHeader::generate_timestamp()}
        };
    }

    std::string RequestSigner::encode_form(const ParamMap& params)
    {
        return CanonicalRequestBuilder::parameter_string(params);
    }

    HttpRequest RequestSigner::rsa_request(
        const std::string& url,
        const ParamMap& params,
        const std::string& prepend) const
    {
        auto oauth_params = base_oauth_params(SignatureMethod::RSA_SHA256);
        for (const auto& [key, value] : params)
            oauth_params[key] = value;

        auto base_string = CanonicalRequestBuilder::build("POST", url, oauth_params, prepend);
        auto signature   = rsa_signer_.sign(base_string);
        auto header      = OAuthHeader::build(credentials_->realm, oauth_params,
                                              OAuthHeader::encode_rsa_signature(signature));

        // the prepend is the decrypted access token secret
        if (prepend.empty())
            logger()->trace("RSA base string for {}: {}", url, base_string);
        else
            logger()->trace("RSA base string for {}: {}{}", url, redact(prepend), base_string.substr(prepend.size()));
        logger()->trace("Authorization: {}", header);

        return HttpRequest{
            .method = "POST",
            .url = url,
            .headers = {
                {"Authorization", header},
                {"Accept", "application/json"},
                {"Content-Length", "0"}
            },
            .body = ""
        };
    }

    HttpRequest RequestSigner::hmac_request(
        const std::string& verb,
        const std::string& url,
        const ParamMap& query,
        const ParamMap& form,
        const std::string& access_token,
        const std::string& live_session_token_b64) const
    {
        std::string method = verb;
        std::transform(method.begin(), method.end(), method.begin(),
                       [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });

        const bool has_body = method == "POST" || method == "PUT";
        if (!form.empty() && !has_body)
            throw AuthError("Form parameters are only allowed for POST and PUT, got " + method);

        auto oauth_params           = base_oauth_params(SignatureMethod::HMAC_SHA256);
        oauth_params[OAUTH_TOKEN]   = access_token;
        oauth_params[OAUTH_VERSION] = OAUTH_VERSION_1_0;

        // request parameters are signed alongside the OAuth ones
        auto signed_params = oauth_params;
        for (const auto& [key, value] : query)
            signed_params[key] = value;
        for (const auto& [key, value] : form)
            signed_params[key] = value;

        auto base_string = CanonicalRequestBuilder::build(method, url, signed_params);
        auto signature   = crypto::HmacSigner::sign(base_string, live_session_token_b64);
        auto header      = OAuthHeader::build(credentials_->realm, oauth_params,
                                              OAuthHeader::encode_hmac_signature(signature));

        logger()->trace("HMAC base string for {} {}: {}", method, url, base_string);
        logger()->trace("Authorization: {}", header);

        HttpRequest request{
            .method = method,
            .url = query.empty() ? url : url + "?" + encode_form(query),
            .headers = {
                {"Authorization", header},
                {"Accept", "application/json"}
            },
            .body = ""
        };

        if (!form.empty())
        {
            request.headers["Content-Type"] = "application/x-www-form-urlencoded";
            request.body                    = encode_form(form);
        }
        else if (has_body)
        {
            request.headers["Content-Length"] = "0";
        }

        return request;
    }
} // namespace ibauth::auth
