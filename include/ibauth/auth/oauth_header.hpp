#pragma once

#include <string>

#include "ibauth/common/types.hpp"

namespace ibauth::auth
{
    /**
     * Authorization header assembly and per-call OAuth values
     *
     * The two signature encodings are deliberately separate: the bootstrap
     * steps embed the RSA signature as raw base64, the HMAC-signed calls
     * embed it percent-encoded.
     */
    class OAuthHeader
    {
    public:
        // 32 alphanumeric characters from RAND_bytes; safe to call from any thread
        static std::string generate_nonce();

        // seconds since the Unix epoch
        static std::string generate_timestamp();

        // RSA-SHA256 bootstrap steps: base64 as-is
        static std::string encode_rsa_signature(const std::string& signature_b64);

        // HMAC-SHA256 calls: percent-encoded base64
        static std::string encode_hmac_signature(const std::string& signature_b64);

        /**
         * OAuth realm="<realm>", k1="v1", k2="v2", ...
         * @param realm Realm, always emitted first
         * @param oauth_params OAuth parameters without realm or signature;
         *                     values are percent-encoded here
         * @param encoded_signature Output of one of the encode_*_signature functions
         */
        static std::string build(
            const std::string& realm,
            const ParamMap& oauth_params,
            const std::string& encoded_signature);
    };
} // namespace ibauth::auth
