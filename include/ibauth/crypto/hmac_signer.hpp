#pragma once

#include <string>

namespace ibauth::crypto
{
    /**
     * HMAC-SHA256 signer for every call made after the live session token
     * has been derived
     */
    class HmacSigner
    {
    public:
        /**
         * Sign a canonical base string
         * @param base_string Canonical OAuth base string
         * @param live_session_token_b64 LST as stored (base64); decoded to the raw key
         * @return Base64 signature, not percent-encoded
         * @throws SignatureError if the LST is not valid base64
         */
        static std::string sign(const std::string& base_string, const std::string& live_session_token_b64);
    };
} // namespace ibauth::crypto
