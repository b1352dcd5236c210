#pragma once

#include <string>

#include "ibauth/common/types.hpp"

namespace ibauth::auth
{
    /**
     * OAuth 1.0a signature base string construction, including the
     * corrections the IBKR servers apply to their own canonical form
     */
    class CanonicalRequestBuilder
    {
    public:
        /**
         * Percent-encode every byte except ALPHA / DIGIT / "-" / "." / "_" / "~"
         * ("/", ":", "," and "|" are encoded too); hex digits are uppercase
         */
        static std::string percent_encode(const std::string& value);

        /**
         * Build the base string
         * @param method HTTP method, upper-cased in the output
         * @param url Full URL without query string
         * @param params OAuth and request parameters, realm excluded
         * @param prepend Hex of the decrypted access token secret; only for the
         *                live session token request, prefixed verbatim
         * @return METHOD&enc(url)&enc(k1=enc(v1)&k2=enc(v2)...) with corrections applied
         */
        static std::string build(
            const std::string& method,
            const std::string& url,
            const ParamMap& params,
            const std::string& prepend = "");

        // %257C -> %7C, %252C -> %2C, %253A -> %3A
        static std::string apply_corrections(std::string base_string);

        // k1=enc(v1)&k2=enc(v2) in key order
        static std::string parameter_string(const ParamMap& params);
    };
} // namespace ibauth::auth
