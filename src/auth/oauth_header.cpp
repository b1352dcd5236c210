#include "ibauth/auth/oauth_header.hpp"

#include <chrono>

#include "ibauth/auth/canonical_request.hpp"
#include "ibauth/auth/oauth_types.hpp"
#include "ibauth/crypto/crypto_utils.hpp"

namespace ibauth::auth
{
    std::string OAuthHeader::generate_nonce()
    {
        static constexpr char kAlphabet[] =
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
        static constexpr size_t kAlphabetSize = sizeof(kAlphabet) - 1;

        // rejection sampling keeps the distribution uniform (248 = 4 * 62)
        std::string nonce;
        nonce.reserve(NONCE_LENGTH);
        while (nonce.size() < NONCE_LENGTH)
        {
            for (const uint8_t b : crypto::CryptoUtils::random_bytes(NONCE_LENGTH))
            {
                if (b >= 248)
                    continue;
                nonce.push_back(kAlphabet[b % kAlphabetSize]);
                if (nonce.size() == NONCE_LENGTH)
                    break;
            }
        }
        return nonce;
    }

    std::string OAuthHeader::generate_timestamp()
    {
        auto now = std::chrono::system_clock::now().time_since_epoch();
        return std::to_string(std::chrono::duration_cast<std::chrono::seconds>(now).count());
    }

    std::string OAuthHeader::encode_rsa_signature(const std::string& signature_b64)
    {
        return signature_b64;
    }

    std::string OAuthHeader::encode_hmac_signature(const std::string& signature_b64)
    {
        return CanonicalRequestBuilder::percent_encode(signature_b64);
    }

    std::string OAuthHeader::build(
        const std::string& realm,
        const ParamMap& oauth_params,
        const std::string& encoded_signature)
    {
        ParamMap values;
        for (const auto& [key, value] : oauth_params)
        {
            if (key == REALM || key == OAUTH_SIGNATURE)
                continue;
            values[key] = CanonicalRequestBuilder::percent_encode(value);
        }
        values[OAUTH_SIGNATURE] = encoded_signature;

        std::string header = "OAuth realm=\"" + realm + "\"";
        for (const auto& [key, value] : values)
            header += ", " + key + "=\"" + value + "\"";
        return header;
    }
} // namespace ibauth::auth
