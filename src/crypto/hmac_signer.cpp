#include "ibauth/crypto/hmac_signer.hpp"

#include "ibauth/common/errors.hpp"
#include "ibauth/crypto/crypto_utils.hpp"

namespace ibauth::crypto
{
    std::string HmacSigner::sign(const std::string& base_string, const std::string& live_session_token_b64)
    {
        if (live_session_token_b64.empty())
            throw SignatureError("Cannot HMAC-sign without a live session token");

        // the key is the decoded digest, not the base64 text
        auto key = CryptoUtils::base64_to_bytes(live_session_token_b64);
        auto mac = CryptoUtils::hmac_sha256(key, CryptoUtils::to_bytes(base_string));
        return CryptoUtils::bytes_to_base64(mac);
    }
} // namespace ibauth::crypto
