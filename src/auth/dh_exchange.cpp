#include "ibauth/auth/dh_exchange.hpp"

#include <algorithm>
#include <cctype>
#include <openssl/crypto.h>

#include "ibauth/auth/oauth_types.hpp"
#include "ibauth/common/errors.hpp"

namespace ibauth::auth
{
    using crypto::CryptoUtils;

    DiffieHellmanExchange::DiffieHellmanExchange(const BigNum& prime, const BigNum& generator)
        : p_(prime.copy())
          , g_(generator.copy())
    {
        BigNum one(1UL);
        if (BN_cmp(g_.get(), one.get()) <= 0 || BN_cmp(g_.get(), p_.get()) >= 0)
            throw ConfigurationError("DH generator must satisfy 1 < g < p");
    }

    DiffieHellmanExchange::~DiffieHellmanExchange() = default;

    std::string DiffieHellmanExchange::generate_challenge()
    {
        a_ = std::make_unique<BigNum>(CryptoUtils::random_bits(DH_EXPONENT_BITS));
        return CryptoUtils::mod_exp(g_, *a_, p_).to_hex();
    }

    std::vector<uint8_t> DiffieHellmanExchange::compute_shared_secret(const std::string& response_hex)
    {
        if (!a_)
            throw SignatureError("Must call generate_challenge() first");

        BigNum B(response_hex);

        // reject 0, 1, p-1 and anything >= p
        BigNum one(1UL);
        BigNum p_minus_one = p_.copy();
        if (!BN_sub_word(p_minus_one.get(), 1))
            throw SignatureError("Failed to calculate p - 1");

        if (BN_cmp(B.get(), one.get()) <= 0 || BN_cmp(B.get(), p_minus_one.get()) >= 0)
        {
            discard_exponent();
            throw SignatureError("Diffie-Hellman response out of range");
        }

        // K = B^a mod p
        auto K = CryptoUtils::mod_exp(B, *a_, p_);
        discard_exponent();

        return K.to_signed_bytes();
    }

    void DiffieHellmanExchange::discard_exponent()
    {
        a_.reset();
    }

    std::string DiffieHellmanExchange::derive_live_session_token(
        const std::vector<uint8_t>& shared_secret,
        const std::string& access_token_secret_b64)
    {
        auto secret = CryptoUtils::base64_to_bytes(access_token_secret_b64);
        auto digest = CryptoUtils::hmac_sha1(shared_secret, secret);
        OPENSSL_cleanse(secret.data(), secret.size());
        return CryptoUtils::bytes_to_base64(digest);
    }

    bool DiffieHellmanExchange::verify_live_session_token(
        const std::vector<uint8_t>& shared_secret,
        const std::string& access_token_secret_b64,
        const std::string& signature_hex)
    {
        auto secret   = CryptoUtils::base64_to_bytes(access_token_secret_b64);
        auto expected = CryptoUtils::bytes_to_hex(CryptoUtils::hmac_sha1(shared_secret, secret));
        OPENSSL_cleanse(secret.data(), secret.size());

        std::string actual = signature_hex;
        std::transform(actual.begin(), actual.end(), actual.begin(),
                       [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (actual.size() != expected.size())
            return false;

        return CRYPTO_memcmp(actual.data(), expected.data(), expected.size()) == 0;
    }

    std::string DiffieHellmanExchange::decrypt_prepend(
        const crypto::RsaPrivateKey& encryption_key,
        const std::string& access_token_secret_b64)
    {
        auto ciphertext = CryptoUtils::base64_to_bytes(access_token_secret_b64);
        auto plaintext  = encryption_key.decrypt_pkcs1(ciphertext);
        auto prepend    = CryptoUtils::bytes_to_hex(plaintext);
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        return prepend;
    }
} // namespace ibauth::auth
