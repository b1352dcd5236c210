#pragma once

#include <string>
#include <vector>
#include <memory>
#include <cstdint>

#include "ibauth/crypto/crypto_utils.hpp"
#include "ibauth/crypto/rsa_engine.hpp"

namespace ibauth::auth
{
    /**
     * Client half of the Diffie-Hellman exchange that yields the live
     * session token
     *
     * One instance serves one derivation: the private exponent is created by
     * generate_challenge() and wiped once the shared secret is computed.
     */
    class DiffieHellmanExchange
    {
    private:
        using BigNum = crypto::CryptoUtils::BigNum;

        BigNum p_; // prime
        BigNum g_; // generator

        std::unique_ptr<BigNum> a_; // private exponent, never persisted

    public:
        DiffieHellmanExchange(const BigNum& prime, const BigNum& generator);
        ~DiffieHellmanExchange();

        DiffieHellmanExchange(const DiffieHellmanExchange&)            = delete;
        DiffieHellmanExchange& operator=(const DiffieHellmanExchange&) = delete;

        // step 1: draw a 256-bit exponent a, return A = g^a mod p as lowercase hex
        std::string generate_challenge();

        /**
         * step 2: K = B^a mod p as sign-extended big-endian bytes
         * (leading 0x00 when the top bit is set); discards a
         * @param response_hex Server value B in hex
         * @throws SignatureError if no challenge is pending or B is out of range
         */
        std::vector<uint8_t> compute_shared_secret(const std::string& response_hex);

        [[nodiscard]] bool has_pending_challenge() const { return a_ != nullptr; }

        // LST = base64(HMAC-SHA1(K, base64_decode(access_token_secret)))
        static std::string derive_live_session_token(
            const std::vector<uint8_t>& shared_secret,
            const std::string& access_token_secret_b64);

        /**
         * Compare the server's live_session_token_signature (hex HMAC-SHA1
         * computed like the LST) with the local value, case-insensitively
         */
        static bool verify_live_session_token(
            const std::vector<uint8_t>& shared_secret,
            const std::string& access_token_secret_b64,
            const std::string& signature_hex);

        /**
         * Decrypt the access token secret with the encryption key and
         * hex-encode it for use as the base string prepend
         * @throws SignatureError on corrupted ciphertext
         */
        static std::string decrypt_prepend(
            const crypto::RsaPrivateKey& encryption_key,
            const std::string& access_token_secret_b64);

    private:
        void discard_exponent();
    };
} // namespace ibauth::auth
