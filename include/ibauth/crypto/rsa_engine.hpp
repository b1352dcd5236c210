#pragma once

#include <vector>
#include <string>
#include <memory>
#include <cstdint>
#include <openssl/evp.h>

namespace ibauth::crypto
{
    /**
     * RSA private key loaded from PEM
     * Used both for the RSA-SHA256 signing key and the PKCS#1 v1.5
     * encryption key that protects the access token secret
     */
    class RsaPrivateKey
    {
    private:
        EVP_PKEY* pkey_;

        // restricts construction to the factories below
        struct Token
        {
            explicit Token() = default;
        };

    public:
        // takes ownership of pkey
        RsaPrivateKey(Token, EVP_PKEY* pkey);
        ~RsaPrivateKey();

        // No copy
        RsaPrivateKey(const RsaPrivateKey&)            = delete;
        RsaPrivateKey& operator=(const RsaPrivateKey&) = delete;

        /**
         * Load an unencrypted PEM private key (PKCS#1 or PKCS#8)
         * @throws ConfigurationError if the file is missing or not an RSA key
         */
        static std::shared_ptr<RsaPrivateKey> from_pem_file(const std::string& path);

        /**
         * Parse an unencrypted PEM private key held in memory
         * @throws ConfigurationError if the text is not an RSA key
         */
        static std::shared_ptr<RsaPrivateKey> from_pem_string(const std::string& pem);

        /**
         * RSASSA-PKCS1-v1_5 signature over SHA-256(data)
         * @return Raw signature bytes
         * @throws SignatureError on failure
         */
        std::vector<uint8_t> sign_sha256(const std::vector<uint8_t>& data) const;

        /**
         * RSAES-PKCS1-v1_5 decryption
         * @throws SignatureError on corrupted ciphertext or wrong key
         */
        std::vector<uint8_t> decrypt_pkcs1(const std::vector<uint8_t>& ciphertext) const;

        [[nodiscard]] int bits() const;

        EVP_PKEY* get() const { return pkey_; }
    };

    /**
     * RSA-SHA256 signer for the bootstrap OAuth steps
     * (request token, access token, live session token)
     */
    class RsaSigner
    {
    private:
        std::shared_ptr<const RsaPrivateKey> key_;

    public:
        explicit RsaSigner(std::shared_ptr<const RsaPrivateKey> key);

        // base64 of the signature over base_string; not percent-encoded
        std::string sign(const std::string& base_string) const;
    };
} // namespace ibauth::crypto
