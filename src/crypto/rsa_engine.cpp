#include "ibauth/crypto/rsa_engine.hpp"

#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/bio.h>
#include <fstream>
#include <sstream>
#include <utility>

#include "ibauth/common/errors.hpp"
#include "ibauth/crypto/crypto_utils.hpp"

namespace ibauth::crypto
{
    namespace
    {
        class DigestContext
        {
        private:
            EVP_MD_CTX* ctx_;

        public:
            DigestContext() : ctx_(EVP_MD_CTX_new())
            {
                if (!ctx_)
                    throw SignatureError("Failed to create digest context");
            }

            ~DigestContext() { EVP_MD_CTX_free(ctx_); }

            DigestContext(const DigestContext&)            = delete;
            DigestContext& operator=(const DigestContext&) = delete;

            EVP_MD_CTX* get() { return ctx_; }
        };

        class PkeyContext
        {
        private:
            EVP_PKEY_CTX* ctx_;

        public:
            explicit PkeyContext(EVP_PKEY* pkey) : ctx_(EVP_PKEY_CTX_new(pkey, nullptr))
            {
                if (!ctx_)
                    throw SignatureError("Failed to create key context");
            }

            ~PkeyContext() { EVP_PKEY_CTX_free(ctx_); }

            PkeyContext(const PkeyContext&)            = delete;
            PkeyContext& operator=(const PkeyContext&) = delete;

            EVP_PKEY_CTX* get() { return ctx_; }
        };
    }

    RsaPrivateKey::RsaPrivateKey(Token, EVP_PKEY* pkey)
        : pkey_(pkey)
    {
    }

    RsaPrivateKey::~RsaPrivateKey()
    {
        if (pkey_)
            EVP_PKEY_free(pkey_);
    }

    std::shared_ptr<RsaPrivateKey> RsaPrivateKey::from_pem_file(const std::string& path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
            throw ConfigurationError("Cannot open RSA key file: " + path);

        std::ostringstream oss;
        oss << file.rdbuf();

        try
        {
            return from_pem_string(oss.str());
        }
        catch (const ConfigurationError& e)
        {
            throw ConfigurationError(std::string(e.what()) + " (" + path + ")");
        }
    }

    std::shared_ptr<RsaPrivateKey> RsaPrivateKey::from_pem_string(const std::string& pem)
    {
        BIO* bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
        if (!bio)
            throw ConfigurationError("Failed to create PEM buffer");

        EVP_PKEY* pkey = PEM_read_bio_PrivateKey(bio, nullptr, nullptr, nullptr);
        BIO_free(bio);

        if (!pkey)
            throw ConfigurationError("Failed to parse PEM private key");

        if (EVP_PKEY_get_base_id(pkey) != EVP_PKEY_RSA)
        {
            EVP_PKEY_free(pkey);
            throw ConfigurationError("Private key is not an RSA key");
        }

        return std::make_shared<RsaPrivateKey>(Token{}, pkey);
    }

    std::vector<uint8_t> RsaPrivateKey::sign_sha256(const std::vector<uint8_t>& data) const
    {
        DigestContext ctx;
        EVP_PKEY_CTX* pctx = nullptr;

        if (EVP_DigestSignInit(ctx.get(), &pctx, EVP_sha256(), nullptr, pkey_) != 1)
            throw SignatureError("Failed to initialize RSA-SHA256 signing");

        if (EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PADDING) != 1)
            throw SignatureError("Failed to set PKCS#1 v1.5 padding");

        size_t sig_len = 0;
        if (EVP_DigestSign(ctx.get(), nullptr, &sig_len, data.data(), data.size()) != 1)
            throw SignatureError("Failed to size RSA signature");

        std::vector<uint8_t> signature(sig_len);
        if (EVP_DigestSign(ctx.get(), signature.data(), &sig_len, data.data(), data.size()) != 1)
            throw SignatureError("RSA-SHA256 signing failed");

        signature.resize(sig_len);
        return signature;
    }

    std::vector<uint8_t> RsaPrivateKey::decrypt_pkcs1(const std::vector<uint8_t>& ciphertext) const
    {
        if (ciphertext.empty())
            throw SignatureError("Empty RSA ciphertext");

        PkeyContext ctx(pkey_);

        if (EVP_PKEY_decrypt_init(ctx.get()) != 1)
            throw SignatureError("Failed to initialize RSA decryption");

        if (EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_PADDING) != 1)
            throw SignatureError("Failed to set PKCS#1 v1.5 padding");

        size_t out_len = 0;
        if (EVP_PKEY_decrypt(ctx.get(), nullptr, &out_len, ciphertext.data(), ciphertext.size()) != 1)
            throw SignatureError("Failed to size RSA plaintext");

        std::vector<uint8_t> plaintext(out_len);
        if (EVP_PKEY_decrypt(ctx.get(), plaintext.data(), &out_len, ciphertext.data(), ciphertext.size()) != 1)
            throw SignatureError("RSA decryption failed - ciphertext corrupted or wrong key");

        plaintext.resize(out_len);
        return plaintext;
    }

    int RsaPrivateKey::bits() const
    {
        return EVP_PKEY_get_bits(pkey_);
    }

    RsaSigner::RsaSigner(std::shared_ptr<const RsaPrivateKey> key)
        : key_(std::move(key))
    {
        if (!key_)
            throw ConfigurationError("RSA signer requires a signing key");
    }

    std::string RsaSigner::sign(const std::string& base_string) const
    {
        auto signature = key_->sign_sha256(CryptoUtils::to_bytes(base_string));
        return CryptoUtils::bytes_to_base64(signature);
    }
} // namespace ibauth::crypto
