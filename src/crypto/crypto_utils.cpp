#include "ibauth/crypto/crypto_utils.hpp"

#include <openssl/rand.h>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/buffer.h>
#include <sstream>
#include <iomanip>
#include <cctype>

#include "ibauth/common/errors.hpp"

namespace ibauth::crypto
{
    // BigNum implementation
    CryptoUtils::BigNum::BigNum() : bn_(BN_new())
    {
        if (!bn_) throw SignatureError("Failed to create BIGNUM");
    }

    CryptoUtils::BigNum::BigNum(const std::vector<uint8_t>& bytes) : bn_(BN_new())
    {
        if (!bn_) throw SignatureError("Failed to create BIGNUM");
        if (!BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), bn_))
            throw SignatureError("Failed to convert bytes to BIGNUM");
    }

    CryptoUtils::BigNum::BigNum(const std::string& hex) : bn_(nullptr)
    {
        if (hex.empty())
            throw SignatureError("Empty hex string for BIGNUM");

        for (const char c : hex)
            if (!std::isxdigit(static_cast<unsigned char>(c)))
                throw SignatureError("Invalid hex digit in BIGNUM value");

        // BN_hex2bn returns the number of digits consumed
        if (BN_hex2bn(&bn_, hex.c_str()) != static_cast<int>(hex.size()))
        {
            if (bn_) BN_free(bn_);
            throw SignatureError("Failed to convert hex to BIGNUM");
        }
    }

    CryptoUtils::BigNum::BigNum(const unsigned long word) : bn_(BN_new())
    {
        if (!bn_) throw SignatureError("Failed to create BIGNUM");
        if (!BN_set_word(bn_, word))
            throw SignatureError("Failed to set BIGNUM word");
    }

    CryptoUtils::BigNum::~BigNum()
    {
        if (bn_) BN_clear_free(bn_);
    }

    CryptoUtils::BigNum::BigNum(BigNum&& other) noexcept : bn_(other.bn_)
    {
        other.bn_ = nullptr;
    }

    CryptoUtils::BigNum& CryptoUtils::BigNum::operator=(BigNum&& other) noexcept
    {
        if (this != &other)
        {
            if (bn_) BN_clear_free(bn_);
            bn_       = other.bn_;
            other.bn_ = nullptr;
        }
        return *this;
    }

    std::vector<uint8_t> CryptoUtils::BigNum::to_bytes() const
    {
        int len = BN_num_bytes(bn_);
        std::vector<uint8_t> bytes(len);
        BN_bn2bin(bn_, bytes.data());
        return bytes;
    }

    std::vector<uint8_t> CryptoUtils::BigNum::to_signed_bytes() const
    {
        auto bytes = to_bytes();
        if (bytes.empty() || (bytes[0] & 0x80))
            bytes.insert(bytes.begin(), 0x00);
        return bytes;
    }

    std::string CryptoUtils::BigNum::to_hex() const
    {
        auto hex = bytes_to_hex(to_bytes());
        auto first = hex.find_first_not_of('0');
        if (first == std::string::npos)
            return "0";
        return hex.substr(first);
    }

    int CryptoUtils::BigNum::num_bits() const
    {
        return BN_num_bits(bn_);
    }

    bool CryptoUtils::BigNum::is_zero() const
    {
        return BN_is_zero(bn_);
    }

    CryptoUtils::BigNum CryptoUtils::BigNum::copy() const
    {
        BigNum result;
        if (!BN_copy(result.get(), bn_))
            throw SignatureError("Failed to copy BIGNUM");
        return result;
    }

    bool CryptoUtils::BigNum::operator==(const BigNum& other) const
    {
        return BN_cmp(bn_, other.bn_) == 0;
    }

    CryptoUtils::BnContext::BnContext() : ctx_(BN_CTX_new())
    {
        if (!ctx_) throw SignatureError("Failed to create BN_CTX");
    }

    CryptoUtils::BnContext::~BnContext()
    {
        if (ctx_) BN_CTX_free(ctx_);
    }

    CryptoUtils::BigNum CryptoUtils::mod_exp(const BigNum& base, const BigNum& exp, const BigNum& m)
    {
        BnContext ctx;
        BigNum result;
        if (!BN_mod_exp(result.get(), base.get(), exp.get(), m.get(), ctx.get()))
            throw SignatureError("Failed to calculate modular exponentiation");
        return result;
    }

    CryptoUtils::BigNum CryptoUtils::random_bits(const int bits)
    {
        BigNum result;
        if (!BN_priv_rand(result.get(), bits, BN_RAND_TOP_ONE, BN_RAND_BOTTOM_ANY))
            throw SignatureError("Failed to generate random BIGNUM");
        return result;
    }

    std::vector<uint8_t> CryptoUtils::random_bytes(size_t length)
    {
        std::vector<uint8_t> bytes(length);
        if (RAND_bytes(bytes.data(), static_cast<int>(length)) != 1)
            throw SignatureError("Failed to generate random bytes");
        return bytes;
    }

    namespace
    {
        std::vector<uint8_t> hmac(
            const EVP_MD* md,
            const std::vector<uint8_t>& key,
            const std::vector<uint8_t>& message)
        {
            static const uint8_t empty = 0;

            std::vector<uint8_t> digest(EVP_MAX_MD_SIZE);
            unsigned int digest_len = 0;

            if (!HMAC(md,
                      key.empty() ? &empty : key.data(), static_cast<int>(key.size()),
                      message.empty() ? &empty : message.data(), message.size(),
                      digest.data(), &digest_len))
                throw SignatureError("HMAC computation failed");

            digest.resize(digest_len);
            return digest;
        }
    }

    std::vector<uint8_t> CryptoUtils::hmac_sha1(
        const std::vector<uint8_t>& key,
        const std::vector<uint8_t>& message)
    {
        return hmac(EVP_sha1(), key, message);
    }

    std::vector<uint8_t> CryptoUtils::hmac_sha256(
        const std::vector<uint8_t>& key,
        const std::vector<uint8_t>& message)
    {
        return hmac(EVP_sha256(), key, message);
    }

    // Encoding functions
    std::string CryptoUtils::bytes_to_hex(const std::vector<uint8_t>& bytes)
    {
        std::ostringstream oss;
        oss << std::hex << std::setfill('0');
        for (uint8_t b : bytes)
            oss << std::setw(2) << static_cast<int>(b);
        return oss.str();
    }

    std::vector<uint8_t> CryptoUtils::hex_to_bytes(const std::string& hex)
    {
        if (hex.size() % 2 != 0)
            throw SignatureError("Hex string has odd length");

        std::vector<uint8_t> bytes;
        bytes.reserve(hex.size() / 2);
        for (size_t i = 0; i < hex.length(); i += 2)
        {
            if (!std::isxdigit(static_cast<unsigned char>(hex[i])) ||
                !std::isxdigit(static_cast<unsigned char>(hex[i + 1])))
                throw SignatureError("Invalid hex digit");

            std::string byte_str = hex.substr(i, 2);
            uint8_t byte         = static_cast<uint8_t>(std::stoi(byte_str, nullptr, 16));
            bytes.push_back(byte);
        }
        return bytes;
    }

    std::string CryptoUtils::bytes_to_base64(const std::vector<uint8_t>& bytes)
    {
        if (bytes.empty())
            return {};

        BIO* b64  = BIO_new(BIO_f_base64());
        BIO* bmem = BIO_new(BIO_s_mem());
        if (!b64 || !bmem)
        {
            BIO_free(b64);
            BIO_free(bmem);
            throw SignatureError("Failed to create base64 BIO");
        }
        b64 = BIO_push(b64, bmem);
        BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);

        if (BIO_write(b64, bytes.data(), static_cast<int>(bytes.size())) <= 0 || BIO_flush(b64) != 1)
        {
            BIO_free_all(b64);
            throw SignatureError("Base64 encode failed");
        }

        BUF_MEM* bptr;
        BIO_get_mem_ptr(b64, &bptr);

        std::string result(bptr->data, bptr->length);
        BIO_free_all(b64);

        return result;
    }

    std::vector<uint8_t> CryptoUtils::base64_to_bytes(const std::string& base64)
    {
        if (base64.empty())
            return {};

        BIO* b64  = BIO_new(BIO_f_base64());
        BIO* bmem = BIO_new_mem_buf(base64.data(), static_cast<int>(base64.size()));
        if (!b64 || !bmem)
        {
            BIO_free(b64);
            BIO_free(bmem);
            throw SignatureError("Failed to create base64 BIO");
        }
        bmem = BIO_push(b64, bmem);
        BIO_set_flags(bmem, BIO_FLAGS_BASE64_NO_NL);

        std::vector<uint8_t> result(base64.size());
        int decoded_size = BIO_read(bmem, result.data(), static_cast<int>(result.size()));

        BIO_free_all(bmem);

        // the base64 filter yields nothing for malformed input
        if (decoded_size <= 0)
            throw SignatureError("Base64 decode failed");

        result.resize(decoded_size);
        return result;
    }

    std::vector<uint8_t> CryptoUtils::to_bytes(const std::string& str)
    {
        return std::vector<uint8_t>(str.begin(), str.end());
    }
} // namespace ibauth::crypto
