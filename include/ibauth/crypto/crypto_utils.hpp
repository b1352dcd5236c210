#pragma once

#include <vector>
#include <string>
#include <cstdint>
#include <openssl/bn.h>

namespace ibauth::crypto
{
    /**
     * Big-integer, encoding and hashing helpers shared by the OAuth signers
     * and the Diffie-Hellman exchange
     */
    class CryptoUtils
    {
    public:
        // BigNum wrapper for RAII; cleared on destruction
        class BigNum
        {
        private:
            BIGNUM* bn_;

        public:
            BigNum();
            explicit BigNum(const std::vector<uint8_t>& bytes);
            explicit BigNum(const std::string& hex);
            explicit BigNum(unsigned long word);
            ~BigNum();

            // no copy
            BigNum(const BigNum&)            = delete;
            BigNum& operator=(const BigNum&) = delete;

            // move
            BigNum(BigNum&& other) noexcept;
            BigNum& operator=(BigNum&& other) noexcept;

            BIGNUM* get() { return bn_; }
            const BIGNUM* get() const { return bn_; }

            // minimal big-endian magnitude
            std::vector<uint8_t> to_bytes() const;

            // big-endian with a leading zero byte when the top bit is set
            // (two's complement, as java.math.BigInteger.toByteArray)
            std::vector<uint8_t> to_signed_bytes() const;

            // lowercase hex without leading zeros or 0x
            std::string to_hex() const;

            [[nodiscard]] int num_bits() const;
            [[nodiscard]] bool is_zero() const;

            BigNum copy() const;

            bool operator==(const BigNum& other) const;
        };

        // BN_CTX scoped to one computation
        class BnContext
        {
        private:
            BN_CTX* ctx_;

        public:
            BnContext();
            ~BnContext();

            BnContext(const BnContext&)            = delete;
            BnContext& operator=(const BnContext&) = delete;

            BN_CTX* get() { return ctx_; }
        };

        // result = base^exp mod m
        static BigNum mod_exp(const BigNum& base, const BigNum& exp, const BigNum& m);

        // uniformly random integer of exactly `bits` bits (top bit set)
        static BigNum random_bits(int bits);

        // Random number generation
        static std::vector<uint8_t> random_bytes(size_t length);

        // HMAC
        static std::vector<uint8_t> hmac_sha1(
            const std::vector<uint8_t>& key,
            const std::vector<uint8_t>& message);

        static std::vector<uint8_t> hmac_sha256(
            const std::vector<uint8_t>& key,
            const std::vector<uint8_t>& message);

        // Convert bytes to/from hex
        static std::string bytes_to_hex(const std::vector<uint8_t>& bytes);
        static std::vector<uint8_t> hex_to_bytes(const std::string& hex);

        // Convert bytes to/from base64
        static std::string bytes_to_base64(const std::vector<uint8_t>& bytes);
        static std::vector<uint8_t> base64_to_bytes(const std::string& base64);

        static std::vector<uint8_t> to_bytes(const std::string& str);
    };
} // namespace ibauth::crypto
