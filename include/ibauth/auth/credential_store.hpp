#pragma once

#include <string>
#include <memory>

#include "ibauth/common/config.hpp"
#include "ibauth/crypto/crypto_utils.hpp"
#include "ibauth/crypto/rsa_engine.hpp"

namespace ibauth::auth
{
    /**
     * Long-lived consumer credentials; immutable once loaded
     */
    struct Credentials
    {
        std::string consumer_key;
        std::string realm;

        std::shared_ptr<const crypto::RsaPrivateKey> signing_key;
        std::shared_ptr<const crypto::RsaPrivateKey> encryption_key;

        std::shared_ptr<const crypto::CryptoUtils::BigNum> dh_prime;
        std::shared_ptr<const crypto::CryptoUtils::BigNum> dh_generator;
    };

    class CredentialStore
    {
    public:
        // smallest DH prime accepted from configuration
        static constexpr int MIN_DH_PRIME_BITS = 1024;

        /**
         * Load consumer key, realm, both RSA keys and the DH domain
         * @throws ConfigurationError when anything is missing or malformed
         */
        static std::shared_ptr<const Credentials> load(const Config& config);

        /**
         * Read prime and generator from a PEM "DH PARAMETERS" file
         * @throws ConfigurationError
         */
        static void load_dh_parameters(
            const std::string& path,
            crypto::CryptoUtils::BigNum& prime,
            crypto::CryptoUtils::BigNum& generator);
    };
} // namespace ibauth::auth
