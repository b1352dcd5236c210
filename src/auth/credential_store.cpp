#include "ibauth/auth/credential_store.hpp"

#include <openssl/pem.h>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/core_names.h>

#include "ibauth/common/errors.hpp"
#include "ibauth/common/logging.hpp"

namespace ibauth::auth
{
    using crypto::CryptoUtils;
    using crypto::RsaPrivateKey;

    void CredentialStore::load_dh_parameters(
        const std::string& path,
        CryptoUtils::BigNum& prime,
        CryptoUtils::BigNum& generator)
    {
        BIO* bio = BIO_new_file(path.c_str(), "r");
        if (!bio)
            throw ConfigurationError("Cannot open DH parameter file: " + path);

        EVP_PKEY* params = PEM_read_bio_Parameters(bio, nullptr);
        BIO_free(bio);

        if (!params)
            throw ConfigurationError("Failed to parse DH parameters: " + path);

        // OSSL_PARAM_get_BN fills an existing BIGNUM in place
        BIGNUM* p = prime.get();
        BIGNUM* g = generator.get();
        bool ok = EVP_PKEY_get_bn_param(params, OSSL_PKEY_PARAM_FFC_P, &p) == 1 &&
                  EVP_PKEY_get_bn_param(params, OSSL_PKEY_PARAM_FFC_G, &g) == 1;
        EVP_PKEY_free(params);

        if (!ok)
            throw ConfigurationError("DH parameter file lacks prime or generator: " + path);
    }

    std::shared_ptr<const Credentials> CredentialStore::load(const Config& config)
    {
        if (config.consumer_key.empty())
            throw ConfigurationError("Consumer key is not configured (IB_CONSUMER_KEY)");
        if (config.signature_key_path.empty())
            throw ConfigurationError("Signing key path is not configured (IB_SIGNATURE_KEY_PATH)");
        if (config.encryption_key_path.empty())
            throw ConfigurationError("Encryption key path is not configured (IB_ENCRYPTION_KEY_PATH)");

        auto credentials          = std::make_shared<Credentials>();
        credentials->consumer_key = config.consumer_key;
        credentials->realm        = config.realm.empty() ? DEFAULT_REALM : config.realm;

        credentials->signing_key    = RsaPrivateKey::from_pem_file(config.signature_key_path);
        credentials->encryption_key = RsaPrivateKey::from_pem_file(config.encryption_key_path);

        auto prime     = std::make_shared<CryptoUtils::BigNum>();
        auto generator = std::make_shared<CryptoUtils::BigNum>(static_cast<unsigned long>(config.dh_generator));

        if (!config.dh_param_path.empty())
        {
            load_dh_parameters(config.dh_param_path, *prime, *generator);
        }
        else if (!config.dh_prime_hex.empty())
        {
            try
            {
                *prime = CryptoUtils::BigNum(config.dh_prime_hex);
            }
            catch (const SignatureError&)
            {
                throw ConfigurationError("DH prime is not valid hex (IB_DH_PRIME)");
            }
        }
        else
        {
            throw ConfigurationError("No DH parameters configured (IB_DH_PARAM_PATH or IB_DH_PRIME)");
        }

        if (prime->num_bits() < MIN_DH_PRIME_BITS)
            throw ConfigurationError("DH prime is too small: " + std::to_string(prime->num_bits()) + " bits");

        credentials->dh_prime     = prime;
        credentials->dh_generator = generator;

        logger()->info("Loaded credentials for consumer {} (realm {}, {}-bit signing key, {}-bit DH prime)",
                       credentials->consumer_key, credentials->realm,
                       credentials->signing_key->bits(), prime->num_bits());

        return credentials;
    }
} // namespace ibauth::auth
