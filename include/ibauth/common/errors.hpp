#pragma once

#include <string>
#include <stdexcept>

#include "ibauth/common/types.hpp"

namespace ibauth
{
    /**
     * Root of every error raised by the authentication core
     */
    class AuthError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // missing or unreadable key files, DH parameters or consumer key
    class ConfigurationError : public AuthError
    {
    public:
        using AuthError::AuthError;
    };

    // local signing, decryption or encoding failure
    class SignatureError : public AuthError
    {
    public:
        using AuthError::AuthError;
    };

    // token file could not be written or removed
    class StorageError : public AuthError
    {
    public:
        using AuthError::AuthError;
    };

    // connect, TLS or timeout failure; never retried by the core
    class TransportError : public AuthError
    {
    public:
        using AuthError::AuthError;
    };

    /**
     * Server answered a step with something other than a usable 200
     */
    class ProtocolError : public AuthError
    {
    private:
        FlowStep step_;
        int status_;
        std::string body_;

    public:
        ProtocolError(FlowStep step, int status, std::string body, const std::string& what);

        [[nodiscard]] FlowStep step() const { return step_; }
        [[nodiscard]] int status() const { return status_; }
        [[nodiscard]] const std::string& body() const { return body_; }
    };

    // 401 on an authenticated call after one LST re-derivation
    class SessionExpiredError : public ProtocolError
    {
    public:
        SessionExpiredError(int status, std::string body);
    };

    // a signed call was attempted before any live session token existed
    class NotAuthenticatedError : public AuthError
    {
    public:
        using AuthError::AuthError;
    };
} // namespace ibauth
