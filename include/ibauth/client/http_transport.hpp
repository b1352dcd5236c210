#pragma once

#include <string>
#include <chrono>

#include "ibauth/common/types.hpp"

namespace ibauth::client
{
    struct Url
    {
        std::string scheme; // http or https
        std::string host;   // IPv6 literals without brackets
        std::string port;
        std::string target; // path and query, at least "/"

        [[nodiscard]] bool is_tls() const { return scheme == "https"; }
        [[nodiscard]] bool is_loopback() const;

        // host header value, port omitted when it is the scheme default
        [[nodiscard]] std::string host_header() const;

        // @throws TransportError on anything but http(s)://host[:port][/target]
        static Url parse(const std::string& url);
    };

    /**
     * Blocking request/response seam between the OAuth core and the network
     */
    class HttpTransport
    {
    public:
        virtual ~HttpTransport() = default;

        /**
         * Perform one request
         * @return Status and body for any HTTP answer, including 4xx/5xx
         * @throws TransportError on resolve, connect, TLS or timeout failure
         */
        virtual HttpResponse send(const HttpRequest& request, std::chrono::seconds timeout) = 0;
    };

    /**
     * Boost.Beast implementation: one connection per request, TLS with
     * hostname verification except for loopback hosts (the local gateway
     * serves a self-signed certificate)
     */
    class BeastHttpTransport : public HttpTransport
    {
    public:
        BeastHttpTransport() = default;

        HttpResponse send(const HttpRequest& request, std::chrono::seconds timeout) override;
    };
} // namespace ibauth::client
