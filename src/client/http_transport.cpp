#include "ibauth/client/http_transport.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/ssl.h>

#include "ibauth/common/errors.hpp"
#include "ibauth/common/logging.hpp"

namespace ibauth::client
{
    namespace beast = boost::beast;
    namespace http  = boost::beast::http;
    namespace net   = boost::asio;
    namespace ssl   = boost::asio::ssl;
    using tcp       = boost::asio::ip::tcp;

    namespace
    {
        constexpr int kHttpVersion = 11;

        void run_pending(net::io_context& ioc)
        {
            ioc.restart();
            ioc.run();
        }

        [[noreturn]] void fail(const Url& url, const char* what, const beast::error_code& ec)
        {
            if (ec == beast::error::timeout)
                throw TransportError(std::string(what) + " timed out for " + url.host + ":" + url.port);
            throw TransportError(std::string(what) + " failed for " + url.host + ":" + url.port + ": " + ec.message());
        }

        http::request<http::string_body> make_request(const HttpRequest& request, const Url& url)
        {
            auto verb = http::string_to_verb(request.method);
            if (verb == http::verb::unknown)
                throw TransportError("Unsupported HTTP method: " + request.method);

            http::request<http::string_body> req{verb, url.target, kHttpVersion};
            req.set(http::field::host, url.host_header());
            req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
            for (const auto& [name, value] : request.headers)
                req.set(name, value);
            req.body() = request.body;
            req.prepare_payload();
            return req;
        }

        // write the request, read the full response; the stream deadline is already armed
        template <class Stream>
        HttpResponse exchange(net::io_context& ioc, Stream& stream, const Url& url,
                              http::request<http::string_body>& req)
        {
            beast::error_code ec;

            http::async_write(stream, req, [&ec](beast::error_code e, std::size_t) { ec = e; });
            run_pending(ioc);
            if (ec) fail(url, "HTTP write", ec);

            beast::flat_buffer buffer;
            http::response<http::string_body> res;
            http::async_read(stream, buffer, res, [&ec](beast::error_code e, std::size_t) { ec = e; });
            run_pending(ioc);
            if (ec) fail(url, "HTTP read", ec);

            return HttpResponse{static_cast<int>(res.result_int()), std::move(res.body())};
        }
    }

    bool Url::is_loopback() const
    {
        return host == "localhost" || host == "127.0.0.1" || host == "::1";
    }

    std::string Url::host_header() const
    {
        auto name = host.find(':') == std::string::npos ? host : "[" + host + "]";
        if ((scheme == "https" && port == "443") || (scheme == "http" && port == "80"))
            return name;
        return name + ":" + port;
    }

    Url Url::parse(const std::string& url)
    {
        Url result;

        auto scheme_end = url.find("://");
        if (scheme_end == std::string::npos)
            throw TransportError("URL has no scheme: " + url);

        result.scheme = url.substr(0, scheme_end);
        if (result.scheme != "http" && result.scheme != "https")
            throw TransportError("Unsupported URL scheme: " + result.scheme);

        auto authority_start = scheme_end + 3;
        auto path_start      = url.find('/', authority_start);
        auto authority       = url.substr(authority_start, path_start - authority_start);
        result.target        = path_start == std::string::npos ? "/" : url.substr(path_start);

        const std::string default_port = result.is_tls() ? "443" : "80";

        if (!authority.empty() && authority.front() == '[')
        {
            // [v6address] or [v6address]:port
            auto close = authority.find(']');
            if (close == std::string::npos)
                throw TransportError("Malformed URL: " + url);

            result.host = authority.substr(1, close - 1);
            if (close + 1 == authority.size())
                result.port = default_port;
            else if (authority[close + 1] == ':')
                result.port = authority.substr(close + 2);
            else
                throw TransportError("Malformed URL: " + url);
        }
        else if (auto colon = authority.rfind(':'); colon != std::string::npos)
        {
            result.host = authority.substr(0, colon);
            result.port = authority.substr(colon + 1);
        }
        else
        {
            result.host = authority;
            result.port = default_port;
        }

        if (result.host.empty() || result.port.empty())
            throw TransportError("Malformed URL: " + url);

        return result;
    }

    HttpResponse BeastHttpTransport::send(const HttpRequest& request, std::chrono::seconds timeout)
    {
        auto url = Url::parse(request.url);
        auto req = make_request(request, url);

        net::io_context ioc;
        beast::error_code ec;

        tcp::resolver resolver(ioc);
        auto endpoints = resolver.resolve(url.host, url.port, ec);
        if (ec) fail(url, "DNS resolve", ec);

        logger()->debug("{} {}", request.method, request.url);

        if (!url.is_tls())
        {
            beast::tcp_stream stream(ioc);
            stream.expires_after(timeout);

            stream.async_connect(endpoints, [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
            run_pending(ioc);
            if (ec) fail(url, "TCP connect", ec);

            auto response = exchange(ioc, stream, url, req);
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            return response;
        }

        ssl::context ctx(ssl::context::tls_client);
        if (url.is_loopback())
        {
            ctx.set_verify_mode(ssl::verify_none);
        }
        else
        {
            ctx.set_default_verify_paths();
            ctx.set_verify_mode(ssl::verify_peer);
        }

        beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

        if (!url.is_loopback())
        {
            if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str()))
                throw TransportError("Failed to set SNI for host " + url.host);
            stream.set_verify_callback(ssl::host_name_verification(url.host));
        }

        // one deadline covers connect, handshake, write and read
        beast::get_lowest_layer(stream).expires_after(timeout);

        beast::get_lowest_layer(stream).async_connect(
            endpoints, [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
        run_pending(ioc);
        if (ec) fail(url, "TCP connect", ec);

        stream.async_handshake(ssl::stream_base::client, [&ec](beast::error_code e) { ec = e; });
        run_pending(ioc);
        if (ec) fail(url, "TLS handshake", ec);

        auto response = exchange(ioc, stream, url, req);

        stream.async_shutdown([&ec](beast::error_code e) { ec = e; });
        run_pending(ioc);
        if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated)
            logger()->debug("TLS shutdown with {}: {}", url.host, ec.message());

        return response;
    }
} // namespace ibauth::client
