#include <future>
#include <thread>
#include <gtest/gtest.h>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "ibauth/client/http_transport.hpp"
#include "ibauth/common/errors.hpp"

namespace ibauth::client
{
    namespace beast = boost::beast;
    namespace http  = boost::beast::http;
    namespace net   = boost::asio;
    using tcp       = boost::asio::ip::tcp;

    TEST(UrlTest, DefaultPorts)
    {
        auto https = Url::parse("https://api.ibkr.com/v1/api/oauth/request_token");
        EXPECT_TRUE(https.is_tls());
        EXPECT_EQ(https.host, "api.ibkr.com");
        EXPECT_EQ(https.port, "443");
        EXPECT_EQ(https.target, "/v1/api/oauth/request_token");
        EXPECT_EQ(https.host_header(), "api.ibkr.com");

        auto plain = Url::parse("http://example.test/x");
        EXPECT_FALSE(plain.is_tls());
        EXPECT_EQ(plain.port, "80");
    }

    TEST(UrlTest, ExplicitPortAndQuery)
    {
        auto url = Url::parse("https://localhost:5000/v1/api/md/snapshot?conids=265598%2C8314");

        EXPECT_EQ(url.host, "localhost");
        EXPECT_EQ(url.port, "5000");
        EXPECT_EQ(url.target, "/v1/api/md/snapshot?conids=265598%2C8314");
        EXPECT_EQ(url.host_header(), "localhost:5000");
        EXPECT_TRUE(url.is_loopback());
    }

    TEST(UrlTest, MissingPathBecomesRoot)
    {
        auto url = Url::parse("https://api.ibkr.com");
        EXPECT_EQ(url.target, "/");
        EXPECT_FALSE(url.is_loopback());
    }

    TEST(UrlTest, BracketedIpv6WithPort)
    {
        auto url = Url::parse("https://[::1]:5000/v1/api/tickle");

        EXPECT_EQ(url.host, "::1");
        EXPECT_EQ(url.port, "5000");
        EXPECT_EQ(url.target, "/v1/api/tickle");
        EXPECT_EQ(url.host_header(), "[::1]:5000");
        EXPECT_TRUE(url.is_loopback());

        auto bare = Url::parse("https://[2001:db8::7]/v1/api");
        EXPECT_EQ(bare.host, "2001:db8::7");
        EXPECT_EQ(bare.port, "443");
        EXPECT_EQ(bare.host_header(), "[2001:db8::7]");

        EXPECT_THROW(Url::parse("https://[::1/v1/api"), TransportError);
        EXPECT_THROW(Url::parse("https://[::1]5000/v1/api"), TransportError);
    }

    TEST(UrlTest, RejectsMalformed)
    {
        EXPECT_THROW(Url::parse("api.ibkr.com/v1/api"), TransportError);
        EXPECT_THROW(Url::parse("ftp://api.ibkr.com/"), TransportError);
        EXPECT_THROW(Url::parse("https:///v1/api"), TransportError);
        EXPECT_THROW(Url::parse("https://api.ibkr.com:/v1"), TransportError);
    }

    /**
     * One-shot plain HTTP listener on 127.0.0.1 that records the request it
     * receives and answers with a fixed status once released
     */
    class LoopbackServer
    {
    private:
        net::io_context ioc_;
        tcp::acceptor acceptor_;
        std::promise<void> release_;
        std::thread thread_;

    public:
        http::request<http::string_body> received;
        int status{200};
        std::string body{R"({"ok":true})"};
        bool hold{false}; // keep the connection open without answering until release()

        LoopbackServer()
            : acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0))
        {
        }

        ~LoopbackServer()
        {
            release();
            if (thread_.joinable())
                thread_.join();
        }

        [[nodiscard]] std::string base_url() const
        {
            return "http://127.0.0.1:" + std::to_string(acceptor_.local_endpoint().port());
        }

        void start()
        {
            thread_ = std::thread([this, released = release_.get_future()]() mutable
            {
                beast::error_code ec;
                tcp::socket socket(ioc_);
                acceptor_.accept(socket, ec);
                if (ec)
                    return;

                beast::flat_buffer buffer;
                http::read(socket, buffer, received, ec);

                if (hold)
                {
                    released.wait();
                    return;
                }

                http::response<http::string_body> res{static_cast<http::status>(status), received.version()};
                res.set(http::field::content_type, "application/json");
                res.body() = body;
                res.prepare_payload();
                http::write(socket, res, ec);
                socket.shutdown(tcp::socket::shutdown_both, ec);
            });
        }

        void release()
        {
            try
            {
                release_.set_value();
            }
            catch (const std::future_error&)
            {
                // already released
            }
        }
    };

    TEST(BeastHttpTransportTest, SendsHeadersAndBody)
    {
        LoopbackServer server;
        server.status = 201;
        server.start();

        HttpRequest request{
            .method = "POST",
            .url = server.base_url() + "/v1/api/iserver/auth/ssodh/init",
            .headers = {{"Authorization", "OAuth realm=\"limited_poa\""},
                        {"Content-Type", "application/x-www-form-urlencoded"}},
            .body = "compete=false&publish=true"
        };

        BeastHttpTransport transport;
        auto response = transport.send(request, std::chrono::seconds(5));

        EXPECT_EQ(response.status, 201);
        EXPECT_EQ(response.body, R"({"ok":true})");

        EXPECT_EQ(server.received.method(), http::verb::post);
        EXPECT_EQ(server.received.target(), "/v1/api/iserver/auth/ssodh/init");
        EXPECT_EQ(server.received[http::field::authorization], "OAuth realm=\"limited_poa\"");
        EXPECT_EQ(server.received.body(), "compete=false&publish=true");
    }

    TEST(BeastHttpTransportTest, ErrorStatusIsAResponseNotAnException)
    {
        LoopbackServer server;
        server.status = 401;
        server.body   = R"({"error":"invalid signature"})";
        server.start();

        BeastHttpTransport transport;
        auto response = transport.send(HttpRequest{.method = "GET", .url = server.base_url() + "/v1/api/x"},
                                       std::chrono::seconds(5));

        EXPECT_EQ(response.status, 401);
        EXPECT_EQ(response.body, R"({"error":"invalid signature"})");
    }

    TEST(BeastHttpTransportTest, TimeoutRaisesTransportError)
    {
        LoopbackServer server;
        server.hold = true;
        server.start();

        BeastHttpTransport transport;
        try
        {
            transport.send(HttpRequest{.method = "GET", .url = server.base_url() + "/slow"},
                           std::chrono::seconds(1));
            FAIL() << "expected TransportError";
        }
        catch (const TransportError& e)
        {
            EXPECT_NE(std::string(e.what()).find("timed out"), std::string::npos) << e.what();
        }
        server.release();
    }

    TEST(BeastHttpTransportTest, RefusedConnectionRaisesTransportError)
    {
        std::string url;
        {
            // bind and release a port so nothing listens on it
            LoopbackServer closed;
            url = closed.base_url() + "/v1/api/portfolio/accounts";
        }

        BeastHttpTransport transport;
        EXPECT_THROW(transport.send(HttpRequest{.method = "GET", .url = url}, std::chrono::seconds(2)),
                     TransportError);
    }

    TEST(BeastHttpTransportTest, UnsupportedMethodIsRejectedBeforeConnecting)
    {
        BeastHttpTransport transport;
        EXPECT_THROW(transport.send(HttpRequest{.method = "BREW", .url = "http://127.0.0.1:9/"},
                                    std::chrono::seconds(1)),
                     TransportError);
    }
} // namespace ibauth::client
