#include <atomic>
#include <functional>
#include <thread>
#include <vector>
#include <gtest/gtest.h>

#include "ibauth/auth/oauth_types.hpp"
#include "ibauth/client/authenticated_client.hpp"
#include "ibauth/common/errors.hpp"
#include "test_support.hpp"

namespace ibauth::client
{
    // forwards to the fake server, but answers the first two calls to one path with 401
    class RejectingTransport : public HttpTransport
    {
    private:
        HttpTransport& inner_;
        std::string path_;

    public:
        int rejected{0};
        std::function<void()> before_second_rejection;

        RejectingTransport(HttpTransport& inner, std::string path)
            : inner_(inner)
              , path_(std::move(path))
        {
        }

        HttpResponse send(const HttpRequest& request, std::chrono::seconds timeout) override
        {
            const bool matches = request.url.size() >= path_.size() &&
                                 request.url.compare(request.url.size() - path_.size(), path_.size(), path_) == 0;
            if (!matches || rejected >= 2)
                return inner_.send(request, timeout);

            if (++rejected == 2 && before_second_rejection)
                before_second_rejection();
            return {401, R"({"error":"not authorized"})"};
        }
    };

    class AuthenticatedClientTest : public ::testing::Test
    {
    protected:
        std::shared_ptr<const auth::Credentials> credentials = test::make_credentials();
        Config config = test::make_config();
        test::FakeIbkrServer server{credentials};
        test::TempDir dir;
        auth::TokenStore store{dir.file("tokens.json")};
        AuthSession session;

        void SetUp() override
        {
            config.access_token        = test::FakeIbkrServer::ACCESS_TOKEN;
            config.access_token_secret = server.encrypted_secret();
        }

        std::unique_ptr<AuthenticatedClient> make_client(AuthSession& target)
        {
            return std::make_unique<AuthenticatedClient>(target, credentials, config, server, &store);
        }
    };

    TEST_F(AuthenticatedClientTest, FastPathThenSignedGet)
    {
        auto client = make_client(session);
        EXPECT_FALSE(client->is_authenticated());

        client->authenticate();
        ASSERT_TRUE(client->is_authenticated());
        EXPECT_EQ(session.state(), AuthState::SESSION_INITIALIZED);

        auto response = client->request("GET", "/portfolio/accounts");

        EXPECT_EQ(response.status, 200);
        EXPECT_NE(response.body.find("U1234567"), std::string::npos);

        const auto& sent   = server.requests.back();
        const auto& header = sent.headers.at("Authorization");
        EXPECT_EQ(sent.url, std::string(test::TEST_API_BASE) + "/portfolio/accounts");
        EXPECT_NE(header.find("oauth_signature_method=\"HMAC-SHA256\""), std::string::npos);
        EXPECT_NE(header.find("oauth_version=\"1.0\""), std::string::npos);
        EXPECT_EQ(server.signature_failures, 0);
    }

    TEST_F(AuthenticatedClientTest, QueryAndFormParametersAreSigned)
    {
        auto client = make_client(session);
        client->authenticate();

        auto search = client->request("GET", "/iserver/secdef/search", {{"symbol", "BRK B"}, {"name", "false"}});
        EXPECT_EQ(search.status, 200);
        EXPECT_EQ(server.requests.back().url,
                  std::string(test::TEST_API_BASE) + "/iserver/secdef/search?name=false&symbol=BRK%20B");

        auto snapshot = client->request("GET", "iserver/marketdata/snapshot",
                                        {{"conids", "265598,8314"}, {"fields", "31|84|86"}});
        EXPECT_EQ(snapshot.status, 200);

        auto order = client->request("POST", "/iserver/account/U1234567/orders", {},
                                     {{"conid", "265598"}, {"side", "BUY"}, {"quantity", "10"}});
        EXPECT_EQ(order.status, 200);
        EXPECT_EQ(server.requests.back().headers.at("Content-Type"), "application/x-www-form-urlencoded");

        auto cancel = client->request("DELETE", "/iserver/account/U1234567/order/42");
        EXPECT_EQ(cancel.status, 200);
        EXPECT_NE(cancel.body.find("DELETE"), std::string::npos);

        EXPECT_EQ(server.signature_failures, 0);
    }

    TEST_F(AuthenticatedClientTest, AbsoluteUrlIsUsedAsIs)
    {
        auto client = make_client(session);
        client->authenticate();

        auto request = client->sign_request("GET", std::string(test::TEST_GATEWAY_BASE) + "/one/user");

        EXPECT_EQ(request.url, std::string(test::TEST_GATEWAY_BASE) + "/one/user");
    }

    TEST_F(AuthenticatedClientTest, NotAuthenticatedIsDistinctFromFailure)
    {
        auto client = make_client(session);

        EXPECT_THROW(client->request("GET", "/portfolio/accounts"), NotAuthenticatedError);
        EXPECT_THROW(client->sign_request("GET", "/portfolio/accounts"), NotAuthenticatedError);
        EXPECT_EQ(server.requests.size(), 0u);
    }

    TEST_F(AuthenticatedClientTest, ExpiredTokenIsRederivedAndCallRetried)
    {
        auto client = make_client(session);
        client->authenticate();
        auto generation = session.generation();

        server.expire_live_session_token();
        auto response = client->request("GET", "/portfolio/accounts");

        EXPECT_EQ(response.status, 200);
        EXPECT_EQ(server.live_session_token_calls, 2);
        EXPECT_EQ(session.generation(), generation + 1);
        EXPECT_TRUE(client->is_authenticated());

        auto record = store.load();
        ASSERT_TRUE(record.has_value());
        EXPECT_EQ(record->live_session_token, server.live_session_token());
    }

    TEST_F(AuthenticatedClientTest, PersistentUnauthorizedRederivesExactlyOnce)
    {
        auto client = make_client(session);
        client->authenticate();
        ASSERT_EQ(server.live_session_token_calls, 1);

        server.reject_resource_calls = true;
        try
        {
            client->request("GET", "/portfolio/accounts");
            FAIL() << "expected SessionExpiredError";
        }
        catch (const SessionExpiredError& e)
        {
            EXPECT_EQ(e.status(), 401);
            EXPECT_EQ(e.step(), FlowStep::AUTHENTICATED_CALL);
        }

        EXPECT_EQ(server.live_session_token_calls, 2);
        EXPECT_EQ(server.resource_calls, 2);
        EXPECT_FALSE(client->is_authenticated());
        EXPECT_EQ(session.last_failure(), FlowStep::AUTHENTICATED_CALL);
    }

    TEST_F(AuthenticatedClientTest, InitRejectionDuringRetryCostsOneDerivation)
    {
        auto client = make_client(session);
        client->authenticate();
        ASSERT_EQ(server.live_session_token_calls, 1);

        server.expire_live_session_token();
        server.init_status = 401;

        try
        {
            client->request("GET", "/portfolio/accounts");
            FAIL() << "expected ProtocolError";
        }
        catch (const ProtocolError& e)
        {
            EXPECT_EQ(e.step(), FlowStep::SESSION_INIT);
            EXPECT_EQ(e.status(), 401);
        }

        EXPECT_EQ(server.live_session_token_calls, 2);
        EXPECT_FALSE(client->is_authenticated());
    }

    TEST_F(AuthenticatedClientTest, LateRejectionKeepsTokenDerivedMeanwhile)
    {
        RejectingTransport transport(server, "/portfolio/accounts");
        AuthenticatedClient client(session, credentials, config, transport);
        client.authenticate();

        // another caller replaces the token while this call's retry is in flight
        transport.before_second_rejection = [&]()
        {
            client.flow().refresh(session.generation());
        };

        EXPECT_THROW(client.request("GET", "/portfolio/accounts"), SessionExpiredError);

        EXPECT_EQ(server.live_session_token_calls, 3);
        ASSERT_TRUE(session.live_session_token().has_value());
        EXPECT_EQ(session.live_session_token()->value_b64, server.live_session_token());
        EXPECT_TRUE(client.is_authenticated());

        auto response = client.request("GET", "/portfolio/accounts");
        EXPECT_EQ(response.status, 200);
        EXPECT_EQ(server.live_session_token_calls, 3);
    }

    TEST_F(AuthenticatedClientTest, FailedRederivationSurfacesItsStep)
    {
        auto client = make_client(session);
        client->authenticate();

        server.expire_live_session_token();
        server.init_status = 500;

        try
        {
            client->request("GET", "/portfolio/accounts");
            FAIL() << "expected ProtocolError";
        }
        catch (const SessionExpiredError&)
        {
            FAIL() << "re-derivation failure must not look like a second 401";
        }
        catch (const ProtocolError& e)
        {
            EXPECT_EQ(e.step(), FlowStep::SESSION_INIT);
            EXPECT_EQ(e.status(), 500);
        }

        EXPECT_EQ(server.live_session_token_calls, 2);
        EXPECT_FALSE(client->is_authenticated());
    }

    TEST_F(AuthenticatedClientTest, NonAuthErrorsAreReturnedToCaller)
    {
        auto client = make_client(session);
        client->authenticate();

        auto response = client->request("GET", std::string("https://elsewhere.test/v1/api/x"));

        EXPECT_EQ(response.status, 404);
        EXPECT_EQ(server.live_session_token_calls, 1);
    }

    TEST_F(AuthenticatedClientTest, ConcurrentUnauthorizedCallsShareOneRederivation)
    {
        auto client = make_client(session);
        client->authenticate();

        server.expire_live_session_token();

        std::atomic<int> ok{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 4; ++i)
        {
            threads.emplace_back([&]()
            {
                if (client->request("GET", "/portfolio/accounts").status == 200)
                    ++ok;
            });
        }
        for (auto& thread : threads)
            thread.join();

        EXPECT_EQ(ok.load(), 4);
        EXPECT_EQ(server.live_session_token_calls, 2);
    }

    TEST_F(AuthenticatedClientTest, PersistedTokensAreReusedAfterLivenessCheck)
    {
        make_client(session)->authenticate();
        ASSERT_EQ(server.live_session_token_calls, 1);

        AuthSession restarted;
        auto client = make_client(restarted);
        client->authenticate();

        EXPECT_TRUE(client->is_authenticated());
        EXPECT_EQ(server.live_session_token_calls, 1);
        EXPECT_EQ(server.requests.back().url, std::string(test::TEST_API_BASE) + auth::LIVENESS_CHECK_PATH);
        EXPECT_EQ(restarted.live_session_token()->value_b64, server.live_session_token());
    }

    TEST_F(AuthenticatedClientTest, StalePersistedTokenIsRederived)
    {
        make_client(session)->authenticate();
        server.expire_live_session_token();

        AuthSession restarted;
        auto client = make_client(restarted);
        client->authenticate();

        EXPECT_TRUE(client->is_authenticated());
        EXPECT_EQ(server.live_session_token_calls, 2);
        EXPECT_EQ(restarted.live_session_token()->value_b64, server.live_session_token());
    }

    TEST_F(AuthenticatedClientTest, TokenFileOfAnotherConsumerIsIgnored)
    {
        store.save(PersistedTokenRecord{
            .access_token = test::FakeIbkrServer::ACCESS_TOKEN,
            .access_token_secret = server.encrypted_secret(),
            .live_session_token = "AQIDBAUGBwgJCgsMDQ4PEBESExQ=",
            .consumer_key = "OTHERCONS",
            .realm = DEFAULT_REALM,
            .timestamp = "2024-05-01T09:30:00"
        });

        auto client = make_client(session);
        client->authenticate();

        EXPECT_TRUE(client->is_authenticated());
        EXPECT_EQ(server.resource_calls, 0);
        EXPECT_EQ(server.live_session_token_calls, 1);
        EXPECT_EQ(store.load()->consumer_key, test::TEST_CONSUMER_KEY);
    }

    TEST_F(AuthenticatedClientTest, FullFlowWithoutPreauthorizedTokens)
    {
        config.access_token.reset();
        config.access_token_secret.reset();

        auto client = make_client(session);
        client->authenticate();

        EXPECT_TRUE(client->is_authenticated());
        EXPECT_EQ(server.request_token_calls, 1);
        EXPECT_EQ(server.access_token_calls, 1);
        EXPECT_EQ(client->request("GET", "/portfolio/accounts").status, 200);
    }

    TEST_F(AuthenticatedClientTest, CheckLivenessReportsRejection)
    {
        auto client = make_client(session);
        client->authenticate();

        EXPECT_TRUE(client->check_liveness());

        server.expire_live_session_token();
        EXPECT_FALSE(client->check_liveness());
        EXPECT_EQ(server.live_session_token_calls, 1);
    }
} // namespace ibauth::client
