#include "ibauth/auth/credential_store.hpp"
#include "ibauth/auth/token_store.hpp"
#include "ibauth/client/authenticated_client.hpp"
#include "ibauth/client/http_transport.hpp"
#include "ibauth/common/config.hpp"
#include "ibauth/common/errors.hpp"
#include "ibauth/common/logging.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <cstdlib>

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <METHOD> <endpoint> [key=value ...]" << std::endl;
        std::cerr << "Example: " << argv[0] << " GET /trsrv/secdef/search symbol=SPY" << std::endl;
        return EXIT_FAILURE;
    }

    try {
        std::string method = argv[1];
        std::transform(method.begin(), method.end(), method.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        std::string endpoint = argv[2];

        if (method != "GET" && method != "POST" && method != "PUT" && method != "DELETE") {
            std::cerr << "Method must be one of GET, POST, PUT, DELETE" << std::endl;
            return EXIT_FAILURE;
        }

        ibauth::ParamMap params;
        for (int i = 3; i < argc; ++i) {
            std::string arg = argv[i];
            auto eq = arg.find('=');
            if (eq == std::string::npos || eq == 0) {
                std::cerr << "Parameters must look like key=value, got '" << arg << "'" << std::endl;
                return EXIT_FAILURE;
            }
            params[arg.substr(0, eq)] = arg.substr(eq + 1);
        }

        auto config = ibauth::Config::from_environment();
        ibauth::set_log_level(config.log_level);

        auto credentials = ibauth::auth::CredentialStore::load(config);
        ibauth::auth::TokenStore token_store(config.token_file);
        ibauth::client::BeastHttpTransport transport;
        ibauth::client::AuthSession session;

        ibauth::client::AuthenticatedClient client(session, credentials, config, transport, &token_store);
        client.authenticate();

        bool has_body = method == "POST" || method == "PUT";
        auto response = has_body
                            ? client.request(method, endpoint, {}, params)
                            : client.request(method, endpoint, params, {});

        std::cout << "HTTP " << response.status << std::endl;
        std::cout << response.body << std::endl;

        return response.status >= 200 && response.status < 300 ? EXIT_SUCCESS : EXIT_FAILURE;

    } catch (const ibauth::ProtocolError& e) {
        std::cerr << "Error in " << ibauth::flow_step_to_string(e.step()) << " (HTTP " << e.status()
                  << "): " << e.what() << std::endl;
        if (!e.body().empty())
            std::cerr << e.body() << std::endl;
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
