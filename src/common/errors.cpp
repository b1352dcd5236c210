#include "ibauth/common/errors.hpp"

#include <utility>

namespace ibauth
{
    ProtocolError::ProtocolError(const FlowStep step, const int status, std::string body, const std::string& what)
        : AuthError(what)
          , step_(step)
          , status_(status)
          , body_(std::move(body))
    {
    }

    SessionExpiredError::SessionExpiredError(const int status, std::string body)
        : ProtocolError(FlowStep::AUTHENTICATED_CALL, status, std::move(body),
                        "Session expired: authenticated call rejected with HTTP " + std::to_string(status))
    {
    }
} // namespace ibauth
