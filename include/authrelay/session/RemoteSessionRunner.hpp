#pragma once

#include "authrelay/session/SessionRunner.hpp"

#include <boost/asio/ssl/context.hpp>

#include <mutex>
#include <string>

namespace authrelay::session {

struct WorkerEndpoint {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
};

WorkerEndpoint parseWorkerEndpoint(const std::string& url);

// Hands each attempt to an out-of-process automation worker over HTTP and
// translates its JSON verdict into a SessionOutcome.
class RemoteSessionRunner : public SessionRunner {
public:
    explicit RemoteSessionRunner(const std::string& endpointUrl);

    SessionResult run(const SessionRequest& request) override;

private:
    std::string post(const std::string& body, std::chrono::milliseconds timeout);

    WorkerEndpoint endpoint_;
    boost::asio::ssl::context sslContext_;
};

std::string buildWorkerJob(const SessionRequest& request);
SessionResult parseWorkerReply(const std::string& body);

} // namespace authrelay::session
