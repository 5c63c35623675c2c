/**
 * DaemonClient.hpp - HTTP client for the command daemon
 */

#pragma once

#include "sui/daemon/CommandExecutor.hpp"

#include <memory>
#include <string>

namespace sui::daemon {

struct DaemonConfig {
    std::string server_url = "http://localhost:8000";
    std::string command_path = "/api/command";
    std::string session_id;
    int timeout_ms = 30000;
};

class DaemonClient : public CommandExecutor {
public:
    explicit DaemonClient(const DaemonConfig& config = DaemonConfig{});
    ~DaemonClient() override;

    DaemonClient(const DaemonClient&) = delete;
    DaemonClient& operator=(const DaemonClient&) = delete;

    CommandResult dispatch(const nlu::Intent& intent) override;

    bool isHealthy();

    /**
     * Request body sent for an intent.
     */
    std::string buildRequest(const nlu::Intent& intent) const;

    /**
     * Interpret a daemon response body.
     */
    static CommandResult parseResponse(const std::string& body);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sui::daemon
