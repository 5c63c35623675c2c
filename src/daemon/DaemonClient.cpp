/**
 * DaemonClient.cpp - Sends confirmed intents to the command daemon
 */

#include "sui/daemon/DaemonClient.hpp"

#include <iostream>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace sui::daemon {

struct DaemonClient::Impl {
    DaemonConfig config;
    std::unique_ptr<httplib::Client> client;

    explicit Impl(const DaemonConfig& c) : config(c) {
        const int timeout_ms = config.timeout_ms;
        client = std::make_unique<httplib::Client>(config.server_url);
        client->set_connection_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
        client->set_read_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
        client->set_write_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
    }
};

DaemonClient::DaemonClient(const DaemonConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
    std::cout << "[DaemonClient] Daemon at " << config.server_url << config.command_path << std::endl;
}

DaemonClient::~DaemonClient() = default;

bool DaemonClient::isHealthy() {
    auto res = impl_->client->Get("/health");
    return res && res->status == 200;
}

std::string DaemonClient::buildRequest(const nlu::Intent& intent) const {
    json request = {
        {"command", intent.type},
        {"parameters", intent.parameters},
        {"context", {
            {"raw_text", intent.raw_text},
            {"summary", intent.human_summary},
            {"confidence", intent.confidence}
        }},
        {"interface_type", "sui"}
    };
    if (!impl_->config.session_id.empty()) {
        request["session_id"] = impl_->config.session_id;
    }
    return request.dump();
}

CommandResult DaemonClient::dispatch(const nlu::Intent& intent) {
    CommandResult result;

    auto res = impl_->client->Post(impl_->config.command_path, buildRequest(intent), "application/json");
    if (!res) {
        result.message = "daemon unreachable: " + httplib::to_string(res.error());
        std::cerr << "[DaemonClient] " << result.message << std::endl;
        return result;
    }
    if (res->status != 200) {
        result.message = "daemon returned HTTP " + std::to_string(res->status);
        std::cerr << "[DaemonClient] " << result.message << std::endl;
        return result;
    }

    result = parseResponse(res->body);
    std::cout << "[DaemonClient] " << intent.type << " -> "
              << (result.success ? "ok" : "failed") << std::endl;
    return result;
}

CommandResult DaemonClient::parseResponse(const std::string& body) {
    CommandResult result;
    try {
        json j = json::parse(body);
        std::string type = j.value("type", "error");
        result.success = (type == "success" || type == "info" || type == "data");
        result.message = j.value("message", "");
    } catch (const json::exception& e) {
        result.success = false;
        result.message = std::string("invalid daemon response: ") + e.what();
        std::cerr << "[DaemonClient] " << result.message << std::endl;
    }
    return result;
}

} // namespace sui::daemon
