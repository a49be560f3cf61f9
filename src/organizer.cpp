#include "organizer.hpp"

#include "json.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

// ─────────────────────────────────────
HttpOrganizeEngine::HttpOrganizeEngine(HttpOrganizerOptions options)
    : m_Options(std::move(options)) {}

// ─────────────────────────────────────
OrganizeResult HttpOrganizeEngine::Organize(const OrganizeRequest &request) {
    OrganizeResult result;

    httplib::Client client(m_Options.url);
    client.set_connection_timeout(static_cast<time_t>(m_Options.connect_timeout.count()), 0);
    client.set_read_timeout(static_cast<time_t>(m_Options.read_timeout.count()), 0);

    nlohmann::json body = {
        {"path", request.target_path},
        {"instruction", request.instruction},
        {"incognito", false},
        {"resource_limit", request.resource_limit},
    };

    spdlog::debug("HttpOrganizeEngine: POST {}{} path={}", m_Options.url, m_Options.endpoint,
                  request.target_path);
    auto res = client.Post(m_Options.endpoint, body.dump(), "application/json");
    if (!res) {
        result.error = "request failed: " + httplib::to_string(res.error());
        return result;
    }
    if (res->status < 200 || res->status >= 300) {
        result.error = "organizer returned HTTP " + std::to_string(res->status);
        if (!res->body.empty()) {
            result.error += ": " + res->body.substr(0, 200);
        }
        return result;
    }

    result.ok = true;
    nlohmann::json reply = nlohmann::json::parse(res->body, nullptr, false);
    if (!reply.is_discarded() && reply.is_object()) {
        JsonParse parser;
        int affected = parser.GetInt(reply, "files_affected", -1);
        if (affected < 0 && reply.contains("moves") && reply["moves"].is_array()) {
            affected = static_cast<int>(reply["moves"].size());
        }
        result.files_affected = affected < 0 ? 0 : affected;
    }
    return result;
}
