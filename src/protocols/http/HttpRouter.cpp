#include "protocols/http/HttpRouter.hpp"
#include "sync/TaskRegistry.hpp"
#include "util/parse.hpp"
#include "util/files.hpp"
#include "logging/LogRegistry.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_map>

using namespace ds::logging;

namespace ds::http {

HttpRouter::HttpRouter(sync::TaskRegistry& registry, std::filesystem::path staticDir)
    : registry_(registry), staticDir_(std::move(staticDir)) {}

Response HttpRouter::route(const Request& req) const {
    const std::string target(req.target().data(), req.target().size());
    const auto path = util::target_path(target);

    try {
        if (path == "/status") {
            if (req.method() != http::verb::get)
                return makeMessageResponse(req, http::status::method_not_allowed, false, "Method not allowed");
            return handleStatus(req, target);
        }

        if (path.starts_with("/api/")) {
            if (req.method() != http::verb::post)
                return makeMessageResponse(req, http::status::method_not_allowed, false, "Method not allowed");
            return handleApi(req, path, target);
        }

        if (req.method() != http::verb::get && req.method() != http::verb::head)
            return makeMessageResponse(req, http::status::method_not_allowed, false, "Method not allowed");

        return handleStatic(req, path);
    } catch (const std::invalid_argument& e) {
        LogRegistry::http()->warn("[HttpRouter] Bad request {}: {}", target, e.what());
        return makeMessageResponse(req, http::status::bad_request, false, e.what());
    }
}

Response HttpRouter::handleStatus(const Request& req, const std::string& target) const {
    const auto params = util::parse_query_params(target);

    if (const auto it = params.find("id"); it != params.end()) {
        const auto status = registry_.getById(it->second);
        if (!status) return makeMessageResponse(req, http::status::not_found, false, "Sync not found");
        return makeJsonResponse(req, http::status::ok, nlohmann::json(*status).dump());
    }

    return makeJsonResponse(req, http::status::ok, nlohmann::json(registry_.getAllStatus()).dump());
}

Response HttpRouter::handleApi(const Request& req, const std::string& path, const std::string& target) const {
    const auto params = util::parse_query_params(target);
    const auto idIt = params.find("id");
    const bool hasId = idIt != params.end() && !idIt->second.empty();

    if (path == "/api/sync/now") {
        if (!hasId) {
            registry_.triggerAll();
            LogRegistry::http()->info("[HttpRouter] Triggered all sync tasks");
            return makeMessageResponse(req, http::status::ok, true, "Sync triggered");
        }
        if (!registry_.triggerById(idIt->second))
            return makeMessageResponse(req, http::status::not_found, false, "Sync not found");
        return makeMessageResponse(req, http::status::ok, true, "Sync triggered");
    }

    if (path == "/api/sync/pause" || path == "/api/sync/resume") {
        if (!hasId) return makeMessageResponse(req, http::status::bad_request, false, "Missing id parameter");

        const bool pause = path == "/api/sync/pause";
        const bool found = pause ? registry_.pauseById(idIt->second) : registry_.resumeById(idIt->second);
        if (!found) return makeMessageResponse(req, http::status::not_found, false, "Sync not found");
        return makeMessageResponse(req, http::status::ok, true, pause ? "Sync paused" : "Sync resumed");
    }

    return makeMessageResponse(req, http::status::not_found, false, "Unknown endpoint");
}

Response HttpRouter::handleStatic(const Request& req, const std::string& path) const {
    if (staticDir_.empty()) return makeMessageResponse(req, http::status::not_found, false, "Not found");

    const auto decoded = util::url_decode(path);
    if (decoded.empty() || decoded.front() != '/')
        return makeMessageResponse(req, http::status::not_found, false, "Not found");

    std::filesystem::path rel = decoded == "/" ? "index.html" : decoded.substr(1);
    const auto file = staticDir_ / rel.relative_path();

    if (!util::isWithin(staticDir_, file)) {
        LogRegistry::http()->warn("[HttpRouter] Rejected path outside static directory: {}", decoded);
        return makeMessageResponse(req, http::status::not_found, false, "Not found");
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec))
        return makeMessageResponse(req, http::status::not_found, false, "Not found");

    Response res{http::status::ok, req.version()};
    res.set(http::field::content_type, mimeTypeFor(file));
    res.keep_alive(req.keep_alive());
    if (req.method() == http::verb::head) {
        res.content_length(std::filesystem::file_size(file, ec));
        return res;
    }

    res.body() = util::readFileToString(file);
    res.prepare_payload();
    return res;
}

std::string HttpRouter::mimeTypeFor(const std::filesystem::path& path) {
    static const std::unordered_map<std::string, std::string> types{
        {".html", "text/html; charset=utf-8"},
        {".htm", "text/html; charset=utf-8"},
        {".css", "text/css"},
        {".js", "application/javascript"},
        {".json", "application/json"},
        {".svg", "image/svg+xml"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".ico", "image/x-icon"},
        {".txt", "text/plain; charset=utf-8"}
    };

    auto ext = path.extension().string();
    std::ranges::transform(ext, ext.begin(), [](const unsigned char c) { return std::tolower(c); });
    const auto it = types.find(ext);
    return it == types.end() ? "application/octet-stream" : it->second;
}

Response HttpRouter::makeJsonResponse(const Request& req, const http::status status, const std::string& body) {
    Response res{status, req.version()};
    res.set(http::field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    res.body() = body;
    res.prepare_payload();
    return res;
}

Response HttpRouter::makeMessageResponse(const Request& req, const http::status status, const bool success,
                                         const std::string& message) {
    const nlohmann::json body = {{"success", success}, {"message", message}};
    return makeJsonResponse(req, status, body.dump());
}

}
