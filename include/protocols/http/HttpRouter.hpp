#pragma once

#include <boost/beast/http.hpp>
#include <filesystem>
#include <string>

namespace ds::sync { class TaskRegistry; }

namespace ds::http {

namespace http = boost::beast::http;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

class HttpRouter {
public:
    // An empty staticDir disables static file serving
    HttpRouter(sync::TaskRegistry& registry, std::filesystem::path staticDir = {});

    Response route(const Request& req) const;

    static Response makeJsonResponse(const Request& req, http::status status, const std::string& body);
    static Response makeMessageResponse(const Request& req, http::status status, bool success,
                                        const std::string& message);

private:
    sync::TaskRegistry& registry_;
    std::filesystem::path staticDir_;

    Response handleStatus(const Request& req, const std::string& target) const;
    Response handleApi(const Request& req, const std::string& path, const std::string& target) const;
    Response handleStatic(const Request& req, const std::string& path) const;

    static std::string mimeTypeFor(const std::filesystem::path& path);
};

}
