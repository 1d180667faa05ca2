#include "protocols/http/HttpSession.hpp"
#include "protocols/http/HttpRouter.hpp"
#include "logging/LogRegistry.hpp"

using namespace ds::logging;

namespace ds::http {

HttpSession::HttpSession(tcp::socket socket, std::shared_ptr<const HttpRouter> router)
    : socket_(std::move(socket)), router_(std::move(router)) {
    buffer_.max_size(8192);
}

void HttpSession::run() {
    do_read();
}

void HttpSession::do_read() {
    auto self = shared_from_this();

    http::async_read(socket_, buffer_, req_,
                     [self](beast::error_code ec, std::size_t bytes) {
                         self->on_read(ec, bytes);
                     });
}

void HttpSession::on_read(beast::error_code ec, std::size_t bytes) {
    if (ec == http::error::end_of_stream) return do_close();

    if (ec) {
        LogRegistry::http()->error("[HttpSession] Read error: {}", ec.message());
        return;
    }

    const auto method = req_.method_string();
    const auto target = req_.target();
    LogRegistry::http()->debug("[HttpSession] {} {} ({} bytes)", std::string(method.data(), method.size()),
                               std::string(target.data(), target.size()), bytes);

    auto self = shared_from_this();

    std::shared_ptr<Response> msg;
    bool close = false;
    try {
        msg = std::make_shared<Response>(router_->route(req_));
        close = msg->need_eof();
    } catch (const std::exception& e) {
        LogRegistry::http()->error("[HttpSession] Exception during request handling: {}", e.what());
        msg = std::make_shared<Response>(
            HttpRouter::makeMessageResponse(req_, http::status::internal_server_error, false, "Internal server error"));
        close = true;
    }

    http::async_write(socket_, *msg,
                      [self, msg, close](beast::error_code ec, std::size_t bytes) {
                          self->on_write(close, ec, bytes);
                      });
}

void HttpSession::on_write(const bool close, beast::error_code ec, const std::size_t) {
    if (ec) {
        LogRegistry::http()->error("[HttpSession] Write error: {}", ec.message());
        return;
    }

    if (close) {
        do_close();
        return;
    }

    req_ = {};
    do_read();
}

void HttpSession::do_close() {
    beast::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_send, ec);
    // ignore errors on shutdown
}

}
