#pragma once

#include <boost/beast/core.hpp>
#include <boost/asio.hpp>
#include <memory>

namespace ds::http {

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

class HttpRouter;

class HttpServer : public std::enable_shared_from_this<HttpServer> {
public:
    HttpServer(net::io_context& ioc, const tcp::endpoint& endpoint, std::shared_ptr<const HttpRouter> router);

    void run();
    void stop();

    [[nodiscard]] tcp::endpoint localEndpoint() const { return acceptor_.local_endpoint(); }

private:
    void do_accept();

    tcp::acceptor acceptor_;
    tcp::socket socket_;
    std::shared_ptr<const HttpRouter> router_;
};

}
