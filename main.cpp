#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"
#include "sync/TaskRegistry.hpp"
#include "protocols/http/HttpServer.hpp"
#include "protocols/http/HttpRouter.hpp"

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>

using namespace ds::config;
using namespace ds::logging;
using namespace ds::sync;

namespace net = boost::asio;

int main(const int argc, char* argv[]) {
    const std::filesystem::path configPath = argc > 1 ? argv[1] : "config.yaml";

    try {
        ConfigRegistry::init(configPath);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load configuration from " << configPath << ": " << e.what() << std::endl;
        return 1;
    }

    const auto& cfg = ConfigRegistry::get();

    try {
        LogRegistry::init(cfg.logging);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        return 1;
    }

    LogRegistry::dirsync()->info("[*] Starting dirsync with config {}", configPath.string());
    LogRegistry::config()->debug("[*] Effective configuration: {}", nlohmann::json(cfg).dump());

    try {
        TaskRegistry registry(cfg.mirror);

        for (const auto& pair : cfg.syncPairs()) {
            try {
                registry.addTask(pair.source, pair.destination, cfg.sync_interval);
            } catch (const std::invalid_argument& e) {
                LogRegistry::dirsync()->warn("[!] Skipping sync pair: {}", e.what());
            }
        }

        if (registry.size() == 0) LogRegistry::dirsync()->warn("[!] No valid sync pairs configured");
        registry.startAll();

        net::io_context ioc{1};

        const auto router = std::make_shared<const ds::http::HttpRouter>(registry, cfg.http.static_dir);
        const net::ip::tcp::endpoint endpoint{net::ip::make_address(cfg.http.host), cfg.http.port};
        const auto server = std::make_shared<ds::http::HttpServer>(ioc, endpoint, router);
        server->run();

        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, const int signum) {
            if (ec) return;
            LogRegistry::dirsync()->info("[!] Signal {} received. Shutting down gracefully...", signum);
            server->stop();
            ioc.stop();
        });

        LogRegistry::dirsync()->info("[✓] dirsync running with {} sync tasks", registry.size());
        ioc.run();

        LogRegistry::dirsync()->info("[*] Stopping sync tasks...");
    } catch (const std::exception& e) {
        LogRegistry::dirsync()->critical("[!] Fatal error: {}", e.what());
        spdlog::shutdown();
        return 1;
    }

    LogRegistry::dirsync()->info("[✓] dirsync stopped");
    spdlog::shutdown();
    return 0;
}
