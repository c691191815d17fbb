#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "config/AppConfig.hpp"
#include "core/BeastHttpServer.hpp"
#include "core/CachingFacade.hpp"
#include "core/HttpBackendClient.hpp"
#include "core/SteadyClock.hpp"
#include "logging/ConsoleLogger.hpp"
#include "metrics/DummyStatsDClient.hpp"
#include "metrics/StatsDClient.hpp"
#include "utils/Utils.hpp"

using namespace std;

// Real client when STATSD_SERVER is set and usable, no-op client otherwise.
std::shared_ptr<IStatsDClient> initializeStatsDClient(const AppConfig& config, std::shared_ptr<ILogger> logger_) {
    string statsd_server_endpoint;
    const char* statsd_server_value = std::getenv("STATSD_SERVER");
    if (statsd_server_value != nullptr) {
        statsd_server_endpoint = std::string(statsd_server_value);
    }

    if (statsd_server_endpoint.empty()) {
        logger_->setup("STATSD_SERVER not set. Metrics are disabled.");
        return std::make_shared<DummyStatsDClient>();
    }

    try {
        auto client = std::make_shared<StatsDClient>(config, logger_, statsd_server_endpoint);
        logger_->setup("Sending metrics to " + statsd_server_endpoint);
        return client;
    } catch (const std::exception& e) {
        logger_->error("StatsDClient could not be created for '" + statsd_server_endpoint + "': " + e.what()
            + ". Metrics are disabled.");
    }
    return std::make_shared<DummyStatsDClient>();
}

int main(int argc, char** argv) {
    try {
        vector<string> args_vec;
        for (int i = 1; i < argc; ++i) {
            args_vec.push_back(argv[i]);
        }

        optional<map<string, string>> parsedArgsOpt = Utils::parseArguments(args_vec);
        if (!parsedArgsOpt) {
            ConsoleLogger(LogUtils::LogLevel::CERROR).error("Failed to parse command-line arguments. Exiting.");
            return 1;
        }

        AppConfig config_ = Utils::loadConfiguration(parsedArgsOpt.value());

        std::shared_ptr<ILogger> logger_ = std::make_shared<ConsoleLogger>(config_.log_level);
        logger_->setup("Configuration loaded.");
        logger_->setup(config_.to_string());

        // Reject a bad cache configuration before anything starts listening.
        ResCacheOptions::fromConfig(config_).validate();

        std::shared_ptr<IStatsDClient> statsd_client = initializeStatsDClient(config_, logger_);

        net::io_context ioc;
        auto work_guard = net::make_work_guard(ioc);

        auto backend_client = std::make_shared<HttpBackendClient>(
            ioc, std::chrono::milliseconds(config_.backend_timeout_in_millis), logger_);
        auto facade = std::make_shared<CachingFacade>(
            ioc, backend_client, statsd_client, config_, logger_, std::make_shared<SteadyClock>());

        auto const address = net::ip::make_address("0.0.0.0");
        auto const port = static_cast<unsigned short>(config_.frontend_port);
        auto server = std::make_shared<BeastHttpServer>(ioc, tcp::endpoint{address, port}, facade, logger_, config_);
        server->run();

        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](beast::error_code const& ec, int signal_number) {
            if (ec) {
                return;
            }
            logger_->setup("Signal " + std::to_string(signal_number) + " received. Shutting down...");
            server->stop();
            facade->cancel_active_backend_calls();
            work_guard.reset();
            ioc.stop();
        });

        // The main thread is one of the I/O threads.
        std::vector<std::thread> ioc_threads;
        for (unsigned int i = 1; i < config_.num_io_threads; ++i) {
            ioc_threads.emplace_back([&ioc, logger_, i]() {
                try {
                    ioc.run();
                } catch (const std::exception& e) {
                    logger_->error("Exception in I/O thread " + std::to_string(i) + ": " + e.what());
                }
            });
        }
        logger_->setup("rescache running on port " + std::to_string(config_.frontend_port) + " with "
            + std::to_string(config_.num_io_threads) + " I/O threads. Press Ctrl+C to exit.");

        try {
            ioc.run();
        } catch (const std::exception& e) {
            logger_->error("Exception in main thread ioc.run(): " + std::string(e.what()));
        }

        for (auto& t : ioc_threads) {
            if (t.joinable()) t.join();
        }
        logger_->setup("All I/O threads joined. Exiting.");
        return 0;
    } catch (const std::exception& e) {
        ConsoleLogger(LogUtils::LogLevel::CERROR).error("Unhandled exception: " + std::string(e.what()));
        return 1;
    }
}
