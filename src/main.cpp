#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <csignal>
#include <curl/curl.h>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/config/config.hpp"
#include "core/logger/logger.hpp"
#include "egress/gateway.hpp"

namespace {

using Egress::Core::Config;
using Egress::Core::Constants;
using Egress::Core::Logger;

constexpr auto SERVE_REPORT_INTERVAL = std::chrono::seconds(60);

struct CurlGlobal {
    CurlGlobal() {
        curl_global_init(CURL_GLOBAL_ALL);
    }
    ~CurlGlobal() {
        curl_global_cleanup();
    }
};

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <command> [args] [options]\n"
              << "\nCommands:\n"
              << "  read <url>        Fetch a page through the reader service\n"
              << "  search <query>    Run a web search through the search service\n"
              << "  fetch <url>       Fetch a URL as-is\n"
              << "  stats             Print pool statistics after start-up probing\n"
              << "  serve             Keep the pool warm and report stats until interrupted\n"
              << "\nRun with --help for the full option list.\n";
}

std::string join_args(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& arg : args) {
        if (!out.empty())
            out += ' ';
        out += arg;
    }
    return out;
}

int emit(const Egress::DispatchResult& result, const std::string& source) {
    std::cout << Egress::to_json(result, source) << std::endl;
    return result.success ? Constants::EXIT_OK : Constants::EXIT_DISPATCH_FAILURE;
}

void serve(Egress::Gateway& gateway) {
    boost::asio::io_context   ioc;
    boost::asio::signal_set   signals(ioc, SIGINT, SIGTERM);
    boost::asio::steady_timer report(ioc);

    std::function<void()> schedule = [&]() {
        report.expires_after(SERVE_REPORT_INTERVAL);
        report.async_wait([&](const boost::system::error_code& ec) {
            if (ec)
                return;
            std::cout << Egress::to_json(gateway.stats()) << std::endl;
            schedule();
        });
    };

    signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
        if (!ec)
            Logger::info("Signal " + std::to_string(signal_number) + " received. Stopping...");
        report.cancel();
    });

    Logger::info("Serving. Press Ctrl+C to stop.");
    schedule();
    ioc.run();
}

int run(const Config& config, const char* prog) {
    if (config.command == "stats" || config.command == "serve") {
        if (!config.args.empty())
            throw std::invalid_argument(config.command + " takes no arguments");
    } else if (config.command == "read" || config.command == "fetch") {
        if (config.args.size() != 1)
            throw std::invalid_argument(config.command + " takes exactly one URL");
    } else if (config.command == "search") {
        if (config.args.empty())
            throw std::invalid_argument("search needs a query");
    } else {
        print_usage(prog);
        return Constants::EXIT_USAGE_ERROR;
    }

    CurlGlobal      curl;
    Egress::Gateway gateway(config);
    gateway.start();

    int code = Constants::EXIT_OK;
    if (config.command == "read") {
        code = emit(gateway.read(config.args.front()), "reader");
    } else if (config.command == "search") {
        code = emit(gateway.search(join_args(config.args)), "search");
    } else if (config.command == "fetch") {
        code = emit(gateway.fetch(config.args.front()), "fetch");
    } else if (config.command == "stats") {
        std::cout << Egress::to_json(gateway.stats()) << std::endl;
    } else {
        serve(gateway);
        std::cout << Egress::to_json(gateway.stats()) << std::endl;
    }

    gateway.stop();
    return code;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        auto config = Config::parse(argc, argv);
        config.validate();
        Logger::set_level(Logger::parse_level(config.log_level));
        return run(config, argv[0]);
    } catch (const std::invalid_argument& e) {
        Logger::error(e.what());
        return Constants::EXIT_USAGE_ERROR;
    } catch (const std::runtime_error& e) {
        Logger::error(e.what());
        return Constants::EXIT_USAGE_ERROR;
    }
}
