#include <pistache/endpoint.h>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>
#include "../include/scanner/api.hpp"
#include "../include/scanner/app_config.hpp"
#include "../include/scanner/logging.hpp"
#include "../include/scanner/market_data.hpp"
#include "../include/scanner/service.hpp"

using namespace Pistache;
using namespace scanner;

int main(int argc, char* argv[]) {
    std::string config_path;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            std::cerr << "usage: " << argv[0] << " [--config <file.json>]\n";
            return 2;
        }
    }

    AppConfig config;
    try {
        config = load_app_config(config_path);
        init_logging(config.logging);
    } catch (const std::exception& e) {
        std::cerr << "Startup failed: " << e.what() << "\n";
        return 1;
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);

    int status = 0;
    try {
        MarketDataClient client(config.market_data_options());
        ScannerService service(config, client);

        Address addr(config.api_host, Port(static_cast<uint16_t>(config.api_port)));
        ScannerAPI api(addr, service);
        api.init(static_cast<size_t>(config.api_threads));

        spdlog::info("[app] API running on http://{}:{}", config.api_host, config.api_port);
        api.start();
    } catch (const std::exception& e) {
        spdlog::critical("[app] server error: {}", e.what());
        status = 1;
    }

    curl_global_cleanup();
    return status;
}
