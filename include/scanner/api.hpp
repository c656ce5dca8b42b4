#pragma once
#include <pistache/endpoint.h>
#include <pistache/http.h>
#include <pistache/net.h>
#include <pistache/router.h>
#include <memory>
#include "service.hpp"

namespace scanner {

using namespace Pistache;

class ScannerController {
public:
    explicit ScannerController(ScannerService& service);

    void setupRoutes(Rest::Router& router);

    // API endpoints
    void health(const Rest::Request& request, Http::ResponseWriter response);
    void getSettings(const Rest::Request& request, Http::ResponseWriter response);
    void updateSettings(const Rest::Request& request, Http::ResponseWriter response);
    void resetSettings(const Rest::Request& request, Http::ResponseWriter response);
    void getMarketData(const Rest::Request& request, Http::ResponseWriter response);
    void runScan(const Rest::Request& request, Http::ResponseWriter response);
    void runBacktest(const Rest::Request& request, Http::ResponseWriter response);

private:
    ScannerService& service_;
};

class ScannerAPI {
public:
    ScannerAPI(Address addr, ScannerService& service);
    void init(size_t thr = 2);
    void start();
    void stop();

private:
    std::shared_ptr<Http::Endpoint> httpEndpoint_;
    Rest::Router router_;
    ScannerController controller_;
};

} // namespace scanner
