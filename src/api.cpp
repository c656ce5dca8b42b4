#include "../include/scanner/api.hpp"
#include "../include/scanner/errors.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <string>

using json = nlohmann::json;

namespace scanner {

namespace {

void send_json(Http::ResponseWriter& response, Http::Code code, const json& body) {
    response.headers().add<Http::Header::ContentType>(MIME(Application, Json));
    response.send(code, body.dump());
}

void send_error(Http::ResponseWriter& response, Http::Code code, const std::string& message) {
    json error_response = {
        {"error", true},
        {"message", message}
    };
    send_json(response, code, error_response);
}

json parse_body(const Rest::Request& request) {
    if (request.body().empty()) return json::object();
    return json::parse(request.body());
}

// Maps the handler's outcome onto a status code: 400 malformed JSON, 422 rejected input,
// 500 anything else.
template <typename Handler>
void respond(const char* endpoint, Http::ResponseWriter& response, Handler&& handler) {
    try {
        send_json(response, Http::Code::Ok, handler());
    } catch (const json::parse_error& e) {
        spdlog::warn("[api] {}: malformed JSON: {}", endpoint, e.what());
        send_error(response, Http::Code::Bad_Request, std::string("Malformed JSON: ") + e.what());
    } catch (const ValidationError& e) {
        spdlog::warn("[api] {}: validation failed: {}", endpoint, e.what());
        send_error(response, Http::Code::Unprocessable_Entity, e.what());
    } catch (const std::exception& e) {
        spdlog::error("[api] {}: {}", endpoint, e.what());
        send_error(response, Http::Code::Internal_Server_Error, e.what());
    }
}

} // namespace

// -------- ScannerController --------

ScannerController::ScannerController(ScannerService& service) : service_(service) {}

void ScannerController::setupRoutes(Rest::Router& router) {
    using namespace Rest;

    Routes::Get(router, "/health", Routes::bind(&ScannerController::health, this));
    Routes::Get(router, "/api/settings", Routes::bind(&ScannerController::getSettings, this));
    Routes::Put(router, "/api/settings", Routes::bind(&ScannerController::updateSettings, this));
    Routes::Post(router, "/api/settings/reset", Routes::bind(&ScannerController::resetSettings, this));
    Routes::Get(router, "/api/market-data/:symbol", Routes::bind(&ScannerController::getMarketData, this));
    Routes::Post(router, "/api/scan", Routes::bind(&ScannerController::runScan, this));
    Routes::Post(router, "/api/backtest", Routes::bind(&ScannerController::runBacktest, this));
}

void ScannerController::health(const Rest::Request&, Http::ResponseWriter response) {
    respond("health", response, [&] { return service_.health(); });
}

void ScannerController::getSettings(const Rest::Request&, Http::ResponseWriter response) {
    respond("settings", response, [&] { return service_.settings(); });
}

void ScannerController::updateSettings(const Rest::Request& request, Http::ResponseWriter response) {
    respond("settings", response, [&] { return service_.update_settings(parse_body(request)); });
}

void ScannerController::resetSettings(const Rest::Request&, Http::ResponseWriter response) {
    respond("settings", response, [&] { return service_.reset_settings(); });
}

void ScannerController::getMarketData(const Rest::Request& request, Http::ResponseWriter response) {
    respond("market-data", response, [&] {
        const auto symbol = request.param(":symbol").as<std::string>();
        const auto timeframe = request.query().get("timeframe");
        const auto days = request.query().get("days");
        return service_.market_data(symbol, timeframe ? *timeframe : std::string(),
                                    days ? *days : std::string());
    });
}

void ScannerController::runScan(const Rest::Request& request, Http::ResponseWriter response) {
    respond("scan", response, [&] { return service_.scan(parse_body(request)); });
}

void ScannerController::runBacktest(const Rest::Request& request, Http::ResponseWriter response) {
    respond("backtest", response, [&] { return service_.backtest(parse_body(request)); });
}

// -------- ScannerAPI --------

ScannerAPI::ScannerAPI(Address addr, ScannerService& service)
    : httpEndpoint_(std::make_shared<Http::Endpoint>(addr)), controller_(service) {}

void ScannerAPI::init(size_t thr) {
    auto opts = Http::Endpoint::options()
        .threads(static_cast<int>(thr))
        .flags(Tcp::Options::ReuseAddr);
    httpEndpoint_->init(opts);
    controller_.setupRoutes(router_);
}

void ScannerAPI::start() {
    httpEndpoint_->setHandler(router_.handler());
    httpEndpoint_->serve();
}

void ScannerAPI::stop() {
    httpEndpoint_->shutdown();
}

} // namespace scanner
