/**
 * @file crow_server.cpp
 * @brief 基于Crow的HTTP服务器
 *
 * 路由：
 * - POST /webhook              车辆事件
 * - GET  /revenue              区域营收
 * - GET  /api/status           各区域占用情况
 * - GET  /api/session/<plate>  在场会话
 */
#include "include/crow_server.h"
#include <thread>

namespace {

crow::LogLevel toCrowLevel(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return crow::LogLevel::Debug;
        case LogLevel::INFO: return crow::LogLevel::Info;
        case LogLevel::WARNING: return crow::LogLevel::Warning;
        default: return crow::LogLevel::Error;
    }
}

}  // namespace

CrowGarageServer::CrowGarageServer(GarageApi& garageApi, Logger& log, unsigned int threadCount)
    : api(garageApi)
    , logger(log)
    , threads(threadCount) {
    app.loglevel(toCrowLevel(logger.getLogLevel()));
    setupCORS();
    setupRoutes();
}

crow::response CrowGarageServer::toCrowResponse(const HttpResponse& response) {
    crow::response res(response.status);
    for (const auto& [key, value] : response.headers) {
        res.set_header(key, value);
    }
    res.body = response.body;
    return res;
}

void CrowGarageServer::setupCORS() {
    auto& cors = app.get_middleware<crow::CORSHandler>();
    cors.global()
        .origin("*")
        .methods(crow::HTTPMethod::Get, crow::HTTPMethod::Post, crow::HTTPMethod::Options)
        .headers("Content-Type");
}

void CrowGarageServer::setupRoutes() {
    CROW_ROUTE(app, "/webhook").methods(crow::HTTPMethod::Post)
    ([this](const crow::request& req) {
        return toCrowResponse(api.handleWebhook(req.body));
    });

    CROW_ROUTE(app, "/revenue").methods(crow::HTTPMethod::Get)
    ([this](const crow::request& req) {
        const char* sector = req.url_params.get("sector");
        const char* date = req.url_params.get("date");
        return toCrowResponse(api.handleRevenue(sector ? sector : "", date ? date : ""));
    });

    CROW_ROUTE(app, "/api/status").methods(crow::HTTPMethod::Get)
    ([this]() {
        return toCrowResponse(api.handleGetGarageStatus());
    });

    CROW_ROUTE(app, "/api/session/<string>").methods(crow::HTTPMethod::Get)
    ([this](const std::string& plate) {
        return toCrowResponse(api.handleGetSession(urlDecode(plate)));
    });
}

void CrowGarageServer::start(uint16_t port) {
    unsigned int workers = threads > 0 ? threads : std::thread::hardware_concurrency();
    if (workers == 0) {
        workers = 1;
    }

    logger.info("Server started on port " + std::to_string(port) + " with " +
                std::to_string(workers) + " worker threads.");
    app.port(port).concurrency(workers).run();
}

void CrowGarageServer::stop() {
    app.stop();
}
