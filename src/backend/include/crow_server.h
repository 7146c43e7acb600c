#pragma once

#ifndef CROW_USE_BOOST_ASIO
#define CROW_USE_BOOST_ASIO
#endif
#include <boost/asio.hpp>
#include "crow.h"
#include "crow/middlewares/cors.h"
#include "../api_handlers.h"

class CrowGarageServer {
public:
    CrowGarageServer(GarageApi& api, Logger& logger, unsigned int threads = 0);

    void start(uint16_t port = 8080);
    void stop();

private:
    void setupRoutes();
    void setupCORS();

    static crow::response toCrowResponse(const HttpResponse& response);

    GarageApi& api;
    Logger& logger;
    unsigned int threads;
    crow::App<crow::CORSHandler> app;
};
