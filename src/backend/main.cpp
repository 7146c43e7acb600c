/**
 * @file main.cpp
 * @brief 车库计费服务的主程序入口
 *
 * 该文件负责：
 * 1. 读取配置
 * 2. 打开存储并初始化车库布局
 * 3. 组装核心组件并启动HTTP服务器
 */
#include "include/crow_server.h"
#include "event_processor.h"
#include "garage_store.h"
#include "layout_provider.h"
#include "revenue.h"
#include "server_config.h"
#include <iostream>

/**
 * @brief 程序入口点
 * @return 0表示正常退出，1表示配置或启动失败
 */
int main(int argc, char* argv[]) {
    ServerConfig config;
    try {
        config = loadServerConfig(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        std::cerr << usage(argv[0]);
        return 1;
    }

    if (config.showHelp) {
        std::cout << usage(argv[0]);
        return 0;
    }

    Logger logger(std::cerr, config.logLevel);

    try {
        logger.info("Starting Garage Pricing API Server...");

        // 存储：数据文件存在时加载历史会话和车位占用
        GarageStore store(config.dataFile);

        // 布局只在首次启动时获取
        auto provider = makeLayoutProvider(config.layoutSource);
        initializeGarage(store, *provider, logger);

        EventProcessor processor(store, store, store, logger);
        RevenueAggregator revenue(store, logger);
        GarageApi api(processor, revenue, store, store, logger);

        CrowGarageServer server(api, logger, config.threads);

        logger.info("Available endpoints:");
        logger.info("POST   /webhook              - Vehicle ENTRY/PARKED/EXIT events");
        logger.info("GET    /revenue              - Revenue by sector and date");
        logger.info("GET    /api/status           - Sector occupancy and current prices");
        logger.info("GET    /api/session/:plate   - Active session of a vehicle");

        server.start(config.port);
        return 0;

    } catch (const std::exception& e) {
        logger.error(std::string("Server error: ") + e.what());
        return 1;
    }
}
