/**
 * @file api_handlers.h
 * @brief HTTP接口处理函数（与具体HTTP框架无关）
 */
#pragma once
#include "event_processor.h"
#include "logger.h"
#include "repositories.h"
#include "revenue.h"
#include <nlohmann/json.hpp>
#include <map>
#include <string>

class HttpResponse {
public:
    int status;
    std::string body;
    std::map<std::string, std::string> headers;

    HttpResponse(int s = 200) : status(s) {
        headers["Content-Type"] = "application/json";
    }
};

/**
 * @class GarageApi
 * @brief 把JSON请求转换为核心调用，把结果转换为JSON响应
 *
 * 事件接口始终返回200和{"success": bool}，让上游事件源总能收到确认；
 * 营收接口对参数错误返回400，对存储故障返回500。
 */
class GarageApi {
public:
    GarageApi(EventProcessor& processor,
              const RevenueAggregator& revenue,
              const LayoutRepository& layout,
              const SessionRepository& sessions,
              Logger& logger);

    /**
     * @brief POST /webhook
     * @param body {"license_plate","event_type","entry_time"?,"exit_time"?,"lat"?,"lng"?}
     */
    HttpResponse handleWebhook(const std::string& body);

    /**
     * @brief GET /revenue?sector=A&date=YYYY-MM-DD
     */
    HttpResponse handleRevenue(const std::string& sector, const std::string& date);

    /**
     * @brief GET /api/status
     */
    HttpResponse handleGetGarageStatus();

    /**
     * @brief GET /api/session/<plate>
     */
    HttpResponse handleGetSession(const std::string& plate);

private:
    std::string createJsonResponse(bool success, const std::string& message,
                                   const nlohmann::json& data = nullptr) const;

    EventProcessor& processor;
    const RevenueAggregator& revenue;
    const LayoutRepository& layout;
    const SessionRepository& sessions;
    Logger& logger;
};

std::string urlDecode(const std::string& encoded);
