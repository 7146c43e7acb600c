/**
 * @file api_handlers.cpp
 * @brief HTTP接口处理函数实现
 */
#include "api_handlers.h"
#include "time_utils.h"
#include <cctype>
#include <sstream>

using json = nlohmann::json;

namespace {

/**
 * @brief 读取可选的时间戳字段
 * @return 字段类型或格式不合法时返回false
 */
bool readTimestamp(const json& doc, const char* key, std::optional<time_t>& out) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return true;
    }
    if (!it->is_string()) {
        return false;
    }
    time_t t;
    if (!parseIso8601(it->get<std::string>(), t)) {
        return false;
    }
    out = t;
    return true;
}

bool readCoordinate(const json& doc, const char* key, std::optional<double>& out) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return true;
    }
    if (!it->is_number()) {
        return false;
    }
    out = it->get<double>();
    return true;
}

bool readString(const json& doc, const char* key, std::string& out) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return true;
    }
    if (!it->is_string()) {
        return false;
    }
    out = it->get<std::string>();
    return true;
}

/**
 * @brief 把请求体转换为原始事件
 * @param[out] error 失败原因
 */
bool parseRawEvent(const std::string& body, RawVehicleEvent& raw, std::string& error) {
    json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        error = "Invalid JSON payload";
        return false;
    }

    if (!readString(doc, "license_plate", raw.licensePlate)) {
        error = "license_plate must be a string";
        return false;
    }
    if (!readString(doc, "event_type", raw.eventType)) {
        error = "event_type must be a string";
        return false;
    }
    if (!readTimestamp(doc, "entry_time", raw.entryTime)) {
        error = "Invalid entry_time";
        return false;
    }
    if (!readTimestamp(doc, "exit_time", raw.exitTime)) {
        error = "Invalid exit_time";
        return false;
    }
    if (!readCoordinate(doc, "lat", raw.lat) || !readCoordinate(doc, "lng", raw.lng)) {
        error = "lat and lng must be numbers";
        return false;
    }
    return true;
}

HttpResponse webhookReply(bool success, const std::string& error = "") {
    json body;
    body["success"] = success;
    if (!error.empty()) {
        body["error"] = error;
    }
    // 事件接口始终返回200
    HttpResponse response(200);
    response.body = body.dump();
    return response;
}

HttpResponse errorReply(int status, const std::string& error) {
    json body;
    body["error"] = error;
    HttpResponse response(status);
    response.body = body.dump();
    return response;
}

}  // namespace

/**
 * @brief URL解码函数
 * @param encoded URL编码的字符串
 * @return 解码后的原始字符串
 *
 * %后不足两位或不是16进制时保持原样；+号转换为空格。
 */
std::string urlDecode(const std::string& encoded) {
    std::string result;
    result.reserve(encoded.length());

    for (size_t i = 0; i < encoded.length(); ++i) {
        if (encoded[i] == '%' && i + 2 < encoded.length() &&
            std::isxdigit(static_cast<unsigned char>(encoded[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(encoded[i + 2]))) {
            int value = 0;
            std::istringstream(encoded.substr(i + 1, 2)) >> std::hex >> value;
            result += static_cast<char>(value);
            i += 2;  // 跳过已处理的两个字符
        } else if (encoded[i] == '+') {
            result += ' ';
        } else {
            result += encoded[i];
        }
    }
    return result;
}

GarageApi::GarageApi(EventProcessor& eventProcessor,
                     const RevenueAggregator& revenueAggregator,
                     const LayoutRepository& layoutRepo,
                     const SessionRepository& sessionRepo,
                     Logger& log)
    : processor(eventProcessor)
    , revenue(revenueAggregator)
    , layout(layoutRepo)
    , sessions(sessionRepo)
    , logger(log) {
}

std::string GarageApi::createJsonResponse(bool success, const std::string& message,
                                          const json& data) const {
    json body;
    body["success"] = success;
    body["message"] = message;
    if (!data.is_null()) {
        body["data"] = data;
    }
    return body.dump();
}

HttpResponse GarageApi::handleWebhook(const std::string& body) {
    RawVehicleEvent raw;
    try {
        // 1. 解析请求体
        std::string error;
        if (!parseRawEvent(body, raw, error)) {
            logger.warning("Webhook rejected: " + error);
            return webhookReply(false, error);
        }

        // 2. 校验并解码事件类型
        VehicleEvent event;
        DecodeStatus status = decodeVehicleEvent(raw, event);
        if (status != DecodeStatus::OK) {
            logger.warning("Webhook rejected for " + raw.licensePlate + ": " +
                           decodeStatusMessage(status));
            return webhookReply(false, decodeStatusMessage(status));
        }

        // 3. 交给核心处理
        return webhookReply(processor.processEvent(event));
    } catch (const std::exception& e) {
        logger.error("Webhook processing failed for " + raw.licensePlate + ": " + e.what());
        return webhookReply(false, e.what());
    }
}

HttpResponse GarageApi::handleRevenue(const std::string& sector, const std::string& date) {
    if (sector.empty()) {
        return errorReply(400, "sector is required");
    }

    time_t day;
    if (!parseDate(date, day)) {
        return errorReply(400, "Invalid date format. Use YYYY-MM-DD");
    }

    try {
        Cents total = revenue.revenue(sector, day);

        json body;
        body["sector"] = sector;
        body["date"] = date;
        body["revenue"] = toAmount(total);

        HttpResponse response(200);
        response.body = body.dump();
        return response;
    } catch (const std::exception& e) {
        logger.error("Revenue query failed for sector " + sector + ": " + e.what());
        return errorReply(500, e.what());
    }
}

HttpResponse GarageApi::handleGetGarageStatus() {
    try {
        json data = json::array();
        for (const auto& status : layout.getSectorStatus()) {
            const Sector& sector = status.sector;
            double rate = occupancyRate(status.occupied, sector.maxCapacity);
            size_t capacity = sector.maxCapacity > 0 ? static_cast<size_t>(sector.maxCapacity) : 0;

            json item;
            item["name"] = sector.name;
            item["max_capacity"] = sector.maxCapacity;
            item["occupied"] = status.occupied;
            item["available"] = capacity > status.occupied ? capacity - status.occupied : 0;
            item["occupancy_rate"] = rate;
            item["base_price"] = toAmount(sector.basePrice);
            item["current_price"] = toAmount(dynamicPrice(sector.basePrice, rate));
            data.push_back(item);
        }

        HttpResponse response(200);
        response.body = createJsonResponse(true, "Status retrieved", data);
        return response;
    } catch (const std::exception& e) {
        HttpResponse response(500);
        response.body = createJsonResponse(false, std::string("Internal error: ") + e.what());
        return response;
    }
}

HttpResponse GarageApi::handleGetSession(const std::string& plate) {
    try {
        auto session = sessions.findActiveSession(plate);
        if (!session) {
            HttpResponse response(404);
            response.body = createJsonResponse(false, "No active session");
            return response;
        }

        json data;
        data["license_plate"] = session->getLicensePlate();
        data["entry_time"] = formatIso8601(session->getEntryTime());
        data["applied_base_price"] = toAmount(session->getAppliedBasePrice());
        data["sector"] = session->getSectorName() ? json(*session->getSectorName()) : json();
        data["spot_id"] = session->getSpotId() ? json(*session->getSpotId()) : json();
        data["lat"] = session->getLat() ? json(*session->getLat()) : json();
        data["lng"] = session->getLng() ? json(*session->getLng()) : json();

        HttpResponse response(200);
        response.body = createJsonResponse(true, "Session found", data);
        return response;
    } catch (const std::exception& e) {
        HttpResponse response(500);
        response.body = createJsonResponse(false, std::string("Internal error: ") + e.what());
        return response;
    }
}
