/**
 * @file layout_provider.cpp
 * @brief 布局来源实现
 */
#include "layout_provider.h"
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <set>
#include <sstream>

using json = nlohmann::json;

GarageLayout parseLayoutJson(const std::string& text) {
    GarageLayout layout;
    try {
        json doc = json::parse(text);

        for (const auto& item : doc.at("sectors")) {
            Sector sector;
            sector.name = item.at("name").get<std::string>();
            sector.basePrice = toCents(item.at("base_price").get<double>());
            sector.maxCapacity = item.at("max_capacity").get<int>();
            layout.sectors.push_back(sector);
        }

        for (const auto& item : doc.at("spots")) {
            Spot spot;
            // 模拟器可能把车位编号写成数字
            const auto& id = item.at("spot_id");
            spot.spotId = id.is_string() ? id.get<std::string>() : id.dump();
            spot.sectorName = item.at("sector").get<std::string>();
            spot.lat = item.at("lat").get<double>();
            spot.lng = item.at("lng").get<double>();
            spot.occupied = false;
            layout.spots.push_back(spot);
        }
    } catch (const json::exception& e) {
        throw LayoutError(std::string("Invalid garage layout: ") + e.what());
    }
    return layout;
}

void validateLayout(const GarageLayout& layout) {
    std::set<std::string> sectorNames;
    for (const auto& sector : layout.sectors) {
        if (sector.name.empty()) {
            throw LayoutError("Sector with empty name");
        }
        if (!sectorNames.insert(sector.name).second) {
            throw LayoutError("Duplicate sector: " + sector.name);
        }
        if (sector.maxCapacity < 0) {
            throw LayoutError("Negative capacity for sector " + sector.name);
        }
        if (sector.basePrice < 0) {
            throw LayoutError("Negative base price for sector " + sector.name);
        }
    }

    std::set<std::string> spotIds;
    for (const auto& spot : layout.spots) {
        if (spot.spotId.empty()) {
            throw LayoutError("Spot with empty id");
        }
        if (!spotIds.insert(spot.spotId).second) {
            throw LayoutError("Duplicate spot: " + spot.spotId);
        }
        if (sectorNames.count(spot.sectorName) == 0) {
            throw LayoutError("Spot " + spot.spotId + " references unknown sector " + spot.sectorName);
        }
    }
}

JsonFileLayoutProvider::JsonFileLayoutProvider(const std::string& filePath)
    : path(filePath) {
}

GarageLayout JsonFileLayoutProvider::fetchLayout() {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw LayoutError("Cannot open layout file: " + path);
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return parseLayoutJson(content);
}

std::string JsonFileLayoutProvider::describe() const {
    return "file " + path;
}

HttpLayoutProvider::HttpLayoutProvider(const std::string& url, int timeout)
    : baseUrl(url)
    , port("80")
    , timeoutSeconds(timeout) {
    const std::string scheme = "http://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        throw LayoutError("Unsupported layout URL (expected http://): " + url);
    }

    // 拆分 host[:port][/base]
    std::string rest = url.substr(scheme.size());
    size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    std::string basePath = slash == std::string::npos ? "" : rest.substr(slash);

    size_t colon = authority.find(':');
    if (colon != std::string::npos) {
        host = authority.substr(0, colon);
        port = authority.substr(colon + 1);
    } else {
        host = authority;
    }
    if (host.empty() || port.empty()) {
        throw LayoutError("Invalid layout URL: " + url);
    }

    while (!basePath.empty() && basePath.back() == '/') {
        basePath.pop_back();
    }
    path = basePath + "/garage";
}

GarageLayout HttpLayoutProvider::fetchLayout() {
    boost::asio::ip::tcp::iostream stream;
    stream.expires_after(std::chrono::seconds(timeoutSeconds));
    stream.connect(host, port);
    if (!stream) {
        throw LayoutError("Failed to connect to " + baseUrl + ": " + stream.error().message());
    }

    // 1. 发送请求
    stream << "GET " << path << " HTTP/1.0\r\n"
           << "Host: " << host << "\r\n"
           << "Accept: application/json\r\n"
           << "Connection: close\r\n\r\n";
    stream.flush();

    // 2. 解析状态行
    std::string httpVersion;
    unsigned int statusCode = 0;
    stream >> httpVersion >> statusCode;
    std::string statusMessage;
    std::getline(stream, statusMessage);
    if (!stream || httpVersion.compare(0, 5, "HTTP/") != 0) {
        throw LayoutError("Invalid HTTP response from " + baseUrl);
    }
    if (statusCode != 200) {
        throw LayoutError("Layout provider " + baseUrl + " returned status " +
                          std::to_string(statusCode));
    }

    // 3. 跳过头部
    std::string header;
    while (std::getline(stream, header) && header != "\r" && !header.empty()) {
    }

    // 4. 读取响应体直到连接关闭
    std::ostringstream body;
    body << stream.rdbuf();
    return parseLayoutJson(body.str());
}

std::string HttpLayoutProvider::describe() const {
    return "http://" + host + ":" + port + path;
}

GarageLayout SimulatedLayoutProvider::fetchLayout() {
    GarageLayout layout;
    layout.sectors = {
        {"A", 1000, 15},
        {"B", 1200, 15},
        {"C", 1500, 15}
    };

    // 基准坐标，区域之间错开0.001，区域内每个车位错开0.0001
    const double baseLat = -23.561684;
    const double baseLng = -46.655981;

    for (const auto& sector : layout.sectors) {
        int sectorOffset = sector.name[0] - 'A';
        for (int i = 1; i <= sector.maxCapacity; ++i) {
            double latOffset = (i % 15) * 0.0001;
            double lngOffset = (i / 15) * 0.0001;

            std::ostringstream id;
            id << sector.name << std::setw(3) << std::setfill('0') << i;

            Spot spot;
            spot.spotId = id.str();
            spot.sectorName = sector.name;
            spot.lat = baseLat + sectorOffset * 0.001 + latOffset;
            spot.lng = baseLng + sectorOffset * 0.001 + lngOffset;
            layout.spots.push_back(spot);
        }
    }
    return layout;
}

std::string SimulatedLayoutProvider::describe() const {
    return "simulated garage";
}

std::unique_ptr<LayoutProvider> makeLayoutProvider(const std::string& source) {
    if (source == "simulated") {
        return std::make_unique<SimulatedLayoutProvider>();
    }
    if (source.compare(0, 7, "http://") == 0 || source.compare(0, 8, "https://") == 0) {
        return std::make_unique<HttpLayoutProvider>(source);
    }
    return std::make_unique<JsonFileLayoutProvider>(source);
}

bool initializeGarage(LayoutRepository& layout, LayoutProvider& provider, Logger& logger) {
    if (layout.hasLayout()) {
        logger.info("Garage already initialized, skipping");
        return false;
    }

    logger.info("Fetching garage configuration from " + provider.describe());
    GarageLayout config = provider.fetchLayout();
    validateLayout(config);
    layout.loadLayout(config);

    logger.info("Garage initialized with " + std::to_string(config.sectors.size()) +
                " sectors and " + std::to_string(config.spots.size()) + " spots");
    return true;
}
