/**
 * @file layout_provider.h
 * @brief 车库布局来源与启动初始化
 */
#pragma once
#include "garage_types.h"
#include "logger.h"
#include "repositories.h"
#include <memory>
#include <stdexcept>
#include <string>

/**
 * @brief 布局无法获取、解析或校验失败
 */
class LayoutError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class LayoutProvider
 * @brief 启动时提供一次区域与车位配置
 */
class LayoutProvider {
public:
    virtual ~LayoutProvider() = default;

    /**
     * @throws LayoutError 获取或解析失败
     */
    virtual GarageLayout fetchLayout() = 0;

    virtual std::string describe() const = 0;
};

/**
 * @brief 从本地JSON文件读取布局
 */
class JsonFileLayoutProvider : public LayoutProvider {
public:
    explicit JsonFileLayoutProvider(const std::string& path);

    GarageLayout fetchLayout() override;
    std::string describe() const override;

private:
    std::string path;
};

/**
 * @brief 通过HTTP GET <baseUrl>/garage 获取布局
 *
 * 只支持明文http，使用HTTP/1.0以避免分块传输。
 */
class HttpLayoutProvider : public LayoutProvider {
public:
    /**
     * @param baseUrl 例：http://localhost:5000
     * @param timeoutSeconds 连接与读取超时
     * @throws LayoutError URL格式不合法
     */
    explicit HttpLayoutProvider(const std::string& baseUrl, int timeoutSeconds = 10);

    GarageLayout fetchLayout() override;
    std::string describe() const override;

    const std::string& getHost() const { return host; }
    const std::string& getPort() const { return port; }
    const std::string& getPath() const { return path; }

private:
    std::string baseUrl;
    std::string host;
    std::string port;
    std::string path;
    int timeoutSeconds;
};

/**
 * @brief 内置的模拟车库：A/B/C三个区域，每区15个车位
 */
class SimulatedLayoutProvider : public LayoutProvider {
public:
    GarageLayout fetchLayout() override;
    std::string describe() const override;
};

/**
 * @brief 解析布局JSON
 *
 * 格式：{"sectors":[{"name","base_price","max_capacity"}],
 *        "spots":[{"spot_id","sector","lat","lng"}]}
 * @throws LayoutError JSON格式错误或缺少字段
 */
GarageLayout parseLayoutJson(const std::string& text);

/**
 * @brief 校验布局完整性
 * @throws LayoutError 区域重名、车位重号、容量为负、车位引用未知区域
 */
void validateLayout(const GarageLayout& layout);

/**
 * @brief 根据配置的布局来源创建提供方
 * @param source "simulated"、http(s)地址或JSON文件路径
 */
std::unique_ptr<LayoutProvider> makeLayoutProvider(const std::string& source);

/**
 * @brief 启动时初始化车库布局
 * @return 是否执行了加载；存储中已有布局时跳过并返回false
 * @throws LayoutError 布局获取或校验失败
 * @throws StoreError 布局无法写入存储
 */
bool initializeGarage(LayoutRepository& layout, LayoutProvider& provider, Logger& logger);
