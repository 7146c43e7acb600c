/**
 * @file server_config.h
 * @brief 服务器配置
 *
 * 优先级从低到高：默认值 → JSON配置文件(--config) → 环境变量 → 命令行参数
 */
#pragma once
#include "logger.h"
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ServerConfig {
    uint16_t port = 8080;                              // HTTP监听端口
    std::string dataFile = "garage_data.dat";          // 数据文件，空串表示只在内存中保存
    std::string layoutSource = "http://localhost:5000"; // 布局来源：URL、JSON文件或simulated
    LogLevel logLevel = LogLevel::INFO;
    unsigned int threads = 0;                          // 工作线程数，0表示CPU核心数
    bool showHelp = false;
};

/**
 * @brief 应用JSON配置文件内容
 *
 * 支持的键：port、data_file、layout_source、log_level、threads
 * @throws ConfigError JSON格式错误或取值不合法
 */
void applyConfigJson(ServerConfig& config, const std::string& text);

/**
 * @brief 应用环境变量
 *
 * GARAGE_API_URL、GARAGE_PORT、GARAGE_DATA_FILE、GARAGE_LOG_LEVEL
 */
void applyEnvironment(ServerConfig& config, const std::map<std::string, std::string>& env);

/**
 * @brief 应用命令行参数（不含程序名）
 * @return --config指定的配置文件路径，没有时为空
 */
std::string applyArguments(ServerConfig& config, const std::vector<std::string>& args);

/**
 * @brief 按优先级组合全部配置来源
 */
ServerConfig loadServerConfig(int argc, char* argv[]);

std::string usage(const std::string& program);
