/**
 * @file server_config.cpp
 * @brief 服务器配置解析
 */
#include "server_config.h"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace {

uint16_t parsePort(const std::string& text) {
    try {
        size_t pos = 0;
        unsigned long value = std::stoul(text, &pos);
        if (pos != text.size() || value == 0 || value > 65535) {
            throw ConfigError("Invalid port: " + text);
        }
        return static_cast<uint16_t>(value);
    } catch (const std::logic_error&) {
        throw ConfigError("Invalid port: " + text);
    }
}

unsigned int parseThreads(const std::string& text) {
    try {
        size_t pos = 0;
        unsigned long value = std::stoul(text, &pos);
        if (pos != text.size() || value > 1024) {
            throw ConfigError("Invalid thread count: " + text);
        }
        return static_cast<unsigned int>(value);
    } catch (const std::logic_error&) {
        throw ConfigError("Invalid thread count: " + text);
    }
}

LogLevel parseLogLevel(const std::string& text) {
    LogLevel level;
    if (!Logger::parseLevel(text, level)) {
        throw ConfigError("Invalid log level: " + text);
    }
    return level;
}

std::string readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw ConfigError("Cannot open config file: " + path);
    }
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

}  // namespace

void applyConfigJson(ServerConfig& config, const std::string& text) {
    try {
        json doc = json::parse(text);
        if (!doc.is_object()) {
            throw ConfigError("Config file must contain a JSON object");
        }

        if (doc.contains("port")) {
            int port = doc["port"].get<int>();
            if (port <= 0 || port > 65535) {
                throw ConfigError("Invalid port: " + std::to_string(port));
            }
            config.port = static_cast<uint16_t>(port);
        }
        if (doc.contains("data_file")) {
            config.dataFile = doc["data_file"].get<std::string>();
        }
        if (doc.contains("layout_source")) {
            config.layoutSource = doc["layout_source"].get<std::string>();
        }
        if (doc.contains("log_level")) {
            config.logLevel = parseLogLevel(doc["log_level"].get<std::string>());
        }
        if (doc.contains("threads")) {
            int threads = doc["threads"].get<int>();
            if (threads < 0 || threads > 1024) {
                throw ConfigError("Invalid thread count: " + std::to_string(threads));
            }
            config.threads = static_cast<unsigned int>(threads);
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid config file: ") + e.what());
    }
}

void applyEnvironment(ServerConfig& config, const std::map<std::string, std::string>& env) {
    auto it = env.find("GARAGE_API_URL");
    if (it != env.end() && !it->second.empty()) {
        config.layoutSource = it->second;
    }

    it = env.find("GARAGE_PORT");
    if (it != env.end() && !it->second.empty()) {
        config.port = parsePort(it->second);
    }

    // 允许设为空串以关闭持久化
    it = env.find("GARAGE_DATA_FILE");
    if (it != env.end()) {
        config.dataFile = it->second;
    }

    it = env.find("GARAGE_LOG_LEVEL");
    if (it != env.end() && !it->second.empty()) {
        config.logLevel = parseLogLevel(it->second);
    }
}

std::string applyArguments(ServerConfig& config, const std::vector<std::string>& args) {
    std::string configFile;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            config.showHelp = true;
            continue;
        }

        if (i + 1 >= args.size()) {
            throw ConfigError("Missing value for " + arg);
        }
        const std::string& value = args[++i];

        if (arg == "--config") {
            configFile = value;
        } else if (arg == "--port") {
            config.port = parsePort(value);
        } else if (arg == "--data-file") {
            config.dataFile = value;
        } else if (arg == "--layout") {
            config.layoutSource = value;
        } else if (arg == "--log-level") {
            config.logLevel = parseLogLevel(value);
        } else if (arg == "--threads") {
            config.threads = parseThreads(value);
        } else {
            throw ConfigError("Unknown option: " + arg);
        }
    }

    return configFile;
}

ServerConfig loadServerConfig(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    // 先扫描一遍参数以找到配置文件，再按优先级依次应用
    ServerConfig scan;
    std::string configFile = applyArguments(scan, args);

    ServerConfig config;
    if (!configFile.empty()) {
        applyConfigJson(config, readFile(configFile));
    }

    std::map<std::string, std::string> env;
    for (const char* name : {"GARAGE_API_URL", "GARAGE_PORT", "GARAGE_DATA_FILE", "GARAGE_LOG_LEVEL"}) {
        if (const char* value = std::getenv(name)) {
            env[name] = value;
        }
    }
    applyEnvironment(config, env);

    applyArguments(config, args);
    return config;
}

std::string usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "  --config <file>      JSON config file\n"
        << "  --port <port>        HTTP port (default 8080)\n"
        << "  --data-file <file>   data file, empty for memory only (default garage_data.dat)\n"
        << "  --layout <source>    layout source: http://host:port, JSON file or 'simulated'\n"
        << "  --log-level <level>  DEBUG, INFO, WARNING or ERROR\n"
        << "  --threads <n>        worker threads, 0 for CPU cores\n"
        << "  -h, --help           show this message\n";
    return out.str();
}
