// configuration layers: defaults, JSON file, environment, command line

#include "server_config.h"
#include <cassert>
#include <string>
#include <vector>

namespace {

bool throwsConfigError(void (*apply)(ServerConfig&)) {
    ServerConfig config;
    try {
        apply(config);
    } catch (const ConfigError&) {
        return true;
    }
    return false;
}

}  // namespace

int main() {
    // --- T1: defaults ---
    ServerConfig defaults;
    assert(defaults.port == 8080);
    assert(defaults.dataFile == "garage_data.dat");
    assert(defaults.layoutSource == "http://localhost:5000");
    assert(defaults.logLevel == LogLevel::INFO);
    assert(defaults.threads == 0);
    assert(!defaults.showHelp);

    // --- T2: JSON file ---
    ServerConfig config;
    applyConfigJson(config, R"({"port": 9090, "data_file": "/var/lib/garage.dat",
                               "layout_source": "simulated", "log_level": "debug", "threads": 4})");
    assert(config.port == 9090);
    assert(config.dataFile == "/var/lib/garage.dat");
    assert(config.layoutSource == "simulated");
    assert(config.logLevel == LogLevel::DEBUG);
    assert(config.threads == 4);
    // keys that are absent keep their value
    applyConfigJson(config, R"({"port": 7070})");
    assert(config.port == 7070);
    assert(config.layoutSource == "simulated");

    assert(throwsConfigError([](ServerConfig& c) { applyConfigJson(c, "{broken"); }));
    assert(throwsConfigError([](ServerConfig& c) { applyConfigJson(c, "[1, 2]"); }));
    assert(throwsConfigError([](ServerConfig& c) { applyConfigJson(c, R"({"port": 70000})"); }));
    assert(throwsConfigError([](ServerConfig& c) { applyConfigJson(c, R"({"port": "http"})"); }));
    assert(throwsConfigError([](ServerConfig& c) { applyConfigJson(c, R"({"log_level": "loud"})"); }));

    // --- T3: environment ---
    ServerConfig env;
    applyEnvironment(env, {
        {"GARAGE_API_URL", "http://simulator:3000"},
        {"GARAGE_PORT", "8181"},
        {"GARAGE_LOG_LEVEL", "warn"},
        {"UNRELATED", "x"}
    });
    assert(env.layoutSource == "http://simulator:3000");
    assert(env.port == 8181);
    assert(env.logLevel == LogLevel::WARNING);
    assert(env.dataFile == "garage_data.dat");
    // an empty data file turns persistence off
    applyEnvironment(env, {{"GARAGE_DATA_FILE", ""}});
    assert(env.dataFile.empty());
    // an empty URL is ignored
    applyEnvironment(env, {{"GARAGE_API_URL", ""}});
    assert(env.layoutSource == "http://simulator:3000");

    assert(throwsConfigError([](ServerConfig& c) { applyEnvironment(c, {{"GARAGE_PORT", "abc"}}); }));
    assert(throwsConfigError([](ServerConfig& c) { applyEnvironment(c, {{"GARAGE_PORT", "0"}}); }));
    assert(throwsConfigError([](ServerConfig& c) { applyEnvironment(c, {{"GARAGE_PORT", "80x"}}); }));

    // --- T4: command line ---
    ServerConfig cli;
    std::string configFile = applyArguments(cli, {
        "--config", "garage.json",
        "--port", "9000",
        "--data-file", "other.dat",
        "--layout", "layout.json",
        "--log-level", "ERROR",
        "--threads", "2"
    });
    assert(configFile == "garage.json");
    assert(cli.port == 9000);
    assert(cli.dataFile == "other.dat");
    assert(cli.layoutSource == "layout.json");
    assert(cli.logLevel == LogLevel::ERROR);
    assert(cli.threads == 2);

    ServerConfig help;
    assert(applyArguments(help, {"--help"}).empty());
    assert(help.showHelp);

    assert(throwsConfigError([](ServerConfig& c) { applyArguments(c, {"--verbose", "1"}); }));
    assert(throwsConfigError([](ServerConfig& c) { applyArguments(c, {"--port"}); }));
    assert(throwsConfigError([](ServerConfig& c) { applyArguments(c, {"--threads", "-1"}); }));
    assert(throwsConfigError([](ServerConfig& c) { applyArguments(c, {"--log-level", "TRACE"}); }));

    // --- T5: later layers override earlier ones ---
    ServerConfig layered;
    applyConfigJson(layered, R"({"port": 9090, "layout_source": "simulated"})");
    applyEnvironment(layered, {{"GARAGE_PORT", "9191"}});
    applyArguments(layered, {"--port", "9292"});
    assert(layered.port == 9292);
    assert(layered.layoutSource == "simulated");

    // --- T6: log level names ---
    LogLevel level = LogLevel::INFO;
    assert(Logger::parseLevel("Warning", level) && level == LogLevel::WARNING);
    assert(Logger::parseLevel("debug", level) && level == LogLevel::DEBUG);
    assert(!Logger::parseLevel("verbose", level));
    assert(level == LogLevel::DEBUG);
    assert(std::string(Logger::getLevelString(LogLevel::ERROR)) == "ERROR");

    assert(usage("garage_server").find("--layout") != std::string::npos);

    return 0;
}
