/**
 * @file pool_config.cpp
 * @brief Configuration loading (JSON file, environment) and validation
 *
 * @date 2025
 */

#include "sandpool/core/pool_config.hpp"
#include "sandpool/core/errors.hpp"
#include "sandpool/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>

using json = nlohmann::json;

namespace sandpool {
namespace core {

namespace {

[[noreturn]] void Invalid(const std::string& message) {
    throw SandpoolError(ErrorKind::INVALID_REQUEST, message);
}

long long ParseInteger(const std::string& name, const std::string& text) {
    try {
        std::size_t consumed = 0;
        long long value = std::stoll(text, &consumed);
        if (consumed != text.size()) {
            Invalid(name + ": trailing characters in '" + text + "'");
        }
        return value;
    }
    catch (const std::logic_error&) {
        Invalid(name + ": expected an integer, got '" + text + "'");
    }
}

double ParseDouble(const std::string& name, const std::string& text) {
    try {
        std::size_t consumed = 0;
        double value = std::stod(text, &consumed);
        if (consumed != text.size()) {
            Invalid(name + ": trailing characters in '" + text + "'");
        }
        return value;
    }
    catch (const std::logic_error&) {
        Invalid(name + ": expected a number, got '" + text + "'");
    }
}

std::size_t ParseCount(const std::string& name, const std::string& text) {
    long long value = ParseInteger(name, text);
    if (value < 0) {
        Invalid(name + ": must not be negative");
    }
    return static_cast<std::size_t>(value);
}

std::chrono::seconds ParseSeconds(const std::string& name, const std::string& text) {
    return std::chrono::seconds(ParseInteger(name, text));
}

template <typename T>
void ReadKey(const json& object, const char* key, T& target) {
    if (object.contains(key) && !object[key].is_null()) {
        target = object[key].get<T>();
    }
}

void ReadSeconds(const json& object, const char* key, std::chrono::seconds& target) {
    if (object.contains(key) && !object[key].is_null()) {
        target = std::chrono::seconds(object[key].get<long long>());
    }
}

} // anonymous namespace

EnvLookup ProcessEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

// ============================================================================
// MEMORY SIZE PARSING
// ============================================================================
// Docker notation: <number>[b|k|m|g], bare numbers are bytes

std::size_t ParseMemoryLimitMb(const std::string& text) {
    std::string trimmed = utils::StringUtils::ToLower(utils::StringUtils::Trim(text));
    if (trimmed.empty()) {
        Invalid("memory limit is empty");
    }

    unsigned long long multiplier = 1;
    char unit = trimmed.back();
    if (std::isalpha(static_cast<unsigned char>(unit))) {
        switch (unit) {
            case 'b': multiplier = 1; break;
            case 'k': multiplier = 1024ULL; break;
            case 'm': multiplier = 1024ULL * 1024; break;
            case 'g': multiplier = 1024ULL * 1024 * 1024; break;
            default:
                Invalid("unknown memory unit in '" + text + "'");
        }
        trimmed.pop_back();
    }

    long long amount = ParseInteger("memory limit", trimmed);
    if (amount <= 0) {
        Invalid("memory limit must be positive: '" + text + "'");
    }

    if (static_cast<unsigned long long>(amount) >
        std::numeric_limits<unsigned long long>::max() / multiplier) {
        Invalid("memory limit too large: '" + text + "'");
    }

    const unsigned long long mb = 1024ULL * 1024;
    unsigned long long bytes = static_cast<unsigned long long>(amount) * multiplier;
    return static_cast<std::size_t>((bytes + mb - 1) / mb);
}

// ============================================================================
// JSON FILE
// ============================================================================

void ApplyConfigFile(AppConfig& config, const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        Invalid("cannot open config file: " + path.string());
    }

    json root;
    try {
        root = json::parse(file);
    }
    catch (const json::parse_error& e) {
        Invalid("invalid JSON in " + path.string() + ": " + e.what());
    }

    try {
        if (root.contains("pool")) {
            const json& pool = root["pool"];
            PoolConfig& p = config.pool;

            ReadKey(pool, "image", p.image);
            ReadKey(pool, "container_label", p.container_label);
            ReadKey(pool, "sandbox_root", p.sandbox_root);
            ReadKey(pool, "pool_size", p.pool_size);
            ReadKey(pool, "max_output_chars", p.max_output_chars);
            ReadKey(pool, "truncation_marker", p.truncation_marker);
            ReadKey(pool, "bind_host", p.bind_host);
            ReadKey(pool, "bind_port", p.bind_port);
            ReadKey(pool, "cpu_limit", p.resource_limits.cpu_limit);
            ReadKey(pool, "pids_limit", p.resource_limits.pids_limit);
            ReadSeconds(pool, "exec_timeout_seconds", p.exec_timeout);
            ReadSeconds(pool, "health_check_interval_seconds", p.health_check_interval);
            ReadSeconds(pool, "acquire_timeout_seconds", p.acquire_timeout);
            ReadSeconds(pool, "shutdown_grace_seconds", p.shutdown_grace);

            if (pool.contains("memory_limit")) {
                const json& memory = pool["memory_limit"];
                p.resource_limits.memory_limit_mb = memory.is_string()
                    ? ParseMemoryLimitMb(memory.get<std::string>())
                    : memory.get<std::size_t>();
            }
        }

        if (root.contains("remote")) {
            const json& remote = root["remote"];
            RemoteConfig& r = config.remote;

            ReadKey(remote, "hosts", r.hosts);
            ReadKey(remote, "app_user", r.app_user);
            ReadKey(remote, "ssh_binary", r.ssh_binary);
            ReadKey(remote, "max_output_bytes", r.max_output_bytes);
            ReadSeconds(remote, "connect_timeout_seconds", r.connect_timeout);
            ReadSeconds(remote, "command_timeout_seconds", r.command_timeout);
        }
    }
    catch (const json::exception& e) {
        Invalid("invalid value in " + path.string() + ": " + e.what());
    }

    spdlog::info("Loaded configuration file: {}", path.string());
}

// ============================================================================
// ENVIRONMENT VARIABLES
// ============================================================================

void ApplyEnvironment(AppConfig& config, const EnvLookup& lookup) {
    PoolConfig& p = config.pool;
    RemoteConfig& r = config.remote;

    if (auto v = lookup("SANDBOX_IMAGE")) p.image = *v;
    if (auto v = lookup("POOL_SIZE")) p.pool_size = ParseCount("POOL_SIZE", *v);
    if (auto v = lookup("EXEC_TIMEOUT")) p.exec_timeout = ParseSeconds("EXEC_TIMEOUT", *v);
    if (auto v = lookup("MAX_OUTPUT_SIZE")) p.max_output_chars = ParseCount("MAX_OUTPUT_SIZE", *v);
    if (auto v = lookup("MCP_HOST")) p.bind_host = *v;
    if (auto v = lookup("MCP_PORT")) p.bind_port = static_cast<int>(ParseInteger("MCP_PORT", *v));
    if (auto v = lookup("CONTAINER_MEMORY_LIMIT")) {
        p.resource_limits.memory_limit_mb = ParseMemoryLimitMb(*v);
    }
    if (auto v = lookup("CONTAINER_CPU_LIMIT")) {
        p.resource_limits.cpu_limit = ParseDouble("CONTAINER_CPU_LIMIT", *v);
    }
    if (auto v = lookup("SANDBOX_ROOT")) p.sandbox_root = *v;
    if (auto v = lookup("HEALTH_CHECK_INTERVAL")) {
        p.health_check_interval = ParseSeconds("HEALTH_CHECK_INTERVAL", *v);
    }
    if (auto v = lookup("ACQUIRE_TIMEOUT")) p.acquire_timeout = ParseSeconds("ACQUIRE_TIMEOUT", *v);

    if (auto v = lookup("REMOTE_HOSTS")) r.hosts = utils::StringUtils::Split(*v, ';');
    if (auto v = lookup("APP_USER_NAME")) r.app_user = *v;
}

// ============================================================================
// VALIDATION
// ============================================================================

void ValidatePoolConfig(const PoolConfig& config) {
    if (config.image.empty()) {
        Invalid("sandbox image is required");
    }
    if (config.pool_size == 0) {
        Invalid("pool size must be > 0");
    }
    if (config.exec_timeout.count() <= 0) {
        Invalid("execution timeout must be > 0");
    }
    if (config.health_check_interval.count() <= 0) {
        Invalid("health check interval must be > 0");
    }
    if (config.acquire_timeout.count() < 0) {
        Invalid("acquire timeout must not be negative");
    }
    if (config.resource_limits.memory_limit_mb < 16) {
        Invalid("memory limit must be >= 16 MB");
    }
    if (config.resource_limits.cpu_limit <= 0.0) {
        Invalid("CPU limit must be > 0");
    }
    if (config.sandbox_root.empty() || config.sandbox_root.front() != '/' ||
        config.sandbox_root == "/") {
        Invalid("sandbox root must be an absolute path other than '/': '" +
                config.sandbox_root + "'");
    }
}

void ValidateRemoteConfig(const RemoteConfig& config) {
    if (config.hosts.empty()) {
        Invalid("no remote hosts configured");
    }
    if (config.app_user.empty()) {
        Invalid("remote application user is required");
    }
    if (config.command_timeout.count() <= 0) {
        Invalid("remote command timeout must be > 0");
    }
}

} // namespace core
} // namespace sandpool
