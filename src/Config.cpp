#include "Config.hpp"
#include "TransactionOptions.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <cstdlib>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>

namespace sqlctx {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> result;
    std::string current;
    for (char c : str) {
        if (c == delimiter) {
            if (!current.empty()) {
                result.push_back(trim(current));
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        result.push_back(trim(current));
    }
    return result;
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool parseBool(const std::string& value) {
    std::string lower = toLower(value);
    return lower == "true" || lower == "1" || lower == "yes" || lower == "on";
}

// Pool timeouts are given in (possibly fractional) seconds
std::chrono::milliseconds parseSeconds(const std::string& value) {
    return std::chrono::milliseconds(static_cast<int64_t>(std::stod(value) * 1000.0));
}

std::string percentDecode(const std::string& value) {
    std::string result;
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%' && i + 2 < value.size() &&
            std::isxdigit(static_cast<unsigned char>(value[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
            result += static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            result += value[i];
        }
    }
    return result;
}

// TCP port 1-65535, nothing else in the text
std::optional<uint16_t> parsePort(const std::string& value) {
    unsigned long port = 0;
    const char* end = value.data() + value.size();
    auto result = std::from_chars(value.data(), end, port);
    if (result.ec != std::errc() || result.ptr != end || port == 0 || port > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(port);
}

bool applyConnectionKey(ConnectionConfig& connection, const std::string& key, const std::string& value) {
    if (key == "host") connection.host = value;
    else if (key == "port") {
        auto port = parsePort(value);
        if (!port) throw std::out_of_range("port " + value);
        connection.port = *port;
    }
    else if (key == "user") connection.user = value;
    else if (key == "password") connection.password = value;
    else if (key == "socket") connection.socket = value;
    else if (key == "database") connection.database = value;
    else if (key == "application_name") connection.application_name = value;
    else if (key == "use_ssl") connection.use_ssl = parseBool(value);
    else if (key == "ssl_ca") connection.ssl_ca = value;
    else if (key == "ssl_cert") connection.ssl_cert = value;
    else if (key == "ssl_key") connection.ssl_key = value;
    else if (key == "connect_timeout")
        connection.connect_timeout = std::chrono::milliseconds(std::stoi(value));
    else if (key == "read_timeout")
        connection.read_timeout = std::chrono::milliseconds(std::stoi(value));
    else if (key == "write_timeout")
        connection.write_timeout = std::chrono::milliseconds(std::stoi(value));
    else return false;
    return true;
}

bool applyPoolKey(PoolConfig& pool, const std::string& key, const std::string& value) {
    if (key == "pool_size") pool.pool_size = static_cast<size_t>(std::stoul(value));
    else if (key == "max_overflow") pool.max_overflow = std::stoi(value);
    else if (key == "max_size") pool.max_size = static_cast<size_t>(std::stoul(value));
    else if (key == "min_size") pool.min_size = static_cast<size_t>(std::stoul(value));
    else if (key == "timeout") pool.timeout = parseSeconds(value);
    else if (key == "use_lifo") pool.use_lifo = parseBool(value);
    else if (key == "reset_on_return") pool.reset_on_return = parseBool(value);
    else if (key == "pre_ping") pool.pre_ping = parseBool(value);
    else if (key == "null_pool") pool.null_pool = parseBool(value);
    else return false;
    return true;
}

bool applyEngineKey(EngineConfig& engine, const std::string& key, const std::string& value) {
    if (key == "type" || key == "database_type") engine.database_type = toLower(value);
    else if (key == "isolation_level") engine.isolation_level = value;
    else return false;
    return true;
}

bool applyLoggingKey(LoggingConfig& logging, const std::string& key, const std::string& value) {
    if (key == "level") logging.level = toLower(value);
    else if (key == "console") logging.console = parseBool(value);
    else if (key == "file") logging.file = value;
    else return false;
    return true;
}

}  // namespace

// ============================================================================
// Pool size normalization
// ============================================================================

PoolOptions PoolConfig::resolve() const {
    PoolOptions options;
    options.timeout = timeout;
    options.use_lifo = use_lifo;
    options.reset_on_return = reset_on_return;
    options.pre_ping = pre_ping;

    if (!max_size) {
        options.pool_size = pool_size.value_or(5);
        if (max_overflow) {
            options.max_overflow = *max_overflow;
        } else {
            options.max_overflow = pool_size ? 0 : 10;
        }
    } else if (!max_overflow) {
        options.max_overflow = 0;
        options.pool_size = (pool_size && *pool_size > 0) ? *pool_size : *max_size;
    } else if (!pool_size) {
        int maxSize = static_cast<int>(*max_size);
        options.pool_size = static_cast<size_t>(std::max(0, maxSize - std::max(0, *max_overflow)));
        options.max_overflow = *max_overflow > maxSize ? maxSize : *max_overflow;
    } else if (*pool_size == 0) {
        options.pool_size = *max_size;
        options.max_overflow = 0;
    } else {
        options.pool_size = std::min(*pool_size, *max_size);
        options.max_overflow = static_cast<int>(*max_size > *pool_size ? *max_size - *pool_size : 0);
    }

    return options;
}

// ============================================================================
// Loading
// ============================================================================

std::optional<Config> Config::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;
    std::string current_section;
    size_t lineNumber = 0;

    while (std::getline(file, line)) {
        ++lineNumber;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            continue;
        }

        // Key-value pair
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        try {
            bool known = false;
            if (current_section == "connection") known = applyConnectionKey(config.connection, key, value);
            else if (current_section == "pool") known = applyPoolKey(config.pool, key, value);
            else if (current_section == "engine") known = applyEngineKey(config.engine, key, value);
            else if (current_section == "logging") known = applyLoggingKey(config.logging, key, value);

            if (!known) {
                spdlog::debug("Ignoring unknown key '{}' in section [{}] of {}",
                              key, current_section, path.string());
            }
        } catch (const std::logic_error&) {
            spdlog::error("Invalid value '{}' for '{}' at {}:{}", value, key, path.string(), lineNumber);
            return std::nullopt;
        }
    }

    return config;
}

std::optional<Config> Config::fromUrl(const std::string& url) {
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        spdlog::error("Malformed database URL: missing scheme");
        return std::nullopt;
    }

    Config config;
    config.engine.database_type = toLower(url.substr(0, schemeEnd));
    // Driver suffixes such as postgresql+libpq select the same backend
    auto plus = config.engine.database_type.find('+');
    if (plus != std::string::npos) {
        config.engine.database_type = config.engine.database_type.substr(0, plus);
    }

    std::string rest = url.substr(schemeEnd + 3);
    std::string query;
    auto queryPos = rest.find('?');
    if (queryPos != std::string::npos) {
        query = rest.substr(queryPos + 1);
        rest = rest.substr(0, queryPos);
    }

    if (config.backendName() == "sqlite") {
        // sqlite:///relative.db, sqlite:////absolute.db, sqlite:///:memory:
        if (!rest.empty() && rest.front() != '/') {
            spdlog::error("Malformed SQLite URL, expected sqlite:///path");
            return std::nullopt;
        }
        config.connection.database = rest.size() > 1 ? percentDecode(rest.substr(1)) : ":memory:";
        config.connection.host.clear();
    } else {
        std::string authority = rest;
        auto slash = rest.find('/');
        if (slash != std::string::npos) {
            authority = rest.substr(0, slash);
            config.connection.database = percentDecode(rest.substr(slash + 1));
        }

        auto at = authority.rfind('@');
        if (at != std::string::npos) {
            std::string credentials = authority.substr(0, at);
            authority = authority.substr(at + 1);
            auto colon = credentials.find(':');
            if (colon != std::string::npos) {
                config.connection.user = percentDecode(credentials.substr(0, colon));
                config.connection.password = percentDecode(credentials.substr(colon + 1));
            } else {
                config.connection.user = percentDecode(credentials);
            }
        }

        auto colon = authority.rfind(':');
        if (colon != std::string::npos && authority.find(']', colon) == std::string::npos) {
            std::string port = authority.substr(colon + 1);
            authority = authority.substr(0, colon);
            auto portNumber = parsePort(port);
            if (!portNumber) {
                spdlog::error("Malformed database URL: invalid port '{}'", port);
                return std::nullopt;
            }
            config.connection.port = *portNumber;
        }
        if (authority.size() >= 2 && authority.front() == '[' && authority.back() == ']') {
            authority = authority.substr(1, authority.size() - 2);
        }
        if (!authority.empty()) {
            config.connection.host = percentDecode(authority);
        }
    }

    for (const auto& option : split(query, '&')) {
        auto eq = option.find('=');
        std::string key = percentDecode(option.substr(0, eq));
        std::string value = eq == std::string::npos ? "true" : percentDecode(option.substr(eq + 1));

        try {
            if (!applyPoolKey(config.pool, key, value) &&
                !applyEngineKey(config.engine, key, value) &&
                !applyConnectionKey(config.connection, key, value) &&
                !applyLoggingKey(config.logging, key, value)) {
                spdlog::warn("Ignoring unknown database URL option '{}'", key);
            }
        } catch (const std::logic_error&) {
            spdlog::error("Invalid value '{}' for URL option '{}'", value, key);
            return std::nullopt;
        }
    }

    return config;
}

// ============================================================================
// Validation
// ============================================================================

std::string Config::backendName() const {
    std::string type = toLower(engine.database_type);
    if (type == "postgres" || type == "pgsql") return "postgresql";
    if (type == "sqlite3") return "sqlite";
    if (type == "mariadb") return "mysql";
    return type;
}

bool Config::validate() const {
    const std::string backend = backendName();
    if (backend != "sqlite" && backend != "postgresql" && backend != "mysql") {
        spdlog::error("Unsupported database type: {}", engine.database_type);
        return false;
    }

    if (backend == "sqlite" && connection.database.empty()) {
        spdlog::error("SQLite database path is required");
        return false;
    }

    // Username is required for MySQL, libpq falls back to the OS user
    if (backend == "mysql" && connection.user.empty()) {
        spdlog::error("Database username is required for MySQL");
        return false;
    }

    if (!engine.isolation_level.empty() && !parseIsolationLevel(engine.isolation_level)) {
        spdlog::error("Unknown isolation level: {}", engine.isolation_level);
        return false;
    }

    if (pool.timeout.count() < 0) {
        spdlog::error("Pool timeout must not be negative");
        return false;
    }

    if (!pool.null_pool) {
        PoolOptions options = pool.resolve();
        if (options.max_overflow < -1) {
            spdlog::error("max_overflow must be -1 (unlimited) or greater");
            return false;
        }
        if (options.max_overflow != -1 &&
            pool.min_size > options.pool_size + static_cast<size_t>(options.max_overflow)) {
            spdlog::error("min_size {} exceeds the pool capacity {}", pool.min_size,
                          options.pool_size + static_cast<size_t>(options.max_overflow));
            return false;
        }
    }

    if (connection.use_ssl) {
        if (!connection.ssl_ca.empty() && !std::filesystem::exists(connection.ssl_ca)) {
            spdlog::error("SSL CA file not found: {}", connection.ssl_ca);
            return false;
        }
        if (!connection.ssl_cert.empty() && !std::filesystem::exists(connection.ssl_cert)) {
            spdlog::error("SSL certificate file not found: {}", connection.ssl_cert);
            return false;
        }
        if (!connection.ssl_key.empty() && !std::filesystem::exists(connection.ssl_key)) {
            spdlog::error("SSL key file not found: {}", connection.ssl_key);
            return false;
        }
    }

    static const std::vector<std::string> levels = {
        "trace", "debug", "info", "warn", "warning", "error", "critical", "off"};
    if (std::find(levels.begin(), levels.end(), logging.level) == levels.end()) {
        spdlog::error("Unknown log level: {}", logging.level);
        return false;
    }

    return true;
}

void Config::resolvePassword() {
    if (!connection.password.empty()) {
        return;
    }

    const char* env_pwd = std::getenv("SQLCTX_PASSWORD");
    if (!env_pwd) {
        const std::string backend = backendName();
        if (backend == "postgresql") {
            env_pwd = std::getenv("PGPASSWORD");
        } else if (backend == "mysql") {
            env_pwd = std::getenv("MYSQL_PWD");
        }
    }
    if (env_pwd) {
        connection.password = env_pwd;
    }
}

}  // namespace sqlctx
