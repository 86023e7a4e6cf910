// IptvMux - IPTV Stream Multiplexing Proxy
// Configuration Manager Implementation

#include "iptvmux/core/config_manager.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <map>
#include <set>
#include <sstream>
#include <type_traits>

namespace iptvmux {
namespace core {

// =============================================================================
// Minimal JSON reader for configuration documents
// =============================================================================

namespace {

enum class JsonType {
    Null,
    Boolean,
    Number,
    String,
    Array,
    Object
};

struct JsonValue {
    JsonType type = JsonType::Null;
    bool boolValue = false;
    double numberValue = 0.0;
    std::string stringValue;
    std::vector<JsonValue> arrayValue;
    std::map<std::string, JsonValue> objectValue;

    bool isBool() const { return type == JsonType::Boolean; }
    bool isNumber() const { return type == JsonType::Number; }
    bool isString() const { return type == JsonType::String; }
    bool isArray() const { return type == JsonType::Array; }
    bool isObject() const { return type == JsonType::Object; }

    bool contains(const std::string& key) const {
        return isObject() && objectValue.find(key) != objectValue.end();
    }

    const JsonValue& operator[](const std::string& key) const {
        static const JsonValue nullValue;
        if (!isObject()) return nullValue;
        auto it = objectValue.find(key);
        return it != objectValue.end() ? it->second : nullValue;
    }
};

using JsonResult = Result<JsonValue, ConfigError>;

class JsonParser {
public:
    explicit JsonParser(const std::string& input) : input_(input), pos_(0) {}

    JsonResult parse() {
        skipWhitespace();
        auto result = parseValue(0);
        if (result.isError()) {
            return result;
        }
        skipWhitespace();
        if (pos_ < input_.size()) {
            return fail("Unexpected characters after JSON value");
        }
        return result;
    }

private:
    static constexpr int MAX_DEPTH = 32;

    const std::string& input_;
    size_t pos_;

    JsonResult fail(const std::string& message) const {
        int line = 1 + static_cast<int>(std::count(input_.begin(),
            input_.begin() + static_cast<std::ptrdiff_t>(std::min(pos_, input_.size())), '\n'));
        return JsonResult::error(
            ConfigError(ConfigError::Code::ParseError, message, "", line));
    }

    void skipWhitespace() {
        while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
            pos_++;
        }
    }

    char peek() const {
        return pos_ < input_.size() ? input_[pos_] : '\0';
    }

    char consume() {
        return pos_ < input_.size() ? input_[pos_++] : '\0';
    }

    bool match(char c) {
        if (peek() == c) {
            consume();
            return true;
        }
        return false;
    }

    JsonResult parseValue(int depth) {
        if (depth > MAX_DEPTH) {
            return fail("JSON nesting too deep");
        }
        skipWhitespace();
        char c = peek();

        if (c == '"') return parseString();
        if (c == '{') return parseObject(depth);
        if (c == '[') return parseArray(depth);
        if (c == 't' || c == 'f') return parseBool();
        if (c == 'n') return parseNull();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parseNumber();

        if (c == '\0') {
            return fail("Unexpected end of input");
        }
        return fail("Unexpected character: " + std::string(1, c));
    }

    JsonResult parseString() {
        if (!match('"')) {
            return fail("Expected '\"'");
        }

        std::string result;
        while (pos_ < input_.size() && peek() != '"') {
            char c = consume();
            if (c == '\\') {
                char escaped = consume();
                switch (escaped) {
                    case '"': result += '"'; break;
                    case '\\': result += '\\'; break;
                    case '/': result += '/'; break;
                    case 'b': result += '\b'; break;
                    case 'f': result += '\f'; break;
                    case 'n': result += '\n'; break;
                    case 'r': result += '\r'; break;
                    case 't': result += '\t'; break;
                    default: result += escaped; break;
                }
            } else {
                result += c;
            }
        }

        if (!match('"')) {
            return fail("Unterminated string");
        }

        JsonValue value;
        value.type = JsonType::String;
        value.stringValue = std::move(result);
        return JsonResult::success(std::move(value));
    }

    JsonResult parseNumber() {
        size_t start = pos_;
        if (peek() == '-') consume();
        while (std::isdigit(static_cast<unsigned char>(peek()))) consume();
        if (peek() == '.') {
            consume();
            while (std::isdigit(static_cast<unsigned char>(peek()))) consume();
        }
        if (peek() == 'e' || peek() == 'E') {
            consume();
            if (peek() == '+' || peek() == '-') consume();
            while (std::isdigit(static_cast<unsigned char>(peek()))) consume();
        }

        std::string numStr = input_.substr(start, pos_ - start);
        char* end = nullptr;
        errno = 0;
        double parsed = std::strtod(numStr.c_str(), &end);
        if (numStr.empty() || end != numStr.c_str() + numStr.size() || errno == ERANGE) {
            return fail("Invalid number: " + numStr);
        }

        JsonValue value;
        value.type = JsonType::Number;
        value.numberValue = parsed;
        return JsonResult::success(std::move(value));
    }

    JsonResult parseBool() {
        JsonValue value;
        value.type = JsonType::Boolean;
        if (input_.compare(pos_, 4, "true") == 0) {
            pos_ += 4;
            value.boolValue = true;
            return JsonResult::success(std::move(value));
        }
        if (input_.compare(pos_, 5, "false") == 0) {
            pos_ += 5;
            return JsonResult::success(std::move(value));
        }
        return fail("Expected 'true' or 'false'");
    }

    JsonResult parseNull() {
        if (input_.compare(pos_, 4, "null") == 0) {
            pos_ += 4;
            return JsonResult::success(JsonValue{});
        }
        return fail("Expected 'null'");
    }

    JsonResult parseArray(int depth) {
        consume();  // '['

        JsonValue value;
        value.type = JsonType::Array;

        skipWhitespace();
        if (match(']')) {
            return JsonResult::success(std::move(value));
        }

        while (true) {
            auto element = parseValue(depth + 1);
            if (element.isError()) {
                return element;
            }
            value.arrayValue.push_back(std::move(element).value());

            skipWhitespace();
            if (match(']')) break;
            if (!match(',')) {
                return fail("Expected ',' or ']' in array");
            }
        }

        return JsonResult::success(std::move(value));
    }

    JsonResult parseObject(int depth) {
        consume();  // '{'

        JsonValue value;
        value.type = JsonType::Object;

        skipWhitespace();
        if (match('}')) {
            return JsonResult::success(std::move(value));
        }

        while (true) {
            skipWhitespace();
            if (peek() != '"') {
                return fail("Expected string key in object");
            }
            auto key = parseString();
            if (key.isError()) {
                return key;
            }

            skipWhitespace();
            if (!match(':')) {
                return fail("Expected ':' after key");
            }

            auto member = parseValue(depth + 1);
            if (member.isError()) {
                return member;
            }
            value.objectValue[key.value().stringValue] = std::move(member).value();

            skipWhitespace();
            if (match('}')) break;
            if (!match(',')) {
                return fail("Expected ',' or '}' in object");
            }
        }

        return JsonResult::success(std::move(value));
    }
};

// =============================================================================
// Typed section reader
// =============================================================================

/**
 * Reads typed members of one JSON object. The first type or range
 * violation is remembered and every later read becomes a no-op.
 */
class SectionReader {
public:
    SectionReader(const JsonValue& object, std::string prefix)
        : object_(object), prefix_(std::move(prefix)) {}

    template<typename T>
    void readUnsigned(const std::string& key, T& target,
                      uint64_t minValue = 0,
                      uint64_t maxValue = std::numeric_limits<T>::max()) {
        if (error_ || !object_.contains(key)) {
            return;
        }
        const JsonValue& v = object_[key];
        if (!v.isNumber() || v.numberValue < 0 || std::floor(v.numberValue) != v.numberValue) {
            setError(key, "must be a non-negative integer");
            return;
        }
        if (v.numberValue < static_cast<double>(minValue) ||
            v.numberValue > static_cast<double>(maxValue)) {
            setError(key, "must be between " + std::to_string(minValue) +
                          " and " + std::to_string(maxValue));
            return;
        }
        target = static_cast<T>(v.numberValue);
    }

    void readBool(const std::string& key, bool& target) {
        if (error_ || !object_.contains(key)) {
            return;
        }
        if (!object_[key].isBool()) {
            setError(key, "must be true or false");
            return;
        }
        target = object_[key].boolValue;
    }

    void readString(const std::string& key, std::string& target) {
        if (error_ || !object_.contains(key)) {
            return;
        }
        if (!object_[key].isString()) {
            setError(key, "must be a string");
            return;
        }
        target = object_[key].stringValue;
    }

    void require(const std::string& key) {
        if (!error_ && !object_.contains(key)) {
            setError(key, "is required");
        }
    }

    void setError(const std::string& key, const std::string& what) {
        if (!error_) {
            std::string field = prefix_ + "." + key;
            error_ = ConfigError(ConfigError::Code::ValidationError, field + " " + what, field);
        }
    }

    const std::optional<ConfigError>& error() const { return error_; }

private:
    const JsonValue& object_;
    std::string prefix_;
    std::optional<ConfigError> error_;
};

std::optional<uint64_t> parseUnsigned(const std::string& text, uint64_t maxValue) {
    if (text.empty() || text.size() > 19 ||
        !std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    uint64_t value = std::strtoull(text.c_str(), nullptr, 10);
    if (value > maxValue) {
        return std::nullopt;
    }
    return value;
}

std::optional<bool> parseBoolFlag(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true" || lower == "1" || lower == "yes") return true;
    if (lower == "false" || lower == "0" || lower == "no") return false;
    return std::nullopt;
}

const char* boolString(bool value) {
    return value ? "true" : "false";
}

std::string quoteJson(const std::string& text) {
    std::string out = "\"";
    for (char c : text) {
        if (c == '"' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    return out + "\"";
}

} // anonymous namespace

// =============================================================================
// ConfigManager Implementation
// =============================================================================

ConfigManager::ConfigManager() = default;

ConfigManager::~ConfigManager() = default;

Result<void, ConfigError> ConfigManager::loadFromFile(const std::string& filePath) {
    auto content = readFile(filePath);
    if (content.isError()) {
        return Result<void, ConfigError>::error(content.error());
    }

    log("Loading configuration from " + filePath);
    return loadFromJsonString(content.value());
}

Result<void, ConfigError> ConfigManager::loadFromJsonString(const std::string& jsonContent) {
    auto result = parseJson(jsonContent);
    if (result.isSuccess()) {
        logEffectiveConfig();
    }
    return result;
}

void ConfigManager::loadDefaults() {
    {
        std::unique_lock<std::shared_mutex> lock(configMutex_);
        config_ = Configuration{};
    }
    log("Configuration loaded with default values");
    logEffectiveConfig();
}

void ConfigManager::applyEnvironmentOverrides() {
    std::unique_lock<std::shared_mutex> lock(configMutex_);

    auto overrideUnsigned = [this](const char* name, uint64_t maxValue, auto& target) {
        if (auto val = getEnvVar(name)) {
            if (auto parsed = parseUnsigned(*val, maxValue)) {
                target = static_cast<std::remove_reference_t<decltype(target)>>(*parsed);
                log(std::string("Environment override: ") + name + "=" + *val);
            } else {
                log(std::string("Warning: Invalid ") + name + " value: " + *val);
            }
        }
    };

    if (auto val = getEnvVar("IPTVMUX_BIND_ADDRESS")) {
        config_.server.bindAddress = *val;
        log("Environment override: IPTVMUX_BIND_ADDRESS=" + *val);
    }
    overrideUnsigned("IPTVMUX_PORT", 65535, config_.server.port);

    if (auto val = getEnvVar("IPTVMUX_LOG_LEVEL")) {
        if (auto level = parseLogLevel(*val)) {
            config_.logging.level = *level;
            log("Environment override: IPTVMUX_LOG_LEVEL=" + *val);
        } else {
            log("Warning: Invalid IPTVMUX_LOG_LEVEL value: " + *val);
        }
    }

    if (auto val = getEnvVar("IPTVMUX_LOG_JSON")) {
        if (auto flag = parseBoolFlag(*val)) {
            config_.logging.enableJson = *flag;
            log("Environment override: IPTVMUX_LOG_JSON=" + *val);
        } else {
            log("Warning: Invalid IPTVMUX_LOG_JSON value: " + *val);
        }
    }

    if (auto val = getEnvVar("IPTVMUX_LOG_FILE")) {
        config_.logging.filePath = *val;
        config_.logging.enableFile = !val->empty();
        log("Environment override: IPTVMUX_LOG_FILE=" + *val);
    }

    const uint64_t u32max = std::numeric_limits<uint32_t>::max();
    overrideUnsigned("IPTVMUX_CHUNK_SIZE", u32max, config_.multiplexer.chunkSize);
    overrideUnsigned("IPTVMUX_QUEUE_DEPTH", u32max, config_.multiplexer.subscriberQueueDepth);
    overrideUnsigned("IPTVMUX_CONNECT_TIMEOUT", u32max, config_.multiplexer.connectTimeoutSeconds);
    overrideUnsigned("IPTVMUX_READ_TIMEOUT", u32max, config_.multiplexer.readTimeoutSeconds);
    overrideUnsigned("IPTVMUX_IDLE_TIMEOUT", u32max, config_.multiplexer.idleTimeoutSeconds);
    overrideUnsigned("IPTVMUX_SUBSCRIBER_WAIT", u32max, config_.multiplexer.subscriberWaitSeconds);

    if (auto val = getEnvVar("IPTVMUX_USER_AGENT")) {
        config_.upstream.defaultUserAgent = *val;
        log("Environment override: IPTVMUX_USER_AGENT=" + *val);
    }
}

void ConfigManager::applyOverrides(const ConfigOverrides& overrides) {
    std::unique_lock<std::shared_mutex> lock(configMutex_);

    if (overrides.bindAddress) {
        config_.server.bindAddress = *overrides.bindAddress;
        log("Command line override: bind=" + *overrides.bindAddress);
    }
    if (overrides.port) {
        config_.server.port = *overrides.port;
        log("Command line override: port=" + std::to_string(*overrides.port));
    }
    if (overrides.logLevel) {
        config_.logging.level = *overrides.logLevel;
        log("Command line override: log-level=" + logLevelToString(*overrides.logLevel));
    }
    if (overrides.jsonLogs) {
        config_.logging.enableJson = *overrides.jsonLogs;
        log(std::string("Command line override: json-logs=") + boolString(*overrides.jsonLogs));
    }
}

Result<void, ConfigError> ConfigManager::validate() const {
    std::shared_lock<std::shared_mutex> lock(configMutex_);

    auto invalid = [](const std::string& message, const std::string& field) {
        return Result<void, ConfigError>::error(
            ConfigError(ConfigError::Code::ValidationError, message, field));
    };

    if (config_.server.port == 0) {
        return invalid("server.port must be between 1 and 65535", "server.port");
    }
    if (config_.server.maxConnections == 0) {
        return invalid("server.maxConnections must be greater than 0", "server.maxConnections");
    }
    if (config_.logging.enableFile && config_.logging.filePath.empty()) {
        return invalid("logging.filePath is required when file logging is enabled",
                       "logging.filePath");
    }

    const MultiplexerConfig& mux = config_.multiplexer;
    if (mux.chunkSize == 0) {
        return invalid("multiplexer.chunkSize must be greater than 0", "multiplexer.chunkSize");
    }
    if (mux.subscriberQueueDepth == 0) {
        return invalid("multiplexer.subscriberQueueDepth must be greater than 0",
                       "multiplexer.subscriberQueueDepth");
    }
    if (mux.connectTimeoutSeconds == 0) {
        return invalid("multiplexer.connectTimeoutSeconds must be greater than 0",
                       "multiplexer.connectTimeoutSeconds");
    }
    if (mux.readTimeoutSeconds == 0) {
        return invalid("multiplexer.readTimeoutSeconds must be greater than 0",
                       "multiplexer.readTimeoutSeconds");
    }
    if (mux.idleTimeoutSeconds == 0) {
        return invalid("multiplexer.idleTimeoutSeconds must be greater than 0",
                       "multiplexer.idleTimeoutSeconds");
    }
    if (mux.subscriberWaitSeconds == 0) {
        return invalid("multiplexer.subscriberWaitSeconds must be greater than 0",
                       "multiplexer.subscriberWaitSeconds");
    }
    if (mux.reclaimIntervalMs == 0) {
        return invalid("multiplexer.reclaimIntervalMs must be greater than 0",
                       "multiplexer.reclaimIntervalMs");
    }

    std::set<AccountId> accountIds;
    std::set<CredentialId> credentialIds;
    for (size_t i = 0; i < config_.accounts.size(); ++i) {
        const AccountConfig& account = config_.accounts[i];
        std::string prefix = "accounts[" + std::to_string(i) + "]";

        if (account.id <= 0) {
            return invalid(prefix + ".id must be a positive integer", prefix + ".id");
        }
        if (!accountIds.insert(account.id).second) {
            return invalid("Duplicate account id " + std::to_string(account.id), prefix + ".id");
        }
        if (account.server.empty()) {
            return invalid(prefix + ".server is required", prefix + ".server");
        }

        for (size_t j = 0; j < account.credentials.size(); ++j) {
            const CredentialConfig& cred = account.credentials[j];
            std::string credPrefix = prefix + ".credentials[" + std::to_string(j) + "]";
            if (cred.id <= 0) {
                return invalid(credPrefix + ".id must be a positive integer", credPrefix + ".id");
            }
            if (!credentialIds.insert(cred.id).second) {
                return invalid("Duplicate credential id " + std::to_string(cred.id),
                               credPrefix + ".id");
            }
            if (cred.maxConnections == 0) {
                return invalid(credPrefix + ".maxConnections must be greater than 0",
                               credPrefix + ".maxConnections");
            }
            if (cred.username.empty()) {
                return invalid(credPrefix + ".username is required", credPrefix + ".username");
            }
        }
    }

    return Result<void, ConfigError>::success();
}

Configuration ConfigManager::getConfig() const {
    std::shared_lock<std::shared_mutex> lock(configMutex_);
    return config_;
}

std::string ConfigManager::dumpConfig() const {
    std::shared_lock<std::shared_mutex> lock(configMutex_);

    std::ostringstream ss;
    ss << "{\n";
    ss << "  \"server\": {\n";
    ss << "    \"bindAddress\": " << quoteJson(config_.server.bindAddress) << ",\n";
    ss << "    \"port\": " << config_.server.port << ",\n";
    ss << "    \"maxConnections\": " << config_.server.maxConnections << "\n";
    ss << "  },\n";
    ss << "  \"logging\": {\n";
    ss << "    \"level\": \"" << logLevelToString(config_.logging.level) << "\",\n";
    ss << "    \"enableConsole\": " << boolString(config_.logging.enableConsole) << ",\n";
    ss << "    \"enableFile\": " << boolString(config_.logging.enableFile) << ",\n";
    ss << "    \"filePath\": " << quoteJson(config_.logging.filePath) << ",\n";
    ss << "    \"enableJson\": " << boolString(config_.logging.enableJson) << ",\n";
    ss << "    \"enableSyslog\": " << boolString(config_.logging.enableSyslog) << "\n";
    ss << "  },\n";
    ss << "  \"multiplexer\": {\n";
    ss << "    \"chunkSize\": " << config_.multiplexer.chunkSize << ",\n";
    ss << "    \"subscriberQueueDepth\": " << config_.multiplexer.subscriberQueueDepth << ",\n";
    ss << "    \"connectTimeoutSeconds\": " << config_.multiplexer.connectTimeoutSeconds << ",\n";
    ss << "    \"readTimeoutSeconds\": " << config_.multiplexer.readTimeoutSeconds << ",\n";
    ss << "    \"idleTimeoutSeconds\": " << config_.multiplexer.idleTimeoutSeconds << ",\n";
    ss << "    \"subscriberWaitSeconds\": " << config_.multiplexer.subscriberWaitSeconds << "\n";
    ss << "  },\n";
    ss << "  \"upstream\": {\n";
    ss << "    \"defaultUserAgent\": " << quoteJson(config_.upstream.defaultUserAgent) << ",\n";
    ss << "    \"maxRedirects\": " << config_.upstream.maxRedirects << "\n";
    ss << "  },\n";
    ss << "  \"accounts\": [";
    for (size_t i = 0; i < config_.accounts.size(); ++i) {
        const AccountConfig& account = config_.accounts[i];
        ss << (i == 0 ? "\n" : ",\n");
        ss << "    {\"id\": " << account.id
           << ", \"name\": " << quoteJson(account.name)
           << ", \"server\": " << quoteJson(account.server)
           << ", \"enabled\": " << boolString(account.enabled)
           << ", \"credentials\": [";
        for (size_t j = 0; j < account.credentials.size(); ++j) {
            const CredentialConfig& cred = account.credentials[j];
            ss << (j == 0 ? "" : ", ")
               << "{\"id\": " << cred.id
               << ", \"username\": " << quoteJson(cred.username)
               << ", \"password\": \"***\""
               << ", \"maxConnections\": " << cred.maxConnections
               << ", \"enabled\": " << boolString(cred.enabled) << "}";
        }
        ss << "]}";
    }
    ss << (config_.accounts.empty() ? "]\n" : "\n  ]\n");
    ss << "}\n";
    return ss.str();
}

void ConfigManager::setLogCallback(ConfigLogCallback callback) {
    std::lock_guard<std::mutex> lock(logMutex_);
    logCallback_ = std::move(callback);
}

// =============================================================================
// Private Implementation
// =============================================================================

Result<void, ConfigError> ConfigManager::parseJson(const std::string& content) {
    JsonParser parser(content);
    auto parsed = parser.parse();
    if (parsed.isError()) {
        return Result<void, ConfigError>::error(parsed.error());
    }

    const JsonValue& root = parsed.value();
    if (!root.isObject()) {
        return Result<void, ConfigError>::error(
            ConfigError(ConfigError::Code::ParseError, "Configuration root must be an object"));
    }

    // Parse into a copy so a rejected document leaves the config untouched.
    Configuration next = getConfig();

    SectionReader server(root["server"], "server");
    server.readString("bindAddress", next.server.bindAddress);
    server.readUnsigned("port", next.server.port, 1, 65535);
    server.readUnsigned("maxConnections", next.server.maxConnections, 1);
    if (server.error()) {
        return Result<void, ConfigError>::error(*server.error());
    }

    const JsonValue& loggingNode = root["logging"];
    SectionReader logging(loggingNode, "logging");
    if (loggingNode.contains("level")) {
        std::string levelStr;
        logging.readString("level", levelStr);
        if (!logging.error()) {
            auto level = parseLogLevel(levelStr);
            if (!level) {
                return Result<void, ConfigError>::error(
                    ConfigError(ConfigError::Code::ValidationError,
                                "Invalid logging.level: " + levelStr +
                                ". Valid values: debug, info, warning, error",
                                "logging.level"));
            }
            next.logging.level = *level;
        }
    }
    logging.readBool("enableConsole", next.logging.enableConsole);
    logging.readBool("enableFile", next.logging.enableFile);
    logging.readString("filePath", next.logging.filePath);
    logging.readBool("enableJson", next.logging.enableJson);
    logging.readBool("enableSyslog", next.logging.enableSyslog);
    logging.readUnsigned("maxFileSizeMB", next.logging.maxFileSizeMB);
    logging.readUnsigned("maxFiles", next.logging.maxFiles);
    logging.readBool("compressRotated", next.logging.compressRotated);
    if (logging.error()) {
        return Result<void, ConfigError>::error(*logging.error());
    }

    SectionReader mux(root["multiplexer"], "multiplexer");
    mux.readUnsigned("chunkSize", next.multiplexer.chunkSize, 1, 16 * 1024 * 1024);
    mux.readUnsigned("subscriberQueueDepth", next.multiplexer.subscriberQueueDepth, 1);
    mux.readUnsigned("connectTimeoutSeconds", next.multiplexer.connectTimeoutSeconds, 1);
    mux.readUnsigned("readTimeoutSeconds", next.multiplexer.readTimeoutSeconds, 1);
    mux.readUnsigned("idleTimeoutSeconds", next.multiplexer.idleTimeoutSeconds, 1);
    mux.readUnsigned("subscriberWaitSeconds", next.multiplexer.subscriberWaitSeconds, 1);
    mux.readUnsigned("reclaimIntervalMs", next.multiplexer.reclaimIntervalMs, 1);
    mux.readUnsigned("idleReleasePauseMs", next.multiplexer.idleReleasePauseMs);
    mux.readUnsigned("staleConnectionSeconds", next.multiplexer.staleConnectionSeconds, 1);
    if (mux.error()) {
        return Result<void, ConfigError>::error(*mux.error());
    }

    SectionReader upstream(root["upstream"], "upstream");
    upstream.readString("defaultUserAgent", next.upstream.defaultUserAgent);
    upstream.readUnsigned("maxRedirects", next.upstream.maxRedirects, 0, 20);
    upstream.readUnsigned("probeTimeoutSeconds", next.upstream.probeTimeoutSeconds, 1);
    if (upstream.error()) {
        return Result<void, ConfigError>::error(*upstream.error());
    }

    if (root.contains("accounts")) {
        const JsonValue& accounts = root["accounts"];
        if (!accounts.isArray()) {
            return Result<void, ConfigError>::error(
                ConfigError(ConfigError::Code::ValidationError,
                            "accounts must be an array", "accounts"));
        }

        next.accounts.clear();
        for (size_t i = 0; i < accounts.arrayValue.size(); ++i) {
            const JsonValue& node = accounts.arrayValue[i];
            std::string prefix = "accounts[" + std::to_string(i) + "]";
            if (!node.isObject()) {
                return Result<void, ConfigError>::error(
                    ConfigError(ConfigError::Code::ValidationError,
                                prefix + " must be an object", prefix));
            }

            AccountConfig account;
            SectionReader reader(node, prefix);
            reader.require("id");
            reader.readUnsigned("id", account.id, 1);
            reader.readString("name", account.name);
            reader.readString("server", account.server);
            reader.readBool("enabled", account.enabled);
            reader.readString("userAgent", account.userAgent);
            reader.readString("username", account.username);
            reader.readString("password", account.password);
            if (node.contains("credentials") && !node["credentials"].isArray()) {
                reader.setError("credentials", "must be an array");
            }
            if (reader.error()) {
                return Result<void, ConfigError>::error(*reader.error());
            }

            const JsonValue& creds = node["credentials"];
            for (size_t j = 0; j < creds.arrayValue.size(); ++j) {
                std::string credPrefix = prefix + ".credentials[" + std::to_string(j) + "]";
                CredentialConfig cred;
                SectionReader credReader(creds.arrayValue[j], credPrefix);
                credReader.require("id");
                credReader.readUnsigned("id", cred.id, 1);
                credReader.readString("username", cred.username);
                credReader.readString("password", cred.password);
                credReader.readUnsigned("maxConnections", cred.maxConnections, 1);
                credReader.readBool("enabled", cred.enabled);
                if (credReader.error()) {
                    return Result<void, ConfigError>::error(*credReader.error());
                }
                account.credentials.push_back(std::move(cred));
            }

            next.accounts.push_back(std::move(account));
        }
    }

    {
        std::unique_lock<std::shared_mutex> lock(configMutex_);
        std::swap(config_, next);
    }

    auto validation = validate();
    if (validation.isError()) {
        std::unique_lock<std::shared_mutex> lock(configMutex_);
        std::swap(config_, next);
    }
    return validation;
}

Result<std::string, ConfigError> ConfigManager::readFile(const std::string& filePath) const {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        return Result<std::string, ConfigError>::error(
            ConfigError(ConfigError::Code::FileNotFound,
                        "Configuration file not found: " + filePath));
    }

    std::ostringstream ss;
    ss << file.rdbuf();

    if (file.bad()) {
        return Result<std::string, ConfigError>::error(
            ConfigError(ConfigError::Code::IOError,
                        "Error reading configuration file: " + filePath));
    }

    return Result<std::string, ConfigError>::success(ss.str());
}

void ConfigManager::log(const std::string& message) const {
    std::lock_guard<std::mutex> lock(logMutex_);
    if (logCallback_) {
        logCallback_(message);
    }
}

void ConfigManager::logEffectiveConfig() const {
    Configuration snapshot = getConfig();
    log("Effective configuration:");
    log("  server.bindAddress: " + snapshot.server.bindAddress);
    log("  server.port: " + std::to_string(snapshot.server.port));
    log("  logging.level: " + logLevelToString(snapshot.logging.level));
    log("  multiplexer.chunkSize: " + std::to_string(snapshot.multiplexer.chunkSize));
    log("  multiplexer.subscriberQueueDepth: " +
        std::to_string(snapshot.multiplexer.subscriberQueueDepth));
    log("  multiplexer.idleTimeoutSeconds: " +
        std::to_string(snapshot.multiplexer.idleTimeoutSeconds));
    log("  accounts: " + std::to_string(snapshot.accounts.size()));
}

std::optional<std::string> ConfigManager::getEnvVar(const std::string& name) const {
    const char* value = std::getenv(name.c_str());
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

} // namespace core
} // namespace iptvmux
