#include "voice_bridge/config.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "voice_bridge/utils/http.hpp"

namespace voice_bridge {

namespace {

constexpr const char* kDefaultBackendWsUrl =
    "wss://generativelanguage.googleapis.com/ws/"
    "google.ai.generativelanguage.v1beta.GenerativeService.BidiGenerateContent";
constexpr const char* kDefaultGreeting = "Connecting you now, one moment please..";

std::string get_env_str(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

std::optional<std::string> get_env_optional(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    std::string result(value);
    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

std::string get_env_required(const char* name) {
    const char* value = std::getenv(name);
    if (!value || std::string(value).empty()) {
        throw std::runtime_error(std::string(name) + " is required");
    }
    return std::string(value);
}

bool get_env_bool(const char* name, bool fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return normalized == "true" || normalized == "1";
}

int get_env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string(name) + " must be an integer");
    }
}

double get_env_double(const char* name, double fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string(name) + " must be a number");
    }
}

std::string trim(std::string value) {
    auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
                                            [&](unsigned char ch) { return !is_space(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
                             [&](unsigned char ch) { return !is_space(ch); }).base(),
                value.end());
    return value;
}

std::string timestamp_suffix() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_value{};
    localtime_r(&time_t, &tm_value);
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y%m%d_%H%M%S");
    return stream.str();
}

std::string strip_quotes(std::string value) {
    if (value.size() < 2) {
        return value;
    }
    if ((value.front() == '"' && value.back() == '"') ||
        (value.front() == '\'' && value.back() == '\'')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

void load_dotenv() {
    const std::filesystem::path dotenv_path = std::filesystem::current_path() / ".env";
    if (!std::filesystem::exists(dotenv_path)) {
        return;
    }

    std::ifstream stream(dotenv_path);
    if (!stream.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line.rfind("#", 0) == 0) {
            continue;
        }

        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        const auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));
        if (key.empty()) {
            continue;
        }
        // Real environment wins over .env.
        setenv(key.c_str(), strip_quotes(value).c_str(), 0);
    }
}

}

std::string derive_media_stream_url(const std::string& server_base_url,
                                    const std::string& path) {
    auto base = utils::to_ws_url(server_base_url);
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    if (path.empty() || path.front() != '/') {
        return base + "/" + path;
    }
    return base + path;
}

std::string load_system_prompt(const std::filesystem::path& path) {
    std::ifstream stream(path);
    if (!stream.is_open()) {
        throw std::runtime_error("System prompt file '" + path.string() + "' not found");
    }
    std::ostringstream content;
    content << stream.rdbuf();
    auto prompt = trim(content.str());
    if (prompt.empty()) {
        throw std::runtime_error("System prompt file '" + path.string() + "' is empty");
    }
    return prompt;
}

Config Config::load() {
    load_dotenv();
    Config config;

    config.server_base_url = get_env_required("SERVER_BASE_URL");
    config.rest_api_port = get_env_int("REST_API_PORT", 8080);
    config.media_stream_port = get_env_int("MEDIA_STREAM_PORT", 8081);
    config.media_stream_path = get_env_str("MEDIA_STREAM_PATH", "/media-stream");
    config.media_stream_url = get_env_str(
        "MEDIA_STREAM_URL",
        derive_media_stream_url(config.server_base_url, config.media_stream_path));
    const char* greeting = std::getenv("CONNECT_GREETING");
    if (!greeting) {
        config.connect_greeting = std::string(kDefaultGreeting);
    } else if (*greeting != '\0') {
        config.connect_greeting = std::string(greeting);
    }

    config.gemini_api_key = get_env_required("GEMINI_API_KEY");
    config.gemini_model = get_env_required("GEMINI_MODEL");
    config.backend_ws_url = get_env_str("BACKEND_WS_URL", kDefaultBackendWsUrl);
    config.system_prompt_file = get_env_str("SYSTEM_PROMPT_FILE", "gemini_system_prompt.txt");
    config.system_prompt = load_system_prompt(config.system_prompt_file);
    config.backend_voice = get_env_optional("BACKEND_VOICE");
    config.backend_transcriptions = get_env_bool("BACKEND_TRANSCRIPTIONS", false);
    config.vad_start_sensitivity = get_env_str("VAD_START_SENSITIVITY", "START_SENSITIVITY_HIGH");
    config.vad_end_sensitivity = get_env_str("VAD_END_SENSITIVITY", "END_SENSITIVITY_HIGH");
    config.vad_prefix_padding_ms = get_env_int("VAD_PREFIX_PADDING_MS", 20);
    config.vad_silence_duration_ms = get_env_int("VAD_SILENCE_DURATION_MS", 250);
    config.backend_connect_timeout = get_env_double("BACKEND_CONNECT_TIMEOUT", 10.0);
    config.backend_close_timeout = get_env_double("BACKEND_CLOSE_TIMEOUT", 5.0);
    config.transport_close_timeout = get_env_double("TRANSPORT_CLOSE_TIMEOUT", 5.0);

    config.pool_size = get_env_int("POOL_SIZE", 2);
    config.pool_maintenance_interval_sec = get_env_int("POOL_MAINTENANCE_INTERVAL_SEC", 30);
    config.pool_creation_delay_ms = get_env_int("POOL_CREATION_DELAY_MS", 500);
    config.pool_max_idle_sec = get_env_int("POOL_MAX_IDLE_SEC", 600);
    config.turn_gap_ms = get_env_int("TURN_GAP_MS", 50);

    config.log_level = get_env_str("LOG_LEVEL", "INFO");
    config.log_name = get_env_str("LOG_NAME", "voice_bridge");
    const auto log_filename_raw = get_env_str("LOG_FILENAME", "");
    if (!log_filename_raw.empty()) {
        const std::filesystem::path log_path(log_filename_raw);
        const auto stamped = log_path.stem().string() + "_" + timestamp_suffix() +
                             log_path.extension().string();
        if (const auto log_dir = get_env_optional("LOGS_DIR")) {
            config.logs_dir = std::filesystem::path(*log_dir);
            config.log_filename = (std::filesystem::path(*log_dir) / stamped).string();
        } else {
            config.log_filename = stamped;
        }
    }

    return config;
}

void Config::validate() const {
    if (server_base_url.empty()) {
        throw std::runtime_error("SERVER_BASE_URL is required");
    }
    if (gemini_api_key.empty()) {
        throw std::runtime_error("GEMINI_API_KEY is required");
    }
    if (gemini_model.empty()) {
        throw std::runtime_error("GEMINI_MODEL is required");
    }
    if (backend_ws_url.rfind("wss://", 0) != 0) {
        throw std::runtime_error("BACKEND_WS_URL must be a wss:// URL");
    }
    if (system_prompt.empty()) {
        throw std::runtime_error("SYSTEM_PROMPT_FILE must contain a system prompt");
    }
    if (rest_api_port <= 0) {
        throw std::runtime_error("REST_API_PORT must be positive");
    }
    if (media_stream_port <= 0) {
        throw std::runtime_error("MEDIA_STREAM_PORT must be positive");
    }
    if (media_stream_port == rest_api_port) {
        throw std::runtime_error("MEDIA_STREAM_PORT must differ from REST_API_PORT");
    }
    if (pool_size < 0) {
        throw std::runtime_error("POOL_SIZE must be zero or positive");
    }
    if (pool_maintenance_interval_sec <= 0) {
        throw std::runtime_error("POOL_MAINTENANCE_INTERVAL_SEC must be positive");
    }
    if (pool_creation_delay_ms < 0) {
        throw std::runtime_error("POOL_CREATION_DELAY_MS must be zero or positive");
    }
    if (pool_max_idle_sec < 0) {
        throw std::runtime_error("POOL_MAX_IDLE_SEC must be zero or positive");
    }
    if (turn_gap_ms < 0) {
        throw std::runtime_error("TURN_GAP_MS must be zero or positive");
    }
    if (vad_prefix_padding_ms < 0 || vad_silence_duration_ms < 0) {
        throw std::runtime_error("VAD padding and silence durations must be zero or positive");
    }
    if (backend_connect_timeout <= 0.0 || backend_close_timeout <= 0.0 ||
        transport_close_timeout <= 0.0) {
        throw std::runtime_error("Timeouts must be positive");
    }
}

}
