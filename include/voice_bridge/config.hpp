#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace voice_bridge {

struct Config {
    std::string server_base_url;
    int rest_api_port = 8080;
    int media_stream_port = 8081;
    std::string media_stream_path = "/media-stream";
    std::string media_stream_url;
    std::optional<std::string> connect_greeting;

    std::string gemini_api_key;
    std::string gemini_model;
    std::string backend_ws_url;
    std::filesystem::path system_prompt_file;
    std::string system_prompt;
    std::optional<std::string> backend_voice;
    bool backend_transcriptions = false;
    std::string vad_start_sensitivity = "START_SENSITIVITY_HIGH";
    std::string vad_end_sensitivity = "END_SENSITIVITY_HIGH";
    int vad_prefix_padding_ms = 20;
    int vad_silence_duration_ms = 250;
    double backend_connect_timeout = 10.0;
    double backend_close_timeout = 5.0;
    double transport_close_timeout = 5.0;

    int pool_size = 2;
    int pool_maintenance_interval_sec = 30;
    int pool_creation_delay_ms = 500;
    int pool_max_idle_sec = 600;
    int turn_gap_ms = 50;

    std::string log_level = "INFO";
    std::optional<std::string> log_filename;
    std::optional<std::filesystem::path> logs_dir;
    std::string log_name = "voice_bridge";

    static Config load();
    void validate() const;
};

std::string derive_media_stream_url(const std::string& server_base_url,
                                    const std::string& path);
std::string load_system_prompt(const std::filesystem::path& path);

}
