#pragma once

#include <string>

namespace voice_bridge::utils {

std::string url_encode(const std::string& value);

// Maps http(s):// to ws(s)://; other schemes are kept and a bare host gets ws://.
std::string to_ws_url(const std::string& url);

std::string append_query(const std::string& url,
                         const std::string& key,
                         const std::string& value);

std::string path_of(const std::string& resource);

}
