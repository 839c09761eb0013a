#include "voice_bridge/utils/http.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace voice_bridge::utils {

std::string url_encode(const std::string& value) {
    std::ostringstream escaped;
    escaped << std::hex << std::uppercase;
    for (unsigned char ch : value) {
        if (std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.' || ch == '~') {
            escaped << ch;
        } else {
            escaped << '%' << std::setw(2) << std::setfill('0')
                    << static_cast<int>(ch);
        }
    }
    return escaped.str();
}

std::string to_ws_url(const std::string& url) {
    if (url.rfind("https://", 0) == 0) {
        return "wss://" + url.substr(8);
    }
    if (url.rfind("http://", 0) == 0) {
        return "ws://" + url.substr(7);
    }
    if (url.find("://") != std::string::npos) {
        return url;
    }
    return "ws://" + url;
}

std::string append_query(const std::string& url,
                         const std::string& key,
                         const std::string& value) {
    const char separator = url.find('?') == std::string::npos ? '?' : '&';
    return url + separator + url_encode(key) + "=" + url_encode(value);
}

std::string path_of(const std::string& resource) {
    const auto query_pos = resource.find('?');
    auto path = query_pos == std::string::npos ? resource : resource.substr(0, query_pos);
    if (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path.empty() ? "/" : path;
}

}
