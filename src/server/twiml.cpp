#include "voice_bridge/server/twiml.hpp"

#include <array>

namespace voice_bridge::server {

namespace {

constexpr const char* kXmlHeader = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";

constexpr std::array<const char*, 5> kMachineAnswers = {
    "fax",
    "machine_start",
    "machine_end_beep",
    "machine_end_silence",
    "machine_end_other",
};

}

bool is_machine_answer(const std::string& answered_by) {
    for (const auto* value : kMachineAnswers) {
        if (answered_by == value) {
            return true;
        }
    }
    return false;
}

std::string xml_escape(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char ch : text) {
        switch (ch) {
            case '&':
                escaped += "&amp;";
                break;
            case '<':
                escaped += "&lt;";
                break;
            case '>':
                escaped += "&gt;";
                break;
            case '"':
                escaped += "&quot;";
                break;
            case '\'':
                escaped += "&apos;";
                break;
            default:
                escaped += ch;
                break;
        }
    }
    return escaped;
}

std::string hangup_twiml() {
    return std::string(kXmlHeader) + "<Response>\n    <Hangup/>\n</Response>";
}

std::string connect_stream_twiml(const std::string& stream_url,
                                 const std::optional<std::string>& greeting) {
    std::string twiml = kXmlHeader;
    twiml += "<Response>\n";
    if (greeting && !greeting->empty()) {
        twiml += "    <Say>" + xml_escape(*greeting) + "</Say>\n";
    }
    twiml += "    <Connect>\n";
    twiml += "        <Stream url=\"" + xml_escape(stream_url) + "\"/>\n";
    twiml += "    </Connect>\n";
    twiml += "</Response>";
    return twiml;
}

std::string stream_twiml(const std::optional<std::string>& answered_by,
                         const std::string& stream_url,
                         const std::optional<std::string>& greeting) {
    if (answered_by && is_machine_answer(*answered_by)) {
        return hangup_twiml();
    }
    return connect_stream_twiml(stream_url, greeting);
}

}
