#pragma once

#include <optional>
#include <string>

namespace voice_bridge {
namespace server {

// True for answering-machine and fax classifications, which get hung up on.
bool is_machine_answer(const std::string& answered_by);

std::string xml_escape(const std::string& text);

std::string hangup_twiml();
std::string connect_stream_twiml(const std::string& stream_url,
                                 const std::optional<std::string>& greeting);

// Picks hangup or connect for a call answered by `answered_by`.
std::string stream_twiml(const std::optional<std::string>& answered_by,
                         const std::string& stream_url,
                         const std::optional<std::string>& greeting);

}
}
