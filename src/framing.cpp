#include "framing.hpp"
#include "protocol.hpp"

#include <cstring>

namespace framing {

Frame classify_line(const std::string& line) {
    std::string l = line;
    if (!l.empty() && l.back() == '\n') l.pop_back();
    if (!l.empty() && l.back() == '\r') l.pop_back();

    Frame frame;
    if (l == protocol::END_OF_OUTPUT_MARKER) {
        frame.type = FrameType::END_OF_OUTPUT;
        return frame;
    }
    size_t prefix_len = std::strlen(protocol::DATA_PREFIX);
    if (l.compare(0, prefix_len, protocol::DATA_PREFIX) == 0) {
        frame.type = FrameType::DATA;
        frame.text = l.substr(prefix_len);
        return frame;
    }
    frame.type = FrameType::PLAIN;
    frame.text = l;
    return frame;
}

std::string build_data_line(const std::string& encoded) {
    std::string out;
    out.reserve(std::strlen(protocol::DATA_PREFIX) + encoded.size() + 1);
    out += protocol::DATA_PREFIX;
    out += encoded;
    out += '\n';
    return out;
}

std::string build_plain_line(const std::string& text) {
    if (!text.empty() && text.back() == '\n') {
        return text;
    }
    return text + "\n";
}

std::string end_of_output_line() {
    return std::string(protocol::END_OF_OUTPUT_MARKER) + "\n";
}

}
