#pragma once

#include <string>

namespace framing {

enum class FrameType {
    PLAIN,
    DATA,
    END_OF_OUTPUT
};

// One protocol line of a response. For DATA frames `text` holds the
// still-encoded payload (prefix removed).
struct Frame {
    FrameType type = FrameType::PLAIN;
    std::string text;
};

Frame classify_line(const std::string& line);

// Builders include the trailing newline; build_plain_line adds one only
// when `text` lacks it.
std::string build_data_line(const std::string& encoded);
std::string build_plain_line(const std::string& text);
std::string end_of_output_line();

}
