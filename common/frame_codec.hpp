#pragma once
#include "frame.hpp"
#include "result.hpp"
#include <string>

// Text header block, blank line, then exactly Size bytes of body.
//
// A field (name or value) is written in double quotes when it is empty,
// starts or ends with whitespace, or contains ':', '"', '\\', CR or LF.
// Inside quotes '"' and '\\' are backslash escaped and CR/LF are written
// as \r and \n, so a quoted field never spans lines.
class FrameCodec {
public:
    // Size is filled in from the body. Names containing ':' or a newline
    // are refused.
    static Result<std::string> encode(const Frame& frame);

    // Decodes one frame from the front of buffer. Returns the number of
    // bytes consumed, or 0 when the buffer does not hold a full frame yet.
    static Result<size_t> decode(const std::string& buffer, Frame& frame);

    static bool needsQuoting(const std::string& field);
    static std::string encodeField(const std::string& field);
    static Result<std::pair<std::string, std::string>> parseHeaderLine(const std::string& line);

    // strict unsigned decimal, used for Size and Filesize
    static bool parseUnsigned(const std::string& text, size_t& value);

private:
    static Result<size_t> bodySize(const Frame& frame);
};
