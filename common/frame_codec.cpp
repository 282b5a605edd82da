#include "frame_codec.hpp"
#include "config.hpp"
#include <limits>
#include <set>

namespace {

bool isBlank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

std::string trim(const std::string& text) {
    size_t begin = 0, end = text.size();
    while (begin < end && isBlank(text[begin])) ++begin;
    while (end > begin && isBlank(text[end - 1])) --end;
    return text.substr(begin, end - begin);
}

size_t skipBlanks(const std::string& line, size_t pos) {
    while (pos < line.size() && isBlank(line[pos])) ++pos;
    return pos;
}

// Reads a quoted field starting at the opening quote. pos ends up just
// past the closing quote.
Result<std::string> readQuoted(const std::string& line, size_t& pos) {
    std::string out;
    ++pos;
    while (pos < line.size()) {
        char c = line[pos++];
        if (c == '"') {
            return Result<std::string>::Ok(out);
        }
        if (c != '\\') {
            out += c;
            continue;
        }
        if (pos >= line.size()) break;
        char escaped = line[pos++];
        switch (escaped) {
        case '"': out += '"'; break;
        case '\\': out += '\\'; break;
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        default:
            return Result<std::string>::Error(ErrorCode::Protocol,
                std::string("Unknown escape \\") + escaped + " in header: " + line);
        }
    }
    return Result<std::string>::Error(ErrorCode::Protocol, "Unterminated quote in header: " + line);
}

} // namespace

bool FrameCodec::needsQuoting(const std::string& field) {
    if (field.empty()) return true;
    if (isBlank(field.front()) || isBlank(field.back())) return true;
    return field.find_first_of(":\"\\\r\n") != std::string::npos;
}

std::string FrameCodec::encodeField(const std::string& field) {
    if (!needsQuoting(field)) return field;
    std::string out;
    out.reserve(field.size() + 2);
    out += '"';
    for (char c : field) {
        switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        default: out += c;
        }
    }
    out += '"';
    return out;
}

bool FrameCodec::parseUnsigned(const std::string& text, size_t& value) {
    if (text.empty()) return false;
    size_t result = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
        size_t digit = static_cast<size_t>(c - '0');
        if (result > (std::numeric_limits<size_t>::max() - digit) / 10) return false;
        result = result * 10 + digit;
    }
    value = result;
    return true;
}

Result<std::pair<std::string, std::string>> FrameCodec::parseHeaderLine(const std::string& line) {
    using HeaderResult = Result<std::pair<std::string, std::string>>;
    std::string name, value;

    size_t pos = skipBlanks(line, 0);
    if (pos < line.size() && line[pos] == '"') {
        auto quoted = readQuoted(line, pos);
        if (!quoted.success) return HeaderResult::From(quoted);
        name = quoted.data;
        pos = skipBlanks(line, pos);
        if (pos >= line.size() || line[pos] != ':') {
            return HeaderResult::Error(ErrorCode::Protocol, "Missing colon after quoted name: " + line);
        }
        if (name.find_first_of(":\n") != std::string::npos) {
            return HeaderResult::Error(ErrorCode::Protocol, "Header name holds a colon or newline: " + line);
        }
    } else {
        size_t colon = line.find(':', pos);
        if (colon == std::string::npos) {
            return HeaderResult::Error(ErrorCode::Protocol, "Missing colon in header: " + line);
        }
        name = trim(line.substr(pos, colon - pos));
        if (name.empty()) {
            return HeaderResult::Error(ErrorCode::Protocol, "Empty header name: " + line);
        }
        pos = colon;
    }
    ++pos; // past the colon

    pos = skipBlanks(line, pos);
    if (pos < line.size() && line[pos] == '"') {
        auto quoted = readQuoted(line, pos);
        if (!quoted.success) return HeaderResult::From(quoted);
        value = quoted.data;
        if (skipBlanks(line, pos) != line.size()) {
            return HeaderResult::Error(ErrorCode::Protocol, "Text after quoted value: " + line);
        }
    } else {
        value = trim(line.substr(pos));
    }
    return HeaderResult::Ok(std::make_pair(name, value));
}

Result<std::string> FrameCodec::encode(const Frame& frame) {
    Frame out = frame;
    if (!out.body.empty() || out.has("Size")) {
        out.set("Size", std::to_string(out.body.size()));
    }

    std::string bytes;
    for (const auto& header : out.headers) {
        if (header.first.find_first_of(":\n") != std::string::npos) {
            return Result<std::string>::Error(ErrorCode::Protocol,
                "Header name may not contain a colon or newline: " + header.first);
        }
        bytes += encodeField(header.first);
        bytes += ": ";
        bytes += encodeField(header.second);
        bytes += '\n';
    }
    bytes += '\n';
    bytes += out.body;
    return Result<std::string>::Ok(std::move(bytes));
}

Result<size_t> FrameCodec::bodySize(const Frame& frame) {
    const std::string* size = frame.find("Size");
    if (!size) return Result<size_t>::Ok(0);
    size_t value = 0;
    if (!parseUnsigned(*size, value)) {
        return Result<size_t>::Error(ErrorCode::Protocol, "Invalid Size header: " + *size);
    }
    if (value > Config::MAX_BODY_SIZE) {
        return Result<size_t>::Error(ErrorCode::Protocol, "Size header exceeds limit: " + *size);
    }
    return Result<size_t>::Ok(value);
}

Result<size_t> FrameCodec::decode(const std::string& buffer, Frame& frame) {
    // header block ends at the first empty line
    size_t blockEnd;
    size_t bodyStart;
    if (!buffer.empty() && buffer[0] == '\n') {
        blockEnd = 0;
        bodyStart = 1;
    } else {
        size_t blank = buffer.find("\n\n");
        if (blank == std::string::npos) {
            if (buffer.size() > Config::MAX_HEADER_BLOCK) {
                return Result<size_t>::Error(ErrorCode::Protocol, "Header block exceeds limit");
            }
            return Result<size_t>::Ok(0);
        }
        blockEnd = blank + 1;
        bodyStart = blank + 2;
    }
    if (blockEnd > Config::MAX_HEADER_BLOCK) {
        return Result<size_t>::Error(ErrorCode::Protocol, "Header block exceeds limit");
    }

    Frame parsed;
    std::set<std::string> seen;
    size_t lineStart = 0;
    while (lineStart < blockEnd) {
        size_t lineEnd = buffer.find('\n', lineStart);
        auto header = parseHeaderLine(buffer.substr(lineStart, lineEnd - lineStart));
        if (!header.success) return Result<size_t>::From(header);
        if (!seen.insert(header.data.first).second) {
            return Result<size_t>::Error(ErrorCode::Protocol, "Duplicate header: " + header.data.first);
        }
        parsed.headers.push_back(std::move(header.data));
        lineStart = lineEnd + 1;
    }

    auto size = bodySize(parsed);
    if (!size.success) return Result<size_t>::From(size);
    if (buffer.size() - bodyStart < size.data) {
        return Result<size_t>::Ok(0);
    }

    parsed.body = buffer.substr(bodyStart, size.data);
    frame = std::move(parsed);
    return Result<size_t>::Ok(bodyStart + size.data);
}
