#include "unified_diff.hpp"
#include "frame_codec.hpp"
#include "hash_utils.hpp"

namespace {

const char* NO_NEWLINE_MARKER = "\\ No newline at end of file\n";

std::string rangeText(size_t start, size_t count) {
    if (count == 1) return std::to_string(start);
    return std::to_string(start) + "," + std::to_string(count);
}

Result<void> malformed(const std::string& what) {
    return Result<void>::Error(ErrorCode::DiffApplication, "Malformed diff: " + what);
}

// "-12,3" or "+7"
bool parseRange(const std::string& text, char sign, size_t& start, size_t& count) {
    if (text.size() < 2 || text[0] != sign) return false;
    std::string body = text.substr(1);
    size_t comma = body.find(',');
    if (comma == std::string::npos) {
        count = 1;
        return FrameCodec::parseUnsigned(body, start);
    }
    return FrameCodec::parseUnsigned(body.substr(0, comma), start) &&
           FrameCodec::parseUnsigned(body.substr(comma + 1), count);
}

Result<void> parseHunkHeader(const std::string& line, Hunk& hunk) {
    // @@ -a,b +c,d @@ optional section text
    if (line.compare(0, 3, "@@ ") != 0) return malformed("bad hunk header: " + line);
    size_t close = line.find(" @@", 3);
    if (close == std::string::npos) return malformed("bad hunk header: " + line);
    std::string ranges = line.substr(3, close - 3);
    size_t space = ranges.find(' ');
    if (space == std::string::npos ||
        !parseRange(ranges.substr(0, space), '-', hunk.oldStart, hunk.oldCount) ||
        !parseRange(ranges.substr(space + 1), '+', hunk.newStart, hunk.newCount)) {
        return malformed("bad hunk header: " + line);
    }
    return Result<void>::Ok();
}

void parseFileHeader(const std::string& rest, std::string& label, std::string& digest) {
    size_t tab = rest.find('\t');
    if (tab == std::string::npos) {
        label = rest;
        return;
    }
    label = rest.substr(0, tab);
    std::string tail = rest.substr(tab + 1);
    if (HashUtils::isDigest(tail)) digest = tail;
}

} // namespace

std::vector<std::string> splitLines(const std::string& content) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < content.size()) {
        size_t newline = content.find('\n', start);
        if (newline == std::string::npos) {
            lines.push_back(content.substr(start));
            break;
        }
        lines.push_back(content.substr(start, newline - start + 1));
        start = newline + 1;
    }
    return lines;
}

std::string UnifiedDiff::format() const {
    std::string out;
    out += "--- " + baseLabel;
    if (!baseDigest.empty()) out += "\t" + baseDigest;
    out += "\n+++ " + targetLabel;
    if (!targetDigest.empty()) out += "\t" + targetDigest;
    out += "\n";

    for (const Hunk& hunk : hunks) {
        out += "@@ -" + rangeText(hunk.oldStart, hunk.oldCount) +
               " +" + rangeText(hunk.newStart, hunk.newCount) + " @@\n";
        for (const HunkLine& line : hunk.lines) {
            switch (line.type) {
            case HunkLineType::CONTEXT: out += ' '; break;
            case HunkLineType::REMOVE: out += '-'; break;
            case HunkLineType::ADD: out += '+'; break;
            }
            out += line.text;
            if (line.text.empty() || line.text.back() != '\n') {
                out += '\n';
                out += NO_NEWLINE_MARKER;
            }
        }
    }
    return out;
}

Result<UnifiedDiff> UnifiedDiff::parse(const std::string& text) {
    UnifiedDiff diff;
    diff.baseLabel.clear();
    diff.targetLabel.clear();

    Hunk* current = nullptr;
    size_t oldLeft = 0, newLeft = 0;

    for (const std::string& rawLine : splitLines(text)) {
        std::string line = rawLine;
        if (!line.empty() && line.back() == '\n') line.pop_back();

        if (current == nullptr || (oldLeft == 0 && newLeft == 0)) {
            if (!line.empty() && line[0] == '\\' && current != nullptr && !current->lines.empty()) {
                std::string& last = current->lines.back().text;
                if (!last.empty() && last.back() == '\n') last.pop_back();
                continue;
            }
            if (line.compare(0, 2, "@@") == 0) {
                diff.hunks.emplace_back();
                current = &diff.hunks.back();
                auto header = parseHunkHeader(line, *current);
                if (!header.success) return Result<UnifiedDiff>::From(header);
                oldLeft = current->oldCount;
                newLeft = current->newCount;
                continue;
            }
            if (current != nullptr) {
                return Result<UnifiedDiff>::From(malformed("hunk longer than its header: " + line));
            }
            // preamble before the first hunk
            if (line.compare(0, 4, "--- ") == 0) {
                parseFileHeader(line.substr(4), diff.baseLabel, diff.baseDigest);
            } else if (line.compare(0, 4, "+++ ") == 0) {
                parseFileHeader(line.substr(4), diff.targetLabel, diff.targetDigest);
            }
            continue;
        }

        if (!line.empty() && line[0] == '\\') {
            if (current->lines.empty()) return Result<UnifiedDiff>::From(malformed("stray newline marker"));
            std::string& last = current->lines.back().text;
            if (!last.empty() && last.back() == '\n') last.pop_back();
            continue;
        }

        char tag = line.empty() ? ' ' : line[0];
        std::string body = (line.empty() ? std::string() : line.substr(1)) + "\n";
        switch (tag) {
        case ' ':
            if (oldLeft == 0 || newLeft == 0) return Result<UnifiedDiff>::From(malformed("hunk longer than its header"));
            current->lines.push_back(HunkLine::makeContext(body));
            --oldLeft;
            --newLeft;
            break;
        case '-':
            if (oldLeft == 0) return Result<UnifiedDiff>::From(malformed("hunk removes more than its header"));
            current->lines.push_back(HunkLine::makeRemove(body));
            --oldLeft;
            break;
        case '+':
            if (newLeft == 0) return Result<UnifiedDiff>::From(malformed("hunk adds more than its header"));
            current->lines.push_back(HunkLine::makeAdd(body));
            --newLeft;
            break;
        default:
            return Result<UnifiedDiff>::From(malformed("unexpected line in hunk: " + line));
        }
    }

    if (oldLeft != 0 || newLeft != 0) {
        return Result<UnifiedDiff>::From(malformed("hunk shorter than its header"));
    }
    return Result<UnifiedDiff>::Ok(std::move(diff));
}
