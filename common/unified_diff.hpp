#pragma once
#include "result.hpp"
#include <string>
#include <vector>

enum class HunkLineType { CONTEXT, REMOVE, ADD };

struct HunkLine {
    HunkLineType type;
    std::string text;   // keeps its '\n' unless it is a final line without one

    static HunkLine makeContext(const std::string& text) {
        return { HunkLineType::CONTEXT, text };
    }

    static HunkLine makeRemove(const std::string& text) {
        return { HunkLineType::REMOVE, text };
    }

    static HunkLine makeAdd(const std::string& text) {
        return { HunkLineType::ADD, text };
    }
};

// Line numbers are 1-based as in the @@ header. A count of 0 means the
// start names the line after which the change goes.
struct Hunk {
    size_t oldStart = 0;
    size_t oldCount = 0;
    size_t newStart = 0;
    size_t newCount = 0;
    std::vector<HunkLine> lines;
};

// Unified diff text. The "---" and "+++" lines carry the SHA-256 of the
// base and the target after a tab; diffs without them are still accepted.
struct UnifiedDiff {
    std::string baseLabel = "base";
    std::string baseDigest;
    std::string targetLabel = "target";
    std::string targetDigest;
    std::vector<Hunk> hunks;

    std::string format() const;
    static Result<UnifiedDiff> parse(const std::string& text);
};

// Splits content into lines that keep their terminating '\n'.
std::vector<std::string> splitLines(const std::string& content);
