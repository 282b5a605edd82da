#include "diff_applier.hpp"
#include "../common/hash_utils.hpp"

DiffApplier::DiffApplier(const std::string& base) : base_(base), baseLines_(splitLines(base)) {}

Result<std::string> DiffApplier::apply(const std::string& diffText) const {
    Result<UnifiedDiff> parsed = UnifiedDiff::parse(diffText);
    if (!parsed.success) return Result<std::string>::From(parsed);
    return apply(parsed.data);
}

Result<std::string> DiffApplier::apply(const UnifiedDiff& diff) const {
    using StringResult = Result<std::string>;
    if (!diff.baseDigest.empty() && !HashUtils::verify(base_, diff.baseDigest)) {
        return StringResult::Error(ErrorCode::DiffApplication,
            "Diff was made against a different baseline (" + diff.baseDigest + ")");
    }

    std::string out;
    out.reserve(base_.size());
    size_t cursor = 0;   // next unconsumed base line, 0-based

    for (const Hunk& hunk : diff.hunks) {
        size_t position = hunk.oldCount == 0 ? hunk.oldStart : hunk.oldStart - 1;
        if (hunk.oldCount != 0 && hunk.oldStart == 0) {
            return StringResult::Error(ErrorCode::DiffApplication, "Hunk starts at line 0");
        }
        if (position < cursor || position > baseLines_.size()) {
            return StringResult::Error(ErrorCode::DiffApplication,
                "Hunk at line " + std::to_string(hunk.oldStart) + " is out of order or past the end of the base");
        }
        for (; cursor < position; ++cursor) out += baseLines_[cursor];

        for (const HunkLine& line : hunk.lines) {
            if (line.type == HunkLineType::ADD) {
                out += line.text;
                continue;
            }
            if (cursor >= baseLines_.size() || baseLines_[cursor] != line.text) {
                return StringResult::Error(ErrorCode::DiffApplication,
                    "Diff does not match the base at line " + std::to_string(cursor + 1));
            }
            if (line.type == HunkLineType::CONTEXT) out += line.text;
            ++cursor;
        }
    }
    for (; cursor < baseLines_.size(); ++cursor) out += baseLines_[cursor];

    if (!diff.targetDigest.empty() && !HashUtils::verify(out, diff.targetDigest)) {
        return StringResult::Error(ErrorCode::DiffApplication, "Patched content does not match the diff's target");
    }
    return StringResult::Ok(std::move(out));
}
