#pragma once
#include "../common/config.hpp"
#include "../common/unified_diff.hpp"
#include <string>
#include <vector>

enum class EditType { EQUAL, REMOVE, ADD };

struct EditOp {
    EditType type;
    size_t oldIndex;    // position in base before this op
    size_t newIndex;    // position in target before this op
};

// Builds the unified diff turning base into target, line by line.
class DiffGenerator {
public:
    DiffGenerator(const std::string& base, const std::string& target,
                  size_t contextLines = Config::DIFF_CONTEXT_LINES,
                  long maxEditCost = Config::DIFF_MAX_EDIT_COST);

    std::string getDiff() const;
    UnifiedDiff getHunks() const;
    std::vector<EditOp> getEdits() const;

private:
    std::string base_;
    std::string target_;
    std::vector<std::string> baseLines_;
    std::vector<std::string> targetLines_;
    size_t contextLines_;
    long maxEditCost_;

    bool shortestEdit(const std::vector<int>& a, const std::vector<int>& b,
                      std::vector<EditType>& script) const;
};
