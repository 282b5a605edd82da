#pragma once
#include "../common/result.hpp"
#include "../common/unified_diff.hpp"
#include <string>
#include <vector>

// Applies a unified diff to the baseline it was made against. Every
// context and removed line has to match the base at the exact position
// its hunk names; there is no fuzz and no offset search.
class DiffApplier {
public:
    explicit DiffApplier(const std::string& base);
    Result<std::string> apply(const std::string& diffText) const;
    Result<std::string> apply(const UnifiedDiff& diff) const;

private:
    std::string base_;
    std::vector<std::string> baseLines_;
};
