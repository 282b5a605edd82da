#include "diff_generator.hpp"
#include "../common/hash_utils.hpp"
#include <algorithm>
#include <unordered_map>

DiffGenerator::DiffGenerator(const std::string& base, const std::string& target,
                             size_t contextLines, long maxEditCost)
    : base_(base), target_(target), baseLines_(splitLines(base)), targetLines_(splitLines(target)),
      contextLines_(contextLines), maxEditCost_(maxEditCost) {}

// Myers' greedy O(ND) search over line ids. trace[d] keeps the furthest
// x reached on every diagonal k in [-d, d] after d edits. Returns false
// when more than maxEditCost_ edits would be needed.
bool DiffGenerator::shortestEdit(const std::vector<int>& a, const std::vector<int>& b,
                                 std::vector<EditType>& script) const {
    const long n = static_cast<long>(a.size());
    const long m = static_cast<long>(b.size());
    const long limit = std::min(n + m, maxEditCost_);
    const long offset = limit + 1;

    std::vector<long> v(2 * limit + 3, 0);
    std::vector<std::vector<long>> trace;
    long found = -1;

    for (long d = 0; d <= limit && found < 0; ++d) {
        for (long k = -d; k <= d; k += 2) {
            long x;
            if (k == -d || (k != d && v[k - 1 + offset] < v[k + 1 + offset]))
                x = v[k + 1 + offset];
            else
                x = v[k - 1 + offset] + 1;
            long y = x - k;
            while (x < n && y < m && a[x] == b[y]) {
                ++x;
                ++y;
            }
            v[k + offset] = x;
            if (x >= n && y >= m) {
                found = d;
                break;
            }
        }
        if (found < 0) {
            std::vector<long> snapshot(2 * d + 1);
            for (long k = -d; k <= d; ++k) snapshot[k + d] = v[k + offset];
            trace.push_back(std::move(snapshot));
        }
    }
    if (found < 0) return false;

    // walk back from (n, m) to (0, 0)
    std::vector<EditType> reversed;
    long x = n, y = m;
    for (long d = found; d > 0; --d) {
        const std::vector<long>& prev = trace[d - 1];
        auto at = [&](long k) { return prev[k + d - 1]; };
        long k = x - y;
        long prevK = (k == -d || (k != d && at(k - 1) < at(k + 1))) ? k + 1 : k - 1;
        long prevX = at(prevK);
        long prevY = prevX - prevK;
        while (x > prevX && y > prevY) {
            reversed.push_back(EditType::EQUAL);
            --x;
            --y;
        }
        if (x == prevX) {
            reversed.push_back(EditType::ADD);
            --y;
        } else {
            reversed.push_back(EditType::REMOVE);
            --x;
        }
    }
    while (x > 0 && y > 0) {
        reversed.push_back(EditType::EQUAL);
        --x;
        --y;
    }
    script.assign(reversed.rbegin(), reversed.rend());
    return true;
}

std::vector<EditOp> DiffGenerator::getEdits() const {
    const size_t n = baseLines_.size();
    const size_t m = targetLines_.size();

    size_t prefix = 0;
    while (prefix < n && prefix < m && baseLines_[prefix] == targetLines_[prefix]) ++prefix;
    size_t suffix = 0;
    while (suffix < n - prefix && suffix < m - prefix &&
           baseLines_[n - 1 - suffix] == targetLines_[m - 1 - suffix]) ++suffix;

    // intern the differing middle so myers compares ints
    std::unordered_map<std::string, int> ids;
    auto intern = [&](const std::string& line) {
        auto it = ids.emplace(line, static_cast<int>(ids.size()));
        return it.first->second;
    };
    std::vector<int> a, b;
    for (size_t i = prefix; i < n - suffix; ++i) a.push_back(intern(baseLines_[i]));
    for (size_t i = prefix; i < m - suffix; ++i) b.push_back(intern(targetLines_[i]));

    std::vector<EditType> middle;
    if (!shortestEdit(a, b, middle)) {
        // too far apart: replace the whole middle region
        middle.assign(a.size(), EditType::REMOVE);
        middle.insert(middle.end(), b.size(), EditType::ADD);
    }

    std::vector<EditOp> ops;
    ops.reserve(prefix + middle.size() + suffix);
    size_t oldIndex = 0, newIndex = 0;
    auto push = [&](EditType type) {
        ops.push_back({type, oldIndex, newIndex});
        if (type != EditType::ADD) ++oldIndex;
        if (type != EditType::REMOVE) ++newIndex;
    };
    for (size_t i = 0; i < prefix; ++i) push(EditType::EQUAL);
    for (EditType type : middle) push(type);
    for (size_t i = 0; i < suffix; ++i) push(EditType::EQUAL);
    return ops;
}

UnifiedDiff DiffGenerator::getHunks() const {
    UnifiedDiff diff;
    diff.baseDigest = HashUtils::digest(base_);
    diff.targetDigest = HashUtils::digest(target_);

    std::vector<EditOp> ops = getEdits();
    std::vector<size_t> changes;
    for (size_t i = 0; i < ops.size(); ++i) {
        if (ops[i].type != EditType::EQUAL) changes.push_back(i);
    }

    size_t c = 0;
    while (c < changes.size()) {
        // extend the group while the equal run between changes is short
        size_t last = c;
        while (last + 1 < changes.size() &&
               changes[last + 1] - changes[last] - 1 <= 2 * contextLines_) {
            ++last;
        }
        size_t lo = changes[c] > contextLines_ ? changes[c] - contextLines_ : 0;
        size_t hi = std::min(ops.size(), changes[last] + contextLines_ + 1);

        Hunk hunk;
        for (size_t i = lo; i < hi; ++i) {
            const EditOp& op = ops[i];
            switch (op.type) {
            case EditType::EQUAL:
                hunk.lines.push_back(HunkLine::makeContext(baseLines_[op.oldIndex]));
                ++hunk.oldCount;
                ++hunk.newCount;
                break;
            case EditType::REMOVE:
                hunk.lines.push_back(HunkLine::makeRemove(baseLines_[op.oldIndex]));
                ++hunk.oldCount;
                break;
            case EditType::ADD:
                hunk.lines.push_back(HunkLine::makeAdd(targetLines_[op.newIndex]));
                ++hunk.newCount;
                break;
            }
        }
        hunk.oldStart = hunk.oldCount == 0 ? ops[lo].oldIndex : ops[lo].oldIndex + 1;
        hunk.newStart = hunk.newCount == 0 ? ops[lo].newIndex : ops[lo].newIndex + 1;
        diff.hunks.push_back(std::move(hunk));
        c = last + 1;
    }
    return diff;
}

std::string DiffGenerator::getDiff() const {
    return getHunks().format();
}
