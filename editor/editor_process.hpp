#pragma once
#include "../common/result.hpp"
#include <string>

enum class EditorEvent { NONE, SAVED, EXITED };

// The editing program as the client session sees it.
class EditorProcess {
public:
    virtual ~EditorProcess() = default;

    // starts editing path without waiting for the edit to finish
    virtual Result<void> start(const std::string& path) = 0;

    // Non-blocking. SAVED once per observed change of the file, EXITED once
    // the program has ended.
    virtual EditorEvent poll() = 0;

    // asks the program to quit; never a forced kill
    virtual Result<void> terminate() = 0;
};
