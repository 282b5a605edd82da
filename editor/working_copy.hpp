#pragma once
#include "../common/result.hpp"
#include <string>

// Client side copy of the file under edit, in a private temporary
// directory that is removed again with the object.
class WorkingCopy {
public:
    WorkingCopy() = default;
    ~WorkingCopy();
    WorkingCopy(const WorkingCopy&) = delete;
    WorkingCopy& operator=(const WorkingCopy&) = delete;

    Result<void> create(const std::string& filename, const std::string& content);
    Result<std::string> read() const;
    const std::string& path() const;
    void remove();

private:
    std::string directory_;
    std::string path_;
};
