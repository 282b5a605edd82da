#pragma once
#include "../common/result.hpp"
#include <string>

// The host side file. Writes land in a temporary file beside the target
// and are renamed over it, so readers see either the old or the new
// content, never a mix.
class DestinationFile {
public:
    explicit DestinationFile(const std::string& destinationPath);
    Result<std::string> read() const;
    Result<void> write(const std::string& content);
    const std::string& path() const;

private:
    std::string destPath_;
};
