#include "destination_file.hpp"
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <vector>

DestinationFile::DestinationFile(const std::string& destinationPath) : destPath_(destinationPath) {}

const std::string& DestinationFile::path() const {
    return destPath_;
}

Result<std::string> DestinationFile::read() const {
    std::ifstream file(destPath_, std::ios::binary);
    if (!file) {
        return Result<std::string>::Error(ErrorCode::Io, "Failed to open file: " + destPath_);
    }
    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        return Result<std::string>::Error(ErrorCode::Io, "Failed to read file: " + destPath_);
    }
    return Result<std::string>::Ok(content.str());
}

Result<void> DestinationFile::write(const std::string& content) {
    mode_t mode = 0600;
    struct stat st{};
    if (stat(destPath_.c_str(), &st) == 0) mode = st.st_mode & 07777;

    std::string tempTemplate = destPath_ + ".remedit.XXXXXX";
    std::vector<char> tempPath(tempTemplate.begin(), tempTemplate.end());
    tempPath.push_back('\0');
    int fd = mkstemp(tempPath.data());
    if (fd < 0) {
        return Result<void>::Error(ErrorCode::Io,
            "Failed to create temporary file for " + destPath_ + ": " + std::strerror(errno));
    }

    auto fail = [&](const std::string& what) {
        std::string reason = std::strerror(errno);
        ::close(fd);
        ::unlink(tempPath.data());
        return Result<void>::Error(ErrorCode::Io, what + " " + destPath_ + ": " + reason);
    };

    const char* data = content.data();
    size_t left = content.size();
    while (left > 0) {
        ssize_t written = ::write(fd, data, left);
        if (written < 0 && errno == EINTR) continue;
        if (written <= 0) return fail("Failed writing");
        data += written;
        left -= static_cast<size_t>(written);
    }
    if (fchmod(fd, mode) != 0) return fail("Failed to set permissions on");
    if (fsync(fd) != 0) return fail("Failed to sync");
    if (::close(fd) != 0) {
        std::string reason = std::strerror(errno);
        ::unlink(tempPath.data());
        return Result<void>::Error(ErrorCode::Io, "Failed closing " + destPath_ + ": " + reason);
    }

    // Atomic swap
    if (std::rename(tempPath.data(), destPath_.c_str()) != 0) {
        std::string reason = std::strerror(errno);
        ::unlink(tempPath.data());
        return Result<void>::Error(ErrorCode::Io, "Failed to replace " + destPath_ + ": " + reason);
    }
    return Result<void>::Ok();
}
