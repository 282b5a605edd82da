#include "working_copy.hpp"
#include "../destination/destination_file.hpp"
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <vector>

WorkingCopy::~WorkingCopy() {
    remove();
}

Result<void> WorkingCopy::create(const std::string& filename, const std::string& content) {
    const char* tmp = std::getenv("TMPDIR");
    std::string pattern = std::string(tmp && *tmp ? tmp : "/tmp") + "/remedit-edit-XXXXXX";
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (mkdtemp(buffer.data()) == nullptr) {
        return Result<void>::Error(ErrorCode::Io,
            std::string("Failed to create working directory: ") + std::strerror(errno));
    }
    directory_ = buffer.data();
    // mkdtemp honours the umask, and the client runs under a 0177 one
    if (chmod(buffer.data(), S_IRWXU) != 0) {
        std::string message = std::string("Failed to set working directory mode: ") + std::strerror(errno);
        remove();
        return Result<void>::Error(ErrorCode::Io, message);
    }
    path_ = directory_ + "/" + filename;

    std::ofstream file(path_, std::ios::binary | std::ios::trunc);
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    if (!file) {
        return Result<void>::Error(ErrorCode::Io, "Failed to write working copy " + path_);
    }
    return Result<void>::Ok();
}

Result<std::string> WorkingCopy::read() const {
    return DestinationFile(path_).read();
}

const std::string& WorkingCopy::path() const {
    return path_;
}

void WorkingCopy::remove() {
    if (directory_.empty()) return;
    // editors may leave swap and backup files next to the copy
    std::error_code ec;
    std::filesystem::remove_all(directory_, ec);
    directory_.clear();
}
