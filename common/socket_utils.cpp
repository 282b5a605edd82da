#include "socket_utils.hpp"
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <vector>

namespace {

Result<sockaddr_un> makeAddress(const std::string& path) {
    sockaddr_un address{};
    address.sun_family = AF_UNIX;
    if (path.empty() || path.size() >= sizeof(address.sun_path)) {
        return Result<sockaddr_un>::Error(ErrorCode::Io, "Invalid socket path: " + path);
    }
    std::memcpy(address.sun_path, path.c_str(), path.size() + 1);
    return Result<sockaddr_un>::Ok(address);
}

std::string errnoText(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

} // namespace

namespace SocketUtils {

Result<int> connectUnix(const std::string& path) {
    auto address = makeAddress(path);
    if (!address.success) return Result<int>::From(address);

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return Result<int>::Error(ErrorCode::Io, errnoText("Socket creation failed"));
    }
    if (connect(fd, reinterpret_cast<sockaddr*>(&address.data), sizeof(address.data)) < 0) {
        std::string message = errnoText("Connection to " + path + " failed");
        ::close(fd);
        return Result<int>::Error(ErrorCode::Io, message);
    }
    return Result<int>::Ok(fd);
}

Result<int> listenUnix(const std::string& path, int backlog) {
    auto address = makeAddress(path);
    if (!address.success) return Result<int>::From(address);

    struct stat st{};
    if (lstat(path.c_str(), &st) == 0) {
        if (!S_ISSOCK(st.st_mode)) {
            return Result<int>::Error(ErrorCode::Io, path + " exists and is not a socket");
        }
        ::unlink(path.c_str());
    }

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return Result<int>::Error(ErrorCode::Io, errnoText("Socket creation failed"));
    }
    if (bind(fd, reinterpret_cast<sockaddr*>(&address.data), sizeof(address.data)) < 0) {
        std::string message = errnoText("Bind to " + path + " failed");
        ::close(fd);
        return Result<int>::Error(ErrorCode::Io, message);
    }
    if (listen(fd, backlog) < 0) {
        std::string message = errnoText("Listen failed");
        ::close(fd);
        ::unlink(path.c_str());
        return Result<int>::Error(ErrorCode::Io, message);
    }
    return Result<int>::Ok(fd);
}

Result<int> acceptConnection(int listenFD) {
    for (;;) {
        int fd = accept4(listenFD, nullptr, nullptr, SOCK_CLOEXEC);
        if (fd >= 0) return Result<int>::Ok(fd);
        if (errno == EINTR || errno == ECONNABORTED) continue;
        return Result<int>::Error(ErrorCode::Io, errnoText("Accept failed"));
    }
}

Result<std::string> resolveSocketPath(const std::string& path) {
    std::string resolved = path;
    struct stat st{};
    if (stat(resolved.c_str(), &st) != 0) {
        return Result<std::string>::Error(ErrorCode::Io, "Socket path does not exist: " + path);
    }
    if (S_ISDIR(st.st_mode)) {
        resolved += "/socket";
        if (stat(resolved.c_str(), &st) != 0) {
            return Result<std::string>::Error(ErrorCode::Io,
                "Socket directory " + path + " does not contain a socket file");
        }
    }
    if (!S_ISSOCK(st.st_mode)) {
        return Result<std::string>::Error(ErrorCode::Io, resolved + " is not a socket");
    }
    if (st.st_uid != getuid()) {
        return Result<std::string>::Error(ErrorCode::Io, resolved + " is not owned by the current user");
    }
    if ((st.st_mode & 0777) != (S_IRUSR | S_IWUSR)) {
        return Result<std::string>::Error(ErrorCode::Io, "Access to " + resolved + " is too permissive");
    }
    return Result<std::string>::Ok(resolved);
}

Result<std::string> makeSocketDirectory() {
    const char* tmp = std::getenv("TMPDIR");
    std::string pattern = std::string(tmp && *tmp ? tmp : "/tmp") + "/remedit-XXXXXX";
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (mkdtemp(buffer.data()) == nullptr) {
        return Result<std::string>::Error(ErrorCode::Io, errnoText("Failed to create socket directory"));
    }
    // the directory needs the search bit the process umask strips
    if (chmod(buffer.data(), S_IRWXU) != 0) {
        std::string message = errnoText("Failed to set socket directory mode");
        ::rmdir(buffer.data());
        return Result<std::string>::Error(ErrorCode::Io, message);
    }
    return Result<std::string>::Ok(std::string(buffer.data()) + "/socket");
}

Result<bool> waitReadable(int fd, int timeoutMs) {
    pollfd entry{};
    entry.fd = fd;
    entry.events = POLLIN;
    for (;;) {
        int ready = poll(&entry, 1, timeoutMs);
        if (ready < 0 && errno == EINTR) continue;
        if (ready < 0) return Result<bool>::Error(ErrorCode::Io, errnoText("Poll failed"));
        return Result<bool>::Ok(ready > 0 && (entry.revents & (POLLIN | POLLHUP | POLLERR)) != 0);
    }
}

void closeSocket(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace SocketUtils
