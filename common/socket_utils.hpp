#pragma once
#include "result.hpp"
#include <string>

// UNIX domain stream sockets. Every returned descriptor is owned by the caller.
namespace SocketUtils {
    Result<int> connectUnix(const std::string& path);

    // Removes a stale socket file left at path before binding.
    Result<int> listenUnix(const std::string& path, int backlog);
    Result<int> acceptConnection(int listenFD);

    // Checks a socket path before trusting it: a directory means
    // "<dir>/socket", the target must be a socket owned by the current user
    // with mode 0600. Returns the path to connect to.
    Result<std::string> resolveSocketPath(const std::string& path);

    // Creates a private remedit-XXXXXX directory in the temp dir and returns
    // the socket path inside it.
    Result<std::string> makeSocketDirectory();

    // true when fd has data or the peer hung up; false on timeout
    Result<bool> waitReadable(int fd, int timeoutMs);

    void closeSocket(int& fd);
}
