#include "host_mode.hpp"
#include "host_session.hpp"
#include "../common/config.hpp"
#include "../common/logger.hpp"
#include "../common/socket_utils.hpp"
#include <unistd.h>

HostMode::HostMode(const HostOptions& options) : options_(options) {}

int HostMode::run() {
    if (access(options_.filePath.c_str(), R_OK | W_OK) != 0) {
        Logger::instance().log(LogLevel::ERROR, "Cannot edit %s: file must exist and be readable and writable",
            options_.filePath.c_str());
        return 1;
    }

    int socketFD = options_.listen ? acceptClient() : connectToClient();
    if (socketFD < 0) return 1;

    HostSession session(socketFD, options_.filePath, 0);
    Result<void> result = session.run();
    if (!result.success) {
        Logger::instance().log(LogLevel::ERROR, "%s ended with %s: %s",
            session.getInfo().c_str(), errorCodeName(result.code), result.message.c_str());
        return 2;
    }
    if (session.updatesRejected() > 0) {
        Logger::instance().log(LogLevel::WARN, "[Host 0] %zu update(s) were rejected", session.updatesRejected());
    }
    return 0;
}

int HostMode::connectToClient() {
    Result<std::string> path = SocketUtils::resolveSocketPath(options_.socketPath);
    if (!path.success) {
        Logger::instance().log(LogLevel::ERROR, "%s", path.message.c_str());
        return -1;
    }
    Result<int> connected = SocketUtils::connectUnix(path.data);
    if (!connected.success) {
        Logger::instance().log(LogLevel::ERROR, "%s", connected.message.c_str());
        return -1;
    }
    Logger::instance().log(LogLevel::DEBUG, "Connected to %s", path.data.c_str());
    return connected.data;
}

int HostMode::acceptClient() {
    Result<int> listening = SocketUtils::listenUnix(options_.socketPath, 1);
    if (!listening.success) {
        Logger::instance().log(LogLevel::ERROR, "%s", listening.message.c_str());
        return -1;
    }
    Logger::instance().log(LogLevel::INFO, "Waiting for a client on %s", options_.socketPath.c_str());
    int listenFD = listening.data;
    Result<int> accepted = SocketUtils::acceptConnection(listenFD);
    SocketUtils::closeSocket(listenFD);
    ::unlink(options_.socketPath.c_str());
    if (!accepted.success) {
        Logger::instance().log(LogLevel::ERROR, "%s", accepted.message.c_str());
        return -1;
    }
    return accepted.data;
}
