#include "server_mode.hpp"
#include "../common/logger.hpp"
#include "../common/socket_utils.hpp"
#include "../common/session_pool.hpp"
#include <sys/socket.h>
#include <unistd.h>

ServerMode::ServerMode(const std::string& socketPath, Handler handler, int maxSessions)
    : socketPath_(socketPath), handler_(std::move(handler)), maxSessions_(maxSessions), serverSocket_(-1),
      activeClients_(0), sessionsServed_(0), stopping_(false) {}

ServerMode::~ServerMode() {
    if (serverSocket_ >= 0) {
        SocketUtils::closeSocket(serverSocket_);
        ::unlink(socketPath_.c_str());
    }
}

Result<void> ServerMode::startServer() {
    Result<void> ready = setupSocket();
    if (!ready.success) return ready;
    acceptConnections();
    {
        std::lock_guard<std::mutex> guard(mtx_);
        SocketUtils::closeSocket(serverSocket_);
    }
    ::unlink(socketPath_.c_str());
    return Result<void>::Ok();
}

void ServerMode::stop() {
    stopping_ = true;
    {
        std::lock_guard<std::mutex> guard(mtx_);
        // wakes a blocked accept
        if (serverSocket_ >= 0) shutdown(serverSocket_, SHUT_RDWR);
    }
    cv_.notify_all();
}

int ServerMode::sessionsServed() const {
    return sessionsServed_;
}

Result<void> ServerMode::setupSocket() {
    Result<int> listening = SocketUtils::listenUnix(socketPath_, Config::LISTEN_BACKLOG);
    if (!listening.success) return Result<void>::From(listening);
    {
        std::lock_guard<std::mutex> guard(mtx_);
        serverSocket_ = listening.data;
    }
    Logger::instance().log(LogLevel::INFO, "[Server] Listening on %s", socketPath_.c_str());
    if (stopping_) shutdown(serverSocket_, SHUT_RDWR);
    return Result<void>::Ok();
}

void ServerMode::acceptConnections() {
    SessionPool pool(static_cast<size_t>(maxSessions_), [this](int clientSocket, int sessionId) {
        runSession(clientSocket, sessionId);
    });
    int nextSessionId = 0;
    Logger::instance().log(LogLevel::DEBUG, "[Server] %zu workers ready", pool.size());

    while (!stopping_) {
        {
            std::unique_lock<std::mutex> lock(mtx_);
            cv_.wait(lock, [this]() {
                return stopping_ || activeClients_ < maxSessions_;
            });
        }
        if (stopping_) break;

        Result<int> accepted = SocketUtils::acceptConnection(serverSocket_);
        if (!accepted.success) {
            if (stopping_) break;
            Logger::instance().log(LogLevel::ERROR, "[Server] %s", accepted.message.c_str());
            continue;
        }

        int sessionId = nextSessionId++;
        activeClients_++;
        Logger::instance().log(LogLevel::INFO, "[Server] Connection accepted, session %d", sessionId);

        Result<void> queued = pool.submit(accepted.data, sessionId);
        if (!queued.success) {
            Logger::instance().log(LogLevel::ERROR, "[Server] %s", queued.message.c_str());
            activeClients_--;
        }
    }
}

void ServerMode::runSession(int clientSocket, int sessionId) {
    handler_(clientSocket, sessionId);
    sessionsServed_++;

    // this client is done now give someone other chance
    {
        std::lock_guard<std::mutex> guard(mtx_);
        activeClients_--;
    }
    cv_.notify_one();
}
