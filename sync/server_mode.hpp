// Listens on a UNIX socket and runs one isolated session per accepted
// connection, at most maxSessions at a time.

#pragma once
#include "../common/config.hpp"
#include "../common/result.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>

class ServerMode {
public:
    // the handler owns clientSocket and must close it
    using Handler = std::function<void(int clientSocket, int sessionId)>;

    ServerMode(const std::string& socketPath, Handler handler, int maxSessions = Config::MAX_SESSIONS);
    ~ServerMode();

    // binds, then serves until stop(); waits for running sessions before returning
    Result<void> startServer();
    void stop();
    int sessionsServed() const;

private:
    std::string socketPath_;
    Handler handler_;
    int maxSessions_;
    int serverSocket_;
    std::atomic<int> activeClients_;
    std::atomic<int> sessionsServed_;
    std::atomic<bool> stopping_;
    std::mutex mtx_;
    std::condition_variable cv_;

    Result<void> setupSocket();
    void acceptConnections();
    void runSession(int clientSocket, int sessionId);
};
