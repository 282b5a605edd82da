#pragma once
#include "result.hpp"
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

// Fixed set of workers for accepted connections. A connection runs to
// completion on one worker; destruction finishes the queued ones first.
class SessionPool {
public:
    using SessionTask = std::function<void(int clientSocket, int sessionId)>;

    SessionPool(size_t workers, SessionTask task);
    ~SessionPool();
    SessionPool(const SessionPool&) = delete;
    SessionPool& operator=(const SessionPool&) = delete;

    // the pool owns clientSocket from here on, also when this fails
    Result<void> submit(int clientSocket, int sessionId);
    size_t size() const;

private:
    struct PendingSession {
        int clientSocket;
        int sessionId;
    };

    SessionTask task_;
    std::vector<std::thread> workers_;
    std::queue<PendingSession> pending_;

    std::mutex queueMutex_;
    std::condition_variable condition_;
    bool stop_ = false;

    void workerLoop();
};
