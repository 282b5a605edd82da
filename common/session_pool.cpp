#include "session_pool.hpp"
#include "socket_utils.hpp"

SessionPool::SessionPool(size_t workers, SessionTask task) : task_(std::move(task)) {
    if (workers == 0) workers = 1;
    for (size_t i = 0; i < workers; ++i) {
        workers_.emplace_back([this]() { workerLoop(); });
    }
}

SessionPool::~SessionPool() {
    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        stop_ = true;
    }
    condition_.notify_all();
    for (std::thread& worker : workers_)
        worker.join();
}

Result<void> SessionPool::submit(int clientSocket, int sessionId) {
    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        if (!stop_) {
            pending_.push({clientSocket, sessionId});
            condition_.notify_one();
            return Result<void>::Ok();
        }
    }
    SocketUtils::closeSocket(clientSocket);
    return Result<void>::Error(ErrorCode::Io, "Session " + std::to_string(sessionId) + " submitted to a stopped pool");
}

size_t SessionPool::size() const {
    return workers_.size();
}

void SessionPool::workerLoop() {
    for (;;) {
        PendingSession next;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            condition_.wait(lock, [this]() {
                return stop_ || !pending_.empty();
            });

            // drain what was queued before shutting down
            if (stop_ && pending_.empty())
                return;

            next = pending_.front();
            pending_.pop();
        }

        task_(next.clientSocket, next.sessionId);
    }
}
