#pragma once
#include "../common/frame_channel.hpp"
#include "../common/result.hpp"
#include "../common/session_state.hpp"
#include "../common/update_payload.hpp"
#include "../destination/destination_file.hpp"
#include <string>

enum class HostState { IDLE, CONNECTED, AWAITING_UPDATE, CLOSED };

// Host end of one connection: sends the file, then applies every update
// the client sends until the connection goes away. Only fully received and
// verified updates ever reach the disk.
class HostSession {
public:
    HostSession(int socketFD, const std::string& filePath, int id);
    ~HostSession();
    HostSession(const HostSession&) = delete;
    HostSession& operator=(const HostSession&) = delete;

    // Runs the session to the end. A peer close, clean or mid-frame, ends
    // it successfully; protocol and disk errors end it with an error.
    Result<void> run();

    HostState state() const;
    const SessionState& session() const;
    size_t updatesApplied() const;
    size_t updatesRejected() const;
    std::string getInfo() const;

private:
    int socketFD_;
    int sessionId_;
    DestinationFile file_;
    FrameChannel channel_;
    SessionState session_;
    HostState state_;
    size_t updatesApplied_;
    size_t updatesRejected_;

    Result<void> sendInitialFrame();
    Result<void> applyUpdate(const Frame& frame);
    Result<std::string> reconstruct(const UpdatePayload& payload) const;
    void requestResync(const std::string& reason);
    void close();
};
