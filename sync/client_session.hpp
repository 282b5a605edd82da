#pragma once
#include "../common/config.hpp"
#include "../common/frame_channel.hpp"
#include "../common/result.hpp"
#include "../common/session_state.hpp"
#include "../editor/editor_process.hpp"
#include "../editor/working_copy.hpp"
#include <string>

enum class ClientState { IDLE, CONNECTED, EDITING, SENDING_UPDATE, EXITING, CLOSED };

struct ClientOptions {
    bool fullUpdates = false;       // send Differential: False frames only
    int pollIntervalMs = Config::EDITOR_POLL_INTERVAL_MS;
};

// Client end of one connection: receives the file, lets the editor work on
// a private copy and sends every saved change back to the host.
class ClientSession {
public:
    ClientSession(int socketFD, int id, EditorProcess& editor, const ClientOptions& options = ClientOptions());
    ~ClientSession();
    ClientSession(const ClientSession&) = delete;
    ClientSession& operator=(const ClientSession&) = delete;

    // Runs until the editor exits (success) or the host goes away, in which
    // case the editor is asked to terminate and ConnectionClosed is returned.
    Result<void> run();

    ClientState state() const;
    const SessionState& session() const;
    size_t updatesSent() const;
    std::string getInfo() const;

private:
    int socketFD_;
    int sessionId_;
    EditorProcess& editor_;
    ClientOptions options_;
    FrameChannel channel_;
    SessionState session_;
    ClientState state_;
    WorkingCopy workingCopy_;
    bool resyncRequested_;
    size_t updatesSent_;

    Result<void> receiveInitialFrame();
    Result<void> editLoop();
    Result<void> handleHostFrame();
    Result<void> sendUpdateIfChanged();
    void stopEditor();
    void close();
};
