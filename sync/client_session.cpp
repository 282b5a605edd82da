#include "client_session.hpp"
#include "../common/logger.hpp"
#include "../common/socket_utils.hpp"
#include "../common/update_payload.hpp"
#include "../source/diff_generator.hpp"

namespace {

bool plainFilename(const std::string& name) {
    return !name.empty() && name != "." && name != ".." &&
           name.find('/') == std::string::npos && name.find('\0') == std::string::npos;
}

} // namespace

ClientSession::ClientSession(int socketFD, int id, EditorProcess& editor, const ClientOptions& options)
    : socketFD_(socketFD), sessionId_(id), editor_(editor), options_(options), channel_(socketFD),
      session_(SessionRole::Client), state_(ClientState::IDLE), resyncRequested_(false), updatesSent_(0) {}

ClientSession::~ClientSession() {
    close();
}

ClientState ClientSession::state() const {
    return state_;
}

const SessionState& ClientSession::session() const {
    return session_;
}

size_t ClientSession::updatesSent() const {
    return updatesSent_;
}

std::string ClientSession::getInfo() const {
    return "[Session " + std::to_string(sessionId_) + "] " + session_.filename +
           (state_ == ClientState::CLOSED ? " [CLOSED]" : " [OPEN]");
}

Result<void> ClientSession::run() {
    if (state_ != ClientState::IDLE) {
        return Result<void>::Error(ErrorCode::Protocol, "Client session already ran");
    }

    Result<void> received = receiveInitialFrame();
    if (!received.success) {
        Logger::instance().log(LogLevel::ERROR, "[Session %d] Dropping connection: %s",
            sessionId_, received.message.c_str());
        close();
        return received;
    }
    state_ = ClientState::CONNECTED;

    Result<void> created = workingCopy_.create(session_.filename, session_.baseContent);
    if (!created.success) {
        Logger::instance().log(LogLevel::ERROR, "[Session %d] %s", sessionId_, created.message.c_str());
        close();
        return created;
    }
    Result<void> started = editor_.start(workingCopy_.path());
    if (!started.success) {
        Logger::instance().log(LogLevel::ERROR, "[Session %d] %s", sessionId_, started.message.c_str());
        close();
        return started;
    }

    Result<void> result = editLoop();
    close();
    return result;
}

Result<void> ClientSession::receiveInitialFrame() {
    Result<Frame> frame = channel_.readFrame();
    if (!frame.success) return Result<void>::From(frame);

    const std::string* version = frame.data.find("Version");
    if (version == nullptr || *version != std::to_string(Config::PROTOCOL_VERSION)) {
        return Result<void>::Error(ErrorCode::UnsupportedVersion,
            "Unsupported protocol version: " + (version ? *version : std::string("<none>")));
    }
    const std::string* filename = frame.data.find("Filename");
    if (filename == nullptr || !plainFilename(*filename)) {
        return Result<void>::Error(ErrorCode::Protocol,
            "Initial frame needs a plain Filename, got: " + (filename ? *filename : std::string("<none>")));
    }
    const std::string* filesize = frame.data.find("Filesize");
    if (filesize != nullptr && *filesize != std::to_string(frame.data.body.size())) {
        return Result<void>::Error(ErrorCode::Protocol,
            "Filesize " + *filesize + " does not match " + std::to_string(frame.data.body.size()) + " body bytes");
    }

    session_.protocolVersion = Config::PROTOCOL_VERSION;
    session_.filename = *filename;
    session_.advance(frame.data.body);
    Logger::instance().log(LogLevel::INFO, "[Session %d] Received %s (%zu bytes)",
        sessionId_, session_.filename.c_str(), session_.baseContent.size());
    return Result<void>::Ok();
}

Result<void> ClientSession::editLoop() {
    state_ = ClientState::EDITING;
    for (;;) {
        Result<bool> readable = SocketUtils::waitReadable(socketFD_, options_.pollIntervalMs);
        if (!readable.success) {
            stopEditor();
            return Result<void>::From(readable);
        }
        if (readable.data || channel_.hasBufferedData()) {
            Result<void> handled = handleHostFrame();
            if (!handled.success) {
                stopEditor();
                return handled;
            }
        }

        EditorEvent event = editor_.poll();
        if (event == EditorEvent::NONE) continue;

        if (event == EditorEvent::EXITED) {
            state_ = ClientState::EXITING;
            Logger::instance().log(LogLevel::DEBUG, "[Session %d] Editor exited", sessionId_);
        }
        Result<void> sent = sendUpdateIfChanged();
        if (!sent.success) {
            Logger::instance().log(LogLevel::WARN, "[Session %d] Update not delivered: %s",
                sessionId_, sent.message.c_str());
            stopEditor();
            return sent;
        }
        if (state_ == ClientState::EXITING) return Result<void>::Ok();
    }
}

Result<void> ClientSession::handleHostFrame() {
    Result<Frame> frame = channel_.readFrame();
    if (!frame.success) {
        if (frame.code == ErrorCode::Protocol) return Result<void>::From(frame);
        Logger::instance().log(LogLevel::WARN, "[Session %d] Host closed the connection while editing", sessionId_);
        return Result<void>::Error(ErrorCode::ConnectionClosed, "Host closed the connection: " + frame.message);
    }

    const std::string* resync = frame.data.find("Resync");
    if (resync != nullptr && *resync == "True") {
        Logger::instance().log(LogLevel::INFO, "[Session %d] Host rejected an update, next one is sent in full",
            sessionId_);
        resyncRequested_ = true;
        return Result<void>::Ok();
    }
    return Result<void>::Error(ErrorCode::Protocol, "Unexpected frame from host while editing");
}

Result<void> ClientSession::sendUpdateIfChanged() {
    Result<std::string> content = workingCopy_.read();
    if (!content.success) {
        // the editor is gone, so this was the last chance to send its edit
        if (state_ == ClientState::EXITING) return Result<void>::From(content);
        Logger::instance().log(LogLevel::WARN, "[Session %d] Cannot read working copy: %s",
            sessionId_, content.message.c_str());
        return Result<void>::Ok();
    }
    // after a resync the host still holds an older baseline than ours
    if (content.data == session_.baseContent && !resyncRequested_) {
        Logger::instance().log(LogLevel::DEBUG, "[Session %d] No changes to send", sessionId_);
        return Result<void>::Ok();
    }

    ClientState resume = state_;
    state_ = ClientState::SENDING_UPDATE;
    UpdatePayload payload;
    if (options_.fullUpdates || resyncRequested_) {
        payload = UpdatePayload::makeFull(content.data);
    } else {
        DiffGenerator generator(session_.baseContent, content.data);
        payload = UpdatePayload::makeDifferential(generator.getDiff(), content.data);
    }

    Result<void> sent = channel_.sendFrame(payload.toFrame());
    state_ = resume;
    if (!sent.success) return sent;

    session_.advance(content.data);
    resyncRequested_ = false;
    ++updatesSent_;
    Logger::instance().log(LogLevel::INFO, "[Session %d] Sent %s update (%zu bytes)", sessionId_,
        payload.differential ? "differential" : "full", payload.body.size());
    return Result<void>::Ok();
}

void ClientSession::stopEditor() {
    Result<void> stopped = editor_.terminate();
    if (!stopped.success) {
        Logger::instance().log(LogLevel::WARN, "[Session %d] %s", sessionId_, stopped.message.c_str());
    }
}

void ClientSession::close() {
    if (state_ == ClientState::CLOSED) return;
    SocketUtils::closeSocket(socketFD_);
    workingCopy_.remove();
    state_ = ClientState::CLOSED;
    Logger::instance().log(LogLevel::DEBUG, "[Session %d] Connection closed after %zu updates",
        sessionId_, updatesSent_);
}
