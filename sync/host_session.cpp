#include "host_session.hpp"
#include "../common/config.hpp"
#include "../common/hash_utils.hpp"
#include "../common/logger.hpp"
#include "../common/socket_utils.hpp"
#include "../destination/diff_applier.hpp"

namespace {

std::string baseName(const std::string& path) {
    size_t slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace

HostSession::HostSession(int socketFD, const std::string& filePath, int id)
    : socketFD_(socketFD), sessionId_(id), file_(filePath), channel_(socketFD),
      session_(SessionRole::Host), state_(HostState::IDLE), updatesApplied_(0), updatesRejected_(0) {}

HostSession::~HostSession() {
    close();
}

HostState HostSession::state() const {
    return state_;
}

const SessionState& HostSession::session() const {
    return session_;
}

size_t HostSession::updatesApplied() const {
    return updatesApplied_;
}

size_t HostSession::updatesRejected() const {
    return updatesRejected_;
}

std::string HostSession::getInfo() const {
    return "[Host " + std::to_string(sessionId_) + "] " + file_.path() +
           (state_ == HostState::CLOSED ? " [CLOSED]" : " [OPEN]");
}

Result<void> HostSession::run() {
    if (state_ != HostState::IDLE) {
        return Result<void>::Error(ErrorCode::Protocol, "Host session already ran");
    }
    state_ = HostState::CONNECTED;

    Result<void> sent = sendInitialFrame();
    if (!sent.success) {
        Logger::instance().log(LogLevel::ERROR, "[Host %d] Failed to send %s: %s",
            sessionId_, file_.path().c_str(), sent.message.c_str());
        close();
        return sent;
    }
    state_ = HostState::AWAITING_UPDATE;

    for (;;) {
        Result<Frame> frame = channel_.readFrame();
        if (!frame.success) {
            if (frame.code == ErrorCode::ConnectionClosed) {
                Logger::instance().log(LogLevel::INFO, "[Host %d] Client closed the connection", sessionId_);
                close();
                return Result<void>::Ok();
            }
            if (frame.code == ErrorCode::IncompleteFrame) {
                Logger::instance().log(LogLevel::WARN, "[Host %d] Discarding partial update: %s",
                    sessionId_, frame.message.c_str());
                close();
                return Result<void>::Ok();
            }
            Logger::instance().log(LogLevel::ERROR, "[Host %d] Aborting session: %s",
                sessionId_, frame.message.c_str());
            close();
            return Result<void>::From(frame);
        }

        Result<void> applied = applyUpdate(frame.data);
        if (applied.success) continue;

        if (applied.code == ErrorCode::Protocol || applied.code == ErrorCode::Io) {
            Logger::instance().log(LogLevel::ERROR, "[Host %d] Aborting session: %s",
                sessionId_, applied.message.c_str());
            close();
            return applied;
        }
        ++updatesRejected_;
        Logger::instance().log(LogLevel::WARN, "[Host %d] Rejected update (%s): %s",
            sessionId_, errorCodeName(applied.code), applied.message.c_str());
        requestResync(applied.message);
    }
}

Result<void> HostSession::sendInitialFrame() {
    Result<std::string> content = file_.read();
    if (!content.success) return Result<void>::From(content);

    session_.filename = baseName(file_.path());
    Frame frame;
    frame.set("Version", std::to_string(Config::PROTOCOL_VERSION));
    frame.set("Filename", session_.filename);
    frame.set("Filesize", std::to_string(content.data.size()));
    frame.set("Size", std::to_string(content.data.size()));
    frame.body = content.data;

    Result<void> sent = channel_.sendFrame(frame);
    if (!sent.success) return sent;

    session_.advance(content.data);
    Logger::instance().log(LogLevel::INFO, "[Host %d] Sent %s (%zu bytes)",
        sessionId_, session_.filename.c_str(), content.data.size());
    return Result<void>::Ok();
}

Result<std::string> HostSession::reconstruct(const UpdatePayload& payload) const {
    if (!payload.differential) return Result<std::string>::Ok(payload.body);

    DiffApplier applier(session_.baseContent);
    Result<std::string> patched = applier.apply(payload.body);
    if (!patched.success) return patched;

    if (patched.data.size() != payload.filesize) {
        return Result<std::string>::Error(ErrorCode::ChecksumMismatch,
            "Patched content is " + std::to_string(patched.data.size()) +
            " bytes, Filesize says " + std::to_string(payload.filesize));
    }
    if (!HashUtils::verify(patched.data, payload.checksum)) {
        return Result<std::string>::Error(ErrorCode::ChecksumMismatch,
            "Patched content does not match Checksum " + payload.checksum);
    }
    return patched;
}

Result<void> HostSession::applyUpdate(const Frame& frame) {
    Result<UpdatePayload> payload = UpdatePayload::fromFrame(frame);
    if (!payload.success) return Result<void>::From(payload);

    Result<std::string> content = reconstruct(payload.data);
    if (!content.success) return Result<void>::From(content);

    Result<void> written = file_.write(content.data);
    if (!written.success) return written;

    session_.advance(content.data);
    ++updatesApplied_;
    Logger::instance().log(LogLevel::INFO, "[Host %d] Applied %s update, %s is now %zu bytes", sessionId_,
        payload.data.differential ? "differential" : "full",
        session_.filename.c_str(), session_.lastAppliedFilesize);
    return Result<void>::Ok();
}

// the client answers with a full update, which re-establishes the baseline
void HostSession::requestResync(const std::string& reason) {
    Frame frame;
    frame.set("Resync", "True");
    Result<void> sent = channel_.sendFrame(frame);
    if (!sent.success) {
        Logger::instance().log(LogLevel::WARN, "[Host %d] Could not request resync after \"%s\": %s",
            sessionId_, reason.c_str(), sent.message.c_str());
        return;
    }
    Logger::instance().log(LogLevel::DEBUG, "[Host %d] Requested full resync", sessionId_);
}

void HostSession::close() {
    if (state_ == HostState::CLOSED) return;
    SocketUtils::closeSocket(socketFD_);
    if (state_ != HostState::IDLE) {
        Logger::instance().log(LogLevel::DEBUG, "[Host %d] Closed after %zu applied and %zu rejected updates",
            sessionId_, updatesApplied_, updatesRejected_);
    }
    state_ = HostState::CLOSED;
}
