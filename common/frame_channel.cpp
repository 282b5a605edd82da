#include "frame_channel.hpp"
#include "config.hpp"
#include "frame_codec.hpp"
#include <sys/socket.h>
#include <cerrno>
#include <cstring>

FrameChannel::FrameChannel(int socketFD) : socketFD_(socketFD) {}

Result<void> FrameChannel::sendAll(const void* buffer, size_t length) {
    const char* data = static_cast<const char*>(buffer);
    while (length > 0) {
        ssize_t sent = send(socketFD_, data, length, MSG_NOSIGNAL);
        if (sent < 0 && errno == EINTR) continue;
        if (sent < 0) {
            return Result<void>::Error(ErrorCode::Io, std::string("Failed to send frame: ") + std::strerror(errno));
        }
        // errno is not set for a zero return
        if (sent == 0) return Result<void>::Error(ErrorCode::Io, "Failed to send frame: peer closed");
        data += sent;
        length -= sent;
    }
    return Result<void>::Ok();
}

Result<void> FrameChannel::sendFrame(const Frame& frame) {
    auto encoded = FrameCodec::encode(frame);
    if (!encoded.success) return Result<void>::From(encoded);
    return sendAll(encoded.data.data(), encoded.data.size());
}

Result<Frame> FrameChannel::readFrame() {
    char chunk[Config::BUFFER_SIZE];
    for (;;) {
        Frame frame;
        auto decoded = FrameCodec::decode(buffer_, frame);
        if (!decoded.success) {
            buffer_.clear();
            return Result<Frame>::From(decoded);
        }
        if (decoded.data > 0) {
            buffer_.erase(0, decoded.data);
            return Result<Frame>::Ok(std::move(frame));
        }

        ssize_t received = recv(socketFD_, chunk, sizeof(chunk), 0);
        if (received < 0 && errno == EINTR) continue;
        if (received < 0 && errno != ECONNRESET) {
            return Result<Frame>::Error(ErrorCode::Io,
                std::string("Failed to read from socket: ") + std::strerror(errno));
        }
        if (received <= 0) {
            if (buffer_.empty()) {
                return Result<Frame>::Error(ErrorCode::ConnectionClosed, "Peer closed the connection");
            }
            size_t partial = buffer_.size();
            buffer_.clear();
            return Result<Frame>::Error(ErrorCode::IncompleteFrame,
                "Peer closed the connection after " + std::to_string(partial) + " bytes of a frame");
        }
        buffer_.append(chunk, static_cast<size_t>(received));
    }
}

bool FrameChannel::hasBufferedData() const {
    return !buffer_.empty();
}

