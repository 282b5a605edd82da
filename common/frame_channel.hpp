#pragma once
#include "frame.hpp"
#include "result.hpp"
#include <string>

// Frame level reads and writes on a connected stream socket.
// Bytes received past the end of one frame stay buffered for the next.
class FrameChannel {
public:
    explicit FrameChannel(int socketFD);

    // ConnectionClosed when the peer closed cleanly between frames,
    // IncompleteFrame when it closed inside one (the partial bytes are dropped).
    Result<Frame> readFrame();
    Result<void> sendFrame(const Frame& frame);

    bool hasBufferedData() const;

private:
    int socketFD_;
    std::string buffer_;

    Result<void> sendAll(const void* buffer, size_t length);
};
