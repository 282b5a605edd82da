#pragma once
#include "frame.hpp"
#include "result.hpp"
#include <string>

// Update frame sent by the client: either the whole new content or a diff
// against the shared baseline together with the expected result size and
// checksum.
struct UpdatePayload {
    bool differential = false;
    std::string body;
    size_t filesize = 0;
    std::string checksum;   // differential only

    static UpdatePayload makeFull(const std::string& content);
    static UpdatePayload makeDifferential(const std::string& diff, const std::string& newContent);

    Frame toFrame() const;

    // Protocol errors for headers that are not parseable at all,
    // UpdateRejected for well-formed frames that cannot describe an update.
    static Result<UpdatePayload> fromFrame(const Frame& frame);
};
