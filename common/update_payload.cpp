#include "update_payload.hpp"
#include "frame_codec.hpp"
#include "hash_utils.hpp"

UpdatePayload UpdatePayload::makeFull(const std::string& content) {
    UpdatePayload payload;
    payload.differential = false;
    payload.body = content;
    payload.filesize = content.size();
    return payload;
}

UpdatePayload UpdatePayload::makeDifferential(const std::string& diff, const std::string& newContent) {
    UpdatePayload payload;
    payload.differential = true;
    payload.body = diff;
    payload.filesize = newContent.size();
    payload.checksum = HashUtils::digest(newContent);
    return payload;
}

Frame UpdatePayload::toFrame() const {
    Frame frame;
    frame.set("Differential", differential ? "True" : "False");
    frame.set("Filesize", std::to_string(filesize));
    if (differential) frame.set("Checksum", checksum);
    frame.set("Size", std::to_string(body.size()));
    frame.body = body;
    return frame;
}

Result<UpdatePayload> UpdatePayload::fromFrame(const Frame& frame) {
    UpdatePayload payload;

    const std::string* differential = frame.find("Differential");
    if (differential == nullptr || *differential == "False") {
        payload.differential = false;
    } else if (*differential == "True") {
        payload.differential = true;
    } else {
        return Result<UpdatePayload>::Error(ErrorCode::Protocol,
            "Differential header must be True or False, got: " + *differential);
    }

    const std::string* filesize = frame.find("Filesize");
    if (filesize != nullptr && !FrameCodec::parseUnsigned(*filesize, payload.filesize)) {
        return Result<UpdatePayload>::Error(ErrorCode::Protocol, "Invalid Filesize header: " + *filesize);
    }
    payload.body = frame.body;

    if (!payload.differential) {
        if (filesize == nullptr) {
            payload.filesize = frame.body.size();
        } else if (payload.filesize != frame.body.size()) {
            return Result<UpdatePayload>::Error(ErrorCode::UpdateRejected,
                "Full update with Filesize " + *filesize + " but Size " + std::to_string(frame.body.size()));
        }
        return Result<UpdatePayload>::Ok(std::move(payload));
    }

    if (filesize == nullptr) {
        return Result<UpdatePayload>::Error(ErrorCode::UpdateRejected, "Differential update without Filesize");
    }
    const std::string* checksum = frame.find("Checksum");
    if (checksum == nullptr || !HashUtils::isDigest(*checksum)) {
        return Result<UpdatePayload>::Error(ErrorCode::UpdateRejected, "Differential update without a valid Checksum");
    }
    payload.checksum = *checksum;
    return Result<UpdatePayload>::Ok(std::move(payload));
}
