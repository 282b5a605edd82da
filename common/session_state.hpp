#pragma once
#include "config.hpp"
#include "hash_utils.hpp"
#include <string>

enum class SessionRole { Host, Client };

// Per connection state. Each side keeps its own copy; baseContent is the
// last content both sides are known to agree on and the reference for
// every diff.
struct SessionState {
    SessionRole role;
    int protocolVersion = Config::PROTOCOL_VERSION;
    std::string filename;
    std::string baseContent;
    size_t lastAppliedFilesize = 0;
    std::string lastChecksum;

    explicit SessionState(SessionRole r) : role(r) {}

    void advance(const std::string& content) {
        baseContent = content;
        lastAppliedFilesize = content.size();
        lastChecksum = HashUtils::digest(content);
    }
};
