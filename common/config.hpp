// config.hpp
#pragma once
#include <cstddef>

namespace Config {
    inline constexpr int PROTOCOL_VERSION = 1;
    inline constexpr size_t BUFFER_SIZE = 4096;                        // socket read size
    inline constexpr size_t MAX_HEADER_BLOCK = 64 * 1024;              // bytes before the blank line
    inline constexpr size_t MAX_BODY_SIZE = 1024UL * 1024 * 1024;      // 1 GiB per frame body
    inline constexpr size_t DIFF_CONTEXT_LINES = 3;
    inline constexpr long DIFF_MAX_EDIT_COST = 1024;                   // myers gives up past this many edits
    inline constexpr int EDITOR_POLL_INTERVAL_MS = 200;
    inline constexpr int EDITOR_TERMINATE_GRACE_MS = 3000;
    inline constexpr int MAX_SESSIONS = 3;
    inline constexpr int LISTEN_BACKLOG = 8;
    inline constexpr unsigned USER_ONLY_UMASK = 0177;
}
