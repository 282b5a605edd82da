#pragma once
#include <string>
#include <utility>
#include <vector>

// One header block plus body as it travels over the socket.
// Header order is preserved, names are unique.
struct Frame {
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    const std::string* find(const std::string& name) const {
        for (const auto& header : headers) {
            if (header.first == name) return &header.second;
        }
        return nullptr;
    }

    bool has(const std::string& name) const {
        return find(name) != nullptr;
    }

    // replaces the value in place when the header exists
    void set(const std::string& name, const std::string& value) {
        for (auto& header : headers) {
            if (header.first == name) {
                header.second = value;
                return;
            }
        }
        headers.emplace_back(name, value);
    }

    bool operator==(const Frame& other) const {
        return headers == other.headers && body == other.body;
    }
};
