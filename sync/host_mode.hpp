#pragma once
#include <string>

struct HostOptions {
    std::string socketPath;
    std::string filePath;
    bool listen = false;    // wait for the client instead of connecting to it
};

// Process driver for "remedit host": sets up the one connection and runs
// a HostSession on it. Returns the process exit status.
class HostMode {
public:
    explicit HostMode(const HostOptions& options);
    int run();

private:
    HostOptions options_;

    int connectToClient();
    int acceptClient();
};
