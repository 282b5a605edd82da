#pragma once
#include "client_session.hpp"
#include <string>
#include <vector>

struct ClientModeOptions {
    std::string socketPath;             // empty: make a private one
    bool connect = false;               // connect once instead of listening
    std::vector<std::string> editor;    // empty: ExternalEditor::chooseEditor()
    ClientOptions session;
};

// Process driver for "remedit client". By default it listens and serves
// every host that connects, each on its own session and editor.
class ClientMode {
public:
    explicit ClientMode(const ClientModeOptions& options);
    int run();

private:
    ClientModeOptions options_;

    Result<void> serveSession(int socketFD, int sessionId) const;
    int runListening();
    int runConnected();
};
