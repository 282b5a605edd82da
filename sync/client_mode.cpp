#include "client_mode.hpp"
#include "server_mode.hpp"
#include "../common/logger.hpp"
#include "../common/socket_utils.hpp"
#include "../editor/external_editor.hpp"
#include <iostream>

ClientMode::ClientMode(const ClientModeOptions& options) : options_(options) {}

int ClientMode::run() {
    if (options_.editor.empty()) options_.editor = ExternalEditor::chooseEditor();
    if (options_.editor.empty()) {
        std::cerr << "No editor found. Set EDITOR or pass -e.\n";
        return 1;
    }
    return options_.connect ? runConnected() : runListening();
}

Result<void> ClientMode::serveSession(int socketFD, int sessionId) const {
    ExternalEditor editor(options_.editor);
    ClientSession session(socketFD, sessionId, editor, options_.session);
    Result<void> result = session.run();
    if (!result.success) {
        Logger::instance().log(LogLevel::WARN, "%s ended with %s: %s",
            session.getInfo().c_str(), errorCodeName(result.code), result.message.c_str());
    }
    return result;
}

int ClientMode::runConnected() {
    if (options_.socketPath.empty()) {
        std::cerr << "--connect needs a socket address (-a)\n";
        return 1;
    }
    Result<int> connected = SocketUtils::connectUnix(options_.socketPath);
    if (!connected.success) {
        Logger::instance().log(LogLevel::ERROR, "%s", connected.message.c_str());
        return 1;
    }
    return serveSession(connected.data, 0).success ? 0 : 2;
}

int ClientMode::runListening() {
    if (options_.socketPath.empty()) {
        Result<std::string> path = SocketUtils::makeSocketDirectory();
        if (!path.success) {
            Logger::instance().log(LogLevel::ERROR, "%s", path.message.c_str());
            return 1;
        }
        options_.socketPath = path.data;
    }
    std::cout << options_.socketPath << std::endl;

    ServerMode server(options_.socketPath, [this](int clientSocket, int sessionId) {
        if (!serveSession(clientSocket, sessionId).success)
            Logger::instance().log(LogLevel::DEBUG, "[Server] Session %d failed, still serving others", sessionId);
    });
    Result<void> result = server.startServer();
    if (!result.success) {
        Logger::instance().log(LogLevel::ERROR, "[Server] %s", result.message.c_str());
        return 1;
    }
    return 0;
}
