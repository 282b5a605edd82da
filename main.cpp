#include "common/config.hpp"
#include "common/logger.hpp"
#include "editor/external_editor.hpp"
#include "sync/client_mode.hpp"
#include "sync/host_mode.hpp"
#include <sys/stat.h>
#include <iostream>
#include <string>

static void printUsage() {
    std::cerr << "Usage:\n"
              << "  remedit host   [-d] -a SOCKET [--listen] FILE\n"
              << "  remedit client [-d] [-a SOCKET] [--connect] [--full] [-e EDITOR]\n"
              << "\n"
              << "  -a SOCKET    socket address (client default: a fresh private socket)\n"
              << "  --listen     host waits for the client instead of connecting to it\n"
              << "  --connect    client connects to a listening host instead of serving\n"
              << "  --full       client sends whole files instead of diffs\n"
              << "  -e EDITOR    editor command (default: $EDITOR, $VISUAL, ...)\n"
              << "  -d           debug logging\n";
}

int main(int argc, char** argv) {

    if (argc < 2) {
        printUsage();
        return 1;
    }

    std::string mode = argv[1];
    HostOptions host;
    ClientModeOptions client;
    bool debug = false;

    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        auto next = [&](int& i) -> const char* {
            if (i + 1 < argc) return argv[++i];
            return nullptr;
        };
        if (a == "-d" || a == "--debug") {
            debug = true;
        } else if (a == "-a" || a == "--socketaddress") {
            const char* value = next(i);
            if (!value) {
                std::cerr << "missing value for " << a << "\n";
                return 1;
            }
            host.socketPath = client.socketPath = value;
        } else if (a == "-e" || a == "--editor") {
            const char* value = next(i);
            if (!value) {
                std::cerr << "missing value for " << a << "\n";
                return 1;
            }
            client.editor = ExternalEditor::splitCommand(value);
        } else if (a == "--listen" && mode == "host") {
            host.listen = true;
        } else if (a == "--connect" && mode == "client") {
            client.connect = true;
        } else if (a == "--full" && mode == "client") {
            client.session.fullUpdates = true;
        } else if (mode == "host" && host.filePath.empty() && !a.empty() && a[0] != '-') {
            host.filePath = a;
        } else {
            std::cerr << "Unknown argument: " << a << "\n";
            printUsage();
            return 1;
        }
    }

    Logger::instance().setLevel(debug ? LogLevel::DEBUG : LogLevel::INFO);
    umask(Config::USER_ONLY_UMASK);

    if (mode == "host") {
        if (host.filePath.empty() || host.socketPath.empty()) {
            printUsage();
            return 1;
        }
        HostMode hostMode(host);
        return hostMode.run();
    }
    if (mode == "client") {
        ClientMode clientMode(client);
        return clientMode.run();
    }

    printUsage();
    return 1;
}
