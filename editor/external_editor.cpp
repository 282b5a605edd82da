#include "external_editor.hpp"
#include "../common/config.hpp"
#include "../common/logger.hpp"
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <thread>

ExternalEditor::ExternalEditor(const std::vector<std::string>& command)
    : command_(command), pid_(-1), exited_(false), lastModified_{}, lastSize_(0) {}

ExternalEditor::~ExternalEditor() {
    if (running()) reap(false);
}

std::vector<std::string> ExternalEditor::splitCommand(const std::string& command) {
    std::istringstream iss(command);
    std::vector<std::string> words;
    std::string word;
    while (iss >> word) words.push_back(word);
    return words;
}

std::vector<std::string> ExternalEditor::chooseEditor() {
    for (const char* variable : {"EDITOR", "VISUAL", "SUDO_EDITOR"}) {
        const char* value = std::getenv(variable);
        if (value == nullptr || *value == '\0') continue;
        // pointing the editor back at ourselves would loop
        if (std::strstr(value, "remedit") != nullptr) break;
        Logger::instance().log(LogLevel::DEBUG, "Chosen editor from %s: %s", variable, value);
        return splitCommand(value);
    }

    const char* pathEnv = std::getenv("PATH");
    std::vector<std::string> dirs = {"/usr/bin", "/bin"};
    if (pathEnv != nullptr) {
        dirs.clear();
        std::stringstream ss(pathEnv);
        std::string dir;
        while (std::getline(ss, dir, ':')) {
            if (!dir.empty()) dirs.push_back(dir);
        }
    }
    for (const char* candidate : {"sensible-editor", "xdg-open", "nano", "ed"}) {
        for (const std::string& dir : dirs) {
            std::string full = dir + "/" + candidate;
            if (access(full.c_str(), X_OK) == 0) {
                Logger::instance().log(LogLevel::DEBUG, "Chosen editor: %s", full.c_str());
                return {full};
            }
        }
    }
    return {};
}

Result<void> ExternalEditor::start(const std::string& path) {
    if (command_.empty()) {
        return Result<void>::Error(ErrorCode::Editor, "No editor command configured");
    }
    path_ = path;
    struct stat st{};
    if (stat(path_.c_str(), &st) == 0) {
        lastModified_ = st.st_mtim;
        lastSize_ = st.st_size;
    }

    std::vector<char*> argv;
    for (std::string& arg : command_) argv.push_back(&arg[0]);
    argv.push_back(&path_[0]);
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        return Result<void>::Error(ErrorCode::Editor, std::string("fork failed: ") + std::strerror(errno));
    }
    if (pid == 0) {
        execvp(argv[0], argv.data());
        _exit(127);
    }
    pid_ = pid;
    exited_ = false;
    Logger::instance().log(LogLevel::DEBUG, "Started editor %s (pid %d) on %s",
        command_[0].c_str(), static_cast<int>(pid_), path_.c_str());
    return Result<void>::Ok();
}

bool ExternalEditor::running() const {
    return pid_ > 0 && !exited_;
}

bool ExternalEditor::fileChanged() {
    struct stat st{};
    if (stat(path_.c_str(), &st) != 0) return false;
    bool changed = st.st_mtim.tv_sec != lastModified_.tv_sec ||
                   st.st_mtim.tv_nsec != lastModified_.tv_nsec ||
                   st.st_size != lastSize_;
    lastModified_ = st.st_mtim;
    lastSize_ = st.st_size;
    return changed;
}

bool ExternalEditor::reap(bool block) {
    int status = 0;
    pid_t done;
    do {
        done = waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (done < 0 && errno == EINTR);
    if (done == pid_ || (done < 0 && errno == ECHILD)) {
        exited_ = true;
        if (done == pid_ && WIFEXITED(status) && WEXITSTATUS(status) == 127) {
            Logger::instance().log(LogLevel::WARN, "Editor %s could not be started", command_[0].c_str());
        }
        return true;
    }
    return false;
}

EditorEvent ExternalEditor::poll() {
    if (pid_ <= 0) return EditorEvent::EXITED;
    if (fileChanged()) return EditorEvent::SAVED;
    if (exited_ || reap(false)) return EditorEvent::EXITED;
    return EditorEvent::NONE;
}

Result<void> ExternalEditor::terminate() {
    if (!running()) return Result<void>::Ok();
    if (kill(pid_, SIGTERM) != 0 && errno != ESRCH) {
        return Result<void>::Error(ErrorCode::Editor, std::string("Failed to signal editor: ") + std::strerror(errno));
    }

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(Config::EDITOR_TERMINATE_GRACE_MS);
    while (std::chrono::steady_clock::now() < deadline) {
        if (reap(false)) return Result<void>::Ok();
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return Result<void>::Error(ErrorCode::Editor,
        "Editor (pid " + std::to_string(pid_) + ") did not exit after termination request");
}
