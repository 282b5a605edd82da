#pragma once
#include "editor_process.hpp"
#include <sys/types.h>
#include <ctime>
#include <string>
#include <vector>

// A real editor started with fork/exec. Saves are noticed through the
// file's modification time and size.
class ExternalEditor : public EditorProcess {
public:
    explicit ExternalEditor(const std::vector<std::string>& command);
    ~ExternalEditor() override;

    Result<void> start(const std::string& path) override;
    EditorEvent poll() override;
    Result<void> terminate() override;

    bool running() const;

    // EDITOR, VISUAL, SUDO_EDITOR, then the first of sensible-editor,
    // xdg-open, nano and ed found on PATH. Empty when nothing is usable.
    static std::vector<std::string> chooseEditor();
    static std::vector<std::string> splitCommand(const std::string& command);

private:
    std::vector<std::string> command_;
    std::string path_;
    pid_t pid_;
    bool exited_;
    timespec lastModified_;
    off_t lastSize_;

    bool fileChanged();
    bool reap(bool block);
};
