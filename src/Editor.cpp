/**
 * @file Editor.cpp
 * @brief Child-process editor implementation
 */

#include "jpatch/Editor.hpp"
#include "jpatch/Logging.hpp"

#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>

#include <spawn.h>
#include <sys/wait.h>

extern char** environ;

namespace jpatch {

namespace {

/**
 * @brief Describe a waitpid() status for error messages
 * @return Empty string for a successful exit
 */
std::string describe_status(int status) {
    if (WIFEXITED(status)) {
        const int code = WEXITSTATUS(status);
        return code == 0 ? std::string() : "exited with status " + std::to_string(code);
    }
    if (WIFSIGNALED(status)) {
        return std::string("killed by signal ") + std::to_string(WTERMSIG(status));
    }
    return "terminated abnormally";
}

/**
 * @brief Editor launched without waiting; reaped by finished() or on destruction
 */
class ChildEditorProcess : public EditorProcess {
public:
    ChildEditorProcess(std::string command, pid_t pid)
        : command_(std::move(command))
        , pid_(pid)
    {}

    ~ChildEditorProcess() override {
        if (pid_ <= 0) {
            return;
        }
        // Loop ended first (interrupt or failure): do not leave the editor
        // holding the terminal
        ::kill(pid_, SIGTERM);
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
    }

    ChildEditorProcess(const ChildEditorProcess&) = delete;
    ChildEditorProcess& operator=(const ChildEditorProcess&) = delete;

    bool finished() override {
        if (pid_ <= 0) {
            return true;
        }

        int status = 0;
        const pid_t rc = ::waitpid(pid_, &status, WNOHANG);
        if (rc == 0) {
            return false;
        }
        if (rc < 0) {
            if (errno == EINTR) {
                return false;
            }
            throw EditorError(command_, std::string("waitpid: ") + std::strerror(errno));
        }

        pid_ = -1;
        const std::string problem = describe_status(status);
        if (!problem.empty()) {
            throw EditorError(command_, problem);
        }
        return true;
    }

private:
    std::string command_;
    pid_t pid_;
};

} // anonymous namespace

std::vector<std::string> split_command(const std::string& command) {
    std::vector<std::string> words;
    std::string current;
    bool in_word = false;
    char quote = '\0';

    for (char c : command) {
        if (quote != '\0') {
            if (c == quote) {
                quote = '\0';
            } else {
                current += c;
            }
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
            in_word = true;
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (in_word) {
                words.push_back(current);
                current.clear();
                in_word = false;
            }
            continue;
        }
        current += c;
        in_word = true;
    }

    if (in_word) {
        words.push_back(current);
    }
    return words;
}

ProcessEditor::ProcessEditor(std::string command)
    : command_(std::move(command))
    , words_(split_command(command_))
{
    if (words_.empty()) {
        throw EditorError(command_, "empty editor command");
    }
}

pid_t ProcessEditor::spawn(const std::string& path) const {
    std::vector<std::string> args = words_;
    args.push_back(path);

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    logger()->debug("spawning editor: {} {}", command_, path);

    pid_t pid = 0;
    const int rc = ::posix_spawnp(&pid, argv[0], nullptr, nullptr, argv.data(), environ);
    if (rc != 0) {
        throw EditorError(command_, std::string("cannot start: ") + std::strerror(rc));
    }
    return pid;
}

void ProcessEditor::run(const std::string& path) {
    const pid_t pid = spawn(path);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw EditorError(command_, std::string("waitpid: ") + std::strerror(errno));
        }
    }

    const std::string problem = describe_status(status);
    if (!problem.empty()) {
        throw EditorError(command_, problem);
    }
}

std::unique_ptr<EditorProcess> ProcessEditor::launch(const std::string& path) {
    return std::make_unique<ChildEditorProcess>(command_, spawn(path));
}

} // namespace jpatch
