/**
 * @file Editor.hpp
 * @brief Launching the external editor on the scratch file
 */

#ifndef JPATCH_EDITOR_HPP
#define JPATCH_EDITOR_HPP

#include "jpatch/Errors.hpp"

#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>

namespace jpatch {

/**
 * @brief Handle to an editor started with Editor::launch()
 */
class EditorProcess {
public:
    virtual ~EditorProcess() = default;

    /**
     * @brief Poll without blocking
     * @return true once the editor has exited successfully
     * @throws EditorError if it exited with a non-zero status or a signal
     */
    virtual bool finished() = 0;
};

class Editor {
public:
    virtual ~Editor() = default;

    /**
     * @brief Open path in the editor and block until the editor exits
     * @throws EditorError if it cannot be started or exits unsuccessfully
     */
    virtual void run(const std::string& path) = 0;

    /**
     * @brief Open path in the editor without waiting for it
     * @throws EditorError if it cannot be started
     */
    virtual std::unique_ptr<EditorProcess> launch(const std::string& path) = 0;
};

/**
 * @brief Editor started as a child process sharing our terminal
 *
 * The command is split on whitespace (single and double quotes group
 * words), the file path is appended as the last argument and the program
 * is looked up in PATH.
 */
class ProcessEditor : public Editor {
public:
    explicit ProcessEditor(std::string command);

    const std::string& command() const noexcept { return command_; }

    void run(const std::string& path) override;
    std::unique_ptr<EditorProcess> launch(const std::string& path) override;

private:
    std::string command_;
    std::vector<std::string> words_;

    pid_t spawn(const std::string& path) const;
};

/**
 * @brief Split a command line into words
 *
 * Examples:
 * - "vim" -> ["vim"]
 * - "code --wait" -> ["code", "--wait"]
 * - "'my editor' -n" -> ["my editor", "-n"]
 */
std::vector<std::string> split_command(const std::string& command);

} // namespace jpatch

#endif // JPATCH_EDITOR_HPP
