/**
 * @file EditSession.hpp
 * @brief Interactive patch editing: apply, edit, re-diff, write
 *
 * A session applies the stored patch to the input document, writes the
 * result to a scratch file, lets the user edit it with an external editor
 * and stores diff(input, edited scratch) as the new patch.
 *
 * States:
 *
 *     Idle -> Applying -> EditorRunning -> Diffing -> Writing -> Idle
 *                                |                      |
 *                                |  (watch mode)        v
 *                                +----------------> WatchWaiting -> Diffing ...
 *
 * Any state may end in Failed. In watch mode the editor runs detached and
 * every save of the scratch file re-enters Diffing; the session ends when
 * the editor exits (after one last re-diff) or when cancelled.
 */

#ifndef JPATCH_EDITSESSION_HPP
#define JPATCH_EDITSESSION_HPP

#include "jpatch/Value.hpp"
#include "jpatch/Patch.hpp"
#include "jpatch/FileSystem.hpp"
#include "jpatch/Editor.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

namespace jpatch {

enum class EditState {
    Idle,
    Applying,
    EditorRunning,
    Diffing,
    Writing,
    WatchWaiting,
    Failed
};

const char* state_name(EditState state);

/**
 * @brief What to do when the stored patch cannot be applied
 */
enum class ApplyFailurePolicy {
    EditBase,  ///< Report the error and edit the unpatched input
    FailFast   ///< Stop the session
};

struct EditOptions {
    std::string input_path;
    std::string patch_path;
    std::string scratch_path;
    bool watch = false;
    ApplyFailurePolicy apply_failure = ApplyFailurePolicy::EditBase;

    /// Longest wait on the watcher before checking for cancellation and
    /// editor exit
    std::chrono::milliseconds poll_interval{200};

    /// Indentation of the written scratch and patch files
    int indent = 2;

    /// Set asynchronously (e.g. from a SIGINT handler) to stop watch mode
    const std::atomic<bool>* cancel = nullptr;

    /// If set, receives a line diff of the patch file: after the write in
    /// single-shot mode, once after the editor has exited in watch mode
    std::ostream* summary = nullptr;
    bool color = false;
};

struct EditResult {
    EditState state = EditState::Idle;
    std::size_t patches_written = 0;

    /// Last patch written to the patch file
    Patch patch;

    /// Why the stored patch was not applied (EditBase policy)
    std::optional<std::string> apply_error;

    /// Why the session failed (state == Failed)
    std::optional<std::string> failure;
};

class EditSession {
public:
    EditSession(FileSystem& fs, Editor& editor, EditOptions options);

    /**
     * @brief Run the session to completion
     *
     * Errors from the document, patch, file system and editor are reported
     * in the result (state Failed), never thrown.
     */
    EditResult run();

    EditState state() const noexcept { return state_; }

private:
    FileSystem& fs_;
    Editor& editor_;
    EditOptions options_;

    EditState state_ = EditState::Idle;
    Value base_;
    Patch pending_;
    std::string initial_patch_text_;
    std::string previous_patch_text_;
    std::unique_ptr<FileWatcher> watcher_;
    std::unique_ptr<EditorProcess> process_;
    EditResult result_;

    void transition(EditState next);
    bool cancelled() const;

    void apply_stored_patch();
    void run_editor();
    void watch_loop();

    /**
     * @brief Re-read the scratch file and diff it against the input
     * @param tolerate_parse_errors Log and return false instead of throwing
     *        when the scratch file is not valid JSON
     */
    bool diff_scratch(bool tolerate_parse_errors);
    void write_patch();
    void print_summary(const std::string& before, const std::string& after);
};

} // namespace jpatch

#endif // JPATCH_EDITSESSION_HPP
