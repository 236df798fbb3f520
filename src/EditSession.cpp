/**
 * @file EditSession.cpp
 * @brief Implementation of the edit loop
 */

#include "jpatch/EditSession.hpp"
#include "jpatch/Apply.hpp"
#include "jpatch/Diff.hpp"
#include "jpatch/Document.hpp"
#include "jpatch/Logging.hpp"
#include "jpatch/TextDiff.hpp"

namespace jpatch {

const char* state_name(EditState state) {
    switch (state) {
        case EditState::Idle: return "idle";
        case EditState::Applying: return "applying";
        case EditState::EditorRunning: return "editor-running";
        case EditState::Diffing: return "diffing";
        case EditState::Writing: return "writing";
        case EditState::WatchWaiting: return "watch-waiting";
        case EditState::Failed: return "failed";
    }
    return "unknown";
}

EditSession::EditSession(FileSystem& fs, Editor& editor, EditOptions options)
    : fs_(fs)
    , editor_(editor)
    , options_(std::move(options))
{}

EditResult EditSession::run() {
    try {
        apply_stored_patch();
        run_editor();

        if (options_.watch) {
            watch_loop();
        } else {
            diff_scratch(false);
            write_patch();
        }
        transition(EditState::Idle);
    } catch (const PatchError& e) {
        logger()->error("{}", e.what());
        result_.failure = e.what();
        transition(EditState::Failed);
    }

    // Stop a still-running editor before reporting
    process_.reset();
    watcher_.reset();

    // The editor owned the terminal until now: one summary for the session
    if (options_.watch && result_.patches_written > 0) {
        print_summary(initial_patch_text_, previous_patch_text_);
    }

    result_.state = state_;
    return result_;
}

void EditSession::transition(EditState next) {
    logger()->debug("edit: {} -> {}", state_name(state_), state_name(next));
    state_ = next;
}

bool EditSession::cancelled() const {
    return options_.cancel != nullptr && options_.cancel->load();
}

void EditSession::apply_stored_patch() {
    transition(EditState::Applying);

    base_ = parse_document(fs_.read_file(options_.input_path), options_.input_path);
    Value applied = base_;

    if (fs_.exists(options_.patch_path)) {
        previous_patch_text_ = fs_.read_file(options_.patch_path);
        initial_patch_text_ = previous_patch_text_;
        try {
            const Patch stored = parse_patch(previous_patch_text_, options_.patch_path);
            applied = apply_patch(base_, stored);
            logger()->info("applied {} operation(s) from {}", stored.size(),
                           options_.patch_path);
        } catch (const PatchError& e) {
            if (options_.apply_failure == ApplyFailurePolicy::FailFast) {
                throw;
            }
            logger()->warn("cannot apply {}: {}; editing the unpatched document",
                           options_.patch_path, e.what());
            result_.apply_error = e.what();
            applied = base_;
        }
    } else {
        logger()->info("{} does not exist yet, starting from an empty patch",
                       options_.patch_path);
    }

    fs_.write_atomic(options_.scratch_path, serialize(applied, options_.indent) + "\n");
}

void EditSession::run_editor() {
    if (options_.watch) {
        // Register before the editor can save for the first time
        watcher_ = fs_.watch(options_.scratch_path);
    }

    transition(EditState::EditorRunning);

    if (options_.watch) {
        process_ = editor_.launch(options_.scratch_path);
    } else {
        editor_.run(options_.scratch_path);
    }
}

void EditSession::watch_loop() {
    transition(EditState::WatchWaiting);

    while (!cancelled()) {
        const bool editor_done = process_->finished();

        if (!editor_done) {
            const WatchEvent event = watcher_->wait(options_.poll_interval);
            if (event == WatchEvent::Timeout) {
                continue;
            }
            if (event == WatchEvent::Removed) {
                throw IoError(options_.scratch_path, "scratch file was removed");
            }
        }

        if (diff_scratch(true)) {
            write_patch();
        }

        if (editor_done) {
            logger()->info("editor exited");
            return;
        }
        transition(EditState::WatchWaiting);
    }

    logger()->info("watch cancelled; last written patch kept");
}

bool EditSession::diff_scratch(bool tolerate_parse_errors) {
    transition(EditState::Diffing);

    const std::string text = fs_.read_file(options_.scratch_path);
    Value edited;
    try {
        edited = parse_document(text, options_.scratch_path);
    } catch (const ParseError& e) {
        if (!tolerate_parse_errors) {
            throw;
        }
        logger()->warn("{}; waiting for the next save", e.what());
        return false;
    }

    pending_ = diff(base_, edited);
    return true;
}

void EditSession::write_patch() {
    transition(EditState::Writing);

    const std::string text = serialize_patch(pending_, options_.indent) + "\n";
    fs_.write_atomic(options_.patch_path, text);

    ++result_.patches_written;
    result_.patch = pending_;
    logger()->info("wrote {} operation(s) to {}", pending_.size(), options_.patch_path);

    if (!options_.watch) {
        print_summary(previous_patch_text_, text);
    }
    previous_patch_text_ = text;
}

void EditSession::print_summary(const std::string& before, const std::string& after) {
    if (options_.summary == nullptr) {
        return;
    }
    print_line_diff(*options_.summary, group_hunks(diff_lines(before, after)),
                    options_.color);
}

} // namespace jpatch
