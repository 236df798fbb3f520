/**
 * @file Commands.cpp
 * @brief Implementation of the jpatch subcommands
 */

#include "jpatch/Commands.hpp"
#include "jpatch/Apply.hpp"
#include "jpatch/Diff.hpp"
#include "jpatch/Document.hpp"
#include "jpatch/EditSession.hpp"
#include "jpatch/Editor.hpp"
#include "jpatch/Errors.hpp"
#include "jpatch/FileSystem.hpp"
#include "jpatch/Patch.hpp"

namespace jpatch {

namespace {

int usage_error(std::ostream& err, const std::string& message) {
    err << "Error: " << message << "\n";
    return kExitUsage;
}

} // anonymous namespace

int run_diff(const std::vector<std::string>& args, const Settings& settings,
             std::ostream& out, std::ostream& err) {
    if (args.size() != 3) {
        return usage_error(err, "usage: jpatch diff FROM TO");
    }
    const Value from = load_document(args[1]);
    const Value to = load_document(args[2]);
    out << serialize_patch(diff(from, to), settings.indent) << "\n";
    return kExitOk;
}

int run_apply(const std::vector<std::string>& args, const CommandOptions& opts,
              const Settings& settings, std::ostream& out, std::ostream& err) {
    if (args.size() != 2 || opts.patch_path.empty()) {
        return usage_error(err, "usage: jpatch apply INPUT -p PATCH");
    }
    const Value document = load_document(args[1]);
    const Patch patch = load_patch(opts.patch_path);
    out << serialize(apply_patch(document, patch), settings.indent) << "\n";
    return kExitOk;
}

int run_edit(const std::vector<std::string>& args, const CommandOptions& opts,
             const Settings& settings, std::ostream& out, std::ostream& err) {
    if (args.size() != 2 || opts.patch_path.empty()) {
        return usage_error(err, "usage: jpatch edit INPUT -p PATCH [-w] [-e EDITOR]");
    }

    TempDirectory scratch_dir;
    PosixFileSystem files(settings.debounce);
    ProcessEditor editor(resolve_editor(settings));

    EditOptions edit;
    edit.input_path = args[1];
    edit.patch_path = opts.patch_path;
    edit.scratch_path = scratch_dir.file("patched.json");
    edit.watch = opts.watch;
    edit.apply_failure = settings.apply_failure;
    edit.poll_interval = settings.poll;
    edit.indent = settings.indent;
    edit.cancel = opts.cancel;
    edit.summary = &out;
    edit.color = opts.color;

    EditSession session(files, editor, edit);
    const EditResult result = session.run();

    if (result.apply_error) {
        err << "Warning: stored patch was not applied: " << *result.apply_error << "\n";
    }
    if (result.state == EditState::Failed) {
        err << "Error: " << result.failure.value_or("edit failed") << "\n";
        return kExitFailure;
    }
    return kExitOk;
}

int run_command(const std::vector<std::string>& args, const CommandOptions& opts,
                const Settings& settings, std::ostream& out, std::ostream& err) {
    if (args.empty()) {
        return usage_error(err, "missing command");
    }

    const std::string& cmd = args[0];
    try {
        if (cmd == "diff") {
            return run_diff(args, settings, out, err);
        }
        if (cmd == "apply") {
            return run_apply(args, opts, settings, out, err);
        }
        if (cmd == "edit") {
            return run_edit(args, opts, settings, out, err);
        }
    } catch (const std::exception& e) {
        return report_error(e, err);
    }

    return usage_error(err, "unknown command '" + cmd + "'");
}

int report_error(const std::exception& e, std::ostream& err) {
    if (dynamic_cast<const ApplyError*>(&e) != nullptr) {
        err << "Error applying patch: " << e.what() << "\n";
    } else {
        err << "Error: " << e.what() << "\n";
    }
    return kExitFailure;
}

} // namespace jpatch
