/**
 * @file Commands.hpp
 * @brief The jpatch subcommands behind the CLI
 *
 * Each command writes its result to out and diagnostics to err and returns
 * the process exit code:
 * - 0 on success
 * - 1 when a document, patch, file or editor operation fails
 * - 2 on usage errors (wrong arguments, unknown command)
 */

#ifndef JPATCH_COMMANDS_HPP
#define JPATCH_COMMANDS_HPP

#include "jpatch/Settings.hpp"

#include <atomic>
#include <exception>
#include <ostream>
#include <string>
#include <vector>

namespace jpatch {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

/**
 * @brief Command-line state that is not part of the settings
 */
struct CommandOptions {
    std::string patch_path;
    bool watch = false;
    bool color = false;
    /// Stops watch mode when set (the CLI's SIGINT handler sets it)
    const std::atomic<bool>* cancel = nullptr;
};

/**
 * @brief jpatch diff FROM TO: print the patch turning FROM into TO
 */
int run_diff(const std::vector<std::string>& args, const Settings& settings,
             std::ostream& out, std::ostream& err);

/**
 * @brief jpatch apply INPUT -p PATCH: print INPUT with PATCH applied
 */
int run_apply(const std::vector<std::string>& args, const CommandOptions& opts,
              const Settings& settings, std::ostream& out, std::ostream& err);

/**
 * @brief jpatch edit INPUT -p PATCH: edit the patched INPUT in the editor
 *        and store the new patch
 */
int run_edit(const std::vector<std::string>& args, const CommandOptions& opts,
             const Settings& settings, std::ostream& out, std::ostream& err);

/**
 * @brief Dispatch on args[0] ("diff", "apply", "edit")
 *
 * Errors thrown by the commands are reported on err and turned into exit
 * codes; nothing propagates.
 */
int run_command(const std::vector<std::string>& args, const CommandOptions& opts,
                const Settings& settings, std::ostream& out, std::ostream& err);

/**
 * @brief Print "Error: ..." (or "Error applying patch: ..." for ApplyError)
 * @return kExitFailure
 */
int report_error(const std::exception& e, std::ostream& err);

} // namespace jpatch

#endif // JPATCH_COMMANDS_HPP
