/**
 * @file FileSystem.hpp
 * @brief File access and change notification used by the edit loop
 *
 * The edit loop only talks to files through these interfaces, so tests
 * can drive it with an in-memory implementation.
 */

#ifndef JPATCH_FILESYSTEM_HPP
#define JPATCH_FILESYSTEM_HPP

#include "jpatch/Errors.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace jpatch {

enum class WatchEvent {
    Changed,  ///< The file was written (bursts coalesced into one event)
    Timeout,  ///< Nothing happened within the timeout
    Removed   ///< The file was deleted or moved away
};

/**
 * @brief Blocking source of change notifications for a single file
 */
class FileWatcher {
public:
    virtual ~FileWatcher() = default;

    /**
     * @brief Wait for the next change
     *
     * @param timeout Longest time to block
     * @return Changed once per burst of writes, Removed when the file is
     *         gone, Timeout otherwise
     * @throws IoError if the notification channel fails
     */
    virtual WatchEvent wait(std::chrono::milliseconds timeout) = 0;
};

class FileSystem {
public:
    virtual ~FileSystem() = default;

    /**
     * @brief Read a whole file
     * @throws IoError if the file is missing or unreadable
     */
    virtual std::string read_file(const std::string& path) = 0;

    /**
     * @brief Replace a file's contents atomically
     *
     * Observers see either the old or the new contents, never a partial
     * write.
     * @throws IoError on failure; the destination is left untouched
     */
    virtual void write_atomic(const std::string& path, const std::string& contents) = 0;

    virtual bool exists(const std::string& path) = 0;

    /**
     * @brief Start watching a file for modifications
     * @throws IoError if the watch cannot be registered
     */
    virtual std::unique_ptr<FileWatcher> watch(const std::string& path) = 0;
};

/**
 * @brief FileSystem backed by the real file system
 *
 * write_atomic writes "<path>.tmp.<pid>" next to the destination, fsyncs
 * it and renames it into place. watch uses inotify on the parent directory
 * so saves that replace the file by rename are also reported.
 */
class PosixFileSystem : public FileSystem {
public:
    /**
     * @param debounce Writes closer together than this are reported as
     *                 one Changed event
     */
    explicit PosixFileSystem(std::chrono::milliseconds debounce = std::chrono::milliseconds(100))
        : debounce_(debounce)
    {}

    std::string read_file(const std::string& path) override;
    void write_atomic(const std::string& path, const std::string& contents) override;
    bool exists(const std::string& path) override;
    std::unique_ptr<FileWatcher> watch(const std::string& path) override;

private:
    std::chrono::milliseconds debounce_;
};

/**
 * @brief Private temporary directory, removed with its contents on destruction
 */
class TempDirectory {
public:
    /**
     * @param prefix Leading part of the directory name
     * @throws IoError if the directory cannot be created
     */
    explicit TempDirectory(const std::string& prefix = "jpatch");
    ~TempDirectory();

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::string& path() const noexcept { return path_; }

    /// Path of a file named name inside the directory
    std::string file(const std::string& name) const;

private:
    std::string path_;
};

} // namespace jpatch

#endif // JPATCH_FILESYSTEM_HPP
