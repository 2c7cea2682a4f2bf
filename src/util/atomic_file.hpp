/**
 * devhttps - Local HTTPS Development Server
 * Atomic file helpers - write-to-temporary then rename
 *
 * Readers of a target path either see no file or the complete file, never a
 * truncated one. Temporary files are siblings of the target so the final
 * rename stays on one filesystem.
 */

#ifndef DEVHTTPS_UTIL_ATOMIC_FILE_HPP
#define DEVHTTPS_UTIL_ATOMIC_FILE_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace devhttps::util {

/**
 * Permissions for files holding private key material
 */
constexpr std::filesystem::perms kPrivateFilePerms =
    std::filesystem::perms::owner_read | std::filesystem::perms::owner_write;

/**
 * Build a unique hidden sibling path for target, e.g. ".server.pem.tmp-1a2b3c4d5e6f7a8b"
 */
std::filesystem::path make_temp_sibling(const std::filesystem::path& target);

/**
 * Write contents to a temporary sibling of target and rename it into place
 * @throws std::runtime_error if the file cannot be written or renamed
 */
void write_file_atomically(const std::filesystem::path& target,
                           std::string_view contents,
                           std::filesystem::perms perms = kPrivateFilePerms);

/**
 * Rename a finished temporary file over target
 * @throws std::runtime_error on failure
 */
void commit_file(const std::filesystem::path& temp, const std::filesystem::path& target);

/**
 * Removes a temporary file on scope exit unless release() was called
 */
class TempFileGuard {
public:
    explicit TempFileGuard(std::filesystem::path path);
    ~TempFileGuard();

    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }

    /**
     * Keep the file (it has been committed or handed elsewhere)
     */
    void release() noexcept { released_ = true; }

private:
    std::filesystem::path path_;
    bool released_{false};
};

} // namespace devhttps::util

#endif // DEVHTTPS_UTIL_ATOMIC_FILE_HPP
