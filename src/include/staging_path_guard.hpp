#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "error.hpp"
#include "filename_sanitizer.hpp"
#include "guard_config.hpp"
#include "ignore_pattern_matcher.hpp"

namespace stagegate {

/**
 * The only place where untrusted project ids and filenames become
 * filesystem paths.
 *
 * Every request passes the identifier validators, then the filename
 * sanitizer, then path resolution. The resolved path is guaranteed to be the
 * project's staging directory or a strict descendant of it after following
 * all symbolic links, and no entry between it and the staging root is a
 * symbolic link.
 *
 * The guard performs read-only filesystem metadata calls and holds no locks.
 * It does not serialize concurrent writers to the same file; the caller's
 * write path must be atomic on its own.
 */
class StagingPathGuard {
public:
    explicit StagingPathGuard(const GuardConfig& config);

    /**
     * Full pipeline from raw request strings to a safe absolute path.
     *
     * @param project_id Untrusted project identifier
     * @param filename Untrusted relative filename
     * @return Resolved path inside the project's staging directory
     */
    Result<std::filesystem::path> resolve(const std::string& project_id,
                                          const std::string& filename) const;

    /**
     * Path resolution only. Both arguments must already have been accepted
     * by the validators; containment is still proven independently.
     */
    Result<std::filesystem::path> resolveValidated(const std::string& project_id,
                                                   const std::string& relative_filename) const;

    /**
     * Resolved staging directory of a project. The directory need not exist
     * yet, but if it does it must not be a symbolic link.
     */
    Result<std::filesystem::path> projectDirectory(const std::string& project_id) const;

    Result<std::string> sanitizeFilename(const std::string& raw) const {
        return _sanitizer.sanitize(raw);
    }

    const std::filesystem::path& stagingRoot() const { return _staging_root; }

    // Equal to, or a descendant of, parent (component-wise)
    static bool isWithin(const std::filesystem::path& child, const std::filesystem::path& parent);

private:
    std::filesystem::path _staging_root;
    std::shared_ptr<const IgnorePatternMatcher> _ignore_matcher;
    FilenameSanitizer _sanitizer;

    Result<std::filesystem::path> canonicalize(const std::filesystem::path& path) const;
    std::optional<Error> findSymlinkBelowRoot(const std::filesystem::path& candidate) const;
};

} // namespace stagegate
