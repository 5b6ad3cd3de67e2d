#include "staging_path_guard.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <crow/logging.h>

#include "identifier_validator.hpp"

namespace stagegate {

namespace fs = std::filesystem;

namespace {

fs::path normalizedRoot(const fs::path& staging_root) {
    if (staging_root.empty()) {
        throw std::invalid_argument("Staging root must be configured");
    }
    fs::path root = fs::absolute(staging_root).lexically_normal();
    if (!root.has_filename() && root.has_parent_path() && root != root.root_path()) {
        root = root.parent_path();
    }
    return root;
}

} // namespace

StagingPathGuard::StagingPathGuard(const GuardConfig& config)
    : _staging_root(normalizedRoot(config.staging_root)),
      _ignore_matcher(std::make_shared<IgnorePatternMatcher>(config.ignore_patterns)),
      _sanitizer(_ignore_matcher, config.allowed_dotfiles) {
    CROW_LOG_DEBUG << "StagingPathGuard initialized with staging root: " << _staging_root.string();
}

bool StagingPathGuard::isWithin(const fs::path& child, const fs::path& parent) {
    auto child_it = child.begin();
    for (const auto& part : parent) {
        // A trailing separator shows up as an empty element
        if (part.empty()) {
            continue;
        }
        if (child_it == child.end() || *child_it != part) {
            return false;
        }
        ++child_it;
    }
    return true;
}

Result<fs::path> StagingPathGuard::canonicalize(const fs::path& path) const {
    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(path, ec);
    if (ec) {
        CROW_LOG_WARNING << "Staging path resolution failed for " << path.string() << ": " << ec.message();
        return Error::Security("Invalid path: staging path could not be resolved");
    }
    return resolved;
}

std::optional<Error> StagingPathGuard::findSymlinkBelowRoot(const fs::path& candidate) const {
    fs::path current = candidate;
    while (current != _staging_root) {
        std::error_code ec;
        auto status = fs::symlink_status(current, ec);
        if (ec && status.type() != fs::file_type::not_found) {
            CROW_LOG_WARNING << "Cannot inspect staging path entry " << current.string() << ": " << ec.message();
            return Error::Security("Invalid path: staging path could not be inspected");
        }
        if (fs::is_symlink(status)) {
            CROW_LOG_WARNING << "Symlink detected in staging path: " << current.string();
            return Error::Security("Symlink detected in staging path");
        }

        fs::path parent = current.parent_path();
        if (parent == current) {
            break;
        }
        current = parent;
    }
    return std::nullopt;
}

Result<fs::path> StagingPathGuard::resolveValidated(const std::string& project_id,
                                                    const std::string& relative_filename) const {
    const fs::path project_dir = _staging_root / project_id;
    const fs::path candidate = project_dir / relative_filename;

    auto resolved = canonicalize(candidate);
    if (!resolved) {
        return std::move(resolved.error());
    }

    auto resolved_project = canonicalize(project_dir);
    if (!resolved_project) {
        return std::move(resolved_project.error());
    }

    if (!isWithin(*resolved, *resolved_project)) {
        CROW_LOG_WARNING << "Path traversal detected for project '" << project_id
                         << "': " << resolved->string() << " is outside " << resolved_project->string();
        return Error::Security("Path traversal detected: '" + relative_filename +
                               "' escapes staging directory");
    }

    if (auto symlink_error = findSymlinkBelowRoot(candidate)) {
        return std::move(*symlink_error);
    }

    CROW_LOG_DEBUG << "Resolved staging path for project '" << project_id << "': " << resolved->string();
    return std::move(*resolved);
}

Result<fs::path> StagingPathGuard::resolve(const std::string& project_id,
                                           const std::string& filename) const {
    auto validated_project = IdentifierValidator::validateProjectId(project_id);
    if (!validated_project) {
        return std::move(validated_project.error());
    }

    auto validated_filename = _sanitizer.sanitize(filename);
    if (!validated_filename) {
        return std::move(validated_filename.error());
    }

    return resolveValidated(*validated_project, *validated_filename);
}

Result<fs::path> StagingPathGuard::projectDirectory(const std::string& project_id) const {
    auto validated_project = IdentifierValidator::validateProjectId(project_id);
    if (!validated_project) {
        return std::move(validated_project.error());
    }

    const fs::path project_dir = _staging_root / *validated_project;

    auto resolved_root = canonicalize(_staging_root);
    if (!resolved_root) {
        return std::move(resolved_root.error());
    }

    auto resolved = canonicalize(project_dir);
    if (!resolved) {
        return std::move(resolved.error());
    }

    if (*resolved == *resolved_root || !isWithin(*resolved, *resolved_root)) {
        CROW_LOG_WARNING << "Project directory for '" << *validated_project
                         << "' resolves outside staging root: " << resolved->string();
        return Error::Security("Path traversal detected: project directory escapes staging root");
    }

    if (auto symlink_error = findSymlinkBelowRoot(project_dir)) {
        return std::move(*symlink_error);
    }

    return std::move(*resolved);
}

} // namespace stagegate
