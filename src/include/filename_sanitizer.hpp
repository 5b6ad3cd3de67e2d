#pragma once

#include <memory>
#include <set>
#include <string>
#include <vector>

#include "error.hpp"
#include "ignore_pattern_matcher.hpp"

namespace stagegate {

/**
 * Normalizes and validates an untrusted relative filename for the staging
 * area.
 *
 * Accepted output is slash-separated, has no leading or trailing slash, and
 * never contains "..", a null byte or a backslash. Sanitizing an accepted
 * value again yields the same value.
 *
 * Rejections are Security errors for traversal material, forbidden
 * characters and device names, and Format errors for everything else
 * (charset, empty components, hidden directories, secret patterns).
 */
class FilenameSanitizer {
public:
    FilenameSanitizer(std::shared_ptr<const IgnorePatternMatcher> ignore_matcher,
                      std::set<std::string> allowed_dotfiles = defaultAllowedDotfiles());

    Result<std::string> sanitize(const std::string& raw) const;

    const std::set<std::string>& allowedDotfiles() const { return _allowed_dotfiles; }

    // ".gitignore" and ".gitattributes"
    static std::set<std::string> defaultAllowedDotfiles();

    // Substrings that are never allowed anywhere in a filename
    static const std::vector<std::string>& forbiddenPatterns();

private:
    std::shared_ptr<const IgnorePatternMatcher> _ignore_matcher;
    std::set<std::string> _allowed_dotfiles;

    static std::string normalizeSeparators(const std::string& filename);
    static bool isReservedComponent(const std::string& component);
    bool isHiddenDirectory(const std::string& component) const;
};

} // namespace stagegate
