#pragma once

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace stagegate {

/**
 * Matches staged filenames against shell-glob patterns for secrets and
 * credentials (dotenv files, private keys, keystores, ...).
 *
 * Patterns follow fnmatch rules: '*' matches any run of characters including
 * '/', '?' matches one character, '[seq]' and '[!seq]' match character sets.
 * Matching is case-sensitive. Patterns are compiled once at construction.
 *
 * A pattern may target a bare filename ("id_rsa"), a directory segment
 * ("secrets") or a full relative path ("config/credentials.json"), so every
 * filename is checked at three granularities: the full relative path, each
 * path segment and the final segment.
 */
class IgnorePatternMatcher {
public:
    /**
     * Create a matcher from the default secret/credential pattern set.
     */
    IgnorePatternMatcher();

    /**
     * Create a matcher from an externally supplied pattern set.
     *
     * @param patterns Shell-glob patterns; empty entries are skipped
     */
    explicit IgnorePatternMatcher(const std::vector<std::string>& patterns);

    /**
     * Check a normalized relative filename against all patterns.
     *
     * @param relative_path Slash-separated relative path
     * @return true if any pattern matches the path, a segment or the final segment
     */
    bool matches(const std::string& relative_path) const;

    /**
     * Same as matches() but reports the first pattern that matched.
     */
    std::optional<std::string> findMatch(const std::string& relative_path) const;

    const std::vector<std::string>& patterns() const { return _patterns; }

    /**
     * Translate one fnmatch-style glob into an ECMAScript regex source.
     * An unterminated '[' is treated as a literal character.
     */
    static std::string globToRegex(const std::string& pattern);

    /**
     * Secret and credential patterns used when configuration supplies none.
     */
    static const std::vector<std::string>& defaultPatterns();

private:
    struct CompiledPattern {
        std::string glob;
        std::regex regex;
    };

    std::vector<std::string> _patterns;
    std::vector<CompiledPattern> _compiled;

    bool matchesAny(const CompiledPattern& pattern, const std::string& relative_path,
                    const std::vector<std::string>& segments) const;
};

} // namespace stagegate
