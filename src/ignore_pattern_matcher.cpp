#include "ignore_pattern_matcher.hpp"

#include <sstream>
#include <stdexcept>
#include <crow/logging.h>

namespace stagegate {

namespace {

std::vector<std::string> splitSegments(const std::string& path) {
    std::vector<std::string> segments;
    std::stringstream ss(path);
    std::string segment;
    while (std::getline(ss, segment, '/')) {
        if (!segment.empty()) {
            segments.push_back(segment);
        }
    }
    return segments;
}

bool isRegexSpecial(char c) {
    switch (c) {
        case '.': case '^': case '$': case '|': case '(': case ')':
        case '[': case ']': case '{': case '}': case '*': case '+':
        case '?': case '\\': case '/':
            return true;
        default:
            return false;
    }
}

} // namespace

IgnorePatternMatcher::IgnorePatternMatcher()
    : IgnorePatternMatcher(defaultPatterns()) {}

IgnorePatternMatcher::IgnorePatternMatcher(const std::vector<std::string>& patterns) {
    for (const auto& pattern : patterns) {
        if (pattern.empty()) {
            continue;
        }
        try {
            _compiled.push_back({pattern, std::regex(globToRegex(pattern), std::regex::ECMAScript)});
            _patterns.push_back(pattern);
        } catch (const std::regex_error& e) {
            throw std::invalid_argument("Invalid ignore pattern '" + pattern + "': " + e.what());
        }
    }
    CROW_LOG_DEBUG << "IgnorePatternMatcher compiled " << _compiled.size() << " patterns";
}

const std::vector<std::string>& IgnorePatternMatcher::defaultPatterns() {
    static const std::vector<std::string> patterns = {
        // dotenv and local settings
        ".env", ".env.*", "*.env",
        // ssh and private keys
        "id_rsa", "id_rsa.*", "id_dsa", "id_dsa.*", "id_ecdsa", "id_ecdsa.*",
        "id_ed25519", "id_ed25519.*", "*.pem", "*.key", "*.ppk",
        // certificates and keystores
        "*.p12", "*.pfx", "*.jks", "*.keystore", "*.crt", "*.cer",
        // credential files
        "credentials", "credentials.*", "*.credentials", "secrets.*",
        "*.secret", ".netrc", ".npmrc", ".pypirc", ".htpasswd",
        "service-account*.json",
    };
    return patterns;
}

std::string IgnorePatternMatcher::globToRegex(const std::string& pattern) {
    std::string out;
    out.reserve(pattern.size() * 2);

    const size_t n = pattern.size();
    size_t i = 0;
    while (i < n) {
        char c = pattern[i++];
        if (c == '*') {
            // Collapse runs of '*'
            while (i < n && pattern[i] == '*') {
                ++i;
            }
            out += "[\\s\\S]*";
        } else if (c == '?') {
            out += "[\\s\\S]";
        } else if (c == '[') {
            size_t j = i;
            if (j < n && pattern[j] == '!') ++j;
            if (j < n && pattern[j] == ']') ++j;
            while (j < n && pattern[j] != ']') ++j;

            if (j >= n) {
                out += "\\[";
                continue;
            }

            std::string stuff = pattern.substr(i, j - i);
            std::string escaped;
            for (char s : stuff) {
                if (s == '\\') {
                    escaped += "\\\\";
                } else if (s == ']' || s == '[') {
                    // ECMAScript reads a leading ']' as an empty class
                    escaped += '\\';
                    escaped += s;
                } else {
                    escaped += s;
                }
            }
            i = j + 1;

            if (!escaped.empty() && escaped[0] == '!') {
                escaped[0] = '^';
            } else if (!escaped.empty() && escaped[0] == '^') {
                escaped.insert(escaped.begin(), '\\');
            }
            out += "[" + escaped + "]";
        } else if (isRegexSpecial(c)) {
            out += '\\';
            out += c;
        } else {
            out += c;
        }
    }
    return out;
}

bool IgnorePatternMatcher::matchesAny(const CompiledPattern& pattern,
                                      const std::string& relative_path,
                                      const std::vector<std::string>& segments) const {
    for (const auto& segment : segments) {
        if (std::regex_match(segment, pattern.regex)) {
            return true;
        }
    }

    if (std::regex_match(relative_path, pattern.regex)) {
        return true;
    }

    if (!segments.empty() && std::regex_match(segments.back(), pattern.regex)) {
        return true;
    }

    return false;
}

std::optional<std::string> IgnorePatternMatcher::findMatch(const std::string& relative_path) const {
    const auto segments = splitSegments(relative_path);
    for (const auto& pattern : _compiled) {
        if (matchesAny(pattern, relative_path, segments)) {
            return pattern.glob;
        }
    }
    return std::nullopt;
}

bool IgnorePatternMatcher::matches(const std::string& relative_path) const {
    return findMatch(relative_path).has_value();
}

} // namespace stagegate
