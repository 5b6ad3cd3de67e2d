#include "filename_sanitizer.hpp"

#include <algorithm>
#include <regex>
#include <sstream>
#include <crow/logging.h>

#include "identifier_validator.hpp"

namespace stagegate {

namespace {

const std::regex& filenamePattern() {
    static const std::regex pattern("^[a-zA-Z0-9._-][a-zA-Z0-9._/-]{0,254}$");
    return pattern;
}

std::string printable(const std::string& pattern) {
    if (pattern == std::string(1, '\0')) {
        return "'\\x00'";
    }
    return "'" + pattern + "'";
}

} // namespace

FilenameSanitizer::FilenameSanitizer(std::shared_ptr<const IgnorePatternMatcher> ignore_matcher,
                                     std::set<std::string> allowed_dotfiles)
    : _ignore_matcher(std::move(ignore_matcher)),
      _allowed_dotfiles(std::move(allowed_dotfiles)) {
    if (!_ignore_matcher) {
        _ignore_matcher = std::make_shared<IgnorePatternMatcher>();
    }
}

std::set<std::string> FilenameSanitizer::defaultAllowedDotfiles() {
    return {".gitignore", ".gitattributes"};
}

const std::vector<std::string>& FilenameSanitizer::forbiddenPatterns() {
    static const std::vector<std::string> patterns = {
        "..", std::string(1, '\0'), "~", ":", "*", "?", "\"", "<", ">", "|",
    };
    return patterns;
}

std::string FilenameSanitizer::normalizeSeparators(const std::string& filename) {
    std::string result = filename;
    std::replace(result.begin(), result.end(), '\\', '/');

    auto start = result.find_first_not_of('/');
    if (start == std::string::npos) {
        return "";
    }
    auto end = result.find_last_not_of('/');
    return result.substr(start, end - start + 1);
}

bool FilenameSanitizer::isReservedComponent(const std::string& component) {
    // Device names stay devices with any extension ("COM1.txt")
    auto dot = component.find('.');
    std::string stem = dot == std::string::npos ? component : component.substr(0, dot);
    return IdentifierValidator::isReservedName(stem);
}

bool FilenameSanitizer::isHiddenDirectory(const std::string& component) const {
    if (component.empty() || component.front() != '.') {
        return false;
    }
    if (_allowed_dotfiles.count(component) > 0) {
        return false;
    }
    return component.find('.', 1) == std::string::npos;
}

Result<std::string> FilenameSanitizer::sanitize(const std::string& raw) const {
    if (raw.empty()) {
        return Error::Format("filename is required");
    }

    std::string filename = normalizeSeparators(IdentifierValidator::trim(raw));
    if (filename.empty()) {
        return Error::Format("filename cannot be empty after normalization");
    }

    for (const auto& pattern : forbiddenPatterns()) {
        if (filename.find(pattern) != std::string::npos) {
            CROW_LOG_WARNING << "Rejected staging filename containing forbidden pattern " << printable(pattern);
            return Error::Security("Forbidden pattern in filename: " + printable(pattern));
        }
    }

    if (!std::regex_match(filename, filenamePattern())) {
        return Error::Format("Invalid filename format: '" + filename + "'");
    }

    std::stringstream ss(filename);
    std::string component;
    while (std::getline(ss, component, '/')) {
        if (component.empty()) {
            return Error::Format("Empty path component in filename");
        }

        if (isReservedComponent(component)) {
            CROW_LOG_WARNING << "Rejected staging filename with reserved device name '" << component << "'";
            return Error::Security("Reserved name in path: '" + component + "'");
        }

        if (isHiddenDirectory(component)) {
            return Error::Format("Hidden directory not allowed: '" + component + "'");
        }
    }

    if (auto match = _ignore_matcher->findMatch(filename)) {
        CROW_LOG_INFO << "Staging filename '" << filename << "' blocked by ignore pattern '" << *match << "'";
        return Error::Format("File matches ignore pattern (secrets/credentials): '" + filename + "'");
    }

    return filename;
}

} // namespace stagegate
