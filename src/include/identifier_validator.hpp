#pragma once

#include <set>
#include <string>
#include <vector>

#include "error.hpp"

namespace stagegate {

enum class ContentEncoding {
    Utf8,
    Base64
};

/**
 * Format rules for the identifiers a staging request carries.
 *
 * The project id becomes a directory name and therefore has the strictest
 * rules. The vendor id is an audit label only and is never used as a path
 * component. Repository URLs are pinned to one trusted host and snapshot
 * types to a closed enumeration so downstream collaborators never receive
 * arbitrary strings.
 *
 * All validators are total: they either return the normalized value or a
 * Format error naming the violated rule.
 */
class IdentifierValidator {
public:
    static constexpr size_t kMaxVendorIdLength = 64;

    static Result<std::string> validateProjectId(const std::string& raw);
    static Result<std::string> validateVendorId(const std::string& raw);
    static Result<std::string> validateRepoUrl(const std::string& raw);
    static Result<std::string> validateSnapshotType(const std::string& raw);
    static Result<ContentEncoding> validateEncoding(const std::string& raw);

    // Sorted list of the twelve analysis categories
    static const std::vector<std::string>& snapshotTypes();

    // Device names that cannot be used as a file or directory name (lowercase)
    static const std::set<std::string>& reservedNames();

    // Case-insensitive check against reservedNames()
    static bool isReservedName(const std::string& name);

    static std::string encodingName(ContentEncoding encoding);

    // Helpers shared with the filename sanitizer
    static std::string trim(const std::string& value);
    static std::string toLower(const std::string& value);

private:
    static constexpr const char* kRepoUrlPrefix = "https://github.com/";
};

} // namespace stagegate
