#include "identifier_validator.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace stagegate {

namespace {

const std::regex& projectIdPattern() {
    static const std::regex pattern("^[a-zA-Z0-9_-]{3,64}$");
    return pattern;
}

std::string quoted(const std::string& value) {
    return "'" + value + "'";
}

} // namespace

std::string IdentifierValidator::trim(const std::string& value) {
    const char* whitespace = " \t\n\r\f\v";
    auto start = value.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(whitespace);
    return value.substr(start, end - start + 1);
}

std::string IdentifierValidator::toLower(const std::string& value) {
    std::string result = value;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

const std::set<std::string>& IdentifierValidator::reservedNames() {
    static const std::set<std::string> names = {
        "con", "prn", "aux", "nul",
        "com1", "com2", "com3", "com4", "com5", "com6", "com7", "com8", "com9",
        "lpt1", "lpt2", "lpt3", "lpt4", "lpt5", "lpt6", "lpt7", "lpt8", "lpt9",
    };
    return names;
}

bool IdentifierValidator::isReservedName(const std::string& name) {
    return reservedNames().count(toLower(name)) > 0;
}

const std::vector<std::string>& IdentifierValidator::snapshotTypes() {
    static const std::vector<std::string> types = [] {
        std::vector<std::string> values = {
            "file_metadata", "imports", "exports", "functions", "classes",
            "connections", "repo_metadata", "security", "quality",
            "doc_metadata", "doc_content", "doc_analysis",
        };
        std::sort(values.begin(), values.end());
        return values;
    }();
    return types;
}

Result<std::string> IdentifierValidator::validateProjectId(const std::string& raw) {
    if (raw.empty()) {
        return Error::Format("project_id is required");
    }

    std::string project_id = trim(raw);

    if (!std::regex_match(project_id, projectIdPattern())) {
        return Error::Format(
            "Invalid project_id format: must be 3-64 alphanumeric characters, "
            "underscores, or hyphens. Got: " + quoted(project_id));
    }

    if (project_id.front() == '-' || project_id.front() == '.') {
        return Error::Format("project_id cannot start with '-' or '.'. Got: " + quoted(project_id));
    }

    if (isReservedName(project_id)) {
        return Error::Format("project_id cannot be a reserved name. Got: " + quoted(project_id));
    }

    return project_id;
}

Result<std::string> IdentifierValidator::validateVendorId(const std::string& raw) {
    if (raw.empty()) {
        return Error::Format("vendor_id is required");
    }

    std::string vendor_id = trim(raw);

    if (vendor_id.empty() || vendor_id.size() > kMaxVendorIdLength) {
        return Error::Format("vendor_id must be 1-64 characters. Got " +
                             std::to_string(vendor_id.size()));
    }

    return vendor_id;
}

Result<std::string> IdentifierValidator::validateRepoUrl(const std::string& raw) {
    if (raw.empty()) {
        return Error::Format("repo_url is required");
    }

    std::string repo_url = trim(raw);
    const std::string prefix = kRepoUrlPrefix;

    if (repo_url.compare(0, prefix.size(), prefix) != 0) {
        return Error::Format("repo_url must be an HTTPS GitHub URL (https://github.com/...)");
    }

    std::string remainder = repo_url.substr(prefix.size());
    while (!remainder.empty() && remainder.back() == '/') {
        remainder.pop_back();
    }

    // owner/repo[/...]: both leading segments must be present
    auto slash = remainder.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 >= remainder.size() ||
        remainder[slash + 1] == '/') {
        return Error::Format("repo_url must include owner and repo name");
    }

    return repo_url;
}

Result<std::string> IdentifierValidator::validateSnapshotType(const std::string& raw) {
    if (raw.empty()) {
        return Error::Format("snapshot_type is required");
    }

    std::string snapshot_type = toLower(trim(raw));
    const auto& valid = snapshotTypes();

    if (std::find(valid.begin(), valid.end(), snapshot_type) == valid.end()) {
        std::string listing;
        for (const auto& type : valid) {
            if (!listing.empty()) {
                listing += ", ";
            }
            listing += type;
        }
        return Error::Format("Invalid snapshot_type: " + quoted(snapshot_type) +
                             ". Must be one of: " + listing);
    }

    return snapshot_type;
}

Result<ContentEncoding> IdentifierValidator::validateEncoding(const std::string& raw) {
    std::string encoding = toLower(trim(raw));
    if (encoding == "utf-8") {
        return ContentEncoding::Utf8;
    }
    if (encoding == "base64") {
        return ContentEncoding::Base64;
    }
    return Error::Format("Invalid encoding: " + quoted(raw) + ". Use 'utf-8' or 'base64'");
}

std::string IdentifierValidator::encodingName(ContentEncoding encoding) {
    return encoding == ContentEncoding::Base64 ? "base64" : "utf-8";
}

} // namespace stagegate
