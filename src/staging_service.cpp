#include "staging_service.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <stdexcept>
#include <fcntl.h>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>
#include <crow/logging.h>
#include <crow/utility.h>

namespace stagegate {

namespace fs = std::filesystem;

namespace {

constexpr const char* kTempPrefix = ".stagegate-upload-";

bool isBase64Char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '+' || c == '/';
}

std::string formatLocalTime(std::time_t t) {
    std::tm tm{};
    if (localtime_r(&t, &tm) == nullptr) {
        return "";
    }
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return buf;
}

// Permissions a plain open() would have produced under the current umask
mode_t defaultFileMode() {
    mode_t mask = ::umask(0);
    ::umask(mask);
    return static_cast<mode_t>(0666 & ~mask);
}

// Closes the descriptor and unlinks the temp file unless released
class TempFileGuard {
public:
    TempFileGuard(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}

    ~TempFileGuard() {
        closeFd();
        if (!released_) {
            ::unlink(path_.c_str());
        }
    }

    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

    int fd() const { return fd_; }
    const std::string& path() const { return path_; }

    bool closeFd() {
        if (fd_ < 0) {
            return true;
        }
        int rc = ::close(fd_);
        fd_ = -1;
        return rc == 0;
    }

    void release() { released_ = true; }

private:
    int fd_;
    std::string path_;
    bool released_ = false;
};

} // namespace

crow::json::wvalue StagingInfo::toJson() const {
    crow::json::wvalue json;
    json["status"] = "success";
    json["project_id"] = project_id;
    json["staging_path"] = staging_path;

    auto file_list = crow::json::wvalue::list();
    for (const auto& file : files) {
        crow::json::wvalue file_json;
        file_json["name"] = file.name;
        file_json["size"] = static_cast<unsigned long long>(file.size);
        file_json["modified_at"] = file.modified_at;
        file_list.push_back(std::move(file_json));
    }
    json["files"] = std::move(file_list);
    json["file_count"] = static_cast<unsigned long long>(files.size());
    json["total_size_bytes"] = static_cast<unsigned long long>(total_size_bytes);
    return json;
}

crow::json::wvalue UploadReceipt::toJson() const {
    crow::json::wvalue json;
    json["status"] = "uploaded";
    json["project_id"] = project_id;
    json["filename"] = filename;
    json["path"] = path;
    json["size"] = static_cast<unsigned long long>(size);
    return json;
}

crow::json::wvalue ClearReceipt::toJson() const {
    crow::json::wvalue json;
    json["status"] = "cleared";
    json["project_id"] = project_id;
    json["files_deleted"] = static_cast<unsigned long long>(files_deleted);
    return json;
}

crow::json::wvalue DeleteReceipt::toJson() const {
    crow::json::wvalue json;
    json["status"] = "deleted";
    json["project_id"] = project_id;
    json["message"] = "Project " + project_id + " staging area deleted";
    return json;
}

StagingService::StagingService(std::shared_ptr<const StagingPathGuard> guard, size_t max_file_bytes)
    : _guard(std::move(guard)), _max_file_bytes(max_file_bytes) {
    if (!_guard) {
        throw std::invalid_argument("StagingService requires a path guard");
    }
}

std::string StagingService::logicalPath(const std::string& project_id, const std::string& filename) {
    std::string path = "staging/" + project_id;
    if (!filename.empty()) {
        path += "/" + filename;
    }
    return path;
}

Result<std::string> StagingService::decodeContent(const std::string& content, ContentEncoding encoding) {
    if (encoding == ContentEncoding::Utf8) {
        return content;
    }

    std::string compact;
    compact.reserve(content.size());
    for (char c : content) {
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t') {
            continue;
        }
        compact.push_back(c);
    }

    if (compact.empty()) {
        return std::string();
    }

    if (compact.size() % 4 != 0) {
        return Error::Format("Invalid base64 content: incorrect padding");
    }

    size_t padding = 0;
    for (size_t i = 0; i < compact.size(); ++i) {
        char c = compact[i];
        if (c == '=') {
            // Padding only in the last two positions
            if (i < compact.size() - 2) {
                return Error::Format("Invalid base64 content: misplaced padding");
            }
            ++padding;
        } else if (padding > 0 || !isBase64Char(c)) {
            return Error::Format("Invalid base64 content: unexpected character");
        }
    }

    return crow::utility::base64decode(compact.data(), compact.size());
}

Result<bool> StagingService::writeAtomically(const fs::path& target, const std::string& data) {
    std::string tmpl = (target.parent_path() / (std::string(kTempPrefix) + "XXXXXX")).string();
    int fd = ::mkstemp(tmpl.data());
    if (fd < 0) {
        return Error::Io("Failed to write file", std::strerror(errno));
    }
    TempFileGuard temp(fd, tmpl);

    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(temp.fd(), data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Error::Io("Failed to write file", std::strerror(errno));
        }
        written += static_cast<size_t>(n);
    }

    if (::fchmod(temp.fd(), defaultFileMode()) != 0) {
        return Error::Io("Failed to write file", std::strerror(errno));
    }

    if (::fsync(temp.fd()) != 0 || !temp.closeFd()) {
        return Error::Io("Failed to write file", std::strerror(errno));
    }

    std::error_code ec;
    fs::rename(temp.path(), target, ec);
    if (ec) {
        return Error::Io("Failed to write file", ec.message());
    }
    temp.release();
    return true;
}

Result<UploadReceipt> StagingService::upload(const std::string& project_id,
                                             const std::string& filename,
                                             const std::string& content,
                                             const std::string& encoding) const {
    auto validated_project = IdentifierValidator::validateProjectId(project_id);
    if (!validated_project) {
        return std::move(validated_project.error());
    }

    auto validated_filename = _guard->sanitizeFilename(filename);
    if (!validated_filename) {
        return std::move(validated_filename.error());
    }

    auto safe_path = _guard->resolveValidated(*validated_project, *validated_filename);
    if (!safe_path) {
        return std::move(safe_path.error());
    }

    auto validated_encoding = IdentifierValidator::validateEncoding(encoding);
    if (!validated_encoding) {
        return std::move(validated_encoding.error());
    }

    CROW_LOG_INFO << "Staging upload: project_id=" << *validated_project
                  << " filename=" << *validated_filename
                  << " encoding=" << IdentifierValidator::encodingName(*validated_encoding);

    auto data = decodeContent(content, *validated_encoding);
    if (!data) {
        return std::move(data.error());
    }

    if (data->size() > _max_file_bytes) {
        return Error::Format("File too large: " + std::to_string(data->size()) +
                             " bytes. Max: " + std::to_string(_max_file_bytes) + " bytes");
    }

    std::error_code ec;
    fs::create_directories(safe_path->parent_path(), ec);
    if (ec) {
        return Error::Io("Failed to create staging directory", ec.message());
    }

    // Directories now exist; prove again that none of them was swapped for a link
    auto verified_path = _guard->resolveValidated(*validated_project, *validated_filename);
    if (!verified_path) {
        return std::move(verified_path.error());
    }

    auto written = writeAtomically(*verified_path, *data);
    if (!written) {
        CROW_LOG_ERROR << "Staging upload failed for project '" << *validated_project
                       << "': " << written.error().details;
        return std::move(written.error());
    }

    UploadReceipt receipt;
    receipt.project_id = *validated_project;
    receipt.filename = *validated_filename;
    receipt.path = logicalPath(*validated_project, *validated_filename);
    receipt.size = data->size();
    return receipt;
}

Result<std::vector<StagedFile>> StagingService::listFiles(const fs::path& project_dir) const {
    std::vector<StagedFile> files;

    std::error_code ec;
    if (!fs::exists(project_dir, ec)) {
        return files;
    }

    fs::recursive_directory_iterator it(project_dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return Error::Io("Failed to list staging directory", ec.message());
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            // The iterator is already at end after a failed increment
            CROW_LOG_WARNING << "Staging directory listing failed: " << ec.message();
            return Error::Io("Failed to list staging directory", ec.message());
        }

        struct stat st{};
        if (::lstat(it->path().c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
            continue;
        }

        std::string name = it->path().lexically_relative(project_dir).generic_string();
        if (name.empty() || it->path().filename().string().rfind(kTempPrefix, 0) == 0) {
            continue;
        }

        StagedFile file;
        file.name = name;
        file.size = static_cast<std::uintmax_t>(st.st_size);
        file.modified_at = formatLocalTime(st.st_mtime);
        files.push_back(std::move(file));
    }

    return files;
}

Result<StagingInfo> StagingService::stagingInfo(const std::string& project_id) const {
    auto project_dir = _guard->projectDirectory(project_id);
    if (!project_dir) {
        return std::move(project_dir.error());
    }

    const std::string validated_project = project_dir->filename().string();
    CROW_LOG_INFO << "Staging info: project_id=" << validated_project;

    auto files = listFiles(*project_dir);
    if (!files) {
        return std::move(files.error());
    }

    StagingInfo info;
    info.project_id = validated_project;
    info.staging_path = logicalPath(validated_project);
    info.files = std::move(*files);
    for (const auto& file : info.files) {
        info.total_size_bytes += file.size;
    }
    return info;
}

Result<bool> StagingService::hasStagedFiles(const std::string& project_id) const {
    auto info = stagingInfo(project_id);
    if (!info) {
        return std::move(info.error());
    }
    return !info->files.empty();
}

Result<ClearReceipt> StagingService::clear(const std::string& project_id) const {
    auto project_dir = _guard->projectDirectory(project_id);
    if (!project_dir) {
        return std::move(project_dir.error());
    }

    const std::string validated_project = project_dir->filename().string();
    CROW_LOG_INFO << "Staging clear: project_id=" << validated_project;

    auto files = listFiles(*project_dir);
    if (!files) {
        return std::move(files.error());
    }

    std::error_code ec;
    fs::remove_all(*project_dir, ec);
    if (ec) {
        return Error::Io("Failed to clear staging directory", ec.message());
    }

    ClearReceipt receipt;
    receipt.project_id = validated_project;
    receipt.files_deleted = files->size();
    return receipt;
}

Result<DeleteReceipt> StagingService::deleteProject(const std::string& project_id) const {
    auto project_dir = _guard->projectDirectory(project_id);
    if (!project_dir) {
        return std::move(project_dir.error());
    }

    const std::string validated_project = project_dir->filename().string();
    CROW_LOG_INFO << "Staging delete: project_id=" << validated_project;

    std::error_code ec;
    fs::remove_all(*project_dir, ec);
    if (ec) {
        return Error::Io("Failed to delete staging directory", ec.message());
    }

    DeleteReceipt receipt;
    receipt.project_id = validated_project;
    return receipt;
}

} // namespace stagegate
