#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <crow/json.h>

#include "error.hpp"
#include "identifier_validator.hpp"
#include "staging_path_guard.hpp"

namespace stagegate {

struct StagedFile {
    std::string name;        // Relative to the project staging directory
    std::uintmax_t size = 0;
    std::string modified_at; // Local time, ISO 8601
};

struct StagingInfo {
    std::string project_id;
    std::string staging_path;
    std::vector<StagedFile> files;
    std::uintmax_t total_size_bytes = 0;

    crow::json::wvalue toJson() const;
};

struct UploadReceipt {
    std::string project_id;
    std::string filename;
    std::string path;
    std::uintmax_t size = 0;

    crow::json::wvalue toJson() const;
};

struct ClearReceipt {
    std::string project_id;
    size_t files_deleted = 0;

    crow::json::wvalue toJson() const;
};

struct DeleteReceipt {
    std::string project_id;

    crow::json::wvalue toJson() const;
};

/**
 * Upload, listing, clearing and deletion of per-project staging files.
 *
 * Every path handed to a filesystem call comes out of the StagingPathGuard.
 * Uploads are written to a temporary file in the target directory and
 * renamed into place, so concurrent readers never see a partial file.
 */
class StagingService {
public:
    StagingService(std::shared_ptr<const StagingPathGuard> guard, size_t max_file_bytes);

    Result<UploadReceipt> upload(const std::string& project_id,
                                 const std::string& filename,
                                 const std::string& content,
                                 const std::string& encoding = "utf-8") const;

    Result<StagingInfo> stagingInfo(const std::string& project_id) const;

    Result<ClearReceipt> clear(const std::string& project_id) const;

    Result<DeleteReceipt> deleteProject(const std::string& project_id) const;

    // True when at least one regular file is staged for the project
    Result<bool> hasStagedFiles(const std::string& project_id) const;

    /**
     * Decode upload content. Base64 input must use the standard alphabet
     * with correct padding; embedded whitespace is ignored.
     */
    static Result<std::string> decodeContent(const std::string& content, ContentEncoding encoding);

    size_t maxFileBytes() const { return _max_file_bytes; }

private:
    std::shared_ptr<const StagingPathGuard> _guard;
    size_t _max_file_bytes;

    Result<std::vector<StagedFile>> listFiles(const std::filesystem::path& project_dir) const;
    static Result<bool> writeAtomically(const std::filesystem::path& target, const std::string& data);
    static std::string logicalPath(const std::string& project_id, const std::string& filename = "");
};

} // namespace stagegate
