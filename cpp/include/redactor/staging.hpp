#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include "redactor/config.hpp"
#include "redactor/result.hpp"

namespace redactor {

/**
 * StagedOutput - a redacted document written to a private staging directory
 * and exposed at its destination only by commit().
 *
 * The staging file is created owner-read/write only. If the object is
 * destroyed without a successful commit() the staging file is removed, so a
 * failed or abandoned run never leaves output behind.
 */
class StagedOutput {
public:
    // Creates the staging directory if needed; throws IOError on failure
    explicit StagedOutput(const std::filesystem::path& staging_dir);
    ~StagedOutput();

    StagedOutput(const StagedOutput&) = delete;
    StagedOutput& operator=(const StagedOutput&) = delete;

    // Write (or overwrite) the staged bytes; throws IOError(WRITE_FAILED)
    void write(const ByteBuffer& bytes);

    /**
     * Move the staged file to destination by rename. When staging and
     * destination are on different filesystems the bytes are copied next to
     * the destination first and renamed from there.
     */
    void commit(const std::filesystem::path& destination);

    const std::filesystem::path& staged_path() const { return path_; }
    bool committed() const { return committed_; }

private:
    void discard() noexcept;

    std::filesystem::path path_;
    bool written_ = false;
    bool committed_ = false;
};

/**
 * Stage a validated document and deliver it to destination; its report moves
 * to Delivered once the file is in place.
 * Throws IOError if it cannot be written; nothing is left at destination then.
 */
void deliver_document(RedactedDocument& document, const PipelineConfig& pipeline,
                      const std::filesystem::path& destination);

/**
 * Remove staging files older than the retention window.
 * Returns the number of files removed; a missing directory counts as empty.
 */
size_t purge_stale_staging(const std::filesystem::path& staging_dir, std::chrono::hours retention);

} // namespace redactor
