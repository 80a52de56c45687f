#include "redactor/staging.hpp"
#include "redactor/error.hpp"
#include "redactor/logging.hpp"

#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace redactor {

namespace {

constexpr const char* kStagePrefix = "stage-";
constexpr const char* kStageSuffix = ".part";

std::string unique_stage_name() {
    std::random_device rd;
    std::uniform_int_distribution<uint64_t> dist;
    std::ostringstream ss;
    ss << kStagePrefix << std::hex << std::setw(16) << std::setfill('0') << dist(rd) << kStageSuffix;
    return ss.str();
}

void write_file(const fs::path& path, const ByteBuffer& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw IOError(ErrorCode::WRITE_FAILED, "Cannot open output file", path.string());
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
        throw IOError(ErrorCode::WRITE_FAILED, "Short write", path.string());
    }
}

} // namespace

// =============================================================================
// StagedOutput
// =============================================================================

StagedOutput::StagedOutput(const fs::path& staging_dir) {
    std::error_code ec;
    fs::create_directories(staging_dir, ec);
    if (ec) {
        throw IOError(ErrorCode::WRITE_FAILED, "Cannot create staging directory",
                      staging_dir.string() + ": " + ec.message());
    }
    fs::permissions(staging_dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) {
        LOG_WARN("Cannot restrict staging directory permissions: ", ec.message());
    }
    path_ = staging_dir / unique_stage_name();
}

StagedOutput::~StagedOutput() {
    if (!committed_) discard();
}

void StagedOutput::write(const ByteBuffer& bytes) {
    REDACTOR_CHECK(!committed_, ErrorCode::WRITE_FAILED, "Staged output already committed");

    written_ = true;
    write_file(path_, bytes);

    std::error_code ec;
    fs::permissions(path_, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
    if (ec) {
        throw IOError(ErrorCode::WRITE_FAILED, "Cannot restrict staged file permissions",
                      path_.string() + ": " + ec.message());
    }
}

void StagedOutput::commit(const fs::path& destination) {
    REDACTOR_CHECK(written_ && !committed_, ErrorCode::WRITE_FAILED, "Nothing staged to commit");

    std::error_code ec;
    fs::rename(path_, destination, ec);
    if (!ec) {
        committed_ = true;
        LOG_DEBUG("Output committed: ", destination.string());
        return;
    }

    if (ec != std::errc::cross_device_link) {
        throw IOError(ErrorCode::WRITE_FAILED, "Cannot move staged output into place",
                      destination.string() + ": " + ec.message());
    }

    // Different filesystem: copy beside the destination, then rename there
    fs::path sibling = destination;
    sibling += kStageSuffix;
    fs::copy_file(path_, sibling, fs::copy_options::overwrite_existing, ec);
    if (!ec) fs::rename(sibling, destination, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(sibling, ignored);
        throw IOError(ErrorCode::WRITE_FAILED, "Cannot move staged output into place",
                      destination.string() + ": " + ec.message());
    }

    discard();
    committed_ = true;
    LOG_DEBUG("Output committed across filesystems: ", destination.string());
}

void StagedOutput::discard() noexcept {
    if (!written_) return;
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        LOG_WARN("Cannot remove staging file ", path_.string(), ": ", ec.message());
    }
}

// =============================================================================
// Delivery
// =============================================================================

void deliver_document(RedactedDocument& document, const PipelineConfig& pipeline,
                      const fs::path& destination) {
    REDACTOR_CHECK(document.report.final_state == DocumentState::Validated ||
                   document.report.final_state == DocumentState::Delivered,
                   ErrorCode::SECURITY_VIOLATION, "Only validated documents can be delivered");

    StagedOutput staged(pipeline.staging_dir);
    staged.write(document.bytes);
    staged.commit(destination);

    LOG_INFO("Document ", to_string(document.report.final_state), " -> ",
             to_string(DocumentState::Delivered), ": ", document.bytes.size(), " bytes");
    document.report.final_state = DocumentState::Delivered;
}

// =============================================================================
// Retention
// =============================================================================

size_t purge_stale_staging(const fs::path& staging_dir, std::chrono::hours retention) {
    std::error_code ec;
    if (!fs::is_directory(staging_dir, ec)) return 0;

    const auto cutoff = fs::file_time_type::clock::now() - retention;
    size_t removed = 0;

    for (fs::directory_iterator it(staging_dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;
        const std::string name = entry.path().filename().string();
        if (name.rfind(kStagePrefix, 0) != 0 || !entry.is_regular_file()) continue;

        std::error_code file_ec;
        const auto modified = fs::last_write_time(entry.path(), file_ec);
        if (file_ec || modified >= cutoff) continue;

        if (fs::remove(entry.path(), file_ec)) {
            ++removed;
        } else if (file_ec) {
            LOG_WARN("Cannot purge staging file ", name, ": ", file_ec.message());
        }
    }
    if (ec) {
        LOG_WARN("Staging directory scan stopped early: ", ec.message());
    }

    if (removed > 0) {
        LOG_INFO("Purged ", removed, " stale staging file(s) from ", staging_dir.string());
    }
    return removed;
}

} // namespace redactor
