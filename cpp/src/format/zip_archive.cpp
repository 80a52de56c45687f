#include "redactor/format/zip_archive.hpp"
#include "redactor/error.hpp"

#include <miniz.h>

#include <algorithm>
#include <cstring>

namespace redactor {

// =============================================================================
// ZipReader
// =============================================================================

struct ZipReader::Impl {
    mz_zip_archive archive;
    ByteBuffer storage;

    Impl() { std::memset(&archive, 0, sizeof(archive)); }
};

ZipReader::ZipReader(const ByteBuffer& bytes) : impl_(std::make_unique<Impl>()) {
    impl_->storage = bytes;
    if (impl_->storage.empty() ||
        !mz_zip_reader_init_mem(&impl_->archive, impl_->storage.data(), impl_->storage.size(), 0)) {
        throw ExtractionError("Not a readable ZIP container",
                              mz_zip_get_error_string(mz_zip_get_last_error(&impl_->archive)));
    }
}

ZipReader::~ZipReader() {
    mz_zip_reader_end(&impl_->archive);
}

bool ZipReader::contains(const std::string& name) const {
    return mz_zip_reader_locate_file(&impl_->archive, name.c_str(), nullptr, 0) >= 0;
}

std::optional<std::string> ZipReader::read(const std::string& name) const {
    const int index = mz_zip_reader_locate_file(&impl_->archive, name.c_str(), nullptr, 0);
    if (index < 0) return std::nullopt;

    size_t size = 0;
    void* data = mz_zip_reader_extract_to_heap(&impl_->archive, static_cast<mz_uint>(index), &size, 0);
    if (!data) {
        throw ExtractionError("Unable to inflate ZIP entry", name);
    }
    std::string out(static_cast<const char*>(data), size);
    mz_free(data);
    return out;
}

std::vector<std::string> ZipReader::entries() const {
    std::vector<std::string> names;
    const mz_uint count = mz_zip_reader_get_num_files(&impl_->archive);
    for (mz_uint i = 0; i < count; ++i) {
        mz_zip_archive_file_stat stat;
        if (!mz_zip_reader_file_stat(&impl_->archive, i, &stat)) {
            throw ExtractionError("Corrupt ZIP directory entry", std::to_string(i));
        }
        names.emplace_back(stat.m_filename);
    }
    std::sort(names.begin(), names.end());
    return names;
}

// =============================================================================
// ZipWriter
// =============================================================================

struct ZipWriter::Impl {
    mz_zip_archive archive;
    bool open = false;

    Impl() { std::memset(&archive, 0, sizeof(archive)); }
};

ZipWriter::ZipWriter() : impl_(std::make_unique<Impl>()) {
    if (!mz_zip_writer_init_heap(&impl_->archive, 0, 0)) {
        throw ReconstructionError("Unable to initialise ZIP writer");
    }
    impl_->open = true;
}

ZipWriter::~ZipWriter() {
    if (impl_->open) {
        mz_zip_writer_end(&impl_->archive);
    }
}

void ZipWriter::add(const std::string& name, const std::string& data) {
    if (!impl_->open) {
        throw ReconstructionError("ZIP writer already finished", name);
    }
    if (!mz_zip_writer_add_mem(&impl_->archive, name.c_str(), data.data(), data.size(),
                               MZ_DEFAULT_COMPRESSION)) {
        throw ReconstructionError("Unable to add ZIP entry", name);
    }
}

ByteBuffer ZipWriter::finish() {
    if (!impl_->open) {
        throw ReconstructionError("ZIP writer already finished");
    }

    void* data = nullptr;
    size_t size = 0;
    const bool ok = mz_zip_writer_finalize_heap_archive(&impl_->archive, &data, &size);
    mz_zip_writer_end(&impl_->archive);
    impl_->open = false;

    if (!ok || !data) {
        if (data) mz_free(data);
        throw ReconstructionError("Unable to finalise ZIP archive");
    }

    ByteBuffer out(static_cast<const uint8_t*>(data), static_cast<const uint8_t*>(data) + size);
    mz_free(data);
    return out;
}

} // namespace redactor
