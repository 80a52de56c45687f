#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "redactor/types.hpp"

namespace redactor {

/**
 * Read-only view of a ZIP container held in memory (miniz).
 * The archive bytes are copied; the source buffer may go away.
 */
class ZipReader {
public:
    // Throws ExtractionError if the bytes are not a readable ZIP archive
    explicit ZipReader(const ByteBuffer& bytes);
    ~ZipReader();

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    bool contains(const std::string& name) const;

    // Entry contents, or nullopt when the entry does not exist.
    // Throws ExtractionError if the entry exists but cannot be inflated.
    std::optional<std::string> read(const std::string& name) const;

    std::vector<std::string> entries() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * Builds a ZIP container in memory (miniz). Entries are written in the order
 * they are added.
 */
class ZipWriter {
public:
    ZipWriter();
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    // Throws ReconstructionError on failure
    void add(const std::string& name, const std::string& data);

    // Finish the archive and return its bytes; the writer cannot be reused
    ByteBuffer finish();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace redactor
