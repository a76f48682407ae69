#pragma once
// ═══════════════════════════════════════════════════════════════════
//  peerlink/bundle.h — Zip bundling of multi-file submissions (zlib)
// ═══════════════════════════════════════════════════════════════════
//
//  A submission with several files is offered as one zip archive.
//  Entries are deflated in a single streaming pass; sizes and CRCs
//  follow each entry in a data descriptor so no input is read twice.
//  Archives are limited to the classic (non-zip64) format.
//
// ═══════════════════════════════════════════════════════════════════

#include "crypto.h"
#include "ingest.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <unordered_set>
#include <vector>

#include <zlib.h>

namespace peerlink::bundle {

class ZipWriter {
public:
    explicit ZipWriter(const std::filesystem::path& path, int level = Z_DEFAULT_COMPRESSION);

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    // Deflates `source` into the archive under `entryName`
    void addFile(const std::filesystem::path& source, const std::string& entryName);

    // Writes the central directory; no entries may be added afterwards.
    // Returns the SHA-256 of the complete archive.
    std::string finish();

    std::size_t entryCount() const { return entries_.size(); }
    std::uint64_t bytesWritten() const { return written_; }

private:
    struct Entry {
        std::string   name;
        std::uint32_t crc = 0;
        std::uint32_t compressedSize = 0;
        std::uint32_t size = 0;
        std::uint32_t offset = 0;
    };

    void put16(std::uint16_t v);
    void put32(std::uint32_t v);
    void putBytes(const char* data, std::size_t size);

    std::ofstream      out_;
    crypto::Sha256     hash_;
    int                level_;
    std::uint64_t      written_ = 0;
    std::uint16_t      dosTime_ = 0;
    std::uint16_t      dosDate_ = 0;
    std::vector<Entry> entries_;
    bool               finished_ = false;
};

// ── Unique entry name: "a.txt", "a-2.txt", "a-3.txt", ... ──
std::string uniqueEntryName(const std::string& name, std::unordered_set<std::string>& used);

// Bundles the artifacts into <dir>/bundle-<uuid>.zip and describes the
// archive as an artifact of its own. A partially written archive is
// removed before the error propagates.
ingest::Artifact createBundle(const std::vector<ingest::Artifact>& artifacts,
                              const std::filesystem::path& dir);

} // namespace peerlink::bundle
