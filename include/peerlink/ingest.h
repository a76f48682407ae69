#pragma once
// ═══════════════════════════════════════════════════════════════════
//  peerlink/ingest.h — Writes decoded file parts to the upload dir
// ═══════════════════════════════════════════════════════════════════
//
//  The ingestor is the decoder's consumer: every part with a filename
//  is streamed to <uploadDir>/<uuid>-<sanitized name>, form fields are
//  skipped. A decode or write failure removes every file this call
//  already wrote, so a submission never half-succeeds.
//
// ═══════════════════════════════════════════════════════════════════

#include "multipart.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace peerlink::ingest {

struct Artifact {
    std::filesystem::path path;
    std::string           originalName;
    std::uintmax_t        size = 0;
    std::string           sha256;
};

struct Options {
    std::size_t bufferBytes = 64 * 1024;
};

// ── Replace path separators and characters reserved on common filesystems ──
std::string sanitizeFilename(const std::string& name);

class ArtifactIngestor {
public:
    explicit ArtifactIngestor(std::filesystem::path uploadDir, Options options = {});

    // Consumes the whole decoder. Throws DecodeError or std::runtime_error
    // after rolling back the files written so far.
    std::vector<Artifact> ingest(multipart::Decoder& decoder);

    // Best-effort removal; failures are logged
    static void discard(const std::vector<Artifact>& artifacts);

    const std::filesystem::path& uploadDir() const { return uploadDir_; }

private:
    Artifact writePart(multipart::Part& part);

    std::filesystem::path uploadDir_;
    Options options_;
};

} // namespace peerlink::ingest
