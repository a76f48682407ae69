// ═══════════════════════════════════════════════════════════════════
//  src/ingest.cpp — Artifact ingestion from multipart parts
// ═══════════════════════════════════════════════════════════════════

#include "peerlink/ingest.h"
#include "peerlink/console.h"
#include "peerlink/crypto.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace peerlink::ingest {

namespace fs = std::filesystem;

std::string sanitizeFilename(const std::string& name) {
    // Browsers on some platforms send the full client path
    auto slash = name.find_last_of("/\\");
    std::string base = slash == std::string::npos ? name : name.substr(slash + 1);

    std::string cleaned;
    cleaned.reserve(base.size());
    for (char c : base) {
        auto uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || std::strchr(":*?\"<>|", c) != nullptr) {
            cleaned += '_';
        } else {
            cleaned += c;
        }
    }

    if (cleaned.size() > 200) cleaned.resize(200);
    if (cleaned.empty() || cleaned == "." || cleaned == "..") return "file";
    return cleaned;
}

ArtifactIngestor::ArtifactIngestor(fs::path uploadDir, Options options)
    : uploadDir_(std::move(uploadDir))
    , options_(options)
{
    fs::create_directories(uploadDir_);
}

std::vector<Artifact> ArtifactIngestor::ingest(multipart::Decoder& decoder) {
    std::vector<Artifact> written;
    try {
        while (auto part = decoder.next()) {
            if (!part->isFile()) {
                console::debug("Skipping form field", part->name(), "(part", part->index(), ")");
                continue;
            }
            written.push_back(writePart(*part));
        }
    } catch (const DecodeError& e) {
        console::warn("Upload rejected at part",
                      e.partIndex() ? std::to_string(*e.partIndex()) : std::string("<preamble>"),
                      "-", e.what(), "- discarding", written.size(), "file(s)");
        discard(written);
        throw;
    } catch (const std::exception& e) {
        console::error("Upload failed:", e.what(), "- discarding", written.size(), "file(s)");
        discard(written);
        throw;
    }
    return written;
}

Artifact ArtifactIngestor::writePart(multipart::Part& part) {
    Artifact artifact;
    artifact.originalName = sanitizeFilename(part.filename());
    artifact.path = uploadDir_ / (crypto::uuid() + "-" + artifact.originalName);

    std::ofstream out(artifact.path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Failed to create " + artifact.path.string()
                                 + " (" + std::strerror(errno) + ")");
    }

    try {
        crypto::Sha256 hash;
        std::vector<char> buffer(options_.bufferBytes);
        while (auto n = part.read(buffer.data(), buffer.size())) {
            out.write(buffer.data(), static_cast<std::streamsize>(n));
            if (!out) {
                throw std::runtime_error("Failed to write " + artifact.path.string());
            }
            hash.update(buffer.data(), n);
            artifact.size += n;
        }
        out.close();
        if (!out) {
            throw std::runtime_error("Failed to flush " + artifact.path.string());
        }
        artifact.sha256 = hash.hexDigest();
    } catch (const std::exception&) {
        out.close();
        std::error_code ec;
        fs::remove(artifact.path, ec);
        throw;
    }

    console::info("Stored", artifact.originalName, "as", artifact.path.filename().string(),
                  "(" + std::to_string(artifact.size) + " bytes)");
    return artifact;
}

void ArtifactIngestor::discard(const std::vector<Artifact>& artifacts) {
    for (auto& artifact : artifacts) {
        std::error_code ec;
        fs::remove(artifact.path, ec);
        if (ec) {
            console::warn("Could not remove", artifact.path.string(), "-", ec.message());
        }
    }
}

} // namespace peerlink::ingest
