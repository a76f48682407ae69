// ═══════════════════════════════════════════════════════════════════
//  src/bundle.cpp — Streaming zip writer on top of zlib deflate
// ═══════════════════════════════════════════════════════════════════

#include "peerlink/bundle.h"
#include "peerlink/console.h"
#include "peerlink/crypto.h"

#include <chrono>
#include <ctime>
#include <limits>
#include <stdexcept>
#include <system_error>

namespace peerlink::bundle {

namespace fs = std::filesystem;

namespace {

constexpr std::uint32_t kLocalHeaderSig   = 0x04034b50;
constexpr std::uint32_t kDescriptorSig    = 0x08074b50;
constexpr std::uint32_t kCentralHeaderSig = 0x02014b50;
constexpr std::uint32_t kEndOfCentralSig  = 0x06054b50;

constexpr std::uint16_t kVersion       = 20;      // 2.0: deflate
constexpr std::uint16_t kFlags         = 0x0808;  // data descriptor | UTF-8 names
constexpr std::uint16_t kMethodDeflate = 8;

constexpr std::uint64_t kZip32Limit = std::numeric_limits<std::uint32_t>::max();

std::uint32_t checkedOffset(std::uint64_t value) {
    if (value >= kZip32Limit) {
        throw std::runtime_error("bundle exceeds the 4 GiB zip limit");
    }
    return static_cast<std::uint32_t>(value);
}

} // namespace

ZipWriter::ZipWriter(const fs::path& path, int level)
    : out_(path, std::ios::binary | std::ios::trunc)
    , level_(level)
{
    if (!out_) {
        throw std::runtime_error("Failed to create bundle " + path.string());
    }

    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    dosTime_ = static_cast<std::uint16_t>((local.tm_hour << 11) | (local.tm_min << 5) | (local.tm_sec / 2));
    dosDate_ = static_cast<std::uint16_t>(((local.tm_year - 80) << 9) | ((local.tm_mon + 1) << 5) | local.tm_mday);
}

void ZipWriter::put16(std::uint16_t v) {
    char b[2] = {static_cast<char>(v & 0xFF), static_cast<char>((v >> 8) & 0xFF)};
    putBytes(b, sizeof(b));
}

void ZipWriter::put32(std::uint32_t v) {
    char b[4] = {static_cast<char>(v & 0xFF), static_cast<char>((v >> 8) & 0xFF),
                 static_cast<char>((v >> 16) & 0xFF), static_cast<char>((v >> 24) & 0xFF)};
    putBytes(b, sizeof(b));
}

void ZipWriter::putBytes(const char* data, std::size_t size) {
    out_.write(data, static_cast<std::streamsize>(size));
    if (!out_) throw std::runtime_error("Failed to write bundle");
    hash_.update(data, size);
    written_ += size;
}

void ZipWriter::addFile(const fs::path& source, const std::string& entryName) {
    if (finished_) throw std::logic_error("ZipWriter: archive already finished");
    if (entries_.size() >= 0xFFFF) throw std::runtime_error("bundle has too many entries");
    if (entryName.size() > 0xFFFF) throw std::runtime_error("bundle entry name too long");

    std::ifstream in(source, std::ios::binary);
    if (!in) throw std::runtime_error("Failed to open " + source.string());

    Entry entry;
    entry.name   = entryName;
    entry.offset = checkedOffset(written_);

    // ── Local header; CRC and sizes follow in the data descriptor ──
    put32(kLocalHeaderSig);
    put16(kVersion);
    put16(kFlags);
    put16(kMethodDeflate);
    put16(dosTime_);
    put16(dosDate_);
    put32(0);
    put32(0);
    put32(0);
    put16(static_cast<std::uint16_t>(entryName.size()));
    put16(0);
    putBytes(entryName.data(), entryName.size());

    z_stream zs{};
    if (deflateInit2(&zs, level_, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }

    std::uint64_t size = 0;
    std::uint64_t compressed = 0;
    uLong crc = crc32(0L, Z_NULL, 0);
    std::vector<char> inBuf(64 * 1024);
    std::vector<char> outBuf(64 * 1024);

    try {
        int flush = Z_NO_FLUSH;
        do {
            in.read(inBuf.data(), static_cast<std::streamsize>(inBuf.size()));
            auto got = static_cast<std::size_t>(in.gcount());
            if (in.bad()) throw std::runtime_error("Failed to read " + source.string());
            flush = in.eof() ? Z_FINISH : Z_NO_FLUSH;

            crc = crc32(crc, reinterpret_cast<const Bytef*>(inBuf.data()), static_cast<uInt>(got));
            size += got;

            zs.next_in  = reinterpret_cast<Bytef*>(inBuf.data());
            zs.avail_in = static_cast<uInt>(got);
            do {
                zs.next_out  = reinterpret_cast<Bytef*>(outBuf.data());
                zs.avail_out = static_cast<uInt>(outBuf.size());
                if (deflate(&zs, flush) == Z_STREAM_ERROR) {
                    throw std::runtime_error("deflate failed");
                }
                auto produced = outBuf.size() - zs.avail_out;
                putBytes(outBuf.data(), produced);
                compressed += produced;
            } while (zs.avail_out == 0);
        } while (flush != Z_FINISH);
    } catch (const std::exception&) {
        deflateEnd(&zs);
        throw;
    }
    deflateEnd(&zs);

    entry.crc            = static_cast<std::uint32_t>(crc);
    entry.size           = checkedOffset(size);
    entry.compressedSize = checkedOffset(compressed);

    put32(kDescriptorSig);
    put32(entry.crc);
    put32(entry.compressedSize);
    put32(entry.size);

    entries_.push_back(std::move(entry));
}

std::string ZipWriter::finish() {
    if (finished_) throw std::logic_error("ZipWriter: archive already finished");

    auto centralOffset = checkedOffset(written_);
    for (auto& e : entries_) {
        put32(kCentralHeaderSig);
        put16(kVersion);
        put16(kVersion);
        put16(kFlags);
        put16(kMethodDeflate);
        put16(dosTime_);
        put16(dosDate_);
        put32(e.crc);
        put32(e.compressedSize);
        put32(e.size);
        put16(static_cast<std::uint16_t>(e.name.size()));
        put16(0);   // extra
        put16(0);   // comment
        put16(0);   // disk
        put16(0);   // internal attributes
        put32(0);   // external attributes
        put32(e.offset);
        putBytes(e.name.data(), e.name.size());
    }
    auto centralSize = checkedOffset(written_ - centralOffset);

    put32(kEndOfCentralSig);
    put16(0);
    put16(0);
    put16(static_cast<std::uint16_t>(entries_.size()));
    put16(static_cast<std::uint16_t>(entries_.size()));
    put32(centralSize);
    put32(centralOffset);
    put16(0);

    out_.close();
    if (!out_) throw std::runtime_error("Failed to close bundle");
    finished_ = true;
    return hash_.hexDigest();
}

std::string uniqueEntryName(const std::string& name, std::unordered_set<std::string>& used) {
    if (used.insert(name).second) return name;

    fs::path p(name);
    auto stem = p.stem().string();
    auto ext  = p.extension().string();
    for (int n = 2;; ++n) {
        auto candidate = stem + "-" + std::to_string(n) + ext;
        if (used.insert(candidate).second) return candidate;
    }
}

ingest::Artifact createBundle(const std::vector<ingest::Artifact>& artifacts, const fs::path& dir) {
    ingest::Artifact archive;
    archive.originalName = "bundle-" + crypto::uuid() + ".zip";
    archive.path = dir / archive.originalName;
    try {
        ZipWriter zip(archive.path);
        std::unordered_set<std::string> used;
        for (auto& artifact : artifacts) {
            zip.addFile(artifact.path, uniqueEntryName(artifact.originalName, used));
        }
        archive.sha256 = zip.finish();
        archive.size   = zip.bytesWritten();
    } catch (const std::exception& e) {
        console::error("Bundling failed:", e.what());
        std::error_code ec;
        fs::remove(archive.path, ec);
        throw;
    }

    console::info("Created bundle", archive.originalName, "with", artifacts.size(),
                  "file(s),", archive.size, "bytes");
    return archive;
}

} // namespace peerlink::bundle
