// ═══════════════════════════════════════════════════════════════════
//  test_multipart.cpp — Tests for the streaming form-data decoder
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <peerlink/multipart.h>

#include <string>
#include <vector>

using namespace peerlink;
using namespace peerlink::multipart;

namespace {

struct Decoded {
    std::string name;
    std::string filename;
    std::string body;
};

std::vector<Decoded> decodeAll(const std::string& body, const std::string& boundary,
                               std::size_t chunk = 0, DecoderOptions options = {}) {
    Decoder decoder(stringSource(body, chunk), boundary, options);
    std::vector<Decoded> parts;
    while (auto part = decoder.next()) {
        parts.push_back({part->name(), part->filename(), part->readAll()});
    }
    return parts;
}

std::string binaryPayload(std::size_t size, unsigned seed) {
    std::string out(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        out[i] = static_cast<char>((i * 31 + seed * 7) & 0xFF);
    }
    return out;
}

} // namespace

TEST(MultipartTest, ParseFieldAndFile) {
    std::string body =
        "--boundary\r\n"
        "Content-Disposition: form-data; name=\"note\"\r\n"
        "\r\n"
        "skip me\r\n"
        "--boundary\r\n"
        "Content-Disposition: form-data; name=\"file\"; filename=\"greeting.txt\"\r\n"
        "Content-Type: text/plain\r\n"
        "\r\n"
        "hello world\r\n"
        "--boundary--\r\n";

    Decoder decoder(stringSource(body), "boundary");

    auto first = decoder.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->index(), 0u);
    EXPECT_EQ(first->name(), "note");
    EXPECT_FALSE(first->isFile());
    EXPECT_EQ(first->contentType(), "application/octet-stream");
    EXPECT_EQ(first->readAll(), "skip me");

    auto second = decoder.next();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->index(), 1u);
    EXPECT_TRUE(second->isFile());
    EXPECT_EQ(second->filename(), "greeting.txt");
    EXPECT_EQ(second->contentType(), "text/plain");
    EXPECT_EQ(second->readAll(), "hello world");

    EXPECT_FALSE(decoder.next().has_value());
    EXPECT_FALSE(decoder.next().has_value());
    EXPECT_EQ(decoder.partsDecoded(), 2u);
}

TEST(MultipartTest, DecodesManyPartsInOrderByteForByte) {
    const std::string boundary = "XyZ-7MA4YWxkTrZu0gW";
    std::vector<std::string> payloads;
    std::string body = "preamble that clients may send\r\n";
    for (unsigned i = 0; i < 6; ++i) {
        payloads.push_back(binaryPayload(1000 + i * 4099, i));
        body += "--" + boundary + "\r\n";
        body += "Content-Disposition: form-data; name=\"f" + std::to_string(i)
              + "\"; filename=\"f" + std::to_string(i) + ".bin\"\r\n\r\n";
        body += payloads.back() + "\r\n";
    }
    body += "--" + boundary + "--\r\nepilogue is ignored";

    auto parts = decodeAll(body, boundary);
    ASSERT_EQ(parts.size(), payloads.size());
    for (std::size_t i = 0; i < parts.size(); ++i) {
        EXPECT_EQ(parts[i].name, "f" + std::to_string(i));
        EXPECT_EQ(parts[i].body, payloads[i]) << "part " << i;
    }
}

TEST(MultipartTest, BoundaryTextWithoutLineBreakIsData) {
    std::string content =
        "--boundary at line start\r\n"
        "x--boundary--\r\n"
        "\r\n-boundary\r\n"
        "\r\n--boundar";
    std::string body =
        "--boundary\r\n"
        "Content-Disposition: form-data; name=\"f\"; filename=\"tricky.txt\"\r\n"
        "\r\n" + content + "\r\n"
        "--boundary--\r\n";

    auto parts = decodeAll(body, "boundary");
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].body, content);
}

TEST(MultipartTest, SingleByteReadsGiveSameResult) {
    std::string body =
        "--b\r\n"
        "Content-Disposition: form-data; name=\"a\"\r\n\r\n"
        "\r\r\n\r\n-\r\n--\r\n--c\r\n"
        "--b\r\n"
        "Content-Disposition: form-data; name=\"z\"; filename=\"z.txt\"\r\n\r\n"
        "last\r\n"
        "--b--";

    auto whole = decodeAll(body, "b");
    auto trickle = decodeAll(body, "b", 1);

    ASSERT_EQ(whole.size(), 2u);
    ASSERT_EQ(trickle.size(), 2u);
    EXPECT_EQ(whole[0].body, "\r\r\n\r\n-\r\n--\r\n--c");
    EXPECT_EQ(trickle[0].body, whole[0].body);
    EXPECT_EQ(trickle[1].body, "last");
}

TEST(MultipartTest, SmallReadBufferStreamsLargePart) {
    auto payload = binaryPayload(200000, 3);
    std::string body =
        "--edge\r\n"
        "Content-Disposition: form-data; name=\"f\"; filename=\"big.bin\"\r\n\r\n"
        + payload + "\r\n--edge--\r\n";

    DecoderOptions options;
    options.readBufferBytes = 7;
    auto parts = decodeAll(body, "edge", 13, options);
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].body.size(), payload.size());
    EXPECT_EQ(parts[0].body, payload);
}

TEST(MultipartTest, SkippingAPartDrainsIt) {
    std::string body =
        "--b\r\n"
        "Content-Disposition: form-data; name=\"ignored\"\r\n\r\n"
        + std::string(50000, 'q') + "\r\n"
        "--b\r\n"
        "Content-Disposition: form-data; name=\"kept\"\r\n\r\n"
        "value\r\n"
        "--b--\r\n";

    Decoder decoder(stringSource(body, 512), "b");
    auto first = decoder.next();
    ASSERT_TRUE(first.has_value());

    auto second = decoder.next();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->name(), "kept");
    EXPECT_EQ(second->readAll(), "value");

    // A part the decoder moved past reads nothing
    char buf[16];
    EXPECT_EQ(first->read(buf, sizeof(buf)), 0u);
}

TEST(MultipartTest, HeaderNamesAreCaseInsensitive) {
    std::string body =
        "--b\r\n"
        "CONTENT-DISPOSITION: form-data; NAME=\"upload\"; FileName=\"A.TXT\"\r\n"
        "content-type: text/plain\r\n"
        "X-Custom:   padded   \r\n"
        "\r\n"
        "data\r\n"
        "--b--\r\n";

    Decoder decoder(stringSource(body), "b");
    auto part = decoder.next();
    ASSERT_TRUE(part.has_value());
    EXPECT_EQ(part->name(), "upload");
    EXPECT_EQ(part->filename(), "A.TXT");
    EXPECT_EQ(part->header("Content-Type"), "text/plain");
    EXPECT_EQ(part->header("x-custom"), "padded");
    EXPECT_EQ(part->headers().count("content-disposition"), 1u);
}

TEST(MultipartTest, FoldedHeaderIsJoined) {
    std::string body =
        "--b\r\n"
        "Content-Disposition: form-data;\r\n"
        "\tname=\"folded\"\r\n"
        "\r\n"
        "x\r\n"
        "--b--\r\n";

    auto parts = decodeAll(body, "b");
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].name, "folded");
}

TEST(MultipartTest, EmptyPartBody) {
    std::string body =
        "--b\r\n"
        "Content-Disposition: form-data; name=\"f\"; filename=\"empty.txt\"\r\n\r\n"
        "\r\n"
        "--b--\r\n";

    auto parts = decodeAll(body, "b");
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_TRUE(parts[0].body.empty());
}

// ── Failures ──

TEST(MultipartTest, TruncatedBodyReportsPartIndex) {
    std::string body =
        "--b\r\n"
        "Content-Disposition: form-data; name=\"a\"\r\n\r\n"
        "complete\r\n"
        "--b\r\n"
        "Content-Disposition: form-data; name=\"f\"; filename=\"cut.bin\"\r\n\r\n"
        "this part never ends";

    Decoder decoder(stringSource(body), "b");
    auto first = decoder.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->readAll(), "complete");

    auto second = decoder.next();
    ASSERT_TRUE(second.has_value());
    try {
        second->readAll();
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Decode);
        ASSERT_TRUE(e.partIndex().has_value());
        EXPECT_EQ(*e.partIndex(), 1u);
    }

    // The decoder stays failed
    EXPECT_THROW(decoder.next(), DecodeError);
}

TEST(MultipartTest, MissingBoundaryHasNoPartIndex) {
    std::string body = "no delimiter anywhere in here\r\n";
    Decoder decoder(stringSource(body), "b");
    try {
        decoder.next();
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_FALSE(e.partIndex().has_value());
    }
}

TEST(MultipartTest, StreamEndingInsideHeaders) {
    std::string body =
        "--b\r\n"
        "Content-Disposition: form-data; name=\"a\"\r\n";
    Decoder decoder(stringSource(body), "b");
    try {
        decoder.next();
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        ASSERT_TRUE(e.partIndex().has_value());
        EXPECT_EQ(*e.partIndex(), 0u);
    }
}

TEST(MultipartTest, MalformedHeaderLine) {
    std::string body =
        "--b\r\n"
        "this line has no colon\r\n\r\n"
        "x\r\n--b--\r\n";
    Decoder decoder(stringSource(body), "b");
    EXPECT_THROW(decoder.next(), DecodeError);
}

TEST(MultipartTest, OversizedHeaderBlock) {
    std::string body =
        "--b\r\n"
        "Content-Disposition: form-data; name=\"" + std::string(5000, 'n') + "\"\r\n\r\n"
        "x\r\n--b--\r\n";

    DecoderOptions options;
    options.maxHeaderBytes = 1024;
    Decoder decoder(stringSource(body), "b", options);
    EXPECT_THROW(decoder.next(), DecodeError);
}

TEST(MultipartTest, GarbageAfterDelimiter) {
    std::string body =
        "--b\r\n"
        "Content-Disposition: form-data; name=\"a\"\r\n\r\n"
        "x\r\n"
        "--bogus\r\n";
    Decoder decoder(stringSource(body), "b");
    auto part = decoder.next();
    ASSERT_TRUE(part.has_value());
    EXPECT_THROW(part->readAll(), DecodeError);
}

TEST(MultipartTest, EmptyBoundaryRejected) {
    EXPECT_THROW(Decoder(stringSource("x"), ""), std::invalid_argument);
}

// ── Header helpers ──

TEST(MultipartTest, ContentTypeDetection) {
    EXPECT_TRUE(isMultipartFormData("multipart/form-data; boundary=abc"));
    EXPECT_TRUE(isMultipartFormData("Multipart/Form-Data;boundary=abc"));
    EXPECT_FALSE(isMultipartFormData("application/json"));
    EXPECT_FALSE(isMultipartFormData("multipart/mixed; boundary=abc"));
    EXPECT_FALSE(isMultipartFormData(""));
}

TEST(MultipartTest, ExtractBoundary) {
    EXPECT_EQ(extractBoundary("multipart/form-data; boundary=----WebKit7MA4"), "----WebKit7MA4");
    EXPECT_EQ(extractBoundary("multipart/form-data; boundary=\"quoted; value\""), "quoted; value");
    EXPECT_EQ(extractBoundary("multipart/form-data; charset=utf-8; BOUNDARY=abc"), "abc");
    EXPECT_EQ(extractBoundary("multipart/form-data"), "");
    EXPECT_EQ(extractBoundary("multipart/form-data; charset=utf-8"), "");
}

TEST(MultipartTest, ParseContentDisposition) {
    auto plain = parseContentDisposition("form-data; name=\"files\"; filename=\"a b.txt\"");
    EXPECT_EQ(plain.name, "files");
    EXPECT_EQ(plain.filename, "a b.txt");

    auto escaped = parseContentDisposition("form-data; name=\"f\"; filename=\"say \\\"hi\\\".txt\"");
    EXPECT_EQ(escaped.filename, "say \"hi\".txt");

    auto encoded = parseContentDisposition("form-data; name=\"f\"; filename=\"caf%C3%A9.txt\"");
    EXPECT_EQ(encoded.filename, "caf\xC3\xA9.txt");

    auto extended = parseContentDisposition(
        "form-data; name=\"f\"; filename=\"fallback.txt\"; filename*=UTF-8''r%C3%A9sum%C3%A9.pdf");
    EXPECT_EQ(extended.filename, "r\xC3\xA9sum\xC3\xA9.pdf");

    auto field = parseContentDisposition("form-data; name=\"only\"");
    EXPECT_EQ(field.name, "only");
    EXPECT_TRUE(field.filename.empty());
}
