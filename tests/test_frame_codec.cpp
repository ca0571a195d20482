#include "../common/frame_codec.hpp"
#include "../common/base64.hpp"
#include "../common/compress.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace {

Frame make_frame(u32 part, u32 total, const std::string& name, std::vector<u8> data) {
    Frame f;
    f.part = part;
    f.total = total;
    f.filename = name;
    f.data = std::move(data);
    return f;
}

} // namespace

TEST(FrameCodec, RoundTrip) {
    Frame f = make_frame(2, 3, "report.pdf", pattern_bytes(2048));
    DecodeResult r = proto::decode_frame(proto::encode_frame(f));
    ASSERT_TRUE(r.ok()) << r.detail;
    EXPECT_EQ(r.frame, f);
}

TEST(FrameCodec, RoundTripEmptyData) {
    Frame f = make_frame(1, 1, "empty.bin", {});
    DecodeResult r = proto::decode_frame(proto::encode_frame(f));
    ASSERT_TRUE(r.ok()) << r.detail;
    EXPECT_TRUE(r.frame.data.empty());
    EXPECT_EQ(r.frame, f);
}

TEST(FrameCodec, RoundTripZeroBytes) {
    std::vector<u8> zeros(100, 0);
    zeros[50] = 0xFF;
    Frame f = make_frame(1, 2, "zeros.bin", zeros);
    DecodeResult r = proto::decode_frame(proto::encode_frame(f));
    ASSERT_TRUE(r.ok()) << r.detail;
    EXPECT_EQ(r.frame.data, zeros);
}

TEST(FrameCodec, WireFormatHasFourShortKeys) {
    std::vector<u8> data{'h', 'i'};
    std::string text = proto::encode_frame(1, 3, "a.txt", data.data(), data.size());
    EXPECT_EQ(text, "{\"p\":1,\"t\":3,\"f\":\"a.txt\",\"d\":\"aGk=\"}");
}

TEST(FrameCodec, EncodeRejectsInvalidFrames) {
    std::vector<u8> data{1};
    EXPECT_THROW(proto::encode_frame(0, 1, "a", data.data(), 1), std::invalid_argument);
    EXPECT_THROW(proto::encode_frame(2, 1, "a", data.data(), 1), std::invalid_argument);
    EXPECT_THROW(proto::encode_frame(1, 1, "dir/a", data.data(), 1), std::invalid_argument);
    EXPECT_THROW(proto::encode_frame(1, 1, "..", data.data(), 1), std::invalid_argument);
}

TEST(FrameCodec, ForeignCodesAreMalformed) {
    const char* foreign[] = {
        "",
        "https://example.com/menu",
        "WIFI:S:home;T:WPA;P:secret;;",
        "{not json",
        "[1, 2, 3]",
        "42",
        "\"p\"",
        "{\"url\": \"https://example.com\"}",
        "{}",
    };
    for (const char* text : foreign) {
        DecodeResult r = proto::decode_frame(text);
        EXPECT_EQ(r.status, DecodeStatus::MALFORMED) << text;
    }
}

TEST(FrameCodec, DamagedFramesAreInvalidFields) {
    const char* damaged[] = {
        "{\"p\":1,\"t\":2}",
        "{\"p\":1,\"t\":2,\"f\":\"a\"}",
        "{\"p\":0,\"t\":2,\"f\":\"a\",\"d\":\"\"}",
        "{\"p\":-1,\"t\":2,\"f\":\"a\",\"d\":\"\"}",
        "{\"p\":3,\"t\":2,\"f\":\"a\",\"d\":\"\"}",
        "{\"p\":\"1\",\"t\":2,\"f\":\"a\",\"d\":\"\"}",
        "{\"p\":1.5,\"t\":2,\"f\":\"a\",\"d\":\"\"}",
        "{\"p\":1,\"t\":2,\"f\":7,\"d\":\"\"}",
        "{\"p\":1,\"t\":2,\"f\":\"../etc/passwd\",\"d\":\"\"}",
        "{\"p\":1,\"t\":2,\"f\":\"a\",\"d\":\"@@@@\"}",
        "{\"p\":1,\"t\":2,\"f\":\"a\",\"d\":\"abc\"}",
        "{\"p\":1,\"t\":2,\"f\":\"a\",\"d\":\"\",\"z\":\"yes\"}",
        "{\"p\":1,\"t\":4294967296,\"f\":\"a\",\"d\":\"\"}",
    };
    for (const char* text : damaged) {
        DecodeResult r = proto::decode_frame(text);
        EXPECT_EQ(r.status, DecodeStatus::INVALID_FIELDS) << text;
        EXPECT_FALSE(r.detail.empty());
    }
}

TEST(FrameCodec, UnknownExtraKeysAreTolerated) {
    DecodeResult r = proto::decode_frame("{\"p\":1,\"t\":1,\"f\":\"a\",\"d\":\"aGk=\",\"v\":2}");
    ASSERT_TRUE(r.ok()) << r.detail;
    EXPECT_EQ(r.frame.data, (std::vector<u8>{'h', 'i'}));
}

TEST(FrameCodec, CompressedFrameRoundTrips) {
    std::vector<u8> text_like(2048, 'A');
    std::string wire = proto::encode_frame(1, 2, "log.txt", text_like.data(), text_like.size(),
                                           /*allow_compress=*/true);
    auto j = nlohmann::json::parse(wire);
    EXPECT_EQ(j.value("z", 0), 1);
    EXPECT_LT(wire.size(), base64::encode(text_like).size());

    DecodeResult r = proto::decode_frame(wire);
    ASSERT_TRUE(r.ok()) << r.detail;
    EXPECT_EQ(r.frame.data, text_like);
}

TEST(FrameCodec, CompressionOffLeavesNoFlag) {
    std::vector<u8> text_like(2048, 'A');
    std::string wire = proto::encode_frame(1, 2, "log.txt", text_like.data(), text_like.size());
    EXPECT_FALSE(nlohmann::json::parse(wire).contains("z"));
}

TEST(FrameCodec, BadZstdPayloadIsInvalidFields) {
    std::vector<u8> junk{'n', 'o', 't', 'z', 's', 't', 'd'};
    std::string wire = "{\"p\":1,\"t\":1,\"f\":\"a\",\"d\":\"" + base64::encode(junk) + "\",\"z\":1}";
    EXPECT_EQ(proto::decode_frame(wire).status, DecodeStatus::INVALID_FIELDS);
}

TEST(FrameCodec, OversizedZstdPayloadIsRejected) {
    std::vector<u8> big(MAX_CHUNK_SIZE * 4, 'B');
    std::vector<u8> packed = compress::compress_to_vec(big.data(), big.size());
    std::string wire = "{\"p\":1,\"t\":1,\"f\":\"a\",\"d\":\"" + base64::encode(packed) + "\",\"z\":1}";
    EXPECT_EQ(proto::decode_frame(wire).status, DecodeStatus::INVALID_FIELDS);
}

TEST(Base64, KnownVectors) {
    auto enc = [](const std::string& s) {
        return base64::encode(reinterpret_cast<const u8*>(s.data()), s.size());
    };
    EXPECT_EQ(enc(""), "");
    EXPECT_EQ(enc("f"), "Zg==");
    EXPECT_EQ(enc("fo"), "Zm8=");
    EXPECT_EQ(enc("foo"), "Zm9v");
    EXPECT_EQ(enc("foobar"), "Zm9vYmFy");

    std::vector<u8> out;
    EXPECT_TRUE(base64::decode("Zm9vYg==", out));
    EXPECT_EQ(std::string(out.begin(), out.end()), "foob");
    EXPECT_FALSE(base64::decode("Zm9vYg=", out));
    EXPECT_FALSE(base64::decode("Zm=vYg==", out));
    EXPECT_FALSE(base64::decode("Zm9v!mFy", out));
}
