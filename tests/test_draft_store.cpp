#include "../receiver/draft_store.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <algorithm>

namespace {

// 5000 bytes, chunk 2048: parts of 2048, 2048 and 904 bytes
struct ThreeParts {
    std::vector<u8> content = pattern_bytes(5000);
    std::vector<u8> part(u32 p) const {
        size_t off = (size_t)(p - 1) * 2048;
        return slice(content, off, std::min<size_t>(2048, content.size() - off));
    }
};

} // namespace

TEST(DraftStore, ArtifactNames) {
    TempDir dir;
    DraftStore store(dir.str());
    EXPECT_EQ(store.output_path("a.bin"), dir.file("RESTORED_a.bin"));
    EXPECT_EQ(store.draft_path("a.bin"), dir.file("DRAFT_a.bin"));
    EXPECT_EQ(store.sidecar_path("a.bin"), dir.file("DRAFT_a.bin.parts"));
    EXPECT_EQ(store.manifest_path("a.bin"), dir.file("a.bin.missing.json"));
}

TEST(DraftStore, NoDraftMeansNothingToResume) {
    TempDir dir;
    DraftStore store(dir.str());
    EXPECT_FALSE(store.load("a.bin", 3, 2048).has_value());
    EXPECT_FALSE(store.load("a.bin", 0, 2048).has_value());
}

TEST(DraftStore, SidecarRoundTrip) {
    TempDir dir;
    DraftStore store(dir.str());
    ThreeParts f;
    PartMap parts;
    parts[1] = f.part(1);
    parts[3] = f.part(3);

    store.save_draft("a.bin", parts, 3, 2048);
    EXPECT_EQ(fs::file_size(store.draft_path("a.bin")), 5000u);

    auto resumed = store.load("a.bin", 0, 999);
    ASSERT_TRUE(resumed.has_value());
    EXPECT_TRUE(resumed->from_sidecar);
    EXPECT_EQ(resumed->total, 3u);
    EXPECT_EQ(resumed->chunk_size, 2048u);
    EXPECT_TRUE(resumed->chunk_confirmed);
    EXPECT_EQ(resumed->parts, parts);
}

TEST(DraftStore, UnknownPartSizeIsNotSavedAsFact) {
    TempDir dir;
    DraftStore store(dir.str());
    // Final part of a 2500-byte file sent in 1024-byte parts, laid out at a
    // guessed stride of 2048
    std::vector<u8> content = pattern_bytes(2500);
    PartMap parts;
    parts[3] = slice(content, 2048, 452);
    store.save_draft("u.bin", parts, 3, 2048, false);
    EXPECT_EQ(fs::file_size(store.draft_path("u.bin")), 2u * 2048 + 452);

    auto resumed = store.load("u.bin", 3, 0);
    ASSERT_TRUE(resumed.has_value());
    EXPECT_TRUE(resumed->from_sidecar);
    EXPECT_FALSE(resumed->chunk_confirmed);
    EXPECT_EQ(resumed->chunk_size, 2048u);
    EXPECT_EQ(resumed->parts, parts);

    // Without the sidecar the draft cannot be cut until the part size is known
    fs::remove(store.sidecar_path("u.bin"));
    EXPECT_FALSE(store.load("u.bin", 3, 0).has_value());
    EXPECT_TRUE(store.has_draft("u.bin"));
}

TEST(DraftStore, SidecarRestoresAllZeroPart) {
    TempDir dir;
    DraftStore store(dir.str());
    ThreeParts f;
    PartMap parts;
    parts[1] = f.part(1);
    parts[2] = std::vector<u8>(2048, 0);  // genuinely zero content

    store.save_draft("z.bin", parts, 3, 2048);
    auto with_sidecar = store.load("z.bin", 3, 2048);
    ASSERT_TRUE(with_sidecar.has_value());
    EXPECT_EQ(with_sidecar->parts.count(2), 1u);

    // The content scan cannot tell zero data from a gap
    fs::remove(store.sidecar_path("z.bin"));
    auto by_content = store.load("z.bin", 3, 2048);
    ASSERT_TRUE(by_content.has_value());
    EXPECT_FALSE(by_content->from_sidecar);
    EXPECT_EQ(by_content->parts.count(1), 1u);
    EXPECT_EQ(by_content->parts.count(2), 0u);
}

TEST(DraftStore, DamagedPartFailsDigestCheck) {
    TempDir dir;
    DraftStore store(dir.str());
    ThreeParts f;
    PartMap parts;
    parts[1] = f.part(1);
    parts[3] = f.part(3);
    store.save_draft("d.bin", parts, 3, 2048);

    std::vector<u8> draft = read_bytes(store.draft_path("d.bin"));
    draft[10] ^= 0xFF;
    write_bytes(store.draft_path("d.bin"), draft);

    auto resumed = store.load("d.bin", 3, 2048);
    ASSERT_TRUE(resumed.has_value());
    EXPECT_EQ(resumed->parts.count(1), 0u);
    EXPECT_EQ(resumed->parts.at(3), f.part(3));
}

TEST(DraftStore, ContentScanNeedsAPartCount) {
    TempDir dir;
    DraftStore store(dir.str());
    ThreeParts f;
    PartMap parts;
    parts[1] = f.part(1);
    parts[3] = f.part(3);
    store.save_draft("m.bin", parts, 3, 2048);
    fs::remove(store.sidecar_path("m.bin"));

    EXPECT_FALSE(store.load("m.bin", 0, 2048).has_value());

    RemediationManifest manifest;
    manifest.filename = "m.bin";
    manifest.total_parts = 3;
    manifest.missing = {2};
    store.save_manifest(manifest);

    auto resumed = store.load("m.bin", 0, 2048);
    ASSERT_TRUE(resumed.has_value());
    EXPECT_EQ(resumed->total, 3u);
    EXPECT_EQ(resumed->parts, parts);
}

TEST(DraftStore, DraftOfAnotherShapeIsIgnored) {
    TempDir dir;
    DraftStore store(dir.str());
    ThreeParts f;
    PartMap parts;
    parts[1] = f.part(1);
    store.save_draft("s.bin", parts, 3, 2048);

    // A transfer of 5 parts cannot match a 3-part draft of 4096 bytes
    EXPECT_FALSE(store.load("s.bin", 5, 2048).has_value());
}

TEST(DraftStore, DiscardRemovesEverything) {
    TempDir dir;
    DraftStore store(dir.str());
    PartMap parts;
    parts[1] = pattern_bytes(16);
    store.save_draft("x.bin", parts, 2, 16);

    RemediationManifest manifest;
    manifest.filename = "x.bin";
    manifest.total_parts = 2;
    manifest.missing = {2};
    store.save_manifest(manifest);

    store.discard("x.bin");
    EXPECT_FALSE(fs::exists(store.draft_path("x.bin")));
    EXPECT_FALSE(fs::exists(store.sidecar_path("x.bin")));
    EXPECT_FALSE(fs::exists(store.manifest_path("x.bin")));

    // Discarding again is harmless
    store.discard("x.bin");
}
