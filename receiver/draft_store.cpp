// ============================================================
// draft_store.cpp
// ============================================================

#include "draft_store.hpp"
#include "../common/file_io.hpp"
#include "../common/hash.hpp"
#include "../common/logger.hpp"
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace {

constexpr char SIDECAR_MAGIC[4] = {'F', 'C', 'D', '1'};
constexpr size_t SIDECAR_HEADER = 16;  // magic + total + chunk_size + last_len
constexpr u32 CHUNK_UNKNOWN = 0;

void put_u32(std::vector<u8>& out, u32 v) {
    for (int i = 0; i < 4; ++i) out.push_back((u8)(v >> (8 * i)));
}

u32 get_u32(const u8* p) {
    return (u32)p[0] | ((u32)p[1] << 8) | ((u32)p[2] << 16) | ((u32)p[3] << 24);
}

bool bit_set(const u8* bits, u32 idx) {
    return (bits[idx / 8] & (u8)(1u << (idx % 8))) != 0;
}

bool all_zero(const u8* p, size_t n) {
    for (size_t i = 0; i < n; ++i) {
        if (p[i]) return false;
    }
    return true;
}

} // namespace

DraftStore::DraftStore(std::string output_dir)
    : dir_(std::move(output_dir))
{
    fs::create_directories(dir_);
}

std::string DraftStore::output_path(const std::string& filename) const {
    return (fs::path(dir_) / ("RESTORED_" + filename)).string();
}

std::string DraftStore::draft_path(const std::string& filename) const {
    return (fs::path(dir_) / ("DRAFT_" + filename)).string();
}

std::string DraftStore::sidecar_path(const std::string& filename) const {
    return draft_path(filename) + ".parts";
}

std::string DraftStore::manifest_path(const std::string& filename) const {
    return (fs::path(dir_) / (filename + ".missing.json")).string();
}

void DraftStore::write_output(const std::string& filename, const std::vector<u8>& data) const {
    file_io::write_file_atomic(output_path(filename), data);
}

bool DraftStore::has_draft(const std::string& filename) const {
    std::error_code ec;
    return fs::is_regular_file(draft_path(filename), ec);
}

void DraftStore::save_draft(const std::string& filename, const PartMap& parts,
                            u32 total, u32 chunk_size, bool chunk_confirmed) const {
    std::vector<u8> draft = reassembler::assemble_draft(parts, total, chunk_size);

    // Sidecar: header, presence bitmap, then one digest slot per part
    std::vector<u8> side;
    side.reserve(SIDECAR_HEADER + (total + 7) / 8 + (size_t)total * 4);
    side.insert(side.end(), SIDECAR_MAGIC, SIDECAR_MAGIC + 4);
    put_u32(side, total);
    put_u32(side, chunk_confirmed ? chunk_size : CHUNK_UNKNOWN);
    auto last = parts.find(total);
    put_u32(side, last != parts.end() ? (u32)last->second.size() : 0u);

    size_t bitmap_at = side.size();
    side.resize(side.size() + (total + 7) / 8, 0);
    std::vector<u32> digests(total, 0);
    for (const auto& kv : parts) {
        if (kv.first < 1 || kv.first > total) continue;
        u32 idx = kv.first - 1;
        side[bitmap_at + idx / 8] |= (u8)(1u << (idx % 8));
        digests[idx] = hash::xxh3_32(kv.second.data(), kv.second.size());
    }
    for (u32 d : digests) put_u32(side, d);

    try {
        file_io::write_file_atomic(draft_path(filename), draft);
        file_io::write_file_atomic(sidecar_path(filename), side);
    } catch (const std::exception& e) {
        throw DraftWriteError("cannot write draft of " + filename + ": " + e.what());
    }
    LOG_INFO("Draft saved: " + draft_path(filename) + " (" + std::to_string(parts.size()) +
             "/" + std::to_string(total) + " parts, " + std::to_string(draft.size()) + " bytes)");
}

void DraftStore::save_manifest(const RemediationManifest& manifest) const {
    manifest.save(manifest_path(manifest.filename));
    LOG_INFO("Manifest saved: " + manifest_path(manifest.filename));
}

std::optional<ResumedDraft> DraftStore::load(const std::string& filename,
                                             u32 expected_total, u32 chunk_size) const {
    if (!has_draft(filename)) return std::nullopt;
    std::string path = draft_path(filename);
    std::error_code ec;

    std::vector<u8> draft;
    try {
        draft = file_io::read_small_file(path);
    } catch (const std::exception& e) {
        LOG_WARN("Ignoring unreadable draft: " + std::string(e.what()));
        return std::nullopt;
    }

    if (fs::is_regular_file(sidecar_path(filename), ec)) {
        auto resumed = load_with_sidecar(filename, draft, expected_total);
        if (resumed) return resumed;
    }
    return load_by_content(filename, draft, expected_total, chunk_size);
}

std::optional<ResumedDraft> DraftStore::load_with_sidecar(const std::string& filename,
                                                          const std::vector<u8>& draft,
                                                          u32 expected_total) const {
    std::string path = sidecar_path(filename);
    std::vector<u8> side;
    try {
        side = file_io::read_small_file(path);
    } catch (const std::exception& e) {
        LOG_WARN("Ignoring unreadable sidecar: " + std::string(e.what()));
        return std::nullopt;
    }

    if (side.size() < SIDECAR_HEADER || std::memcmp(side.data(), SIDECAR_MAGIC, 4) != 0) {
        LOG_WARN("Ignoring sidecar with bad header: " + path);
        return std::nullopt;
    }
    u32 total      = get_u32(side.data() + 4);
    u32 chunk_size = get_u32(side.data() + 8);
    u32 last_len   = get_u32(side.data() + 12);
    size_t bitmap_len = ((size_t)total + 7) / 8;
    if (total == 0 || side.size() != SIDECAR_HEADER + bitmap_len + (size_t)total * 4) {
        LOG_WARN("Ignoring truncated or inconsistent sidecar: " + path);
        return std::nullopt;
    }
    if (expected_total != 0 && total != expected_total) {
        LOG_WARN("Ignoring sidecar for " + filename + ": part count mismatch (saved=" +
                 std::to_string(total) + " current=" + std::to_string(expected_total) + ")");
        return std::nullopt;
    }

    const u8* bits    = side.data() + SIDECAR_HEADER;
    const u8* digests = bits + bitmap_len;

    // With the part size unknown only the final part can be held, and the
    // draft's stride follows from its length
    bool confirmed = chunk_size != CHUNK_UNKNOWN;
    u32 stride = chunk_size;
    if (!confirmed) {
        for (u32 idx = 0; idx + 1 < total; ++idx) {
            if (bit_set(bits, idx)) {
                LOG_WARN("Ignoring sidecar for " + filename +
                         ": part size unknown but non-final parts marked held");
                return std::nullopt;
            }
        }
        stride = 0;
        if (last_len != 0 && draft.size() >= last_len) {
            size_t body = draft.size() - last_len;
            if (total == 1) {
                stride = last_len;
            } else if (body % (total - 1) == 0) {
                stride = (u32)(body / (total - 1));
            }
        }
    }
    if (stride == 0 || last_len > stride ||
        draft.size() != (size_t)(total - 1) * stride + last_len) {
        LOG_WARN("Ignoring sidecar for " + filename + ": draft length " +
                 std::to_string(draft.size()) + " does not match");
        return std::nullopt;
    }

    ResumedDraft out;
    out.total = total;
    out.chunk_size = stride;
    out.chunk_confirmed = confirmed;
    out.from_sidecar = true;
    u32 rejected = 0;
    for (u32 idx = 0; idx < total; ++idx) {
        if (!bit_set(bits, idx)) continue;
        u32 part = idx + 1;
        size_t len = part < total ? stride : last_len;
        if (len == 0) continue;
        const u8* p = draft.data() + (size_t)idx * stride;
        if (hash::xxh3_32(p, len) != get_u32(digests + (size_t)idx * 4)) {
            ++rejected;
            continue;
        }
        out.parts.emplace(part, std::vector<u8>(p, p + len));
    }
    if (rejected) {
        LOG_WARN("Draft of " + filename + ": " + std::to_string(rejected) +
                 " part(s) failed digest check and must be resent");
    }
    return out;
}

std::optional<ResumedDraft> DraftStore::load_by_content(const std::string& filename,
                                                        const std::vector<u8>& draft,
                                                        u32 expected_total, u32 chunk_size) const {
    u32 total = expected_total;
    if (total == 0) {
        // Without a frame or sidecar the only record of the part count is the manifest
        try {
            total = RemediationManifest::load(manifest_path(filename)).total_parts;
        } catch (const std::exception& e) {
            LOG_WARN("Cannot resume " + filename + " without sidecar or manifest: " + e.what());
            return std::nullopt;
        }
    }
    if (chunk_size == 0) return std::nullopt;

    size_t body = (size_t)(total - 1) * chunk_size;
    if (draft.size() < body || draft.size() > body + chunk_size) {
        LOG_WARN("Ignoring draft of " + filename + ": length " + std::to_string(draft.size()) +
                 " does not fit " + std::to_string(total) + " parts of " +
                 std::to_string(chunk_size) + " bytes");
        return std::nullopt;
    }

    ResumedDraft out;
    out.total = total;
    out.chunk_size = chunk_size;
    out.chunk_confirmed = false;
    out.from_sidecar = false;
    for (u32 part = 1; part <= total; ++part) {
        size_t off = (size_t)(part - 1) * chunk_size;
        size_t len = part < total ? chunk_size : draft.size() - body;
        if (len == 0 || all_zero(draft.data() + off, len)) continue;
        out.parts.emplace(part, std::vector<u8>(draft.data() + off, draft.data() + off + len));
    }
    LOG_WARN("No sidecar for " + filename + ": all-zero parts of the draft are treated as missing");
    return out;
}

void DraftStore::discard(const std::string& filename) const {
    file_io::remove_file(draft_path(filename));
    file_io::remove_file(sidecar_path(filename));
    file_io::remove_file(manifest_path(filename));
}
