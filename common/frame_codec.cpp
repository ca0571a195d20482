// ============================================================
// frame_codec.cpp
// ============================================================

#include "frame_codec.hpp"
#include "base64.hpp"
#include "compress.hpp"
#include "utils.hpp"
#include <nlohmann/json.hpp>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;

namespace {

DecodeResult fail(DecodeStatus status, std::string detail) {
    DecodeResult r;
    r.status = status;
    r.detail = std::move(detail);
    return r;
}

// Reads a positive u32 field; false if absent, non-integer or out of range
bool read_count(const json& obj, const char* key, u32& out) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number_integer()) return false;
    if (it->is_number_unsigned()) {
        u64 v = it->get<u64>();
        if (v == 0 || v > std::numeric_limits<u32>::max()) return false;
        out = (u32)v;
        return true;
    }
    i64 v = it->get<i64>();
    if (v <= 0 || v > (i64)std::numeric_limits<u32>::max()) return false;
    out = (u32)v;
    return true;
}

// "z" may be true/false or 0/1
bool read_flag(const json& obj, const char* key, bool& out) {
    auto it = obj.find(key);
    if (it == obj.end()) { out = false; return true; }
    if (it->is_boolean()) { out = it->get<bool>(); return true; }
    if (it->is_number_integer()) {
        i64 v = it->get<i64>();
        if (v != 0 && v != 1) return false;
        out = (v == 1);
        return true;
    }
    return false;
}

} // namespace

std::string proto::encode_frame(u32 part, u32 total, const std::string& filename,
                                const u8* data, size_t len, bool allow_compress)
{
    if (total == 0 || part == 0 || part > total) {
        throw std::invalid_argument("frame part " + std::to_string(part) +
                                    " outside [1, " + std::to_string(total) + "]");
    }
    if (!utils::validate_base_name(filename)) {
        throw std::invalid_argument("frame filename is not a bare file name: " + filename);
    }

    nlohmann::ordered_json j;
    j[frame_key::PART]     = part;
    j[frame_key::TOTAL]    = total;
    j[frame_key::FILENAME] = filename;

    bool compressed = false;
    if (allow_compress && len > 0) {
        std::vector<u8> packed = compress::compress_to_vec(data, len);
        if (packed.size() < len) {
            j[frame_key::DATA] = base64::encode(packed);
            compressed = true;
        }
    }
    if (!compressed) {
        j[frame_key::DATA] = base64::encode(data, len);
    } else {
        j[frame_key::ZSTD] = 1;
    }
    return j.dump();
}

DecodeResult proto::decode_frame(const std::string& text) {
    if (text.empty() || text.size() > MAX_FRAME_TEXT_LEN) {
        return fail(DecodeStatus::MALFORMED, "empty or oversized payload");
    }

    json j = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        return fail(DecodeStatus::MALFORMED, "not JSON");
    }
    if (!j.is_object()) {
        return fail(DecodeStatus::MALFORMED, "JSON is not an object");
    }
    if (!j.contains(frame_key::PART) && !j.contains(frame_key::TOTAL) &&
        !j.contains(frame_key::FILENAME) && !j.contains(frame_key::DATA)) {
        return fail(DecodeStatus::MALFORMED, "no frame fields");
    }

    DecodeResult r;
    Frame& f = r.frame;

    if (!read_count(j, frame_key::PART, f.part)) {
        return fail(DecodeStatus::INVALID_FIELDS, "bad or missing 'p'");
    }
    if (!read_count(j, frame_key::TOTAL, f.total)) {
        return fail(DecodeStatus::INVALID_FIELDS, "bad or missing 't'");
    }
    if (f.part > f.total) {
        return fail(DecodeStatus::INVALID_FIELDS,
                    "part " + std::to_string(f.part) + " > total " + std::to_string(f.total));
    }

    auto fit = j.find(frame_key::FILENAME);
    if (fit == j.end() || !fit->is_string()) {
        return fail(DecodeStatus::INVALID_FIELDS, "bad or missing 'f'");
    }
    f.filename = fit->get<std::string>();
    if (!utils::validate_base_name(f.filename)) {
        return fail(DecodeStatus::INVALID_FIELDS, "unsafe filename");
    }

    auto dit = j.find(frame_key::DATA);
    if (dit == j.end() || !dit->is_string()) {
        return fail(DecodeStatus::INVALID_FIELDS, "bad or missing 'd'");
    }
    if (!base64::decode(dit->get_ref<const std::string&>(), f.data)) {
        return fail(DecodeStatus::INVALID_FIELDS, "'d' is not valid base64");
    }

    bool zstd = false;
    if (!read_flag(j, frame_key::ZSTD, zstd)) {
        return fail(DecodeStatus::INVALID_FIELDS, "bad 'z'");
    }
    if (zstd) {
        try {
            f.data = compress::decompress_to_vec(f.data.data(), f.data.size(), MAX_CHUNK_SIZE);
        } catch (const std::runtime_error& e) {
            return fail(DecodeStatus::INVALID_FIELDS, e.what());
        }
    }

    r.status = DecodeStatus::OK;
    return r;
}
