// ============================================================
// remediation_manifest.cpp
// ============================================================

#include "remediation_manifest.hpp"
#include "protocol.hpp"
#include "file_io.hpp"
#include "utils.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

void RemediationManifest::validate() const {
    if (!utils::validate_base_name(filename)) {
        throw ManifestFormatError("manifest filename is not a bare file name: '" + filename + "'");
    }
    if (total_parts == 0) {
        throw ManifestFormatError("manifest total_parts must be > 0");
    }
    u32 prev = 0;
    for (u32 p : missing) {
        if (p == 0 || p > total_parts) {
            throw ManifestFormatError("manifest part " + std::to_string(p) +
                                      " outside [1, " + std::to_string(total_parts) + "]");
        }
        if (p <= prev) {
            throw ManifestFormatError("manifest parts not strictly increasing at " +
                                      std::to_string(p));
        }
        prev = p;
    }
}

std::string RemediationManifest::to_json() const {
    nlohmann::ordered_json j;
    j[manifest_key::FILENAME]    = filename;
    j[manifest_key::TOTAL_PARTS] = total_parts;
    j[manifest_key::MISSING]     = missing;
    return j.dump(2) + "\n";
}

RemediationManifest RemediationManifest::from_json(const std::string& text) {
    json j = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) {
        throw ManifestFormatError("manifest is not a JSON object");
    }

    RemediationManifest m;
    try {
        m.filename = j.at(manifest_key::FILENAME).get<std::string>();

        const json& total = j.at(manifest_key::TOTAL_PARTS);
        if (!total.is_number_unsigned() || total.get<u64>() > 0xFFFFFFFFull) {
            throw ManifestFormatError("manifest total_parts is not a u32");
        }
        m.total_parts = total.get<u32>();

        const json& missing = j.at(manifest_key::MISSING);
        if (!missing.is_array()) {
            throw ManifestFormatError("manifest missing is not an array");
        }
        m.missing.reserve(missing.size());
        for (const auto& v : missing) {
            if (!v.is_number_unsigned() || v.get<u64>() > 0xFFFFFFFFull) {
                throw ManifestFormatError("manifest missing entry is not a u32");
            }
            m.missing.push_back(v.get<u32>());
        }
    } catch (const json::exception& e) {
        throw ManifestFormatError(std::string("manifest field error: ") + e.what());
    }

    m.validate();
    return m;
}

void RemediationManifest::save(const std::string& path) const {
    try {
        file_io::write_file_atomic(path, to_json());
    } catch (const std::exception& e) {
        throw ManifestWriteError("cannot write manifest " + path + ": " + e.what());
    }
}

RemediationManifest RemediationManifest::load(const std::string& path) {
    std::vector<u8> raw = file_io::read_small_file(path);
    return from_json(std::string(raw.begin(), raw.end()));
}
