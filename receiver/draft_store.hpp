#pragma once

// ============================================================
// draft_store.hpp -- On-disk artifacts of one receiver output dir
//
//   RESTORED_<f>        finished file
//   DRAFT_<f>           offset-correct partial file
//   DRAFT_<f>.parts     presence bitmap + per-part xxh3-32 (sidecar)
//   <f>.missing.json    remediation manifest
// ============================================================

#include "../common/platform.hpp"
#include "../common/remediation_manifest.hpp"
#include "reassembler.hpp"
#include <string>
#include <vector>
#include <optional>
#include <stdexcept>

class DraftWriteError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Parts recovered from an earlier run's draft
struct ResumedDraft {
    u32     total{0};
    u32     chunk_size{0};            // stride the draft was read with
    bool    chunk_confirmed{false};   // true when the sender's part size is known
    PartMap parts;
    bool    from_sidecar{false};  // false = recovered by the non-zero-stride heuristic
};

class DraftStore {
public:
    // Creates output_dir if needed (throws std::filesystem::filesystem_error)
    explicit DraftStore(std::string output_dir);

    const std::string& dir() const { return dir_; }

    std::string output_path(const std::string& filename) const;
    std::string draft_path(const std::string& filename) const;
    std::string sidecar_path(const std::string& filename) const;
    std::string manifest_path(const std::string& filename) const;

    // Write the finished file. Throws std::runtime_error.
    void write_output(const std::string& filename, const std::vector<u8>& data) const;

    // Write draft + sidecar. chunk_size is the draft's stride; when
    // chunk_confirmed is false it is only a guess and the sidecar records
    // the part size as unknown. Throws DraftWriteError.
    void save_draft(const std::string& filename, const PartMap& parts,
                    u32 total, u32 chunk_size, bool chunk_confirmed = true) const;

    // Throws ManifestWriteError
    void save_manifest(const RemediationManifest& manifest) const;

    bool has_draft(const std::string& filename) const;

    // Look for a draft of filename. expected_total is the total announced by
    // the transfer (0 when no frame has been seen yet). chunk_size is used
    // only when there is no sidecar; 0 means unknown, and such a draft is
    // not scanned. Returns std::nullopt when there is no usable draft;
    // never throws.
    std::optional<ResumedDraft> load(const std::string& filename,
                                     u32 expected_total, u32 chunk_size) const;

    // Remove draft, sidecar and manifest of filename (missing files are fine)
    void discard(const std::string& filename) const;

private:
    std::string dir_;

    std::optional<ResumedDraft> load_with_sidecar(const std::string& filename,
                                                  const std::vector<u8>& draft,
                                                  u32 expected_total) const;
    std::optional<ResumedDraft> load_by_content(const std::string& filename,
                                                const std::vector<u8>& draft,
                                                u32 expected_total, u32 chunk_size) const;
};
