#pragma once

// ============================================================
// remediation_manifest.hpp -- Persistent list of missing parts
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>
#include <stdexcept>

// Written by a receiver that stalled; read by the next sender run so it
// produces only the parts the receiver still lacks.
//   {"filename": "...", "total_parts": N, "missing": [a, b, ...]}

class ManifestFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ManifestWriteError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct RemediationManifest {
    std::string      filename;
    u32              total_parts{0};
    std::vector<u32> missing;   // strictly increasing, each in [1, total_parts]

    // Throws ManifestFormatError if the invariants above do not hold
    void validate() const;

    std::string to_json() const;

    // Throws ManifestFormatError on bad JSON or a violated invariant
    static RemediationManifest from_json(const std::string& text);

    // Throws ManifestWriteError
    void save(const std::string& path) const;

    // Throws std::runtime_error if unreadable, ManifestFormatError if invalid
    static RemediationManifest load(const std::string& path);
};
