#pragma once

// ============================================================
// frame_sink.hpp -- Where presentation units go
//
// The barcode renderer itself is an external tool; a sink hands it
// the serialized frame either as one line on a stream (pipe into a
// QR encoder / display) or as one file per frame.
// ============================================================

#include "sender_session.hpp"
#include <string>
#include <ostream>

class FrameSink {
public:
    virtual ~FrameSink() = default;

    // Throws std::runtime_error if the unit cannot be delivered
    virtual void present(const PresentationUnit& unit) = 0;

    // Where units end up, for log lines
    virtual std::string describe() const = 0;
};

// One serialized frame per line
class StreamFrameSink : public FrameSink {
public:
    explicit StreamFrameSink(std::ostream& out) : out_(out) {}

    void present(const PresentationUnit& unit) override;
    std::string describe() const override { return "stream"; }

private:
    std::ostream& out_;
};

// One file per frame: <filename>_part_001_of_013.txt
class DirectoryFrameSink : public FrameSink {
public:
    explicit DirectoryFrameSink(const std::string& dir);

    void present(const PresentationUnit& unit) override;
    std::string describe() const override { return dir_; }

    // File name used for a unit
    static std::string unit_file_name(const PresentationUnit& unit);

private:
    std::string dir_;
};
