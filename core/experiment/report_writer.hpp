#pragma once

#include "propagation/propagation_result.hpp"

#include <cstddef>
#include <ostream>
#include <string>

namespace ideodrift {

/// Line-oriented CSV report of propagation records.
/// One header line, then one line per observable hop.
class ReportWriter {
public:
    explicit ReportWriter(std::ostream& out) : out_(out) {}

    static std::string header();
    static std::string formatRecord(size_t run_id, const PropagationResult& record);

    void writeHeader();
    void writeRecord(size_t run_id, const PropagationResult& record);
    void writeRun(size_t run_id, const PropagationRun& run);

    size_t linesWritten() const { return lines_written_; }

private:
    std::ostream& out_;
    size_t lines_written_ = 0;
};

} // namespace ideodrift
