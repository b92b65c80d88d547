#ifndef SLIDELAYOUT_CORE_REPORT_H
#define SLIDELAYOUT_CORE_REPORT_H

#include "slidelayout/core/types.h"

#include <cstdint>
#include <string>

namespace slidelayout {

// Fold of per-object host mutations. Skipped objects are neither moved nor failed.
struct MutationTally {
    std::uint32_t succeeded{0};
    std::uint32_t failed{0};
    std::uint32_t skipped{0};

    void record(HostStatus status) {
        if (status == HostStatus::Ok) {
            succeeded++;
        } else {
            failed++;
        }
    }
    void skip() { skipped++; }
    std::uint32_t touched() const { return succeeded + failed; }
};

// Outcome of one public operation. `message` is what the UI shows verbatim.
struct OperationReport {
    LayoutError error{LayoutError::Ok};
    std::uint32_t succeeded{0};
    std::uint32_t failed{0};
    std::uint32_t skipped{0};
    std::string message;

    bool ok() const { return error == LayoutError::Ok; }
    bool partial() const { return ok() && failed > 0; }
};

OperationReport reportFailure(LayoutError error, std::string message);
OperationReport reportSuccess(std::string message);

// `summary` followed by failure/skip clauses taken from the tally.
OperationReport reportTally(const MutationTally& tally, std::string summary);

std::string countNoun(std::uint32_t count, const char* singular, const char* plural);
std::string formatUnits(float value);

} // namespace slidelayout

#endif // SLIDELAYOUT_CORE_REPORT_H
