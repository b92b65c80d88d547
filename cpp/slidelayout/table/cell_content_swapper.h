#pragma once

#include "slidelayout/core/report.h"
#include "slidelayout/core/types.h"
#include "slidelayout/host/host_api.h"

#include <cstdint>
#include <optional>

namespace slidelayout {

// Swaps the contents of two rows or two columns of one table.
//
// Validation runs in a fixed order (table, indices, merged cells) and all of
// it happens before the first write, so a rejected swap leaves the table as
// it was. Plain swaps exchange text only; keepFormatting captures a full
// CellPayload from both cells of a pair before writing either of them.
class CellContentSwapper {
public:
    OperationReport swap(SelectionSource& source,
                         TableAxis axis,
                         int first,
                         int second,
                         bool keepFormatting) const;

    // Same, against an already resolved table.
    OperationReport swapInTable(SlideTable& table,
                                TableAxis axis,
                                int first,
                                int second,
                                bool keepFormatting) const;

    // Zero-based index of the first line (row or column) that touches a merged
    // cell, if any.
    std::optional<std::uint32_t> findMergedLine(SlideTable& table,
                                                TableAxis axis,
                                                std::uint32_t first,
                                                std::uint32_t second) const;
};

} // namespace slidelayout
