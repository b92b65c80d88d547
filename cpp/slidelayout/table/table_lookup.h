#pragma once

#include "slidelayout/core/report.h"
#include "slidelayout/host/host_api.h"

namespace slidelayout {

struct TableLookup {
    SlideTable* table{nullptr};
    // Set when `table` is null; ready to hand back to the UI.
    OperationReport failure;

    bool found() const { return table != nullptr; }
};

// The selected table when exactly one is selected, otherwise the only table on
// the page. Any other count cannot be resolved.
TableLookup findTargetTable(SelectionSource& source);

} // namespace slidelayout
