#include "slidelayout/table/table_lookup.h"
#include "slidelayout/core/logging.h"

#include <string>
#include <vector>

namespace slidelayout {

TableLookup findTargetTable(SelectionSource& source) {
    TableLookup lookup;

    const std::vector<SlideTable*> selected = source.selectedTables();
    if (selected.size() == 1 && selected.front()) {
        lookup.table = selected.front();
        return lookup;
    }

    const std::vector<SlideTable*> onPage = source.pageTables();
    if (onPage.size() == 1 && onPage.front()) {
        lookup.table = onPage.front();
        return lookup;
    }

    if (onPage.empty()) {
        lookup.failure = reportFailure(LayoutError::NoTable, "No table found on this slide.");
    } else {
        lookup.failure = reportFailure(LayoutError::AmbiguousTable,
            "Found " + std::to_string(onPage.size()) + " tables on this slide. Select exactly one table.");
    }
    SLIDELAYOUT_LOG_WARN("table lookup failed: %zu selected, %zu on page", selected.size(), onPage.size());
    return lookup;
}

} // namespace slidelayout
