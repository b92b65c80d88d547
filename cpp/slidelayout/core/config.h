#pragma once

#include <string>

namespace slidelayout {

// Tunables for a LayoutEngine instance. Defaults match the presentation editor.
struct LayoutOptions {
    // Key of the anchor id in the document-scoped key-value store.
    std::string anchorStorageKey{"slidelayout.anchorId"};
    // Vertical gap between objects stacked inside one table cell.
    float cellStackGap{5.0f};
    float defaultCellPadding{5.0f};
    float defaultMatrixSpacing{10.0f};
    // Tolerance for the stretch "size <= 0" and fill "strictly beyond" checks.
    float sizeEpsilon{0.0f};
};

} // namespace slidelayout
