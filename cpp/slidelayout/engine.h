#pragma once

#include "slidelayout/anchor/anchor_resolver.h"
#include "slidelayout/core/config.h"
#include "slidelayout/core/report.h"
#include "slidelayout/core/types.h"
#include "slidelayout/host/host_api.h"
#include "slidelayout/table/cell_content_swapper.h"
#include "slidelayout/table/table_cell_locator.h"
#include "slidelayout/transform/alignment_engine.h"
#include "slidelayout/transform/distribution_engine.h"
#include "slidelayout/transform/docking_engine.h"
#include "slidelayout/transform/matrix_arranger.h"
#include "slidelayout/transform/size_transform_engine.h"

#include <optional>

class LayoutEngineTestAccessor;

namespace slidelayout {

// Entry point used by the editor. Every call reads the current selection and
// anchor, runs one engine to completion and returns a report whose message is
// shown to the user as is. Only exceptions thrown by the host escape.
class LayoutEngine {
    friend class ::LayoutEngineTestAccessor;
public:
    LayoutEngine(SelectionSource& source, KeyValueStore& store, LayoutOptions options = LayoutOptions{});

    LayoutEngine(const LayoutEngine&) = delete;
    LayoutEngine& operator=(const LayoutEngine&) = delete;

    const LayoutOptions& options() const { return options_; }

    // Anchor
    OperationReport setAnchorFromSelection();
    OperationReport clearAnchor();
    OperationReport anchorStatus();

    // Geometry
    OperationReport align(AlignEdge edge);
    OperationReport distribute(Axis axis);
    OperationReport dock(Side side);
    OperationReport matchSize(MatchDimension dimension);
    OperationReport stretch(Side side);
    OperationReport fillGap(Side side);
    OperationReport magicResize(float percentage);
    OperationReport arrangeMatrix(int rows, int cols, float spacing);
    OperationReport arrangeMatrix(int rows, int cols) { return arrangeMatrix(rows, cols, options_.defaultMatrixSpacing); }

    // Tables
    OperationReport alignInTableCells(CellAlignment alignment, float padding);
    OperationReport alignInTableCells(CellAlignment alignment) { return alignInTableCells(alignment, options_.defaultCellPadding); }
    OperationReport swapTableRows(int first, int second, bool keepFormatting);
    OperationReport swapTableColumns(int first, int second, bool keepFormatting);

private:
    std::optional<ObjectId> currentAnchorId() const { return anchorStore_.load(); }

    SelectionSource& source_;
    AnchorStore anchorStore_;
    LayoutOptions options_;

    AlignmentEngine alignment_;
    DistributionEngine distribution_;
    DockingEngine docking_;
    SizeTransformEngine sizeTransform_;
    MatrixArranger matrix_;
    TableCellLocator cellLocator_;
    CellContentSwapper swapper_;
};

} // namespace slidelayout
