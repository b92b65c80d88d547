#ifndef SLIDELAYOUT_TABLE_CELL_PAYLOAD_H
#define SLIDELAYOUT_TABLE_CELL_PAYLOAD_H

#include "slidelayout/core/types.h"
#include "slidelayout/host/host_api.h"
#include "slidelayout/text/text_style.h"

#include <string>
#include <vector>

namespace slidelayout {

/**
 * CellPayload: full content state of one table cell.
 *
 * Offsets in `runs` and `paragraphs` refer to `text` as it was when captured.
 * Borders belong to the table, not the cell, and are never part of a payload.
 */
struct CellPayload {
    std::string text;
    std::vector<text::StyledRun> runs;
    std::vector<text::StyledParagraph> paragraphs;
    CellFill fill;
    ContentAlignment contentAlignment{ContentAlignment::Unspecified};

    bool operator==(const CellPayload& other) const;
    bool operator!=(const CellPayload& other) const { return !(*this == other); }
};

/**
 * Read-only snapshot of `cell`.
 */
CellPayload capturePayload(const TableCell& cell);

/**
 * Writes `payload` into `cell`: text first (which resets styles on the host),
 * then run styles, paragraph styles, fill and content alignment. Unset style
 * fields and empty styles are not written, so host defaults survive.
 * Every step is attempted; the first refused step's status is returned.
 */
HostStatus applyPayload(TableCell& cell, const CellPayload& payload);

} // namespace slidelayout

#endif // SLIDELAYOUT_TABLE_CELL_PAYLOAD_H
