#include "slidelayout/table/cell_payload.h"
#include "slidelayout/core/logging.h"

namespace slidelayout {

namespace {
    void keepFirstFailure(HostStatus& result, HostStatus status) {
        if (result == HostStatus::Ok && status != HostStatus::Ok) result = status;
    }

    HostStatus applyFill(TableCell& cell, const CellFill& fill) {
        if (!fill.visible) return cell.setTransparentFill();
        switch (fill.color.kind) {
            case text::ColorSpec::Kind::None:
                // Visible fill without a reportable color: leave the host's fill alone.
                return HostStatus::Ok;
            case text::ColorSpec::Kind::Rgb:
            case text::ColorSpec::Kind::Theme:
                return cell.setSolidFill(fill.color, fill.alpha);
        }
        return HostStatus::Unsupported;
    }
}

bool CellPayload::operator==(const CellPayload& other) const {
    return text == other.text
        && runs == other.runs
        && paragraphs == other.paragraphs
        && fill == other.fill
        && contentAlignment == other.contentAlignment;
}

CellPayload capturePayload(const TableCell& cell) {
    CellPayload payload;
    payload.text = cell.getText();

    const std::vector<text::TextSpan> runSpans = cell.runSpans();
    payload.runs.reserve(runSpans.size());
    for (const text::TextSpan& span : runSpans) {
        payload.runs.push_back({span, cell.readRunStyle(span)});
    }

    const std::vector<text::TextSpan> paragraphSpans = cell.paragraphSpans();
    payload.paragraphs.reserve(paragraphSpans.size());
    for (const text::TextSpan& span : paragraphSpans) {
        payload.paragraphs.push_back({span, cell.readParagraphStyle(span)});
    }

    payload.fill = cell.getFill();
    payload.contentAlignment = cell.getContentAlignment();
    return payload;
}

HostStatus applyPayload(TableCell& cell, const CellPayload& payload) {
    HostStatus result = HostStatus::Ok;
    keepFirstFailure(result, cell.setText(payload.text));

    for (const text::StyledRun& run : payload.runs) {
        if (run.style.empty() || run.span.length() == 0) continue;
        keepFirstFailure(result, cell.applyRunStyle(run.span, run.style));
    }
    for (const text::StyledParagraph& paragraph : payload.paragraphs) {
        if (paragraph.style.empty()) continue;
        keepFirstFailure(result, cell.applyParagraphStyle(paragraph.span, paragraph.style));
    }

    keepFirstFailure(result, applyFill(cell, payload.fill));
    if (payload.contentAlignment != ContentAlignment::Unspecified) {
        keepFirstFailure(result, cell.setContentAlignment(payload.contentAlignment));
    }

    if (result != HostStatus::Ok) {
        SLIDELAYOUT_LOG_WARN("cell payload applied partially (status %u)", static_cast<unsigned>(result));
    }
    return result;
}

} // namespace slidelayout
