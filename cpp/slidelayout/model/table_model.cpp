#include "slidelayout/core/string_utils.h"
#include "slidelayout/model/slide_model.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace slidelayout::model {

// =============================================================================
// ModelCell
// =============================================================================

HostStatus ModelCell::setText(const std::string& content) {
    text_ = content;
    length_ = logicalLength(text_);
    runs_.clear();
    if (length_ > 0) runs_.push_back({text::TextSpan{0, length_}, text::RunStyleSnapshot{}});
    paragraphStyles_.assign(paragraphStarts(text_).size(), text::ParagraphStyleSnapshot{});
    writeCount_++;
    return HostStatus::Ok;
}

std::vector<text::TextSpan> ModelCell::runSpans() const {
    std::vector<text::TextSpan> spans;
    spans.reserve(runs_.size());
    for (const text::StyledRun& run : runs_) spans.push_back(run.span);
    return spans;
}

text::RunStyleSnapshot ModelCell::readRunStyle(const text::TextSpan& span) const {
    for (const text::StyledRun& run : runs_) {
        if (span.start >= run.span.start && span.start < run.span.end) return run.style;
    }
    return text::RunStyleSnapshot{};
}

void ModelCell::splitRunAt(std::uint32_t offset) {
    for (std::size_t i = 0; i < runs_.size(); ++i) {
        text::StyledRun& run = runs_[i];
        if (offset <= run.span.start || offset >= run.span.end) continue;
        text::StyledRun tail{text::TextSpan{offset, run.span.end}, run.style};
        run.span.end = offset;
        runs_.insert(runs_.begin() + static_cast<std::ptrdiff_t>(i) + 1, tail);
        return;
    }
}

HostStatus ModelCell::applyRunStyle(const text::TextSpan& span, const text::RunStyleSnapshot& style) {
    const std::uint32_t start = std::min(span.start, length_);
    const std::uint32_t end = std::min(span.end, length_);
    if (start >= end) return HostStatus::Ok;

    splitRunAt(start);
    splitRunAt(end);
    for (text::StyledRun& run : runs_) {
        if (run.span.start >= start && run.span.end <= end) text::overlayStyle(run.style, style);
    }
    writeCount_++;
    return HostStatus::Ok;
}

std::vector<text::TextSpan> ModelCell::paragraphSpans() const {
    const std::vector<std::uint32_t> starts = paragraphStarts(text_);
    std::vector<text::TextSpan> spans;
    spans.reserve(starts.size());
    for (std::size_t i = 0; i < starts.size(); ++i) {
        const std::uint32_t end = i + 1 < starts.size() ? starts[i + 1] : length_;
        spans.push_back(text::TextSpan{starts[i], end});
    }
    return spans;
}

text::ParagraphStyleSnapshot ModelCell::readParagraphStyle(const text::TextSpan& span) const {
    const std::vector<text::TextSpan> spans = paragraphSpans();
    for (std::size_t i = 0; i < spans.size() && i < paragraphStyles_.size(); ++i) {
        const bool starts = span.start == spans[i].start;
        const bool inside = span.start > spans[i].start && span.start < spans[i].end;
        if (starts || inside) return paragraphStyles_[i];
    }
    return text::ParagraphStyleSnapshot{};
}

HostStatus ModelCell::applyParagraphStyle(const text::TextSpan& span, const text::ParagraphStyleSnapshot& style) {
    const std::vector<text::TextSpan> spans = paragraphSpans();
    bool touched = false;
    for (std::size_t i = 0; i < spans.size() && i < paragraphStyles_.size(); ++i) {
        const bool overlaps = span.start < spans[i].end && span.end > spans[i].start;
        if (overlaps || span.start == spans[i].start) {
            text::overlayStyle(paragraphStyles_[i], style);
            touched = true;
        }
    }
    if (touched) writeCount_++;
    return HostStatus::Ok;
}

HostStatus ModelCell::setSolidFill(const text::ColorSpec& color, float alpha) {
    if (!color.isSet()) return HostStatus::Unsupported;
    if (alpha < 0.0f || alpha > 1.0f) return HostStatus::Rejected;
    fill_.visible = true;
    fill_.color = color;
    fill_.alpha = alpha;
    writeCount_++;
    return HostStatus::Ok;
}

HostStatus ModelCell::setTransparentFill() {
    fill_ = CellFill{};
    writeCount_++;
    return HostStatus::Ok;
}

HostStatus ModelCell::setContentAlignment(ContentAlignment alignment) {
    if (alignment == ContentAlignment::Unspecified) return HostStatus::Unsupported;
    contentAlignment_ = alignment;
    writeCount_++;
    return HostStatus::Ok;
}

// =============================================================================
// ModelTable
// =============================================================================

ModelTable::ModelTable(ObjectId id, float left, float top, std::vector<float> columnWidths, std::vector<float> rowHeights)
    : id_(std::move(id)),
      left_(left),
      top_(top),
      columnWidths_(std::move(columnWidths)),
      rowHeights_(std::move(rowHeights)) {
    if (columnWidths_.empty() || rowHeights_.empty()) {
        throw std::invalid_argument("ModelTable: a table needs at least one row and one column");
    }
    cells_.resize(columnWidths_.size() * rowHeights_.size());
}

float ModelTable::columnWidth(std::uint32_t column) const {
    return columnWidths_.at(column);
}

float ModelTable::rowHeight(std::uint32_t row) const {
    return rowHeights_.at(row);
}

std::size_t ModelTable::cellIndex(std::uint32_t row, std::uint32_t column) const {
    if (row >= numRows() || column >= numColumns()) {
        throw std::out_of_range("ModelTable: cell (" + std::to_string(row) + ", " + std::to_string(column)
            + ") outside table " + id_);
    }
    return static_cast<std::size_t>(row) * columnWidths_.size() + column;
}

ModelCell& ModelTable::modelCell(std::uint32_t row, std::uint32_t column) {
    return cells_[cellIndex(row, column)];
}

const ModelCell& ModelTable::modelCell(std::uint32_t row, std::uint32_t column) const {
    return cells_[cellIndex(row, column)];
}

void ModelTable::mergeCells(std::uint32_t row, std::uint32_t column, std::uint32_t rowSpan, std::uint32_t columnSpan) {
    if (rowSpan == 0 || columnSpan == 0) throw std::invalid_argument("ModelTable::mergeCells: empty span");
    cellIndex(row + rowSpan - 1, column + columnSpan - 1);
    for (std::uint32_t r = row; r < row + rowSpan; ++r) {
        for (std::uint32_t c = column; c < column + columnSpan; ++c) {
            modelCell(r, c).setMergeState(r == row && c == column ? MergeState::Head : MergeState::Merged);
        }
    }
}

} // namespace slidelayout::model
