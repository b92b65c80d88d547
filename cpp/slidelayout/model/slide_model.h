#pragma once

#include "slidelayout/core/types.h"
#include "slidelayout/host/host_api.h"
#include "slidelayout/text/text_style.h"

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

// In-memory mirror of one slide. Implements every host collaborator so the
// engine can run natively (tests) or against state pushed from the editor
// (WebAssembly bindings).

namespace slidelayout::model {

enum class ObjectKind : std::uint8_t {
    Shape = 0,
    Image = 1,
    Line = 2,  // movable only; the host derives its size from the endpoints
};

enum class ObjectFlags : std::uint32_t {
    Locked = 1 << 0,
};

class ModelObject final : public SlideObject {
public:
    ModelObject(ObjectId id, ObjectKind kind, const Bounds& bounds);

    ObjectId id() const override { return id_; }
    float getLeft() const override { return bounds_.left; }
    float getTop() const override { return bounds_.top; }
    float getWidth() const override { return bounds_.width; }
    float getHeight() const override { return bounds_.height; }

    HostStatus setLeft(float value) override;
    HostStatus setTop(float value) override;
    HostStatus setWidth(float value) override;
    HostStatus setHeight(float value) override;

    bool isLocked() const { return (flags_ & static_cast<std::uint32_t>(ObjectFlags::Locked)) != 0; }
    // Number of setter calls the host accepted.
    std::uint32_t editCount() const { return editCount_; }

    void reset(ObjectKind kind, const Bounds& bounds);
    void setFlags(std::uint32_t mask, std::uint32_t value);

private:
    HostStatus checkMovable() const;
    HostStatus checkResizable() const;

    ObjectId id_;
    ObjectKind kind_;
    Bounds bounds_;
    std::uint32_t flags_{0};
    std::uint32_t editCount_{0};
};

class ModelCell final : public TableCell {
public:
    MergeState mergeState() const override { return mergeState_; }

    std::string getText() const override { return text_; }
    HostStatus setText(const std::string& content) override;

    std::vector<text::TextSpan> runSpans() const override;
    text::RunStyleSnapshot readRunStyle(const text::TextSpan& span) const override;
    HostStatus applyRunStyle(const text::TextSpan& span, const text::RunStyleSnapshot& style) override;

    std::vector<text::TextSpan> paragraphSpans() const override;
    text::ParagraphStyleSnapshot readParagraphStyle(const text::TextSpan& span) const override;
    HostStatus applyParagraphStyle(const text::TextSpan& span, const text::ParagraphStyleSnapshot& style) override;

    CellFill getFill() const override { return fill_; }
    HostStatus setSolidFill(const text::ColorSpec& color, float alpha) override;
    HostStatus setTransparentFill() override;

    ContentAlignment getContentAlignment() const override { return contentAlignment_; }
    HostStatus setContentAlignment(ContentAlignment alignment) override;

    void setMergeState(MergeState state) { mergeState_ = state; }
    std::uint32_t writeCount() const { return writeCount_; }

private:
    // Splits the run containing `offset` so that a run boundary falls on it.
    void splitRunAt(std::uint32_t offset);

    std::string text_;
    std::uint32_t length_{0};
    std::vector<text::StyledRun> runs_;
    std::vector<text::ParagraphStyleSnapshot> paragraphStyles_{text::ParagraphStyleSnapshot{}};
    CellFill fill_;
    ContentAlignment contentAlignment_{ContentAlignment::Top};
    MergeState mergeState_{MergeState::Normal};
    std::uint32_t writeCount_{0};
};

class ModelTable final : public SlideTable {
public:
    ModelTable(ObjectId id, float left, float top, std::vector<float> columnWidths, std::vector<float> rowHeights);

    ObjectId id() const override { return id_; }
    float getLeft() const override { return left_; }
    float getTop() const override { return top_; }

    std::uint32_t numRows() const override { return static_cast<std::uint32_t>(rowHeights_.size()); }
    std::uint32_t numColumns() const override { return static_cast<std::uint32_t>(columnWidths_.size()); }
    float columnWidth(std::uint32_t column) const override;
    float rowHeight(std::uint32_t row) const override;

    TableCell& cell(std::uint32_t row, std::uint32_t column) override { return modelCell(row, column); }
    ModelCell& modelCell(std::uint32_t row, std::uint32_t column);
    const ModelCell& modelCell(std::uint32_t row, std::uint32_t column) const;

    // Marks the region as merged: its top-left cell becomes the head.
    void mergeCells(std::uint32_t row, std::uint32_t column, std::uint32_t rowSpan, std::uint32_t columnSpan);

private:
    std::size_t cellIndex(std::uint32_t row, std::uint32_t column) const;

    ObjectId id_;
    float left_;
    float top_;
    std::vector<float> columnWidths_;
    std::vector<float> rowHeights_;
    std::vector<ModelCell> cells_;
};

class SlideModel final : public SelectionSource {
public:
    SlideModel() = default;
    SlideModel(const SlideModel&) = delete;
    SlideModel& operator=(const SlideModel&) = delete;

    void clear() noexcept;

    ModelObject& upsertObject(const ObjectId& id, float left, float top, float width, float height,
                              ObjectKind kind = ObjectKind::Shape);
    bool deleteObject(const ObjectId& id);
    ModelObject* getObject(const ObjectId& id);
    const ModelObject* getObject(const ObjectId& id) const;
    void setObjectFlags(const ObjectId& id, std::uint32_t mask, std::uint32_t value);

    ModelTable& upsertTable(const ObjectId& id, float left, float top,
                            std::vector<float> columnWidths, std::vector<float> rowHeights);
    bool deleteTable(const ObjectId& id);
    ModelTable* getTable(const ObjectId& id);

    // Ids may name objects or tables, in the order the editor reports them.
    // Unknown ids are dropped.
    void setSelection(const std::vector<ObjectId>& ids);
    void clearSelection();
    const std::vector<ObjectId>& getSelectionIds() const { return selection_; }

    Selection selectedObjects() override;
    std::vector<SlideTable*> selectedTables() override;
    std::vector<SlideTable*> pageTables() override;

private:
    void pruneSelection();

    std::unordered_map<ObjectId, std::unique_ptr<ModelObject>> objects_;
    std::unordered_map<ObjectId, std::unique_ptr<ModelTable>> tables_;
    // Creation order; tables are reported in this order.
    std::vector<ObjectId> tableOrder_;
    std::vector<ObjectId> selection_;
};

} // namespace slidelayout::model
