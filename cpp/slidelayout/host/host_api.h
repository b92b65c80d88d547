#pragma once

#include "slidelayout/core/geometry.h"
#include "slidelayout/core/types.h"
#include "slidelayout/text/text_style.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Collaborator interfaces implemented by the presentation host.
// The engines never own host objects; pointers are valid for one operation.

namespace slidelayout {

class SlideObject {
public:
    virtual ~SlideObject() = default;

    virtual ObjectId id() const = 0;

    virtual float getLeft() const = 0;
    virtual float getTop() const = 0;
    virtual float getWidth() const = 0;
    virtual float getHeight() const = 0;

    virtual HostStatus setLeft(float value) = 0;
    virtual HostStatus setTop(float value) = 0;
    virtual HostStatus setWidth(float value) = 0;
    virtual HostStatus setHeight(float value) = 0;

    Bounds bounds() const { return Bounds{getLeft(), getTop(), getWidth(), getHeight()}; }
};

// Ordered as reported by the host. The order carries no spatial meaning.
using Selection = std::vector<SlideObject*>;

enum class MergeState : std::uint8_t {
    Normal = 0,
    Head = 1,    // top-left cell of a merged region
    Merged = 2,  // covered by another cell's merge
};

enum class ContentAlignment : std::uint8_t {
    Unspecified = 0,
    Top = 1,
    Middle = 2,
    Bottom = 3,
};

struct CellFill {
    bool visible{false};
    text::ColorSpec color;
    float alpha{1.0f};

    bool operator==(const CellFill& other) const {
        return visible == other.visible && color == other.color && alpha == other.alpha;
    }
    bool operator!=(const CellFill& other) const { return !(*this == other); }
};

class TableCell {
public:
    virtual ~TableCell() = default;

    virtual MergeState mergeState() const = 0;

    virtual std::string getText() const = 0;
    // Replaces the content; the host resets run and paragraph styles to its defaults.
    virtual HostStatus setText(const std::string& content) = 0;

    virtual std::vector<text::TextSpan> runSpans() const = 0;
    virtual text::RunStyleSnapshot readRunStyle(const text::TextSpan& span) const = 0;
    virtual HostStatus applyRunStyle(const text::TextSpan& span, const text::RunStyleSnapshot& style) = 0;

    virtual std::vector<text::TextSpan> paragraphSpans() const = 0;
    virtual text::ParagraphStyleSnapshot readParagraphStyle(const text::TextSpan& span) const = 0;
    virtual HostStatus applyParagraphStyle(const text::TextSpan& span, const text::ParagraphStyleSnapshot& style) = 0;

    virtual CellFill getFill() const = 0;
    virtual HostStatus setSolidFill(const text::ColorSpec& color, float alpha) = 0;
    virtual HostStatus setTransparentFill() = 0;

    virtual ContentAlignment getContentAlignment() const = 0;
    virtual HostStatus setContentAlignment(ContentAlignment alignment) = 0;
};

class SlideTable {
public:
    virtual ~SlideTable() = default;

    virtual ObjectId id() const = 0;
    virtual float getLeft() const = 0;
    virtual float getTop() const = 0;

    virtual std::uint32_t numRows() const = 0;
    virtual std::uint32_t numColumns() const = 0;
    virtual float columnWidth(std::uint32_t column) const = 0;
    virtual float rowHeight(std::uint32_t row) const = 0;

    // Zero-based coordinates.
    virtual TableCell& cell(std::uint32_t row, std::uint32_t column) = 0;
};

class SelectionSource {
public:
    virtual ~SelectionSource() = default;

    // Selected page elements other than tables, in host order.
    virtual Selection selectedObjects() = 0;
    virtual std::vector<SlideTable*> selectedTables() = 0;
    virtual std::vector<SlideTable*> pageTables() = 0;
};

// Document-scoped storage shared by all collaborators of a document.
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    virtual std::optional<std::string> get(const std::string& key) const = 0;
    virtual void set(const std::string& key, const std::string& value) = 0;
    virtual void remove(const std::string& key) = 0;
};

} // namespace slidelayout
