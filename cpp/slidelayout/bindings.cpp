#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

#include "slidelayout/engine.h"
#include "slidelayout/model/memory_kv_store.h"
#include "slidelayout/model/slide_model.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#ifdef EMSCRIPTEN
namespace {

// One slide as mirrored from the editor. The editor pushes geometry and table
// state in, calls an operation, then reads the edited geometry back. The anchor
// id lives in document properties on the editor side and is synced through
// get/setStoredAnchor.
class LayoutSession {
public:
    LayoutSession() : engine_(model_, store_) {}

    slidelayout::model::SlideModel& model() { return model_; }
    slidelayout::LayoutEngine& engine() { return engine_; }

    std::string getStoredAnchor() const {
        const std::optional<std::string> id = store_.get(engine_.options().anchorStorageKey);
        return id ? *id : std::string();
    }

    void setStoredAnchor(const std::string& id) {
        if (id.empty()) {
            store_.remove(engine_.options().anchorStorageKey);
        } else {
            store_.set(engine_.options().anchorStorageKey, id);
        }
    }

private:
    slidelayout::model::SlideModel model_;
    slidelayout::model::MemoryKeyValueStore store_;
    slidelayout::LayoutEngine engine_;
};

slidelayout::Bounds objectBounds(LayoutSession& self, const std::string& id) {
    const slidelayout::model::ModelObject* object = self.model().getObject(id);
    return object ? object->bounds() : slidelayout::Bounds{};
}

} // namespace

EMSCRIPTEN_BINDINGS(slidelayout_module) {
    using namespace slidelayout;

    emscripten::register_vector<std::string>("StringVector");
    emscripten::register_vector<float>("FloatVector");

    emscripten::enum_<AlignEdge>("AlignEdge")
        .value("Left", AlignEdge::Left)
        .value("Right", AlignEdge::Right)
        .value("Top", AlignEdge::Top)
        .value("Bottom", AlignEdge::Bottom)
        .value("CenterX", AlignEdge::CenterX)
        .value("CenterY", AlignEdge::CenterY);

    emscripten::enum_<Axis>("Axis")
        .value("Horizontal", Axis::Horizontal)
        .value("Vertical", Axis::Vertical);

    emscripten::enum_<Side>("Side")
        .value("Left", Side::Left)
        .value("Right", Side::Right)
        .value("Top", Side::Top)
        .value("Bottom", Side::Bottom);

    emscripten::enum_<MatchDimension>("MatchDimension")
        .value("Width", MatchDimension::Width)
        .value("Height", MatchDimension::Height)
        .value("Both", MatchDimension::Both);

    emscripten::enum_<CellAlignment>("CellAlignment")
        .value("Left", CellAlignment::Left)
        .value("Center", CellAlignment::Center)
        .value("Right", CellAlignment::Right);

    emscripten::enum_<LayoutError>("LayoutError")
        .value("Ok", LayoutError::Ok)
        .value("InsufficientSelection", LayoutError::InsufficientSelection)
        .value("InvalidArgument", LayoutError::InvalidArgument)
        .value("NoTable", LayoutError::NoTable)
        .value("AmbiguousTable", LayoutError::AmbiguousTable)
        .value("IndexOutOfRange", LayoutError::IndexOutOfRange)
        .value("MergedCells", LayoutError::MergedCells)
        .value("NoGapsFound", LayoutError::NoGapsFound)
        .value("NothingToDo", LayoutError::NothingToDo);

    emscripten::enum_<model::ObjectKind>("ObjectKind")
        .value("Shape", model::ObjectKind::Shape)
        .value("Image", model::ObjectKind::Image)
        .value("Line", model::ObjectKind::Line);

    emscripten::value_object<OperationReport>("OperationReport")
        .field("error", &OperationReport::error)
        .field("succeeded", &OperationReport::succeeded)
        .field("failed", &OperationReport::failed)
        .field("skipped", &OperationReport::skipped)
        .field("message", &OperationReport::message);

    emscripten::value_object<Bounds>("Bounds")
        .field("left", &Bounds::left)
        .field("top", &Bounds::top)
        .field("width", &Bounds::width)
        .field("height", &Bounds::height);

    emscripten::class_<LayoutSession>("LayoutSession")
        .constructor<>()
        .function("getStoredAnchor", &LayoutSession::getStoredAnchor)
        .function("setStoredAnchor", &LayoutSession::setStoredAnchor)
        // Slide mirror
        .function("clear", emscripten::optional_override([](LayoutSession& self) {
            self.model().clear();
        }))
        .function("upsertObject", emscripten::optional_override([](LayoutSession& self, const std::string& id,
                float left, float top, float width, float height, model::ObjectKind kind, bool locked) {
            model::ModelObject& object = self.model().upsertObject(id, left, top, width, height, kind);
            const auto lockedBit = static_cast<std::uint32_t>(model::ObjectFlags::Locked);
            object.setFlags(lockedBit, locked ? lockedBit : 0u);
        }))
        .function("deleteObject", emscripten::optional_override([](LayoutSession& self, const std::string& id) {
            return self.model().deleteObject(id);
        }))
        .function("getObjectBounds", &objectBounds)
        .function("upsertTable", emscripten::optional_override([](LayoutSession& self, const std::string& id,
                float left, float top, const std::vector<float>& columnWidths, const std::vector<float>& rowHeights) {
            self.model().upsertTable(id, left, top, columnWidths, rowHeights);
        }))
        .function("setCellText", emscripten::optional_override([](LayoutSession& self, const std::string& tableId,
                std::uint32_t row, std::uint32_t column, const std::string& content) {
            model::ModelTable* table = self.model().getTable(tableId);
            if (!table) return false;
            table->modelCell(row, column).setText(content);
            return true;
        }))
        .function("getCellText", emscripten::optional_override([](LayoutSession& self, const std::string& tableId,
                std::uint32_t row, std::uint32_t column) {
            model::ModelTable* table = self.model().getTable(tableId);
            return table ? table->modelCell(row, column).getText() : std::string();
        }))
        .function("mergeCells", emscripten::optional_override([](LayoutSession& self, const std::string& tableId,
                std::uint32_t row, std::uint32_t column, std::uint32_t rowSpan, std::uint32_t columnSpan) {
            model::ModelTable* table = self.model().getTable(tableId);
            if (!table) return false;
            table->mergeCells(row, column, rowSpan, columnSpan);
            return true;
        }))
        .function("setSelection", emscripten::optional_override([](LayoutSession& self, const std::vector<std::string>& ids) {
            self.model().setSelection(ids);
        }))
        // Operations
        .function("setAnchorFromSelection", emscripten::optional_override([](LayoutSession& self) {
            return self.engine().setAnchorFromSelection();
        }))
        .function("clearAnchor", emscripten::optional_override([](LayoutSession& self) {
            return self.engine().clearAnchor();
        }))
        .function("anchorStatus", emscripten::optional_override([](LayoutSession& self) {
            return self.engine().anchorStatus();
        }))
        .function("align", emscripten::optional_override([](LayoutSession& self, AlignEdge edge) {
            return self.engine().align(edge);
        }))
        .function("distribute", emscripten::optional_override([](LayoutSession& self, Axis axis) {
            return self.engine().distribute(axis);
        }))
        .function("dock", emscripten::optional_override([](LayoutSession& self, Side side) {
            return self.engine().dock(side);
        }))
        .function("matchSize", emscripten::optional_override([](LayoutSession& self, MatchDimension dimension) {
            return self.engine().matchSize(dimension);
        }))
        .function("stretch", emscripten::optional_override([](LayoutSession& self, Side side) {
            return self.engine().stretch(side);
        }))
        .function("fillGap", emscripten::optional_override([](LayoutSession& self, Side side) {
            return self.engine().fillGap(side);
        }))
        .function("magicResize", emscripten::optional_override([](LayoutSession& self, float percentage) {
            return self.engine().magicResize(percentage);
        }))
        .function("arrangeMatrix", emscripten::optional_override([](LayoutSession& self, int rows, int cols, float spacing) {
            return self.engine().arrangeMatrix(rows, cols, spacing);
        }))
        .function("alignInTableCells", emscripten::optional_override([](LayoutSession& self, CellAlignment alignment, float padding) {
            return self.engine().alignInTableCells(alignment, padding);
        }))
        .function("swapTableRows", emscripten::optional_override([](LayoutSession& self, int first, int second, bool keepFormatting) {
            return self.engine().swapTableRows(first, second, keepFormatting);
        }))
        .function("swapTableColumns", emscripten::optional_override([](LayoutSession& self, int first, int second, bool keepFormatting) {
            return self.engine().swapTableColumns(first, second, keepFormatting);
        }));
}
#endif
