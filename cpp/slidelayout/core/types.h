#ifndef SLIDELAYOUT_CORE_TYPES_H
#define SLIDELAYOUT_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <string>

// Lightweight types and constants shared by the layout engines.

namespace slidelayout {

// Host object identity. Opaque and stable per object; never parsed.
using ObjectId = std::string;

// Selection size preconditions
static constexpr std::size_t kMinAlignSelection = 2;
static constexpr std::size_t kMinDockSelection = 2;
static constexpr std::size_t kMinSizeSelection = 2;
static constexpr std::size_t kMinDistributeSelection = 3;
static constexpr std::size_t kMinMatrixSelection = 2;
static constexpr std::size_t kMinMagicResizeSelection = 1;

// Result of a single host mutation call.
enum class HostStatus : std::uint8_t {
    Ok = 0,
    Unsupported = 1,  // object kind has no such property
    Rejected = 2,     // host refused the edit (locked, read-only, ...)
};

enum class LayoutError : std::uint32_t {
    Ok = 0,
    InsufficientSelection = 1,
    InvalidArgument = 2,
    NoTable = 3,
    AmbiguousTable = 4,
    IndexOutOfRange = 5,
    MergedCells = 6,
    NoGapsFound = 7,
    NothingToDo = 8,
};

enum class AlignEdge : std::uint8_t {
    Left = 0,
    Right = 1,
    Top = 2,
    Bottom = 3,
    CenterX = 4,
    CenterY = 5,
};

enum class Axis : std::uint8_t {
    Horizontal = 0,
    Vertical = 1,
};

// Edge of the anchor an operation works against.
enum class Side : std::uint8_t {
    Left = 0,
    Right = 1,
    Top = 2,
    Bottom = 3,
};

enum class MatchDimension : std::uint8_t {
    Width = 0,
    Height = 1,
    Both = 2,
};

enum class CellAlignment : std::uint8_t {
    Left = 0,
    Center = 1,
    Right = 2,
};

enum class TableAxis : std::uint8_t {
    Rows = 0,
    Columns = 1,
};

inline Axis axisOf(Side side) {
    return (side == Side::Left || side == Side::Right) ? Axis::Horizontal : Axis::Vertical;
}

const char* toString(AlignEdge edge);
const char* toString(Side side);
const char* toString(LayoutError error);

} // namespace slidelayout

#endif // SLIDELAYOUT_CORE_TYPES_H
