#ifndef SLIDELAYOUT_TEXT_TEXT_STYLE_H
#define SLIDELAYOUT_TEXT_TEXT_STYLE_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace slidelayout::text {

// Color as the host reports it. None means "no explicit color"; it is carried
// through capture and skipped on apply.
struct ColorSpec {
    enum class Kind : std::uint8_t { None = 0, Rgb = 1, Theme = 2 };

    Kind kind{Kind::None};
    std::string value; // "#RRGGBB" for Rgb, theme color name for Theme

    static ColorSpec none() { return ColorSpec{}; }
    static ColorSpec rgb(std::string hex) { return ColorSpec{Kind::Rgb, std::move(hex)}; }
    static ColorSpec theme(std::string themeId) { return ColorSpec{Kind::Theme, std::move(themeId)}; }

    bool isSet() const { return kind != Kind::None; }

    bool operator==(const ColorSpec& other) const { return kind == other.kind && value == other.value; }
    bool operator!=(const ColorSpec& other) const { return !(*this == other); }
};

enum class BaselineOffset : std::uint8_t {
    None = 0,
    Superscript = 1,
    Subscript = 2,
};

enum class ParagraphAlignment : std::uint8_t {
    Start = 0,
    Center = 1,
    End = 2,
    Justified = 3,
};

// Character-level style. Every field is optional; an empty field was not
// explicitly set on the source text and must not be written back.
struct RunStyleSnapshot {
    std::optional<bool> bold;
    std::optional<bool> italic;
    std::optional<bool> underline;
    std::optional<bool> strikethrough;
    std::optional<bool> smallCaps;
    std::optional<std::string> fontFamily;
    std::optional<float> fontSize;
    std::optional<std::uint16_t> fontWeight;
    std::optional<BaselineOffset> baselineOffset;
    ColorSpec foregroundColor;
    ColorSpec backgroundColor;
    std::optional<std::string> linkUrl;

    bool empty() const;
    bool operator==(const RunStyleSnapshot& other) const;
    bool operator!=(const RunStyleSnapshot& other) const { return !(*this == other); }
};

struct ParagraphStyleSnapshot {
    std::optional<float> lineSpacing;
    std::optional<float> spaceAbove;
    std::optional<float> spaceBelow;
    std::optional<float> indentStart;
    std::optional<float> indentEnd;
    std::optional<float> indentFirstLine;
    std::optional<ParagraphAlignment> alignment;

    bool empty() const;
    bool operator==(const ParagraphStyleSnapshot& other) const;
    bool operator!=(const ParagraphStyleSnapshot& other) const { return !(*this == other); }
};

// Writes every set field of `patch` into `target`; unset fields leave `target` as is.
void overlayStyle(RunStyleSnapshot& target, const RunStyleSnapshot& patch);
void overlayStyle(ParagraphStyleSnapshot& target, const ParagraphStyleSnapshot& patch);

// Half-open character range in logical (UTF-16 code unit) offsets.
struct TextSpan {
    std::uint32_t start{0};
    std::uint32_t end{0};

    std::uint32_t length() const { return end > start ? end - start : 0; }
    bool operator==(const TextSpan& other) const { return start == other.start && end == other.end; }
    bool operator!=(const TextSpan& other) const { return !(*this == other); }
};

template <typename Style>
struct StyledSpan {
    TextSpan span;
    Style style;

    bool operator==(const StyledSpan& other) const { return span == other.span && style == other.style; }
    bool operator!=(const StyledSpan& other) const { return !(*this == other); }
};

using StyledRun = StyledSpan<RunStyleSnapshot>;
using StyledParagraph = StyledSpan<ParagraphStyleSnapshot>;

} // namespace slidelayout::text

#endif // SLIDELAYOUT_TEXT_TEXT_STYLE_H
