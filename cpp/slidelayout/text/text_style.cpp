#include "slidelayout/text/text_style.h"

namespace slidelayout::text {

namespace {
    template <typename T>
    void overlayField(std::optional<T>& target, const std::optional<T>& patch) {
        if (patch.has_value()) target = patch;
    }

    void overlayColor(ColorSpec& target, const ColorSpec& patch) {
        switch (patch.kind) {
            case ColorSpec::Kind::None:
                break;
            case ColorSpec::Kind::Rgb:
            case ColorSpec::Kind::Theme:
                target = patch;
                break;
        }
    }
}

bool RunStyleSnapshot::empty() const {
    return !bold && !italic && !underline && !strikethrough && !smallCaps
        && !fontFamily && !fontSize && !fontWeight && !baselineOffset
        && !foregroundColor.isSet() && !backgroundColor.isSet() && !linkUrl;
}

bool RunStyleSnapshot::operator==(const RunStyleSnapshot& other) const {
    return bold == other.bold
        && italic == other.italic
        && underline == other.underline
        && strikethrough == other.strikethrough
        && smallCaps == other.smallCaps
        && fontFamily == other.fontFamily
        && fontSize == other.fontSize
        && fontWeight == other.fontWeight
        && baselineOffset == other.baselineOffset
        && foregroundColor == other.foregroundColor
        && backgroundColor == other.backgroundColor
        && linkUrl == other.linkUrl;
}

bool ParagraphStyleSnapshot::empty() const {
    return !lineSpacing && !spaceAbove && !spaceBelow && !indentStart && !indentEnd
        && !indentFirstLine && !alignment;
}

bool ParagraphStyleSnapshot::operator==(const ParagraphStyleSnapshot& other) const {
    return lineSpacing == other.lineSpacing
        && spaceAbove == other.spaceAbove
        && spaceBelow == other.spaceBelow
        && indentStart == other.indentStart
        && indentEnd == other.indentEnd
        && indentFirstLine == other.indentFirstLine
        && alignment == other.alignment;
}

void overlayStyle(RunStyleSnapshot& target, const RunStyleSnapshot& patch) {
    overlayField(target.bold, patch.bold);
    overlayField(target.italic, patch.italic);
    overlayField(target.underline, patch.underline);
    overlayField(target.strikethrough, patch.strikethrough);
    overlayField(target.smallCaps, patch.smallCaps);
    overlayField(target.fontFamily, patch.fontFamily);
    overlayField(target.fontSize, patch.fontSize);
    overlayField(target.fontWeight, patch.fontWeight);
    overlayField(target.baselineOffset, patch.baselineOffset);
    overlayColor(target.foregroundColor, patch.foregroundColor);
    overlayColor(target.backgroundColor, patch.backgroundColor);
    overlayField(target.linkUrl, patch.linkUrl);
}

void overlayStyle(ParagraphStyleSnapshot& target, const ParagraphStyleSnapshot& patch) {
    overlayField(target.lineSpacing, patch.lineSpacing);
    overlayField(target.spaceAbove, patch.spaceAbove);
    overlayField(target.spaceBelow, patch.spaceBelow);
    overlayField(target.indentStart, patch.indentStart);
    overlayField(target.indentEnd, patch.indentEnd);
    overlayField(target.indentFirstLine, patch.indentFirstLine);
    overlayField(target.alignment, patch.alignment);
}

} // namespace slidelayout::text
