#include "genko/page.h"
#include "genko/unicode.h"

namespace genko {

namespace {

struct VerticalMapping {
    char32_t from;
    char32_t to;
};

// Horizontal punctuation → CJK vertical presentation forms
constexpr VerticalMapping kVerticalForms[] = {
    {0x3001, 0xFE11},   // 、
    {0x3002, 0xFE12},   // 。
    {0x300C, 0xFE41},   // 「
    {0x300D, 0xFE42},   // 」
    {0x300E, 0xFE43},   // 『
    {0x300F, 0xFE44},   // 』
    {0xFF08, 0xFE35},   // （
    {0xFF09, 0xFE36},   // ）
    {0xFF3B, 0xFE47},   // ［
    {0xFF3D, 0xFE48},   // ］
    {0xFF5B, 0xFE37},   // ｛
    {0xFF5D, 0xFE38},   // ｝
    {0x3008, 0xFE3F},   // 〈
    {0x3009, 0xFE40},   // 〉
    {0x300A, 0xFE3D},   // 《
    {0x300B, 0xFE3E},   // 》
    {0x3010, 0xFE3B},   // 【
    {0x3011, 0xFE3C},   // 】
    {0x30FC, 0xFF5C},   // ー (long vowel mark drawn as a vertical bar)
};

constexpr float kRotatedBoxScale = 0.92f;

} // anonymous namespace

char32_t verticalForm(char32_t c) {
    for (const auto& m : kVerticalForms) {
        if (m.from == c) return m.to;
    }
    return c;
}

CellGlyph resolveGlyph(const std::u32string& text, TokenKind kind) {
    CellGlyph glyph;

    if (kind == TokenKind::TCY) {
        glyph.text = text;
        glyph.orientation = GlyphOrientation::Horizontal;
        return glyph;
    }

    if (text.size() == 1) {
        char32_t mapped = verticalForm(text[0]);
        glyph.text = std::u32string(1, mapped);
        if (isAsciiAlnum(mapped)) {
            glyph.orientation = GlyphOrientation::Rotated;
            glyph.boxScale = kRotatedBoxScale;
        }
        return glyph;
    }

    glyph.text = text;
    return glyph;
}

} // namespace genko
