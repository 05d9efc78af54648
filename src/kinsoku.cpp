#include "genko/layout.h"
#include <algorithm>
#include <array>

namespace genko {

namespace kinsoku {

namespace {

// ── Prohibition tables ───────────────────────────────────────────────

/// 、 。 ， ． ！ ？ ) ] ｝ 〕 〉 》 」 』 】
constexpr std::array<char32_t, 15> kLineHead = {
    0x3001, 0x3002, 0xFF0C, 0xFF0E, 0xFF01, 0xFF1F,
    U')', U']',
    0xFF5D, 0x3015, 0x3009, 0x300B, 0x300D, 0x300F, 0x3011,
};

/// ( [ ｛ 〔 〈 《 「 『 【
constexpr std::array<char32_t, 9> kLineEnd = {
    U'(', U'[',
    0xFF5B, 0x3014, 0x3008, 0x300A, 0x300C, 0x300E, 0x3010,
};

template <size_t N>
bool isSingleOf(const std::u32string& text, const std::array<char32_t, N>& table) {
    if (text.size() != 1) return false;
    return std::find(table.begin(), table.end(), text[0]) != table.end();
}

} // anonymous namespace

bool isLineHeadProhibited(const std::u32string& text) {
    return isSingleOf(text, kLineHead);
}

bool isLineEndProhibited(const std::u32string& text) {
    return isSingleOf(text, kLineEnd);
}

} // namespace kinsoku

} // namespace genko
