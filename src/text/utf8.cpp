/// @file src/text/utf8.cpp
/// @brief Strict UTF-8 codec, folding and whole-word search.

#include "fdx/text.hpp"

namespace fdx::text {

namespace {

/// Result of decoding one sequence at a given offset.
struct Step {
    wchar_t          cp;
    std::size_t      width;   ///< 0 on error
    std::string_view error;
};

Step decode_one(std::string_view bytes, std::size_t i) noexcept {
    const auto b0 = static_cast<unsigned char>(bytes[i]);
    if (b0 < 0x80) {
        return {static_cast<wchar_t>(b0), 1, {}};
    }

    std::size_t width = 0;
    char32_t cp = 0;
    char32_t min_cp = 0;
    if ((b0 >> 5) == 0x6) {
        width = 2; cp = b0 & 0x1F; min_cp = 0x80;
    } else if ((b0 >> 4) == 0xE) {
        width = 3; cp = b0 & 0x0F; min_cp = 0x800;
    } else if ((b0 >> 3) == 0x1E) {
        width = 4; cp = b0 & 0x07; min_cp = 0x10000;
    } else {
        return {0, 0, "invalid lead byte"};
    }

    if (bytes.size() - i < width) {
        return {0, 0, "truncated sequence"};
    }
    for (std::size_t k = 1; k < width; ++k) {
        const auto b = static_cast<unsigned char>(bytes[i + k]);
        if ((b >> 6) != 0x2) {
            return {0, 0, "invalid continuation byte"};
        }
        cp = (cp << 6) | (b & 0x3F);
    }

    if (cp < min_cp)                   return {0, 0, "overlong encoding"};
    if (cp >= 0xD800 && cp <= 0xDFFF)  return {0, 0, "surrogate code point"};
    if (cp > 0x10FFFF)                 return {0, 0, "code point out of range"};

    return {static_cast<wchar_t>(cp), width, {}};
}

}  // namespace

// ─── Decoding ─────────────────────────────────────────────────────────────────

std::optional<std::wstring> decode_utf8(std::string_view bytes) noexcept {
    std::wstring out;
    out.reserve(bytes.size());
    std::size_t i = 0;
    while (i < bytes.size()) {
        const Step s = decode_one(bytes, i);
        if (s.width == 0) {
            return std::nullopt;
        }
        out.push_back(s.cp);
        i += s.width;
    }
    return out;
}

std::optional<DecodeError> find_utf8_error(std::string_view bytes) noexcept {
    std::size_t i = 0;
    while (i < bytes.size()) {
        const Step s = decode_one(bytes, i);
        if (s.width == 0) {
            return DecodeError{.byte_offset = i, .reason = s.error};
        }
        i += s.width;
    }
    return std::nullopt;
}

std::size_t code_point_length(std::string_view bytes) noexcept {
    std::size_t n = 0;
    std::size_t i = 0;
    while (i < bytes.size()) {
        const Step s = decode_one(bytes, i);
        i += (s.width == 0) ? 1 : s.width;
        ++n;
    }
    return n;
}

// ─── Encoding ─────────────────────────────────────────────────────────────────

std::string encode_utf8(std::wstring_view text) {
    std::string out;
    out.reserve(text.size() * 2);
    for (wchar_t wc : text) {
        const auto cp = static_cast<char32_t>(wc);
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }
    return out;
}

// ─── Folding ──────────────────────────────────────────────────────────────────

wchar_t fold_char(wchar_t ch) noexcept {
    if (ch >= L'A' && ch <= L'Z')       return static_cast<wchar_t>(ch + 0x20);
    if (ch >= 0x00C0 && ch <= 0x00DE && ch != 0x00D7) {
        return static_cast<wchar_t>(ch + 0x20);
    }
    if (ch >= 0x0410 && ch <= 0x042F)   return static_cast<wchar_t>(ch + 0x20);  // А–Я
    if (ch >= 0x0400 && ch <= 0x040F)   return static_cast<wchar_t>(ch + 0x50);  // Ѐ–Џ
    if (ch == 0x0490)                   return 0x0491;                            // Ґ
    if (ch == 0x00A0 || ch == 0x2007 || ch == 0x2009 || ch == 0x202F) {
        return L' ';
    }
    return ch;
}

std::wstring fold_for_matching(std::wstring_view text) {
    std::wstring out;
    out.reserve(text.size());
    for (wchar_t ch : text) {
        out.push_back(fold_char(ch));
    }
    return out;
}

std::wstring fold_utf8(std::string_view bytes) {
    auto decoded = decode_utf8(bytes);
    if (!decoded) {
        return {};
    }
    return fold_for_matching(*decoded);
}

// ─── Character classes ────────────────────────────────────────────────────────

bool is_space(wchar_t ch) noexcept {
    if (ch == L' ' || (ch >= 0x09 && ch <= 0x0D)) return true;
    if (ch == 0x00A0 || ch == 0x1680 || ch == 0x3000)  return true;
    if (ch >= 0x2000 && ch <= 0x200A)                  return true;
    return ch == 0x2028 || ch == 0x2029 || ch == 0x202F || ch == 0x205F;
}

bool is_word_char(wchar_t ch) noexcept {
    if ((ch >= L'a' && ch <= L'z') || (ch >= L'A' && ch <= L'Z')) return true;
    if (ch >= L'0' && ch <= L'9') return true;
    if (ch == L'_') return true;
    if (ch >= 0x00C0 && ch <= 0x00FF && ch != 0x00D7 && ch != 0x00F7) return true;
    return ch >= 0x0400 && ch <= 0x04FF;
}

std::wstring collapse_whitespace(std::wstring_view text) {
    std::wstring out;
    out.reserve(text.size());
    bool pending_space = false;
    for (wchar_t ch : text) {
        if (is_space(ch)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(L' ');
            pending_space = false;
        }
        out.push_back(ch);
    }
    return out;
}

// ─── Word search ──────────────────────────────────────────────────────────────

std::vector<std::size_t>
find_all(std::wstring_view haystack, std::wstring_view needle) {
    std::vector<std::size_t> hits;
    if (needle.empty()) {
        return hits;
    }
    for (std::size_t pos = haystack.find(needle); pos != std::wstring_view::npos;
         pos = haystack.find(needle, pos + 1)) {
        hits.push_back(pos);
    }
    return hits;
}

std::vector<std::size_t>
find_whole_word(std::wstring_view haystack, std::wstring_view needle) {
    std::vector<std::size_t> hits;
    if (needle.empty() || needle.size() > haystack.size()) {
        return hits;
    }

    std::size_t pos = haystack.find(needle);
    while (pos != std::wstring_view::npos) {
        const std::size_t end = pos + needle.size();
        // Only enforce a boundary where the needle itself starts/ends with a
        // word character; keywords such as "$" stand on their own.
        const bool left_ok = pos == 0 || !is_word_char(needle.front()) ||
                             !is_word_char(haystack[pos - 1]);
        const bool right_ok = end == haystack.size() || !is_word_char(needle.back()) ||
                              !is_word_char(haystack[end]);
        if (left_ok && right_ok) {
            hits.push_back(pos);
        }
        pos = haystack.find(needle, pos + 1);
    }
    return hits;
}

}  // namespace fdx::text
