// ==============================================================================
// encoding.cpp - Декодирование текста скриптов
// ==============================================================================

#include "verfold/encoding.hpp"

#include <cctype>
#include <cstdint>

namespace verfold::io {

namespace {

// U+FFFD replacement character в UTF-8
constexpr const char* REPLACEMENT = "\xEF\xBF\xBD";

std::string to_lowercase(std::string_view str) {
    std::string result(str);
    for (auto& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

/// Дописать code point в UTF-8
void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::uint8_t byte_at(std::string_view bytes, std::size_t i) {
    return static_cast<std::uint8_t>(bytes[i]);
}

bool is_continuation(std::uint8_t b) {
    return (b & 0xC0) == 0x80;
}

/// Длина корректной UTF-8 последовательности с позиции i, 0 если некорректна
/// Отвергает overlong-формы, суррогаты и code point > U+10FFFF
std::size_t valid_utf8_length(std::string_view bytes, std::size_t i) {
    std::uint8_t b0 = byte_at(bytes, i);
    std::size_t len = 0;
    std::uint8_t lo = 0x80;
    std::uint8_t hi = 0xBF;

    if (b0 >= 0xC2 && b0 <= 0xDF) {
        len = 2;
    } else if (b0 >= 0xE0 && b0 <= 0xEF) {
        len = 3;
        if (b0 == 0xE0) {
            lo = 0xA0;
        } else if (b0 == 0xED) {
            hi = 0x9F;
        }
    } else if (b0 >= 0xF0 && b0 <= 0xF4) {
        len = 4;
        if (b0 == 0xF0) {
            lo = 0x90;
        } else if (b0 == 0xF4) {
            hi = 0x8F;
        }
    } else {
        return 0;
    }

    if (i + len > bytes.size()) {
        return 0;
    }
    std::uint8_t b1 = byte_at(bytes, i + 1);
    if (b1 < lo || b1 > hi) {
        return 0;
    }
    for (std::size_t k = 2; k < len; ++k) {
        if (!is_continuation(byte_at(bytes, i + k))) {
            return 0;
        }
    }
    return len;
}

std::string decode_utf8(std::string_view bytes) {
    std::string result;
    result.reserve(bytes.size());

    std::size_t i = 0;
    while (i < bytes.size()) {
        if (byte_at(bytes, i) < 0x80) {
            result.push_back(bytes[i]);
            ++i;
            continue;
        }
        std::size_t len = valid_utf8_length(bytes, i);
        if (len == 0) {
            result += REPLACEMENT;
            ++i;
            continue;
        }
        result.append(bytes.data() + i, len);
        i += len;
    }
    return result;
}

std::string decode_utf16(std::string_view bytes, bool big_endian) {
    auto unit_at = [&](std::size_t i) -> std::uint16_t {
        std::uint16_t b0 = byte_at(bytes, i);
        std::uint16_t b1 = byte_at(bytes, i + 1);
        return big_endian ? static_cast<std::uint16_t>((b0 << 8) | b1)
                          : static_cast<std::uint16_t>(b0 | (b1 << 8));
    };

    std::string result;
    result.reserve(bytes.size() / 2);

    std::size_t i = 0;
    for (; i + 1 < bytes.size(); i += 2) {
        std::uint16_t wc = unit_at(i);

        if (wc >= 0xD800 && wc <= 0xDBFF) {
            // High surrogate - нужна следующая пара
            if (i + 3 < bytes.size()) {
                std::uint16_t low = unit_at(i + 2);
                if (low >= 0xDC00 && low <= 0xDFFF) {
                    std::uint32_t cp = 0x10000 +
                                       ((static_cast<std::uint32_t>(wc) - 0xD800) << 10) +
                                       (static_cast<std::uint32_t>(low) - 0xDC00);
                    append_utf8(result, cp);
                    i += 2;  // Пропускаем low surrogate
                    continue;
                }
            }
            result += REPLACEMENT;
        } else if (wc >= 0xDC00 && wc <= 0xDFFF) {
            // Lone low surrogate
            result += REPLACEMENT;
        } else {
            append_utf8(result, wc);
        }
    }

    // Нечётный хвостовой байт
    if (i < bytes.size()) {
        result += REPLACEMENT;
    }
    return result;
}

std::string decode_latin1(std::string_view bytes) {
    std::string result;
    result.reserve(bytes.size());
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        append_utf8(result, byte_at(bytes, i));
    }
    return result;
}

std::string decode_ascii(std::string_view bytes) {
    std::string result(bytes);
    for (auto& c : result) {
        if (static_cast<unsigned char>(c) > 0x7F) {
            c = '?';
        }
    }
    return result;
}

}  // namespace

// ----------------------------------------------------------------------------
// Имена кодировок
// ----------------------------------------------------------------------------

const char* encoding_name(TextEncoding enc) {
    switch (enc) {
    case TextEncoding::Utf8:
        return "utf-8";
    case TextEncoding::Utf16Le:
        return "utf-16le";
    case TextEncoding::Utf16Be:
        return "utf-16be";
    case TextEncoding::Latin1:
        return "iso-8859-1";
    case TextEncoding::Ascii:
        return "us-ascii";
    }
    return "utf-8";
}

std::optional<TextEncoding> parse_encoding(std::string_view name) {
    std::string lower = to_lowercase(name);

    if (lower == "utf-8" || lower == "utf8") {
        return TextEncoding::Utf8;
    }
    if (lower == "utf-16" || lower == "utf-16le" || lower == "utf16" || lower == "unicode") {
        return TextEncoding::Utf16Le;
    }
    if (lower == "utf-16be" || lower == "unicodefffe") {
        return TextEncoding::Utf16Be;
    }
    if (lower == "latin1" || lower == "latin-1" || lower == "iso-8859-1") {
        return TextEncoding::Latin1;
    }
    if (lower == "ascii" || lower == "us-ascii") {
        return TextEncoding::Ascii;
    }
    return std::nullopt;
}

// ----------------------------------------------------------------------------
// Декодирование
// ----------------------------------------------------------------------------

std::optional<TextEncoding> detect_bom(std::string_view bytes, std::size_t& bom_size) {
    bom_size = 0;

    if (bytes.size() >= 3 && byte_at(bytes, 0) == 0xEF && byte_at(bytes, 1) == 0xBB &&
        byte_at(bytes, 2) == 0xBF) {
        bom_size = 3;
        return TextEncoding::Utf8;
    }
    if (bytes.size() >= 2 && byte_at(bytes, 0) == 0xFF && byte_at(bytes, 1) == 0xFE) {
        bom_size = 2;
        return TextEncoding::Utf16Le;
    }
    if (bytes.size() >= 2 && byte_at(bytes, 0) == 0xFE && byte_at(bytes, 1) == 0xFF) {
        bom_size = 2;
        return TextEncoding::Utf16Be;
    }
    return std::nullopt;
}

std::string decode_text(std::string_view bytes, TextEncoding enc) {
    std::size_t bom_size = 0;
    if (auto detected = detect_bom(bytes, bom_size)) {
        enc = *detected;
        bytes.remove_prefix(bom_size);
    }

    switch (enc) {
    case TextEncoding::Utf8:
        return decode_utf8(bytes);
    case TextEncoding::Utf16Le:
        return decode_utf16(bytes, false);
    case TextEncoding::Utf16Be:
        return decode_utf16(bytes, true);
    case TextEncoding::Latin1:
        return decode_latin1(bytes);
    case TextEncoding::Ascii:
        return decode_ascii(bytes);
    }
    return decode_utf8(bytes);
}

}  // namespace verfold::io
