// ==============================================================================
// verfold/encoding.hpp - Декодирование текста скриптов
// ==============================================================================
//
// Назначение:
// - Перечень поддерживаемых кодировок
// - Разбор имени кодировки ("utf-8", "utf-16le", "latin1", ...)
// - Декодирование байтов файла в UTF-8 строку
//
// BOM в начале данных имеет приоритет над заданной кодировкой и удаляется.
// Некорректные последовательности заменяются на U+FFFD, декодирование
// не завершается ошибкой.
//
// ==============================================================================

#ifndef VERFOLD_ENCODING_HPP
#define VERFOLD_ENCODING_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace verfold::io {

enum class TextEncoding {
    Utf8,     // По умолчанию
    Utf16Le,  // "utf-16", "unicode"
    Utf16Be,
    Latin1,   // ISO-8859-1
    Ascii     // Байты > 0x7F -> '?'
};

/// Каноническое имя кодировки ("utf-8", "utf-16le", ...)
const char* encoding_name(TextEncoding enc);

/// Разобрать имя кодировки (без учёта регистра)
/// @return std::nullopt для неизвестного имени
std::optional<TextEncoding> parse_encoding(std::string_view name);

/// Определить кодировку по BOM
/// @param bom_size Длина BOM в байтах (0 если BOM нет)
std::optional<TextEncoding> detect_bom(std::string_view bytes, std::size_t& bom_size);

/// Декодировать байты в UTF-8
std::string decode_text(std::string_view bytes, TextEncoding enc);

}  // namespace verfold::io

#endif  // VERFOLD_ENCODING_HPP
