// ==============================================================================
// verfold/version.hpp - Версии папок миграций
// ==============================================================================
//
// Назначение:
// - Version: упорядоченный кортеж (major, minor, build, revision)
// - Разбор свободного имени папки в Version
// - try-форма (без исключений) и строгая форма (ResolveError)
//
// Грамматика префикса версии:
//   1..4 группы десятичных цифр в начале строки, разделённые серией
//   символов из набора {^ _ - . , ~ пробел}. Пятая группа после тех же
//   разделителей делает разбор неуспешным. Хвост после префикса игнорируется.
//
// ==============================================================================

#ifndef VERFOLD_VERSION_HPP
#define VERFOLD_VERSION_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace verfold {

// ----------------------------------------------------------------------------
// Version - значение версии
// ----------------------------------------------------------------------------

struct Version {
    std::int32_t major = 0;
    std::int32_t minor = 0;
    std::int32_t build = 0;
    std::int32_t revision = 0;

    /// Формат: "major.minor.build.revision" (всегда 4 компонента)
    std::string to_string() const;
};

/// Лексикографическое сравнение (major, minor, build, revision)
int compare(const Version& a, const Version& b);

inline bool operator==(const Version& a, const Version& b) { return compare(a, b) == 0; }
inline bool operator!=(const Version& a, const Version& b) { return compare(a, b) != 0; }
inline bool operator<(const Version& a, const Version& b) { return compare(a, b) < 0; }
inline bool operator<=(const Version& a, const Version& b) { return compare(a, b) <= 0; }
inline bool operator>(const Version& a, const Version& b) { return compare(a, b) > 0; }
inline bool operator>=(const Version& a, const Version& b) { return compare(a, b) >= 0; }

// ----------------------------------------------------------------------------
// Разбор
// ----------------------------------------------------------------------------

/// Проверить, является ли символ разделителем групп версии
bool is_version_delimiter(char c);

/// Разобрать версию из начала строки
/// @return std::nullopt если строка не начинается с префикса версии,
///         содержит 5+ числовых групп или группа не помещается в int32
std::optional<Version> try_parse_version(std::string_view text);

/// Разобрать версию, требуя успеха
/// @throws ResolveError (MalformedVersion) если try_parse_version неуспешен
Version parse_version(std::string_view text);

}  // namespace verfold

#endif  // VERFOLD_VERSION_HPP
