// ==============================================================================
// version.cpp - Разбор версий папок миграций
// ==============================================================================
//
// Разбор выполняется явным токенизатором:
// группа цифр -> (серия разделителей -> группа цифр){0,3}
// и отказ, если после четвёртой группы следует ещё одна.
//
// ==============================================================================

#include "verfold/version.hpp"

#include "verfold/error.hpp"

#include <array>
#include <charconv>
#include <cstddef>
#include <system_error>

namespace verfold {

namespace {

// Максимальное число групп в версии
constexpr std::size_t MAX_GROUPS = 4;

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

/// Длина серии разделителей, начинающейся с pos
std::size_t delimiter_run(std::string_view text, std::size_t pos) {
    std::size_t end = pos;
    while (end < text.size() && is_version_delimiter(text[end])) {
        ++end;
    }
    return end - pos;
}

/// Следует ли с позиции pos "разделители + цифра"
/// Возвращает позицию цифры или std::string_view::npos
std::size_t next_group_start(std::string_view text, std::size_t pos) {
    std::size_t run = delimiter_run(text, pos);
    if (run == 0) {
        return std::string_view::npos;
    }
    std::size_t digit_pos = pos + run;
    if (digit_pos < text.size() && is_digit(text[digit_pos])) {
        return digit_pos;
    }
    return std::string_view::npos;
}

/// Прочитать группу цифр с позиции pos
/// Ведущие нули не влияют на значение; переполнение int32 -> false
bool read_group(std::string_view text, std::size_t& pos, std::int32_t& value) {
    std::size_t end = pos;
    while (end < text.size() && is_digit(text[end])) {
        ++end;
    }

    const char* first = text.data() + pos;
    const char* last = text.data() + end;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        return false;
    }

    pos = end;
    return true;
}

}  // namespace

// ----------------------------------------------------------------------------
// Version
// ----------------------------------------------------------------------------

std::string Version::to_string() const {
    return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(build) + "." +
           std::to_string(revision);
}

int compare(const Version& a, const Version& b) {
    const std::array<std::int32_t, 4> lhs{a.major, a.minor, a.build, a.revision};
    const std::array<std::int32_t, 4> rhs{b.major, b.minor, b.build, b.revision};
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (lhs[i] < rhs[i]) {
            return -1;
        }
        if (lhs[i] > rhs[i]) {
            return 1;
        }
    }
    return 0;
}

// ----------------------------------------------------------------------------
// Разбор
// ----------------------------------------------------------------------------

bool is_version_delimiter(char c) {
    switch (c) {
    case '^':
    case '_':
    case '-':
    case '.':
    case ',':
    case '~':
    case ' ':
        return true;
    default:
        return false;
    }
}

std::optional<Version> try_parse_version(std::string_view text) {
    // Первая группа обязательна и начинается с позиции 0
    if (text.empty() || !is_digit(text[0])) {
        return std::nullopt;
    }

    std::array<std::int32_t, MAX_GROUPS> groups{};
    std::size_t pos = 0;
    std::size_t count = 0;

    if (!read_group(text, pos, groups[count])) {
        return std::nullopt;
    }
    ++count;

    // Необязательные группы 2..4
    while (count < MAX_GROUPS) {
        std::size_t start = next_group_start(text, pos);
        if (start == std::string_view::npos) {
            break;
        }
        pos = start;
        if (!read_group(text, pos, groups[count])) {
            return std::nullopt;
        }
        ++count;
    }

    // Пятая группа отвергает весь разбор, а не обрезается
    if (count == MAX_GROUPS && next_group_start(text, pos) != std::string_view::npos) {
        return std::nullopt;
    }

    Version v;
    v.major = groups[0];
    v.minor = groups[1];
    v.build = groups[2];
    v.revision = groups[3];
    return v;
}

Version parse_version(std::string_view text) {
    auto parsed = try_parse_version(text);
    if (!parsed.has_value()) {
        throw ResolveError(ResolveErrorKind::MalformedVersion,
                           "Error parsing version from string '" + std::string(text) + "'.",
                           std::string(text));
    }
    return *parsed;
}

}  // namespace verfold
