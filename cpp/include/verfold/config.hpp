// ==============================================================================
// verfold/config.hpp - Файл конфигурации
// ==============================================================================
//
// Назначение:
// - Загрузка параметров разрешения из YAML файла (yaml-cpp)
// - Построение ResolveOptions из конфигурации
//
// Формат:
//   root: db/migrations      # относительный путь - от директории файла
//   target_version: "2.0"    # необязательно
//   encoding: utf-8          # необязательно
//   filter: "^1\\."          # необязательно, ECMAScript regex (поиск в имени)
//
// Неизвестные ключи - ошибка.
//
// ==============================================================================

#ifndef VERFOLD_CONFIG_HPP
#define VERFOLD_CONFIG_HPP

#include <verfold/encoding.hpp>
#include <verfold/resolver.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace verfold::config {

// ----------------------------------------------------------------------------
// Config - параметры из файла
// ----------------------------------------------------------------------------

struct Config {
    std::optional<std::filesystem::path> root;
    std::optional<std::string> target_version;
    std::optional<io::TextEncoding> encoding;
    std::optional<std::string> filter;  // regex
};

// ----------------------------------------------------------------------------
// Ошибки
// ----------------------------------------------------------------------------

/// Ошибка загрузки конфигурации
struct Error {
    std::string message;
    std::string path;

    /// Формат: "failed to load config '<path>' - <message>"
    std::string format() const;
};

/// Результат загрузки
struct LoadResult {
    bool ok = false;
    Config config;
    Error error;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Загрузить конфигурацию из YAML файла
LoadResult load(const std::filesystem::path& path);

/// Загрузить конфигурацию из YAML текста
/// @param base_dir Директория для разрешения относительного root
LoadResult load_from_string(const std::string& yaml, const std::filesystem::path& base_dir);

/// Построить фильтр имён из регулярного выражения (std::regex_search)
/// @throws std::regex_error при некорректном выражении
NameFilter make_regex_filter(const std::string& pattern);

/// Применить конфигурацию к ResolveOptions (заданные поля перезаписывают)
/// @throws std::regex_error при некорректном filter
void apply(const Config& cfg, ResolveOptions& options);

}  // namespace verfold::config

#endif  // VERFOLD_CONFIG_HPP
