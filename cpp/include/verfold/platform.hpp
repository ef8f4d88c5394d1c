// ==============================================================================
// verfold/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Имена папок и файлов внутри verfold всегда UTF-8; здесь они переводятся
// в native путь и обратно. Здесь же решается, различает ли платформа
// регистр в именах скриптов, и есть ли у потока вывода терминал.
//
// ==============================================================================

#ifndef VERFOLD_PLATFORM_HPP
#define VERFOLD_PLATFORM_HPP

#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>

namespace verfold::platform {

/// Путь из UTF-8 имени (аргумент CLI, значение из YAML, имя папки версии)
std::filesystem::path path_from_utf8(std::string_view u8str);

/// UTF-8 имя пути; при ошибке перекодировки на Windows - p.string()
std::string path_to_utf8(const std::filesystem::path& p);

/// Подключён ли поток к терминалу (ANSI цвета только в этом случае)
bool is_terminal(std::FILE* stream);

/// Различает ли файловая система платформы регистр в именах
/// Windows и macOS: false; остальные: true
bool filenames_case_sensitive();

}  // namespace verfold::platform

#endif  // VERFOLD_PLATFORM_HPP
