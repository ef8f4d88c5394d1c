// ==============================================================================
// verfold/resolver.hpp - Разрешение скриптов из версионных папок
// ==============================================================================
//
// Назначение:
// - Сбор .sql скриптов из поддиректорий корня миграций
// - Режим без целевой версии: все поддиректории
// - Режим с целевой версией: только папки с версией <= целевой,
//   с обнаружением неоднозначных версий
// - Имя скрипта: "<папка>/<файл>", уникально между папками
//
// Поведение:
// - Порядок папок и файлов - порядок перечисления файловой системы
// - Любая ошибка (версия, неоднозначность, ввод-вывод) прерывает весь вызов,
//   частичный результат не возвращается
// - Разрешение не имеет состояния между вызовами
//
// ==============================================================================

#ifndef VERFOLD_RESOLVER_HPP
#define VERFOLD_RESOLVER_HPP

#include <verfold/encoding.hpp>

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace verfold {

namespace io {
class FileSystem;
}

// ----------------------------------------------------------------------------
// ScriptRecord - загруженный скрипт
// ----------------------------------------------------------------------------

struct ScriptRecord {
    /// Относительное имя "<папка>/<файл>" (разделитель '/' на всех платформах)
    std::string name;

    /// Текст скрипта в UTF-8
    std::string contents;
};

// ----------------------------------------------------------------------------
// ResolveOptions - параметры разрешения
// ----------------------------------------------------------------------------

/// Предикат над именем папки или "<папка>/<файл>"
using NameFilter = std::function<bool(const std::string&)>;

struct ResolveOptions {
    /// Корневая директория с версионными папками
    std::filesystem::path root;

    /// Целевая версия; nullopt или пустая строка - все папки
    std::optional<std::string> target_version;

    /// Фильтр имён; пустой - без фильтрации.
    /// Применяется к именам папок (только с целевой версией) и к
    /// составным именам "<папка>/<файл>" (всегда)
    NameFilter filter;

    /// Кодировка файлов скриптов
    io::TextEncoding encoding = io::TextEncoding::Utf8;
};

/// Шаблон файлов скриптов внутри версионной папки
constexpr const char* SCRIPT_PATTERN = "*.sql";

// ----------------------------------------------------------------------------
// FolderResolver
// ----------------------------------------------------------------------------

class FolderResolver {
public:
    /// fs должен пережить FolderResolver
    FolderResolver(ResolveOptions options, const io::FileSystem& fs);

    /// Выполнить разрешение
    /// @throws ResolveError (MalformedVersion) некорректная целевая версия или имя папки
    /// @throws ResolveError (AmbiguousVersion) две папки с одинаковой версией
    /// @throws ResolveError (Io) ошибка перечисления или чтения
    std::vector<ScriptRecord> resolve() const;

    /// Используется ли ограничение целевой версией
    bool bounded() const;

    const ResolveOptions& options() const { return options_; }

private:
    std::vector<ScriptRecord> resolve_unbounded() const;
    std::vector<ScriptRecord> resolve_bounded() const;

    /// Загрузить скрипты из одной версионной папки и дописать в out
    void load_folder(const std::string& folder, std::vector<ScriptRecord>& out) const;

    ResolveOptions options_;
    const io::FileSystem& fs_;
};

// ----------------------------------------------------------------------------
// Свободные функции
// ----------------------------------------------------------------------------

/// Разрешить скрипты через заданную файловую систему
std::vector<ScriptRecord> resolve_scripts(const ResolveOptions& options, const io::FileSystem& fs);

/// Разрешить скрипты на локальной файловой системе
std::vector<ScriptRecord> resolve_scripts(const ResolveOptions& options);

}  // namespace verfold

#endif  // VERFOLD_RESOLVER_HPP
