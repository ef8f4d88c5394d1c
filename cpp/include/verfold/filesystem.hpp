// ==============================================================================
// verfold/filesystem.hpp - Доступ к файловой системе
// ==============================================================================
//
// Назначение:
// - Абстракция FileSystem: перечисление поддиректорий и файлов, чтение файла
// - LocalFileSystem: реализация поверх std::filesystem
// - Сопоставление имён с glob-шаблоном (* и ?)
//
// Порядок перечисления - порядок файловой системы, без сортировки.
// Все ошибки ввода-вывода бросают ResolveError (Io).
//
// ==============================================================================

#ifndef VERFOLD_FILESYSTEM_HPP
#define VERFOLD_FILESYSTEM_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace verfold::io {

// ----------------------------------------------------------------------------
// FileSystem - интерфейс доступа к файлам
// ----------------------------------------------------------------------------

class FileSystem {
public:
    virtual ~FileSystem() = default;

    /// Имена непосредственных поддиректорий path
    /// @throws ResolveError (Io) если path не существует или не читается
    virtual std::vector<std::string> list_subdirectories(const std::filesystem::path& path) const = 0;

    /// Имена файлов непосредственно в path, подходящих под glob-шаблон
    /// @throws ResolveError (Io)
    virtual std::vector<std::string> list_files(const std::filesystem::path& path,
                                                std::string_view pattern) const = 0;

    /// Прочитать содержимое файла целиком (байты)
    /// @throws ResolveError (Io)
    virtual std::string read_file(const std::filesystem::path& path) const = 0;
};

// ----------------------------------------------------------------------------
// LocalFileSystem - реальная файловая система
// ----------------------------------------------------------------------------

class LocalFileSystem : public FileSystem {
public:
    LocalFileSystem();

    std::vector<std::string> list_subdirectories(const std::filesystem::path& path) const override;

    /// Регистр сравнивается по правилам платформы (platform::filenames_case_sensitive)
    std::vector<std::string> list_files(const std::filesystem::path& path,
                                        std::string_view pattern) const override;

    std::string read_file(const std::filesystem::path& path) const override;

private:
    bool case_sensitive_;
};

// ----------------------------------------------------------------------------
// Glob
// ----------------------------------------------------------------------------

/// Сопоставить имя с шаблоном: '*' - любая последовательность, '?' - один символ
/// При case_sensitive=false сравнение ASCII без учёта регистра
bool match_glob(std::string_view pattern, std::string_view name, bool case_sensitive);

}  // namespace verfold::io

#endif  // VERFOLD_FILESYSTEM_HPP
