// ==============================================================================
// filesystem.cpp - Доступ к файловой системе
// ==============================================================================
//
// LocalFileSystem поверх std::filesystem (error_code API, без исключений
// std::filesystem_error). Ошибки переводятся в ResolveError (Io).
//
// ==============================================================================

#include "verfold/filesystem.hpp"

#include "verfold/error.hpp"
#include "verfold/platform.hpp"

#include <cctype>
#include <fstream>
#include <iterator>
#include <system_error>

namespace verfold::io {

namespace {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

[[noreturn]] void throw_io(const std::string& what, const std::filesystem::path& path) {
    std::string p = platform::path_to_utf8(path);
    throw ResolveError(ResolveErrorKind::Io, what + " - " + p, p);
}

[[noreturn]] void throw_io(const std::string& what, const std::filesystem::path& path,
                           const std::error_code& ec) {
    std::string p = platform::path_to_utf8(path);
    throw ResolveError(ResolveErrorKind::Io, what + " - " + p + ": " + ec.message(), p);
}

/// Проверить, что path - существующая директория
void require_directory(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::file_status status = std::filesystem::status(path, ec);

    if (ec && ec != std::errc::no_such_file_or_directory) {
        throw_io("failed to get metadata for path", path, ec);
    }
    if (!std::filesystem::exists(status)) {
        throw_io("directory does not exist", path);
    }
    if (!std::filesystem::is_directory(status)) {
        throw_io("path is not a directory", path);
    }
}

/// Обойти непосредственные элементы директории
/// Функция fn получает directory_entry и решает, включать ли имя
template <typename Fn>
std::vector<std::string> list_entries(const std::filesystem::path& path, Fn&& fn) {
    require_directory(path);

    std::error_code ec;
    std::filesystem::directory_iterator it(path, ec);
    if (ec) {
        throw_io("failed to read directory", path, ec);
    }

    std::vector<std::string> names;
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (fn(*it)) {
            names.push_back(platform::path_to_utf8(it->path().filename()));
        }
    }
    // При ошибке increment() итератор становится end
    if (ec) {
        throw_io("failed to read directory", path, ec);
    }

    return names;
}

/// Цель символической ссылки не существует
bool is_missing_target(const std::error_code& ec) {
    return ec == std::errc::no_such_file_or_directory;
}

bool chars_equal(char a, char b, bool case_sensitive) {
    if (case_sensitive) {
        return a == b;
    }
    return std::tolower(static_cast<unsigned char>(a)) ==
           std::tolower(static_cast<unsigned char>(b));
}

}  // namespace

// ----------------------------------------------------------------------------
// LocalFileSystem
// ----------------------------------------------------------------------------

LocalFileSystem::LocalFileSystem() : case_sensitive_(platform::filenames_case_sensitive()) {}

std::vector<std::string> LocalFileSystem::list_subdirectories(
    const std::filesystem::path& path) const {
    return list_entries(path, [&](const std::filesystem::directory_entry& entry) {
        // is_directory следует по символическим ссылкам;
        // висячая ссылка - не директория
        std::error_code ec;
        bool is_dir = entry.is_directory(ec);
        if (ec && !is_missing_target(ec)) {
            throw_io("failed to get metadata for path", entry.path(), ec);
        }
        return is_dir && !ec;
    });
}

std::vector<std::string> LocalFileSystem::list_files(const std::filesystem::path& path,
                                                     std::string_view pattern) const {
    return list_entries(path, [&](const std::filesystem::directory_entry& entry) {
        // Имена вне шаблона не проверяются вовсе
        std::string name = platform::path_to_utf8(entry.path().filename());
        if (!match_glob(pattern, name, case_sensitive_)) {
            return false;
        }

        std::error_code ec;
        bool is_file = entry.is_regular_file(ec);
        if (ec) {
            // Висячая ссылка с подходящим именем остаётся в списке:
            // ошибку сообщит read_file
            if (is_missing_target(ec)) {
                return true;
            }
            throw_io("failed to get metadata for path", entry.path(), ec);
        }
        return is_file;
    });
}

std::string LocalFileSystem::read_file(const std::filesystem::path& path) const {
    // Поток закрывается при выходе из функции на любом пути
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        throw_io("failed to open file", path);
    }

    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw_io("failed to read file", path);
    }

    return data;
}

// ----------------------------------------------------------------------------
// Glob
// ----------------------------------------------------------------------------

bool match_glob(std::string_view pattern, std::string_view name, bool case_sensitive) {
    std::size_t p = 0;
    std::size_t n = 0;

    // Позиция последней '*' и соответствующая позиция в name для отката
    std::size_t star = std::string_view::npos;
    std::size_t star_n = 0;

    while (n < name.size()) {
        if (p < pattern.size() &&
            (pattern[p] == '?' || (pattern[p] != '*' && chars_equal(pattern[p], name[n], case_sensitive)))) {
            ++p;
            ++n;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            star_n = n;
        } else if (star != std::string_view::npos) {
            p = star + 1;
            n = ++star_n;
        } else {
            return false;
        }
    }

    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

}  // namespace verfold::io
