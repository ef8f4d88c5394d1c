// ==============================================================================
// resolver.cpp - Разрешение скриптов из версионных папок
// ==============================================================================

#include "verfold/resolver.hpp"

#include "verfold/error.hpp"
#include "verfold/filesystem.hpp"
#include "verfold/platform.hpp"
#include "verfold/version.hpp"

#include <algorithm>
#include <utility>

namespace verfold {

// ----------------------------------------------------------------------------
// FolderResolver
// ----------------------------------------------------------------------------

FolderResolver::FolderResolver(ResolveOptions options, const io::FileSystem& fs)
    : options_(std::move(options)), fs_(fs) {}

bool FolderResolver::bounded() const {
    return options_.target_version.has_value() && !options_.target_version->empty();
}

std::vector<ScriptRecord> FolderResolver::resolve() const {
    return bounded() ? resolve_bounded() : resolve_unbounded();
}

std::vector<ScriptRecord> FolderResolver::resolve_unbounded() const {
    std::vector<ScriptRecord> scripts;

    // Имена папок не фильтруются, фильтр применяется только к файлам
    for (const auto& folder : fs_.list_subdirectories(options_.root)) {
        load_folder(folder, scripts);
    }

    return scripts;
}

std::vector<ScriptRecord> FolderResolver::resolve_bounded() const {
    std::vector<std::string> folders = fs_.list_subdirectories(options_.root);

    // Отброшенные фильтром папки не участвуют и в проверке неоднозначности
    if (options_.filter) {
        folders.erase(std::remove_if(folders.begin(), folders.end(),
                                     [&](const std::string& name) { return !options_.filter(name); }),
                      folders.end());
    }

    std::vector<ScriptRecord> scripts;
    if (folders.empty()) {
        return scripts;
    }

    const Version target = parse_version(*options_.target_version);
    std::vector<Version> accepted;

    for (const auto& folder : folders) {
        // Все оставшиеся имена папок обязаны разбираться как версии
        const Version version = parse_version(folder);
        if (version > target) {
            continue;
        }

        if (std::find(accepted.begin(), accepted.end(), version) != accepted.end()) {
            throw ResolveError(ResolveErrorKind::AmbiguousVersion,
                               "Version '" + version.to_string() + "' parsed for folder '" + folder +
                                   "' is ambiguous.",
                               folder);
        }

        load_folder(folder, scripts);
        accepted.push_back(version);
    }

    return scripts;
}

void FolderResolver::load_folder(const std::string& folder, std::vector<ScriptRecord>& out) const {
    const std::filesystem::path folder_path = options_.root / platform::path_from_utf8(folder);

    // Сначала собираем выбранные файлы, затем читаем по одному
    std::vector<std::pair<std::string, std::string>> selected;  // (имя файла, составное имя)
    for (auto& file : fs_.list_files(folder_path, SCRIPT_PATTERN)) {
        std::string name = folder + "/" + file;
        if (options_.filter && !options_.filter(name)) {
            continue;
        }
        selected.emplace_back(std::move(file), std::move(name));
    }

    for (auto& [file, name] : selected) {
        std::string bytes = fs_.read_file(folder_path / platform::path_from_utf8(file));
        out.push_back(ScriptRecord{std::move(name), io::decode_text(bytes, options_.encoding)});
    }
}

// ----------------------------------------------------------------------------
// Свободные функции
// ----------------------------------------------------------------------------

std::vector<ScriptRecord> resolve_scripts(const ResolveOptions& options, const io::FileSystem& fs) {
    return FolderResolver(options, fs).resolve();
}

std::vector<ScriptRecord> resolve_scripts(const ResolveOptions& options) {
    io::LocalFileSystem fs;
    return FolderResolver(options, fs).resolve();
}

}  // namespace verfold
