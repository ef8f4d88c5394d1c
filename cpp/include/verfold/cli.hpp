// ==============================================================================
// verfold/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
//
// ==============================================================================

#ifndef VERFOLD_CLI_HPP
#define VERFOLD_CLI_HPP

#include <verfold/encoding.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace verfold::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    bool no_banner = false;  // --no-banner
    int verbose = 0;         // -v (repeatable)
    bool quiet = false;      // -q
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// resolve - список скриптов из версионных папок
struct ResolveCommand {
    std::optional<std::filesystem::path> root;    // positional: ROOT
    std::optional<std::string> target_version;    // -t, --target-version
    std::optional<std::string> filter;            // -f, --filter (regex)
    std::optional<io::TextEncoding> encoding;     // -e, --encoding
    std::optional<std::filesystem::path> config;  // -c, --config
    std::optional<std::filesystem::path> output;  // -o, --output
    bool json = false;                            // -j, --json
    bool jsonl = false;                           // --jsonl
    bool contents = false;                        // --contents
};

/// parse-version - показать результат разбора версии
struct ParseVersionCommand {
    std::vector<std::string> texts;
};

/// help - показать справку
struct HelpCommand {
    std::optional<std::string> command;  // опциональная подкоманда для справки
};

/// version - показать версию
struct VersionCommand {};

// ----------------------------------------------------------------------------
// Command - вариант команды
// ----------------------------------------------------------------------------

using Command = std::variant<ResolveCommand, ParseVersionCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 1;
    std::string stderr_message;
};

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API парсинга
// ----------------------------------------------------------------------------

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Генерировать текст --help (для конкретной команды или общий)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Генерировать текст --version
std::string render_version();

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

/// Версия программы
constexpr const char* VERSION = "0.1.0";

/// Описание программы
constexpr const char* ABOUT = "Resolve migration scripts from version folders";

}  // namespace verfold::cli

#endif  // VERFOLD_CLI_HPP
