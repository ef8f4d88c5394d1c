// ==============================================================================
// verfold/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Только этот модуль пишет в stdout/stderr.
//
// - stdout: данные (список скриптов, таблица версий), либо файл --output
// - stderr: журнал с префиксами [+] [!] [x] [*] [~]
// - JSON и JSON lines через RapidJSON
// - ANSI цвета только на терминале и никогда в файле --output
//
// ==============================================================================

#ifndef VERFOLD_OUTPUT_HPP
#define VERFOLD_OUTPUT_HPP

#include "verfold/resolver.hpp"
#include "verfold/version.hpp"

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace verfold::output {

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// Журнал
// ----------------------------------------------------------------------------

/// Уровень сообщения журнала
enum class Level {
    Info,   // [+] скрыто при -q
    Warn,   // [!] скрыто при -q
    Error,  // [x] всегда
    Debug,  // [*] при -v
    Trace   // [~] при -vv
};

struct OutputConfig {
    bool quiet = false;
    int verbose = 0;

    /// --output: данные stdout уходят в этот файл
    std::optional<std::filesystem::path> output_path;
};

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(OutputConfig cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    /// false, если output_path задан, но файл не удалось создать
    bool ready() const;

    void write(Stream s, std::string_view bytes);
    void write_line(Stream s, std::string_view bytes);

    /// Пишет "<префикс> <message>" в stderr, если уровень включён
    void log(Level level, std::string_view message);

    void info(std::string_view message) { log(Level::Info, message); }
    void warn(std::string_view message) { log(Level::Warn, message); }
    void error(std::string_view message) { log(Level::Error, message); }
    void debug(std::string_view message) { log(Level::Debug, message); }
    void trace(std::string_view message) { log(Level::Trace, message); }

    bool enabled(Level level) const;

    /// Строка "-- <name>" перед текстом скрипта (--contents)
    void script_heading(std::string_view name);

    void flush();

    const OutputConfig& config() const { return config_; }

private:
    std::FILE* target(Stream s) const;
    bool colored(Stream s) const;

    OutputConfig config_;
    std::FILE* data_file_ = nullptr;
};

// ----------------------------------------------------------------------------
// Table - рамка из псевдографики, ширина столбцов в code point'ах
// ----------------------------------------------------------------------------

class Table {
public:
    explicit Table(std::vector<std::string> headers);

    void add_row(std::vector<std::string> cells);
    size_t row_count() const { return rows_.size(); }

    std::string render() const;

private:
    std::vector<size_t> column_widths() const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
};

// ----------------------------------------------------------------------------
// Результаты команд
// ----------------------------------------------------------------------------

/// Формат списка скриптов в stdout
enum class ScriptFormat {
    Table,      // script | bytes
    Contents,   // "-- <name>" и текст скрипта
    Json,       // массив {name, contents}, отступ 2
    JsonLines   // объект {name, contents} на строку
};

/// Текст из командной строки parse-version и результат его разбора
struct ParsedText {
    std::string text;
    std::optional<Version> version;
};

/// Таблица "script | bytes"; bytes - размер текста в UTF-8
Table script_table(const std::vector<ScriptRecord>& scripts);

/// Таблица "text | version"; неразобранный текст получает "invalid"
Table version_table(const std::vector<ParsedText>& rows);

std::string scripts_to_json(const std::vector<ScriptRecord>& scripts);
std::string scripts_to_json_lines(const std::vector<ScriptRecord>& scripts);

/// Список скриптов в stdout (или файл --output) в заданном формате
void write_scripts(Writer& w, const std::vector<ScriptRecord>& scripts, ScriptFormat format);

/// Ширина UTF-8 строки в code point'ах
size_t display_width(std::string_view text);

}  // namespace verfold::output

#endif  // VERFOLD_OUTPUT_HPP
