// ==============================================================================
// output.cpp - Пользовательский вывод
// ==============================================================================
//
// RapidJSON для списков скриптов. Байты пишутся через fwrite, без std::endl.
//
// ==============================================================================

#include "verfold/output.hpp"

#include "verfold/platform.hpp"

#include <algorithm>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <utility>

namespace verfold::output {

namespace {

constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";

struct LevelStyle {
    const char* prefix;
    const char* color;
};

LevelStyle style_of(Level level) {
    switch (level) {
    case Level::Info:
        return {"[+] ", ANSI_GREEN};
    case Level::Warn:
        return {"[!] ", "\x1b[33m"};
    case Level::Error:
        return {"[x] ", "\x1b[31m"};
    case Level::Debug:
        return {"[*] ", "\x1b[36m"};
    case Level::Trace:
    default:
        return {"[~] ", "\x1b[35m"};
    }
}

// Псевдографика рамки (UTF-8)
constexpr const char* BOX_V = "\xe2\x94\x82";  // │
constexpr const char* BOX_H = "\xe2\x94\x80";  // ─

/// Углы и стыки одной горизонтальной линии рамки
struct Rule {
    const char* left;
    const char* middle;
    const char* right;
};

constexpr Rule RULE_TOP{"\xe2\x94\x8c", "\xe2\x94\xac", "\xe2\x94\x90"};     // ┌ ┬ ┐
constexpr Rule RULE_HEADER{"\xe2\x94\x9c", "\xe2\x94\xbc", "\xe2\x94\xa4"};  // ├ ┼ ┤
constexpr Rule RULE_BOTTOM{"\xe2\x94\x94", "\xe2\x94\xb4", "\xe2\x94\x98"};  // └ ┴ ┘

void append_rule(std::string& out, const std::vector<size_t>& widths, const Rule& rule) {
    out += rule.left;
    for (size_t i = 0; i < widths.size(); ++i) {
        for (size_t j = 0; j < widths[i] + 2; ++j) {
            out += BOX_H;
        }
        out += (i + 1 < widths.size()) ? rule.middle : rule.right;
    }
    out += '\n';
}

void append_cells(std::string& out, const std::vector<size_t>& widths,
                  const std::vector<std::string>& cells) {
    out += BOX_V;
    for (size_t i = 0; i < widths.size(); ++i) {
        const std::string empty;
        const std::string& cell = (i < cells.size()) ? cells[i] : empty;
        out += ' ';
        out += cell;
        out.append(widths[i] - display_width(cell) + 1, ' ');
        out += BOX_V;
    }
    out += '\n';
}

/// Объект {name, contents}; длины явные, текст скрипта может содержать '\0'
rapidjson::Value script_object(const ScriptRecord& script,
                               rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value obj(rapidjson::kObjectType);
    obj.AddMember("name",
                  rapidjson::Value(script.name.data(),
                                   static_cast<rapidjson::SizeType>(script.name.size()), alloc),
                  alloc);
    obj.AddMember("contents",
                  rapidjson::Value(script.contents.data(),
                                   static_cast<rapidjson::SizeType>(script.contents.size()), alloc),
                  alloc);
    return obj;
}

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(OutputConfig cfg) : config_(std::move(cfg)) {
    if (!config_.output_path.has_value()) {
        return;
    }
#ifdef _WIN32
    data_file_ = _wfopen(config_.output_path->c_str(), L"wb");
#else
    data_file_ = std::fopen(platform::path_to_utf8(*config_.output_path).c_str(), "wb");
#endif
}

Writer::~Writer() {
    flush();
    if (data_file_ != nullptr) {
        std::fclose(data_file_);
    }
}

bool Writer::ready() const {
    return !config_.output_path.has_value() || data_file_ != nullptr;
}

std::FILE* Writer::target(Stream s) const {
    if (s == Stream::Stderr) {
        return stderr;
    }
    return data_file_ != nullptr ? data_file_ : stdout;
}

bool Writer::colored(Stream s) const {
    return platform::is_terminal(target(s));
}

void Writer::write(Stream s, std::string_view bytes) {
    std::fwrite(bytes.data(), 1, bytes.size(), target(s));
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

bool Writer::enabled(Level level) const {
    switch (level) {
    case Level::Error:
        return true;
    case Level::Info:
    case Level::Warn:
        return !config_.quiet;
    case Level::Debug:
        return config_.verbose >= 1;
    case Level::Trace:
    default:
        return config_.verbose >= 2;
    }
}

void Writer::log(Level level, std::string_view message) {
    if (!enabled(level)) {
        return;
    }
    const LevelStyle style = style_of(level);
    if (colored(Stream::Stderr)) {
        write(Stream::Stderr, style.color);
        write(Stream::Stderr, style.prefix);
        write(Stream::Stderr, ANSI_RESET);
    } else {
        write(Stream::Stderr, style.prefix);
    }
    write_line(Stream::Stderr, message);
}

void Writer::script_heading(std::string_view name) {
    const bool color = colored(Stream::Stdout);
    if (color) {
        write(Stream::Stdout, ANSI_GREEN);
    }
    write(Stream::Stdout, "-- ");
    write(Stream::Stdout, name);
    if (color) {
        write(Stream::Stdout, ANSI_RESET);
    }
    write(Stream::Stdout, "\n");
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
    if (data_file_ != nullptr) {
        std::fflush(data_file_);
    }
}

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

Table::Table(std::vector<std::string> headers) : headers_(std::move(headers)) {}

void Table::add_row(std::vector<std::string> cells) {
    rows_.push_back(std::move(cells));
}

std::vector<size_t> Table::column_widths() const {
    std::vector<size_t> widths(headers_.size(), 0);
    auto widen = [&widths](const std::vector<std::string>& cells) {
        if (cells.size() > widths.size()) {
            widths.resize(cells.size(), 0);
        }
        for (size_t i = 0; i < cells.size(); ++i) {
            widths[i] = std::max(widths[i], display_width(cells[i]));
        }
    };
    widen(headers_);
    for (const auto& row : rows_) {
        widen(row);
    }
    return widths;
}

std::string Table::render() const {
    const std::vector<size_t> widths = column_widths();
    std::string out;
    append_rule(out, widths, RULE_TOP);
    append_cells(out, widths, headers_);
    append_rule(out, widths, RULE_HEADER);
    for (const auto& row : rows_) {
        append_cells(out, widths, row);
    }
    append_rule(out, widths, RULE_BOTTOM);
    return out;
}

// ----------------------------------------------------------------------------
// Результаты команд
// ----------------------------------------------------------------------------

Table script_table(const std::vector<ScriptRecord>& scripts) {
    Table table({"script", "bytes"});
    for (const auto& script : scripts) {
        table.add_row({script.name, std::to_string(script.contents.size())});
    }
    return table;
}

Table version_table(const std::vector<ParsedText>& rows) {
    Table table({"text", "version"});
    for (const auto& row : rows) {
        table.add_row({row.text, row.version ? row.version->to_string() : "invalid"});
    }
    return table;
}

std::string scripts_to_json(const std::vector<ScriptRecord>& scripts) {
    rapidjson::Document doc;
    doc.SetArray();
    for (const auto& script : scripts) {
        doc.PushBack(script_object(script, doc.GetAllocator()), doc.GetAllocator());
    }

    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    doc.Accept(writer);

    std::string out(buffer.GetString(), buffer.GetSize());
    out += '\n';
    return out;
}

std::string scripts_to_json_lines(const std::vector<ScriptRecord>& scripts) {
    std::string out;
    for (const auto& script : scripts) {
        rapidjson::Document doc;
        rapidjson::Value obj = script_object(script, doc.GetAllocator());

        rapidjson::StringBuffer buffer;
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        obj.Accept(writer);
        out.append(buffer.GetString(), buffer.GetSize());
        out += '\n';
    }
    return out;
}

void write_scripts(Writer& w, const std::vector<ScriptRecord>& scripts, ScriptFormat format) {
    switch (format) {
    case ScriptFormat::Json:
        w.write(Stream::Stdout, scripts_to_json(scripts));
        break;
    case ScriptFormat::JsonLines:
        w.write(Stream::Stdout, scripts_to_json_lines(scripts));
        break;
    case ScriptFormat::Contents:
        for (const auto& script : scripts) {
            w.script_heading(script.name);
            w.write_line(Stream::Stdout, script.contents);
        }
        break;
    case ScriptFormat::Table:
    default:
        w.write(Stream::Stdout, script_table(scripts).render());
        break;
    }
    w.flush();
}

size_t display_width(std::string_view text) {
    // Байты продолжения UTF-8 (10xxxxxx) не начинают code point
    return static_cast<size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

}  // namespace verfold::output
