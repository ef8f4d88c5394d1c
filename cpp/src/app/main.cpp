// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// Точка входа:
// 1. Парсинг argv через cli
// 2. Создание Writer (output)
// 3. Dispatch команды
// 4. Возврат exit code
//
// Исключения перехватываются на границе app.
//
// ==============================================================================

#include "verfold/cli.hpp"
#include "verfold/config.hpp"
#include "verfold/error.hpp"
#include "verfold/output.hpp"
#include "verfold/platform.hpp"
#include "verfold/resolver.hpp"
#include "verfold/version.hpp"

#include <exception>
#include <iostream>
#include <regex>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace {

// ----------------------------------------------------------------------------
// Banner (--no-banner)
// ----------------------------------------------------------------------------

constexpr const char* BANNER = R"(
                 __       _     _
 __   _____ _ __ / _| ___ | | __| |
 \ \ / / _ \ '__| |_ / _ \| |/ _` |
  \ V /  __/ |  |  _| (_) | | (_| |
   \_/ \___|_|  |_|  \___/|_|\__,_|
)";

void print_banner(verfold::output::Writer& writer, bool no_banner, bool quiet) {
    if (no_banner || quiet) {
        return;
    }
    writer.write(verfold::output::Stream::Stderr, BANNER);
    writer.write_line(verfold::output::Stream::Stderr, "");
}

verfold::output::ScriptFormat script_format(const verfold::cli::ResolveCommand& cmd) {
    using verfold::output::ScriptFormat;
    if (cmd.json) {
        return ScriptFormat::Json;
    }
    if (cmd.jsonl) {
        return ScriptFormat::JsonLines;
    }
    return cmd.contents ? ScriptFormat::Contents : ScriptFormat::Table;
}

// ----------------------------------------------------------------------------
// Выполнение команд
// ----------------------------------------------------------------------------

int run_resolve(const verfold::cli::ResolveCommand& cmd, verfold::output::Writer& writer) {
    using namespace verfold;

    ResolveOptions options;

    // Конфигурация из файла, затем переопределения из командной строки
    if (cmd.config.has_value()) {
        writer.debug("Loading config: " + platform::path_to_utf8(*cmd.config));
        config::LoadResult loaded = config::load(*cmd.config);
        if (!loaded.ok) {
            writer.error(loaded.error.format());
            return 1;
        }
        config::apply(loaded.config, options);
    }

    if (cmd.root.has_value()) {
        options.root = *cmd.root;
    }
    if (cmd.target_version.has_value()) {
        options.target_version = cmd.target_version;
    }
    if (cmd.encoding.has_value()) {
        options.encoding = *cmd.encoding;
    }
    if (cmd.filter.has_value()) {
        try {
            options.filter = config::make_regex_filter(*cmd.filter);
        } catch (const std::regex_error& e) {
            writer.error("invalid filter regex '" + *cmd.filter + "' - " + e.what());
            return 2;
        }
    }

    if (options.root.empty()) {
        writer.error("No root directory was provided on the command line or in the config");
        return 2;
    }

    std::string target = options.target_version.value_or("");
    writer.info("Resolving migration scripts from: " + platform::path_to_utf8(options.root) +
                " (target version: " + (target.empty() ? std::string("none") : target) + ")");
    writer.debug(std::string("Script encoding: ") + io::encoding_name(options.encoding));
    if (cmd.filter.has_value()) {
        writer.debug("Name filter: " + *cmd.filter);
    }

    std::vector<ScriptRecord> scripts;
    try {
        scripts = resolve_scripts(options);
    } catch (const ResolveError& e) {
        writer.error(e.format());
        return 1;
    }

    for (const auto& script : scripts) {
        writer.trace("Loaded " + script.name + " (" + std::to_string(script.contents.size()) +
                     " bytes)");
    }

    // Файл --output создаётся только при успешном разрешении скриптов
    if (cmd.output.has_value()) {
        output::OutputConfig out_cfg = writer.config();
        out_cfg.output_path = cmd.output;
        output::Writer file_writer(out_cfg);
        if (!file_writer.ready()) {
            writer.error("failed to open output file - " + platform::path_to_utf8(*cmd.output));
            return 1;
        }
        output::write_scripts(file_writer, scripts, script_format(cmd));
    } else {
        output::write_scripts(writer, scripts, script_format(cmd));
    }

    writer.info("Resolved " + std::to_string(scripts.size()) + " migration scripts");
    return 0;
}

int run_parse_version(const verfold::cli::ParseVersionCommand& cmd,
                      verfold::output::Writer& writer) {
    using namespace verfold;

    std::vector<output::ParsedText> rows;
    int failures = 0;
    for (const auto& text : cmd.texts) {
        rows.push_back({text, try_parse_version(text)});
        if (!rows.back().version.has_value()) {
            ++failures;
        }
    }
    writer.write(output::Stream::Stdout, output::version_table(rows).render());

    if (failures > 0) {
        writer.warn(std::to_string(failures) + " of " + std::to_string(cmd.texts.size()) +
                    " texts could not be parsed as versions");
        return 1;
    }
    return 0;
}

// ----------------------------------------------------------------------------
// Главная функция выполнения (run)
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    using namespace verfold;

    // 1. Парсинг argv
    cli::ParseResult parse_result = cli::parse(argc, argv);

    // 2. Создание Writer
    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    output::Writer writer(out_cfg);

    // 3. Ошибки парсинга: сообщение напрямую в stderr, без префикса [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    // 4. Dispatch команды
    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help(cmd.command));
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::ResolveCommand>) {
                print_banner(writer, parse_result.global.no_banner, out_cfg.quiet);
                return run_resolve(cmd, writer);
            } else if constexpr (std::is_same_v<T, cli::ParseVersionCommand>) {
                return run_parse_version(cmd, writer);
            } else {
                // Unreachable
                return 1;
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Формат ошибки "[x] <err>"
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    } catch (...) {
        std::cerr << "[x] Unknown error occurred\n";
        return 1;
    }
}
