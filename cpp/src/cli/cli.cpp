// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Собственный слой CLI: сообщения об ошибках в стиле clap,
// exit code 2 для ошибок использования.
//
// ==============================================================================

#include "verfold/cli.hpp"

#include "verfold/platform.hpp"

#include <cstring>

namespace verfold::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

/// Ошибка использования: текст + подсказка, exit code 2
void usage_error(ParseResult& result, const std::string& message, const char* usage) {
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message = "error: " + message + "\n\nUsage: " + usage +
                                       "\n\nFor more information, try '--help'.\n";
}

/// Взять значение опции из следующего аргумента
/// @return nullptr если значения нет (ошибка уже записана в result)
const char* take_value(int argc, char** argv, int& i, ParseResult& result, const char* display,
                       const char* usage) {
    if (i + 1 >= argc) {
        usage_error(result,
                    std::string("a value is required for '") + display +
                        "' but none was supplied",
                    usage);
        return nullptr;
    }
    ++i;
    return argv[i];
}

constexpr const char* MAIN_USAGE = "verfold [OPTIONS] <COMMAND>";
constexpr const char* RESOLVE_USAGE = "verfold resolve [OPTIONS] [ROOT]";
constexpr const char* PARSE_VERSION_USAGE = "verfold parse-version <TEXT>...";

void parse_resolve(int argc, char** argv, int start, ParseResult& result) {
    ResolveCommand cmd;

    for (int i = start; i < argc; ++i) {
        const char* arg = argv[i];

        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{"resolve"};
            return;
        } else if (str_eq(arg, "-t") || str_eq(arg, "--target-version")) {
            const char* v = take_value(argc, argv, i, result, "--target-version <VERSION>",
                                       RESOLVE_USAGE);
            if (v == nullptr) {
                return;
            }
            cmd.target_version = v;
        } else if (str_eq(arg, "-f") || str_eq(arg, "--filter")) {
            const char* v = take_value(argc, argv, i, result, "--filter <REGEX>", RESOLVE_USAGE);
            if (v == nullptr) {
                return;
            }
            cmd.filter = v;
        } else if (str_eq(arg, "-e") || str_eq(arg, "--encoding")) {
            const char* v = take_value(argc, argv, i, result, "--encoding <ENCODING>",
                                       RESOLVE_USAGE);
            if (v == nullptr) {
                return;
            }
            auto enc = io::parse_encoding(v);
            if (!enc.has_value()) {
                usage_error(result,
                            std::string("invalid value '") + v +
                                "' for '--encoding <ENCODING>': unknown encoding, must be: "
                                "utf-8, utf-16le, utf-16be, iso-8859-1, or us-ascii",
                            RESOLVE_USAGE);
                return;
            }
            cmd.encoding = *enc;
        } else if (str_eq(arg, "-c") || str_eq(arg, "--config")) {
            const char* v = take_value(argc, argv, i, result, "--config <FILE>", RESOLVE_USAGE);
            if (v == nullptr) {
                return;
            }
            cmd.config = platform::path_from_utf8(v);
        } else if (str_eq(arg, "-o") || str_eq(arg, "--output")) {
            const char* v = take_value(argc, argv, i, result, "--output <OUTPUT>", RESOLVE_USAGE);
            if (v == nullptr) {
                return;
            }
            cmd.output = platform::path_from_utf8(v);
        } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
            cmd.json = true;
        } else if (str_eq(arg, "--jsonl")) {
            cmd.jsonl = true;
        } else if (str_eq(arg, "--contents")) {
            cmd.contents = true;
        } else if (str_eq(arg, "-q")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "-v")) {
            result.global.verbose++;
        } else if (arg[0] == '-' && arg[1] != '\0') {
            usage_error(result, std::string("unexpected argument '") + arg + "' found",
                        RESOLVE_USAGE);
            return;
        } else if (!cmd.root.has_value()) {
            cmd.root = platform::path_from_utf8(arg);
        } else {
            usage_error(result, std::string("unexpected argument '") + arg + "' found",
                        RESOLVE_USAGE);
            return;
        }
    }

    if (cmd.json && cmd.jsonl) {
        usage_error(result, "the argument '--json' cannot be used with '--jsonl'", RESOLVE_USAGE);
        return;
    }

    // ROOT можно задать в конфигурации
    if (!cmd.root.has_value() && !cmd.config.has_value()) {
        usage_error(result, "the following required arguments were not provided:\n  <ROOT>",
                    RESOLVE_USAGE);
        return;
    }

    result.ok = true;
    result.command = cmd;
}

void parse_parse_version(int argc, char** argv, int start, ParseResult& result) {
    ParseVersionCommand cmd;

    for (int i = start; i < argc; ++i) {
        const char* arg = argv[i];
        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{"parse-version"};
            return;
        }
        // Любой другой аргумент - текст для разбора, включая начинающийся с '-'
        cmd.texts.emplace_back(arg);
    }

    if (cmd.texts.empty()) {
        usage_error(result, "the following required arguments were not provided:\n  <TEXT>...",
                    PARSE_VERSION_USAGE);
        return;
    }

    result.ok = true;
    result.command = cmd;
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("verfold ") + VERSION + "\n";
}

// ----------------------------------------------------------------------------
// render_help
// ----------------------------------------------------------------------------

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: verfold [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  resolve        List migration scripts resolved from version folders\n"
               "  parse-version  Show how folder names parse into versions\n"
               "  help           Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Options:\n"
               "      --no-banner  Hide the banner\n"
               "  -q               Suppress informational output\n"
               "  -v...            Print verbose output\n"
               "  -h, --help       Print help\n"
               "  -V, --version    Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    List every script under db/migrations:\n"
               "        ./verfold resolve db/migrations\n"
               "\n"
               "    List scripts up to version 2.1 as JSON:\n"
               "        ./verfold resolve db/migrations -t 2.1 --json\n";
    } else if (*command == "resolve") {
        return "List migration scripts resolved from version folders\n"
               "\n"
               "Usage: verfold resolve [OPTIONS] [ROOT]\n"
               "\n"
               "Arguments:\n"
               "  [ROOT]  Directory containing version folders\n"
               "\n"
               "Options:\n"
               "  -t, --target-version <VERSION>  Skip folders with a higher version\n"
               "  -f, --filter <REGEX>            Keep folder and script names matching REGEX\n"
               "  -e, --encoding <ENCODING>       Script file encoding [default: utf-8]\n"
               "  -c, --config <FILE>             Load settings from a YAML file\n"
               "  -j, --json                      Output as JSON\n"
               "      --jsonl                     Output as JSON lines\n"
               "      --contents                  Print script contents\n"
               "  -o, --output <OUTPUT>           Save output to a file\n"
               "  -h, --help                      Print help\n";
    } else if (*command == "parse-version") {
        return "Show how folder names parse into versions\n"
               "\n"
               "Usage: verfold parse-version <TEXT>...\n"
               "\n"
               "Arguments:\n"
               "  <TEXT>...  Folder names or version strings\n"
               "\n"
               "Options:\n"
               "  -h, --help  Print help\n";
    } else {
        return "error: unrecognized subcommand '" + *command + "'\n";
    }
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.ok = false;
    result.command = HelpCommand{};

    if (argc < 2) {
        // Без аргументов: справка в stderr, exit code 2
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    // Глобальные опции до подкоманды
    int cmd_idx = argc;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (str_eq(arg, "--no-banner")) {
            result.global.no_banner = true;
        } else if (str_eq(arg, "-v")) {
            result.global.verbose++;
        } else if (str_eq(arg, "-q")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (arg[0] == '-') {
            usage_error(result, std::string("unexpected argument '") + arg + "' found",
                        MAIN_USAGE);
            return result;
        } else {
            cmd_idx = i;
            break;
        }
    }

    if (cmd_idx >= argc) {
        result.ok = true;
        result.command = HelpCommand{};
        return result;
    }

    const char* cmd = argv[cmd_idx];

    if (str_eq(cmd, "resolve")) {
        parse_resolve(argc, argv, cmd_idx + 1, result);
    } else if (str_eq(cmd, "parse-version")) {
        parse_parse_version(argc, argv, cmd_idx + 1, result);
    } else if (str_eq(cmd, "help")) {
        result.ok = true;
        if (cmd_idx + 1 < argc) {
            result.command = HelpCommand{argv[cmd_idx + 1]};
        } else {
            result.command = HelpCommand{};
        }
    } else {
        usage_error(result, std::string("unrecognized subcommand '") + cmd + "'", MAIN_USAGE);
    }

    return result;
}

}  // namespace verfold::cli
