// ==============================================================================
// test_cli_gtest.cpp - Тесты CLI модуля (GoogleTest)
// ==============================================================================
//
// Проверяется:
// - глобальные опции, --help / --version
// - resolve: позиционный ROOT, опции, конфликты, обязательные аргументы
// - parse-version: список текстов
// - ошибки использования (exit code 2)
//
// ==============================================================================

#include "verfold/cli.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace verfold::cli::test {

// ==============================================================================
// Вспомогательные функции
// ==============================================================================

// Конвертация вектора строк в argc/argv
struct Args {
    std::vector<std::string> strings;
    std::vector<char*> ptrs;

    explicit Args(std::initializer_list<std::string> args) : strings(args) {
        for (auto& s : strings) {
            ptrs.push_back(s.data());
        }
        ptrs.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(strings.size()); }

    char** argv() { return ptrs.data(); }
};

ParseResult parse_args(Args&& args) {
    return parse(args.argc(), args.argv());
}

// ==============================================================================
// Help / Version
// ==============================================================================

TEST(CliTest, Parse_Help_ReturnsHelpCommand) {
    ParseResult result = parse_args(Args{"verfold", "--help"});
    EXPECT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<HelpCommand>(result.command));
    EXPECT_FALSE(std::get<HelpCommand>(result.command).command.has_value());
}

TEST(CliTest, Parse_Version_ReturnsVersionCommand) {
    EXPECT_TRUE(std::holds_alternative<VersionCommand>(parse_args(Args{"verfold", "-V"}).command));
    EXPECT_TRUE(
        std::holds_alternative<VersionCommand>(parse_args(Args{"verfold", "--version"}).command));
}

TEST(CliTest, Parse_HelpSubcommand_CarriesName) {
    ParseResult result = parse_args(Args{"verfold", "help", "resolve"});
    EXPECT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<HelpCommand>(result.command));
    EXPECT_EQ(std::get<HelpCommand>(result.command).command, std::optional<std::string>("resolve"));
}

TEST(CliTest, Parse_ResolveHelp_ReturnsResolveHelp) {
    ParseResult result = parse_args(Args{"verfold", "resolve", "--help"});
    EXPECT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<HelpCommand>(result.command));
    EXPECT_EQ(std::get<HelpCommand>(result.command).command, std::optional<std::string>("resolve"));
}

TEST(CliTest, Parse_NoArgs_HelpToStderrExitCode2) {
    ParseResult result = parse_args(Args{"verfold"});
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("Usage: verfold"), std::string::npos);
}

TEST(CliTest, RenderVersion) {
    EXPECT_EQ(render_version(), std::string("verfold ") + VERSION + "\n");
}

TEST(CliTest, RenderHelp_ListsCommands) {
    std::string help = render_help();
    EXPECT_NE(help.find("resolve"), std::string::npos);
    EXPECT_NE(help.find("parse-version"), std::string::npos);

    std::string resolve_help = render_help(std::string("resolve"));
    EXPECT_NE(resolve_help.find("--target-version <VERSION>"), std::string::npos);
    EXPECT_NE(resolve_help.find("--encoding <ENCODING>"), std::string::npos);

    EXPECT_NE(render_help(std::string("bogus")).find("unrecognized subcommand"), std::string::npos);
}

// ==============================================================================
// Глобальные опции
// ==============================================================================

TEST(CliTest, Parse_GlobalOptions) {
    ParseResult result =
        parse_args(Args{"verfold", "--no-banner", "-v", "-v", "-q", "resolve", "db"});
    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(result.global.no_banner);
    EXPECT_EQ(result.global.verbose, 2);
    EXPECT_TRUE(result.global.quiet);
}

TEST(CliTest, Parse_UnknownGlobalOption_Error) {
    ParseResult result = parse_args(Args{"verfold", "--bogus", "resolve"});
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("unexpected argument '--bogus' found"),
              std::string::npos);
}

TEST(CliTest, Parse_UnknownSubcommand_Error) {
    ParseResult result = parse_args(Args{"verfold", "migrate"});
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("unrecognized subcommand 'migrate'"),
              std::string::npos);
}

// ==============================================================================
// resolve
// ==============================================================================

TEST(CliResolveTest, Parse_AllOptions) {
    ParseResult result = parse_args(Args{"verfold", "resolve", "db/migrations", "-t", "2.1", "-f",
                                         "^1", "-e", "utf-16le", "-o", "out.json", "--json",
                                         "--contents"});
    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    ASSERT_TRUE(std::holds_alternative<ResolveCommand>(result.command));

    const auto& cmd = std::get<ResolveCommand>(result.command);
    ASSERT_TRUE(cmd.root.has_value());
    EXPECT_EQ(cmd.root->generic_string(), "db/migrations");
    EXPECT_EQ(cmd.target_version, std::optional<std::string>("2.1"));
    EXPECT_EQ(cmd.filter, std::optional<std::string>("^1"));
    EXPECT_EQ(cmd.encoding, io::TextEncoding::Utf16Le);
    ASSERT_TRUE(cmd.output.has_value());
    EXPECT_EQ(cmd.output->generic_string(), "out.json");
    EXPECT_TRUE(cmd.json);
    EXPECT_FALSE(cmd.jsonl);
    EXPECT_TRUE(cmd.contents);
    EXPECT_FALSE(cmd.config.has_value());
}

TEST(CliResolveTest, Parse_LongOptions) {
    ParseResult result = parse_args(Args{"verfold", "resolve", "--target-version", "1.0",
                                         "--filter", "x", "--encoding", "latin1", "--config",
                                         "verfold.yml", "--jsonl"});
    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;

    const auto& cmd = std::get<ResolveCommand>(result.command);
    EXPECT_FALSE(cmd.root.has_value());
    ASSERT_TRUE(cmd.config.has_value());
    EXPECT_EQ(cmd.config->generic_string(), "verfold.yml");
    EXPECT_EQ(cmd.encoding, io::TextEncoding::Latin1);
    EXPECT_TRUE(cmd.jsonl);
}

TEST(CliResolveTest, Parse_VerboseAfterSubcommand) {
    ParseResult result = parse_args(Args{"verfold", "resolve", "db", "-v", "-q"});
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.global.verbose, 1);
    EXPECT_TRUE(result.global.quiet);
}

TEST(CliResolveTest, Parse_MissingRootAndConfig_Error) {
    ParseResult result = parse_args(Args{"verfold", "resolve", "-t", "1.0"});
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("<ROOT>"), std::string::npos);
}

TEST(CliResolveTest, Parse_MissingOptionValue_Error) {
    ParseResult result = parse_args(Args{"verfold", "resolve", "db", "-t"});
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find(
                  "a value is required for '--target-version <VERSION>' but none was supplied"),
              std::string::npos);
}

TEST(CliResolveTest, Parse_InvalidEncoding_Error) {
    ParseResult result = parse_args(Args{"verfold", "resolve", "db", "-e", "ebcdic"});
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("invalid value 'ebcdic'"), std::string::npos);
}

TEST(CliResolveTest, Parse_JsonWithJsonl_Error) {
    ParseResult result = parse_args(Args{"verfold", "resolve", "db", "--json", "--jsonl"});
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("cannot be used with"), std::string::npos);
}

TEST(CliResolveTest, Parse_SecondPositional_Error) {
    ParseResult result = parse_args(Args{"verfold", "resolve", "a", "b"});
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("unexpected argument 'b' found"),
              std::string::npos);
    EXPECT_NE(result.diagnostic.stderr_message.find("For more information, try '--help'."),
              std::string::npos);
}

TEST(CliResolveTest, Parse_UnknownOption_Error) {
    ParseResult result = parse_args(Args{"verfold", "resolve", "db", "--recursive"});
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
}

// ==============================================================================
// parse-version
// ==============================================================================

TEST(CliParseVersionTest, Parse_Texts) {
    ParseResult result = parse_args(Args{"verfold", "parse-version", "1.0", "v2", "-3"});
    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<ParseVersionCommand>(result.command));
    EXPECT_EQ(std::get<ParseVersionCommand>(result.command).texts,
              (std::vector<std::string>{"1.0", "v2", "-3"}));
}

TEST(CliParseVersionTest, Parse_NoTexts_Error) {
    ParseResult result = parse_args(Args{"verfold", "parse-version"});
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("<TEXT>..."), std::string::npos);
}

}  // namespace verfold::cli::test
