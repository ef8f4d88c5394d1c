// ==============================================================================
// test_version_gtest.cpp - Тесты разбора версий (GoogleTest)
// ==============================================================================
//
// Проверяется:
// - 1..4 группы, значения по умолчанию 0
// - ведущие нули, серии разделителей, все символы-разделители
// - отказ при 5+ группах и при отсутствии ведущей цифры
// - хвост после префикса игнорируется
// - порядок сравнения
// - строгая форма бросает ResolveError
//
// ==============================================================================

#include "verfold/error.hpp"
#include "verfold/version.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace verfold::test {

namespace {

Version make(std::int32_t major, std::int32_t minor = 0, std::int32_t build = 0,
             std::int32_t revision = 0) {
    Version v;
    v.major = major;
    v.minor = minor;
    v.build = build;
    v.revision = revision;
    return v;
}

}  // namespace

// ==============================================================================
// Успешный разбор
// ==============================================================================

TEST(VersionParseTest, SingleGroup_DefaultsRemainingToZero) {
    auto v = try_parse_version("1");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, make(1, 0, 0, 0));
}

TEST(VersionParseTest, FourGroups_AllComponentsSet) {
    auto v = try_parse_version("1.2.3.4");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->major, 1);
    EXPECT_EQ(v->minor, 2);
    EXPECT_EQ(v->build, 3);
    EXPECT_EQ(v->revision, 4);
}

TEST(VersionParseTest, TwoAndThreeGroups) {
    EXPECT_EQ(try_parse_version("3.7").value(), make(3, 7));
    EXPECT_EQ(try_parse_version("3.7.11").value(), make(3, 7, 11));
}

TEST(VersionParseTest, LeadingZeros_StrippedNumerically) {
    EXPECT_EQ(try_parse_version("01.02").value(), make(1, 2));
    EXPECT_EQ(try_parse_version("0001.0000.0010.000").value(), make(1, 0, 10, 0));
    EXPECT_EQ(try_parse_version("00").value(), make(0));
}

TEST(VersionParseTest, RepeatedDelimiters_FormOneSeparator) {
    EXPECT_EQ(try_parse_version("1--2").value(), make(1, 2));
    EXPECT_EQ(try_parse_version("1._-2 ~ 3").value(), make(1, 2, 3));
}

TEST(VersionParseTest, EveryDelimiterCharacter_Accepted) {
    const std::vector<std::string> texts = {"1^2", "1_2", "1-2", "1.2", "1,2", "1~2", "1 2"};
    for (const auto& text : texts) {
        auto v = try_parse_version(text);
        ASSERT_TRUE(v.has_value()) << text;
        EXPECT_EQ(*v, make(1, 2)) << text;
    }
}

TEST(VersionParseTest, TrailingText_Ignored) {
    EXPECT_EQ(try_parse_version("2.1_add_customers").value(), make(2, 1));
    EXPECT_EQ(try_parse_version("1.2.3.4.x").value(), make(1, 2, 3, 4));
    EXPECT_EQ(try_parse_version("1.2.3.4.").value(), make(1, 2, 3, 4));
    EXPECT_EQ(try_parse_version("7 release").value(), make(7));
    EXPECT_EQ(try_parse_version("1.2/3").value(), make(1, 2));
}

TEST(VersionParseTest, DelimiterWithoutDigit_EndsVersion) {
    // Разделитель без последующей цифры не начинает новую группу
    EXPECT_EQ(try_parse_version("1.a.3").value(), make(1));
    EXPECT_EQ(try_parse_version("4-").value(), make(4));
}

TEST(VersionParseTest, LargestInt32Component_Accepted) {
    EXPECT_EQ(try_parse_version("2147483647").value(), make(2147483647));
}

// ==============================================================================
// Неуспешный разбор
// ==============================================================================

TEST(VersionParseTest, FiveGroups_Rejected) {
    EXPECT_FALSE(try_parse_version("1.2.3.4.5").has_value());
    EXPECT_FALSE(try_parse_version("1-2-3-4-5").has_value());
    EXPECT_FALSE(try_parse_version("1.2.3.4..5").has_value());
    EXPECT_FALSE(try_parse_version("1.2.3.4.5.6").has_value());
    EXPECT_FALSE(try_parse_version("1.2.3.4.5_name").has_value());
}

TEST(VersionParseTest, NoLeadingDigit_Rejected) {
    EXPECT_FALSE(try_parse_version("v1.2").has_value());
    EXPECT_FALSE(try_parse_version(" 1.2").has_value());
    EXPECT_FALSE(try_parse_version(".1").has_value());
    EXPECT_FALSE(try_parse_version("scripts").has_value());
    EXPECT_FALSE(try_parse_version("").has_value());
}

TEST(VersionParseTest, ComponentOverflow_Rejected) {
    EXPECT_FALSE(try_parse_version("2147483648").has_value());
    EXPECT_FALSE(try_parse_version("1.99999999999").has_value());
}

// ==============================================================================
// Строгая форма
// ==============================================================================

TEST(VersionParseTest, StrictParse_ReturnsVersion) {
    EXPECT_EQ(parse_version("2.0"), make(2));
}

TEST(VersionParseTest, StrictParse_ThrowsMalformedVersion) {
    try {
        parse_version("next");
        FAIL() << "expected ResolveError";
    } catch (const ResolveError& e) {
        EXPECT_EQ(e.kind(), ResolveErrorKind::MalformedVersion);
        EXPECT_EQ(e.subject(), "next");
        EXPECT_EQ(std::string(e.what()), "Error parsing version from string 'next'.");
        EXPECT_EQ(e.format(), "malformed version: Error parsing version from string 'next'.");
    }
}

// ==============================================================================
// Сравнение и форматирование
// ==============================================================================

TEST(VersionCompareTest, LexicographicOrder) {
    EXPECT_LT(make(1, 0, 0, 0), make(1, 0, 0, 1));
    EXPECT_LT(make(1, 0, 0, 1), make(1, 1, 0, 0));
    EXPECT_LT(make(1, 1, 0, 0), make(2, 0, 0, 0));
    EXPECT_LT(make(1, 9, 9, 9), make(2));
    EXPECT_GT(make(0, 0, 1), make(0, 0, 0, 9));
}

TEST(VersionCompareTest, EqualityAndInclusiveBounds) {
    EXPECT_EQ(make(1, 0), try_parse_version("01.0").value());
    EXPECT_LE(make(2), make(2));
    EXPECT_GE(make(2), make(2));
    EXPECT_NE(make(2), make(2, 0, 0, 1));
    EXPECT_EQ(compare(make(3, 1), make(3, 1)), 0);
}

TEST(VersionFormatTest, ToString_AlwaysFourComponents) {
    EXPECT_EQ(make(1).to_string(), "1.0.0.0");
    EXPECT_EQ(try_parse_version("010.2_3").value().to_string(), "10.2.3.0");
}

TEST(VersionFormatTest, DelimiterSet) {
    for (char c : std::string("^_-.,~ ")) {
        EXPECT_TRUE(is_version_delimiter(c)) << c;
    }
    EXPECT_FALSE(is_version_delimiter('/'));
    EXPECT_FALSE(is_version_delimiter('+'));
    EXPECT_FALSE(is_version_delimiter('0'));
}

}  // namespace verfold::test
