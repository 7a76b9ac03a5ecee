#include "converter.hpp"
#include <cctype>
#include <gtest/gtest.h>
#include <string>

using namespace cfgval;

class ConverterTest : public ::testing::Test {
protected:
    void SetUp() override { }
    void TearDown() override { }
};

// ============================================
// fromString tests
// ============================================

TEST_F(ConverterTest, FromStringParsesNumbers)
{
    EXPECT_EQ(fromString<int>("42"), 42);
    EXPECT_EQ(fromString<int>(" -7 "), -7);
    EXPECT_EQ(fromString<long>("123456789"), 123456789L);
    EXPECT_DOUBLE_EQ(fromString<double>("3.5"), 3.5);
    EXPECT_FLOAT_EQ(fromString<float>("0.25"), 0.25f);
}

TEST_F(ConverterTest, FromStringRejectsTrailingCharacters)
{
    EXPECT_THROW((void)fromString<int>("42abc"), ParseError);
    EXPECT_THROW((void)fromString<int>("1.5"), ParseError);
    EXPECT_THROW((void)fromString<double>(""), ParseError);
}

TEST_F(ConverterTest, FromStringKeepsStringsVerbatim)
{
    EXPECT_EQ(fromString<std::string>("  as is "), "  as is ");
}

TEST_F(ConverterTest, ParseErrorCarriesTextAndType)
{
    try {
        (void)fromString<int>("twelve");
        FAIL() << "Expected ParseError";
    } catch (const ParseError &e) {
        EXPECT_EQ(e.text(), "twelve");
        EXPECT_EQ(e.typeName(), "int");
        EXPECT_NE(std::string(e.what()).find("twelve"), std::string::npos);
    }
}

// ============================================
// parseBool tests
// ============================================

TEST_F(ConverterTest, BoolAcceptsTrueWords)
{
    for (const char *word: {"1", "on", "yes", "Yes", "TRUE", "y", "sure", "  ok  ", "of course"})
        EXPECT_TRUE(parseBool(word)) << word;
}

TEST_F(ConverterTest, BoolAcceptsFalseWords)
{
    for (const char *word: {"0", "off", "no", "NO", "false", "n", "nope", "never", "no way"})
        EXPECT_FALSE(parseBool(word)) << word;
}

TEST_F(ConverterTest, BoolRejectsOtherWords)
{
    EXPECT_THROW((void)parseBool("maybe"), ParseError);
    EXPECT_THROW((void)parseBool(""), ParseError);
    EXPECT_THROW((void)fromString<bool>("2"), ParseError);
}

// ============================================
// Converter implementations
// ============================================

TEST_F(ConverterTest, ScalarConverterUsesFromString)
{
    const auto conv = makeConverter<int>();
    EXPECT_EQ(conv->parse("5"), 5);
    EXPECT_EQ((*conv)("6"), 6);
    EXPECT_EQ(conv->typeName(), "int");
    EXPECT_EQ(makeConverter<double>()->typeName(), "float");
    EXPECT_EQ(makeConverter<std::string>()->typeName(), "str");
    EXPECT_EQ(makeConverter<bool>()->typeName(), "bool");
}

TEST_F(ConverterTest, FunctionConverterWrapsCallable)
{
    const auto upper = makeConverter<std::string>(
        [](const std::string &s) {
            std::string r = s;
            for (auto &c: r)
                c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            return r;
        },
        "upper");

    EXPECT_EQ(upper->parse("abc"), "ABC");
    EXPECT_EQ(upper->typeName(), "upper");
}

TEST_F(ConverterTest, FunctionConverterReportsStdExceptionsAsParseError)
{
    const auto stoi = makeConverter<int>([](const std::string &s) { return std::stoi(s); }, "stoi");

    EXPECT_EQ(stoi->parse("12"), 12);
    EXPECT_THROW((void)stoi->parse("abc"), ParseError);
    EXPECT_THROW((void)stoi->parse("99999999999999999999"), ParseError);
}

TEST_F(ConverterTest, FunctionConverterRequiresCallable)
{
    EXPECT_THROW(FunctionConverter<int>(nullptr, "none"), std::invalid_argument);
}
