#include "exceptions.hpp"
#include "path/glob.hpp"
#include "setting.hpp"
#include <filesystem>
#include <gtest/gtest.h>
#include <string>

using namespace cfgval;

class SettingTest : public ::testing::Test {
protected:
    void SetUp() override { }
    void TearDown() override { }

    static Setting fragment(const std::string &value)
    {
        return Setting("files", value, std::string{"/x/y/origin.cfg"}, {}, false, true);
    }
};

// ============================================
// Construction and key tests
// ============================================

TEST_F(SettingTest, ConstructorStoresFields)
{
    Setting s("key", " value ", std::string{"/etc/app.cfg"}, {}, true);

    EXPECT_EQ(s.key(), "key");
    EXPECT_EQ(s.value(), "value");
    EXPECT_EQ(s.origin(), "/etc/app.cfg");
    EXPECT_TRUE(s.fromCli());
    EXPECT_FALSE(s.toAppend());
    EXPECT_EQ(s.length(), 1);
}

TEST_F(SettingTest, DefaultsHaveNoOrigin)
{
    Setting s("key", "value");

    EXPECT_EQ(s.origin(), "");
    EXPECT_EQ(s.location(), "<unknown origin>");
    EXPECT_FALSE(s.fromCli());
    EXPECT_TRUE(s.format().stripWhitespace);
    EXPECT_TRUE(s.format().removeEmptyElements);
    EXPECT_EQ(s.format().listDelimiters, (std::vector<std::string>{",", ";"}));
}

TEST_F(SettingTest, EmptyKeyIsRejected)
{
    EXPECT_THROW(Setting("", "value"), InvalidKeyError);
}

TEST_F(SettingTest, SetKeyRevalidates)
{
    Setting s("key", "value");
    s.setKey("other");
    EXPECT_EQ(s.key(), "other");

    EXPECT_THROW(s.setKey(""), InvalidKeyError);
    EXPECT_EQ(s.key(), "other");
}

// ============================================
// Append-pending fragment tests
// ============================================

TEST_F(SettingTest, FragmentRejectsEveryRead)
{
    const Setting s = fragment("a.py, b.py");

    EXPECT_THROW((void)s.value(), IncompleteValueError);
    EXPECT_THROW((void)s.toList(), IncompleteValueError);
    EXPECT_THROW((void)s.toDict(), IncompleteValueError);
    EXPECT_THROW((void)s.toBool(), IncompleteValueError);
    EXPECT_THROW((void)s.toInt(), IncompleteValueError);
    EXPECT_THROW((void)s.toFloat(), IncompleteValueError);
    EXPECT_THROW((void)s.toUrl(), IncompleteValueError);
    EXPECT_THROW((void)s.toPath(), IncompleteValueError);
    EXPECT_THROW((void)s.toGlob(), IncompleteValueError);
    EXPECT_THROW((void)s.toPathList(), IncompleteValueError);
    EXPECT_THROW((void)s.toGlobList(), IncompleteValueError);
}

TEST_F(SettingTest, FragmentBecomesUsableAfterMerge)
{
    Setting s = fragment("b.py");
    s.setValue("a.py, " + std::string("b.py"));
    s.setToAppend(false);

    EXPECT_EQ(s.value(), "a.py, b.py");
    EXPECT_EQ(s.toList(), (std::vector<std::string>{"a.py", "b.py"}));
}

TEST_F(SettingTest, IncompleteErrorNamesKeyAndOrigin)
{
    try {
        (void)fragment("x").value();
        FAIL() << "Expected IncompleteValueError";
    } catch (const IncompleteValueError &e) {
        const std::string what = e.what();
        EXPECT_NE(what.find("files"), std::string::npos);
        EXPECT_NE(what.find("/x/y/origin.cfg"), std::string::npos);
    }
}

TEST_F(SettingTest, DescribeWorksForFragments)
{
    EXPECT_EQ(fragment("x").describe(),
              "<Setting key='files', value='x', origin='/x/y/origin.cfg', from_cli=false, to_append=true>");
}

// ============================================
// Conversion tests
// ============================================

TEST_F(SettingTest, ListUsesFormatOptions)
{
    FormatOptions opts;
    opts.listDelimiters = {"|"};
    Setting s("key", "a | b,c", std::string{}, opts);

    EXPECT_EQ(s.toList(), (std::vector<std::string>{"a", "b,c"}));
}

TEST_F(SettingTest, ScalarConversions)
{
    EXPECT_TRUE(Setting("k", "on").toBool());
    EXPECT_EQ(Setting("k", "-3").toInt(), -3);
    EXPECT_DOUBLE_EQ(Setting("k", "0.5").toFloat(), 0.5);
    EXPECT_EQ(Setting("k", "https://coala.io").toUrl(), "https://coala.io");
    EXPECT_THROW((void)Setting("k", "x").toInt(), ParseError);
}

TEST_F(SettingTest, DictView)
{
    const auto dict = Setting("k", "a: 1, b:").toDict();
    ASSERT_EQ(dict.size(), 2);
    EXPECT_EQ(dict[0].second, "1");
    EXPECT_EQ(dict[1].second, "");
}

// ============================================
// Path tests
// ============================================

TEST_F(SettingTest, PathUsesOwnOrigin)
{
    Setting s("k", "config.ini", std::string{"/a/b/origin.cfg"});

    EXPECT_EQ(s.toPath(), "/a/b/config.ini");
    EXPECT_EQ(s.toPath("/elsewhere/other.cfg"), "/a/b/config.ini");
}

TEST_F(SettingTest, PathFallsBackToExplicitOrigin)
{
    Setting s("k", "config.ini");
    EXPECT_EQ(s.toPath("/c/d/"), "/c/d/config.ini");
}

TEST_F(SettingTest, AbsolutePathNeedsNoOrigin)
{
    EXPECT_EQ(Setting("k", "/abs/file").toPath(), "/abs/file");
}

TEST_F(SettingTest, MissingOriginNamesKey)
{
    Setting s("include", "config.ini");
    try {
        (void)s.toPath();
        FAIL() << "Expected MissingOriginError";
    } catch (const MissingOriginError &e) {
        EXPECT_NE(std::string(e.what()).find("include"), std::string::npos);
    }
}

TEST_F(SettingTest, GlobEscapesOriginOnly)
{
    Setting s("k", "x*.py", std::string{"/a/[b]/origin.cfg"});
    EXPECT_EQ(s.toGlob(), R"(/a/\[b\]/x*.py)");
    EXPECT_EQ(s.toPath(), "/a/[b]/x*.py");
}

TEST_F(SettingTest, PathListKeepsDeclaredOrder)
{
    Setting s("files", "a.py, b.py", std::string{"/x/y/origin.cfg"});
    EXPECT_EQ(s.toPathList(), (std::vector<std::string>{"/x/y/a.py", "/x/y/b.py"}));
}

TEST_F(SettingTest, GlobListEscapesEachOrigin)
{
    Setting s("files", "*.py, /abs/[x].py, sub/?.c", SourcePosition{"/p/[q]/origin.cfg", 4});
    EXPECT_EQ(s.toGlobList(), (std::vector<std::string>{R"(/p/\[q\]/*.py)", "/abs/[x].py", R"(/p/\[q\]/sub/?.c)"}));
}

TEST_F(SettingTest, PathListWithoutOriginUsesWorkingDirectory)
{
    const auto cwd = std::filesystem::current_path();
    Setting s("files", "a.py, /abs/b.py");
    EXPECT_EQ(s.toPathList(), (std::vector<std::string>{(cwd / "a.py").string(), "/abs/b.py"}));
    EXPECT_EQ(s.toGlobList(), (std::vector<std::string>{glob::escape(cwd.string()) + "/a.py", "/abs/b.py"}));
}

TEST_F(SettingTest, EmptyExplicitOriginIsWorkingDirectory)
{
    Setting s("f", "a.py");
    EXPECT_EQ(s.toPath(std::string{}), (std::filesystem::current_path() / "a.py").string());
    EXPECT_EQ(Setting("f", "a.py", std::string{"/x/y/origin.cfg"}).toPath(std::string{}), "/x/y/a.py");
}

TEST_F(SettingTest, PathListKeepsEmptyElementsWhenConfigured)
{
    FormatOptions opts;
    opts.removeEmptyElements = false;
    Setting s("files", "a.py,,b.py", std::string{"/x/y/origin.cfg"}, opts);

    EXPECT_EQ(s.toPathList(), (std::vector<std::string>{"/x/y/a.py", "/x/y", "/x/y/b.py"}));
    EXPECT_EQ(s.toGlobList(), (std::vector<std::string>{"/x/y/a.py", "/x/y", "/x/y/b.py"}));
}

TEST_F(SettingTest, PathListDropsEmptyElementsByDefault)
{
    Setting s("files", "a.py,,b.py", std::string{"/x/y/origin.cfg"});

    EXPECT_EQ(s.toPathList(), (std::vector<std::string>{"/x/y/a.py", "/x/y/b.py"}));
    EXPECT_EQ(s.toGlobList(), (std::vector<std::string>{"/x/y/a.py", "/x/y/b.py"}));
}

// ============================================
// Origin and line number tests
// ============================================

TEST_F(SettingTest, PlainOriginHasNoLineNumbers)
{
    Setting s("k", "v", std::string{"/etc/app.cfg"});
    EXPECT_THROW((void)s.lineNumber(), LineNumberUnavailableError);
    EXPECT_THROW((void)s.endLineNumber(), LineNumberUnavailableError);
}

TEST_F(SettingTest, SourcePositionProvidesLineNumbers)
{
    Setting s("k", "v", SourcePosition{"/etc/app.cfg", 10});
    s.setLength(3);

    EXPECT_EQ(s.origin(), "/etc/app.cfg");
    EXPECT_EQ(s.location(), "/etc/app.cfg:10");
    EXPECT_EQ(s.lineNumber(), 10);
    EXPECT_EQ(s.endLineNumber(), 12);
}

TEST_F(SettingTest, SingleLineValueEndsOnItsLine)
{
    Setting s("k", "v", SourcePosition{"/etc/app.cfg", 7, 3});
    EXPECT_EQ(s.endLineNumber(), 7);
    EXPECT_EQ(s.location(), "/etc/app.cfg:7:3");
    EXPECT_EQ(std::get<SourcePosition>(s.originValue()).column, 3);
}

TEST_F(SettingTest, LengthMustBePositive)
{
    Setting s("k", "v");
    EXPECT_THROW(s.setLength(0), SettingError);
    EXPECT_EQ(s.length(), 1);
}
