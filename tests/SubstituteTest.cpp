
#include "TestPrinters.h"
#include "ere/Regex.h"
#include <gtest/gtest.h>

namespace {

QString substitute(const QString &pattern, const QString &subject, const QString &replacement) {
	std::unique_ptr<RegexMatch> match = Regex(pattern).findFirstMatchIn(subject);
	if (!match) {
		ADD_FAILURE() << "no match";
		return QString();
	}

	return match->substitute(replacement);
}

}

TEST(SubstituteTest, WholeMatch) {
	EXPECT_EQ(substitute("(\\w+) (\\w+)", "hello world", "&!"), QString("hello world!"));
	EXPECT_EQ(substitute("(\\w+) (\\w+)", "hello world", "[\\0]"), QString("[hello world]"));
}

TEST(SubstituteTest, Groups) {
	EXPECT_EQ(substitute("(\\w+) (\\w+)", "hello world", "\\2 \\1"), QString("world hello"));
	EXPECT_EQ(substitute("(\\w+) (\\w+)", "hello world", "\\1\\1"), QString("hellohello"));
}

TEST(SubstituteTest, CaseConversion) {
	EXPECT_EQ(substitute("(\\w+) (\\w+)", "hello world", "\\u\\1"), QString("Hello"));
	EXPECT_EQ(substitute("(\\w+) (\\w+)", "hello world", "\\U\\2"), QString("WORLD"));
	EXPECT_EQ(substitute("(\\w+)", "HELLO", "\\l\\1"), QString("hELLO"));
	EXPECT_EQ(substitute("(\\w+)", "HELLO", "\\L&"), QString("hello"));
}

TEST(SubstituteTest, ControlEscapes) {
	EXPECT_EQ(substitute("x", "x", "a\\tb\\nc"), QString("a\tb\nc"));
	EXPECT_EQ(substitute("x", "x", "\\e"), QString(QChar(0x1b)));
}

TEST(SubstituteTest, LiteralEscapes) {
	EXPECT_EQ(substitute("x", "x", "\\\\"), QString("\\"));
	EXPECT_EQ(substitute("x", "x", "\\&"), QString("&"));
	EXPECT_EQ(substitute("x", "x", "\\q"), QString("q"));
}

TEST(SubstituteTest, TrailingBackslashIsLiteral) {
	EXPECT_EQ(substitute("x", "x", "a\\"), QString("a\\"));
}

TEST(SubstituteTest, UnsetGroupInsertsNothing) {
	EXPECT_EQ(substitute("(a)|b", "b", "[\\1]"), QString("[]"));
}

TEST(SubstituteTest, MissingGroupInsertsNothing) {
	EXPECT_EQ(substitute("(a)", "a", "<\\5>"), QString("<>"));
}
