
#include "TestPrinters.h"
#include "ere/RegexCompiler.h"
#include "ere/RegexMatch.h"
#include "ere/RegexParser.h"
#include <gtest/gtest.h>

namespace {

RegexProgram compile(const QString &pattern) {
	int groups = 0;
	RegexNode::Pointer root = RegexParser::parse(pattern, &groups);
	return RegexCompiler::compile(*root, groups);
}

std::unique_ptr<RegexMatch> run(const QString &pattern, const QString &subject, int origin = 0, int flags = ExecNone) {
	const RegexProgram program = compile(pattern);
	return RegexMatch::execute(program, subject, origin, flags);
}

bool fullMatch(const QString &pattern, const QString &subject) {
	return run(pattern, subject, 0, ExecAnchored | ExecFullMatch) != nullptr;
}

::testing::AssertionResult hasCapture(const RegexMatch *match, int index, int start, int end) {
	if (!match) {
		return ::testing::AssertionFailure() << "no match";
	}

	const Capture cap = match->capture(index);
	if (cap.start != start || cap.end != end) {
		return ::testing::AssertionFailure() << "group " << index << " is (" << cap.start << ", " << cap.end << "), expected (" << start << ", " << end << ")";
	}

	return ::testing::AssertionSuccess();
}

}

TEST(RegexMatchTest, LiteralPatternMatchesItself) {
	const char *const words[] = {"a", "hello", "x y z", "0123456789", "-,;:"};

	for (const char *word : words) {
		std::unique_ptr<RegexMatch> match = run(word, word);
		ASSERT_TRUE(match != nullptr) << word;
		EXPECT_EQ(match->start(), 0);
		EXPECT_EQ(match->end(), QString(word).size());
		EXPECT_EQ(match->captured(0), QString(word));
	}
}

TEST(RegexMatchTest, StarMatchesEmptySubject) {
	std::unique_ptr<RegexMatch> match = run("a*", "");
	EXPECT_TRUE(hasCapture(match.get(), 0, 0, 0));
}

TEST(RegexMatchTest, PlusNeedsOneCharacter) {
	EXPECT_TRUE(run("a+", "") == nullptr);
	EXPECT_TRUE(hasCapture(run("a+", "aaa").get(), 0, 0, 3));
}

TEST(RegexMatchTest, OptIsGreedy) {
	EXPECT_EQ(run("a?", "a")->captured(0), QString("a"));
}

TEST(RegexMatchTest, LazyOptPrefersSkipping) {
	std::unique_ptr<RegexMatch> match = run("a??", "a");
	EXPECT_TRUE(hasCapture(match.get(), 0, 0, 0));

	// but takes the character when the rest needs it
	EXPECT_TRUE(hasCapture(run("a??b", "ab").get(), 0, 0, 2));
}

TEST(RegexMatchTest, LazyStar) {
	EXPECT_EQ(run("<.*>", "<a><b>")->captured(0), QString("<a><b>"));
	EXPECT_EQ(run("<.*?>", "<a><b>")->captured(0), QString("<a>"));
}

TEST(RegexMatchTest, CharacterClass) {
	EXPECT_TRUE(fullMatch("[a-c]", "a"));
	EXPECT_TRUE(fullMatch("[a-c]", "b"));
	EXPECT_TRUE(fullMatch("[a-c]", "c"));
	EXPECT_FALSE(fullMatch("[a-c]", "d"));
	EXPECT_FALSE(fullMatch("[a-c]", ""));
}

TEST(RegexMatchTest, NegatedCharacterClass) {
	EXPECT_FALSE(fullMatch("[^a-c]", "a"));
	EXPECT_FALSE(fullMatch("[^a-c]", "c"));
	EXPECT_TRUE(fullMatch("[^a-c]", "d"));
	EXPECT_TRUE(fullMatch("[^a-c]", QString(QChar(0x4e2d))));
	EXPECT_TRUE(fullMatch("[^a-c]", QString(QChar(0xffff))));
}

TEST(RegexMatchTest, BuiltinClasses) {
	EXPECT_TRUE(hasCapture(run("\\d+", "abc123def").get(), 0, 3, 6));
	EXPECT_TRUE(hasCapture(run("\\s", "ab cd").get(), 0, 2, 3));
	EXPECT_TRUE(hasCapture(run("\\W", "ab_c-d").get(), 0, 4, 5));
}

TEST(RegexMatchTest, RangeBound) {
	EXPECT_FALSE(fullMatch("a{2,4}", "a"));
	EXPECT_TRUE(fullMatch("a{2,4}", "aa"));
	EXPECT_TRUE(fullMatch("a{2,4}", "aaa"));
	EXPECT_TRUE(fullMatch("a{2,4}", "aaaa"));
	EXPECT_FALSE(fullMatch("a{2,4}", "aaaaa"));
}

TEST(RegexMatchTest, ExactBound) {
	EXPECT_FALSE(fullMatch("a{3}", "aa"));
	EXPECT_TRUE(fullMatch("a{3}", "aaa"));
	EXPECT_FALSE(fullMatch("a{3}", "aaaa"));
}

TEST(RegexMatchTest, OpenBound) {
	EXPECT_FALSE(fullMatch("a{2,}", "a"));
	EXPECT_TRUE(fullMatch("a{2,}", "aa"));
	EXPECT_TRUE(fullMatch("a{2,}", "aaa"));
	EXPECT_TRUE(fullMatch("a{2,}", QString(50, QChar('a'))));
}

TEST(RegexMatchTest, BoundTailIsLazy) {
	// the optional copies prefer to be skipped
	EXPECT_TRUE(hasCapture(run("a{2,4}", "aaaa").get(), 0, 0, 2));
	EXPECT_TRUE(hasCapture(run("a{2,4}b", "aaaab").get(), 0, 0, 5));
	EXPECT_TRUE(hasCapture(run("a{0,3}", "aaa").get(), 0, 0, 0));
}

TEST(RegexMatchTest, AlternationPriority) {
	std::unique_ptr<RegexMatch> match = run("(a|ab)", "ab");
	EXPECT_TRUE(hasCapture(match.get(), 0, 0, 1));
	EXPECT_TRUE(hasCapture(match.get(), 1, 0, 1));
}

TEST(RegexMatchTest, CaptureOffsets) {
	std::unique_ptr<RegexMatch> match = run("(a)(b)", "ab");
	EXPECT_TRUE(hasCapture(match.get(), 0, 0, 2));
	EXPECT_TRUE(hasCapture(match.get(), 1, 0, 1));
	EXPECT_TRUE(hasCapture(match.get(), 2, 1, 2));
	EXPECT_EQ(match->groupCount(), 2);
	EXPECT_EQ(match->capturedTexts(), QStringList() << "ab" << "a" << "b");
}

TEST(RegexMatchTest, NestedCaptures) {
	std::unique_ptr<RegexMatch> match = run("((a)b)c", "xabc");
	EXPECT_TRUE(hasCapture(match.get(), 0, 1, 4));
	EXPECT_TRUE(hasCapture(match.get(), 1, 1, 3));
	EXPECT_TRUE(hasCapture(match.get(), 2, 1, 2));
}

TEST(RegexMatchTest, RepeatedGroupKeepsLastIteration) {
	EXPECT_TRUE(hasCapture(run("(a|b)*", "abb").get(), 1, 2, 3));
	EXPECT_TRUE(hasCapture(run("(a){3}", "aaa").get(), 1, 2, 3));
}

TEST(RegexMatchTest, UnsetGroup) {
	std::unique_ptr<RegexMatch> match = run("(a)|b", "b");
	ASSERT_TRUE(match != nullptr);

	EXPECT_FALSE(match->capture(1).isValid());
	EXPECT_EQ(match->capture(1).start, UnsetSlot);
	EXPECT_TRUE(match->captured(1).isNull());
}

TEST(RegexMatchTest, BacktrackingRestoresCaptures) {
	EXPECT_TRUE(hasCapture(run("(a*)ab", "aab").get(), 1, 0, 1));

	// the failed first branch leaves nothing behind
	std::unique_ptr<RegexMatch> match = run("(a)x|(a)y", "ay");
	ASSERT_TRUE(match != nullptr);
	EXPECT_FALSE(match->capture(1).isValid());
	EXPECT_TRUE(hasCapture(match.get(), 2, 0, 1));
}

TEST(RegexMatchTest, Anchors) {
	EXPECT_TRUE(run("^a$", "a") != nullptr);
	EXPECT_TRUE(run("^a$", "ba") == nullptr);
	EXPECT_TRUE(run("^a$", "ab") == nullptr);
	EXPECT_TRUE(hasCapture(run("a$", "aba").get(), 0, 2, 3));
	EXPECT_TRUE(hasCapture(run("^$", "").get(), 0, 0, 0));
}

TEST(RegexMatchTest, StartAnchorOnlyAtSubjectStart) {
	EXPECT_TRUE(run("^a", "aa", 1) == nullptr);
	EXPECT_TRUE(hasCapture(run("^a", "aa", 0).get(), 0, 0, 1));
}

TEST(RegexMatchTest, Origin) {
	EXPECT_TRUE(hasCapture(run("a", "bab", 1).get(), 0, 1, 2));
	EXPECT_TRUE(run("a", "bab", 2) == nullptr);
	EXPECT_TRUE(hasCapture(run("a*", "aa", 2).get(), 0, 2, 2));
	EXPECT_TRUE(run("a*", "aa", 3) == nullptr);
	EXPECT_TRUE(run("a*", "aa", -1) == nullptr);
}

TEST(RegexMatchTest, AnchoredExecution) {
	EXPECT_TRUE(run("b", "ab", 0, ExecAnchored) == nullptr);
	EXPECT_TRUE(hasCapture(run("b", "ab", 1, ExecAnchored).get(), 0, 1, 2));
}

TEST(RegexMatchTest, FullMatchExecution) {
	std::unique_ptr<RegexMatch> match = run("(a|ab)", "ab", 0, ExecAnchored | ExecFullMatch);
	EXPECT_TRUE(hasCapture(match.get(), 0, 0, 2));
	EXPECT_TRUE(hasCapture(match.get(), 1, 0, 2));
}

TEST(RegexMatchTest, EmptyClassMatchesNothingExtra) {
	EXPECT_TRUE(fullMatch("x[]y", "xy"));
}

TEST(RegexMatchTest, PathologicalPatternsTerminate) {
	const QString as(40, QChar('a'));

	EXPECT_TRUE(run("(a*)*b", as) == nullptr);
	EXPECT_TRUE(run("(a|aa)*c", as) == nullptr);
	EXPECT_TRUE(run("(a?){40}a{40}", as) != nullptr);
	EXPECT_TRUE(hasCapture(run("()*", "").get(), 0, 0, 0));
	EXPECT_TRUE(hasCapture(run("(|a)+", "aa").get(), 0, 0, 0));
	EXPECT_TRUE(hasCapture(run("(a*)+$", "aa").get(), 0, 0, 2));
}

TEST(RegexMatchTest, ResultOwnsItsSubject) {
	QString subject = "abc";

	std::unique_ptr<RegexMatch> match = run("b", subject);
	subject[1] = QChar('z');

	ASSERT_TRUE(match != nullptr);
	EXPECT_EQ(match->captured(0), QString("b"));
	EXPECT_EQ(match->subject(), QString("abc"));
}

TEST(RegexMatchTest, ProgramIsReusable) {
	const RegexProgram program = compile("(\\d)");

	std::unique_ptr<RegexMatch> first  = RegexMatch::execute(program, "a1");
	std::unique_ptr<RegexMatch> second = RegexMatch::execute(program, "22b");

	EXPECT_TRUE(hasCapture(first.get(), 1, 1, 2));
	EXPECT_TRUE(hasCapture(second.get(), 1, 0, 1));
}

TEST(RegexMatchTest, CaptureOutOfRangeIsUnset) {
	std::unique_ptr<RegexMatch> match = run("(a)", "a");
	ASSERT_TRUE(match != nullptr);

	EXPECT_FALSE(match->capture(2).isValid());
	EXPECT_FALSE(match->capture(-1).isValid());
	EXPECT_EQ(match->capture(100).length(), 0);
	EXPECT_TRUE(match->captured(2).isNull());
}

TEST(RegexMatchTest, GroupRemovedByZeroBoundStaysUnset) {
	std::unique_ptr<RegexMatch> match = run("x(a){0}(b)", "xb");
	ASSERT_TRUE(match != nullptr);

	EXPECT_EQ(match->groupCount(), 2);
	EXPECT_FALSE(match->capture(1).isValid());
	EXPECT_TRUE(hasCapture(match.get(), 2, 1, 2));
}

TEST(RegexMatchTest, LongSubjectFarFromOrigin) {
	QString subject(300000, QLatin1Char('a'));
	subject += QLatin1String("xyz");

	std::unique_ptr<RegexMatch> match = run("a*(x)yz", subject, 250000);
	EXPECT_TRUE(hasCapture(match.get(), 0, 250000, 300003));
	EXPECT_TRUE(hasCapture(match.get(), 1, 300000, 300001));
}

TEST(RegexMatchTest, LongPattern) {
	const QString text(5000, QLatin1Char('k'));
	EXPECT_TRUE(fullMatch(text, text));
	EXPECT_FALSE(fullMatch(text, text.left(4999)));
}
