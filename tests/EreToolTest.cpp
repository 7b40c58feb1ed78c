
#include "TestPrinters.h"
#include "EreTool.h"
#include <QBuffer>
#include <QFile>
#include <QTemporaryDir>
#include <gtest/gtest.h>

namespace {

class EreToolTest : public ::testing::Test {
protected:
	int run(const QStringList &args, const QByteArray &input = QByteArray()) {
		output_.clear();
		errors_.clear();

		QTextStream out(&output_);
		QTextStream err(&errors_);

		QBuffer in;
		in.setData(input);
		in.open(QIODevice::ReadOnly);

		EreTool tool(out, err);
		const int status = tool.run(QStringList() << "eretool" << args, &in);

		out.flush();
		err.flush();
		return status;
	}

	QString writeFile(const QString &name, const QByteArray &contents) {
		const QString path = dir_.filePath(name);
		QFile file(path);
		if (file.open(QIODevice::WriteOnly)) {
			file.write(contents);
		}
		return path;
	}

protected:
	QTemporaryDir dir_;
	QString       output_;
	QString       errors_;
};

}

TEST_F(EreToolTest, PrintsMatchingLines) {
	EXPECT_EQ(run(QStringList() << "b+", "abc\nxyz\nbb\n"), EreTool::ExitMatched);
	EXPECT_EQ(output_, QString("abc\nbb\n"));
}

TEST_F(EreToolTest, NoMatchingLine) {
	EXPECT_EQ(run(QStringList() << "q", "abc\nxyz\n"), EreTool::ExitNoMatch);
	EXPECT_TRUE(output_.isEmpty());
}

TEST_F(EreToolTest, BadPatternIsTrouble) {
	EXPECT_EQ(run(QStringList() << "(a", "a\n"), EreTool::ExitTrouble);
	EXPECT_TRUE(output_.isEmpty());
	EXPECT_TRUE(errors_.contains("Malformed regular expression near index 0"));
}

TEST_F(EreToolTest, UsageErrors) {
	EXPECT_EQ(run(QStringList()), EreTool::ExitTrouble);
	EXPECT_TRUE(errors_.contains("missing pattern"));

	EXPECT_EQ(run(QStringList() << "--bogus" << "a"), EreTool::ExitTrouble);
}

TEST_F(EreToolTest, LineRegexp) {
	EXPECT_EQ(run(QStringList() << "-x" << "ab", "ab\nabc\nxab\n"), EreTool::ExitMatched);
	EXPECT_EQ(output_, QString("ab\n"));
}

TEST_F(EreToolTest, OnlyMatchingSkipsEmptyMatches) {
	EXPECT_EQ(run(QStringList() << "-o" << "a*", "baac\nxyz\nabab\n"), EreTool::ExitMatched);
	EXPECT_EQ(output_, QString("aa\na\na\n"));
}

TEST_F(EreToolTest, Replace) {
	EXPECT_EQ(run(QStringList() << "-r" << "<\\1>" << "(\\d+)", "a1b22\nnone\n"), EreTool::ExitMatched);
	EXPECT_EQ(output_, QString("a<1>b<22>\n"));
}

TEST_F(EreToolTest, ReplaceWholeLine) {
	EXPECT_EQ(run(QStringList() << "-x" << "-r" << "\\2 \\1" << "(\\w+) (\\w+)", "hello world\nnot this one\n"), EreTool::ExitMatched);
	EXPECT_EQ(output_, QString("world hello\n"));
}

TEST_F(EreToolTest, PatternSetLabelsEachHit) {
	const QString set = writeFile("set.json", R"json([
		{ "name": "year", "pattern": "\\d{4}" },
		{ "name": "xs", "pattern": "x+", "fullMatch": true },
		{ "name": "swap", "pattern": "(a)(b)", "replace": "\\2\\1" }
	])json");

	EXPECT_EQ(run(QStringList() << "--patterns" << set, "in 2021\nxx\nxaby\nnothing\n"), EreTool::ExitMatched);
	EXPECT_EQ(output_, QString("year:in 2021\nxs:xx\nswap:xbay\n"));
}

TEST_F(EreToolTest, MissingPatternSet) {
	EXPECT_EQ(run(QStringList() << "--patterns" << dir_.filePath("absent.json"), "a\n"), EreTool::ExitTrouble);
	EXPECT_TRUE(errors_.contains("cannot load pattern set"));
}

TEST_F(EreToolTest, SeveralFilesArePrefixed) {
	const QString fruit = writeFile("fruit.txt", "apple\nberry\n");
	const QString more  = writeFile("more.txt", "grape\nplum\n");

	EXPECT_EQ(run(QStringList() << "ap" << fruit << more), EreTool::ExitMatched);
	EXPECT_EQ(output_, fruit + ":apple\n" + more + ":grape\n");
}

TEST_F(EreToolTest, SingleFileIsNotPrefixed) {
	const QString fruit = writeFile("fruit.txt", "apple\nberry\n");

	EXPECT_EQ(run(QStringList() << "rr" << fruit), EreTool::ExitMatched);
	EXPECT_EQ(output_, QString("berry\n"));
}

TEST_F(EreToolTest, UnreadableFileIsTrouble) {
	const QString fruit = writeFile("fruit.txt", "apple\n");

	EXPECT_EQ(run(QStringList() << "apple" << dir_.filePath("absent.txt") << fruit), EreTool::ExitTrouble);
	EXPECT_EQ(output_, fruit + ":apple\n");
}

TEST_F(EreToolTest, Dump) {
	EXPECT_EQ(run(QStringList() << "--dump" << "a|b"), EreTool::ExitMatched);
	EXPECT_EQ(output_, QString("ast: Alt(Literal(a), Literal(b))\n"
	                           "groups: 0\n"
	                           "0: save 0\n1: split 2, 4\n2: char a\n3: jmp 5\n4: char b\n5: save 1\n6: accept\n"));
}

TEST_F(EreToolTest, DumpEveryPatternOfASet) {
	const QString set = writeFile("set.json", R"json([
		{ "name": "one", "pattern": "a" },
		{ "name": "group", "pattern": "(b){0}" }
	])json");

	EXPECT_EQ(run(QStringList() << "--dump" << "--patterns" << set), EreTool::ExitMatched);
	EXPECT_EQ(output_, QString("one:\n"
	                           "ast: Literal(a)\n"
	                           "groups: 0\n"
	                           "0: save 0\n1: char a\n2: save 1\n3: accept\n"
	                           "group:\n"
	                           "ast: Empty\n"
	                           "groups: 1\n"
	                           "0: save 0\n1: save 1\n2: accept\n"));
}
