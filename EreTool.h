
#ifndef ERE_TOOL_H_
#define ERE_TOOL_H_

#include "PatternSet.h"
#include "ere/Regex.h"
#include <QIODevice>
#include <QString>
#include <QStringList>
#include <QTextStream>
#include <memory>
#include <vector>

/* The grep-style front end of eretool.  Everything the tool prints goes to
   the two streams handed to the constructor, so it can be driven without a
   process of its own. */
class EreTool {
public:
	enum ExitStatus {
		ExitMatched = 0,
		ExitNoMatch = 1,
		ExitTrouble = 2,
	};

public:
	EreTool(QTextStream &out, QTextStream &err);
	EreTool(const EreTool &) = delete;
	EreTool &operator=(const EreTool &) = delete;

public:
	/**
	 * @brief run - parses a command line and filters its inputs.
	 * @param arguments - the command line, program name first
	 * @param standardInput - read when no files are named, may be null
	 * @return ExitMatched if any line was selected, ExitNoMatch if none was,
	 *         ExitTrouble for a bad pattern, an unreadable input or a usage
	 *         error
	 */
	int run(const QStringList &arguments, QIODevice *standardInput);

private:
	/* One compiled pattern plus how its hits are printed. */
	struct LineFilter {
		QString        label; // printed before every hit, may be empty
		const Regex   *regex;
		bool           fullMatch;
		const QString *replacement;
	};

private:
	bool filter_line(const LineFilter &filter, const QString &prefix, const QString &line);
	bool filter_stream(QIODevice *input, const QString &prefix);
	void dump_pattern(const QString &pattern);

private:
	QTextStream                &out_;
	QTextStream                &err_;
	bool                        onlyMatching_;
	QString                     replacement_;
	std::unique_ptr<PatternSet> patternSet_;
	std::unique_ptr<Regex>      regex_;
	std::vector<LineFilter>     filters_;
};

#endif
