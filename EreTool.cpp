
#include "EreTool.h"
#include "ere/RegexCompiler.h"
#include "ere/RegexParser.h"
#include <QCommandLineParser>
#include <QFile>
#include <QtDebug>

//------------------------------------------------------------------------------
// Name: EreTool
//------------------------------------------------------------------------------
EreTool::EreTool(QTextStream &out, QTextStream &err) : out_(out), err_(err), onlyMatching_(false) {
}

//------------------------------------------------------------------------------
// Name: run
//------------------------------------------------------------------------------
int EreTool::run(const QStringList &arguments, QIODevice *standardInput) {

	QCommandLineParser parser;
	parser.setApplicationDescription("Print lines matching a POSIX extended regular expression.");
	const QCommandLineOption helpOption = parser.addHelpOption();
	parser.addPositionalArgument("pattern", "The regular expression, omitted with --patterns.");
	parser.addPositionalArgument("files", "Files to search, standard input when none are given.", "[FILE...]");

	QCommandLineOption patternsOption("patterns", "Apply every pattern of the JSON pattern set <file>.", "file");
	QCommandLineOption lineOption(QStringList() << "x" << "line-regexp", "Only select lines matched as a whole.");
	QCommandLineOption onlyOption(QStringList() << "o" << "only-matching", "Print only the matched parts of a line.");
	QCommandLineOption replaceOption(QStringList() << "r" << "replace", "Print lines with every match replaced by <text>.", "text");
	QCommandLineOption dumpOption("dump", "Print the syntax tree and the program of the pattern, or of every pattern of the set, and exit.");

	parser.addOption(patternsOption);
	parser.addOption(lineOption);
	parser.addOption(onlyOption);
	parser.addOption(replaceOption);
	parser.addOption(dumpOption);

	if (!parser.parse(arguments)) {
		err_ << "eretool: " << parser.errorText() << '\n';
		return ExitTrouble;
	}

	if (parser.isSet(helpOption)) {
		out_ << parser.helpText();
		return ExitMatched;
	}

	const bool lineRegexp = parser.isSet(lineOption);
	const bool replace    = parser.isSet(replaceOption);
	onlyMatching_         = parser.isSet(onlyOption);
	replacement_          = parser.value(replaceOption);

	QStringList args = parser.positionalArguments();

	patternSet_.reset();
	regex_.reset();
	filters_.clear();

	try {
		if (parser.isSet(patternsOption)) {
			patternSet_ = PatternSet::load(parser.value(patternsOption));
			if (!patternSet_) {
				err_ << "eretool: cannot load pattern set " << parser.value(patternsOption) << '\n';
				return ExitTrouble;
			}

			if (parser.isSet(dumpOption)) {
				for (const PatternEntry &entry : patternSet_->entries()) {
					out_ << entry.name << ":\n";
					dump_pattern(entry.regex->pattern());
				}
				return ExitMatched;
			}

			for (const PatternEntry &entry : patternSet_->entries()) {
				LineFilter filter;
				filter.label       = entry.name + ':';
				filter.regex       = entry.regex.get();
				filter.fullMatch   = entry.fullMatch || lineRegexp;
				filter.replacement = entry.hasReplacement ? &entry.replacement : (replace ? &replacement_ : nullptr);
				filters_.push_back(filter);
			}
		} else {
			if (args.isEmpty()) {
				err_ << "eretool: missing pattern\n";
				return ExitTrouble;
			}

			const QString pattern = args.takeFirst();

			if (parser.isSet(dumpOption)) {
				dump_pattern(pattern);
				return ExitMatched;
			}

			regex_.reset(new Regex(pattern));

			LineFilter filter;
			filter.regex       = regex_.get();
			filter.fullMatch   = lineRegexp;
			filter.replacement = replace ? &replacement_ : nullptr;
			filters_.push_back(filter);
		}
	} catch (const RegexException &e) {
		err_ << "eretool: " << QString::fromUtf8(e.what()) << '\n';
		return ExitTrouble;
	}

	bool matched = false;
	bool trouble = false;

	if (args.isEmpty()) {
		if (!standardInput) {
			err_ << "eretool: no input\n";
			return ExitTrouble;
		}

		matched = filter_stream(standardInput, QString());
	} else {
		const bool prefixFile = args.size() > 1;

		for (const QString &filename : args) {
			QFile input(filename);
			if (!input.open(QIODevice::ReadOnly | QIODevice::Text)) {
				qWarning() << "cannot open" << filename << ":" << input.errorString();
				trouble = true;
				continue;
			}

			if (filter_stream(&input, prefixFile ? filename + ':' : QString())) {
				matched = true;
			}
		}
	}

	out_.flush();

	if (trouble) {
		return ExitTrouble;
	}

	return matched ? ExitMatched : ExitNoMatch;
}

//------------------------------------------------------------------------------
// Name: filter_line
// Desc: Prints what 'filter' makes of 'line', returns true if it matched.
//------------------------------------------------------------------------------
bool EreTool::filter_line(const LineFilter &filter, const QString &prefix, const QString &line) {

	if (filter.fullMatch) {
		std::unique_ptr<RegexMatch> match = filter.regex->execute(line, 0, ExecAnchored | ExecFullMatch);
		if (!match) {
			return false;
		}

		out_ << prefix << filter.label << (filter.replacement ? match->substitute(*filter.replacement) : line) << '\n';
		return true;
	}

	std::vector<std::unique_ptr<RegexMatch>> matches = filter.regex->findAllMatchIn(line);
	if (matches.empty()) {
		return false;
	}

	if (onlyMatching_) {
		for (const std::unique_ptr<RegexMatch> &match : matches) {
			if (match->end() > match->start()) {
				out_ << prefix << filter.label << (filter.replacement ? match->substitute(*filter.replacement) : match->captured(0)) << '\n';
			}
		}
	} else if (filter.replacement) {
		out_ << prefix << filter.label << filter.regex->replaceAllIn(line, *filter.replacement) << '\n';
	} else {
		out_ << prefix << filter.label << line << '\n';
	}

	return true;
}

//------------------------------------------------------------------------------
// Name: filter_stream
//------------------------------------------------------------------------------
bool EreTool::filter_stream(QIODevice *input, const QString &prefix) {

	bool matched = false;
	QTextStream in(input);

	while (!in.atEnd()) {
		const QString line = in.readLine();
		for (const LineFilter &filter : filters_) {
			if (filter_line(filter, prefix, line)) {
				matched = true;
			}
		}
	}

	return matched;
}

//------------------------------------------------------------------------------
// Name: dump_pattern
//------------------------------------------------------------------------------
void EreTool::dump_pattern(const QString &pattern) {
	int groups = 0;
	RegexNode::Pointer root = RegexParser::parse(pattern, &groups);
	RegexProgram program    = RegexCompiler::compile(*root, groups);

	out_ << "ast: " << root->toString() << '\n';
	out_ << "groups: " << program.groupCount() << '\n';
	out_ << program.dump() << '\n';
}
