
#include "Regex.h"
#include "RegexCompiler.h"
#include "RegexParser.h"

namespace {

RegexProgram compile_pattern(const QString &pattern) {
	int groups = 0;
	RegexNode::Pointer root = RegexParser::parse(pattern, &groups);
	return RegexCompiler::compile(*root, groups);
}

}

//------------------------------------------------------------------------------
// Name: Regex
//------------------------------------------------------------------------------
Regex::Regex(const QString &pattern) : pattern_(pattern), program_(compile_pattern(pattern)) {
}

//------------------------------------------------------------------------------
// Name: execute
//------------------------------------------------------------------------------
std::unique_ptr<RegexMatch> Regex::execute(const QString &subject, int origin, int flags) const {
	return RegexMatch::execute(program_, subject, origin, flags);
}

//------------------------------------------------------------------------------
// Name: isMatchedBy
//------------------------------------------------------------------------------
bool Regex::isMatchedBy(const QString &subject) const {
	return execute(subject, 0, ExecAnchored | ExecFullMatch) != nullptr;
}

//------------------------------------------------------------------------------
// Name: findFirstMatchIn
//------------------------------------------------------------------------------
std::unique_ptr<RegexMatch> Regex::findFirstMatchIn(const QString &subject, int origin) const {
	return execute(subject, origin);
}

//------------------------------------------------------------------------------
// Name: findFirstIn
// Desc: null QString when nothing matches, empty QString for an empty match
//------------------------------------------------------------------------------
QString Regex::findFirstIn(const QString &subject, int origin) const {
	if (std::unique_ptr<RegexMatch> match = execute(subject, origin)) {
		return match->captured(0);
	}

	return QString();
}

//------------------------------------------------------------------------------
// Name: findAllMatchIn
//------------------------------------------------------------------------------
std::vector<std::unique_ptr<RegexMatch>> Regex::findAllMatchIn(const QString &subject) const {

	std::vector<std::unique_ptr<RegexMatch>> matches;
	int origin = 0;

	while (origin <= subject.size()) {
		std::unique_ptr<RegexMatch> match = execute(subject, origin);
		if (!match) {
			break;
		}

		origin = (match->end() == match->start()) ? match->end() + 1 : match->end();
		matches.push_back(std::move(match));
	}

	return matches;
}

//------------------------------------------------------------------------------
// Name: findAllIn
//------------------------------------------------------------------------------
QStringList Regex::findAllIn(const QString &subject) const {
	QStringList texts;
	for (const std::unique_ptr<RegexMatch> &match : findAllMatchIn(subject)) {
		texts << match->captured(0);
	}
	return texts;
}

//------------------------------------------------------------------------------
// Name: replaceFirstIn
//------------------------------------------------------------------------------
QString Regex::replaceFirstIn(const QString &subject, const QString &replacement) const {

	std::unique_ptr<RegexMatch> match = execute(subject);
	if (!match) {
		return subject;
	}

	return subject.left(match->start()) + match->substitute(replacement) + subject.mid(match->end());
}

//------------------------------------------------------------------------------
// Name: replaceAllIn
//------------------------------------------------------------------------------
QString Regex::replaceAllIn(const QString &subject, const QString &replacement) const {

	QString result;
	int last = 0;

	for (const std::unique_ptr<RegexMatch> &match : findAllMatchIn(subject)) {
		result += subject.midRef(last, match->start() - last);
		result += match->substitute(replacement);
		last = match->end();
	}

	result += subject.midRef(last);
	return result;
}

//------------------------------------------------------------------------------
// Name: split
// Desc: An empty match at the end of 'subject' or right where the previous
//       match ended does not split.
//------------------------------------------------------------------------------
QStringList Regex::split(const QString &subject) const {

	QStringList pieces;
	int last = 0;

	for (const std::unique_ptr<RegexMatch> &match : findAllMatchIn(subject)) {
		if (match->start() == match->end() && (match->start() == last || match->start() == subject.size())) {
			continue;
		}

		pieces << subject.mid(last, match->start() - last);
		last = match->end();
	}

	pieces << subject.mid(last);
	return pieces;
}
