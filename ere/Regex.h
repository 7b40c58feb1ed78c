
#ifndef ERE_REGEX_H_
#define ERE_REGEX_H_

#include "RegexCommon.h"
#include "RegexException.h"
#include "RegexMatch.h"
#include "RegexProgram.h"
#include <QString>
#include <QStringList>
#include <memory>
#include <vector>

/* A compiled POSIX extended regular expression.  Construction parses and
   compiles the pattern, after which the object is immutable and may be
   used from several threads at once. */
class Regex {
public:
	/**
	 * @brief Compiles a regular expression into the form used by 'execute'.
	 * @param pattern - String containing the regular expression.
	 * @throws RegexParseError located at the offending character
	 */
	explicit Regex(const QString &pattern);

private:
	Regex(const Regex &) = delete;
	Regex &operator=(const Regex &) = delete;

public:
	/**
	 * @brief execute - Match the compiled program against a string.
	 * @param subject - Text to search within.
	 * @param origin - First position a match may start at.
	 * @param flags - ExecFlags
	 * @return the match or nullptr
	 */
	std::unique_ptr<RegexMatch> execute(const QString &subject, int origin = 0, int flags = ExecNone) const;

public:
	// true when the whole of 'subject' matches
	bool isMatchedBy(const QString &subject) const;

	std::unique_ptr<RegexMatch> findFirstMatchIn(const QString &subject, int origin = 0) const;
	QString findFirstIn(const QString &subject, int origin = 0) const;

	/**
	 * @brief findAllMatchIn - successive non-overlapping matches, left to
	 * right.  An empty match moves the next search one code unit on.
	 */
	std::vector<std::unique_ptr<RegexMatch>> findAllMatchIn(const QString &subject) const;
	QStringList findAllIn(const QString &subject) const;

	QString replaceFirstIn(const QString &subject, const QString &replacement) const;
	QString replaceAllIn(const QString &subject, const QString &replacement) const;

	// pieces of 'subject' between the matches
	QStringList split(const QString &subject) const;

public:
	const QString &pattern() const {
		return pattern_;
	}

	const RegexProgram &program() const {
		return program_;
	}

	int groupCount() const {
		return program_.groupCount();
	}

private:
	QString      pattern_;
	RegexProgram program_;
};

#endif
