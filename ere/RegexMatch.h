
#ifndef ERE_REGEX_MATCH_H_
#define ERE_REGEX_MATCH_H_

#include "RegexCommon.h"
#include "RegexProgram.h"
#include <QString>
#include <QStringList>
#include <memory>
#include <vector>

struct Capture {
	int start;
	int end;

	// false for a group that did not take part in the match
	bool isValid() const {
		return start != UnsetSlot && end != UnsetSlot;
	}

	int length() const {
		return isValid() ? end - start : 0;
	}
};

/* The result of a successful execution.  It keeps its own copy of the
   subject and of the capture slots, nothing refers back into the machine
   that produced it. */
class RegexMatch {
public:
	/**
	 * @brief execute - runs 'program' against 'subject'.
	 * @param program - compiled pattern
	 * @param subject - text to search within
	 * @param origin - first position a match may start at.  ^ still only
	 *                 matches at position 0 of 'subject'.
	 * @param flags - ExecFlags
	 * @return the leftmost, highest priority match or nullptr
	 */
	static std::unique_ptr<RegexMatch> execute(const RegexProgram &program, const QString &subject, int origin = 0, int flags = ExecNone);

private:
	RegexMatch(const QString &subject, const std::vector<int> &slots);
	RegexMatch(const RegexMatch &) = delete;
	RegexMatch &operator=(const RegexMatch &) = delete;

public:
	/**
	 * @brief substitute - expands a replacement template against this match.
	 *
	 * '&' and \0 insert the whole match, \1 .. \9 insert a group.  \u \l
	 * change the case of the first character of the group that follows them,
	 * \U \L of the whole group.  \n \t \r \f \a \v \e are control characters,
	 * any other escaped character stands for itself.
	 */
	QString substitute(const QString &replacement) const;

public:
	// including group 0
	int captureCount() const {
		return static_cast<int>(slots_.size() / 2);
	}

	int groupCount() const {
		return captureCount() - 1;
	}

	// unset for a group that did not participate or does not exist
	Capture capture(int index) const {
		Capture cap;
		cap.start = UnsetSlot;
		cap.end   = UnsetSlot;

		if (index >= 0 && index < captureCount()) {
			cap.start = slots_[2 * index];
			cap.end   = slots_[2 * index + 1];
		}

		return cap;
	}

	int start() const {
		return slots_[0];
	}

	int end() const {
		return slots_[1];
	}

	const QString &subject() const {
		return subject_;
	}

	// null QString for a group that did not participate
	QString captured(int index = 0) const;
	QStringList capturedTexts() const;

private:
	const QString          subject_;
	const std::vector<int> slots_;
};

#endif
