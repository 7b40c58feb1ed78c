
#include "RegexMatch.h"
#include "RegexOpcodes.h"
#include <QtDebug>
#include <algorithm>

namespace {

/* Depth first backtracking over (pc, position) with an explicit job stack.
 *
 * A SPLIT runs its first target straight away and leaves a job for the
 * second.  A SAVE_SLOT leaves a job that puts the old slot value back, so
 * when a path dies the stack unwinds its slot writes before the next
 * alternative runs and no path ever sees a sibling's captures.
 *
 * Every (pc, position) pair is entered at most once per search.  Whoever
 * gets there first has the higher priority and explores everything that
 * can follow, so any later arrival can only repeat that work.  This also
 * cuts empty loops and bounds a search to program size * (length + 1)
 * steps.
 *
 * The visited bits are laid out position by position from the search
 * origin and grown only as far as the search actually reaches, so a
 * match found close to its origin costs nothing for the rest of the
 * subject. */
class Backtracker {
public:
	Backtracker(const RegexProgram &program, const QString &subject, int flags);
	Backtracker(const Backtracker &) = delete;
	Backtracker &operator=(const Backtracker &) = delete;

public:
	bool search(int origin);

	const std::vector<int> &slots() const {
		return slots_;
	}

private:
	struct Job {
		enum Kind { Thread, RestoreSlot };

		Kind kind;
		int  a; // Thread: pc, RestoreSlot: slot
		int  b; // Thread: position, RestoreSlot: previous value
	};

private:
	bool attempt(int start);
	bool run(int pc, int pos);
	bool shouldVisit(int pc, int pos);
	void push(Job::Kind kind, int a, int b);

private:
	const RegexProgram &program_;
	const QChar *const  input_;
	const int           length_;
	const int           flags_;
	const size_t        width_; // bits per position
	int                 origin_;
	std::vector<bool>   visited_;
	std::vector<Job>    jobs_;
	std::vector<int>    slots_;
};

//------------------------------------------------------------------------------
// Name: Backtracker
//------------------------------------------------------------------------------
Backtracker::Backtracker(const RegexProgram &program, const QString &subject, int flags) : program_(program), input_(subject.constData()), length_(subject.size()), flags_(flags), width_(static_cast<size_t>(program.size())), origin_(0) {
	slots_.assign(program.slotCount(), UnsetSlot);
}

//------------------------------------------------------------------------------
// Name: search
// Desc: Tries each start position from 'origin' on, the first success is the
//       leftmost match.
//------------------------------------------------------------------------------
bool Backtracker::search(int origin) {

	if (origin < 0 || origin > length_) {
		return false;
	}

	origin_ = origin;
	visited_.clear();

	for (int start = origin; start <= length_; ++start) {
		if (attempt(start)) {
			return true;
		}

		if (flags_ & ExecAnchored) {
			break;
		}
	}

	return false;
}

//------------------------------------------------------------------------------
// Name: attempt
// Desc: try match at specific point, returns: false failure, true success
//------------------------------------------------------------------------------
bool Backtracker::attempt(int start) {

	jobs_.clear();
	push(Job::Thread, 0, start);

	while (!jobs_.empty()) {
		const Job job = jobs_.back();
		jobs_.pop_back();

		if (job.kind == Job::RestoreSlot) {
			slots_[job.a] = job.b;
		} else if (run(job.a, job.b)) {
			return true;
		}
	}

	return false;
}

//------------------------------------------------------------------------------
// Name: run
// Desc: Follows one path until it reaches ACCEPT or fails.
//------------------------------------------------------------------------------
bool Backtracker::run(int pc, int pos) {

	for (;;) {
		if (!shouldVisit(pc, pos)) {
			return false;
		}

		const RegexInstruction &inst = program_[pc];

		switch (inst.opcode) {
		case MATCH_LITERAL:
			if (pos < length_ && input_[pos].unicode() == inst.character) {
				++pc;
				++pos;
				continue;
			}
			return false;

		case MATCH_ANY:
			if (pos < length_) {
				++pc;
				++pos;
				continue;
			}
			return false;

		case MATCH_CLASS:
			if (pos < length_ && inst.charClass->contains(input_[pos].unicode())) {
				++pc;
				++pos;
				continue;
			}
			return false;

		case SPLIT:
			push(Job::Thread, inst.y, pos);
			pc = inst.x;
			continue;

		case JUMP:
			pc = inst.x;
			continue;

		case SAVE_SLOT:
			push(Job::RestoreSlot, inst.x, slots_[inst.x]);
			slots_[inst.x] = pos;
			++pc;
			continue;

		case CHECK_START:
			if (pos == 0) {
				++pc;
				continue;
			}
			return false;

		case CHECK_END:
			if (pos == length_) {
				++pc;
				continue;
			}
			return false;

		case ACCEPT:
			return !(flags_ & ExecFullMatch) || pos == length_;
		}

		qWarning("internal error, bad opcode %d at %d", static_cast<int>(inst.opcode), pc);
		return false;
	}
}

//------------------------------------------------------------------------------
// Name: shouldVisit
// Desc: Marks (pc, pos) as entered, false if it was already.
//------------------------------------------------------------------------------
bool Backtracker::shouldVisit(int pc, int pos) {
	const size_t n = static_cast<size_t>(pos - origin_) * width_ + static_cast<size_t>(pc);

	if (n >= visited_.size()) {
		const size_t limit = static_cast<size_t>(length_ - origin_ + 1) * width_;
		visited_.resize(std::min(std::max(n + 1, 2 * visited_.size()), limit), false);
	}

	if (visited_[n]) {
		return false;
	}

	visited_[n] = true;
	return true;
}

//------------------------------------------------------------------------------
// Name: push
//------------------------------------------------------------------------------
void Backtracker::push(Job::Kind kind, int a, int b) {
	Job job;
	job.kind = kind;
	job.a    = a;
	job.b    = b;
	jobs_.push_back(job);
}

//------------------------------------------------------------------------------
// Name: literal_escape
// Desc: Translates the character after a backslash in a replacement string.
//------------------------------------------------------------------------------
QChar literal_escape(QChar c) {

	static const char valid_escape[] = {'a', 'e', 'f', 'n', 'r', 't', 'v', '\0'};
	static const char value[]        = {'\a', 0x1B, '\f', '\n', '\r', '\t', '\v', '\0'};

	for (int i = 0; valid_escape[i] != '\0'; i++) {
		if (c == QLatin1Char(valid_escape[i])) {
			return QLatin1Char(value[i]);
		}
	}

	return c;
}

//------------------------------------------------------------------------------
// Name: adjust_case
//------------------------------------------------------------------------------
QString adjust_case(const QString &text, QChar chgcase) {

	if (text.isEmpty()) {
		return text;
	}

	switch (chgcase.unicode()) {
	case 'u':
		return text.left(1).toUpper() + text.mid(1);
	case 'U':
		return text.toUpper();
	case 'l':
		return text.left(1).toLower() + text.mid(1);
	case 'L':
		return text.toLower();
	default:
		return text;
	}
}

}

//------------------------------------------------------------------------------
// Name: execute
//------------------------------------------------------------------------------
std::unique_ptr<RegexMatch> RegexMatch::execute(const RegexProgram &program, const QString &subject, int origin, int flags) {

	Backtracker machine(program, subject, flags);

	if (!machine.search(origin)) {
		return nullptr;
	}

	return std::unique_ptr<RegexMatch>(new RegexMatch(subject, machine.slots()));
}

//------------------------------------------------------------------------------
// Name: RegexMatch
//------------------------------------------------------------------------------
RegexMatch::RegexMatch(const QString &subject, const std::vector<int> &slots) : subject_(subject), slots_(slots) {
}

//------------------------------------------------------------------------------
// Name: captured
//------------------------------------------------------------------------------
QString RegexMatch::captured(int index) const {

	if (index < 0 || index >= captureCount()) {
		return QString();
	}

	const Capture cap = capture(index);
	if (!cap.isValid()) {
		return QString();
	}

	return subject_.mid(cap.start, cap.length());
}

//------------------------------------------------------------------------------
// Name: capturedTexts
//------------------------------------------------------------------------------
QStringList RegexMatch::capturedTexts() const {
	QStringList texts;
	for (int i = 0; i < captureCount(); ++i) {
		texts << captured(i);
	}
	return texts;
}

/*----------------------------------------------------------------------*
 * substitute - Perform substitutions after a match.
 *----------------------------------------------------------------------*/
QString RegexMatch::substitute(const QString &replacement) const {

	QString result;
	const int size = replacement.size();
	int src = 0;

	while (src < size) {
		QChar c = replacement.at(src++);
		QChar chgcase;
		int paren_no = -1;

		if (c == QLatin1Char('\\') && src < size) {
			// Process any case altering tokens, i.e \u, \U, \l, \L.
			const QChar next = replacement.at(src);

			if (next == QLatin1Char('u') || next == QLatin1Char('U') || next == QLatin1Char('l') || next == QLatin1Char('L')) {
				chgcase = next;
				++src;

				if (src >= size) {
					break;
				}

				c = replacement.at(src++);
			}
		}

		if (c == QLatin1Char('&')) {
			paren_no = 0;
		} else if (c == QLatin1Char('\\')) {
			if (src >= size) {
				// If '\' is the last character of the replacement string, it is
				// interpreted as a literal backslash.
			} else if (replacement.at(src).isDigit() && replacement.at(src).unicode() <= '9') {
				paren_no = replacement.at(src++).unicode() - '0';
			} else {
				c = literal_escape(replacement.at(src++));
			}
		}

		if (paren_no < 0) { // Ordinary character.
			result += c;
		} else if (paren_no >= captureCount()) {
			qWarning("replacement refers to group \\%d, the pattern has %d", paren_no, groupCount());
		} else if (capture(paren_no).isValid()) {
			result += adjust_case(captured(paren_no), chgcase);
		}
	}

	return result;
}
