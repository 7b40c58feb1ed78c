
#ifndef ERE_REGEX_PROGRAM_H_
#define ERE_REGEX_PROGRAM_H_

#include "RegexOpcodes.h"
#include <QString>
#include <vector>

/* The compiled form of a pattern.  Immutable once built, so one program may
   be executed by any number of threads at the same time. */
class RegexProgram {
public:
	RegexProgram(int captureCount, std::vector<RegexInstruction> code);

public:
	const RegexInstruction &operator[](int pc) const {
		return code_[pc];
	}

	int size() const {
		return static_cast<int>(code_.size());
	}

	// Capture groups including the implicit group 0 around the whole match.
	int captureCount() const {
		return captureCount_;
	}

	// Parenthesized groups of the pattern, i.e. captureCount() - 1.
	int groupCount() const {
		return captureCount_ - 1;
	}

	int slotCount() const {
		return 2 * captureCount_;
	}

public:
	/**
	 * @brief dump - disassembly, one instruction per line: "3: split 4, 7"
	 */
	QString dump() const;

private:
	const int                           captureCount_;
	const std::vector<RegexInstruction> code_;
};

#endif
