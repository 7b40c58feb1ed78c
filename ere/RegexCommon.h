
#ifndef ERE_REGEX_COMMON_H_
#define ERE_REGEX_COMMON_H_

#include "Types.h"
#include <QString>

/* Largest count accepted inside a {m,n} bound.  Bounds are expanded into
   copies of their operand, so this also caps the size of one expansion. */
const int MaxRepetitionCount = 1000;

/* Value of a capture slot that was never written. */
const int UnsetSlot = -1;

// Flags for RegexMatch::execute
enum ExecFlags {
	ExecNone      = 0x00,
	ExecAnchored  = 0x01, // only try a match starting at the origin
	ExecFullMatch = 0x02, // Accept only counts at the end of the subject
};

/* Renders a code unit for dumps and diagnostics: printable ASCII as is,
   everything else as a \uXXXX escape. */
QString printableChar(char_type c);

#endif
