
#ifndef ERE_REGEX_OPCODES_H_
#define ERE_REGEX_OPCODES_H_

#include "CharRangeSet.h"
#include "Types.h"
#include <cstdint>
#include <memory>

enum RegexOpcodes : uint8_t {
	/* STRUCTURE OF A COMPILED REGULAR EXPRESSION 'PROGRAM'.
	 *
	 * A program is a flat, zero-indexed sequence of instructions run by a
	 * backtracking machine.  Execution starts at instruction 0 with an empty
	 * set of capture slots and proceeds to the next instruction unless the
	 * instruction says otherwise.  Choice points are SPLITs: the first target
	 * is tried first and the second only when everything reachable from the
	 * first has failed.  Operands are program indices, capture slot numbers or
	 * the character data the instruction tests.
	 *
	 * The opcodes are:
	 */

	// Consume one character.
	MATCH_LITERAL = 1, // Match the operand character.
	MATCH_ANY     = 2, // Match any character.
	MATCH_CLASS   = 3, // Match any character in the operand class.

	// Control flow.
	SPLIT = 4, // Continue at x, on failure at y.
	JUMP  = 5, // Continue at x.

	// Zero width.
	SAVE_SLOT   = 6, // Record the current position in capture slot x.
	CHECK_START = 7, // Position is the start of the subject.
	CHECK_END   = 8, // Position is the end of the subject.

	ACCEPT = 9, // Success. Always the last instruction.
};

struct RegexInstruction {
	RegexOpcodes                         opcode;
	char_type                            character; // MATCH_LITERAL
	int                                  x;         // SPLIT, JUMP: address. SAVE_SLOT: slot
	int                                  y;         // SPLIT: second address
	std::shared_ptr<const CharRangeTree> charClass; // MATCH_CLASS
};

#endif
