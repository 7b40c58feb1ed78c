
#ifndef ERE_REGEX_COMPILER_H_
#define ERE_REGEX_COMPILER_H_

#include "RegexNode.h"
#include "RegexProgram.h"
#include <vector>

/* Lowers a syntax tree into a RegexProgram.  The tree is trusted to come
   from RegexParser, a node the compiler does not know is an internal error. */
class RegexCompiler {
public:
	/**
	 * @brief compile - wraps 'root' in the implicit group 0, lowers it and
	 * appends the final ACCEPT.
	 * @param groupCount - number of groups the parser counted, every Capture
	 *                     in 'root' must be numbered 1 .. groupCount
	 */
	static RegexProgram compile(const RegexNode &root, int groupCount);

private:
	explicit RegexCompiler(int groupCount) : groupCount_(groupCount) {
	}

	RegexCompiler(const RegexCompiler &) = delete;
	RegexCompiler &operator=(const RegexCompiler &) = delete;

private:
	void emit(const RegexNode *node);
	int emit_node(RegexOpcodes op, int x = 0, int y = 0);
	void set_targets(int pc, int x, int y);

	// address of the next instruction to be emitted
	int here() const {
		return static_cast<int>(code_.size());
	}

private:
	std::vector<RegexInstruction> code_;
	int                           groupCount_;
};

#endif
