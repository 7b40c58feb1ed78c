
#ifndef ERE_REGEX_PARSER_H_
#define ERE_REGEX_PARSER_H_

#include "RegexNode.h"
#include "RegexException.h"
#include <QString>
#include <vector>

/* Shift-reduce parser for POSIX extended regular expressions.  Each token
   either pushes a leaf onto the stack, pushes a temporary marker waiting for
   its closer, or reduces the top of the stack.  Markers never survive into
   the tree that parse() returns. */
class RegexParser {
public:
	/**
	 * @brief parse - builds the syntax tree of 'pattern'.
	 * @param pattern - the regular expression
	 * @param groupCount - if not null, receives the number of '(' groups in
	 *                     'pattern', including any that {0} removed from the tree
	 * @return the root node, never null
	 * @throws RegexParseError located at the offending character
	 */
	static RegexNode::Pointer parse(const QString &pattern, int *groupCount = nullptr);

private:
	enum class TokenType {
		Char,
		Dot,
		Star,
		Plus,
		Opt,
		Pipe,
		LPar,
		RPar,
		LBracket,
		RBracket,
		LBrace,
		RBrace,
		Circ,
		Dollar,
		DigitClass,
		WordClass,
		SpaceClass,
		EOI,
	};

	struct Token {
		TokenType type;
		char_type character; // Char only
		bool      negated;   // built-in classes only
		int       offset;    // where the token starts
		int       next;      // offset just past the token
	};

	// decides which raw characters are meta
	struct LexState {
		enum Mode { Normal, Bound, Set };
		Mode mode;
		bool negated; // Set only
	};

	// closed sum of permanent nodes and temporary markers
	struct StackItem {
		enum Kind { Node, CapturingGroupStart, CharClassStart, RepetitionBoundStart, AlternationMarker };

		bool isMarker() const {
			return kind != Node;
		}

		bool isLiteral(char_type c) const {
			return kind == Node && node->type() == RegexNode::Type::Literal && node->character() == c;
		}

		Kind               kind;
		int                level;  // CapturingGroupStart and CharClassStart
		int                group;  // CapturingGroupStart only
		int                offset; // markers: offset of the opening token
		RegexNode::Pointer node;
	};

private:
	explicit RegexParser(const QString &pattern);
	RegexParser(const RegexParser &) = delete;
	RegexParser &operator=(const RegexParser &) = delete;

private:
	RegexNode::Pointer run();
	void parseOne();

private:
	// lexing
	Token nextToken() const;
	Token nextRawToken(int offset) const;
	bool isMeta(char_type c) const;
	static bool isClassEscape(char_type c);

private:
	// reductions
	void reduceOne(const Token &token, RegexNode::Type type, bool greedy);
	void reduceCapturing(int level, int offset);
	void reduceAlternatives(int level);
	void reduceCharSet(bool negated, int level, int offset);
	void reduceBounded(int offset);

private:
	void pushNode(RegexNode::Pointer node);
	void pushMarker(StackItem::Kind kind, int level, int offset);
	RegexNode::Pointer popNode();
	static RegexNode::Pointer concatOpt(RegexNode::Pointer first, RegexNode::Pointer rest);
	[[noreturn]] void fail(int offset, const QString &message) const;

private:
	const QString          pattern_;
	std::vector<LexState>  states_; // current state on top
	std::vector<StackItem> stack_;  // top of stack at the back
	int                    level_;
	int                    groups_; // capturing groups opened so far
	int                    offset_;
};

#endif
