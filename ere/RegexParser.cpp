
#include "RegexParser.h"
#include "RegexCommon.h"
#include "CharRangeSet.h"

namespace {

const char NormalMetaChars[] = ".[{()\\*+?|^$";
const char BoundMetaChars[]  = "}";
const char SetMetaChars[]    = "\\[]";

//------------------------------------------------------------------------------
// Name: containsChar
//------------------------------------------------------------------------------
bool containsChar(const char *chars, char_type c) {
	for (const char *p = chars; *p != '\0'; ++p) {
		if (static_cast<char_type>(*p) == c) {
			return true;
		}
	}
	return false;
}

//------------------------------------------------------------------------------
// Name: parseCount
// Desc: Reads the digits collected for one side of a {m,n} bound.  Returns -1
//       when the value exceeds MaxRepetitionCount.
//------------------------------------------------------------------------------
int parseCount(const QString &digits) {
	int value = 0;
	for (QChar ch : digits) {
		value = value * 10 + (ch.unicode() - '0');
		if (value > MaxRepetitionCount) {
			return -1;
		}
	}
	return value;
}

}

/*----------------------------------------------------------------------*
 * parse
 *
 * Drives the shift-reduce loop one token at a time until the input is
 * exhausted, then folds whatever is left on the stack the way a '|'
 * would at the outermost level.  Exactly one node must remain.
 *----------------------------------------------------------------------*/
RegexNode::Pointer RegexParser::parse(const QString &pattern, int *groupCount) {
	RegexParser parser(pattern);
	RegexNode::Pointer root = parser.run();

	if (groupCount) {
		*groupCount = parser.groups_;
	}

	return root;
}

//------------------------------------------------------------------------------
// Name: RegexParser
//------------------------------------------------------------------------------
RegexParser::RegexParser(const QString &pattern) : pattern_(pattern), level_(0), groups_(0), offset_(0) {
	LexState normal;
	normal.mode    = LexState::Normal;
	normal.negated = false;
	states_.push_back(normal);
}

//------------------------------------------------------------------------------
// Name: run
//------------------------------------------------------------------------------
RegexNode::Pointer RegexParser::run() {

	while (offset_ < pattern_.size()) {
		parseOne();
	}

	reduceAlternatives(0);

	// an opener that never saw its closer
	for (const StackItem &item : stack_) {
		if (item.isMarker()) {
			fail(item.offset, "Malformed regular expression");
		}
	}

	if (stack_.size() != 1) {
		fail(0, "Malformed regular expression");
	}

	return popNode();
}

/*----------------------------------------------------------------------*
 * parseOne
 *
 * Reads one token and applies its stack transformation.  Quantifiers
 * and '[' peek at the next raw character: a '?' after a quantifier
 * makes it lazy and a '^' right after '[' negates the set.  Either way
 * the peeked character is consumed.
 *----------------------------------------------------------------------*/
void RegexParser::parseOne() {

	const Token token = nextToken();
	int next = token.next;

	switch (token.type) {
	case TokenType::EOI:
		break;
	case TokenType::Char:
		pushNode(RegexNode::literal(token.character));
		break;
	case TokenType::Dot:
		pushNode(RegexNode::anyChar());
		break;
	case TokenType::DigitClass:
		pushNode(RegexNode::charClass(token.negated ? digitCharSet().negate() : digitCharSet()));
		break;
	case TokenType::WordClass:
		pushNode(RegexNode::charClass(token.negated ? wordCharSet().negate() : wordCharSet()));
		break;
	case TokenType::SpaceClass:
		pushNode(RegexNode::charClass(token.negated ? spaceCharSet().negate() : spaceCharSet()));
		break;
	case TokenType::Star:
	case TokenType::Plus:
	case TokenType::Opt:
		{
			const Token peek = nextRawToken(token.next);
			const bool lazy  = (peek.type == TokenType::Char && peek.character == '?');

			RegexNode::Type type = RegexNode::Type::Opt;
			if (token.type == TokenType::Star) {
				type = RegexNode::Type::Star;
			} else if (token.type == TokenType::Plus) {
				type = RegexNode::Type::Plus;
			}

			reduceOne(token, type, !lazy);

			if (lazy) {
				next = peek.next;
			}
		}
		break;
	case TokenType::LPar:
		pushMarker(StackItem::CapturingGroupStart, level_, token.offset);
		stack_.back().group = ++groups_;
		++level_;
		break;
	case TokenType::RPar:
		reduceCapturing(level_ - 1, token.offset);
		--level_;
		break;
	case TokenType::Pipe:
		reduceAlternatives(level_);
		pushMarker(StackItem::AlternationMarker, level_, token.offset);
		break;
	case TokenType::LBracket:
		{
			const Token peek   = nextRawToken(token.next);
			const bool negated = (peek.type == TokenType::Char && peek.character == '^');

			pushMarker(StackItem::CharClassStart, level_, token.offset);
			++level_;

			LexState set;
			set.mode    = LexState::Set;
			set.negated = negated;
			states_.push_back(set);

			if (negated) {
				next = peek.next;
			}
		}
		break;
	case TokenType::RBracket:
		if (states_.back().mode == LexState::Set) {
			reduceCharSet(states_.back().negated, level_ - 1, token.offset);
			states_.pop_back();
			--level_;
		} else {
			pushNode(RegexNode::literal(']'));
		}
		break;
	case TokenType::Circ:
		pushNode(RegexNode::startAnchor());
		break;
	case TokenType::Dollar:
		pushNode(RegexNode::endAnchor());
		break;
	case TokenType::LBrace:
		{
			pushMarker(StackItem::RepetitionBoundStart, level_, token.offset);

			LexState bound;
			bound.mode    = LexState::Bound;
			bound.negated = false;
			states_.push_back(bound);
		}
		break;
	case TokenType::RBrace:
		if (states_.back().mode == LexState::Bound) {
			reduceBounded(token.offset);
			states_.pop_back();
		} else {
			pushNode(RegexNode::literal('}'));
		}
		break;
	}

	offset_ = next;
}

//------------------------------------------------------------------------------
// Name: isMeta
// Desc: Meta characters depend on the lexer mode, everything else is a literal.
//------------------------------------------------------------------------------
bool RegexParser::isMeta(char_type c) const {
	switch (states_.back().mode) {
	case LexState::Normal:
		return containsChar(NormalMetaChars, c);
	case LexState::Bound:
		return containsChar(BoundMetaChars, c);
	case LexState::Set:
		return containsChar(SetMetaChars, c);
	}
	return false;
}

//------------------------------------------------------------------------------
// Name: isClassEscape
//------------------------------------------------------------------------------
bool RegexParser::isClassEscape(char_type c) {
	return containsChar("dswDSW", c);
}

//------------------------------------------------------------------------------
// Name: nextRawToken
// Desc: Returns the character at 'offset' as is, regardless of the lexer mode.
//------------------------------------------------------------------------------
RegexParser::Token RegexParser::nextRawToken(int offset) const {
	Token token;
	token.character = 0;
	token.negated   = false;
	token.offset    = offset;

	if (offset >= pattern_.size()) {
		token.type = TokenType::EOI;
		token.next = offset;
	} else {
		token.type      = TokenType::Char;
		token.character = pattern_.at(offset).unicode();
		token.next      = offset + 1;
	}

	return token;
}

/*----------------------------------------------------------------------*
 * nextToken
 *
 * A backslash escapes any meta character of the current mode and
 * introduces the built-in classes \d \s \w \D \S \W.  Every other
 * escape is rejected, located at the escaped character.
 *----------------------------------------------------------------------*/
RegexParser::Token RegexParser::nextToken() const {

	Token token = nextRawToken(offset_);
	if (token.type == TokenType::EOI) {
		return token;
	}

	const char_type c = token.character;

	if (c == '\\') {
		if (offset_ + 1 >= pattern_.size()) {
			fail(offset_, "Unterminated escaped character");
		}

		const char_type escaped = pattern_.at(offset_ + 1).unicode();
		token.next = offset_ + 2;

		if (isMeta(escaped)) {
			token.character = escaped;
			return token;
		}

		if (!isClassEscape(escaped)) {
			fail(offset_ + 1, QString("Unknown escaped character '\\%1'").arg(QChar(escaped)));
		}

		switch (escaped) {
		case 'd':
		case 'D':
			token.type = TokenType::DigitClass;
			break;
		case 's':
		case 'S':
			token.type = TokenType::SpaceClass;
			break;
		default:
			token.type = TokenType::WordClass;
			break;
		}

		token.negated = (escaped == 'D' || escaped == 'S' || escaped == 'W');
		return token;
	}

	if (!isMeta(c)) {
		return token;
	}

	switch (c) {
	case '.':
		token.type = TokenType::Dot;
		break;
	case '*':
		token.type = TokenType::Star;
		break;
	case '+':
		token.type = TokenType::Plus;
		break;
	case '?':
		token.type = TokenType::Opt;
		break;
	case '|':
		token.type = TokenType::Pipe;
		break;
	case '(':
		token.type = TokenType::LPar;
		break;
	case ')':
		token.type = TokenType::RPar;
		break;
	case '[':
		token.type = TokenType::LBracket;
		break;
	case ']':
		token.type = TokenType::RBracket;
		break;
	case '{':
		token.type = TokenType::LBrace;
		break;
	case '}':
		token.type = TokenType::RBrace;
		break;
	case '^':
		token.type = TokenType::Circ;
		break;
	case '$':
		token.type = TokenType::Dollar;
		break;
	default:
		break;
	}

	return token;
}

//------------------------------------------------------------------------------
// Name: reduceOne
// Desc: Wraps the top of the stack in a Star, Plus or Opt node.
//------------------------------------------------------------------------------
void RegexParser::reduceOne(const Token &token, RegexNode::Type type, bool greedy) {

	if (stack_.empty()) {
		fail(token.offset, QString("Dangling control meta character '%1'").arg(pattern_.at(token.offset)));
	}

	if (stack_.back().isMarker()) {
		fail(stack_.back().offset, "Malformed regular expression");
	}

	RegexNode::Pointer node = popNode();

	switch (type) {
	case RegexNode::Type::Star:
		pushNode(RegexNode::star(std::move(node), greedy));
		break;
	case RegexNode::Type::Plus:
		pushNode(RegexNode::plus(std::move(node), greedy));
		break;
	default:
		pushNode(RegexNode::opt(std::move(node), greedy));
		break;
	}
}

/*----------------------------------------------------------------------*
 * reduceCapturing
 *
 * Pops everything down to the group start opened at 'level',
 * concatenating nodes with the earlier one on the left and folding
 * each "first | second" triple met on the way into an Alt.  The result
 * (Empty for "()") is pushed back wrapped in a Capture.
 *----------------------------------------------------------------------*/
void RegexParser::reduceCapturing(int level, int offset) {

	RegexNode::Pointer acc;

	for (;;) {
		if (stack_.empty()) {
			fail(offset, "Unbalanced closing character ')'");
		}

		const StackItem &top = stack_.back();

		if (top.kind == StackItem::CapturingGroupStart && top.level == level) {
			const int group = top.group;
			stack_.pop_back();
			pushNode(RegexNode::capture(acc ? std::move(acc) : RegexNode::empty(), group));
			return;
		}

		if (top.isMarker()) {
			fail(top.offset, "Malformed regular expression");
		}

		const size_t size = stack_.size();
		if (size >= 3 && stack_[size - 2].kind == StackItem::AlternationMarker) {
			RegexNode::Pointer second = popNode();
			stack_.pop_back();

			if (stack_.back().isMarker()) {
				fail(stack_.back().offset, "Malformed regular expression");
			}

			RegexNode::Pointer first = popNode();
			acc = RegexNode::alt(std::move(first), concatOpt(std::move(second), std::move(acc)));
			continue;
		}

		acc = concatOpt(popNode(), std::move(acc));
	}
}

/*----------------------------------------------------------------------*
 * reduceAlternatives
 *
 * Same walk as reduceCapturing but it stops at a previous '|' (which
 * it folds into an Alt), at the start of the enclosing group (which
 * stays on the stack) or at the bottom of the stack.
 *----------------------------------------------------------------------*/
void RegexParser::reduceAlternatives(int level) {

	RegexNode::Pointer acc;

	for (;;) {
		if (stack_.empty()) {
			pushNode(acc ? std::move(acc) : RegexNode::empty());
			return;
		}

		const StackItem &top = stack_.back();
		const size_t size    = stack_.size();

		if (top.kind == StackItem::AlternationMarker && size >= 2 && !stack_[size - 2].isMarker()) {
			stack_.pop_back();
			RegexNode::Pointer first = popNode();
			pushNode(acc ? RegexNode::alt(std::move(first), std::move(acc)) : std::move(first));
			return;
		}

		if (top.kind == StackItem::CapturingGroupStart && top.level == level - 1) {
			pushNode(acc ? std::move(acc) : RegexNode::empty());
			return;
		}

		if (top.isMarker()) {
			fail(top.offset, "Malformed regular expression");
		}

		acc = concatOpt(popNode(), std::move(acc));
	}
}

/*----------------------------------------------------------------------*
 * reduceCharSet
 *
 * Collects the members of a bracket expression down to its start
 * marker: "x-y" triples as ranges, single characters, and nested
 * classes (built-in escapes or inner brackets) merged in whole.
 *
 * An empty result pushes nothing.  A single character that is not
 * negated collapses to a Literal.
 *----------------------------------------------------------------------*/
void RegexParser::reduceCharSet(bool negated, int level, int offset) {

	CharRangeSet acc;

	for (;;) {
		if (stack_.empty()) {
			fail(offset, "Unbalanced closing character ']'");
		}

		const StackItem &top = stack_.back();

		if (top.kind == StackItem::CharClassStart && top.level == level) {
			stack_.pop_back();

			if (acc.isEmpty()) {
				return;
			}

			if (acc.isSingleCharacter() && !negated) {
				pushNode(RegexNode::literal(acc.ranges().front().lo));
			} else {
				pushNode(RegexNode::charClass(negated ? acc.negate() : acc));
			}
			return;
		}

		if (top.isMarker()) {
			fail(top.offset, "Malformed regular expression");
		}

		const size_t size = stack_.size();

		if (size >= 3 && stack_[size - 2].isLiteral('-')) {
			const StackItem &low = stack_[size - 3];

			// "[-x]", the range has no lower end
			if (low.kind == StackItem::CharClassStart && low.level == level) {
				fail(low.offset + 1, "Malformed range");
			}

			if (top.node->type() == RegexNode::Type::Literal && low.kind == StackItem::Node && low.node->type() == RegexNode::Type::Literal) {
				acc.add(CharRange(low.node->character(), top.node->character()));
				stack_.pop_back();
				stack_.pop_back();
				stack_.pop_back();
				continue;
			}
		}

		switch (top.node->type()) {
		case RegexNode::Type::Literal:
			acc.add(CharRange(top.node->character()));
			break;
		case RegexNode::Type::CharClass:
			acc.unite(top.node->charSet());
			break;
		default:
			fail(offset, "Malformed character set");
		}

		stack_.pop_back();
	}
}

/*----------------------------------------------------------------------*
 * reduceBounded
 *
 * Reads the digits of a {m,n} bound back from the top of the stack:
 * digits seen before the comma belong to 'n', digits after it to 'm'.
 * Without a comma the single number is both.  The operand below the
 * bound is then expanded:
 *
 *   {m}    m copies
 *   {m,n}  m copies followed by n - m lazy optional copies
 *   {m,}   m - 1 copies followed by a greedy Plus ({0,} is a Star)
 *----------------------------------------------------------------------*/
void RegexParser::reduceBounded(int offset) {

	QString minDigits;
	QString maxDigits;
	bool inMax = true;
	int boundOffset = -1;

	while (boundOffset < 0) {
		if (stack_.empty()) {
			fail(offset, "Malformed regular expression");
		}

		const StackItem &top = stack_.back();

		if (top.kind == StackItem::RepetitionBoundStart) {
			boundOffset = top.offset;
		} else if (inMax && top.isLiteral(',')) {
			inMax = false;
		} else if (top.kind == StackItem::Node && top.node->type() == RegexNode::Type::Literal && top.node->character() >= '0' && top.node->character() <= '9') {
			const QChar digit(top.node->character());
			if (inMax) {
				maxDigits.prepend(digit);
			} else {
				minDigits.prepend(digit);
			}
		} else {
			fail(offset, "Malformed regular expression");
		}

		stack_.pop_back();
	}

	if (minDigits.isEmpty() && maxDigits.isEmpty()) {
		fail(boundOffset, "Malformed regular expression");
	}

	const bool openEnded = !inMax && maxDigits.isEmpty();
	int min;
	int max;

	if (inMax) {
		min = max = parseCount(maxDigits);
	} else {
		min = parseCount(minDigits);
		max = openEnded ? 0 : parseCount(maxDigits);
	}

	if (min < 0 || max < 0) {
		fail(offset, "Repetition count too large");
	}

	if (!openEnded && max < min) {
		fail(offset, "Malformed regular expression");
	}

	RegexNode::Pointer operand;
	if (stack_.empty()) {
		operand = RegexNode::empty();
	} else if (stack_.back().isMarker()) {
		fail(stack_.back().offset, "Malformed regular expression");
	} else {
		operand = popNode();
	}

	RegexNode::Pointer result;

	if (openEnded) {
		if (min == 0) {
			result = RegexNode::star(std::move(operand), true);
		} else {
			result = RegexNode::plus(operand->clone(), true);
			for (int i = 1; i < min; ++i) {
				result = RegexNode::concat(operand->clone(), std::move(result));
			}
		}
	} else {
		for (int i = min; i < max; ++i) {
			result = concatOpt(RegexNode::opt(operand->clone(), false), std::move(result));
		}

		for (int i = 0; i < min; ++i) {
			result = concatOpt(operand->clone(), std::move(result));
		}

		if (!result) {
			result = RegexNode::empty();
		}
	}

	pushNode(std::move(result));
}

//------------------------------------------------------------------------------
// Name: pushNode
//------------------------------------------------------------------------------
void RegexParser::pushNode(RegexNode::Pointer node) {
	StackItem item;
	item.kind   = StackItem::Node;
	item.level  = level_;
	item.group  = 0;
	item.offset = offset_;
	item.node   = std::move(node);
	stack_.push_back(std::move(item));
}

//------------------------------------------------------------------------------
// Name: pushMarker
//------------------------------------------------------------------------------
void RegexParser::pushMarker(StackItem::Kind kind, int level, int offset) {
	StackItem item;
	item.kind   = kind;
	item.level  = level;
	item.group  = 0;
	item.offset = offset;
	stack_.push_back(std::move(item));
}

//------------------------------------------------------------------------------
// Name: popNode
//------------------------------------------------------------------------------
RegexNode::Pointer RegexParser::popNode() {
	RegexNode::Pointer node = std::move(stack_.back().node);
	stack_.pop_back();
	return node;
}

//------------------------------------------------------------------------------
// Name: concatOpt
// Desc: Concat(first, rest), or just 'first' when there is no rest yet.
//------------------------------------------------------------------------------
RegexNode::Pointer RegexParser::concatOpt(RegexNode::Pointer first, RegexNode::Pointer rest) {
	if (!rest) {
		return first;
	}
	return RegexNode::concat(std::move(first), std::move(rest));
}

//------------------------------------------------------------------------------
// Name: fail
//------------------------------------------------------------------------------
void RegexParser::fail(int offset, const QString &message) const {
	throw RegexParseError(pattern_, offset, message);
}
