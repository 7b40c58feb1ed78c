
#ifndef ERE_REGEX_NODE_H_
#define ERE_REGEX_NODE_H_

#include "CharRangeSet.h"
#include "Types.h"
#include <QString>
#include <memory>

/* A node of the parsed pattern.  Nodes are built bottom up by the parser
   through the factory functions below and never change afterwards; each node
   owns its children exclusively. */
class RegexNode {
public:
	typedef std::unique_ptr<RegexNode> Pointer;

	enum class Type {
		Empty,       // matches the empty string
		AnyChar,     // .
		Literal,     // one code unit
		Concat,      // left then right
		Alt,         // left or right, left preferred
		Opt,         // child 0 or 1 times
		Star,        // child 0 or more times
		Plus,        // child 1 or more times
		CharClass,   // [...] and the built-in classes
		Capture,     // ( child )
		StartAnchor, // ^
		EndAnchor,   // $
	};

public:
	static Pointer empty();
	static Pointer anyChar();
	static Pointer literal(char_type c);
	static Pointer concat(Pointer left, Pointer right);
	static Pointer alt(Pointer left, Pointer right);
	static Pointer opt(Pointer child, bool greedy);
	static Pointer star(Pointer child, bool greedy);
	static Pointer plus(Pointer child, bool greedy);
	static Pointer charClass(const CharRangeSet &set);
	static Pointer capture(Pointer child, int index);
	static Pointer startAnchor();
	static Pointer endAnchor();

private:
	explicit RegexNode(Type type);
	RegexNode(const RegexNode &) = delete;
	RegexNode &operator=(const RegexNode &) = delete;

public:
	~RegexNode();

public:
	Type type() const {
		return type_;
	}

	// Literal only
	char_type character() const {
		return character_;
	}

	// Opt, Star and Plus only
	bool greedy() const {
		return greedy_;
	}

	// Concat and Alt
	const RegexNode *left() const {
		return left_.get();
	}

	const RegexNode *right() const {
		return right_.get();
	}

	// Opt, Star, Plus and Capture
	const RegexNode *child() const {
		return left_.get();
	}

	// CharClass only
	const CharRangeSet &charSet() const {
		return set_;
	}

	// Capture only: the group number, counted by opening parenthesis from 1.
	// Copies made by {m,n} expansion share the number of their original.
	int index() const {
		return index_;
	}

public:
	/**
	 * @brief clone - deep copy of this subtree.
	 */
	Pointer clone() const;

	/**
	 * @brief toString - one line rendering, e.g. Concat(Literal(a), Star(AnyChar))
	 */
	QString toString() const;

private:
	Pointer copyNode() const;

private:
	Type         type_;
	char_type    character_;
	bool         greedy_;
	int          index_;
	Pointer      left_;
	Pointer      right_;
	CharRangeSet set_;
};

#endif
