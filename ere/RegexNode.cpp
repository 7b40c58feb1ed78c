
#include "RegexNode.h"
#include "RegexCommon.h"
#include "RegexException.h"
#include <vector>

//------------------------------------------------------------------------------
// Name: RegexNode
//------------------------------------------------------------------------------
RegexNode::RegexNode(Type type) : type_(type), character_(0), greedy_(true), index_(0) {
}

//------------------------------------------------------------------------------
// Name: ~RegexNode
// Desc: Detaches the subtrees onto a local list and frees them one node at a
//       time, a long concatenation is as deep as the pattern is long.
//------------------------------------------------------------------------------
RegexNode::~RegexNode() {

	std::vector<Pointer> pending;

	if (left_) {
		pending.push_back(std::move(left_));
	}

	if (right_) {
		pending.push_back(std::move(right_));
	}

	while (!pending.empty()) {
		Pointer node = std::move(pending.back());
		pending.pop_back();

		if (node->left_) {
			pending.push_back(std::move(node->left_));
		}

		if (node->right_) {
			pending.push_back(std::move(node->right_));
		}
	}
}

//------------------------------------------------------------------------------
// Name: empty
//------------------------------------------------------------------------------
RegexNode::Pointer RegexNode::empty() {
	return Pointer(new RegexNode(Type::Empty));
}

//------------------------------------------------------------------------------
// Name: anyChar
//------------------------------------------------------------------------------
RegexNode::Pointer RegexNode::anyChar() {
	return Pointer(new RegexNode(Type::AnyChar));
}

//------------------------------------------------------------------------------
// Name: literal
//------------------------------------------------------------------------------
RegexNode::Pointer RegexNode::literal(char_type c) {
	Pointer node(new RegexNode(Type::Literal));
	node->character_ = c;
	return node;
}

//------------------------------------------------------------------------------
// Name: concat
//------------------------------------------------------------------------------
RegexNode::Pointer RegexNode::concat(Pointer left, Pointer right) {
	Pointer node(new RegexNode(Type::Concat));
	node->left_  = std::move(left);
	node->right_ = std::move(right);
	return node;
}

//------------------------------------------------------------------------------
// Name: alt
//------------------------------------------------------------------------------
RegexNode::Pointer RegexNode::alt(Pointer left, Pointer right) {
	Pointer node(new RegexNode(Type::Alt));
	node->left_  = std::move(left);
	node->right_ = std::move(right);
	return node;
}

//------------------------------------------------------------------------------
// Name: opt
//------------------------------------------------------------------------------
RegexNode::Pointer RegexNode::opt(Pointer child, bool greedy) {
	Pointer node(new RegexNode(Type::Opt));
	node->left_   = std::move(child);
	node->greedy_ = greedy;
	return node;
}

//------------------------------------------------------------------------------
// Name: star
//------------------------------------------------------------------------------
RegexNode::Pointer RegexNode::star(Pointer child, bool greedy) {
	Pointer node(new RegexNode(Type::Star));
	node->left_   = std::move(child);
	node->greedy_ = greedy;
	return node;
}

//------------------------------------------------------------------------------
// Name: plus
//------------------------------------------------------------------------------
RegexNode::Pointer RegexNode::plus(Pointer child, bool greedy) {
	Pointer node(new RegexNode(Type::Plus));
	node->left_   = std::move(child);
	node->greedy_ = greedy;
	return node;
}

//------------------------------------------------------------------------------
// Name: charClass
//------------------------------------------------------------------------------
RegexNode::Pointer RegexNode::charClass(const CharRangeSet &set) {
	Pointer node(new RegexNode(Type::CharClass));
	node->set_ = set;
	return node;
}

//------------------------------------------------------------------------------
// Name: capture
//------------------------------------------------------------------------------
RegexNode::Pointer RegexNode::capture(Pointer child, int index) {
	Pointer node(new RegexNode(Type::Capture));
	node->left_  = std::move(child);
	node->index_ = index;
	return node;
}

//------------------------------------------------------------------------------
// Name: startAnchor
//------------------------------------------------------------------------------
RegexNode::Pointer RegexNode::startAnchor() {
	return Pointer(new RegexNode(Type::StartAnchor));
}

//------------------------------------------------------------------------------
// Name: endAnchor
//------------------------------------------------------------------------------
RegexNode::Pointer RegexNode::endAnchor() {
	return Pointer(new RegexNode(Type::EndAnchor));
}

//------------------------------------------------------------------------------
// Name: clone
// Desc: Copies the right spine of a concatenation in a loop.
//------------------------------------------------------------------------------
RegexNode::Pointer RegexNode::clone() const {

	Pointer copy = copyNode();
	RegexNode *last = copy.get();

	for (const RegexNode *node = this; node->type_ == Type::Concat; node = node->right_.get()) {
		last->right_ = node->right_->copyNode();
		last         = last->right_.get();
	}

	return copy;
}

//------------------------------------------------------------------------------
// Name: copyNode
// Desc: This node and its subtrees, except the right side of a Concat, which
//       is left for 'clone' to fill in.
//------------------------------------------------------------------------------
RegexNode::Pointer RegexNode::copyNode() const {
	Pointer copy(new RegexNode(type_));
	copy->character_ = character_;
	copy->greedy_    = greedy_;
	copy->set_       = set_;
	copy->index_     = index_;

	if (left_) {
		copy->left_ = left_->clone();
	}

	if (right_ && type_ != Type::Concat) {
		copy->right_ = right_->clone();
	}

	return copy;
}

//------------------------------------------------------------------------------
// Name: toString
//------------------------------------------------------------------------------
QString RegexNode::toString() const {

	const char *const lazy = greedy_ ? "" : ", lazy";

	switch (type_) {
	case Type::Empty:
		return QLatin1String("Empty");
	case Type::AnyChar:
		return QLatin1String("AnyChar");
	case Type::Literal:
		return QString("Literal(%1)").arg(printableChar(character_));
	case Type::Concat:
		{
			QString text;
			int depth = 0;
			const RegexNode *node = this;

			for (; node->type_ == Type::Concat; node = node->right_.get()) {
				text += QLatin1String("Concat(");
				text += node->left_->toString();
				text += QLatin1String(", ");
				++depth;
			}

			text += node->toString();
			text += QString(depth, QLatin1Char(')'));
			return text;
		}
	case Type::Alt:
		return QString("Alt(%1, %2)").arg(left_->toString(), right_->toString());
	case Type::Opt:
		return QString("Opt(%1%2)").arg(left_->toString(), QLatin1String(lazy));
	case Type::Star:
		return QString("Star(%1%2)").arg(left_->toString(), QLatin1String(lazy));
	case Type::Plus:
		return QString("Plus(%1%2)").arg(left_->toString(), QLatin1String(lazy));
	case Type::CharClass:
		return QString("CharClass(%1)").arg(set_.toString());
	case Type::Capture:
		return QString("Capture(%1, %2)").arg(QString::number(index_), left_->toString());
	case Type::StartAnchor:
		return QLatin1String("StartAnchor");
	case Type::EndAnchor:
		return QLatin1String("EndAnchor");
	}

	throw RegexException("internal error #1, 'RegexNode::toString'");
}
