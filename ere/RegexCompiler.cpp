
#include "RegexCompiler.h"
#include "RegexException.h"

/*----------------------------------------------------------------------*
 * compile
 *
 * Group numbers were handed out by the parser, group n owns slots 2n
 * and 2n + 1.  Copies of a group made by {m,n} expansion write the
 * same slots, and a group removed by {0} keeps its slots but never
 * sets them, so the capture count is the parser's group count plus
 * one for the whole match.
 *----------------------------------------------------------------------*/
RegexProgram RegexCompiler::compile(const RegexNode &root, int groupCount) {

	if (groupCount < 0) {
		throw RegexException("internal error #2, 'RegexCompiler::compile'");
	}

	RegexCompiler compiler(groupCount);

	compiler.emit_node(SAVE_SLOT, 0);
	compiler.emit(&root);
	compiler.emit_node(SAVE_SLOT, 1);
	compiler.emit_node(ACCEPT);

	return RegexProgram(groupCount + 1, std::move(compiler.code_));
}

/*----------------------------------------------------------------------*
 * emit
 *
 *   Alt(a, b)       split L1, L2 / L1: a / jmp L3 / L2: b / L3:
 *   Opt(a)          split L1, L2 / L1: a / L2:
 *   Star(a)         L0: split L1, L2 / L1: a / jmp L0 / L2:
 *   Plus(a)         L0: a / split L0, L1 / L1:
 *   Capture(a)      save 2n / a / save 2n + 1
 *
 * Lazy quantifiers swap the two split targets.  Empty emits nothing.
 *----------------------------------------------------------------------*/
void RegexCompiler::emit(const RegexNode *node) {

	// concatenations nest to the right, walk the spine instead of recursing
	while (node->type() == RegexNode::Type::Concat) {
		emit(node->left());
		node = node->right();
	}

	switch (node->type()) {
	case RegexNode::Type::Empty:
		break;
	case RegexNode::Type::Literal:
		code_[emit_node(MATCH_LITERAL)].character = node->character();
		break;
	case RegexNode::Type::AnyChar:
		emit_node(MATCH_ANY);
		break;
	case RegexNode::Type::CharClass:
		code_[emit_node(MATCH_CLASS)].charClass = std::make_shared<const CharRangeTree>(node->charSet().toSearchStructure());
		break;
	case RegexNode::Type::StartAnchor:
		emit_node(CHECK_START);
		break;
	case RegexNode::Type::EndAnchor:
		emit_node(CHECK_END);
		break;
	case RegexNode::Type::Alt:
		{
			const int split = emit_node(SPLIT);
			emit(node->left());
			const int jump = emit_node(JUMP);
			set_targets(split, split + 1, here());
			emit(node->right());
			set_targets(jump, here(), 0);
		}
		break;
	case RegexNode::Type::Opt:
		{
			const int split = emit_node(SPLIT);
			emit(node->child());
			if (node->greedy()) {
				set_targets(split, split + 1, here());
			} else {
				set_targets(split, here(), split + 1);
			}
		}
		break;
	case RegexNode::Type::Star:
		{
			const int split = emit_node(SPLIT);
			emit(node->child());
			emit_node(JUMP, split);
			if (node->greedy()) {
				set_targets(split, split + 1, here());
			} else {
				set_targets(split, here(), split + 1);
			}
		}
		break;
	case RegexNode::Type::Plus:
		{
			const int body = here();
			emit(node->child());
			const int split = emit_node(SPLIT);
			if (node->greedy()) {
				set_targets(split, body, split + 1);
			} else {
				set_targets(split, split + 1, body);
			}
		}
		break;
	case RegexNode::Type::Capture:
		if (node->index() < 1 || node->index() > groupCount_) {
			throw RegexException("internal error #3, 'RegexCompiler::emit'");
		}

		emit_node(SAVE_SLOT, 2 * node->index());
		emit(node->child());
		emit_node(SAVE_SLOT, 2 * node->index() + 1);
		break;
	default:
		throw RegexException("internal error #1, 'RegexCompiler::emit'");
	}
}

//------------------------------------------------------------------------------
// Name: emit_node
// Desc: Appends an instruction and returns its address.
//------------------------------------------------------------------------------
int RegexCompiler::emit_node(RegexOpcodes op, int x, int y) {
	RegexInstruction inst;
	inst.opcode    = op;
	inst.character = 0;
	inst.x         = x;
	inst.y         = y;
	code_.push_back(inst);
	return here() - 1;
}

//------------------------------------------------------------------------------
// Name: set_targets
// Desc: Back-patches the targets of a SPLIT or JUMP once they are known.
//------------------------------------------------------------------------------
void RegexCompiler::set_targets(int pc, int x, int y) {
	code_[pc].x = x;
	code_[pc].y = y;
}
