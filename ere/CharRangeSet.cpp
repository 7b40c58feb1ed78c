
#include "CharRangeSet.h"
#include "RegexCommon.h"
#include <QStringList>
#include <algorithm>

//------------------------------------------------------------------------------
// Name: CharRangeSet
//------------------------------------------------------------------------------
CharRangeSet::CharRangeSet(const CharRange &range) {
	add(range);
}

//------------------------------------------------------------------------------
// Name: CharRangeSet
//------------------------------------------------------------------------------
CharRangeSet::CharRangeSet(std::initializer_list<CharRange> ranges) {
	for (const CharRange &range : ranges) {
		add(range);
	}
}

//------------------------------------------------------------------------------
// Name: add
// Desc: Walks the sorted ranges once.  Ranges entirely below the new one are
//       kept, ranges that overlap or touch it are folded into it, and the
//       merged range is written out before the first range entirely above it.
//       Bounds are widened to int so that 0xffff + 1 does not wrap.
//------------------------------------------------------------------------------
void CharRangeSet::add(const CharRange &range) {

	int lo = std::min(range.lo, range.hi);
	int hi = std::max(range.lo, range.hi);

	std::vector<CharRange> merged;
	merged.reserve(ranges_.size() + 1);

	bool written = false;

	for (const CharRange &r : ranges_) {
		if (static_cast<int>(r.hi) + 1 < lo) {
			merged.push_back(r);
		} else if (hi + 1 < static_cast<int>(r.lo)) {
			if (!written) {
				merged.push_back(CharRange(static_cast<char_type>(lo), static_cast<char_type>(hi)));
				written = true;
			}
			merged.push_back(r);
		} else {
			lo = std::min(lo, static_cast<int>(r.lo));
			hi = std::max(hi, static_cast<int>(r.hi));
		}
	}

	if (!written) {
		merged.push_back(CharRange(static_cast<char_type>(lo), static_cast<char_type>(hi)));
	}

	ranges_.swap(merged);
}

//------------------------------------------------------------------------------
// Name: unite
//------------------------------------------------------------------------------
void CharRangeSet::unite(const CharRangeSet &other) {
	for (const CharRange &r : other.ranges_) {
		add(r);
	}
}

//------------------------------------------------------------------------------
// Name: negate
// Desc: Emits the gaps between consecutive ranges plus the two gaps at the
//       edges of the domain.  Gaps come out sorted and never touch each
//       other, so they are appended directly.
//------------------------------------------------------------------------------
CharRangeSet CharRangeSet::negate() const {

	CharRangeSet result;
	int next = CharTypeMin;

	for (const CharRange &r : ranges_) {
		if (static_cast<int>(r.lo) > next) {
			result.ranges_.push_back(CharRange(static_cast<char_type>(next), static_cast<char_type>(r.lo - 1)));
		}
		next = static_cast<int>(r.hi) + 1;
	}

	if (next <= CharTypeMax) {
		result.ranges_.push_back(CharRange(static_cast<char_type>(next), CharTypeMax));
	}

	return result;
}

//------------------------------------------------------------------------------
// Name: contains
//------------------------------------------------------------------------------
bool CharRangeSet::contains(char_type c) const {

	// first range starting above c, the candidate is the one before it
	auto it = std::upper_bound(ranges_.begin(), ranges_.end(), c, [](char_type ch, const CharRange &r) {
		return ch < r.lo;
	});

	if (it == ranges_.begin()) {
		return false;
	}

	return (it - 1)->contains(c);
}

//------------------------------------------------------------------------------
// Name: toSearchStructure
//------------------------------------------------------------------------------
CharRangeTree CharRangeSet::toSearchStructure() const {
	return CharRangeTree(ranges_);
}

//------------------------------------------------------------------------------
// Name: toString
//------------------------------------------------------------------------------
QString CharRangeSet::toString() const {

	QStringList parts;
	for (const CharRange &r : ranges_) {
		if (r.lo == r.hi) {
			parts << printableChar(r.lo);
		} else {
			parts << QString("%1-%2").arg(printableChar(r.lo), printableChar(r.hi));
		}
	}

	return QString("[%1]").arg(parts.join(QChar::fromLatin1(' ')));
}

//------------------------------------------------------------------------------
// Name: CharRangeTree
//------------------------------------------------------------------------------
CharRangeTree::CharRangeTree(const std::vector<CharRange> &sorted) {

	nodes_.resize(sorted.size() + 1, CharRange(0));

	size_t next = 0;
	build(sorted, &next, 1);

	for (const CharRange &r : sorted) {
		if (r.lo > 0xff) {
			break;
		}

		const int last = std::min<int>(r.hi, 0xff);
		for (int c = r.lo; c <= last; ++c) {
			latin1_.set(c);
		}
	}
}

//------------------------------------------------------------------------------
// Name: build
// Desc: An in-order walk of the implicit tree visits the slots in ascending
//       order, so filling them from the sorted ranges in that walk yields a
//       search tree of minimal height.
//------------------------------------------------------------------------------
void CharRangeTree::build(const std::vector<CharRange> &sorted, size_t *next, size_t k) {
	if (k < nodes_.size()) {
		build(sorted, next, 2 * k);
		nodes_[k] = sorted[(*next)++];
		build(sorted, next, 2 * k + 1);
	}
}

//------------------------------------------------------------------------------
// Name: contains
//------------------------------------------------------------------------------
bool CharRangeTree::contains(char_type c) const {

	if (c <= 0xff) {
		return latin1_.test(c);
	}

	size_t k = 1;
	while (k < nodes_.size()) {
		const CharRange &r = nodes_[k];
		if (c < r.lo) {
			k = 2 * k;
		} else if (c > r.hi) {
			k = 2 * k + 1;
		} else {
			return true;
		}
	}

	return false;
}

//------------------------------------------------------------------------------
// Name: collect
//------------------------------------------------------------------------------
void CharRangeTree::collect(size_t k, CharRangeSet *set) const {
	if (k < nodes_.size()) {
		collect(2 * k, set);
		set->add(nodes_[k]);
		collect(2 * k + 1, set);
	}
}

//------------------------------------------------------------------------------
// Name: toString
//------------------------------------------------------------------------------
QString CharRangeTree::toString() const {
	CharRangeSet set;
	collect(1, &set);
	return set.toString();
}

//------------------------------------------------------------------------------
// Name: digitCharSet
//------------------------------------------------------------------------------
const CharRangeSet &digitCharSet() {
	static const CharRangeSet set(CharRange('0', '9'));
	return set;
}

//------------------------------------------------------------------------------
// Name: wordCharSet
//------------------------------------------------------------------------------
const CharRangeSet &wordCharSet() {
	static const CharRangeSet set = {CharRange('A', 'Z'), CharRange('a', 'z'), CharRange('0', '9'), CharRange('_')};
	return set;
}

//------------------------------------------------------------------------------
// Name: spaceCharSet
//------------------------------------------------------------------------------
const CharRangeSet &spaceCharSet() {
	static const CharRangeSet set = {CharRange(' '), CharRange('\t'), CharRange('\r'), CharRange('\n'), CharRange('\f')};
	return set;
}
