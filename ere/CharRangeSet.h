
#ifndef ERE_CHAR_RANGE_SET_H_
#define ERE_CHAR_RANGE_SET_H_

#include "Types.h"
#include <QString>
#include <bitset>
#include <initializer_list>
#include <vector>

/* A closed interval [lo, hi] of code units. */
struct CharRange {
	CharRange(char_type c) : lo(c), hi(c) {
	}

	CharRange(char_type low, char_type high) : lo(low), hi(high) {
	}

	bool contains(char_type c) const {
		return lo <= c && c <= hi;
	}

	bool operator==(const CharRange &other) const {
		return lo == other.lo && hi == other.hi;
	}

	bool operator!=(const CharRange &other) const {
		return !(*this == other);
	}

	char_type lo;
	char_type hi;
};

class CharRangeTree;

/* An ordered set of disjoint, non-adjacent ranges, sorted by 'lo'.  Every
   operation re-establishes that invariant before returning.  Once a set has
   been handed to an AST node it is only ever read, derived sets are new
   instances. */
class CharRangeSet {
public:
	CharRangeSet() = default;
	explicit CharRangeSet(const CharRange &range);
	CharRangeSet(std::initializer_list<CharRange> ranges);

public:
	/**
	 * @brief add - inserts a range, merging it with every range it overlaps or
	 * touches.
	 */
	void add(const CharRange &range);

	/**
	 * @brief unite - adds every range of 'other' to this set.
	 */
	void unite(const CharRangeSet &other);

	/**
	 * @brief negate - complement against [CharTypeMin, CharTypeMax].
	 * @return a new set, this one is left untouched
	 */
	CharRangeSet negate() const;

	bool contains(char_type c) const;

	/**
	 * @brief toSearchStructure - builds the lookup structure used at match
	 * time from the canonical sorted form.
	 */
	CharRangeTree toSearchStructure() const;

public:
	bool isEmpty() const {
		return ranges_.empty();
	}

	// true when the set holds exactly one code unit
	bool isSingleCharacter() const {
		return ranges_.size() == 1 && ranges_[0].lo == ranges_[0].hi;
	}

	const std::vector<CharRange> &ranges() const {
		return ranges_;
	}

	bool operator==(const CharRangeSet &other) const {
		return ranges_ == other.ranges_;
	}

	bool operator!=(const CharRangeSet &other) const {
		return ranges_ != other.ranges_;
	}

	QString toString() const;

private:
	std::vector<CharRange> ranges_;
};

/* Membership structure built once per character class when a program is
   compiled.  Latin-1 code units are answered from a bit table, everything
   else by walking an implicit balanced search tree laid out breadth first
   (children of node k live at 2k and 2k + 1). */
class CharRangeTree {
public:
	CharRangeTree() = default;
	explicit CharRangeTree(const std::vector<CharRange> &sorted);

public:
	bool contains(char_type c) const;

	size_t size() const {
		return nodes_.empty() ? 0 : nodes_.size() - 1;
	}

	// same rendering as CharRangeSet::toString
	QString toString() const;

private:
	void build(const std::vector<CharRange> &sorted, size_t *next, size_t k);
	void collect(size_t k, CharRangeSet *set) const;

private:
	std::vector<CharRange> nodes_; // 1-based, nodes_[0] is unused
	std::bitset<256>       latin1_;
};

/* The built-in classes behind \d \w \s and their upper case complements. */
const CharRangeSet &digitCharSet();
const CharRangeSet &wordCharSet();
const CharRangeSet &spaceCharSet();

#endif
