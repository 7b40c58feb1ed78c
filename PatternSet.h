
#ifndef PATTERN_SET_H_
#define PATTERN_SET_H_

#include "ere/Regex.h"
#include <QByteArray>
#include <QString>
#include <memory>
#include <vector>

struct PatternEntry {
	QString                name;
	std::unique_ptr<Regex> regex;
	QString                replacement;
	bool                   hasReplacement;
	bool                   fullMatch;

	// does 'line' match, as a whole line when 'fullMatch' is set
	bool matches(const QString &line) const;
};

/* A named list of compiled patterns read from a JSON array:
 *
 *   [ { "name": "date", "pattern": "(\\d{4})-(\\d{2})", "replace": "\\2/\\1" } ]
 *
 * Entries whose pattern does not compile are skipped with a warning. */
class PatternSet {
public:
	/**
	 * @brief load - reads a pattern set from a file.
	 * @return the set, or nullptr if the file cannot be read or is not a JSON
	 *         array
	 */
	static std::unique_ptr<PatternSet> load(const QString &filename);
	static std::unique_ptr<PatternSet> fromJson(const QByteArray &json);

private:
	PatternSet() = default;
	PatternSet(const PatternSet &) = delete;
	PatternSet &operator=(const PatternSet &) = delete;

public:
	const std::vector<PatternEntry> &entries() const {
		return entries_;
	}

	const PatternEntry *find(const QString &name) const;

private:
	std::vector<PatternEntry> entries_;
};

#endif
