
#include "PatternSet.h"
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QtDebug>

//------------------------------------------------------------------------------
// Name: matches
//------------------------------------------------------------------------------
bool PatternEntry::matches(const QString &line) const {
	if (fullMatch) {
		return regex->isMatchedBy(line);
	}

	return regex->findFirstMatchIn(line) != nullptr;
}

//------------------------------------------------------------------------------
// Name: load
//------------------------------------------------------------------------------
std::unique_ptr<PatternSet> PatternSet::load(const QString &filename) {

	QFile file(filename);
	if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
		qWarning() << "cannot open pattern set" << filename << ":" << file.errorString();
		return nullptr;
	}

	return fromJson(file.readAll());
}

//------------------------------------------------------------------------------
// Name: fromJson
//------------------------------------------------------------------------------
std::unique_ptr<PatternSet> PatternSet::fromJson(const QByteArray &json) {

	QJsonParseError e;
	QJsonDocument d = QJsonDocument::fromJson(json, &e);
	if (d.isNull()) {
		qWarning() << "pattern set is not valid JSON:" << e.errorString() << "at offset" << e.offset;
		return nullptr;
	}

	if (!d.isArray()) {
		qWarning() << "pattern set must be a JSON array";
		return nullptr;
	}

	std::unique_ptr<PatternSet> set(new PatternSet);

	QJsonArray arr = d.array();
	for (int i = 0; i < arr.size(); ++i) {
		QJsonObject obj = arr[i].toObject();

		if (!obj.contains("pattern") || !obj["pattern"].isString()) {
			qWarning("pattern set entry %d has no pattern, skipped", i);
			continue;
		}

		PatternEntry entry;
		entry.name           = QString("pattern%1").arg(i);
		entry.hasReplacement = false;
		entry.fullMatch      = false;

		if (obj.contains("name") && !obj["name"].isNull()) {
			entry.name = obj["name"].toString();
		}

		if (obj.contains("replace") && !obj["replace"].isNull()) {
			entry.replacement    = obj["replace"].toString();
			entry.hasReplacement = true;
		}

		if (obj.contains("fullMatch")) {
			entry.fullMatch = obj["fullMatch"].toBool();
		}

		try {
			entry.regex.reset(new Regex(obj["pattern"].toString()));
		} catch (const RegexParseError &ex) {
			qWarning().noquote() << "pattern" << entry.name << "skipped:" << ex.what();
			continue;
		}

		qDebug() << "loaded pattern" << entry.name << "with" << entry.regex->groupCount() << "groups";
		set->entries_.push_back(std::move(entry));
	}

	return set;
}

//------------------------------------------------------------------------------
// Name: find
//------------------------------------------------------------------------------
const PatternEntry *PatternSet::find(const QString &name) const {
	for (const PatternEntry &entry : entries_) {
		if (entry.name == name) {
			return &entry;
		}
	}

	return nullptr;
}
