
#ifndef ERE_REGEX_EXCEPTION_H_
#define ERE_REGEX_EXCEPTION_H_

#include <QByteArray>
#include <QString>
#include <cstdarg>
#include <cstdio>
#include <exception>

class RegexException : public std::exception {
public:
	explicit RegexException(const char *format, ...) {
		char buffer[256];
		va_list ap;
		va_start(ap, format);
		vsnprintf(buffer, sizeof(buffer), format, ap);
		va_end(ap);
		error_ = QByteArray(buffer);
	}

protected:
	RegexException() = default;

public:
	const char *what() const noexcept override {
		return error_.constData();
	}

protected:
	QByteArray error_;
};

/* Raised by the parser.  'offset' is the zero-based code unit index into the
   pattern of the offending character or of the unmatched opening token. */
class RegexParseError : public RegexException {
public:
	RegexParseError(const QString &pattern, int offset, const QString &message) : offset_(offset), message_(message) {
		error_ = QString("%1 near index %2\n%3\n^").arg(message, QString::number(offset), pattern.mid(offset)).toUtf8();
	}

public:
	int offset() const {
		return offset_;
	}

	const QString &message() const {
		return message_;
	}

private:
	int     offset_;
	QString message_;
};

#endif
