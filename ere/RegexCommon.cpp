
#include "RegexCommon.h"

//------------------------------------------------------------------------------
// Name: printableChar
//------------------------------------------------------------------------------
QString printableChar(char_type c) {

	if (c > 0x20 && c < 0x7f) {
		return QString(QChar(c));
	}

	return QString("\\u%1").arg(c, 4, 16, QChar::fromLatin1('0'));
}
