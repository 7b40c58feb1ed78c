
#ifndef TYPES_H_
#define TYPES_H_

#include <QtGlobal>

// One UTF-16 code unit, the same value QChar::unicode() yields. Patterns,
// subjects and every offset the engine reports are expressed in these units.
typedef quint16 char_type;

const char_type CharTypeMin = 0x0000;
const char_type CharTypeMax = 0xffff;

#endif
