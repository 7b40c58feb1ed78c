
#include "RegexProgram.h"
#include "RegexCommon.h"
#include <QStringList>

//------------------------------------------------------------------------------
// Name: RegexProgram
//------------------------------------------------------------------------------
RegexProgram::RegexProgram(int captureCount, std::vector<RegexInstruction> code) : captureCount_(captureCount), code_(std::move(code)) {
}

//------------------------------------------------------------------------------
// Name: dump
//------------------------------------------------------------------------------
QString RegexProgram::dump() const {

	QStringList lines;

	for (int pc = 0; pc < size(); ++pc) {
		const RegexInstruction &inst = code_[pc];
		QString text;

		switch (inst.opcode) {
		case MATCH_LITERAL:
			text = QString("char %1").arg(printableChar(inst.character));
			break;
		case MATCH_ANY:
			text = QLatin1String("any");
			break;
		case MATCH_CLASS:
			text = QString("class %1").arg(inst.charClass->toString());
			break;
		case SPLIT:
			text = QString("split %1, %2").arg(inst.x).arg(inst.y);
			break;
		case JUMP:
			text = QString("jmp %1").arg(inst.x);
			break;
		case SAVE_SLOT:
			text = QString("save %1").arg(inst.x);
			break;
		case CHECK_START:
			text = QLatin1String("check_start");
			break;
		case CHECK_END:
			text = QLatin1String("check_end");
			break;
		case ACCEPT:
			text = QLatin1String("accept");
			break;
		}

		lines << QString("%1: %2").arg(pc).arg(text);
	}

	return lines.join(QChar::fromLatin1('\n'));
}
