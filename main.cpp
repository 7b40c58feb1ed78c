
#include "EreTool.h"
#include <QCoreApplication>
#include <QFile>
#include <cstdio>

int main(int argc, char *argv[]) {

	QCoreApplication app(argc, argv);
	QCoreApplication::setApplicationName("eretool");

	QTextStream out(stdout);
	QTextStream err(stderr);

	QFile input;
	if (!input.open(stdin, QIODevice::ReadOnly | QIODevice::Text)) {
		err << "eretool: cannot read standard input: " << input.errorString() << '\n';
		return EreTool::ExitTrouble;
	}

	EreTool tool(out, err);
	return tool.run(QCoreApplication::arguments(), &input);
}
