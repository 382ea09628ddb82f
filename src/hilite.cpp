
#include "Main.h"

#include <QCoreApplication>
#include <QStringList>

#include <cstdio>
#include <cstdlib>

namespace {

bool ShowDebugOutput = false;

const char *LevelName(QtMsgType type) {
	switch (type) {
	case QtDebugMsg:
		return "debug";
	case QtInfoMsg:
		return "info";
	case QtWarningMsg:
		return "warning";
	case QtCriticalMsg:
		return "critical";
	case QtFatalMsg:
		return "fatal";
	}

	return "message";
}

/**
 * @brief Writes log messages to stderr, keeping stdout for the highlighted
 * output. Debug messages (load summaries) are only shown when the
 * `HILITE_DEBUG` environment variable is set.
 *
 * @param type The severity of the message.
 * @param context Unused.
 * @param msg The message.
 */
void MessageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg) {

	Q_UNUSED(context)

	if (type == QtDebugMsg && !ShowDebugOutput) {
		return;
	}

	fprintf(stderr, "[%s] %s\n", LevelName(type), qPrintable(msg));

	if (type == QtFatalMsg) {
		abort();
	}
}

}

int main(int argc, char *argv[]) {

	ShowDebugOutput = qEnvironmentVariableIsSet("HILITE_DEBUG");
	qInstallMessageHandler(MessageHandler);

	QCoreApplication app(argc, argv);
	QCoreApplication::setApplicationName(QStringLiteral("hilite"));
	QCoreApplication::setApplicationVersion(QStringLiteral(HILITE_VERSION));

	Main main{QCoreApplication::arguments()};
	return main.exec();
}
