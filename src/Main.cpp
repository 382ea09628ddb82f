#include "Main.h"
#include "DocumentHighlighter.h"
#include "LanguageRegistry.h"
#include "Settings.h"
#include "Util/FileSystem.h"

#include <QColor>
#include <QCoreApplication>
#include <QString>

#include <cstdio>
#include <cstdlib>

namespace {

constexpr const char cmdLineHelp[] =
	"Usage: hilite [-config file] [-definitions dir]... [-lm language]\n"
	"              [-ansi] [-list] [-diagnostics] [-V|-version] [-h|-help]\n"
	"              [--] [file]\n";

/**
 * @brief Gets the index of the next argument parameter.
 *
 * @param args The command line arguments.
 * @param argIndex The current argument index.
 * @return The next argument index.
 */
int getArgumentParameter(const QStringList &args, int argIndex) {
	if (argIndex + 1 >= args.size()) {
		fprintf(stderr, "hilite: %s requires an argument\n%s", qPrintable(args[argIndex]), cmdLineHelp);
		exit(EXIT_FAILURE);
	}

	return ++argIndex;
}

/**
 * @brief Builds the escape sequence selecting a color and emphasis.
 *
 * @param color The foreground color.
 * @param bold Whether the text is bold.
 * @param italic Whether the text is italic.
 * @param underline Whether the text is underlined.
 * @return The escape sequence.
 */
QString AnsiStyle(const QColor &color, bool bold, bool italic, bool underline) {

	QString sequence = QStringLiteral("\x1b[");
	if (bold) {
		sequence += QLatin1String("1;");
	}

	if (italic) {
		sequence += QLatin1String("3;");
	}

	if (underline) {
		sequence += QLatin1String("4;");
	}

	sequence += QStringLiteral("38;2;%1;%2;%3m").arg(color.red()).arg(color.green()).arg(color.blue());
	return sequence;
}

QString FlagString(const HighlightStyle &style) {

	QString flags;
	if (style.isBold) {
		flags += QLatin1Char('b');
	}

	if (style.isItalic) {
		flags += QLatin1Char('i');
	}

	if (style.isUnderlined) {
		flags += QLatin1Char('u');
	}

	return flags.isEmpty() ? QStringLiteral("-") : flags;
}

}

/**
 * @brief Constructor for Main class.
 *
 * @param args The command line arguments passed to the application.
 */
Main::Main(const QStringList &args) {

	bool opts = true;

	for (int i = 1; i < args.size(); ++i) {

		if (opts && args[i] == QLatin1String("--")) {
			opts = false; // treat all remaining arguments as filenames
		} else if (opts && args[i] == QLatin1String("-config")) {
			i           = getArgumentParameter(args, i);
			configFile_ = args[i];
		} else if (opts && args[i] == QLatin1String("-definitions")) {
			i = getArgumentParameter(args, i);
			definitionDirs_.append(args[i]);
		} else if (opts && args[i] == QLatin1String("-lm")) {
			i         = getArgumentParameter(args, i);
			langMode_ = args[i];
		} else if (opts && args[i] == QLatin1String("-ansi")) {
			ansi_ = true;
		} else if (opts && args[i] == QLatin1String("-list")) {
			list_ = true;
		} else if (opts && args[i] == QLatin1String("-diagnostics")) {
			diagnostics_ = true;
		} else if (opts && (args[i] == QLatin1String("-V") || args[i] == QLatin1String("-version"))) {
			printf("hilite version %s\n", qPrintable(QCoreApplication::applicationVersion()));
			exit(EXIT_SUCCESS);
		} else if (opts && (args[i] == QLatin1String("-h") || args[i] == QLatin1String("-help"))) {
			fprintf(stderr, "%s", cmdLineHelp);
			exit(EXIT_SUCCESS);
		} else if (opts && args[i].startsWith(QLatin1Char('-'))) {
			fprintf(stderr, "hilite: Unrecognized option %s\n%s", qPrintable(args[i]), cmdLineHelp);
			exit(EXIT_FAILURE);
		} else if (!fileName_.isEmpty()) {
			fprintf(stderr, "hilite: only one file can be highlighted at a time\n%s", cmdLineHelp);
			exit(EXIT_FAILURE);
		} else {
			fileName_ = args[i];
		}
	}
}

/**
 * @brief Loads the configuration and the language definitions, then does
 * what the command line asked for.
 *
 * @return The exit code of the application.
 */
int Main::exec() {

	if (!configFile_.isEmpty()) {
		Settings::SetConfigFile(configFile_);
	}

	Settings::Load();

	LanguageRegistry &registry = Highlight::Registry();
	registry.loadDefaults();

	for (const QString &dir : Settings::definitionPaths + definitionDirs_) {
		registry.loadDirectory(dir);
	}

	if (list_) {
		listLanguages();
	}

	if (diagnostics_) {
		printDiagnostics();
	}

	if (fileName_.isEmpty()) {
		if (list_ || diagnostics_) {
			return EXIT_SUCCESS;
		}

		fprintf(stderr, "%s", cmdLineHelp);
		return EXIT_FAILURE;
	}

	return highlightFile();
}

/**
 * @brief Highlights the file named on the command line and prints the result.
 *
 * @return The exit code of the application.
 */
int Main::highlightFile() {

	const LanguageRegistry &registry = Highlight::Registry();

	std::shared_ptr<const LanguageDefinition> language;
	if (!langMode_.isEmpty()) {
		language = registry.definitionForName(langMode_);
		if (!language) {
			fprintf(stderr, "hilite: unknown language %s\n", qPrintable(langMode_));
			return EXIT_FAILURE;
		}
	} else {
		language = registry.definitionForFile(fileName_);
	}

	if (!Settings::highlightSyntax) {
		language = nullptr;
	}

	std::optional<QStringList> lines = ReadDocumentLines(fileName_);
	if (!lines) {
		fprintf(stderr, "hilite: could not read %s\n", qPrintable(fileName_));
		return EXIT_FAILURE;
	}

	DocumentHighlighter document(&registry);
	document.setReparseChunkSize(Settings::reparseChunkSize);
	document.setLanguage(language);
	document.setText(*lines);

	HighlightPass pass = document.beginPass(0, document.lineCount());
	while (pass.step()) {
	}

	std::optional<std::vector<LineStyles>> styles = pass.takeResults();
	if (!styles) {
		fprintf(stderr, "hilite: highlighting of %s did not complete\n", qPrintable(fileName_));
		return EXIT_FAILURE;
	}

	if (ansi_) {
		printAnsi(*lines, *styles);
	} else {
		printSpans(*styles);
	}

	return EXIT_SUCCESS;
}

void Main::listLanguages() const {

	const LanguageRegistry &registry = Highlight::Registry();

	for (const QString &name : registry.languageNames()) {
		const std::shared_ptr<const LanguageDefinition> language = registry.definitionForName(name);
		printf("%s: %s\n", qPrintable(name), qPrintable(language->extensions.join(QLatin1Char(' '))));
	}
}

void Main::printDiagnostics() const {

	for (const LoadDiagnostic &diagnostic : Highlight::Registry().diagnostics()) {
		if (diagnostic.rule.isEmpty()) {
			printf("%s: %s: %s\n",
				   qPrintable(diagnostic.origin),
				   qPrintable(QString(to_string(diagnostic.kind))),
				   qPrintable(diagnostic.message));
		} else {
			printf("%s: %s: %s: %s\n",
				   qPrintable(diagnostic.origin),
				   qPrintable(QString(to_string(diagnostic.kind))),
				   qPrintable(diagnostic.rule),
				   qPrintable(diagnostic.message));
		}
	}
}

/**
 * @brief Prints one line per span: the line index, the span's offsets, its
 * role, color and emphasis.
 *
 * @param styles The spans of every line.
 */
void Main::printSpans(const std::vector<LineStyles> &styles) {

	for (size_t line = 0; line < styles.size(); ++line) {
		for (const StyledSpan &span : styles[line]) {
			printf("%d:%d-%d %s %s %s\n",
				   static_cast<int>(line),
				   span.start,
				   span.end,
				   qPrintable(span.style.name),
				   qPrintable(span.style.color.name()),
				   qPrintable(FlagString(span.style)));
		}
	}
}

/**
 * @brief Prints the document with its spans rendered as 24-bit terminal
 * colors. Unstyled text uses the configured default foreground.
 *
 * @param lines The lines of the document.
 * @param styles The spans of every line.
 */
void Main::printAnsi(const QStringList &lines, const std::vector<LineStyles> &styles) {

	QColor foreground(Settings::defaultForeground);
	if (!foreground.isValid()) {
		qWarning("hilite: invalid default foreground %s", qPrintable(Settings::defaultForeground));
		foreground = QColor(Qt::lightGray);
	}

	const QString plain = AnsiStyle(foreground, false, false, false);
	const auto reset    = QLatin1String("\x1b[0m");

	for (int i = 0; i < lines.size(); ++i) {
		const QString &text = lines[i];

		QString out;
		int pos = 0;

		for (const StyledSpan &span : styles[static_cast<size_t>(i)]) {
			if (span.start > pos) {
				out += plain + text.mid(pos, span.start - pos);
			}

			out += AnsiStyle(span.style.color, span.style.isBold, span.style.isItalic, span.style.isUnderlined);
			out += text.mid(span.start, span.length());
			out += reset;
			pos = span.end;
		}

		if (pos < text.size()) {
			out += plain + text.mid(pos);
		}

		out += reset;
		printf("%s\n", qPrintable(out));
	}
}
