
#include "Util/FileSystem.h"

#include <QFile>
#include <QString>
#include <QtDebug>

#include <algorithm>

namespace {

/* Parameters to the algorithm used to auto-detect DOS format files. We scan
   up to the lesser of FormatSampleLines lines and FormatSampleChars
   characters of the beginning of the file, checking that all newlines are
   paired with carriage returns. If even a single counterexample exists, the
   file is judged to be in Unix format. */
constexpr size_t FormatSampleLines = 5;
constexpr size_t FormatSampleChars = 2000;

}

/**
 * @brief Determine the line ending convention of a file based on its content.
 *
 * @param text The raw content of the file.
 * @return The format of the file, which can be Unix, Dos, or Mac.
 *
 * @note If any ambiguity exists, the file is judged to be in Unix format.
 */
FileFormats FormatOfFile(std::string_view text) {

	size_t nNewlines = 0;
	size_t nReturns  = 0;

	const size_t sampleSize = std::min(text.size(), FormatSampleChars);

	for (size_t i = 0; i < sampleSize; ++i) {
		if (text[i] == '\n') {
			++nNewlines;
			if (i == 0 || text[i - 1] != '\r') {
				return FileFormats::Unix;
			}

			if (nNewlines >= FormatSampleLines) {
				return FileFormats::Dos;
			}
		} else if (text[i] == '\r') {
			++nReturns;
		}
	}

	if (nNewlines > 0) {
		return FileFormats::Dos;
	}

	if (nReturns > 0) {
		return FileFormats::Mac;
	}

	return FileFormats::Unix;
}

/**
 * @brief Splits text into the lines of a document. A trailing line terminator
 * does not start an additional empty line, so "a\nb\n" is two lines, while an
 * empty text is a document with a single empty line.
 *
 * @param text The text to split.
 * @param format The line ending convention used by `text`.
 * @return The lines, without their terminators.
 */
QStringList SplitLines(const QString &text, FileFormats format) {

	QString separator;
	switch (format) {
	case FileFormats::Dos:
		separator = QStringLiteral("\r\n");
		break;
	case FileFormats::Mac:
		separator = QStringLiteral("\r");
		break;
	case FileFormats::Unix:
		separator = QStringLiteral("\n");
		break;
	}

	QStringList lines = text.split(separator);
	if (lines.size() > 1 && lines.back().isEmpty()) {
		lines.removeLast();
	}

	return lines;
}

/**
 * @brief Reads a UTF-8 text file of any line ending convention and splits it
 * into lines.
 *
 * @param fileName The name of the file to read.
 * @return The lines of the file, or an empty optional if it could not be read.
 */
std::optional<QStringList> ReadDocumentLines(const QString &fileName) {

	QFile file(fileName);
	if (!file.open(QIODevice::ReadOnly)) {
		qWarning("hilite: could not open %s: %s", qPrintable(fileName), qPrintable(file.errorString()));
		return {};
	}

	const QByteArray contents = file.readAll();
	if (file.error() != QFileDevice::NoError) {
		qWarning("hilite: error while reading %s: %s", qPrintable(fileName), qPrintable(file.errorString()));
		return {};
	}

	const FileFormats format = FormatOfFile(std::string_view(contents.constData(), static_cast<size_t>(contents.size())));
	return SplitLines(QString::fromUtf8(contents), format);
}
