
#ifndef UTIL_FILESYSTEM_H_
#define UTIL_FILESYSTEM_H_

#include <QStringList>

#include <optional>
#include <string_view>

class QString;

enum class FileFormats : int {
	Unix,
	Dos,
	Mac
};

FileFormats FormatOfFile(std::string_view text);
QStringList SplitLines(const QString &text, FileFormats format);
std::optional<QStringList> ReadDocumentLines(const QString &fileName);

#endif
