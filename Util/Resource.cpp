
#include "Util/Resource.h"

#include <gsl/gsl>

#include <QDir>
#include <QResource>
#include <QString>
#include <QtDebug>

/**
 * @brief Loads the contents of a compiled-in resource, decompressing it
 * when rcc stored it compressed.
 *
 * @param resource The resource path, for example ":/highlight/python.json".
 * @return The resource data, or an empty optional if the resource does not
 * exist or uses a compression algorithm this build can't read.
 */
std::optional<QByteArray> LoadResource(const QString &resource) {

	const QResource res(resource);
	if (!res.isValid()) {
		qWarning("hilite: no such resource %s", qPrintable(resource));
		return {};
	}

	// don't copy the data, if it's uncompressed, we can deal with it in place
	auto data = QByteArray::fromRawData(reinterpret_cast<const char *>(res.data()), gsl::narrow<int>(res.size()));

#if QT_VERSION >= QT_VERSION_CHECK(5, 13, 0)
	switch (res.compressionAlgorithm()) {
	case QResource::NoCompression:
		break;
	case QResource::ZlibCompression:
		data = qUncompress(data);
		break;
	default:
		qWarning("hilite: resource %s uses an unsupported compression algorithm", qPrintable(resource));
		return {};
	}
#else
	if (res.isCompressed()) {
		data = qUncompress(data);
	}
#endif

	return data;
}

/**
 * @brief Lists the resources stored under a resource directory.
 *
 * @param directory The resource directory, for example ":/highlight".
 * @param nameFilters Wildcard filters applied to the entry names.
 * @return The full resource paths of the matching entries, sorted by name.
 */
QStringList ListResources(const QString &directory, const QStringList &nameFilters) {

	const QDir dir(directory);

	QStringList paths;
	for (const QString &entry : dir.entryList(nameFilters, QDir::Files, QDir::Name)) {
		paths.append(dir.filePath(entry));
	}

	return paths;
}
