
#ifndef UTIL_RESOURCE_H_
#define UTIL_RESOURCE_H_

#include <QByteArray>
#include <QStringList>

#include <optional>

class QString;

std::optional<QByteArray> LoadResource(const QString &resource);
QStringList ListResources(const QString &directory, const QStringList &nameFilters);

#endif
