
#ifndef YAML_H_
#define YAML_H_

#include <QColor>
#include <QString>
#include <QStringList>

#include <yaml-cpp/yaml.h>

// Decoders for the Qt types found in definition files. Definitions are JSON
// documents, which yaml-cpp reads as YAML flow collections. Nothing is ever
// written back, so only the decoding side is provided.
namespace YAML {

template <>
struct convert<QString> {
	static bool decode(const Node &node, QString &rhs) {
		if (!node.IsScalar()) {
			return false;
		}

		rhs = QString::fromStdString(node.Scalar());
		return true;
	}
};

// a list of scalars, anything else is refused as a whole
template <>
struct convert<QStringList> {
	static bool decode(const Node &node, QStringList &rhs) {
		if (!node.IsSequence()) {
			return false;
		}

		QStringList items;
		items.reserve(static_cast<int>(node.size()));

		for (const Node &item : node) {
			QString value;
			if (!convert<QString>::decode(item, value)) {
				return false;
			}
			items.append(value);
		}

		rhs = std::move(items);
		return true;
	}
};

// a color name or #rrggbb value, as understood by QColor
template <>
struct convert<QColor> {
	static bool decode(const Node &node, QColor &rhs) {
		QString name;
		if (!convert<QString>::decode(node, name)) {
			return false;
		}

		const QColor color(name.trimmed());
		if (!color.isValid()) {
			return false;
		}

		rhs = color;
		return true;
	}
};

}

#endif
