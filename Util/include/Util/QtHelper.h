
#ifndef UTIL_QT_HELPER_H_
#define UTIL_QT_HELPER_H_

#include <QCoreApplication>
#include <QString>

// Gives a namespace the same tr() a Q_OBJECT class gets, using the
// namespace name as the translation context
#define Q_DECLARE_NAMESPACE_TR(context)                                                              \
	inline QString tr(const char *sourceText, const char *disambiguation = nullptr, int n = -1) { \
		return QCoreApplication::translate(#context, sourceText, disambiguation, n);                \
	}

#endif
