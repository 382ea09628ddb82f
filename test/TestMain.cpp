#include <QCoreApplication>

#include <gtest/gtest.h>

int main(int argc, char *argv[]) {
	::testing::InitGoogleTest(&argc, argv);

	QCoreApplication app(argc, argv);
	QCoreApplication::setApplicationName(QStringLiteral("hilite_tests"));

	return RUN_ALL_TESTS();
}
