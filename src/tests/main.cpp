#include <QCoreApplication>
#include <gtest/gtest.h>

// Probes and process control need a Qt application object.
auto main(int argc, char *argv[]) -> int
{
    ::testing::InitGoogleTest(&argc, argv);
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("DevSrvTests"));
    QCoreApplication::setApplicationName(QStringLiteral("DevSrvTests"));
    return RUN_ALL_TESTS();
}
