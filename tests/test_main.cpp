#include <QCoreApplication>

#include <gtest/gtest.h>

int main(int argc, char **argv)
{
    // QTimer and QObject-scoped callbacks need an application instance.
    QCoreApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
