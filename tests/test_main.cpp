#include <gtest/gtest.h>

#include <QCoreApplication>

#include <cstring>

auto main(int argc, char** argv) -> int
{
    // Check the program was started just for test case discovery
    bool list_tests = false;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--gtest_list_tests") == 0) {
            list_tests = true;
            break;
        }
    }

    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("Genyleap"));
    QCoreApplication::setApplicationName(QStringLiteral("BaranTests"));
    if (!list_tests) {
        qSetMessagePattern(QStringLiteral("[%{type}] %{message}"));
    }

    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
