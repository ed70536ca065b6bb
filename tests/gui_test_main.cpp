// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_session.hpp>
#include <QApplication>

int main(int argc, char* argv[]) {
    // Widgets need a platform plugin; the tests never open a window
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }

    QApplication app(argc, argv);
    return Catch::Session().run(argc, argv);
}
