#include <gtest/gtest.h>

#include <QApplication>
#include <QDir>

#include "xorhunt/Log.h"

// Widgets need a QApplication; QSettings is pointed at a scratch directory.
int main(int argc, char **argv) {
    QDir scratch(QDir::temp().filePath("xorhunt_gui_tests"));
    scratch.mkpath(".");
    qputenv("XDG_CONFIG_HOME", scratch.absolutePath().toLocal8Bit());
    qputenv("QT_QPA_PLATFORM", "offscreen");
    QApplication app(argc, argv);
    xorhunt::setLogEnabled(false);
    ::testing::InitGoogleTest(&argc, argv);
    int rc = RUN_ALL_TESTS();
    scratch.removeRecursively();
    return rc;
}
