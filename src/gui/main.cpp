#include <QApplication>

#include "gui/HuntWindow.h"

int main(int argc, char **argv) {
    QApplication app(argc, argv);
    QApplication::setOrganizationName("XorHunt");
    QApplication::setApplicationName("xorhunt-gui");
    HuntWindow window;
    window.show();
    return app.exec();
}
