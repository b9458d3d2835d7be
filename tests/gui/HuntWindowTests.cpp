#include <gtest/gtest.h>

#include <QComboBox>
#include <QDir>
#include <QFile>
#include <QLineEdit>
#include <QPushButton>

#include "gui/HuntWindow.h"

class HuntWindowTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = QDir::temp().filePath("xorhunt_gui_image.bin");
        QFile f(path_);
        ASSERT_TRUE(f.open(QIODevice::WriteOnly | QIODevice::Truncate));
        QByteArray filler(256 * 1024, '\xA5');
        ASSERT_EQ(f.write(filler), filler.size());
    }

    void TearDown() override {
        QFile::remove(path_);
    }

    QString path_;
};

/**
 * @brief Closing the window while a full key space scan runs stops the worker
 * thread and releases it before the window goes away.
 */
TEST_F(HuntWindowTest, CloseDuringScanStopsIt) {
    HuntWindow window;
    window.show();
    auto *pathEdit = window.findChild<QLineEdit *>("pathEdit");
    auto *modeCombo = window.findChild<QComboBox *>("modeCombo");
    auto *cipherCombo = window.findChild<QComboBox *>("cipherCombo");
    auto *scanButton = window.findChild<QPushButton *>("scanButton");
    ASSERT_NE(pathEdit, nullptr);
    ASSERT_NE(modeCombo, nullptr);
    ASSERT_NE(cipherCombo, nullptr);
    ASSERT_NE(scanButton, nullptr);

    pathEdit->setText(path_);
    cipherCombo->setCurrentIndex(0);
    modeCombo->setCurrentIndex(2);
    scanButton->click();
    EXPECT_TRUE(window.scanInProgress());

    window.close();
    EXPECT_FALSE(window.scanInProgress());
    EXPECT_TRUE(scanButton->isEnabled());
}
