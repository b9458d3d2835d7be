#pragma once

#include <QMainWindow>
#include <QVariant>
#include <atomic>
#include <memory>

#include "xorhunt/FirmwareImage.h"
#include "xorhunt/ScanTypes.h"
#include "xorhunt/SignatureCatalog.h"
#include "xorhunt/XorScanner.h"

class QCheckBox;
class QCloseEvent;
class QComboBox;
class QLabel;
class QLineEdit;
class QProgressBar;
class QPushButton;
class QSpinBox;
class QTableView;
class QThread;
class QTimer;
class MatchTableModel;
class HuntJob;

class HuntWindow : public QMainWindow {
    Q_OBJECT
public:
    explicit HuntWindow(QWidget *parent = nullptr);
    ~HuntWindow() override;

    bool scanInProgress() const { return scanInProgress_; }

protected:
    void closeEvent(QCloseEvent *event) override;

private slots:
    void onBrowse();
    void onScan();
    void onStop();
    void onModeChanged(int index);
    void onCipherChanged(int index);

private:
    void setupUi();
    bool currentScanParams(xorhunt::ScanParams &params, QString &error) const;
    void setScanning(bool scanning);
    void onScanFinished();
    void abandonScan();
    void setStatusDetail(const QString &text);
    void loadSettings();
    void persistSettings() const;

    QLineEdit *pathEdit_{};
    QPushButton *browseBtn_{};
    QComboBox *modeCombo_{};
    QLineEdit *keyEdit_{};
    QLineEdit *firstKeyEdit_{};
    QLineEdit *lastKeyEdit_{};
    QComboBox *widthCombo_{};
    QComboBox *cipherCombo_{};
    QComboBox *phaseCombo_{};
    QComboBox *catalogCombo_{};
    QCheckBox *bruteCheck_{};
    QSpinBox *threadsSpin_{};
    QSpinBox *maxSizeSpin_{};
    QCheckBox *rejectOversizeCheck_{};
    QSpinBox *limitSpin_{};
    QPushButton *scanBtn_{};
    QPushButton *stopBtn_{};
    QProgressBar *scanProgress_{};
    QTableView *resultsTable_{};
    MatchTableModel *resultsModel_{};
    QLabel *statusLabel_{};
    QTimer *scanProgressTimer_{};

    QThread *scanThread_{};
    HuntJob *scanJob_{};
    bool scanInProgress_{false};
    std::atomic<uint64_t> progressDone_{0};
    uint64_t progressTotal_{0};

    xorhunt::SignatureCatalog catalog_;
    xorhunt::FirmwareImage image_;
    std::unique_ptr<xorhunt::XorScanner> scanner_;
};
