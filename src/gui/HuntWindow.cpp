#include "gui/HuntWindow.h"

#include <QCheckBox>
#include <QCloseEvent>
#include <QComboBox>
#include <QFileDialog>
#include <QFormLayout>
#include <QGridLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QLabel>
#include <QLineEdit>
#include <QMessageBox>
#include <QProgressBar>
#include <QPushButton>
#include <QSettings>
#include <QSpinBox>
#include <QTableView>
#include <QThread>
#include <QTimer>
#include <QVBoxLayout>

#include <algorithm>

#include "gui/MatchTableModel.h"
#include "xorhunt/Report.h"

namespace {
constexpr const char kSettingsOrg[] = "XorHunt";
constexpr const char kSettingsApp[] = "xorhunt-gui";

enum ModeIndex { kModeSingle = 0, kModeRange = 1, kModeAll = 2 };
} // namespace

// Runs one scan off the UI thread.
class HuntJob {
public:
    HuntJob(xorhunt::XorScanner *scanner, const std::vector<uint8_t> &buffer, const xorhunt::ScanParams &params)
        : params_(params), scanner_(scanner), buffer_(buffer) {}

    void run() { success = scanner_->scan(buffer_, params_, report); }

    bool success{false};
    xorhunt::ScanReport report;
    xorhunt::ScanParams params_;

private:
    xorhunt::XorScanner *scanner_;
    const std::vector<uint8_t> &buffer_;
};

HuntWindow::HuntWindow(QWidget *parent) : QMainWindow(parent) {
    setupUi();
    loadSettings();
}

HuntWindow::~HuntWindow() {
    abandonScan();
}

// Stops a running scan and frees it without waiting for the finished handler,
// which never runs once the event loop has exited.
void HuntWindow::abandonScan() {
    if (!scanThread_) return;
    if (scanner_) scanner_->requestCancel();
    scanThread_->wait();
    scanThread_->disconnect(this);
    delete scanThread_;
    scanThread_ = nullptr;
    delete scanJob_;
    scanJob_ = nullptr;
    setScanning(false);
}

void HuntWindow::setupUi() {
    setWindowTitle("XorHunt");
    auto *central = new QWidget(this);
    auto *mainLayout = new QVBoxLayout(central);

    auto *inputBox = new QGroupBox("Firmware Image", central);
    auto *inputRow = new QHBoxLayout(inputBox);
    pathEdit_ = new QLineEdit(inputBox);
    pathEdit_->setObjectName("pathEdit");
    pathEdit_->setPlaceholderText("Path to firmware binary...");
    browseBtn_ = new QPushButton("Browse...", inputBox);
    inputRow->addWidget(pathEdit_);
    inputRow->addWidget(browseBtn_);
    mainLayout->addWidget(inputBox);

    auto *scanBox = new QGroupBox("Key Search", central);
    auto *scanGrid = new QGridLayout(scanBox);
    modeCombo_ = new QComboBox(scanBox);
    modeCombo_->setObjectName("modeCombo");
    modeCombo_->addItems({"Single key", "Key range", "Full key space"});
    keyEdit_ = new QLineEdit("0x00", scanBox);
    firstKeyEdit_ = new QLineEdit("0x00000000", scanBox);
    lastKeyEdit_ = new QLineEdit("0x0000FFFF", scanBox);
    widthCombo_ = new QComboBox(scanBox);
    widthCombo_->addItems({"1 byte", "2 bytes", "3 bytes", "4 bytes"});
    widthCombo_->setCurrentIndex(3);
    cipherCombo_ = new QComboBox(scanBox);
    cipherCombo_->setObjectName("cipherCombo");
    cipherCombo_->addItems({"XOR", "RC4"});
    phaseCombo_ = new QComboBox(scanBox);
    phaseCombo_->addItems({"Anchored at match", "Anchored at file start"});
    catalogCombo_ = new QComboBox(scanBox);
    catalogCombo_->addItems({"Filesystems", "Firmware"});
    bruteCheck_ = new QCheckBox("Try every key", scanBox);
    scanGrid->addWidget(new QLabel("Mode", scanBox), 0, 0);
    scanGrid->addWidget(modeCombo_, 0, 1);
    scanGrid->addWidget(new QLabel("Key", scanBox), 0, 2);
    scanGrid->addWidget(keyEdit_, 0, 3);
    scanGrid->addWidget(new QLabel("First key", scanBox), 1, 0);
    scanGrid->addWidget(firstKeyEdit_, 1, 1);
    scanGrid->addWidget(new QLabel("Last key", scanBox), 1, 2);
    scanGrid->addWidget(lastKeyEdit_, 1, 3);
    scanGrid->addWidget(new QLabel("Key width", scanBox), 2, 0);
    scanGrid->addWidget(widthCombo_, 2, 1);
    scanGrid->addWidget(new QLabel("Key phase", scanBox), 2, 2);
    scanGrid->addWidget(phaseCombo_, 2, 3);
    scanGrid->addWidget(new QLabel("Cipher", scanBox), 3, 0);
    scanGrid->addWidget(cipherCombo_, 3, 1);
    scanGrid->addWidget(new QLabel("Signatures", scanBox), 3, 2);
    scanGrid->addWidget(catalogCombo_, 3, 3);
    scanGrid->addWidget(bruteCheck_, 4, 0, 1, 2);
    mainLayout->addWidget(scanBox);

    auto *optBox = new QGroupBox("Options", central);
    auto *optForm = new QFormLayout(optBox);
    threadsSpin_ = new QSpinBox(optBox);
    threadsSpin_->setRange(1, 1024);
    threadsSpin_->setValue(static_cast<int>(xorhunt::defaultWorkerCount()));
    maxSizeSpin_ = new QSpinBox(optBox);
    maxSizeSpin_->setRange(1, 4 * 1024 * 1024);
    maxSizeSpin_->setSuffix(" KiB");
    maxSizeSpin_->setValue(static_cast<int>(xorhunt::kDefaultMaxBytes / 1024));
    rejectOversizeCheck_ = new QCheckBox("Reject files larger than the cap", optBox);
    limitSpin_ = new QSpinBox(optBox);
    limitSpin_->setRange(0, 100000000);
    limitSpin_->setValue(100000);
    limitSpin_->setSpecialValueText("No limit");
    optForm->addRow("Worker threads", threadsSpin_);
    optForm->addRow("Scan window", maxSizeSpin_);
    optForm->addRow(rejectOversizeCheck_);
    optForm->addRow("Match limit", limitSpin_);
    mainLayout->addWidget(optBox);

    auto *runRow = new QHBoxLayout;
    scanBtn_ = new QPushButton("Scan", central);
    scanBtn_->setObjectName("scanButton");
    stopBtn_ = new QPushButton("Stop", central);
    stopBtn_->setEnabled(false);
    scanProgress_ = new QProgressBar(central);
    scanProgress_->setRange(0, 100);
    scanProgress_->setVisible(false);
    runRow->addWidget(scanBtn_);
    runRow->addWidget(stopBtn_);
    runRow->addWidget(scanProgress_, 1);
    mainLayout->addLayout(runRow);

    resultsModel_ = new MatchTableModel(this);
    resultsTable_ = new QTableView(central);
    resultsTable_->setModel(resultsModel_);
    resultsTable_->setSelectionBehavior(QAbstractItemView::SelectRows);
    resultsTable_->horizontalHeader()->setStretchLastSection(true);
    resultsTable_->verticalHeader()->setVisible(false);
    mainLayout->addWidget(resultsTable_, 1);

    statusLabel_ = new QLabel("Ready", central);
    mainLayout->addWidget(statusLabel_);
    setCentralWidget(central);
    resize(760, 640);

    scanProgressTimer_ = new QTimer(this);
    scanProgressTimer_->setInterval(200);
    connect(scanProgressTimer_, &QTimer::timeout, this, [this]() {
        if (progressTotal_ == 0) return;
        uint64_t done = std::min(progressDone_.load(std::memory_order_relaxed), progressTotal_);
        scanProgress_->setValue(static_cast<int>((done * 100) / progressTotal_));
    });

    connect(browseBtn_, &QPushButton::clicked, this, &HuntWindow::onBrowse);
    connect(scanBtn_, &QPushButton::clicked, this, &HuntWindow::onScan);
    connect(stopBtn_, &QPushButton::clicked, this, &HuntWindow::onStop);
    connect(modeCombo_, QOverload<int>::of(&QComboBox::currentIndexChanged), this, &HuntWindow::onModeChanged);
    connect(cipherCombo_, QOverload<int>::of(&QComboBox::currentIndexChanged), this,
            &HuntWindow::onCipherChanged);
    onModeChanged(modeCombo_->currentIndex());
    onCipherChanged(cipherCombo_->currentIndex());
}

void HuntWindow::onModeChanged(int index) {
    keyEdit_->setEnabled(index == kModeSingle);
    firstKeyEdit_->setEnabled(index == kModeRange);
    lastKeyEdit_->setEnabled(index == kModeRange);
    bruteCheck_->setEnabled(index != kModeSingle && cipherCombo_->currentIndex() == 0);
}

void HuntWindow::onCipherChanged(int index) {
    // RC4 keys cannot be solved from the data and have no phase
    phaseCombo_->setEnabled(index == 0);
    bruteCheck_->setEnabled(index == 0 && modeCombo_->currentIndex() != kModeSingle);
}

void HuntWindow::onBrowse() {
    QString path = QFileDialog::getOpenFileName(this, "Open firmware image", pathEdit_->text());
    if (!path.isEmpty()) pathEdit_->setText(path);
}

bool HuntWindow::currentScanParams(xorhunt::ScanParams &params, QString &error) const {
    params.keyWidth = static_cast<unsigned>(widthCombo_->currentIndex() + 1);
    params.cipher = cipherCombo_->currentIndex() == 0 ? xorhunt::Cipher::Xor : xorhunt::Cipher::Rc4;
    params.phase = phaseCombo_->currentIndex() == 0 ? xorhunt::KeyPhase::Signature : xorhunt::KeyPhase::Buffer;
    params.strategy = bruteCheck_->isChecked() ? xorhunt::KeyStrategy::Enumerate : xorhunt::KeyStrategy::Derive;
    params.workers = static_cast<size_t>(threadsSpin_->value());
    params.matchLimit = static_cast<size_t>(limitSpin_->value());

    std::string keyText;
    switch (modeCombo_->currentIndex()) {
        case kModeSingle: keyText = keyEdit_->text().trimmed().toStdString(); break;
        case kModeRange:
            keyText = firstKeyEdit_->text().trimmed().toStdString() + "-" + lastKeyEdit_->text().trimmed().toStdString();
            break;
        default: keyText = "all"; break;
    }
    xorhunt::KeySpec spec;
    std::string err;
    if (!xorhunt::parseKeySpec(keyText, params.keyWidth, spec, err)) {
        error = QString::fromStdString(err);
        return false;
    }
    if (spec.exhaustive) {
        params.mode = xorhunt::ScanMode::Exhaustive;
        params.firstKey = spec.first;
        params.lastKey = spec.last;
    } else {
        params.mode = xorhunt::ScanMode::SingleKey;
        params.key = static_cast<uint32_t>(spec.first);
    }
    return true;
}

void HuntWindow::setScanning(bool scanning) {
    scanInProgress_ = scanning;
    scanBtn_->setEnabled(!scanning);
    stopBtn_->setEnabled(scanning);
    browseBtn_->setEnabled(!scanning);
    scanProgress_->setVisible(scanning);
    if (scanning) {
        scanProgress_->setValue(0);
        scanProgressTimer_->start();
    } else {
        scanProgressTimer_->stop();
    }
}

void HuntWindow::onScan() {
    if (scanInProgress_) return;
    xorhunt::ScanParams params;
    QString error;
    if (!currentScanParams(params, error)) {
        QMessageBox::warning(this, "Invalid key", error);
        return;
    }
    persistSettings();

    if (!xorhunt::SignatureCatalog::byName(catalogCombo_->currentIndex() == 0 ? "filesystems" : "firmware",
                                           catalog_)) {
        return;
    }

    xorhunt::LoadOptions load;
    load.maxBytes = static_cast<uint64_t>(maxSizeSpin_->value()) * 1024;
    load.policy = rejectOversizeCheck_->isChecked() ? xorhunt::OversizePolicy::Reject
                                                    : xorhunt::OversizePolicy::Truncate;
    if (!image_.load(pathEdit_->text().toStdString(), load)) {
        QMessageBox::warning(this, xorhunt::scanErrorName(image_.lastErrorCode()),
                             QString::fromStdString(image_.lastError()));
        setStatusDetail("Load failed");
        return;
    }

    scanner_ = std::make_unique<xorhunt::XorScanner>(catalog_);
    if (!scanner_->validate(image_.bytes().size(), params)) {
        QMessageBox::warning(this, xorhunt::scanErrorName(scanner_->lastErrorCode()),
                             QString::fromStdString(scanner_->lastError()));
        setStatusDetail("Invalid configuration");
        return;
    }

    resultsModel_->clear();
    progressTotal_ = scanner_->estimateWork(image_.bytes().size(), params);
    scanner_->setProgressSink(&progressDone_, progressTotal_);
    setScanning(true);
    setStatusDetail(QString::fromStdString("Scanning: " + xorhunt::describeScan(params)));

    scanner_->resetCancel();
    scanJob_ = new HuntJob(scanner_.get(), image_.bytes(), params);
    HuntJob *job = scanJob_;
    scanThread_ = QThread::create([job]() {
        job->run();
    });
    connect(scanThread_, &QThread::finished, this, [this]() {
        onScanFinished();
    });
    scanThread_->start();
}

void HuntWindow::onScanFinished() {
    if (!scanThread_) return;
    std::unique_ptr<HuntJob> job(scanJob_);
    scanJob_ = nullptr;
    scanThread_->deleteLater();
    scanThread_ = nullptr;
    setScanning(false);

    const auto &report = job->report;
    if (!job->success && scanner_->lastErrorCode() != xorhunt::ScanError::WorkerFailure) {
        QMessageBox::warning(this, "Scan failed", QString::fromStdString(scanner_->lastError()));
        setStatusDetail("Scan failed");
        return;
    }

    size_t count = report.matches.size();
    resultsModel_->setMatches(report.matches, job->params_.keyWidth);
    if (count > 0) resultsTable_->resizeColumnsToContents();

    QString detail = QString("%1 match%2").arg(static_cast<qulonglong>(count)).arg(count == 1 ? "" : "es");
    if (report.cancelled) detail += ", cancelled";
    if (report.limitReached) detail += ", match limit reached";
    if (image_.truncated()) {
        detail += QString(", scanned first %1 of %2 bytes")
                      .arg(static_cast<qulonglong>(image_.bytes().size()))
                      .arg(static_cast<qulonglong>(image_.fileSize()));
    }
    setStatusDetail(detail);

    if (!job->success) {
        QStringList failed;
        for (const auto &shard : report.shards) {
            if (!shard.completed) failed << QString::fromStdString(xorhunt::formatShard(shard, job->params_));
        }
        QMessageBox::warning(this, "Incomplete scan",
                             QString::fromStdString(scanner_->lastError()) + "\n\n" + failed.join('\n'));
    }
}

void HuntWindow::onStop() {
    if (!scanInProgress_ || !scanner_) return;
    scanner_->requestCancel();
    stopBtn_->setEnabled(false);
    setStatusDetail("Stopping...");
}

void HuntWindow::closeEvent(QCloseEvent *event) {
    abandonScan();
    persistSettings();
    QMainWindow::closeEvent(event);
}

void HuntWindow::setStatusDetail(const QString &text) {
    statusLabel_->setText(text);
}

void HuntWindow::persistSettings() const {
    QSettings settings(QString::fromLatin1(kSettingsOrg), QString::fromLatin1(kSettingsApp));
    settings.setValue("input/path", pathEdit_->text());
    settings.setValue("scan/mode", modeCombo_->currentIndex());
    settings.setValue("scan/key", keyEdit_->text());
    settings.setValue("scan/firstKey", firstKeyEdit_->text());
    settings.setValue("scan/lastKey", lastKeyEdit_->text());
    settings.setValue("scan/width", widthCombo_->currentIndex());
    settings.setValue("scan/cipher", cipherCombo_->currentIndex());
    settings.setValue("scan/phase", phaseCombo_->currentIndex());
    settings.setValue("scan/catalog", catalogCombo_->currentIndex());
    settings.setValue("scan/brute", bruteCheck_->isChecked());
    settings.setValue("options/threads", threadsSpin_->value());
    settings.setValue("options/maxSizeKiB", maxSizeSpin_->value());
    settings.setValue("options/rejectOversized", rejectOversizeCheck_->isChecked());
    settings.setValue("options/matchLimit", limitSpin_->value());
}

void HuntWindow::loadSettings() {
    QSettings settings(QString::fromLatin1(kSettingsOrg), QString::fromLatin1(kSettingsApp));
    auto applyCombo = [](QComboBox *combo, const QVariant &value) {
        if (!value.isValid() || combo->count() == 0) return;
        combo->setCurrentIndex(std::clamp(value.toInt(), 0, combo->count() - 1));
    };
    pathEdit_->setText(settings.value("input/path", pathEdit_->text()).toString());
    applyCombo(modeCombo_, settings.value("scan/mode"));
    keyEdit_->setText(settings.value("scan/key", keyEdit_->text()).toString());
    firstKeyEdit_->setText(settings.value("scan/firstKey", firstKeyEdit_->text()).toString());
    lastKeyEdit_->setText(settings.value("scan/lastKey", lastKeyEdit_->text()).toString());
    applyCombo(widthCombo_, settings.value("scan/width"));
    applyCombo(cipherCombo_, settings.value("scan/cipher"));
    applyCombo(phaseCombo_, settings.value("scan/phase"));
    applyCombo(catalogCombo_, settings.value("scan/catalog"));
    bruteCheck_->setChecked(settings.value("scan/brute", false).toBool());
    threadsSpin_->setValue(settings.value("options/threads", threadsSpin_->value()).toInt());
    maxSizeSpin_->setValue(settings.value("options/maxSizeKiB", maxSizeSpin_->value()).toInt());
    rejectOversizeCheck_->setChecked(settings.value("options/rejectOversized", false).toBool());
    limitSpin_->setValue(settings.value("options/matchLimit", limitSpin_->value()).toInt());
    onModeChanged(modeCombo_->currentIndex());
    onCipherChanged(cipherCombo_->currentIndex());
}
