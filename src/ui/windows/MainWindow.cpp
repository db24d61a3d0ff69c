#include "ui/windows/MainWindow.hpp"

#include <QApplication>
#include <QClipboard>
#include <QCloseEvent>
#include <QDateTime>
#include <QMenuBar>
#include <QMessageBox>
#include <QStatusBar>
#include <QVBoxLayout>
#include <chrono>
#include <spdlog/spdlog.h>

namespace linkrelay::ui {

MainWindow::MainWindow(viewmodels::DeepLinkViewModel& viewModel, infra::ConfigManager& config,
                       const QString& endpoint, QWidget* parent)
    : QMainWindow(parent), viewModel_(viewModel), config_(config), endpoint_(endpoint) {
    setWindowTitle(QApplication::applicationName());
    setMinimumSize(480, 300);

    setupUi();
    setupMenuBar();
    setupStatusBar();

    // Links delivered before the window existed
    for (const auto& event : viewModel_.links()) {
        addLinkItem(event);
    }

    connect(&viewModel_, &viewmodels::DeepLinkViewModel::linkReceived, this,
            &MainWindow::onLinkReceived);
    connect(&viewModel_, &viewmodels::DeepLinkViewModel::historyCleared, this, [this]() {
        linkList_->clear();
        updateStatusBar();
    });

    updateStatusBar();
}

MainWindow::~MainWindow() {
    saveWindowState();
}

void MainWindow::setupUi() {
    auto* centralWidget = new QWidget(this);
    setCentralWidget(centralWidget);

    auto* mainLayout = new QVBoxLayout(centralWidget);
    mainLayout->setContentsMargins(4, 4, 4, 4);

    linkList_ = new QListWidget(this);
    linkList_->setSelectionMode(QAbstractItemView::SingleSelection);
    linkList_->setAlternatingRowColors(true);
    mainLayout->addWidget(linkList_);

    connect(linkList_, &QListWidget::currentRowChanged, this,
            [this](int row) { copyAction_->setEnabled(row >= 0); });
}

void MainWindow::setupMenuBar() {
    auto* fileMenu = menuBar()->addMenu("&File");

    quitAction_ = fileMenu->addAction("&Quit", this, &QMainWindow::close);
    quitAction_->setShortcut(QKeySequence::Quit);

    auto* editMenu = menuBar()->addMenu("&Edit");

    copyAction_ = editMenu->addAction("&Copy Link", this, &MainWindow::onCopyLink);
    copyAction_->setShortcut(QKeySequence::Copy);
    copyAction_->setEnabled(false);

    clearAction_ = editMenu->addAction("C&lear History", this, &MainWindow::onClearHistory);

    auto* helpMenu = menuBar()->addMenu("&Help");
    helpMenu->addAction("&About", this, &MainWindow::onAbout);
}

void MainWindow::setupStatusBar() {
    statusLabel_ = new QLabel(QString("Listening on %1").arg(endpoint_), this);
    linkCountLabel_ = new QLabel("Links: 0", this);

    statusBar()->addWidget(statusLabel_, 1);
    statusBar()->addPermanentWidget(linkCountLabel_);
}

void MainWindow::onLinkReceived(const core::DeepLinkEvent& event) {
    addLinkItem(event);
    updateStatusBar();

    // A relayed link means the user tried to open the app again
    if (event.origin == core::LinkOrigin::Relay) {
        if (isMinimized()) {
            showNormal();
        }
        raise();
        activateWindow();
    }
}

void MainWindow::addLinkItem(const core::DeepLinkEvent& event) {
    auto msecs = std::chrono::duration_cast<std::chrono::milliseconds>(
                     event.receivedAt.time_since_epoch())
                     .count();
    auto time = QDateTime::fromMSecsSinceEpoch(msecs).toString("hh:mm:ss");

    auto* item = new QListWidgetItem(QString("%1  [%2]  %3")
                                         .arg(time)
                                         .arg(QString::fromStdString(event.originToString()))
                                         .arg(QString::fromStdString(event.url.text)));
    item->setData(Qt::UserRole, QString::fromStdString(event.url.text));
    item->setToolTip(QString::fromStdString(event.url.text));
    linkList_->addItem(item);
    linkList_->scrollToBottom();
}

void MainWindow::onCopyLink() {
    auto* item = linkList_->currentItem();
    if (!item) {
        return;
    }
    QApplication::clipboard()->setText(item->data(Qt::UserRole).toString());
    statusBar()->showMessage("Link copied", 2000);
}

void MainWindow::onClearHistory() {
    viewModel_.clear();
}

void MainWindow::onAbout() {
    QMessageBox::about(this, "About LinkRelay",
                       "<h2>LinkRelay</h2>"
                       "<p>Version 1.0.0</p>"
                       "<p>Receives deep links opened while the application is running.</p>");
}

void MainWindow::updateStatusBar() {
    linkCountLabel_->setText(QString("Links: %1").arg(linkList_->count()));
}

void MainWindow::closeEvent(QCloseEvent* event) {
    saveWindowState();
    event->accept();
}

void MainWindow::saveWindowState() {
    auto& config = config_.config();

    if (!isMaximized()) {
        auto geom = geometry();
        config.windowX = geom.x();
        config.windowY = geom.y();
        config.windowWidth = geom.width();
        config.windowHeight = geom.height();
    }
    config.windowMaximized = isMaximized();

    if (!config_.save()) {
        spdlog::warn("Window state was not saved");
    }
}

void MainWindow::restoreWindowState() {
    const auto& config = config_.config();

    if (config.windowMaximized) {
        showMaximized();
    } else {
        setGeometry(config.windowX, config.windowY, config.windowWidth, config.windowHeight);
        show();
    }
}

} // namespace linkrelay::ui
