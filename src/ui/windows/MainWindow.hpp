#pragma once

#include "core/types/DeepLinkEvent.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "viewmodels/DeepLinkViewModel.hpp"

#include <QAction>
#include <QLabel>
#include <QListWidget>
#include <QMainWindow>

namespace linkrelay::ui {

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    MainWindow(viewmodels::DeepLinkViewModel& viewModel, infra::ConfigManager& config,
               const QString& endpoint, QWidget* parent = nullptr);
    ~MainWindow() override;

    void restoreWindowState();

protected:
    void closeEvent(QCloseEvent* event) override;

private slots:
    void onLinkReceived(const core::DeepLinkEvent& event);
    void onCopyLink();
    void onClearHistory();
    void onAbout();

private:
    void setupUi();
    void setupMenuBar();
    void setupStatusBar();
    void addLinkItem(const core::DeepLinkEvent& event);
    void updateStatusBar();
    void saveWindowState();

    viewmodels::DeepLinkViewModel& viewModel_;
    infra::ConfigManager& config_;
    QString endpoint_;

    QListWidget* linkList_{nullptr};
    QLabel* statusLabel_{nullptr};
    QLabel* linkCountLabel_{nullptr};

    QAction* copyAction_{nullptr};
    QAction* clearAction_{nullptr};
    QAction* quitAction_{nullptr};
};

} // namespace linkrelay::ui
