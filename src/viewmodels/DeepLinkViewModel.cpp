#include "viewmodels/DeepLinkViewModel.hpp"

#include <QMetaObject>
#include <spdlog/spdlog.h>

namespace linkrelay::viewmodels {

DeepLinkViewModel::DeepLinkViewModel(size_t maxHistory, QObject* parent)
    : QObject(parent), maxHistory_(maxHistory == 0 ? 1 : maxHistory) {}

void DeepLinkViewModel::deliver(const core::DeepLinkEvent& event) {
    {
        std::lock_guard lock(mutex_);
        history_.push_back(event);
        if (history_.size() > maxHistory_) {
            history_.erase(history_.begin(),
                           history_.begin() + static_cast<std::ptrdiff_t>(history_.size() - maxHistory_));
        }
    }

    QMetaObject::invokeMethod(this, [this, event]() { emit linkReceived(event); },
                              Qt::QueuedConnection);

    spdlog::debug("Deep link queued for display: {}", event.url.text);
}

std::vector<core::DeepLinkEvent> DeepLinkViewModel::links() const {
    std::lock_guard lock(mutex_);
    return history_;
}

size_t DeepLinkViewModel::linkCount() const {
    std::lock_guard lock(mutex_);
    return history_.size();
}

void DeepLinkViewModel::clear() {
    {
        std::lock_guard lock(mutex_);
        history_.clear();
    }
    emit historyCleared();
}

} // namespace linkrelay::viewmodels
