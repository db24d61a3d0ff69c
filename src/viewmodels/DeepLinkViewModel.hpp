/**
 * @file DeepLinkViewModel.hpp
 * @brief ViewModel collecting the deep links received by the application.
 */

#pragma once

#include "core/services/IEventSink.hpp"
#include "core/types/DeepLinkEvent.hpp"

#include <QObject>
#include <cstddef>
#include <mutex>
#include <vector>

namespace linkrelay::viewmodels {

/**
 * @brief Event sink that keeps a history of deep links for the UI.
 *
 * deliver() runs on an I/O worker thread. The history is updated under a
 * mutex and linkReceived is emitted on the thread owning this object.
 *
 * @note Owned by a std::shared_ptr so the dispatcher can hold it weakly.
 */
class DeepLinkViewModel : public QObject, public core::IEventSink {
    Q_OBJECT

public:
    /**
     * @brief Constructs a DeepLinkViewModel.
     * @param maxHistory Number of links kept; older entries are discarded.
     * @param parent Optional parent QObject.
     */
    explicit DeepLinkViewModel(size_t maxHistory = 500, QObject* parent = nullptr);

    void deliver(const core::DeepLinkEvent& event) override;

    /**
     * @brief Gets the received links, oldest first.
     */
    std::vector<core::DeepLinkEvent> links() const;

    size_t linkCount() const;

    void clear();

signals:
    /**
     * @brief Emitted on the owning thread for every delivered link.
     * @param event The received link.
     */
    void linkReceived(const core::DeepLinkEvent& event);

    void historyCleared();

private:
    size_t maxHistory_;
    std::vector<core::DeepLinkEvent> history_;
    mutable std::mutex mutex_;
};

} // namespace linkrelay::viewmodels
