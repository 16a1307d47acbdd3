#include "network/connectivity_monitor.hpp"
#include "core/log_categories.hpp"
#include <QNetworkInformation>

namespace tally::network {

// ============================================================================
// NetworkInformationBackend
// ============================================================================

NetworkInformationBackend::~NetworkInformationBackend() {
    stop();
}

Result<void, Error> NetworkInformationBackend::start() {
    if (!QNetworkInformation::loadBackendByFeatures(
            QNetworkInformation::Feature::Reachability)) {
        return Result<void, Error>::err(
            Error{"No network information backend with reachability support"});
    }

    auto* info = QNetworkInformation::instance();
    if (!info) {
        return Result<void, Error>::err(Error{"Network information backend not loaded"});
    }

    reachability_connection_ = QObject::connect(
        info, &QNetworkInformation::reachabilityChanged,
        [this](QNetworkInformation::Reachability reachability) {
            if (on_reachability_changed) {
                on_reachability_changed(
                    reachability != QNetworkInformation::Reachability::Disconnected);
            }
        });
    return Result<void, Error>::ok();
}

void NetworkInformationBackend::stop() {
    if (reachability_connection_) {
        QObject::disconnect(reachability_connection_);
        reachability_connection_ = {};
    }
}

bool NetworkInformationBackend::is_online() const {
    auto* info = QNetworkInformation::instance();
    if (!info) {
        return true;
    }
    return info->reachability() != QNetworkInformation::Reachability::Disconnected;
}

// ============================================================================
// ManualConnectivityBackend
// ============================================================================

Result<void, Error> ManualConnectivityBackend::start() {
    started_ = true;
    return Result<void, Error>::ok();
}

void ManualConnectivityBackend::stop() {
    started_ = false;
}

void ManualConnectivityBackend::set_online(bool online) {
    if (online_ == online) return;
    online_ = online;
    if (started_ && on_reachability_changed) {
        on_reachability_changed(online_);
    }
}

// ============================================================================
// ConnectivityMonitor
// ============================================================================

ConnectivityMonitor::ConnectivityMonitor(std::unique_ptr<ConnectivityBackend> backend,
                                         std::chrono::milliseconds debounce,
                                         QObject* parent)
    : QObject(parent)
    , backend_(std::move(backend))
    , debounce_timer_(std::make_unique<QTimer>())
    , debounce_(debounce)
{
    debounce_timer_->setSingleShot(true);
    debounce_timer_->setInterval(debounce_);
    connect(debounce_timer_.get(), &QTimer::timeout, this, &ConnectivityMonitor::settle);

    if (backend_) {
        backend_->on_reachability_changed = [this](bool online) {
            handleRawChange(online);
        };
    }
}

ConnectivityMonitor::~ConnectivityMonitor() {
    stop();
}

bool ConnectivityMonitor::start() {
    if (started_) return backend_available_;
    started_ = true;

    if (!backend_) {
        qCWarning(tallyConnectivityLog) << "CONNECTIVITY: no backend, assuming online";
        backend_available_ = false;
        online_ = raw_online_ = true;
        return false;
    }

    auto result = backend_->start();
    if (result.is_err()) {
        qCWarning(tallyConnectivityLog) << "CONNECTIVITY: backend unavailable, assuming online:"
                                        << QString::fromStdString(result.unwrap_err().message);
        backend_available_ = false;
        online_ = raw_online_ = true;
        return false;
    }

    backend_available_ = true;
    online_ = raw_online_ = backend_->is_online();
    qCInfo(tallyConnectivityLog) << "CONNECTIVITY: start online=" << online_;
    return true;
}

void ConnectivityMonitor::stop() {
    if (!started_) return;
    started_ = false;
    debounce_timer_->stop();
    if (backend_ && backend_available_) {
        backend_->stop();
    }
}

void ConnectivityMonitor::handleRawChange(bool online) {
    qCDebug(tallyConnectivityLog) << "CONNECTIVITY: raw online=" << online;
    raw_online_ = online;

    if (raw_online_ == online_) {
        // Flapped back before the window closed.
        debounce_timer_->stop();
        return;
    }

    if (debounce_.count() <= 0) {
        settle();
        return;
    }
    debounce_timer_->start();
}

void ConnectivityMonitor::settle() {
    if (raw_online_ == online_) return;
    online_ = raw_online_;
    qCInfo(tallyConnectivityLog) << "CONNECTIVITY:" << (online_ ? "online" : "offline");
    emit connectivityChanged(online_);
}

std::unique_ptr<ConnectivityBackend> createConnectivityBackend() {
    return std::make_unique<NetworkInformationBackend>();
}

} // namespace tally::network
