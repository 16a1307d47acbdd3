#pragma once

#include "core/result.hpp"
#include <QObject>
#include <QMetaObject>
#include <QTimer>
#include <chrono>
#include <functional>
#include <memory>

namespace tally::network {

/**
 * ConnectivityBackend - Source of raw reachability events.
 *
 * Raw events are not debounced; ConnectivityMonitor does that.
 */
class ConnectivityBackend {
public:
    virtual ~ConnectivityBackend() = default;

    virtual Result<void, Error> start() = 0;
    virtual void stop() = 0;

    [[nodiscard]] virtual bool is_online() const = 0;

    // Callbacks
    std::function<void(bool)> on_reachability_changed;
};

/**
 * NetworkInformationBackend - Platform reachability through
 * QNetworkInformation. Anything but "disconnected" counts as online.
 */
class NetworkInformationBackend : public ConnectivityBackend {
public:
    ~NetworkInformationBackend() override;

    Result<void, Error> start() override;
    void stop() override;
    [[nodiscard]] bool is_online() const override;

private:
    QMetaObject::Connection reachability_connection_;
};

/**
 * ManualConnectivityBackend - Reachability set by the caller.
 *
 * Used by `tally --offline` and by tests to script transitions.
 */
class ManualConnectivityBackend : public ConnectivityBackend {
public:
    explicit ManualConnectivityBackend(bool online = true) : online_(online) {}

    Result<void, Error> start() override;
    void stop() override;
    [[nodiscard]] bool is_online() const override { return online_; }

    /**
     * Report a raw transition. Repeating the current state is a no-op.
     */
    void set_online(bool online);

private:
    bool online_;
    bool started_ = false;
};

/**
 * ConnectivityMonitor - Debounced online/offline status.
 *
 * A raw transition surfaces only after it has been stable for the
 * debounce interval; a flap back to the surfaced state inside the
 * window emits nothing. If the backend cannot start, the monitor
 * assumes online so that writes still try the remote.
 */
class ConnectivityMonitor : public QObject {
    Q_OBJECT

    Q_PROPERTY(bool online READ isOnline NOTIFY connectivityChanged)

public:
    static constexpr std::chrono::milliseconds DEFAULT_DEBOUNCE{750};

    explicit ConnectivityMonitor(std::unique_ptr<ConnectivityBackend> backend,
                                 std::chrono::milliseconds debounce = DEFAULT_DEBOUNCE,
                                 QObject* parent = nullptr);
    ~ConnectivityMonitor() override;

    /**
     * Start listening. Returns false if the backend was unavailable
     * (the monitor then reports online).
     */
    bool start();
    void stop();

    [[nodiscard]] bool isOnline() const { return online_; }
    [[nodiscard]] bool isBackendAvailable() const { return backend_available_; }
    [[nodiscard]] std::chrono::milliseconds debounceInterval() const { return debounce_; }

signals:
    void connectivityChanged(bool online);

private:
    std::unique_ptr<ConnectivityBackend> backend_;
    std::unique_ptr<QTimer> debounce_timer_;
    std::chrono::milliseconds debounce_;

    bool online_ = true;
    bool raw_online_ = true;
    bool started_ = false;
    bool backend_available_ = false;

    void handleRawChange(bool online);
    void settle();
};

/**
 * Create the platform reachability backend.
 */
std::unique_ptr<ConnectivityBackend> createConnectivityBackend();

} // namespace tally::network
