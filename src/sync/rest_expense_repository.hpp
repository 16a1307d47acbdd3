#pragma once

#include "sync/remote_repository.hpp"
#include <QByteArray>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QObject>
#include <QString>
#include <QUrl>
#include <chrono>
#include <memory>

namespace tally::sync {

struct RestConfig {
    QString endpoint;       // e.g. https://project.supabase.co
    QString api_key;
    QString access_token;   // Falls back to api_key when empty
    std::chrono::milliseconds timeout{15000};
};

/**
 * Map a finished HTTP exchange to a write result.
 *
 * - 2xx: ok
 * - 408, 429, 5xx, or no HTTP status with a network error: Transient
 * - any other 4xx: Validation
 */
[[nodiscard]] Result<void, Error> classify_reply(QNetworkReply::NetworkError error,
                                                 int http_status,
                                                 const QString& error_string,
                                                 const QByteArray& body);

/**
 * RestExpenseRepository - PostgREST style expense table over HTTPS.
 *
 * POST   {endpoint}/rest/v1/expenses
 * PATCH  {endpoint}/rest/v1/expenses?id=eq.<id>
 * DELETE {endpoint}/rest/v1/expenses?id=eq.<id>
 *
 * Inserts ask the server to ignore duplicate ids, so replaying a create
 * that already landed is harmless.
 */
class RestExpenseRepository : public QObject, public RemoteRepository {
    Q_OBJECT

public:
    explicit RestExpenseRepository(RestConfig config, QObject* parent = nullptr);
    ~RestExpenseRepository() override;

    void create(const Expense& expense, Completion done) override;
    void update(const Expense& expense, Completion done) override;
    void remove(const Uuid& id, Completion done) override;

    [[nodiscard]] QUrl collectionUrl() const;
    [[nodiscard]] QUrl rowUrl(const Uuid& id) const;

private:
    RestConfig config_;
    std::unique_ptr<QNetworkAccessManager> network_;

    [[nodiscard]] QNetworkRequest makeRequest(const QUrl& url) const;
    // Completes `done` with a transient error when no endpoint is set.
    bool hasEndpoint(Completion& done);
    void track(QNetworkReply* reply, const char* verb, Completion done);
};

} // namespace tally::sync
