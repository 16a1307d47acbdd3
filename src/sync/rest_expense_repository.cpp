#include "sync/rest_expense_repository.hpp"
#include "sync/payload_codec.hpp"
#include "core/log_categories.hpp"
#include <QJsonDocument>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrlQuery>

namespace tally::sync {

Result<void, Error> classify_reply(QNetworkReply::NetworkError error,
                                   int http_status,
                                   const QString& error_string,
                                   const QByteArray& body) {
    if (http_status >= 200 && http_status < 300) {
        return Result<void, Error>::ok();
    }

    if (http_status == 0) {
        if (error == QNetworkReply::NoError) {
            return Result<void, Error>::ok();
        }
        return Result<void, Error>::err(Error::transient(
            "Network error: " + error_string.toStdString(), static_cast<int>(error)));
    }

    std::string message = "HTTP " + std::to_string(http_status);
    if (!body.isEmpty()) {
        message += ": " + body.left(512).toStdString();
    } else if (!error_string.isEmpty()) {
        message += ": " + error_string.toStdString();
    }

    if (http_status == 408 || http_status == 429 || http_status >= 500) {
        return Result<void, Error>::err(Error::transient(std::move(message), http_status));
    }
    return Result<void, Error>::err(Error::validation(std::move(message), http_status));
}

RestExpenseRepository::RestExpenseRepository(RestConfig config, QObject* parent)
    : QObject(parent)
    , config_(std::move(config))
    , network_(std::make_unique<QNetworkAccessManager>())
{
    while (config_.endpoint.endsWith(QLatin1Char('/'))) {
        config_.endpoint.chop(1);
    }
}

RestExpenseRepository::~RestExpenseRepository() = default;

QUrl RestExpenseRepository::collectionUrl() const {
    return QUrl(config_.endpoint + QStringLiteral("/rest/v1/") +
                QString::fromLatin1(EXPENSES_COLLECTION));
}

QUrl RestExpenseRepository::rowUrl(const Uuid& id) const {
    QUrl url = collectionUrl();
    QUrlQuery query;
    query.addQueryItem(QStringLiteral("id"),
                       QStringLiteral("eq.") + QString::fromStdString(id.to_string()));
    url.setQuery(query);
    return url;
}

QNetworkRequest RestExpenseRepository::makeRequest(const QUrl& url) const {
    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    request.setRawHeader("apikey", config_.api_key.toUtf8());
    const auto& bearer = config_.access_token.isEmpty() ? config_.api_key : config_.access_token;
    request.setRawHeader("Authorization", "Bearer " + bearer.toUtf8());
    request.setTransferTimeout(static_cast<int>(config_.timeout.count()));
    return request;
}

bool RestExpenseRepository::hasEndpoint(Completion& done) {
    if (!config_.endpoint.isEmpty()) return true;
    QTimer::singleShot(0, this, [done = std::move(done)]() {
        done(Result<void, Error>::err(Error::transient("No remote endpoint configured")));
    });
    return false;
}

void RestExpenseRepository::track(QNetworkReply* reply, const char* verb, Completion done) {
    connect(reply, &QNetworkReply::finished, this, [reply, verb, done = std::move(done)]() {
        const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        auto result = classify_reply(reply->error(), status, reply->errorString(),
                                     reply->readAll());
        if (result.is_err()) {
            qCWarning(tallyRemoteLog) << "REMOTE:" << verb << reply->url().toString()
                                      << "failed:"
                                      << QString::fromStdString(result.unwrap_err().message);
        } else {
            qCDebug(tallyRemoteLog) << "REMOTE:" << verb << reply->url().toString()
                                    << "status=" << status;
        }
        reply->deleteLater();
        done(std::move(result));
    });
}

void RestExpenseRepository::create(const Expense& expense, Completion done) {
    if (!hasEndpoint(done)) return;

    auto request = makeRequest(collectionUrl());
    request.setRawHeader("Prefer", "return=minimal,resolution=ignore-duplicates");
    const auto body = QJsonDocument(expense_to_json(expense)).toJson(QJsonDocument::Compact);
    track(network_->post(request, body), "POST", std::move(done));
}

void RestExpenseRepository::update(const Expense& expense, Completion done) {
    if (!hasEndpoint(done)) return;

    auto request = makeRequest(rowUrl(expense.id));
    request.setRawHeader("Prefer", "return=minimal");
    auto object = expense_to_json(expense);
    object.remove(QStringLiteral("id"));
    const auto body = QJsonDocument(object).toJson(QJsonDocument::Compact);
    track(network_->sendCustomRequest(request, "PATCH", body), "PATCH", std::move(done));
}

void RestExpenseRepository::remove(const Uuid& id, Completion done) {
    if (!hasEndpoint(done)) return;

    track(network_->deleteResource(makeRequest(rowUrl(id))), "DELETE", std::move(done));
}

} // namespace tally::sync
