#include "sync/payload_codec.hpp"
#include <QByteArray>
#include <QDateTime>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <QTimeZone>

namespace tally::sync {

namespace {

QString to_iso(Timestamp ts) {
    return QDateTime::fromMSecsSinceEpoch(ts.millis(), QTimeZone::UTC)
        .toString(Qt::ISODateWithMs);
}

Error malformed(const QString& what) {
    return Error::validation("Malformed expense payload: " + what.toStdString());
}

} // namespace

QJsonObject expense_to_json(const Expense& expense) {
    QJsonObject object;
    object.insert(QStringLiteral("id"), QString::fromStdString(expense.id.to_string()));
    object.insert(QStringLiteral("description"), QString::fromStdString(expense.description));
    object.insert(QStringLiteral("amount"), expense.amount);
    object.insert(QStringLiteral("category"), QString::fromStdString(expense.category));
    object.insert(QStringLiteral("type"), QString::fromStdString(expense.type));
    object.insert(QStringLiteral("date"), to_iso(expense.date));
    object.insert(QStringLiteral("note"), expense.note
        ? QJsonValue(QString::fromStdString(*expense.note))
        : QJsonValue(QJsonValue::Null));
    return object;
}

Result<Expense, Error> expense_from_json(const QJsonObject& object) {
    const auto id = Uuid::parse(object.value(QStringLiteral("id")).toString().toStdString());
    if (!id) {
        return Result<Expense, Error>::err(malformed(QStringLiteral("bad id")));
    }

    const auto amount = object.value(QStringLiteral("amount"));
    if (!amount.isDouble()) {
        return Result<Expense, Error>::err(malformed(QStringLiteral("amount is not a number")));
    }

    const auto date = QDateTime::fromString(object.value(QStringLiteral("date")).toString(),
                                            Qt::ISODateWithMs);
    if (!date.isValid()) {
        return Result<Expense, Error>::err(malformed(QStringLiteral("bad date")));
    }

    Expense expense{
        .id = *id,
        .description = object.value(QStringLiteral("description")).toString().toStdString(),
        .amount = amount.toDouble(),
        .category = object.value(QStringLiteral("category")).toString().toStdString(),
        .type = object.value(QStringLiteral("type")).toString().toStdString(),
        .date = Timestamp(date.toMSecsSinceEpoch()),
        .note = std::nullopt
    };

    const auto note = object.value(QStringLiteral("note"));
    if (note.isString()) {
        expense.note = note.toString().toStdString();
    }
    return Result<Expense, Error>::ok(std::move(expense));
}

std::string encode_expense(const Expense& expense) {
    return QJsonDocument(expense_to_json(expense)).toJson(QJsonDocument::Compact).toStdString();
}

Result<Expense, Error> decode_expense(std::string_view payload) {
    QJsonParseError parse_error{};
    const auto doc = QJsonDocument::fromJson(
        QByteArray(payload.data(), static_cast<qsizetype>(payload.size())), &parse_error);
    if (parse_error.error != QJsonParseError::NoError) {
        return Result<Expense, Error>::err(malformed(parse_error.errorString()));
    }
    if (!doc.isObject()) {
        return Result<Expense, Error>::err(malformed(QStringLiteral("not an object")));
    }
    return expense_from_json(doc.object());
}

WriteRequest make_expense_request(OperationType operation, const Expense& expense) {
    std::string payload;
    if (operation == OperationType::Delete) {
        QJsonObject object;
        object.insert(QStringLiteral("id"), QString::fromStdString(expense.id.to_string()));
        payload = QJsonDocument(object).toJson(QJsonDocument::Compact).toStdString();
    } else {
        payload = encode_expense(expense);
    }

    return WriteRequest{
        .operation = operation,
        .target_collection = EXPENSES_COLLECTION,
        .entity_id = expense.id,
        .payload = std::move(payload)
    };
}

} // namespace tally::sync
