#include "taskmessage.h"
#include <QJsonValue>

const QString TaskMessage::PROTOCOL_VERSION = "1.1";

TaskMessage TaskMessage::progress(quint64 token, int percent)
{
    TaskMessage message;
    message.type = Type::Progress;
    message.sessionToken = token;
    message.percent = qBound(0, percent, 100);
    return message;
}

TaskMessage TaskMessage::chunk(quint64 token, int index, const QByteArray& payload, int width, int height)
{
    TaskMessage message;
    message.type = Type::Chunk;
    message.sessionToken = token;
    message.index = index;
    message.payload = payload;
    message.width = width;
    message.height = height;
    return message;
}

TaskMessage TaskMessage::done(quint64 token)
{
    TaskMessage message;
    message.type = Type::Done;
    message.sessionToken = token;
    message.percent = 100;
    return message;
}

TaskMessage TaskMessage::error(quint64 token, const QString& errorMessage)
{
    TaskMessage message;
    message.type = Type::Error;
    message.sessionToken = token;
    message.errorMessage = errorMessage;
    return message;
}

QString TaskMessage::typeName(Type type)
{
    switch (type) {
        case Type::Progress:
            return "progress";
        case Type::Chunk:
            return "chunk";
        case Type::Done:
            return "done";
        case Type::Error:
            return "error";
        default:
            return "unknown";
    }
}

QJsonObject TaskMessage::toJson(bool includePayload) const
{
    QJsonObject json;
    json["version"] = PROTOCOL_VERSION;
    json["type"] = typeName(type);
    // Tokens stay far below 2^53, so a double holds them exactly
    json["sessionToken"] = static_cast<double>(sessionToken);

    switch (type) {
        case Type::Progress:
            json["percent"] = percent;
            break;
        case Type::Chunk:
            json["index"] = index;
            json["width"] = width;
            json["height"] = height;
            if (includePayload) {
                json["payload"] = QString::fromLatin1(payload.toBase64());
            } else {
                json["payloadBytes"] = payload.size();
            }
            break;
        case Type::Error:
            json["message"] = errorMessage;
            break;
        case Type::Done:
            break;
    }

    return json;
}

TaskMessage TaskMessage::fromJson(const QJsonObject& json, bool* ok)
{
    TaskMessage message;
    bool valid = json.value("version").toString() == PROTOCOL_VERSION;

    QString typeString = json.value("type").toString();
    message.sessionToken = static_cast<quint64>(json.value("sessionToken").toDouble());

    if (typeString == "progress") {
        message.type = Type::Progress;
        message.percent = json.value("percent").toInt(-1);
        valid = valid && message.percent >= 0 && message.percent <= 100;
    } else if (typeString == "chunk") {
        message.type = Type::Chunk;
        message.index = json.value("index").toInt(-1);
        message.width = json.value("width").toInt();
        message.height = json.value("height").toInt();
        message.payload = QByteArray::fromBase64(json.value("payload").toString().toLatin1());
        valid = valid && message.index >= 0 && message.width > 0 && message.height > 0;
    } else if (typeString == "done") {
        message.type = Type::Done;
        message.percent = 100;
    } else if (typeString == "error") {
        message.type = Type::Error;
        message.errorMessage = json.value("message").toString();
    } else {
        valid = false;
    }

    if (ok) {
        *ok = valid;
    }
    return message;
}
