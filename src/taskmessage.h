#ifndef TASKMESSAGE_H
#define TASKMESSAGE_H

#include <QByteArray>
#include <QJsonObject>
#include <QMetaType>
#include <QString>

/**
 * Envelope for everything the slicing task reports to the session controller
 *
 * The task and the controller share no memory: every result crosses the thread
 * boundary as one of these values through a queued signal. The sessionToken
 * identifies the session that spawned the task so the controller can drop
 * messages from superseded sessions.
 *
 * Wire form (version 1.1):
 *   { "version": "1.1", "type": "progress", "sessionToken": n, "percent": 0-100 }
 *   { "version": "1.1", "type": "chunk", "sessionToken": n, "index": i,
 *     "width": w, "height": h, "payload": "<base64>" }
 *   { "version": "1.1", "type": "done", "sessionToken": n }
 *   { "version": "1.1", "type": "error", "sessionToken": n, "message": "..." }
 */
struct TaskMessage {
    enum class Type {
        Progress,
        Chunk,
        Done,
        Error
    };

    Type type;
    quint64 sessionToken;
    int percent;
    int index;
    QByteArray payload;
    int width;
    int height;
    QString errorMessage;

    TaskMessage() :
        type(Type::Done),
        sessionToken(0),
        percent(0),
        index(-1),
        width(0),
        height(0)
    {}

    static TaskMessage progress(quint64 token, int percent);
    static TaskMessage chunk(quint64 token, int index, const QByteArray& payload, int width, int height);
    static TaskMessage done(quint64 token);
    static TaskMessage error(quint64 token, const QString& message);

    /**
     * Whether no further message follows this one
     */
    bool isTerminal() const { return type == Type::Done || type == Type::Error; }

    /**
     * Serialize to the versioned wire form
     * @param includePayload false replaces the payload by its size ("payloadBytes")
     * @return JSON object
     */
    QJsonObject toJson(bool includePayload = true) const;

    /**
     * Parse the versioned wire form
     * @param json JSON object
     * @param ok Set to false if the object is not a valid message
     * @return Parsed message
     */
    static TaskMessage fromJson(const QJsonObject& json, bool* ok = nullptr);

    static QString typeName(Type type);

    static const QString PROTOCOL_VERSION;
};

Q_DECLARE_METATYPE(TaskMessage)

#endif // TASKMESSAGE_H
