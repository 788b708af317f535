#include <gtest/gtest.h>
#include <QJsonDocument>
#include "taskmessage.h"

TEST(TaskMessageTest, ProgressIsClamped)
{
    EXPECT_EQ(TaskMessage::progress(1, 150).percent, 100);
    EXPECT_EQ(TaskMessage::progress(1, -5).percent, 0);
    EXPECT_FALSE(TaskMessage::progress(1, 50).isTerminal());
}

TEST(TaskMessageTest, DoneAndErrorAreTerminal)
{
    EXPECT_TRUE(TaskMessage::done(1).isTerminal());
    EXPECT_TRUE(TaskMessage::error(1, "boom").isTerminal());
    EXPECT_FALSE(TaskMessage::chunk(1, 0, "x", 1, 1).isTerminal());
}

TEST(TaskMessageTest, ChunkWireForm)
{
    TaskMessage chunk = TaskMessage::chunk(42, 3, QByteArray("\x89PNG", 4), 800, 1200);
    QJsonObject json = chunk.toJson();

    EXPECT_EQ(json.value("version").toString(), "1.1");
    EXPECT_EQ(json.value("type").toString(), "chunk");
    EXPECT_EQ(json.value("sessionToken").toDouble(), 42.0);
    EXPECT_EQ(json.value("index").toInt(), 3);
    EXPECT_EQ(json.value("width").toInt(), 800);
    EXPECT_EQ(json.value("height").toInt(), 1200);
    EXPECT_EQ(json.value("payload").toString(), QString("iVBORw=="));

    bool ok = false;
    TaskMessage parsed = TaskMessage::fromJson(json, &ok);
    ASSERT_TRUE(ok);
    EXPECT_EQ(parsed.type, TaskMessage::Type::Chunk);
    EXPECT_EQ(parsed.sessionToken, 42u);
    EXPECT_EQ(parsed.index, 3);
    EXPECT_EQ(parsed.payload, chunk.payload);
}

TEST(TaskMessageTest, WireFormWithoutPayloadReportsSize)
{
    QJsonObject json = TaskMessage::chunk(1, 0, QByteArray(1234, 'a'), 10, 10).toJson(false);

    EXPECT_FALSE(json.contains("payload"));
    EXPECT_EQ(json.value("payloadBytes").toInt(), 1234);
}

TEST(TaskMessageTest, ParsesEveryMessageType)
{
    const char* documents[] = {
        R"({"version":"1.1","type":"progress","sessionToken":5,"percent":48})",
        R"({"version":"1.1","type":"done","sessionToken":5})",
        R"({"version":"1.1","type":"error","sessionToken":5,"message":"Failed to decode image"})",
    };

    bool ok = false;
    TaskMessage progress = TaskMessage::fromJson(QJsonDocument::fromJson(documents[0]).object(), &ok);
    EXPECT_TRUE(ok);
    EXPECT_EQ(progress.type, TaskMessage::Type::Progress);
    EXPECT_EQ(progress.percent, 48);

    TaskMessage done = TaskMessage::fromJson(QJsonDocument::fromJson(documents[1]).object(), &ok);
    EXPECT_TRUE(ok);
    EXPECT_EQ(done.type, TaskMessage::Type::Done);

    TaskMessage error = TaskMessage::fromJson(QJsonDocument::fromJson(documents[2]).object(), &ok);
    EXPECT_TRUE(ok);
    EXPECT_EQ(error.type, TaskMessage::Type::Error);
    EXPECT_EQ(error.errorMessage, "Failed to decode image");
    EXPECT_EQ(error.sessionToken, 5u);
}

TEST(TaskMessageTest, RejectsMalformedMessages)
{
    bool ok = true;
    TaskMessage::fromJson(QJsonDocument::fromJson(
        R"({"version":"1.0","type":"done","sessionToken":5})").object(), &ok);
    EXPECT_FALSE(ok);

    ok = true;
    TaskMessage::fromJson(QJsonDocument::fromJson(
        R"({"version":"1.1","type":"resize","sessionToken":5})").object(), &ok);
    EXPECT_FALSE(ok);

    ok = true;
    TaskMessage::fromJson(QJsonDocument::fromJson(
        R"({"version":"1.1","type":"progress","sessionToken":5,"percent":140})").object(), &ok);
    EXPECT_FALSE(ok);

    ok = true;
    TaskMessage::fromJson(QJsonDocument::fromJson(
        R"({"version":"1.1","type":"chunk","sessionToken":5,"width":10,"height":10})").object(), &ok);
    EXPECT_FALSE(ok);
}
