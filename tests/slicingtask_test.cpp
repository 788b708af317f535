#include <gtest/gtest.h>
#include <QList>
#include <QObject>
#include "slicingtask.h"
#include "testutils.h"

using testutils::gradientImage;
using testutils::waitUntil;

namespace {

class SlicingTaskTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        qRegisterMetaType<TaskMessage>("TaskMessage");
    }

    QList<TaskMessage> runTask(SlicingTask& task)
    {
        QList<TaskMessage> messages;
        QObject receiver;
        QObject::connect(&task, &SlicingTask::messagePosted, &receiver,
                         [&messages](const TaskMessage& message) { messages.append(message); },
                         Qt::QueuedConnection);

        task.start();
        EXPECT_TRUE(task.wait(10000));
        // Deliver everything the task queued before it finished
        QCoreApplication::processEvents();
        QCoreApplication::processEvents();
        return messages;
    }

    static QList<TaskMessage> ofType(const QList<TaskMessage>& messages, TaskMessage::Type type)
    {
        QList<TaskMessage> matching;
        for (const TaskMessage& message : messages) {
            if (message.type == type) {
                matching.append(message);
            }
        }
        return matching;
    }
};

} // namespace

TEST(SlicingTaskBandsTest, CountAndHeights)
{
    std::vector<cv::Rect> bands = SlicingTask::sliceBands(640, 2500, 1000);
    ASSERT_EQ(bands.size(), 3u);
    EXPECT_EQ(bands[0], cv::Rect(0, 0, 640, 1000));
    EXPECT_EQ(bands[1], cv::Rect(0, 1000, 640, 1000));
    EXPECT_EQ(bands[2], cv::Rect(0, 2000, 640, 500));
}

TEST(SlicingTaskBandsTest, MatchesCeilDivisionForAnyHeight)
{
    for (int sliceHeight : {100, 137, 999, 1000, 1200, 5000}) {
        for (int imageHeight : {1, 99, 100, 101, 2500, 7777}) {
            std::vector<cv::Rect> bands = SlicingTask::sliceBands(10, imageHeight, sliceHeight);
            size_t expected = static_cast<size_t>((imageHeight + sliceHeight - 1) / sliceHeight);
            ASSERT_EQ(bands.size(), expected) << imageHeight << "/" << sliceHeight;

            for (size_t i = 0; i + 1 < bands.size(); ++i) {
                EXPECT_EQ(bands[i].height, sliceHeight);
            }
            EXPECT_EQ(bands.back().height, imageHeight - sliceHeight * static_cast<int>(expected - 1));
        }
    }
}

TEST(SlicingTaskBandsTest, EmptyImageHasNoBands)
{
    EXPECT_TRUE(SlicingTask::sliceBands(0, 100, 100).empty());
    EXPECT_TRUE(SlicingTask::sliceBands(100, 0, 100).empty());
}

TEST(SlicingTaskBandsTest, ProgressSchedule)
{
    EXPECT_EQ(SlicingTask::progressAfterSlice(0, 3), 48);
    EXPECT_EQ(SlicingTask::progressAfterSlice(1, 3), 72);
    EXPECT_EQ(SlicingTask::progressAfterSlice(2, 3), 95);
    EXPECT_EQ(SlicingTask::progressAfterSlice(0, 1), 95);
}

TEST(SlicingTaskBandsTest, SliceHeightLimits)
{
    EXPECT_FALSE(SlicingTask::isValidSliceHeight(99));
    EXPECT_TRUE(SlicingTask::isValidSliceHeight(100));
    EXPECT_TRUE(SlicingTask::isValidSliceHeight(5000));
    EXPECT_FALSE(SlicingTask::isValidSliceHeight(5001));
}

TEST_F(SlicingTaskTest, PostsOrderedChunksThenDone)
{
    SlicingTask task(7, SourceImage::fromMat(gradientImage(320, 2500)), 1000,
                     std::make_unique<OpenCvSliceEncoder>("png"));
    QList<TaskMessage> messages = runTask(task);

    ASSERT_GE(messages.size(), 3);
    EXPECT_EQ(messages.first().type, TaskMessage::Type::Progress);
    EXPECT_EQ(messages.first().percent, 0);
    EXPECT_EQ(messages.last().type, TaskMessage::Type::Done);
    EXPECT_EQ(messages[messages.size() - 2].type, TaskMessage::Type::Progress);
    EXPECT_EQ(messages[messages.size() - 2].percent, 100);

    int lastPercent = -1;
    for (const TaskMessage& message : messages) {
        EXPECT_EQ(message.sessionToken, 7u);
        if (message.type == TaskMessage::Type::Progress) {
            EXPECT_GE(message.percent, lastPercent);
            lastPercent = message.percent;
        }
    }

    QList<TaskMessage> chunks = ofType(messages, TaskMessage::Type::Chunk);
    ASSERT_EQ(chunks.size(), 3);
    const int heights[] = {1000, 1000, 500};
    for (int i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].index, i);
        EXPECT_EQ(chunks[i].width, 320);
        EXPECT_EQ(chunks[i].height, heights[i]);

        std::vector<uchar> bytes(chunks[i].payload.begin(), chunks[i].payload.end());
        cv::Mat decoded = cv::imdecode(bytes, cv::IMREAD_COLOR);
        ASSERT_FALSE(decoded.empty());
        EXPECT_EQ(decoded.cols, 320);
        EXPECT_EQ(decoded.rows, heights[i]);
    }

    EXPECT_TRUE(ofType(messages, TaskMessage::Type::Error).isEmpty());
}

TEST_F(SlicingTaskTest, DefaultEncoderProducesJpeg)
{
    SlicingTask task(1, SourceImage::fromMat(gradientImage(64, 150)), 100, nullptr);
    QList<TaskMessage> chunks = ofType(runTask(task), TaskMessage::Type::Chunk);

    ASSERT_EQ(chunks.size(), 2);
    ASSERT_GE(chunks[0].payload.size(), 3);
    EXPECT_EQ(static_cast<uchar>(chunks[0].payload[0]), 0xFF);
    EXPECT_EQ(static_cast<uchar>(chunks[0].payload[1]), 0xD8);
}

TEST_F(SlicingTaskTest, DecodesEncodedSource)
{
    QByteArray png = testutils::encodePng(gradientImage(50, 250));
    SlicingTask task(2, SourceImage::fromEncoded(png, "long.png"), 100,
                     std::make_unique<OpenCvSliceEncoder>("png"));
    QList<TaskMessage> messages = runTask(task);

    EXPECT_EQ(ofType(messages, TaskMessage::Type::Chunk).size(), 3);
    EXPECT_EQ(messages.last().type, TaskMessage::Type::Done);
}

TEST_F(SlicingTaskTest, TransparentSourceEncodesAsJpeg)
{
    cv::Mat bgra(300, 40, CV_8UC4, cv::Scalar(10, 20, 30, 128));
    SlicingTask task(3, SourceImage::fromMat(bgra), 100, std::make_unique<OpenCvSliceEncoder>("jpg"));
    QList<TaskMessage> messages = runTask(task);

    EXPECT_EQ(ofType(messages, TaskMessage::Type::Chunk).size(), 3);
    EXPECT_EQ(messages.last().type, TaskMessage::Type::Done);
}

TEST_F(SlicingTaskTest, UndecodableSourceEndsWithError)
{
    SlicingTask task(4, SourceImage::fromEncoded("definitely not an image", "broken.png"), 1000, nullptr);
    QList<TaskMessage> messages = runTask(task);

    ASSERT_FALSE(messages.isEmpty());
    EXPECT_EQ(messages.last().type, TaskMessage::Type::Error);
    EXPECT_TRUE(messages.last().errorMessage.contains("broken.png"));
    EXPECT_TRUE(ofType(messages, TaskMessage::Type::Chunk).isEmpty());
    EXPECT_TRUE(ofType(messages, TaskMessage::Type::Done).isEmpty());
}

TEST_F(SlicingTaskTest, InvalidSliceHeightEndsWithError)
{
    SlicingTask task(5, SourceImage::fromMat(gradientImage(10, 500)), 50, nullptr);
    QList<TaskMessage> messages = runTask(task);

    ASSERT_FALSE(messages.isEmpty());
    EXPECT_EQ(messages.last().type, TaskMessage::Type::Error);
    EXPECT_TRUE(ofType(messages, TaskMessage::Type::Chunk).isEmpty());
}

TEST_F(SlicingTaskTest, EncodeFailureIsFatalAndKeepsEarlierChunks)
{
    SlicingTask task(6, SourceImage::fromMat(gradientImage(30, 350)), 100,
                     std::make_unique<testutils::FailingEncoder>(1));
    QList<TaskMessage> messages = runTask(task);

    QList<TaskMessage> chunks = ofType(messages, TaskMessage::Type::Chunk);
    ASSERT_EQ(chunks.size(), 1);
    EXPECT_EQ(chunks[0].index, 0);

    EXPECT_EQ(messages.last().type, TaskMessage::Type::Error);
    EXPECT_TRUE(messages.last().errorMessage.contains("slice 2 of 4"));
    EXPECT_TRUE(ofType(messages, TaskMessage::Type::Done).isEmpty());
}

TEST_F(SlicingTaskTest, StopRequestEndsSilently)
{
    SlicingTask task(8, SourceImage::fromMat(gradientImage(30, 1000)), 100,
                     std::make_unique<OpenCvSliceEncoder>("png"));
    task.requestStop();
    EXPECT_TRUE(task.isStopRequested());

    QList<TaskMessage> messages = runTask(task);

    for (const TaskMessage& message : messages) {
        EXPECT_FALSE(message.isTerminal());
    }
    EXPECT_TRUE(ofType(messages, TaskMessage::Type::Chunk).isEmpty());
}
