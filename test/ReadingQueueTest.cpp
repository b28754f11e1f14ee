#include <gtest/gtest.h>
#include <cstring>
#include <string>
#include "ReadingQueue.hpp"
#include "RollingWindow.hpp"

static Reading readingOf(double grams)
{
    Reading reading;
    reading.grams = grams;
    return reading;
}

TEST(ReadingQueueTest, DeliversInOrder)
{
    ReadingQueue queue(4);
    ASSERT_TRUE(queue.isValid());
    queue.onReading(readingOf(1.0));
    queue.onError(SCREZ_TIMEOUT, "SCREZ_TIMEOUT");
    queue.onReading(readingOf(2.0));
    EXPECT_EQ(3U, queue.pending());

    ReaderEvent event;
    ASSERT_TRUE(queue.receive(event));
    EXPECT_EQ(ReaderEventType::READING, event.type);
    EXPECT_DOUBLE_EQ(1.0, event.reading.grams);
    ASSERT_TRUE(queue.receive(event));
    EXPECT_EQ(ReaderEventType::ERROR, event.type);
    EXPECT_EQ(SCREZ_TIMEOUT, event.error);
    EXPECT_STREQ("SCREZ_TIMEOUT", event.message);
    ASSERT_TRUE(queue.receive(event));
    EXPECT_DOUBLE_EQ(2.0, event.reading.grams);
    EXPECT_FALSE(queue.receive(event));
}

TEST(ReadingQueueTest, FullQueueDropsOldest)
{
    ReadingQueue queue(2);
    queue.onReading(readingOf(1.0));
    queue.onReading(readingOf(2.0));
    queue.onReading(readingOf(3.0));
    EXPECT_EQ(1U, queue.getDroppedCount());

    ReaderEvent event;
    ASSERT_TRUE(queue.receive(event));
    EXPECT_DOUBLE_EQ(2.0, event.reading.grams);
    ASSERT_TRUE(queue.receive(event));
    EXPECT_DOUBLE_EQ(3.0, event.reading.grams);
}

TEST(ReadingQueueTest, LongMessagesAreTruncated)
{
    ReadingQueue queue;
    std::string longMessage(200, 'x');
    queue.onError(SCREZ_HARDWARE_UNAVAILABLE, longMessage.c_str());

    ReaderEvent event;
    ASSERT_TRUE(queue.receive(event));
    EXPECT_EQ((size_t)READER_EVENT_MESSAGE_LEN - 1, strlen(event.message));
    queue.clear();
    EXPECT_EQ(0U, queue.pending());
}

TEST(RollingWindowTest, MeanOfLastEntries)
{
    RollingWindow window(3);
    window.push(10.0);
    window.push(20.0);
    window.push(30.0);
    EXPECT_DOUBLE_EQ(20.0, window.mean());

    window.push(40.0);
    EXPECT_DOUBLE_EQ(30.0, window.mean());
    EXPECT_EQ(3U, window.size());
}

TEST(RollingWindowTest, PartialWindowAveragesWhatItHas)
{
    RollingWindow window(5);
    EXPECT_DOUBLE_EQ(0.0, window.mean());
    window.push(4.0);
    EXPECT_DOUBLE_EQ(4.0, window.mean());
    window.push(8.0);
    EXPECT_DOUBLE_EQ(6.0, window.mean());

    window.clear();
    EXPECT_EQ(0U, window.size());
    window.push(1.0);
    EXPECT_DOUBLE_EQ(1.0, window.mean());
}

TEST(RollingWindowTest, ZeroCapacityActsAsOne)
{
    RollingWindow window(0);
    EXPECT_EQ(1U, window.capacity());
    window.push(3.0);
    window.push(9.0);
    EXPECT_DOUBLE_EQ(9.0, window.mean());
}
