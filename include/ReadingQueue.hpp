#ifndef READINGQUEUE_HPP
#define READINGQUEUE_HPP

#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"
#include "ReadingSink.hpp"

#define READING_QUEUE_DEFAULT_DEPTH (8)
#define READER_EVENT_MESSAGE_LEN    (48)

enum class ReaderEventType : uint8_t
{
    READING,
    ERROR
};

/** @brief One queue slot. Plain data, copied by value into the FreeRTOS queue. */
struct ReaderEvent {
    ReaderEventType type;
    Reading reading;
    ScaleResult_e error;
    char message[READER_EVENT_MESSAGE_LEN];
};

/**
 * @file ReadingQueue.hpp
 * @brief Bounded channel between the reader task and a consumer task.
 *
 * The producer never blocks: when the consumer falls behind, the oldest event is dropped so the queue always
 * holds the most recent readings, still in sampling order.
 */
class ReadingQueue : public ReadingSink {
  public:
    explicit ReadingQueue(UBaseType_t depth = READING_QUEUE_DEFAULT_DEPTH);
    ~ReadingQueue();

    bool isValid() const { return _queue != NULL; }

    void onReading(const Reading& reading) override;
    void onError(ScaleResult_e error, const char* message) override;

    /**
     * @brief Pops the oldest event.
     * @param wait Ticks to block for when the queue is empty.
     * @return <false> if nothing arrived in time.
     */
    bool receive(ReaderEvent& eventOut, TickType_t wait = 0);
    UBaseType_t pending() const;
    uint32_t getDroppedCount() const { return _dropped; }
    void clear();

  private:
    QueueHandle_t _queue;
    volatile uint32_t _dropped;

    void _push(const ReaderEvent& event);
};

#endif // READINGQUEUE_HPP
