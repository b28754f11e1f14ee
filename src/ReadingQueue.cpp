#include "ReadingQueue.hpp"
#include "esp_log.h"
#include <cstring>

static const char* TAG = "ReadingQueue";

ReadingQueue::ReadingQueue(UBaseType_t depth) : _queue(NULL), _dropped(0)
{
    _queue = xQueueCreate(depth > 0 ? depth : 1, sizeof(ReaderEvent));
    if (_queue == NULL) {
        ESP_LOGE(TAG, "Fatal: Could not create reading queue (depth %u).", (unsigned)depth);
    }
}

ReadingQueue::~ReadingQueue()
{
    if (_queue != NULL) {
        vQueueDelete(_queue);
        _queue = NULL;
    }
}

void ReadingQueue::_push(const ReaderEvent& event)
{
    if (_queue == NULL) {
        return;
    }
    if (xQueueSend(_queue, &event, 0) != pdTRUE) {
        ReaderEvent oldest;
        xQueueReceive(_queue, &oldest, 0);
        _dropped++;
        if (xQueueSend(_queue, &event, 0) != pdTRUE) {
            ESP_LOGW(TAG, "Reading queue still full, event lost.");
        }
    }
}

void ReadingQueue::onReading(const Reading& reading)
{
    ReaderEvent event{};
    event.type    = ReaderEventType::READING;
    event.reading = reading;
    event.error   = SCREZ_OK;
    _push(event);
}

void ReadingQueue::onError(ScaleResult_e error, const char* message)
{
    ReaderEvent event{};
    event.type  = ReaderEventType::ERROR;
    event.error = error;
    if (message != NULL) {
        strncpy(event.message, message, sizeof(event.message) - 1);
    }
    _push(event);
}

bool ReadingQueue::receive(ReaderEvent& eventOut, TickType_t wait)
{
    if (_queue == NULL) {
        return false;
    }
    return xQueueReceive(_queue, &eventOut, wait) == pdTRUE;
}

UBaseType_t ReadingQueue::pending() const
{
    if (_queue == NULL) {
        return 0;
    }
    return uxQueueMessagesWaiting(_queue);
}

void ReadingQueue::clear()
{
    if (_queue != NULL) {
        xQueueReset(_queue);
    }
}
