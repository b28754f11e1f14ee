#ifndef SCALEREADER_HPP
#define SCALEREADER_HPP

#include <atomic>
#include <functional>
#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"
#include "freertos/task.h"
#include "HX711Scale.hpp"
#include "ReadingSink.hpp"

#define READER_TASK_STACK_SIZE (4096)
#define READER_TASK_PRIORITY   (5)
#define READER_STOP_MARGIN_MS  (100)

enum class ReaderState : uint8_t
{
    IDLE,     ///< No task exists
    RUNNING,  ///< Task is sampling
    STOPPING, ///< Stop was requested, task has not exited yet
};

const char* getReaderStateString(const ReaderState state);

/**
 * @file ScaleReader.hpp
 * @brief Background FreeRTOS task sampling an HX711Scale at a fixed cadence.
 *
 * The task only borrows the scale: every chip access goes through the scale's own mutex, so tare() or a
 * calibration read issued by another task simply queues behind the current cycle.
 */
class ScaleReader {
  public:
    explicit ScaleReader(HX711Scale& scale);
    ~ScaleReader();

    /**
     * @brief Spawns the reader task. Clears the session tare.
     * @return SCREZ_ALREADY_RUNNING, SCREZ_INVALID_CONFIG or SCREZ_NOT_CONFIGURED.
     */
    ScaleResult_e start(const ReaderConfig& config, ReadingSink& sink);
    ScaleResult_e start(const ReaderConfig& config, std::function<void(const Reading&)> onReading,
      std::function<void(ScaleResult_e, const char*)> onError);
    /** @brief Starts again with the last config and sink. SCREZ_WRONG_STATE if never started. */
    ScaleResult_e restart();

    /**
     * @brief Asks the task to exit and waits until it did. Idempotent.
     * Called from inside the sink (i.e. on the reader task), it only raises the stop request.
     * @return SCREZ_TIMEOUT if the task did not exit within one interval plus one averaged read.
     */
    ScaleResult_e stop();

    ReaderState getState();
    bool isRunning() { return getState() == ReaderState::RUNNING; }
    ReaderConfig getConfig() const { return _config; }

    static ScaleResult_e validateConfig(const ReaderConfig& config);

  private:
    HX711Scale& _scale;

    SemaphoreHandle_t _stateMutex; // Guards _state and _taskHandle
    SemaphoreHandle_t _exitSem;    // Given by the task right before it deletes itself
    TaskHandle_t _taskHandle;
    ReaderState _state;
    std::atomic<bool> _stopRequested;

    ReaderConfig _config;
    ReadingSink* _sink;
    CallbackReadingSink _callbackSink;

    static void _readerTask(void* pvParameters);
    void _run();
    void _waitTaskReleased();
    uint32_t _stopBoundMs() const;
};

#endif // SCALEREADER_HPP
