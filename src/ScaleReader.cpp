#include "ScaleReader.hpp"
#include "RollingWindow.hpp"
#include "esp_log.h"
#include <cmath>

static const char* TAG = "ScaleReader";

const char* getReaderStateString(const ReaderState state)
{
    switch (state) {
        case ReaderState::IDLE:
            return "IDLE";
        case ReaderState::RUNNING:
            return "RUNNING";
        case ReaderState::STOPPING:
            return "STOPPING";
        default:
            return "UNKNOWN";
    }
}

ScaleReader::ScaleReader(HX711Scale& scale)
    : _scale(scale),
      _stateMutex(NULL),
      _exitSem(NULL),
      _taskHandle(NULL),
      _state(ReaderState::IDLE),
      _stopRequested(false),
      _config(),
      _sink(NULL),
      _callbackSink()
{
    _stateMutex = xSemaphoreCreateMutex();
    _exitSem    = xSemaphoreCreateBinary();
    if (_stateMutex == NULL || _exitSem == NULL) {
        ESP_LOGE(TAG, "Fatal: Could not create reader semaphores.");
    }
}

ScaleReader::~ScaleReader()
{
    if (stop() == SCREZ_TIMEOUT) {
        // The task still uses this instance: nothing may be freed until it has exited.
        ESP_LOGE(TAG, "Reader task still alive while its owner is destroyed, waiting for it.");
        xSemaphoreTake(_exitSem, portMAX_DELAY);
        _waitTaskReleased();
    }
    if (_stateMutex != NULL) {
        vSemaphoreDelete(_stateMutex);
        _stateMutex = NULL;
    }
    if (_exitSem != NULL) {
        vSemaphoreDelete(_exitSem);
        _exitSem = NULL;
    }
}

ScaleResult_e ScaleReader::validateConfig(const ReaderConfig& config)
{
    if (config.samplesPerReading < 1) {
        return SCREZ_INVALID_CONFIG;
    }
    if (!std::isfinite(config.intervalSeconds) || config.intervalSeconds <= 0.0) {
        return SCREZ_INVALID_CONFIG;
    }
    if (config.rollingWindow && config.windowSize < 1) {
        return SCREZ_INVALID_CONFIG;
    }
    return SCREZ_OK;
}

ReaderState ScaleReader::getState()
{
    if (_stateMutex == NULL || xSemaphoreTake(_stateMutex, portMAX_DELAY) != pdTRUE) {
        return _state;
    }
    ReaderState state = _state;
    xSemaphoreGive(_stateMutex);
    return state;
}

ScaleResult_e ScaleReader::start(const ReaderConfig& config, ReadingSink& sink)
{
    ScaleResult_e res = validateConfig(config);
    if (res != SCREZ_OK) {
        ESP_LOGE(TAG, "Reader config rejected: %u samples every %.3f s, window %s/%u.", config.samplesPerReading,
          config.intervalSeconds, config.rollingWindow ? "on" : "off", config.windowSize);
        return res;
    }
    if (!_scale.isConfigured()) {
        ESP_LOGE(TAG, "Cannot start reader: HX711 is not configured.");
        return SCREZ_NOT_CONFIGURED;
    }
    if (_stateMutex == NULL || _exitSem == NULL) {
        return SCREZ_MUTEX_ACQUISITION;
    }

    xSemaphoreTake(_stateMutex, portMAX_DELAY);
    if (_state != ReaderState::IDLE) {
        xSemaphoreGive(_stateMutex);
        ESP_LOGW(TAG, "Reader already %s.", getReaderStateString(_state));
        return SCREZ_ALREADY_RUNNING;
    }

    // A task that died on a fatal error left its exit token behind.
    xSemaphoreTake(_exitSem, 0);

    _config = config;
    _sink   = &sink;
    _stopRequested.store(false);
    _scale.setSamplesPerReading(config.samplesPerReading);
    _scale.clearTare();

    _state = ReaderState::RUNNING;
    if (xTaskCreate(_readerTask, "Scale Reader", READER_TASK_STACK_SIZE, this, READER_TASK_PRIORITY, &_taskHandle) != pdPASS) {
        _state      = ReaderState::IDLE;
        _taskHandle = NULL;
        xSemaphoreGive(_stateMutex);
        ESP_LOGE(TAG, "Fatal: Could not create reader task.");
        return SCREZ_HARDWARE_UNAVAILABLE;
    }
    xSemaphoreGive(_stateMutex);

    ESP_LOGI(TAG, "Reader started: %u samples every %.3f s%s.", config.samplesPerReading, config.intervalSeconds,
      config.rollingWindow ? ", rolling window" : "");
    return SCREZ_OK;
}

ScaleResult_e ScaleReader::start(const ReaderConfig& config, std::function<void(const Reading&)> onReading,
  std::function<void(ScaleResult_e, const char*)> onError)
{
    // The callback sink is in use by a live task, leave it alone.
    if (getState() != ReaderState::IDLE) {
        return SCREZ_ALREADY_RUNNING;
    }
    _callbackSink = CallbackReadingSink(onReading, onError);
    return start(config, _callbackSink);
}

ScaleResult_e ScaleReader::restart()
{
    if (_sink == NULL) {
        return SCREZ_WRONG_STATE;
    }
    return start(_config, *_sink);
}

void ScaleReader::_waitTaskReleased()
{
    // The exit token is given with the state mutex held, so the task is done with it once we get it.
    xSemaphoreTake(_stateMutex, portMAX_DELAY);
    xSemaphoreGive(_stateMutex);
}

uint32_t ScaleReader::_stopBoundMs() const
{
    uint32_t intervalMs = (uint32_t)std::ceil(_config.intervalSeconds * 1000.0);
    return intervalMs + _config.samplesPerReading * _scale.getReadyTimeout() + SCALE_LOCK_MARGIN_MS + READER_STOP_MARGIN_MS;
}

ScaleResult_e ScaleReader::stop()
{
    if (_stateMutex == NULL || _exitSem == NULL) {
        return SCREZ_OK;
    }

    xSemaphoreTake(_stateMutex, portMAX_DELAY);
    if (_state == ReaderState::IDLE) {
        xSemaphoreGive(_stateMutex);
        return SCREZ_OK;
    }
    _stopRequested.store(true);
    _state = ReaderState::STOPPING;

    if (_taskHandle == xTaskGetCurrentTaskHandle()) {
        // Called from the sink: the loop sees the flag once the callback returns.
        xSemaphoreGive(_stateMutex);
        return SCREZ_OK;
    }
    if (_taskHandle != NULL) {
        xTaskNotifyGive(_taskHandle);
    }
    xSemaphoreGive(_stateMutex);

    if (xSemaphoreTake(_exitSem, pdMS_TO_TICKS(_stopBoundMs())) != pdTRUE) {
        // Another stop() may have consumed the exit token.
        if (getState() == ReaderState::IDLE) {
            return SCREZ_OK;
        }
        ESP_LOGE(TAG, "Reader task did not exit within %u ms.", _stopBoundMs());
        return SCREZ_TIMEOUT;
    }
    _waitTaskReleased();
    ESP_LOGI(TAG, "Reader stopped.");
    return SCREZ_OK;
}

void ScaleReader::_readerTask(void* pvParameters)
{
    ScaleReader* instance = (ScaleReader*)pvParameters;
    ESP_LOGI(TAG, "Scale Reader task started.");

    instance->_run();

    // IDLE and the exit token become visible together: a start() that sees IDLE also finds the token to drain.
    xSemaphoreTake(instance->_stateMutex, portMAX_DELAY);
    instance->_state      = ReaderState::IDLE;
    instance->_taskHandle = NULL;
    xSemaphoreGive(instance->_exitSem);
    // Last touch of the instance: the owner may be destroyed as soon as this is given.
    xSemaphoreGive(instance->_stateMutex);
    vTaskDelete(NULL);
}

void ScaleReader::_run()
{
    const ReaderConfig config = _config;
    ReadingSink& sink         = *_sink;

    TickType_t intervalTicks = (TickType_t)std::lround(config.intervalSeconds * configTICK_RATE_HZ);
    if (intervalTicks == 0) {
        intervalTicks = 1;
    }

    RollingWindow window(config.windowSize);
    TickType_t nextWake       = xTaskGetTickCount();
    TickType_t lastCycleStart = nextWake;
    bool firstCycle           = true;

    while (!_stopRequested.load()) {
        TickType_t cycleStart = xTaskGetTickCount();

        Reading reading;
        ScaleResult_e res = _scale.readReading(config.samplesPerReading, reading, &_stopRequested);
        if (res == SCREZ_CANCELLED) {
            break;
        }

        // Cycle-to-cycle wall time, failed cycles included; the very first cycle has no predecessor, so it counts
        // its own read plus one interval.
        TickType_t cycleTicks = firstCycle ? (xTaskGetTickCount() - cycleStart) + intervalTicks : cycleStart - lastCycleStart;
        if (cycleTicks == 0) {
            cycleTicks = 1;
        }
        firstCycle     = false;
        lastCycleStart = cycleStart;

        if (res == SCREZ_OK) {
            if (config.rollingWindow) {
                window.push(reading.grams);
                reading.grams   = window.mean();
                reading.newtons = reading.grams * STANDARD_GRAVITY_MS2 / 1000.0;
            }
            reading.sampleRateHz = (double)configTICK_RATE_HZ / (double)cycleTicks;

            sink.onReading(reading);
        } else {
            ESP_LOGW(TAG, "Sampling cycle failed: %s", getScaleResultString(res));
            sink.onError(res, getScaleResultString(res));
            if (isFatalScaleResult(res)) {
                ESP_LOGE(TAG, "Reader stopping on fatal error %s.", getScaleResultString(res));
                break;
            }
        }

        nextWake += intervalTicks;
        TickType_t now = xTaskGetTickCount();
        if ((int32_t)(nextWake - now) > 0) {
            // Woken early by stop().
            ulTaskNotifyTake(pdTRUE, nextWake - now);
        } else {
            // Overran the cadence: resync instead of bursting to catch up.
            nextWake = now;
        }
    }
}
