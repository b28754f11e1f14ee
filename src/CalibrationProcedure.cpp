#include "CalibrationProcedure.hpp"
#include "esp_log.h"
#include <cmath>

static const char* TAG = "Calibration";

const char* getCalibrationStepString(const CalibrationStep step)
{
    switch (step) {
        case CalibrationStep::STEP_IDLE:
            return "IDLE";
        case CalibrationStep::STEP_AWAIT_ZERO:
            return "AWAIT_ZERO";
        case CalibrationStep::STEP_CAPTURING_ZERO:
            return "CAPTURING_ZERO";
        case CalibrationStep::STEP_AWAIT_WEIGHT:
            return "AWAIT_WEIGHT";
        case CalibrationStep::STEP_CAPTURING_WEIGHT:
            return "CAPTURING_WEIGHT";
        case CalibrationStep::STEP_DONE:
            return "DONE";
        default:
            return "UNKNOWN";
    }
}

CalibrationProcedure::CalibrationProcedure(HX711Scale& scale, ScaleReader& reader, CalibrationStore& store)
    : _scale(scale),
      _reader(reader),
      _store(store),
      _temperatureSource(),
      _stepMutex(NULL),
      _step(CalibrationStep::STEP_IDLE),
      _cancelRequested(false),
      _samples(CALIBRATION_DEFAULT_SAMPLES),
      _zeroRaw(0),
      _resumeReader(false),
      _result()
{
    _stepMutex = xSemaphoreCreateMutex();
    if (_stepMutex == NULL) {
        ESP_LOGE(TAG, "Fatal: Could not create calibration mutex.");
    }
}

CalibrationProcedure::~CalibrationProcedure()
{
    if (_stepMutex != NULL) {
        vSemaphoreDelete(_stepMutex);
        _stepMutex = NULL;
    }
}

bool CalibrationProcedure::_lock()
{
    return _stepMutex != NULL && xSemaphoreTake(_stepMutex, portMAX_DELAY) == pdTRUE;
}

void CalibrationProcedure::_unlock()
{
    xSemaphoreGive(_stepMutex);
}

void CalibrationProcedure::_resumeReaderIfPaused()
{
    bool resume = false;
    if (_lock()) {
        resume        = _resumeReader;
        _resumeReader = false;
        _unlock();
    }
    if (!resume) {
        return;
    }
    ScaleResult_e res = _reader.restart();
    if (res != SCREZ_OK) {
        ESP_LOGE(TAG, "Could not resume the reader after calibration: %s", getScaleResultString(res));
    }
}

ScaleResult_e CalibrationProcedure::begin(uint32_t samples)
{
    if (!_lock()) {
        return SCREZ_MUTEX_ACQUISITION;
    }
    if (_step != CalibrationStep::STEP_IDLE && _step != CalibrationStep::STEP_DONE) {
        ESP_LOGW(TAG, "Calibration already in progress (%s).", getCalibrationStepString(_step));
        _unlock();
        return SCREZ_WRONG_STATE;
    }
    _unlock();

    if (!_scale.isConfigured()) {
        ESP_LOGE(TAG, "Cannot calibrate: HX711 is not configured.");
        return SCREZ_NOT_CONFIGURED;
    }

    bool paused = false;
    if (_reader.isRunning()) {
        ScaleResult_e res = _reader.stop();
        if (res != SCREZ_OK) {
            ESP_LOGE(TAG, "Cannot calibrate: reader did not stop (%s).", getScaleResultString(res));
            return res;
        }
        paused = true;
    }

    if (!_lock()) {
        return SCREZ_MUTEX_ACQUISITION;
    }
    _samples = samples < CALIBRATION_MIN_SAMPLES ? CALIBRATION_MIN_SAMPLES : samples;
    _cancelRequested.store(false);
    _zeroRaw      = 0;
    _resumeReader = paused;
    _step         = CalibrationStep::STEP_AWAIT_ZERO;
    _unlock();

    ESP_LOGI(TAG, "Calibration started (%u samples per capture). Remove all weight from the scale.", _samples);
    return SCREZ_OK;
}

ScaleResult_e CalibrationProcedure::captureZero()
{
    if (!_lock()) {
        return SCREZ_MUTEX_ACQUISITION;
    }
    if (_step != CalibrationStep::STEP_AWAIT_ZERO) {
        _unlock();
        return SCREZ_WRONG_STATE;
    }
    _step            = CalibrationStep::STEP_CAPTURING_ZERO;
    uint32_t samples = _samples;
    _unlock();

    int32_t zeroRaw   = 0;
    ScaleResult_e res = _scale.readAverage(samples, zeroRaw, &_cancelRequested);

    if (!_lock()) {
        return SCREZ_MUTEX_ACQUISITION;
    }
    if (_step != CalibrationStep::STEP_CAPTURING_ZERO) {
        // cancel() won the race, whatever the read produced is discarded.
        _unlock();
        return SCREZ_CANCELLED;
    }
    if (res != SCREZ_OK) {
        _step = CalibrationStep::STEP_AWAIT_ZERO;
        _unlock();
        ESP_LOGW(TAG, "Zero capture failed: %s", getScaleResultString(res));
        return res;
    }
    _zeroRaw = zeroRaw;
    _step    = CalibrationStep::STEP_AWAIT_WEIGHT;
    _unlock();

    ESP_LOGI(TAG, "Zero captured at raw %ld. Place the known weight on the scale.", (long)zeroRaw);
    return SCREZ_OK;
}

ScaleResult_e CalibrationProcedure::captureWeight(double knownWeight)
{
    if (!_lock()) {
        return SCREZ_MUTEX_ACQUISITION;
    }
    if (_step != CalibrationStep::STEP_AWAIT_WEIGHT) {
        _unlock();
        return SCREZ_WRONG_STATE;
    }
    if (!(knownWeight > 0.0) || !std::isfinite(knownWeight)) {
        _unlock();
        ESP_LOGE(TAG, "Known weight must be a positive number of grams (got %f).", knownWeight);
        return SCREZ_INVALID_CALIBRATION;
    }
    _step            = CalibrationStep::STEP_CAPTURING_WEIGHT;
    uint32_t samples = _samples;
    int32_t zeroRaw  = _zeroRaw;
    _unlock();

    int32_t loadedRaw = 0;
    double scale      = 0.0;
    ScaleResult_e res = _scale.readAverage(samples, loadedRaw, &_cancelRequested);
    if (res == SCREZ_OK) {
        res = HX711Scale::computeScale(knownWeight, zeroRaw, loadedRaw, scale);
    }

    if (!_lock()) {
        return SCREZ_MUTEX_ACQUISITION;
    }
    if (_step != CalibrationStep::STEP_CAPTURING_WEIGHT) {
        _unlock();
        return SCREZ_CANCELLED;
    }
    if (res != SCREZ_OK) {
        _step = CalibrationStep::STEP_AWAIT_WEIGHT;
        _unlock();
        ESP_LOGW(TAG, "Weight capture failed: %s", getScaleResultString(res));
        return res;
    }

    CalibrationState calibration;
    calibration.offset       = zeroRaw;
    calibration.scale        = scale;
    calibration.calibratedAt = time(nullptr);
    calibration.knownWeight  = knownWeight;
    calibration.temperature  = _temperatureSource ? _temperatureSource() : NAN;

    // Held across the commit so a concurrent cancel() cannot land between apply and DONE.
    res = _scale.applyCalibration(calibration);
    if (res != SCREZ_OK) {
        _step = CalibrationStep::STEP_AWAIT_WEIGHT;
        _unlock();
        return res;
    }
    _result = calibration;
    _step   = CalibrationStep::STEP_DONE;
    _unlock();

    ESP_LOGI(TAG, "Calibration done: loaded raw %ld, scale %.6f counts/g, offset %ld.", (long)loadedRaw, scale, (long)zeroRaw);

    res = SCREZ_OK;
    if (!_store.saveCalibration(calibration, zeroRaw)) {
        ESP_LOGE(TAG, "Calibration applied but could not be saved.");
        res = SCREZ_STORAGE_FAILED;
    }
    _resumeReaderIfPaused();
    return res;
}

ScaleResult_e CalibrationProcedure::cancel()
{
    if (!_lock()) {
        return SCREZ_MUTEX_ACQUISITION;
    }
    if (_step == CalibrationStep::STEP_IDLE) {
        _unlock();
        return SCREZ_OK;
    }
    if (_step == CalibrationStep::STEP_DONE) {
        _unlock();
        return SCREZ_WRONG_STATE;
    }
    _cancelRequested.store(true);
    _step = CalibrationStep::STEP_IDLE;
    _unlock();

    ESP_LOGI(TAG, "Calibration cancelled, stored calibration unchanged.");
    _resumeReaderIfPaused();
    return SCREZ_OK;
}

CalibrationStep CalibrationProcedure::getStep()
{
    CalibrationStep step = CalibrationStep::STEP_IDLE;
    if (_lock()) {
        step = _step;
        _unlock();
    }
    return step;
}

int32_t CalibrationProcedure::getZeroRaw()
{
    int32_t zeroRaw = 0;
    if (_lock()) {
        zeroRaw = _zeroRaw;
        _unlock();
    }
    return zeroRaw;
}

CalibrationState CalibrationProcedure::getResult()
{
    CalibrationState result;
    if (_lock()) {
        result = _result;
        _unlock();
    }
    return result;
}
