#include "HX711Scale.hpp"
#include "esp_log.h"

static const char* TAG = "HX711Scale";

HX711Scale::HX711Scale(ClockDataLine& line, uint32_t readyTimeoutMs)
    : _line(line),
      _protocol(line, readyTimeoutMs),
      _scaleMutex(NULL),
      _pinConfig(),
      _configured(false),
      _discardNext(true),
      _samplesPerReading(8),
      _calibration(),
      _tareOffset(0)
{
    _scaleMutex = xSemaphoreCreateMutex();
    if (_scaleMutex == NULL) {
        ESP_LOGE(TAG, "Fatal: Could not create scale mutex.");
    }
}

HX711Scale::~HX711Scale()
{
    if (_configured) {
        _line.end();
    }
    if (_scaleMutex != NULL) {
        vSemaphoreDelete(_scaleMutex);
        _scaleMutex = NULL;
    }
}

bool HX711Scale::_lock(uint32_t pendingSamples)
{
    if (_scaleMutex == NULL) {
        return false;
    }
    // Queue behind whatever read is in flight rather than rejecting the caller.
    uint32_t waitMs = pendingSamples * _protocol.getReadyTimeout() + SCALE_LOCK_MARGIN_MS;
    return xSemaphoreTake(_scaleMutex, pdMS_TO_TICKS(waitMs)) == pdTRUE;
}

void HX711Scale::_unlock()
{
    xSemaphoreGive(_scaleMutex);
}

ScaleResult_e HX711Scale::configure(const PinConfig& config)
{
    uint8_t pulses = 0;
    if (HX711Protocol::pulsesForGain(config.gain, pulses) != SCREZ_OK) {
        ESP_LOGE(TAG, "Configuration rejected: gain %u is not one of 128, 64, 32.", config.gain);
        return SCREZ_INVALID_GAIN;
    }
    if (!_lock(_samplesPerReading)) {
        ESP_LOGE(TAG, "Failed to acquire scale mutex for configure().");
        return SCREZ_MUTEX_ACQUISITION;
    }

    if (_configured) {
        _line.end();
        _configured = false;
    }

    ScaleResult_e res = _line.begin(config.dataPin, config.clockPin);
    if (res != SCREZ_OK) {
        ESP_LOGE(TAG, "Could not claim DOUT=%u / PD_SCK=%u: %s", config.dataPin, config.clockPin, getScaleResultString(res));
        _unlock();
        return res;
    }

    _protocol.setGain(config.gain);
    _protocol.powerUp();
    _pinConfig   = config;
    _discardNext = true;
    _configured  = true;
    _unlock();

    ESP_LOGI(TAG, "HX711 configured on DOUT=%u, PD_SCK=%u, gain %u (%u extra pulses).", config.dataPin, config.clockPin, config.gain,
      _protocol.getExtraPulses());
    return SCREZ_OK;
}

void HX711Scale::setReadyTimeout(uint32_t timeoutMs)
{
    if (timeoutMs == 0) {
        timeoutMs = HX711_DEFAULT_READY_TIMEOUT_MS;
    }
    if (_lock(_samplesPerReading)) {
        _protocol.setReadyTimeout(timeoutMs);
        _unlock();
    } else {
        ESP_LOGE(TAG, "Failed to acquire scale mutex for setReadyTimeout().");
    }
}

void HX711Scale::setSamplesPerReading(uint32_t samples)
{
    _samplesPerReading = samples > 0 ? samples : 1;
}

ScaleResult_e HX711Scale::_readAverageLocked(uint32_t samples, int32_t& averageOut, const std::atomic<bool>* abortFlag)
{
    if (!_configured) {
        return SCREZ_NOT_CONFIGURED;
    }
    if (samples == 0) {
        return SCREZ_INVALID_CONFIG;
    }

    int32_t value = 0;
    if (_discardNext) {
        if (_protocol.readRaw(value) != SCREZ_OK) {
            return SCREZ_TIMEOUT;
        }
        _discardNext = false;
    }

    int64_t sum = 0;
    for (uint32_t i = 0; i < samples; i++) {
        if (abortFlag != nullptr && abortFlag->load()) {
            return SCREZ_CANCELLED;
        }
        if (_protocol.readRaw(value) != SCREZ_OK) {
            return SCREZ_TIMEOUT;
        }
        sum += value;
    }
    averageOut = (int32_t)std::llround((double)sum / (double)samples);
    return SCREZ_OK;
}

ScaleResult_e HX711Scale::readRaw(int32_t& rawOut)
{
    return readAverage(1, rawOut);
}

ScaleResult_e HX711Scale::readAverage(uint32_t samples, int32_t& averageOut, const std::atomic<bool>* abortFlag)
{
    if (!_lock(samples > _samplesPerReading ? samples : _samplesPerReading)) {
        ESP_LOGE(TAG, "Failed to acquire scale mutex for readAverage().");
        return SCREZ_MUTEX_ACQUISITION;
    }
    ScaleResult_e res = _readAverageLocked(samples, averageOut, abortFlag);
    _unlock();
    return res;
}

ScaleResult_e HX711Scale::readReading(uint32_t samples, Reading& readingOut, const std::atomic<bool>* abortFlag)
{
    if (!_lock(samples > _samplesPerReading ? samples : _samplesPerReading)) {
        ESP_LOGE(TAG, "Failed to acquire scale mutex for readReading().");
        return SCREZ_MUTEX_ACQUISITION;
    }
    int32_t raw       = 0;
    ScaleResult_e res = _readAverageLocked(samples, raw, abortFlag);
    if (res == SCREZ_OK) {
        readingOut = _convert(raw, _calibration.offset, _calibration.scale, _tareOffset);
    }
    _unlock();
    return res;
}

ScaleResult_e HX711Scale::tare(int32_t* tareRawOut)
{
    if (!_lock(_samplesPerReading)) {
        ESP_LOGE(TAG, "Failed to acquire scale mutex for tare().");
        return SCREZ_MUTEX_ACQUISITION;
    }
    int32_t raw       = 0;
    int64_t session   = 0;
    ScaleResult_e res = _readAverageLocked(_samplesPerReading, raw, nullptr);
    if (res == SCREZ_OK) {
        session     = (int64_t)raw - _calibration.offset;
        _tareOffset = session;
        if (tareRawOut != nullptr) {
            *tareRawOut = raw;
        }
    }
    _unlock();

    if (res == SCREZ_OK) {
        ESP_LOGI(TAG, "Tare complete at raw %ld (session offset %lld).", (long)raw, (long long)session);
    } else {
        ESP_LOGE(TAG, "Tare failed: %s", getScaleResultString(res));
    }
    return res;
}

void HX711Scale::clearTare()
{
    if (_lock(_samplesPerReading)) {
        _tareOffset = 0;
        _unlock();
    } else {
        ESP_LOGE(TAG, "Failed to acquire scale mutex for clearTare().");
    }
}

int64_t HX711Scale::getTareOffset()
{
    int64_t tareOffset = 0;
    if (_lock(_samplesPerReading)) {
        tareOffset = _tareOffset;
        _unlock();
    } else {
        ESP_LOGE(TAG, "Failed to acquire scale mutex for getTareOffset().");
    }
    return tareOffset;
}

void HX711Scale::setOffset(int64_t offset)
{
    if (_lock(_samplesPerReading)) {
        _calibration.offset = offset;
        _unlock();
        ESP_LOGI(TAG, "Offset set to: %lld", (long long)offset);
    } else {
        ESP_LOGE(TAG, "Failed to acquire scale mutex for setOffset().");
    }
}

int64_t HX711Scale::getOffset()
{
    return getCalibration().offset;
}

ScaleResult_e HX711Scale::setScale(double scale)
{
    if (scale == 0.0 || !std::isfinite(scale)) {
        ESP_LOGE(TAG, "Rejected scale %f: must be finite and non-zero.", scale);
        return SCREZ_INVALID_SCALE;
    }
    if (!_lock(_samplesPerReading)) {
        ESP_LOGE(TAG, "Failed to acquire scale mutex for setScale().");
        return SCREZ_MUTEX_ACQUISITION;
    }
    _calibration.scale = scale;
    _unlock();
    ESP_LOGI(TAG, "Scale set to: %.6f counts/g", scale);
    return SCREZ_OK;
}

double HX711Scale::getScale()
{
    return getCalibration().scale;
}

CalibrationState HX711Scale::getCalibration()
{
    CalibrationState snapshot;
    if (_lock(_samplesPerReading)) {
        snapshot = _calibration;
        _unlock();
    } else {
        ESP_LOGE(TAG, "Failed to acquire scale mutex for getCalibration().");
    }
    return snapshot;
}

ScaleResult_e HX711Scale::applyCalibration(const CalibrationState& calibration)
{
    if (calibration.scale == 0.0 || !std::isfinite(calibration.scale)) {
        ESP_LOGE(TAG, "Rejected calibration with scale %f.", calibration.scale);
        return SCREZ_INVALID_SCALE;
    }
    if (!_lock(_samplesPerReading)) {
        ESP_LOGE(TAG, "Failed to acquire scale mutex for applyCalibration().");
        return SCREZ_MUTEX_ACQUISITION;
    }
    _calibration = calibration;
    _tareOffset  = 0;
    _unlock();
    ESP_LOGI(TAG, "Calibration applied: scale %.6f counts/g, offset %lld.", calibration.scale, (long long)calibration.offset);
    return SCREZ_OK;
}

ScaleResult_e HX711Scale::computeScale(double knownWeight, int64_t zeroRaw, int64_t loadedRaw, double& scaleOut)
{
    if (!(knownWeight > 0.0) || !std::isfinite(knownWeight)) {
        ESP_LOGE(TAG, "Calibration failed: known weight must be positive (got %f).", knownWeight);
        return SCREZ_INVALID_CALIBRATION;
    }
    int64_t delta = loadedRaw - zeroRaw;
    if (delta == 0) {
        ESP_LOGE(TAG, "Calibration failed: loaded reading equals the zero reading (%lld).", (long long)zeroRaw);
        return SCREZ_INVALID_CALIBRATION;
    }
    double scale = (double)delta / knownWeight;
    if (!std::isfinite(scale) || scale == 0.0) {
        ESP_LOGE(TAG, "Calibration failed: computed scale is not usable.");
        return SCREZ_INVALID_CALIBRATION;
    }
    scaleOut = scale;
    return SCREZ_OK;
}

ScaleResult_e HX711Scale::computeScale(double knownWeight, int64_t zeroRaw, double& scaleOut, int32_t* loadedRawOut,
  const std::atomic<bool>* abortFlag)
{
    if (!(knownWeight > 0.0)) {
        ESP_LOGE(TAG, "Calibration failed: known weight must be positive (got %f).", knownWeight);
        return SCREZ_INVALID_CALIBRATION;
    }
    int32_t loadedRaw = 0;
    ScaleResult_e res = readAverage(_samplesPerReading, loadedRaw, abortFlag);
    if (res != SCREZ_OK) {
        return res;
    }
    if (loadedRawOut != nullptr) {
        *loadedRawOut = loadedRaw;
    }
    return computeScale(knownWeight, zeroRaw, loadedRaw, scaleOut);
}

Reading HX711Scale::_convert(int32_t raw, int64_t offset, double scale, int64_t tareOffset)
{
    Reading reading;
    reading.raw       = raw;
    reading.grams     = (double)((int64_t)raw - offset - tareOffset) / scale;
    reading.newtons   = reading.grams * STANDARD_GRAVITY_MS2 / 1000.0;
    reading.timestamp = time(nullptr);
    return reading;
}

Reading HX711Scale::toReading(int32_t raw)
{
    int64_t offset     = 0;
    double scale       = 1.0;
    int64_t tareOffset = 0;
    // Every holder releases the mutex within one bounded averaged read.
    if (_scaleMutex != NULL && xSemaphoreTake(_scaleMutex, portMAX_DELAY) == pdTRUE) {
        offset     = _calibration.offset;
        scale      = _calibration.scale;
        tareOffset = _tareOffset;
        _unlock();
    } else {
        ESP_LOGE(TAG, "Scale mutex missing, converting with the uncalibrated model.");
    }
    return _convert(raw, offset, scale, tareOffset);
}

ScaleResult_e HX711Scale::powerDown()
{
    if (!_lock(_samplesPerReading)) {
        ESP_LOGE(TAG, "Failed to acquire scale mutex for powerDown().");
        return SCREZ_MUTEX_ACQUISITION;
    }
    if (!_configured) {
        _unlock();
        return SCREZ_NOT_CONFIGURED;
    }
    _protocol.powerDown();
    _unlock();
    ESP_LOGI(TAG, "HX711 powered down.");
    return SCREZ_OK;
}

ScaleResult_e HX711Scale::powerUp()
{
    if (!_lock(_samplesPerReading)) {
        ESP_LOGE(TAG, "Failed to acquire scale mutex for powerUp().");
        return SCREZ_MUTEX_ACQUISITION;
    }
    if (!_configured) {
        _unlock();
        return SCREZ_NOT_CONFIGURED;
    }
    _protocol.powerUp();
    // Wakes up on channel A gain 128 and needs to settle, so the first conversion is not ours.
    _discardNext = true;
    _unlock();
    ESP_LOGI(TAG, "HX711 powered up.");
    return SCREZ_OK;
}
