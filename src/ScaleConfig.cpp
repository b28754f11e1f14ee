#include "ScaleConfig.hpp"
#include "HX711Protocol.hpp"
#include "ArduinoJson.h"
#include "esp_log.h"
#include <cmath>

static const char* TAG = "ScaleConfig";

ScaleConfig::ScaleConfig()
    : doutPin(HX711_DATA_PIN),
      sckPin(HX711_CLOCK_PIN),
      gain(HX711_DEFAULT_GAIN),
      scale(1.0),
      offset(0),
      samples(8),
      interval(0.2),
      knownWeight(1000.0),
      decimals(2),
      rollingWindow(false),
      windowSize(3),
      readyTimeoutMs(HX711_DEFAULT_READY_TIMEOUT_MS),
      demoMode(false),
      calibrationTime(0),
      calibrationTemp(NAN),
      calibrationWeight(NAN),
      hasLastZeroRaw(false),
      lastZeroRaw(0)
{}

const char* getCalibrationHealthString(const CalibrationHealth_e value)
{
    switch (value) {
        case CALHEALTH_GOOD:
            return "GOOD";
        case CALHEALTH_WARN:
            return "WARN";
        case CALHEALTH_BAD:
            return "BAD";
        default:
            return "UNKNOWN";
    }
}

CalibrationHealth_e evaluateCalibrationStatus(const ScaleConfig& config, time_t now, const char** messageOut)
{
    CalibrationHealth_e health = CALHEALTH_GOOD;
    const char* message        = "Calibration OK";

    bool defaultModel = config.scale == 1.0 && config.offset == 0;
    if (config.calibrationTime == 0 || !std::isfinite(config.scale) || config.scale == 0.0 || defaultModel) {
        health  = CALHEALTH_BAD;
        message = "Calibration required";
    } else if ((int64_t)now - (int64_t)config.calibrationTime > CALIBRATION_STALE_AFTER_S) {
        health  = CALHEALTH_WARN;
        message = "Calibration may be stale";
    }

    if (messageOut != nullptr) {
        *messageOut = message;
    }
    return health;
}

double zeroDriftGrams(int64_t zeroRaw, int64_t offset, double scale)
{
    double magnitude = std::fabs(scale);
    if (magnitude < 1e-9) {
        magnitude = 1e-9;
    }
    return std::fabs((double)(zeroRaw - offset) / magnitude);
}

// Accepts integers as well as the float form older files may carry.
static int64_t _readInt64(JsonVariantConst value, int64_t fallback)
{
    if (value.is<int64_t>()) {
        return value.as<int64_t>();
    }
    if (value.is<double>()) {
        double d = value.as<double>();
        if (std::isfinite(d)) {
            return (int64_t)std::llround(d);
        }
    }
    return fallback;
}

bool serializeScaleConfig(const ScaleConfig& config, std::string& jsonOut)
{
    JsonDocument doc;
    doc["dout_pin"]         = config.doutPin;
    doc["sck_pin"]          = config.sckPin;
    doc["gain"]             = config.gain;
    doc["scale"]            = config.scale;
    doc["offset"]           = config.offset;
    doc["samples"]          = config.samples;
    doc["interval"]         = config.interval;
    doc["known_weight"]     = config.knownWeight;
    doc["decimals"]         = config.decimals;
    doc["rolling_window"]   = config.rollingWindow;
    doc["window_size"]      = config.windowSize;
    doc["ready_timeout_ms"] = config.readyTimeoutMs;
    doc["demo_mode"]        = config.demoMode;

    if (config.calibrationTime != 0) {
        doc["calibration_time"] = (int64_t)config.calibrationTime;
    } else {
        doc["calibration_time"] = nullptr;
    }
    if (std::isfinite(config.calibrationTemp)) {
        doc["calibration_temp"] = config.calibrationTemp;
    } else {
        doc["calibration_temp"] = nullptr;
    }
    if (std::isfinite(config.calibrationWeight)) {
        doc["calibration_weight"] = config.calibrationWeight;
    } else {
        doc["calibration_weight"] = nullptr;
    }
    if (config.hasLastZeroRaw) {
        doc["last_zero_raw"] = config.lastZeroRaw;
    } else {
        doc["last_zero_raw"] = nullptr;
    }

    jsonOut.clear();
    if (serializeJson(doc, jsonOut) == 0) {
        ESP_LOGE(TAG, "Failed to serialize scale config.");
        return false;
    }
    return true;
}

bool deserializeScaleConfig(const char* json, ScaleConfig& configOut)
{
    const ScaleConfig defaults;
    configOut = defaults;
    if (json == nullptr) {
        return false;
    }

    JsonDocument doc;
    DeserializationError error = deserializeJson(doc, json);
    if (error) {
        ESP_LOGE(TAG, "Failed to parse scale config. Using defaults. Error: %s", error.c_str());
        return false;
    }
    if (!doc.is<JsonObject>()) {
        ESP_LOGE(TAG, "Scale config is not a JSON object. Using defaults.");
        return false;
    }

    // Load values from JSON, using defaults as a fallback if a key is missing.
    configOut.doutPin        = doc["dout_pin"] | defaults.doutPin;
    configOut.sckPin         = doc["sck_pin"] | defaults.sckPin;
    configOut.gain           = doc["gain"] | defaults.gain;
    configOut.scale          = doc["scale"] | defaults.scale;
    configOut.offset         = _readInt64(doc["offset"], defaults.offset);
    configOut.knownWeight    = doc["known_weight"] | defaults.knownWeight;
    configOut.rollingWindow  = doc["rolling_window"] | defaults.rollingWindow;
    configOut.readyTimeoutMs = doc["ready_timeout_ms"] | defaults.readyTimeoutMs;
    configOut.demoMode       = doc["demo_mode"] | defaults.demoMode;

    int64_t samples      = _readInt64(doc["samples"], defaults.samples);
    configOut.samples    = samples < 1 ? 1 : (uint32_t)samples;
    int64_t windowSize   = _readInt64(doc["window_size"], defaults.windowSize);
    configOut.windowSize = windowSize < 1 ? 1 : (uint32_t)windowSize;
    int64_t decimals     = _readInt64(doc["decimals"], defaults.decimals);
    configOut.decimals   = decimals < 0 ? 0 : (decimals > SCALE_CONFIG_MAX_DECIMALS ? SCALE_CONFIG_MAX_DECIMALS : (uint8_t)decimals);

    double interval = doc["interval"] | defaults.interval;
    if (!std::isfinite(interval) || interval < SCALE_CONFIG_MIN_INTERVAL_S) {
        ESP_LOGW(TAG, "Interval %.3f s raised to %.3f s.", interval, SCALE_CONFIG_MIN_INTERVAL_S);
        interval = SCALE_CONFIG_MIN_INTERVAL_S;
    }
    configOut.interval = interval;

    configOut.calibrationTime = (time_t)_readInt64(doc["calibration_time"], 0);
    if (!doc["calibration_temp"].isNull()) {
        configOut.calibrationTemp = doc["calibration_temp"] | defaults.calibrationTemp;
    }
    if (!doc["calibration_weight"].isNull()) {
        configOut.calibrationWeight = doc["calibration_weight"] | defaults.calibrationWeight;
    }
    if (!doc["last_zero_raw"].isNull()) {
        configOut.lastZeroRaw    = (int32_t)_readInt64(doc["last_zero_raw"], 0);
        configOut.hasLastZeroRaw = true;
    }
    return true;
}

ScaleResult_e validateScaleConfig(const ScaleConfig& config)
{
    uint8_t pulses = 0;
    if (HX711Protocol::pulsesForGain(config.gain, pulses) != SCREZ_OK) {
        return SCREZ_INVALID_GAIN;
    }
    if (config.doutPin == config.sckPin) {
        return SCREZ_INVALID_CONFIG;
    }
    if (config.samples < 1 || !std::isfinite(config.interval) || config.interval <= 0.0) {
        return SCREZ_INVALID_CONFIG;
    }
    if (config.rollingWindow && config.windowSize < 1) {
        return SCREZ_INVALID_CONFIG;
    }
    if (!std::isfinite(config.scale) || config.scale == 0.0) {
        return SCREZ_INVALID_SCALE;
    }
    return SCREZ_OK;
}

PinConfig toPinConfig(const ScaleConfig& config)
{
    return PinConfig(config.doutPin, config.sckPin, config.gain);
}

ReaderConfig toReaderConfig(const ScaleConfig& config)
{
    ReaderConfig reader;
    reader.samplesPerReading = config.samples;
    reader.intervalSeconds   = config.interval;
    reader.rollingWindow     = config.rollingWindow;
    reader.windowSize        = config.windowSize;
    return reader;
}

CalibrationState toCalibrationState(const ScaleConfig& config)
{
    CalibrationState calibration;
    calibration.offset       = config.offset;
    calibration.scale        = config.scale;
    calibration.calibratedAt = config.calibrationTime;
    calibration.knownWeight  = config.calibrationWeight;
    calibration.temperature  = config.calibrationTemp;
    return calibration;
}

void recordLastZeroRaw(ScaleConfig& config, int32_t zeroRaw)
{
    config.lastZeroRaw    = zeroRaw;
    config.hasLastZeroRaw = true;
}

void applyCalibrationToConfig(ScaleConfig& config, const CalibrationState& calibration, int32_t lastZeroRaw)
{
    config.scale             = calibration.scale;
    config.offset            = calibration.offset;
    config.calibrationTime   = calibration.calibratedAt;
    config.calibrationWeight = calibration.knownWeight;
    config.calibrationTemp   = calibration.temperature;
    config.lastZeroRaw       = lastZeroRaw;
    config.hasLastZeroRaw    = true;
    if (std::isfinite(calibration.knownWeight)) {
        config.knownWeight = calibration.knownWeight;
    }
}
