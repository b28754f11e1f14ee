#ifndef SCALECONFIG_HPP
#define SCALECONFIG_HPP

#include <string>
#include "ScaleTypes.hpp"
#include "board_pinout.h"

#define SCALE_CONFIG_MIN_INTERVAL_S  (0.05)
#define SCALE_CONFIG_MAX_DECIMALS    (6)
#define CALIBRATION_STALE_AFTER_S    (7L * 24L * 3600L)
#define ZERO_DRIFT_LIMIT_GRAMS       (5.0)
#define ZERO_DRIFT_MIN_SAMPLES       (3)

/**
 * @file ScaleConfig.hpp
 * @brief Persisted settings of the scale, and their JSON form.
 *
 * Optional calibration metadata uses sentinels: calibrationTime 0, calibrationTemp/calibrationWeight NAN,
 * hasLastZeroRaw false. They serialize as JSON null.
 */
struct ScaleConfig {
    uint8_t doutPin;
    uint8_t sckPin;
    uint16_t gain;
    double scale;
    int64_t offset;
    uint32_t samples;
    double interval; ///< Seconds between reader cycles
    double knownWeight;
    uint8_t decimals;
    bool rollingWindow;
    uint32_t windowSize;
    uint32_t readyTimeoutMs;
    bool demoMode;

    time_t calibrationTime;
    float calibrationTemp;
    double calibrationWeight;
    bool hasLastZeroRaw;
    int32_t lastZeroRaw;

    ScaleConfig();
};

enum CalibrationHealth_e : uint8_t
{
    CALHEALTH_GOOD = 0,
    CALHEALTH_WARN,
    CALHEALTH_BAD,
};

const char* getCalibrationHealthString(const CalibrationHealth_e value);

/**
 * @brief BAD without a calibration time or with the default/invalid scale, WARN once older than 7 days.
 * @param[out] messageOut <optional> Operator-facing text.
 */
CalibrationHealth_e evaluateCalibrationStatus(const ScaleConfig& config, time_t now, const char** messageOut = nullptr);

/** @brief Absolute distance in grams between a fresh zero reading and the calibrated offset. */
double zeroDriftGrams(int64_t zeroRaw, int64_t offset, double scale);

bool serializeScaleConfig(const ScaleConfig& config, std::string& jsonOut);
/**
 * @brief Missing keys keep their default; interval, samples and decimals are clamped into range.
 * @return <false> on malformed JSON, in which case configOut holds the defaults.
 */
bool deserializeScaleConfig(const char* json, ScaleConfig& configOut);

ScaleResult_e validateScaleConfig(const ScaleConfig& config);

PinConfig toPinConfig(const ScaleConfig& config);
ReaderConfig toReaderConfig(const ScaleConfig& config);
CalibrationState toCalibrationState(const ScaleConfig& config);
/** @brief Only touches the zero-reading fields, whatever calibration the settings currently carry. */
void recordLastZeroRaw(ScaleConfig& config, int32_t zeroRaw);
/** @brief Copies a committed calibration and its zero reading back into the persisted settings. */
void applyCalibrationToConfig(ScaleConfig& config, const CalibrationState& calibration, int32_t lastZeroRaw);

#endif // SCALECONFIG_HPP
