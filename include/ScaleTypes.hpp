#ifndef SCALETYPES_HPP
#define SCALETYPES_HPP

#include <cstdint>
#include <cmath>
#include <time.h>

/**
 * @file ScaleTypes.hpp
 * @brief Result codes and plain data structures shared by the HX711 driver, the reader task and the calibration procedure.
 */

/** @brief Standard gravity, used to derive newtons from grams. */
#define STANDARD_GRAVITY_MS2 (9.80665)

enum ScaleResult_e : uint8_t
{
    SCREZ_OK = 0,
    SCREZ_TIMEOUT, // The chip did not signal conversion-ready in time. Recoverable.
    SCREZ_INVALID_GAIN,
    SCREZ_INVALID_SCALE,
    SCREZ_INVALID_CALIBRATION,
    SCREZ_INVALID_CONFIG,
    SCREZ_ALREADY_RUNNING,
    SCREZ_HARDWARE_UNAVAILABLE, // Pins could not be claimed. Fatal.
    SCREZ_NOT_CONFIGURED,
    SCREZ_CANCELLED,
    SCREZ_WRONG_STATE,
    SCREZ_STORAGE_FAILED,
    SCREZ_MUTEX_ACQUISITION,
};

const char* getScaleResultString(const ScaleResult_e value);

/** @brief Configuration-level failures stop the reader instead of being retried on the next cycle. */
bool isFatalScaleResult(const ScaleResult_e value);

struct PinConfig {
    uint8_t dataPin;
    uint8_t clockPin;
    uint16_t gain; // 128, 64 or 32

    PinConfig() : dataPin(0), clockPin(0), gain(128) {}
    PinConfig(uint8_t dout, uint8_t sck, uint16_t g) : dataPin(dout), clockPin(sck), gain(g) {}
};

/**
 * @struct CalibrationState
 * @brief Persisted offset/scale model. `scale` is in raw counts per gram.
 */
struct CalibrationState {
    int64_t offset;       ///< Raw counts at zero load
    double scale;         ///< Raw counts per gram, never 0
    time_t calibratedAt;  ///< 0 when never calibrated
    double knownWeight;   ///< Grams used for the last calibration, NAN if unknown
    float temperature;    ///< Chip temperature at calibration time, NAN if unknown

    CalibrationState() : offset(0), scale(1.0), calibratedAt(0), knownWeight(NAN), temperature(NAN) {}

    /** @brief The 1.0/0 pair is what an uncalibrated scale starts with. */
    bool isDefault() const { return scale == 1.0 && offset == 0; }
};

struct Reading {
    int32_t raw;
    double grams;
    double newtons;
    double sampleRateHz;
    time_t timestamp;

    Reading() : raw(0), grams(0.0), newtons(0.0), sampleRateHz(0.0), timestamp(0) {}
};

struct ReaderConfig {
    uint32_t samplesPerReading;
    double intervalSeconds;
    bool rollingWindow;
    uint32_t windowSize;

    ReaderConfig() : samplesPerReading(8), intervalSeconds(0.2), rollingWindow(false), windowSize(3) {}
};

#endif // SCALETYPES_HPP
