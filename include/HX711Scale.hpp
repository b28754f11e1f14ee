#ifndef HX711SCALE_HPP
#define HX711SCALE_HPP

#include <atomic>
#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"
#include "HX711Protocol.hpp"

// Margin added to the lock wait of a queued caller, on top of the reads it waits behind.
#define SCALE_LOCK_MARGIN_MS (50)

/**
 * @file HX711Scale.hpp
 * @brief Owns the HX711 pin configuration, the calibration model and the session tare, in a thread-safe manner.
 *
 * A single mutex covers "one physical conversion read": every read, and every change to the offset/scale/tare,
 * goes through it, so a reading converted by toReading() always sees a consistent (offset, scale, tare) triple.
 */

class HX711Scale {
  public:
    HX711Scale(ClockDataLine& line, uint32_t readyTimeoutMs = HX711_DEFAULT_READY_TIMEOUT_MS);
    ~HX711Scale();

    /**
     * @brief Claims the pins and selects the gain.
     * @return SCREZ_INVALID_GAIN or SCREZ_HARDWARE_UNAVAILABLE. Never falls back to a default.
     */
    ScaleResult_e configure(const PinConfig& config);
    bool isConfigured() const { return _configured; }
    PinConfig getPinConfig() const { return _pinConfig; }

    void setReadyTimeout(uint32_t timeoutMs);
    uint32_t getReadyTimeout() const { return _protocol.getReadyTimeout(); }

    /** @brief Sample count used by tare(). Clamped to at least 1. */
    void setSamplesPerReading(uint32_t samples);
    uint32_t getSamplesPerReading() const { return _samplesPerReading; }

    ScaleResult_e readRaw(int32_t& rawOut);
    /**
     * @brief Averages `samples` conversions, rounded to the nearest count. All-or-nothing.
     * @param abortFlag Checked between samples; when it becomes true the average is abandoned with SCREZ_CANCELLED.
     */
    ScaleResult_e readAverage(uint32_t samples, int32_t& averageOut, const std::atomic<bool>* abortFlag = nullptr);
    /** @brief readAverage() and toReading() under a single lock hold. */
    ScaleResult_e readReading(uint32_t samples, Reading& readingOut, const std::atomic<bool>* abortFlag = nullptr);

    /**
     * @brief Session-only zero: the current averaged raw value will read as 0 g. Persisted calibration is untouched.
     * @param[out] tareRawOut <optional> The averaged raw value the tare was taken at.
     */
    ScaleResult_e tare(int32_t* tareRawOut = nullptr);
    void clearTare();
    int64_t getTareOffset();

    void setOffset(int64_t offset);
    int64_t getOffset();
    ScaleResult_e setScale(double scale);
    double getScale();

    CalibrationState getCalibration();
    /** @brief Installs a full calibration at once and drops the session tare. */
    ScaleResult_e applyCalibration(const CalibrationState& calibration);

    /**
     * @brief (loadedRaw - zeroRaw) / knownWeight, rejecting weights <= 0, a zero delta and non-finite results.
     */
    static ScaleResult_e computeScale(double knownWeight, int64_t zeroRaw, int64_t loadedRaw, double& scaleOut);
    /** @brief Takes an averaged reading of the loaded cell, then computes the scale against `zeroRaw`. */
    ScaleResult_e computeScale(double knownWeight, int64_t zeroRaw, double& scaleOut, int32_t* loadedRawOut = nullptr,
      const std::atomic<bool>* abortFlag = nullptr);

    /**
     * @brief Pure conversion with the current calibration and tare.
     * Waits for a read in flight instead of converting with a half-updated calibration.
     */
    Reading toReading(int32_t raw);

    ScaleResult_e powerDown();
    ScaleResult_e powerUp();

  private:
    ClockDataLine& _line;
    HX711Protocol _protocol;

    // Guards the chip and the calibration/tare fields below.
    SemaphoreHandle_t _scaleMutex;

    PinConfig _pinConfig;
    bool _configured;
    bool _discardNext; // The next conversion was started with a stale gain.
    uint32_t _samplesPerReading;

    CalibrationState _calibration;
    int64_t _tareOffset;

    bool _lock(uint32_t pendingSamples);
    void _unlock();
    ScaleResult_e _readAverageLocked(uint32_t samples, int32_t& averageOut, const std::atomic<bool>* abortFlag);
    static Reading _convert(int32_t raw, int64_t offset, double scale, int64_t tareOffset);
};

#endif // HX711SCALE_HPP
