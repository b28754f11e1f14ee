#ifndef CALIBRATIONPROCEDURE_HPP
#define CALIBRATIONPROCEDURE_HPP

#include <atomic>
#include <functional>
#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"
#include "CalibrationStore.hpp"
#include "HX711Scale.hpp"
#include "ScaleReader.hpp"

#define CALIBRATION_MIN_SAMPLES     (3)
#define CALIBRATION_DEFAULT_SAMPLES (10)

enum class CalibrationStep : uint8_t
{
    STEP_IDLE,              ///< Not calibrating
    STEP_AWAIT_ZERO,        ///< Operator must empty the scale, then call captureZero()
    STEP_CAPTURING_ZERO,    ///< Averaged zero read in progress
    STEP_AWAIT_WEIGHT,      ///< Operator must place the known weight, then call captureWeight()
    STEP_CAPTURING_WEIGHT,  ///< Averaged loaded read in progress
    STEP_DONE,              ///< New calibration applied (and persisted unless saving failed)
};

const char* getCalibrationStepString(const CalibrationStep step);

/**
 * @file CalibrationProcedure.hpp
 * @brief Two-point calibration as a state machine: empty scale, then a known weight.
 *
 * The capture calls block the calling task for one averaged read. cancel() may come from any other task: it
 * aborts the read between samples and the capture returns SCREZ_CANCELLED without touching the calibration.
 * A reader that was running when the procedure began is paused and resumed on DONE or cancel.
 */
class CalibrationProcedure {
  public:
    CalibrationProcedure(HX711Scale& scale, ScaleReader& reader, CalibrationStore& store);
    ~CalibrationProcedure();

    /** @brief Chip temperature sampled when the calibration is committed. NAN when unset. */
    void setTemperatureSource(std::function<float()> source) { _temperatureSource = source; }

    /**
     * @brief IDLE/DONE -> AWAIT_ZERO.
     * @param samples Conversions per averaged read, raised to CALIBRATION_MIN_SAMPLES.
     */
    ScaleResult_e begin(uint32_t samples = CALIBRATION_DEFAULT_SAMPLES);
    /** @brief AWAIT_ZERO -> AWAIT_WEIGHT, or back to AWAIT_ZERO on a failed read. */
    ScaleResult_e captureZero();
    /**
     * @brief AWAIT_WEIGHT -> DONE, or back to AWAIT_WEIGHT on a failed read or an unusable scale.
     * @return SCREZ_STORAGE_FAILED if the calibration was applied but could not be persisted.
     */
    ScaleResult_e captureWeight(double knownWeight);
    ScaleResult_e cancel();

    CalibrationStep getStep();
    int32_t getZeroRaw();
    uint32_t getSamples() const { return _samples; }
    /** @brief The calibration committed by the last run that reached DONE. */
    CalibrationState getResult();

  private:
    HX711Scale& _scale;
    ScaleReader& _reader;
    CalibrationStore& _store;
    std::function<float()> _temperatureSource;

    SemaphoreHandle_t _stepMutex;
    CalibrationStep _step;
    std::atomic<bool> _cancelRequested;
    uint32_t _samples;
    int32_t _zeroRaw;
    bool _resumeReader;
    CalibrationState _result;

    bool _lock();
    void _unlock();
    void _resumeReaderIfPaused();
};

#endif // CALIBRATIONPROCEDURE_HPP
