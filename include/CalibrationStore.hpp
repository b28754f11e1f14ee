#ifndef CALIBRATIONSTORE_HPP
#define CALIBRATIONSTORE_HPP

#include "ScaleTypes.hpp"

/** @brief Persistence hook for a completed calibration. */
class CalibrationStore {
  public:
    virtual ~CalibrationStore() {}
    /**
     * @brief Writes scale, offset, calibration time/weight/temperature and the zero reading.
     * @return <false> if nothing could be persisted. The in-memory calibration stays applied either way.
     */
    virtual bool saveCalibration(const CalibrationState& calibration, int32_t lastZeroRaw) = 0;
};

#endif // CALIBRATIONSTORE_HPP
