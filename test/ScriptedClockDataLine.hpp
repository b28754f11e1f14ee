#ifndef SCRIPTEDCLOCKDATALINE_HPP
#define SCRIPTEDCLOCKDATALINE_HPP

#include <atomic>
#include <deque>
#include "ClockDataLine.hpp"
#include "HX711Protocol.hpp"

/**
 * @brief Test double that shifts out a scripted list of conversions on a virtual microsecond clock.
 *
 * DOUT is low (ready) whenever a scripted sample is left and the line is not stalled. Once the script is
 * exhausted every ready-wait times out. Time only moves through delayMicros(), so timeouts are exact and instant.
 */
class ScriptedClockDataLine : public ClockDataLine {
  public:
    ScriptedClockDataLine()
        : _failBegin(false), _stalled(false), _begun(false), _clockHigh(false), _pulses(0), _lastExtra(0), _latched(0),
          _nowUs(0), _criticalDepth(0), _maxCriticalDepth(0), _readsCompleted(0)
    {}

    void pushSample(int32_t raw) { _samples.push_back((uint32_t)raw & 0x00FFFFFFUL); }
    void pushSamples(int32_t raw, size_t count)
    {
        for (size_t i = 0; i < count; i++) {
            pushSample(raw);
        }
    }
    size_t remaining() const { return _samples.size(); }

    void setFailBegin(bool fail) { _failBegin = fail; }
    void setStalled(bool stalled) { _stalled = stalled; }

    ScaleResult_e begin(uint8_t dataPin, uint8_t clockPin) override
    {
        if (_failBegin || dataPin == clockPin) {
            return SCREZ_HARDWARE_UNAVAILABLE;
        }
        _begun = true;
        return SCREZ_OK;
    }

    void end() override { _begun = false; }

    void writeClock(bool high) override
    {
        if (high && !_clockHigh) {
            if (_pulses > 0) {
                _pulses++;
            } else if (_isReady()) {
                _latched = _samples.front();
                _samples.pop_front();
                _pulses = 1;
            }
        }
        _clockHigh = high;
    }

    bool readData() override
    {
        if (_pulses > HX711_DATA_BITS) {
            _lastExtra = _pulses - HX711_DATA_BITS;
            _pulses    = 0;
            _readsCompleted++;
        }
        if (_pulses == 0) {
            return !_isReady();
        }
        return ((_latched >> (HX711_DATA_BITS - _pulses)) & 1UL) != 0;
    }

    void delayMicros(uint32_t us) override { _nowUs += us; }
    uint32_t nowMicros() override { return _nowUs; }

    void enterCritical() override
    {
        _criticalDepth++;
        if (_criticalDepth > _maxCriticalDepth) {
            _maxCriticalDepth = _criticalDepth;
        }
    }
    void exitCritical() override { _criticalDepth--; }

    /** @brief Trailing pulses after the 24 data bits of the last read. */
    uint8_t getLastExtraPulses() const { return _pulses > HX711_DATA_BITS ? _pulses - HX711_DATA_BITS : _lastExtra; }
    bool isClockHigh() const { return _clockHigh; }
    bool isBegun() const { return _begun; }
    int getCriticalDepth() const { return _criticalDepth; }
    int getMaxCriticalDepth() const { return _maxCriticalDepth; }

  private:
    std::deque<uint32_t> _samples;
    bool _failBegin;
    std::atomic<bool> _stalled;
    bool _begun;
    bool _clockHigh;
    uint8_t _pulses;
    uint8_t _lastExtra;
    uint32_t _latched;
    uint32_t _nowUs;
    int _criticalDepth;
    int _maxCriticalDepth;
    uint32_t _readsCompleted;

    bool _isReady() const { return _begun && !_stalled && !_samples.empty(); }
};

#endif // SCRIPTEDCLOCKDATALINE_HPP
