#ifndef SIMULATEDCLOCKDATALINE_HPP
#define SIMULATEDCLOCKDATALINE_HPP

#include <atomic>
#include "ClockDataLine.hpp"

#define SIM_DEFAULT_BASELINE_RAW       (84250)
#define SIM_DEFAULT_COUNTS_PER_GRAM    (420.0)
#define SIM_DEFAULT_CONVERSION_US      (12500UL) // 80 SPS
#define SIM_DEFAULT_SWING_PERIOD_MS    (1600)
#define SIM_SETTLING_CONVERSIONS       (4)
#define SIM_POWER_DOWN_THRESHOLD_US    (60)

/**
 * @file SimulatedClockDataLine.hpp
 * @brief Software model of an HX711 sitting behind the two serial wires, for demo mode and tests.
 *
 * Models conversion-ready timing, MSB-first shifting on rising clock edges, gain selection by the number of
 * trailing pulses, power-down after 60us of clock high and the settling time after power-up. Time is the
 * FreeRTOS tick counter, so the bounded ready-wait of the protocol driver behaves as it does on hardware.
 */
class SimulatedClockDataLine : public ClockDataLine {
  public:
    SimulatedClockDataLine(int32_t baselineRaw = SIM_DEFAULT_BASELINE_RAW, double countsPerGram = SIM_DEFAULT_COUNTS_PER_GRAM,
      uint32_t conversionPeriodUs = SIM_DEFAULT_CONVERSION_US);

    ScaleResult_e begin(uint8_t dataPin, uint8_t clockPin) override;
    void end() override;
    void writeClock(bool high) override;
    bool readData() override;
    void delayMicros(uint32_t us) override;
    uint32_t nowMicros() override;

    /** @brief Simulated load on the cell, in grams at gain 128. */
    void setLoad(double grams) { _loadGrams = grams; }
    /** @brief Adds swing * sin(t / period) to the load. A zero swing disables it. */
    void setLoadSwing(double swingGrams, uint32_t periodMs = SIM_DEFAULT_SWING_PERIOD_MS);
    /** @brief Uniform noise of +/- `counts` on every conversion. */
    void setNoise(uint32_t counts) { _noiseCounts = counts; }
    /** @brief When stalled, DOUT never goes low. */
    void setStalled(bool stalled) { _stalled = stalled; }
    void setConversionPeriod(uint32_t us) { _conversionPeriodUs = us; }

    /** @brief Trailing pulses seen after the 24 data bits of the last read (1, 2 or 3). */
    uint8_t getSelectedExtraPulses() const;
    uint32_t getConversionsRead() const { return _conversionsRead; }
    bool isPoweredDown() const { return _poweredDown; }
    bool isBegun() const { return _begun; }

  private:
    int32_t _baselineRaw;
    double _countsPerGram;
    std::atomic<double> _loadGrams;
    std::atomic<double> _swingGrams;
    uint32_t _swingPeriodMs;
    std::atomic<uint32_t> _noiseCounts;
    std::atomic<bool> _stalled;
    std::atomic<uint32_t> _conversionPeriodUs;

    bool _begun;
    bool _clockHigh;
    bool _poweredDown;
    uint32_t _highUs;        // Time spent with the clock high since the last rising edge
    uint8_t _pulses;         // Clock pulses into the current read, 0 when idle
    uint8_t _selectedPulses; // Gain selection applying to the conversion in progress
    uint32_t _latched;       // 24-bit word being shifted out
    uint32_t _conversionStartUs;
    uint32_t _settleUs;
    uint32_t _conversionsRead;
    uint32_t _pendingUs;
    uint32_t _noiseState;

    bool _conversionDone();
    void _latchSample();
    void _finishRead();
    int32_t _noise();
};

#endif // SIMULATEDCLOCKDATALINE_HPP
