#ifndef HX711PROTOCOL_HPP
#define HX711PROTOCOL_HPP

#include "ClockDataLine.hpp"

// At 10 SPS a conversion takes 100ms and the datasheet gives 400ms of settling after power-up or a channel change.
#define HX711_DEFAULT_READY_TIMEOUT_MS (500)

#define HX711_DATA_BITS                (24)

/**
 * @file HX711Protocol.hpp
 * @brief Bit-serial read sequence of the HX711 24-bit bridge ADC.
 *
 * Not reentrant: one instance per pin pair, and the caller serializes calls (see HX711Scale).
 */
class HX711Protocol {
  public:
    HX711Protocol(ClockDataLine& line, uint32_t readyTimeoutMs = HX711_DEFAULT_READY_TIMEOUT_MS);

    /**
     * @brief Maps a gain to the number of clock pulses issued after the 24 data bits.
     * Datasheet: 25 pulses -> channel A gain 128, 26 -> channel B gain 32, 27 -> channel A gain 64.
     * @param[out] pulsesOut 1, 2 or 3.
     * @return SCREZ_INVALID_GAIN for anything other than 128, 64 or 32.
     */
    static ScaleResult_e pulsesForGain(uint16_t gain, uint8_t& pulsesOut);
    /** @brief Sign-extends a 24-bit two's-complement value. */
    static int32_t signExtend24(uint32_t value);

    /** @brief Selects the gain applied to the conversion following the next read. */
    ScaleResult_e setGain(uint16_t gain);
    uint16_t getGain() const { return _gain; }
    uint8_t getExtraPulses() const { return _extraPulses; }

    void setReadyTimeout(uint32_t timeoutMs) { _readyTimeoutMs = timeoutMs; }
    uint32_t getReadyTimeout() const { return _readyTimeoutMs; }

    bool isReady();
    /** @brief Polls DOUT until it goes low, bounded by the ready timeout. */
    ScaleResult_e waitReady();

    /**
     * @brief Performs exactly one conversion read.
     * @param[out] valueOut Signed sample, untouched on failure.
     * @return SCREZ_TIMEOUT if the chip never signalled ready. No retry.
     */
    ScaleResult_e readRaw(int32_t& valueOut);

    void powerDown();
    void powerUp();

  private:
    ClockDataLine& _line;
    uint32_t _readyTimeoutMs;
    uint16_t _gain;
    uint8_t _extraPulses;

    static constexpr uint32_t CLOCK_HALF_PERIOD_US = 1;
    static constexpr uint32_t READY_POLL_US        = 1000;
    static constexpr uint32_t POWER_DOWN_HOLD_US   = 80; // > 60us with PD_SCK high

    void _pulse();
};

#endif // HX711PROTOCOL_HPP
