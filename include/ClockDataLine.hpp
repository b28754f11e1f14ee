#ifndef CLOCKDATALINE_HPP
#define CLOCKDATALINE_HPP

#include <cstdint>
#include "ScaleTypes.hpp"

/**
 * @file ClockDataLine.hpp
 * @brief The two wires of the HX711 serial interface: one clock output (PD_SCK) and one data input (DOUT).
 *
 * The protocol driver only talks to the chip through this interface, so the same bit-banging code runs
 * against real GPIOs or against the simulated chip used in demo mode and in the unit tests.
 */
class ClockDataLine {
  public:
    virtual ~ClockDataLine() {}

    /**
     * @brief Claims the pins. The clock line is left low (chip powered up).
     * @return SCREZ_HARDWARE_UNAVAILABLE if either pin cannot be used.
     */
    virtual ScaleResult_e begin(uint8_t dataPin, uint8_t clockPin) = 0;
    /** @brief Releases the pins. */
    virtual void end() = 0;

    virtual void writeClock(bool high) = 0;
    /** @return The level of DOUT; low means a conversion is ready. */
    virtual bool readData() = 0;

    virtual void delayMicros(uint32_t us) = 0;
    /** @brief Monotonic microsecond counter, wraps freely. */
    virtual uint32_t nowMicros() = 0;

    /** @brief Brackets a pulse train that must not be preempted (a clock-high phase over 60us powers the chip down). */
    virtual void enterCritical() {}
    virtual void exitCritical() {}
};

#endif // CLOCKDATALINE_HPP
