#ifndef GPIOCLOCKDATALINE_HPP
#define GPIOCLOCKDATALINE_HPP

#include <Arduino.h>
#include "ClockDataLine.hpp"

/**
 * @file GpioClockDataLine.hpp
 * @brief HX711 wires on two ESP32 GPIOs.
 */
class GpioClockDataLine : public ClockDataLine {
  public:
    GpioClockDataLine();

    ScaleResult_e begin(uint8_t dataPin, uint8_t clockPin) override;
    void end() override;
    void writeClock(bool high) override;
    bool readData() override;
    void delayMicros(uint32_t us) override;
    uint32_t nowMicros() override;
    void enterCritical() override;
    void exitCritical() override;

  private:
    uint8_t _dataPin;
    uint8_t _clockPin;
    bool _claimed;
    portMUX_TYPE _mux;
};

#endif // GPIOCLOCKDATALINE_HPP
