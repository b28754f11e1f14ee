#include "HX711Protocol.hpp"
#include "esp_log.h"

static const char* TAG = "HX711Protocol";

HX711Protocol::HX711Protocol(ClockDataLine& line, uint32_t readyTimeoutMs)
    : _line(line), _readyTimeoutMs(readyTimeoutMs), _gain(128), _extraPulses(1)
{}

ScaleResult_e HX711Protocol::pulsesForGain(uint16_t gain, uint8_t& pulsesOut)
{
    switch (gain) {
        case 128:
            pulsesOut = 1;
            return SCREZ_OK;
        case 32:
            pulsesOut = 2;
            return SCREZ_OK;
        case 64:
            pulsesOut = 3;
            return SCREZ_OK;
        default:
            break;
    }
    return SCREZ_INVALID_GAIN;
}

int32_t HX711Protocol::signExtend24(uint32_t value)
{
    value &= 0x00FFFFFFUL;
    if (value & 0x00800000UL) {
        value |= 0xFF000000UL;
    }
    return (int32_t)value;
}

ScaleResult_e HX711Protocol::setGain(uint16_t gain)
{
    uint8_t pulses = 0;
    if (pulsesForGain(gain, pulses) != SCREZ_OK) {
        ESP_LOGE(TAG, "Unsupported gain %u (expected 128, 64 or 32).", gain);
        return SCREZ_INVALID_GAIN;
    }
    _gain        = gain;
    _extraPulses = pulses;
    return SCREZ_OK;
}

bool HX711Protocol::isReady()
{
    return !_line.readData();
}

ScaleResult_e HX711Protocol::waitReady()
{
    const uint32_t timeoutUs = _readyTimeoutMs * 1000UL;
    const uint32_t start     = _line.nowMicros();
    while (!isReady()) {
        if ((uint32_t)(_line.nowMicros() - start) >= timeoutUs) {
            return SCREZ_TIMEOUT;
        }
        _line.delayMicros(READY_POLL_US);
    }
    return SCREZ_OK;
}

void HX711Protocol::_pulse()
{
    _line.writeClock(true);
    _line.delayMicros(CLOCK_HALF_PERIOD_US);
    _line.writeClock(false);
    _line.delayMicros(CLOCK_HALF_PERIOD_US);
}

ScaleResult_e HX711Protocol::readRaw(int32_t& valueOut)
{
    if (waitReady() != SCREZ_OK) {
        ESP_LOGD(TAG, "DOUT stayed high for %u ms.", _readyTimeoutMs);
        return SCREZ_TIMEOUT;
    }

    uint32_t value = 0;
    _line.enterCritical();
    for (uint8_t bit = 0; bit < HX711_DATA_BITS; bit++) {
        // DOUT shifts on the rising edge and holds until the next one, so sample once the falling edge settled.
        _pulse();
        value = (value << 1) | (_line.readData() ? 1UL : 0UL);
    }
    for (uint8_t i = 0; i < _extraPulses; i++) {
        _pulse();
    }
    _line.exitCritical();

    valueOut = signExtend24(value);
    return SCREZ_OK;
}

void HX711Protocol::powerDown()
{
    _line.writeClock(false);
    _line.writeClock(true);
    _line.delayMicros(POWER_DOWN_HOLD_US);
}

void HX711Protocol::powerUp()
{
    // The chip resets to channel A gain 128 when it wakes up.
    _line.writeClock(false);
}
