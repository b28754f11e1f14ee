#include "GpioClockDataLine.hpp"
#include "esp_log.h"

static const char* TAG = "GpioClockDataLine";

GpioClockDataLine::GpioClockDataLine() : _dataPin(0), _clockPin(0), _claimed(false)
{
    portMUX_INITIALIZE(&_mux);
}

ScaleResult_e GpioClockDataLine::begin(uint8_t dataPin, uint8_t clockPin)
{
    if (dataPin == clockPin) {
        ESP_LOGE(TAG, "DOUT and PD_SCK cannot share GPIO%u.", dataPin);
        return SCREZ_HARDWARE_UNAVAILABLE;
    }
    if (!GPIO_IS_VALID_GPIO(dataPin)) {
        ESP_LOGE(TAG, "GPIO%u cannot be used as DOUT input.", dataPin);
        return SCREZ_HARDWARE_UNAVAILABLE;
    }
    if (!GPIO_IS_VALID_OUTPUT_GPIO(clockPin)) {
        ESP_LOGE(TAG, "GPIO%u cannot drive PD_SCK.", clockPin);
        return SCREZ_HARDWARE_UNAVAILABLE;
    }

    _dataPin  = dataPin;
    _clockPin = clockPin;
    pinMode(_clockPin, OUTPUT);
    pinMode(_dataPin, INPUT);
    digitalWrite(_clockPin, LOW);
    _claimed = true;
    ESP_LOGI(TAG, "Claimed GPIO%u (DOUT) and GPIO%u (PD_SCK).", _dataPin, _clockPin);
    return SCREZ_OK;
}

void GpioClockDataLine::end()
{
    if (!_claimed) {
        return;
    }
    // Leave PD_SCK low so the chip stays powered until someone claims it again.
    digitalWrite(_clockPin, LOW);
    pinMode(_dataPin, INPUT);
    _claimed = false;
}

void GpioClockDataLine::writeClock(bool high)
{
    digitalWrite(_clockPin, high ? HIGH : LOW);
}

bool GpioClockDataLine::readData()
{
    return digitalRead(_dataPin) == HIGH;
}

void GpioClockDataLine::delayMicros(uint32_t us)
{
    // Long waits (the ready poll) yield to other tasks; bit timing busy-waits.
    if (us >= 1000) {
        TickType_t ticks = pdMS_TO_TICKS(us / 1000);
        vTaskDelay(ticks > 0 ? ticks : 1);
    } else {
        delayMicroseconds(us);
    }
}

uint32_t GpioClockDataLine::nowMicros()
{
    return micros();
}

void GpioClockDataLine::enterCritical()
{
    portENTER_CRITICAL(&_mux);
}

void GpioClockDataLine::exitCritical()
{
    portEXIT_CRITICAL(&_mux);
}
