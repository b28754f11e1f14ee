#include "SimulatedClockDataLine.hpp"
#include "HX711Protocol.hpp"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "esp_log.h"

static const char* TAG = "SimHX711";

static constexpr int32_t RAW_MAX = 0x7FFFFF;
static constexpr int32_t RAW_MIN = -0x800000;

SimulatedClockDataLine::SimulatedClockDataLine(int32_t baselineRaw, double countsPerGram, uint32_t conversionPeriodUs)
    : _baselineRaw(baselineRaw),
      _countsPerGram(countsPerGram),
      _loadGrams(0.0),
      _swingGrams(0.0),
      _swingPeriodMs(SIM_DEFAULT_SWING_PERIOD_MS),
      _noiseCounts(0),
      _stalled(false),
      _conversionPeriodUs(conversionPeriodUs),
      _begun(false),
      _clockHigh(false),
      _poweredDown(false),
      _highUs(0),
      _pulses(0),
      _selectedPulses(1),
      _latched(0),
      _conversionStartUs(0),
      _settleUs(0),
      _conversionsRead(0),
      _pendingUs(0),
      _noiseState(0x2545F491UL)
{}

ScaleResult_e SimulatedClockDataLine::begin(uint8_t dataPin, uint8_t clockPin)
{
    if (dataPin == clockPin) {
        ESP_LOGE(TAG, "DOUT and PD_SCK cannot share pin %u.", dataPin);
        return SCREZ_HARDWARE_UNAVAILABLE;
    }
    _begun             = true;
    _clockHigh         = false;
    _poweredDown       = false;
    _pulses            = 0;
    _selectedPulses    = 1;
    _conversionStartUs = nowMicros();
    _settleUs          = SIM_SETTLING_CONVERSIONS * _conversionPeriodUs;
    ESP_LOGI(TAG, "Simulated HX711 on DOUT=%u, PD_SCK=%u, baseline %ld counts.", dataPin, clockPin, (long)_baselineRaw);
    return SCREZ_OK;
}

void SimulatedClockDataLine::end()
{
    _begun = false;
}

void SimulatedClockDataLine::setLoadSwing(double swingGrams, uint32_t periodMs)
{
    _swingGrams    = swingGrams;
    _swingPeriodMs = periodMs > 0 ? periodMs : SIM_DEFAULT_SWING_PERIOD_MS;
}

uint32_t SimulatedClockDataLine::nowMicros()
{
    return (uint32_t)(xTaskGetTickCount() * portTICK_PERIOD_MS * 1000UL);
}

void SimulatedClockDataLine::delayMicros(uint32_t us)
{
    if (_clockHigh && !_poweredDown) {
        _highUs += us;
        if (_highUs > SIM_POWER_DOWN_THRESHOLD_US) {
            _poweredDown = true;
            _pulses      = 0;
        }
    }

    // Sub-tick delays accumulate until they add up to a whole tick.
    const uint32_t tickUs = portTICK_PERIOD_MS * 1000UL;
    _pendingUs += us;
    if (_pendingUs >= tickUs) {
        TickType_t ticks = _pendingUs / tickUs;
        _pendingUs -= ticks * tickUs;
        vTaskDelay(ticks);
    }
}

bool SimulatedClockDataLine::_conversionDone()
{
    return (uint32_t)(nowMicros() - _conversionStartUs) >= (_conversionPeriodUs + _settleUs);
}

int32_t SimulatedClockDataLine::_noise()
{
    uint32_t amplitude = _noiseCounts;
    if (amplitude == 0) {
        return 0;
    }
    // xorshift32
    _noiseState ^= _noiseState << 13;
    _noiseState ^= _noiseState >> 17;
    _noiseState ^= _noiseState << 5;
    return (int32_t)(_noiseState % (2 * amplitude + 1)) - (int32_t)amplitude;
}

void SimulatedClockDataLine::_latchSample()
{
    double load  = _loadGrams;
    double swing = _swingGrams;
    if (swing != 0.0) {
        double t = (double)(xTaskGetTickCount() * portTICK_PERIOD_MS) / (double)_swingPeriodMs;
        load += swing * std::sin(t);
    }

    // Channel A at gain 64 sees half the counts of gain 128; channel B (gain 32) a quarter.
    double gainFactor = 1.0;
    if (_selectedPulses == 3) {
        gainFactor = 0.5;
    } else if (_selectedPulses == 2) {
        gainFactor = 0.25;
    }

    int64_t value = (int64_t)_baselineRaw + std::llround(load * _countsPerGram * gainFactor) + _noise();
    if (value > RAW_MAX) {
        value = RAW_MAX;
    } else if (value < RAW_MIN) {
        value = RAW_MIN;
    }
    _latched = (uint32_t)value & 0x00FFFFFFUL;
}

void SimulatedClockDataLine::_finishRead()
{
    uint8_t extra = _pulses - HX711_DATA_BITS;
    if (extra >= 1 && extra <= 3) {
        _selectedPulses = extra;
    }
    _pulses   = 0;
    _settleUs = 0;
    _conversionsRead++;
}

uint8_t SimulatedClockDataLine::getSelectedExtraPulses() const
{
    if (_pulses > HX711_DATA_BITS) {
        return _pulses - HX711_DATA_BITS;
    }
    return _selectedPulses;
}

void SimulatedClockDataLine::writeClock(bool high)
{
    if (!_begun) {
        return;
    }
    if (high && !_clockHigh) {
        _highUs = 0;
        if (!_poweredDown) {
            if (_pulses > 0) {
                _pulses++;
            } else if (!_stalled && _conversionDone()) {
                _latchSample();
                _pulses = 1;
            }
        }
    } else if (!high && _clockHigh) {
        if (_poweredDown) {
            // Waking up: back to channel A gain 128, then settle.
            _poweredDown       = false;
            _pulses            = 0;
            _selectedPulses    = 1;
            _conversionStartUs = nowMicros();
            _settleUs          = SIM_SETTLING_CONVERSIONS * _conversionPeriodUs;
        } else if (_pulses > HX711_DATA_BITS) {
            // The next conversion starts after the last trailing pulse.
            _conversionStartUs = nowMicros();
        }
    }
    _clockHigh = high;
}

bool SimulatedClockDataLine::readData()
{
    if (!_begun || _poweredDown) {
        return true;
    }
    if (_pulses > HX711_DATA_BITS) {
        _finishRead();
    }
    if (_pulses == 0) {
        return _stalled || !_conversionDone();
    }
    return ((_latched >> (HX711_DATA_BITS - _pulses)) & 1UL) != 0;
}
