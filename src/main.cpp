#include <Arduino.h>
#include "esp_log.h"

#include "board_pinout.h"
#include "ConfigManager.hpp"
#include "GpioClockDataLine.hpp"
#include "SimulatedClockDataLine.hpp"
#include "HX711Scale.hpp"
#include "ScaleReader.hpp"
#include "ReadingQueue.hpp"
#include "CalibrationProcedure.hpp"

#define DEMO_BASE_LOAD_GRAMS  (250.0)
#define DEMO_SWING_GRAMS      (40.0)
#define DEMO_NOISE_COUNTS     (60)
#define CONSOLE_LINE_MAX      (24)

// --- Global Objects ---
ConfigManager configManager("BridgeScale");
GpioClockDataLine gpioLine;
SimulatedClockDataLine demoLine;
ReadingQueue readingQueue;

// Bound to the GPIO or the simulated line once the stored config is known.
static HX711Scale* scale                 = nullptr;
static ScaleReader* reader               = nullptr;
static CalibrationProcedure* calibration = nullptr;

static ScaleConfig config;
static volatile uint8_t displayDecimals = 2;
static bool chipPoweredDown             = false;

static const char* TAG = "main";

// Serial console state machine for multi-step commands
enum class SerialCmdState : uint8_t
{
    IDLE,
    CAL_AWAITING_ZERO,
    CAL_AWAITING_WEIGHT
};
static SerialCmdState serialCmdState = SerialCmdState::IDLE;
static char lineBuf[CONSOLE_LINE_MAX];
static size_t lineLen = 0;

// --- Prototypes ---
void consoleTask(void* pvParameters);
static void printHelp();
static void printStatus();
static void startReading();
static void stopReading();
static void checkZeroDrift();
static void handleCalibrationInput(int charVal);

void setup()
{
    CONSOLE_SERIAL.setTxBufferSize(1024);
    CONSOLE_SERIAL.begin(CONSOLE_BAUD_RATE);
    // Wait a moment for serial to initialize
    delay(1000);
    esp_log_level_set("*", esp_log_level_t::ESP_LOG_INFO);
    CONSOLE_SERIAL.setDebugOutput(true);

    ESP_LOGI(TAG, "--- BridgeScale Starting Up ---");

    if (!configManager.begin()) {
        ESP_LOGE(TAG, "Fatal: NVS unavailable, settings will not persist.");
    }
    configManager.loadScaleConfig(config);
    displayDecimals = config.decimals;

    ScaleResult_e res = validateScaleConfig(config);
    if (res != SCREZ_OK) {
        ESP_LOGE(TAG, "Stored configuration is invalid (%s). Fix it or factory reset with 'f'.", getScaleResultString(res));
    }

    ClockDataLine* line = &gpioLine;
    if (config.demoMode) {
        demoLine.setLoad(DEMO_BASE_LOAD_GRAMS);
        demoLine.setLoadSwing(DEMO_SWING_GRAMS, SIM_DEFAULT_SWING_PERIOD_MS);
        demoLine.setNoise(DEMO_NOISE_COUNTS);
        line = &demoLine;
        ESP_LOGW(TAG, "Demo mode: readings come from a simulated HX711.");
    }

    scale       = new HX711Scale(*line, config.readyTimeoutMs);
    reader      = new ScaleReader(*scale);
    calibration = new CalibrationProcedure(*scale, *reader, configManager);
    calibration->setTemperatureSource([]() { return temperatureRead(); });

    scale->setSamplesPerReading(config.samples);
    if (scale->applyCalibration(toCalibrationState(config)) != SCREZ_OK) {
        ESP_LOGE(TAG, "Stored calibration rejected, keeping the uncalibrated default.");
    }

    res = scale->configure(toPinConfig(config));
    if (res != SCREZ_OK) {
        // Surfaced once; the reader refuses to start until the pins are fixed.
        ESP_LOGE(TAG, "Fatal: HX711 unavailable on DOUT=%u SCK=%u: %s", config.doutPin, config.sckPin, getScaleResultString(res));
    }

    xTaskCreate(consoleTask, "Console", 3072, &readingQueue, 4, NULL);

    printStatus();
    printHelp();
    ESP_LOGI(TAG, "--- Setup Complete ---");
}

void loop()
{
    if (!CONSOLE_SERIAL.available()) {
        vTaskDelay(pdMS_TO_TICKS(50));
        return;
    }
    int charVal = CONSOLE_SERIAL.read();

    // Handle multi-step command states before the main switch
    if (serialCmdState != SerialCmdState::IDLE) {
        handleCalibrationInput(charVal);
        return;
    }

    switch (charVal) {
        case 's':
        case 'S':
            startReading();
            break;
        case 'x':
        case 'X':
            stopReading();
            break;
        case 't':
        case 'T': {
            int32_t tareRaw   = 0;
            ScaleResult_e res = scale->tare(&tareRaw);
            if (res == SCREZ_OK) {
                CONSOLE_SERIAL.printf("Tared at raw %ld.\r\n", (long)tareRaw);
                if (!configManager.saveLastZeroRaw(tareRaw)) {
                    CONSOLE_SERIAL.println("Warning: zero reading was not saved.");
                }
                // The live settings may hold a calibration that never made it to NVS.
                recordLastZeroRaw(config, tareRaw);
            } else {
                CONSOLE_SERIAL.printf("Tare failed: %s\r\n", getScaleResultString(res));
            }
        } break;
        case 'c':
        case 'C': {
            ScaleResult_e res = calibration->begin(config.samples);
            if (res == SCREZ_OK) {
                CONSOLE_SERIAL.printf("\r\n--- Calibration ---\r\n");
                CONSOLE_SERIAL.printf("Empty the scale, then press Enter ('c' to cancel).\r\n");
                serialCmdState = SerialCmdState::CAL_AWAITING_ZERO;
            } else {
                CONSOLE_SERIAL.printf("Cannot calibrate: %s\r\n", getScaleResultString(res));
            }
        } break;
        case 'p':
        case 'P':
            printStatus();
            break;
        case 'd':
        case 'D':
            config.demoMode = !config.demoMode;
            if (configManager.saveScaleConfig(config)) {
                CONSOLE_SERIAL.printf("Demo mode %s. Restarting...\r\n", config.demoMode ? "enabled" : "disabled");
                stopReading();
                CONSOLE_SERIAL.flush();
                ESP.restart();
            } else {
                config.demoMode = !config.demoMode;
                CONSOLE_SERIAL.println("Could not save the demo mode setting.");
            }
            break;
        case 'r':
        case 'R': {
            int32_t raw       = 0;
            ScaleResult_e res = scale->readRaw(raw);
            if (res == SCREZ_OK) {
                Reading reading = scale->toReading(raw);
                CONSOLE_SERIAL.printf("raw %ld -> %.*f g\r\n", (long)raw, displayDecimals, reading.grams);
            } else {
                CONSOLE_SERIAL.printf("Read failed: %s\r\n", getScaleResultString(res));
            }
        } break;
        case 'z':
        case 'Z': {
            ScaleResult_e res;
            if (chipPoweredDown) {
                res = scale->powerUp();
            } else {
                stopReading();
                res = scale->powerDown();
            }
            if (res == SCREZ_OK) {
                chipPoweredDown = !chipPoweredDown;
                CONSOLE_SERIAL.printf("HX711 powered %s.\r\n", chipPoweredDown ? "down" : "up");
            } else {
                CONSOLE_SERIAL.printf("Power control failed: %s\r\n", getScaleResultString(res));
            }
        } break;
        case 'f':
        case 'F':
            stopReading();
            if (configManager.factoryReset()) {
                CONSOLE_SERIAL.println("Settings erased. Restarting...");
                CONSOLE_SERIAL.flush();
                ESP.restart();
            } else {
                CONSOLE_SERIAL.println("Factory reset failed.");
            }
            break;
        case 'h':
        case 'H':
        case '?':
            printHelp();
            break;
        default:
            break;
    }
}

static void printHelp()
{
    CONSOLE_SERIAL.println("Commands: s start, x stop, t tare, c calibrate, p status, d demo on/off, r raw read, z power down/up, f factory reset");
}

static void printStatus()
{
    const char* message        = nullptr;
    CalibrationHealth_e health = evaluateCalibrationStatus(config, time(nullptr), &message);
    CalibrationState current   = scale->getCalibration();

    CONSOLE_SERIAL.println("--- BridgeScale ---");
    CONSOLE_SERIAL.printf("  Pins:         DOUT=%u SCK=%u gain %u%s\r\n", config.doutPin, config.sckPin, config.gain,
      config.demoMode ? " (demo)" : "");
    CONSOLE_SERIAL.printf("  Sampling:     %u samples every %.3f s, window %s/%u\r\n", config.samples, config.interval,
      config.rollingWindow ? "on" : "off", config.windowSize);
    CONSOLE_SERIAL.printf("  Calibration:  scale %.6f counts/g, offset %lld, tare %lld\r\n", current.scale, (long long)current.offset,
      (long long)scale->getTareOffset());
    if (config.calibrationTime != 0) {
        CONSOLE_SERIAL.printf("  Calibrated:   %ld with %.1f g at %.1f C\r\n", (long)config.calibrationTime, config.calibrationWeight,
          config.calibrationTemp);
    }
    CONSOLE_SERIAL.printf("  Status:       [%s] %s\r\n", getCalibrationHealthString(health), message);
    CONSOLE_SERIAL.printf("  Reader:       %s, %u readings dropped\r\n", getReaderStateString(reader->getState()),
      readingQueue.getDroppedCount());
}

static void checkZeroDrift()
{
    if (!config.hasLastZeroRaw) {
        return;
    }
    uint32_t samples = config.samples < ZERO_DRIFT_MIN_SAMPLES ? ZERO_DRIFT_MIN_SAMPLES : config.samples;
    int32_t zeroRaw  = 0;
    if (scale->readAverage(samples, zeroRaw) != SCREZ_OK) {
        // Non-blocking: a failed check does not keep the reader from starting.
        return;
    }
    CalibrationState current = scale->getCalibration();
    double drift             = zeroDriftGrams(zeroRaw, current.offset, current.scale);
    if (drift > ZERO_DRIFT_LIMIT_GRAMS) {
        ESP_LOGW(TAG, "Zero drifted by %.1f g since calibration, consider recalibrating.", drift);
        CONSOLE_SERIAL.printf("Warning: zero drifted by %.1f g, recalibration advised.\r\n", drift);
    }
}

static void startReading()
{
    if (reader->isRunning()) {
        CONSOLE_SERIAL.println("Already reading.");
        return;
    }
    checkZeroDrift();
    readingQueue.clear();
    ScaleResult_e res = reader->start(toReaderConfig(config), readingQueue);
    if (res != SCREZ_OK) {
        CONSOLE_SERIAL.printf("Cannot start reading: %s\r\n", getScaleResultString(res));
    }
}

static void stopReading()
{
    ScaleResult_e res = reader->stop();
    if (res != SCREZ_OK) {
        CONSOLE_SERIAL.printf("Reader did not stop: %s\r\n", getScaleResultString(res));
    }
}

static void handleCalibrationInput(int charVal)
{
    // CRLF terminals: the LF must not confirm the next step too.
    static int lastChar = 0;
    bool crlf           = (charVal == '\n' && lastChar == '\r');
    lastChar            = charVal;
    if (crlf) {
        return;
    }

    if (charVal == 'c' || charVal == 'C') {
        calibration->cancel();
        CONSOLE_SERIAL.println("\r\nCalibration cancelled.");
        serialCmdState = SerialCmdState::IDLE;
        lineLen        = 0;
        return;
    }

    if (serialCmdState == SerialCmdState::CAL_AWAITING_ZERO) {
        if (charVal != '\r' && charVal != '\n') {
            return;
        }
        CONSOLE_SERIAL.println("Capturing zero...");
        ScaleResult_e res = calibration->captureZero();
        if (res == SCREZ_OK) {
            CONSOLE_SERIAL.printf("Zero at raw %ld. Place the known weight, type its grams (Enter = %.1f g).\r\n",
              (long)calibration->getZeroRaw(), config.knownWeight);
            serialCmdState = SerialCmdState::CAL_AWAITING_WEIGHT;
            lineLen        = 0;
        } else {
            CONSOLE_SERIAL.printf("Zero capture failed (%s). Press Enter to retry.\r\n", getScaleResultString(res));
        }
        return;
    }

    // CAL_AWAITING_WEIGHT
    if (charVal != '\r' && charVal != '\n') {
        if (lineLen < sizeof(lineBuf) - 1 && ((charVal >= '0' && charVal <= '9') || charVal == '.')) {
            lineBuf[lineLen++] = (char)charVal;
            CONSOLE_SERIAL.write((uint8_t)charVal);
        }
        return;
    }
    lineBuf[lineLen] = '\0';
    double knownWeight = lineLen > 0 ? strtod(lineBuf, NULL) : config.knownWeight;
    lineLen            = 0;

    CONSOLE_SERIAL.printf("\r\nCapturing %.1f g...\r\n", knownWeight);
    ScaleResult_e res = calibration->captureWeight(knownWeight);
    if (res == SCREZ_OK || res == SCREZ_STORAGE_FAILED) {
        CalibrationState result = calibration->getResult();
        CONSOLE_SERIAL.printf("Calibrated: scale %.6f counts/g, offset %lld.\r\n", result.scale, (long long)result.offset);
        if (res == SCREZ_STORAGE_FAILED) {
            CONSOLE_SERIAL.println("Warning: calibration is active but was not saved.");
            applyCalibrationToConfig(config, result, calibration->getZeroRaw());
        } else {
            config = configManager.getConfig();
        }
        serialCmdState = SerialCmdState::IDLE;
    } else {
        CONSOLE_SERIAL.printf("Weight capture failed (%s). Type the weight again or 'c' to cancel.\r\n", getScaleResultString(res));
    }
}

void consoleTask(void* pvParameters)
{
    ReadingQueue* queue = (ReadingQueue*)pvParameters;
    ESP_LOGI(TAG, "Console task started.");
    ReaderEvent event;

    for (;;) {
        if (!queue->receive(event, pdMS_TO_TICKS(1000))) {
            continue;
        }
        if (event.type == ReaderEventType::READING) {
            CONSOLE_SERIAL.printf("%.*f g  %.3f N  (raw %ld, %.1f Hz)\r\n", displayDecimals, event.reading.grams, event.reading.newtons,
              (long)event.reading.raw, event.reading.sampleRateHz);
        } else {
            CONSOLE_SERIAL.printf("HX711 error: %s\r\n", event.message);
        }
    }
}
