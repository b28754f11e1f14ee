#include <gtest/gtest.h>
#include <atomic>
#include "ScaleReader.hpp"
#include "ReadingQueue.hpp"
#include "SimulatedClockDataLine.hpp"
#include "ScriptedClockDataLine.hpp"
#include "TaskRunner.hpp"

static TickType_t elapsedSince(TickType_t start)
{
    return xTaskGetTickCount() - start;
}

class ScaleReaderTest : public ::testing::Test {
  protected:
    SimulatedClockDataLine sim{ SIM_DEFAULT_BASELINE_RAW, SIM_DEFAULT_COUNTS_PER_GRAM, 2000 };
    HX711Scale scale{ sim, 100 };
    ScaleReader reader{ scale };

    std::atomic<uint32_t> readings{ 0 };
    std::atomic<uint32_t> timeouts{ 0 };
    std::atomic<uint32_t> otherErrors{ 0 };

    void SetUp() override { ASSERT_EQ(SCREZ_OK, scale.configure(PinConfig(5, 6, 128))); }
    void TearDown() override { reader.stop(); }

    ScaleResult_e startCounting(const ReaderConfig& config)
    {
        return reader.start(
          config, [this](const Reading&) { readings++; },
          [this](ScaleResult_e error, const char*) {
              if (error == SCREZ_TIMEOUT) {
                  timeouts++;
              } else {
                  otherErrors++;
              }
          });
    }

    static ReaderConfig fastConfig(double intervalSeconds)
    {
        ReaderConfig config;
        config.samplesPerReading = 2;
        config.intervalSeconds   = intervalSeconds;
        return config;
    }
};

TEST_F(ScaleReaderTest, DeliversAboutOneReadingPerInterval)
{
    ASSERT_EQ(SCREZ_OK, startCounting(fastConfig(0.2)));
    EXPECT_EQ(ReaderState::RUNNING, reader.getState());
    vTaskDelay(pdMS_TO_TICKS(1000));

    TickType_t stopStart = xTaskGetTickCount();
    ASSERT_EQ(SCREZ_OK, reader.stop());
    EXPECT_LE(elapsedSince(stopStart), pdMS_TO_TICKS(200 + 2 * 100 + SCALE_LOCK_MARGIN_MS + READER_STOP_MARGIN_MS));
    EXPECT_EQ(ReaderState::IDLE, reader.getState());

    EXPECT_GE(readings.load(), 4U);
    EXPECT_LE(readings.load(), 6U);
    EXPECT_EQ(0U, timeouts.load());
    EXPECT_EQ(0U, otherErrors.load());

    // Nothing arrives once stopped.
    uint32_t delivered = readings.load();
    vTaskDelay(pdMS_TO_TICKS(300));
    EXPECT_EQ(delivered, readings.load());
}

TEST_F(ScaleReaderTest, StopWakesIntervalSleepEarly)
{
    ASSERT_EQ(SCREZ_OK, startCounting(fastConfig(5.0)));
    vTaskDelay(pdMS_TO_TICKS(100));

    TickType_t stopStart = xTaskGetTickCount();
    ASSERT_EQ(SCREZ_OK, reader.stop());
    EXPECT_LT(elapsedSince(stopStart), pdMS_TO_TICKS(1000));
    EXPECT_EQ(1U, readings.load());
}

TEST_F(ScaleReaderTest, StartTwiceIsRejected)
{
    ASSERT_EQ(SCREZ_OK, startCounting(fastConfig(0.1)));
    EXPECT_EQ(SCREZ_ALREADY_RUNNING, startCounting(fastConfig(0.1)));
    ReadingQueue queue;
    EXPECT_EQ(SCREZ_ALREADY_RUNNING, reader.start(fastConfig(0.1), queue));
    EXPECT_TRUE(reader.isRunning());
}

TEST_F(ScaleReaderTest, StopIsIdempotent)
{
    EXPECT_EQ(SCREZ_OK, reader.stop());
    ASSERT_EQ(SCREZ_OK, startCounting(fastConfig(0.1)));
    EXPECT_EQ(SCREZ_OK, reader.stop());
    EXPECT_EQ(SCREZ_OK, reader.stop());
    EXPECT_EQ(ReaderState::IDLE, reader.getState());

    // And it can run again afterwards.
    ASSERT_EQ(SCREZ_OK, reader.restart());
    EXPECT_TRUE(reader.isRunning());
}

TEST_F(ScaleReaderTest, RejectsInvalidConfig)
{
    ReaderConfig config = fastConfig(0.1);
    config.samplesPerReading = 0;
    EXPECT_EQ(SCREZ_INVALID_CONFIG, startCounting(config));

    config = fastConfig(0.0);
    EXPECT_EQ(SCREZ_INVALID_CONFIG, startCounting(config));

    config               = fastConfig(0.1);
    config.rollingWindow = true;
    config.windowSize    = 0;
    EXPECT_EQ(SCREZ_INVALID_CONFIG, startCounting(config));
    EXPECT_EQ(ReaderState::IDLE, reader.getState());
}

TEST_F(ScaleReaderTest, TimeoutsAreReportedAndSamplingContinues)
{
    sim.setStalled(true);
    ASSERT_EQ(SCREZ_OK, startCounting(fastConfig(0.1)));
    vTaskDelay(pdMS_TO_TICKS(600));

    EXPECT_GE(timeouts.load(), 2U);
    EXPECT_EQ(0U, readings.load());
    EXPECT_TRUE(reader.isRunning());

    sim.setStalled(false);
    vTaskDelay(pdMS_TO_TICKS(600));
    EXPECT_GE(readings.load(), 2U);
    EXPECT_TRUE(reader.isRunning());
    EXPECT_EQ(0U, otherErrors.load());
}

TEST_F(ScaleReaderTest, StopIsBoundedWhileReadIsBlockedOnStalledChip)
{
    sim.setStalled(true);
    ASSERT_EQ(SCREZ_OK, startCounting(fastConfig(0.1)));
    // Lands inside a ready-wait that will run into its 100 ms timeout.
    vTaskDelay(pdMS_TO_TICKS(150));

    ScaleResult_e stopResult = SCREZ_WRONG_STATE;
    TickType_t stopTicks     = 0;
    TaskRunner stopper([&]() {
        TickType_t stopStart = xTaskGetTickCount();
        stopResult           = reader.stop();
        stopTicks            = elapsedSince(stopStart);
    });
    ASSERT_TRUE(stopper.start());
    ASSERT_TRUE(stopper.join(pdMS_TO_TICKS(2000)));

    EXPECT_EQ(SCREZ_OK, stopResult);
    EXPECT_LE(stopTicks, pdMS_TO_TICKS(100 + 2 * 100 + SCALE_LOCK_MARGIN_MS + READER_STOP_MARGIN_MS));
    EXPECT_EQ(ReaderState::IDLE, reader.getState());
    EXPECT_EQ(0U, readings.load());
    EXPECT_GE(timeouts.load(), 1U);
}

TEST_F(ScaleReaderTest, SampleRateAfterFailedCycleSpansOneInterval)
{
    ReadingQueue queue(32);
    ASSERT_EQ(SCREZ_OK, reader.start(fastConfig(0.2), queue));

    ReaderEvent event;
    ASSERT_TRUE(queue.receive(event, pdMS_TO_TICKS(1000)));
    ASSERT_EQ(ReaderEventType::READING, event.type);

    // The reader sleeps until its next cycle, which then finds the chip stalled.
    sim.setStalled(true);
    bool sawError = queue.receive(event, pdMS_TO_TICKS(1000));
    sim.setStalled(false);
    EXPECT_TRUE(sawError);
    EXPECT_EQ(ReaderEventType::ERROR, event.type);

    bool sawReading = queue.receive(event, pdMS_TO_TICKS(1000));
    EXPECT_EQ(SCREZ_OK, reader.stop());
    ASSERT_TRUE(sawReading);
    ASSERT_EQ(ReaderEventType::READING, event.type);
    // 0.2 s between the failed cycle and this one: 5 Hz, not the 2.5 Hz of two intervals.
    EXPECT_GT(event.reading.sampleRateHz, 4.0);
    EXPECT_LT(event.reading.sampleRateHz, 6.5);
}

TEST_F(ScaleReaderTest, TareWhileRunningIsSerialized)
{
    ASSERT_EQ(SCREZ_OK, startCounting(fastConfig(0.05)));
    vTaskDelay(pdMS_TO_TICKS(100));

    scale.setSamplesPerReading(4);
    ASSERT_EQ(SCREZ_OK, scale.tare());
    EXPECT_NEAR(SIM_DEFAULT_BASELINE_RAW, scale.getTareOffset(), 1);
    EXPECT_TRUE(reader.isRunning());
    EXPECT_EQ(0U, otherErrors.load());
}

TEST_F(ScaleReaderTest, ReportsSampleRate)
{
    ReadingQueue queue(16);
    ASSERT_EQ(SCREZ_OK, reader.start(fastConfig(0.1), queue));
    vTaskDelay(pdMS_TO_TICKS(550));
    ASSERT_EQ(SCREZ_OK, reader.stop());

    ReaderEvent event;
    int seen = 0;
    while (queue.receive(event, 0)) {
        ASSERT_EQ(ReaderEventType::READING, event.type);
        EXPECT_GT(event.reading.sampleRateHz, 5.0);
        EXPECT_LT(event.reading.sampleRateHz, 20.0);
        seen++;
    }
    EXPECT_GE(seen, 4);
}

TEST(ScaleReaderNotConfigured, RefusesToStart)
{
    SimulatedClockDataLine sim;
    HX711Scale scale(sim);
    ScaleReader reader(scale);
    ReadingQueue queue;
    EXPECT_EQ(SCREZ_NOT_CONFIGURED, reader.start(ReaderConfig(), queue));
    EXPECT_EQ(ReaderState::IDLE, reader.getState());
    EXPECT_EQ(SCREZ_WRONG_STATE, reader.restart());
}

TEST(ScaleReaderWindow, ReportsRollingMeanOfGrams)
{
    ScriptedClockDataLine line;
    ReadingQueue queue(32);
    HX711Scale scale(line, 20);
    ScaleReader reader(scale);

    line.pushSample(0); // discarded after configure
    line.pushSample(10);
    line.pushSample(20);
    line.pushSample(30);
    line.pushSample(40);
    ASSERT_EQ(SCREZ_OK, scale.configure(PinConfig(5, 6, 128)));

    ReaderConfig config;
    config.samplesPerReading = 1;
    config.intervalSeconds   = 0.05;
    config.rollingWindow     = true;
    config.windowSize        = 3;
    ASSERT_EQ(SCREZ_OK, reader.start(config, queue));
    vTaskDelay(pdMS_TO_TICKS(400));
    ASSERT_EQ(SCREZ_OK, reader.stop());

    const double expected[] = { 10.0, 15.0, 20.0, 30.0 };
    ReaderEvent event;
    for (double grams : expected) {
        ASSERT_TRUE(queue.receive(event, 0));
        ASSERT_EQ(ReaderEventType::READING, event.type);
        EXPECT_DOUBLE_EQ(grams, event.reading.grams);
        EXPECT_NEAR(grams * STANDARD_GRAVITY_MS2 / 1000.0, event.reading.newtons, 1e-9);
    }
    // Script exhausted: the loop kept going and reported timeouts.
    ASSERT_TRUE(queue.receive(event, 0));
    EXPECT_EQ(ReaderEventType::ERROR, event.type);
    EXPECT_EQ(SCREZ_TIMEOUT, event.error);
}

TEST(ScaleReaderFatal, ConfigurationErrorStopsTheLoop)
{
    ScriptedClockDataLine line;
    HX711Scale scale(line, 20);
    ScaleReader reader(scale);
    std::atomic<uint32_t> fatal(0);

    line.pushSample(0);
    ASSERT_EQ(SCREZ_OK, scale.configure(PinConfig(5, 6, 128)));
    ReaderConfig config;
    config.samplesPerReading = 1;
    config.intervalSeconds   = 0.05;
    ASSERT_EQ(SCREZ_OK, reader.start(
                          config, [](const Reading&) {},
                          [&fatal](ScaleResult_e error, const char*) {
                              if (error == SCREZ_NOT_CONFIGURED) {
                                  fatal++;
                              }
                          }));

    // Losing the pins mid-run: reconfiguring onto an unusable pin pair leaves the scale unconfigured.
    line.setFailBegin(true);
    EXPECT_EQ(SCREZ_HARDWARE_UNAVAILABLE, scale.configure(PinConfig(5, 6, 128)));
    vTaskDelay(pdMS_TO_TICKS(300));

    // Reported once, then the task is gone.
    EXPECT_EQ(ReaderState::IDLE, reader.getState());
    EXPECT_EQ(1U, fatal.load());
    EXPECT_EQ(SCREZ_OK, reader.stop());
}

TEST(ScaleReaderFatal, RestartAfterFatalErrorStopsForReal)
{
    SimulatedClockDataLine sim(SIM_DEFAULT_BASELINE_RAW, SIM_DEFAULT_COUNTS_PER_GRAM, 2000);
    HX711Scale scale(sim, 100);
    ScaleReader reader(scale);
    std::atomic<uint32_t> readings(0);
    std::atomic<uint32_t> fatal(0);

    ASSERT_EQ(SCREZ_OK, scale.configure(PinConfig(5, 6, 128)));
    ReaderConfig config;
    config.samplesPerReading = 1;
    config.intervalSeconds   = 0.05;
    ASSERT_EQ(SCREZ_OK, reader.start(
                          config, [&readings](const Reading&) { readings++; },
                          [&fatal](ScaleResult_e error, const char*) {
                              if (isFatalScaleResult(error)) {
                                  fatal++;
                              }
                          }));

    // A shared pin cannot be claimed, the scale ends up unconfigured and the task exits on its own.
    EXPECT_EQ(SCREZ_HARDWARE_UNAVAILABLE, scale.configure(PinConfig(5, 5, 128)));
    for (int i = 0; i < 50 && reader.getState() != ReaderState::IDLE; i++) {
        vTaskDelay(pdMS_TO_TICKS(20));
    }
    ASSERT_EQ(ReaderState::IDLE, reader.getState());
    EXPECT_EQ(1U, fatal.load());

    // The exited task left its exit token behind; the new run must not be mistaken for gone.
    ASSERT_EQ(SCREZ_OK, scale.configure(PinConfig(5, 6, 128)));
    ASSERT_EQ(SCREZ_OK, reader.restart());
    vTaskDelay(pdMS_TO_TICKS(250));
    EXPECT_TRUE(reader.isRunning());

    ASSERT_EQ(SCREZ_OK, reader.stop());
    EXPECT_EQ(ReaderState::IDLE, reader.getState());
    uint32_t delivered = readings.load();
    EXPECT_GE(delivered, 2U);
    vTaskDelay(pdMS_TO_TICKS(300));
    EXPECT_EQ(delivered, readings.load());
}

TEST(ScaleReaderLifetime, DestructorOutwaitsSlowSink)
{
    SimulatedClockDataLine sim(SIM_DEFAULT_BASELINE_RAW, SIM_DEFAULT_COUNTS_PER_GRAM, 2000);
    HX711Scale scale(sim, 100);
    ASSERT_EQ(SCREZ_OK, scale.configure(PinConfig(5, 6, 128)));

    std::atomic<bool> inSink(false);
    std::atomic<bool> sinkDone(false);
    TickType_t destroyStart = 0;
    {
        ScaleReader reader(scale);
        ReaderConfig config;
        config.samplesPerReading = 1;
        config.intervalSeconds   = 0.05;
        // The first reading keeps the task busy far past the 300 ms stop bound.
        ASSERT_EQ(SCREZ_OK, reader.start(
                              config,
                              [&](const Reading&) {
                                  if (!sinkDone.load()) {
                                      inSink = true;
                                      vTaskDelay(pdMS_TO_TICKS(800));
                                      sinkDone = true;
                                  }
                              },
                              [](ScaleResult_e, const char*) {}));
        for (int i = 0; i < 100 && !inSink.load(); i++) {
            vTaskDelay(pdMS_TO_TICKS(10));
        }
        ASSERT_TRUE(inSink.load());
        destroyStart = xTaskGetTickCount();
    }
    EXPECT_TRUE(sinkDone.load());
    EXPECT_GE(elapsedSince(destroyStart), pdMS_TO_TICKS(500));
}
