#include "Acquisition_loop.h"
#include "Fake_transport.h"
#include "Gpib_errors.h"
#include <gtest/gtest.h>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace
{
    /// @brief Keeps every sample it receives; optionally fails on a given record.
    class RecordingSink : public SampleSink
    {
    public:
        std::size_t failAt = 0;

        void append(const Sample& sample) override
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (failAt != 0 && _samples.size() + 1 == failAt)
                throw std::runtime_error("disk full");
            _samples.push_back(sample);
        }

        std::vector<Sample> samples() const
        {
            std::lock_guard<std::mutex> lock(_mutex);
            return _samples;
        }

    private:
        mutable std::mutex _mutex;
        std::vector<Sample> _samples;
    };

    /// @brief Collects what the loop hands to its handlers and lets the test wait for it.
    class Observer
    {
    public:
        void sample(const Sample& sample)
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _samples.push_back(sample);
            _changed.notify_all();
        }

        void fault(const FaultReport& report)
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _faults.push_back(report);
            _changed.notify_all();
        }

        void warning(const std::string& reason)
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _warnings.push_back(reason);
        }

        bool waitForSamples(std::size_t count, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
        {
            std::unique_lock<std::mutex> lock(_mutex);
            return _changed.wait_for(lock, timeout, [&] { return _samples.size() >= count; });
        }

        bool waitForFault(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
        {
            std::unique_lock<std::mutex> lock(_mutex);
            return _changed.wait_for(lock, timeout, [&] { return !_faults.empty(); });
        }

        std::vector<Sample> samples() const { std::lock_guard<std::mutex> lock(_mutex); return _samples; }
        std::vector<FaultReport> faults() const { std::lock_guard<std::mutex> lock(_mutex); return _faults; }
        std::vector<std::string> warnings() const { std::lock_guard<std::mutex> lock(_mutex); return _warnings; }

    private:
        mutable std::mutex _mutex;
        std::condition_variable _changed;
        std::vector<Sample> _samples;
        std::vector<FaultReport> _faults;
        std::vector<std::string> _warnings;
    };
}

class AcquisitionLoopTest : public ::testing::Test
{
protected:
    FakeTransport* fake = nullptr;
    std::unique_ptr<InstrumentSession> session;
    RecordingSink sink;
    Observer observer;

    void SetUp() override
    {
        fake = new FakeTransport();
        session.reset(new InstrumentSession(std::unique_ptr<Transport>(fake), makeDialect("nanovoltmeter")));
        session->connect("GPIB0::15::INSTR");
        MeasurementConfig config;
        config.range = RangeSetting::fixed(1e-3);
        config.integrationNplc = 1.0;
        config.averagingCount = 10;
        session->configure(config);
    }

    AcquisitionLoop::SampleHandler onSample()
    {
        return [this](const Sample& sample) { observer.sample(sample); };
    }

    AcquisitionLoop::FaultHandler onFault()
    {
        return [this](const FaultReport& report) { observer.fault(report); };
    }
};

TEST_F(AcquisitionLoopTest, DeliversReadingsInOrderThenAnInvalidSample)
{
    fake->scriptRead(ReadEvent::reply("1.234E-03"));
    fake->scriptRead(ReadEvent::reply("1.236E-03"));
    for (int i = 0; i < 3; ++i)
        fake->scriptRead(ReadEvent::timeout());

    AcquisitionLoop loop(*session, sink);
    SessionState stateAtInvalid = SessionState::Disconnected;
    loop.setWarningHandler([this](const std::string& reason) { observer.warning(reason); });
    loop.start(std::chrono::milliseconds(1),
        [&](const Sample& sample) {
            observer.sample(sample);
            if (!sample.valid)
            {
                stateAtInvalid = session->state();
                loop.stop();
            }
        },
        onFault());
    loop.wait();

    std::vector<Sample> written = sink.samples();
    ASSERT_EQ(3u, written.size());
    EXPECT_TRUE(written[0].valid);
    EXPECT_DOUBLE_EQ(1.234e-3, written[0].value);
    EXPECT_TRUE(written[1].valid);
    EXPECT_DOUBLE_EQ(1.236e-3, written[1].value);
    EXPECT_FALSE(written[2].valid);
    EXPECT_EQ(SessionState::Acquiring, stateAtInvalid);
    EXPECT_LE(written[0].timestamp, written[1].timestamp);
    EXPECT_LE(written[1].timestamp, written[2].timestamp);
    EXPECT_LE(written[0].elapsedSeconds, written[1].elapsedSeconds);

    std::vector<Sample> handled = observer.samples();
    ASSERT_EQ(3u, handled.size());
    EXPECT_DOUBLE_EQ(1.236e-3, handled[1].value);
    EXPECT_EQ(1u, observer.warnings().size());
    EXPECT_TRUE(observer.faults().empty());

    EXPECT_EQ(5u, fake->count(":READ?"));
    EXPECT_EQ(2, fake->clearCount());
    EXPECT_EQ(3u, loop.samplesDelivered());
    EXPECT_FALSE(loop.isRunning());
    EXPECT_EQ(SessionState::Configured, session->state());
}

TEST_F(AcquisitionLoopTest, LiteralTimeoutRepliesBecomeAnInvalidSample)
{
    fake->scriptRead(ReadEvent::reply("1.234E-03"));
    fake->scriptRead(ReadEvent::reply("1.236E-03"));
    for (int i = 0; i < 3; ++i)
        fake->scriptRead(ReadEvent::reply("TIMEOUT"));

    AcquisitionLoop loop(*session, sink);
    loop.setWarningHandler([this](const std::string& reason) { observer.warning(reason); });
    loop.start(std::chrono::milliseconds(1),
        [&](const Sample& sample) {
            observer.sample(sample);
            if (!sample.valid)
                loop.stop();
        },
        onFault());
    loop.wait();

    std::vector<Sample> written = sink.samples();
    ASSERT_EQ(3u, written.size());
    EXPECT_DOUBLE_EQ(1.234e-3, written[0].value);
    EXPECT_DOUBLE_EQ(1.236e-3, written[1].value);
    EXPECT_FALSE(written[2].valid);
    EXPECT_EQ(3u, session->lastAttemptCount());
    EXPECT_EQ(5u, fake->count(":READ?"));

    std::vector<std::string> warnings = observer.warnings();
    ASSERT_EQ(1u, warnings.size());
    EXPECT_NE(std::string::npos, warnings[0].find("TIMEOUT"));
    EXPECT_TRUE(observer.faults().empty());
}

TEST_F(AcquisitionLoopTest, SessionIsAcquiringWhileRunning)
{
    fake->defaultReading = "1.0E-03";
    AcquisitionLoop loop(*session, sink);
    loop.start(std::chrono::milliseconds(5), onSample(), onFault());
    ASSERT_TRUE(observer.waitForSamples(1));
    EXPECT_TRUE(loop.isRunning());
    EXPECT_EQ(SessionState::Acquiring, session->state());
    EXPECT_THROW(loop.start(std::chrono::milliseconds(5), onSample(), onFault()), SessionStateError);

    loop.stop();
    loop.wait();
    EXPECT_EQ(SessionState::Configured, session->state());
}

TEST_F(AcquisitionLoopTest, IntervalIsAMinimumSpacing)
{
    fake->defaultReading = "1.0E-03";
    AcquisitionLoop loop(*session, sink);
    loop.start(std::chrono::milliseconds(50), onSample(), onFault());
    ASSERT_TRUE(observer.waitForSamples(3));
    loop.stop();
    loop.wait();

    std::vector<Sample> handled = observer.samples();
    for (std::size_t i = 1; i < 3; ++i)
        EXPECT_GE(handled[i].elapsedSeconds - handled[i - 1].elapsedSeconds, 0.045);
}

TEST_F(AcquisitionLoopTest, StopInterruptsTheIdleInterval)
{
    fake->defaultReading = "1.0E-03";
    AcquisitionLoop loop(*session, sink);
    loop.start(std::chrono::seconds(60), onSample(), onFault());
    ASSERT_TRUE(observer.waitForSamples(1));

    std::chrono::steady_clock::time_point before = std::chrono::steady_clock::now();
    loop.stop();
    loop.wait();
    EXPECT_LT(std::chrono::steady_clock::now() - before, std::chrono::seconds(5));
    EXPECT_EQ(1u, sink.samples().size());
}

TEST_F(AcquisitionLoopTest, PausedTimeIsExcludedFromElapsed)
{
    fake->defaultReading = "1.0E-03";
    AcquisitionLoop loop(*session, sink);
    loop.start(std::chrono::milliseconds(10),
        [&](const Sample& sample) {
            if (observer.samples().empty())
                loop.pause();
            observer.sample(sample);
        },
        onFault());
    ASSERT_TRUE(observer.waitForSamples(1));
    EXPECT_TRUE(loop.isPaused());

    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    EXPECT_EQ(1u, sink.samples().size());

    loop.resume();
    ASSERT_TRUE(observer.waitForSamples(2));
    loop.stop();
    loop.wait();

    std::vector<Sample> handled = observer.samples();
    EXPECT_LT(handled[1].elapsedSeconds, 0.25);
}

TEST_F(AcquisitionLoopTest, DisconnectEndsTheRunWithAFault)
{
    fake->scriptRead(ReadEvent::reply("1.234E-03"));
    fake->scriptRead(ReadEvent::disconnect());

    AcquisitionLoop loop(*session, sink);
    loop.start(std::chrono::milliseconds(1), onSample(), onFault());
    ASSERT_TRUE(observer.waitForFault());
    loop.wait();

    std::vector<FaultReport> faults = observer.faults();
    ASSERT_EQ(1u, faults.size());
    EXPECT_EQ(1u, faults[0].samplesDelivered);
    EXPECT_FALSE(faults[0].reason.empty());
    EXPECT_EQ(1u, sink.samples().size());
    EXPECT_FALSE(loop.isRunning());
    EXPECT_EQ(SessionState::Faulted, session->state());

    std::size_t before = fake->written().size();
    EXPECT_THROW(session->acquire(), InstrumentUnresponsive);
    EXPECT_EQ(before, fake->written().size());
    EXPECT_EQ(1u, observer.faults().size());
    EXPECT_THROW(loop.start(std::chrono::milliseconds(1), onSample(), onFault()), InstrumentUnresponsive);
}

TEST_F(AcquisitionLoopTest, SinkFailureEndsTheRunWithAFault)
{
    fake->defaultReading = "1.0E-03";
    sink.failAt = 2;

    AcquisitionLoop loop(*session, sink);
    loop.start(std::chrono::milliseconds(1), onSample(), onFault());
    ASSERT_TRUE(observer.waitForFault());
    loop.wait();

    std::vector<FaultReport> faults = observer.faults();
    ASSERT_EQ(1u, faults.size());
    EXPECT_EQ(0u, faults[0].reason.find("sample sink failed"));
    EXPECT_EQ(1u, faults[0].samplesDelivered);
    EXPECT_EQ(1u, observer.samples().size());
    EXPECT_EQ(SessionState::Configured, session->state());
}

TEST_F(AcquisitionLoopTest, HandlerExceptionDoesNotStopTheRun)
{
    fake->defaultReading = "1.0E-03";
    AcquisitionLoop loop(*session, sink);
    loop.start(std::chrono::milliseconds(1),
        [&](const Sample& sample) {
            observer.sample(sample);
            if (observer.samples().size() == 1)
                throw std::runtime_error("operator display closed");
        },
        onFault());
    ASSERT_TRUE(observer.waitForSamples(3));
    loop.stop();
    loop.wait();
    EXPECT_TRUE(observer.faults().empty());
}

TEST_F(AcquisitionLoopTest, NonStandardHandlerExceptionDoesNotStopTheRun)
{
    fake->defaultReading = "1.0E-03";
    AcquisitionLoop loop(*session, sink);
    loop.start(std::chrono::milliseconds(1),
        [&](const Sample& sample) {
            observer.sample(sample);
            if (observer.samples().size() == 1)
                throw 42;
        },
        onFault());
    ASSERT_TRUE(observer.waitForSamples(3));
    loop.stop();
    loop.wait();
    EXPECT_TRUE(observer.faults().empty());
    EXPECT_EQ(observer.samples().size(), sink.samples().size());
}

TEST_F(AcquisitionLoopTest, NonStandardSinkExceptionEndsTheRunWithAFault)
{
    class ThrowingSink : public SampleSink
    {
    public:
        void append(const Sample&) override { throw 7; }
    } throwing;

    fake->defaultReading = "1.0E-03";
    AcquisitionLoop loop(*session, throwing);
    loop.start(std::chrono::milliseconds(1), onSample(), onFault());
    ASSERT_TRUE(observer.waitForFault());
    loop.wait();

    std::vector<FaultReport> faults = observer.faults();
    ASSERT_EQ(1u, faults.size());
    EXPECT_EQ("sample sink failed: unknown exception", faults[0].reason);
    EXPECT_EQ(0u, faults[0].samplesDelivered);
    EXPECT_EQ(SessionState::Configured, session->state());
}

TEST_F(AcquisitionLoopTest, WarningHandlerIsFixedWhileRunning)
{
    fake->defaultReading = "1.0E-03";
    AcquisitionLoop loop(*session, sink);
    loop.setWarningHandler([this](const std::string& reason) { observer.warning(reason); });
    loop.start(std::chrono::milliseconds(5), onSample(), onFault());
    ASSERT_TRUE(observer.waitForSamples(1));
    EXPECT_THROW(loop.setWarningHandler(AcquisitionLoop::WarningHandler()), SessionStateError);

    loop.stop();
    loop.wait();
    EXPECT_NO_THROW(loop.setWarningHandler(AcquisitionLoop::WarningHandler()));
}

TEST_F(AcquisitionLoopTest, StartNeedsAConfiguredSession)
{
    session->close();
    AcquisitionLoop loop(*session, sink);
    EXPECT_THROW(loop.start(std::chrono::milliseconds(1), onSample(), onFault()), SessionStateError);
    EXPECT_FALSE(loop.isRunning());
}

TEST_F(AcquisitionLoopTest, LoopRestartsAfterWait)
{
    fake->defaultReading = "1.0E-03";
    AcquisitionLoop loop(*session, sink);
    loop.start(std::chrono::milliseconds(1), onSample(), onFault());
    ASSERT_TRUE(observer.waitForSamples(2));
    loop.stop();
    loop.wait();
    std::size_t firstRun = observer.samples().size();

    loop.start(std::chrono::milliseconds(1), onSample(), onFault());
    ASSERT_TRUE(observer.waitForSamples(firstRun + 2));
    loop.stop();
    loop.wait();
    EXPECT_GE(loop.samplesDelivered(), 2u);
    EXPECT_EQ(observer.samples().size(), sink.samples().size());
}

TEST_F(AcquisitionLoopTest, WaitFromAHandlerIsRefused)
{
    fake->defaultReading = "1.0E-03";
    AcquisitionLoop loop(*session, sink);
    bool refused = false;
    loop.start(std::chrono::milliseconds(1),
        [&](const Sample& sample) {
            try
            {
                loop.wait();
            }
            catch (const SessionStateError&)
            {
                refused = true;
            }
            loop.stop();
            observer.sample(sample);
        },
        onFault());
    ASSERT_TRUE(observer.waitForSamples(1));
    loop.wait();
    EXPECT_TRUE(refused);
}

TEST_F(AcquisitionLoopTest, DestructorStopsTheWorker)
{
    fake->defaultReading = "1.0E-03";
    {
        AcquisitionLoop loop(*session, sink);
        loop.start(std::chrono::milliseconds(1), onSample(), onFault());
        ASSERT_TRUE(observer.waitForSamples(1));
    }
    EXPECT_EQ(SessionState::Configured, session->state());
}
