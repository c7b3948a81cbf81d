#pragma once
#include "Csv_sink.h"
#include "Instrument_session.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

/// @brief Why a run ended on its own.
struct FaultReport
{
	std::string reason;
	std::size_t samplesDelivered;
};

/// @brief Drives InstrumentSession::acquire() on a worker thread and fans the samples out.
///
/// Each iteration acquires one sample, appends it to the sink and hands it to
/// onSample, strictly in order. The interval hint is a minimum spacing between
/// iteration starts, never a fixed period. stop() is cooperative: an acquire()
/// in flight always completes.
class AcquisitionLoop
{
public:
	typedef std::function<void(const Sample&)> SampleHandler;
	typedef std::function<void(const FaultReport&)> FaultHandler;
	typedef std::function<void(const std::string&)> WarningHandler;

	AcquisitionLoop(InstrumentSession& session, SampleSink& sink);
	~AcquisitionLoop();

	AcquisitionLoop(const AcquisitionLoop&) = delete;
	AcquisitionLoop& operator=(const AcquisitionLoop&) = delete;

	/// @brief Starts a run. The session must be Configured; a previous run must have been waited for.
	void start(std::chrono::milliseconds intervalHint, SampleHandler onSample, FaultHandler onFault);
	/// @brief Requests the end of the run. Idempotent, callable from any thread including the handlers.
	void stop();
	/// @brief Blocks until the worker has exited. Must not be called from a handler.
	void wait();
	void pause();
	void resume();

	/// @brief Reported for every invalid sample, with the session's failure text. Rejected while a run is active.
	void setWarningHandler(WarningHandler onWarning);

	bool isRunning() const { return _running.load(); }
	bool isPaused() const { return _paused.load(); }
	std::size_t samplesDelivered() const { return _delivered.load(); }

private:
	InstrumentSession& _session;
	SampleSink& _sink;
	std::chrono::milliseconds _interval;
	SampleHandler _onSample;
	FaultHandler _onFault;
	WarningHandler _onWarning;

	std::thread _worker;
	std::mutex _mutex;
	std::condition_variable _wake;
	std::atomic<bool> _running;
	std::atomic<bool> _stopRequested;
	std::atomic<bool> _paused;
	std::atomic<std::size_t> _delivered;

	void run();
	void reportFault(const std::string& reason);
	bool idleUntil(std::chrono::steady_clock::time_point deadline);
};
