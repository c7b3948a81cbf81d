#include "Acquisition_loop.h"
#include "Gpib_errors.h"
#include <iostream>
using std::cerr;

namespace
{
    /// @brief Operator handlers are fire-and-forget: nothing they throw reaches the loop.
    template <typename Handler, typename Argument>
    void notify(const char* name, const Handler& handler, const Argument& argument)
    {
        if (!handler)
            return;
        try
        {
            handler(argument);
        }
        catch (const std::exception& e)
        {
            cerr << "** ERROR in " << name << " handler: " << e.what() << '\n';
        }
        catch (...)
        {
            cerr << "** ERROR in " << name << " handler: unknown exception\n";
        }
    }
}

AcquisitionLoop::AcquisitionLoop(InstrumentSession& session, SampleSink& sink)
    : _session(session), _sink(sink), _interval(0),
      _running(false), _stopRequested(false), _paused(false), _delivered(0)
{
}

AcquisitionLoop::~AcquisitionLoop()
{
    stop();
    if (_worker.joinable() && _worker.get_id() != std::this_thread::get_id())
        _worker.join();
}

void AcquisitionLoop::start(std::chrono::milliseconds intervalHint, SampleHandler onSample, FaultHandler onFault)
{
    if (_running.load())
        throw SessionStateError("acquisition loop is already running");
    wait();

    _session.beginAcquisition();

    _interval = intervalHint;
    _onSample = onSample;
    _onFault = onFault;
    _stopRequested = false;
    _paused = false;
    _delivered = 0;
    _running = true;
    _worker = std::thread(&AcquisitionLoop::run, this);
}

void AcquisitionLoop::stop()
{
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _stopRequested = true;
    }
    _wake.notify_all();
}

void AcquisitionLoop::wait()
{
    if (!_worker.joinable())
        return;
    if (_worker.get_id() == std::this_thread::get_id())
        throw SessionStateError("AcquisitionLoop::wait called from its own worker");
    _worker.join();
}

void AcquisitionLoop::pause()
{
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _paused = true;
    }
    _wake.notify_all();
}

void AcquisitionLoop::resume()
{
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _paused = false;
    }
    _wake.notify_all();
}

void AcquisitionLoop::setWarningHandler(WarningHandler onWarning)
{
    if (_running.load())
        throw SessionStateError("warning handler cannot change while the acquisition loop is running");
    _onWarning = onWarning;
}

void AcquisitionLoop::run()
{
    const std::chrono::steady_clock::time_point runStart = std::chrono::steady_clock::now();
    std::chrono::steady_clock::duration pausedTotal(0);

    while (!_stopRequested.load())
    {
        if (_paused.load())
        {
            std::chrono::steady_clock::time_point pauseStart = std::chrono::steady_clock::now();
            {
                std::unique_lock<std::mutex> lock(_mutex);
                _wake.wait(lock, [this] { return !_paused.load() || _stopRequested.load(); });
            }
            pausedTotal += std::chrono::steady_clock::now() - pauseStart;
            continue;
        }

        std::chrono::steady_clock::time_point iterationStart = std::chrono::steady_clock::now();
        Sample sample;
        try
        {
            sample = _session.acquire();
        }
        catch (const InstrumentUnresponsive& e)
        {
            reportFault(e.what());
            break;
        }
        catch (const std::exception& e)
        {
            reportFault(std::string("acquire failed: ") + e.what());
            break;
        }
        catch (...)
        {
            reportFault("acquire failed: unknown exception");
            break;
        }
        sample.elapsedSeconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - runStart - pausedTotal).count();

        try
        {
            _sink.append(sample);
        }
        catch (const std::exception& e)
        {
            reportFault(std::string("sample sink failed: ") + e.what());
            break;
        }
        catch (...)
        {
            reportFault("sample sink failed: unknown exception");
            break;
        }
        ++_delivered;

        notify("onSample", _onSample, sample);
        if (!sample.valid)
            notify("onWarning", _onWarning, _session.lastFailure());

        if (!idleUntil(iterationStart + _interval))
            break;
    }

    _session.endAcquisition();
    _running = false;
}

void AcquisitionLoop::reportFault(const std::string& reason)
{
    cerr << "** ERROR: acquisition stopped, " << reason << '\n';
    FaultReport report = { reason, _delivered.load() };
    notify("onFault", _onFault, report);
}

bool AcquisitionLoop::idleUntil(std::chrono::steady_clock::time_point deadline)
{
    std::unique_lock<std::mutex> lock(_mutex);
    return !_wake.wait_until(lock, deadline, [this] { return _stopRequested.load(); });
}
