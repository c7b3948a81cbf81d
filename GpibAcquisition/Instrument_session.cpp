#include "Instrument_session.h"
#include "Gpib_errors.h"
#include <chrono>
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>
using std::cout;
using std::cerr;

InstrumentSession::InstrumentSession(std::unique_ptr<Transport> transport, std::unique_ptr<ScpiDialect> dialect,
    const SessionOptions& options)
    : _transport(std::move(transport)), _dialect(std::move(dialect)), _options(options),
      _state(SessionState::Disconnected)
{
    if (!_transport || !_dialect)
        throw std::invalid_argument("InstrumentSession needs a transport and a dialect");
    if (_options.readAttempts == 0)
        _options.readAttempts = 1;
}

InstrumentSession::~InstrumentSession()
{
    try
    {
        close();
    }
    catch (const std::exception& e)
    {
        cerr << "** ERROR during close: " << e.what() << '\n';
    }
}

void InstrumentSession::connect(const std::string& address)
{
    if (state() != SessionState::Disconnected)
        throw SessionStateError(std::string("connect needs a Disconnected session, state is ") + toString(state()));
    if (address.empty())
        throw ConnectionError("empty instrument address");

    _address = address;
    try
    {
        _transport->open(address, _options.connectTimeoutMs);
    }
    catch (const ConnectionError&)
    {
        throw;
    }
    catch (const GpibError& e)
    {
        throw ConnectionError(address + ": " + e.what());
    }

    try
    {
        _transport->setTimeout(_options.ioTimeoutMs);
        _identity = _dialect->parseText(ScpiIntent::Identify, request(ScpiIntent::Identify));
    }
    catch (const GpibError& e)
    {
        _transport->close();
        throw ConnectionError(address + " did not identify itself: " + e.what());
    }

    _state = SessionState::Connected;
    cout << "Driver initialized \n";
    cout << "Resource:           " << _address << '\n';
    cout << "Instrument:         " << _identity << '\n';
}

std::vector<InstrumentSession::ConfigStep> InstrumentSession::planConfiguration(const MeasurementConfig& config) const
{
    std::vector<ConfigStep> steps;
    try
    {
        if (config.averagingCount < 1)
            throw InvalidParameter("averagingCount", "must be at least 1");

        if (_options.resetOnConfigure)
        {
            steps.push_back({ "reset", _dialect->build(ScpiIntent::Reset), ScpiIntent::OperationComplete, ConfigStep::Equals, 1.0 });
            steps.push_back({ "reset", _dialect->build(ScpiIntent::ClearStatus), ScpiIntent::OperationComplete, ConfigStep::Equals, 1.0 });
        }
        steps.push_back({ "function", _dialect->build(ScpiIntent::SelectFunction), ScpiIntent::QueryError, ConfigStep::NoError, 0.0 });
        if (_dialect->supports(ScpiIntent::SetZeroCheck))
            steps.push_back({ "zeroCheck", _dialect->build(ScpiIntent::SetZeroCheck, 0.0), ScpiIntent::QueryZeroCheck, ConfigStep::Equals, 0.0 });

        if (config.range.automatic)
            steps.push_back({ "range", _dialect->build(ScpiIntent::SetAutoRange, 1.0), ScpiIntent::QueryAutoRange, ConfigStep::Equals, 1.0 });
        else
            steps.push_back({ "range", _dialect->build(ScpiIntent::SetRange, config.range.value), ScpiIntent::QueryRange, ConfigStep::AtLeast, config.range.value });

        steps.push_back({ "integrationTime", _dialect->build(ScpiIntent::SetIntegration, config.integrationNplc),
            ScpiIntent::QueryIntegration, ConfigStep::Close, config.integrationNplc });

        if (config.averagingCount > 1)
        {
            double count = static_cast<double>(config.averagingCount);
            steps.push_back({ "averagingCount", _dialect->build(ScpiIntent::SetAveragingCount, count),
                ScpiIntent::QueryAveragingCount, ConfigStep::Equals, count });
            steps.push_back({ "averagingCount", _dialect->build(ScpiIntent::SetAveragingState, 1.0),
                ScpiIntent::QueryAveragingState, ConfigStep::Equals, 1.0 });
        }
        else
        {
            steps.push_back({ "averagingCount", _dialect->build(ScpiIntent::SetAveragingState, 0.0),
                ScpiIntent::QueryAveragingState, ConfigStep::Equals, 0.0 });
        }

        double trigger = ScpiDialect::triggerArgument(config.triggerMode);
        steps.push_back({ "triggerMode", _dialect->build(ScpiIntent::SetTriggerSource, trigger),
            ScpiIntent::QueryTriggerSource, ConfigStep::Equals, trigger });
        steps.push_back({ "triggerMode", _dialect->build(ScpiIntent::SetTriggerCount, 1.0),
            ScpiIntent::QueryTriggerCount, ConfigStep::Equals, 1.0 });

        // Every step must be confirmable before anything is sent.
        for (const auto& step : steps)
            _dialect->spec(step.confirm);
    }
    catch (const InvalidParameter& e)
    {
        throw ConfigurationRejected(e.field(), e.reason());
    }
    catch (const UnsupportedIntent& e)
    {
        throw ConfigurationRejected("dialect", e.what());
    }
    return steps;
}

void InstrumentSession::applySteps(const std::vector<ConfigStep>& steps)
{
    for (const auto& step : steps)
    {
        std::string reply;
        double value = 0.0;
        try
        {
            send(step.command);
            reply = request(step.confirm);
            value = _dialect->parseResponse(step.confirm, reply);
        }
        catch (const TransportTimeout&)
        {
            throw ConfigurationRejected(step.field, "no reply to " + std::string(toString(step.confirm)) + " within the timeout");
        }
        catch (const TransportIoError& e)
        {
            throw ConfigurationRejected(step.field, e.what());
        }
        catch (const MalformedResponse& e)
        {
            throw ConfigurationRejected(step.field, std::string("unreadable reply: ") + e.what());
        }

        bool accepted = false;
        switch (step.check)
        {
        case ConfigStep::Equals:
            accepted = value == step.expected;
            break;
        case ConfigStep::AtLeast:
            accepted = value >= step.expected * (1.0 - kReadbackTolerance);
            break;
        case ConfigStep::Close:
            accepted = std::fabs(value - step.expected) <= kReadbackTolerance * std::fabs(step.expected);
            break;
        case ConfigStep::NoError:
            accepted = value == 0.0;
            break;
        }
        if (!accepted)
        {
            if (step.check == ConfigStep::NoError)
                throw ConfigurationRejected(step.field, "instrument refused '" + step.command + "': " + _dialect->parseText(step.confirm, reply));
            std::ostringstream reason;
            reason << "instrument reports " << value << " after '" << step.command << "', expected "
                << (step.check == ConfigStep::AtLeast ? "at least " : "") << step.expected;
            throw ConfigurationRejected(step.field, reason.str());
        }
    }
}

void InstrumentSession::configure(const MeasurementConfig& config)
{
    requireUsable("configure");
    if (state() != SessionState::Connected && state() != SessionState::Configured)
        throw SessionStateError(std::string("configure is rejected while ") + toString(state()));

    std::vector<ConfigStep> steps = planConfiguration(config);

    cout << "\nConfiguring " << _dialect->name() << '\n';
    if (config.range.automatic)
        cout << "Range:              auto\n";
    else
        cout << "Range:              " << config.range.value << ' ' << _dialect->unit() << '\n';
    cout << "NPLC:               " << config.integrationNplc << '\n';
    cout << "Averaging count:    " << config.averagingCount << '\n';
    cout << "Trigger:            " << toString(config.triggerMode) << '\n';

    try
    {
        applySteps(steps);
    }
    catch (const ConfigurationRejected& rejected)
    {
        cerr << "** ERROR during configure: " << rejected.what() << '\n';
        ConfigurationRejected error = rejected;
        if (_configured)
        {
            try
            {
                applySteps(planConfiguration(_config));
                cout << "Previous configuration restored\n";
            }
            catch (const ConfigurationRejected& e)
            {
                cerr << "** ERROR during configure: previous configuration could not be restored, " << e.what() << '\n';
                _configured = false;
                _state = SessionState::Connected;
            }
            catch (const TransportDisconnected& e)
            {
                fault(e.what());
                throw InstrumentUnresponsive(_address + ": " + e.what());
            }
        }
        throw error;
    }
    catch (const TransportDisconnected& e)
    {
        fault(e.what());
        throw InstrumentUnresponsive(_address + ": " + e.what());
    }

    _config = config;
    _configured = true;
    _state = SessionState::Configured;
    cout << "Configuration accepted\n";
}

Sample InstrumentSession::acquire()
{
    requireUsable("acquire");
    if (state() != SessionState::Configured && state() != SessionState::Acquiring)
        throw SessionStateError(std::string("acquire needs a configured session, state is ") + toString(state()));

    const std::string readCommand = _dialect->build(ScpiIntent::Read);
    const std::string fetch = _dialect->fetchCommand();
    _lastAttempts = 0;
    _lastFailure.clear();
    bool flush = false;

    while (_lastAttempts < _options.readAttempts)
    {
        ++_lastAttempts;
        try
        {
            if (flush)
                _transport->clear();
            send(readCommand);
            if (!fetch.empty())
                send(fetch);
            std::string raw = _transport->readLine();
            std::chrono::system_clock::time_point at = std::chrono::system_clock::now();
            return Sample::reading(at, _dialect->parseResponse(ScpiIntent::Read, raw));
        }
        catch (const TransportTimeout& e)
        {
            _lastFailure = std::string("timeout: ") + e.what();
            flush = _options.clearOnRetry;
        }
        catch (const MalformedResponse& e)
        {
            _lastFailure = std::string("malformed reply '") + e.raw() + "': " + e.what();
            flush = _options.clearOnRetry;
        }
        catch (const TransportIoError& e)
        {
            _lastFailure = std::string("bus error: ") + e.what();
            flush = _options.clearOnRetry;
        }
        catch (const TransportDisconnected& e)
        {
            fault(e.what());
            throw InstrumentUnresponsive(_address + ": " + e.what());
        }
        cerr << "** Warning during acquire: attempt " << _lastAttempts << " of " << _options.readAttempts
            << ", " << _lastFailure << '\n';
    }

    return Sample::invalid(std::chrono::system_clock::now());
}

void InstrumentSession::close()
{
    if (state() == SessionState::Disconnected && !_transport->isOpen())
        return;

    if (_transport->isOpen() && state() != SessionState::Faulted && _dialect->supports(ScpiIntent::SourceOutputOff))
    {
        try
        {
            send(_dialect->build(ScpiIntent::SourceOutputOff));
        }
        catch (const GpibError& e)
        {
            cerr << "** Warning during close: source output not switched off, " << e.what() << '\n';
        }
    }

    _transport->close();
    _state = SessionState::Disconnected;
    _configured = false;
    _identity.clear();
    cout << "\nDriver closed\n";
}

void InstrumentSession::reconnect()
{
    if (_address.empty())
        throw SessionStateError("reconnect needs an address from an earlier connect");
    close();
    connect(_address);
}

void InstrumentSession::beginAcquisition()
{
    requireUsable("beginAcquisition");
    if (state() != SessionState::Configured)
        throw SessionStateError(std::string("acquisition needs a Configured session, state is ") + toString(state()));
    _state = SessionState::Acquiring;
}

void InstrumentSession::endAcquisition()
{
    if (state() == SessionState::Acquiring)
        _state = SessionState::Configured;
}

void InstrumentSession::send(const std::string& command)
{
    _transport->write(command);
    std::chrono::milliseconds settle = _dialect->settleTime();
    if (settle.count() > 0)
        std::this_thread::sleep_for(settle);
}

std::string InstrumentSession::request(ScpiIntent intent)
{
    send(_dialect->build(intent));
    const std::string fetch = _dialect->fetchCommand();
    if (!fetch.empty())
        send(fetch);
    return _transport->readLine();
}

void InstrumentSession::fault(const std::string& reason)
{
    _state = SessionState::Faulted;
    cerr << "** ERROR: " << _address << " is unresponsive, session faulted: " << reason << '\n';
}

void InstrumentSession::requireUsable(const char* operation) const
{
    if (state() == SessionState::Faulted)
        throw InstrumentUnresponsive(std::string(operation) + ": " + _address + " is faulted, reconnect first");
}
