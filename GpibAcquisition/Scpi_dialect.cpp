#include "Scpi_dialect.h"
#include "Gpib_errors.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <locale>
#include <sstream>

namespace
{
    /// @brief Keithley instruments report an overflowed reading as +9.9E37.
    constexpr double kOverflowReading = 9.9e37;

    std::string upper(std::string text)
    {
        std::transform(text.begin(), text.end(), text.begin(),
            [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return text;
    }

    std::string trim(const std::string& text)
    {
        std::string::size_type first = text.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return std::string();
        std::string::size_type last = text.find_last_not_of(" \t\r\n");
        return text.substr(first, last - first + 1);
    }

    std::string formatNumber(double value)
    {
        std::ostringstream out;
        out.imbue(std::locale::classic());
        out << std::setprecision(15) << value;
        return out.str();
    }

    bool isQuery(const ScpiCommandSpec& spec)
    {
        return !spec.header.empty() && spec.header.back() == '?';
    }
}

const char* toString(ScpiIntent intent)
{
    switch (intent)
    {
    case ScpiIntent::Reset: return "Reset";
    case ScpiIntent::ClearStatus: return "ClearStatus";
    case ScpiIntent::Identify: return "Identify";
    case ScpiIntent::OperationComplete: return "OperationComplete";
    case ScpiIntent::QueryError: return "QueryError";
    case ScpiIntent::SelectFunction: return "SelectFunction";
    case ScpiIntent::SetRange: return "SetRange";
    case ScpiIntent::QueryRange: return "QueryRange";
    case ScpiIntent::SetAutoRange: return "SetAutoRange";
    case ScpiIntent::QueryAutoRange: return "QueryAutoRange";
    case ScpiIntent::SetIntegration: return "SetIntegration";
    case ScpiIntent::QueryIntegration: return "QueryIntegration";
    case ScpiIntent::SetAveragingState: return "SetAveragingState";
    case ScpiIntent::QueryAveragingState: return "QueryAveragingState";
    case ScpiIntent::SetAveragingCount: return "SetAveragingCount";
    case ScpiIntent::QueryAveragingCount: return "QueryAveragingCount";
    case ScpiIntent::SetTriggerSource: return "SetTriggerSource";
    case ScpiIntent::QueryTriggerSource: return "QueryTriggerSource";
    case ScpiIntent::SetTriggerCount: return "SetTriggerCount";
    case ScpiIntent::QueryTriggerCount: return "QueryTriggerCount";
    case ScpiIntent::SetZeroCheck: return "SetZeroCheck";
    case ScpiIntent::QueryZeroCheck: return "QueryZeroCheck";
    case ScpiIntent::SourceOutputOff: return "SourceOutputOff";
    case ScpiIntent::Read: return "Read";
    }
    return "Unknown";
}

ScpiDialect::ScpiDialect(const std::string& name, const std::string& unit)
    : _name(name), _unit(unit)
{
}

void ScpiDialect::define(ScpiIntent intent, const std::string& header, ScpiArgument argument,
    double minimum, double maximum, const std::string& field)
{
    ScpiCommandSpec spec = { intent, header, argument, minimum, maximum, field };
    _commands.push_back(spec);
}

void ScpiDialect::defineCommon()
{
    define(ScpiIntent::Reset, "*RST");
    define(ScpiIntent::ClearStatus, "*CLS");
    define(ScpiIntent::Identify, "*IDN?");
    define(ScpiIntent::OperationComplete, "*OPC?");
    define(ScpiIntent::QueryError, ":SYST:ERR?");
    define(ScpiIntent::SetTriggerSource, ":TRIG:SOUR", ScpiArgument::TriggerSource, 0, 1, "triggerMode");
    define(ScpiIntent::QueryTriggerSource, ":TRIG:SOUR?");
    define(ScpiIntent::SetTriggerCount, ":TRIG:COUN", ScpiArgument::Integer, 1, 9999, "triggerCount");
    define(ScpiIntent::QueryTriggerCount, ":TRIG:COUN?");
    define(ScpiIntent::Read, ":READ?");
}

bool ScpiDialect::supports(ScpiIntent intent) const
{
    for (const auto& command : _commands)
    {
        if (command.intent == intent)
            return true;
    }
    return false;
}

const ScpiCommandSpec& ScpiDialect::spec(ScpiIntent intent) const
{
    for (const auto& command : _commands)
    {
        if (command.intent == intent)
            return command;
    }
    throw UnsupportedIntent(std::string(toString(intent)) + " is not supported by the " + _name + " dialect");
}

std::string ScpiDialect::build(ScpiIntent intent) const
{
    const ScpiCommandSpec& command = spec(intent);
    if (command.argument != ScpiArgument::None)
        throw InvalidParameter(command.field, std::string(toString(intent)) + " requires an argument");
    return command.header;
}

std::string ScpiDialect::build(ScpiIntent intent, double value) const
{
    const ScpiCommandSpec& command = spec(intent);
    if (command.argument == ScpiArgument::None)
        throw InvalidParameter(command.field.empty() ? toString(intent) : command.field,
            std::string(toString(intent)) + " takes no argument");
    if (!std::isfinite(value))
        throw InvalidParameter(command.field, "value is not a finite number");
    if (value < command.minimum || value > command.maximum)
    {
        throw InvalidParameter(command.field, formatNumber(value) + " is outside " +
            formatNumber(command.minimum) + " .. " + formatNumber(command.maximum) + " for the " + _name);
    }

    std::string argument;
    switch (command.argument)
    {
    case ScpiArgument::Number:
        argument = formatNumber(value);
        break;
    case ScpiArgument::Integer:
        if (std::floor(value) != value)
            throw InvalidParameter(command.field, formatNumber(value) + " is not a whole number");
        argument = std::to_string(static_cast<long long>(value));
        break;
    case ScpiArgument::Boolean:
        if (value != 0.0 && value != 1.0)
            throw InvalidParameter(command.field, "expected 0 or 1");
        argument = value != 0.0 ? "ON" : "OFF";
        break;
    case ScpiArgument::TriggerSource:
        if (value != 0.0 && value != 1.0)
            throw InvalidParameter(command.field, "unknown trigger source");
        argument = value != 0.0 ? "EXT" : "IMM";
        break;
    case ScpiArgument::None:
        break;
    }
    return command.header + " " + argument;
}

std::string ScpiDialect::payloadOf(const std::string& raw)
{
    if (raw.empty() || raw.back() != '\n')
        throw MalformedResponse("reply is missing its terminator", raw);
    std::string payload = trim(raw);
    if (payload.empty())
        throw MalformedResponse("reply is empty", raw);
    return payload;
}

double ScpiDialect::parseNumber(const std::string& text, const std::string& raw)
{
    std::istringstream in(text);
    in.imbue(std::locale::classic());
    double value = 0.0;
    in >> value;
    if (in.fail())
        throw MalformedResponse("reply is not numeric", raw);
    in >> std::ws;
    if (!in.eof())
        throw MalformedResponse("trailing characters after number", raw);
    if (!std::isfinite(value))
        throw MalformedResponse("reply is not a finite number", raw);
    return value;
}

double ScpiDialect::parseReading(const std::string& payload, const std::string& raw) const
{
    return parseNumber(payload.substr(0, payload.find(',')), raw);
}

double ScpiDialect::parseResponse(ScpiIntent intent, const std::string& raw) const
{
    const ScpiCommandSpec& command = spec(intent);
    if (!isQuery(command) || intent == ScpiIntent::Identify)
        throw UnsupportedIntent(std::string(toString(intent)) + " has no numeric reply");

    std::string payload = payloadOf(raw);
    switch (intent)
    {
    case ScpiIntent::Read:
    {
        double reading = parseReading(payload, raw);
        if (std::fabs(reading) >= kOverflowReading)
            throw MalformedResponse("reading overflow", raw);
        return reading;
    }
    case ScpiIntent::QueryError:
    {
        // <code>,"<message>"
        return parseNumber(trim(payload.substr(0, payload.find(','))), raw);
    }
    case ScpiIntent::QueryTriggerSource:
    {
        std::string source = upper(payload);
        if (source == "IMM" || source == "IMMEDIATE")
            return triggerArgument(TriggerMode::Immediate);
        if (source == "EXT" || source == "EXTERNAL")
            return triggerArgument(TriggerMode::External);
        throw MalformedResponse("unknown trigger source " + payload, raw);
    }
    case ScpiIntent::OperationComplete:
    case ScpiIntent::QueryAutoRange:
    case ScpiIntent::QueryAveragingState:
    case ScpiIntent::QueryZeroCheck:
    {
        double flag = parseNumber(payload, raw);
        if (flag != 0.0 && flag != 1.0)
            throw MalformedResponse("expected 0 or 1", raw);
        return flag;
    }
    default:
        return parseNumber(payload, raw);
    }
}

std::string ScpiDialect::parseText(ScpiIntent intent, const std::string& raw) const
{
    const ScpiCommandSpec& command = spec(intent);
    if (!isQuery(command))
        throw UnsupportedIntent(std::string(toString(intent)) + " has no reply");
    return payloadOf(raw);
}

NanovoltmeterDialect::NanovoltmeterDialect()
    : ScpiDialect("nanovoltmeter", "V")
{
    defineCommon();
    define(ScpiIntent::SelectFunction, ":SENS:FUNC 'VOLT'");
    define(ScpiIntent::SetRange, ":SENS:VOLT:RANG", ScpiArgument::Number, 0.0, 120.0, "range");
    define(ScpiIntent::QueryRange, ":SENS:VOLT:RANG?");
    define(ScpiIntent::SetAutoRange, ":SENS:VOLT:RANG:AUTO", ScpiArgument::Boolean, 0, 1, "range");
    define(ScpiIntent::QueryAutoRange, ":SENS:VOLT:RANG:AUTO?");
    define(ScpiIntent::SetIntegration, ":SENS:VOLT:NPLC", ScpiArgument::Number, 0.01, 60.0, "integrationTime");
    define(ScpiIntent::QueryIntegration, ":SENS:VOLT:NPLC?");
    define(ScpiIntent::SetAveragingState, ":SENS:VOLT:DFIL:TCON REP;:SENS:VOLT:DFIL:STAT",
        ScpiArgument::Boolean, 0, 1, "averagingCount");
    define(ScpiIntent::QueryAveragingState, ":SENS:VOLT:DFIL:STAT?");
    define(ScpiIntent::SetAveragingCount, ":SENS:VOLT:DFIL:COUN", ScpiArgument::Integer, 1, 100, "averagingCount");
    define(ScpiIntent::QueryAveragingCount, ":SENS:VOLT:DFIL:COUN?");
}

PicoammeterDialect::PicoammeterDialect()
    : ScpiDialect("picoammeter", "A")
{
    defineCommon();
    define(ScpiIntent::SelectFunction, ":SENS:FUNC 'CURR'");
    define(ScpiIntent::SetRange, ":SENS:CURR:RANG", ScpiArgument::Number, 0.0, 0.021, "range");
    define(ScpiIntent::QueryRange, ":SENS:CURR:RANG?");
    define(ScpiIntent::SetAutoRange, ":SENS:CURR:RANG:AUTO", ScpiArgument::Boolean, 0, 1, "range");
    define(ScpiIntent::QueryAutoRange, ":SENS:CURR:RANG:AUTO?");
    define(ScpiIntent::SetIntegration, ":SENS:CURR:NPLC", ScpiArgument::Number, 0.01, 60.0, "integrationTime");
    define(ScpiIntent::QueryIntegration, ":SENS:CURR:NPLC?");
    define(ScpiIntent::SetAveragingState, ":SENS:AVER:TCON REP;:SENS:AVER:STAT",
        ScpiArgument::Boolean, 0, 1, "averagingCount");
    define(ScpiIntent::QueryAveragingState, ":SENS:AVER:STAT?");
    define(ScpiIntent::SetAveragingCount, ":SENS:AVER:COUN", ScpiArgument::Integer, 2, 100, "averagingCount");
    define(ScpiIntent::QueryAveragingCount, ":SENS:AVER:COUN?");
    define(ScpiIntent::SetZeroCheck, ":SYST:ZCH", ScpiArgument::Boolean, 0, 1, "zeroCheck");
    define(ScpiIntent::QueryZeroCheck, ":SYST:ZCH?");
}

double PicoammeterDialect::parseReading(const std::string& payload, const std::string& raw) const
{
    // READING[A],TIMESTAMP,STATUS
    std::string reading = trim(payload.substr(0, payload.find(',')));
    if (!reading.empty() && (reading.back() == 'A' || reading.back() == 'a'))
        reading.erase(reading.size() - 1);
    return parseNumber(reading, raw);
}

RelayedDialect::RelayedDialect(std::unique_ptr<ScpiDialect> inner)
    : ScpiDialect(inner ? inner->name() + "-bridge" : std::string("bridge"), inner ? inner->unit() : std::string()),
      _inner(std::move(inner))
{
    if (!_inner)
        throw UnsupportedIntent("relayed dialect needs an instrument behind the bridge");
    define(ScpiIntent::SourceOutputOff, ":OUTP OFF");
}

std::string RelayedDialect::relay(const std::string& command)
{
    return ":SYST:COMM:SER:SEND \"" + command + "\"";
}

bool RelayedDialect::supports(ScpiIntent intent) const
{
    return ScpiDialect::supports(intent) || _inner->supports(intent);
}

const ScpiCommandSpec& RelayedDialect::spec(ScpiIntent intent) const
{
    if (ScpiDialect::supports(intent))
        return ScpiDialect::spec(intent);
    return _inner->spec(intent);
}

std::string RelayedDialect::build(ScpiIntent intent) const
{
    if (ScpiDialect::supports(intent))
        return ScpiDialect::build(intent);
    return relay(_inner->build(intent));
}

std::string RelayedDialect::build(ScpiIntent intent, double value) const
{
    if (ScpiDialect::supports(intent))
        return ScpiDialect::build(intent, value);
    return relay(_inner->build(intent, value));
}

double RelayedDialect::parseResponse(ScpiIntent intent, const std::string& raw) const
{
    return _inner->parseResponse(intent, raw);
}

std::string RelayedDialect::parseText(ScpiIntent intent, const std::string& raw) const
{
    return _inner->parseText(intent, raw);
}

std::string RelayedDialect::fetchCommand() const
{
    return ":SYST:COMM:SER:ENT?";
}

std::chrono::milliseconds RelayedDialect::settleTime() const
{
    return std::chrono::milliseconds(20);
}

std::unique_ptr<ScpiDialect> makeDialect(const std::string& name)
{
    if (name == "nanovoltmeter")
        return std::unique_ptr<ScpiDialect>(new NanovoltmeterDialect());
    if (name == "picoammeter")
        return std::unique_ptr<ScpiDialect>(new PicoammeterDialect());
    if (name == "nanovoltmeter-bridge")
        return std::unique_ptr<ScpiDialect>(new RelayedDialect(std::unique_ptr<ScpiDialect>(new NanovoltmeterDialect())));
    throw UnsupportedIntent("unknown instrument dialect '" + name + "'");
}
