#pragma once
#include "Measurement_types.h"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

/// @brief Semantic command the session asks a dialect to spell out.
enum class ScpiIntent
{
	Reset,
	ClearStatus,
	Identify,
	OperationComplete,
	QueryError,
	SelectFunction,
	SetRange,
	QueryRange,
	SetAutoRange,
	QueryAutoRange,
	SetIntegration,
	QueryIntegration,
	SetAveragingState,
	QueryAveragingState,
	SetAveragingCount,
	QueryAveragingCount,
	SetTriggerSource,
	QueryTriggerSource,
	SetTriggerCount,
	QueryTriggerCount,
	SetZeroCheck,
	QueryZeroCheck,
	SourceOutputOff,
	Read
};

const char* toString(ScpiIntent intent);

/// @brief How the argument of a command is validated and formatted.
enum class ScpiArgument
{
	None,
	Number,
	Integer,
	Boolean,
	TriggerSource
};

/// @brief One row of a dialect's command table.
struct ScpiCommandSpec
{
	ScpiIntent intent;
	/// @brief Command text up to the argument, e.g. ":SENS:VOLT:NPLC" or ":SENS:VOLT:NPLC?".
	std::string header;
	ScpiArgument argument;
	/// @brief Documented bounds of the argument, inclusive.
	double minimum;
	double maximum;
	/// @brief Configuration field reported when the argument is rejected.
	std::string field;
};

/// @brief Command grammar of one instrument model.
///
/// Maps intents to SCPI strings and replies back to values. Stateless after
/// construction, so one dialect can be used from any thread.
class ScpiDialect
{
public:
	virtual ~ScpiDialect() {}

	const std::string& name() const { return _name; }
	/// @brief Unit of the value returned by Read.
	const std::string& unit() const { return _unit; }

	virtual bool supports(ScpiIntent intent) const;
	/// @brief Table row for the intent. Throws UnsupportedIntent.
	virtual const ScpiCommandSpec& spec(ScpiIntent intent) const;

	virtual std::string build(ScpiIntent intent) const;
	virtual std::string build(ScpiIntent intent, double value) const;

	/// @brief Numeric value of a reply. Throws MalformedResponse.
	virtual double parseResponse(ScpiIntent intent, const std::string& raw) const;
	/// @brief Trimmed text of a reply, e.g. the identity string. Throws MalformedResponse.
	virtual std::string parseText(ScpiIntent intent, const std::string& raw) const;

	/// @brief Command that fetches a query reply, empty when the reply is read directly.
	virtual std::string fetchCommand() const { return std::string(); }
	/// @brief Pause required after each write before the next command.
	virtual std::chrono::milliseconds settleTime() const { return std::chrono::milliseconds(0); }

	static double triggerArgument(TriggerMode mode)
	{
		return mode == TriggerMode::External ? 1.0 : 0.0;
	}

protected:
	ScpiDialect(const std::string& name, const std::string& unit);

	void define(ScpiIntent intent, const std::string& header, ScpiArgument argument = ScpiArgument::None,
		double minimum = 0.0, double maximum = 0.0, const std::string& field = std::string());
	/// @brief Defines the commands every IEEE 488.2 / SCPI instrument understands.
	void defineCommon();

	/// @brief Value of a :READ? payload. The default accepts a plain number.
	virtual double parseReading(const std::string& payload, const std::string& raw) const;

	static std::string payloadOf(const std::string& raw);
	static double parseNumber(const std::string& text, const std::string& raw);

private:
	std::string _name;
	std::string _unit;
	std::vector<ScpiCommandSpec> _commands;
};

/// @brief Keithley 2182A nanovoltmeter, channel 1.
class NanovoltmeterDialect : public ScpiDialect
{
public:
	NanovoltmeterDialect();
};

/// @brief Keithley 6485 picoammeter.
class PicoammeterDialect : public ScpiDialect
{
public:
	PicoammeterDialect();

protected:
	double parseReading(const std::string& payload, const std::string& raw) const override;
};

/// @brief An instrument reached through the RS-232 bridge of a Keithley 6221 current source.
///
/// Commands are forwarded with :SYST:COMM:SER:SEND and replies collected with
/// :SYST:COMM:SER:ENT?. The 6221 itself answers SourceOutputOff.
class RelayedDialect : public ScpiDialect
{
public:
	explicit RelayedDialect(std::unique_ptr<ScpiDialect> inner);

	bool supports(ScpiIntent intent) const override;
	const ScpiCommandSpec& spec(ScpiIntent intent) const override;
	std::string build(ScpiIntent intent) const override;
	std::string build(ScpiIntent intent, double value) const override;
	double parseResponse(ScpiIntent intent, const std::string& raw) const override;
	std::string parseText(ScpiIntent intent, const std::string& raw) const override;
	std::string fetchCommand() const override;
	std::chrono::milliseconds settleTime() const override;

private:
	std::unique_ptr<ScpiDialect> _inner;

	static std::string relay(const std::string& command);
};

/// @brief Dialect by name: "nanovoltmeter", "picoammeter" or "nanovoltmeter-bridge".
std::unique_ptr<ScpiDialect> makeDialect(const std::string& name);
