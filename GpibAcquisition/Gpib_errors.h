#pragma once
#include <string>
#include <stdexcept>
using std::runtime_error;
using std::logic_error;

/// @brief Base of every instrument, transport and protocol failure.
class GpibError : public runtime_error
{
public:
	explicit GpibError(const std::string& message) : runtime_error(message) {}
};

/// @brief The transport could not be opened (address unreachable, driver missing, resource busy).
class ConnectionError : public GpibError
{
public:
	explicit ConnectionError(const std::string& message) : GpibError(message) {}
};

/// @brief A read or write did not complete within the transport timeout.
class TransportTimeout : public GpibError
{
public:
	explicit TransportTimeout(const std::string& message) : GpibError(message) {}
};

/// @brief A bus error the next attempt may not see again.
class TransportIoError : public GpibError
{
public:
	explicit TransportIoError(const std::string& message) : GpibError(message) {}
};

/// @brief The device is gone from the bus. Not recoverable without a reconnect.
class TransportDisconnected : public GpibError
{
public:
	explicit TransportDisconnected(const std::string& message) : GpibError(message) {}
};

/// @brief The dialect has no command for the requested intent.
class UnsupportedIntent : public GpibError
{
public:
	explicit UnsupportedIntent(const std::string& message) : GpibError(message) {}
};

/// @brief A command argument is outside what the instrument documents.
class InvalidParameter : public GpibError
{
public:
	InvalidParameter(const std::string& field, const std::string& message)
		: GpibError(field + ": " + message), _field(field), _reason(message) {}
	const std::string& field() const { return _field; }
	const std::string& reason() const { return _reason; }

private:
	std::string _field;
	std::string _reason;
};

/// @brief The reply bytes do not match the grammar expected for the intent.
class MalformedResponse : public GpibError
{
public:
	MalformedResponse(const std::string& message, const std::string& raw)
		: GpibError(message), _raw(raw) {}
	const std::string& raw() const { return _raw; }

private:
	std::string _raw;
};

/// @brief A configuration field was refused, either by validation or by the instrument.
class ConfigurationRejected : public GpibError
{
public:
	ConfigurationRejected(const std::string& field, const std::string& reason)
		: GpibError("configuration rejected, " + field + ": " + reason), _field(field), _reason(reason) {}
	const std::string& field() const { return _field; }
	const std::string& reason() const { return _reason; }

private:
	std::string _field;
	std::string _reason;
};

/// @brief The instrument stopped answering at the transport level; the session is Faulted.
class InstrumentUnresponsive : public GpibError
{
public:
	explicit InstrumentUnresponsive(const std::string& message) : GpibError(message) {}
};

/// @brief An operation was called in a session state that does not allow it.
class SessionStateError : public logic_error
{
public:
	explicit SessionStateError(const std::string& message) : logic_error(message) {}
};
