#pragma once
#include "Measurement_types.h"
#include "Scpi_dialect.h"
#include "Transport.h"
#include <atomic>
#include <memory>
#include <string>
#include <vector>

/// @brief The default bound on opening the instrument resource (milliseconds).
constexpr unsigned int kDefaultConnectTimeoutMs = 5000;
/// @brief The default per-call transport timeout for writes and reads (milliseconds).
constexpr unsigned int kDefaultIoTimeoutMs = 10000;
/// @brief The default number of read attempts per sample before it is reported invalid.
constexpr unsigned int kDefaultReadAttempts = 3;
/// @brief Relative tolerance used when a numeric setting is read back.
constexpr double kReadbackTolerance = 1e-6;

/// @brief Timeouts and retry policy of a session. Tune against the real bus and driver.
struct SessionOptions
{
	unsigned int connectTimeoutMs = kDefaultConnectTimeoutMs;
	unsigned int ioTimeoutMs = kDefaultIoTimeoutMs;
	unsigned int readAttempts = kDefaultReadAttempts;
	/// @brief Send *RST and *CLS before applying a configuration.
	bool resetOnConfigure = true;
	/// @brief Issue a device clear before retrying a read that timed out.
	bool clearOnRetry = true;
};

/// @brief One instrument on one address: connection, configuration and single-sample reads.
///
/// Not internally locked. Exactly one thread may call connect, configure,
/// acquire or close at a time; state() may be read from anywhere.
class InstrumentSession
{
public:
	InstrumentSession(std::unique_ptr<Transport> transport, std::unique_ptr<ScpiDialect> dialect,
		const SessionOptions& options = SessionOptions());
	~InstrumentSession();

	InstrumentSession(const InstrumentSession&) = delete;
	InstrumentSession& operator=(const InstrumentSession&) = delete;

	void connect(const std::string& address);
	void configure(const MeasurementConfig& config);
	Sample acquire();
	void close();
	/// @brief Leaves Faulted (or any state) by reopening the last address. The configuration must be applied again.
	void reconnect();

	/// @brief Configured -> Acquiring. Called by the acquisition loop when a run starts.
	void beginAcquisition();
	/// @brief Acquiring -> Configured. A Faulted session stays Faulted.
	void endAcquisition();

	SessionState state() const { return _state.load(); }
	bool isConfigured() const { return _configured; }
	const MeasurementConfig& activeConfig() const { return _config; }
	const std::string& address() const { return _address; }
	const std::string& identity() const { return _identity; }
	const ScpiDialect& dialect() const { return *_dialect; }
	const SessionOptions& options() const { return _options; }

	/// @brief Read attempts made by the last acquire().
	unsigned int lastAttemptCount() const { return _lastAttempts; }
	/// @brief Why the last invalid sample was given up on.
	const std::string& lastFailure() const { return _lastFailure; }

private:
	/// @brief A command to write, and how its effect is confirmed.
	struct ConfigStep
	{
		std::string field;
		std::string command;
		ScpiIntent confirm;
		enum Check { Equals, AtLeast, Close, NoError } check;
		double expected;
	};

	std::unique_ptr<Transport> _transport;
	std::unique_ptr<ScpiDialect> _dialect;
	SessionOptions _options;
	std::atomic<SessionState> _state;
	std::string _address;
	std::string _identity;
	MeasurementConfig _config;
	bool _configured = false;
	unsigned int _lastAttempts = 0;
	std::string _lastFailure;

	std::vector<ConfigStep> planConfiguration(const MeasurementConfig& config) const;
	void applySteps(const std::vector<ConfigStep>& steps);
	void send(const std::string& command);
	std::string request(ScpiIntent intent);
	void fault(const std::string& reason);
	void requireUsable(const char* operation) const;
};
