#pragma once
#include <string>

/// @brief Byte channel to one instrument address.
///
/// Implementations raise ConnectionError from open(), TransportTimeout when a
/// read or write runs past the timeout, TransportDisconnected when the device
/// has left the bus and TransportIoError for any other bus error.
class Transport
{
public:
	virtual ~Transport() {}

	virtual void open(const std::string& address, unsigned int timeoutMs) = 0;
	virtual void setTimeout(unsigned int timeoutMs) = 0;
	/// @brief Sends one command. The transport appends the line terminator.
	virtual void write(const std::string& command) = 0;
	/// @brief Reads up to and including the line terminator.
	virtual std::string readLine() = 0;
	/// @brief Selected device clear: drops any reply still queued in the instrument.
	virtual void clear() = 0;
	virtual void close() = 0;
	virtual bool isOpen() const = 0;

	virtual std::string query(const std::string& command)
	{
		write(command);
		return readLine();
	}
};
