#pragma once
#include "Transport.h"
#include <visa.h>
#include <string>

/// @brief The largest reply accepted from one readLine (bytes).
constexpr ViUInt32 kMaxReplyBytes = 65536;
/// @brief Size of each viRead chunk (bytes).
constexpr ViUInt32 kReadChunkBytes = 256;

/// @brief Transport over a VISA resource (GPIB, USB-TMC, LAN or serial).
///
/// The resource is opened with an exclusive lock, so a second session on the
/// same address fails to connect. Reads end on the line feed termination character.
class VisaTransport : public Transport
{
public:
	VisaTransport();
	~VisaTransport();

	void open(const std::string& address, unsigned int timeoutMs) override;
	void setTimeout(unsigned int timeoutMs) override;
	void write(const std::string& command) override;
	std::string readLine() override;
	void clear() override;
	void close() override;
	bool isOpen() const override { return _instrument != VI_NULL; }

private:
	ViSession _resourceManager;
	ViSession _instrument;
	std::string _address;

	void requireOpen() const;
	void testApiCall(ViStatus status, char const* functionName);
};
