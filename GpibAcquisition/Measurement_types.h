#pragma once
#include <chrono>
#include <limits>
#include <string>

/// @brief Where the instrument takes its measurement trigger from.
enum class TriggerMode
{
	Immediate,
	External
};

/// @brief Measurement range: automatic, or a fixed full-scale value in instrument units.
struct RangeSetting
{
	bool automatic = true;
	double value = 0.0;

	static RangeSetting autoRange()
	{
		return RangeSetting();
	}

	static RangeSetting fixed(double fullScale)
	{
		RangeSetting range;
		range.automatic = false;
		range.value = fullScale;
		return range;
	}
};

/// @brief Everything applied to the instrument before acquisition begins.
struct MeasurementConfig
{
	RangeSetting range;
	/// @brief Integration time in power line cycles.
	double integrationNplc = 1.0;
	/// @brief Number of readings averaged by the instrument filter, 1 disables the filter.
	unsigned int averagingCount = 1;
	TriggerMode triggerMode = TriggerMode::Immediate;
};

/// @brief One reading, stamped when the read completed.
struct Sample
{
	std::chrono::system_clock::time_point timestamp;
	/// @brief Run time in seconds when the sample arrived, paused intervals excluded. Set by the acquisition loop.
	double elapsedSeconds = 0.0;
	/// @brief Reading in instrument units. Quiet NaN when the sample is invalid.
	double value = std::numeric_limits<double>::quiet_NaN();
	bool valid = false;

	static Sample reading(std::chrono::system_clock::time_point at, double measured)
	{
		Sample sample;
		sample.timestamp = at;
		sample.value = measured;
		sample.valid = true;
		return sample;
	}

	static Sample invalid(std::chrono::system_clock::time_point at)
	{
		Sample sample;
		sample.timestamp = at;
		return sample;
	}
};

enum class SessionState
{
	Disconnected,
	Connected,
	Configured,
	Acquiring,
	Faulted
};

inline const char* toString(SessionState state)
{
	switch (state)
	{
	case SessionState::Disconnected: return "Disconnected";
	case SessionState::Connected: return "Connected";
	case SessionState::Configured: return "Configured";
	case SessionState::Acquiring: return "Acquiring";
	case SessionState::Faulted: return "Faulted";
	}
	return "Unknown";
}

inline const char* toString(TriggerMode mode)
{
	return mode == TriggerMode::External ? "external" : "immediate";
}
