#pragma once
#include "Measurement_types.h"
#include <fstream>
#include <string>

/// @brief Append-only destination for samples, in delivery order.
class SampleSink
{
public:
	virtual ~SampleSink() {}
	virtual void append(const Sample& sample) = 0;
	virtual void flush() {}
};

/// @brief Writes samples as comma separated text with a header line.
///
/// Columns: timestamp_ns,elapsed_s,value_<unit>,valid. Numbers are written
/// with max_digits10 digits so they read back bit-exact. An invalid sample
/// has an empty value field.
class CsvSampleSink : public SampleSink
{
public:
	CsvSampleSink(const std::string& path, const std::string& unit);
	~CsvSampleSink();

	void append(const Sample& sample) override;
	void flush() override;

	const std::string& path() const { return _path; }
	std::size_t recordCount() const { return _records; }

	/// @brief The path itself if nothing exists there, otherwise the path with a time suffix before the extension.
	static std::string uniquePath(const std::string& path);

private:
	std::string _path;
	std::ofstream _out;
	std::size_t _records = 0;
};
