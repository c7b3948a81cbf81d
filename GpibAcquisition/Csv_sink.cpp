#include "Csv_sink.h"
#include "Gpib_errors.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>

CsvSampleSink::CsvSampleSink(const std::string& path, const std::string& unit)
    : _path(path), _out(path.c_str(), std::ios::out | std::ios::trunc)
{
    if (!_out)
        throw runtime_error("cannot open " + path + " for writing");
    _out.imbue(std::locale::classic());
    _out << std::setprecision(std::numeric_limits<double>::max_digits10);
    _out << "timestamp_ns,elapsed_s,value_" << unit << ",valid\n";
    _out.flush();
}

CsvSampleSink::~CsvSampleSink()
{
    _out.flush();
}

void CsvSampleSink::append(const Sample& sample)
{
    long long ns = std::chrono::duration_cast<std::chrono::nanoseconds>(sample.timestamp.time_since_epoch()).count();
    _out << ns << ',' << sample.elapsedSeconds << ',';
    if (sample.valid)
        _out << sample.value;
    _out << ',' << (sample.valid ? 1 : 0) << '\n';
    _out.flush();
    if (!_out)
        throw runtime_error("write to " + _path + " failed");
    ++_records;
}

void CsvSampleSink::flush()
{
    _out.flush();
}

namespace
{
    bool exists(const std::string& path)
    {
        std::ifstream existing(path.c_str());
        return static_cast<bool>(existing);
    }
}

std::string CsvSampleSink::uniquePath(const std::string& path)
{
    if (!exists(path))
        return path;

    std::time_t now = std::time(nullptr);
    std::tm local = *std::localtime(&now);
    std::ostringstream stamp;
    stamp << std::put_time(&local, "_%Y-%m-%d_at_%H-%M-%S");

    std::string stem = path;
    std::string extension;
    std::string::size_type slash = path.find_last_of("/\\");
    std::string::size_type dot = path.find_last_of('.');
    if (dot != std::string::npos && dot != 0 && (slash == std::string::npos || (dot > slash && dot != slash + 1)))
    {
        stem = path.substr(0, dot);
        extension = path.substr(dot);
    }

    // Two runs started within the same second get a counter after the time.
    std::string candidate = stem + stamp.str() + extension;
    for (int run = 2; exists(candidate); ++run)
        candidate = stem + stamp.str() + "_" + std::to_string(run) + extension;
    return candidate;
}
