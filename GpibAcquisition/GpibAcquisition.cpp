///
/// GPIB acquisition program
///
/// Connects to a Keithley nanovoltmeter or picoammeter, applies the measurement
/// configuration and logs timestamped readings to a CSV file until the operator
/// quits. Commands on stdin while running: p pause, r resume, c reconnect after
/// a fault, q quit.
///

#include "Acquisition_loop.h"
#include "Csv_sink.h"
#include "Gpib_errors.h"
#include "Instrument_session.h"
#include "Visa_transport.h"
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
using std::cout;
using std::cerr;

namespace
{
    struct ProgramOptions
    {
        std::string address = "GPIB0::14::INSTR";
        std::string instrument = "picoammeter";
        std::string output = "readings.csv";
        unsigned int intervalMs = 100;
        SessionOptions session;
        MeasurementConfig config;

        ProgramOptions()
        {
            config.integrationNplc = 3.0;
            config.averagingCount = 5;
        }
    };

    void printUsage()
    {
        cout << "Usage: GpibAcquisition [options]\n\n";
        cout << "  --address <resource>     VISA resource, default GPIB0::14::INSTR\n";
        cout << "  --instrument <dialect>   picoammeter | nanovoltmeter | nanovoltmeter-bridge\n";
        cout << "  --range auto|<value>     full scale in instrument units, default auto\n";
        cout << "  --nplc <cycles>          integration time in power line cycles, default 3\n";
        cout << "  --average <count>        readings averaged by the instrument, default 5\n";
        cout << "  --trigger imm|ext        trigger source, default imm\n";
        cout << "  --interval-ms <ms>       minimum spacing between readings, default 100\n";
        cout << "  --timeout-ms <ms>        transport timeout, default " << kDefaultIoTimeoutMs << "\n";
        cout << "  --attempts <n>           read attempts per sample, default " << kDefaultReadAttempts << "\n";
        cout << "  --output <file.csv>      default readings.csv, never overwritten\n\n";
        cout << "Example:\n\n\tGpibAcquisition --instrument nanovoltmeter --address GPIB0::15::INSTR --range 1e-3 --nplc 1 --average 10\n\n";
    }

    bool parseArguments(int argc, char** argv, ProgramOptions& options)
    {
        for (int i = 1; i < argc; ++i)
        {
            std::string flag = argv[i];
            if (flag == "--help" || flag == "-h")
                return false;
            if (i + 1 >= argc)
            {
                cerr << "Missing value for " << flag << '\n';
                return false;
            }
            std::string value = argv[++i];
            try
            {
                if (flag == "--address")
                    options.address = value;
                else if (flag == "--instrument")
                    options.instrument = value;
                else if (flag == "--output")
                    options.output = value;
                else if (flag == "--range")
                    options.config.range = value == "auto" ? RangeSetting::autoRange() : RangeSetting::fixed(std::stod(value));
                else if (flag == "--nplc")
                    options.config.integrationNplc = std::stod(value);
                else if (flag == "--average")
                    options.config.averagingCount = static_cast<unsigned int>(std::stoul(value));
                else if (flag == "--trigger")
                {
                    if (value != "imm" && value != "ext")
                    {
                        cerr << "Unknown trigger source " << value << '\n';
                        return false;
                    }
                    options.config.triggerMode = value == "ext" ? TriggerMode::External : TriggerMode::Immediate;
                }
                else if (flag == "--interval-ms")
                    options.intervalMs = static_cast<unsigned int>(std::stoul(value));
                else if (flag == "--timeout-ms")
                    options.session.ioTimeoutMs = static_cast<unsigned int>(std::stoul(value));
                else if (flag == "--attempts")
                    options.session.readAttempts = static_cast<unsigned int>(std::stoul(value));
                else
                {
                    cerr << "Unknown option " << flag << '\n';
                    return false;
                }
            }
            catch (const std::exception&)
            {
                cerr << "Bad value '" << value << "' for " << flag << '\n';
                return false;
            }
        }
        return true;
    }
}

int main(int argc, char** argv)
{
    ProgramOptions options;
    if (!parseArguments(argc, argv, options))
    {
        printUsage();
        return 1;
    }

    try
    {
        InstrumentSession session(std::unique_ptr<Transport>(new VisaTransport()), makeDialect(options.instrument), options.session);
        session.connect(options.address);
        session.configure(options.config);

        CsvSampleSink sink(CsvSampleSink::uniquePath(options.output), session.dialect().unit());
        cout << "Output file:        " << sink.path() << '\n';

        const std::string unit = session.dialect().unit();
        AcquisitionLoop loop(session, sink);
        loop.setWarningHandler([](const std::string& reason) {
            cerr << "Invalid sample: " << reason << '\n';
        });
        AcquisitionLoop::SampleHandler onSample = [&unit](const Sample& sample) {
            if (sample.valid)
                cout << "Reading: " << std::scientific << std::setprecision(3) << sample.value << ' ' << unit;
            else
                cout << "Reading: invalid";
            cout << std::fixed << std::setprecision(1) << " @ " << sample.elapsedSeconds << " s\n" << std::defaultfloat;
        };
        AcquisitionLoop::FaultHandler onFault = [](const FaultReport& report) {
            cout << "Acquisition stopped after " << report.samplesDelivered << " samples: " << report.reason << '\n';
            cout << "Enter c to reconnect or q to quit.\n";
        };

        const std::chrono::milliseconds interval(options.intervalMs);
        loop.start(interval, onSample, onFault);
        cout << "\nMeasurement started. Commands: p pause, r resume, c reconnect, q quit\n";

        std::string command;
        while (std::getline(std::cin, command))
        {
            if (command == "q")
                break;
            if (command == "p")
            {
                loop.pause();
                cout << "Measurement paused.\n";
            }
            else if (command == "r")
            {
                loop.resume();
                cout << "Measurement resumed.\n";
            }
            else if (command == "c")
            {
                if (loop.isRunning() || session.state() != SessionState::Faulted)
                {
                    cout << "Reconnect is only needed after a fault.\n";
                    continue;
                }
                loop.wait();
                try
                {
                    session.reconnect();
                    session.configure(options.config);
                    loop.start(interval, onSample, onFault);
                    cout << "Measurement restarted.\n";
                }
                catch (const GpibError& e)
                {
                    cerr << "Reconnect failed: " << e.what() << '\n';
                }
            }
        }

        loop.stop();
        loop.wait();
        session.close();
        cout << "Samples written:    " << sink.recordCount() << " to " << sink.path() << '\n';
    }
    catch (const ConfigurationRejected& e)
    {
        cerr << "Configuration rejected, field " << e.field() << ": " << e.reason() << '\n';
        return 2;
    }
    catch (const ConnectionError& e)
    {
        cerr << "Connection error: " << e.what() << '\n';
        return 2;
    }
    catch (const GpibError& e)
    {
        cerr << "Error: " << e.what() << '\n';
        return 2;
    }
    catch (const std::runtime_error& e)
    {
        cerr << "Error: " << e.what() << '\n';
        return 2;
    }
    return 0;
}
