// readIdn.cpp : Bus probe. Opens one VISA resource, prints its *IDN? reply and a few raw :READ? replies.
//
// Usage: readIdn [resource] [count]

#include <iostream>
#include <string>
#include "Gpib_errors.h"
#include "Visa_transport.h"
using std::cerr;

namespace
{
    std::string printable(const std::string& reply)
    {
        std::string text;
        for (char c : reply)
        {
            if (c == '\n')
                text += "\\n";
            else if (c == '\r')
                text += "\\r";
            else
                text += c;
        }
        return text;
    }
}

int main(int argc, char** argv)
{
    std::string resource = argc > 1 ? argv[1] : "GPIB0::14::INSTR";
    int count = 5;
    if (argc > 2)
    {
        try
        {
            count = std::stoi(argv[2]);
        }
        catch (const std::exception&)
        {
            cerr << "Usage: readIdn [resource] [count]\n";
            return 1;
        }
    }

    try
    {
        VisaTransport transport;
        transport.open(resource, 5000);
        std::cout << "Resource:           " << resource << '\n';
        std::cout << "Identity:           " << printable(transport.query("*IDN?")) << '\n';

        for (int i = 0; i < count; i++)
        {
            try
            {
                std::cout << "Reading " << i << ":          " << printable(transport.query(":READ?")) << std::endl;
            }
            catch (const TransportTimeout& e)
            {
                cerr << "Reading " << i << " timed out: " << e.what() << '\n';
                transport.clear();
            }
        }
        transport.close();
    }
    catch (const GpibError& e)
    {
        cerr << "Probe failed: " << e.what() << '\n';
        return 2;
    }
    return 0;
}
