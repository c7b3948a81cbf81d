#include "Visa_transport.h"
#include "Gpib_errors.h"
#include <iostream>
using std::cerr;
using std::hex;
using std::dec;

#define checkApiCall( f ) do { ViStatus s = f; testApiCall( s, #f ); } while( false )

VisaTransport::VisaTransport()
    : _resourceManager(VI_NULL), _instrument(VI_NULL)
{
}

VisaTransport::~VisaTransport()
{
    close();
}

void VisaTransport::open(const std::string& address, unsigned int timeoutMs)
{
    if (isOpen())
        throw ConnectionError(address + ": transport already open on " + _address);

    try
    {
        checkApiCall(viOpenDefaultRM(&_resourceManager));
        checkApiCall(viOpen(_resourceManager, const_cast<ViRsrc>(address.c_str()), VI_EXCLUSIVE_LOCK,
            static_cast<ViUInt32>(timeoutMs), &_instrument));
        checkApiCall(viSetAttribute(_instrument, VI_ATTR_TERMCHAR, '\n'));
        checkApiCall(viSetAttribute(_instrument, VI_ATTR_TERMCHAR_EN, VI_TRUE));
        checkApiCall(viSetAttribute(_instrument, VI_ATTR_TMO_VALUE, static_cast<ViUInt32>(timeoutMs)));
    }
    catch (const GpibError& e)
    {
        close();
        throw ConnectionError(address + ": " + e.what());
    }
    _address = address;
}

void VisaTransport::setTimeout(unsigned int timeoutMs)
{
    requireOpen();
    checkApiCall(viSetAttribute(_instrument, VI_ATTR_TMO_VALUE, static_cast<ViUInt32>(timeoutMs)));
}

void VisaTransport::write(const std::string& command)
{
    requireOpen();
    std::string line = command + "\n";
    ViUInt32 written = 0;
    checkApiCall(viWrite(_instrument, reinterpret_cast<ViBuf>(const_cast<char*>(line.data())),
        static_cast<ViUInt32>(line.size()), &written));
    if (written != line.size())
        throw TransportIoError(_address + ": short write of '" + command + "'");
}

std::string VisaTransport::readLine()
{
    requireOpen();
    std::string reply;
    ViByte chunk[kReadChunkBytes];
    for (;;)
    {
        ViUInt32 count = 0;
        ViStatus status = viRead(_instrument, chunk, kReadChunkBytes, &count);
        reply.append(reinterpret_cast<const char*>(chunk), count);
        if (status == VI_SUCCESS_MAX_CNT)
        {
            if (reply.size() > kMaxReplyBytes)
                throw TransportIoError(_address + ": reply exceeds " + std::to_string(kMaxReplyBytes) + " bytes");
            continue;
        }
        if (status != VI_SUCCESS_TERM_CHAR)
            testApiCall(status, "viRead");
        break;
    }
    return reply;
}

void VisaTransport::clear()
{
    requireOpen();
    checkApiCall(viClear(_instrument));
}

void VisaTransport::close()
{
    if (_instrument != VI_NULL)
    {
        ViStatus status = viClose(_instrument);
        _instrument = VI_NULL;
        if (status < VI_SUCCESS)
            cerr << "** Warning during viClose(instrument): 0x" << hex << status << dec << '\n';
    }
    if (_resourceManager != VI_NULL)
    {
        ViStatus status = viClose(_resourceManager);
        _resourceManager = VI_NULL;
        if (status < VI_SUCCESS)
            cerr << "** Warning during viClose(resource manager): 0x" << hex << status << dec << '\n';
    }
}

void VisaTransport::requireOpen() const
{
    if (!isOpen())
        throw TransportDisconnected("VISA session is not open");
}

// Utility function to check the status of a VISA call and map errors to transport failures.
void VisaTransport::testApiCall(ViStatus status, char const* functionName)
{
    if (status == VI_SUCCESS)
        return;

    ViChar message[256] = "";
    ViObject reporter = _instrument != VI_NULL ? _instrument : _resourceManager;
    viStatusDesc(reporter, status, message);

    if (status > 0) // Warning occurred.
    {
        cerr << "** Warning during " << functionName << ": 0x" << hex << status << dec << ", " << message << '\n';
        return;
    }

    // Error occurred.
    cerr << "** ERROR during " << functionName << ": 0x" << hex << status << dec << ", " << message << '\n';
    std::string what = _address + ": " + functionName + ": " + message;
    switch (status)
    {
    case VI_ERROR_TMO:
        throw TransportTimeout(what);
    case VI_ERROR_CONN_LOST:
    case VI_ERROR_NLISTENERS:
    case VI_ERROR_INV_OBJECT:
        throw TransportDisconnected(what);
    default:
        throw TransportIoError(what);
    }
}
