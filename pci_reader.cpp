#include <cerrno>
#include <cstring>
#include <fstream>

#include <fcntl.h>
#include <unistd.h>

#include "pci_error.hpp"
#include "pci_log.hpp"
#include "pci_reader.hpp"

using namespace std;
using namespace std::filesystem;

namespace
{
    class file_descriptor
    {
    public:
        explicit file_descriptor(int fd) : m_fd(fd) {}
        ~file_descriptor()
        {
            if (m_fd >= 0)
                close(m_fd);
        }
        file_descriptor(const file_descriptor&) = delete;
        file_descriptor& operator=(const file_descriptor&) = delete;

        int get() const { return m_fd; }

    private:
        int m_fd;
    };

    // the resource is simply not there for this device
    bool is_absent(int error)
    {
        return error == ENOENT || error == ENODEV || error == ENXIO;
    }

    bool is_hex_digit(char c)
    {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    }

    const char* AER_DEVICE_STATS[] = {
        "aer_dev_correctable",
        "aer_dev_fatal",
        "aer_dev_nonfatal",
    };

    const char* AER_ROOTPORT_COUNTS[] = {
        "aer_rootport_total_err_cor",
        "aer_rootport_total_err_fatal",
        "aer_rootport_total_err_nonfatal",
    };
}

uint32_t parse_hex_attribute(const string& attribute, const string& text, size_t digits)
{
    string value = text;
    while (!value.empty() && (value.back() == '\n' || value.back() == ' '))
        value.pop_back();

    string hex = value;
    if (hex.size() > 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X'))
        hex.erase(0, 2);

    if (hex.empty() || hex.size() > digits)
        throw parse_error(attribute, value);
    for (char c : hex)
    {
        if (!is_hex_digit(c))
            throw parse_error(attribute, value);
    }

    return static_cast<uint32_t>(stoul(hex, nullptr, 16));
}

device_reader::device_reader(read_options options)
    : m_options(std::move(options))
{
}

path device_reader::deviceDir(const pci_address& address) const
{
    return m_options.sysfsRoot / address.toString();
}

optional<string> device_reader::getFileContext(const pci_address& address, const string& fileName) const
{
    path filePath = deviceDir(address) / fileName;

    error_code ec;
    if (!exists(filePath, ec))
    {
        if (ec)
            throw read_error(address.toString(), fileName, ec.message());
        return nullopt;
    }

    fstream file;
    file.open(filePath, std::ios::in);
    if (!file)
        throw read_error(address.toString(), fileName, strerror(errno));

    string content;
    getline(file, content);
    if (file.bad())
        throw read_error(address.toString(), fileName, "read failed");
    file.close();

    return content;
}

optional<vector<uint8_t>> device_reader::getBinaryContext(const pci_address& address, const string& fileName) const
{
    path filePath = deviceDir(address) / fileName;

    file_descriptor fd(open(filePath.c_str(), O_RDONLY));
    if (fd.get() < 0)
    {
        if (is_absent(errno))
            return nullopt;
        throw read_error(address.toString(), fileName, strerror(errno));
    }

    vector<uint8_t> data;
    uint8_t buffer[4096];
    while (true)
    {
        ssize_t byteRead = ::read(fd.get(), buffer, sizeof(buffer));
        if (byteRead < 0)
        {
            if (errno == EINTR)
                continue;
            if (data.empty() && is_absent(errno))
                return nullopt;
            throw read_error(address.toString(), fileName, strerror(errno));
        }
        if (byteRead == 0)
            break;
        data.insert(data.end(), buffer, buffer + byteRead);
    }

    return data;
}

optional<uint32_t> device_reader::getHexAttribute(pci_device& device, const string& fileName,
                                                  size_t digits, bool required) const
{
    const string address = device.getAddress().toString();

    optional<string> text = getFileContext(device.getAddress(), fileName);
    if (!text)
    {
        if (required)
            throw read_error(address, fileName, "attribute missing");
        return nullopt;
    }

    try
    {
        return parse_hex_attribute(fileName, *text, digits);
    }
    catch (const parse_error& e)
    {
        log_warning("{}: {}", address, e.what());
        device.addNote(e.what());
        return nullopt;
    }
}

optional<pci_address> device_reader::getParent(const pci_address& address) const
{
    error_code ec;
    path real = canonical(deviceDir(address), ec);
    if (ec)
        throw read_error(address.toString(), "", "cannot resolve sysfs path: " + ec.message());

    // a host bridge directory such as pci0000:00 is not an address
    return pci_address::parse(real.parent_path().filename().string());
}

pci_device device_reader::read(const pci_address& address) const
{
    error_code ec;
    if (!is_directory(deviceDir(address), ec))
        throw read_error(address.toString(), "", ec ? ec.message() : "no such device");

    pci_device device(address);

    auto narrow = [](optional<uint32_t> value) -> optional<uint16_t> {
        if (!value)
            return nullopt;
        return static_cast<uint16_t>(*value);
    };

    device.setVendorId(narrow(getHexAttribute(device, "vendor", 4, true)));
    device.setDeviceId(narrow(getHexAttribute(device, "device", 4, true)));
    device.setClassId(getHexAttribute(device, "class", 6, true));
    device.setSubsystemVendor(narrow(getHexAttribute(device, "subsystem_vendor", 4, false)));
    device.setSubsystemDevice(narrow(getHexAttribute(device, "subsystem_device", 4, false)));

    device.setParent(getParent(address));
    bool virtfn = exists(deviceDir(address) / "physfn", ec);
    if (ec)
    {
        log_warning("{}: physfn: {}", address.toString(), ec.message());
        device.addNote("physfn: " + ec.message());
    }
    device.setVirtualFunction(virtfn);

    try
    {
        optional<vector<uint8_t>> config = getBinaryContext(address, "config");
        if (config)
            device.setExpress(decode_express_info(*config));
        else
            device.addNote("config: not exposed");
    }
    catch (const read_error& e)
    {
        // without config space the device is still listed, just as plain PCI
        log_debug("{}", e.what());
        device.addNote(e.what());
    }

    if (m_options.readVpd)
    {
        try
        {
            device.setVpd(readVpd(address));
        }
        catch (const read_error& e)
        {
            log_warning("{}", e.what());
            device.addNote(e.what());
        }
    }

    if (m_options.readAer && device.isExpress())
    {
        bool rootPort = *device.getExpressType() == express_type::root_port;
        device.setAer(readAer(address, rootPort));
    }

    return device;
}

optional<vpd_record> device_reader::readVpd(const pci_address& address) const
{
    optional<vector<uint8_t>> data = getBinaryContext(address, "vpd");
    if (!data || data->empty())
        return nullopt;

    return decode_vpd(*data);
}

optional<aer_info> device_reader::readAer(const pci_address& address, bool rootPort) const
{
    aer_info aer;

    for (const char* name : AER_DEVICE_STATS)
    {
        ifstream file(deviceDir(address) / name);
        if (!file)
            continue;

        aer.device[name] = parse_aer_stats(file);
    }

    if (rootPort)
    {
        for (const char* name : AER_ROOTPORT_COUNTS)
        {
            ifstream file(deviceDir(address) / name);
            if (!file)
                continue;

            optional<int64_t> count = parse_aer_count(file);
            if (count)
                aer.rootport[name] = *count;
        }
    }

    if (aer.empty())
        return nullopt;

    return aer;
}
