#include <cstdlib>
#include <fstream>
#include <stdexcept>

#ifndef FMT_HEADER_ONLY
#define FMT_HEADER_ONLY
#endif
#include <fmt/format.h>

#include "pci_address.hpp"
#include "test_helpers.hpp"

using namespace std;
using namespace std::filesystem;

fake_sysfs::fake_sysfs()
{
    string pattern = (temp_directory_path() / "pci_crawler_test_XXXXXX").string();
    if (mkdtemp(pattern.data()) == nullptr)
        throw runtime_error("mkdtemp failed");

    m_base = pattern;
    create_directories(root());
    create_directories(m_base / "devices");
}

fake_sysfs::~fake_sysfs()
{
    error_code ec;
    remove_all(m_base, ec);
}

path fake_sysfs::deviceDir(const string& address) const
{
    auto it = m_devices.find(address);
    if (it == m_devices.end())
        throw runtime_error("unknown fake device " + address);
    return it->second;
}

path fake_sysfs::addDevice(const string& address, const string& parent,
                           uint16_t vendor, uint16_t device, uint32_t classId)
{
    path dir;
    if (parent.empty())
    {
        pci_address addr = *pci_address::parse(address);
        dir = m_base / "devices" / fmt::format("pci{:04x}:{:02x}", addr.getDomain(), addr.getBus()) / address;
    }
    else
    {
        dir = deviceDir(parent) / address;
    }

    create_directories(dir);
    m_devices[address] = dir;
    create_directory_symlink(dir, root() / address);

    writeAttribute(address, "vendor", fmt::format("0x{:04x}\n", vendor));
    writeAttribute(address, "device", fmt::format("0x{:04x}\n", device));
    writeAttribute(address, "class", fmt::format("0x{:06x}\n", classId));
    writeAttribute(address, "subsystem_vendor", "0x1028\n");
    writeAttribute(address, "subsystem_device", "0x0abc\n");

    return dir;
}

void fake_sysfs::writeAttribute(const string& address, const string& name, const string& content)
{
    ofstream file(deviceDir(address) / name);
    file << content;
}

void fake_sysfs::writeBinary(const string& address, const string& name, const vector<uint8_t>& data)
{
    ofstream file(deviceDir(address) / name, ios::binary);
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<streamsize>(data.size()));
}

void fake_sysfs::removeAttribute(const string& address, const string& name)
{
    std::filesystem::remove(deviceDir(address) / name);
}

pci_device make_device(const string& address, const string& parent, optional<express_type> type,
                       uint16_t vendor, uint16_t device, uint32_t classId)
{
    pci_device dev(*pci_address::parse(address));
    dev.setVendorId(vendor);
    dev.setDeviceId(device);
    dev.setClassId(classId);
    dev.setSubsystemVendor(0x1028);
    dev.setSubsystemDevice(0x0abc);
    if (!parent.empty())
        dev.setParent(*pci_address::parse(parent));

    express_info express;
    express.type = type;
    dev.setExpress(express);
    return dev;
}

namespace
{
    void put_u16(vector<uint8_t>& data, size_t offset, uint16_t value)
    {
        data[offset]     = static_cast<uint8_t>(value);
        data[offset + 1] = static_cast<uint8_t>(value >> 8);
    }

    void put_u32(vector<uint8_t>& data, size_t offset, uint32_t value)
    {
        put_u16(data, offset, static_cast<uint16_t>(value));
        put_u16(data, offset + 2, static_cast<uint16_t>(value >> 16));
    }
}

vector<uint8_t> express_config(uint8_t typeCode, uint16_t lnksta, uint16_t lnkcap, uint16_t lnkctl2,
                               optional<uint32_t> sltcap, uint16_t sltctl, uint16_t sltsta)
{
    const size_t cap = 0x40;
    vector<uint8_t> config(256, 0);

    put_u16(config, 0x00, 0x8086);
    put_u16(config, 0x06, 0x0010);
    config[0x34] = cap;

    config[cap]     = 0x10;
    config[cap + 1] = 0x00;

    uint16_t flags = 0x0002 | static_cast<uint16_t>(typeCode << 4);
    if (sltcap)
        flags |= 0x0100;
    put_u16(config, cap + 0x02, flags);

    put_u32(config, cap + 0x0c, lnkcap);
    put_u16(config, cap + 0x12, lnksta);
    if (sltcap)
    {
        put_u32(config, cap + 0x14, *sltcap);
        put_u16(config, cap + 0x18, sltctl);
        put_u16(config, cap + 0x1a, sltsta);
    }
    put_u16(config, cap + 0x30, lnkctl2);

    return config;
}
