#include <regex>

#include "pci_address.hpp"
#include "pci_log.hpp"

using namespace std;

namespace
{
    // Domain(32bits):Bus(8bits):Device(5bits).Function(3bits)
    const regex LONG_PCI_ADDR_REGEX(
        "^([0-9a-fA-F]{2,8}):([0-9a-fA-F]{2}):([01][0-9a-fA-F])[:.]0*([0-7])$");

    // Bus(8bits):Device(5bits).Function(3bits)
    const regex SHORT_PCI_ADDR_REGEX(
        "^([0-9a-fA-F]{2}):([01][0-9a-fA-F])\\.([0-7])$");

    uint32_t hex_field(const ssub_match& field)
    {
        return static_cast<uint32_t>(stoul(field.str(), nullptr, 16));
    }
}

optional<pci_address> pci_address::parse(const string& text)
{
    smatch m;

    if (regex_match(text, m, LONG_PCI_ADDR_REGEX))
    {
        return pci_address(hex_field(m[1]),
                           static_cast<uint8_t>(hex_field(m[2])),
                           static_cast<uint8_t>(hex_field(m[3])),
                           static_cast<uint8_t>(hex_field(m[4])));
    }

    if (regex_match(text, m, SHORT_PCI_ADDR_REGEX))
    {
        return pci_address(0,
                           static_cast<uint8_t>(hex_field(m[1])),
                           static_cast<uint8_t>(hex_field(m[2])),
                           static_cast<uint8_t>(hex_field(m[3])));
    }

    return nullopt;
}

string pci_address::toString() const
{
    return fmt::format("{:04x}:{:02x}:{:02x}.{:x}", m_domain, m_bus, m_device, m_function);
}

string pci_address::toShortString() const
{
    if (m_domain != 0)
        return toString();

    return fmt::format("{:02x}:{:02x}.{:x}", m_bus, m_device, m_function);
}
