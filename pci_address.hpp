#ifndef __PCI_ADDRESS_H__
#define __PCI_ADDRESS_H__

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>

// domain:bus:device.function of one PCI function.
// The domain is not always 0, ARM servers routinely expose several.
class pci_address
{
public:
    pci_address() = default;
    pci_address(uint32_t domain, uint8_t bus, uint8_t device, uint8_t function)
        : m_domain(domain), m_bus(bus), m_device(device), m_function(function) {}

    // Accepts "dddd:bb:dd.f", "dddd:bb:dd:f" and the short "bb:dd.f" form,
    // case insensitive. Returns nothing for anything else.
    static std::optional<pci_address> parse(const std::string& text);

    uint32_t getDomain()   const { return m_domain;   }
    uint8_t  getBus()      const { return m_bus;      }
    uint8_t  getDevice()   const { return m_device;   }
    uint8_t  getFunction() const { return m_function; }

    std::string toString() const;
    std::string toShortString() const;

    bool operator==(const pci_address& other) const { return key() == other.key(); }
    bool operator!=(const pci_address& other) const { return key() != other.key(); }
    bool operator<(const pci_address& other)  const { return key() <  other.key(); }

private:
    std::tuple<uint32_t, uint8_t, uint8_t, uint8_t> key() const
    {
        return std::make_tuple(m_domain, m_bus, m_device, m_function);
    }

    uint32_t m_domain   = 0;
    uint8_t  m_bus      = 0;
    uint8_t  m_device   = 0;
    uint8_t  m_function = 0;
};

#endif
