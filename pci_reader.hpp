#ifndef __PCI_READER_H__
#define __PCI_READER_H__

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "pci_address.hpp"
#include "pci_device.hpp"

#define SYSFS_PCI_BUS_DEVICES "/sys/bus/pci/devices"

struct read_options
{
    std::filesystem::path sysfsRoot = SYSFS_PCI_BUS_DEVICES;
    bool                  readVpd   = false;
    bool                  readAer   = false;
};

// Parses a sysfs numeric attribute such as "0x8086\n": optional 0x prefix,
// at most `digits` hex digits. Throws parse_error otherwise.
uint32_t parse_hex_attribute(const std::string& attribute, const std::string& text, size_t digits);

// Reads DeviceRecords from the per-device sysfs directories.
class device_reader
{
public:
    explicit device_reader(read_options options);
    ~device_reader() = default;

    const read_options& getOptions() const { return m_options; }

    // Throws read_error when the device directory or one of its identity
    // attributes (vendor, device, class) cannot be read.
    pci_device read(const pci_address& address) const;

    // Nothing when the device has no VPD. Throws read_error when the VPD
    // resource exists but reading it fails.
    std::optional<vpd_record> readVpd(const pci_address& address) const;

    std::optional<aer_info> readAer(const pci_address& address, bool rootPort) const;

    // Upstream device from the canonical sysfs path, nothing below a host
    // bridge. Throws read_error when the path cannot be resolved.
    std::optional<pci_address> getParent(const pci_address& address) const;

private:
    std::filesystem::path deviceDir(const pci_address& address) const;

    std::optional<std::string> getFileContext(const pci_address& address, const std::string& fileName) const;
    std::optional<std::vector<uint8_t>> getBinaryContext(const pci_address& address, const std::string& fileName) const;

    std::optional<uint32_t> getHexAttribute(pci_device& device, const std::string& fileName,
                                            size_t digits, bool required) const;

    read_options m_options;
};

#endif
