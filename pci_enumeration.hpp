#ifndef __PCI_ENUMERATION_H__
#define __PCI_ENUMERATION_H__

#include <filesystem>
#include <vector>

#include "pci_address.hpp"
#include "pci_device.hpp"
#include "pci_reader.hpp"

// Addresses of all devices below the sysfs root, in address order.
// Throws read_error when the root itself cannot be listed.
std::vector<pci_address> enumeration(const std::filesystem::path& root);

// Reads every address. A device that fails is kept with only its address,
// parent and read error; one whose parent is unknown too is skipped with a
// warning. If none can be read at all the snapshot fails with read_error.
std::vector<pci_device> read_snapshot(const device_reader& reader, const std::vector<pci_address>& addresses);

#endif
