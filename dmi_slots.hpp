#ifndef __DMI_SLOTS_H__
#define __DMI_SLOTS_H__

#include <istream>
#include <map>
#include <optional>
#include <string>

#include "pci_tree.hpp"

struct dmi_slot
{
    std::string designation;
    std::string type;
};

// long PCI address -> firmware slot description
using dmi_slot_map = std::map<std::string, dmi_slot>;

// Parses `dmidecode -t slot` output. Slots without a bus address are dropped.
dmi_slot_map parse_dmi_slots(std::istream& in);

// Runs dmidecode. Any failure gives an empty map.
dmi_slot_map load_dmi_slots();

// How the device is connected, built from its ancestors nearest first and
// joined with " -> ". Nothing for a device directly on a root bus.
std::optional<std::string> device_location(const pci_node& node, const dmi_slot_map& slots);

#endif
