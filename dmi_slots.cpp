#include <algorithm>
#include <cctype>
#include <cstdio>
#include <memory>
#include <sstream>
#include <vector>

#include "dmi_slots.hpp"
#include "pci_log.hpp"

#include <fmt/ranges.h>

using namespace std;

namespace
{
    const char* DMIDECODE_SLOTS = "/sbin/dmidecode -t slot 2>/dev/null";

    string trim(const string& text)
    {
        size_t first = text.find_first_not_of(" \t\r\n");
        if (first == string::npos)
            return "";
        size_t last = text.find_last_not_of(" \t\r\n");
        return text.substr(first, last - first + 1);
    }

    void add_slot(const map<string, string>& slot, dmi_slot_map& slots)
    {
        auto address = slot.find("Bus Address");
        auto designation = slot.find("Designation");
        auto type = slot.find("Type");
        if (address == slot.end() || designation == slot.end() || type == slot.end())
            return;

        string key = address->second;
        transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return tolower(c); });
        slots[key] = dmi_slot{ designation->second, type->second };
    }
}

dmi_slot_map parse_dmi_slots(istream& in)
{
    dmi_slot_map slots;
    map<string, string> slot;
    bool inSlot = false;

    string line;
    while (getline(in, line))
    {
        line = trim(line);

        if (line == "System Slot Information")
        {
            slot.clear();
            inSlot = true;
            continue;
        }

        if (!inSlot)
            continue;

        if (line.empty())
        {
            add_slot(slot, slots);
            slot.clear();
            inSlot = false;
            continue;
        }

        size_t sep = line.find(": ");
        if (sep != string::npos)
            slot[line.substr(0, sep)] = line.substr(sep + 2);
    }

    if (inSlot)
        add_slot(slot, slots);

    return slots;
}

dmi_slot_map load_dmi_slots()
{
    unique_ptr<FILE, int (*)(FILE*)> pipe(popen(DMIDECODE_SLOTS, "r"), pclose);
    if (!pipe)
    {
        log_debug("could not run dmidecode, slot designations unavailable");
        return dmi_slot_map();
    }

    string output;
    char buffer[4096];
    size_t byteRead;
    while ((byteRead = fread(buffer, 1, sizeof(buffer), pipe.get())) > 0)
        output.append(buffer, byteRead);

    istringstream in(output);
    dmi_slot_map slots = parse_dmi_slots(in);
    log_debug("dmidecode reported {} PCI slots", slots.size());
    return slots;
}

optional<string> device_location(const pci_node& node, const dmi_slot_map& slots)
{
    vector<string> pathels;

    for (const pci_node* ancestor : node.getPath())
    {
        const pci_device& dev = ancestor->getDevice();

        auto dmi = slots.find(dev.getAddress().toString());
        if (dmi != slots.end())
        {
            pathels.push_back(dmi->second.designation);
            continue;
        }

        vector<string> pathpart;
        const express_info& express = dev.getExpress();
        if (express.slot)
            pathpart.push_back(fmt::format("slot {}", express.slot->slot));
        if (express.link && express.type)
            pathpart.push_back(express_type_name(*express.type));

        if (!pathpart.empty())
            pathels.push_back(fmt::format("{}", fmt::join(pathpart, ", ")));
    }

    if (pathels.empty())
        return nullopt;

    return fmt::format("{}", fmt::join(pathels, " -> "));
}
