#include <fstream>

#include "pci_ids.hpp"
#include "pci_log.hpp"

using namespace std;

namespace
{
    const vector<string> PCI_IDS_LOCATIONS = {
        "/usr/share/hwdata/pci.ids",
        "/usr/share/misc/pci.ids",
    };

    optional<uint32_t> parse_hex(const string& text)
    {
        if (text.empty())
            return nullopt;

        size_t used = 0;
        unsigned long value;
        try
        {
            value = stoul(text, &used, 16);
        }
        catch (const exception&)
        {
            return nullopt;
        }
        if (used != text.size())
            return nullopt;

        return static_cast<uint32_t>(value);
    }

    // "<ids>  <name>" with the leading tabs already removed
    bool split_entry(const string& line, string& ids, string& name)
    {
        size_t sep = line.find("  ");
        if (sep == string::npos)
            return false;

        ids = line.substr(0, sep);
        size_t start = line.find_first_not_of(' ', sep);
        if (start == string::npos)
            return false;
        name = line.substr(start);
        return true;
    }

    string id_text(optional<uint16_t> id)
    {
        return id ? fmt::format("{:04x}", *id) : "????";
    }
}

pci_ids pci_ids::load()
{
    return load(PCI_IDS_LOCATIONS);
}

pci_ids pci_ids::load(const vector<string>& locations)
{
    pci_ids db;

    for (const auto& location : locations)
    {
        ifstream file(location);
        if (!file)
            continue;

        db.parse(file);
        log_debug("loaded {} vendors from {}", db.m_vendors.size(), location);
        return db;
    }

    log_debug("no pci.ids database found, devices are shown by id only");
    return db;
}

void pci_ids::parse(istream& in)
{
    enum class section { none, vendors, classes };

    section current = section::none;
    optional<uint16_t> vendor;
    optional<uint16_t> device;
    optional<uint32_t> klass;
    optional<uint32_t> subclass;

    string line;
    while (getline(in, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty() || line[0] == '#')
            continue;

        string ids;
        string name;

        if (line.compare(0, 2, "C ") == 0)
        {
            current = section::classes;
            vendor.reset();
            device.reset();
            subclass.reset();
            klass.reset();

            if (!split_entry(line.substr(2), ids, name))
                continue;
            klass = parse_hex(ids);
            if (klass)
                m_classes[make_tuple(*klass << 16, 1)] = name;
        }
        else if (line.compare(0, 2, "\t\t") == 0)
        {
            if (!split_entry(line.substr(2), ids, name))
                continue;

            if (current == section::vendors && vendor && device)
            {
                size_t space = ids.find(' ');
                if (space == string::npos)
                    continue;
                optional<uint32_t> subVendor = parse_hex(ids.substr(0, space));
                optional<uint32_t> subDevice = parse_hex(ids.substr(space + 1));
                if (subVendor && subDevice)
                {
                    m_subsystems[make_tuple(*vendor, *device, static_cast<uint16_t>(*subVendor),
                                            static_cast<uint16_t>(*subDevice))] = name;
                }
            }
            else if (current == section::classes && klass && subclass)
            {
                optional<uint32_t> progIf = parse_hex(ids);
                if (progIf)
                    m_classes[make_tuple(*klass << 16 | *subclass << 8 | *progIf, 3)] = name;
            }
        }
        else if (line[0] == '\t')
        {
            if (!split_entry(line.substr(1), ids, name))
                continue;

            optional<uint32_t> id = parse_hex(ids);
            if (!id)
                continue;

            if (current == section::vendors && vendor)
            {
                device = static_cast<uint16_t>(*id);
                m_devices[make_tuple(*vendor, *device)] = name;
            }
            else if (current == section::classes && klass)
            {
                subclass = *id;
                m_classes[make_tuple(*klass << 16 | *subclass << 8, 2)] = name;
            }
        }
        else
        {
            if (!split_entry(line, ids, name))
                continue;

            optional<uint32_t> id = parse_hex(ids);
            if (!id)
                continue;

            current = section::vendors;
            vendor = static_cast<uint16_t>(*id);
            device.reset();
            m_vendors[*vendor] = name;
        }
    }
}

optional<string> pci_ids::getVendorName(uint16_t vendor) const
{
    auto it = m_vendors.find(vendor);
    if (it == m_vendors.end())
        return nullopt;
    return it->second;
}

optional<string> pci_ids::getDeviceName(uint16_t vendor, uint16_t device) const
{
    auto it = m_devices.find(make_tuple(vendor, device));
    if (it == m_devices.end())
        return nullopt;
    return it->second;
}

optional<string> pci_ids::getSubsystemName(uint16_t vendor, uint16_t device,
                                           uint16_t subVendor, uint16_t subDevice) const
{
    auto it = m_subsystems.find(make_tuple(vendor, device, subVendor, subDevice));
    if (it == m_subsystems.end())
        return nullopt;
    return it->second;
}

optional<string> pci_ids::getClassName(uint32_t classId) const
{
    const uint32_t keys[] = { classId & 0xffffff, classId & 0xffff00, classId & 0xff0000 };

    for (int depth = 3; depth >= 1; depth--)
    {
        auto it = m_classes.find(make_tuple(keys[3 - depth], depth));
        if (it != m_classes.end())
            return it->second;
    }

    return nullopt;
}

string pci_ids::describe(optional<uint16_t> vendor, optional<uint16_t> device) const
{
    optional<string> vendorName;
    optional<string> deviceName;

    if (vendor)
        vendorName = getVendorName(*vendor);
    if (vendor && device)
        deviceName = getDeviceName(*vendor, *device);

    if (vendorName && deviceName)
        return fmt::format("{} ({}) {} ({})", *vendorName, id_text(vendor), *deviceName, id_text(device));
    if (vendorName)
        return fmt::format("{} ({}), device {}", *vendorName, id_text(vendor), id_text(device));

    return fmt::format("{}:{}", id_text(vendor), id_text(device));
}
