#include <algorithm>
#include <map>

#include "pci_error.hpp"
#include "pci_filter.hpp"
#include "pci_log.hpp"

using namespace std;

namespace
{
    bool is_hex(const string& text)
    {
        return !text.empty() && all_of(text.begin(), text.end(), [](char c) {
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        });
    }

    string strip_hex_prefix(const string& text)
    {
        if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X'))
            return text.substr(2);
        return text;
    }

    uint16_t parse_id(const string& what, const string& text)
    {
        string hex = strip_hex_prefix(text);
        if (!is_hex(hex) || hex.size() > 4)
            throw filter_error(fmt::format("could not parse {} id '{}'", what, text));

        return static_cast<uint16_t>(stoul(hex, nullptr, 16));
    }
}

const vector<class_alias>& class_aliases()
{
    static const vector<class_alias> aliases = {
        { "nvme",     0x010802, 0xffffff },
        { "ethernet", 0x020000, 0xffff00 },
        { "raid",     0x010400, 0xffff00 },
        { "gpu",      0x030000, 0xff0000 },
    };
    return aliases;
}

class_filter parse_class_filter(const string& text)
{
    for (const auto& alias : class_aliases())
    {
        if (text == alias.name)
            return class_filter{ alias.value, alias.mask };
    }

    string hex = strip_hex_prefix(text);
    if (!is_hex(hex) || hex.size() > 6)
        throw filter_error(fmt::format("'{}' is neither a hex class id nor a known class alias", text));

    return class_filter{ static_cast<uint32_t>(stoul(hex, nullptr, 16)), 0xffffff };
}

id_filter parse_id_filter(const string& text)
{
    size_t colon = text.find(':');
    if (colon == string::npos)
        throw filter_error(fmt::format("could not parse vendor/device id '{}', expected vendor:device", text));

    id_filter filter;
    filter.vendor = parse_id("vendor", text.substr(0, colon));

    string device = text.substr(colon + 1);
    if (!device.empty())
        filter.device = parse_id("device", device);

    return filter;
}

pci_address parse_address_filter(const string& text)
{
    optional<pci_address> address = pci_address::parse(text);
    if (!address)
        throw filter_error(fmt::format("invalid PCI address '{}'", text));

    return *address;
}

filter_result::filter_result(vector<filter_entry> entries)
    : m_entries(std::move(entries))
{
    sort(m_entries.begin(), m_entries.end(), [](const filter_entry& a, const filter_entry& b) {
        return a.node->getAddress() < b.node->getAddress();
    });
}

const filter_entry* filter_result::find(const pci_address& address) const
{
    auto it = lower_bound(m_entries.begin(), m_entries.end(), address,
                          [](const filter_entry& entry, const pci_address& key) {
                              return entry.node->getAddress() < key;
                          });
    if (it == m_entries.end() || it->node->getAddress() != address)
        return nullptr;

    return &*it;
}

bool filter_result::contains(const pci_address& address) const
{
    return find(address) != nullptr;
}

bool filter_result::isMatched(const pci_address& address) const
{
    const filter_entry* entry = find(address);
    return entry != nullptr && entry->matched;
}

vector<const pci_node*> filter_result::getMatched() const
{
    vector<const pci_node*> matched;
    for (const auto& entry : m_entries)
    {
        if (entry.matched)
            matched.push_back(entry.node);
    }
    return matched;
}

bool matches(const pci_device& device, const filter_spec& spec)
{
    if (spec.address && device.getAddress() != *spec.address)
        return false;

    if (spec.id)
    {
        if (device.getVendorId() != spec.id->vendor)
            return false;
        if (spec.id->device && device.getDeviceId() != *spec.id->device)
            return false;
    }

    if (spec.classId)
    {
        optional<uint32_t> classId = device.getClassId();
        if (!classId || (*classId & spec.classId->mask) != spec.classId->value)
            return false;
    }

    if (spec.expressOnly && !device.isExpress())
        return false;

    if (spec.physfnOnly && device.isVirtualFunction())
        return false;

    if (spec.noBuiltin && !device.getParent() && device.getExpressType() != express_type::root_port)
        return false;

    return true;
}

filter_result apply_filter(const pci_tree& tree, const filter_spec& spec)
{
    map<pci_address, filter_entry> selected;

    for (const pci_node* node : tree.getPciDeviceList())
    {
        if (matches(node->getDevice(), spec))
            selected.emplace(node->getAddress(), filter_entry{ node, true });
    }

    size_t matched = selected.size();

    if (spec.includePath)
    {
        vector<const pci_node*> hits;
        for (const auto& entry : selected)
            hits.push_back(entry.second.node);

        // emplace keeps a matched entry when it is also someone's ancestor
        for (const pci_node* node : hits)
        {
            for (const pci_node* ancestor : node->getPath())
                selected.emplace(ancestor->getAddress(), filter_entry{ ancestor, false });
        }
    }

    log_debug("filter: {} matched, {} context", matched, selected.size() - matched);

    vector<filter_entry> entries;
    entries.reserve(selected.size());
    for (const auto& entry : selected)
        entries.push_back(entry.second);

    return filter_result(std::move(entries));
}
