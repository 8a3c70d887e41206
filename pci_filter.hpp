#ifndef __PCI_FILTER_H__
#define __PCI_FILTER_H__

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "pci_address.hpp"
#include "pci_tree.hpp"

// device matches when (class_id & mask) == value
struct class_filter
{
    uint32_t value = 0;
    uint32_t mask  = 0xffffff;
};

struct class_alias
{
    const char* name;
    uint32_t    value;
    uint32_t    mask;
};

// nvme, ethernet, raid, gpu
const std::vector<class_alias>& class_aliases();

// Hex class code ("010802", "0x0108") or one of the aliases.
// Throws filter_error.
class_filter parse_class_filter(const std::string& text);

struct id_filter
{
    uint16_t                vendor = 0;
    std::optional<uint16_t> device;  // unset matches any device of the vendor
};

// "vvvv:dddd" or "vvvv:" in hex. Throws filter_error.
id_filter parse_id_filter(const std::string& text);

// Throws filter_error.
pci_address parse_address_filter(const std::string& text);

struct filter_spec
{
    std::optional<class_filter> classId;
    std::optional<id_filter>    id;
    std::optional<pci_address>  address;
    bool expressOnly = false;
    bool physfnOnly  = false;
    bool noBuiltin   = false;
    bool includePath = false;
};

struct filter_entry
{
    const pci_node* node;
    bool            matched;  // false for ancestors pulled in as context
};

class filter_result
{
public:
    explicit filter_result(std::vector<filter_entry> entries);

    // address order
    const std::vector<filter_entry>& getEntries() const { return m_entries; }

    bool empty() const { return m_entries.empty(); }
    size_t size() const { return m_entries.size(); }

    bool contains(const pci_address& address) const;
    bool isMatched(const pci_address& address) const;

    std::vector<const pci_node*> getMatched() const;

private:
    const filter_entry* find(const pci_address& address) const;

    std::vector<filter_entry> m_entries;
};

bool matches(const pci_device& device, const filter_spec& spec);

// Pure function of the forest and the spec. An empty result is not an error.
filter_result apply_filter(const pci_tree& tree, const filter_spec& spec);

#endif
