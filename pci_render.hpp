#ifndef __PCI_RENDER_H__
#define __PCI_RENDER_H__

#include <string>
#include <vector>

#include "dmi_slots.hpp"
#include "pci_filter.hpp"
#include "pci_ids.hpp"
#include "pci_tree.hpp"

enum class output_mode
{
    flat,
    tree,
    json,
};

struct render_options
{
    bool hexify      = false;  // JSON ids as zero padded hex strings
    bool vpd         = false;
    bool aer         = false;
    bool verbose     = false;
    bool color       = false;
    bool markMatched = false;  // tag JSON entries with "matched"
};

class pci_renderer
{
public:
    pci_renderer(const pci_ids& ids, const dmi_slot_map& slots, render_options options)
        : m_ids(ids), m_slots(slots), m_options(options) {}

    std::string render(output_mode mode, const pci_tree& tree, const filter_result& result) const;

    std::string renderFlat(const filter_result& result) const;
    std::string renderTree(const pci_tree& tree, const filter_result& result) const;
    std::string renderJson(const filter_result& result) const;

private:
    std::string jsonEntry(const filter_entry& entry) const;
    void treeLevel(const std::vector<const pci_node*>& nodes, const filter_result& result,
                   const std::string& prefix, bool top, std::string& out) const;
    std::string treeLine(const pci_node& node) const;

    const pci_ids&      m_ids;
    const dmi_slot_map& m_slots;
    render_options      m_options;
};

std::string json_escape(const std::string& text);

#endif
