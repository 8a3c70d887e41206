#ifndef __PCI_TREE_H__
#define __PCI_TREE_H__

#include <cstddef>
#include <map>
#include <memory>
#include <utility>
#include <vector>

#include "pci_address.hpp"
#include "pci_device.hpp"

class pci_node
{
public:
    pci_node(pci_device device, const pci_node* parent)
        : m_device(std::move(device)), m_parent(parent) {}

    const pci_device& getDevice() const { return m_device; }
    const pci_address& getAddress() const { return m_device.getAddress(); }
    const pci_node* getParent() const { return m_parent; }
    const std::vector<std::unique_ptr<pci_node>>& getChildren() const { return m_children; }

    // ancestors from the immediate parent up to the root, without this node
    std::vector<const pci_node*> getPath() const;

private:
    friend class pci_tree;

    pci_device                             m_device;
    const pci_node*                        m_parent;
    std::vector<std::unique_ptr<pci_node>> m_children;
};

// Forest rebuilt from the flat snapshot. Roots and children are kept in
// address order, so device/function order below each parent.
class pci_tree
{
public:
    // Throws topology_error for a duplicate address, a parent that is not in
    // the snapshot, or a parent chain that loops.
    explicit pci_tree(std::vector<pci_device> devices);
    ~pci_tree() = default;

    pci_tree(pci_tree&&) = default;
    pci_tree& operator=(pci_tree&&) = default;

    const std::vector<std::unique_ptr<pci_node>>& getRoots() const { return m_roots; }

    const pci_node* getPciDevice(const pci_address& address) const;

    // every node, in address order
    std::vector<const pci_node*> getPciDeviceList() const;

    size_t size() const { return m_index.size(); }

private:
    void attach(pci_node& node, std::vector<pci_device>& devices,
                const std::map<pci_address, std::vector<size_t>>& children);

    std::vector<std::unique_ptr<pci_node>> m_roots;
    std::map<pci_address, const pci_node*> m_index;
};

#endif
