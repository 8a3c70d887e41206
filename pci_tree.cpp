#include <algorithm>

#include "pci_error.hpp"
#include "pci_log.hpp"
#include "pci_tree.hpp"

using namespace std;

vector<const pci_node*> pci_node::getPath() const
{
    vector<const pci_node*> path;
    for (const pci_node* current = m_parent; current != nullptr; current = current->m_parent)
        path.push_back(current);

    return path;
}

pci_tree::pci_tree(vector<pci_device> devices)
{
    // first pass: index every record by address
    map<pci_address, size_t> index;
    for (size_t i = 0; i < devices.size(); i++)
    {
        if (!index.emplace(devices[i].getAddress(), i).second)
            throw topology_error(devices[i].getAddress().toString(), "address appears twice in the snapshot");
    }

    // second pass: link children to parents
    map<pci_address, vector<size_t>> children;
    vector<size_t> roots;
    for (size_t i = 0; i < devices.size(); i++)
    {
        const optional<pci_address>& parent = devices[i].getParent();
        if (!parent)
        {
            roots.push_back(i);
            continue;
        }

        if (index.find(*parent) == index.end())
        {
            throw topology_error(devices[i].getAddress().toString(),
                                 fmt::format("parent {} is not in the snapshot", parent->toString()));
        }
        children[*parent].push_back(i);
    }

    auto byAddress = [&devices](size_t a, size_t b) {
        return devices[a].getAddress() < devices[b].getAddress();
    };
    sort(roots.begin(), roots.end(), byAddress);
    for (auto& entry : children)
        sort(entry.second.begin(), entry.second.end(), byAddress);

    for (size_t i : roots)
    {
        auto node = make_unique<pci_node>(std::move(devices[i]), nullptr);
        m_index[node->getAddress()] = node.get();
        attach(*node, devices, children);
        m_roots.push_back(std::move(node));
    }

    // records never reached from a root sit on a parent cycle
    if (m_index.size() != index.size())
    {
        for (const auto& entry : index)
        {
            if (m_index.find(entry.first) == m_index.end())
                throw topology_error(entry.first.toString(), "parent chain never reaches a root");
        }
    }

    log_debug("topology: {} devices under {} roots", m_index.size(), m_roots.size());
}

void pci_tree::attach(pci_node& node, vector<pci_device>& devices,
                      const map<pci_address, vector<size_t>>& children)
{
    auto it = children.find(node.getAddress());
    if (it == children.end())
        return;

    for (size_t i : it->second)
    {
        auto child = make_unique<pci_node>(std::move(devices[i]), &node);
        m_index[child->getAddress()] = child.get();
        attach(*child, devices, children);
        node.m_children.push_back(std::move(child));
    }
}

const pci_node* pci_tree::getPciDevice(const pci_address& address) const
{
    auto it = m_index.find(address);
    if (it == m_index.end())
        return nullptr;

    return it->second;
}

vector<const pci_node*> pci_tree::getPciDeviceList() const
{
    vector<const pci_node*> list;
    list.reserve(m_index.size());
    for (const auto& entry : m_index)
        list.push_back(entry.second);

    return list;
}
