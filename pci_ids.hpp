#ifndef __PCI_IDS_H__
#define __PCI_IDS_H__

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

// Names from the pci.ids database. Only used for labels, never for filtering.
class pci_ids
{
public:
    pci_ids() = default;

    // First readable file of the default locations. An empty database when
    // none is installed.
    static pci_ids load();
    static pci_ids load(const std::vector<std::string>& locations);

    void parse(std::istream& in);

    bool empty() const { return m_vendors.empty() && m_classes.empty(); }

    std::optional<std::string> getVendorName(uint16_t vendor) const;
    std::optional<std::string> getDeviceName(uint16_t vendor, uint16_t device) const;
    std::optional<std::string> getSubsystemName(uint16_t vendor, uint16_t device,
                                                uint16_t subVendor, uint16_t subDevice) const;

    // most specific name of a 24 bit class code: prog-if, subclass or class
    std::optional<std::string> getClassName(uint32_t classId) const;

    // "Vendor (vvvv) Device (dddd)" with fallbacks to what is known
    std::string describe(std::optional<uint16_t> vendor, std::optional<uint16_t> device) const;

private:
    std::map<uint16_t, std::string>                                      m_vendors;
    std::map<std::tuple<uint16_t, uint16_t>, std::string>                m_devices;
    std::map<std::tuple<uint16_t, uint16_t, uint16_t, uint16_t>, std::string> m_subsystems;

    // keyed by class << 16 | subclass << 8 | prog-if, with depth 1..3
    std::map<std::tuple<uint32_t, int>, std::string> m_classes;
};

#endif
