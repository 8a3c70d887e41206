#ifndef pci_device_H_
#define pci_device_H_

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "pci_address.hpp"
#include "pci_aer.hpp"
#include "pci_config.hpp"
#include "vpd_decoder.hpp"

// One PCI function as read from the host. IDs are opaque codes kept at their
// register width so they can always be rendered back as hex.
class pci_device
{
public:
    pci_device() = default;
    explicit pci_device(const pci_address& address) : m_address(address) {}
    ~pci_device() = default;

    const pci_address& getAddress()                  const { return m_address;         }
    std::optional<uint16_t> getVendorId()            const { return m_vendorId;        }
    std::optional<uint16_t> getDeviceId()            const { return m_deviceId;        }
    std::optional<uint16_t> getSubsystemVendor()     const { return m_subsystemVendor; }
    std::optional<uint16_t> getSubsystemDevice()     const { return m_subsystemDevice; }
    std::optional<uint32_t> getClassId()             const { return m_classId;         }
    const std::optional<pci_address>& getParent()    const { return m_parent;          }
    const express_info& getExpress()                 const { return m_express;         }
    const std::optional<vpd_record>& getVpd()        const { return m_vpd;             }
    const std::optional<aer_info>& getAer()          const { return m_aer;             }
    bool isVirtualFunction()                         const { return m_virtfn;          }
    const std::optional<std::string>& getReadError() const { return m_readError;       }
    const std::vector<std::string>& getNotes()       const { return m_notes;           }

    std::optional<express_type> getExpressType() const { return m_express.type; }
    bool isExpress() const
    {
        return m_express.type && *m_express.type != express_type::not_applicable;
    }

    void setVendorId(std::optional<uint16_t> id)             { m_vendorId = id;        }
    void setDeviceId(std::optional<uint16_t> id)             { m_deviceId = id;        }
    void setSubsystemVendor(std::optional<uint16_t> id)      { m_subsystemVendor = id; }
    void setSubsystemDevice(std::optional<uint16_t> id)      { m_subsystemDevice = id; }
    void setClassId(std::optional<uint32_t> id)              { m_classId = id;         }
    void setParent(std::optional<pci_address> parent)        { m_parent = parent;      }
    void setVirtualFunction(bool virtfn)                     { m_virtfn = virtfn;      }
    void setVpd(std::optional<vpd_record> vpd)               { m_vpd = std::move(vpd); }
    void setAer(std::optional<aer_info> aer)                 { m_aer = std::move(aer); }

    // kept in the snapshot so the devices below it still have a parent
    void setReadError(std::string error)                     { m_readError = std::move(error); }

    void setExpress(express_info express);
    void addNote(std::string note) { m_notes.push_back(std::move(note)); }

private:
    pci_address                m_address;
    std::optional<uint16_t>    m_vendorId;
    std::optional<uint16_t>    m_deviceId;
    std::optional<uint16_t>    m_subsystemVendor;
    std::optional<uint16_t>    m_subsystemDevice;
    std::optional<uint32_t>    m_classId;
    std::optional<pci_address> m_parent;
    express_info               m_express;
    std::optional<vpd_record>  m_vpd;
    std::optional<aer_info>    m_aer;
    bool                       m_virtfn = false;
    std::optional<std::string> m_readError;
    std::vector<std::string>   m_notes;
};


#endif
