#include <set>

#include <fmt/ranges.h>

#include "pci_config.hpp"
#include "pci_log.hpp"

using namespace std;

namespace
{
    const size_t PCI_CONFIG_HEADER_SIZE = 0x40;

    const size_t  PCI_VENDOR_ID       = 0x00;
    const size_t  PCI_STATUS_REGISTER = 0x06;
    const size_t  PCI_CAP_LIST_PTR    = 0x34;
    const uint16_t PCI_HAS_CAP_LIST   = 0x10;

    const uint8_t PCI_CAP_EXPRESS = 0x10;
    const size_t  PCI_CAP_FLAGS   = 0x02;

    const size_t PCI_EXP_LNKCAP  = 0x0c;
    const size_t PCI_EXP_LNKSTA  = 0x12;
    const size_t PCI_EXP_SLTCAP  = 0x14;
    const size_t PCI_EXP_SLTCTL  = 0x18;
    const size_t PCI_EXP_SLTSTA  = 0x1a;
    const size_t PCI_EXP_LNKCTL2 = 0x30;

    const uint16_t PCI_EXPRESS_FLAG_SLOT          = 0x0100;
    const uint32_t PCI_EXP_SLOT_CAP_POWER         = 1 << 1;
    const uint32_t PCI_EXP_SLOT_CAP_ATTN_LED      = 1 << 3;
    const uint16_t PCI_EXP_SLOT_CTL_POWER         = 1 << 10;
    const uint16_t PCI_EXP_SLOT_PRESENCE          = 1 << 6;
    const uint16_t PCI_EXP_SLOT_CTL_ATTN_LED_MASK = 0x00c0;

    // Config space bytes plus every offset the decoder has looked at
    class config_space
    {
    public:
        explicit config_space(const vector<uint8_t>& data) : m_data(data) {}

        size_t size() const { return m_data.size(); }

        uint8_t readU8(size_t offset)
        {
            m_used.insert(offset);
            return m_data[offset];
        }

        uint16_t readU16(size_t offset)
        {
            return static_cast<uint16_t>(readU8(offset) | (readU8(offset + 1) << 8));
        }

        uint32_t readU32(size_t offset)
        {
            return static_cast<uint32_t>(readU16(offset)) |
                   static_cast<uint32_t>(readU16(offset + 2)) << 16;
        }

        vector<size_t> getUsed() const { return vector<size_t>(m_used.begin(), m_used.end()); }

    private:
        const vector<uint8_t>& m_data;
        set<size_t>            m_used;
    };

    const char* express_speed(uint32_t code)
    {
        switch (code)
        {
            case 1: return "2.5GT/s";
            case 2: return "5GT/s";
            case 3: return "8GT/s";
            case 4: return "16GT/s";
            case 5: return "32GT/s";
            case 6: return "64GT/s";
        }
        return nullptr;
    }

    express_type express_type_from_code(uint32_t code)
    {
        switch (code)
        {
            case 0x0: return express_type::endpoint;
            case 0x1: return express_type::legacy_endpoint;
            case 0x4: return express_type::root_port;
            case 0x5: return express_type::upstream_port;
            case 0x6: return express_type::downstream_port;
            case 0x7: return express_type::pci_bridge;
            case 0x8: return express_type::pcie_bridge;
            case 0x9: return express_type::root_complex_endpoint;
            case 0xa: return express_type::root_complex_event_collector;
        }
        return express_type::unknown;
    }

    const char* attention_led(uint16_t control)
    {
        switch (control & PCI_EXP_SLOT_CTL_ATTN_LED_MASK)
        {
            case 0x0000: return "reserved";
            case 0x0040: return "on";
            case 0x0080: return "blink";
            case 0x00c0: return "off";
        }
        return "off";
    }

    // offset of a capability, 0 when absent or unreachable
    size_t find_capability(config_space& config, uint8_t capability, vector<string>& notes)
    {
        uint16_t status = config.readU16(PCI_STATUS_REGISTER);
        if ((status & PCI_HAS_CAP_LIST) == 0)
            return 0;

        set<size_t> visited;
        size_t pos = config.readU8(PCI_CAP_LIST_PTR) & ~0x3u;

        while (pos != 0)
        {
            if (!visited.insert(pos).second)
            {
                notes.push_back("detected looping in capability decoding");
                return 0;
            }
            if (pos + 2 > config.size())
            {
                notes.push_back(fmt::format("capability at {:#x} is past the readable config space ({} bytes)",
                                            pos, config.size()));
                return 0;
            }

            if (config.readU8(pos) == capability)
                return pos;

            pos = config.readU8(pos + 1) & ~0x3u;
        }

        return 0;
    }

    express_link decode_link(config_space& config, size_t express, uint16_t flags)
    {
        express_link link;

        uint16_t lnksta = config.readU16(express + PCI_EXP_LNKSTA);
        uint16_t lnkcap = config.readU16(express + PCI_EXP_LNKCAP);

        const char* speed = express_speed(lnksta & 0xf);
        link.cur_speed = speed ? speed : "unknown";
        link.cur_width = (lnksta & 0x3f0) >> 4;

        speed = express_speed(lnkcap & 0xf);
        link.capable_speed = speed ? speed : "unknown";
        link.capable_width = (lnkcap & 0x3f0) >> 4;

        // LNKCTL2 only exists from capability version 2 on
        if ((flags & 0xf) >= 2 && express + PCI_EXP_LNKCTL2 + 2 <= config.size())
        {
            speed = express_speed(config.readU16(express + PCI_EXP_LNKCTL2) & 0xf);
            if (speed)
                link.target_speed = speed;
        }

        link.state = link.cur_width != 0 ? link_state::present : link_state::not_present;
        return link;
    }

    express_slot decode_slot(config_space& config, size_t express)
    {
        express_slot slot;

        uint32_t sltcap = config.readU32(express + PCI_EXP_SLTCAP);
        uint16_t sltctl = config.readU16(express + PCI_EXP_SLTCTL);
        uint16_t sltsta = config.readU16(express + PCI_EXP_SLTSTA);

        slot.slot     = sltcap >> 19;
        slot.presence = (sltsta & PCI_EXP_SLOT_PRESENCE) != 0;

        if (sltcap & PCI_EXP_SLOT_CAP_ATTN_LED)
            slot.attn_led = attention_led(sltctl);
        else
            slot.attn_led = "unsupported";

        // a set control bit means powered off
        if (sltcap & PCI_EXP_SLOT_CAP_POWER)
            slot.power = (sltctl & PCI_EXP_SLOT_CTL_POWER) == 0;

        return slot;
    }

    void decode(config_space& config, express_info& info)
    {
        if (config.size() < PCI_CONFIG_HEADER_SIZE)
        {
            info.notes.push_back(fmt::format("config space is only {} bytes", config.size()));
            return;
        }

        if (config.readU16(PCI_VENDOR_ID) == 0xffff)
        {
            // the device has likely gone missing
            info.type = express_type::not_applicable;
            info.notes.push_back("PCI config space for device is inaccessible");
            return;
        }

        size_t express = find_capability(config, PCI_CAP_EXPRESS, info.notes);
        if (express == 0)
            return;

        if (express + PCI_CAP_FLAGS + 2 > config.size())
        {
            info.notes.push_back("express capability flags are past the readable config space");
            return;
        }

        uint16_t flags = config.readU16(express + PCI_CAP_FLAGS);
        info.type = express_type_from_code((flags & 0xf0) >> 4);

        if (*info.type == express_type::unknown ||
            *info.type == express_type::root_complex_endpoint ||
            *info.type == express_type::root_complex_event_collector)
            return;

        if (express + PCI_EXP_LNKSTA + 2 > config.size())
        {
            info.notes.push_back("express link registers are past the readable config space");
            return;
        }
        info.link = decode_link(config, express, flags);

        if (flags & PCI_EXPRESS_FLAG_SLOT)
        {
            if (express + PCI_EXP_SLTSTA + 2 > config.size())
                info.notes.push_back("express slot registers are past the readable config space");
            else
                info.slot = decode_slot(config, express);
        }
    }
}

const char* express_type_name(express_type type)
{
    switch (type)
    {
        case express_type::endpoint:                     return "endpoint";
        case express_type::legacy_endpoint:              return "legacy_endpoint";
        case express_type::root_port:                    return "root_port";
        case express_type::upstream_port:                return "upstream_port";
        case express_type::downstream_port:              return "downstream_port";
        case express_type::pci_bridge:                   return "pci_bridge";
        case express_type::pcie_bridge:                  return "pcie_bridge";
        case express_type::root_complex_endpoint:        return "root_complex_endpoint";
        case express_type::root_complex_event_collector: return "root_complex_event_collector";
        case express_type::unknown:                      return "unknown";
        case express_type::not_applicable:               return "not_applicable";
    }
    return "unknown";
}

const char* link_state_name(link_state state)
{
    switch (state)
    {
        case link_state::present:     return "present";
        case link_state::not_present: return "not_present";
        case link_state::unknown:     return "unknown";
    }
    return "unknown";
}

express_info decode_express_info(const vector<uint8_t>& config)
{
    express_info info;
    config_space space(config);

    decode(space, info);

    info.used_config_space = space.getUsed();
    return info;
}

string config_ranges(const vector<size_t>& offsets)
{
    vector<string> ranges;

    for (size_t i = 0; i < offsets.size();)
    {
        size_t j = i;
        while (j + 1 < offsets.size() && offsets[j + 1] == offsets[j] + 1)
            j++;

        if (i == j)
            ranges.push_back(fmt::format("{:#04x}", offsets[i]));
        else
            ranges.push_back(fmt::format("{:#04x}-{:#04x}", offsets[i], offsets[j]));
        i = j + 1;
    }

    return fmt::format("{}", fmt::join(ranges, ", "));
}
