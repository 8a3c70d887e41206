#ifndef __PCI_CONFIG_H__
#define __PCI_CONFIG_H__

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class express_type
{
    endpoint,
    legacy_endpoint,
    root_port,
    upstream_port,
    downstream_port,
    pci_bridge,
    pcie_bridge,
    root_complex_endpoint,
    root_complex_event_collector,
    unknown,
    not_applicable,
};

enum class link_state
{
    present,
    not_present,
    unknown,
};

struct express_link
{
    link_state                 state = link_state::unknown;
    std::string                cur_speed;
    uint32_t                   cur_width = 0;
    std::string                capable_speed;
    uint32_t                   capable_width = 0;
    std::optional<std::string> target_speed;
};

struct express_slot
{
    uint32_t            slot     = 0;
    bool                presence = false;
    std::optional<bool> power;      // unset when power is not controllable
    std::string         attn_led;
};

// What the PCI Express capability of one function says about it
struct express_info
{
    std::optional<express_type> type;   // unset for plain PCI devices
    std::optional<express_link> link;
    std::optional<express_slot> slot;
    std::vector<std::string>    notes;  // soft decoding errors
    std::vector<size_t>         used_config_space;  // sorted byte offsets read
};

const char* express_type_name(express_type type);
const char* link_state_name(link_state state);

// Decodes the express capability from the readable part of a config space.
// Unprivileged readers only get the first 64 bytes, so a short buffer is
// normal and only yields notes.
express_info decode_express_info(const std::vector<uint8_t>& config);

// "0x00-0x01, 0x34" for sorted offsets
std::string config_ranges(const std::vector<size_t>& offsets);

#endif
