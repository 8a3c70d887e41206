#include <fmt/color.h>
#include <fmt/ranges.h>

#include "pci_log.hpp"
#include "pci_render.hpp"

using namespace std;

namespace
{
    string paint(bool color, fmt::text_style style, const string& text)
    {
        if (!color)
            return text;
        return fmt::format(style, "{}", text);
    }

    string json_string(const string& text)
    {
        return "\"" + json_escape(text) + "\"";
    }

    string json_optional(const optional<string>& text)
    {
        return text ? json_string(*text) : "null";
    }

    template <typename T>
    string json_id(optional<T> id, int pad, bool hexify)
    {
        if (!id)
            return "null";
        if (hexify)
            return fmt::format("\"{:0{}x}\"", *id, pad);
        return fmt::format("{}", *id);
    }

    string json_bool(bool value)
    {
        return value ? "true" : "false";
    }

    // "key": value pairs joined the way json.dumps does
    string json_object(const vector<pair<string, string>>& members)
    {
        vector<string> parts;
        parts.reserve(members.size());
        for (const auto& member : members)
            parts.push_back(json_string(member.first) + ": " + member.second);

        return fmt::format("{{{}}}", fmt::join(parts, ", "));
    }

    string json_vpd(const vpd_record& vpd)
    {
        vector<pair<string, string>> fields;
        for (const auto& field : vpd.fields)
            fields.emplace_back(field.first, json_string(field.second));

        return json_object({
            { "identifier_string", json_optional(vpd.identifier_string) },
            { "fields", json_object(fields) },
        });
    }

    string json_aer(const aer_info& aer)
    {
        vector<pair<string, string>> members;

        if (!aer.device.empty())
        {
            vector<pair<string, string>> stats;
            for (const auto& file : aer.device)
            {
                vector<pair<string, string>> counters;
                for (const auto& counter : file.second)
                    counters.emplace_back(counter.first, fmt::format("{}", counter.second));
                stats.emplace_back(file.first, json_object(counters));
            }
            members.emplace_back("device", json_object(stats));
        }

        if (!aer.rootport.empty())
        {
            vector<pair<string, string>> counts;
            for (const auto& count : aer.rootport)
                counts.emplace_back(count.first, fmt::format("{}", count.second));
            members.emplace_back("rootport", json_object(counts));
        }

        return json_object(members);
    }

    bool shows_name(const optional<express_type>& type)
    {
        return !type ||
               *type == express_type::endpoint ||
               *type == express_type::upstream_port ||
               *type == express_type::root_complex_endpoint;
    }
}

string json_escape(const string& text)
{
    string escaped;
    escaped.reserve(text.size());

    for (unsigned char c : text)
    {
        switch (c)
        {
            case '"':  escaped += "\\\""; break;
            case '\\': escaped += "\\\\"; break;
            case '\b': escaped += "\\b";  break;
            case '\f': escaped += "\\f";  break;
            case '\n': escaped += "\\n";  break;
            case '\r': escaped += "\\r";  break;
            case '\t': escaped += "\\t";  break;
            default:
                if (c < 0x20)
                    escaped += fmt::format("\\u{:04x}", c);
                else
                    escaped += static_cast<char>(c);
        }
    }

    return escaped;
}

string pci_renderer::render(output_mode mode, const pci_tree& tree, const filter_result& result) const
{
    switch (mode)
    {
        case output_mode::tree: return renderTree(tree, result);
        case output_mode::json: return renderJson(result);
        case output_mode::flat: break;
    }
    return renderFlat(result);
}

string pci_renderer::renderFlat(const filter_result& result) const
{
    const bool color = m_options.color;
    string out;

    for (const auto& entry : result.getEntries())
    {
        const pci_device& dev = entry.node->getDevice();

        string line = paint(color, fmt::fg(fmt::terminal_color::yellow), dev.getAddress().toString()) + ", ";
        if (dev.getExpressType())
            line += "PCIe " + paint(color, fmt::fg(fmt::terminal_color::red), express_type_name(*dev.getExpressType())) + ", ";
        line += paint(color, fmt::fg(fmt::terminal_color::green), m_ids.describe(dev.getVendorId(), dev.getDeviceId()));
        out += line + "\n";

        optional<string> location = device_location(*entry.node, m_slots);
        if (location)
            out += "  connected via: " + paint(color, fmt::emphasis::bold, *location) + "\n";

        if (dev.getReadError())
            out += "  read error: " + paint(color, fmt::fg(fmt::terminal_color::red), *dev.getReadError()) + "\n";

        if (m_options.verbose)
        {
            if (dev.getClassId())
            {
                optional<string> className = m_ids.getClassName(*dev.getClassId());
                out += fmt::format("  class: {} ({:06x})\n", className.value_or("unknown"), *dev.getClassId());
            }
            if (dev.getExpress().link)
                out += fmt::format("  link: {}\n", link_state_name(dev.getExpress().link->state));
            if (!dev.getExpress().used_config_space.empty())
                out += "  config space used: " + config_ranges(dev.getExpress().used_config_space) + "\n";
            for (const auto& note : dev.getNotes())
                out += "  debug: " + note + "\n";
        }

        if (m_options.vpd && dev.getVpd())
        {
            const vpd_record& vpd = *dev.getVpd();
            if (vpd.identifier_string && !vpd.identifier_string->empty())
                out += "  VPD Identifier: " + paint(color, fmt::emphasis::bold, *vpd.identifier_string) + "\n";
            for (const auto& field : vpd.fields)
            {
                out += "    " + paint(color, fmt::fg(fmt::terminal_color::blue), field.first) + "=" +
                       paint(color, fmt::emphasis::bold, field.second) + "\n";
            }
        }
    }

    return out;
}

string pci_renderer::renderTree(const pci_tree& tree, const filter_result& result) const
{
    // Built-in root complex devices are left out: only root ports and roots
    // with something below them in the result start a tree.
    vector<const pci_node*> roots;
    for (const auto& root : tree.getRoots())
    {
        if (!result.contains(root->getAddress()))
            continue;

        bool hasChildren = false;
        for (const auto& child : root->getChildren())
        {
            if (result.contains(child->getAddress()))
            {
                hasChildren = true;
                break;
            }
        }

        if (hasChildren || root->getDevice().getExpressType() == express_type::root_port)
            roots.push_back(root.get());
    }

    string out;
    treeLevel(roots, result, "", true, out);
    return out;
}

void pci_renderer::treeLevel(const vector<const pci_node*>& nodes, const filter_result& result,
                             const string& prefix, bool top, string& out) const
{
    for (size_t i = 0; i < nodes.size(); i++)
    {
        const bool last = i + 1 == nodes.size();

        string connector;
        string childPrefix;
        if (!top)
        {
            connector   = prefix + (last ? " └─" : " ├─");
            childPrefix = prefix + (last ? "   " : " │ ");
        }

        out += connector + treeLine(*nodes[i]) + "\n";

        vector<const pci_node*> children;
        for (const auto& child : nodes[i]->getChildren())
        {
            if (result.contains(child->getAddress()))
                children.push_back(child.get());
        }
        treeLevel(children, result, childPrefix, false, out);
    }
}

string pci_renderer::treeLine(const pci_node& node) const
{
    const bool color = m_options.color;
    const pci_device& dev = node.getDevice();
    const express_info& express = dev.getExpress();
    const auto blue = fmt::fg(fmt::terminal_color::blue);

    string line = paint(color, fmt::fg(fmt::terminal_color::yellow), dev.getAddress().toShortString()) + " ";
    if (express.type)
        line += paint(color, fmt::fg(fmt::terminal_color::red), express_type_name(*express.type));
    else
        line += paint(color, fmt::emphasis::underline, "PCI");

    auto dmi = m_slots.find(dev.getAddress().toString());
    if (dmi != m_slots.end())
        line += ", \"" + dmi->second.designation + "\"";

    if (express.slot)
    {
        const express_slot& slot = *express.slot;
        line += ", slot " + paint(color, blue, fmt::format("{}", slot.slot));
        if (slot.presence)
            line += ", " + paint(color, blue, "device present");
        if (slot.power)
        {
            auto style = fmt::fg(*slot.power ? fmt::terminal_color::green : fmt::terminal_color::red);
            line += ", power: " + paint(color, style, *slot.power ? "On" : "Off");
        }
        if (slot.attn_led != "unsupported" && slot.attn_led != "off")
            line += ", attn: " + paint(color, fmt::fg(fmt::terminal_color::red), slot.attn_led);
    }

    if (express.link && express.type)
    {
        const express_link& link = *express.link;
        const express_type type = *express.type;

        if ((type == express_type::downstream_port || type == express_type::root_port) && link.cur_width != 0)
        {
            line += ", speed " + paint(color, blue, link.cur_speed) +
                    ", width " + paint(color, blue, fmt::format("x{}", link.cur_width));
        }

        // ports report below target whenever their endpoint is slower, so
        // only endpoints are checked for a downgraded link
        if (link.target_speed && link.cur_speed != *link.target_speed &&
            type == express_type::endpoint && link.cur_width != 0)
        {
            line += ", current speed " + paint(color, blue, link.cur_speed) +
                    " target speed " + paint(color, blue, *link.target_speed);
        }
    }

    if (shows_name(express.type))
        line += ", " + paint(color, fmt::fg(fmt::terminal_color::green), m_ids.describe(dev.getVendorId(), dev.getDeviceId()));

    return line;
}

string pci_renderer::renderJson(const filter_result& result) const
{
    vector<pair<string, string>> devices;
    for (const auto& entry : result.getEntries())
        devices.emplace_back(entry.node->getAddress().toString(), jsonEntry(entry));

    return json_object(devices) + "\n";
}

string pci_renderer::jsonEntry(const filter_entry& entry) const
{
    const pci_device& dev = entry.node->getDevice();
    const express_info& express = dev.getExpress();
    const bool hexify = m_options.hexify;

    vector<pair<string, string>> members = {
        { "vendor_id",        json_id(dev.getVendorId(), 4, hexify) },
        { "device_id",        json_id(dev.getDeviceId(), 4, hexify) },
        { "class_id",         json_id(dev.getClassId(), 6, hexify) },
        { "subsystem_vendor", json_id(dev.getSubsystemVendor(), 4, hexify) },
        { "subsystem_device", json_id(dev.getSubsystemDevice(), 4, hexify) },
        { "addr",             json_string(dev.getAddress().toString()) },
    };

    if (express.type)
        members.emplace_back("express_type", json_string(express_type_name(*express.type)));

    if (express.link)
    {
        const express_link& link = *express.link;
        members.emplace_back("cur_speed", json_string(link.cur_speed));
        members.emplace_back("cur_width", fmt::format("{}", link.cur_width));
        members.emplace_back("capable_speed", json_string(link.capable_speed));
        members.emplace_back("capable_width", fmt::format("{}", link.capable_width));
        members.emplace_back("target_speed", json_optional(link.target_speed));
        members.emplace_back("link_state", json_string(link_state_name(link.state)));
    }

    if (express.slot)
    {
        const express_slot& slot = *express.slot;
        members.emplace_back("slot", fmt::format("{}", slot.slot));
        members.emplace_back("presence", json_bool(slot.presence));
        members.emplace_back("power", slot.power ? json_bool(*slot.power) : "null");
        members.emplace_back("attn_led", json_string(slot.attn_led));
    }

    optional<string> location = device_location(*entry.node, m_slots);
    if (location)
        members.emplace_back("location", json_string(*location));

    vector<string> path;
    for (const pci_node* ancestor : entry.node->getPath())
        path.push_back(json_string(ancestor->getAddress().toString()));
    members.emplace_back("path", fmt::format("[{}]", fmt::join(path, ", ")));

    if (m_options.vpd && dev.getVpd())
        members.emplace_back("vpd", json_vpd(*dev.getVpd()));

    if (m_options.aer && dev.getAer())
        members.emplace_back("aer", json_aer(*dev.getAer()));

    if (dev.getReadError())
        members.emplace_back("read_error", json_string(*dev.getReadError()));

    if (m_options.markMatched)
        members.emplace_back("matched", json_bool(entry.matched));

    return json_object(members);
}
