#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "pci_filter.hpp"
#include "pci_render.hpp"
#include "test_helpers.hpp"

namespace
{
    pci_tree root_port_with_endpoint()
    {
        return pci_tree({
            make_device("0000:00:00.0", "", std::nullopt, 0x8086, 0x2020, 0x060000),
            make_device("00:1d.4", "", express_type::root_port, 0x8086, 0xa334, 0x060400),
            make_device("02:00.0", "00:1d.4", express_type::endpoint),
        });
    }

    filter_result select(const pci_tree& tree, const std::string& address, bool includePath)
    {
        filter_spec spec;
        spec.address = parse_address_filter(address);
        spec.includePath = includePath;
        return apply_filter(tree, spec);
    }

    bool contains(const std::string& text, const std::string& part)
    {
        return text.find(part) != std::string::npos;
    }
}

TEST(PciRenderTest, TreeShowsPathToEndpoint)
{
    pci_tree tree = root_port_with_endpoint();
    pci_ids ids;
    dmi_slot_map slots;
    pci_renderer renderer(ids, slots, render_options());

    std::string out = renderer.renderTree(tree, select(tree, "02:00.0", true));

    EXPECT_EQ(out, "00:1d.4 root_port\n └─02:00.0 endpoint, 8086:1234\n");
}

TEST(PciRenderTest, TreeSkipsBuiltinRootDevices)
{
    pci_tree tree = root_port_with_endpoint();
    pci_ids ids;
    dmi_slot_map slots;
    pci_renderer renderer(ids, slots, render_options());

    std::string out = renderer.render(output_mode::tree, tree, apply_filter(tree, filter_spec()));

    EXPECT_FALSE(contains(out, "00:00.0"));
    EXPECT_TRUE(contains(out, "00:1d.4 root_port\n"));
}

TEST(PciRenderTest, TreeConnectorsForSiblings)
{
    pci_tree tree({
        make_device("00:01.0", "", express_type::root_port),
        make_device("01:00.0", "00:01.0", express_type::upstream_port),
        make_device("02:00.0", "01:00.0", express_type::downstream_port),
        make_device("02:01.0", "01:00.0", express_type::downstream_port),
        make_device("03:00.0", "02:00.0", express_type::endpoint),
    });
    pci_ids ids;
    dmi_slot_map slots;
    pci_renderer renderer(ids, slots, render_options());

    std::string out = renderer.renderTree(tree, apply_filter(tree, filter_spec()));

    EXPECT_EQ(out,
              "00:01.0 root_port\n"
              " └─01:00.0 upstream_port, 8086:1234\n"
              "    ├─02:00.0 downstream_port\n"
              "    │  └─03:00.0 endpoint, 8086:1234\n"
              "    └─02:01.0 downstream_port\n");
}

TEST(PciRenderTest, TreeShowsNamesFromDatabase)
{
    pci_tree tree = root_port_with_endpoint();
    pci_ids ids;
    std::istringstream in("8086  Intel Corporation\n\t1234  Example Controller\n");
    ids.parse(in);
    dmi_slot_map slots;
    pci_renderer renderer(ids, slots, render_options());

    std::string out = renderer.renderTree(tree, select(tree, "02:00.0", true));

    EXPECT_TRUE(contains(out, "02:00.0 endpoint, Intel Corporation (8086) Example Controller (1234)\n"));
}

TEST(PciRenderTest, FlatLine)
{
    pci_tree tree = root_port_with_endpoint();
    pci_ids ids;
    dmi_slot_map slots;
    pci_renderer renderer(ids, slots, render_options());

    std::string out = renderer.renderFlat(select(tree, "02:00.0", false));

    EXPECT_EQ(out, "0000:02:00.0, PCIe endpoint, 8086:1234\n");
}

TEST(PciRenderTest, FlatShowsVpdWhenAsked)
{
    pci_device nic = make_device("0000:02:00.0", "", express_type::endpoint);
    vpd_record vpd;
    vpd.identifier_string = "Example Adapter";
    vpd.fields["PN"] = "X";
    vpd.fields["SN"] = "Y";
    nic.setVpd(vpd);
    pci_tree tree({ nic });

    pci_ids ids;
    dmi_slot_map slots;
    render_options options;
    options.vpd = true;
    pci_renderer renderer(ids, slots, options);

    std::string out = renderer.renderFlat(apply_filter(tree, filter_spec()));

    EXPECT_EQ(out,
              "0000:02:00.0, PCIe endpoint, 8086:1234\n"
              "  VPD Identifier: Example Adapter\n"
              "    PN=X\n"
              "    SN=Y\n");
}

TEST(PciRenderTest, JsonEntryWithHexIds)
{
    pci_tree tree = root_port_with_endpoint();
    pci_ids ids;
    dmi_slot_map slots;
    render_options options;
    options.hexify = true;
    pci_renderer renderer(ids, slots, options);

    std::string out = renderer.renderJson(select(tree, "02:00.0", false));

    EXPECT_EQ(out,
              "{\"0000:02:00.0\": {\"vendor_id\": \"8086\", \"device_id\": \"1234\", "
              "\"class_id\": \"020000\", \"subsystem_vendor\": \"1028\", \"subsystem_device\": \"0abc\", "
              "\"addr\": \"0000:02:00.0\", \"express_type\": \"endpoint\", \"path\": [\"0000:00:1d.4\"]}}\n");
}

TEST(PciRenderTest, JsonNumericIdsAndNulls)
{
    pci_device dev = make_device("0000:05:00.0");
    dev.setSubsystemVendor(std::nullopt);
    dev.setSubsystemDevice(std::nullopt);
    pci_tree tree({ dev });

    pci_ids ids;
    dmi_slot_map slots;
    pci_renderer renderer(ids, slots, render_options());

    std::string out = renderer.renderJson(apply_filter(tree, filter_spec()));

    EXPECT_TRUE(contains(out, "\"vendor_id\": 32902"));
    EXPECT_TRUE(contains(out, "\"class_id\": 131072"));
    EXPECT_TRUE(contains(out, "\"subsystem_vendor\": null"));
    EXPECT_FALSE(contains(out, "express_type"));
    EXPECT_TRUE(contains(out, "\"path\": []"));
}

TEST(PciRenderTest, JsonMarksContextEntries)
{
    pci_tree tree = root_port_with_endpoint();
    pci_ids ids;
    dmi_slot_map slots;
    render_options options;
    options.markMatched = true;
    pci_renderer renderer(ids, slots, options);

    std::string out = renderer.renderJson(select(tree, "02:00.0", true));

    size_t port = out.find("\"0000:00:1d.4\": {");
    size_t endpoint = out.find("\"0000:02:00.0\": {");
    ASSERT_NE(port, std::string::npos);
    ASSERT_NE(endpoint, std::string::npos);
    ASSERT_LT(port, endpoint);

    std::string portEntry = out.substr(port, endpoint - port);
    std::string endpointEntry = out.substr(endpoint);
    EXPECT_TRUE(contains(portEntry, "\"matched\": false"));
    EXPECT_TRUE(contains(endpointEntry, "\"matched\": true"));
}

TEST(PciRenderTest, JsonLinkAndSlotFields)
{
    pci_device port = make_device("0000:00:01.0", "", std::nullopt, 0x8086, 0x1901, 0x060400);
    express_info express;
    express.type = express_type::root_port;
    express_link link;
    link.state = link_state::present;
    link.cur_speed = "8GT/s";
    link.cur_width = 4;
    link.capable_speed = "8GT/s";
    link.capable_width = 16;
    express.link = link;
    express_slot slot;
    slot.slot = 3;
    slot.presence = true;
    slot.attn_led = "off";
    express.slot = slot;
    port.setExpress(express);
    pci_tree tree({ port });

    pci_ids ids;
    dmi_slot_map slots;
    pci_renderer renderer(ids, slots, render_options());

    std::string out = renderer.renderJson(apply_filter(tree, filter_spec()));

    EXPECT_TRUE(contains(out,
                         "\"express_type\": \"root_port\", \"cur_speed\": \"8GT/s\", \"cur_width\": 4, "
                         "\"capable_speed\": \"8GT/s\", \"capable_width\": 16, \"target_speed\": null, "
                         "\"link_state\": \"present\", \"slot\": 3, \"presence\": true, \"power\": null, "
                         "\"attn_led\": \"off\""));

    std::string line = renderer.renderTree(tree, apply_filter(tree, filter_spec()));
    EXPECT_EQ(line, "00:01.0 root_port, slot 3, device present, speed 8GT/s, width x4\n");
}

TEST(PciRenderTest, EmptyResultRendersNothing)
{
    pci_tree tree = root_port_with_endpoint();
    filter_spec spec;
    spec.classId = parse_class_filter("gpu");
    filter_result result = apply_filter(tree, spec);

    pci_ids ids;
    dmi_slot_map slots;
    pci_renderer renderer(ids, slots, render_options());

    EXPECT_EQ(renderer.renderFlat(result), "");
    EXPECT_EQ(renderer.renderTree(tree, result), "");
    EXPECT_EQ(renderer.renderJson(result), "{}\n");
}

TEST(PciRenderTest, EscapesJsonStrings)
{
    EXPECT_EQ(json_escape("a\"b\\c\n"), "a\\\"b\\\\c\\n");
    EXPECT_EQ(json_escape(std::string("\x01", 1)), "\\u0001");
}

TEST(PciRenderTest, UnreadableDeviceShowsItsReadError)
{
    pci_device bridge{*pci_address::parse("0000:00:1d.4")};
    bridge.setReadError("0000:00:1d.4: vendor: attribute missing");
    pci_tree tree({ bridge, make_device("02:00.0", "00:1d.4", express_type::endpoint) });

    pci_ids ids;
    dmi_slot_map slots;
    pci_renderer renderer(ids, slots, render_options());
    filter_result result = apply_filter(tree, filter_spec());

    std::string flat = renderer.renderFlat(result);
    EXPECT_TRUE(contains(flat, "0000:00:1d.4, "));
    EXPECT_TRUE(contains(flat, "  read error: 0000:00:1d.4: vendor: attribute missing\n"));

    std::string json = renderer.renderJson(result);
    EXPECT_TRUE(contains(json, "\"vendor_id\": null"));
    EXPECT_TRUE(contains(json, "\"read_error\": \"0000:00:1d.4: vendor: attribute missing\""));
    EXPECT_EQ(json.find("read_error"), json.rfind("read_error"));
}

TEST(PciRenderTest, VerboseListsConfigSpaceUsed)
{
    pci_device nic = make_device("0000:02:00.0");
    express_info express;
    express.type = express_type::endpoint;
    express.used_config_space = { 0x00, 0x01, 0x06, 0x07, 0x34, 0x40 };
    nic.setExpress(express);
    pci_tree tree({ nic });

    pci_ids ids;
    dmi_slot_map slots;
    render_options options;
    options.verbose = true;
    pci_renderer renderer(ids, slots, options);

    std::string out = renderer.renderFlat(apply_filter(tree, filter_spec()));
    EXPECT_TRUE(contains(out, "  config space used: 0x00-0x01, 0x06-0x07, 0x34, 0x40\n"));

    std::string quiet = pci_renderer(ids, slots, render_options()).renderFlat(apply_filter(tree, filter_spec()));
    EXPECT_FALSE(contains(quiet, "config space used"));
}
