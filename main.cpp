#include <algorithm>
#include <cstdint>
#include <optional>
#include <iostream>
#include <string>
#include <vector>

#include <unistd.h>

#include "cmdline.hpp"
#include <fmt/ranges.h>

#include "dmi_slots.hpp"
#include "pci_enumeration.hpp"
#include "pci_error.hpp"
#include "pci_filter.hpp"
#include "pci_ids.hpp"
#include "pci_log.hpp"
#include "pci_reader.hpp"
#include "pci_render.hpp"
#include "pci_tree.hpp"
#include "pci_validate.hpp"

using namespace std;

namespace
{
    string alias_names()
    {
        vector<string> names;
        for (const auto& alias : class_aliases())
            names.push_back(alias.name);
        return fmt::format("{}", fmt::join(names, ", "));
    }

    void no_scripting()
    {
        if (isatty(STDOUT_FILENO))
            return;

        const char* warning =
            "It looks like you may be writing a script that uses pcicrawler. "
            "Please always use the --json flag from scripts, do NOT parse "
            "output intended for humans!";
        fmt::print("{}\n", warning);
        fmt::print(stderr, "{}\n", warning);
    }
}

int32_t main(int argc, char *argv[])
{
    cmdline::parser a;

    a.set_program_name("pcicrawler");
    a.add("json",         'j',  "Output in JSON format");
    a.add("hexify",       'x',  "Output vendor/device/class IDs as hex strings instead of numbers in JSON output");
    a.add("aer",          'a',  "Include PCIe Advanced Error Reporting (AER) information when available - only provided in JSON output");
    a.add("tree",         't',  "Output as a tree");
    a.add<std::string>("device",   'd', "Only show devices matching this PCI vendor/device ID (syntax like vendor:device, or vendor:, in hex)", false, "");
    a.add<std::string>("class-id", 'c', "Only show devices matching this PCI class ID in hex, or one of: " + alias_names(), false, "");
    a.add<std::string>("addr",     's', "Show device with this PCI address", false, "");
    a.add("include-path", 'p',  "Include devices upstream of matched devices");
    a.add("express-only", 'e',  "Only show PCIe devices");
    a.add("vpd",          'V',  "Include VPD data if present, does not work with --tree");
    a.add("physfn-only",  '\0', "Show only PFs if SR-IOV is enabled");
    a.add("no-builtin",   '\0', "Exclude builtin root devices (defaults to true with --tree)");
    a.add("verbose",      'v',  "Show debugging output - not compatible with JSON/tree views");
    a.add<std::string>("validate", '\0', "Check the matched devices against the expectations in this JSON file, exits 3 when a check fails", false, "");
    a.add<std::string>("sysfs", '\0', "Directory holding the PCI device entries", false, SYSFS_PCI_BUS_DEVICES);
    a.footer("\nDisplay, filter and export information about PCI or PCI Express devices and their topology.\n"
             "Run as root to get more information using privileged sysfs entries.");

    a.parse_check(argc, argv);

    if (a.exist("verbose"))
        set_log_level(log_level::debug);

    output_mode mode = output_mode::flat;
    if (a.exist("tree"))
        mode = output_mode::tree;
    else if (a.exist("json"))
        mode = output_mode::json;

    filter_spec spec;
    try
    {
        if (!a.get<std::string>("device").empty())
            spec.id = parse_id_filter(a.get<std::string>("device"));
        if (!a.get<std::string>("class-id").empty())
            spec.classId = parse_class_filter(a.get<std::string>("class-id"));
        if (!a.get<std::string>("addr").empty())
            spec.address = parse_address_filter(a.get<std::string>("addr"));
    }
    catch (const filter_error& e)
    {
        log_error("{}", e.what());
        cerr << a.usage();
        return 2;
    }
    spec.expressOnly = a.exist("express-only");
    spec.physfnOnly  = a.exist("physfn-only");
    spec.noBuiltin   = a.exist("no-builtin");
    // a tree without its upstream devices cannot be drawn
    spec.includePath = a.exist("include-path") || mode == output_mode::tree;

    optional<validation_plan> plan;
    try
    {
        if (!a.get<std::string>("validate").empty())
            plan = load_validation_plan(a.get<std::string>("validate"));
    }
    catch (const validation_error& e)
    {
        log_error("{}", e.what());
        return 1;
    }

    read_options readOptions;
    readOptions.sysfsRoot = a.get<std::string>("sysfs");
    readOptions.readVpd   = a.exist("vpd") && mode != output_mode::tree;
    readOptions.readAer   = (a.exist("aer") && mode == output_mode::json) || plan.has_value();

    try
    {
        device_reader reader(readOptions);
        pci_tree tree(read_snapshot(reader, enumeration(readOptions.sysfsRoot)));

        filter_result result = apply_filter(tree, spec);
        if (spec.address && !result.isMatched(*spec.address))
            log_warning("no PCI device {} matches", spec.address->toString());

        dmi_slot_map slots = load_dmi_slots();

        if (plan)
        {
            vector<check_result> results = run_validation(*plan, result.getMatched(), slots);

            if (mode == output_mode::json)
                fmt::print("{}", validation_report_json(results));
            else
            {
                for (const auto& check : results)
                    fmt::print("{}: {}\n", check.passed ? "PASS" : "FAIL", check.verdict);
            }

            bool failed = any_of(results.begin(), results.end(),
                                 [](const check_result& check) { return !check.passed; });
            return failed ? 3 : 0;
        }

        pci_ids ids = pci_ids::load();

        render_options renderOptions;
        renderOptions.hexify      = a.exist("hexify");
        renderOptions.vpd         = readOptions.readVpd;
        renderOptions.aer         = readOptions.readAer;
        renderOptions.verbose     = a.exist("verbose") && mode == output_mode::flat;
        renderOptions.color       = mode != output_mode::json && isatty(STDOUT_FILENO);
        renderOptions.markMatched = spec.includePath;

        if (mode != output_mode::json)
            no_scripting();

        pci_renderer renderer(ids, slots, renderOptions);
        fmt::print("{}", renderer.render(mode, tree, result));
    }
    catch (const topology_error& e)
    {
        log_error("inconsistent PCI topology: {}", e.what());
        return 1;
    }
    catch (const read_error& e)
    {
        log_error("{}", e.what());
        return 1;
    }

    return 0;
}
