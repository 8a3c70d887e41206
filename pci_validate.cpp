#include <algorithm>
#include <cctype>
#include <fstream>

#include <fmt/ranges.h>

#include "pci_error.hpp"
#include "pci_log.hpp"
#include "pci_validate.hpp"

using namespace std;

namespace
{
    // a check's current value of the device, already as text
    struct check_value
    {
        const char* check;
        string (*current)(const pci_node& node, const dmi_slot_map& slots);
    };

    template <typename T>
    string id_text(const optional<T>& id)
    {
        return id ? to_string(*id) : "none";
    }

    string location_text(const pci_node& node, const dmi_slot_map& slots)
    {
        return device_location(node, slots).value_or("none");
    }

    string vendor_text(const pci_node& node, const dmi_slot_map&)
    {
        return id_text(node.getDevice().getVendorId());
    }

    string device_text(const pci_node& node, const dmi_slot_map&)
    {
        return id_text(node.getDevice().getDeviceId());
    }

    string class_text(const pci_node& node, const dmi_slot_map&)
    {
        return id_text(node.getDevice().getClassId());
    }

    string slot_text(const pci_node& node, const dmi_slot_map&)
    {
        const auto& slot = node.getDevice().getExpress().slot;
        return slot ? to_string(slot->slot) : "none";
    }

    string cur_speed_text(const pci_node& node, const dmi_slot_map&)
    {
        const auto& link = node.getDevice().getExpress().link;
        return link ? link->cur_speed : "none";
    }

    string cur_width_text(const pci_node& node, const dmi_slot_map&)
    {
        const auto& link = node.getDevice().getExpress().link;
        return link ? to_string(link->cur_width) : "none";
    }

    string capable_speed_text(const pci_node& node, const dmi_slot_map&)
    {
        const auto& link = node.getDevice().getExpress().link;
        return link ? link->capable_speed : "none";
    }

    string capable_width_text(const pci_node& node, const dmi_slot_map&)
    {
        const auto& link = node.getDevice().getExpress().link;
        return link ? to_string(link->capable_width) : "none";
    }

    // compared as text, the way they are printed; same order as the first
    // entries of validation_conditions()
    const vector<check_value>& value_checks()
    {
        static const vector<check_value> checks = {
            { "pci_location_check",            location_text      },
            { "pci_vendor_id_check",           vendor_text        },
            { "pci_device_id_check",           device_text        },
            { "pci_class_id_check",            class_text         },
            { "pci_physical_slot_check",       slot_text          },
            { "pci_current_link_speed_check",  cur_speed_text     },
            { "pci_current_link_width_check",  cur_width_text     },
            { "pci_capable_link_speed_check",  capable_speed_text },
            { "pci_capable_link_width_check",  capable_width_text },
        };
        return checks;
    }

    string value_text(const Json::Value& value)
    {
        if (value.isNull())
            return "none";
        if (value.isString())
            return value.asString();
        if (value.isBool())
            return value.asBool() ? "true" : "false";
        if (value.isIntegral())
            return to_string(value.asLargestInt());

        Json::StreamWriterBuilder writer;
        writer["indentation"] = "";
        return Json::writeString(writer, value);
    }

    // integers as they are, strings as hex ("0x8086", "8086")
    optional<uint32_t> id_value(const Json::Value& value)
    {
        if (value.isUInt())
            return value.asUInt();
        if (!value.isString())
            return nullopt;

        string text = value.asString();
        if (text.rfind("0x", 0) == 0 || text.rfind("0X", 0) == 0)
            text = text.substr(2);
        if (text.empty() || text.size() > 8 || !all_of(text.begin(), text.end(), [](unsigned char c) { return isxdigit(c) != 0; }))
            return nullopt;

        return static_cast<uint32_t>(stoul(text, nullptr, 16));
    }

    string expected_text(const string& condition, const Json::Value& expected)
    {
        if (condition == "vendor_id" || condition == "device_id" || condition == "class_id")
        {
            optional<uint32_t> id = id_value(expected);
            if (id)
                return to_string(*id);
        }
        return value_text(expected);
    }

    optional<uint16_t> identifier_id(const Json::Value& identifiers, const char* name)
    {
        if (!identifiers.isMember(name))
            return nullopt;

        optional<uint32_t> id = id_value(identifiers[name]);
        if (!id || *id > 0xffff)
            throw validation_error(fmt::format("identifier {} is not a 16 bit id: {}", name, value_text(identifiers[name])));
        return static_cast<uint16_t>(*id);
    }

    validation_target parse_target(const Json::Value& dut, size_t index)
    {
        if (!dut.isObject() || !dut["identifiers"].isObject())
            throw validation_error(fmt::format("DUT {} has no identifiers", index));
        if (!dut["validate"].isObject())
            throw validation_error(fmt::format("DUT {} has nothing to validate", index));

        const Json::Value& identifiers = dut["identifiers"];
        validation_target target;

        if (identifiers.isMember("address"))
        {
            const string text = value_text(identifiers["address"]);
            target.address = pci_address::parse(text);
            if (!target.address)
                throw validation_error(fmt::format("DUT {} has a malformed address '{}'", index, text));
        }
        target.vendorId = identifier_id(identifiers, "vendor_id");
        target.deviceId = identifier_id(identifiers, "device_id");
        target.conditions = dut["validate"];

        for (const auto& name : target.conditions.getMemberNames())
        {
            const auto& known = validation_conditions();
            if (find(known.begin(), known.end(), name) == known.end())
                log_warning("DUT {}: unknown check '{}' is ignored", index, name);
        }

        return target;
    }

    bool identifies(const validation_target& target, const pci_device& device)
    {
        if (target.address && *target.address != device.getAddress())
            return false;
        if (target.vendorId && device.getVendorId() != target.vendorId)
            return false;
        if (target.deviceId && device.getDeviceId() != target.deviceId)
            return false;
        return true;
    }

    string describe(const validation_target& target)
    {
        vector<string> parts;
        if (target.address)
            parts.push_back("address " + target.address->toString());
        if (target.vendorId)
            parts.push_back(fmt::format("vendor {:04x}", *target.vendorId));
        if (target.deviceId)
            parts.push_back(fmt::format("device {:04x}", *target.deviceId));
        if (parts.empty())
            return "any device";
        return fmt::format("{}", fmt::join(parts, ", "));
    }

    check_result compare(const string& check, const string& device, const string& expected, const string& found)
    {
        check_result result;
        result.check  = check;
        result.device = device;
        result.passed = found == expected;
        if (result.passed)
            result.verdict = fmt::format("Test {} for device {} PASSED", check, device);
        else
            result.verdict = fmt::format("Test {} for device {}, expected {}, found {}.", check, device, expected, found);
        return result;
    }

    check_result check_address(const string& device, const pci_address& address, const Json::Value& expected)
    {
        vector<string> listed;
        if (expected.isArray())
        {
            for (const auto& item : expected)
                listed.push_back(value_text(item));
        }
        else
        {
            listed.push_back(value_text(expected));
        }

        check_result result;
        result.check  = "pci_address_check";
        result.device = device;
        for (const auto& text : listed)
        {
            optional<pci_address> other = pci_address::parse(text);
            result.passed = result.passed || (other && *other == address);
        }

        if (result.passed)
            result.verdict = fmt::format("Test {} for device {} PASSED", result.check, device);
        else
            result.verdict = fmt::format("Test {} did not find {} in expected list [{}].",
                                         result.check, device, fmt::join(listed, ", "));
        return result;
    }

    // true allows no errors at all, a number is the most any counter may show
    // and false turns the check off
    check_result check_aer(const string& device, const pci_device& dev, const Json::Value& expected)
    {
        const string check = "pci_AER_check";

        int64_t limit = 0;
        if (expected.isIntegral())
            limit = expected.asLargestInt();
        else if (!expected.isBool())
            return compare(check, device, value_text(expected), "an AER error limit");

        if (!dev.getAer())
            return compare(check, device, fmt::format("at most {} errors", limit), "no AER information");

        int64_t worst = 0;
        for (const auto& file : dev.getAer()->device)
        {
            for (const auto& counter : file.second)
                worst = max(worst, counter.second);
        }
        for (const auto& count : dev.getAer()->rootport)
            worst = max(worst, count.second);

        if (worst <= limit)
        {
            check_result result;
            result.check   = check;
            result.device  = device;
            result.passed  = true;
            result.verdict = fmt::format("Test {} for device {} PASSED", check, device);
            return result;
        }
        return compare(check, device, fmt::format("at most {} errors", limit), fmt::format("{} errors", worst));
    }
}

const vector<string>& validation_conditions()
{
    static const vector<string> conditions = {
        "location",
        "vendor_id",
        "device_id",
        "class_id",
        "physical_slot",
        "current_link_speed",
        "current_link_width",
        "capable_link_speed",
        "capable_link_width",
        "addresses",
        "check_aer",
    };
    return conditions;
}

validation_plan parse_validation_plan(istream& in)
{
    Json::CharReaderBuilder builder;
    Json::Value root;
    string errors;

    if (!Json::parseFromStream(builder, in, &root, &errors))
        throw validation_error("malformed JSON: " + errors);

    if (!root.isObject() || !root["duts"].isArray())
        throw validation_error("missing DUTs info");

    validation_plan plan;
    for (Json::Value::ArrayIndex i = 0; i < root["duts"].size(); i++)
        plan.targets.push_back(parse_target(root["duts"][i], i));

    return plan;
}

validation_plan load_validation_plan(const std::filesystem::path& path)
{
    ifstream file(path);
    if (!file)
        throw validation_error("cannot open " + path.string());

    try
    {
        return parse_validation_plan(file);
    }
    catch (const validation_error& e)
    {
        throw validation_error(fmt::format("cannot parse file {}, {}", path.string(), e.what()));
    }
}

vector<check_result> run_validation(const validation_plan& plan, const vector<const pci_node*>& devices,
                                    const dmi_slot_map& slots)
{
    vector<check_result> results;
    const auto& conditions = validation_conditions();

    for (const auto& target : plan.targets)
    {
        vector<const pci_node*> duts;
        for (const pci_node* node : devices)
        {
            if (identifies(target, node->getDevice()))
                duts.push_back(node);
        }

        if (duts.empty())
        {
            log_warning("no PCI device matches the validation target ({})", describe(target));
            continue;
        }

        for (const pci_node* node : duts)
        {
            const pci_device& dev = node->getDevice();
            const string device = dev.getAddress().toString();

            for (size_t i = 0; i < conditions.size(); i++)
            {
                const string& condition = conditions[i];
                if (!target.conditions.isMember(condition))
                    continue;

                const Json::Value& expected = target.conditions[condition];
                if (condition == "check_aer" && expected.isBool() && !expected.asBool())
                    continue;

                if (condition == "addresses")
                    results.push_back(check_address(device, dev.getAddress(), expected));
                else if (condition == "check_aer")
                    results.push_back(check_aer(device, dev, expected));
                else
                {
                    const check_value& check = value_checks()[i];
                    results.push_back(compare(check.check, device, expected_text(condition, expected),
                                              check.current(*node, slots)));
                }

                log_debug("{}", results.back().verdict);
            }
        }
    }

    return results;
}

string validation_report_json(const vector<check_result>& results)
{
    Json::Value report(Json::arrayValue);
    for (const auto& result : results)
    {
        Json::Value entry;
        entry["check"]   = result.check;
        entry["device"]  = result.device;
        entry["result"]  = result.passed ? "PASS" : "FAIL";
        entry["verdict"] = result.verdict;
        report.append(entry);
    }

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, report) + "\n";
}
