#ifndef __PCI_VALIDATE_H__
#define __PCI_VALIDATE_H__

#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

#include "dmi_slots.hpp"
#include "pci_address.hpp"
#include "pci_tree.hpp"

// One "duts" entry of a validation file. Unset identifiers match any device.
struct validation_target
{
    std::optional<pci_address> address;
    std::optional<uint16_t>    vendorId;
    std::optional<uint16_t>    deviceId;
    Json::Value                conditions;  // check name -> expected value
};

struct validation_plan
{
    std::vector<validation_target> targets;
};

// Throws validation_error.
validation_plan parse_validation_plan(std::istream& in);
validation_plan load_validation_plan(const std::filesystem::path& path);

struct check_result
{
    std::string check;   // "pci_vendor_id_check"
    std::string device;  // long address
    bool        passed = false;
    std::string verdict;
};

// condition names of the validation file, in the order they are checked
const std::vector<std::string>& validation_conditions();

// Runs every condition of every target against the devices it identifies.
// A target without a matching device is skipped with a warning.
std::vector<check_result> run_validation(const validation_plan& plan,
                                         const std::vector<const pci_node*>& devices,
                                         const dmi_slot_map& slots);

std::string validation_report_json(const std::vector<check_result>& results);

#endif
