#ifndef __PCI_AER_H__
#define __PCI_AER_H__

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>

// PCIe Advanced Error Reporting counters exposed next to the device in sysfs
struct aer_info
{
    // aer_dev_correctable / aer_dev_fatal / aer_dev_nonfatal -> counter -> value
    std::map<std::string, std::map<std::string, int64_t>> device;

    // aer_rootport_total_err_* -> value, root ports only
    std::map<std::string, int64_t> rootport;

    bool empty() const { return device.empty() && rootport.empty(); }
};

// "RxErr 0" lines; lines that do not split into a name and an integer are skipped
std::map<std::string, int64_t> parse_aer_stats(std::istream& in);

// a single integer count
std::optional<int64_t> parse_aer_count(std::istream& in);

#endif
