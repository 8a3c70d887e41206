#include <algorithm>
#include <string>

#include "pci_enumeration.hpp"
#include "pci_error.hpp"
#include "pci_log.hpp"

using namespace std;

namespace
{
    // An unreadable device stays in the snapshot, marked with its error, as
    // long as its place in the topology is known. Otherwise it is dropped.
    optional<pci_device> unreadable_device(const device_reader& reader, const pci_address& address,
                                           const read_error& error)
    {
        pci_device device(address);
        try
        {
            device.setParent(reader.getParent(address));
        }
        catch (const read_error& e)
        {
            log_warning("skipping device: {}", e.what());
            return nullopt;
        }

        device.setReadError(error.what());
        return device;
    }
}

vector<pci_address> enumeration(const std::filesystem::path& root)
{
    vector<pci_address> dir;

    error_code ec;
    std::filesystem::directory_iterator it(root, ec);
    if (ec)
        throw read_error("", root.string(), ec.message());

    for (const auto& entry : it)
    {
        string name = entry.path().filename().string();
        optional<pci_address> address = pci_address::parse(name);
        if (!address)
        {
            log_debug("ignoring {} in {}", name, root.string());
            continue;
        }
        dir.push_back(*address);
    }

    sort(dir.begin(), dir.end());
    return dir;
}

vector<pci_device> read_snapshot(const device_reader& reader, const vector<pci_address>& addresses)
{
    vector<pci_device> devices;
    size_t failed = 0;

    for (const auto& address : addresses)
    {
        try
        {
            devices.push_back(reader.read(address));
        }
        catch (const read_error& e)
        {
            // no retry: the tree may have changed under us
            log_warning("{}", e.what());
            failed++;

            optional<pci_device> placeholder = unreadable_device(reader, address, e);
            if (placeholder)
                devices.push_back(std::move(*placeholder));
        }
    }

    if (failed > 0 && failed == addresses.size())
        throw read_error("", "", fmt::format("none of the {} PCI devices could be read", failed));

    log_info("read {} PCI devices, {} unreadable", devices.size(), failed);
    return devices;
}
