#include <utility>

#include "pci_device.hpp"

using namespace std;

void pci_device::setExpress(express_info express)
{
    // decoding notes stay with the device so --verbose can show them
    for (auto& note : express.notes)
        m_notes.push_back("config: " + note);
    express.notes.clear();

    m_express = std::move(express);
}
