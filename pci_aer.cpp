#include <sstream>

#include "pci_aer.hpp"

using namespace std;

map<string, int64_t> parse_aer_stats(istream& in)
{
    map<string, int64_t> stats;

    string line;
    while (getline(in, line))
    {
        istringstream fields(line);
        string key;
        int64_t value;
        string extra;

        if (!(fields >> key >> value) || (fields >> extra))
            continue;

        stats[key] = value;
    }

    return stats;
}

optional<int64_t> parse_aer_count(istream& in)
{
    int64_t value;
    if (!(in >> value))
        return nullopt;

    return value;
}
