#ifndef __VPD_DECODER_H__
#define __VPD_DECODER_H__

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Vital Product Data, PCI Local Bus Specification v2.2 appendix I
struct vpd_record
{
    std::optional<std::string>         identifier_string;
    std::map<std::string, std::string> fields;

    // set when the VPD-R section carried an RV checksum keyword
    std::optional<bool> checksum_ok;

    bool empty() const { return !identifier_string && fields.empty(); }
};

// Decodes a raw VPD blob. Never throws: unknown tags are skipped and a
// truncated element stops decoding, keeping what was decoded before it.
vpd_record decode_vpd(const std::vector<uint8_t>& data);

#endif
