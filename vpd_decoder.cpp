#include "vpd_decoder.hpp"

using namespace std;

namespace
{
    // large resource data types, tag byte 0b1XXXXXXX
    const uint8_t VPD_TAG_IDENTIFIER = 0x02;
    const uint8_t VPD_TAG_READ_ONLY  = 0x10;
    const uint8_t VPD_TAG_READ_WRITE = 0x11;

    // small resource data type, tag byte 0b0XXXXYYY
    const uint8_t VPD_TAG_END = 0x0f;

    const size_t VPD_KEYWORD_HEADER = 3;

    bool is_keyword_char(unsigned char c)
    {
        return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    }

    bool is_blank(char c)
    {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' ||
               c == '\v' || c == '\f' || c == '\0';
    }

    // ASCII with U+FFFD for anything outside it, surrounding blanks removed
    string vpd_string(const vector<uint8_t>& data, size_t begin, size_t end)
    {
        string value;
        for (size_t i = begin; i < end; i++)
        {
            if (data[i] < 0x80)
                value += static_cast<char>(data[i]);
            else
                value += "\xef\xbf\xbd";
        }

        size_t first = 0;
        while (first < value.size() && is_blank(value[first]))
            first++;

        size_t last = value.size();
        while (last > first && is_blank(value[last - 1]))
            last--;

        return value.substr(first, last - first);
    }

    void decode_keywords(const vector<uint8_t>& data, size_t begin, size_t end, vpd_record& record)
    {
        size_t pos = begin;

        while (end - pos >= VPD_KEYWORD_HEADER)
        {
            string key;
            key += static_cast<char>(data[pos]);
            key += static_cast<char>(data[pos + 1]);
            size_t length = data[pos + 2];

            size_t value = pos + VPD_KEYWORD_HEADER;
            if (value + length > end)
                return;

            // a keyword that is not two alphanumerics is corrupt, its value is stepped over
            bool valid = is_keyword_char(data[pos]) && is_keyword_char(data[pos + 1]);

            if (valid && key == "RV")
            {
                // the first RV byte makes everything from offset 0 sum to zero
                if (length >= 1)
                {
                    uint8_t sum = 0;
                    for (size_t i = 0; i <= value; i++)
                        sum = static_cast<uint8_t>(sum + data[i]);
                    record.checksum_ok = (sum == 0);
                }
            }
            else if (valid && key != "RW")
            {
                record.fields[key] = vpd_string(data, value, value + length);
            }

            pos = value + length;
        }
    }
}

vpd_record decode_vpd(const vector<uint8_t>& data)
{
    vpd_record record;
    size_t pos = 0;

    while (pos < data.size())
    {
        uint8_t tagByte = data[pos];
        uint8_t tag;
        size_t  header;
        size_t  length;

        if ((tagByte & 0x80) == 0)
        {
            tag    = (tagByte >> 3) & 0x0f;
            length = tagByte & 0x07;
            header = 1;
        }
        else
        {
            if (data.size() - pos < 3)
                break;
            tag    = tagByte & 0x7f;
            length = data[pos + 1] | (data[pos + 2] << 8);
            header = 3;
        }

        if ((tagByte & 0x80) == 0 && tag == VPD_TAG_END)
            break;

        size_t body = pos + header;
        if (length > data.size() - body)
        {
            // keywords complete before the cut are still good
            if ((tagByte & 0x80) && (tag == VPD_TAG_READ_ONLY || tag == VPD_TAG_READ_WRITE))
                decode_keywords(data, body, data.size(), record);
            break;
        }

        if (tagByte & 0x80)
        {
            switch (tag)
            {
                case VPD_TAG_IDENTIFIER:
                    record.identifier_string = vpd_string(data, body, body + length);
                    break;
                case VPD_TAG_READ_ONLY:
                case VPD_TAG_READ_WRITE:
                    decode_keywords(data, body, body + length, record);
                    break;
                default:
                    break;
            }
        }

        pos = body + length;
    }

    return record;
}
