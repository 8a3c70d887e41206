#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "vpd_decoder.hpp"

namespace
{
    using bytes = std::vector<uint8_t>;

    void append_large(bytes& blob, uint8_t tag, const bytes& body)
    {
        blob.push_back(tag);
        blob.push_back(static_cast<uint8_t>(body.size() & 0xff));
        blob.push_back(static_cast<uint8_t>(body.size() >> 8));
        blob.insert(blob.end(), body.begin(), body.end());
    }

    bytes text(const std::string& s)
    {
        return bytes(s.begin(), s.end());
    }

    bytes keywords(const std::vector<std::pair<std::string, std::string>>& fields)
    {
        bytes body;
        for (const auto& field : fields)
        {
            body.push_back(static_cast<uint8_t>(field.first[0]));
            body.push_back(static_cast<uint8_t>(field.first[1]));
            body.push_back(static_cast<uint8_t>(field.second.size()));
            body.insert(body.end(), field.second.begin(), field.second.end());
        }
        return body;
    }

    bytes sample_vpd()
    {
        bytes blob;
        append_large(blob, 0x82, text("Example Network Adapter"));
        append_large(blob, 0x90, keywords({ { "PN", "X" }, { "SN", "Y" } }));
        blob.push_back(0x78);
        return blob;
    }
}

TEST(VpdDecoderTest, RecoversIdentifierAndFields)
{
    vpd_record vpd = decode_vpd(sample_vpd());

    ASSERT_TRUE(vpd.identifier_string.has_value());
    EXPECT_EQ(*vpd.identifier_string, "Example Network Adapter");
    ASSERT_EQ(vpd.fields.size(), 2u);
    EXPECT_EQ(vpd.fields.at("PN"), "X");
    EXPECT_EQ(vpd.fields.at("SN"), "Y");
}

TEST(VpdDecoderTest, InputIsNotModified)
{
    const bytes blob = sample_vpd();
    bytes copy = blob;

    decode_vpd(copy);

    EXPECT_EQ(copy, blob);
}

TEST(VpdDecoderTest, EmptyInputGivesEmptyRecord)
{
    vpd_record vpd = decode_vpd(bytes());

    EXPECT_TRUE(vpd.empty());
    EXPECT_FALSE(vpd.identifier_string.has_value());
    EXPECT_TRUE(vpd.fields.empty());
}

TEST(VpdDecoderTest, TruncatedMidFieldKeepsEarlierFields)
{
    bytes blob;
    append_large(blob, 0x82, text("Adapter"));
    append_large(blob, 0x90, keywords({ { "PN", "PART-1" }, { "SN", "SERIAL-NUMBER" }, { "EC", "A1" } }));

    // cut inside the SN value
    size_t cut = 0;
    for (size_t i = 0; i + 1 < blob.size(); i++)
    {
        if (blob[i] == 'S' && blob[i + 1] == 'N')
        {
            cut = i + 6;
            break;
        }
    }
    ASSERT_NE(cut, 0u);
    blob.resize(cut);

    vpd_record vpd = decode_vpd(blob);

    EXPECT_EQ(vpd.identifier_string.value_or(""), "Adapter");
    EXPECT_EQ(vpd.fields.size(), 1u);
    EXPECT_EQ(vpd.fields.at("PN"), "PART-1");
    EXPECT_EQ(vpd.fields.count("SN"), 0u);
    EXPECT_EQ(vpd.fields.count("EC"), 0u);
}

TEST(VpdDecoderTest, TruncatedIdentifierStopsDecoding)
{
    bytes blob = { 0x82, 0x40, 0x00, 'A', 'B', 'C' };

    vpd_record vpd = decode_vpd(blob);

    EXPECT_TRUE(vpd.empty());
}

TEST(VpdDecoderTest, TruncatedLargeTagHeader)
{
    bytes blob;
    append_large(blob, 0x82, text("Adapter"));
    blob.push_back(0x90);
    blob.push_back(0x05);

    vpd_record vpd = decode_vpd(blob);

    EXPECT_EQ(vpd.identifier_string.value_or(""), "Adapter");
    EXPECT_TRUE(vpd.fields.empty());
}

TEST(VpdDecoderTest, DuplicateKeywordLastWins)
{
    bytes blob;
    append_large(blob, 0x90, keywords({ { "SN", "first" }, { "PN", "part" }, { "SN", "second" } }));
    blob.push_back(0x78);

    vpd_record vpd = decode_vpd(blob);

    EXPECT_EQ(vpd.fields.size(), 2u);
    EXPECT_EQ(vpd.fields.at("SN"), "second");
}

TEST(VpdDecoderTest, EndTagStopsDecoding)
{
    bytes blob;
    append_large(blob, 0x90, keywords({ { "PN", "part" } }));
    blob.push_back(0x78);
    append_large(blob, 0x90, keywords({ { "SN", "after-end" } }));

    vpd_record vpd = decode_vpd(blob);

    EXPECT_EQ(vpd.fields.size(), 1u);
    EXPECT_EQ(vpd.fields.count("SN"), 0u);
}

TEST(VpdDecoderTest, UnknownTagsAreSkipped)
{
    bytes blob;
    append_large(blob, 0x85, text("vendor blob"));
    blob.push_back(0x22);  // small resource, tag 4, two bytes of payload
    blob.push_back(0xaa);
    blob.push_back(0xbb);
    append_large(blob, 0x90, keywords({ { "PN", "part" } }));
    blob.push_back(0x78);

    vpd_record vpd = decode_vpd(blob);

    EXPECT_EQ(vpd.fields.at("PN"), "part");
}

TEST(VpdDecoderTest, ReadWriteSectionIsDecoded)
{
    bytes blob;
    append_large(blob, 0x90, keywords({ { "PN", "part" } }));
    append_large(blob, 0x91, keywords({ { "V1", "writable" }, { "RW", std::string(4, '\0') } }));
    blob.push_back(0x78);

    vpd_record vpd = decode_vpd(blob);

    EXPECT_EQ(vpd.fields.at("V1"), "writable");
    EXPECT_EQ(vpd.fields.count("RW"), 0u);
}

TEST(VpdDecoderTest, ChecksumIsVerified)
{
    bytes blob;
    append_large(blob, 0x82, text("Adapter"));
    bytes body = keywords({ { "PN", "part" } });
    body.push_back('R');
    body.push_back('V');
    body.push_back(1);
    body.push_back(0);  // patched below
    append_large(blob, 0x90, body);

    uint8_t sum = 0;
    for (size_t i = 0; i + 1 < blob.size(); i++)
        sum = static_cast<uint8_t>(sum + blob[i]);
    blob.back() = static_cast<uint8_t>(0x100 - sum);
    blob.push_back(0x78);

    vpd_record good = decode_vpd(blob);
    EXPECT_EQ(good.checksum_ok, std::optional<bool>(true));
    EXPECT_EQ(good.fields.count("RV"), 0u);

    blob[blob.size() - 2] ^= 0xff;
    vpd_record bad = decode_vpd(blob);
    EXPECT_EQ(bad.checksum_ok, std::optional<bool>(false));
    EXPECT_EQ(bad.fields.at("PN"), "part");
}

TEST(VpdDecoderTest, ValuesAreTrimmedAndAsciiOnly)
{
    bytes blob;
    append_large(blob, 0x82, text("  Adapter  "));
    bytes body = keywords({ { "SN", "AB  " } });
    body.push_back('M');
    body.push_back('N');
    body.push_back(2);
    body.push_back('A');
    body.push_back(0xff);
    append_large(blob, 0x90, body);

    vpd_record vpd = decode_vpd(blob);

    EXPECT_EQ(*vpd.identifier_string, "Adapter");
    EXPECT_EQ(vpd.fields.at("SN"), "AB");
    EXPECT_EQ(vpd.fields.at("MN"), "A\xef\xbf\xbd");
}

TEST(VpdDecoderTest, CorruptKeywordIsSkipped)
{
    bytes blob = { 0x90, 0x0b, 0x00,
                   0xff, 0x01, 0x02, 'A', 'B',
                   'S', 'N', 0x03, 'X', 'Y', 'Z',
                   0x78 };

    vpd_record vpd = decode_vpd(blob);

    ASSERT_EQ(vpd.fields.size(), 1u);
    EXPECT_EQ(vpd.fields.at("SN"), "XYZ");
}

TEST(VpdDecoderTest, KeywordsWithPunctuationAreSkipped)
{
    bytes blob;
    append_large(blob, 0x90, keywords({ { "P-", "part" }, { " N", "name" }, { "V1", "vendor" } }));
    blob.push_back(0x78);

    vpd_record vpd = decode_vpd(blob);

    ASSERT_EQ(vpd.fields.size(), 1u);
    EXPECT_EQ(vpd.fields.at("V1"), "vendor");
}
