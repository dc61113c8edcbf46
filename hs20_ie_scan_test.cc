#include "config.h"

#include <string>

#include <gtest/gtest.h>

#include "hs20_error.h"
#include "hs20_ie_scan.h"
#include "util.h"

namespace {

const char *reference_ie =
    "000477696e67"
    "0b052a00cf611e"
    "6b091e0a01610408621205"
    "6f0a0e530111112222222229"
    "dd07506f9a10143a01";

const char *example_network_ie =
    "000f4578616d706c65204e6574776f726b010882848b960c1218240301012a010432043048606c"
    "30140100000fac040100000fac040100000fac0100007f04000000806b091e07010203040506076c"
    "027f006f1001531122331020304050010203040506dd05506f9a1000";

unsigned int consumed_bytes(const hs20_ie_scan& scan) {
    unsigned int total = 0;

    for (const auto& r : scan.records())
        total += 2 + r.second;

    return total;
}

}

TEST(hs20_ie_scan, reference_beacon) {
    hs20_ie_scan scan;
    scan.parse(hex_to_bytes(reference_ie));

    ASSERT_TRUE(scan.has_ssid());
    EXPECT_EQ("wing", scan.ssid_octets());
    EXPECT_FALSE(scan.ssid_utf8());

    ASSERT_NE(nullptr, scan.bss_load());
    EXPECT_EQ(42, scan.bss_load()->station_count());
    EXPECT_EQ(207, scan.bss_load()->channel_utilization());
    EXPECT_EQ(7777, scan.bss_load()->capacity());

    ASSERT_NE(nullptr, scan.interworking());
    EXPECT_EQ(hs20_access_network_type::test_or_experimental,
            scan.interworking()->access_network_type());
    EXPECT_EQ(0x610408621205ULL, scan.interworking()->hessid());

    ASSERT_NE(nullptr, scan.roaming_consortium());
    EXPECT_EQ(2u, scan.roaming_consortium()->oi_list().size());

    ASSERT_NE(nullptr, scan.hs20_indication());
    EXPECT_EQ(314, scan.hs20_indication()->anqp_domain_id());

    EXPECT_EQ(nullptr, scan.extended_capabilities());
}

TEST(hs20_ie_scan, records_cover_buffer) {
    for (auto ie : { reference_ie, example_network_ie }) {
        auto octets = hex_to_bytes(ie);

        hs20_ie_scan scan;
        scan.parse(octets);

        EXPECT_EQ(octets.length(), consumed_bytes(scan));
    }
}

TEST(hs20_ie_scan, skips_unknown_tags) {
    hs20_ie_scan scan;
    scan.parse(hex_to_bytes(example_network_ie));

    ASSERT_EQ(11u, scan.records().size());
    EXPECT_EQ(1, scan.records()[1].first);
    EXPECT_EQ(48, scan.records()[5].first);
    EXPECT_EQ(108, scan.records()[8].first);

    EXPECT_EQ("Example Network", scan.ssid_octets());
    EXPECT_EQ(nullptr, scan.bss_load());

    ASSERT_NE(nullptr, scan.extended_capabilities());
    EXPECT_TRUE(scan.extended_capabilities()->interworking());

    ASSERT_NE(nullptr, scan.roaming_consortium());
    EXPECT_EQ(3u, scan.roaming_consortium()->oi_list().size());

    ASSERT_NE(nullptr, scan.hs20_indication());
    EXPECT_EQ(hs20_release::r1, scan.hs20_indication()->release());
    EXPECT_EQ(-1, scan.hs20_indication()->anqp_domain_id());
}

TEST(hs20_ie_scan, empty_buffer) {
    hs20_ie_scan scan;
    scan.parse(std::string());

    EXPECT_FALSE(scan.has_ssid());
    EXPECT_TRUE(scan.records().empty());
}

TEST(hs20_ie_scan, zero_length_ssid_is_present) {
    hs20_ie_scan scan;
    scan.parse(hex_to_bytes("0000"));

    EXPECT_TRUE(scan.has_ssid());
    EXPECT_EQ("", scan.ssid_octets());
}

TEST(hs20_ie_scan, last_ssid_wins) {
    hs20_ie_scan scan;
    scan.parse(hex_to_bytes("000161" "000162"));

    EXPECT_EQ("b", scan.ssid_octets());
}

TEST(hs20_ie_scan, utf8_flag_independent_of_order) {
    hs20_ie_scan before;
    before.parse(hex_to_bytes("7f0700000000000001" "0003636166"));

    hs20_ie_scan after;
    after.parse(hex_to_bytes("0003636166" "7f0700000000000001"));

    EXPECT_TRUE(before.ssid_utf8());
    EXPECT_TRUE(after.ssid_utf8());
}

TEST(hs20_ie_scan, non_hs20_vendor_skipped) {
    hs20_ie_scan scan;

    // WFA OUI, P2P type
    scan.parse(hex_to_bytes("dd06506f9a09aabb"));
    EXPECT_EQ(nullptr, scan.hs20_indication());

    // Microsoft WMM
    scan.parse(hex_to_bytes("dd070050f202000100"));
    EXPECT_EQ(nullptr, scan.hs20_indication());
}

TEST(hs20_ie_scan, short_vendor_skipped) {
    hs20_ie_scan scan;

    // Right prefix but no configuration byte
    scan.parse(hex_to_bytes("dd04506f9a10"));
    EXPECT_EQ(nullptr, scan.hs20_indication());

    scan.parse(hex_to_bytes("dd020050"));
    EXPECT_EQ(nullptr, scan.hs20_indication());
    EXPECT_EQ(1u, scan.records().size());
}

TEST(hs20_ie_scan, overrun_rejected) {
    hs20_ie_scan scan;

    EXPECT_THROW(scan.parse(hex_to_bytes("000477696e67" "0b0a2a00cf611e")),
            hs20_malformed_element);

    // Nothing survives a failed scan
    EXPECT_FALSE(scan.has_ssid());
    EXPECT_TRUE(scan.records().empty());
}

TEST(hs20_ie_scan, bad_bss_load_rejected) {
    hs20_ie_scan scan;

    EXPECT_THROW(scan.parse(hex_to_bytes("0b042a00cf61")), hs20_malformed_element);
}

TEST(hs20_ie_scan, bad_roaming_consortium_rejected) {
    hs20_ie_scan scan;

    EXPECT_THROW(scan.parse(hex_to_bytes("6f050033111111")), hs20_malformed_element);
}

