#include "config.h"

#include <string>

#include <gtest/gtest.h>

#include "hs20_error.h"
#include "util.h"

#include "dot11_ie.h"
#include "dot11_ie_11_qbss.h"
#include "dot11_ie_107_interworking.h"
#include "dot11_ie_111_roaming_consortium.h"
#include "dot11_ie_127_extended_capabilities.h"
#include "dot11_ie_221_hs20_indication.h"
#include "dot11_ie_221_vendor.h"

TEST(dot11_ie, splits_records) {
    dot11_ie ie;
    ie.parse(hex_to_bytes("000477696e67" "0b052a00cf611e" "6c027f00"));

    auto tags = ie.tags();
    ASSERT_EQ(3u, tags->size());

    EXPECT_EQ(0, (*tags)[0]->tag_num());
    EXPECT_EQ(4, (*tags)[0]->tag_len());
    EXPECT_EQ("wing", (*tags)[0]->tag_data());

    EXPECT_EQ(11, (*tags)[1]->tag_num());
    EXPECT_EQ(5, (*tags)[1]->tag_len());

    EXPECT_EQ(108, (*tags)[2]->tag_num());
    EXPECT_EQ(std::string("\x7f\x00", 2), (*tags)[2]->tag_data());
}

TEST(dot11_ie, zero_length_record) {
    dot11_ie ie;
    ie.parse(hex_to_bytes("0000"));

    ASSERT_EQ(1u, ie.tags()->size());
    EXPECT_EQ("", (*ie.tags())[0]->tag_data());
}

TEST(dot11_ie, empty_buffer) {
    dot11_ie ie;
    ie.parse(std::string());

    EXPECT_TRUE(ie.tags()->empty());
}

TEST(dot11_ie, length_overrun_throws) {
    dot11_ie ie;

    EXPECT_THROW(ie.parse(hex_to_bytes("000577696e67")), hs20_malformed_element);
    EXPECT_THROW(ie.parse(hex_to_bytes("0004")), hs20_malformed_element);
}

TEST(dot11_ie, truncated_header_throws) {
    dot11_ie ie;

    EXPECT_THROW(ie.parse(hex_to_bytes("000477696e670b")), hs20_malformed_element);
}

TEST(dot11_ie_11_qbss, decodes_bss_load) {
    dot11_ie_11_qbss qbss;
    qbss.parse(hex_to_bytes("2a00cf611e"));

    EXPECT_EQ(42, qbss.station_count());
    EXPECT_EQ(207, qbss.channel_utilization());
    EXPECT_EQ(7777, qbss.capacity());
}

TEST(dot11_ie_11_qbss, wrong_length_throws) {
    dot11_ie_11_qbss qbss;

    EXPECT_THROW(qbss.parse(hex_to_bytes("2a00cf61")), hs20_malformed_element);
    EXPECT_THROW(qbss.parse(hex_to_bytes("2a00cf611e00")), hs20_malformed_element);
}

TEST(dot11_ie_107_interworking, options_only) {
    dot11_ie_107_interworking iw;
    iw.parse(hex_to_bytes("03"));

    EXPECT_EQ(hs20_access_network_type::free_public, iw.access_network_type());
    EXPECT_FALSE(iw.internet());
    EXPECT_FALSE(iw.has_venue());
    EXPECT_FALSE(iw.has_hessid());
    EXPECT_EQ(0u, iw.hessid());
}

TEST(dot11_ie_107_interworking, venue_and_hessid) {
    dot11_ie_107_interworking iw;
    iw.parse(hex_to_bytes("1e0a01610408621205"));

    EXPECT_EQ(hs20_access_network_type::test_or_experimental, iw.access_network_type());
    EXPECT_TRUE(iw.internet());
    ASSERT_TRUE(iw.has_venue());
    EXPECT_EQ(anqp_venue_group::vehicular, iw.venue_group());
    EXPECT_EQ(anqp_venue_type::automobile_or_truck, iw.venue_type());
    ASSERT_TRUE(iw.has_hessid());
    EXPECT_EQ(0x610408621205ULL, iw.hessid());
}

TEST(dot11_ie_107_interworking, venue_only) {
    dot11_ie_107_interworking iw;
    iw.parse(hex_to_bytes("f20201"));

    EXPECT_EQ(hs20_access_network_type::chargeable_public, iw.access_network_type());
    EXPECT_TRUE(iw.internet());
    EXPECT_TRUE(iw.asra());
    EXPECT_TRUE(iw.esr());
    EXPECT_TRUE(iw.uesa());
    ASSERT_TRUE(iw.has_venue());
    EXPECT_EQ(anqp_venue_group::business, iw.venue_group());
    EXPECT_EQ(anqp_venue_type::doctor_or_dentist_office, iw.venue_type());
    EXPECT_FALSE(iw.has_hessid());
}

TEST(dot11_ie_107_interworking, hessid_only) {
    dot11_ie_107_interworking iw;
    iw.parse(hex_to_bytes("0f020304050607"));

    EXPECT_EQ(hs20_access_network_type::wildcard, iw.access_network_type());
    EXPECT_FALSE(iw.has_venue());
    ASSERT_TRUE(iw.has_hessid());
    EXPECT_EQ(0x020304050607ULL, iw.hessid());
}

TEST(dot11_ie_107_interworking, reserved_venue_group_is_kept) {
    dot11_ie_107_interworking iw;
    iw.parse(hex_to_bytes("00ff01"));

    ASSERT_TRUE(iw.has_venue());
    EXPECT_EQ(anqp_venue_group::reserved, iw.venue_group());
    EXPECT_EQ(anqp_venue_type::reserved, iw.venue_type());
}

TEST(dot11_ie_107_interworking, odd_length_keeps_options) {
    dot11_ie_107_interworking iw;
    iw.parse(hex_to_bytes("1100"));

    EXPECT_EQ(hs20_access_network_type::private_with_guest, iw.access_network_type());
    EXPECT_TRUE(iw.internet());
    EXPECT_FALSE(iw.has_venue());
    EXPECT_FALSE(iw.has_hessid());
}

TEST(dot11_ie_107_interworking, empty_throws) {
    dot11_ie_107_interworking iw;

    EXPECT_THROW(iw.parse(std::string()), hs20_malformed_element);
}

TEST(dot11_ie_111_roaming_consortium, two_ois) {
    dot11_ie_111_roaming_consortium rc;
    rc.parse(hex_to_bytes("0e530111112222222229"));

    EXPECT_EQ(14, rc.anqp_oi_count());
    EXPECT_EQ(3, rc.oi1_len());
    EXPECT_EQ(5, rc.oi2_len());

    ASSERT_EQ(2u, rc.oi_list().size());
    EXPECT_EQ(0x111111ULL, rc.oi_list()[0]);
    EXPECT_EQ(0x2222222229ULL, rc.oi_list()[1]);
}

TEST(dot11_ie_111_roaming_consortium, three_ois) {
    dot11_ie_111_roaming_consortium rc;
    rc.parse(hex_to_bytes("01531122331020304050010203040506"));

    EXPECT_EQ(1, rc.anqp_oi_count());
    ASSERT_EQ(3u, rc.oi_list().size());
    EXPECT_EQ(0x112233ULL, rc.oi_list()[0]);
    EXPECT_EQ(0x1020304050ULL, rc.oi_list()[1]);
    EXPECT_EQ(0x010203040506ULL, rc.oi_list()[2]);
}

TEST(dot11_ie_111_roaming_consortium, no_ois) {
    dot11_ie_111_roaming_consortium rc;
    rc.parse(hex_to_bytes("0500"));

    EXPECT_EQ(5, rc.anqp_oi_count());
    EXPECT_TRUE(rc.oi_list().empty());
}

TEST(dot11_ie_111_roaming_consortium, remainder_only) {
    // Both packed lengths zero, everything left over is OI3
    dot11_ie_111_roaming_consortium rc;
    rc.parse(hex_to_bytes("0000506f9a"));

    ASSERT_EQ(1u, rc.oi_list().size());
    EXPECT_EQ(0x506f9aULL, rc.oi_list()[0]);
}

TEST(dot11_ie_111_roaming_consortium, negative_oi3_throws) {
    dot11_ie_111_roaming_consortium rc;

    EXPECT_THROW(rc.parse(hex_to_bytes("0033111111")), hs20_malformed_element);
}

TEST(dot11_ie_111_roaming_consortium, short_element_throws) {
    dot11_ie_111_roaming_consortium rc;

    EXPECT_THROW(rc.parse(hex_to_bytes("00")), hs20_malformed_element);
}

TEST(dot11_ie_111_roaming_consortium, wide_oi_keeps_low_bits) {
    // 9 byte OI1, 1 byte OI3
    dot11_ie_111_roaming_consortium rc;
    rc.parse(hex_to_bytes("00090102030405060708090a"));

    ASSERT_EQ(2u, rc.oi_list().size());
    EXPECT_EQ(0x0203040506070809ULL, rc.oi_list()[0]);
    EXPECT_EQ(0x0aULL, rc.oi_list()[1]);
}

TEST(dot11_ie_111_roaming_consortium, fifteen_byte_oi) {
    dot11_ie_111_roaming_consortium rc;
    rc.parse(hex_to_bytes("030f" "0000000000000000" "11223344556677"));

    ASSERT_EQ(1u, rc.oi_list().size());
    EXPECT_EQ(0x0011223344556677ULL, rc.oi_list()[0]);
}

TEST(dot11_ie_127_extended, packs_little_endian) {
    dot11_ie_127_extended ext;
    ext.parse(hex_to_bytes("00000080"));

    EXPECT_EQ(0x80000000ULL, ext.capabilities());
    EXPECT_TRUE(ext.interworking());
    EXPECT_FALSE(ext.utf8_ssid());
    EXPECT_EQ(0x80, ext.octet(3));
    EXPECT_FALSE(ext.truncated());
}

TEST(dot11_ie_127_extended, utf8_ssid_bit) {
    dot11_ie_127_extended ext;
    ext.parse(hex_to_bytes("00000000000001"));

    EXPECT_EQ(DOT11_EXTCAP_UTF8_SSID, ext.capabilities());
    EXPECT_TRUE(ext.utf8_ssid());
    EXPECT_TRUE(ext.capability(48));
}

TEST(dot11_ie_127_extended, truncates_past_eight_octets) {
    dot11_ie_127_extended ext;
    ext.parse(hex_to_bytes("0102030405060708ffff"));

    EXPECT_EQ(0x0807060504030201ULL, ext.capabilities());
    EXPECT_EQ(10u, ext.capability_len());
    EXPECT_TRUE(ext.truncated());
}

TEST(dot11_ie_127_extended, empty_is_zero) {
    dot11_ie_127_extended ext;
    ext.parse(std::string());

    EXPECT_EQ(0u, ext.capabilities());
}

TEST(dot11_ie_221_vendor, splits_oui_and_type) {
    dot11_ie_221_vendor vendor;
    vendor.parse(hex_to_bytes("506f9a10143a01"));

    EXPECT_EQ(0x506f9au, vendor.vendor_oui_int());
    EXPECT_EQ(0x10, vendor.vendor_oui_type());
    EXPECT_EQ(std::string("\x14\x3a\x01", 3), vendor.vendor_tag());
}

TEST(dot11_ie_221_vendor, short_throws) {
    dot11_ie_221_vendor vendor;

    EXPECT_THROW(vendor.parse(hex_to_bytes("506f9a")), hs20_malformed_element);
}

TEST(dot11_ie_221_hs20_indication, release_2_with_domain) {
    dot11_ie_221_hs20_indication hs20;
    hs20.parse(hex_to_bytes("143a01"));

    EXPECT_EQ(hs20_release::r2, hs20.release());
    ASSERT_TRUE(hs20.has_anqp_domain_id());
    EXPECT_EQ(314, hs20.anqp_domain_id());
    EXPECT_FALSE(hs20.dgaf_disabled());
}

TEST(dot11_ie_221_hs20_indication, release_1_no_domain) {
    dot11_ie_221_hs20_indication hs20;
    hs20.parse(hex_to_bytes("01"));

    EXPECT_EQ(hs20_release::r1, hs20.release());
    EXPECT_FALSE(hs20.has_anqp_domain_id());
    EXPECT_EQ(-1, hs20.anqp_domain_id());
    EXPECT_TRUE(hs20.dgaf_disabled());
}

TEST(dot11_ie_221_hs20_indication, unknown_release) {
    dot11_ie_221_hs20_indication hs20;
    hs20.parse(hex_to_bytes("30"));

    EXPECT_EQ(hs20_release::unknown, hs20.release());
    EXPECT_EQ(3, hs20.release_num());
}

TEST(dot11_ie_221_hs20_indication, missing_domain_throws) {
    dot11_ie_221_hs20_indication hs20;

    EXPECT_THROW(hs20.parse(hex_to_bytes("143a")), hs20_malformed_element);
}

