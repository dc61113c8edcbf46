#include "config.h"

#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include "anqp.h"
#include "hs20_types.h"

TEST(anqp_element_type, info_id_lookup) {
    anqp_element_type t;

    ASSERT_TRUE(anqp_element_type_from_info_id(258, t));
    EXPECT_EQ(anqp_element_type::venue_name, t);

    ASSERT_TRUE(anqp_element_type_from_info_id(56797, t));
    EXPECT_EQ(anqp_element_type::vendor_specific, t);

    EXPECT_FALSE(anqp_element_type_from_info_id(255, t));
    EXPECT_FALSE(anqp_element_type_from_info_id(273, t));
}

TEST(anqp_element_type, hs20_subtype_lookup) {
    anqp_element_type t;

    ASSERT_TRUE(anqp_element_type_from_hs20_subtype(4, t));
    EXPECT_EQ(anqp_element_type::hs20_wan_metrics, t);

    // 3 is reserved
    EXPECT_FALSE(anqp_element_type_from_hs20_subtype(3, t));
}

TEST(anqp_element_type, names) {
    EXPECT_STREQ("ANQPVenueName", anqp_element_type_name(anqp_element_type::venue_name));
    EXPECT_STREQ("HSWANMetrics", anqp_element_type_name(anqp_element_type::hs20_wan_metrics));

    std::stringstream ss;
    ss << anqp_element_type::roaming_consortium;
    EXPECT_EQ("ANQPRoamingConsortium", ss.str());
}

TEST(anqp_venue_info, decodes_group_and_type) {
    anqp_venue_info v;

    ASSERT_TRUE(v.parse(std::string("\x0a\x01", 2)));
    EXPECT_EQ(anqp_venue_group::vehicular, v.group());
    EXPECT_EQ(anqp_venue_type::automobile_or_truck, v.type());

    ASSERT_TRUE(v.parse(std::string("\x07\x01", 2)));
    EXPECT_EQ(anqp_venue_group::residential, v.group());
    EXPECT_EQ(anqp_venue_type::private_residence, v.type());

    ASSERT_TRUE(v.parse(std::string("\x00\x00", 2)));
    EXPECT_EQ(anqp_venue_group::unspecified, v.group());
    EXPECT_EQ(anqp_venue_type::unspecified, v.type());
}

TEST(anqp_venue_info, unknown_group_is_reserved) {
    anqp_venue_info v;

    ASSERT_TRUE(v.parse(std::string("\x0c\x01", 2)));
    EXPECT_EQ(anqp_venue_group::reserved, v.group());
    EXPECT_EQ(anqp_venue_type::reserved, v.type());
}

TEST(anqp_venue_info, unknown_type_is_reserved) {
    anqp_venue_info v;

    // Business type 5 is reserved
    ASSERT_TRUE(v.parse(std::string("\x02\x05", 2)));
    EXPECT_EQ(anqp_venue_group::business, v.group());
    EXPECT_EQ(anqp_venue_type::reserved, v.type());

    ASSERT_TRUE(v.parse(std::string("\x02\x06", 2)));
    EXPECT_EQ(anqp_venue_type::post_office, v.type());

    ASSERT_TRUE(v.parse(std::string("\x08\x01", 2)));
    EXPECT_EQ(anqp_venue_group::storage, v.group());
    EXPECT_EQ(anqp_venue_type::reserved, v.type());
}

TEST(anqp_venue_info, runt_field_fails_unchanged) {
    anqp_venue_info v;

    ASSERT_TRUE(v.parse(std::string("\x0b\x02", 2)));
    EXPECT_FALSE(v.parse(std::string("\x0a", 1)));
    EXPECT_FALSE(v.parse(""));

    EXPECT_EQ(anqp_venue_group::outdoor, v.group());
    EXPECT_EQ(anqp_venue_type::city_park, v.type());
}

TEST(anqp_venue_info, names) {
    EXPECT_STREQ("Vehicular", anqp_venue_group_name(anqp_venue_group::vehicular));
    EXPECT_STREQ("AutomobileOrTruck", anqp_venue_type_name(anqp_venue_type::automobile_or_truck));
    EXPECT_STREQ("Reserved", anqp_venue_group_name(anqp_venue_group::reserved));
    EXPECT_STREQ("Reserved", anqp_venue_type_name(anqp_venue_type::reserved));
}

TEST(hs20_types, access_network_type_codes) {
    hs20_access_network_type t;

    for (uint8_t c = 0; c < 16; c++) {
        ASSERT_TRUE(hs20_access_network_type_from_code(c, t));
        EXPECT_EQ(c, hs20_access_network_type_code(t));
    }

    ASSERT_TRUE(hs20_access_network_type_from_code(14, t));
    EXPECT_EQ(hs20_access_network_type::test_or_experimental, t);
    EXPECT_STREQ("TestOrExperimental", hs20_access_network_type_name(t));

    ASSERT_TRUE(hs20_access_network_type_from_code(6, t));
    EXPECT_STREQ("Resvd6", hs20_access_network_type_name(t));

    EXPECT_FALSE(hs20_access_network_type_from_code(16, t));
}

TEST(hs20_types, release_codes) {
    EXPECT_EQ(hs20_release::r1, hs20_release_from_code(0));
    EXPECT_EQ(hs20_release::r2, hs20_release_from_code(1));
    EXPECT_EQ(hs20_release::unknown, hs20_release_from_code(2));
    EXPECT_EQ(hs20_release::unknown, hs20_release_from_code(15));

    std::stringstream ss;
    ss << hs20_release::r2;
    EXPECT_EQ("R2", ss.str());
}

