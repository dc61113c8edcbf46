/*
    This file is part of hs20scan

    hs20scan is free software; you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation; either version 2 of the License, or
    (at your option) any later version.

    hs20scan is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with hs20scan; if not, write to the Free Software
    Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
*/

#ifndef __ANQP_H__
#define __ANQP_H__

/* ANQP boundary types
 *
 * The ANQP query/response engine lives outside this library; it is reached
 * through anqp_line_parser and hands back anqp_element objects keyed by
 * their element type.  The only ANQP content decoded here is the 2-byte
 * venue info (group, type) shared by the Interworking IE and the ANQP Venue
 * Name element.
 *
 */

#include "config.h"

#include <stdint.h>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

// ANQP info IDs (802.11u) and Hotspot 2.0 ANQP subtypes.  HS2.0 subtypes are
// carried in a vendor-specific ANQP element; they're offset into their own
// range so the two code spaces can share one key type.
#define ANQP_HS20_SUBTYPE_BASE      0x10000

enum class anqp_element_type : uint32_t {
    query_list = 256,
    capability_list = 257,
    venue_name = 258,
    emergency_number = 259,
    network_auth_type = 260,
    roaming_consortium = 261,
    ip_addr_availability = 262,
    nai_realm = 263,
    cellular_network_3gpp = 264,
    geo_location = 265,
    civic_location = 266,
    location_uri = 267,
    domain_name = 268,
    emergency_alert = 269,
    tdls_capability = 270,
    emergency_nai = 271,
    neighbor_report = 272,
    vendor_specific = 56797,

    hs20_capability_list = ANQP_HS20_SUBTYPE_BASE + 1,
    hs20_operator_friendly_name = ANQP_HS20_SUBTYPE_BASE + 2,
    hs20_wan_metrics = ANQP_HS20_SUBTYPE_BASE + 4,
    hs20_connection_capability = ANQP_HS20_SUBTYPE_BASE + 5,
    hs20_nai_home_realm_query = ANQP_HS20_SUBTYPE_BASE + 6,
    hs20_operating_class = ANQP_HS20_SUBTYPE_BASE + 7,
    hs20_osu_providers = ANQP_HS20_SUBTYPE_BASE + 8,
    hs20_icon_request = ANQP_HS20_SUBTYPE_BASE + 10,
    hs20_icon_file = ANQP_HS20_SUBTYPE_BASE + 11,
};

bool anqp_element_type_from_info_id(uint16_t info_id, anqp_element_type& ret_type);
bool anqp_element_type_from_hs20_subtype(uint8_t subtype, anqp_element_type& ret_type);
const char *anqp_element_type_name(anqp_element_type type);

std::ostream& operator<<(std::ostream& os, anqp_element_type type);

// A decoded ANQP element, produced by the external ANQP parser
class anqp_element {
public:
    anqp_element(anqp_element_type in_type) :
        m_element_type{in_type} { }
    virtual ~anqp_element() { }

    anqp_element_type element_type() const {
        return m_element_type;
    }

    virtual std::string as_string() const = 0;

protected:
    anqp_element_type m_element_type;
};

typedef std::map<anqp_element_type, std::shared_ptr<anqp_element>> anqp_element_map;
typedef std::shared_ptr<const anqp_element_map> shared_anqp_element_map;

// Resolves raw ANQP response lines (supplicant "key=hex" form) into elements.
// Implemented outside this library.
class anqp_line_parser {
public:
    virtual ~anqp_line_parser() { }

    virtual shared_anqp_element_map parse(const std::vector<std::string>& in_lines) = 0;
};

// Venue group, IEEE 802.11 venue info field octet 0
enum class anqp_venue_group {
    unspecified,
    assembly,
    business,
    educational,
    factory_industrial,
    institutional,
    mercantile,
    residential,
    storage,
    utility_miscellaneous,
    vehicular,
    outdoor,
    reserved
};

// Venue type, octet 1; only meaningful together with the group
enum class anqp_venue_type {
    unspecified,

    unspecified_assembly,
    arena,
    stadium,
    passenger_terminal,
    amphitheater,
    amusement_park,
    place_of_worship,
    convention_center,
    library,
    museum,
    restaurant,
    theater,
    bar,
    coffee_shop,
    zoo_or_aquarium,
    emergency_coordination_center,

    unspecified_business,
    doctor_or_dentist_office,
    bank,
    fire_station,
    police_station,
    post_office,
    professional_office,
    research_and_development_facility,
    attorney_office,

    unspecified_educational,
    school_primary,
    school_secondary,
    university_or_college,

    unspecified_factory_industrial,
    factory,

    unspecified_institutional,
    hospital,
    long_term_care_facility,
    alcohol_and_drug_rehabilitation_center,
    group_home,
    prison_or_jail,

    unspecified_mercantile,
    retail_store,
    grocery_market,
    automotive_service_station,
    shopping_mall,
    gas_station,

    unspecified_residential,
    private_residence,
    hotel_or_motel,
    dormitory,
    boarding_house,

    unspecified_storage,

    unspecified_utility_miscellaneous,

    unspecified_vehicular,
    automobile_or_truck,
    airplane,
    bus,
    ferry,
    ship_or_boat,
    train,
    motor_bike,

    unspecified_outdoor,
    muni_mesh_network,
    city_park,
    rest_area,
    traffic_control,
    bus_stop,
    kiosk,

    reserved
};

const char *anqp_venue_group_name(anqp_venue_group group);
const char *anqp_venue_type_name(anqp_venue_type type);

std::ostream& operator<<(std::ostream& os, anqp_venue_group group);
std::ostream& operator<<(std::ostream& os, anqp_venue_type type);

// Venue info sub-field (group, type).  parse() reports failure through its
// return value rather than throwing; venue data is cosmetic and a caller may
// choose to carry on without it.
//
// Group codes outside the table decode to reserved/reserved; a known group
// with an unknown type decodes to (group, reserved).
class anqp_venue_info {
public:
    anqp_venue_info() :
        m_group{anqp_venue_group::unspecified},
        m_type{anqp_venue_type::unspecified} { }
    ~anqp_venue_info() { }

    // Returns false, leaving the object unchanged, on a runt field
    bool parse(const std::string& data) noexcept;

    anqp_venue_group group() const {
        return m_group;
    }

    anqp_venue_type type() const {
        return m_type;
    }

    void reset() {
        m_group = anqp_venue_group::unspecified;
        m_type = anqp_venue_type::unspecified;
    }

protected:
    anqp_venue_group m_group;
    anqp_venue_type m_type;
};

#endif

