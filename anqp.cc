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

#include "anqp.h"

namespace {

struct element_type_entry {
    anqp_element_type type;
    const char *name;
};

const element_type_entry element_type_table[] = {
    { anqp_element_type::query_list, "ANQPQueryList" },
    { anqp_element_type::capability_list, "ANQPCapabilityList" },
    { anqp_element_type::venue_name, "ANQPVenueName" },
    { anqp_element_type::emergency_number, "ANQPEmergencyNumber" },
    { anqp_element_type::network_auth_type, "ANQPNwkAuthType" },
    { anqp_element_type::roaming_consortium, "ANQPRoamingConsortium" },
    { anqp_element_type::ip_addr_availability, "ANQPIPAddrAvailability" },
    { anqp_element_type::nai_realm, "ANQPNAIRealm" },
    { anqp_element_type::cellular_network_3gpp, "ANQP3GPPNetwork" },
    { anqp_element_type::geo_location, "ANQPGeoLoc" },
    { anqp_element_type::civic_location, "ANQPCivicLoc" },
    { anqp_element_type::location_uri, "ANQPLocURI" },
    { anqp_element_type::domain_name, "ANQPDomName" },
    { anqp_element_type::emergency_alert, "ANQPEmergencyAlert" },
    { anqp_element_type::tdls_capability, "ANQPTDLSCap" },
    { anqp_element_type::emergency_nai, "ANQPEmergencyNAI" },
    { anqp_element_type::neighbor_report, "ANQPNeighborReport" },
    { anqp_element_type::vendor_specific, "ANQPVendorSpec" },
    { anqp_element_type::hs20_capability_list, "HSCapabilityList" },
    { anqp_element_type::hs20_operator_friendly_name, "HSFriendlyName" },
    { anqp_element_type::hs20_wan_metrics, "HSWANMetrics" },
    { anqp_element_type::hs20_connection_capability, "HSConnCapability" },
    { anqp_element_type::hs20_nai_home_realm_query, "HSNAIHomeRealmQuery" },
    { anqp_element_type::hs20_operating_class, "HSOperatingclass" },
    { anqp_element_type::hs20_osu_providers, "HSOSUProviders" },
    { anqp_element_type::hs20_icon_request, "HSIconRequest" },
    { anqp_element_type::hs20_icon_file, "HSIconFile" },
};

struct venue_group_entry {
    uint8_t code;
    anqp_venue_group group;
    const char *name;
};

const venue_group_entry venue_group_table[] = {
    { 0, anqp_venue_group::unspecified, "Unspecified" },
    { 1, anqp_venue_group::assembly, "Assembly" },
    { 2, anqp_venue_group::business, "Business" },
    { 3, anqp_venue_group::educational, "Educational" },
    { 4, anqp_venue_group::factory_industrial, "FactoryIndustrial" },
    { 5, anqp_venue_group::institutional, "Institutional" },
    { 6, anqp_venue_group::mercantile, "Mercantile" },
    { 7, anqp_venue_group::residential, "Residential" },
    { 8, anqp_venue_group::storage, "Storage" },
    { 9, anqp_venue_group::utility_miscellaneous, "UtilityMiscellaneous" },
    { 10, anqp_venue_group::vehicular, "Vehicular" },
    { 11, anqp_venue_group::outdoor, "Outdoor" },
};

struct venue_type_entry {
    anqp_venue_group group;
    uint8_t code;
    anqp_venue_type type;
    const char *name;
};

const venue_type_entry venue_type_table[] = {
    { anqp_venue_group::unspecified, 0, anqp_venue_type::unspecified, "Unspecified" },

    { anqp_venue_group::assembly, 0, anqp_venue_type::unspecified_assembly, "UnspecifiedAssembly" },
    { anqp_venue_group::assembly, 1, anqp_venue_type::arena, "Arena" },
    { anqp_venue_group::assembly, 2, anqp_venue_type::stadium, "Stadium" },
    { anqp_venue_group::assembly, 3, anqp_venue_type::passenger_terminal, "PassengerTerminal" },
    { anqp_venue_group::assembly, 4, anqp_venue_type::amphitheater, "Amphitheater" },
    { anqp_venue_group::assembly, 5, anqp_venue_type::amusement_park, "AmusementPark" },
    { anqp_venue_group::assembly, 6, anqp_venue_type::place_of_worship, "PlaceOfWorship" },
    { anqp_venue_group::assembly, 7, anqp_venue_type::convention_center, "ConventionCenter" },
    { anqp_venue_group::assembly, 8, anqp_venue_type::library, "Library" },
    { anqp_venue_group::assembly, 9, anqp_venue_type::museum, "Museum" },
    { anqp_venue_group::assembly, 10, anqp_venue_type::restaurant, "Restaurant" },
    { anqp_venue_group::assembly, 11, anqp_venue_type::theater, "Theater" },
    { anqp_venue_group::assembly, 12, anqp_venue_type::bar, "Bar" },
    { anqp_venue_group::assembly, 13, anqp_venue_type::coffee_shop, "CoffeeShop" },
    { anqp_venue_group::assembly, 14, anqp_venue_type::zoo_or_aquarium, "ZooOrAquarium" },
    { anqp_venue_group::assembly, 15, anqp_venue_type::emergency_coordination_center,
        "EmergencyCoordinationCenter" },

    { anqp_venue_group::business, 0, anqp_venue_type::unspecified_business, "UnspecifiedBusiness" },
    { anqp_venue_group::business, 1, anqp_venue_type::doctor_or_dentist_office, "DoctorOrDentistOffice" },
    { anqp_venue_group::business, 2, anqp_venue_type::bank, "Bank" },
    { anqp_venue_group::business, 3, anqp_venue_type::fire_station, "FireStation" },
    { anqp_venue_group::business, 4, anqp_venue_type::police_station, "PoliceStation" },
    // 5 is reserved
    { anqp_venue_group::business, 6, anqp_venue_type::post_office, "PostOffice" },
    { anqp_venue_group::business, 7, anqp_venue_type::professional_office, "ProfessionalOffice" },
    { anqp_venue_group::business, 8, anqp_venue_type::research_and_development_facility,
        "ResearchAndDevelopmentFacility" },
    { anqp_venue_group::business, 9, anqp_venue_type::attorney_office, "AttorneyOffice" },

    { anqp_venue_group::educational, 0, anqp_venue_type::unspecified_educational, "UnspecifiedEducational" },
    { anqp_venue_group::educational, 1, anqp_venue_type::school_primary, "SchoolPrimary" },
    { anqp_venue_group::educational, 2, anqp_venue_type::school_secondary, "SchoolSecondary" },
    { anqp_venue_group::educational, 3, anqp_venue_type::university_or_college, "UniversityOrCollege" },

    { anqp_venue_group::factory_industrial, 0, anqp_venue_type::unspecified_factory_industrial,
        "UnspecifiedFactoryIndustrial" },
    { anqp_venue_group::factory_industrial, 1, anqp_venue_type::factory, "Factory" },

    { anqp_venue_group::institutional, 0, anqp_venue_type::unspecified_institutional,
        "UnspecifiedInstitutional" },
    { anqp_venue_group::institutional, 1, anqp_venue_type::hospital, "Hospital" },
    { anqp_venue_group::institutional, 2, anqp_venue_type::long_term_care_facility, "LongTermCareFacility" },
    { anqp_venue_group::institutional, 3, anqp_venue_type::alcohol_and_drug_rehabilitation_center,
        "AlcoholAndDrugRehabilitationCenter" },
    { anqp_venue_group::institutional, 4, anqp_venue_type::group_home, "GroupHome" },
    { anqp_venue_group::institutional, 5, anqp_venue_type::prison_or_jail, "PrisonOrJail" },

    { anqp_venue_group::mercantile, 0, anqp_venue_type::unspecified_mercantile, "UnspecifiedMercantile" },
    { anqp_venue_group::mercantile, 1, anqp_venue_type::retail_store, "RetailStore" },
    { anqp_venue_group::mercantile, 2, anqp_venue_type::grocery_market, "GroceryMarket" },
    { anqp_venue_group::mercantile, 3, anqp_venue_type::automotive_service_station,
        "AutomotiveServiceStation" },
    { anqp_venue_group::mercantile, 4, anqp_venue_type::shopping_mall, "ShoppingMall" },
    { anqp_venue_group::mercantile, 5, anqp_venue_type::gas_station, "GasStation" },

    { anqp_venue_group::residential, 0, anqp_venue_type::unspecified_residential, "UnspecifiedResidential" },
    { anqp_venue_group::residential, 1, anqp_venue_type::private_residence, "PrivateResidence" },
    { anqp_venue_group::residential, 2, anqp_venue_type::hotel_or_motel, "HotelOrMotel" },
    { anqp_venue_group::residential, 3, anqp_venue_type::dormitory, "Dormitory" },
    { anqp_venue_group::residential, 4, anqp_venue_type::boarding_house, "BoardingHouse" },

    { anqp_venue_group::storage, 0, anqp_venue_type::unspecified_storage, "UnspecifiedStorage" },

    { anqp_venue_group::utility_miscellaneous, 0, anqp_venue_type::unspecified_utility_miscellaneous,
        "UnspecifiedUtilityMiscellaneous" },

    { anqp_venue_group::vehicular, 0, anqp_venue_type::unspecified_vehicular, "UnspecifiedVehicular" },
    { anqp_venue_group::vehicular, 1, anqp_venue_type::automobile_or_truck, "AutomobileOrTruck" },
    { anqp_venue_group::vehicular, 2, anqp_venue_type::airplane, "Airplane" },
    { anqp_venue_group::vehicular, 3, anqp_venue_type::bus, "Bus" },
    { anqp_venue_group::vehicular, 4, anqp_venue_type::ferry, "Ferry" },
    { anqp_venue_group::vehicular, 5, anqp_venue_type::ship_or_boat, "ShipOrBoat" },
    { anqp_venue_group::vehicular, 6, anqp_venue_type::train, "Train" },
    { anqp_venue_group::vehicular, 7, anqp_venue_type::motor_bike, "MotorBike" },

    { anqp_venue_group::outdoor, 0, anqp_venue_type::unspecified_outdoor, "UnspecifiedOutdoor" },
    { anqp_venue_group::outdoor, 1, anqp_venue_type::muni_mesh_network, "MuniMeshNetwork" },
    { anqp_venue_group::outdoor, 2, anqp_venue_type::city_park, "CityPark" },
    { anqp_venue_group::outdoor, 3, anqp_venue_type::rest_area, "RestArea" },
    { anqp_venue_group::outdoor, 4, anqp_venue_type::traffic_control, "TrafficControl" },
    { anqp_venue_group::outdoor, 5, anqp_venue_type::bus_stop, "BusStop" },
    { anqp_venue_group::outdoor, 6, anqp_venue_type::kiosk, "Kiosk" },
};

}

bool anqp_element_type_from_info_id(uint16_t info_id, anqp_element_type& ret_type) {
    for (const auto& e : element_type_table) {
        if ((uint32_t) e.type == info_id) {
            ret_type = e.type;
            return true;
        }
    }

    return false;
}

bool anqp_element_type_from_hs20_subtype(uint8_t subtype, anqp_element_type& ret_type) {
    for (const auto& e : element_type_table) {
        if ((uint32_t) e.type == ANQP_HS20_SUBTYPE_BASE + subtype) {
            ret_type = e.type;
            return true;
        }
    }

    return false;
}

const char *anqp_element_type_name(anqp_element_type type) {
    for (const auto& e : element_type_table) {
        if (e.type == type)
            return e.name;
    }

    return "Unknown";
}

const char *anqp_venue_group_name(anqp_venue_group group) {
    for (const auto& e : venue_group_table) {
        if (e.group == group)
            return e.name;
    }

    return "Reserved";
}

const char *anqp_venue_type_name(anqp_venue_type type) {
    for (const auto& e : venue_type_table) {
        if (e.type == type)
            return e.name;
    }

    return "Reserved";
}

std::ostream& operator<<(std::ostream& os, anqp_element_type type) {
    os << anqp_element_type_name(type);
    return os;
}

std::ostream& operator<<(std::ostream& os, anqp_venue_group group) {
    os << anqp_venue_group_name(group);
    return os;
}

std::ostream& operator<<(std::ostream& os, anqp_venue_type type) {
    os << anqp_venue_type_name(type);
    return os;
}

bool anqp_venue_info::parse(const std::string& data) noexcept {
    if (data.length() < 2)
        return false;

    auto group_code = (uint8_t) data[0];
    auto type_code = (uint8_t) data[1];

    auto group = anqp_venue_group::reserved;
    auto type = anqp_venue_type::reserved;

    for (const auto& g : venue_group_table) {
        if (g.code == group_code) {
            group = g.group;
            break;
        }
    }

    if (group != anqp_venue_group::reserved) {
        for (const auto& t : venue_type_table) {
            if (t.group == group && t.code == type_code) {
                type = t.type;
                break;
            }
        }
    }

    m_group = group;
    m_type = type;

    return true;
}

