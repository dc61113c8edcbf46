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

#include "hs20_types.h"

namespace {

struct access_network_type_entry {
    uint8_t code;
    hs20_access_network_type type;
    const char *name;
};

const access_network_type_entry access_network_type_table[] = {
    { 0, hs20_access_network_type::private_network, "Private" },
    { 1, hs20_access_network_type::private_with_guest, "PrivateWithGuest" },
    { 2, hs20_access_network_type::chargeable_public, "ChargeablePublic" },
    { 3, hs20_access_network_type::free_public, "FreePublic" },
    { 4, hs20_access_network_type::personal, "Personal" },
    { 5, hs20_access_network_type::emergency_only, "EmergencyOnly" },
    { 6, hs20_access_network_type::reserved_6, "Resvd6" },
    { 7, hs20_access_network_type::reserved_7, "Resvd7" },
    { 8, hs20_access_network_type::reserved_8, "Resvd8" },
    { 9, hs20_access_network_type::reserved_9, "Resvd9" },
    { 10, hs20_access_network_type::reserved_10, "Resvd10" },
    { 11, hs20_access_network_type::reserved_11, "Resvd11" },
    { 12, hs20_access_network_type::reserved_12, "Resvd12" },
    { 13, hs20_access_network_type::reserved_13, "Resvd13" },
    { 14, hs20_access_network_type::test_or_experimental, "TestOrExperimental" },
    { 15, hs20_access_network_type::wildcard, "Wildcard" },
};

struct release_entry {
    uint8_t code;
    hs20_release release;
    const char *name;
};

const release_entry release_table[] = {
    { 0, hs20_release::r1, "R1" },
    { 1, hs20_release::r2, "R2" },
};

}

bool hs20_access_network_type_from_code(uint8_t code, hs20_access_network_type& ret_type) {
    for (const auto& e : access_network_type_table) {
        if (e.code == code) {
            ret_type = e.type;
            return true;
        }
    }

    return false;
}

uint8_t hs20_access_network_type_code(hs20_access_network_type type) {
    for (const auto& e : access_network_type_table) {
        if (e.type == type)
            return e.code;
    }

    return 0;
}

const char *hs20_access_network_type_name(hs20_access_network_type type) {
    for (const auto& e : access_network_type_table) {
        if (e.type == type)
            return e.name;
    }

    return "Unknown";
}

hs20_release hs20_release_from_code(uint8_t code) {
    for (const auto& e : release_table) {
        if (e.code == code)
            return e.release;
    }

    return hs20_release::unknown;
}

const char *hs20_release_name(hs20_release release) {
    for (const auto& e : release_table) {
        if (e.release == release)
            return e.name;
    }

    return "Unknown";
}

std::ostream& operator<<(std::ostream& os, hs20_access_network_type type) {
    os << hs20_access_network_type_name(type);
    return os;
}

std::ostream& operator<<(std::ostream& os, hs20_release release) {
    os << hs20_release_name(release);
    return os;
}

