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

#ifndef __HS20_TYPES_H__
#define __HS20_TYPES_H__

/* Enumerations carried in beacon IEs.
 *
 * Wire codes live in explicit lookup tables in hs20_types.cc; nothing here
 * is decoded by casting a wire byte to the enum or by positional index.
 */

#include "config.h"

#include <stdint.h>
#include <iostream>
#include <string>

// Access network type, 802.11u Interworking options bits 0-3
enum class hs20_access_network_type {
    private_network,
    private_with_guest,
    chargeable_public,
    free_public,
    personal,
    emergency_only,
    reserved_6,
    reserved_7,
    reserved_8,
    reserved_9,
    reserved_10,
    reserved_11,
    reserved_12,
    reserved_13,
    test_or_experimental,
    wildcard
};

// Map a 4-bit wire code to the enum; false if the code has no entry
bool hs20_access_network_type_from_code(uint8_t code, hs20_access_network_type& ret_type);
uint8_t hs20_access_network_type_code(hs20_access_network_type type);
const char *hs20_access_network_type_name(hs20_access_network_type type);

// Hotspot 2.0 release from the HS2.0 Indication element
enum class hs20_release {
    r1,
    r2,
    unknown
};

// Map the 4-bit release number; anything without a table entry is unknown
hs20_release hs20_release_from_code(uint8_t code);
const char *hs20_release_name(hs20_release release);

std::ostream& operator<<(std::ostream& os, hs20_access_network_type type);
std::ostream& operator<<(std::ostream& os, hs20_release release);

#endif

