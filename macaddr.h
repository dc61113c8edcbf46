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

#ifndef __MACADDR_H__
#define __MACADDR_H__

#include "config.h"

#ifdef HAVE_STDINT_H
#include <stdint.h>
#endif
#ifdef HAVE_INTTYPES_H
#include <inttypes.h>
#endif
#include <functional>
#include <iostream>
#include <string>

#include <fmt/format.h>
#include <fmt/ostream.h>

#define MAC_LEN         6
#define MAC_LONG_MASK   0x0000FFFFFFFFFFFFULL

// 48-bit EUI stored right-aligned in a u64; byte 0 is the most significant
// (first transmitted) octet.
//
// Text form is parsed permissively: any non-hex character is a separator and
// is dropped, so "00:11:22:33:44:55", "00-11-22-33-44-55" and "001122334455"
// are the same address.  Exactly 12 hex digits are required.
struct mac_addr {
    uint64_t longmac;

    constexpr mac_addr() :
        longmac{0} { }

    constexpr mac_addr(const mac_addr& in) :
        longmac{in.longmac} { }

    constexpr mac_addr(uint64_t in) :
        longmac{in & MAC_LONG_MASK} { }

    // Throws hs20_invalid_address
    mac_addr(const char *in) {
        string2long(in);
    }

    mac_addr(const std::string& in) {
        string2long(in);
    }

    mac_addr(const uint8_t *in, unsigned int len) :
        longmac{0} {
        for (unsigned int x = 0; x < len && x < MAC_LEN; x++)
            longmac = (longmac << 8) | in[x];
    }

    // Parse text into longmac; throws hs20_invalid_address and leaves the
    // previous value untouched on failure
    void string2long(const std::string& in);

    // Text to 48-bit value, see string2long
    static uint64_t parse_mac(const std::string& in);

    // Canonical lowercase aa:bb:cc:dd:ee:ff form of a 48-bit value
    static std::string format_mac(uint64_t in);

    constexpr bool operator== (const mac_addr& op) const {
        return longmac == op.longmac;
    }

    constexpr bool operator== (const uint64_t op) const {
        return longmac == op;
    }

    constexpr bool operator!= (const mac_addr& op) const {
        return !(operator==(op));
    }

    // MAC less-than for STL sorts...
    constexpr bool operator< (const mac_addr& op) const {
        return longmac < op.longmac;
    }

    mac_addr& operator= (const mac_addr& op) {
        longmac = op.longmac;
        return *this;
    }

    constexpr unsigned int index64(uint64_t val, int index) const {
        if (index < 0 || index >= MAC_LEN)
            return 0;

        return (uint8_t) (val >> ((MAC_LEN - index - 1) * 8));
    }

    constexpr unsigned int operator[] (int index) const {
        return index64(longmac, index);
    }

	constexpr uint32_t OUI() const {
		return (longmac >> 24) & 0x00FFFFFF;
	}

    constexpr bool is_broadcast() const {
        return longmac == MAC_LONG_MASK;
    }

    constexpr bool is_multicast() const {
        return (longmac >> 40) & 0x01;
    }

    constexpr uint64_t get_as_long() const {
        return longmac;
    }

    std::string as_string() const {
        return mac_to_string();
    }

    std::string mac_to_string() const {
        return format_mac(longmac);
    }

    friend std::ostream& operator<<(std::ostream& os, const mac_addr& m);
    friend std::istream& operator>>(std::istream& is, mac_addr& m);
};

std::ostream& operator<<(std::ostream& os, const mac_addr& m);
std::istream& operator>>(std::istream& is, mac_addr& m);

template <>struct fmt::formatter<mac_addr> : fmt::ostream_formatter {};

namespace std {
    template<> struct hash<mac_addr> {
        std::size_t operator()(mac_addr const& m) const noexcept {
            return std::hash<uint64_t>{}(m.longmac);
        }
    };
}

#endif

