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

#include "macaddr.h"

#include "hs20_error.h"
#include "util.h"

uint64_t mac_addr::parse_mac(const std::string& in) {
    uint64_t mac = 0;
    unsigned int ndigits = 0;

    for (auto c : in) {
        auto nibble = x_to_i(c);

        if (nibble < 0)
            continue;

        // Keep counting past 12 so the error reports the real length
        if (ndigits < MAC_LEN * 2)
            mac = (mac << 4) | (uint64_t) nibble;

        ndigits++;
    }

    if (ndigits != MAC_LEN * 2 || (ndigits & 1))
        throw hs20_invalid_address(fmt::format("Bad MAC address '{}', expected 12 hex "
                    "digits and found {}", munge_to_printable(in), ndigits));

    return mac;
}

void mac_addr::string2long(const std::string& in) {
    longmac = parse_mac(in);
}

std::string mac_addr::format_mac(uint64_t in) {
    return fmt::format("{:02x}:{:02x}:{:02x}:{:02x}:{:02x}:{:02x}",
            (in >> 40) & 0xFF, (in >> 32) & 0xFF, (in >> 24) & 0xFF,
            (in >> 16) & 0xFF, (in >> 8) & 0xFF, in & 0xFF);
}

std::ostream& operator<<(std::ostream& os, const mac_addr& m) {
    os << m.mac_to_string();
    return os;
}

std::istream& operator>>(std::istream& is, mac_addr& m) {
    std::string sline;
    std::getline(is, sline);

    try {
        m.string2long(sline);
    } catch (const hs20_invalid_address&) {
        is.setstate(std::ios::failbit);
    }

    return is;
}

