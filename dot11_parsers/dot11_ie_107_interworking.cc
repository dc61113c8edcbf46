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

#include <fmt/format.h>

#include "globalregistry.h"
#include "hs20_error.h"
#include "util.h"

#include "dot11_ie_107_interworking.h"

void dot11_ie_107_interworking::parse(std::shared_ptr<kaitai::kstream> p_io) {
    parse(*p_io);
}

void dot11_ie_107_interworking::parse(kaitai::kstream& p_io) {
    reset();

    auto len = p_io.size();

    if (len == 0)
        throw hs20_malformed_element("dot11_ie_107_interworking has no access network options");

    m_options = p_io.read_u1();

    if (!hs20_access_network_type_from_code(m_options & 0x0F, m_access_network_type))
        throw hs20_malformed_element(fmt::format("dot11_ie_107_interworking unknown access "
                    "network type {}", m_options & 0x0F));

    if (len == 3 || len == 9) {
        auto venue = p_io.read_bytes(2);

        m_has_venue = m_venue.parse(venue);

        if (!m_has_venue) {
            m_venue.reset();
            _MSG_DEBUG("Interworking venue info {} could not be decoded, ignoring it",
                    bytes_to_hex(venue));
        }
    }

    if (len == 7 || len == 9) {
        uint64_t hessid_hi = p_io.read_u2be();
        uint64_t hessid_lo = p_io.read_u4be();

        m_hessid = (hessid_hi << 32) | hessid_lo;
        m_has_hessid = true;
    }

    if (len != 1 && len != 3 && len != 7 && len != 9)
        _MSG_DEBUG("Interworking element has unexpected length {}, decoded access network "
                "options only", len);
}

void dot11_ie_107_interworking::parse(const std::string& data) {
	membuf d_membuf(data.data(), data.data() + data.length());
	std::istream is(&d_membuf);
	kaitai::kstream p_io(&is);

    parse(p_io);
}

