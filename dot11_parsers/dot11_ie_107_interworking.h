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

#ifndef __DOT11_IE_107_INTERWORKING_H__
#define __DOT11_IE_107_INTERWORKING_H__

/* dot11 ie 107 Interworking
 *
 * 802.11u access network options, optionally followed by venue info (2 bytes)
 * and/or the HESSID (6 bytes, big endian).  The element length selects which
 * of the optional fields are present:
 *
 *   1  options
 *   3  options, venue info
 *   7  options, HESSID
 *   9  options, venue info, HESSID
 *
 * Other non-zero lengths keep the options byte and skip the rest.  Venue info
 * which fails to decode is dropped without failing the element.
 *
 */

#include <string>
#include <memory>
#include <vector>
#include <kaitai/kaitaistream.h>

#include "anqp.h"
#include "hs20_types.h"

class dot11_ie_107_interworking {
public:
    dot11_ie_107_interworking() :
        m_options{0},
        m_access_network_type{hs20_access_network_type::private_network},
        m_has_venue{false},
        m_has_hessid{false},
        m_hessid{0} { }
    ~dot11_ie_107_interworking() { }

    constexpr static uint8_t ie_num() {
        return 107;
    }

    void parse(std::shared_ptr<kaitai::kstream> p_io);
    void parse(kaitai::kstream& p_io);
	void parse(const std::string& data);

    constexpr uint8_t access_network_options() const {
        return m_options;
    }

    constexpr hs20_access_network_type access_network_type() const {
        return m_access_network_type;
    }

    constexpr bool internet() const {
        return m_options & 0x10;
    }

    constexpr bool asra() const {
        return m_options & 0x20;
    }

    constexpr bool esr() const {
        return m_options & 0x40;
    }

    constexpr bool uesa() const {
        return m_options & 0x80;
    }

    constexpr bool has_venue() const {
        return m_has_venue;
    }

    anqp_venue_group venue_group() const {
        return m_venue.group();
    }

    anqp_venue_type venue_type() const {
        return m_venue.type();
    }

    constexpr bool has_hessid() const {
        return m_has_hessid;
    }

    constexpr uint64_t hessid() const {
        return m_hessid;
    }

    void reset() {
        m_options = 0;
        m_access_network_type = hs20_access_network_type::private_network;
        m_has_venue = false;
        m_venue.reset();
        m_has_hessid = false;
        m_hessid = 0;
    }

protected:
    uint8_t m_options;
    hs20_access_network_type m_access_network_type;

    bool m_has_venue;
    anqp_venue_info m_venue;

    bool m_has_hessid;
    uint64_t m_hessid;
};


#endif

