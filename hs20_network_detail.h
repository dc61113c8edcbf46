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

#ifndef __HS20_NETWORK_DETAIL_H__
#define __HS20_NETWORK_DETAIL_H__

/* Hotspot 2.0 network descriptor
 *
 * Built once from a BSSID and the "<prefix>=<hex>" IE text reported for a
 * beacon or probe response, plus the raw ANQP response lines if any have been
 * collected.  Nothing is mutable after construction; attaching ANQP results
 * later goes through complete(), which returns a new descriptor.
 *
 * Identity is the (SSID, BSSID) pair: equality, hashing and key_string() use
 * nothing else.
 *
 */

#include "config.h"

#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include "anqp.h"
#include "hs20_types.h"
#include "macaddr.h"

class hs20_network_detail {
public:
    // Throws hs20_invalid_input (no '=' separator, bad hex), hs20_invalid_address
    // and hs20_malformed_element.  A null anqp_lines yields an empty ANQP map
    // without consulting the parser.
    hs20_network_detail(const std::string& in_bssid, const std::string& in_ie_text,
            const std::vector<std::string> *in_anqp_lines, anqp_line_parser *in_anqp_parser);

    hs20_network_detail(const std::string& in_bssid, const std::string& in_ie_text);

    // New descriptor identical to this one apart from the ANQP elements
    std::shared_ptr<hs20_network_detail> complete(shared_anqp_element_map in_anqp_elements) const;

    bool has_ssid() const {
        return m_has_ssid;
    }

    // UTF-8 text; empty when has_ssid() is false
    const std::string& ssid() const {
        return m_ssid;
    }

    uint64_t bssid() const {
        return m_bssid.longmac;
    }

    const mac_addr& bssid_mac() const {
        return m_bssid;
    }

    uint64_t hessid() const {
        return m_hessid;
    }

    unsigned int station_count() const {
        return m_station_count;
    }

    unsigned int channel_utilization() const {
        return m_channel_utilization;
    }

    unsigned int capacity() const {
        return m_capacity;
    }

    bool has_interworking() const {
        return m_has_interworking;
    }

    // Only meaningful when has_interworking()
    hs20_access_network_type access_network_type() const {
        return m_access_network_type;
    }

    bool internet_available() const {
        return m_internet;
    }

    bool has_venue() const {
        return m_has_venue;
    }

    anqp_venue_group venue_group() const {
        return m_venue_group;
    }

    anqp_venue_type venue_type() const {
        return m_venue_type;
    }

    bool has_hs_release() const {
        return m_has_hs_release;
    }

    hs20_release hs_release() const {
        return m_hs_release;
    }

    // -1 when not advertised
    int anqp_domain_id() const {
        return m_anqp_domain_id;
    }

    unsigned int anqp_oi_count() const {
        return m_anqp_oi_count;
    }

    bool has_roaming_consortium() const {
        return m_has_roaming_consortium;
    }

    const std::vector<uint64_t>& roaming_consortium_ois() const {
        return m_roaming_consortium_ois;
    }

    bool has_extended_capabilities() const {
        return m_has_extended_capabilities;
    }

    uint64_t extended_capabilities() const {
        return m_extended_capabilities;
    }

    // Never null
    shared_anqp_element_map anqp_elements() const {
        return m_anqp_elements;
    }

    // Interworking, roaming consortium or HS2.0 indication present
    bool has_80211u_info() const {
        return m_has_interworking || m_has_roaming_consortium || m_has_hs_release;
    }

    bool is_ssid_utf8() const;

    // 'SSID':aa:bb:cc:dd:ee:ff
    std::string key_string() const;
    std::string bssid_string() const;

    // Debug rendering of every field
    std::string as_string() const;

    bool operator==(const hs20_network_detail& op) const;
    bool operator!=(const hs20_network_detail& op) const {
        return !(*this == op);
    }

    std::size_t hash() const;

protected:
    hs20_network_detail(const hs20_network_detail& in_base, shared_anqp_element_map in_anqp_elements);

    void decode_ie_text(const std::string& in_bssid, const std::string& in_ie_text);

    bool m_has_ssid;
    std::string m_ssid;

    mac_addr m_bssid;
    uint64_t m_hessid;

    unsigned int m_station_count;
    unsigned int m_channel_utilization;
    unsigned int m_capacity;

    bool m_has_interworking;
    hs20_access_network_type m_access_network_type;
    bool m_internet;

    bool m_has_venue;
    anqp_venue_group m_venue_group;
    anqp_venue_type m_venue_type;

    bool m_has_hs_release;
    hs20_release m_hs_release;
    int m_anqp_domain_id;

    unsigned int m_anqp_oi_count;
    bool m_has_roaming_consortium;
    std::vector<uint64_t> m_roaming_consortium_ois;

    bool m_has_extended_capabilities;
    uint64_t m_extended_capabilities;

    shared_anqp_element_map m_anqp_elements;
};

std::ostream& operator<<(std::ostream& os, const hs20_network_detail& d);

template <>struct fmt::formatter<hs20_network_detail> : fmt::ostream_formatter {};

namespace std {
    template<> struct hash<hs20_network_detail> {
        std::size_t operator()(hs20_network_detail const& d) const noexcept {
            return d.hash();
        }
    };
}

#endif

