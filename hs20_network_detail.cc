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

#include "config.h"

#include <sstream>

#include "globalregistry.h"
#include "hs20_error.h"
#include "hs20_ie_scan.h"
#include "hs20_network_detail.h"
#include "util.h"

hs20_network_detail::hs20_network_detail(const std::string& in_bssid,
        const std::string& in_ie_text, const std::vector<std::string> *in_anqp_lines,
        anqp_line_parser *in_anqp_parser) :
    m_has_ssid{false},
    m_hessid{0},
    m_station_count{0},
    m_channel_utilization{0},
    m_capacity{0},
    m_has_interworking{false},
    m_access_network_type{hs20_access_network_type::private_network},
    m_internet{false},
    m_has_venue{false},
    m_venue_group{anqp_venue_group::unspecified},
    m_venue_type{anqp_venue_type::unspecified},
    m_has_hs_release{false},
    m_hs_release{hs20_release::unknown},
    m_anqp_domain_id{-1},
    m_anqp_oi_count{0},
    m_has_roaming_consortium{false},
    m_has_extended_capabilities{false},
    m_extended_capabilities{0} {

    decode_ie_text(in_bssid, in_ie_text);

    if (in_anqp_lines != nullptr && in_anqp_parser != nullptr)
        m_anqp_elements = in_anqp_parser->parse(*in_anqp_lines);
    else if (in_anqp_lines != nullptr)
        _MSG_DEBUG("{} has {} ANQP lines but no ANQP parser, ignoring them",
                m_bssid, in_anqp_lines->size());

    if (m_anqp_elements == nullptr)
        m_anqp_elements = std::make_shared<anqp_element_map>();
}

hs20_network_detail::hs20_network_detail(const std::string& in_bssid,
        const std::string& in_ie_text) :
    hs20_network_detail(in_bssid, in_ie_text, nullptr, nullptr) { }

hs20_network_detail::hs20_network_detail(const hs20_network_detail& in_base,
        shared_anqp_element_map in_anqp_elements) :
    hs20_network_detail(in_base) {

    m_anqp_elements = in_anqp_elements;

    if (m_anqp_elements == nullptr)
        m_anqp_elements = std::make_shared<anqp_element_map>();
}

std::shared_ptr<hs20_network_detail> hs20_network_detail::complete(
        shared_anqp_element_map in_anqp_elements) const {
    return std::shared_ptr<hs20_network_detail>(new hs20_network_detail(*this, in_anqp_elements));
}

void hs20_network_detail::decode_ie_text(const std::string& in_bssid,
        const std::string& in_ie_text) {
    auto sep = in_ie_text.find('=');

    if (sep == std::string::npos)
        throw hs20_invalid_input(fmt::format("No element separator in IE string '{}'",
                    munge_to_printable(in_ie_text)));

    // The separator is checked before the address
    m_bssid.string2long(in_bssid);

    auto hex = in_ie_text.substr(sep + 1);

    if ((hex.length() % 2) != 0 || !is_hex_str(hex))
        throw hs20_invalid_input(fmt::format("IE string for {} is not an even length hex "
                    "string", m_bssid));

    hs20_ie_scan scan;
    scan.parse(hex_to_bytes(hex));

    if (scan.bss_load() != nullptr) {
        m_station_count = scan.bss_load()->station_count();
        m_channel_utilization = scan.bss_load()->channel_utilization();
        m_capacity = scan.bss_load()->capacity();
    }

    auto interworking = scan.interworking();

    if (interworking != nullptr) {
        m_has_interworking = true;
        m_access_network_type = interworking->access_network_type();
        m_internet = interworking->internet();
        m_hessid = interworking->hessid();

        if (interworking->has_venue()) {
            m_has_venue = true;
            m_venue_group = interworking->venue_group();
            m_venue_type = interworking->venue_type();
        }
    }

    auto rc = scan.roaming_consortium();

    if (rc != nullptr) {
        m_has_roaming_consortium = true;
        m_anqp_oi_count = rc->anqp_oi_count();
        m_roaming_consortium_ois = rc->oi_list();
    }

    auto hs20 = scan.hs20_indication();

    if (hs20 != nullptr) {
        m_has_hs_release = true;
        m_hs_release = hs20->release();
        m_anqp_domain_id = hs20->anqp_domain_id();
    }

    auto extcap = scan.extended_capabilities();

    if (extcap != nullptr) {
        m_has_extended_capabilities = true;
        m_extended_capabilities = extcap->capabilities();
    }

    // Encoding is only known once every element has been seen
    if (scan.has_ssid()) {
        m_has_ssid = true;

        if (scan.ssid_utf8()) {
            if (!is_valid_utf8(scan.ssid_octets()))
                _MSG_DEBUG("{} advertises a UTF-8 SSID which is not valid UTF-8, replacing "
                        "invalid sequences: {}", m_bssid, munge_to_printable(scan.ssid_octets()));

            m_ssid = utf8_sanitize(scan.ssid_octets());
        } else {
            m_ssid = latin1_to_utf8(scan.ssid_octets());
        }
    }
}

bool hs20_network_detail::is_ssid_utf8() const {
    return m_has_extended_capabilities && (m_extended_capabilities & DOT11_EXTCAP_UTF8_SSID);
}

std::string hs20_network_detail::key_string() const {
    return fmt::format("'{}':{}", m_ssid, bssid_string());
}

std::string hs20_network_detail::bssid_string() const {
    return m_bssid.mac_to_string();
}

std::string hs20_network_detail::as_string() const {
    std::stringstream ss;

    ss << "hs20_network_detail{ssid=";
    if (m_has_ssid)
        ss << "'" << m_ssid << "'";
    else
        ss << "none";

    ss << fmt::format(", hessid={:x}, bssid={:x}, station_count={}, channel_utilization={}, "
            "capacity={}", m_hessid, m_bssid.longmac, m_station_count,
            m_channel_utilization, m_capacity);

    ss << ", access_network_type=";
    if (m_has_interworking)
        ss << m_access_network_type;
    else
        ss << "none";

    ss << ", internet=" << (m_internet ? "true" : "false");

    if (m_has_venue)
        ss << ", venue_group=" << m_venue_group << ", venue_type=" << m_venue_type;
    else
        ss << ", venue_group=none, venue_type=none";

    ss << ", hs_release=";
    if (m_has_hs_release)
        ss << m_hs_release;
    else
        ss << "none";

    ss << fmt::format(", anqp_domain_id={}, anqp_oi_count={}", m_anqp_domain_id, m_anqp_oi_count);

    ss << ", roaming_consortiums=";
    if (m_has_roaming_consortium) {
        ss << "[";
        for (size_t i = 0; i < m_roaming_consortium_ois.size(); i++) {
            if (i > 0)
                ss << ", ";
            ss << fmt::format("{:x}", m_roaming_consortium_ois[i]);
        }
        ss << "]";
    } else {
        ss << "none";
    }

    ss << ", extended_capabilities=";
    if (m_has_extended_capabilities)
        ss << fmt::format("{:016x}", m_extended_capabilities);
    else
        ss << "none";

    ss << ", anqp_elements=" << m_anqp_elements->size() << "}";

    return ss.str();
}

bool hs20_network_detail::operator==(const hs20_network_detail& op) const {
    return m_has_ssid == op.m_has_ssid && m_ssid == op.m_ssid && m_bssid == op.m_bssid;
}

std::size_t hs20_network_detail::hash() const {
    return (std::hash<std::string>{}(m_ssid) * 31) + std::hash<mac_addr>{}(m_bssid);
}

std::ostream& operator<<(std::ostream& os, const hs20_network_detail& d) {
    os << d.as_string();
    return os;
}

