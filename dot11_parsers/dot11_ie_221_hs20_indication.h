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

#ifndef __DOT11_IE_221_HS20_INDICATION_H__
#define __DOT11_IE_221_HS20_INDICATION_H__

/* dot11 ie 221 WFA Hotspot 2.0 Indication
 *
 * Parsed from the vendor content after the WFA OUI and the HS2.0 indication
 * type:
 *
 *   u8  hotspot configuration
 *         bit 0     DGAF disabled
 *         bit 2     ANQP domain id present
 *         bits 4-7  release number
 *   u16 ANQP domain id (little endian, optional)
 *
 */

#include <string>
#include <memory>
#include <vector>
#include <kaitai/kaitaistream.h>

#include "hs20_types.h"

class dot11_ie_221_hs20_indication {
public:
    dot11_ie_221_hs20_indication() :
        m_hotspot_config{0},
        m_anqp_domain_id{-1} { }
    ~dot11_ie_221_hs20_indication() { }

    constexpr static uint32_t wfa_oui() {
        return 0x506F9A;
    }

    constexpr static uint8_t wfa_sub_hs20_indication() {
        return 16;
    }

    void parse(std::shared_ptr<kaitai::kstream> p_io);
    void parse(kaitai::kstream& p_io);
	void parse(const std::string& data);

    constexpr uint8_t hotspot_config() const {
        return m_hotspot_config;
    }

    constexpr bool dgaf_disabled() const {
        return m_hotspot_config & 0x01;
    }

    constexpr bool has_anqp_domain_id() const {
        return m_hotspot_config & 0x04;
    }

    // -1 when the domain id is not present
    constexpr int anqp_domain_id() const {
        return m_anqp_domain_id;
    }

    constexpr uint8_t release_num() const {
        return (m_hotspot_config >> 4) & 0x0F;
    }

    hs20_release release() const {
        return hs20_release_from_code(release_num());
    }

    void reset() {
        m_hotspot_config = 0;
        m_anqp_domain_id = -1;
    }

protected:
    uint8_t m_hotspot_config;
    int m_anqp_domain_id;
};


#endif

