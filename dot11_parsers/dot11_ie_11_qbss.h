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

#ifndef __DOT11_IE_11_QBSS_H__
#define __DOT11_IE_11_QBSS_H__

/* dot11 ie 11 BSS Load
 *
 * Station count and channel utilization reported by an AP, followed by the
 * available admission capacity.  Only the 5-byte 802.11e layout is accepted;
 * anything else throws hs20_malformed_element.
 *
 */

#include <string>
#include <memory>
#include <vector>
#include <kaitai/kaitaistream.h>

class dot11_ie_11_qbss {
public:
    dot11_ie_11_qbss() :
        m_station_count{0},
        m_channel_utilization{0},
        m_capacity{0} { }
    ~dot11_ie_11_qbss() { }

    constexpr static uint8_t ie_num() {
        return 11;
    }

    constexpr static uint8_t ie_len() {
        return 5;
    }

    void parse(std::shared_ptr<kaitai::kstream> p_io);
    void parse(kaitai::kstream& p_io);
	void parse(const std::string &data);

    constexpr uint16_t station_count() const {
        return m_station_count;
    }

    constexpr uint8_t channel_utilization() const {
        return m_channel_utilization;
    }

    constexpr uint16_t capacity() const {
        return m_capacity;
    }

    void reset() {
        m_station_count = 0;
        m_channel_utilization = 0;
        m_capacity = 0;
    }

protected:
    uint16_t m_station_count;
    uint8_t m_channel_utilization;
    uint16_t m_capacity;

};


#endif

