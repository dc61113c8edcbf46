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

#ifndef __DOT11_IE_111_ROAMING_CONSORTIUM_H__
#define __DOT11_IE_111_ROAMING_CONSORTIUM_H__

/* dot11 ie 111 Roaming Consortium
 *
 * Count of further OIs available over ANQP, a packed pair of OI lengths, and
 * up to three OIs.  The third OI takes whatever remains of the element.
 *
 *   u8  anqp oi count
 *   u8  oi1 len (bits 0-3), oi2 len (bits 4-7)
 *   oi1, oi2, oi3 (big endian)
 *
 * An OI wider than 8 bytes keeps its low 64 bits.
 *
 */

#include <string>
#include <memory>
#include <vector>
#include <kaitai/kaitaistream.h>

class dot11_ie_111_roaming_consortium {
public:
    dot11_ie_111_roaming_consortium() :
        m_anqp_oi_count{0},
        m_oi_lengths{0} { }
    ~dot11_ie_111_roaming_consortium() { }

    constexpr static uint8_t ie_num() {
        return 111;
    }

    void parse(std::shared_ptr<kaitai::kstream> p_io);
    void parse(kaitai::kstream& p_io);
	void parse(const std::string& data);

    constexpr uint8_t anqp_oi_count() const {
        return m_anqp_oi_count;
    }

    constexpr uint8_t oi1_len() const {
        return m_oi_lengths & 0x0F;
    }

    constexpr uint8_t oi2_len() const {
        return (m_oi_lengths >> 4) & 0x0F;
    }

    // OIs in element order, one per non-zero length
    const std::vector<uint64_t>& oi_list() const {
        return m_oi_list;
    }

    void reset() {
        m_anqp_oi_count = 0;
        m_oi_lengths = 0;
        m_oi_list.clear();
    }

protected:
    uint64_t read_oi(kaitai::kstream& p_io, unsigned int len);

    uint8_t m_anqp_oi_count;
    uint8_t m_oi_lengths;
    std::vector<uint64_t> m_oi_list;
};


#endif

