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

#include "hs20_error.h"
#include "util.h"

#include "dot11_ie_111_roaming_consortium.h"

void dot11_ie_111_roaming_consortium::parse(std::shared_ptr<kaitai::kstream> p_io) {
    parse(*p_io);
}

void dot11_ie_111_roaming_consortium::parse(kaitai::kstream& p_io) {
    m_oi_list.clear();

    auto len = (int) p_io.size();

    if (len < 2)
        throw hs20_malformed_element(fmt::format("dot11_ie_111_roaming_consortium expected at "
                    "least 2 bytes, got {}", len));

    m_anqp_oi_count = p_io.read_u1();
    m_oi_lengths = p_io.read_u1();

    int oi3_len = len - 2 - oi1_len() - oi2_len();

    if (oi3_len < 0)
        throw hs20_malformed_element(fmt::format("dot11_ie_111_roaming_consortium OI lengths "
                    "{} and {} overrun the {} byte element", oi1_len(), oi2_len(), len));

    const unsigned int lengths[] = { oi1_len(), oi2_len(), (unsigned int) oi3_len };

    for (auto l : lengths) {
        if (l == 0)
            continue;

        m_oi_list.push_back(read_oi(p_io, l));
    }
}

void dot11_ie_111_roaming_consortium::parse(const std::string& data) {
	membuf d_membuf(data.data(), data.data() + data.length());
	std::istream is(&d_membuf);
	kaitai::kstream p_io(&is);

    parse(p_io);
}

uint64_t dot11_ie_111_roaming_consortium::read_oi(kaitai::kstream& p_io, unsigned int len) {
    uint64_t oi = 0;

    for (unsigned int x = 0; x < len; x++)
        oi = (oi << 8) | p_io.read_u1();

    return oi;
}
