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

#include "util.h"

#include "dot11_ie_127_extended_capabilities.h"

void dot11_ie_127_extended::parse(std::shared_ptr<kaitai::kstream> p_io) {
    parse(*p_io);
}

void dot11_ie_127_extended::parse(kaitai::kstream& p_io) {
    m_capability_len = (unsigned int) p_io.size();
    m_capabilities = 0;

    for (unsigned int x = 0; x < m_capability_len && x < 8; x++)
        m_capabilities |= ((uint64_t) p_io.read_u1()) << (x * 8);
}

void dot11_ie_127_extended::parse(const std::string& data) {
	membuf d_membuf(data.data(), data.data() + data.length());
	std::istream is(&d_membuf);
	kaitai::kstream p_io(&is);

    parse(p_io);
}

