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

#include "dot11_ie_221_vendor.h"

void dot11_ie_221_vendor::parse(std::shared_ptr<kaitai::kstream> p_io) {
    parse(*p_io);
}

void dot11_ie_221_vendor::parse(kaitai::kstream& p_io) {
    if (p_io.size() < 4)
        throw hs20_malformed_element(fmt::format("dot11_ie_221_vendor expected at least 4 "
                    "bytes of OUI and type, got {}", p_io.size()));

    m_vendor_oui = p_io.read_bytes(3);
    m_vendor_oui_type = p_io.read_u1();
    m_vendor_tag = p_io.read_bytes_full();
}

void dot11_ie_221_vendor::parse(const std::string& data) {
	membuf d_membuf(data.data(), data.data() + data.length());
	std::istream is(&d_membuf);
	kaitai::kstream p_io(&is);

    parse(p_io);
}

