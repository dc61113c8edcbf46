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

#include "dot11_ie.h"

void dot11_ie::parse(std::shared_ptr<kaitai::kstream> p_io) {
    parse(*p_io);
}

void dot11_ie::parse(kaitai::kstream& p_io) {
    m_tags->clear();

    while (!p_io.is_eof()) {
        auto tag = std::make_shared<dot11_ie_tag>();
        tag->parse(p_io);
        m_tags->push_back(tag);
    }
}

void dot11_ie::parse(const std::string& data) {
	membuf d_membuf(data.data(), data.data() + data.length());
	std::istream is(&d_membuf);
	kaitai::kstream p_io(&is);

    parse(p_io);
}

void dot11_ie::dot11_ie_tag::parse(kaitai::kstream& p_io) {
    auto offt = p_io.pos();

    m_tag_num = p_io.read_u1();

    if (p_io.is_eof())
        throw hs20_malformed_element(fmt::format("IE record at offset {} truncated after "
                    "tag {}, no length byte", offt, m_tag_num));

    m_tag_len = p_io.read_u1();

    auto remaining = p_io.size() - p_io.pos();

    if (m_tag_len > remaining)
        throw hs20_malformed_element(fmt::format("IE tag {} at offset {} claims {} bytes but "
                    "only {} remain", m_tag_num, offt, m_tag_len, remaining));

    m_tag_data = p_io.read_bytes(m_tag_len);
}

