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

#ifndef __DOT11_IE_221_VENDOR_H__
#define __DOT11_IE_221_VENDOR_H__

/* dot11 ie 221
 *
 * Generic IE221 Vendor parser used to prep tags for consumption by other
 * parsers: 3 byte OUI, 1 byte vendor type, and the vendor content
 *
 */

#include <string>
#include <memory>
#include <vector>
#include <kaitai/kaitaistream.h>

class dot11_ie_221_vendor {
public:
    dot11_ie_221_vendor() :
        m_vendor_oui_type{0} { }
    ~dot11_ie_221_vendor() { }

    constexpr static uint8_t ie_num() {
        return 221;
    }

    void parse(std::shared_ptr<kaitai::kstream> p_io);
    void parse(kaitai::kstream& p_io);
	void parse(const std::string& data);

    const std::string& vendor_oui() const {
        return m_vendor_oui;
    }

    uint32_t vendor_oui_int() const {
        return (uint32_t) (
                ((uint8_t) m_vendor_oui[0] << 16) +
                ((uint8_t) m_vendor_oui[1] << 8) +
                ((uint8_t) m_vendor_oui[2]));
    }

    constexpr uint8_t vendor_oui_type() const {
        return m_vendor_oui_type;
    }

    // Content following the OUI and type
    const std::string& vendor_tag() const {
        return m_vendor_tag;
    }

    void reset() {
        m_vendor_oui = "";
        m_vendor_oui_type = 0;
        m_vendor_tag = "";
    }

protected:
    std::string m_vendor_oui;
    uint8_t m_vendor_oui_type;
    std::string m_vendor_tag;
};


#endif

