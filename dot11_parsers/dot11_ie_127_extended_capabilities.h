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

#ifndef __DOT11_IE_127_EXTENDED_CAPS_H__
#define __DOT11_IE_127_EXTENDED_CAPS_H__

/* dot11 ie 127 extended capabilities
 *
 * Variable length capability bitfield.  The first 8 octets are packed little
 * endian into a 64 bit value, so capability bit N is bit N of capabilities();
 * shorter elements are zero extended and octets past the 8th are dropped.
 *
 */

#include <string>
#include <memory>
#include <vector>
#include <kaitai/kaitaistream.h>

// SSID is UTF-8 encoded
#define DOT11_EXTCAP_UTF8_SSID      0x0001000000000000ULL
#define DOT11_EXTCAP_INTERWORKING   0x0000000080000000ULL

class dot11_ie_127_extended {
public:
    dot11_ie_127_extended() :
        m_capabilities{0},
        m_capability_len{0} { }
    ~dot11_ie_127_extended() { }

    constexpr static uint8_t ie_num() {
        return 127;
    }

    void parse(std::shared_ptr<kaitai::kstream> p_io);
    void parse(kaitai::kstream& p_io);
	void parse(const std::string& data);

    constexpr uint64_t capabilities() const {
        return m_capabilities;
    }

    // Octet count of the element as transmitted
    constexpr unsigned int capability_len() const {
        return m_capability_len;
    }

    constexpr bool truncated() const {
        return m_capability_len > 8;
    }

    // 0-based octet of the packed field
    constexpr uint8_t octet(unsigned int n) const {
        return n < 8 ? (uint8_t) (m_capabilities >> (n * 8)) : 0;
    }

    constexpr bool capability(unsigned int bit) const {
        return bit < 64 && ((m_capabilities >> bit) & 0x01);
    }

    constexpr bool interworking() const {
        return m_capabilities & DOT11_EXTCAP_INTERWORKING;
    }

    constexpr bool utf8_ssid() const {
        return m_capabilities & DOT11_EXTCAP_UTF8_SSID;
    }

    void reset() {
        m_capabilities = 0;
        m_capability_len = 0;
    }

protected:
    uint64_t m_capabilities;
    unsigned int m_capability_len;
};


#endif

