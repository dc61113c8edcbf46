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

#ifndef __HS20_IE_SCAN_H__
#define __HS20_IE_SCAN_H__

/* Beacon IE scanner
 *
 * Walks a beacon / probe response IE buffer and hands each element we care
 * about to its parser.  The parsed elements are kept as-is; nothing here
 * interprets the SSID octets, since the text encoding depends on the extended
 * capabilities element which may come later in the buffer.
 *
 * Any structural failure (record overrun, an element with an impossible
 * shape) throws hs20_malformed_element and the scan holds nothing useful.
 * Unknown elements, and vendor elements other than the HS2.0 indication,
 * are skipped.
 *
 */

#include "config.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "dot11_parsers/dot11_ie.h"
#include "dot11_parsers/dot11_ie_11_qbss.h"
#include "dot11_parsers/dot11_ie_107_interworking.h"
#include "dot11_parsers/dot11_ie_111_roaming_consortium.h"
#include "dot11_parsers/dot11_ie_127_extended_capabilities.h"
#include "dot11_parsers/dot11_ie_221_hs20_indication.h"

#define IE_TAG_SSID     0

class hs20_ie_scan {
public:
    // tag number, tag length
    typedef std::pair<uint8_t, uint8_t> ie_record;

    hs20_ie_scan() :
        m_has_ssid{false} { }
    ~hs20_ie_scan() { }

    // Scan raw IE octets
    void parse(const std::string& data);

    bool has_ssid() const {
        return m_has_ssid;
    }

    const std::string& ssid_octets() const {
        return m_ssid_octets;
    }

    // True when the SSID octets are UTF-8 rather than ISO-8859-1
    bool ssid_utf8() const {
        return m_extended_capabilities != nullptr && m_extended_capabilities->utf8_ssid();
    }

    std::shared_ptr<dot11_ie_11_qbss> bss_load() const {
        return m_bss_load;
    }

    std::shared_ptr<dot11_ie_107_interworking> interworking() const {
        return m_interworking;
    }

    std::shared_ptr<dot11_ie_111_roaming_consortium> roaming_consortium() const {
        return m_roaming_consortium;
    }

    std::shared_ptr<dot11_ie_221_hs20_indication> hs20_indication() const {
        return m_hs20_indication;
    }

    std::shared_ptr<dot11_ie_127_extended> extended_capabilities() const {
        return m_extended_capabilities;
    }

    // Every record consumed, in buffer order
    const std::vector<ie_record>& records() const {
        return m_records;
    }

    void reset();

protected:
    void handle_tag(const dot11_ie::dot11_ie_tag& tag);
    void handle_vendor(const dot11_ie::dot11_ie_tag& tag);

    bool m_has_ssid;
    std::string m_ssid_octets;

    std::shared_ptr<dot11_ie_11_qbss> m_bss_load;
    std::shared_ptr<dot11_ie_107_interworking> m_interworking;
    std::shared_ptr<dot11_ie_111_roaming_consortium> m_roaming_consortium;
    std::shared_ptr<dot11_ie_221_hs20_indication> m_hs20_indication;
    std::shared_ptr<dot11_ie_127_extended> m_extended_capabilities;

    std::vector<ie_record> m_records;
};

#endif

