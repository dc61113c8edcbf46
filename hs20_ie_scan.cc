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

#include "config.h"

#include <fmt/format.h>

#include "globalregistry.h"
#include "hs20_error.h"
#include "hs20_ie_scan.h"
#include "util.h"

#include "dot11_parsers/dot11_ie_221_vendor.h"

void hs20_ie_scan::reset() {
    m_has_ssid = false;
    m_ssid_octets = "";

    m_bss_load.reset();
    m_interworking.reset();
    m_roaming_consortium.reset();
    m_hs20_indication.reset();
    m_extended_capabilities.reset();

    m_records.clear();
}

void hs20_ie_scan::parse(const std::string& data) {
    reset();

    try {
        dot11_ie ie_tags;
        ie_tags.parse(data);

        for (const auto& ie_tag : *(ie_tags.tags())) {
            m_records.push_back(ie_record(ie_tag->tag_num(), ie_tag->tag_len()));
            handle_tag(*ie_tag);
        }
    } catch (const hs20_exception&) {
        reset();
        throw;
    } catch (const std::exception& e) {
        // Reader failures from the kaitai stream
        reset();
        throw hs20_malformed_element(fmt::format("IE stream corrupt: {}", e.what()));
    }
}

void hs20_ie_scan::handle_tag(const dot11_ie::dot11_ie_tag& tag) {
    switch (tag.tag_num()) {
        case IE_TAG_SSID:
            if (m_has_ssid)
                _MSG_DEBUG("Multiple SSID elements, replacing '{}' with '{}'",
                        munge_to_printable(m_ssid_octets), munge_to_printable(tag.tag_data()));

            m_has_ssid = true;
            m_ssid_octets = tag.tag_data();
            break;

        case dot11_ie_11_qbss::ie_num(): {
            auto qbss = std::make_shared<dot11_ie_11_qbss>();
            qbss->parse(tag.tag_data());
            m_bss_load = qbss;
            break;
        }

        case dot11_ie_107_interworking::ie_num(): {
            auto interworking = std::make_shared<dot11_ie_107_interworking>();
            interworking->parse(tag.tag_data());
            m_interworking = interworking;
            break;
        }

        case dot11_ie_111_roaming_consortium::ie_num(): {
            auto rc = std::make_shared<dot11_ie_111_roaming_consortium>();
            rc->parse(tag.tag_data());
            m_roaming_consortium = rc;
            break;
        }

        case dot11_ie_127_extended::ie_num(): {
            auto extcap = std::make_shared<dot11_ie_127_extended>();
            extcap->parse(tag.tag_data());

            if (extcap->truncated())
                _MSG_DEBUG("Extended capabilities element is {} bytes, only the first 8 "
                        "are kept", extcap->capability_len());

            m_extended_capabilities = extcap;
            break;
        }

        case dot11_ie_221_vendor::ie_num():
            handle_vendor(tag);
            break;

        default:
            _MSG_DEBUG("Skipping IE tag {} ({} bytes)", tag.tag_num(), tag.tag_len());
            break;
    }
}

void hs20_ie_scan::handle_vendor(const dot11_ie::dot11_ie_tag& tag) {
    // OUI, type and at least the hotspot configuration byte
    if (tag.tag_len() < 5) {
        _MSG_DEBUG("Skipping short vendor IE ({} bytes)", tag.tag_len());
        return;
    }

    dot11_ie_221_vendor vendor;
    vendor.parse(tag.tag_data());

    if (vendor.vendor_oui_int() != dot11_ie_221_hs20_indication::wfa_oui() ||
            vendor.vendor_oui_type() != dot11_ie_221_hs20_indication::wfa_sub_hs20_indication()) {
        _MSG_DEBUG("Skipping vendor IE {:06x} type {}", vendor.vendor_oui_int(),
                vendor.vendor_oui_type());
        return;
    }

    auto hs20 = std::make_shared<dot11_ie_221_hs20_indication>();
    hs20->parse(vendor.vendor_tag());
    m_hs20_indication = hs20;
}

