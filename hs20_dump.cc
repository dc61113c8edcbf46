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

#include <fstream>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include "configfile.h"
#include "globalregistry.h"
#include "hs20_dump.h"
#include "hs20_error.h"
#include "hs20_network_detail.h"
#include "util.h"

hs20_dump::hs20_dump(std::ostream& in_out) :
    m_out{in_out},
    m_key_output{false},
    m_stop_on_error{false},
    m_decoded{0},
    m_rejected{0} { }

void hs20_dump::configure(config_file& in_conf) {
    auto output = str_lower(in_conf.fetch_opt_dfl("output", "detail"));

    if (output == "key")
        m_key_output = true;
    else if (output == "detail")
        m_key_output = false;
    else
        throw hs20_invalid_input(fmt::format("Unknown output '{}', expected 'detail' or 'key'",
                    munge_to_printable(output)));

    m_stop_on_error = in_conf.fetch_opt_bool("stop_on_error", 0);

    for (const auto& f : in_conf.fetch_opt_vec("input"))
        m_inputs.push_back(f);
}

bool hs20_dump::run() {
    for (const auto& f : m_inputs) {
        if (!dump_file(f))
            return false;
    }

    return true;
}

bool hs20_dump::reject() {
    m_rejected++;
    return !m_stop_on_error;
}

bool hs20_dump::dump_file(const std::string& in_fname) {
    std::ifstream ifs(in_fname);

    if (!ifs.is_open()) {
        _MSG_ERROR("Unable to open input file '{}'", in_fname);
        return reject();
    }

    return dump_stream(ifs, in_fname);
}

bool hs20_dump::dump_stream(std::istream& in_stream, const std::string& in_name) {
    std::string line;
    unsigned int lineno = 0;

    while (std::getline(in_stream, line)) {
        lineno++;

        auto stripped = str_strip(line);

        if (stripped.length() == 0 || stripped[0] == '#')
            continue;

        auto fields = str_tokenize(stripped, " \t");

        if (fields.size() != 2) {
            _MSG_ERROR("{}:{}: expected '<bssid> <prefix>=<hex>', got {} fields",
                    in_name, lineno, fields.size());

            if (!reject())
                return false;

            continue;
        }

        try {
            hs20_network_detail detail(fields[0], fields[1]);

            if (m_key_output)
                fmt::print(m_out, "{}\n", detail.key_string());
            else
                fmt::print(m_out, "{}\n", detail.as_string());

            m_decoded++;
        } catch (const hs20_exception& e) {
            _MSG_ERROR("{}:{}: {}", in_name, lineno, e.what());

            if (!reject())
                return false;
        }
    }

    return true;
}

std::string hs20_dump::summary() const {
    return fmt::format("{} records decoded, {} rejected", m_decoded, m_rejected);
}

