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

#ifndef __HS20_DUMP_H__
#define __HS20_DUMP_H__

/* Batch decode of captured beacon IE strings, one record per line:
 *
 *   <bssid> <prefix>=<hex ie bytes>
 *
 * Blank lines and lines starting with '#' are ignored.  Each decoded record
 * prints its detail rendering, or only its network key, to the output stream;
 * rejected records are reported through the message bus.
 *
 * Config keys:
 *   output=detail|key
 *   stop_on_error=true|false
 *   input=<file>           (repeatable)
 *
 */

#include "config.h"

#include <iostream>
#include <string>
#include <vector>

class config_file;

class hs20_dump {
public:
    hs20_dump(std::ostream& in_out);
    ~hs20_dump() { }

    // Load output / stop_on_error / input from the config; throws
    // hs20_invalid_input on an unknown output mode
    void configure(config_file& in_conf);

    // Inputs named on the command line come before those from the config
    void add_input(const std::string& in_fname) {
        m_inputs.push_back(in_fname);
    }

    const std::vector<std::string>& inputs() const {
        return m_inputs;
    }

    bool key_output() const {
        return m_key_output;
    }

    bool stop_on_error() const {
        return m_stop_on_error;
    }

    // Decode every input in order; returns false if a rejected record stopped
    // the run under stop_on_error
    bool run();

    // Both return false if processing should stop
    bool dump_file(const std::string& in_fname);
    bool dump_stream(std::istream& in_stream, const std::string& in_name);

    unsigned int decoded() const {
        return m_decoded;
    }

    unsigned int rejected() const {
        return m_rejected;
    }

    std::string summary() const;

protected:
    // Returns false if processing should stop
    bool reject();

    std::ostream& m_out;

    bool m_key_output;
    bool m_stop_on_error;

    std::vector<std::string> m_inputs;

    unsigned int m_decoded;
    unsigned int m_rejected;
};

#endif

