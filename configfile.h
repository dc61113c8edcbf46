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

#ifndef __CONFIGFILE_H__
#define __CONFIGFILE_H__

#include "config.h"

#include <map>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "util.h"

// Flat key=value configuration.  Keys are case-insensitive; a key may repeat,
// fetch_opt returns the first value and fetch_opt_vec returns all of them.
//
//   # comment
//   output=key
//   stop_on_error=true
//   include=/path/to/other.conf
//   somelist+=appended value
class config_file {
public:
	config_file();
    ~config_file();

    int parse_config(const char *in_fname);
    int parse_config(const std::string& in_fname) {
        return parse_config(in_fname.c_str());
    }

    std::string fetch_opt(const std::string& in_key);
    std::string fetch_opt_dfl(const std::string& in_key, const std::string& in_dfl);
    std::vector<std::string> fetch_opt_vec(const std::string& in_key);

	// Fetch a true/false t/f value with a default (ie value returned if not
	// equal to true, or missing.)
	int fetch_opt_bool(const std::string& in_key, int dvalue);

    // Fetch an opt as a dynamic type derived via '>>' assignment; will throw
    // std::runtime_error if the type can not be converted.  If the key is not found, the
    // default value is used.
    template<typename T>
    T fetch_opt_as(const std::string& in_key, const T& dvalue) {
        std::lock_guard<std::recursive_mutex> lk(config_locker);

        auto ki = config_map.find(str_lower(in_key));

        if (ki == config_map.end() || ki->second.size() == 0)
            return dvalue;

        std::stringstream ss(ki->second[0].value);
        T conv_value;
        ss >> conv_value;

        if (ss.fail())
            throw std::runtime_error(fmt::format("could not coerce content of key {}", in_key));

        return conv_value;
    }

	void set_opt(const std::string& in_key, const std::string& in_val);

protected:
    class config_entity {
    public:
        config_entity(const std::string& v, const std::string& sf) :
            value{v},
            sourcefile{sf} { }

        std::string value;
        std::string sourcefile;
    };

    int parse_config(const char *in_fname, unsigned int depth);

    std::string filename;

    std::map<std::string, std::vector<config_entity>> config_map;

    std::recursive_mutex config_locker;
};

#endif

