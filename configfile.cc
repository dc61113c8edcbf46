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

#include <string>
#include <ctype.h>
#include <stdlib.h>
#include <stdio.h>
#include <errno.h>
#include <stdexcept>

#include "util.h"

#include "configfile.h"
#include "globalregistry.h"

#define CONFIG_INCLUDE_DEPTH_MAX    8

config_file::config_file() {
}

config_file::~config_file() {
}

int config_file::parse_config(const char *in_fname) {
    return parse_config(in_fname, 0);
}

int config_file::parse_config(const char *in_fname, unsigned int depth) {
    std::lock_guard<std::recursive_mutex> lk(config_locker);

    FILE *configf;
    char confline[8192];

    if (depth > CONFIG_INCLUDE_DEPTH_MAX) {
        _MSG_ERROR("Config file '{}' nested too deeply in includes, is there an "
                "include loop?", in_fname);
        return -1;
    }

    if ((configf = fopen(in_fname, "r")) == NULL) {
        _MSG_ERROR("Error reading config file '{}': {}", in_fname,
                hs20_strerror_r(errno));

        return -1;
    }

    if (depth == 0)
        filename = in_fname;

    int lineno = 0;
    while (!feof(configf)) {
        if (fgets(confline, 8192, configf) == NULL)
            break;

        lineno++;

        std::string parsestr = str_strip(confline);
        std::string directive, value;

        if (parsestr.length() == 0)
            continue;
        if (parsestr[0] == '#')
            continue;

        auto eq = parsestr.find("=");

        if (eq == std::string::npos || eq == 0) {
            _MSG_ERROR("Illegal config option in '{}' line {}: {}", in_fname, lineno, parsestr);
            continue;
        }

        // '+=' appends exactly like a repeated key
        if (parsestr[eq - 1] == '+')
            directive = str_strip(parsestr.substr(0, eq - 1));
        else
            directive = str_strip(parsestr.substr(0, eq));

        value = str_strip(parsestr.substr(eq + 1, parsestr.length()));

        if (value == "" || directive == "") {
            _MSG_ERROR("Illegal config option in '{}' line {}: {}", in_fname, lineno, parsestr);
            continue;
        }

        if (directive == "include") {
            _MSG_INFO("Including sub-config file: {}", value);

            if (parse_config(value.c_str(), depth + 1) < 0) {
                fclose(configf);
                return -1;
            }
        } else {
            config_map[str_lower(directive)].push_back(config_entity(value, in_fname));
        }
    }

    fclose(configf);

    return 1;
}

std::string config_file::fetch_opt(const std::string& in_key) {
    std::lock_guard<std::recursive_mutex> lk(config_locker);

    auto cmitr = config_map.find(str_lower(in_key));

    // No such key
    if (cmitr == config_map.end())
        return "";

    if (cmitr->second.size() == 0)
        return "";

    return cmitr->second[0].value;
}

std::string config_file::fetch_opt_dfl(const std::string& in_key, const std::string& in_dfl) {
    std::string r = fetch_opt(in_key);

    if (r.length() == 0)
        return in_dfl;

    return r;
}

std::vector<std::string> config_file::fetch_opt_vec(const std::string& in_key) {
    std::lock_guard<std::recursive_mutex> lk(config_locker);

    std::vector<std::string> eretvec;

    auto cmitr = config_map.find(str_lower(in_key));

    if (cmitr == config_map.end())
        return eretvec;

    for (const auto& e : cmitr->second)
        eretvec.push_back(e.value);

    return eretvec;
}

int config_file::fetch_opt_bool(const std::string& in_key, int dvalue) {
    std::string v = str_lower(fetch_opt(in_key));

    int r = string_to_bool(v);

    if (r == -1)
        return dvalue;

    return r;
}

void config_file::set_opt(const std::string& in_key, const std::string& in_val) {
    std::lock_guard<std::recursive_mutex> lk(config_locker);

    std::vector<config_entity> v;
    v.push_back(config_entity(in_val, "::dynamic::"));
    config_map[str_lower(in_key)] = v;
}

