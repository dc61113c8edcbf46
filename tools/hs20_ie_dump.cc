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

/* Decode files of captured beacon IE strings, one per line:
 *
 *   <bssid> <prefix>=<hex ie bytes>
 *
 * Files may be named with -i, as bare arguments, or as input= in the config.
 */

#include "config.h"

#include <iostream>
#include <string>

#include <getopt.h>
#include <stdio.h>
#include <stdlib.h>

#include <fmt/format.h>

#include "configfile.h"
#include "globalregistry.h"
#include "hs20_dump.h"
#include "hs20_error.h"
#include "messagebus.h"

void print_help(char *argv) {
    printf("Hotspot 2.0 beacon IE decoder %s.%s.%s\n", VERSION_MAJOR, VERSION_MINOR, VERSION_TINY);
    printf("usage: %s [OPTION] [filename...]\n", argv);
    printf(" -i, --in [filename]          Input file of '<bssid> ie=<hex>' lines\n"
           " -c, --config [filename]      Config file\n"
           " -k, --key                    Print only the network key of each record\n"
           " -d, --debug                  Print decoder debug messages\n");
}

int main(int argc, char *argv[]) {
    static struct option longopt[] = {
        { "in", required_argument, 0, 'i' },
        { "config", required_argument, 0, 'c' },
        { "key", no_argument, 0, 'k' },
        { "debug", no_argument, 0, 'd' },
        { "help", no_argument, 0, 'h' },
        { 0, 0, 0, 0 }
    };

    int option_idx = 0;
    optind = 0;
    opterr = 0;

    hs20_dump dumper(std::cout);
    std::string config_fname;
    bool force_key = false;
    bool force_debug = false;

    while (1) {
        int r = getopt_long(argc, argv,
                            "-hi:c:kd", longopt, &option_idx);
        if (r < 0) break;

        if (r == 'h') {
            print_help(argv[0]);
            exit(1);
        } else if (r == 'i' || r == 1) {
            // Bare arguments are input files too
            dumper.add_input(std::string(optarg));
        } else if (r == 'c') {
            config_fname = std::string(optarg);
        } else if (r == 'k') {
            force_key = true;
        } else if (r == 'd') {
            force_debug = true;
        } else {
            fmt::print(stderr, "ERROR: Unknown option '{}'\n", argv[optind - 1]);
            print_help(argv[0]);
            exit(1);
        }
    }

    auto messagebus = message_bus::create_messagebus(Globalreg::globalreg);
    stdout_message_client stdout_client;

    config_file conf;
    Globalreg::globalreg->hs20_config = &conf;

    // Errors only until we know if debug output was asked for
    messagebus->register_client(&stdout_client, MSGFLAG_ERROR | MSGFLAG_FATAL);

    if (config_fname.length() > 0 && conf.parse_config(config_fname) < 0) {
        fmt::print(stderr, "ERROR: Could not load config file '{}'\n", config_fname);
        exit(1);
    }

    if (force_key)
        conf.set_opt("output", "key");
    if (force_debug)
        conf.set_opt("log_debug", "true");

    try {
        dumper.configure(conf);
    } catch (const hs20_invalid_input& e) {
        fmt::print(stderr, "ERROR: {}\n", e.what());
        exit(1);
    }

    messagebus->remove_client(&stdout_client);

    if (conf.fetch_opt_bool("log_debug", 0))
        messagebus->register_client(&stdout_client, MSGFLAG_ALL);
    else
        messagebus->register_client(&stdout_client, MSGFLAG_ALL & ~MSGFLAG_DEBUG);

    if (dumper.inputs().size() == 0) {
        fmt::print(stderr, "ERROR: Expected --in [filename] or input= in the config file\n");
        exit(1);
    }

    bool completed = dumper.run();

    fmt::print(stderr, "{}\n", dumper.summary());

    Globalreg::globalreg->hs20_config = nullptr;
    messagebus->remove_client(&stdout_client);

    if (!completed)
        return 1;

    return 0;
}

