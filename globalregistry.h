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

#ifndef __GLOBALREGISTRY_H__
#define __GLOBALREGISTRY_H__

#include "config.h"

#include <atomic>
#include <memory>
#include <string>

#include <fmt/format.h>

// Pre-defs for all the things we point to
class message_bus;
class config_file;

// Message flags for queuing data
#define MSGFLAG_NONE    0
#define MSGFLAG_DEBUG   1
#define MSGFLAG_INFO    2
#define MSGFLAG_ERROR   4
#define MSGFLAG_ALERT   8
#define MSGFLAG_FATAL   16
#define MSGFLAG_ALL     (MSGFLAG_DEBUG | MSGFLAG_INFO | \
                         MSGFLAG_ERROR | MSGFLAG_ALERT | \
                         MSGFLAG_FATAL)

// Global registry of the process-wide services: the message bus the parsers
// log through and the loaded configuration.  Library consumers which never
// create a bus simply lose the log output.
class global_registry {
public:
    global_registry();

    // Fatal terminate condition, set by _MSG_FATAL
    std::atomic<bool> fatal_condition;

    std::shared_ptr<message_bus> messagebus;
    config_file *hs20_config;
};

namespace Globalreg {
    extern global_registry *globalreg;

    // Inject into the registered bus, if there is one
    void inject_message(const std::string& in_msg, int in_flags);
}

// fmt-enabled msgbus
#define _MSG_DEBUG(...) \
    Globalreg::inject_message(fmt::format(__VA_ARGS__), MSGFLAG_DEBUG)

#define _MSG_INFO(...) \
    Globalreg::inject_message(fmt::format(__VA_ARGS__), MSGFLAG_INFO)

#define _MSG_ERROR(...) \
    Globalreg::inject_message(fmt::format(__VA_ARGS__), MSGFLAG_ERROR)

#define _MSG_FATAL(...) \
    { Globalreg::inject_message(fmt::format(__VA_ARGS__), MSGFLAG_FATAL); \
      Globalreg::globalreg->fatal_condition = true; }

#endif

