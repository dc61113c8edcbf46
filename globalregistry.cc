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

#include "globalregistry.h"
#include "messagebus.h"

static global_registry default_globalreg;

global_registry *Globalreg::globalreg = &default_globalreg;

global_registry::global_registry() :
    fatal_condition{false},
    hs20_config{nullptr} { }

void Globalreg::inject_message(const std::string& in_msg, int in_flags) {
    if (globalreg == nullptr)
        return;

    auto bus = globalreg->messagebus;

    if (bus == nullptr)
        return;

    bus->inject_message(in_msg, in_flags);
}

