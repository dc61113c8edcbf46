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

#include <stdio.h>

#include "messagebus.h"

void stdout_message_client::process_message(const std::string& in_msg, int in_flags) {
    if (in_flags & (MSGFLAG_ERROR | MSGFLAG_FATAL))
        fprintf(stderr, "ERROR: %s\n", in_msg.c_str());
    else if (in_flags & MSGFLAG_DEBUG)
        fprintf(stderr, "DEBUG: %s\n", in_msg.c_str());
    else
        fprintf(stdout, "NOTICE: %s\n", in_msg.c_str());
}

message_bus::message_bus() { }

message_bus::~message_bus() { }

void message_bus::inject_message(const std::string& in_msg, int in_flags) {
    // Recursive so a client may log from inside process_message
    std::lock_guard<std::recursive_mutex> lk(handler_mutex);

    for (const auto& sub : subscribers) {
        if (sub.mask & in_flags)
            sub.client->process_message(in_msg, in_flags);
    }
}

void message_bus::register_client(message_client *in_subscriber, int in_mask) {
    std::lock_guard<std::recursive_mutex> lk(handler_mutex);

    subscribers.push_back(busclient{in_subscriber, in_mask});
}

void message_bus::remove_client(message_client *in_unsubscriber) {
    std::lock_guard<std::recursive_mutex> lk(handler_mutex);

    for (unsigned int x = 0; x < subscribers.size(); x++) {
        if (subscribers[x].client == in_unsubscriber) {
            subscribers.erase(subscribers.begin() + x);
            return;
        }
    }
}

