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

#ifndef __MESSAGEBUS_H__
#define __MESSAGEBUS_H__

#include "config.h"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "globalregistry.h"

// A subscriber to the message bus.  It subscribes with a mask of
// what messages it wants to handle
class message_client {
public:
    message_client() { }
	virtual ~message_client() { }

    virtual void process_message(const std::string& in_msg, int in_flags) = 0;
};

class stdout_message_client : public message_client {
public:
    stdout_message_client() { }
	virtual ~stdout_message_client() { }

    virtual void process_message(const std::string& in_msg, int in_flags) override;
};

// Messages are delivered synchronously on the injecting thread; the decoder
// never blocks on a dispatch queue
class message_bus {
public:
    static std::shared_ptr<message_bus> create_messagebus(global_registry *in_globalreg) {
        std::shared_ptr<message_bus> mon(new message_bus());
        in_globalreg->messagebus = mon;
        return mon;
    }

    message_bus();
    virtual ~message_bus();

    // Inject a message into the bus
    void inject_message(const std::string& in_msg, int in_flags);

    // Link a message display system
    void register_client(message_client *in_subscriber, int in_mask);
    void remove_client(message_client *in_unsubscriber);

protected:
    std::recursive_mutex handler_mutex;

    struct busclient {
        message_client *client;
        int mask;
    };

    std::vector<busclient> subscribers;
};

#endif

