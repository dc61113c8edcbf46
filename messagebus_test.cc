#include "config.h"

#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "globalregistry.h"
#include "messagebus.h"

namespace {

class capture_message_client : public message_client {
public:
    virtual void process_message(const std::string& in_msg, int in_flags) override {
        messages.push_back(std::make_pair(in_msg, in_flags));
    }

    std::vector<std::pair<std::string, int>> messages;
};

class messagebus_test : public ::testing::Test {
protected:
    void SetUp() override {
        saved_bus = Globalreg::globalreg->messagebus;
        bus = message_bus::create_messagebus(Globalreg::globalreg);
    }

    void TearDown() override {
        Globalreg::globalreg->messagebus = saved_bus;
        Globalreg::globalreg->fatal_condition = false;
    }

    std::shared_ptr<message_bus> saved_bus;
    std::shared_ptr<message_bus> bus;
};

}

TEST_F(messagebus_test, create_registers_with_globalreg) {
    EXPECT_EQ(bus, Globalreg::globalreg->messagebus);
}

TEST_F(messagebus_test, delivers_by_mask) {
    capture_message_client errors;
    capture_message_client everything;

    bus->register_client(&errors, MSGFLAG_ERROR);
    bus->register_client(&everything, MSGFLAG_ALL);

    _MSG_DEBUG("skipping tag {}", 48);
    _MSG_ERROR("bad record {}", 3);

    ASSERT_EQ(1u, errors.messages.size());
    EXPECT_EQ("bad record 3", errors.messages[0].first);
    EXPECT_EQ(MSGFLAG_ERROR, errors.messages[0].second);

    ASSERT_EQ(2u, everything.messages.size());
    EXPECT_EQ("skipping tag 48", everything.messages[0].first);
    EXPECT_EQ(MSGFLAG_DEBUG, everything.messages[0].second);

    bus->remove_client(&errors);
    bus->remove_client(&everything);
}

TEST_F(messagebus_test, removed_client_gets_nothing) {
    capture_message_client c;

    bus->register_client(&c, MSGFLAG_ALL);
    bus->remove_client(&c);

    _MSG_INFO("hello");

    EXPECT_TRUE(c.messages.empty());
}

TEST_F(messagebus_test, fatal_sets_condition) {
    capture_message_client c;
    bus->register_client(&c, MSGFLAG_FATAL);

    _MSG_FATAL("giving up on {}", "input");

    EXPECT_TRUE(Globalreg::globalreg->fatal_condition.load());
    ASSERT_EQ(1u, c.messages.size());
    EXPECT_EQ("giving up on input", c.messages[0].first);

    bus->remove_client(&c);
}

TEST(messagebus_nobus, messages_dropped_without_bus) {
    auto saved_bus = Globalreg::globalreg->messagebus;
    Globalreg::globalreg->messagebus.reset();

    _MSG_ERROR("nobody is listening");
    EXPECT_EQ(nullptr, Globalreg::globalreg->messagebus);

    Globalreg::globalreg->messagebus = saved_bus;
}

