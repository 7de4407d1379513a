#include <gtest/gtest.h>
#include "device/PortForwardTable.hpp"
#include "device/ResourceRegistry.hpp"
#include "device/DeviceIdentity.hpp"
#include "simulator/SimulatedTransport.hpp"

using namespace droidlink;

namespace {

struct ForwardFixture : public ::testing::Test {
    void SetUp() override {
        sim = std::make_shared<SimulatedTransport>(7);
        sim->add_device("127.0.0.1:16384");
        client = sim->connect(parse_address("127.0.0.1:16384"));
        table = std::make_unique<PortForwardTable>(client, resources);
    }

    std::shared_ptr<SimulatedTransport> sim;
    std::shared_ptr<CommandClient> client;
    ResourceRegistry resources;
    std::unique_ptr<PortForwardTable> table;
};

} // namespace

TEST_F(ForwardFixture, ForwardIsDeduplicatedPerRemote) {
    uint16_t first = table->forward("tcp:7912");
    uint16_t second = table->forward("tcp:7912");
    EXPECT_EQ(first, second);
    EXPECT_EQ(sim->count("forward "), 1u);
    EXPECT_EQ(table->size(), 1u);
    EXPECT_EQ(resources.size(), 1u);

    uint16_t other = table->forward("localabstract:minitouch");
    EXPECT_NE(first, other);
    EXPECT_EQ(sim->count("forward "), 2u);
}

TEST_F(ForwardFixture, ReverseIsDeduplicatedPerRemote) {
    table->reverse("tcp:7912", "tcp:7912");
    table->reverse("tcp:7912", "tcp:8000");
    EXPECT_EQ(sim->count("reverse "), 1u);
    auto list = table->list();
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].direction, ForwardDirection::Reverse);
    EXPECT_EQ(list[0].local, "tcp:7912");
}

TEST_F(ForwardFixture, SameRemoteDifferentDirectionsAreDistinct) {
    table->forward("tcp:7912");
    table->reverse("tcp:7912", "tcp:7912");
    EXPECT_EQ(table->size(), 2u);
}

TEST_F(ForwardFixture, RegistryAndRemoveAllTogetherRemoveOnce) {
    table->forward("tcp:7912");
    table->reverse("tcp:9000", "tcp:9000");

    EXPECT_TRUE(resources.release_all().empty());
    EXPECT_TRUE(table->remove_all().empty());

    EXPECT_EQ(sim->count("remove_forward "), 2u);
    EXPECT_TRUE(sim->live_mappings().empty());
    EXPECT_EQ(table->size(), 0u);
}

TEST_F(ForwardFixture, RemoveAllFirstThenRegistryIsNoOp) {
    table->forward("tcp:7912");
    EXPECT_TRUE(table->remove_all().empty());
    EXPECT_TRUE(resources.release_all().empty());
    EXPECT_EQ(sim->count("remove_forward "), 1u);
}

TEST_F(ForwardFixture, RemoveUnknownIsNoOp) {
    table->remove(ForwardDirection::Forward, "tcp:1234");
    EXPECT_EQ(sim->count("remove_forward "), 0u);
}

TEST_F(ForwardFixture, RemoveAllCollectsFailures) {
    table->forward("tcp:7912");
    table->forward("tcp:7913");
    sim->fail_remove_forward(true);
    auto failures = table->remove_all();
    EXPECT_EQ(failures.size(), 2u);
    EXPECT_EQ(table->size(), 0u);
}
