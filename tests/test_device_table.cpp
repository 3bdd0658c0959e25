// =============================================================================
// Unit tests for DeviceTable (debounced device presence)
// =============================================================================
#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <vector>
#include "device_table.hpp"

using namespace pilot;

namespace {

Device makeDevice(const std::string& id, DeviceState state = DeviceState::Online) {
    Device d;
    d.id = id;
    d.transport = classifyTransport(id);
    d.label = defaultLabel(id);
    d.state = state;
    return d;
}

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace

TEST(DeviceTableTest, NewDevicesAreAdded) {
    DeviceTable table(2);
    auto delta = table.apply({makeDevice("A"), makeDevice("B")});

    EXPECT_EQ(delta.added, (std::vector<std::string>{"A", "B"}));
    EXPECT_TRUE(delta.disconnected.empty());
    EXPECT_EQ(table.size(), 2u);
    EXPECT_TRUE(table.isOnline("A"));
}

TEST(DeviceTableTest, SingleMissedPollIsNotADisconnect) {
    DeviceTable table(2);
    table.apply({makeDevice("A")});

    auto delta = table.apply({});
    EXPECT_TRUE(contains(delta.missing, "A"));
    EXPECT_TRUE(delta.disconnected.empty());
    EXPECT_TRUE(table.disconnectedIds().empty());
    // Present in the table but not usable for a new session
    EXPECT_TRUE(table.contains("A"));
    EXPECT_FALSE(table.isOnline("A"));
}

TEST(DeviceTableTest, DisconnectAfterDebounceTicks) {
    DeviceTable table(2);
    table.apply({makeDevice("A")});
    table.apply({});
    auto delta = table.apply({});

    EXPECT_EQ(delta.disconnected, (std::vector<std::string>{"A"}));
    EXPECT_EQ(table.disconnectedIds(), (std::vector<std::string>{"A"}));

    // Reported once, not on every following tick
    auto later = table.apply({});
    EXPECT_TRUE(later.disconnected.empty());
}

TEST(DeviceTableTest, FlickerResetsTheCounter) {
    DeviceTable table(2);
    table.apply({makeDevice("A")});
    table.apply({});
    auto back = table.apply({makeDevice("A")});
    EXPECT_TRUE(contains(back.reappeared, "A"));
    EXPECT_TRUE(table.isOnline("A"));

    auto miss = table.apply({});
    EXPECT_TRUE(miss.disconnected.empty());
    EXPECT_TRUE(table.disconnectedIds().empty());
}

TEST(DeviceTableTest, DebounceOfOneDisconnectsImmediately) {
    DeviceTable table(1);
    table.apply({makeDevice("A")});
    auto delta = table.apply({});
    EXPECT_EQ(delta.disconnected, (std::vector<std::string>{"A"}));
}

TEST(DeviceTableTest, NonPositiveDebounceIsClampedToOne) {
    DeviceTable table(0);
    EXPECT_EQ(table.debounceTicks(), 1);
}

TEST(DeviceTableTest, StateChangeIsReported) {
    DeviceTable table(2);
    table.apply({makeDevice("A", DeviceState::Unauthorized)});
    EXPECT_FALSE(table.isOnline("A"));

    auto delta = table.apply({makeDevice("A", DeviceState::Online)});
    EXPECT_EQ(delta.changed, (std::vector<std::string>{"A"}));
    EXPECT_TRUE(table.isOnline("A"));
}

TEST(DeviceTableTest, RemoveAndRecordsAreOrderedById) {
    DeviceTable table(2);
    table.apply({makeDevice("C"), makeDevice("A"), makeDevice("B")});

    auto records = table.records();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].device.id, "A");
    EXPECT_EQ(records[2].device.id, "C");

    EXPECT_TRUE(table.remove("B"));
    EXPECT_FALSE(table.remove("B"));
    records = table.records();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1].device.id, "C");
}

TEST(DeviceTableTest, RemovedDeviceComesBackAsNew) {
    DeviceTable table(1);
    table.apply({makeDevice("A")});
    table.apply({});
    table.remove("A");

    auto delta = table.apply({makeDevice("A")});
    EXPECT_EQ(delta.added, (std::vector<std::string>{"A"}));
    EXPECT_TRUE(delta.reappeared.empty());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
