#include <gtest/gtest.h>

#include "fake_system.hpp"
#include "infrastructure/link_manager.hpp"
#include "test_support.hpp"

using aprelay::infrastructure::LinkManager;
using aprelay::testing::FakeSystem;

class LinkManagerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        aprelay::testing::quiet_logging();
        host.add_interface("eth0");
        host.add_interface("wlan0");
    }

    FakeSystem host;
    LinkManager manager{host};
};

TEST_F(LinkManagerTest, InterfaceExists)
{
    EXPECT_TRUE(manager.interface_exists("wlan0"));
    EXPECT_FALSE(manager.interface_exists("wlan1"));
    EXPECT_FALSE(manager.interface_exists(""));
}

TEST_F(LinkManagerTest, AddressesAreParsedFromOneLineOutput)
{
    host.interfaces["wlan0"].addresses = {"192.168.50.1/24", "10.0.0.5/8"};

    auto addresses = manager.ipv4_addresses("wlan0");
    ASSERT_EQ(addresses.size(), 2u);
    EXPECT_EQ(addresses[0], "192.168.50.1/24");
    EXPECT_EQ(addresses[1], "10.0.0.5/8");

    EXPECT_TRUE(manager.has_address("wlan0", "192.168.50.1"));
    EXPECT_FALSE(manager.has_address("wlan0", "192.168.50.10"));
    EXPECT_FALSE(manager.has_address("eth0", "192.168.50.1"));
}

TEST_F(LinkManagerTest, AddAndRemoveAddress)
{
    EXPECT_TRUE(manager.add_address("wlan0", "192.168.50.1/24"));
    EXPECT_FALSE(manager.add_address("wlan0", "192.168.50.1/24"));
    EXPECT_TRUE(manager.has_address("wlan0", "192.168.50.1"));

    EXPECT_TRUE(manager.remove_address("wlan0", "192.168.50.1/24"));
    EXPECT_FALSE(manager.remove_address("wlan0", "192.168.50.1/24"));
    EXPECT_TRUE(host.interfaces["wlan0"].addresses.empty());
}

TEST_F(LinkManagerTest, AccessPointMode)
{
    EXPECT_FALSE(manager.is_access_point_mode("wlan0"));
    host.interfaces["wlan0"].ap_mode = true;
    EXPECT_TRUE(manager.is_access_point_mode("wlan0"));

    host.supports_iw = false;
    EXPECT_FALSE(manager.is_access_point_mode("wlan0"));
}

TEST_F(LinkManagerTest, AddressSummaryIsTruncated)
{
    host.interfaces["wlan0"].addresses = {"192.168.50.1/24"};

    auto summary = manager.address_summary("wlan0", 2);
    EXPECT_NE(summary.find("wlan0: <BROADCAST"), std::string::npos);
    EXPECT_NE(summary.find("link/ether"), std::string::npos);
    EXPECT_EQ(summary.find("inet "), std::string::npos);

    EXPECT_EQ(manager.address_summary("wlan9", 4), "Interface wlan9 not available\n");
}

TEST_F(LinkManagerTest, LinkUpAndForwarding)
{
    EXPECT_TRUE(manager.set_link_up("wlan0"));
    EXPECT_TRUE(host.interfaces["wlan0"].up);

    EXPECT_TRUE(manager.enable_ip_forwarding());
    EXPECT_TRUE(host.ip_forward);
}
