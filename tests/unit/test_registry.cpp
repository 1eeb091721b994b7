/**
 * @file test_registry.cpp
 * @brief Unit tests for DeviceRegistry and the inventory stores.
 */

#include "registry/device_registry.hpp"
#include "registry/device_store.hpp"
#include "support/mock_fleet.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace fleetwatch;
using namespace fleetwatch::testing;

class RegistryTest : public ::testing::Test {
protected:
    MockProtocolClient client_;
    Logger logger_ = make_null_logger();
    DriverContext ctx_{client_, DriverConfig{}, logger_};
    DeviceRegistry registry_{ctx_};
};

TEST_F(RegistryTest, AddAndFind) {
    ASSERT_TRUE(registry_.add(make_device("sw-1", DeviceFamily::Switch, "10.0.0.20")).has_value());
    ASSERT_TRUE(registry_.add(make_device("ap-1", DeviceFamily::AccessPoint, "10.0.0.10")).has_value());

    EXPECT_EQ(registry_.size(), 2u);
    EXPECT_TRUE(registry_.contains("sw-1"));

    auto found = registry_.find("sw-1");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->address, "10.0.0.20");

    auto driver = registry_.driver("ap-1");
    ASSERT_TRUE(driver.has_value());
    EXPECT_EQ((*driver)->family(), DeviceFamily::AccessPoint);

    auto list = registry_.list();
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].id, "ap-1");
    EXPECT_EQ(list[1].id, "sw-1");
}

TEST_F(RegistryTest, RejectsDuplicateAndInvalid) {
    ASSERT_TRUE(registry_.add(make_device("sw-1", DeviceFamily::Switch, "10.0.0.20")).has_value());

    auto dup = registry_.add(make_device("sw-1", DeviceFamily::Switch, "10.0.0.21"));
    ASSERT_FALSE(dup.has_value());
    EXPECT_EQ(dup.error().code, ErrorCode::AlreadyExists);
    EXPECT_EQ(registry_.find("sw-1")->address, "10.0.0.20");

    EXPECT_EQ(registry_.add(make_device("", DeviceFamily::Switch, "10.0.0.1")).error().code,
              ErrorCode::InvalidArgument);
    EXPECT_EQ(registry_.add(make_device("bad id", DeviceFamily::Switch, "10.0.0.1")).error().code,
              ErrorCode::InvalidArgument);
    EXPECT_EQ(registry_.add(make_device("sw-2", DeviceFamily::Switch, "switch.local")).error().code,
              ErrorCode::InvalidArgument);
    EXPECT_EQ(registry_.size(), 1u);
}

TEST_F(RegistryTest, UpdateReplacesDriver) {
    ASSERT_TRUE(registry_.add(make_device("dev-1", DeviceFamily::AccessPoint, "10.0.0.10")).has_value());
    auto before = *registry_.driver("dev-1");

    auto replacement = make_device("dev-1", DeviceFamily::Switch, "10.0.0.30");
    ASSERT_TRUE(registry_.update(replacement).has_value());

    auto after = *registry_.driver("dev-1");
    EXPECT_EQ(after->family(), DeviceFamily::Switch);
    EXPECT_EQ(after->device().address, "10.0.0.30");
    // A poll holding the old driver keeps it alive and unchanged.
    EXPECT_EQ(before->device().address, "10.0.0.10");

    EXPECT_EQ(registry_.update(make_device("ghost", DeviceFamily::Switch, "10.0.0.1")).error().code,
              ErrorCode::UnknownDevice);
}

TEST_F(RegistryTest, RemoveDropsBackups) {
    seed_switch(client_, "10.0.0.20", 10, 10, 1);
    ASSERT_TRUE(registry_.add(make_device("sw-1", DeviceFamily::Switch, "10.0.0.20")).has_value());
    ASSERT_TRUE((*registry_.driver("sw-1"))->backup(registry_.backups()).has_value());
    EXPECT_EQ(registry_.backups().size(), 1u);

    ASSERT_TRUE(registry_.remove("sw-1").has_value());
    EXPECT_FALSE(registry_.contains("sw-1"));
    EXPECT_EQ(registry_.backups().size(), 0u);
    EXPECT_EQ(registry_.remove("sw-1").error().code, ErrorCode::UnknownDevice);
    EXPECT_EQ(registry_.find("sw-1").error().code, ErrorCode::UnknownDevice);
}

TEST_F(RegistryTest, EnabledDriversSkipsDisabled) {
    auto disabled = make_device("ap-2", DeviceFamily::AccessPoint, "10.0.0.11");
    disabled.enabled = false;
    ASSERT_TRUE(registry_.add(make_device("ap-1", DeviceFamily::AccessPoint, "10.0.0.10")).has_value());
    ASSERT_TRUE(registry_.add(disabled).has_value());

    auto drivers = registry_.enabled_drivers();
    ASSERT_EQ(drivers.size(), 1u);
    EXPECT_EQ(drivers[0]->device().id, "ap-1");
}

// ─────────────────────────────────────────────
// Stores
// ─────────────────────────────────────────────

class TomlDeviceStoreTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "fw_test_inventory";
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }
};

TEST_F(TomlDeviceStoreTest, MissingFileWritesDefaults) {
    TomlDeviceStore store(dir_ / "devices.toml");
    auto devices = store.load_devices();
    ASSERT_TRUE(devices.has_value()) << devices.error().message;

    ASSERT_EQ(devices->size(), 3u);
    EXPECT_EQ((*devices)[0].id, "aruba_ap_1");
    EXPECT_EQ((*devices)[2].family, DeviceFamily::Switch);
    EXPECT_TRUE(std::filesystem::exists(store.path()));

    auto reloaded = store.load_devices();
    ASSERT_TRUE(reloaded.has_value());
    EXPECT_EQ(reloaded->size(), 3u);
}

TEST_F(TomlDeviceStoreTest, SavePreservesEveryField) {
    auto device = make_device("sw-core", DeviceFamily::Switch, "10.1.0.2");
    device.display_name = "Core Switch";
    device.enabled = false;
    device.credentials.snmp_community = "monitor";
    device.credentials.ssh_user = "netops";

    TomlDeviceStore store(dir_ / "nested" / "devices.toml");
    ASSERT_TRUE(store.save_devices({device}).has_value());

    auto loaded = store.load_devices();
    ASSERT_TRUE(loaded.has_value());
    ASSERT_EQ(loaded->size(), 1u);
    const auto& back = loaded->front();
    EXPECT_EQ(back.id, "sw-core");
    EXPECT_EQ(back.display_name, "Core Switch");
    EXPECT_EQ(back.location, "Lab");
    EXPECT_FALSE(back.enabled);
    EXPECT_EQ(back.credentials.snmp_community, "monitor");
    EXPECT_EQ(back.credentials.ssh_user, "netops");
}

TEST_F(TomlDeviceStoreTest, AcceptsLegacyTypeNames) {
    std::filesystem::create_directories(dir_);
    std::ofstream(dir_ / "devices.toml") << R"(
        [[device]]
        id = "aruba_ap_9"
        family = "aruba_ap500"
        address = "192.168.1.99"
    )";

    TomlDeviceStore store(dir_ / "devices.toml");
    auto devices = store.load_devices();
    ASSERT_TRUE(devices.has_value());
    ASSERT_EQ(devices->size(), 1u);
    EXPECT_EQ(devices->front().family, DeviceFamily::AccessPoint);
    EXPECT_EQ(devices->front().display_name, "aruba_ap_9");
    EXPECT_TRUE(devices->front().enabled);
}

TEST_F(TomlDeviceStoreTest, ParseErrors) {
    std::filesystem::create_directories(dir_);
    std::ofstream(dir_ / "broken.toml") << "[[device]\nid = ";
    std::ofstream(dir_ / "unknown.toml") << "[[device]]\nid = \"r1\"\nfamily = \"router\"\naddress = \"10.0.0.1\"\n";
    std::ofstream(dir_ / "partial.toml") << "[[device]]\nid = \"r1\"\n";

    EXPECT_EQ(TomlDeviceStore(dir_ / "broken.toml").load_devices().error().code, ErrorCode::Parse);
    EXPECT_EQ(TomlDeviceStore(dir_ / "unknown.toml").load_devices().error().code, ErrorCode::Parse);
    EXPECT_EQ(TomlDeviceStore(dir_ / "partial.toml").load_devices().error().code, ErrorCode::Parse);
}

TEST(InMemoryDeviceStoreTest, CountsSaves) {
    InMemoryDeviceStore store({make_device("ap-1", DeviceFamily::AccessPoint, "10.0.0.10")});
    EXPECT_EQ(store.load_devices()->size(), 1u);
    EXPECT_EQ(store.save_count(), 0u);

    ASSERT_TRUE(store.save_devices({}).has_value());
    EXPECT_EQ(store.save_count(), 1u);
    EXPECT_TRUE(store.load_devices()->empty());
}
