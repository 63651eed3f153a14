/*
 * test_driver_loader.cpp - loads the built driver modules and checks that both
 * register their descriptors
 */

#include <gtest/gtest.h>

#include "TestUtils.h"

#include "plugin/DriverLoader.h"

#include <algorithm>
#include <stdexcept>

#ifndef PICONTROL_TEST_DRIVER_DIR
#error "PICONTROL_TEST_DRIVER_DIR must point at the built driver modules"
#endif

static const char *kLircDriverId = "BA7C5FCE-F23F-11EE-A951-0242AC120002";
static const char *kRemoteDriverId = "5E0F3A52-8C1D-4B7E-9F61-2D4A7C3E9B18";

class DriverLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        remoteDir_ = dir_.mkdir("remotes");

        config_ = writeConfig(dir_,
            "[driver]\nmodule_dir = " PICONTROL_TEST_DRIVER_DIR "\n"
            "[icons]\ndir = " + dir_.mkdir("icons") + "\n"
            "[ir_lirc]\nsocket = " + dir_.file("lircd") + "\n"
            "[ir_remote]\nremote_dir = " + remoteDir_ + "\n"
            "device = " + dir_.file("lirc0") + "\n");

        loader_.reset(new DriverLoader(config_.get()));
    }

    void TearDown() override {
        loader_.reset();
    }

    TempDir dir_;
    std::string remoteDir_;
    std::unique_ptr<INIReader> config_;
    std::unique_ptr<DriverLoader> loader_;
};

TEST_F(DriverLoaderTest, LoadsBothModules) {
    EXPECT_EQ(loader_->getNumModules(), 2u);

    std::vector<std::string> ids;
    EXPECT_EQ(loader_->getDriverIds(ids), 2);

    EXPECT_NE(std::find(ids.begin(), ids.end(), kLircDriverId), ids.end());
    EXPECT_NE(std::find(ids.begin(), ids.end(), kRemoteDriverId), ids.end());
}

TEST_F(DriverLoaderTest, ExposesConfigToDrivers) {
    EXPECT_EQ(loader_->getConfig(), config_.get());
}

TEST_F(DriverLoaderTest, NormalizesUuids) {
    EXPECT_EQ(DriverLoader::normalizeUuid("ba7c5fce-f23f-11ee-a951-0242ac120002"), kLircDriverId);
    EXPECT_EQ(DriverLoader::normalizeUuid(kLircDriverId), kLircDriverId);
    EXPECT_EQ(DriverLoader::normalizeUuid("not-a-uuid"), "not-a-uuid");
}

TEST_F(DriverLoaderTest, CreatesDescriptorsByUuid) {
    std::unique_ptr<DeviceDriverDescriptor> lirc(
        loader_->createDescriptor("ba7c5fce-f23f-11ee-a951-0242ac120002"));

    ASSERT_NE(lirc, nullptr);
    EXPECT_EQ(lirc->getDriverId(), kLircDriverId);
    EXPECT_EQ(lirc->getDisplayName(), "IR Controlled Devices");

    // no daemon at the configured socket
    std::vector<DeviceInfo> devices;
    EXPECT_EQ(lirc->getDevices(devices), 0);
}

TEST_F(DriverLoaderTest, UnknownUuidThrows) {
    EXPECT_THROW(loader_->createDescriptor("00000000-0000-0000-0000-000000000000"),
                 std::out_of_range);
    EXPECT_THROW(loader_->createDescriptor("garbage"), std::out_of_range);
}

TEST_F(DriverLoaderTest, RemoteDescriptorEnumeratesConfiguredDirectory) {
    dir_.write("remotes/kitchen_tv.remote", R"({"keys": {"POWER": [9000, 4500, 560]}})");

    std::unique_ptr<DeviceDriverDescriptor> descriptor(loader_->createDescriptor(kRemoteDriverId));
    ASSERT_NE(descriptor, nullptr);

    std::vector<DeviceInfo> devices;
    EXPECT_EQ(descriptor->getDevices(devices), 1);
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].getDeviceId(), "kitchen_tv");

    std::unique_ptr<DeviceDriver> driver(descriptor->createDeviceInstance("kitchen_tv"));

    std::vector<std::unique_ptr<DeviceCommand>> commands;
    EXPECT_EQ(driver->getCommands(commands), 1);
    EXPECT_EQ(commands[0]->getTitle(), "POWER");
}
