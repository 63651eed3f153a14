/*
 * test_remote_file_driver.cpp - tests for the remote definition driver:
 * enumeration, device lookup, commands and transmission
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "TestUtils.h"

#include "RemoteFileDriverDescriptor.h"
#include "RemoteFileDeviceDriver.h"

#include <cstring>

#include <type_traits>

using namespace testing;

class RemoteFileDriverTest : public Test {
protected:
    void SetUp() override {
        remoteDir_ = dir_.mkdir("remotes");
        iconDir_ = dir_.mkdir("icons");
        transmitter_ = dir_.file("lirc0");

        dir_.write("icons/POWER.png", fakePng("power"));
        dir_.write("icons/unknown.png", fakePng("unknown"));

        config_ = writeConfig(dir_,
            "[icons]\ndir = " + iconDir_ + "\n"
            "[ir_remote]\nremote_dir = " + remoteDir_ + "\n"
            "device = " + transmitter_ + "\n");

        EXPECT_CALL(host_, getConfig()).WillRepeatedly(Return(config_.get()));

        descriptor_.reset(new RemoteFileDriverDescriptor(&host_));
    }

    void TearDown() override {
        descriptor_.reset();
    }

    std::unique_ptr<DeviceDriver> createDriver(const std::string &deviceId) {
        return std::unique_ptr<DeviceDriver>(descriptor_->createDeviceInstance(deviceId));
    }

    // reads back what was "transmitted" to the stand-in LIRC device
    std::vector<uint32_t> transmitted() {
        std::vector<uint8_t> bytes = readBytes(transmitter_);
        std::vector<uint32_t> timings(bytes.size() / sizeof(uint32_t));
        memcpy(timings.data(), bytes.data(), timings.size() * sizeof(uint32_t));
        return timings;
    }

    TempDir dir_;
    std::string remoteDir_;
    std::string iconDir_;
    std::string transmitter_;

    std::unique_ptr<INIReader> config_;
    NiceMock<MockDriverHost> host_;
    std::unique_ptr<RemoteFileDriverDescriptor> descriptor_;
};

TEST_F(RemoteFileDriverTest, DescriptorIdentity) {
    EXPECT_EQ(descriptor_->getDriverId(), "5E0F3A52-8C1D-4B7E-9F61-2D4A7C3E9B18");
    EXPECT_EQ(descriptor_->getDisplayName(), "IR Remote Definitions");
    EXPECT_EQ(descriptor_->getRemoteDir(), remoteDir_);
    EXPECT_EQ(descriptor_->getTransmitterPath(), transmitter_);
}

TEST_F(RemoteFileDriverTest, KitchenTvEnumeratesWithLayoutSize) {
    dir_.write("remotes/kitchen_tv.remote",
        R"({"keys": {"MUTE": "..."}, "remote": {"width": 4, "height": 6, "layout": []}})");

    std::vector<DeviceInfo> devices;
    EXPECT_EQ(descriptor_->getDevices(devices), 1);
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].getDeviceId(), "kitchen_tv");
    EXPECT_EQ(devices[0].getName(), "kitchen_tv");

    auto driver = createDriver("kitchen_tv");
    unsigned int width = 0, height = 0;
    std::tie(width, height) = driver->remoteLayoutSize();

    EXPECT_EQ(width, 4u);
    EXPECT_EQ(height, 6u);
    EXPECT_TRUE(driver->remoteLayout().empty());
    EXPECT_TRUE(driver->isDeviceReady());
}

TEST_F(RemoteFileDriverTest, EnumerationIsFilteredAndSorted) {
    dir_.write("remotes/living_room.remote", R"({"keys": {}})");
    dir_.write("remotes/amp.remote", R"({"keys": {}})");
    dir_.write("remotes/notes.txt", "not a remote");
    dir_.write("remotes/.hidden.remote", R"({"keys": {}})");
    dir_.write("remotes/.remote", R"({"keys": {}})");
    dir_.mkdir("remotes/folder.remote");

    std::vector<DeviceInfo> devices;
    EXPECT_EQ(descriptor_->getDevices(devices), 2);
    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].getDeviceId(), "amp");
    EXPECT_EQ(devices[1].getDeviceId(), "living_room");
}

TEST_F(RemoteFileDriverTest, MissingDirectoryHasNoDevices) {
    TempDir otherDir;
    auto config = writeConfig(otherDir,
        "[ir_remote]\nremote_dir = " + otherDir.file("missing") + "\n");

    NiceMock<MockDriverHost> host;
    EXPECT_CALL(host, getConfig()).WillRepeatedly(Return(config.get()));
    RemoteFileDriverDescriptor descriptor(&host);

    std::vector<DeviceInfo> devices;
    EXPECT_EQ(descriptor.getDevices(devices), 0);
    EXPECT_TRUE(devices.empty());
}

TEST_F(RemoteFileDriverTest, GetDeviceMatchesEnumeration) {
    dir_.write("remotes/amp.remote", R"({"keys": {}})");
    dir_.write("remotes/tv.remote", R"({"keys": {}})");

    std::vector<DeviceInfo> devices;
    descriptor_->getDevices(devices);

    for (const auto &device : devices) {
        EXPECT_EQ(descriptor_->getDevice(device.getDeviceId()).getDeviceId(), device.getDeviceId());
    }

    EXPECT_THROW(descriptor_->getDevice("projector"), DeviceNotFoundException);
    EXPECT_THROW(descriptor_->createDeviceInstance("projector"), DeviceNotFoundException);
}

TEST_F(RemoteFileDriverTest, CommandsAreSortedWithSequentialIds) {
    dir_.write("remotes/tv.remote",
        R"({"keys": {"VOL_UP": [1], "POWER": [2], "VOL_DOWN": [3]}})");

    auto driver = createDriver("tv");

    std::vector<std::unique_ptr<DeviceCommand>> commands;
    EXPECT_EQ(driver->getCommands(commands), 3);
    ASSERT_EQ(commands.size(), 3u);

    const char *expected[] = {"POWER", "VOL_DOWN", "VOL_UP"};

    for (int i = 0; i < 3; i++) {
        EXPECT_EQ(commands[i]->getId(), i);
        EXPECT_EQ(commands[i]->getTitle(), expected[i]);
    }

    EXPECT_EQ(commands[0]->getIcon(), fakePng("power"));
    EXPECT_EQ(commands[1]->getIcon(), fakePng("unknown"));
}

TEST_F(RemoteFileDriverTest, CommandListIsDeterministic) {
    dir_.write("remotes/tv.remote",
        R"({"keys": {"VOL_UP": [1], "POWER": [2], "VOL_DOWN": [3], "MUTE": [4]}})");

    auto driver = createDriver("tv");

    std::vector<std::unique_ptr<DeviceCommand>> first, second;
    driver->getCommands(first);
    driver->getCommands(second);

    ASSERT_EQ(first.size(), second.size());

    for (size_t i = 0; i < first.size(); i++) {
        EXPECT_EQ(first[i]->getId(), second[i]->getId());
        EXPECT_EQ(first[i]->getTitle(), second[i]->getTitle());
    }
}

TEST_F(RemoteFileDriverTest, BrokenDefinitionFailsConstruction) {
    dir_.write("remotes/broken.remote", "{ not json");

    EXPECT_THROW(createDriver("broken"), DriverConstructionException);
}

TEST_F(RemoteFileDriverTest, ExecuteWritesTimingsToDevice) {
    dir_.write("remotes/tv.remote",
        R"({"carrier": 38000, "keys": {"POWER": "9000 4500 560 1690 560"}})");

    // a regular file stands in for the LIRC device; the carrier ioctl fails
    // on it, which is only logged
    dir_.write("lirc0", "");

    auto driver = createDriver("tv");

    std::vector<std::unique_ptr<DeviceCommand>> commands;
    driver->getCommands(commands);
    ASSERT_EQ(commands.size(), 1u);

    driver->execute(commands[0].get());

    EXPECT_EQ(transmitted(), (std::vector<uint32_t>{9000, 4500, 560, 1690, 560}));
}

TEST_F(RemoteFileDriverTest, ExecuteWithoutDeviceIsSilent) {
    dir_.write("remotes/tv.remote", R"({"keys": {"POWER": [9000, 4500, 560]}})");

    auto driver = createDriver("tv");

    std::vector<std::unique_ptr<DeviceCommand>> commands;
    driver->getCommands(commands);
    ASSERT_EQ(commands.size(), 1u);

    EXPECT_NO_THROW(driver->execute(commands[0].get()));
}

TEST_F(RemoteFileDriverTest, ExecuteWithInvalidCodeThrows) {
    dir_.write("remotes/kitchen_tv.remote", R"({"keys": {"MUTE": "..."}})");

    auto driver = createDriver("kitchen_tv");

    std::vector<std::unique_ptr<DeviceCommand>> commands;
    driver->getCommands(commands);
    ASSERT_EQ(commands.size(), 1u);

    EXPECT_THROW(driver->execute(commands[0].get()), DeviceCommandException);
}

TEST_F(RemoteFileDriverTest, DriversShareDescriptorIconCache) {
    dir_.write("remotes/tv.remote", R"({"keys": {"POWER": [1]}})");

    auto first = createDriver("tv");
    auto second = createDriver("tv");

    std::vector<std::unique_ptr<DeviceCommand>> commands;
    first->getCommands(commands);
    second->getCommands(commands);

    ASSERT_EQ(commands.size(), 2u);
    EXPECT_EQ(commands[0]->getIcon(), commands[1]->getIcon());
}

TEST_F(RemoteFileDriverTest, DriverOutlivesDescriptor) {
    dir_.write("remotes/tv.remote", R"({"keys": {"POWER": [1], "MUTE": [2]}})");

    auto driver = createDriver("tv");
    descriptor_.reset();

    std::vector<std::unique_ptr<DeviceCommand>> commands;
    EXPECT_EQ(driver->getCommands(commands), 2);
    ASSERT_EQ(commands.size(), 2u);
    EXPECT_EQ(commands[0]->getIcon(), fakePng("unknown"));
    EXPECT_EQ(commands[1]->getIcon(), fakePng("power"));
}

TEST(RemoteFileDeviceDriverOwnershipTest, DriversAreNotCopyable) {
    EXPECT_FALSE(std::is_copy_constructible<RemoteFileDeviceDriver>::value);
    EXPECT_FALSE(std::is_copy_assignable<RemoteFileDeviceDriver>::value);
}
