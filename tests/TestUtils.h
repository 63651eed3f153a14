/*
 * TestUtils.h - temporary directories, config files and a mock driver host
 * shared by the driver tests
 */
#ifndef TESTUTILS_H
#define TESTUTILS_H

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <picontrol_driver.h>

#include <INIReader.h>

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include <ftw.h>
#include <unistd.h>
#include <sys/stat.h>

class MockDriverHost : public DriverHost {
public:
    MOCK_METHOD(INIReader *, getConfig, (), (override));
    MOCK_METHOD(int, registerDriver, (const uuid_t &, driver_descriptor_factory_t), (override));
};

// Directory under /tmp that is removed with everything in it
class TempDir {
public:
    TempDir() {
        char pathTemplate[] = "/tmp/picontrol-test-XXXXXX";
        char *dir = mkdtemp(pathTemplate);

        if (dir == nullptr) {
            ADD_FAILURE() << "Couldn't create temporary directory";
        } else {
            path_ = dir;
        }
    }

    ~TempDir() {
        if (!path_.empty()) {
            nftw(path_.c_str(), removeEntry, 16, FTW_DEPTH | FTW_PHYS);
        }
    }

    const std::string &path() const { return path_; }

    std::string file(const std::string &name) const { return path_ + "/" + name; }

    std::string mkdir(const std::string &name) const {
        std::string dir = file(name);
        ::mkdir(dir.c_str(), 0755);
        return dir;
    }

    std::string write(const std::string &name, const std::string &contents) const {
        std::string fullPath = file(name);
        std::ofstream out(fullPath.c_str(), std::ios::out | std::ios::binary | std::ios::trunc);
        out << contents;
        return fullPath;
    }

    std::string write(const std::string &name, const std::vector<uint8_t> &contents) const {
        std::string fullPath = file(name);
        std::ofstream out(fullPath.c_str(), std::ios::out | std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char *>(contents.data()), contents.size());
        return fullPath;
    }

private:
    static int removeEntry(const char *path, const struct stat *, int, struct FTW *) {
        return ::remove(path);
    }

    std::string path_;
};

inline std::vector<uint8_t> readBytes(const std::string &path) {
    std::ifstream in(path.c_str(), std::ios::in | std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in),
                                std::istreambuf_iterator<char>());
}

inline std::vector<uint8_t> fakePng(const std::string &tag) {
    std::vector<uint8_t> data = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
    data.insert(data.end(), tag.begin(), tag.end());
    return data;
}

// Writes an INI file into the directory and parses it
inline std::unique_ptr<INIReader> writeConfig(const TempDir &dir, const std::string &contents) {
    std::string path = dir.write("picontrol-ir.conf", contents);
    std::unique_ptr<INIReader> reader(new INIReader(path));
    EXPECT_EQ(reader->ParseError(), 0);
    return reader;
}

#endif
