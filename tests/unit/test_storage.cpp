#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include "../../src/storage/disk_storage.hpp"
#include "glimpse/errors.hpp"

using namespace Glimpse;
using namespace Glimpse::Storage;
namespace fs = std::filesystem;

class StorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (fs::exists("test_storage_out"))
            fs::remove_all("test_storage_out");
    }

    void TearDown() override {
        if (fs::exists("test_storage_out"))
            fs::remove_all("test_storage_out");
    }

    static std::string read_file(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());
    }
};

TEST_F(StorageTest, PersistCreatesDirectory) {
    DiskStorage storage;
    std::string path = storage.persist("Hello World", "shot.png", "test_storage_out");

    EXPECT_EQ(path, "test_storage_out/shot.png");
    EXPECT_TRUE(fs::exists("test_storage_out/shot.png"));
    EXPECT_EQ(read_file(path), "Hello World");
}

TEST_F(StorageTest, ExistingDirectoryIsReused) {
    fs::create_directory("test_storage_out");
    DiskStorage storage;

    storage.persist("a", "a.png", "test_storage_out");
    storage.persist("b", "b.png", "test_storage_out");

    EXPECT_EQ(read_file("test_storage_out/a.png"), "a");
    EXPECT_EQ(read_file("test_storage_out/b.png"), "b");
}

TEST_F(StorageTest, NestedDirectoryCreation) {
    DiskStorage storage;
    std::string path = storage.persist("x", "deep.png", "test_storage_out/deep/path");

    EXPECT_EQ(path, "test_storage_out/deep/path/deep.png");
    EXPECT_TRUE(fs::exists("test_storage_out/deep/path/deep.png"));
}

TEST_F(StorageTest, BinaryStorage) {
    DiskStorage storage;
    std::string binary_data = {(char)0x89, 'P', 'N', 'G', 0x00, 0x01, 0x0A, 0x0D, (char)0xFF};
    std::string path        = storage.persist(binary_data, "data.png", "test_storage_out");

    EXPECT_EQ(read_file(path), binary_data);
}

TEST_F(StorageTest, PathIsNotNormalized) {
    DiskStorage storage;
    std::string path = storage.persist("x", "dots.png", "./test_storage_out");

    EXPECT_EQ(path, "./test_storage_out/dots.png");
}

TEST_F(StorageTest, UnwritableDirectoryIsPersistenceError) {
    std::ofstream("test_storage_out_file") << "not a directory";
    DiskStorage storage;

    EXPECT_THROW(storage.persist("x", "a.png", "test_storage_out_file/sub"), PersistenceError);
    fs::remove("test_storage_out_file");
}

TEST_F(StorageTest, InvalidArgumentsArePersistenceErrors) {
    DiskStorage storage;

    EXPECT_THROW(storage.persist("x", "a.png", ""), PersistenceError);
    EXPECT_THROW(storage.persist("x", "", "test_storage_out"), PersistenceError);
    EXPECT_THROW(storage.persist("x", "../escape.png", "test_storage_out"), PersistenceError);
}
