#include "holdfast/store/file_store.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <type_traits>
#include <unordered_map>

using holdfast::ErrorKind;
using holdfast::store::FileStore;

namespace fs = std::filesystem;

class FileStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("holdfast_file_store_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);
        path_ = dir_ / "state.json";
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    fs::path dir_;
    fs::path path_;
};

TEST_F(FileStoreTest, StartsEmptyAndCreatesDirectory) {
    auto opened = FileStore::open(path_);
    ASSERT_TRUE(opened.is_ok());
    EXPECT_TRUE(fs::exists(dir_));
    EXPECT_TRUE(opened.value()->list_keys().value().empty());
}

TEST_F(FileStoreTest, OnlyOpenConstructs) {
    using Values = std::unordered_map<std::string, std::string>;
    static_assert(!std::is_constructible_v<FileStore, fs::path, Values>);
    static_assert(!std::is_default_constructible_v<FileStore>);

    auto opened = FileStore::open(path_);
    ASSERT_TRUE(opened.is_ok());
    std::unique_ptr<holdfast::store::DurableStore> owned = std::move(opened.value());
    ASSERT_TRUE(owned->set("k", "v").is_ok());
    EXPECT_EQ(*owned->get("k").value(), "v");
}

TEST_F(FileStoreTest, ValuesSurviveReopen) {
    {
        auto opened = FileStore::open(path_);
        ASSERT_TRUE(opened.is_ok());
        auto& store = *opened.value();
        ASSERT_TRUE(store.set("holdfast:sync:last", "1704067200000").is_ok());
        ASSERT_TRUE(store.set("holdfast:cache:cards", R"({"data":[1,2]})").is_ok());
        ASSERT_TRUE(store.set("gone", "x").is_ok());
        ASSERT_TRUE(store.remove("gone").is_ok());
    }

    auto reopened = FileStore::open(path_);
    ASSERT_TRUE(reopened.is_ok());
    auto& store = *reopened.value();

    auto last = store.get("holdfast:sync:last");
    ASSERT_TRUE(last.is_ok());
    ASSERT_TRUE(last.value().has_value());
    EXPECT_EQ(*last.value(), "1704067200000");
    EXPECT_EQ(*store.get("holdfast:cache:cards").value(), R"({"data":[1,2]})");
    EXPECT_FALSE(store.get("gone").value().has_value());
    EXPECT_FALSE(fs::exists(fs::path(path_.string() + ".tmp")));
}

TEST_F(FileStoreTest, RemoveManyPersists) {
    {
        auto store = std::move(FileStore::open(path_).value());
        store->set("a", "1");
        store->set("b", "2");
        store->set("c", "3");
        ASSERT_TRUE(store->remove_many({"a", "b"}).is_ok());
    }

    auto store = std::move(FileStore::open(path_).value());
    auto keys = store->list_keys();
    ASSERT_TRUE(keys.is_ok());
    ASSERT_EQ(keys.value().size(), 1u);
    EXPECT_EQ(keys.value()[0], "c");
}

TEST_F(FileStoreTest, CorruptFileIsReportedAndLeftAlone) {
    fs::create_directories(dir_);
    {
        std::ofstream out(path_);
        out << "[1, 2, 3]";
    }

    auto opened = FileStore::open(path_);
    ASSERT_TRUE(opened.is_error());
    EXPECT_EQ(opened.error().kind, ErrorKind::CorruptRecord);

    std::ifstream in(path_);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "[1, 2, 3]");
}

TEST_F(FileStoreTest, FailedWriteKeepsPreviousState) {
    auto opened = FileStore::open(path_);
    ASSERT_TRUE(opened.is_ok());
    auto& store = *opened.value();
    ASSERT_TRUE(store.set("a", "1").is_ok());

    // Invalid UTF-8 cannot be serialized; the write fails as a whole
    auto failed = store.set("b", std::string("\xff\xfe", 2));
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error().kind, ErrorKind::StorageFault);

    EXPECT_FALSE(store.get("b").value().has_value());
    EXPECT_EQ(*store.get("a").value(), "1");
}
