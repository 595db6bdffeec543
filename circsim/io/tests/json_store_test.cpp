#include <circsim/blocks/counter.hpp>
#include <circsim/core/circuit.hpp>
#include <circsim/io/error.hpp>
#include <circsim/io/json_store.hpp>
#include <circsim/io/json_value.hpp>

#include <gtest/gtest.h>

#include "test_blocks.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

using namespace circsim::io;
using namespace circsim::core;
using circsim::test::LogCapture;
using circsim::test::virtual_options;

// =============================================================================
// Value <-> JSON
// =============================================================================

TEST(JsonValueTest, Parse) {
    EXPECT_EQ(value_from_json("null"), Value(nullptr));
    EXPECT_EQ(value_from_json("true"), Value(true));
    EXPECT_TRUE(value_from_json("42").is_int());
    EXPECT_TRUE(value_from_json("42.0").is_double());
    EXPECT_EQ(value_from_json("\"on\""), Value("on"));
    EXPECT_EQ(value_from_json("[\"on\", 1.5, null]"), Value(Value::List{"on", 1.5, nullptr}));
}

TEST(JsonValueTest, ParseErrors) {
    EXPECT_THROW((void)value_from_json("{\"a\": 1}"), LoaderError);
    EXPECT_THROW((void)value_from_json("[1, {}]"), LoaderError);
    EXPECT_THROW((void)value_from_json("[1,"), LoaderError);
}

TEST(JsonValueTest, Serialize) {
    EXPECT_EQ(value_to_json(Value(Value::List{"off", nullptr, true, 3})), "[\"off\",null,true,3]");
    EXPECT_EQ(value_to_json(Value("a\"b")), "\"a\\\"b\"");
    EXPECT_THROW((void)value_to_json(Value()), LoaderError);
    EXPECT_THROW((void)value_to_json(Value(std::numeric_limits<double>::infinity())), LoaderError);
}

// =============================================================================
// JsonFileStore
// =============================================================================

class JsonFileStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        path = std::filesystem::temp_directory_path()
            / (std::string("circsim_store_") + info->name() + ".json");
        std::filesystem::remove(path);
    }

    void TearDown() override {
        std::filesystem::remove(path);
        std::filesystem::remove(path.string() + ".tmp");
    }

    void write(const std::string& content) {
        std::ofstream file(path);
        file << content;
    }

    std::string read() const {
        std::ifstream file(path);
        std::ostringstream oss;
        oss << file.rdbuf();
        return oss.str();
    }

    std::filesystem::path path;
};

TEST_F(JsonFileStoreTest, MissingFileIsEmpty) {
    JsonFileStore store(path);

    EXPECT_TRUE(store.keys().empty());
    EXPECT_FALSE(store.dirty());
    store.flush();
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(JsonFileStoreTest, FlushAndReload) {
    {
        JsonFileStore store(path);
        store.set("<Counter 'c'>", 5);
        store.set("<Timer 't'>", Value::List{"on", 1003.5});
        EXPECT_TRUE(store.dirty());
        store.flush();
        EXPECT_FALSE(store.dirty());
    }
    EXPECT_FALSE(std::filesystem::exists(path.string() + ".tmp"));

    JsonFileStore store(path);
    EXPECT_EQ(store.keys(), (std::vector<std::string>{"<Counter 'c'>", "<Timer 't'>"}));
    EXPECT_EQ(store.get("<Counter 'c'>"), Value(5));
    EXPECT_EQ(store.get("<Timer 't'>"), Value(Value::List{"on", 1003.5}));
}

TEST_F(JsonFileStoreTest, EraseMarksDirty) {
    write(R"({"a": 1, "b": [true]})");
    JsonFileStore store(path);

    store.erase("missing");
    EXPECT_FALSE(store.dirty());
    store.erase("a");
    EXPECT_TRUE(store.dirty());
    store.flush();
    EXPECT_EQ(read(), "{\"b\":[true]}\n");
}

TEST_F(JsonFileStoreTest, UnsupportedValue) {
    JsonFileStore store(path);

    EXPECT_THROW(store.set("x", Value()), LoaderError);
    EXPECT_FALSE(store.get("x").has_value());
}

TEST_F(JsonFileStoreTest, InvalidFile) {
    write("[1, 2]");
    EXPECT_THROW(JsonFileStore{path}, LoaderError);

    write("{\"a\": ");
    EXPECT_THROW(JsonFileStore{path}, LoaderError);

    write(R"({"a": {"nested": 1}})");
    EXPECT_THROW(JsonFileStore{path}, LoaderError);
}

TEST_F(JsonFileStoreTest, CircuitStateSurvivesRestart) {
    LogCapture logs;
    {
        JsonFileStore store(path);
        Circuit circuit(virtual_options(1000.0));
        circuit.set_persistent_store(&store);
        auto& cnt = circuit.add<circsim::blocks::Counter>(
            BlockOptions{.name = "cnt"},
            circsim::blocks::Counter::Config{.persistence = {.persistent = true}});
        ASSERT_TRUE(circuit.initialize());
        (void)cnt.event("inc", {{"amount", 7}});
        circuit.shutdown();
    }

    JsonFileStore store(path);
    EXPECT_EQ(store.get(STOP_TIME_KEY), Value(1000.0));

    Circuit circuit(virtual_options(1005.0));
    circuit.set_persistent_store(&store);
    auto& cnt = circuit.add<circsim::blocks::Counter>(
        BlockOptions{.name = "cnt"},
        circsim::blocks::Counter::Config{.persistence = {.persistent = true}});
    ASSERT_TRUE(circuit.initialize());
    EXPECT_EQ(cnt.output(), Value(7));
    circuit.shutdown();
}
