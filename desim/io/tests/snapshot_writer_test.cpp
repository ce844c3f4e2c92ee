#include <desim/io/snapshot_writer.hpp>

#include <desim/core/clock.hpp>

#include <gtest/gtest.h>

#include <rapidjson/document.h>

#include <sstream>

using namespace desim;

TEST(SnapshotWriterTest, WritesClockState) {
    core::Clock clock(0.5, 0.0, core::TimeUnit::Seconds);
    clock.schedule_at([] {}, 3.0);
    clock.run(2.0);

    std::ostringstream out;
    io::write_snapshot(clock.snapshot(), out);

    rapidjson::Document doc;
    doc.Parse(out.str().c_str());
    ASSERT_FALSE(doc.HasParseError()) << out.str();
    ASSERT_TRUE(doc.IsObject());
    EXPECT_EQ(doc["id"].GetInt(), 1);
    EXPECT_STREQ(doc["state"].GetString(), "Idle");
    EXPECT_STREQ(doc["unit"].GetString(), "s");
    EXPECT_DOUBLE_EQ(doc["time"].GetDouble(), 2.0);
    EXPECT_DOUBLE_EQ(doc["dt"].GetDouble(), 0.5);
    EXPECT_EQ(doc["scount"].GetUint64(), 4u);
    EXPECT_EQ(doc["evcount"].GetUint64(), 0u);
    EXPECT_EQ(doc["events"].GetUint64(), 1u);
    EXPECT_EQ(doc["workers"].GetUint64(), 0u);
}

TEST(SnapshotWriterTest, UnitlessClock) {
    core::Clock clock;
    const std::string json = io::snapshot_to_json(clock.snapshot());

    rapidjson::Document doc;
    doc.Parse(json.c_str());
    ASSERT_FALSE(doc.HasParseError());
    EXPECT_STREQ(doc["unit"].GetString(), "none");
    EXPECT_STREQ(doc["state"].GetString(), "Undefined");
}
