#include <desim/io/trace_writers.hpp>

#include <desim/core/clock.hpp>

#include <gtest/gtest.h>

#include <rapidjson/document.h>

#include <sstream>
#include <string>
#include <variant>

using namespace desim;

class TraceWritersTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::Logger::instance().set_sink(nullptr);
    }

    void TearDown() override {
        core::Logger::instance().set_sink(stderr);
    }
};

TEST_F(TraceWritersTest, MemoryWriterRecordsClockRun) {
    io::MemoryTraceWriter writer;
    core::Clock clock(0.5);
    clock.set_trace_writer(&writer);

    clock.schedule_at([] {}, 1.2);
    clock.run(2.0);

    EXPECT_EQ(writer.count("event"), 1u);
    EXPECT_EQ(writer.count(core::MASTER_CLOCK_ID, "tick"), 4u);
    EXPECT_EQ(writer.count(2, "tick"), 0u);
    ASSERT_EQ(writer.clocks().size(), 1u);
    EXPECT_EQ(writer.clocks().front(), core::MASTER_CLOCK_ID);

    const auto* run = writer.last(core::MASTER_CLOCK_ID, "run");
    ASSERT_NE(run, nullptr);
    EXPECT_EQ(run, &writer.records().back());
    EXPECT_DOUBLE_EQ(run->time, 2.0);
    EXPECT_EQ(run->counter("events"), 1u);
    EXPECT_EQ(run->counter("ticks"), 4u);
    // The clock id is lifted out of the fields.
    EXPECT_EQ(run->fields.count("clock"), 0u);

    const auto* tick = writer.last(core::MASTER_CLOCK_ID, "tick");
    ASSERT_NE(tick, nullptr);
    EXPECT_EQ(tick->counter("scount"), 4u);
    EXPECT_FALSE(tick->counter("missing").has_value());

    for (std::size_t i = 1; i < writer.records().size(); ++i) {
        EXPECT_LE(writer.records()[i - 1].time, writer.records()[i].time);
    }
}

TEST_F(TraceWritersTest, MemoryWriterSeparatesClocks) {
    io::MemoryTraceWriter writer;
    core::Clock master;
    master.set_trace_writer(&writer);

    master.schedule_at([] {}, 1.0);
    master.run(2.0);
    // Hand-written records stand in for a second clock.
    writer.begin(2.0);
    writer.type("event");
    writer.field("clock", uint64_t{3});
    writer.field("evcount", uint64_t{7});
    writer.end();

    EXPECT_EQ(writer.count("event"), 2u);
    EXPECT_EQ(writer.count(core::MASTER_CLOCK_ID, "event"), 1u);
    EXPECT_EQ(writer.count(3, "event"), 1u);
    ASSERT_EQ(writer.clocks().size(), 2u);
    EXPECT_EQ(writer.clocks()[1], 3);
    EXPECT_EQ(writer.last(3, "event")->counter("evcount"), 7u);
    EXPECT_EQ(writer.last(3, "run"), nullptr);

    writer.clear();
    EXPECT_TRUE(writer.records().empty());
    EXPECT_TRUE(writer.clocks().empty());
}

TEST_F(TraceWritersTest, MemoryWriterRecordsDiagnostics) {
    io::MemoryTraceWriter writer;
    core::Clock clock;
    clock.set_trace_writer(&writer);

    clock.resume();

    ASSERT_EQ(writer.count("diagnostic"), 1u);
    const auto& record = writer.records().front();
    EXPECT_EQ(std::get<std::string>(record.fields.at("command")), "Resume");
}

TEST_F(TraceWritersTest, JsonWriterStreamsClockRecords) {
    std::ostringstream out;
    {
        io::JsonTraceWriter writer(out);
        core::Clock clock(0.5);
        clock.set_trace_writer(&writer);
        clock.schedule_at([] {}, 0.75);
        clock.run(1.0);
        writer.finalize();
        writer.finalize();
    }

    rapidjson::Document doc;
    doc.Parse(out.str().c_str());
    ASSERT_FALSE(doc.HasParseError()) << out.str();
    ASSERT_TRUE(doc.IsArray());
    // tick, event, tick, run
    ASSERT_EQ(doc.Size(), 4u);
    EXPECT_STREQ(doc[0]["type"].GetString(), "tick");
    EXPECT_EQ(doc[0]["clock"].GetUint64(), 1u);
    EXPECT_EQ(doc[0]["scount"].GetUint64(), 1u);
    EXPECT_STREQ(doc[1]["type"].GetString(), "event");
    EXPECT_DOUBLE_EQ(doc[1]["time"].GetDouble(), 0.75);
    EXPECT_EQ(doc[1]["evcount"].GetUint64(), 1u);
    EXPECT_STREQ(doc[3]["type"].GetString(), "run");
    EXPECT_DOUBLE_EQ(doc[3]["time"].GetDouble(), 1.0);
}

TEST_F(TraceWritersTest, JsonWriterEscapesStrings) {
    std::ostringstream out;
    {
        io::JsonTraceWriter writer(out);
        writer.begin(1.5);
        writer.type("worker_fault");
        writer.field("what", std::string_view("say \"hi\"\n"));
        writer.field("ratio", 0.25);
        writer.end();
    }

    rapidjson::Document doc;
    doc.Parse(out.str().c_str());
    ASSERT_FALSE(doc.HasParseError()) << out.str();
    ASSERT_EQ(doc.Size(), 1u);
    EXPECT_STREQ(doc[0]["what"].GetString(), "say \"hi\"\n");
    EXPECT_DOUBLE_EQ(doc[0]["ratio"].GetDouble(), 0.25);
}

TEST_F(TraceWritersTest, JsonWriterEmptyArray) {
    std::ostringstream out;
    {
        io::JsonTraceWriter writer(out);
    }
    EXPECT_EQ(out.str(), "[]\n");
}

TEST_F(TraceWritersTest, TextualWriterUsesClockColumns) {
    std::ostringstream out;
    io::TextualTraceWriter writer(out, false);

    writer.begin(2.5);
    writer.type("event");
    writer.field("clock", uint64_t{1});
    writer.field("evcount", uint64_t{3});
    writer.end();
    writer.begin(3.0);
    writer.type("worker_fault");
    writer.field("clock", uint64_t{1});
    writer.field("worker", uint64_t{2});
    writer.field("what", std::string_view("boom"));
    writer.end();

    std::istringstream lines(out.str());
    std::string header;
    std::string event;
    std::string fault;
    ASSERT_TRUE(std::getline(lines, header));
    ASSERT_TRUE(std::getline(lines, event));
    ASSERT_TRUE(std::getline(lines, fault));

    EXPECT_EQ(header, "        time clock record            evcount   scount  details");
    EXPECT_EQ(event, "     2.50000     1 event                   3        -");
    EXPECT_EQ(fault, "     3.00000     1 worker_fault            -        -  worker=2 what=boom");
    EXPECT_EQ(out.str().find('\033'), std::string::npos);
}

TEST_F(TraceWritersTest, TextualWriterHighlightsFaults) {
    std::ostringstream out;
    io::TextualTraceWriter writer(out, true);

    writer.begin(1.0);
    writer.type("worker_fault");
    writer.end();
    writer.begin(2.0);
    writer.type("halt");
    writer.end();
    writer.begin(3.0);
    writer.type("tick");
    writer.end();

    const std::string text = out.str();
    EXPECT_NE(text.find("\033[31mworker_fault"), std::string::npos);
    EXPECT_NE(text.find("\033[33mhalt"), std::string::npos);
    EXPECT_EQ(text.find("\033[31mtick"), std::string::npos);
    EXPECT_EQ(text.find("\033[33mtick"), std::string::npos);
}
