#include <desim/io/snapshot_writer.hpp>

#include <desim/core/units.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <string_view>

namespace desim::io {

namespace {

void write_string(rapidjson::Writer<rapidjson::StringBuffer>& writer, std::string_view value) {
    writer.String(value.data(), static_cast<rapidjson::SizeType>(value.size()));
}

} // anonymous namespace

std::string snapshot_to_json(const core::ClockSnapshot& snapshot) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    writer.Key("id");
    writer.Int(snapshot.id);
    writer.Key("state");
    write_string(writer, core::to_string(snapshot.state));
    writer.Key("unit");
    write_string(writer, snapshot.unit == core::TimeUnit::None ? "none" : core::unit_symbol(snapshot.unit));
    writer.Key("time");
    writer.Double(snapshot.time);
    writer.Key("dt");
    writer.Double(snapshot.dt);
    writer.Key("end_time");
    writer.Double(snapshot.end_time);
    writer.Key("tev");
    writer.Double(snapshot.tev);
    writer.Key("tn");
    writer.Double(snapshot.tn);
    writer.Key("evcount");
    writer.Uint64(snapshot.evcount);
    writer.Key("scount");
    writer.Uint64(snapshot.scount);
    writer.Key("events");
    writer.Uint64(snapshot.events);
    writer.Key("conditions");
    writer.Uint64(snapshot.conditions);
    writer.Key("periodics");
    writer.Uint64(snapshot.periodics);
    writer.Key("processes");
    writer.Uint64(snapshot.processes);
    writer.Key("workers");
    writer.Uint64(snapshot.workers);
    writer.EndObject();

    return buffer.GetString();
}

void write_snapshot(const core::ClockSnapshot& snapshot, std::ostream& out) {
    out << snapshot_to_json(snapshot);
}

} // namespace desim::io
