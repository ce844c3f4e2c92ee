#include <desim/io/config_loader.hpp>
#include <desim/io/error.hpp>

#include <desim/core/log.hpp>
#include <desim/core/units.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <array>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <string>

namespace desim::io {

namespace {

using namespace desim::core;

constexpr const char* CONTEXT = "clock config";

constexpr std::array<std::string_view, 8> KNOWN_FIELDS{
    "dt", "t0", "unit", "workers", "sync_interval", "seed", "handle_exceptions", "log_level"};

double get_double(const rapidjson::Value& member, const char* name) {
    if (!member.IsNumber()) {
        throw LoaderError(std::string("field '") + name + "' must be a number", CONTEXT);
    }
    const double value = member.GetDouble();
    if (!std::isfinite(value)) {
        throw LoaderError(std::string("field '") + name + "' must be finite", CONTEXT);
    }
    return value;
}

uint64_t get_uint64(const rapidjson::Value& member, const char* name) {
    if (!member.IsUint64()) {
        throw LoaderError(std::string("field '") + name + "' must be a non-negative integer", CONTEXT);
    }
    return member.GetUint64();
}

std::string_view get_string(const rapidjson::Value& member, const char* name) {
    if (!member.IsString()) {
        throw LoaderError(std::string("field '") + name + "' must be a string", CONTEXT);
    }
    return {member.GetString(), member.GetStringLength()};
}

void check_fields(const rapidjson::Value& obj) {
    for (auto it = obj.MemberBegin(); it != obj.MemberEnd(); ++it) {
        const std::string_view key{it->name.GetString(), it->name.GetStringLength()};
        bool known = false;
        for (auto field : KNOWN_FIELDS) {
            known = known || field == key;
        }
        if (!known) {
            throw LoaderError("unknown field '" + std::string(key) + "'", CONTEXT);
        }
    }
}

ClockConfig parse_config(const rapidjson::Value& obj) {
    check_fields(obj);
    ClockConfig config;

    if (obj.HasMember("dt")) {
        config.dt = get_double(obj["dt"], "dt");
        if (config.dt < 0.0) {
            throw LoaderError("dt must be >= 0", CONTEXT);
        }
    }
    if (obj.HasMember("t0")) {
        config.t0 = get_double(obj["t0"], "t0");
    }
    if (obj.HasMember("unit")) {
        const auto name = get_string(obj["unit"], "unit");
        const auto unit = parse_unit(name);
        if (!unit) {
            throw LoaderError("unknown time unit '" + std::string(name) + "'", CONTEXT);
        }
        config.unit = *unit;
    }
    if (obj.HasMember("workers")) {
        config.workers = static_cast<std::size_t>(get_uint64(obj["workers"], "workers"));
    }
    if (obj.HasMember("sync_interval")) {
        config.sync_interval = get_double(obj["sync_interval"], "sync_interval");
        if (config.sync_interval <= 0.0) {
            throw LoaderError("sync_interval must be positive", CONTEXT);
        }
    }
    if (obj.HasMember("seed")) {
        config.seed = get_uint64(obj["seed"], "seed");
    }
    if (obj.HasMember("handle_exceptions")) {
        const auto& member = obj["handle_exceptions"];
        if (!member.IsBool()) {
            throw LoaderError("field 'handle_exceptions' must be a boolean", CONTEXT);
        }
        config.handle_exceptions = member.GetBool();
    }
    if (obj.HasMember("log_level")) {
        const auto name = get_string(obj["log_level"], "log_level");
        const auto level = parse_log_level(name);
        if (!level) {
            throw LoaderError("unknown log level '" + std::string(name) + "'", CONTEXT);
        }
        config.log_level = *level;
    }
    return config;
}

std::string level_key(LogLevel level) {
    std::string name = log_level_name(level);
    for (char& c : name) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return name;
}

} // anonymous namespace

core::ClockConfig load_clock_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_clock_config_from_string(oss.str());
}

core::ClockConfig load_clock_config_from_string(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }

    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", CONTEXT);
    }

    return parse_config(doc);
}

void write_clock_config_to_stream(const core::ClockConfig& config, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    writer.Key("dt");
    writer.Double(config.dt);
    writer.Key("t0");
    writer.Double(config.t0);
    writer.Key("unit");
    const std::string_view symbol = config.unit == TimeUnit::None ? "none" : unit_symbol(config.unit);
    writer.String(symbol.data(), static_cast<rapidjson::SizeType>(symbol.size()));
    writer.Key("workers");
    writer.Uint64(config.workers);
    writer.Key("sync_interval");
    writer.Double(config.sync_interval);
    writer.Key("seed");
    writer.Uint64(config.seed);
    writer.Key("handle_exceptions");
    writer.Bool(config.handle_exceptions);
    writer.Key("log_level");
    writer.String(level_key(config.log_level).c_str());
    writer.EndObject();

    out << buffer.GetString();
}

void write_clock_config(const core::ClockConfig& config, const std::filesystem::path& path) {
    std::ofstream file(path);
    if (!file) {
        throw LoaderError("cannot open file for writing", path.string());
    }
    write_clock_config_to_stream(config, file);
}

} // namespace desim::io
