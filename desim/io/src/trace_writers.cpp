#include <desim/io/trace_writers.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace desim::io {

namespace {

constexpr std::string_view CLOCK_KEY = "clock";
constexpr std::string_view EVCOUNT_KEY = "evcount";
constexpr std::string_view SCOUNT_KEY = "scount";

} // anonymous namespace

// =============================================================================
// JsonTraceWriter
// =============================================================================

JsonTraceWriter::JsonTraceWriter(std::ostream& output)
    : output_(output)
    , stream_(output)
    , writer_(stream_) {
    writer_.StartArray();
}

JsonTraceWriter::~JsonTraceWriter() {
    finalize();
}

void JsonTraceWriter::key(std::string_view name) {
    writer_.Key(name.data(), static_cast<rapidjson::SizeType>(name.size()));
}

void JsonTraceWriter::begin(double time) {
    if (finalized_) {
        return;
    }
    writer_.StartObject();
    key("time");
    writer_.Double(time);
}

void JsonTraceWriter::type(std::string_view name) {
    field("type", name);
}

void JsonTraceWriter::field(std::string_view name, double value) {
    if (finalized_) {
        return;
    }
    key(name);
    writer_.Double(value);
}

void JsonTraceWriter::field(std::string_view name, uint64_t value) {
    if (finalized_) {
        return;
    }
    key(name);
    writer_.Uint64(value);
}

void JsonTraceWriter::field(std::string_view name, std::string_view value) {
    if (finalized_) {
        return;
    }
    key(name);
    writer_.String(value.data(), static_cast<rapidjson::SizeType>(value.size()));
}

void JsonTraceWriter::end() {
    if (finalized_) {
        return;
    }
    writer_.EndObject();
}

void JsonTraceWriter::finalize() {
    if (finalized_) {
        return;
    }
    writer_.EndArray();
    stream_.Flush();
    output_ << '\n';
    output_.flush();
    finalized_ = true;
}

// =============================================================================
// MemoryTraceWriter
// =============================================================================

std::optional<uint64_t> ClockRecord::counter(std::string_view key) const {
    auto it = fields.find(key);
    if (it == fields.end()) {
        return std::nullopt;
    }
    if (const auto* value = std::get_if<uint64_t>(&it->second)) {
        return *value;
    }
    return std::nullopt;
}

void MemoryTraceWriter::begin(double time) {
    current_ = ClockRecord{};
    current_.time = time;
}

void MemoryTraceWriter::type(std::string_view name) {
    current_.type = std::string(name);
}

void MemoryTraceWriter::field(std::string_view key, double value) {
    current_.fields.insert_or_assign(std::string(key), value);
}

void MemoryTraceWriter::field(std::string_view key, uint64_t value) {
    if (key == CLOCK_KEY) {
        current_.clock = static_cast<core::ClockId>(value);
        return;
    }
    current_.fields.insert_or_assign(std::string(key), value);
}

void MemoryTraceWriter::field(std::string_view key, std::string_view value) {
    current_.fields.insert_or_assign(std::string(key), std::string(value));
}

void MemoryTraceWriter::end() {
    if (std::find(clocks_.begin(), clocks_.end(), current_.clock) == clocks_.end()) {
        clocks_.push_back(current_.clock);
    }
    records_.push_back(std::move(current_));
    current_ = ClockRecord{};
}

std::size_t MemoryTraceWriter::count(std::string_view type) const {
    return static_cast<std::size_t>(std::count_if(records_.begin(), records_.end(),
        [type](const ClockRecord& record) { return record.type == type; }));
}

std::size_t MemoryTraceWriter::count(core::ClockId clock, std::string_view type) const {
    return static_cast<std::size_t>(std::count_if(records_.begin(), records_.end(),
        [clock, type](const ClockRecord& record) {
            return record.clock == clock && record.type == type;
        }));
}

const ClockRecord* MemoryTraceWriter::last(core::ClockId clock, std::string_view type) const {
    auto it = std::find_if(records_.rbegin(), records_.rend(), [clock, type](const ClockRecord& record) {
        return record.clock == clock && record.type == type;
    });
    return it == records_.rend() ? nullptr : &*it;
}

void MemoryTraceWriter::clear() {
    records_.clear();
    clocks_.clear();
}

// =============================================================================
// TextualTraceWriter
// =============================================================================

namespace {

constexpr const char* COLOR_RESET = "\033[0m";
constexpr const char* COLOR_RED = "\033[31m";
constexpr const char* COLOR_YELLOW = "\033[33m";

std::string counter_column(const std::optional<uint64_t>& value) {
    return value ? std::to_string(*value) : std::string("-");
}

} // anonymous namespace

TextualTraceWriter::TextualTraceWriter(std::ostream& output, bool color_enabled)
    : output_(output)
    , color_enabled_(color_enabled) {}

void TextualTraceWriter::begin(double time) {
    time_ = time;
    type_.clear();
    clock_.reset();
    evcount_.reset();
    scount_.reset();
    details_.clear();
}

void TextualTraceWriter::type(std::string_view name) {
    type_ = std::string(name);
}

void TextualTraceWriter::field(std::string_view key, double value) {
    details_ += fmt::format(" {}={:.10g}", key, value);
}

void TextualTraceWriter::field(std::string_view key, uint64_t value) {
    if (key == CLOCK_KEY) {
        clock_ = value;
    } else if (key == EVCOUNT_KEY) {
        evcount_ = value;
    } else if (key == SCOUNT_KEY) {
        scount_ = value;
    } else {
        details_ += fmt::format(" {}={}", key, value);
    }
}

void TextualTraceWriter::field(std::string_view key, std::string_view value) {
    details_ += fmt::format(" {}={}", key, value);
}

const char* TextualTraceWriter::color_of(std::string_view type) const noexcept {
    if (!color_enabled_) {
        return nullptr;
    }
    if (type == "process_failed" || type == "worker_fault") {
        return COLOR_RED;
    }
    if (type == "halt" || type == "diagnostic") {
        return COLOR_YELLOW;
    }
    return nullptr;
}

void TextualTraceWriter::end() {
    if (!header_written_) {
        output_ << fmt::format("{:>12} {:>5} {:<16} {:>8} {:>8}  details\n",
                               "time", "clock", "record", "evcount", "scount");
        header_written_ = true;
    }

    const char* color = color_of(type_);
    std::string line = fmt::format("{:>12.5f} {:>5} ", time_, counter_column(clock_));
    line += color != nullptr ? fmt::format("{}{:<16}{}", color, type_, COLOR_RESET)
                             : fmt::format("{:<16}", type_);
    line += fmt::format(" {:>8} {:>8} {}", counter_column(evcount_), counter_column(scount_), details_);
    // Trailing blanks left by an empty details column.
    line.erase(line.find_last_not_of(' ') + 1);
    output_ << line << '\n';
}

} // namespace desim::io
