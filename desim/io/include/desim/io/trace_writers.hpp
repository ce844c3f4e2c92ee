#pragma once

/// @file trace_writers.hpp
/// @brief TraceWriter implementations for clock activity.
///
/// Every record a Clock emits carries its clock id in a `clock` field,
/// and event and tick records carry the running `evcount` and `scount`.
/// The writers here key on those: the JSON writer lifts the clock id
/// next to the time, the memory writer indexes records by clock, and
/// the text writer lays them out in clock and counter columns.
///
/// @ingroup io_writers

#include <desim/core/action.hpp>
#include <desim/core/trace_writer.hpp>

#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/writer.h>

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace desim::io {

/// @brief Streams records as a JSON array through RapidJSON.
///
/// Each record becomes `{"time": t, "type": "...", "clock": id, ...}`.
/// Call @ref finalize once the clock is done; the destructor does it
/// otherwise.
///
/// @ingroup io_writers
/// @see core::TraceWriter, MemoryTraceWriter, TextualTraceWriter
class JsonTraceWriter : public core::TraceWriter {
public:
    /// @param output  Destination stream (must outlive this writer).
    explicit JsonTraceWriter(std::ostream& output);
    ~JsonTraceWriter() override;

    JsonTraceWriter(const JsonTraceWriter&) = delete;
    JsonTraceWriter& operator=(const JsonTraceWriter&) = delete;

    void begin(double time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    /// @brief Close the array and flush. Idempotent.
    void finalize();

private:
    using Writer = rapidjson::Writer<rapidjson::OStreamWrapper, rapidjson::UTF8<>, rapidjson::UTF8<>,
                                     rapidjson::CrtAllocator, rapidjson::kWriteNanAndInfFlag>;

    void key(std::string_view name);

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    rapidjson::OStreamWrapper stream_;
    Writer writer_;
    bool finalized_{false};
};

using FieldValue = std::variant<double, uint64_t, std::string>;

/// @brief One record kept by MemoryTraceWriter.
/// @ingroup io_writers
struct ClockRecord {
    double time{0.0};
    core::ClockId clock{0};  ///< Emitting clock, 0 if the record had no `clock` field.
    std::string type;
    std::map<std::string, FieldValue, std::less<>> fields;  ///< Every field but `clock`.

    /// @brief Counter field such as `evcount`, if present.
    [[nodiscard]] std::optional<uint64_t> counter(std::string_view key) const;
};

/// @brief Keeps every record in memory, indexed by emitting clock.
///
/// A master and its workers can share one writer only if the caller
/// serializes them; Clock installs writers per clock, so the usual
/// case is one writer per clock.
///
/// @ingroup io_writers
class MemoryTraceWriter : public core::TraceWriter {
public:
    void begin(double time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    [[nodiscard]] const std::vector<ClockRecord>& records() const { return records_; }

    /// @brief Records of type @p type from any clock.
    [[nodiscard]] std::size_t count(std::string_view type) const;

    /// @brief Records of type @p type emitted by clock @p clock.
    [[nodiscard]] std::size_t count(core::ClockId clock, std::string_view type) const;

    /// @brief Ids of the clocks seen so far, in first-seen order.
    [[nodiscard]] const std::vector<core::ClockId>& clocks() const { return clocks_; }

    /// @brief The latest record of @p type from @p clock, if any.
    [[nodiscard]] const ClockRecord* last(core::ClockId clock, std::string_view type) const;

    void clear();

private:
    std::vector<ClockRecord> records_;
    std::vector<core::ClockId> clocks_;
    ClockRecord current_;
};

/// @brief Column-aligned text trace.
///
/// @code
///         time clock record           evcount   scount  details
///      2.50000     1 event                  3        -
///      3.00000     1 tick                   3        6
///      3.00000     2 worker_fault           -        -  command=Run what=boom
/// @endcode
///
/// The header is written before the first record. With colour on,
/// fault records are red and halts or diagnostics yellow.
///
/// @ingroup io_writers
class TextualTraceWriter : public core::TraceWriter {
public:
    explicit TextualTraceWriter(std::ostream& output, bool color_enabled = true);

    TextualTraceWriter(const TextualTraceWriter&) = delete;
    TextualTraceWriter& operator=(const TextualTraceWriter&) = delete;

    void begin(double time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

private:
    [[nodiscard]] const char* color_of(std::string_view type) const noexcept;

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool color_enabled_;
    bool header_written_{false};
    double time_{0.0};
    std::string type_;
    std::optional<uint64_t> clock_;
    std::optional<uint64_t> evcount_;
    std::optional<uint64_t> scount_;
    std::string details_;
};

} // namespace desim::io
