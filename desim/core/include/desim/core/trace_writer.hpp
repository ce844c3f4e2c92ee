#pragma once

#include <cstdint>
#include <string_view>

namespace desim::core {

/// @brief Abstract interface for recording clock activity.
/// @ingroup core
///
/// Each trace record is built incrementally:
///   1. begin() -- opens a new record at a given virtual time
///   2. type()  -- sets the record type (`"event"`, `"tick"`, `"run"`, ...)
///   3. field() -- (repeated) adds key/value data fields
///   4. end()   -- closes and optionally flushes the record
///
/// A Clock holds an optional non-owning pointer to a TraceWriter. When
/// no writer is installed the overhead is a single null-pointer check.
/// Every record carries a `clock` field with the emitting clock's id.
///
/// @see Clock::set_trace_writer()
class TraceWriter {
public:
    virtual ~TraceWriter() = default;

    /// @brief Begin a new trace record at the given virtual time.
    virtual void begin(double time) = 0;

    /// @brief Set the record type name.
    virtual void type(std::string_view name) = 0;

    virtual void field(std::string_view key, double value) = 0;
    virtual void field(std::string_view key, uint64_t value) = 0;
    virtual void field(std::string_view key, std::string_view value) = 0;

    /// @brief End the current record and flush if needed.
    virtual void end() = 0;

protected:
    TraceWriter() = default;
    TraceWriter(const TraceWriter&) = default;
    TraceWriter& operator=(const TraceWriter&) = default;
    TraceWriter(TraceWriter&&) = default;
    TraceWriter& operator=(TraceWriter&&) = default;
};

} // namespace desim::core
