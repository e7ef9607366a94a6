#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <arrow/array.h>
#include <epoch_frame/datetime.h>

namespace retail_lens::calendar {

using Date = std::chrono::sys_days;

/**
 * Parses a calendar date.
 *
 * Accepts `YYYY-MM-DD` or `YYYY/MM/DD` (one or two digit month and day, one
 * separator used throughout),
 * optionally followed by a time part introduced by 'T' or a space, which is
 * ignored. Returns nullopt for anything else, including impossible dates
 * such as 2023-02-30.
 */
std::optional<Date> ParseDate(std::string_view text);

/**
 * Column form of ParseDate.
 *
 * Returns a timestamp[ns] array aligned with `cells`, holding midnight of each
 * parsed date and null where the cell is null or not a valid date. Text cells
 * follow the ParseDate rules; date and timestamp cells are truncated to the
 * day; cells of any other type are read as their text.
 */
std::shared_ptr<arrow::Array>
ParseDates(std::shared_ptr<arrow::Array> const &cells);

// "YYYY-MM" per timestamp
std::shared_ptr<arrow::Array>
MonthBuckets(std::shared_ptr<arrow::Array> const &timestamps);

// Midnight of the first day of the month, per timestamp
std::shared_ptr<arrow::Array>
MonthStarts(std::shared_ptr<arrow::Array> const &timestamps);

// YYYY-MM-DD
std::string FormatDate(Date date);

// YYYY-MM, the string bucket used by the month filter
std::string FormatMonthBucket(Date date);

epoch_frame::DateTime ToDateTime(Date date);

// Nanoseconds since the epoch, as stored in timestamp columns
Date FromTimestamp(int64_t nanoseconds);

} // namespace retail_lens::calendar
