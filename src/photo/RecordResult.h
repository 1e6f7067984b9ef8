// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <optional>
#include <string>
#include <utility>

enum class ErrorKind
{
    NONE,
    UNREADABLE,             // file could not be read or is not an image
    BAD_METADATA,           // EXIF present but malformed
    BAD_LOCATION,           // GPS tags present but unusable
    UNSUPPORTED_FORMAT,     // no embeddable image data (PNG, HEIC)
    RENAME_FAILED
};

inline const char* errorKindName(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::NONE:               return "ok";
    case ErrorKind::UNREADABLE:         return "unreadable";
    case ErrorKind::BAD_METADATA:       return "bad metadata";
    case ErrorKind::BAD_LOCATION:       return "bad location";
    case ErrorKind::UNSUPPORTED_FORMAT: return "unsupported format";
    case ErrorKind::RENAME_FAILED:      return "rename failed";
    }
    return "unknown";
}

// Outcome of processing one record of a batch. A degraded result still
// carries a value (with sentinel fields filled in); a dropped result
// carries none, and the record is left out of the batch.

template<typename T>
class RecordResult
{
public:
    static RecordResult ok(T value)
    {
        return RecordResult(std::move(value), ErrorKind::NONE, std::string());
    }

    static RecordResult degraded(T value, ErrorKind kind, std::string message)
    {
        return RecordResult(std::move(value), kind, std::move(message));
    }

    static RecordResult dropped(ErrorKind kind, std::string message)
    {
        return RecordResult(std::nullopt, kind, std::move(message));
    }

    bool hasValue() const { return value_.has_value(); }
    bool isOk() const { return kind_ == ErrorKind::NONE; }
    bool isDegraded() const { return hasValue() && !isOk(); }
    bool isDropped() const { return !hasValue(); }

    const T& value() const { return *value_; }
    T& value() { return *value_; }
    T take() { return std::move(*value_); }

    ErrorKind errorKind() const { return kind_; }
    const std::string& message() const { return message_; }

private:
    RecordResult(std::optional<T> value, ErrorKind kind, std::string message) :
        value_(std::move(value)),
        kind_(kind),
        message_(std::move(message))
    {
    }

    std::optional<T> value_;
    ErrorKind kind_;
    std::string message_;
};
