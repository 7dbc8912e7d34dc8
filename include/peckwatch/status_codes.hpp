#pragma once

namespace peckwatch {

// Result codes shared by the engine modules. Per-message and per-window
// codes never leave the session; NotReady and ConfigError are startup-time.
enum class Status {
    Ok = 0,
    InvalidWindowLength,
    DecodeError,
    InferenceError,
    EmptyCategory,
    NotFound,
    NoReaction,   // dispatcher had nothing to do (not triggered or SILENT)
    NotReady,
    ConfigError,
};

// Stable snake_case identifier used on the wire and in logs.
const char* status_name(Status s);

inline bool ok(Status s) { return s == Status::Ok; }

} // namespace peckwatch
