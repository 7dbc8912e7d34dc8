#include "status_codes.hpp"

namespace peckwatch {

const char* status_name(Status s) {
    switch (s) {
        case Status::Ok: return "ok";
        case Status::InvalidWindowLength: return "invalid_window_length";
        case Status::DecodeError: return "decode_error";
        case Status::InferenceError: return "inference_error";
        case Status::EmptyCategory: return "empty_category";
        case Status::NotFound: return "not_found";
        case Status::NoReaction: return "no_reaction";
        case Status::NotReady: return "not_ready";
        case Status::ConfigError: return "config_error";
    }
    return "unknown";
}

} // namespace peckwatch
