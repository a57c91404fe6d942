#pragma once
/**
 * @file result.hpp
 * @brief The value a command hands to the formatter.
 */

#include <nlohmann/json.hpp>

#include <string>
#include <utility>

namespace hideez {

enum class ResultKind {
    None,       // nothing to print
    Message,    // a device message: type name + field mapping
    Mapping,
    Sequence,
    Scalar
};

struct Result {
    ResultKind kind{ResultKind::None};
    std::string message_type;   // Message only
    nlohmann::json value;
};

/// Wrap a response struct; T needs a TYPE name and a to_json overload.
template <typename T>
Result make_message(const T& msg) {
    return Result{ResultKind::Message, T::TYPE, nlohmann::json(msg)};
}

inline Result make_mapping(nlohmann::json v)  { return Result{ResultKind::Mapping, {}, std::move(v)}; }
inline Result make_sequence(nlohmann::json v) { return Result{ResultKind::Sequence, {}, std::move(v)}; }
inline Result make_scalar(nlohmann::json v)   { return Result{ResultKind::Scalar, {}, std::move(v)}; }

} // namespace hideez
