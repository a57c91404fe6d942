#pragma once
/**
 * @file formatter.hpp
 * @brief Render a command result as text or JSON.
 *
 * @details
 * JSON mode:
 *   - Message: `{"<Type>":{fields}}` on one line
 *   - Mapping, Sequence, Scalar: 4-space indented, keys sorted
 *
 * Text mode:
 *   - Sequence: one element per line
 *   - Mapping:  `key: value`; a nested mapping is flattened one level
 *               to `outer.inner: value`
 *   - Message:  the type name, then the fields as above indented by two
 *   - Scalar:   strings unquoted, booleans `true`/`false`
 *
 * None renders as the empty string. Every non-empty rendering ends in '\n'.
 */

#include "hideez/result.hpp"

#include <string>

namespace hideez {

std::string format_result(const Result& r, bool as_json);

} // namespace hideez
