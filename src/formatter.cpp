#include "hideez/formatter.hpp"

#include <sstream>

namespace hideez {

using nlohmann::json;

namespace {

std::string scalar_text(const json& v) {
    if (v.is_string())  return v.get<std::string>();
    if (v.is_boolean()) return v.get<bool>() ? "true" : "false";
    if (v.is_null())    return "";
    return v.dump();
}

void mapping_lines(const json& m, const std::string& indent, std::ostringstream& os) {
    for (auto it = m.begin(); it != m.end(); ++it) {
        if (it->is_object() && !it->empty()) {
            for (auto in = it->begin(); in != it->end(); ++in)
                os << indent << it.key() << '.' << in.key() << ": " << scalar_text(*in) << '\n';
        } else {
            os << indent << it.key() << ": " << scalar_text(*it) << '\n';
        }
    }
}

std::string text(const Result& r) {
    std::ostringstream os;
    switch (r.kind) {
        case ResultKind::None:
            break;
        case ResultKind::Message:
            os << r.message_type << '\n';
            if (r.value.is_object()) mapping_lines(r.value, "  ", os);
            break;
        case ResultKind::Mapping:
            if (r.value.is_object()) mapping_lines(r.value, "", os);
            else os << scalar_text(r.value) << '\n';
            break;
        case ResultKind::Sequence:
            if (r.value.is_array()) {
                for (const auto& e : r.value) os << scalar_text(e) << '\n';
            } else {
                os << scalar_text(r.value) << '\n';
            }
            break;
        case ResultKind::Scalar:
            os << scalar_text(r.value) << '\n';
            break;
    }
    return os.str();
}

} // namespace

std::string format_result(const Result& r, bool as_json) {
    if (r.kind == ResultKind::None) return {};
    if (!as_json) return text(r);

    if (r.kind == ResultKind::Message)
        return json{{r.message_type, r.value}}.dump() + "\n";
    return r.value.dump(4) + "\n";
}

} // namespace hideez
