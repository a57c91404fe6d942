#pragma once
/**
 * @file prompt.hpp
 * @brief Line-oriented interactive questions on a pair of streams.
 *
 * A question is shown as `text [default]: ` (or `text: ` without a default).
 * An empty line takes the default. A validator may reject the answer, in
 * which case `Error: <reason>` is printed and the question repeats.
 * End of input takes the default when there is one, otherwise the call
 * fails with "input_closed".
 */

#include <functional>
#include <iosfwd>
#include <optional>
#include <string>

namespace hideez {

class Prompt {
public:
    /// Accepts or rejects an answer; on rejection sets the reason.
    using Validator = std::function<bool(const std::string& answer, std::string& reason)>;

    Prompt(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

    bool ask(const std::string& text,
             const std::optional<std::string>& def,
             std::string& answer,
             std::string& err,
             const Validator& validate = nullptr);

    std::ostream& out() { return out_; }

private:
    std::istream& in_;
    std::ostream& out_;
};

} // namespace hideez
