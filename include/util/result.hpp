#pragma once
#include <string>
#include <utility>

namespace gzinspect {

struct Result {
    bool ok{true};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    // Prepends "<context>: " to the message of a failed result.
    Result WithContext(const std::string& context) const {
        if (ok) return *this;
        return Fail(err, context + ": " + msg);
    }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m)};
    }
};

} // namespace gzinspect
