#pragma once
#include <string>
#include <utility>

namespace hotpush {

struct Result {
    bool ok{true};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    int code() const { return err; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m)};
    }

    // Keeps the error code, prefixes the message with where it failed.
    static Result Wrap(const Result& inner, const std::string& context) {
        return Fail(inner.err, context + ": " + inner.msg);
    }
};

} // namespace hotpush
