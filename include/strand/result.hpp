#pragma once

#include <strand/error.hpp>

#include <string>
#include <utility>
#include <variant>

namespace strand {

// Either a value or a StrandError. Nothing in strand throws across a module
// boundary; fallible operations return one of these instead.
template<typename T>
class Result {
public:
    // Implicit so a StrandError can be returned from any Result-returning
    // function (STRAND_TRY relies on this)
    Result(StrandError err) : data_(std::in_place_index<1>, std::move(err)) {}

    static Result ok(T val) { return Result(std::in_place_index<0>, std::move(val)); }
    static Result err(StrandError e) { return Result(std::move(e)); }

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }
    explicit operator bool() const { return is_ok(); }

    // Throws std::bad_variant_access on the wrong alternative
    T& value() & { return std::get<0>(data_); }
    const T& value() const& { return std::get<0>(data_); }
    T&& value() && { return std::get<0>(std::move(data_)); }

    StrandError& error() & { return std::get<1>(data_); }
    const StrandError& error() const& { return std::get<1>(data_); }
    StrandError&& error() && { return std::get<1>(std::move(data_)); }

    T value_or(T fallback) const& {
        return is_ok() ? value() : std::move(fallback);
    }

    // f: T& -> Result<U>
    template<typename F>
    auto and_then(F&& f) -> decltype(f(std::declval<T&>())) {
        using Next = decltype(f(std::declval<T&>()));
        if (is_err()) return Next::err(error());
        return f(value());
    }

    // f: StrandError -> StrandError; Ok passes through
    template<typename F>
    Result map_err(F&& f) && {
        if (is_ok()) return std::move(*this);
        return Result::err(f(std::move(*this).error()));
    }

    // Prefix the error message, e.g. "dependency 'foo': "
    Result context(const std::string& prefix) && {
        return std::move(*this).map_err([&](StrandError e) {
            e.message = prefix + e.message;
            return e;
        });
    }

    // Record the file the error came from, unless one is already set
    Result with_file(const std::string& path) && {
        return std::move(*this).map_err([&](StrandError e) {
            if (e.file.empty()) e.file = path;
            return e;
        });
    }

private:
    template<typename... Args>
    explicit Result(std::in_place_index_t<0> tag, Args&&... args)
        : data_(tag, std::forward<Args>(args)...) {}

    std::variant<T, StrandError> data_;
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define STRAND_TRY(expr) \
    do { \
        auto _strand_result = (expr); \
        if (_strand_result.is_err()) return std::move(_strand_result).error(); \
    } while (0)

} // namespace strand
