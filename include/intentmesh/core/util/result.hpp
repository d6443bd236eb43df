/**
 * @file result.hpp
 * @brief Value-or-error return type used across IntentMesh.
 */
#pragma once
#include <utility>
#include <variant>
#include "intentmesh/core/util/error_types.hpp"

namespace intentmesh {

    /**
     * @class Result
     * @brief Holds either a value of type T or an Error.
     */
    template <typename T>
    class Result {
    public:
        Result(const T& value) : data_(value) {}
        Result(T&& value) : data_(std::move(value)) {}
        Result(const Error& error) : data_(error) {}
        Result(Error&& error) : data_(std::move(error)) {}

        bool has_value() const { return std::holds_alternative<T>(data_); }
        bool has_error() const { return std::holds_alternative<Error>(data_); }
        explicit operator bool() const { return has_value(); }

        const T& value() const& { return std::get<T>(data_); }
        T& value() & { return std::get<T>(data_); }
        T&& value() && { return std::get<T>(std::move(data_)); }
        const Error& error() const { return std::get<Error>(data_); }

    private:
        std::variant<T, Error> data_;
    };

    template <>
    class Result<void> {
    public:
        Result() : success_(true) {}
        Result(const Error& error) : success_(false), error_(error) {}
        Result(Error&& error) : success_(false), error_(std::move(error)) {}

        bool has_value() const { return success_; }
        bool has_error() const { return !success_; }
        explicit operator bool() const { return success_; }
        const Error& error() const { return error_; }

    private:
        bool success_ = false;
        Error error_;
    };

}
