// IptvMux - IPTV Stream Multiplexing Proxy
// Result type carrying either a value or an error

#ifndef IPTVMUX_CORE_RESULT_HPP
#define IPTVMUX_CORE_RESULT_HPP

#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace iptvmux {
namespace core {

/**
 * @brief Holds the outcome of a fallible operation.
 *
 * Every layer of IptvMux reports recoverable failures through this type
 * instead of throwing. Accessing the wrong alternative throws
 * std::logic_error, which always indicates a caller bug.
 *
 * @tparam T Value type on success
 * @tparam E Error type on failure
 */
template<typename T, typename E>
class Result {
public:
    static Result success(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    static Result error(E err) {
        return Result(std::in_place_index<1>, std::move(err));
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return storage_.index() == 0;
    }

    [[nodiscard]] bool isError() const noexcept {
        return storage_.index() == 1;
    }

    /**
     * @brief Access the value.
     * @throws std::logic_error if this result holds an error
     */
    [[nodiscard]] T& value() & {
        requireValue();
        return std::get<0>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        requireValue();
        return std::get<0>(storage_);
    }

    [[nodiscard]] T&& value() && {
        requireValue();
        return std::get<0>(std::move(storage_));
    }

    /**
     * @brief Access the error.
     * @throws std::logic_error if this result holds a value
     */
    [[nodiscard]] E& error() & {
        requireError();
        return std::get<1>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        requireError();
        return std::get<1>(storage_);
    }

    /**
     * @brief Value on success, fallback otherwise.
     */
    [[nodiscard]] T valueOr(T fallback) const& {
        return isSuccess() ? std::get<0>(storage_) : fallback;
    }

    [[nodiscard]] T valueOr(T fallback) && {
        return isSuccess() ? std::get<0>(std::move(storage_)) : fallback;
    }

    Result(Result&&) noexcept = default;
    Result& operator=(Result&&) noexcept = default;
    Result(const Result&) = default;
    Result& operator=(const Result&) = default;

private:
    template<std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& payload)
        : storage_(tag, std::forward<U>(payload)) {}

    void requireValue() const {
        if (isError()) {
            throw std::logic_error("Result: value() called on an error result");
        }
    }

    void requireError() const {
        if (isSuccess()) {
            throw std::logic_error("Result: error() called on a success result");
        }
    }

    // Index-based so that T and E may be the same type.
    std::variant<T, E> storage_;
};

/**
 * @brief Result of an operation that produces no value.
 *
 * @tparam E Error type on failure
 */
template<typename E>
class Result<void, E> {
public:
    static Result success() {
        return Result();
    }

    static Result error(E err) {
        return Result(std::move(err));
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return ok_;
    }

    [[nodiscard]] bool isError() const noexcept {
        return !ok_;
    }

    [[nodiscard]] E& error() & {
        if (ok_) {
            throw std::logic_error("Result: error() called on a success result");
        }
        return error_;
    }

    [[nodiscard]] const E& error() const& {
        if (ok_) {
            throw std::logic_error("Result: error() called on a success result");
        }
        return error_;
    }

    Result(Result&&) noexcept = default;
    Result& operator=(Result&&) noexcept = default;
    Result(const Result&) = default;
    Result& operator=(const Result&) = default;

private:
    Result() : error_{}, ok_(true) {}
    explicit Result(E err) : error_(std::move(err)), ok_(false) {}

    E error_;
    bool ok_;
};

} // namespace core
} // namespace iptvmux

#endif // IPTVMUX_CORE_RESULT_HPP
