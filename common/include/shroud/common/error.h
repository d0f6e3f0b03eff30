#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include <fmt/format.h>

namespace shroud {

/**
 * Conversion of an error code to a human-readable string.
 * Must be specialized for every error enum used with `Error`.
 */
template <typename Enum>
struct ErrorCodeToString;

class ErrorBase {
public:
    virtual ~ErrorBase() = default;

    /** Full description of the error including nested ones */
    [[nodiscard]] virtual std::string str() const = 0;
};

template <typename Enum>
class ErrorImpl;

/** Error is a shared pointer to an error description, `nullptr` means "no error" */
template <typename Enum>
using Error = std::shared_ptr<ErrorImpl<Enum>>;

template <typename Enum>
class ErrorImpl : public ErrorBase {
public:
    ErrorImpl(Enum value, std::string message, std::shared_ptr<ErrorBase> next)
            : m_value(value)
            , m_message(std::move(message))
            , m_next(std::move(next)) {
    }

    [[nodiscard]] Enum value() const {
        return m_value;
    }

    [[nodiscard]] const std::string &message() const {
        return m_message;
    }

    [[nodiscard]] const std::shared_ptr<ErrorBase> &next() const {
        return m_next;
    }

    [[nodiscard]] std::string str() const override {
        std::string result = ErrorCodeToString<Enum>()(m_value);
        if (!m_message.empty()) {
            result = fmt::format("{}: {}", result, m_message);
        }
        if (m_next != nullptr) {
            result = fmt::format("{}\nCaused by: {}", result, m_next->str());
        }
        return result;
    }

private:
    Enum m_value;
    std::string m_message;
    std::shared_ptr<ErrorBase> m_next;
};

template <typename Enum>
Error<Enum> make_error(Enum value) {
    return std::make_shared<ErrorImpl<Enum>>(value, std::string{}, nullptr);
}

template <typename Enum>
Error<Enum> make_error(Enum value, std::string message) {
    return std::make_shared<ErrorImpl<Enum>>(value, std::move(message), nullptr);
}

template <typename Enum, typename NextEnum>
Error<Enum> make_error(Enum value, Error<NextEnum> next) {
    return std::make_shared<ErrorImpl<Enum>>(value, std::string{}, std::move(next));
}

template <typename Enum, typename NextEnum>
Error<Enum> make_error(Enum value, std::string message, Error<NextEnum> next) {
    return std::make_shared<ErrorImpl<Enum>>(value, std::move(message), std::move(next));
}

/**
 * Either a value or an error.
 * Checking `has_error()` is mandatory before calling `value()`.
 */
template <typename T, typename Enum>
class Result {
public:
    Result() = default;

    template <typename U, typename = std::enable_if_t<std::is_convertible_v<U &&, T>>>
    Result(U &&value) // NOLINT(google-explicit-constructor)
            : m_data(std::in_place_index<0>, std::forward<U>(value)) {
    }

    Result(Error<Enum> error) // NOLINT(google-explicit-constructor)
            : m_data(std::in_place_index<1>, std::move(error)) {
    }

    [[nodiscard]] bool has_value() const {
        return m_data.index() == 0;
    }

    [[nodiscard]] bool has_error() const {
        return m_data.index() == 1;
    }

    [[nodiscard]] const Error<Enum> &error() const {
        return std::get<1>(m_data);
    }

    T &value() & {
        return std::get<0>(m_data);
    }

    const T &value() const & {
        return std::get<0>(m_data);
    }

    T &&value() && {
        return std::get<0>(std::move(m_data));
    }

    T &operator*() {
        return value();
    }

    const T &operator*() const {
        return value();
    }

    T *operator->() {
        return &value();
    }

    const T *operator->() const {
        return &value();
    }

    explicit operator bool() const {
        return has_value();
    }

private:
    std::variant<T, Error<Enum>> m_data;
};

} // namespace shroud
