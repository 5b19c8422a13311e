#pragma once

/// @file unsafe_sendable.hpp
/// @brief Opaque wrapper for values handed across threads without their own guarantees
///
/// Wrap at the point of capture (a producer callback), unwrap only at the
/// single consumer site. The wrapped value must not be touched by the
/// producer after wrapping. This is an audited exception for moving
/// notification payloads through an AsyncBuffer, not a general pattern.

#include "fwd.hpp"
#include <utility>

namespace beacon_stream {

template<typename T>
class UnsafeSendable {
public:
    using value_type = T;

    explicit UnsafeSendable(T value) : m_value(std::move(value)) {}

    /// Access the wrapped value (consumer side only)
    [[nodiscard]] const T& value() const& noexcept { return m_value; }

    /// Move the wrapped value out (consumer side only)
    [[nodiscard]] T take() && { return std::move(m_value); }

private:
    T m_value;
};

} // namespace beacon_stream
