#pragma once

/// @file notification.hpp
/// @brief Immutable description of one posted notification

#include "fwd.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <variant>

namespace beacon_event {

// =============================================================================
// SourceRef
// =============================================================================

/// Opaque identity of the object a notification is about.
/// Compared by address only; never dereferenced.
class SourceRef {
public:
    constexpr SourceRef() noexcept = default;
    constexpr explicit SourceRef(const void* object) noexcept : m_object(object) {}

    /// Reference the given object
    template<typename T>
    [[nodiscard]] static SourceRef of(const T& object) noexcept {
        return SourceRef(static_cast<const void*>(&object));
    }

    [[nodiscard]] constexpr const void* address() const noexcept { return m_object; }
    [[nodiscard]] constexpr bool is_null() const noexcept { return m_object == nullptr; }

    constexpr bool operator==(const SourceRef&) const noexcept = default;

private:
    const void* m_object = nullptr;
};

std::ostream& operator<<(std::ostream& os, const SourceRef& source);

// =============================================================================
// Payload
// =============================================================================

/// One user-info value
using PayloadValue = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

/// Key/value payload carried by a notification
using UserInfo = std::map<std::string, PayloadValue>;

// =============================================================================
// Notification
// =============================================================================

/// One occurrence of a named event
class Notification {
public:
    explicit Notification(
        NotificationName name,
        std::optional<SourceRef> source = std::nullopt,
        UserInfo payload = {})
        : m_name(std::move(name))
        , m_source(source)
        , m_payload(std::move(payload)) {}

    [[nodiscard]] const NotificationName& name() const noexcept { return m_name; }
    [[nodiscard]] const std::optional<SourceRef>& source() const noexcept { return m_source; }
    [[nodiscard]] const UserInfo& payload() const noexcept { return m_payload; }

    /// Order assigned by the posting center (0 if never posted)
    [[nodiscard]] std::uint64_t sequence_number() const noexcept { return m_sequence_number; }

    [[nodiscard]] bool contains(const std::string& key) const {
        return m_payload.find(key) != m_payload.end();
    }

    /// Typed payload lookup; nullptr when missing or of another type
    template<typename T>
    [[nodiscard]] const T* get(const std::string& key) const {
        auto it = m_payload.find(key);
        if (it == m_payload.end()) {
            return nullptr;
        }
        return std::get_if<T>(&it->second);
    }

    /// Copy with the center's sequence number stamped on it
    [[nodiscard]] Notification stamped(std::uint64_t sequence_number) const {
        Notification copy(*this);
        copy.m_sequence_number = sequence_number;
        return copy;
    }

private:
    NotificationName m_name;
    std::optional<SourceRef> m_source;
    UserInfo m_payload;
    std::uint64_t m_sequence_number = 0;
};

std::ostream& operator<<(std::ostream& os, const Notification& notification);

} // namespace beacon_event

template<>
struct std::hash<beacon_event::SourceRef> {
    std::size_t operator()(const beacon_event::SourceRef& source) const noexcept {
        return std::hash<const void*>{}(source.address());
    }
};
