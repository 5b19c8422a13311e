/// @file notification.cpp
/// @brief Notification formatting for logs and test output

#include <beacon/event/notification.hpp>

namespace beacon_event {

std::ostream& operator<<(std::ostream& os, const SourceRef& source) {
    if (source.is_null()) {
        return os << "source(null)";
    }
    return os << "source(" << source.address() << ")";
}

std::ostream& operator<<(std::ostream& os, const Notification& notification) {
    os << "Notification{" << notification.name();
    if (notification.source()) {
        os << ", " << *notification.source();
    }
    if (notification.sequence_number() != 0) {
        os << ", #" << notification.sequence_number();
    }

    if (!notification.payload().empty()) {
        os << ", {";
        bool first = true;
        for (const auto& [key, value] : notification.payload()) {
            if (!first) os << ", ";
            os << key << "=";
            std::visit([&os](const auto& v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    os << "null";
                } else if constexpr (std::is_same_v<T, bool>) {
                    os << (v ? "true" : "false");
                } else if constexpr (std::is_same_v<T, std::string>) {
                    os << "\"" << v << "\"";
                } else {
                    os << v;
                }
            }, value);
            first = false;
        }
        os << "}";
    }

    return os << "}";
}

} // namespace beacon_event
