#pragma once

/// @file types.hpp
/// @brief Strong ID types and the ordered payload map shared by all components.

#include <cstdint>
#include <functional>
#include <map>
#include <string>

namespace sluice::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// Prevents mixing request and connection identifiers at compile time
/// while keeping the same underlying representation.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct RequestIdTag {};
struct ConnectionIdTag {};
struct WorkerIdTag {};

/// Identifier assigned by admission control to each accepted request.
using RequestId = StrongId<RequestIdTag>;

/// Identifier of a pooled store connection.
using ConnectionId = StrongId<ConnectionIdTag>;

/// Identifier of a scheduler worker (1-based).
using WorkerId = StrongId<WorkerIdTag, uint32_t>;

template <typename Tag, typename T>
constexpr StrongId<Tag, T> NULL_ID{};

/// Request payload and key inputs.
///
/// An ordered map so that iteration order is already the canonical
/// (sorted-key) order used for hashing.
using Payload = std::map<std::string, std::string>;

} // namespace sluice::foundation

// Hash support for use in unordered containers.
template <typename Tag, typename T>
struct std::hash<sluice::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const sluice::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
