// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#ifndef CLUECAST__UTILITIES__RECORD_ID_H
#define CLUECAST__UTILITIES__RECORD_ID_H

#include <cstdint>
#include <cstdlib>
#include <functional>
#include <optional>
#include <ostream>
#include <string>


/*
 * Store assigned identifier, tagged by record kind so that a RoundId
 * can not be passed where a GameId is expected. Zero is None.
 */
template <typename Tag>
class RecordId {
    std::uint64_t value_{};

public:
    static const RecordId None;

    constexpr RecordId() noexcept = default;
    constexpr explicit RecordId(std::uint64_t value) noexcept : value_{value} {}

    [[nodiscard]] constexpr std::uint64_t value() const noexcept { return value_; }

    [[nodiscard]] std::string str() const { return std::to_string(value_); }

    static std::optional<RecordId> parse(const std::string& value) {
        if (value.empty() || value.size() > 19) {
            return std::nullopt;
        }
        for (char c : value) {
            if (c < '0' || c > '9') {
                return std::nullopt;
            }
        }
        auto result = RecordId{std::strtoull(value.c_str(), nullptr, 10)};
        if (!result) {
            return std::nullopt;
        }
        return result;
    }

    constexpr explicit operator bool() const noexcept { return value_ != 0; }
    constexpr bool operator !() const noexcept { return value_ == 0; }

    constexpr bool operator==(const RecordId& other) const noexcept { return value_ == other.value_; }
    constexpr bool operator!=(const RecordId& other) const noexcept { return value_ != other.value_; }
    constexpr bool operator<(const RecordId& other) const noexcept { return value_ < other.value_; }
    constexpr bool operator>(const RecordId& other) const noexcept { return value_ > other.value_; }
    constexpr bool operator<=(const RecordId& other) const noexcept { return value_ <= other.value_; }
    constexpr bool operator>=(const RecordId& other) const noexcept { return value_ >= other.value_; }

    friend std::ostream& operator<<(std::ostream& os, const RecordId& id) { return os << id.value_; }
};

template <typename Tag>
const RecordId<Tag> RecordId<Tag>::None{};


struct GameTag {};
struct PlayerTag {};
struct RoundTag {};
struct PickTag {};
struct UserTag {};
struct WordTag {};
struct KeywordTag {};

using GameId = RecordId<GameTag>;
using PlayerId = RecordId<PlayerTag>;
using RoundId = RecordId<RoundTag>;
using PickId = RecordId<PickTag>;
using UserId = RecordId<UserTag>;
using WordId = RecordId<WordTag>;
using KeywordId = RecordId<KeywordTag>;


namespace std {

    template <typename Tag>
    struct hash<RecordId<Tag>>
    {
        std::size_t operator()(const RecordId<Tag>& value) const noexcept
        {
            return std::hash<std::uint64_t>{}(value.value());
        }
    };

}


#endif
