#pragma once

#include <stdint.h>
#include <optional>
#include <string>
#include <utility>

#include "errors.hpp"

namespace libetcdgw {

// The documented prefix range end: bump the last byte. Keys ending in 0xFF
// and the empty key have no such end and are rejected.
inline std::string increment_last_byte(std::string key)
{
    if (key.empty())
        throw InvalidArgument("cannot compute a prefix range end for an empty key");

    auto last = static_cast<uint8_t>(key.back());
    if (last == 0xFF)
        throw InvalidArgument("cannot compute a prefix range end for a key ending in 0xFF");

    key.back() = static_cast<char>(last + 1);
    return key;
}

class KeyRange
{
public:
    enum class Mode
    {
        SINGLE,
        PREFIX,
        RANGE,
    };

private:
    std::string start_;
    std::string end_;
    Mode mode_;

    KeyRange(std::string start, std::string end, Mode mode)
        : start_(std::move(start))
        , end_(std::move(end))
        , mode_{mode}
    {}

public:
    // single key
    KeyRange(std::string key)
        : KeyRange(std::move(key), "", Mode::SINGLE)
    {}

    KeyRange(const char *key)
        : KeyRange(std::string(key))
    {}

    KeyRange(std::string key, std::optional<std::string> range_end, bool prefix)
        : start_(std::move(key))
        , mode_{Mode::SINGLE}
    {
        if (range_end && prefix)
            throw InvalidArgument("range_end and prefix are mutually exclusive");

        if (prefix) {
            increment_last_byte(start_);
            mode_ = Mode::PREFIX;
        } else if (range_end) {
            end_ = std::move(*range_end);
            mode_ = Mode::RANGE;
        }
    }

    static KeyRange single(std::string key)
    {
        return KeyRange(std::move(key), "", Mode::SINGLE);
    }

    static KeyRange prefix(std::string key)
    {
        return KeyRange(std::move(key), std::nullopt, true);
    }

    static KeyRange range(std::string start, std::string end)
    {
        return KeyRange(std::move(start), std::string(std::move(end)), Mode::RANGE);
    }

    // Every key in the store: start "\0" with the open-ended range end "\0".
    static KeyRange all()
    {
        return KeyRange(std::string(1, '\0'), std::string(1, '\0'), Mode::RANGE);
    }

    const std::string& start() const { return start_; }

    Mode mode() const { return mode_; }

    std::optional<std::string> resolve_end() const
    {
        switch (mode_) {
            case Mode::SINGLE:
                return std::nullopt;
            case Mode::PREFIX:
                return increment_last_byte(start_);
            case Mode::RANGE:
                return end_;
        }
        return std::nullopt;
    }

    bool contains(const std::string &key) const
    {
        if (mode_ == Mode::SINGLE)
            return key == start_;

        if (key < start_)
            return false;

        auto end = *resolve_end();
        if (end.empty())
            return key == start_;
        if (end == std::string(1, '\0'))
            return true;
        return key < end;
    }

    bool operator==(const KeyRange &that) const
    {
        return mode_ == that.mode_ && start_ == that.start_ && end_ == that.end_;
    }

    bool operator!=(const KeyRange &that) const { return !(*this == that); }
};

} // namespace libetcdgw
