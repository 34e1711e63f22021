#pragma once

#include <boost/uuid/uuid.hpp>
#include <google/protobuf/message.h>
#include <zlib.h>

#include <stdint.h>
#include <algorithm>
#include <set>
#include <string>
#include <string_view>
#include <utility>

#include "errors.hpp"
#include "util.hpp"
#include "wire_codec.hpp"

namespace libetcdgw {

using Uuid = boost::uuids::uuid;

// Maps application keys to the bytes that follow the slot prefix. The
// encoding must preserve the order in which keys are expected to be scanned.
template<class K>
class KeyCodec
{
public:
    using key_type = K;

    virtual std::string encode(const K &key) const = 0;
    virtual K decode(std::string_view data) const = 0;
    virtual ~KeyCodec() = default;
};

template<class V>
class ValueCodec
{
public:
    using value_type = V;

    virtual std::string encode(const V &value) const = 0;
    virtual V decode(std::string_view data) const = 0;
    virtual ~ValueCodec() = default;
};


class StringCodec : public KeyCodec<std::string>, public ValueCodec<std::string>
{
public:
    std::string encode(const std::string &value) const override { return value; }
    std::string decode(std::string_view data) const override { return std::string(data); }
};

// unsigned 64-bit object ids, big-endian
class OidCodec : public KeyCodec<uint64_t>, public ValueCodec<uint64_t>
{
public:
    std::string encode(const uint64_t &value) const override { return util::pack_u64(value); }
    uint64_t decode(std::string_view data) const override { return util::unpack_u64(data); }
};

class Uint16Codec : public KeyCodec<uint16_t>, public ValueCodec<uint16_t>
{
public:
    std::string encode(const uint16_t &value) const override { return util::pack_u16(value); }

    uint16_t decode(std::string_view data) const override
    {
        if (data.size() != 2)
            throw CodecError("need 2 bytes to decode uint16, got " + std::to_string(data.size()));
        return util::unpack_u16(data);
    }
};

namespace detail {

inline Uuid decode_uuid(std::string_view data)
{
    if (data.size() < Uuid::static_size())
        throw CodecError("need 16 bytes to decode a UUID, got " + std::to_string(data.size()));
    Uuid uuid;
    std::copy(data.begin(), data.begin() + Uuid::static_size(), uuid.begin());
    return uuid;
}

inline void append_uuid(std::string &out, const Uuid &uuid)
{
    out.append(reinterpret_cast<const char *>(uuid.data), Uuid::static_size());
}

} // namespace detail

class UuidCodec : public KeyCodec<Uuid>, public ValueCodec<Uuid>
{
public:
    std::string encode(const Uuid &value) const override
    {
        std::string result;
        detail::append_uuid(result, value);
        return result;
    }

    Uuid decode(std::string_view data) const override
    {
        if (data.size() != Uuid::static_size())
            throw CodecError("need 16 bytes to decode a UUID, got " + std::to_string(data.size()));
        return detail::decode_uuid(data);
    }
};

// (uuid, string): the 16 uuid bytes followed by the string bytes
class UuidStringCodec : public KeyCodec<std::pair<Uuid, std::string>>,
                        public ValueCodec<std::pair<Uuid, std::string>>
{
public:
    std::string encode(const std::pair<Uuid, std::string> &value) const override
    {
        std::string result;
        detail::append_uuid(result, value.first);
        result.append(value.second);
        return result;
    }

    std::pair<Uuid, std::string> decode(std::string_view data) const override
    {
        auto uuid = detail::decode_uuid(data);
        data.remove_prefix(Uuid::static_size());
        return {uuid, std::string(data)};
    }
};

class UuidUuidCodec : public KeyCodec<std::pair<Uuid, Uuid>>, public ValueCodec<std::pair<Uuid, Uuid>>
{
public:
    std::string encode(const std::pair<Uuid, Uuid> &value) const override
    {
        std::string result;
        detail::append_uuid(result, value.first);
        detail::append_uuid(result, value.second);
        return result;
    }

    std::pair<Uuid, Uuid> decode(std::string_view data) const override
    {
        if (data.size() != 2 * Uuid::static_size())
            throw CodecError("need 32 bytes to decode a UUID pair, got " + std::to_string(data.size()));
        return {detail::decode_uuid(data), detail::decode_uuid(data.substr(Uuid::static_size()))};
    }
};

// set of UUIDs as concatenated 16-byte records
class UuidSetCodec : public ValueCodec<std::set<Uuid>>
{
public:
    std::string encode(const std::set<Uuid> &value) const override
    {
        std::string result;
        result.reserve(value.size() * Uuid::static_size());
        for (const auto &uuid : value)
            detail::append_uuid(result, uuid);
        return result;
    }

    std::set<Uuid> decode(std::string_view data) const override
    {
        if (data.size() % Uuid::static_size())
            throw CodecError("UUID set of " + std::to_string(data.size()) + " bytes is not a multiple of 16");

        std::set<Uuid> result;
        for (; !data.empty(); data.remove_prefix(Uuid::static_size()))
            result.insert(detail::decode_uuid(data));
        return result;
    }
};

// protobuf binary encoding
template<class M>
class ProtoCodec : public ValueCodec<M>
{
public:
    std::string encode(const M &value) const override
    {
        std::string result;
        if (!value.SerializeToString(&result))
            throw CodecError("cannot serialize " + value.GetTypeName());
        return result;
    }

    M decode(std::string_view data) const override
    {
        M value;
        if (!value.ParseFromArray(data.data(), static_cast<int>(data.size())))
            throw CodecError("cannot parse " + value.GetTypeName());
        return value;
    }
};

// proto3 JSON encoding
template<class M>
class JsonCodec : public ValueCodec<M>
{
public:
    std::string encode(const M &value) const override
    {
        try {
            return wire::to_json(value);
        } catch (const ProtocolError &e) {
            throw CodecError(e.what());
        }
    }

    M decode(std::string_view data) const override
    {
        try {
            return wire::from_json<M>(data);
        } catch (const ProtocolError &e) {
            throw CodecError(e.what());
        }
    }
};


enum class Compression
{
    NONE,
    ZLIB,
};

inline std::string compress(std::string data, Compression compression)
{
    if (compression == Compression::NONE)
        return data;

    uLongf size = compressBound(static_cast<uLong>(data.size()));
    std::string result(size, '\0');
    int rc = compress2(reinterpret_cast<Bytef *>(&result[0]), &size,
                       reinterpret_cast<const Bytef *>(data.data()), static_cast<uLong>(data.size()),
                       Z_DEFAULT_COMPRESSION);
    if (rc != Z_OK)
        throw CodecError("zlib compression failed with code " + std::to_string(rc));

    result.resize(size);
    return result;
}

inline std::string decompress(std::string_view data, Compression compression)
{
    if (compression == Compression::NONE)
        return std::string(data);

    z_stream stream{};
    if (inflateInit(&stream) != Z_OK)
        throw CodecError("zlib inflateInit failed");

    stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(data.data()));
    stream.avail_in = static_cast<uInt>(data.size());

    std::string result;
    char chunk[16384];
    int rc;
    do {
        stream.next_out = reinterpret_cast<Bytef *>(chunk);
        stream.avail_out = sizeof(chunk);
        rc = inflate(&stream, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            inflateEnd(&stream);
            throw CodecError("zlib decompression failed with code " + std::to_string(rc));
        }
        result.append(chunk, sizeof(chunk) - stream.avail_out);
    } while (rc != Z_STREAM_END);

    inflateEnd(&stream);
    return result;
}

} // namespace libetcdgw
