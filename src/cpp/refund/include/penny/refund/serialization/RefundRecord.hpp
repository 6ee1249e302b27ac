/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "penny/refund/RefundRecord.hpp"
#include "penny/serialization/msgpack_util.hpp"

//-------------------------------------------------------------------------

namespace penny::serialization
{

//-------------------------------------------------------------------------

inline constexpr uint32_t kRefundRecordsVersion = 1;

/**
 * Packs a refund history as {"version": 1, "records": [RefundRecord...]} for
 * the persistence layer.
 */
[[nodiscard]] inline std::vector<char> packRefundRecords(
    std::span<const refund::RefundRecord> records)
{
    BinaryStream stream;
    msgpack::packer packer{stream};
    packer.pack_map(2);
    packer.pack("version");
    packer.pack(kRefundRecordsVersion);
    packer.pack("records");
    packer.pack_array(static_cast<uint32_t>(records.size()));
    for (const auto& record : records) {
        packer.pack(record);
    }
    return std::vector<char>(stream.data(), stream.data() + stream.size());
}

// Throws MsgPackError on anything that is not a packed refund history.
[[nodiscard]] inline std::vector<refund::RefundRecord> unpackRefundRecords(
    std::span<const char> bytes)
{
    try {
        const msgpack::object_handle handle = msgpack::unpack(bytes.data(), bytes.size());
        const msgpack::object& o = handle.get();
        if (o.type != msgpack::type::MAP) {
            throw MsgPackError{"Refund history is not a map"};
        }
        const auto versionPtr = msgpackFind(o, "version");
        if (versionPtr == nullptr) {
            throw MsgPackError{"Missing field 'version'"};
        }
        if (const auto version = versionPtr->as<uint32_t>(); version != kRefundRecordsVersion) {
            throw MsgPackError{fmt::format("Unsupported refund history version {}", version)};
        }
        const auto recordsPtr = msgpackFind(o, "records");
        if (recordsPtr == nullptr || recordsPtr->type != msgpack::type::ARRAY) {
            throw MsgPackError{"Missing field 'records'"};
        }
        return recordsPtr->as<std::vector<refund::RefundRecord>>();
    }
    catch (const MsgPackError&) {
        throw;
    }
    catch (const msgpack::type_error&) {
        throw MsgPackError{"Malformed refund record"};
    }
    catch (const msgpack::unpack_error& e) {
        throw MsgPackError{e.what()};
    }
}

//-------------------------------------------------------------------------

}  // namespace penny::serialization

//-------------------------------------------------------------------------
