// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEGARC_ARCHIVING_BLOCK_RECORD_H
#define SEGARC_ARCHIVING_BLOCK_RECORD_H

/**
 * @file block_record.h
 * @brief Block records and their position in the archived history
 *
 * A block record is the opaque serialization of one finalized block plus any
 * proof data needed to rebuild chain state from the archive. In the archived
 * byte stream every record is framed by a 4-byte little-endian length prefix,
 * so records can be split back apart after reconstruction.
 */

#include <archiving/archiving_common.h>
#include <serialize.h>
#include <uint256.h>

#include <cstdint>
#include <ios>
#include <string>
#include <utility>
#include <vector>

namespace archiving {

/**
 * @brief One block's canonical serialization, as handed to the archiver
 */
struct BlockRecord {
    /** Opaque block bytes (block + auxiliary proof data) */
    std::vector<unsigned char> payload;

    BlockRecord() = default;
    explicit BlockRecord(std::vector<unsigned char> payloadIn) : payload(std::move(payloadIn)) {}

    /** Framed form: length prefix followed by the payload */
    template<typename Stream>
    void Serialize(Stream& s) const {
        ser_writedata32(s, static_cast<uint32_t>(payload.size()));
        if (!payload.empty()) {
            s.write(reinterpret_cast<const char*>(payload.data()), payload.size());
        }
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        uint32_t nLength = ser_readdata32(s);
        if (nLength > MAX_RECORD_PAYLOAD_SIZE) {
            throw std::ios_base::failure("BlockRecord: payload length exceeds maximum");
        }
        payload.resize(nLength);
        if (nLength > 0) {
            s.read(reinterpret_cast<char*>(payload.data()), nLength);
        }
    }

    /** Bytes this record occupies in the archived stream */
    uint64_t GetFramedSize() const { return RECORD_LENGTH_PREFIX_SIZE + payload.size(); }

    /** Length prefix + payload as one byte vector */
    std::vector<unsigned char> GetFramedBytes() const;

    /** Hash of the payload, for logging and tests */
    uint256 GetHash() const;

    bool operator==(const BlockRecord& other) const { return payload == other.payload; }
    bool operator!=(const BlockRecord& other) const { return !(*this == other); }
};

/**
 * @brief The last record touched by a segment
 *
 * Identifies the record containing the segment's final byte. A record that
 * ends exactly at the segment boundary is complete (archivedBytes == 0);
 * otherwise archivedBytes counts its framed bytes archived so far, the rest
 * continuing into the next segment.
 */
struct LastArchivedRecord {
    /** Sequential record number, starting at 0 */
    uint64_t number;

    /** Framed bytes archived so far; 0 if the record is complete */
    uint32_t archivedBytes;

    LastArchivedRecord() : number(0), archivedBytes(0) {}
    LastArchivedRecord(uint64_t numberIn, uint32_t archivedBytesIn)
        : number(numberIn), archivedBytes(archivedBytesIn) {}

    ADD_SERIALIZE_METHODS;

    template <typename Stream, typename Operation>
    inline void SerializationOp(Stream& s, Operation ser_action) {
        READWRITE(number);
        READWRITE(archivedBytes);
    }

    bool IsComplete() const { return archivedBytes == 0; }

    std::string ToString() const;

    bool operator==(const LastArchivedRecord& other) const {
        return number == other.number && archivedBytes == other.archivedBytes;
    }
    bool operator!=(const LastArchivedRecord& other) const { return !(*this == other); }
};

/**
 * @brief A record recovered from the archive together with its number
 */
struct NumberedRecord {
    uint64_t number;
    BlockRecord record;

    NumberedRecord() : number(0) {}
    NumberedRecord(uint64_t numberIn, BlockRecord recordIn)
        : number(numberIn), record(std::move(recordIn)) {}
};

} // namespace archiving

#endif // SEGARC_ARCHIVING_BLOCK_RECORD_H
