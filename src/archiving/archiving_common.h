// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEGARC_ARCHIVING_ARCHIVING_COMMON_H
#define SEGARC_ARCHIVING_ARCHIVING_COMMON_H

/**
 * @file archiving_common.h
 * @brief Common definitions shared by every archiving component
 *
 * Holds the protocol version, the error taxonomy reported by the archiving
 * pipeline, and ArchiveState, the object through which components report a
 * typed failure to their caller.
 */

#include <cstdint>
#include <string>

namespace archiving {

/** Archive protocol version recorded in every segment header */
static constexpr uint32_t ARCHIVE_PROTOCOL_VERSION = 1;

/** Size in bytes of the length prefix framing each block record */
static constexpr uint32_t RECORD_LENGTH_PREFIX_SIZE = 4;

/** Largest payload accepted for a single block record (64 MiB) */
static constexpr uint32_t MAX_RECORD_PAYLOAD_SIZE = 64 * 1024 * 1024;

/** Number of elements in GF(2^8); bounds the total shard count */
static constexpr uint32_t MAX_TOTAL_SHARDS = 256;

/** Largest segment capacity; header offsets into a segment are 32-bit */
static constexpr uint64_t MAX_SEGMENT_CAPACITY = UINT32_MAX;

/** Failure kinds reported by the archiving pipeline */
enum class ArchiveError : uint8_t {
    NONE = 0,
    INSUFFICIENT_SHARDS = 1,    // fewer than k distinct valid shards
    CORRUPT_SHARD = 2,          // wrong length, bad index or bad padding
    COMMITMENT_MISMATCH = 3,    // piece fails its inclusion proof
    MISSING_PREDECESSOR = 4,    // header does not extend the chain tip
    BUFFER_UNDERFLOW = 5,       // not enough buffered bytes for a segment
    INVALID_RECORD = 6,         // record too large or malformed framing
    INVALID_PARAMS = 7          // parameter set failed validation
};

/** Stable name of an error, for logs and messages */
std::string GetArchiveErrorName(ArchiveError error);

/**
 * Captures the outcome of an archiving operation.
 *
 * Functions take an ArchiveState& and return bool; on failure they return
 * state.Invalid(...), which records the error kind and a reason string.
 */
class ArchiveState {
private:
    ArchiveError error;
    std::string strRejectReason;
    std::string strDebugMessage;

public:
    ArchiveState() : error(ArchiveError::NONE) {}

    bool Invalid(ArchiveError errorIn, const std::string& strRejectReasonIn = "",
                 const std::string& strDebugMessageIn = "")
    {
        error = errorIn;
        strRejectReason = strRejectReasonIn;
        strDebugMessage = strDebugMessageIn;
        return false;
    }

    bool IsValid() const { return error == ArchiveError::NONE; }
    bool IsInvalid() const { return error != ArchiveError::NONE; }

    ArchiveError GetError() const { return error; }
    const std::string& GetRejectReason() const { return strRejectReason; }
    const std::string& GetDebugMessage() const { return strDebugMessage; }

    /** One-line description, e.g. "insufficient-shards: have 3, need 4" */
    std::string ToString() const;

    void Reset()
    {
        error = ArchiveError::NONE;
        strRejectReason.clear();
        strDebugMessage.clear();
    }
};

} // namespace archiving

#endif // SEGARC_ARCHIVING_ARCHIVING_COMMON_H
