// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <archiving/archiving_common.h>

namespace archiving {

std::string GetArchiveErrorName(ArchiveError error)
{
    switch (error) {
        case ArchiveError::NONE:                return "none";
        case ArchiveError::INSUFFICIENT_SHARDS: return "insufficient-shards";
        case ArchiveError::CORRUPT_SHARD:       return "corrupt-shard";
        case ArchiveError::COMMITMENT_MISMATCH: return "commitment-mismatch";
        case ArchiveError::MISSING_PREDECESSOR: return "missing-predecessor";
        case ArchiveError::BUFFER_UNDERFLOW:    return "buffer-underflow";
        case ArchiveError::INVALID_RECORD:      return "invalid-record";
        case ArchiveError::INVALID_PARAMS:      return "invalid-params";
    }
    return "unknown";
}

std::string ArchiveState::ToString() const
{
    if (IsValid()) {
        return "valid";
    }
    std::string str = GetArchiveErrorName(error);
    if (!strRejectReason.empty()) {
        str += ": " + strRejectReason;
    }
    if (!strDebugMessage.empty()) {
        str += " (" + strDebugMessage + ")";
    }
    return str;
}

} // namespace archiving
