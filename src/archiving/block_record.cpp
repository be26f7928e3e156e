// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <archiving/block_record.h>

#include <hash.h>
#include <streams.h>
#include <tinyformat.h>
#include <util.h>

namespace archiving {

std::vector<unsigned char> BlockRecord::GetFramedBytes() const
{
    CDataStream ss(SER_DISK, 0);
    ss << *this;
    return std::vector<unsigned char>(ss.begin(), ss.end());
}

uint256 BlockRecord::GetHash() const
{
    return Hash(payload.begin(), payload.end());
}

std::string LastArchivedRecord::ToString() const
{
    if (IsComplete()) {
        return strprintf("LastArchivedRecord(number=%u, complete)", number);
    }
    return strprintf("LastArchivedRecord(number=%u, archivedBytes=%u)", number, archivedBytes);
}

} // namespace archiving
