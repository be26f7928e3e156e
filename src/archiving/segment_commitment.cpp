// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <archiving/segment_commitment.h>

#include <tinyformat.h>
#include <util.h>

#include <stdexcept>

namespace archiving {

uint256 SegmentMerkleTree::HashLeaf(const std::vector<unsigned char>& data, HashAlgorithm algo)
{
    return Hash(data.begin(), data.end(), algo);
}

uint256 SegmentMerkleTree::HashNode(const uint256& left, const uint256& right, HashAlgorithm algo)
{
    CHashWriter ss(SER_GETHASH, 0, algo);
    ss << left << right;
    return ss.GetHash();
}

uint32_t SegmentMerkleTree::GetDepth(size_t leafCount)
{
    uint32_t depth = 0;
    size_t width = 1;
    while (width < leafCount) {
        width <<= 1;
        ++depth;
    }
    return depth;
}

SegmentMerkleTree::SegmentMerkleTree(const std::vector<std::vector<unsigned char>>& pieceData,
                                     HashAlgorithm algoIn)
    : algo(algoIn)
{
    if (pieceData.empty()) {
        return;
    }

    std::vector<uint256> leaves;
    leaves.reserve(pieceData.size());
    for (const auto& data : pieceData) {
        leaves.push_back(HashLeaf(data, algo));
    }
    levels.push_back(std::move(leaves));

    while (levels.back().size() > 1) {
        const std::vector<uint256>& level = levels.back();
        std::vector<uint256> nextLevel;
        nextLevel.reserve((level.size() + 1) / 2);
        for (size_t i = 0; i < level.size(); i += 2) {
            // Odd element - hash with itself
            const uint256& right = (i + 1 < level.size()) ? level[i + 1] : level[i];
            nextLevel.push_back(HashNode(level[i], right, algo));
        }
        levels.push_back(std::move(nextLevel));
    }
}

uint256 SegmentMerkleTree::GetRoot() const
{
    if (levels.empty()) {
        return uint256();
    }
    return levels.back()[0];
}

std::vector<uint256> SegmentMerkleTree::GetProof(size_t index) const
{
    if (index >= GetLeafCount()) {
        throw std::out_of_range(strprintf("SegmentMerkleTree::GetProof: index %u out of range", index));
    }

    std::vector<uint256> proof;
    proof.reserve(levels.size() - 1);
    size_t idx = index;
    for (size_t height = 0; height + 1 < levels.size(); ++height) {
        const std::vector<uint256>& level = levels[height];
        size_t siblingIdx = (idx % 2 == 0) ? idx + 1 : idx - 1;
        proof.push_back(siblingIdx < level.size() ? level[siblingIdx] : level[idx]);
        idx /= 2;
    }
    return proof;
}

bool SegmentMerkleTree::VerifyProof(const uint256& root, size_t index, size_t leafCount,
                                    const std::vector<unsigned char>& data,
                                    const std::vector<uint256>& proof, HashAlgorithm algo)
{
    if (index >= leafCount) {
        return false;
    }
    if (proof.size() != GetDepth(leafCount)) {
        return false;
    }

    uint256 current = HashLeaf(data, algo);
    size_t idx = index;
    for (const uint256& sibling : proof) {
        if (idx % 2 == 0) {
            current = HashNode(current, sibling, algo);
        } else {
            current = HashNode(sibling, current, algo);
        }
        idx /= 2;
    }
    return current == root;
}

uint256 CommitPieces(const std::vector<std::vector<unsigned char>>& pieceData, HashAlgorithm algo)
{
    return SegmentMerkleTree(pieceData, algo).GetRoot();
}

std::vector<uint256> ProvePiece(const std::vector<std::vector<unsigned char>>& pieceData, size_t index,
                                HashAlgorithm algo)
{
    return SegmentMerkleTree(pieceData, algo).GetProof(index);
}

bool VerifyPiece(const uint256& root, size_t index, size_t totalPieces,
                 const std::vector<unsigned char>& pieceData,
                 const std::vector<uint256>& proof, HashAlgorithm algo)
{
    return SegmentMerkleTree::VerifyProof(root, index, totalPieces, pieceData, proof, algo);
}

} // namespace archiving
