// Copyright (c) 2024 The Segarc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEGARC_ARCHIVING_SEGMENT_COMMITMENT_H
#define SEGARC_ARCHIVING_SEGMENT_COMMITMENT_H

/**
 * @file segment_commitment.h
 * @brief Merkle commitment over the pieces of one segment
 *
 * Leaves are H(piece data) in piece index order, interior nodes are
 * H(left || right). A node without a sibling is paired with itself, so every
 * leaf of an n-leaf tree has a proof of exactly ceil(log2(n)) sibling hashes.
 * H is the network's commitment hash.
 */

#include <hash.h>
#include <uint256.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace archiving {

class SegmentMerkleTree {
private:
    HashAlgorithm algo;

    /** levels[0] holds the leaf hashes, levels.back() the root */
    std::vector<std::vector<uint256>> levels;

public:
    SegmentMerkleTree(const std::vector<std::vector<unsigned char>>& pieceData, HashAlgorithm algoIn);

    /** Root of the tree; null for an empty piece list */
    uint256 GetRoot() const;

    size_t GetLeafCount() const { return levels.empty() ? 0 : levels[0].size(); }

    /**
     * Sibling path of one leaf, bottom-up
     * @throws std::out_of_range if index is not a leaf
     */
    std::vector<uint256> GetProof(size_t index) const;

    static uint256 HashLeaf(const std::vector<unsigned char>& data, HashAlgorithm algo);
    static uint256 HashNode(const uint256& left, const uint256& right, HashAlgorithm algo);

    /** Proof length for a tree of leafCount leaves */
    static uint32_t GetDepth(size_t leafCount);

    /**
     * Recompute the root from one leaf and its proof.
     * Rejects an index outside [0, leafCount) and a proof whose length is
     * not GetDepth(leafCount).
     */
    static bool VerifyProof(const uint256& root, size_t index, size_t leafCount,
                            const std::vector<unsigned char>& data,
                            const std::vector<uint256>& proof, HashAlgorithm algo);
};

/** Commitment over all pieces of a segment, in index order */
uint256 CommitPieces(const std::vector<std::vector<unsigned char>>& pieceData, HashAlgorithm algo);

/** Inclusion proof of piece index against CommitPieces(pieceData) */
std::vector<uint256> ProvePiece(const std::vector<std::vector<unsigned char>>& pieceData, size_t index,
                                HashAlgorithm algo);

/** Check one piece against a segment commitment */
bool VerifyPiece(const uint256& root, size_t index, size_t totalPieces,
                 const std::vector<unsigned char>& pieceData,
                 const std::vector<uint256>& proof, HashAlgorithm algo);

} // namespace archiving

#endif // SEGARC_ARCHIVING_SEGMENT_COMMITMENT_H
