#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "../Core/Base.hpp"

namespace Lanescan
{
    /**
     * Byte of `key` at `offset`, or a synthesized pad byte past its end.
     *
     * The pad is (offset - length) mod 256, so the virtual bytes beyond the end
     * of a key depend on both the offset and that key's length. "key" and "key1"
     * therefore differ at offset 3 (pad 0 vs '1') and "key1" vs "key1x" at 4.
     * Build and lookup share this function, which is what lets a query's pad
     * bytes line up with the stored ones.
     */
    LANESCAN_NODISCARD LANESCAN_FORCEINLINE constexpr std::uint8_t PaddedByte(std::string_view key, std::size_t offset) noexcept
    {
        const std::uint8_t pad = static_cast<std::uint8_t>(offset - key.size());
        return offset < key.size() ? static_cast<std::uint8_t>(key[offset]) : pad;
    }

    /**
     * Dense keys x depth table of padded bytes.
     *
     * Built once per position search so that scoring a candidate is plain
     * indexing rather than repeated bounds checks on every key.
     */
    class KeyByteMatrix
    {
    public:
        KeyByteMatrix(std::span<const std::string_view> keys, std::size_t depth)
            : m_keyCount(keys.size())
            , m_depth(depth)
            , m_bytes(keys.size() * depth)
        {
            for (std::size_t k = 0; k < m_keyCount; ++k)
            {
                std::uint8_t* row = m_bytes.data() + k * m_depth;
                for (std::size_t offset = 0; offset < m_depth; ++offset)
                {
                    row[offset] = PaddedByte(keys[k], offset);
                }
            }
        }

        LANESCAN_NODISCARD std::size_t KeyCount() const noexcept { return m_keyCount; }
        LANESCAN_NODISCARD std::size_t Depth() const noexcept { return m_depth; }

        LANESCAN_NODISCARD std::uint8_t At(std::size_t key, std::size_t offset) const noexcept
        {
            LANESCAN_ASSERT(key < m_keyCount && offset < m_depth, "Matrix index out of range");
            return m_bytes[key * m_depth + offset];
        }

        // True when keys a and b agree at every listed offset
        LANESCAN_NODISCARD bool AgreeAt(std::size_t a, std::size_t b, std::span<const std::size_t> offsets) const noexcept
        {
            const std::uint8_t* rowA = m_bytes.data() + a * m_depth;
            const std::uint8_t* rowB = m_bytes.data() + b * m_depth;

            bool agree = true;
            for (std::size_t offset : offsets)
            {
                agree &= rowA[offset] == rowB[offset];
            }
            return agree;
        }

        // Search depth for a key set: min(longest key, cap), never below one offset
        LANESCAN_NODISCARD static std::size_t DepthFor(std::span<const std::string_view> keys, std::size_t cap) noexcept
        {
            std::size_t longest = 0;
            for (std::string_view key : keys)
            {
                longest = std::max(longest, key.size());
            }
            return std::max<std::size_t>(std::min(longest, cap), 1);
        }

    private:
        std::size_t m_keyCount;
        std::size_t m_depth;
        std::vector<std::uint8_t> m_bytes;
    };
}
