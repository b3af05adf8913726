#pragma once

#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <type_traits>

#include "../Core/Base.hpp"

#if defined(LANESCAN_ARCH_X64) || defined(LANESCAN_ARCH_X86)
    #if defined(LANESCAN_COMPILER_MSVC)
        #include <intrin.h>
        #include <immintrin.h>
    #else
        #include <x86intrin.h>
    #endif
#elif defined(LANESCAN_HAS_NEON)
    #include <arm_neon.h>
#endif

namespace Lanescan
{
    namespace Simd
    {
        // Width tags for explicit control
        struct Width128 {};  // 16 lanes
        struct Width256 {};  // 32 lanes
        struct Width512 {};  // 64 lanes

        template<typename T>
        concept SimdWidth = std::is_same_v<T, Width128> || std::is_same_v<T, Width256> || std::is_same_v<T, Width512>;

        template<typename Width>
        struct WidthTraits;

        template<>
        struct WidthTraits<Width128>
        {
            static constexpr std::size_t bytes = 16;
            using MaskType = std::uint16_t;
        };

        template<>
        struct WidthTraits<Width256>
        {
            static constexpr std::size_t bytes = 32;
            using MaskType = std::uint32_t;
        };

        template<>
        struct WidthTraits<Width512>
        {
            static constexpr std::size_t bytes = 64;
            using MaskType = std::uint64_t;
        };

        template<SimdWidth Width>
        inline constexpr std::size_t AlignmentV = WidthTraits<Width>::bytes;

        template<SimdWidth Width>
        LANESCAN_NODISCARD LANESCAN_FORCEINLINE bool IsAligned(const void* ptr) noexcept
        {
            return (reinterpret_cast<std::uintptr_t>(ptr) & (AlignmentV<Width> - 1)) == 0;
        }

        namespace Ops
        {
            // ============== 128-bit implementations ==============
            namespace Detail128
            {
                LANESCAN_FORCEINLINE std::uint16_t MatchByteMask_Scalar(const void* data, std::uint8_t value) noexcept
                {
                    std::uint16_t mask = 0;
                    const std::uint8_t* bytes = static_cast<const std::uint8_t*>(data);
                    for (int i = 0; i < 16; ++i)
                    {
                        mask |= static_cast<std::uint16_t>(bytes[i] == value) << i;
                    }
                    return mask;
                }

#if defined(LANESCAN_HAS_SSE2)
                LANESCAN_FORCEINLINE std::uint16_t MatchByteMask_SSE(const void* data, std::uint8_t value) noexcept
                {
                    const __m128i group = _mm_load_si128(static_cast<const __m128i*>(data));
                    const __m128i match = _mm_set1_epi8(static_cast<char>(value));
                    const __m128i eq = _mm_cmpeq_epi8(group, match);
                    return static_cast<std::uint16_t>(_mm_movemask_epi8(eq));
                }
#endif

#if defined(LANESCAN_HAS_NEON)
                LANESCAN_FORCEINLINE std::uint16_t MatchByteMask_NEON(const void* data, std::uint8_t value) noexcept
                {
                    const uint8x16_t group = vld1q_u8(static_cast<const std::uint8_t*>(data));
                    const uint8x16_t match = vdupq_n_u8(value);
                    const uint8x16_t eq = vceqq_u8(group, match);

                    const uint8x16_t bit_mask = {
                        0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0x40, 0x80,
                        0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0x40, 0x80
                    };
                    const uint8x16_t masked = vandq_u8(eq, bit_mask);
                    const uint8x8_t low = vget_low_u8(masked);
                    const uint8x8_t high = vget_high_u8(masked);

#if defined(LANESCAN_ARCH_ARM64)
                    const std::uint8_t low_mask = vaddv_u8(low);
                    const std::uint8_t high_mask = vaddv_u8(high);
#else
                    uint8x8_t low_sum = vpadd_u8(low, low);
                    low_sum = vpadd_u8(low_sum, low_sum);
                    low_sum = vpadd_u8(low_sum, low_sum);
                    uint8x8_t high_sum = vpadd_u8(high, high);
                    high_sum = vpadd_u8(high_sum, high_sum);
                    high_sum = vpadd_u8(high_sum, high_sum);
                    const std::uint8_t low_mask = vget_lane_u8(low_sum, 0);
                    const std::uint8_t high_mask = vget_lane_u8(high_sum, 0);
#endif
                    return static_cast<std::uint16_t>((static_cast<std::uint16_t>(high_mask) << 8) | low_mask);
                }
#endif
            }

            // ============== 256-bit implementations ==============
            // Fallback issues both 128-bit loads before any comparison
            namespace Detail256
            {
#if defined(LANESCAN_HAS_AVX2)
                LANESCAN_FORCEINLINE std::uint32_t MatchByteMask_AVX(const void* data, std::uint8_t value) noexcept
                {
                    const __m256i group = _mm256_load_si256(static_cast<const __m256i*>(data));
                    const __m256i match = _mm256_set1_epi8(static_cast<char>(value));
                    const __m256i eq = _mm256_cmpeq_epi8(group, match);
                    return static_cast<std::uint32_t>(_mm256_movemask_epi8(eq));
                }
#endif

                LANESCAN_FORCEINLINE std::uint32_t MatchByteMask_Fallback(const void* data, std::uint8_t value) noexcept
                {
#if defined(LANESCAN_HAS_SSE2)
                    const std::uint8_t* ptr = static_cast<const std::uint8_t*>(data);

                    const __m128i group_low = _mm_load_si128(reinterpret_cast<const __m128i*>(ptr));
                    const __m128i group_high = _mm_load_si128(reinterpret_cast<const __m128i*>(ptr + 16));

                    const __m128i match = _mm_set1_epi8(static_cast<char>(value));

                    const __m128i eq_low = _mm_cmpeq_epi8(group_low, match);
                    const __m128i eq_high = _mm_cmpeq_epi8(group_high, match);

                    const std::uint16_t mask_low = static_cast<std::uint16_t>(_mm_movemask_epi8(eq_low));
                    const std::uint16_t mask_high = static_cast<std::uint16_t>(_mm_movemask_epi8(eq_high));

                    return (static_cast<std::uint32_t>(mask_high) << 16) | mask_low;
#elif defined(LANESCAN_HAS_NEON)
                    const std::uint8_t* ptr = static_cast<const std::uint8_t*>(data);
                    const std::uint16_t mask_low = Detail128::MatchByteMask_NEON(ptr, value);
                    const std::uint16_t mask_high = Detail128::MatchByteMask_NEON(ptr + 16, value);
                    return (static_cast<std::uint32_t>(mask_high) << 16) | mask_low;
#else
                    const std::uint8_t* ptr = static_cast<const std::uint8_t*>(data);
                    const std::uint16_t mask_low = Detail128::MatchByteMask_Scalar(ptr, value);
                    const std::uint16_t mask_high = Detail128::MatchByteMask_Scalar(ptr + 16, value);
                    return (static_cast<std::uint32_t>(mask_high) << 16) | mask_low;
#endif
                }
            }

            // ============== 512-bit implementations ==============
            namespace Detail512
            {
#if defined(LANESCAN_HAS_AVX512BW)
                LANESCAN_FORCEINLINE std::uint64_t MatchByteMask_AVX512(const void* data, std::uint8_t value) noexcept
                {
                    const __m512i group = _mm512_load_si512(data);
                    const __m512i match = _mm512_set1_epi8(static_cast<char>(value));
                    return static_cast<std::uint64_t>(_mm512_cmpeq_epi8_mask(group, match));
                }
#endif

                LANESCAN_FORCEINLINE std::uint64_t MatchByteMask_Fallback(const void* data, std::uint8_t value) noexcept
                {
                    const std::uint8_t* ptr = static_cast<const std::uint8_t*>(data);
#if defined(LANESCAN_HAS_AVX2)
                    const std::uint32_t mask_low = Detail256::MatchByteMask_AVX(ptr, value);
                    const std::uint32_t mask_high = Detail256::MatchByteMask_AVX(ptr + 32, value);
#else
                    const std::uint32_t mask_low = Detail256::MatchByteMask_Fallback(ptr, value);
                    const std::uint32_t mask_high = Detail256::MatchByteMask_Fallback(ptr + 32, value);
#endif
                    return (static_cast<std::uint64_t>(mask_high) << 32) | mask_low;
                }
            }

            // ============== Public API ==============

            // One bit per lane whose byte equals `value`; bit i corresponds to data[i].
            // `data` must be aligned to the width.
            template<SimdWidth Width>
            LANESCAN_FORCEINLINE auto MatchByteMask(const void* data, std::uint8_t value) noexcept -> typename WidthTraits<Width>::MaskType
            {
                LANESCAN_ASSERT(IsAligned<Width>(data), "Data must be aligned for SIMD operations");

                if constexpr (std::is_same_v<Width, Width128>)
                {
#if defined(LANESCAN_HAS_SSE2)
                    return Detail128::MatchByteMask_SSE(data, value);
#elif defined(LANESCAN_HAS_NEON)
                    return Detail128::MatchByteMask_NEON(data, value);
#else
                    return Detail128::MatchByteMask_Scalar(data, value);
#endif
                }
                else if constexpr (std::is_same_v<Width, Width256>)
                {
#if defined(LANESCAN_HAS_AVX2)
                    return Detail256::MatchByteMask_AVX(data, value);
#else
                    return Detail256::MatchByteMask_Fallback(data, value);
#endif
                }
                else
                {
#if defined(LANESCAN_HAS_AVX512BW)
                    return Detail512::MatchByteMask_AVX512(data, value);
#else
                    return Detail512::MatchByteMask_Fallback(data, value);
#endif
                }
            }

            // Mask with the low `count` lanes set; count may equal the full width
            template<SimdWidth Width>
            LANESCAN_FORCEINLINE constexpr auto LaneMask(std::size_t count) noexcept -> typename WidthTraits<Width>::MaskType
            {
                using MaskType = typename WidthTraits<Width>::MaskType;
                constexpr std::size_t bits = sizeof(MaskType) * 8;
                LANESCAN_ASSERT(count <= bits, "Lane count exceeds vector width");

                return count >= bits
                    ? static_cast<MaskType>(~MaskType{0})
                    : static_cast<MaskType>((MaskType{1} << count) - 1);
            }

            // Population count (number of set bits)
            template<typename MaskType>
            LANESCAN_FORCEINLINE int PopCount(MaskType mask) noexcept
            {
                static_assert(std::is_unsigned_v<MaskType>, "Mask must be unsigned");
                return std::popcount(mask);
            }

            // Count trailing zeros; returns the bit width for a zero mask
            template<typename MaskType>
            LANESCAN_FORCEINLINE int CountTrailingZeros(MaskType mask) noexcept
            {
                static_assert(std::is_unsigned_v<MaskType>, "Mask must be unsigned");
                if (!mask) return static_cast<int>(sizeof(MaskType) * 8);

#if defined(LANESCAN_COMPILER_MSVC)
                unsigned long idx;
                if constexpr (sizeof(MaskType) <= 4)
                {
                    _BitScanForward(&idx, static_cast<unsigned long>(mask));
                }
                else
                {
                    _BitScanForward64(&idx, static_cast<unsigned long long>(mask));
                }
                return static_cast<int>(idx);
#else
                if constexpr (sizeof(MaskType) <= 4)
                {
                    return __builtin_ctz(static_cast<unsigned>(mask));
                }
                else
                {
                    return __builtin_ctzll(static_cast<unsigned long long>(mask));
                }
#endif
            }

            // ============== Byte lanes for max-reduction scans ==============
            //
            // Keeps a vector of unsigned bytes in a register, narrows it with byte
            // equality tests and reduces it to its largest lane. Used where a scan
            // tracks "which lane survived" as a lane value instead of a bitmask.
            template<SimdWidth Width>
            struct ByteLanes
            {
                static constexpr std::size_t lanes = WidthTraits<Width>::bytes;

                struct Vector
                {
                    alignas(WidthTraits<Width>::bytes) std::array<std::uint8_t, lanes> bytes;
                };

                // [W, W-1, ..., 1]: the lowest surviving lane holds the largest value
                static constexpr Vector Descending() noexcept
                {
                    Vector v{};
                    for (std::size_t i = 0; i < lanes; ++i)
                    {
                        v.bytes[i] = static_cast<std::uint8_t>(lanes - i);
                    }
                    return v;
                }

                // state[i] &= (plane[i] == value ? 0xFF : 0x00)
                static LANESCAN_FORCEINLINE void AndEqual(Vector& state, const void* plane, std::uint8_t value) noexcept
                {
                    const std::uint8_t* bytes = static_cast<const std::uint8_t*>(plane);
                    for (std::size_t i = 0; i < lanes; ++i)
                    {
                        state.bytes[i] &= static_cast<std::uint8_t>(-static_cast<int>(bytes[i] == value));
                    }
                }

                static LANESCAN_FORCEINLINE std::uint8_t ReduceMax(const Vector& state) noexcept
                {
                    std::uint8_t best = 0;
                    for (std::size_t i = 0; i < lanes; ++i)
                    {
                        best = state.bytes[i] > best ? state.bytes[i] : best;
                    }
                    return best;
                }
            };

#if defined(LANESCAN_HAS_SSE2)
            template<>
            struct ByteLanes<Width128>
            {
                static constexpr std::size_t lanes = 16;
                using Vector = __m128i;

                static LANESCAN_FORCEINLINE Vector Descending() noexcept
                {
                    return _mm_setr_epi8(16, 15, 14, 13, 12, 11, 10, 9, 8, 7, 6, 5, 4, 3, 2, 1);
                }

                static LANESCAN_FORCEINLINE void AndEqual(Vector& state, const void* plane, std::uint8_t value) noexcept
                {
                    const __m128i group = _mm_load_si128(static_cast<const __m128i*>(plane));
                    const __m128i eq = _mm_cmpeq_epi8(group, _mm_set1_epi8(static_cast<char>(value)));
                    state = _mm_and_si128(state, eq);
                }

                static LANESCAN_FORCEINLINE std::uint8_t ReduceMax(Vector state) noexcept
                {
                    state = _mm_max_epu8(state, _mm_srli_si128(state, 8));
                    state = _mm_max_epu8(state, _mm_srli_si128(state, 4));
                    state = _mm_max_epu8(state, _mm_srli_si128(state, 2));
                    state = _mm_max_epu8(state, _mm_srli_si128(state, 1));
                    return static_cast<std::uint8_t>(_mm_cvtsi128_si32(state) & 0xFF);
                }
            };
#elif defined(LANESCAN_HAS_NEON) && defined(LANESCAN_ARCH_ARM64)
            template<>
            struct ByteLanes<Width128>
            {
                static constexpr std::size_t lanes = 16;
                using Vector = uint8x16_t;

                static LANESCAN_FORCEINLINE Vector Descending() noexcept
                {
                    const Vector v = { 16, 15, 14, 13, 12, 11, 10, 9, 8, 7, 6, 5, 4, 3, 2, 1 };
                    return v;
                }

                static LANESCAN_FORCEINLINE void AndEqual(Vector& state, const void* plane, std::uint8_t value) noexcept
                {
                    const uint8x16_t group = vld1q_u8(static_cast<const std::uint8_t*>(plane));
                    state = vandq_u8(state, vceqq_u8(group, vdupq_n_u8(value)));
                }

                static LANESCAN_FORCEINLINE std::uint8_t ReduceMax(Vector state) noexcept
                {
                    return vmaxvq_u8(state);
                }
            };
#endif
        }
    }
}
