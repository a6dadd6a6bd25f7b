/*
Module Name:
- transparent_string_hash.hpp

Abstract:
- Transparent hash and equality functors for string-like keys.
- Exact variants key project maps; case-folding variants key the username alias table.
- Both enable heterogeneous lookup in standard containers without temporary allocations.
- Case folding walks the key one code point at a time while hashing and comparing, so no
  folded copy of the key is ever built. ASCII folds inline; other UTF-8 code points go
  through ICU simple case folding (u_foldCase), so "Élodie" matches "élodie".
- Malformed UTF-8 bytes are not folded and only match themselves.
- Uses GSL Expects to guard against null char* which would be UB.
*/
#pragma once

// C++ Standard Library
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string_view>
#include <type_traits>

// GSL
#include <gsl/gsl>

// ICU
#include <unicode/uchar.h>
#include <unicode/utf8.h>

// Core
#include <rb/utils/attributes.hpp>

namespace rb
{
    namespace detail
    {
        // Gates the null check only for CharT* inputs.
        template<class T, class CharT>
        inline constexpr bool is_char_ptr_v =
            std::is_pointer_v<std::remove_cvref_t<T>> &&
            std::same_as<
                std::remove_cv_t<std::remove_pointer_t<std::remove_cvref_t<T>>>,
                CharT>;

        // 64-bit FNV-1a. Stable across runs, which keeps test expectations reproducible.
        inline constexpr std::uint64_t kFnvOffsetBasis = 14695981039346656037ULL;
        inline constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

        // ASCII case fold. Bytes outside A-Z pass through untouched.
        [[nodiscard]] constexpr char fold_ascii(char c) noexcept
        {
            return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
        }

        // Folded values of malformed bytes sit above U+10FFFF so they never equal a real code point.
        inline constexpr std::uint32_t kMalformedByteBase = 0x110000;

        // Folded code point starting at s[pos]; advances pos past it.
        // Pre: pos < s.size()
        [[nodiscard]] RB_FORCE_INLINE std::uint32_t next_folded(std::string_view s, std::size_t& pos) noexcept
        {
            const auto byte = static_cast<unsigned char>(s[pos]);
            if (byte < 0x80)
            {
                ++pos;
                return static_cast<unsigned char>(fold_ascii(static_cast<char>(byte)));
            }

            const auto* bytes = reinterpret_cast<const std::uint8_t*>(s.data());
            const auto length = gsl::narrow_cast<std::int32_t>(s.size());
            auto i = gsl::narrow_cast<std::int32_t>(pos);
            UChar32 cp = 0;
            U8_NEXT(bytes, i, length, cp);
            if (cp < 0)
            {
                ++pos;
                return kMalformedByteBase + byte;
            }
            pos = gsl::narrow_cast<std::size_t>(i);
            return static_cast<std::uint32_t>(u_foldCase(cp, U_FOLD_CASE_DEFAULT));
        }

        [[nodiscard]] RB_FORCE_INLINE std::size_t folded_hash(std::string_view s) noexcept
        {
            std::uint64_t h = kFnvOffsetBasis;
            for (std::size_t pos = 0; pos < s.size();)
            {
                h ^= next_folded(s, pos);
                h *= kFnvPrime;
            }
            return static_cast<std::size_t>(h);
        }

        // Byte lengths may differ between equal strings (U+212A KELVIN SIGN folds to 'k').
        [[nodiscard]] RB_FORCE_INLINE bool folded_equal(std::string_view a, std::string_view b) noexcept
        {
            std::size_t i = 0;
            std::size_t j = 0;
            while (i < a.size() && j < b.size())
            {
                if (next_folded(a, i) != next_folded(b, j))
                    return false;
            }
            return i == a.size() && j == b.size();
        }
    } // namespace detail

    template<class CharT = char, class Traits = std::char_traits<CharT>>
    struct TransparentBasicStringHash
    {
        using is_transparent = void; // opts in to heterogeneous lookup

        template<std::convertible_to<std::basic_string_view<CharT, Traits>> S>
        std::size_t operator()(const S& s) const noexcept
        {
            if constexpr (detail::is_char_ptr_v<S, CharT>)
            {
                Expects(s != nullptr); // contract: CharT* must not be null
            }
            using sv = std::basic_string_view<CharT, Traits>;
            return std::hash<sv>{}(sv{ s });
        }
    };

    template<class CharT = char, class Traits = std::char_traits<CharT>>
    struct TransparentBasicStringEq
    {
        using is_transparent = void;

        template<std::convertible_to<std::basic_string_view<CharT, Traits>> A,
                 std::convertible_to<std::basic_string_view<CharT, Traits>> B>
        bool operator()(const A& a, const B& b) const noexcept
        {
            if constexpr (detail::is_char_ptr_v<A, CharT>)
            {
                Expects(a != nullptr); // contract: CharT* must not be null
            }
            if constexpr (detail::is_char_ptr_v<B, CharT>)
            {
                Expects(b != nullptr); // contract: CharT* must not be null
            }
            using sv = std::basic_string_view<CharT, Traits>;
            return sv{ a } == sv{ b };
        }
    };

    /// Hash that ignores letter case (Unicode simple folding). Equal under CaseFoldStringEq implies equal hash.
    struct CaseFoldStringHash
    {
        using is_transparent = void;

        template<std::convertible_to<std::string_view> S>
        std::size_t operator()(const S& s) const noexcept
        {
            if constexpr (detail::is_char_ptr_v<S, char>)
            {
                Expects(s != nullptr); // contract: char* must not be null
            }
            return detail::folded_hash(std::string_view{ s });
        }
    };

    /// Equality that ignores letter case (Unicode simple folding).
    struct CaseFoldStringEq
    {
        using is_transparent = void;

        template<std::convertible_to<std::string_view> A,
                 std::convertible_to<std::string_view> B>
        bool operator()(const A& a, const B& b) const noexcept
        {
            if constexpr (detail::is_char_ptr_v<A, char>)
            {
                Expects(a != nullptr); // contract: char* must not be null
            }
            if constexpr (detail::is_char_ptr_v<B, char>)
            {
                Expects(b != nullptr); // contract: char* must not be null
            }
            return detail::folded_equal(std::string_view{ a }, std::string_view{ b });
        }
    };

} // namespace rb
