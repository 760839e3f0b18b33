// Copyright (C) 2020-2021 Sami Väisänen
// Copyright (C) 2020-2021 Ensisoft http://www.ensisoft.com
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#pragma once

#include "config.h"

#include <cstdint>
#include <initializer_list>

namespace base
{
    // Set of enum values stored as bits. The enum values are used as
    // bit indices so they must be less than the number of bits in Bits.
    template<typename Enum, typename Bits = std::uint32_t>
    class bitflag
    {
    public:
        static constexpr unsigned BitCount = sizeof(Bits) * 8;

        bitflag() = default;
        bitflag(Enum initial)
        { set(initial); }
        explicit bitflag(Bits value) noexcept
          : mBits(value)
        {}
        bitflag(std::initializer_list<Enum> values)
        {
            for (auto e : values)
                set(e, true);
        }

        bitflag& set(Enum value, bool on = true) noexcept
        {
            const auto bit = ToBit(value);
            if (on)
                mBits |= bit;
            else mBits &= ~bit;
            return *this;
        }

        // test a single value.
        bool test(Enum value) const noexcept
        {
            const auto bit = ToBit(value);
            return (mBits & bit) == bit;
        }
        // test for any of the values.
        bool test(bitflag values) const noexcept
        { return (mBits & values.mBits) != 0; }

        void clear() noexcept
        { mBits = 0; }
        bool any_bit() const noexcept
        { return mBits != 0; }
        Bits value() const noexcept
        { return mBits; }

        bitflag& operator |= (bitflag other) noexcept
        {
            mBits |= other.mBits;
            return *this;
        }
    private:
        static_assert(sizeof(Bits) <= sizeof(std::uint64_t), "Unsupported bit storage type.");

        static Bits ToBit(Enum value) noexcept
        { return Bits(1) << static_cast<Bits>(value); }
    private:
        Bits mBits = 0;
    };

    template<typename Enum, typename Bits>
    bitflag<Enum, Bits> operator | (bitflag<Enum, Bits> lhs, bitflag<Enum, Bits> rhs) noexcept
    { return bitflag<Enum, Bits>(lhs.value() | rhs.value()); }

    template<typename Enum, typename Bits>
    bool operator == (bitflag<Enum, Bits> lhs, bitflag<Enum, Bits> rhs) noexcept
    { return lhs.value() == rhs.value(); }
    template<typename Enum, typename Bits>
    bool operator != (bitflag<Enum, Bits> lhs, bitflag<Enum, Bits> rhs) noexcept
    { return lhs.value() != rhs.value(); }

} // base
