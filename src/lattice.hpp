#pragma once

#include "common.hpp"

#include <string>

namespace replicaflow
{
    // Logical time used by the compute protocol on the wire.
    using Timestamp = std::uint64_t;

    // Minimal lattice interface required for frontier math:
    //   minimum(), less_equal(a, b), join(a, b), meet(a, b), to_string(t).
    template <class T>
    struct Lattice;

    template <>
    struct Lattice<Timestamp>
    {
        static constexpr Timestamp minimum() noexcept { return 0; }
        static constexpr bool less_equal(Timestamp a, Timestamp b) noexcept { return a <= b; }
        static constexpr Timestamp join(Timestamp a, Timestamp b) noexcept { return a < b ? b : a; }
        static constexpr Timestamp meet(Timestamp a, Timestamp b) noexcept { return a < b ? a : b; }
        static std::string to_string(Timestamp t) { return std::to_string(t); }
    };

    // Pointwise product order. Two times are comparable only if both
    // coordinates agree on the direction, so this is a genuine partial order.
    template <class A, class B>
    struct Product
    {
        A outer{};
        B inner{};

        friend constexpr bool operator==(const Product &lhs, const Product &rhs)
        {
            return lhs.outer == rhs.outer && lhs.inner == rhs.inner;
        }
    };

    template <class A, class B>
    struct Lattice<Product<A, B>>
    {
        static constexpr Product<A, B> minimum() noexcept { return Product<A, B>{Lattice<A>::minimum(), Lattice<B>::minimum()}; }

        static constexpr bool less_equal(const Product<A, B> &a, const Product<A, B> &b) noexcept
        {
            return Lattice<A>::less_equal(a.outer, b.outer) && Lattice<B>::less_equal(a.inner, b.inner);
        }

        static constexpr Product<A, B> join(const Product<A, B> &a, const Product<A, B> &b) noexcept
        {
            return Product<A, B>{Lattice<A>::join(a.outer, b.outer), Lattice<B>::join(a.inner, b.inner)};
        }

        static constexpr Product<A, B> meet(const Product<A, B> &a, const Product<A, B> &b) noexcept
        {
            return Product<A, B>{Lattice<A>::meet(a.outer, b.outer), Lattice<B>::meet(a.inner, b.inner)};
        }

        static std::string to_string(const Product<A, B> &t)
        {
            return "(" + Lattice<A>::to_string(t.outer) + "," + Lattice<B>::to_string(t.inner) + ")";
        }
    };

    template <class T>
    inline bool time_less_equal(const T &a, const T &b)
    {
        return Lattice<T>::less_equal(a, b);
    }

    template <class T>
    inline bool time_less_than(const T &a, const T &b)
    {
        return Lattice<T>::less_equal(a, b) && !(a == b);
    }
}
