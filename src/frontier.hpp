#pragma once

#include "lattice.hpp"

#include <initializer_list>
#include <string>
#include <vector>

namespace replicaflow
{
    // A set of mutually incomparable times. As a frontier it describes every
    // time not yet complete: t is incomplete iff some element is <= t.
    // The empty antichain is the frontier of a collection that is finished.
    template <class T>
    class Antichain
    {
    public:
        Antichain() = default;

        Antichain(std::initializer_list<T> elems)
        {
            for (const auto &t : elems)
            {
                insert(t);
            }
        }

        static Antichain from_elem(T t)
        {
            Antichain out;
            out.m_elements.push_back(std::move(t));
            return out;
        }

        static Antichain minimum() { return from_elem(Lattice<T>::minimum()); }

        // Inserts `t` unless it is dominated by an existing element. Elements
        // that `t` dominates are removed. Returns whether `t` was added.
        bool insert(const T &t)
        {
            for (const auto &e : m_elements)
            {
                if (Lattice<T>::less_equal(e, t))
                {
                    return false;
                }
            }
            std::erase_if(m_elements, [&](const T &e)
                          { return Lattice<T>::less_equal(t, e); });
            m_elements.push_back(t);
            return true;
        }

        void extend(const Antichain &other)
        {
            for (const auto &t : other.m_elements)
            {
                insert(t);
            }
        }

        // True if some element is less than or equal to `t`.
        bool less_equal(const T &t) const
        {
            for (const auto &e : m_elements)
            {
                if (Lattice<T>::less_equal(e, t))
                {
                    return true;
                }
            }
            return false;
        }

        // True if some element is strictly less than `t`.
        bool less_than(const T &t) const
        {
            for (const auto &e : m_elements)
            {
                if (time_less_than(e, t))
                {
                    return true;
                }
            }
            return false;
        }

        bool empty() const noexcept { return m_elements.empty(); }
        std::size_t size() const noexcept { return m_elements.size(); }
        const std::vector<T> &elements() const noexcept { return m_elements; }

        auto begin() const noexcept { return m_elements.begin(); }
        auto end() const noexcept { return m_elements.end(); }

        void clear() noexcept { m_elements.clear(); }

        friend bool operator==(const Antichain &lhs, const Antichain &rhs)
        {
            if (lhs.m_elements.size() != rhs.m_elements.size())
            {
                return false;
            }
            for (const auto &t : lhs.m_elements)
            {
                if (std::find(rhs.m_elements.begin(), rhs.m_elements.end(), t) == rhs.m_elements.end())
                {
                    return false;
                }
            }
            return true;
        }

    private:
        std::vector<T> m_elements;
    };

    // Frontier partial order: `a <= b` iff every element of `b` is greater or
    // equal to some element of `a`. The empty frontier is the top element.
    template <class T>
    inline bool frontier_less_equal(const Antichain<T> &a, const Antichain<T> &b)
    {
        for (const auto &t : b)
        {
            if (!a.less_equal(t))
            {
                return false;
            }
        }
        return true;
    }

    template <class T>
    inline bool frontier_less_than(const Antichain<T> &a, const Antichain<T> &b)
    {
        return frontier_less_equal(a, b) && !(a == b);
    }

    // Least upper bound of two frontiers: joins of all element pairs.
    template <class T>
    inline Antichain<T> frontier_join(const Antichain<T> &a, const Antichain<T> &b)
    {
        Antichain<T> out;
        for (const auto &x : a)
        {
            for (const auto &y : b)
            {
                out.insert(Lattice<T>::join(x, y));
            }
        }
        return out;
    }

    // Greatest lower bound of two frontiers: the minimal elements of the union.
    template <class T>
    inline Antichain<T> frontier_meet(const Antichain<T> &a, const Antichain<T> &b)
    {
        Antichain<T> out = a;
        out.extend(b);
        return out;
    }

    template <class T>
    inline std::string to_string(const Antichain<T> &f)
    {
        std::string out = "{";
        bool first = true;
        for (const auto &t : f)
        {
            if (!first)
            {
                out += ", ";
            }
            out += Lattice<T>::to_string(t);
            first = false;
        }
        out += "}";
        return out;
    }
}
