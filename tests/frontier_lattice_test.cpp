/*
Purpose: Frontier arithmetic over totally and partially ordered times.

What this tests: Antichain insertion keeps only minimal elements, the frontier
order treats the empty frontier as the top element, and join/meet behave as
least upper / greatest lower bounds, including for product (partially ordered)
times where two frontiers can be incomparable.
*/

#include "frontier.hpp"

#include <cassert>
#include <cstdint>

namespace
{
    using P = replicaflow::Product<std::uint64_t, std::uint64_t>;
    using replicaflow::Antichain;
    using replicaflow::Timestamp;
}

int main()
{
    // Totally ordered times collapse to a single element.
    {
        Antichain<Timestamp> f{5, 3, 7};
        assert(f.size() == 1);
        assert(f.elements().front() == 3);
        assert(f.less_equal(3));
        assert(!f.less_than(3));
        assert(f.less_than(4));
        assert(!f.less_equal(2));
    }

    // Frontier order; the empty frontier is greater than everything.
    {
        const Antichain<Timestamp> a{3};
        const Antichain<Timestamp> b{5};
        const Antichain<Timestamp> empty;

        assert(replicaflow::frontier_less_equal(a, b));
        assert(replicaflow::frontier_less_than(a, b));
        assert(!replicaflow::frontier_less_equal(b, a));
        assert(replicaflow::frontier_less_equal(a, a));
        assert(!replicaflow::frontier_less_than(a, a));
        assert(replicaflow::frontier_less_than(b, empty));
        assert(!replicaflow::frontier_less_than(empty, empty));
        assert(!replicaflow::frontier_less_equal(empty, a));

        assert((replicaflow::frontier_join(a, b) == Antichain<Timestamp>{5}));
        assert((replicaflow::frontier_meet(a, b) == Antichain<Timestamp>{3}));
        assert(replicaflow::frontier_join(a, empty).empty());
        assert((replicaflow::frontier_meet(a, empty) == a));
    }

    // Product times: (1,2) and (2,1) are incomparable and both survive.
    {
        Antichain<P> f;
        assert(f.insert(P{1, 2}));
        assert(f.insert(P{2, 1}));
        assert(f.size() == 2);

        // Dominated by (1,2): rejected.
        assert(!f.insert(P{1, 3}));
        assert(f.size() == 2);

        // Dominates both: replaces them.
        assert(f.insert(P{0, 0}));
        assert(f.size() == 1);
        assert((f == Antichain<P>{P{0, 0}}));
    }

    // Incomparable product frontiers: neither is <= the other.
    {
        const Antichain<P> a{P{1, 2}};
        const Antichain<P> b{P{2, 1}};
        assert(!replicaflow::frontier_less_equal(a, b));
        assert(!replicaflow::frontier_less_equal(b, a));

        const auto join = replicaflow::frontier_join(a, b);
        assert((join == Antichain<P>{P{2, 2}}));
        assert(replicaflow::frontier_less_than(a, join));
        assert(replicaflow::frontier_less_than(b, join));

        const auto meet = replicaflow::frontier_meet(a, b);
        assert(meet.size() == 2);
        assert(replicaflow::frontier_less_equal(meet, a));
        assert(replicaflow::frontier_less_equal(meet, b));
    }

    // Equality ignores element order.
    {
        const Antichain<P> a{P{1, 2}, P{2, 1}};
        const Antichain<P> b{P{2, 1}, P{1, 2}};
        assert(a == b);
        assert(replicaflow::to_string(Antichain<Timestamp>{4}) == "{4}");
        assert(replicaflow::to_string(Antichain<Timestamp>{}) == "{}");
    }

    return 0;
}
