/*
Purpose: First-answer-wins peek delivery and prompt cancellation.

What this tests: a peek answered by two replicas is delivered once, carrying
the trace context of the response; a cancelled peek yields a synthesized
Canceled answer before any replica responds and later real answers are
dropped; cancelling an unknown peek still answers it.
*/

#include "replication_state.hpp"

#include <cassert>

namespace
{
    using T = replicaflow::Timestamp;
    using replicaflow::PeekResponse;
    using replicaflow::Uuid;

    replicaflow::Peek<T> make_peek(Uuid uuid, std::string trace)
    {
        replicaflow::Peek<T> p;
        p.id = replicaflow::GlobalId::user(1);
        p.uuid = uuid;
        p.timestamp = 3;
        p.otelCtx["traceparent"] = std::move(trace);
        return p;
    }

    replicaflow::ComputeResponse<T> rows(Uuid uuid, std::string row, std::string trace)
    {
        PeekResponse r;
        r.uuid = uuid;
        r.result = replicaflow::PeekRows{{{std::move(row), 1}}};
        r.otelCtx["traceparent"] = std::move(trace);
        return r;
    }

    const PeekResponse &as_peek(const std::optional<replicaflow::ActiveReplicationResponse<T>> &r)
    {
        assert(r.has_value());
        const auto *compute = r->compute();
        assert(compute);
        const auto *out = compute->get_if<PeekResponse>();
        assert(out);
        return *out;
    }
}

int main()
{
    const Uuid p1{0, 1};
    const Uuid p2{0, 2};
    const Uuid p3{0, 3};

    replicaflow::ActiveReplicationState<T> s;

    // Two replicas answer p1: first answer wins.
    {
        s.handle_command(make_peek(p1, "cmd-p1"));
        assert(s.peeks().count(p1) == 1);

        const auto first = s.handle_response(rows(p1, "from-a", "resp-a"), 1);
        const auto &peek = as_peek(first);
        assert((peek.uuid == p1));
        assert(std::get<replicaflow::PeekRows>(peek.result).rows.front().first == "from-a");
        assert(peek.otelCtx.at("traceparent") == "resp-a");
        assert(s.peeks().empty());

        assert(!s.handle_response(rows(p1, "from-b", "resp-b"), 2).has_value());

        // Only heartbeats remain.
        std::size_t heartbeats = 0;
        while (auto r = s.pop_pending())
        {
            assert(r->is_heartbeat());
            ++heartbeats;
        }
        assert(heartbeats == 2);
    }

    // Cancel p2 before anyone answers.
    {
        s.handle_command(make_peek(p2, "cmd-p2"));
        s.handle_command(replicaflow::CancelPeeks{{p2}});
        assert(s.peeks().empty());

        const auto canceled = s.pop_pending();
        const auto &peek = as_peek(canceled);
        assert((peek.uuid == p2));
        assert(std::holds_alternative<replicaflow::PeekCanceled>(peek.result));
        assert(peek.otelCtx.at("traceparent") == "cmd-p2");
        assert(!s.has_pending());

        // The real answer arrives late and is dropped.
        assert(!s.handle_response(rows(p2, "late", "resp"), 1).has_value());
        const auto hb = s.pop_pending();
        assert(hb && hb->is_heartbeat());
        assert(!s.has_pending());
    }

    // Cancelling an unknown peek still answers it, with no trace context.
    {
        s.handle_command(replicaflow::CancelPeeks{{p3}});
        const auto canceled = s.pop_pending();
        const auto &peek = as_peek(canceled);
        assert((peek.uuid == p3));
        assert(std::holds_alternative<replicaflow::PeekCanceled>(peek.result));
        assert(peek.otelCtx.empty());
    }

    // Every command is recorded.
    assert(s.history().size() == 4);

    return 0;
}
