#pragma once

#include "protocol.hpp"
#include "wire.hpp"

namespace replicaflow
{
    // Binary encoding of commands and responses for `Timestamp` times.
    // Variants are written as their alternative index followed by the fields
    // of the alternative; sequences and maps carry a u32 element count.
    namespace wire_detail
    {
        inline void put(WireWriter &w, const GlobalId &id)
        {
            w.write_u8(static_cast<std::uint8_t>(id.kind));
            w.write_u64(id.value);
        }

        inline void get(WireReader &r, GlobalId &id)
        {
            const auto kind = r.read_u8();
            if (kind > static_cast<std::uint8_t>(GlobalIdKind::Transient))
            {
                throw std::runtime_error("decode: invalid GlobalId kind");
            }
            id.kind = static_cast<GlobalIdKind>(kind);
            id.value = r.read_u64();
        }

        inline void put(WireWriter &w, const Uuid &u)
        {
            w.write_u64(u.hi);
            w.write_u64(u.lo);
        }

        inline void get(WireReader &r, Uuid &u)
        {
            u.hi = r.read_u64();
            u.lo = r.read_u64();
        }

        inline void put(WireWriter &w, const Antichain<Timestamp> &f)
        {
            w.write_count(f.size());
            for (const auto t : f)
            {
                w.write_u64(t);
            }
        }

        inline void get(WireReader &r, Antichain<Timestamp> &f)
        {
            f.clear();
            const auto n = r.read_count();
            for (std::size_t i = 0; i < n; ++i)
            {
                f.insert(r.read_u64());
            }
        }

        inline void put(WireWriter &w, const TraceContext &ctx)
        {
            w.write_count(ctx.size());
            for (const auto &[k, v] : ctx)
            {
                w.write_string(k);
                w.write_string(v);
            }
        }

        inline void get(WireReader &r, TraceContext &ctx)
        {
            ctx.clear();
            const auto n = r.read_count();
            for (std::size_t i = 0; i < n; ++i)
            {
                auto k = r.read_string();
                ctx[std::move(k)] = r.read_string();
            }
        }

        inline void put(WireWriter &w, const std::vector<std::uint32_t> &v)
        {
            w.write_count(v.size());
            for (const auto x : v)
            {
                w.write_u32(x);
            }
        }

        inline void get(WireReader &r, std::vector<std::uint32_t> &v)
        {
            v.resize(r.read_count());
            for (auto &x : v)
            {
                x = r.read_u32();
            }
        }

        inline void put(WireWriter &w, const std::vector<std::string> &v)
        {
            w.write_count(v.size());
            for (const auto &s : v)
            {
                w.write_string(s);
            }
        }

        inline void get(WireReader &r, std::vector<std::string> &v)
        {
            v.resize(r.read_count());
            for (auto &s : v)
            {
                s = r.read_string();
            }
        }

        inline LogVariant get_log_variant(WireReader &r)
        {
            const auto v = r.read_u8();
            if (v < static_cast<std::uint8_t>(LogVariant::TimelyOperates) || v > static_cast<std::uint8_t>(LogVariant::ComputePeekDuration))
            {
                throw std::runtime_error("decode: invalid LogVariant");
            }
            return static_cast<LogVariant>(v);
        }

        inline void put(WireWriter &w, const LoggingConfig &c)
        {
            w.write_u64(c.intervalNs);
            w.write_bool(c.enableLogging);
            w.write_bool(c.logLogging);
            w.write_count(c.activeLogs.size());
            for (const auto &[variant, id] : c.activeLogs)
            {
                w.write_u8(static_cast<std::uint8_t>(variant));
                put(w, id);
            }
            w.write_count(c.sinkLogs.size());
            for (const auto &[variant, entry] : c.sinkLogs)
            {
                w.write_u8(static_cast<std::uint8_t>(variant));
                put(w, entry.first);
                w.write_string(entry.second.dataShard);
                w.write_string(entry.second.statusShard);
            }
        }

        inline void get(WireReader &r, LoggingConfig &c)
        {
            c.intervalNs = r.read_u64();
            c.enableLogging = r.read_bool();
            c.logLogging = r.read_bool();
            c.activeLogs.clear();
            auto n = r.read_count();
            for (std::size_t i = 0; i < n; ++i)
            {
                const auto variant = get_log_variant(r);
                GlobalId id;
                get(r, id);
                c.activeLogs[variant] = id;
            }
            c.sinkLogs.clear();
            n = r.read_count();
            for (std::size_t i = 0; i < n; ++i)
            {
                const auto variant = get_log_variant(r);
                std::pair<GlobalId, CollectionMetadata> entry;
                get(r, entry.first);
                entry.second.dataShard = r.read_string();
                entry.second.statusShard = r.read_string();
                c.sinkLogs[variant] = std::move(entry);
            }
        }

        inline void put(WireWriter &w, const DataflowDescription<Timestamp> &d)
        {
            w.write_count(d.sourceImports.size());
            for (const auto &s : d.sourceImports)
            {
                put(w, s.id);
                w.write_bool(s.monotonic);
            }
            w.write_count(d.indexImports.size());
            for (const auto &i : d.indexImports)
            {
                put(w, i.id);
                put(w, i.onId);
                w.write_bool(i.monotonic);
            }
            w.write_count(d.objectsToBuild.size());
            for (const auto &b : d.objectsToBuild)
            {
                put(w, b.id);
                w.write_string(b.plan);
            }
            w.write_count(d.indexExports.size());
            for (const auto &e : d.indexExports)
            {
                put(w, e.id);
                put(w, e.onId);
                put(w, e.key);
            }
            w.write_count(d.sinkExports.size());
            for (const auto &e : d.sinkExports)
            {
                put(w, e.id);
                put(w, e.from);
                w.write_string(e.connection);
            }
            w.write_bool(d.asOf.has_value());
            if (d.asOf)
            {
                put(w, *d.asOf);
            }
            put(w, d.until);
            w.write_string(d.debugName);
        }

        inline void get(WireReader &r, DataflowDescription<Timestamp> &d)
        {
            d.sourceImports.resize(r.read_count());
            for (auto &s : d.sourceImports)
            {
                get(r, s.id);
                s.monotonic = r.read_bool();
            }
            d.indexImports.resize(r.read_count());
            for (auto &i : d.indexImports)
            {
                get(r, i.id);
                get(r, i.onId);
                i.monotonic = r.read_bool();
            }
            d.objectsToBuild.resize(r.read_count());
            for (auto &b : d.objectsToBuild)
            {
                get(r, b.id);
                b.plan = r.read_string();
            }
            d.indexExports.resize(r.read_count());
            for (auto &e : d.indexExports)
            {
                get(r, e.id);
                get(r, e.onId);
                get(r, e.key);
            }
            d.sinkExports.resize(r.read_count());
            for (auto &e : d.sinkExports)
            {
                get(r, e.id);
                get(r, e.from);
                e.connection = r.read_string();
            }
            d.asOf.reset();
            if (r.read_bool())
            {
                Antichain<Timestamp> asOf;
                get(r, asOf);
                d.asOf = std::move(asOf);
            }
            get(r, d.until);
            d.debugName = r.read_string();
        }

        inline void put(WireWriter &w, const RowSetFinishing &f)
        {
            put(w, f.orderBy);
            w.write_bool(f.limit.has_value());
            if (f.limit)
            {
                w.write_u64(*f.limit);
            }
            w.write_u64(f.offset);
            put(w, f.project);
        }

        inline void get(WireReader &r, RowSetFinishing &f)
        {
            get(r, f.orderBy);
            f.limit.reset();
            if (r.read_bool())
            {
                f.limit = r.read_u64();
            }
            f.offset = r.read_u64();
            get(r, f.project);
        }

        inline void put_command(WireWriter &w, const CreateTimely &c)
        {
            w.write_u64(c.config.workers);
            w.write_u64(c.config.process);
            put(w, c.config.addresses);
            w.write_u32(c.config.idleArrangementMergeEffort);
            w.write_i64(c.epoch.envd);
            w.write_u64(c.epoch.replica);
        }

        inline void put_command(WireWriter &w, const CreateInstance &c)
        {
            w.write_u64(c.config.replicaId);
            w.write_bool(c.config.logging.has_value());
            if (c.config.logging)
            {
                put(w, *c.config.logging);
            }
        }

        inline void put_command(WireWriter &, const InitializationComplete &) {}

        inline void put_command(WireWriter &w, const UpdateConfiguration &c)
        {
            w.write_count(c.params.size());
            for (const auto &p : c.params)
            {
                w.write_u8(static_cast<std::uint8_t>(p.kind));
                w.write_u64(p.value);
            }
        }

        inline void put_command(WireWriter &w, const CreateDataflows<Timestamp> &c)
        {
            w.write_count(c.dataflows.size());
            for (const auto &d : c.dataflows)
            {
                put(w, d);
            }
        }

        inline void put_command(WireWriter &w, const AllowCompaction<Timestamp> &c)
        {
            w.write_count(c.frontiers.size());
            for (const auto &[id, frontier] : c.frontiers)
            {
                put(w, id);
                put(w, frontier);
            }
        }

        inline void put_command(WireWriter &w, const Peek<Timestamp> &c)
        {
            put(w, c.id);
            w.write_bool(c.literalConstraints.has_value());
            if (c.literalConstraints)
            {
                put(w, *c.literalConstraints);
            }
            put(w, c.uuid);
            w.write_u64(c.timestamp);
            put(w, c.finishing);
            put(w, c.otelCtx);
        }

        inline void put_command(WireWriter &w, const CancelPeeks &c)
        {
            w.write_count(c.uuids.size());
            for (const auto &u : c.uuids)
            {
                put(w, u);
            }
        }
    }

    inline ByteBuffer encode_command(const ComputeCommand<Timestamp> &cmd)
    {
        WireWriter w;
        w.write_u8(static_cast<std::uint8_t>(cmd.value.index()));
        std::visit([&](const auto &c)
                   { wire_detail::put_command(w, c); },
                   cmd.value);
        return w.take();
    }

    inline ComputeCommand<Timestamp> decode_command(std::span<const std::byte> bytes)
    {
        using namespace wire_detail;
        WireReader r(bytes);
        ComputeCommand<Timestamp> out;
        switch (r.read_u8())
        {
        case 0:
        {
            CreateTimely c;
            c.config.workers = r.read_u64();
            c.config.process = r.read_u64();
            get(r, c.config.addresses);
            c.config.idleArrangementMergeEffort = r.read_u32();
            c.epoch.envd = r.read_i64();
            c.epoch.replica = r.read_u64();
            out = std::move(c);
            break;
        }
        case 1:
        {
            CreateInstance c;
            c.config.replicaId = r.read_u64();
            if (r.read_bool())
            {
                LoggingConfig logging;
                get(r, logging);
                c.config.logging = std::move(logging);
            }
            out = std::move(c);
            break;
        }
        case 2:
            out = InitializationComplete{};
            break;
        case 3:
        {
            UpdateConfiguration c;
            const auto n = r.read_count();
            for (std::size_t i = 0; i < n; ++i)
            {
                const auto kind = r.read_u8();
                if (kind < 1 || kind > 2)
                {
                    throw std::runtime_error("decode_command: invalid ComputeParameter kind");
                }
                c.params.insert(ComputeParameter{static_cast<ComputeParameterKind>(kind), r.read_u64()});
            }
            out = std::move(c);
            break;
        }
        case 4:
        {
            CreateDataflows<Timestamp> c;
            c.dataflows.resize(r.read_count());
            for (auto &d : c.dataflows)
            {
                get(r, d);
            }
            out = std::move(c);
            break;
        }
        case 5:
        {
            AllowCompaction<Timestamp> c;
            c.frontiers.resize(r.read_count());
            for (auto &[id, frontier] : c.frontiers)
            {
                get(r, id);
                get(r, frontier);
            }
            out = std::move(c);
            break;
        }
        case 6:
        {
            Peek<Timestamp> c;
            get(r, c.id);
            if (r.read_bool())
            {
                std::vector<Row> keys;
                get(r, keys);
                c.literalConstraints = std::move(keys);
            }
            get(r, c.uuid);
            c.timestamp = r.read_u64();
            get(r, c.finishing);
            get(r, c.otelCtx);
            out = std::move(c);
            break;
        }
        case 7:
        {
            CancelPeeks c;
            const auto n = r.read_count();
            for (std::size_t i = 0; i < n; ++i)
            {
                Uuid u;
                get(r, u);
                c.uuids.insert(u);
            }
            out = std::move(c);
            break;
        }
        default:
            throw std::runtime_error("decode_command: unknown command tag");
        }
        if (!r.eof())
        {
            throw std::runtime_error("decode_command: trailing bytes");
        }
        return out;
    }

    inline ByteBuffer encode_response(const ComputeResponse<Timestamp> &resp)
    {
        using namespace wire_detail;
        WireWriter w;
        w.write_u8(static_cast<std::uint8_t>(resp.value.index()));
        if (const auto *uppers = resp.get_if<FrontierUppers<Timestamp>>())
        {
            w.write_count(uppers->uppers.size());
            for (const auto &[id, frontier] : uppers->uppers)
            {
                put(w, id);
                put(w, frontier);
            }
        }
        else if (const auto *peek = resp.get_if<PeekResponse>())
        {
            put(w, peek->uuid);
            w.write_u8(static_cast<std::uint8_t>(peek->result.index()));
            if (const auto *rows = std::get_if<PeekRows>(&peek->result))
            {
                w.write_count(rows->rows.size());
                for (const auto &[row, diff] : rows->rows)
                {
                    w.write_string(row);
                    w.write_i64(diff);
                }
            }
            else if (const auto *err = std::get_if<PeekError>(&peek->result))
            {
                w.write_string(err->message);
            }
            put(w, peek->otelCtx);
        }
        else
        {
            const auto &tail = *resp.get_if<TailResponse<Timestamp>>();
            put(w, tail.id);
            w.write_u8(static_cast<std::uint8_t>(tail.value.index()));
            if (const auto *batch = std::get_if<TailBatch<Timestamp>>(&tail.value))
            {
                put(w, batch->lower);
                put(w, batch->upper);
                w.write_count(batch->updates.size());
                for (const auto &u : batch->updates)
                {
                    w.write_u64(u.time);
                    w.write_string(u.row);
                    w.write_i64(u.diff);
                }
            }
            else
            {
                put(w, std::get<TailDroppedAt<Timestamp>>(tail.value).frontier);
            }
        }
        return w.take();
    }

    inline ComputeResponse<Timestamp> decode_response(std::span<const std::byte> bytes)
    {
        using namespace wire_detail;
        WireReader r(bytes);
        ComputeResponse<Timestamp> out;
        switch (r.read_u8())
        {
        case 0:
        {
            FrontierUppers<Timestamp> uppers;
            uppers.uppers.resize(r.read_count());
            for (auto &[id, frontier] : uppers.uppers)
            {
                get(r, id);
                get(r, frontier);
            }
            out = std::move(uppers);
            break;
        }
        case 1:
        {
            PeekResponse peek;
            get(r, peek.uuid);
            switch (r.read_u8())
            {
            case 0:
            {
                PeekRows rows;
                rows.rows.resize(r.read_count());
                for (auto &[row, diff] : rows.rows)
                {
                    row = r.read_string();
                    diff = r.read_i64();
                }
                peek.result = std::move(rows);
                break;
            }
            case 1:
                peek.result = PeekError{r.read_string()};
                break;
            case 2:
                peek.result = PeekCanceled{};
                break;
            default:
                throw std::runtime_error("decode_response: unknown peek result tag");
            }
            get(r, peek.otelCtx);
            out = std::move(peek);
            break;
        }
        case 2:
        {
            TailResponse<Timestamp> tail;
            get(r, tail.id);
            switch (r.read_u8())
            {
            case 0:
            {
                TailBatch<Timestamp> batch;
                get(r, batch.lower);
                get(r, batch.upper);
                batch.updates.resize(r.read_count());
                for (auto &u : batch.updates)
                {
                    u.time = r.read_u64();
                    u.row = r.read_string();
                    u.diff = r.read_i64();
                }
                tail.value = std::move(batch);
                break;
            }
            case 1:
            {
                TailDroppedAt<Timestamp> dropped;
                get(r, dropped.frontier);
                tail.value = std::move(dropped);
                break;
            }
            default:
                throw std::runtime_error("decode_response: unknown tail tag");
            }
            out = std::move(tail);
            break;
        }
        default:
            throw std::runtime_error("decode_response: unknown response tag");
        }
        if (!r.eof())
        {
            throw std::runtime_error("decode_response: trailing bytes");
        }
        return out;
    }
}
