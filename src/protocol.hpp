#pragma once

#include "common.hpp"
#include "frontier.hpp"

#include <chrono>
#include <compare>
#include <cstdio>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace replicaflow
{
    enum class GlobalIdKind : std::uint8_t
    {
        System = 0,
        User = 1,
        Transient = 2,
    };

    // Identifies a collection (index, sink, introspection source) across the
    // whole compute instance.
    struct GlobalId
    {
        GlobalIdKind kind = GlobalIdKind::User;
        std::uint64_t value = 0;

        static constexpr GlobalId system(std::uint64_t v) noexcept { return GlobalId{GlobalIdKind::System, v}; }
        static constexpr GlobalId user(std::uint64_t v) noexcept { return GlobalId{GlobalIdKind::User, v}; }
        static constexpr GlobalId transient(std::uint64_t v) noexcept { return GlobalId{GlobalIdKind::Transient, v}; }

        friend auto operator<=>(const GlobalId &, const GlobalId &) = default;
    };

    inline std::string to_string(const GlobalId &id)
    {
        const char prefix = id.kind == GlobalIdKind::System ? 's' : (id.kind == GlobalIdKind::User ? 'u' : 't');
        return std::string(1, prefix) + std::to_string(id.value);
    }

    // 128-bit peek identifier.
    struct Uuid
    {
        std::uint64_t hi = 0;
        std::uint64_t lo = 0;

        friend auto operator<=>(const Uuid &, const Uuid &) = default;
    };

    inline std::string to_string(const Uuid &u)
    {
        char buf[40];
        std::snprintf(buf, sizeof(buf), "%08llx-%04llx-%04llx-%04llx-%012llx",
                      static_cast<unsigned long long>(u.hi >> 32),
                      static_cast<unsigned long long>((u.hi >> 16) & 0xFFFFu),
                      static_cast<unsigned long long>(u.hi & 0xFFFFu),
                      static_cast<unsigned long long>(u.lo >> 48),
                      static_cast<unsigned long long>(u.lo & 0xFFFFFFFFFFFFULL));
        return std::string(buf);
    }

    using Row = std::string;
    using Diff = std::int64_t;

    // Carrier for distributed tracing context (e.g. a W3C traceparent).
    using TraceContext = std::map<std::string, std::string>;

    enum class LogVariant : std::uint8_t
    {
        TimelyOperates = 1,
        TimelyChannels = 2,
        TimelyElapsed = 3,
        DifferentialArrangementBatches = 4,
        DifferentialArrangementRecords = 5,
        ComputeDataflowCurrent = 6,
        ComputeFrontierCurrent = 7,
        ComputePeekCurrent = 8,
        ComputePeekDuration = 9,
    };

    inline const char *log_variant_name(LogVariant v) noexcept
    {
        switch (v)
        {
        case LogVariant::TimelyOperates:
            return "timely_operates";
        case LogVariant::TimelyChannels:
            return "timely_channels";
        case LogVariant::TimelyElapsed:
            return "timely_elapsed";
        case LogVariant::DifferentialArrangementBatches:
            return "differential_arrangement_batches";
        case LogVariant::DifferentialArrangementRecords:
            return "differential_arrangement_records";
        case LogVariant::ComputeDataflowCurrent:
            return "compute_dataflow_current";
        case LogVariant::ComputeFrontierCurrent:
            return "compute_frontier_current";
        case LogVariant::ComputePeekCurrent:
            return "compute_peek_current";
        case LogVariant::ComputePeekDuration:
            return "compute_peek_duration";
        }
        return "unknown";
    }

    // Where a persisted introspection collection lives in storage.
    struct CollectionMetadata
    {
        std::string dataShard;
        std::string statusShard;

        friend bool operator==(const CollectionMetadata &, const CollectionMetadata &) = default;
    };

    // Introspection collections a single replica writes to storage. These are
    // replica-specific and are filled in when a command is specialized.
    using PersistedLogs = std::map<LogVariant, std::pair<GlobalId, CollectionMetadata>>;

    struct LoggingConfig
    {
        std::uint64_t intervalNs = 1'000'000'000;
        bool enableLogging = true;
        bool logLogging = false;
        // Introspection indexes maintained by every replica.
        std::map<LogVariant, GlobalId> activeLogs;
        PersistedLogs sinkLogs;

        friend bool operator==(const LoggingConfig &, const LoggingConfig &) = default;
    };

    struct InstanceConfig
    {
        ReplicaId replicaId = 0;
        std::optional<LoggingConfig> logging;

        friend bool operator==(const InstanceConfig &, const InstanceConfig &) = default;
    };

    struct TimelyConfig
    {
        std::uint64_t workers = 1;
        // Index of the receiving process within its replica.
        std::uint64_t process = 0;
        std::vector<std::string> addresses;
        std::uint32_t idleArrangementMergeEffort = 1000;

        friend bool operator==(const TimelyConfig &, const TimelyConfig &) = default;
    };

    struct ComputeStartupEpoch
    {
        std::int64_t envd = 0;
        std::uint64_t replica = 0;

        friend bool operator==(const ComputeStartupEpoch &, const ComputeStartupEpoch &) = default;
    };

    enum class ComputeParameterKind : std::uint8_t
    {
        MaxResultSize = 1,
        DataflowMaxInflightBytes = 2,
    };

    struct ComputeParameter
    {
        ComputeParameterKind kind = ComputeParameterKind::MaxResultSize;
        std::uint64_t value = 0;

        friend auto operator<=>(const ComputeParameter &, const ComputeParameter &) = default;
    };

    struct RowSetFinishing
    {
        std::vector<std::uint32_t> orderBy;
        std::optional<std::uint64_t> limit;
        std::uint64_t offset = 0;
        std::vector<std::uint32_t> project;

        friend bool operator==(const RowSetFinishing &, const RowSetFinishing &) = default;
    };

    struct SourceImport
    {
        GlobalId id;
        bool monotonic = false;

        friend bool operator==(const SourceImport &, const SourceImport &) = default;
    };

    struct IndexImport
    {
        GlobalId id;
        GlobalId onId;
        bool monotonic = false;

        friend bool operator==(const IndexImport &, const IndexImport &) = default;
    };

    // An object the dataflow renders. The plan is opaque to the controller.
    struct BuildDesc
    {
        GlobalId id;
        std::string plan;

        friend bool operator==(const BuildDesc &, const BuildDesc &) = default;
    };

    struct IndexExport
    {
        GlobalId id;
        GlobalId onId;
        std::vector<std::uint32_t> key;

        friend bool operator==(const IndexExport &, const IndexExport &) = default;
    };

    struct SinkExport
    {
        GlobalId id;
        GlobalId from;
        std::string connection;

        friend bool operator==(const SinkExport &, const SinkExport &) = default;
    };

    template <class T>
    struct DataflowDescription
    {
        std::vector<SourceImport> sourceImports;
        std::vector<IndexImport> indexImports;
        std::vector<BuildDesc> objectsToBuild;
        std::vector<IndexExport> indexExports;
        std::vector<SinkExport> sinkExports;
        // Times at which the outputs must be correct. Set before sending.
        std::optional<Antichain<T>> asOf;
        Antichain<T> until;
        std::string debugName;

        std::vector<GlobalId> export_ids() const
        {
            std::vector<GlobalId> out;
            out.reserve(indexExports.size() + sinkExports.size());
            for (const auto &e : indexExports)
            {
                out.push_back(e.id);
            }
            for (const auto &e : sinkExports)
            {
                out.push_back(e.id);
            }
            return out;
        }

        friend bool operator==(const DataflowDescription &, const DataflowDescription &) = default;
    };

    // ---- Commands ----

    // Builds the runtime on each process of a replica. Always the first command.
    struct CreateTimely
    {
        TimelyConfig config;
        ComputeStartupEpoch epoch;

        friend bool operator==(const CreateTimely &, const CreateTimely &) = default;
    };

    struct CreateInstance
    {
        InstanceConfig config;

        friend bool operator==(const CreateInstance &, const CreateInstance &) = default;
    };

    struct InitializationComplete
    {
        friend bool operator==(const InitializationComplete &, const InitializationComplete &) = default;
    };

    struct UpdateConfiguration
    {
        std::set<ComputeParameter> params;

        friend bool operator==(const UpdateConfiguration &, const UpdateConfiguration &) = default;
    };

    template <class T>
    struct CreateDataflows
    {
        std::vector<DataflowDescription<T>> dataflows;

        friend bool operator==(const CreateDataflows &, const CreateDataflows &) = default;
    };

    // Allows the replicas to compact each named collection up to its frontier.
    // An empty frontier retires the collection.
    template <class T>
    struct AllowCompaction
    {
        std::vector<std::pair<GlobalId, Antichain<T>>> frontiers;

        friend bool operator==(const AllowCompaction &, const AllowCompaction &) = default;
    };

    template <class T>
    struct Peek
    {
        GlobalId id;
        // If set, look up only these keys. Never empty when set.
        std::optional<std::vector<Row>> literalConstraints;
        Uuid uuid;
        T timestamp{};
        RowSetFinishing finishing;
        TraceContext otelCtx;

        friend bool operator==(const Peek &, const Peek &) = default;
    };

    struct CancelPeeks
    {
        std::set<Uuid> uuids;

        friend bool operator==(const CancelPeeks &, const CancelPeeks &) = default;
    };

    template <class T>
    struct ComputeCommand
    {
        using Variant = std::variant<CreateTimely,
                                     CreateInstance,
                                     InitializationComplete,
                                     UpdateConfiguration,
                                     CreateDataflows<T>,
                                     AllowCompaction<T>,
                                     Peek<T>,
                                     CancelPeeks>;

        Variant value;

        ComputeCommand() = default;

        template <class C, class = std::enable_if_t<!std::is_same_v<std::decay_t<C>, ComputeCommand>>>
        ComputeCommand(C &&c) : value(std::forward<C>(c))
        {
        }

        template <class C>
        bool is() const noexcept { return std::holds_alternative<C>(value); }

        template <class C>
        const C *get_if() const noexcept { return std::get_if<C>(&value); }

        template <class C>
        C *get_if() noexcept { return std::get_if<C>(&value); }

        friend bool operator==(const ComputeCommand &, const ComputeCommand &) = default;
    };

    template <class T>
    inline const char *command_name(const ComputeCommand<T> &cmd) noexcept
    {
        switch (cmd.value.index())
        {
        case 0:
            return "CreateTimely";
        case 1:
            return "CreateInstance";
        case 2:
            return "InitializationComplete";
        case 3:
            return "UpdateConfiguration";
        case 4:
            return "CreateDataflows";
        case 5:
            return "AllowCompaction";
        case 6:
            return "Peek";
        case 7:
            return "CancelPeeks";
        }
        return "Unknown";
    }

    // Collections whose frontiers a command starts or ceases to define.
    template <class T>
    inline void frontier_tracking(const ComputeCommand<T> &cmd, std::vector<GlobalId> &start, std::vector<GlobalId> &cease)
    {
        if (const auto *ci = cmd.template get_if<CreateInstance>())
        {
            if (ci->config.logging)
            {
                for (const auto &[variant, id] : ci->config.logging->activeLogs)
                {
                    (void)variant;
                    start.push_back(id);
                }
            }
        }
        else if (const auto *cd = cmd.template get_if<CreateDataflows<T>>())
        {
            for (const auto &dataflow : cd->dataflows)
            {
                for (const auto &id : dataflow.export_ids())
                {
                    start.push_back(id);
                }
            }
        }
        else if (const auto *ac = cmd.template get_if<AllowCompaction<T>>())
        {
            for (const auto &[id, frontier] : ac->frontiers)
            {
                if (frontier.empty())
                {
                    cease.push_back(id);
                }
            }
        }
    }

    // ---- Responses ----

    struct PeekRows
    {
        std::vector<std::pair<Row, Diff>> rows;

        friend bool operator==(const PeekRows &, const PeekRows &) = default;
    };

    struct PeekError
    {
        std::string message;

        friend bool operator==(const PeekError &, const PeekError &) = default;
    };

    struct PeekCanceled
    {
        friend bool operator==(const PeekCanceled &, const PeekCanceled &) = default;
    };

    using PeekResult = std::variant<PeekRows, PeekError, PeekCanceled>;

    struct PeekResponse
    {
        Uuid uuid;
        PeekResult result;
        TraceContext otelCtx;

        friend bool operator==(const PeekResponse &, const PeekResponse &) = default;
    };

    template <class T>
    struct FrontierUppers
    {
        std::vector<std::pair<GlobalId, Antichain<T>>> uppers;

        friend bool operator==(const FrontierUppers &, const FrontierUppers &) = default;
    };

    template <class T>
    struct TailUpdate
    {
        T time{};
        Row row;
        Diff diff = 0;

        friend bool operator==(const TailUpdate &, const TailUpdate &) = default;
    };

    // Updates at times in [lower, upper).
    template <class T>
    struct TailBatch
    {
        Antichain<T> lower;
        Antichain<T> upper;
        std::vector<TailUpdate<T>> updates;

        friend bool operator==(const TailBatch &, const TailBatch &) = default;
    };

    template <class T>
    struct TailDroppedAt
    {
        Antichain<T> frontier;

        friend bool operator==(const TailDroppedAt &, const TailDroppedAt &) = default;
    };

    template <class T>
    struct TailResponse
    {
        GlobalId id;
        std::variant<TailBatch<T>, TailDroppedAt<T>> value;

        friend bool operator==(const TailResponse &, const TailResponse &) = default;
    };

    template <class T>
    struct ComputeResponse
    {
        using Variant = std::variant<FrontierUppers<T>, PeekResponse, TailResponse<T>>;

        Variant value;

        ComputeResponse() = default;

        template <class C, class = std::enable_if_t<!std::is_same_v<std::decay_t<C>, ComputeResponse>>>
        ComputeResponse(C &&c) : value(std::forward<C>(c))
        {
        }

        template <class C>
        bool is() const noexcept { return std::holds_alternative<C>(value); }

        template <class C>
        const C *get_if() const noexcept { return std::get_if<C>(&value); }

        template <class C>
        C *get_if() noexcept { return std::get_if<C>(&value); }

        friend bool operator==(const ComputeResponse &, const ComputeResponse &) = default;
    };

    template <class T>
    inline const char *response_name(const ComputeResponse<T> &resp) noexcept
    {
        switch (resp.value.index())
        {
        case 0:
            return "FrontierUppers";
        case 1:
            return "PeekResponse";
        case 2:
            return "TailResponse";
        }
        return "Unknown";
    }

    // Notes that a replica was heard from at the given wall-clock time.
    struct ReplicaHeartbeat
    {
        ReplicaId replica = 0;
        std::chrono::system_clock::time_point at{};

        friend bool operator==(const ReplicaHeartbeat &, const ReplicaHeartbeat &) = default;
    };

    // What the controller hands upstream: a deduplicated compute response or
    // a replica liveness notification.
    template <class T>
    struct ActiveReplicationResponse
    {
        std::variant<ComputeResponse<T>, ReplicaHeartbeat> value;

        bool is_heartbeat() const noexcept { return std::holds_alternative<ReplicaHeartbeat>(value); }

        const ComputeResponse<T> *compute() const noexcept { return std::get_if<ComputeResponse<T>>(&value); }
        const ReplicaHeartbeat *heartbeat() const noexcept { return std::get_if<ReplicaHeartbeat>(&value); }

        friend bool operator==(const ActiveReplicationResponse &, const ActiveReplicationResponse &) = default;
    };
}

namespace std
{
    template <>
    struct hash<replicaflow::GlobalId>
    {
        std::size_t operator()(const replicaflow::GlobalId &id) const noexcept
        {
            return std::hash<std::uint64_t>{}(id.value * 4 + static_cast<std::uint64_t>(id.kind));
        }
    };

    template <>
    struct hash<replicaflow::Uuid>
    {
        std::size_t operator()(const replicaflow::Uuid &u) const noexcept
        {
            return std::hash<std::uint64_t>{}(u.hi ^ (u.lo * 0x9e3779b97f4a7c15ULL));
        }
    };
}
