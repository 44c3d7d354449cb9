#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "chunk/chunk_set.hpp"
#include "chunk/errors.hpp"
#include "chunk/plan.hpp"
#include "remote/iremote_mover.hpp"

/*
Per oversized item:

  DISCOVERED ──size <= chunk──> DIRECT_TRANSFER ─────────────────────────────> DONE
      │
      └──size > chunk──> CHUNK_CHECK ──VALID──────────────────────> UPLOAD ──> DONE
                              │                                      ^
                              ├──INVALID──> INVALIDATE ──> RESPLIT ──┤
                              └──no chunks yet─────────────> RESPLIT ┘

A fresh RESPLIT is scanned and verified once more; failing that is fatal, never a loop.
*/

namespace app
{

enum class State
{
    Discovered,
    DirectTransfer,
    ChunkCheck,
    Invalidate,
    Resplit,
    Upload,
    Done,
    Failed
};

const char *state_name(State s);

struct SourceItem
{
    std::filesystem::path path;  // absolute
    std::uint64_t         size{0};
};

struct RunCounters
{
    std::uint64_t files{0};
    std::uint64_t bytes_seen{0};
    std::uint64_t direct_uploads{0};
    std::uint64_t chunks_uploaded{0};
    std::uint64_t resplits{0};
    std::uint64_t invalidations{0};
    std::uint64_t remote_delete_failures{0};
    std::uint64_t transfer_failures{0};
    std::uint64_t vanished{0};
};

// Everything one reconciliation pass needs; no state lives outside it.
struct ReconciliationContext
{
    SourceItem            item;
    chunk::ChunkSpec      spec;
    std::filesystem::path sidecar_dir;
    std::string           remote_dir;  // logical dir of the item on the remote store
    RunCounters          &counters;
};

struct ItemOutcome
{
    State              final_state{State::Discovered};
    std::vector<State> trace;
    chunk::Error       error;  // fatal kinds stop the run
    bool               skipped{false};
    std::size_t        local_deletes{0};
    std::size_t        remote_deletes{0};
    std::size_t        uploads{0};

    bool fatal() const { return chunk::is_fatal(error.kind); }
    bool visited(State s) const;
};

struct ReconcilerOptions
{
    bool check_space{true};
    int  min_free_percent{10};
};

class Reconciler
{
  public:
    Reconciler(remote::IRemoteMover &mover, ReconcilerOptions opts = {});

    ItemOutcome process(ReconciliationContext &ctx);

    // Bytes that get split for an item: the item itself if it is already an archive,
    // else its stored-archive wrapper.
    static std::uint64_t payload_size(const std::string &item_name, std::uint64_t item_size);

  private:
    void invalidate(ReconciliationContext &ctx, const chunk::ChunkSet &set, ItemOutcome &out);
    bool resplit(ReconciliationContext &ctx, std::uint64_t payload, ItemOutcome &out);
    void upload_chunks(ReconciliationContext &ctx, const chunk::ChunkSet &set, ItemOutcome &out);
    void direct_transfer(ReconciliationContext &ctx, ItemOutcome &out);
    void enter(ItemOutcome &out, State s);
    void fail(ItemOutcome &out, chunk::ErrorKind kind, std::string detail);

    remote::IRemoteMover &mover_;
    ReconcilerOptions     opts_;
};

}  // namespace app
