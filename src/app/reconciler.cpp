#include <algorithm>
#include <system_error>

#include "app/reconciler.hpp"
#include "archive/zip_store.hpp"
#include "chunk/naming.hpp"
#include "chunk/scanner.hpp"
#include "chunk/splitter.hpp"
#include "chunk/verifier.hpp"
#include "disk/free_space.hpp"
#include "remote/dest_path.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace app
{
namespace fs = std::filesystem;

const char *state_name(State s)
{
    switch (s)
    {
        case State::Discovered:
            return "DISCOVERED";
        case State::DirectTransfer:
            return "DIRECT_TRANSFER";
        case State::ChunkCheck:
            return "CHUNK_CHECK";
        case State::Invalidate:
            return "INVALIDATE";
        case State::Resplit:
            return "RESPLIT";
        case State::Upload:
            return "UPLOAD";
        case State::Done:
            return "DONE";
        case State::Failed:
            return "FAILED";
    }
    return "?";
}

bool ItemOutcome::visited(State s) const
{
    return std::find(trace.begin(), trace.end(), s) != trace.end();
}

Reconciler::Reconciler(remote::IRemoteMover &mover, ReconcilerOptions opts)
    : mover_(mover), opts_(opts)
{
}

std::uint64_t Reconciler::payload_size(const std::string &item_name, std::uint64_t item_size)
{
    if (chunk::style_for(item_name) == chunk::NameStyle::Raw)
        return item_size;
    return archive::stored_zip_size(item_name, item_size);
}

void Reconciler::enter(ItemOutcome &out, State s)
{
    out.trace.push_back(s);
    out.final_state = s;
    LOG_DEBUG("-> %s", state_name(s));
}

void Reconciler::fail(ItemOutcome &out, chunk::ErrorKind kind, std::string detail)
{
    out.error = chunk::Error{kind, std::move(detail)};
    enter(out, State::Failed);
}

ItemOutcome Reconciler::process(ReconciliationContext &ctx)
{
    ItemOutcome out;
    enter(out, State::Discovered);

    const std::string name = ctx.item.path.filename().string();

    // the item may be gone since traversal saw it
    std::error_code ec;
    if (!fs::is_regular_file(ctx.item.path, ec))
    {
        LOG_WARN("%s no longer exists, skipping", ctx.item.path.c_str());
        ++ctx.counters.vanished;
        out.skipped = true;
        out.error   = chunk::Error{chunk::ErrorKind::Vanished, ctx.item.path.string()};
        enter(out, State::Done);
        return out;
    }
    ctx.item.size = fs::file_size(ctx.item.path, ec);
    if (ec)
    {
        LOG_WARN("%s cannot be sized (%s), skipping", ctx.item.path.c_str(), ec.message().c_str());
        ++ctx.counters.vanished;
        out.skipped = true;
        out.error   = chunk::Error{chunk::ErrorKind::Vanished, ctx.item.path.string()};
        enter(out, State::Done);
        return out;
    }
    ++ctx.counters.files;
    ctx.counters.bytes_seen += ctx.item.size;

    if (ctx.spec.chunk_size_bytes == 0)
    {
        fail(out, chunk::ErrorKind::Plan, "chunk size must be > 0");
        return out;
    }
    LOG_INFO("Processing %s (%llu bytes)", ctx.item.path.c_str(),
             (unsigned long long)ctx.item.size);

    if (!chunk::needs_chunking(ctx.item.size, ctx.spec))
    {
        // leftovers from a run with a smaller chunk size
        auto stale = chunk::scan_chunks(name, ctx.sidecar_dir);
        if (!stale.ok)
        {
            fail(out, chunk::ErrorKind::Scan, stale.error.detail);
            return out;
        }
        if (!stale.set.empty())
        {
            LOG_INFO("- %s fits in one object now, dropping %zu old chunk(s)", name.c_str(),
                     stale.set.count());
            invalidate(ctx, stale.set, out);
        }
        direct_transfer(ctx, out);
        enter(out, State::Done);
        return out;
    }

    enter(out, State::ChunkCheck);
    const std::uint64_t payload = payload_size(name, ctx.item.size);
    auto                plan    = chunk::make_plan(payload, ctx.spec.chunk_size_bytes);
    if (!plan)
    {
        fail(out, chunk::ErrorKind::Plan, "no plan for " + name);
        return out;
    }
    LOG_INFO("- Larger than %llu bytes, expecting %llu chunk(s) of %llu payload bytes",
             (unsigned long long)ctx.spec.chunk_size_bytes,
             (unsigned long long)plan->expected_count, (unsigned long long)payload);

    auto scan = chunk::scan_chunks(name, ctx.sidecar_dir);
    if (!scan.ok)
    {
        fail(out, chunk::ErrorKind::Scan, scan.error.detail);
        return out;
    }

    if (scan.set.empty())
    {
        LOG_INFO("- No chunks yet, chunking %s", name.c_str());
    }
    else
    {
        const auto verdict = chunk::verify(scan.set, *plan);
        if (verdict.valid())
        {
            LOG_INFO("- Chunk verification PASSED (%zu chunk(s))", scan.set.count());
            enter(out, State::Upload);
            upload_chunks(ctx, scan.set, out);
            enter(out, State::Done);
            return out;
        }
        LOG_INFO("- Chunk verification FAILED: %s", chunk::describe(verdict).c_str());
        invalidate(ctx, scan.set, out);
    }

    if (!resplit(ctx, payload, out))
        return out;

    auto fresh = chunk::scan_chunks(name, ctx.sidecar_dir);
    if (!fresh.ok)
    {
        fail(out, chunk::ErrorKind::Scan, fresh.error.detail);
        return out;
    }
    const auto recheck = chunk::verify(fresh.set, *plan);
    if (!recheck.valid())
    {
        fail(out, chunk::ErrorKind::Split,
             "fresh chunks of " + name + " failed verification: " + chunk::describe(recheck));
        return out;
    }

    enter(out, State::Upload);
    upload_chunks(ctx, fresh.set, out);
    enter(out, State::Done);
    return out;
}

void Reconciler::invalidate(ReconciliationContext &ctx, const chunk::ChunkSet &set, ItemOutcome &out)
{
    enter(out, State::Invalidate);
    ++ctx.counters.invalidations;
    for (const auto &c : set.chunks)
    {
        LOG_INFO("-- Removing %s from the source", c.name.c_str());
        std::error_code ec;
        if (fs::remove(c.path, ec))
            ++out.local_deletes;
        else if (ec)
            LOG_ERROR("-- Cannot remove %s: %s", c.path.c_str(), ec.message().c_str());

        // best effort: a stale remote chunk must not survive next to the new set
        const std::string remote_path = remote::join_remote(ctx.remote_dir, c.name);
        LOG_INFO("-- Removing %s from the destination", remote_path.c_str());
        if (mover_.delete_remote(remote_path))
        {
            ++out.remote_deletes;
        }
        else
        {
            ++ctx.counters.remote_delete_failures;
            LOG_ERROR("-- %s: failed to remove %s from the destination",
                      chunk::kind_name(chunk::ErrorKind::RemoteDelete), remote_path.c_str());
        }
    }
}

bool Reconciler::resplit(ReconciliationContext &ctx, std::uint64_t payload, ItemOutcome &out)
{
    enter(out, State::Resplit);
    ++ctx.counters.resplits;

    const std::string name  = ctx.item.path.filename().string();
    const auto        style = chunk::style_for(name);

    std::error_code ec;
    fs::create_directories(ctx.sidecar_dir, ec);
    if (ec)
    {
        fail(out, chunk::ErrorKind::Split,
             "cannot create " + ctx.sidecar_dir.string() + ": " + ec.message());
        return false;
    }

    // archive + chunks coexist until the archive is dropped
    const std::uint64_t need = style == chunk::NameStyle::Archived ? 2 * payload : payload;
    if (opts_.check_space && !disk::check_free_space(ctx.sidecar_dir, need, opts_.min_free_percent))
    {
        fail(out, chunk::ErrorKind::Space, "not enough local space to chunk " + name);
        return false;
    }

    fs::path input = ctx.item.path;
    fs::path temp_archive;
    if (style == chunk::NameStyle::Archived)
    {
        temp_archive = ctx.sidecar_dir / chunk::split_base(name, style);
        LOG_INFO("- Zipping %s as %s", name.c_str(), temp_archive.c_str());
        auto ar = archive::write_stored_zip(ctx.item.path, temp_archive);
        if (!ar.ok)
        {
            fail(out, chunk::ErrorKind::Archive, ar.error.detail);
            return false;
        }
        if (ar.bytes != payload)
        {
            fs::remove(temp_archive, ec);
            fail(out, chunk::ErrorKind::Archive,
                 name + " changed size while archiving (" + std::to_string(ar.bytes) +
                     " != " + std::to_string(payload) + ")");
            return false;
        }
        input = temp_archive;
    }
    else
    {
        LOG_INFO("- %s is already an archive, splitting as-is", name.c_str());
    }

    LOG_INFO("- Splitting %s into chunks of %llu bytes", input.filename().c_str(),
             (unsigned long long)ctx.spec.chunk_size_bytes);
    auto sr = chunk::split_file(input, ctx.sidecar_dir, name, style, ctx.spec.chunk_size_bytes);

    if (!temp_archive.empty())
    {
        LOG_INFO("- Removing temporary file %s", temp_archive.c_str());
        if (!fs::remove(temp_archive, ec) && ec)
            LOG_WARN("- Cannot remove %s: %s", temp_archive.c_str(), ec.message().c_str());
    }

    if (!sr.ok)
    {
        fail(out, chunk::ErrorKind::Split, sr.error.detail);
        return false;
    }
    LOG_INFO("-- Split into %zu chunk(s), blake2b=%s", sr.chunks.size(), sr.digest_hex.c_str());
    return true;
}

void Reconciler::upload_chunks(ReconciliationContext &ctx, const chunk::ChunkSet &set, ItemOutcome &out)
{
    for (const auto &c : set.chunks)
    {
        LOG_INFO("-- Uploading chunk %s to %s", c.name.c_str(),
                 ctx.remote_dir.empty() ? "/" : ctx.remote_dir.c_str());
        auto res = mover_.copy(c.path, ctx.remote_dir);
        if (!res.ok)
        {
            ++ctx.counters.transfer_failures;
            LOG_ERROR("--- %s: %s -> %s: %s", chunk::kind_name(chunk::ErrorKind::Transfer),
                      c.name.c_str(), ctx.remote_dir.c_str(), res.diagnostics.c_str());
            continue;
        }
        ++ctx.counters.chunks_uploaded;
        ++out.uploads;
    }
}

void Reconciler::direct_transfer(ReconciliationContext &ctx, ItemOutcome &out)
{
    enter(out, State::DirectTransfer);
    LOG_INFO("-- Uploading %s to %s", ctx.item.path.filename().c_str(),
             ctx.remote_dir.empty() ? "/" : ctx.remote_dir.c_str());
    auto res = mover_.copy(ctx.item.path, ctx.remote_dir);
    if (!res.ok)
    {
        ++ctx.counters.transfer_failures;
        LOG_ERROR("--- %s: %s -> %s: %s", chunk::kind_name(chunk::ErrorKind::Transfer),
                  ctx.item.path.c_str(), ctx.remote_dir.c_str(), res.diagnostics.c_str());
        return;
    }
    ++ctx.counters.direct_uploads;
    ++out.uploads;
}

}  // namespace app
