#include "receiver/reassembly_store.hpp"
#include "util/log.hpp"

namespace receiver
{

FileRecord &ReassemblyStore::touch(const proto::FileId &id)
{
    auto it = map_.find(id);
    if (it != map_.end())
        return it->second;
    FileRecord &r = map_[id];
    r.id          = id;
    LOG_DEBUG("new record %s", id.to_string().c_str());
    return r;
}

FileRecord *ReassemblyStore::find(const proto::FileId &id)
{
    auto it = map_.find(id);
    return it == map_.end() ? nullptr : &it->second;
}

const FileRecord *ReassemblyStore::find(const proto::FileId &id) const
{
    auto it = map_.find(id);
    return it == map_.end() ? nullptr : &it->second;
}

StoreResult ReassemblyStore::put_header(const proto::FileId     &id,
                                        const proto::FileHeader &h,
                                        std::size_t             *purged)
{
    if (purged)
        *purged = 0;
    if (forgotten(id))
        return StoreResult::HeaderDuplicate;
    FileRecord &r = touch(id);
    if (r.header)
    {
        if (*r.header == h)
            return StoreResult::HeaderDuplicate;
        LOG_WARN("header conflict for %s: have '%s' (%u chunks), got '%s' (%u chunks)",
                 id.to_string().c_str(), r.header->file_name.c_str(), r.header->chunk_count,
                 h.file_name.c_str(), h.chunk_count);
        return StoreResult::HeaderConflict;
    }

    r.header = h;
    // data that raced ahead of the header may not fit in it
    std::size_t dropped = 0;
    for (auto it = r.parts.lower_bound(h.chunk_count); it != r.parts.end();)
    {
        r.bytes -= it->second.size();
        it = r.parts.erase(it);
        ++dropped;
    }
    if (dropped)
        LOG_WARN("%s: dropped %zu buffered chunks beyond chunk_count=%u", id.to_string().c_str(),
                 dropped, h.chunk_count);
    if (purged)
        *purged = dropped;
    return StoreResult::HeaderStored;
}

StoreResult ReassemblyStore::put_data(const proto::Chunk &c)
{
    if (forgotten(c.file_id))
        return StoreResult::Duplicate;
    FileRecord &r = touch(c.file_id);
    if (r.header && c.index >= r.header->chunk_count)
        return StoreResult::IndexOutOfRange;
    if (r.finalized)
        return StoreResult::Duplicate;

    auto it = r.parts.find(c.index);
    if (it != r.parts.end())
    {
        // overwrite keeps the latest copy; content is expected to be identical
        r.bytes = r.bytes - it->second.size() + c.payload.size();
        it->second = c.payload;
        return StoreResult::Duplicate;
    }
    r.parts.emplace(c.index, c.payload);
    r.bytes += c.payload.size();
    return StoreResult::Stored;
}

std::optional<std::vector<std::uint8_t>> ReassemblyStore::assemble(const proto::FileId &id) const
{
    const FileRecord *r = find(id);
    if (!r || !r->complete())
        return std::nullopt;

    std::vector<std::uint8_t> out;
    out.reserve(r->bytes);
    std::uint32_t expect = 0;
    for (const auto &[index, part] : r->parts)
    {
        if (index != expect)
            return std::nullopt;  // should not happen
        out.insert(out.end(), part.begin(), part.end());
        ++expect;
    }
    return out;
}

void ReassemblyStore::release(FileRecord &r)
{
    r.parts.clear();
    r.bytes = 0;
}

void ReassemblyStore::mark_finalized(const proto::FileId &id)
{
    if (FileRecord *r = find(id))
    {
        release(*r);
        r->finalized       = true;
        r->finalize_failed = false;
    }
}

void ReassemblyStore::forget(const proto::FileId &id)
{
    auto it = map_.find(id);
    if (it == map_.end() || !it->second.finalized)
        return;
    map_.erase(it);
    forgotten_.insert(id);
}

void ReassemblyStore::mark_abandoned(const proto::FileId &id)
{
    FileRecord &r = touch(id);
    release(r);
    r.abandoned = true;
}

std::vector<proto::FileId> ReassemblyStore::pending_finalize() const
{
    std::vector<proto::FileId> out;
    for (const auto &[id, r] : map_)
    {
        if (r.complete())
            out.push_back(id);
    }
    return out;
}

std::size_t ReassemblyStore::buffered_bytes() const
{
    std::size_t total = 0;
    for (const auto &kv : map_)
        total += kv.second.bytes;
    return total;
}

}  // namespace receiver
