#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "proto/wire.hpp"

namespace receiver
{

enum class StoreResult
{
    Stored,           // new data index
    Duplicate,        // index already held (payload overwritten) or file already finalized
    HeaderStored,     // first header for the file
    HeaderDuplicate,  // same header again
    HeaderConflict,   // different header, first one kept
    IndexOutOfRange,  // data index >= known chunk_count
};

struct FileRecord
{
    proto::FileId                                     id;
    std::optional<proto::FileHeader>                  header;
    std::map<std::uint32_t, std::vector<std::uint8_t>> parts;  // data index -> payload
    std::size_t                                       bytes = 0;
    bool finalized       = false;  // written out, buffers released
    bool finalize_failed = false;  // sink refused it; waits for an explicit retry
    bool abandoned       = false;

    // header known and every index in [0, chunk_count) held
    bool complete() const
    {
        return header && !finalized && !abandoned && parts.size() == header->chunk_count;
    }
};

// Per-file reassembly state for one receiving session. Not thread-safe.
class ReassemblyStore
{
  public:
    FileRecord       &touch(const proto::FileId &id);
    FileRecord       *find(const proto::FileId &id);
    const FileRecord *find(const proto::FileId &id) const;

    // `purged` receives the number of buffered indices dropped for exceeding chunk_count
    StoreResult put_header(const proto::FileId     &id,
                           const proto::FileHeader &h,
                           std::size_t             *purged = nullptr);
    StoreResult put_data(const proto::Chunk &c);

    // Payloads concatenated in index order, nullopt unless the record is complete
    std::optional<std::vector<std::uint8_t>> assemble(const proto::FileId &id) const;

    // Drop the buffers of a written-out file but remember that it is done
    void mark_finalized(const proto::FileId &id);
    void mark_abandoned(const proto::FileId &id);
    // Drop a finalized record entirely, keeping only its id so late chunks
    // still count as duplicates instead of starting the file over
    void forget(const proto::FileId &id);
    bool forgotten(const proto::FileId &id) const { return forgotten_.count(id) != 0; }

    std::vector<proto::FileId> pending_finalize() const;
    std::size_t                size() const { return map_.size(); }
    std::size_t                buffered_bytes() const;

  private:
    static void release(FileRecord &r);

    std::unordered_map<proto::FileId, FileRecord> map_;
    std::unordered_set<proto::FileId>             forgotten_;
};

}  // namespace receiver
