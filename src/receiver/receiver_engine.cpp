#include <utility>

#include "receiver/receiver_engine.hpp"
#include "util/log.hpp"

namespace receiver
{

const char *result_name(IngestResult r)
{
    switch (r)
    {
        case IngestResult::Accepted:
            return "accepted";
        case IngestResult::Duplicate:
            return "duplicate";
        case IngestResult::Malformed:
            return "malformed";
        case IngestResult::Violation:
            return "violation";
        case IngestResult::Ignored:
            return "ignored";
    }
    return "?";
}

ReceiverEngine::ReceiverEngine(IFileSink &sink, ReceiverConfig cfg)
    : sink_(sink), cfg_(cfg), queue_(cfg.dedup)
{
}

IngestResult ReceiverEngine::on_rx(const transport::Frame &f)
{
    ++stats_.frames;

    proto::DecodeError err;
    auto               p = proto::parse(f, &err);
    if (!p)
    {
        ++stats_.malformed;
        LOG_DEBUG("dropping malformed frame of %zu bytes (%s: %s)", f.size(),
                  proto::field_name(err.field), err.reason.c_str());
        return IngestResult::Malformed;
    }
    if (p->type != proto::PacketType::Chunk)
    {
        ++stats_.ignored;
        LOG_DEBUG("ignoring control packet on the data link");
        return IngestResult::Ignored;
    }
    return on_chunk(p->chunk);
}

IngestResult ReceiverEngine::on_chunk(const proto::Chunk &c)
{
    const FileRecord *existing = store_.find(c.file_id);
    if (existing && existing->abandoned)
    {
        // the earlier cancel may have been lost
        ++stats_.ignored;
        queue_.push(proto::ControlEvent::cancel(c.file_id));
        return IngestResult::Ignored;
    }

    IngestResult result;
    if (c.is_header())
    {
        proto::DecodeError err;
        auto               h = proto::decode_header(c.payload, &err);
        if (!h)
        {
            ++stats_.malformed;
            LOG_WARN("bad header payload for %s (%s: %s)", c.file_id.to_string().c_str(),
                     proto::field_name(err.field), err.reason.c_str());
            return IngestResult::Malformed;
        }

        std::size_t purged = 0;
        const auto  r      = store_.put_header(c.file_id, *h, &purged);
        stats_.violations += purged;
        if (r == StoreResult::HeaderConflict)
        {
            ++stats_.violations;
            return IngestResult::Violation;
        }
        result = r == StoreResult::HeaderStored ? IngestResult::Accepted : IngestResult::Duplicate;
        if (r == StoreResult::HeaderStored)
            LOG_INFO("header %s '%s': %llu bytes in %u chunks", c.file_id.to_string().c_str(),
                     h->file_name.c_str(), static_cast<unsigned long long>(h->file_size),
                     h->chunk_count);
    }
    else
    {
        const auto r = store_.put_data(c);
        if (r == StoreResult::IndexOutOfRange)
        {
            ++stats_.violations;
            LOG_WARN("chunk %u of %s is beyond its chunk count", c.index,
                     c.file_id.to_string().c_str());
            return IngestResult::Violation;
        }
        result = r == StoreResult::Stored ? IngestResult::Accepted : IngestResult::Duplicate;
    }

    if (result == IngestResult::Accepted)
        ++stats_.accepted;
    else
        ++stats_.duplicates;
    ack(c.file_id, c.index);

    const FileRecord *rec = store_.find(c.file_id);
    if (rec && rec->complete() && !rec->finalize_failed)
        finalize(c.file_id);
    return result;
}

void ReceiverEngine::ack(const proto::FileId &id, std::uint32_t index)
{
    if (!queue_.push(proto::ControlEvent::ack(id, index)))
        LOG_DEBUG("ack %s/%u already pending", id.to_string().c_str(), index);
}

std::string ReceiverEngine::output_name(const FileRecord &r) const
{
    std::string name = r.header ? safe_file_name(r.header->file_name) : std::string{};
    if (name.empty())
        name = r.id.to_string();
    return name;
}

bool ReceiverEngine::finalize(const proto::FileId &id)
{
    FileRecord *rec   = store_.find(id);
    auto        bytes = store_.assemble(id);
    if (!rec || !bytes)
        return false;

    if (bytes->size() != rec->header->file_size)
    {
        ++stats_.violations;
        abandon(id, "reassembled " + std::to_string(bytes->size()) + " bytes, header says " +
                        std::to_string(rec->header->file_size));
        return false;
    }

    const std::string name = output_name(*rec);
    std::string       err;
    if (!sink_.write_file(name, *bytes, err))
    {
        rec->finalize_failed = true;
        ++stats_.storage_failures;
        LOG_SYSTEM("[STORE] writing '%s' for %s failed: %s", name.c_str(),
                   id.to_string().c_str(), err.c_str());
        outcomes_.push_back(FileOutcome{id, name, OutcomeStatus::StorageFailed, err});
        return false;
    }

    store_.mark_finalized(id);
    ++stats_.finalized;
    LOG_SYSTEM("[FINAL] %s -> '%s' (%zu bytes)", id.to_string().c_str(), name.c_str(),
               bytes->size());
    outcomes_.push_back(FileOutcome{id, name, OutcomeStatus::Finalized, {}});
    if (cfg_.forget_finalized)
        store_.forget(id);
    return true;
}

std::size_t ReceiverEngine::retry_finalize()
{
    std::size_t done = 0;
    for (const auto &id : store_.pending_finalize())
    {
        if (FileRecord *rec = store_.find(id))
            rec->finalize_failed = false;
        if (finalize(id))
            ++done;
    }
    return done;
}

bool ReceiverEngine::abandon(const proto::FileId &id, const std::string &why)
{
    const FileRecord *rec = store_.find(id);
    if (!rec || rec->finalized || rec->abandoned)
        return false;

    const std::string name = output_name(*rec);
    store_.mark_abandoned(id);
    ++stats_.abandoned;
    queue_.push(proto::ControlEvent::cancel(id));
    LOG_SYSTEM("[ABANDON] %s '%s': %s", id.to_string().c_str(), name.c_str(), why.c_str());
    outcomes_.push_back(FileOutcome{id, name, OutcomeStatus::Abandoned, why});
    return true;
}

std::vector<FileOutcome> ReceiverEngine::take_outcomes()
{
    std::vector<FileOutcome> out;
    out.swap(outcomes_);
    return out;
}

}  // namespace receiver
