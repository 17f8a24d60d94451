#include <algorithm>
#include <utility>

#include "sender/sender_engine.hpp"
#include "util/log.hpp"

namespace sender
{

const char *state_name(FileState s)
{
    switch (s)
    {
        case FileState::Queued:
            return "queued";
        case FileState::InFlight:
            return "in-flight";
        case FileState::Acknowledged:
            return "acknowledged";
    }
    return "?";
}

SenderEngine::SenderEngine(SenderConfig cfg) : cfg_(cfg) {}

void SenderEngine::set_on_acknowledged(OnAcknowledged cb)
{
    std::lock_guard<std::mutex> lk(mu_);
    on_acked_ = std::move(cb);
}

std::optional<std::size_t> SenderEngine::position_of(const FileSlot &s, std::uint32_t index)
{
    if (index == proto::HEADER_INDEX)
        return 0;
    if (index >= s.file.header.chunk_count)
        return std::nullopt;
    return static_cast<std::size_t>(index) + 1;
}

bool SenderEngine::enqueue(OutgoingFile f)
{
    if (f.chunks.empty() || !f.chunks.front().is_header() ||
        f.chunks.size() != static_cast<std::size_t>(f.header.chunk_count) + 1)
    {
        LOG_ERROR("enqueue: malformed chunk set for %s", f.id.to_string().c_str());
        return false;
    }
    for (std::size_t pos = 0; pos < f.chunks.size(); ++pos)
    {
        const proto::Chunk &c      = f.chunks[pos];
        const std::uint32_t expect =
            pos == 0 ? proto::HEADER_INDEX : static_cast<std::uint32_t>(pos - 1);
        if (c.file_id != f.id || c.index != expect)
        {
            LOG_ERROR("enqueue: chunk %zu of %s is %s/%u, expected index %u", pos,
                      f.id.to_string().c_str(), c.file_id.to_string().c_str(), c.index, expect);
            return false;
        }
    }

    std::lock_guard<std::mutex> lk(mu_);
    if (files_.count(f.id) || acknowledged_.count(f.id))
    {
        LOG_WARN("enqueue: %s already known", f.id.to_string().c_str());
        return false;
    }

    const proto::FileId id = f.id;
    FileSlot            slot;
    slot.remaining = f.chunks.size();
    slot.acked.assign(f.chunks.size(), false);
    slot.file = std::move(f);

    auto &stored = files_.emplace(id, std::move(slot)).first->second;
    if (cfg_.max_in_flight == 0 || rotation_.size() < cfg_.max_in_flight)
    {
        admit_locked(id, stored);
    }
    else
    {
        queued_.push_back(id);
        LOG_INFO("enqueue: %s '%s' queued (%zu in flight)", id.to_string().c_str(),
                 stored.file.header.file_name.c_str(), rotation_.size());
    }
    return true;
}

void SenderEngine::admit_locked(const proto::FileId &id, FileSlot &slot)
{
    slot.state = FileState::InFlight;
    rotation_.push_back(id);
    LOG_INFO("%s '%s' in flight: %zu bytes, %u chunks", id.to_string().c_str(),
             slot.file.header.file_name.c_str(),
             static_cast<std::size_t>(slot.file.header.file_size), slot.file.header.chunk_count);
}

void SenderEngine::promote_locked()
{
    while (!queued_.empty() && (cfg_.max_in_flight == 0 || rotation_.size() < cfg_.max_in_flight))
    {
        const proto::FileId id = queued_.front();
        queued_.pop_front();
        auto it = files_.find(id);
        if (it != files_.end())
            admit_locked(id, it->second);
    }
}

void SenderEngine::remove_from_rotation_locked(const proto::FileId &id)
{
    auto it = std::find(rotation_.begin(), rotation_.end(), id);
    if (it != rotation_.end())
    {
        const std::size_t pos = static_cast<std::size_t>(it - rotation_.begin());
        rotation_.erase(it);
        // keep pointing at the file that followed the removed one
        if (pos < rr_)
            --rr_;
        if (rr_ >= rotation_.size())
            rr_ = 0;
        return;
    }
    queued_.erase(std::remove(queued_.begin(), queued_.end(), id), queued_.end());
}

bool SenderEngine::cancel(const proto::FileId &id)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = files_.find(id);
    if (it == files_.end())
        return false;
    LOG_INFO("cancel: %s '%s' dropped with %zu chunks unacked", id.to_string().c_str(),
             it->second.file.header.file_name.c_str(), it->second.remaining);
    remove_from_rotation_locked(id);
    files_.erase(it);
    promote_locked();
    return true;
}

std::vector<proto::Chunk> SenderEngine::next_batch(std::size_t n)
{
    std::vector<proto::Chunk>   out;
    std::lock_guard<std::mutex> lk(mu_);
    if (rotation_.empty())
        return out;
    out.reserve(n);

    for (std::size_t k = 0; k < n && !rotation_.empty(); ++k)
    {
        if (rr_ >= rotation_.size())
            rr_ = 0;
        FileSlot &slot = files_.at(rotation_[rr_]);
        ++rr_;

        // remaining > 0 for every file in rotation, so this finds one within a lap
        const std::size_t total = slot.acked.size();
        for (std::size_t step = 0; step < total; ++step)
        {
            const std::size_t pos = slot.cursor;
            slot.cursor           = (slot.cursor + 1) % total;
            if (!slot.acked[pos])
            {
                out.push_back(slot.file.chunks[pos]);
                break;
            }
        }
    }
    return out;
}

void SenderEngine::ingest(const proto::ControlEvent &ev)
{
    OnAcknowledged cb;
    std::string    name;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto                        it = files_.find(ev.file_id);
        if (it == files_.end())
        {
            LOG_DEBUG("ingest: control event for unknown file %s", ev.file_id.to_string().c_str());
            return;
        }
        FileSlot &slot = it->second;

        if (ev.kind == proto::ControlKind::Cancel)
        {
            LOG_SYSTEM("[CANCEL] receiver abandoned %s '%s'", ev.file_id.to_string().c_str(),
                       slot.file.header.file_name.c_str());
            remove_from_rotation_locked(ev.file_id);
            files_.erase(it);
            promote_locked();
            return;
        }

        const auto pos = position_of(slot, ev.index);
        if (!pos)
        {
            LOG_DEBUG("ingest: ack index %u outside %s", ev.index, ev.file_id.to_string().c_str());
            return;
        }
        if (slot.acked[*pos])
            return;  // duplicate ack
        slot.acked[*pos] = true;
        if (--slot.remaining > 0)
            return;

        name = slot.file.header.file_name;
        LOG_SYSTEM("[ACKED] %s '%s' fully acknowledged", ev.file_id.to_string().c_str(),
                   name.c_str());
        remove_from_rotation_locked(ev.file_id);
        files_.erase(it);
        remember_acked_locked(ev.file_id);
        promote_locked();
        cb = on_acked_;
    }
    if (cb)
        cb(ev.file_id, name);
}

void SenderEngine::remember_acked_locked(const proto::FileId &id)
{
    if (cfg_.recent_acked == 0)
        return;
    if (acknowledged_.insert(id).second)
        acked_order_.push_back(id);
    while (acked_order_.size() > cfg_.recent_acked)
    {
        acknowledged_.erase(acked_order_.front());
        acked_order_.pop_front();
    }
}

std::optional<FileState> SenderEngine::state(const proto::FileId &id) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = files_.find(id);
    if (it != files_.end())
        return it->second.state;
    if (acknowledged_.count(id))
        return FileState::Acknowledged;
    return std::nullopt;
}

std::size_t SenderEngine::in_flight_count() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return rotation_.size();
}

std::size_t SenderEngine::queued_count() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return queued_.size();
}

std::size_t SenderEngine::unacked_count(const proto::FileId &id) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = files_.find(id);
    return it == files_.end() ? 0 : it->second.remaining;
}

bool SenderEngine::idle() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return files_.empty();
}

std::size_t SenderEngine::recent_acked_count() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return acked_order_.size();
}

}  // namespace sender
