/**
 * @file merge_engine.cpp
 * @brief Merge table implementation
 */

#include "pdrop/merge_engine.h"
#include "pdrop/log.h"

namespace pdrop {

MergeEngine::MergeEngine(MergeOptions options) : options_(options) {}

MergeEngine::Key MergeEngine::key_for(const PeerId &id,
                                      const BackendId &backend) const {
  return Key{id, options_.dedupe ? BackendId() : backend};
}

std::vector<DiscoveryEvent> MergeEngine::apply(const BackendId &backend,
                                               const DiscoveryEvent &event,
                                               TimePoint now) {
  if (event.peer.id.empty()) {
    PDROP_LOG_DEBUG("dropping event without peer identity from '%s'",
                    backend.c_str());
    return {};
  }

  if (event.is_discovered()) {
    return on_discovered(backend, event.peer, now);
  }
  return on_lost(backend, event.peer);
}

std::vector<DiscoveryEvent> MergeEngine::on_discovered(const BackendId &backend,
                                                       const PeerInfo &peer,
                                                       TimePoint now) {
  Key key = key_for(peer.id, backend);
  auto it = table_.find(key);

  if (it == table_.end()) {
    PeerInfo entry = peer;
    entry.transports = {backend};
    entry.last_seen = now;
    table_.emplace(key, entry);
    return {DiscoveryEvent::discovered(std::move(entry))};
  }

  // Known peer: refresh, never re-announce
  PeerInfo &entry = it->second;
  entry.transports.insert(backend);
  if (now > entry.last_seen) {
    entry.last_seen = now;
  }
  if (peer.signal_dbm) {
    entry.signal_dbm = peer.signal_dbm;
  }
  for (const auto &[k, v] : peer.metadata) {
    entry.metadata[k] = v;
  }
  return {};
}

std::vector<DiscoveryEvent> MergeEngine::on_lost(const BackendId &backend,
                                                 const PeerInfo &peer) {
  auto it = table_.find(key_for(peer.id, backend));
  if (it == table_.end() || !it->second.has_transport(backend)) {
    return {};
  }

  PeerInfo &entry = it->second;
  entry.transports.erase(backend);
  if (!entry.transports.empty()) {
    return {};
  }

  PeerInfo gone = std::move(entry);
  gone.transports = {backend};
  table_.erase(it);
  return {DiscoveryEvent::lost(std::move(gone))};
}

std::vector<DiscoveryEvent>
MergeEngine::remove_backend(const BackendId &backend) {
  std::vector<DiscoveryEvent> events;

  for (auto it = table_.begin(); it != table_.end();) {
    PeerInfo &entry = it->second;
    if (entry.transports.erase(backend) == 0 || !entry.transports.empty()) {
      ++it;
      continue;
    }

    PeerInfo gone = std::move(entry);
    gone.transports = {backend};
    events.push_back(DiscoveryEvent::lost(std::move(gone)));
    it = table_.erase(it);
  }

  return events;
}

std::vector<DiscoveryEvent> MergeEngine::sweep(TimePoint now) {
  std::vector<DiscoveryEvent> events;
  if (options_.ttl.count() <= 0) {
    return events;
  }

  for (auto it = table_.begin(); it != table_.end();) {
    if (now - it->second.last_seen < options_.ttl) {
      ++it;
      continue;
    }

    PDROP_LOG_DEBUG("peer '%s' expired", it->second.id.str().c_str());
    events.push_back(DiscoveryEvent::lost(std::move(it->second)));
    it = table_.erase(it);
  }

  return events;
}

std::vector<PeerInfo> MergeEngine::snapshot() const {
  std::vector<PeerInfo> peers;
  peers.reserve(table_.size());
  for (const auto &[key, entry] : table_) {
    peers.push_back(entry);
  }
  return peers;
}

std::optional<PeerInfo> MergeEngine::find(const PeerId &id) const {
  auto it = table_.lower_bound(Key{id, BackendId()});
  if (it != table_.end() && it->first.id == id) {
    return it->second;
  }
  return std::nullopt;
}

} // namespace pdrop
