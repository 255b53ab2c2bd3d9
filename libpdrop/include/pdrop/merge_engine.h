/**
 * @file merge_engine.h
 * @brief Multi-transport merge table for pdrop
 *
 * The MergeEngine reconciles raw sightings from several backends into one
 * peer table and decides which merged events to emit. It is pure state:
 * no threads, no clock of its own. The orchestrator's merge loop is its
 * single writer and passes arrival times in.
 *
 * Table invariant: an entry exists iff at least one backend currently
 * attributes a sighting to it. An entry is removed exactly when its set of
 * contributing backends becomes empty, and that removal is the only thing
 * that produces a merged PeerLost.
 */

#ifndef PDROP_MERGE_ENGINE_H
#define PDROP_MERGE_ENGINE_H

#include "pdrop/types.h"
#include <chrono>
#include <map>
#include <optional>
#include <vector>

namespace pdrop {

struct MergeOptions {
  /// Entries unseen for at least this long are expired by sweep()
  std::chrono::milliseconds ttl{std::chrono::seconds(30)};

  /// false: each (peer, backend) pair is tracked and reported separately
  bool dedupe = true;
};

class PDROP_API MergeEngine {
public:
  explicit MergeEngine(MergeOptions options = {});

  /**
   * @brief Apply one raw event from a backend
   * @param now Arrival time, stamped as the sighting's last_seen
   * @return Merged events to emit (zero or one)
   */
  std::vector<DiscoveryEvent> apply(const BackendId &backend,
                                    const DiscoveryEvent &event,
                                    TimePoint now);

  /**
   * @brief Withdraw every sighting attributed to a backend
   *
   * Used for stream closure and for detaching backends at shutdown.
   * @return PeerLost for each entry left without contributors
   */
  std::vector<DiscoveryEvent> remove_backend(const BackendId &backend);

  /**
   * @brief Expire entries whose last sighting is at least ttl old
   * @return Exactly one PeerLost per expired entry
   */
  std::vector<DiscoveryEvent> sweep(TimePoint now);

  /// Copy of the current table, ordered by peer id
  std::vector<PeerInfo> snapshot() const;

  /// Entry for a peer (first match when dedupe is off)
  std::optional<PeerInfo> find(const PeerId &id) const;

  size_t size() const { return table_.size(); }
  bool empty() const { return table_.empty(); }

  const MergeOptions &options() const { return options_; }

private:
  /// scope is empty when dedupe is on, the backend id otherwise
  struct Key {
    PeerId id;
    BackendId scope;

    bool operator<(const Key &other) const {
      if (id != other.id) {
        return id < other.id;
      }
      return scope < other.scope;
    }
  };

  Key key_for(const PeerId &id, const BackendId &backend) const;

  std::vector<DiscoveryEvent> on_discovered(const BackendId &backend,
                                            const PeerInfo &peer,
                                            TimePoint now);
  std::vector<DiscoveryEvent> on_lost(const BackendId &backend,
                                      const PeerInfo &peer);

  MergeOptions options_;
  std::map<Key, PeerInfo> table_;
};

} // namespace pdrop

#endif // PDROP_MERGE_ENGINE_H
