#include <condense/phases.hpp>

#include <atomic>
#include <utility>

namespace condense::internal {

rocksdb::Status ClusterNearDuplicates(const PhaseEnv& env, std::vector<WorkingNote>* notes,
                                      std::vector<Cluster>* clusters, size_t* removed) {
  if (!notes || !clusters || !removed) return rocksdb::Status::InvalidArgument("output is null");
  clusters->clear();
  *removed = 0;

  auto& list = *notes;
  const size_t n = list.size();

  // Concepts once per note; the comparisons below only read them.
  for (auto& w : list) {
    if (env.deadline->Expired()) return rocksdb::Status::TimedOut("near dedup deadline");
    EnsureConcepts(&w, env);
  }

  const double threshold = env.options->threshold_near;
  std::vector<bool> assigned(n, false);
  std::vector<std::vector<size_t>> groups;

  for (size_t seed = 0; seed < n; ++seed) {
    if (assigned[seed]) continue;
    assigned[seed] = true;
    std::vector<size_t> members{seed};

    std::vector<size_t> candidates;
    for (size_t j = seed + 1; j < n; ++j) {
      if (!assigned[j]) candidates.push_back(j);
    }

    // Scores land in a slot per candidate; assignment below is sequential.
    std::vector<double> combined(candidates.size(), 0.0);
    std::atomic<bool> timed_out{false};
    ParallelFor(candidates.size(), env.options->num_threads, [&](size_t k) {
      if (timed_out.load(std::memory_order_relaxed)) return;
      if (env.deadline->Expired()) {
        timed_out.store(true, std::memory_order_relaxed);
        return;
      }
      const WorkingNote& a = list[seed];
      const WorkingNote& b = list[candidates[k]];
      combined[k] = env.scorer->Score(a.normalized, a.concepts, b.normalized, b.concepts).combined;
    });
    if (timed_out.load()) return rocksdb::Status::TimedOut("near dedup deadline");

    for (size_t k = 0; k < candidates.size(); ++k) {
      if (combined[k] >= threshold) {
        assigned[candidates[k]] = true;
        members.push_back(candidates[k]);
      }
    }
    groups.push_back(std::move(members));
  }

  std::vector<WorkingNote> kept;
  kept.reserve(groups.size());
  for (const auto& members : groups) {
    size_t rep = members.front();
    for (size_t m : members) {
      if (Outranks(list[m].priority, list[rep].priority)) rep = m;
    }

    Cluster cluster;
    cluster.representative_note_id = list[rep].note.id;
    for (size_t m : members) cluster.member_note_ids.push_back(list[m].note.id);

    WorkingNote out = std::move(list[rep]);
    for (size_t m : members) {
      if (m != rep) FoldProvenance(&out, list[m]);
    }
    kept.push_back(std::move(out));
    clusters->push_back(std::move(cluster));
  }

  *removed = n - kept.size();
  SortBySequence(&kept);
  *notes = std::move(kept);
  return rocksdb::Status::OK();
}

}  // namespace condense::internal
