#include <condense/phases.hpp>

#include <unordered_map>
#include <utility>

namespace condense::internal {

rocksdb::Status DeduplicateExact(const PhaseEnv& env, std::vector<WorkingNote>* notes,
                                 size_t* removed) {
  if (!notes || !removed) return rocksdb::Status::InvalidArgument("output is null");
  *removed = 0;

  // Groups in order of first appearance.
  std::unordered_map<std::string, size_t> group_of;
  std::vector<std::vector<size_t>> groups;
  group_of.reserve(notes->size());

  for (size_t i = 0; i < notes->size(); ++i) {
    if (env.deadline->Expired()) return rocksdb::Status::TimedOut("exact dedup deadline");
    const std::string fp = Fingerprint((*notes)[i].normalized.text);
    auto it = group_of.find(fp);
    if (it == group_of.end()) {
      group_of.emplace(fp, groups.size());
      groups.push_back({i});
    } else {
      groups[it->second].push_back(i);
    }
  }

  std::vector<WorkingNote> kept;
  kept.reserve(groups.size());
  for (const auto& members : groups) {
    size_t rep = members.front();
    for (size_t m : members) {
      if (Outranks((*notes)[m].priority, (*notes)[rep].priority)) rep = m;
    }
    WorkingNote out = std::move((*notes)[rep]);
    for (size_t m : members) {
      if (m != rep) FoldProvenance(&out, (*notes)[m]);
    }
    kept.push_back(std::move(out));
  }

  *removed = notes->size() - kept.size();
  SortBySequence(&kept);
  *notes = std::move(kept);
  return rocksdb::Status::OK();
}

}  // namespace condense::internal
