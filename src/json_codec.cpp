#include <condense/json_codec.hpp>

#include <json/json.h>

#include <sstream>

namespace condense {

namespace {

NoteInput ParseElement(const Json::Value& v) {
  NoteInput in;
  if (v.isString()) {
    in.text = v.asString();
    return in;
  }
  if (!v.isObject()) return in;  // no text: skipped at ingestion

  const Json::Value& text = v["text"];
  if (text.isString()) in.text = text.asString();

  const Json::Value& role = v.isMember("sourceRole") ? v["sourceRole"] : v["role"];
  if (role.isString()) in.role = role.asString();

  const Json::Value& seq = v["sequenceIndex"];
  if (seq.isIntegral() && seq.isInt64()) in.sequence_index = seq.asInt64();

  const Json::Value& id = v["id"];
  if (id.isString()) {
    in.id = id.asString();
  } else if (id.isIntegral() && id.isInt64()) {
    in.id = std::to_string(id.asInt64());
  } else if (id.isIntegral() && id.isUInt64()) {
    in.id = std::to_string(id.asUInt64());
  }
  return in;
}

std::string Write(const Json::Value& json, bool pretty) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = pretty ? "  " : "";
  return Json::writeString(builder, json);
}

}  // namespace

rocksdb::Status ParseNoteInputs(std::string_view json, std::vector<NoteInput>* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  out->clear();

  Json::Value root;
  Json::CharReaderBuilder builder;
  std::string errors;
  std::istringstream stream{std::string(json)};
  if (!Json::parseFromStream(builder, stream, &root, &errors)) {
    return rocksdb::Status::InvalidArgument("invalid JSON: " + errors);
  }

  const Json::Value* notes = &root;
  if (root.isObject()) {
    if (!root["notes"].isArray()) {
      return rocksdb::Status::InvalidArgument("expected an array or an object with \"notes\"");
    }
    notes = &root["notes"];
  } else if (!root.isArray()) {
    return rocksdb::Status::InvalidArgument("expected an array or an object with \"notes\"");
  }

  out->reserve(notes->size());
  for (const auto& element : *notes) out->push_back(ParseElement(element));
  return rocksdb::Status::OK();
}

std::string ResultToJson(const DeduplicationResult& result, bool pretty) {
  Json::Value json;

  Json::Value notes(Json::arrayValue);
  for (const auto& n : result.notes) {
    Json::Value note;
    note["id"] = n.id;
    note["text"] = n.text;
    note["sourceRole"] = std::string(SourceRoleName(n.source_role));
    note["sequenceIndex"] = static_cast<Json::Int64>(n.sequence_index);
    note["earliestSequenceIndex"] = static_cast<Json::Int64>(n.earliest_sequence_index);
    Json::Value provenance(Json::arrayValue);
    for (const auto& id : n.provenance) provenance.append(id);
    note["provenance"] = provenance;
    note["merged"] = n.merged;
    note["modified"] = n.modified;
    notes.append(note);
  }
  json["notes"] = notes;

  json["inputCount"] = static_cast<Json::UInt64>(result.input_count);
  json["outputCount"] = static_cast<Json::UInt64>(result.output_count);
  json["reductionPercent"] = result.reduction_percent;
  json["clusterCount"] = static_cast<Json::UInt64>(result.cluster_count);
  json["partial"] = result.partial;

  Json::Value clusters(Json::arrayValue);
  for (const auto& c : result.clusters) {
    Json::Value cluster;
    cluster["representativeNoteId"] = c.representative_note_id;
    Json::Value members(Json::arrayValue);
    for (const auto& id : c.member_note_ids) members.append(id);
    cluster["memberNoteIds"] = members;
    clusters.append(cluster);
  }
  json["clusters"] = clusters;

  const PhaseStats& s = result.phase_stats;
  Json::Value stats;
  stats["exactRemoved"] = static_cast<Json::UInt64>(s.exact_removed);
  stats["nearRemoved"] = static_cast<Json::UInt64>(s.near_removed);
  stats["sentencesRemoved"] = static_cast<Json::UInt64>(s.sentences_removed);
  stats["notesEmptied"] = static_cast<Json::UInt64>(s.notes_emptied);
  stats["merged"] = static_cast<Json::UInt64>(s.merged);
  stats["skippedInputs"] = static_cast<Json::UInt64>(s.skipped_inputs);
  stats["phasesCompleted"] = static_cast<Json::UInt64>(s.phases_completed);

  Json::Value durations;
  durations["exact"] = static_cast<Json::UInt64>(s.exact_us);
  durations["near"] = static_cast<Json::UInt64>(s.near_us);
  durations["sentence"] = static_cast<Json::UInt64>(s.sentence_us);
  durations["merge"] = static_cast<Json::UInt64>(s.merge_us);
  stats["durationsUs"] = durations;

  Json::Value errors(Json::arrayValue);
  for (const auto& e : s.errors) {
    Json::Value error;
    error["phase"] = e.phase;
    error["message"] = e.message;
    errors.append(error);
  }
  stats["errors"] = errors;
  json["phaseStats"] = stats;

  return Write(json, pretty);
}

std::string ScoreToJson(const SimilarityScore& score, bool pretty) {
  Json::Value json;
  json["jaccard"] = score.jaccard;
  json["levenshtein"] = score.levenshtein;
  json["semantic"] = score.semantic;
  json["combined"] = score.combined;
  return Write(json, pretty);
}

}  // namespace condense
