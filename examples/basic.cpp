#include <condense/pipeline.hpp>

#include <iostream>

int main() {
  condense::Options opt;
  std::unique_ptr<condense::Pipeline> pipeline;

  auto s = condense::Pipeline::Create(&pipeline, opt);
  if (!s.ok()) {
    std::cerr << "Create failed: " << s.ToString() << "\n";
    return 1;
  }

  std::vector<condense::NoteInput> notes = {
      condense::NoteInput("Patient developed vasospasm on POD 3.", "attending"),
      condense::NoteInput("Pt developed vasospasm POD#3."),
      condense::NoteInput("POD 3: patient afebrile, tolerating diet."),
      condense::NoteInput("POD 3: ambulating with PT, wound clean.", "PT"),
      condense::NoteInput("Patient developed vasospasm on POD 3.", "resident"),
  };

  condense::DeduplicationResult result;
  s = pipeline->Run(notes, &result);
  if (!s.ok()) {
    std::cerr << "Run failed: " << s.ToString() << "\n";
    return 1;
  }

  for (const auto& n : result.notes) {
    std::cout << n.id << " [" << condense::SourceRoleName(n.source_role) << "]"
              << (n.merged ? " merged" : "") << "\n  " << n.text << "\n  from:";
    for (const auto& id : n.provenance) std::cout << " " << id;
    std::cout << "\n";
  }

  std::cout << result.input_count << " -> " << result.output_count << " notes ("
            << result.reduction_percent << "% reduction)\n";

  // Pairwise scores are available without running the pipeline.
  auto score = pipeline->Similarity("Patient developed vasospasm on POD 3.",
                                    "Pt developed vasospasm POD#3.");
  std::cout << "jaccard=" << score.jaccard << " levenshtein=" << score.levenshtein
            << " semantic=" << score.semantic << " combined=" << score.combined << "\n";
  return 0;
}
