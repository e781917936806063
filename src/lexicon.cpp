#include <condense/lexicon.hpp>
#include <condense/version.hpp>

#include <algorithm>
#include <vector>

namespace condense {

namespace {

// Phrases are written in comparison form (lowercase, single spaces, letters
// and digits split). canonical == nullptr means the phrase is canonical.
struct LexiconRow {
  const char* phrase;
  ConceptCategory category;
  const char* canonical;
};

using C = ConceptCategory;

constexpr LexiconRow kLexicon[] = {
    // --- procedures ---
    {"craniotomy", C::kProcedure, nullptr},
    {"open craniotomy", C::kProcedure, "craniotomy"},
    {"pterional craniotomy", C::kProcedure, "craniotomy"},
    {"crani", C::kProcedure, "craniotomy"},
    {"craniectomy", C::kProcedure, nullptr},
    {"hemicraniectomy", C::kProcedure, "craniectomy"},
    {"decompressive craniectomy", C::kProcedure, "craniectomy"},
    {"coiling", C::kProcedure, nullptr},
    {"coil embolization", C::kProcedure, "coiling"},
    {"endovascular coiling", C::kProcedure, "coiling"},
    {"aneurysm coiling", C::kProcedure, "coiling"},
    {"clipping", C::kProcedure, nullptr},
    {"aneurysm clipping", C::kProcedure, "clipping"},
    {"microsurgical clipping", C::kProcedure, "clipping"},
    {"surgical clipping", C::kProcedure, "clipping"},
    {"clip ligation", C::kProcedure, "clipping"},
    {"evd", C::kProcedure, nullptr},
    {"external ventricular drain", C::kProcedure, "evd"},
    {"ventriculostomy", C::kProcedure, "evd"},
    {"ventricular drain", C::kProcedure, "evd"},
    {"lumbar drain", C::kProcedure, nullptr},
    {"lumbar drainage", C::kProcedure, "lumbar drain"},
    {"shunt", C::kProcedure, nullptr},
    {"vp shunt", C::kProcedure, "shunt"},
    {"ventriculoperitoneal shunt", C::kProcedure, "shunt"},
    {"resection", C::kProcedure, nullptr},
    {"tumor resection", C::kProcedure, "resection"},
    {"gross total resection", C::kProcedure, "resection"},
    {"gtr", C::kProcedure, "resection"},
    {"subtotal resection", C::kProcedure, "resection"},
    {"str", C::kProcedure, "resection"},
    {"debulking", C::kProcedure, "resection"},
    {"biopsy", C::kProcedure, nullptr},
    {"stereotactic biopsy", C::kProcedure, "biopsy"},
    {"cranioplasty", C::kProcedure, nullptr},
    {"bone flap replacement", C::kProcedure, "cranioplasty"},
    {"embolization", C::kProcedure, nullptr},
    {"laminectomy", C::kProcedure, nullptr},
    {"discectomy", C::kProcedure, nullptr},
    {"fusion", C::kProcedure, nullptr},
    {"tracheostomy", C::kProcedure, nullptr},
    {"intubation", C::kProcedure, nullptr},
    {"intubated", C::kProcedure, "intubation"},
    {"extubated", C::kProcedure, "extubation"},
    {"extubation", C::kProcedure, nullptr},

    // --- pathologies ---
    {"aneurysm", C::kPathology, nullptr},
    {"hemorrhage", C::kPathology, nullptr},
    {"bleeding", C::kPathology, "hemorrhage"},
    {"rebleed", C::kPathology, "hemorrhage"},
    {"rebleeding", C::kPathology, "hemorrhage"},
    {"subarachnoid hemorrhage", C::kPathology, nullptr},
    {"sah", C::kPathology, "subarachnoid hemorrhage"},
    {"intracerebral hemorrhage", C::kPathology, nullptr},
    {"ich", C::kPathology, "intracerebral hemorrhage"},
    {"subdural hematoma", C::kPathology, nullptr},
    {"sdh", C::kPathology, "subdural hematoma"},
    {"epidural hematoma", C::kPathology, nullptr},
    {"edh", C::kPathology, "epidural hematoma"},
    {"hematoma", C::kPathology, nullptr},
    {"tumor", C::kPathology, nullptr},
    {"mass", C::kPathology, "tumor"},
    {"glioblastoma", C::kPathology, nullptr},
    {"gbm", C::kPathology, "glioblastoma"},
    {"meningioma", C::kPathology, nullptr},
    {"metastasis", C::kPathology, nullptr},
    {"metastases", C::kPathology, "metastasis"},
    {"mets", C::kPathology, "metastasis"},
    {"hydrocephalus", C::kPathology, nullptr},
    {"ventriculomegaly", C::kPathology, "hydrocephalus"},
    {"enlarged ventricles", C::kPathology, "hydrocephalus"},
    {"vasospasm", C::kPathology, nullptr},
    {"cerebral vasospasm", C::kPathology, "vasospasm"},
    {"spasm", C::kPathology, "vasospasm"},
    {"delayed cerebral ischemia", C::kPathology, "vasospasm"},
    {"dci", C::kPathology, "vasospasm"},
    {"stroke", C::kPathology, nullptr},
    {"cva", C::kPathology, "stroke"},
    {"infarct", C::kPathology, "stroke"},
    {"infarction", C::kPathology, "stroke"},
    {"ischemic stroke", C::kPathology, "stroke"},
    {"edema", C::kPathology, nullptr},
    {"cerebral edema", C::kPathology, "edema"},
    {"brain swelling", C::kPathology, "edema"},
    {"mass effect", C::kPathology, "edema"},
    {"infection", C::kPathology, nullptr},
    {"wound infection", C::kPathology, "infection"},
    {"meningitis", C::kPathology, nullptr},
    {"ventriculitis", C::kPathology, nullptr},
    {"herniation", C::kPathology, nullptr},

    // --- imaging ---
    {"ct", C::kImaging, nullptr},
    {"head ct", C::kImaging, "ct"},
    {"ct head", C::kImaging, "ct"},
    {"cta", C::kImaging, nullptr},
    {"ct angiography", C::kImaging, "cta"},
    {"mri", C::kImaging, nullptr},
    {"mri brain", C::kImaging, "mri"},
    {"mra", C::kImaging, nullptr},
    {"dsa", C::kImaging, "angiography"},
    {"angiography", C::kImaging, nullptr},
    {"angiogram", C::kImaging, "angiography"},
    {"cerebral angiography", C::kImaging, "angiography"},
    {"digital subtraction angiography", C::kImaging, "angiography"},
    {"tcd", C::kImaging, nullptr},
    {"transcranial doppler", C::kImaging, "tcd"},
    {"eeg", C::kImaging, nullptr},
    {"x ray", C::kImaging, nullptr},
    {"xray", C::kImaging, "x ray"},
    {"ultrasound", C::kImaging, nullptr},
    {"scan", C::kImaging, nullptr},

    // --- medications ---
    {"aspirin", C::kMedication, nullptr},
    {"asa", C::kMedication, "aspirin"},
    {"acetylsalicylic acid", C::kMedication, "aspirin"},
    {"clopidogrel", C::kMedication, nullptr},
    {"plavix", C::kMedication, "clopidogrel"},
    {"warfarin", C::kMedication, nullptr},
    {"coumadin", C::kMedication, "warfarin"},
    {"apixaban", C::kMedication, nullptr},
    {"eliquis", C::kMedication, "apixaban"},
    {"rivaroxaban", C::kMedication, nullptr},
    {"xarelto", C::kMedication, "rivaroxaban"},
    {"levetiracetam", C::kMedication, nullptr},
    {"keppra", C::kMedication, "levetiracetam"},
    {"phenytoin", C::kMedication, nullptr},
    {"dilantin", C::kMedication, "phenytoin"},
    {"fosphenytoin", C::kMedication, "phenytoin"},
    {"dexamethasone", C::kMedication, nullptr},
    {"decadron", C::kMedication, "dexamethasone"},
    {"dex", C::kMedication, "dexamethasone"},
    {"mannitol", C::kMedication, nullptr},
    {"nimodipine", C::kMedication, nullptr},
    {"nimotop", C::kMedication, "nimodipine"},
    {"labetalol", C::kMedication, nullptr},
    {"nicardipine", C::kMedication, nullptr},
    {"cardene", C::kMedication, "nicardipine"},
    {"metoprolol", C::kMedication, nullptr},
    {"lopressor", C::kMedication, "metoprolol"},
    {"atorvastatin", C::kMedication, nullptr},
    {"lipitor", C::kMedication, "atorvastatin"},
    {"pantoprazole", C::kMedication, nullptr},
    {"protonix", C::kMedication, "pantoprazole"},
    {"heparin", C::kMedication, nullptr},
    {"enoxaparin", C::kMedication, nullptr},
    {"lovenox", C::kMedication, "enoxaparin"},
    {"vancomycin", C::kMedication, nullptr},
    {"cefazolin", C::kMedication, nullptr},
    {"ancef", C::kMedication, "cefazolin"},
    {"acetaminophen", C::kMedication, nullptr},
    {"tylenol", C::kMedication, "acetaminophen"},
    {"oxycodone", C::kMedication, nullptr},
    {"temozolomide", C::kMedication, nullptr},
    {"temodar", C::kMedication, "temozolomide"},

    // --- anatomy ---
    {"frontal", C::kAnatomy, nullptr},
    {"parietal", C::kAnatomy, nullptr},
    {"temporal", C::kAnatomy, nullptr},
    {"occipital", C::kAnatomy, nullptr},
    {"cerebellum", C::kAnatomy, nullptr},
    {"cerebellar", C::kAnatomy, "cerebellum"},
    {"brainstem", C::kAnatomy, nullptr},
    {"ventricle", C::kAnatomy, nullptr},
    {"ventricles", C::kAnatomy, "ventricle"},
    {"cervical", C::kAnatomy, nullptr},
    {"thoracic", C::kAnatomy, nullptr},
    {"lumbar", C::kAnatomy, nullptr},
    {"spine", C::kAnatomy, nullptr},
    {"mca", C::kAnatomy, "middle cerebral artery"},
    {"middle cerebral artery", C::kAnatomy, nullptr},
    {"aca", C::kAnatomy, "anterior cerebral artery"},
    {"anterior cerebral artery", C::kAnatomy, nullptr},
    {"ica", C::kAnatomy, "internal carotid artery"},
    {"internal carotid artery", C::kAnatomy, nullptr},
    {"pcomm", C::kAnatomy, "posterior communicating artery"},
    {"posterior communicating artery", C::kAnatomy, nullptr},
    {"acomm", C::kAnatomy, "anterior communicating artery"},
    {"anterior communicating artery", C::kAnatomy, nullptr},
    {"basilar", C::kAnatomy, nullptr},

    // --- findings ---
    {"deficit", C::kFinding, nullptr},
    {"deficits", C::kFinding, "deficit"},
    {"weakness", C::kFinding, nullptr},
    {"numbness", C::kFinding, nullptr},
    {"headache", C::kFinding, nullptr},
    {"seizure", C::kFinding, nullptr},
    {"seizures", C::kFinding, "seizure"},
    {"convulsion", C::kFinding, "seizure"},
    {"confusion", C::kFinding, nullptr},
    {"confused", C::kFinding, "confusion"},
    {"coma", C::kFinding, nullptr},
    {"fever", C::kFinding, nullptr},
    {"febrile", C::kFinding, "fever"},
    {"afebrile", C::kFinding, nullptr},
    {"aphasia", C::kFinding, nullptr},
    {"hemiparesis", C::kFinding, nullptr},
    {"dysarthria", C::kFinding, nullptr},
    {"pronator drift", C::kFinding, nullptr},
    {"nausea", C::kFinding, nullptr},
    {"vomiting", C::kFinding, nullptr},
    {"lethargy", C::kFinding, nullptr},
    {"lethargic", C::kFinding, "lethargy"},
};

size_t CountWords(std::string_view phrase) {
  return static_cast<size_t>(std::count(phrase.begin(), phrase.end(), ' ')) + 1;
}

bool IsNumber(std::string_view w) {
  if (w.empty() || w.size() > 3) return false;
  return std::all_of(w.begin(), w.end(), [](char c) { return c >= '0' && c <= '9'; });
}

// Strip leading zeros so "pod 03" and "pod 3" agree.
std::string CanonicalNumber(std::string_view w) {
  size_t i = 0;
  while (i + 1 < w.size() && w[i] == '0') ++i;
  return std::string(w.substr(i));
}

// Recognizes a day marker starting at words[i]; returns words consumed or 0.
size_t MatchDayMarker(const std::vector<std::string_view>& words, size_t i, Concept* out) {
  auto at = [&](size_t k) -> std::string_view {
    return i + k < words.size() ? words[i + k] : std::string_view();
  };

  const char* prefix = nullptr;
  size_t number_at = 0;
  if ((at(0) == "pod" || at(0) == "hd") && IsNumber(at(1))) {
    prefix = at(0) == "pod" ? "pod " : "hd ";
    number_at = 1;
  } else if ((at(0) == "postoperative" || at(0) == "hospital") && at(1) == "day" &&
             IsNumber(at(2))) {
    prefix = at(0) == "hospital" ? "hd " : "pod ";
    number_at = 2;
  } else if (at(0) == "post" && (at(1) == "op" || at(1) == "operative") && at(2) == "day" &&
             IsNumber(at(3))) {
    prefix = "pod ";
    number_at = 3;
  } else {
    return 0;
  }

  out->category = ConceptCategory::kTemporal;
  out->token = std::string(prefix) + CanonicalNumber(at(number_at));
  return number_at + 1;
}

}  // namespace

std::string_view ConceptCategoryName(ConceptCategory category) {
  switch (category) {
    case ConceptCategory::kProcedure:  return "procedure";
    case ConceptCategory::kPathology:  return "pathology";
    case ConceptCategory::kImaging:    return "imaging";
    case ConceptCategory::kMedication: return "medication";
    case ConceptCategory::kAnatomy:    return "anatomy";
    case ConceptCategory::kFinding:    return "finding";
    case ConceptCategory::kTemporal:   return "temporal";
  }
  return "unknown";
}

StaticConceptLexicon::StaticConceptLexicon() {
  table_.reserve(sizeof(kLexicon) / sizeof(kLexicon[0]));
  for (const auto& row : kLexicon) {
    table_.emplace(row.phrase, Entry{row.category, row.canonical ? row.canonical : row.phrase});
    max_phrase_words_ = std::max(max_phrase_words_, CountWords(row.phrase));
  }
}

int StaticConceptLexicon::Version() const { return kConceptLexiconVersion; }

ConceptSet StaticConceptLexicon::Extract(std::string_view normalized_text) const {
  std::vector<std::string_view> words;
  size_t pos = 0;
  while (pos < normalized_text.size()) {
    size_t next = normalized_text.find(' ', pos);
    if (next == std::string_view::npos) next = normalized_text.size();
    if (next > pos) words.push_back(normalized_text.substr(pos, next - pos));
    pos = next + 1;
  }

  ConceptSet out;
  std::string phrase;
  size_t i = 0;
  while (i < words.size()) {
    Concept day;
    if (size_t used = MatchDayMarker(words, i, &day)) {
      out.insert(std::move(day));
      i += used;
      continue;
    }

    // Greedy longest phrase.
    size_t matched = 0;
    const size_t longest = std::min(max_phrase_words_, words.size() - i);
    for (size_t n = longest; n >= 1 && matched == 0; --n) {
      phrase.assign(words[i].data(), words[i].size());
      for (size_t k = 1; k < n; ++k) {
        phrase += ' ';
        phrase.append(words[i + k].data(), words[i + k].size());
      }
      auto it = table_.find(phrase);
      if (it != table_.end()) {
        out.insert(Concept{it->second.category, it->second.canonical});
        matched = n;
      }
    }
    i += matched ? matched : 1;
  }
  return out;
}

std::shared_ptr<const ConceptLexicon> DefaultConceptLexicon() {
  static const std::shared_ptr<const ConceptLexicon> lexicon =
      std::make_shared<StaticConceptLexicon>();
  return lexicon;
}

}  // namespace condense
