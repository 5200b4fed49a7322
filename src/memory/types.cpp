/*
 * engram - Memory Types Implementation
 */
#include <engram/memory/types.hpp>
#include <engram/core/utils.hpp>

namespace engram {

const char* experience_type_to_string(ExperienceType type) {
    switch (type) {
        case ExperienceType::EXPERIENCE:      return "experience";
        case ExperienceType::CORRECTION:      return "correction";
        case ExperienceType::INSIGHT:         return "insight";
        case ExperienceType::AUTO_CAPTURE:    return "auto_capture";
        case ExperienceType::SESSION_SUMMARY: return "session_summary";
    }
    return "experience";
}

bool experience_type_from_string(const std::string& name, ExperienceType& out) {
    if (name == "experience")      { out = ExperienceType::EXPERIENCE; return true; }
    if (name == "correction")      { out = ExperienceType::CORRECTION; return true; }
    if (name == "insight")         { out = ExperienceType::INSIGHT; return true; }
    if (name == "auto_capture")    { out = ExperienceType::AUTO_CAPTURE; return true; }
    if (name == "session_summary") { out = ExperienceType::SESSION_SUMMARY; return true; }
    return false;
}

const char* record_outcome_to_string(RecordOutcome outcome) {
    switch (outcome) {
        case RecordOutcome::CREATED:      return "created";
        case RecordOutcome::DEDUPLICATED: return "deduplicated";
        case RecordOutcome::UPSERTED:     return "upserted";
    }
    return "created";
}

CompactExperience make_compact(const Experience& e, size_t snippet_length) {
    CompactExperience c;
    c.id = e.id;
    c.type = e.type;
    c.tags = e.tags;
    c.created_at = e.created_at;
    c.success = e.success;
    c.project = e.project;
    c.snippet = utf8_prefix(e.context, snippet_length);
    c.topic_key = e.topic_key;
    c.duplicate_count = e.duplicate_count;
    c.revision_count = e.revision_count;
    return c;
}

} // namespace engram
