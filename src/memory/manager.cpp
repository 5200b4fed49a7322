/*
 * engram - Memory Manager Implementation
 */
#include <engram/memory/manager.hpp>
#include <engram/core/config.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>
#include <sstream>

namespace engram {

const int MemoryManager::DIGEST_PREFERENCES;
const int MemoryManager::DIGEST_EXPERIENCES;
const int MemoryManager::DIGEST_PATTERNS;
const int MemoryManager::DIGEST_CORRECTIONS;

MemoryConfig memory_config_from(const Config& config) {
    MemoryConfig mc;
    const int64_t MS_PER_MINUTE = 60 * 1000LL;
    
    mc.db_path = config.get_string("memory.db_path", mc.db_path);
    mc.dedup_window_ms = clamp<int64_t>(config.get_int("memory.dedup_window_minutes", 15), 0, 24 * 60) * MS_PER_MINUTE;
    mc.timeline_window_ms = clamp<int64_t>(config.get_int("memory.timeline_window_minutes", 60), 1, 7 * 24 * 60) * MS_PER_MINUTE;
    mc.timeline_limit = static_cast<int>(clamp<int64_t>(config.get_int("memory.timeline_limit", 20), 1, 500));
    mc.snippet_length = static_cast<size_t>(clamp<int64_t>(config.get_int("memory.snippet_length", 120), 1, 4096));
    mc.pattern_example_limit = static_cast<size_t>(clamp<int64_t>(config.get_int("memory.pattern_example_limit", 10), 1, 1000));
    mc.checkpoint_every = static_cast<int>(clamp<int64_t>(config.get_int("memory.checkpoint_every", 20), 1, 10000));
    return mc;
}

MemoryManager::MemoryManager() : initialized_(false) {}

MemoryManager::~MemoryManager() {
    shutdown();
}

bool MemoryManager::init(const MemoryConfig& config) {
    if (initialized_) {
        shutdown();
    }
    
    config_ = config;
    if (!store_.open(config_.db_path, config_)) {
        last_error_ = store_.last_error();
        LOG_ERROR("[MemoryManager] Failed to open store: %s", last_error_.c_str());
        return false;
    }
    
    initialized_ = true;
    LOG_INFO("[MemoryManager] Initialized (db=%s, dedup window=%lld min)",
             config_.db_path.c_str(), (long long)(config_.dedup_window_ms / 60000));
    return true;
}

bool MemoryManager::init(const Config& config) {
    return init(memory_config_from(config));
}

void MemoryManager::shutdown() {
    if (initialized_) {
        store_.checkpoint();
        store_.close();
        initialized_ = false;
        LOG_DEBUG("[MemoryManager] Shut down");
    }
}

bool MemoryManager::require_open() {
    if (!initialized_) {
        last_error_ = "memory manager not initialized";
        return false;
    }
    return true;
}

// ============================================================================
// Experiences
// ============================================================================

bool MemoryManager::record_experience(const ExperienceInput& input, RecordResult& out) {
    if (!require_open()) return false;
    
    if (!store_.experiences().record(input, out)) {
        last_error_ = store_.experiences().last_error();
        return false;
    }
    return true;
}

bool MemoryManager::record_correction(const std::string& what_i_did,
                                      const std::string& what_user_wanted,
                                      const std::string& lesson,
                                      const std::string& tags,
                                      const std::string& project,
                                      RecordResult& out,
                                      Pattern& pattern)
{
    if (!require_open()) return false;
    
    ExperienceInput input;
    input.type = ExperienceType::CORRECTION;
    input.context = what_i_did;
    input.action = what_user_wanted;
    input.result = lesson;
    input.success = false;
    input.tags = tags.empty() ? "correction" : tags;
    input.project = project;
    
    if (!store_.experiences().record(input, out)) {
        last_error_ = store_.experiences().last_error();
        return false;
    }
    
    std::string example = "Did: " + what_i_did + " \xE2\x86\x92 Wanted: " + what_user_wanted;
    if (!store_.patterns().record(lesson, "correction", example, pattern)) {
        last_error_ = "correction #" + std::to_string(out.id) + " recorded but pattern update failed: " +
                      store_.patterns().last_error();
        LOG_ERROR("[MemoryManager] %s", last_error_.c_str());
        return false;
    }
    
    LOG_INFO("[MemoryManager] Correction #%lld (%s), pattern frequency=%d",
             (long long)out.id, record_outcome_to_string(out.outcome), pattern.frequency);
    return true;
}

bool MemoryManager::query(const std::string& query, const std::string& project, int limit,
                          SearchResult& out)
{
    if (!require_open()) return false;
    
    if (!store_.experiences().search(query, project, limit, out)) {
        last_error_ = store_.experiences().last_error();
        return false;
    }
    return true;
}

bool MemoryManager::get_experience(int64_t id, Experience& out) {
    if (!require_open()) return false;
    return store_.experiences().get(id, out);
}

std::vector<Experience> MemoryManager::timeline(int64_t id) {
    if (!require_open()) return std::vector<Experience>();
    return store_.experiences().timeline(id);
}

std::vector<Experience> MemoryManager::recent_corrections(int limit) {
    if (!require_open()) return std::vector<Experience>();
    return store_.experiences().by_type(ExperienceType::CORRECTION, limit);
}

ForgetResult MemoryManager::forget(const ForgetSelector& selector) {
    ForgetResult res;
    if (!require_open()) {
        res.error = last_error_;
        return res;
    }
    if (selector.empty()) {
        res.error = "you must provide at least one of: id, tag, or project";
        return res;
    }
    
    ExperienceStore& experiences = store_.experiences();
    
    if (selector.has_id) {
        int n = experiences.soft_delete_by_id(selector.id);
        if (n < 0) {
            res.error = experiences.last_error();
            return res;
        }
        res.count += n;
    }
    if (!selector.tag.empty()) {
        int n = selector.exact_tag
            ? experiences.soft_delete_by_tag_exact(selector.tag)
            : experiences.soft_delete_by_tag(selector.tag);
        if (n < 0) {
            res.error = experiences.last_error();
            return res;
        }
        res.count += n;
    }
    if (!selector.project.empty()) {
        int n = experiences.soft_delete_by_project(selector.project);
        if (n < 0) {
            res.error = experiences.last_error();
            return res;
        }
        res.count += n;
    }
    
    res.ok = true;
    return res;
}

// ============================================================================
// Preferences and patterns
// ============================================================================

bool MemoryManager::learn_preference(const std::string& key, const std::string& value,
                                     const std::string& scope, const std::string& source,
                                     ResolvedPreference& out)
{
    if (!require_open()) return false;
    
    Preference pref;
    std::string effective_scope = scope.empty() ? "global" : scope;
    if (!store_.preferences().affirm(key, value, effective_scope, source, pref)) {
        last_error_ = store_.preferences().last_error();
        return false;
    }
    
    int64_t now = current_timestamp_ms();
    out.pref = pref;
    out.origin = effective_scope == "global" ? "global" : "project";
    out.decay_factor = PreferenceStore::decay_factor(pref.last_confirmed_at, now);
    out.effective_confidence = PreferenceStore::effective_confidence(pref, now);
    return true;
}

std::vector<ResolvedPreference> MemoryManager::preferences(const std::string& project) {
    if (!require_open()) return std::vector<ResolvedPreference>();
    return store_.preferences().merged(project, current_timestamp_ms());
}

std::vector<Pattern> MemoryManager::top_patterns(int limit) {
    if (!require_open()) return std::vector<Pattern>();
    return store_.patterns().top(limit);
}

// ============================================================================
// Maintenance
// ============================================================================

bool MemoryManager::stats(MemoryStats& out) {
    if (!require_open()) return false;
    
    out.experiences = store_.experiences().count_active();
    out.corrections = store_.experiences().count_active_by_type(ExperienceType::CORRECTION);
    out.soft_deleted = store_.experiences().count_deleted();
    out.global_prefs = store_.preferences().count_global();
    out.project_prefs = store_.preferences().count_project();
    out.patterns = store_.patterns().count();
    
    if (out.experiences < 0 || out.corrections < 0 || out.soft_deleted < 0) {
        last_error_ = store_.experiences().last_error();
        return false;
    }
    if (out.global_prefs < 0 || out.project_prefs < 0) {
        last_error_ = store_.preferences().last_error();
        return false;
    }
    if (out.patterns < 0) {
        last_error_ = store_.patterns().last_error();
        return false;
    }
    return true;
}

PruneResult MemoryManager::prune(const PruneOptions& options) {
    PruneResult res;
    if (!require_open()) {
        res.error = last_error_;
        return res;
    }
    if (options.older_than_days <= 0 && !options.has_min_confidence) {
        res.error = "you must provide at least older_than_days or min_confidence";
        return res;
    }
    
    if (options.older_than_days > 0) {
        res.experiences = store_.experiences().prune_older_than(options.older_than_days, options.only_failures);
        if (res.experiences < 0) {
            res.error = store_.experiences().last_error();
            res.experiences = 0;
            return res;
        }
    }
    if (options.has_min_confidence) {
        res.preferences = store_.preferences().prune_below(options.min_confidence);
        if (res.preferences < 0) {
            res.error = store_.preferences().last_error();
            res.preferences = 0;
            return res;
        }
    }
    
    res.ok = true;
    return res;
}

bool MemoryManager::checkpoint() {
    if (!require_open()) return false;
    if (!store_.checkpoint()) {
        last_error_ = store_.last_error();
        return false;
    }
    return true;
}

std::string MemoryManager::session_context(const std::string& project) {
    std::ostringstream out;
    if (!require_open()) return out.str();
    
    std::vector<ResolvedPreference> prefs = preferences(project);
    if (prefs.size() > static_cast<size_t>(DIGEST_PREFERENCES)) {
        prefs.resize(DIGEST_PREFERENCES);
    }
    
    std::vector<ExperienceType> excluded;
    excluded.push_back(ExperienceType::AUTO_CAPTURE);
    excluded.push_back(ExperienceType::SESSION_SUMMARY);
    std::vector<Experience> recent = store_.experiences().recent_excluding(excluded, project, DIGEST_EXPERIENCES);
    
    std::vector<Pattern> patterns = top_patterns(DIGEST_PATTERNS);
    std::vector<Experience> corrections = recent_corrections(DIGEST_CORRECTIONS);
    
    out << "## Memory Context\n";
    out << "**Project:** " << (project.empty() ? "(none)" : project) << "\n\n";
    
    out << "### Preferences (" << prefs.size() << ")\n";
    for (const auto& p : prefs) {
        out << "- **" << p.pref.key << ":** " << p.pref.value
            << " (confidence: " << p.effective_confidence << ", " << p.origin << ")\n";
    }
    if (prefs.empty()) out << "_(none)_\n";
    
    out << "\n### Recent Experiences (" << recent.size() << ")\n";
    for (const auto& e : recent) {
        out << "- [" << experience_type_to_string(e.type) << "] "
            << utf8_prefix(e.context, config_.snippet_length)
            << " (" << format_timestamp_ms(e.created_at) << ")\n";
    }
    if (recent.empty()) out << "_(none)_\n";
    
    out << "\n### Top Patterns (" << patterns.size() << ")\n";
    for (const auto& p : patterns) {
        out << "- " << p.description << " (freq: " << p.frequency << ", cat: " << p.category << ")\n";
    }
    if (patterns.empty()) out << "_(none)_\n";
    
    out << "\n### Recent Corrections (" << corrections.size() << ")\n";
    for (const auto& c : corrections) {
        out << "- Did: " << utf8_prefix(c.context, 80) << " -> Wanted: " << utf8_prefix(c.action, 80) << "\n";
    }
    if (corrections.empty()) out << "_(none)_\n";
    
    return out.str();
}

} // namespace engram
