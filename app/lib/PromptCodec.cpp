#include "PromptCodec.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

#include <algorithm>
#include <array>
#include <cmath>
#include <exception>
#include <limits>
#include <map>
#include <sstream>
#include <vector>

namespace {

constexpr std::size_t kMaxWindowsPerApp = 5;
constexpr std::size_t kFallbackSummaryLength = 200;
constexpr std::size_t kMinActivityWords = 4;

const char* const kResponseInstructions = R"(Respond in this exact JSON format:
{
  "summary": "2-3 sentences describing what was accomplished.",
  "explanation": "A paragraph explaining the work themes.",
  "projects": [
    {
      "name": "Project Name",
      "timeMinutes": 45,
      "activities": ["Did X to achieve Y", "Fixed bug in Z component"],
      "confidence": "high"
    }
  ],
  "tags": ["tag1", "tag2"],
  "confidence": "high"
}

PROJECT DETECTION:
- Identify distinct projects from git repos, file paths, window titles, domains
- "Traq" not "Traq Development", "Synaptics" not "Synaptics Work"
- Research/learning ABOUT a project belongs TO that project (e.g., researching "RAG for factory operations" = part of Synaptics/42T project, NOT separate "Research")
- Only use "Research" project for truly unrelated learning
- Time estimates should sum to session duration

ACTIVITY QUALITY - CRITICAL:
Each activity MUST describe a concrete action with context. Pattern: "[Action verb] [specific thing] [optional: why/result]"

GOOD ACTIVITIES (include these):
- "Implemented pan/zoom controls for timeline visualization"
- "Fixed cross-midnight date filtering bug in reports"
- "Reviewed EventDrops library for timeline inspiration"
- "Debugged AI summary generation - model was hallucinating project names"
- "Researched RAG vs tool-calling patterns for factory agent"
- "Tested SL2619 touchpad gestures on demo hardware"

BAD ACTIVITIES (NEVER include these):
- "Edited files in /path/to/project" <- useless, obviously files were edited
- "Reviewed documentation" <- which docs? why?
- "Tested functionalities" <- what functionalities? be specific
- "Coding and development" <- says nothing
- "Browser activity" or "web browsing" <- useless
- "Worked on project" <- circular, tells nothing
- "Made changes" or "updated code" <- no specifics
- Any activity that just restates the project name
- Any activity under 5 words (too vague)

INFER SPECIFICS FROM CONTEXT:
- Window title "timeline.tsx - VS Code" + git commit "fix zoom" -> "Fixed zoom behavior in timeline component"
- Browser on "localhost:8000/demo" + focus on "SL2619" -> "Tested SL2619 demo application locally"
- YouTube "Microsoft Factory Agent" + domain "sl2619" context -> "Researched Microsoft Factory Operations patterns for Synaptics demo"

If you cannot infer a specific activity, OMIT IT rather than writing something generic.
)";

const std::array<const char*, 15> kGenericPhrases = {
    "reviewed documentation",
    "tested functionalities",
    "coding and development",
    "browser activity",
    "web browsing",
    "worked on project",
    "made changes",
    "updated code",
    "code editing",
    "various activities",
    "general development",
    "development work",
    "coding session",
    "programming tasks",
    "software development",
};

const std::array<const char*, 4> kFileTemplatePrefixes = {
    "edited files in ",
    "modified files in ",
    "changed files in ",
    "updated files in ",
};

const std::array<const char*, 8> kGenericEndings = {
    " in the browser",
    " in browser",
    " in chrome",
    " in google chrome",
    " in firefox",
    " and more",
    " etc",
    " etc.",
};

const std::array<const char*, 4> kSpecificTestTerms = {"bug", "feature", "component", "page"};

const std::array<const char*, 7> kDemoVerbs = {
    "built", "created", "tested", "fixed", "implemented", "reviewed", "presented",
};

// Durations accumulated per key, ordered by total descending then first appearance.
class DurationTally
{
public:
    void add(const std::string& key, double seconds)
    {
        auto it = index_.find(key);
        if (it == index_.end()) {
            index_.emplace(key, entries_.size());
            entries_.push_back({key, seconds});
        } else {
            entries_[it->second].second += seconds;
        }
    }

    std::vector<std::pair<std::string, double>> ranked() const
    {
        auto sorted = entries_;
        std::stable_sort(sorted.begin(), sorted.end(),
                         [](const auto& a, const auto& b) { return a.second > b.second; });
        return sorted;
    }

private:
    std::map<std::string, std::size_t> index_;
    std::vector<std::pair<std::string, double>> entries_;
};

int whole_minutes(double seconds)
{
    return static_cast<int>(seconds / 60.0);
}

bool is_meeting_title(const std::string& title)
{
    const std::string lower = Utils::to_lower_copy(title);
    return Utils::contains(lower, "huddle")
        || Utils::contains(lower, "zoom meeting")
        || Utils::contains(lower, "meet.google.com")
        || (Utils::contains(lower, "teams") && Utils::contains(lower, "meeting"));
}

void write_listing(std::ostringstream& out, const char* heading, const std::vector<std::string>& items)
{
    if (items.empty()) {
        return;
    }
    out << "=== " << heading << " ===\n";
    for (const auto& item : items) {
        out << "- " << item << "\n";
    }
    out << "\n";
}

void write_application_activity(std::ostringstream& out, const std::vector<FocusEvent>& events)
{
    if (events.empty()) {
        return;
    }
    out << "=== APPLICATION ACTIVITY ===\n";

    DurationTally apps;
    std::map<std::string, DurationTally> windows_by_app;
    for (const auto& event : events) {
        apps.add(event.app_name, event.duration_seconds);
        windows_by_app[event.app_name].add(event.window_title, event.duration_seconds);
    }

    for (const auto& [app, seconds] : apps.ranked()) {
        const int app_minutes = whole_minutes(seconds);
        if (app_minutes < 1) {
            continue;
        }
        out << "\n" << app << " (" << app_minutes << "m):\n";

        const auto windows = windows_by_app[app].ranked();
        for (std::size_t i = 0; i < windows.size() && i < kMaxWindowsPerApp; ++i) {
            const int minutes = whole_minutes(windows[i].second);
            if (minutes >= 1) {
                out << "  - " << windows[i].first << " (" << minutes << "m)\n";
            }
        }
        if (windows.size() > kMaxWindowsPerApp) {
            out << "  ... and " << (windows.size() - kMaxWindowsPerApp) << " more windows\n";
        }
    }
    out << "\n";
}

void write_meetings(std::ostringstream& out, const std::vector<FocusEvent>& events)
{
    std::vector<std::string> lines;
    for (const auto& event : events) {
        const int minutes = whole_minutes(event.duration_seconds);
        if (minutes >= 1 && is_meeting_title(event.window_title)) {
            lines.push_back(event.window_title + " (" + std::to_string(minutes) + "m)");
        }
    }
    write_listing(out, "MEETINGS DETECTED", lines);
}

// Non-string members read as empty; asString() would throw on objects and arrays.
std::string string_field(const Json::Value& object, const char* key)
{
    const Json::Value& value = object[key];
    return value.isString() ? value.asString() : std::string();
}

std::vector<std::string> string_list(const Json::Value& value)
{
    std::vector<std::string> items;
    if (!value.isArray()) {
        return items;
    }
    for (const auto& item : value) {
        if (item.isString()) {
            items.push_back(item.asString());
        }
    }
    return items;
}

int to_minutes(const Json::Value& value)
{
    if (value.isInt()) {
        return value.asInt();
    }
    if (value.isNumeric()) {
        const double minutes = value.asDouble();
        if (!std::isfinite(minutes)) {
            return 0;
        }
        constexpr double kMax = static_cast<double>(std::numeric_limits<int>::max());
        constexpr double kMin = static_cast<double>(std::numeric_limits<int>::min());
        return static_cast<int>(std::clamp(minutes, kMin, kMax));
    }
    return 0;
}

std::vector<ProjectBreakdown> parse_projects(const Json::Value& value)
{
    std::vector<ProjectBreakdown> projects;
    if (!value.isArray()) {
        return projects;
    }
    for (const auto& item : value) {
        if (!item.isObject()) {
            continue;
        }
        ProjectBreakdown project;
        project.name = string_field(item, "name");
        project.time_minutes = to_minutes(item["timeMinutes"]);
        project.confidence = string_field(item, "confidence");
        for (auto& activity : string_list(item["activities"])) {
            if (!PromptCodec::is_low_information(activity)) {
                project.activities.push_back(std::move(activity));
            }
        }
        projects.push_back(std::move(project));
    }
    return projects;
}

std::size_t word_count(const std::string& text)
{
    std::istringstream stream(text);
    std::size_t count = 0;
    std::string word;
    while (stream >> word) {
        ++count;
    }
    return count;
}

} // namespace

namespace PromptCodec {

std::string build_prompt(const SessionContext& context)
{
    std::ostringstream out;
    out << "Analyze this work session and provide a detailed summary.\n\n";

    const auto hours = context.duration_seconds / 3600;
    const auto minutes = (context.duration_seconds % 3600) / 60;
    if (hours > 0) {
        out << "Session Duration: " << hours << "h " << minutes << "m\n";
    } else {
        out << "Session Duration: " << minutes << "m\n";
    }
    out << "Screenshots: " << context.screenshot_count << "\n\n";

    write_application_activity(out, context.focus_events);
    write_meetings(out, context.focus_events);
    write_listing(out, "GIT COMMITS", context.git_commits);
    write_listing(out, "SHELL COMMANDS", context.shell_commands);
    write_listing(out, "FILE ACTIVITY", context.file_changes);
    write_listing(out, "BROWSER ACTIVITY", context.browser_visits);

    out << kResponseInstructions;
    return out.str();
}


SummaryResult parse_response(const std::string& raw)
{
    SummaryResult result;
    result.confidence = "medium";

    const auto start = raw.find('{');
    const auto end = raw.rfind('}');
    if (start != std::string::npos && end != std::string::npos && end > start) {
        Json::CharReaderBuilder builder;
        Json::Value root;
        std::string errors;
        std::istringstream stream(raw.substr(start, end - start + 1));
        bool parsed = false;
        try {
            parsed = Json::parseFromStream(builder, stream, &root, &errors);
        } catch (const std::exception& ex) {
            // jsoncpp throws once nesting exceeds its stack limit.
            errors = ex.what();
        }
        if (parsed && root.isObject()) {
            result.summary = string_field(root, "summary");
            result.explanation = string_field(root, "explanation");
            result.tags = string_list(root["tags"]);
            result.projects = parse_projects(root["projects"]);
            const std::string confidence = string_field(root, "confidence");
            if (!confidence.empty()) {
                result.confidence = confidence;
            }
            return result;
        }
        if (auto logger = Logger::get_logger("inference_logger")) {
            logger->debug("Model reply is not valid JSON, using raw text: {}", errors);
        }
    }

    result.summary = Utils::trim(raw);
    if (result.summary.size() > kFallbackSummaryLength) {
        result.summary = result.summary.substr(0, kFallbackSummaryLength) + "...";
    }
    if (result.summary.empty()) {
        result.summary = "No summary generated";
    }
    result.tags = {"general"};
    return result;
}


bool is_low_information(const std::string& activity)
{
    if (word_count(activity) < kMinActivityWords) {
        return true;
    }

    const std::string lower = Utils::to_lower_copy(Utils::trim(activity));

    for (const char* phrase : kGenericPhrases) {
        const std::string generic(phrase);
        if (lower == generic || Utils::starts_with(lower, generic + " ")) {
            return true;
        }
    }
    for (const char* prefix : kFileTemplatePrefixes) {
        if (Utils::starts_with(lower, prefix)) {
            return true;
        }
    }
    for (const char* ending : kGenericEndings) {
        if (Utils::ends_with(lower, ending)) {
            return true;
        }
    }

    if (Utils::contains(lower, "tested") && Utils::contains(lower, "in google chrome")) {
        const bool specific = std::any_of(kSpecificTestTerms.begin(), kSpecificTestTerms.end(),
                                          [&](const char* term) { return Utils::contains(lower, term); });
        if (!specific) {
            return true;
        }
    }

    if (Utils::ends_with(lower, " demo")) {
        const bool has_action = std::any_of(kDemoVerbs.begin(), kDemoVerbs.end(),
                                            [&](const char* verb) { return Utils::contains(lower, verb); });
        if (!has_action) {
            return true;
        }
    }
    return false;
}

} // namespace PromptCodec
