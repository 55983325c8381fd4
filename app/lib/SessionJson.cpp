#include "SessionJson.hpp"
#include "AppException.hpp"
#include "Utils.hpp"

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif
#include <exception>
#include <fstream>
#include <memory>
#include <sstream>

namespace {

std::vector<std::string> strings_of(const Json::Value& root, const char* key)
{
    std::vector<std::string> items;
    const Json::Value& value = root[key];
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

std::int64_t int_of(const Json::Value& root, const char* key)
{
    const Json::Value& value = root[key];
    if (value.isInt64()) {
        return value.asInt64();
    }
    return value.isNumeric() ? Utils::saturating_int64(value.asDouble()) : 0;
}

std::string string_of(const Json::Value& root, const char* key)
{
    const Json::Value& value = root[key];
    return value.isString() ? value.asString() : std::string();
}

Json::Value to_array(const std::vector<std::string>& items)
{
    Json::Value array(Json::arrayValue);
    for (const auto& item : items) {
        array.append(item);
    }
    return array;
}

} // namespace

namespace SessionJson {

SessionContext parse_session(const std::string& text)
{
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    bool parsed = false;
    try {
        parsed = reader->parse(text.data(), text.data() + text.size(), &root, &errors);
    } catch (const std::exception& ex) {
        errors = ex.what();
    }
    if (!parsed) {
        THROW_APP_ERROR(ErrorCodes::Code::FILE_PARSE_FAILED, errors);
    }
    if (!root.isObject()) {
        THROW_APP_ERROR(ErrorCodes::Code::FILE_PARSE_FAILED, "session root must be an object");
    }

    SessionContext session;
    session.start_time = int_of(root, "startTime");
    session.end_time = int_of(root, "endTime");
    session.duration_seconds = int_of(root, "durationSeconds");
    if (session.duration_seconds == 0 && session.end_time > session.start_time) {
        session.duration_seconds = session.end_time - session.start_time;
    }
    session.screenshot_count = static_cast<int>(int_of(root, "screenshotCount"));
    session.top_apps = strings_of(root, "topApps");
    session.shell_commands = strings_of(root, "shellCommands");
    session.git_commits = strings_of(root, "gitCommits");
    session.file_changes = strings_of(root, "fileChanges");
    session.browser_visits = strings_of(root, "browserVisits");

    const Json::Value& focus = root["focusEvents"];
    if (focus.isArray()) {
        for (const auto& item : focus) {
            if (!item.isObject()) {
                continue;
            }
            FocusEvent event;
            event.app_name = string_of(item, "appName");
            event.window_title = string_of(item, "windowTitle");
            const Json::Value& seconds = item["durationSeconds"];
            event.duration_seconds = seconds.isNumeric() ? seconds.asDouble() : 0.0;
            session.focus_events.push_back(std::move(event));
        }
    }
    return session;
}


SessionContext read_session_file(const std::filesystem::path& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        THROW_APP_ERROR(ErrorCodes::Code::FILE_NOT_FOUND, Utils::path_to_utf8(path));
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_session(contents.str());
}


std::string summary_to_json(const SummaryResult& result)
{
    Json::Value root(Json::objectValue);
    root["summary"] = result.summary;
    root["explanation"] = result.explanation;
    root["tags"] = to_array(result.tags);
    root["confidence"] = result.confidence;
    root["modelUsed"] = result.model_used;
    root["inferenceTimeMs"] = static_cast<Json::Int64>(result.inference_time_ms);

    Json::Value projects(Json::arrayValue);
    for (const auto& project : result.projects) {
        Json::Value entry(Json::objectValue);
        entry["name"] = project.name;
        entry["timeMinutes"] = project.time_minutes;
        entry["activities"] = to_array(project.activities);
        entry["confidence"] = project.confidence;
        projects.append(entry);
    }
    root["projects"] = projects;

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    return Json::writeString(writer, root);
}

} // namespace SessionJson
