// ReloadSettings.cpp
#include "LiveReload/ReloadSettings.h"
#include "LiveReload/Logging.hpp"

#include "rapidjson/document.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace LiveReload {

    namespace {

        unsigned int ClampMs(const rapidjson::Value& value, unsigned int lo, unsigned int hi) {
            const double clamped = std::clamp(value.GetDouble(), static_cast<double>(lo), static_cast<double>(hi));
            return static_cast<unsigned int>(clamped);
        }

        const rapidjson::Value* FindObject(const rapidjson::Value& parent, const char* name) {
            auto it = parent.FindMember(name);
            if (it == parent.MemberEnd() || !it->value.IsObject()) {
                return nullptr;
            }
            return &it->value;
        }

    } // namespace

    bool LoadReloadSettings(const std::string& filePath, ReloadSettings& out) {
        namespace fs = std::filesystem;

        std::error_code ec;
        if (!fs::exists(filePath, ec)) {
            LIVERELOAD_PRINT(ReloadLogging::LogLevel::Info, "[Settings] No settings file at ", filePath, ", using defaults");
            return false;
        }

        std::ifstream inFile(filePath, std::ios::binary);
        if (!inFile.is_open()) {
            LIVERELOAD_PRINT(ReloadLogging::LogLevel::Error, "[Settings] Failed to open file: ", filePath);
            return false;
        }

        std::string jsonContent((std::istreambuf_iterator<char>(inFile)), std::istreambuf_iterator<char>());
        inFile.close();

        rapidjson::Document doc;
        doc.Parse(jsonContent.c_str());

        if (doc.HasParseError() || !doc.IsObject()) {
            LIVERELOAD_PRINT(ReloadLogging::LogLevel::Error, "[Settings] JSON parse error in: ", filePath);
            return false;
        }

        ReloadSettings settings = out;

        if (const rapidjson::Value* watch = FindObject(doc, "watch")) {
            if (watch->HasMember("debounceMs") && (*watch)["debounceMs"].IsNumber()) {
                settings.watch.debounceMs = ClampMs((*watch)["debounceMs"], 0, kMaxDebounceMs);
            }
            if (watch->HasMember("pollIntervalMs") && (*watch)["pollIntervalMs"].IsNumber()) {
                settings.watch.pollIntervalMs = ClampMs((*watch)["pollIntervalMs"], kMinPollIntervalMs, kMaxPollIntervalMs);
            }
        }

        if (const rapidjson::Value* loader = FindObject(doc, "loader")) {
            if (loader->HasMember("shadowCopy") && (*loader)["shadowCopy"].IsBool()) {
                settings.loader.shadowCopy = (*loader)["shadowCopy"].GetBool();
            }
            if (loader->HasMember("shadowDirectory") && (*loader)["shadowDirectory"].IsString()) {
                settings.loader.shadowDirectory = (*loader)["shadowDirectory"].GetString();
            }
        }

        if (const rapidjson::Value* logging = FindObject(doc, "logging")) {
            if (logging->HasMember("level") && (*logging)["level"].IsString()) {
                const std::string levelText = (*logging)["level"].GetString();
                if (!ReloadLogging::ParseLogLevel(levelText, settings.logging.level)) {
                    LIVERELOAD_PRINT(ReloadLogging::LogLevel::Warn, "[Settings] Unknown log level '", levelText, "', keeping ",
                        ReloadLogging::ToString(settings.logging.level));
                }
            }
            if (logging->HasMember("file") && (*logging)["file"].IsString()) {
                settings.logging.filePath = (*logging)["file"].GetString();
            }
        }

        out = settings;
        LIVERELOAD_PRINT(ReloadLogging::LogLevel::Info, "[Settings] Loaded settings from: ", filePath);
        return true;
    }

    bool SaveReloadSettings(const std::string& filePath, const ReloadSettings& settings) {
        namespace fs = std::filesystem;

        fs::path parentDir = fs::path(filePath).parent_path();
        if (!parentDir.empty() && !fs::exists(parentDir)) {
            try {
                fs::create_directories(parentDir);
            }
            catch (const std::exception& e) {
                LIVERELOAD_PRINT(ReloadLogging::LogLevel::Error, "[Settings] Failed to create directory: ",
                    parentDir.string(), " (", e.what(), ")");
                return false;
            }
        }

        rapidjson::Document doc;
        doc.SetObject();
        rapidjson::Document::AllocatorType& alloc = doc.GetAllocator();

        rapidjson::Value watch(rapidjson::kObjectType);
        watch.AddMember("debounceMs", settings.watch.debounceMs, alloc);
        watch.AddMember("pollIntervalMs", settings.watch.pollIntervalMs, alloc);
        doc.AddMember("watch", watch, alloc);

        rapidjson::Value loader(rapidjson::kObjectType);
        rapidjson::Value shadowDirectory(settings.loader.shadowDirectory.c_str(), alloc);
        loader.AddMember("shadowCopy", settings.loader.shadowCopy, alloc);
        loader.AddMember("shadowDirectory", shadowDirectory, alloc);
        doc.AddMember("loader", loader, alloc);

        rapidjson::Value logging(rapidjson::kObjectType);
        rapidjson::Value level(ReloadLogging::ToString(settings.logging.level), alloc);
        rapidjson::Value logFile(settings.logging.filePath.c_str(), alloc);
        logging.AddMember("level", level, alloc);
        logging.AddMember("file", logFile, alloc);
        doc.AddMember("logging", logging, alloc);

        rapidjson::StringBuffer buffer;
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        doc.Accept(writer);

        std::ofstream outFile(filePath, std::ios::binary);
        if (!outFile.is_open()) {
            LIVERELOAD_PRINT(ReloadLogging::LogLevel::Error, "[Settings] Failed to open file for writing: ", filePath);
            return false;
        }

        outFile << buffer.GetString();
        outFile.close();

        LIVERELOAD_PRINT(ReloadLogging::LogLevel::Debug, "[Settings] Saved settings to: ", filePath);
        return true;
    }

} // namespace LiveReload
