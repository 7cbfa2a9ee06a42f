/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include <chrono>
#include <format>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "core/logger.hpp"
#include "project/pipeline_file.hpp"

namespace ps::management {

    const Version PipelineFile::CURRENT_VERSION(0, 1, 0);
    const std::string PipelineFile::FILE_HEADER = "PipeScene Visualization File";
    const std::string PipelineFile::EXTENSION = ".psv";

    namespace {

        // 0.0.x files kept the scene list under "pipelines" and had no name
        class Version00xTo010Migrator : public FileMigrator {
        public:
            bool canMigrate(const Version& from, const Version& to) const override {
                return from.major == 0 && from.minor == 0 && to == Version(0, 1, 0);
            }

            nlohmann::json migrate(const nlohmann::json& oldData, const Version&, const Version& to) const override {
                nlohmann::json data = oldData;
                if (data.contains("pipelines")) {
                    data["scenes"] = data["pipelines"];
                    data.erase("pipelines");
                }
                if (!data.contains("name")) {
                    data["name"] = "";
                }
                data["version"] = to.toString();
                return data;
            }
        };

    } // namespace

    Version::Version(const std::string& versionStr) {
        std::istringstream ss(versionStr);
        std::string token;

        std::getline(ss, token, '.');
        major = std::stoi(token);

        std::getline(ss, token, '.');
        minor = std::stoi(token);

        std::getline(ss, token);
        patch = std::stoi(token);
    }

    std::string Version::toString() const {
        return std::format("{}.{}.{}", major, minor, patch);
    }

    bool Version::operator>=(const Version& other) const {
        if (major != other.major)
            return major > other.major;
        if (minor != other.minor)
            return minor > other.minor;
        return patch >= other.patch;
    }

    bool Version::operator<(const Version& other) const {
        return !(*this >= other);
    }

    bool Version::operator<=(const Version& other) const {
        return *this < other || *this == other;
    }

    bool Version::operator>(const Version& other) const {
        return !(*this <= other);
    }

    bool Version::operator==(const Version& other) const {
        return major == other.major && minor == other.minor && patch == other.patch;
    }

    bool Version::operator!=(const Version& other) const {
        return !(*this == other);
    }

    void MigratorRegistry::registerMigrator(std::unique_ptr<FileMigrator> migrator) {
        migrators_.push_back(std::move(migrator));
    }

    nlohmann::json MigratorRegistry::migrateToVersion(const nlohmann::json& data, const Version& from, const Version& to) const {
        nlohmann::json current = data;
        Version currentVersion = from;

        while (currentVersion < to) {
            bool migrationFound = false;
            for (const auto& migrator : migrators_) {
                if (migrator->canMigrate(currentVersion, to)) {
                    current = migrator->migrate(current, currentVersion, to);
                    currentVersion = to; // migrators go straight to the target
                    migrationFound = true;
                    break;
                }
            }

            if (!migrationFound) {
                throw std::runtime_error("No migration path found from version " +
                                         currentVersion.toString() + " to " + to.toString());
            }
        }

        return current;
    }

    PipelineFile::PipelineFile() {
        data_.version = CURRENT_VERSION;
        data_.creation_time = generateCurrentTimeStamp();
        initializeMigrators();
    }

    PipelineFile::PipelineFile(const VisualizationData& initialData)
        : data_(initialData) {
        initializeMigrators();
    }

    void PipelineFile::initializeMigrators() {
        migrator_registry_.registerMigrator(std::make_unique<Version00xTo010Migrator>());
    }

    void PipelineFile::setOutputFileName(const std::filesystem::path& path) {
        if (std::filesystem::is_directory(path)) {
            std::string file_name = data_.name.empty() ? "visualization" : data_.name;
            file_name += EXTENSION;
            output_file_name_ = path / file_name;
            return;
        }
        if (path.extension() != EXTENSION) {
            throw std::runtime_error(std::format("PipelineFile: {} expected file extension to be {}", path.string(), EXTENSION));
        }
        output_file_name_ = path;
    }

    void PipelineFile::addScene(state::State scene) {
        data_.scenes.push_back(std::move(scene));
    }

    bool PipelineFile::readFromFile(const std::filesystem::path& filepath) {
        std::lock_guard<std::mutex> lock(io_mutex_);
        try {
            std::ifstream file(filepath);
            if (!file.is_open()) {
                LOG_ERROR("Cannot open file for reading: {}", filepath.string());
                return false;
            }

            nlohmann::json doc;
            file >> doc;

            if (!validateJsonStructure(doc)) {
                LOG_ERROR("Invalid JSON structure in file: {}", filepath.string());
                return false;
            }

            Version fileVersion(doc["version"].get<std::string>());
            if (!isCompatible(fileVersion)) {
                LOG_ERROR("{} was written by a newer version ({} > {})",
                          filepath.string(), fileVersion.toString(), CURRENT_VERSION.toString());
                return false;
            }

            nlohmann::json processedDoc = doc;
            if (fileVersion < CURRENT_VERSION) {
                LOG_INFO("Migrating from version {} to {}", fileVersion.toString(), CURRENT_VERSION.toString());
                processedDoc = migrator_registry_.migrateToVersion(doc, fileVersion, CURRENT_VERSION);
            }

            data_ = parseData(processedDoc);
            output_file_name_ = filepath;

            LOG_DEBUG("Read {} scene(s) from {}", data_.scenes.size(), filepath.string());
            return true;

        } catch (const std::exception& e) {
            LOG_ERROR("Error reading visualization file: {}", e.what());
            return false;
        }
    }

    bool PipelineFile::writeToFile(const std::filesystem::path& filepath) {
        std::lock_guard<std::mutex> lock(io_mutex_);

        std::filesystem::path targetPath = filepath.empty() ? output_file_name_ : filepath;
        if (targetPath.empty()) {
            LOG_ERROR("PipelineFile::writeToFile - no output file was set");
            return false;
        }

        if (std::filesystem::is_directory(targetPath)) {
            LOG_ERROR("PipelineFile: {} is directory and not a file", targetPath.string());
            return false;
        }

        const auto parent = targetPath.parent_path();
        if (!parent.empty() && !std::filesystem::is_directory(parent)) {
            LOG_ERROR("PipelineFile: parent directory {} of {} does not exist", parent.string(), targetPath.string());
            return false;
        }

        if (targetPath.extension() != EXTENSION) {
            LOG_ERROR("PipelineFile: {} expected file extension to be {}", targetPath.string(), EXTENSION);
            return false;
        }

        if (!validateData()) {
            LOG_ERROR("PipelineFile: refusing to write invalid visualization data to {}", targetPath.string());
            return false;
        }

        data_.last_update_time = generateCurrentTimeStamp();

        try {
            std::ofstream file(targetPath);
            if (!file.is_open()) {
                LOG_ERROR("Cannot open file for writing: {}", targetPath.string());
                return false;
            }

            nlohmann::ordered_json doc = serializeData(data_);
            file << doc.dump(4) << std::endl;

            return true;

        } catch (const std::exception& e) {
            LOG_ERROR("Error writing visualization file: {}", e.what());
            return false;
        }
    }

    bool PipelineFile::validateJsonStructure(const nlohmann::json& json) const {
        if (!json.is_object() || !json.contains("file_info") || !json.contains("version")) {
            return false;
        }
        if (json["file_info"] != FILE_HEADER) {
            return false;
        }
        // 0.0.x files predate the scene list rename, the migrator fills the rest in
        const bool has_scenes = json.contains("scenes") || json.contains("pipelines");
        return has_scenes &&
               json.contains("creation_time") &&
               json.contains("last_update_time");
    }

    VisualizationData PipelineFile::parseData(const nlohmann::json& json) const {
        VisualizationData data;

        data.version = Version(json["version"].get<std::string>());
        data.name = json.value("name", std::string{});
        data.creation_time = json["creation_time"].get<std::string>();
        data.last_update_time = json["last_update_time"].get<std::string>();

        const auto& scenes = json["scenes"];
        if (!scenes.is_array()) {
            throw std::runtime_error("\"scenes\" must be an array");
        }
        for (const auto& scene : scenes) {
            // Validates the metadata of every scene state
            state::class_name_of(scene);
            data.scenes.push_back(scene);
        }

        data.additional_fields = json;
        data.additional_fields.erase("file_info");
        data.additional_fields.erase("version");
        data.additional_fields.erase("name");
        data.additional_fields.erase("creation_time");
        data.additional_fields.erase("last_update_time");
        data.additional_fields.erase("scenes");

        return data;
    }

    nlohmann::ordered_json PipelineFile::serializeData(const VisualizationData& data) const {
        nlohmann::ordered_json json;

        json["file_info"] = FILE_HEADER;
        json["version"] = data.version.toString();
        json["name"] = data.name;
        json["creation_time"] = data.creation_time;
        json["last_update_time"] = data.last_update_time;

        json["scenes"] = nlohmann::ordered_json::array();
        for (const auto& scene : data.scenes) {
            json["scenes"].push_back(nlohmann::ordered_json::parse(scene.dump()));
        }

        if (data.additional_fields.is_object()) {
            for (const auto& [key, value] : data.additional_fields.items()) {
                json[key] = nlohmann::ordered_json::parse(value.dump());
            }
        }

        return json;
    }

    std::string PipelineFile::generateCurrentTimeStamp() const {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);

        std::stringstream ss;
        ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    bool PipelineFile::isCompatible(const Version& fileVersion) const {
        return fileVersion <= CURRENT_VERSION;
    }

    bool PipelineFile::validateData() const {
        if (data_.creation_time.empty()) {
            LOG_DEBUG("Visualization data has no creation time");
            return false;
        }
        for (size_t i = 0; i < data_.scenes.size(); ++i) {
            try {
                state::class_name_of(data_.scenes[i]);
            } catch (const state::StateError& e) {
                LOG_DEBUG("Scene {} of the visualization data is not a state: {}", i, e.what());
                return false;
            }
        }
        return true;
    }

} // namespace ps::management
