/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "state/state.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ps::management {

    // Version structure for semantic versioning
    struct Version {
        int major;
        int minor;
        int patch;

        Version(int maj = 0, int min = 0, int p = 1) : major(maj),
                                                       minor(min),
                                                       patch(p) {}
        explicit Version(const std::string& versionStr);

        std::string toString() const;
        bool operator>=(const Version& other) const;
        bool operator<(const Version& other) const;
        bool operator<=(const Version& other) const;
        bool operator>(const Version& other) const;
        bool operator==(const Version& other) const;
        bool operator!=(const Version& other) const;
    };

    // Everything a visualization file holds
    struct VisualizationData {
        Version version;
        std::string name;
        std::string creation_time;
        std::string last_update_time;
        // One full state tree per scene, metadata included
        std::vector<state::State> scenes;

        // Fields this version does not know, written back unchanged
        nlohmann::json additional_fields;
    };

    // Migration interface for backward compatibility
    class FileMigrator {
    public:
        virtual ~FileMigrator() = default;
        virtual bool canMigrate(const Version& from, const Version& to) const = 0;
        virtual nlohmann::json migrate(const nlohmann::json& oldData, const Version& from, const Version& to) const = 0;
    };

    class MigratorRegistry {
    private:
        std::vector<std::unique_ptr<FileMigrator>> migrators_;

    public:
        void registerMigrator(std::unique_ptr<FileMigrator> migrator);
        nlohmann::json migrateToVersion(const nlohmann::json& data, const Version& from, const Version& to) const;
    };

    // Reads and writes ".psv" visualization files
    class PipelineFile {
    private:
        VisualizationData data_;
        MigratorRegistry migrator_registry_;

        void initializeMigrators();
        bool validateJsonStructure(const nlohmann::json& json) const;
        VisualizationData parseData(const nlohmann::json& json) const;
        nlohmann::ordered_json serializeData(const VisualizationData& data) const;

    public:
        static const Version CURRENT_VERSION;
        static const std::string FILE_HEADER;
        static const std::string EXTENSION;

        PipelineFile();
        explicit PipelineFile(const VisualizationData& initialData);

        void setOutputFileName(const std::filesystem::path& path);
        std::filesystem::path getOutputPath() const { return output_file_name_; }

        bool readFromFile(const std::filesystem::path& filepath);
        // Writes to filepath, or to the output file name when it is empty
        bool writeToFile(const std::filesystem::path& filepath = {});

        const VisualizationData& getData() const { return data_; }
        VisualizationData& getData() { return data_; }

        void setName(const std::string& name) { data_.name = name; }
        void addScene(state::State scene);

        bool isCompatible(const Version& fileVersion) const;

        std::string generateCurrentTimeStamp() const;
        // Every scene carries state metadata and the creation time is set
        bool validateData() const;

    private:
        std::filesystem::path output_file_name_;
        mutable std::mutex io_mutex_;
    };

} // namespace ps::management
