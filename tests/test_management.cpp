#include "project/pipeline_file.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iostream>
#include <random>
#include <string>
#include <vector>

class PipelineFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create a temporary directory for test files
        temp_dir_ = std::filesystem::temp_directory_path() / "pipeline_file_test";
        std::filesystem::create_directories(temp_dir_);

        // Setup random number generator
        rng_.seed(33550336);
    }

    void TearDown() override {
        // Clean up temporary directory
        if (std::filesystem::exists(temp_dir_)) {
            std::filesystem::remove_all(temp_dir_);
        }
    }

    std::string generateRandomString(size_t length) {
        const std::string chars = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_";
        std::uniform_int_distribution<> dist(0, chars.size() - 1);

        std::string result;
        result.reserve(length);
        for (size_t i = 0; i < length; ++i) {
            result += chars[dist(rng_)];
        }
        return result;
    }

    ps::state::State generateRandomSceneState() {
        ps::state::State scene;
        scene[ps::state::METADATA_KEY] = {{"class_name", "Scene"}, {"version", 0}};
        scene["name"] = generateRandomString(10);
        scene["visible"] = std::uniform_int_distribution<>(0, 1)(rng_) == 1;
        scene["background"] = {0.1, 0.2, 0.3};
        scene["foreground"] = {1.0, 1.0, 1.0};

        auto children = ps::state::State::array();
        const int source_count = std::uniform_int_distribution<>(0, 3)(rng_);
        for (int i = 0; i < source_count; ++i) {
            ps::state::State source;
            source[ps::state::METADATA_KEY] = {{"class_name", "ParametricSource"}, {"version", 1}};
            source["name"] = generateRandomString(8);
            source["visible"] = true;
            source["function"] = "sphere";
            source["resolution"] = std::uniform_int_distribution<>(4, 128)(rng_);
            source[ps::state::CHILDREN_KEY] = ps::state::State::array();
            children.push_back(source);
        }
        scene[ps::state::CHILDREN_KEY] = std::move(children);
        return scene;
    }

    ps::management::VisualizationData generateRandomVisualizationData() {
        ps::management::VisualizationData data;

        data.version = ps::management::PipelineFile::CURRENT_VERSION;
        data.name = generateRandomString(15);
        data.creation_time = "2025-01-" + std::to_string(std::uniform_int_distribution<>(10, 28)(rng_)) + "T12:00:00Z";
        data.last_update_time = "2025-01-" + std::to_string(std::uniform_int_distribution<>(10, 28)(rng_)) + "T15:30:00Z";

        const int scene_count = std::uniform_int_distribution<>(0, 4)(rng_);
        for (int i = 0; i < scene_count; ++i) {
            data.scenes.push_back(generateRandomSceneState());
        }

        return data;
    }

    bool compareVisualizationData(const ps::management::VisualizationData& a, const ps::management::VisualizationData& b) {
        if (!(a.version == b.version)) {
            std::cout << "Version mismatch: " << a.version.toString() << " vs " << b.version.toString() << std::endl;
            return false;
        }

        if (a.name != b.name) {
            std::cout << "Name mismatch: '" << a.name << "' vs '" << b.name << "'" << std::endl;
            return false;
        }

        if (a.creation_time != b.creation_time) {
            std::cout << "Creation time mismatch: '" << a.creation_time << "' vs '" << b.creation_time << "'" << std::endl;
            return false;
        }

        if (a.scenes.size() != b.scenes.size()) {
            std::cout << "Scene count mismatch: " << a.scenes.size() << " vs " << b.scenes.size() << std::endl;
            return false;
        }

        for (size_t i = 0; i < a.scenes.size(); ++i) {
            if (a.scenes[i] != b.scenes[i]) {
                std::cout << "Scene[" << i << "] mismatch:\n"
                          << a.scenes[i].dump(2) << "\nvs\n"
                          << b.scenes[i].dump(2) << std::endl;
                return false;
            }
        }

        return true;
    }

    void writeJson(const std::filesystem::path& path, const nlohmann::json& json) {
        std::ofstream file(path);
        file << json.dump(4);
    }

    std::filesystem::path temp_dir_;
    std::mt19937 rng_;
};

TEST_F(PipelineFileTest, WriteReadCompareRandomVisualization) {
    auto original_data = generateRandomVisualizationData();

    std::filesystem::path temp_file = temp_dir_ / (generateRandomString(10) + ps::management::PipelineFile::EXTENSION);

    ps::management::PipelineFile file(original_data);
    file.setOutputFileName(temp_file);

    ASSERT_TRUE(file.writeToFile()) << "Failed to write visualization to file: " << temp_file;
    ASSERT_TRUE(std::filesystem::exists(temp_file)) << "Visualization file was not created: " << temp_file;

    ps::management::PipelineFile loaded;
    ASSERT_TRUE(loaded.readFromFile(temp_file)) << "Failed to read visualization from file: " << temp_file;

    EXPECT_TRUE(compareVisualizationData(original_data, loaded.getData())) << "Original and loaded data do not match";
    EXPECT_EQ(loaded.getOutputPath(), temp_file);

    // Verify file structure (check if it's valid JSON and has expected fields)
    std::ifstream in(temp_file);
    ASSERT_TRUE(in.is_open()) << "Cannot open written file for verification";

    nlohmann::json json_content;
    in >> json_content;

    EXPECT_TRUE(json_content.contains("file_info")) << "Missing file_info field";
    EXPECT_TRUE(json_content.contains("version")) << "Missing version field";
    EXPECT_TRUE(json_content.contains("name")) << "Missing name field";
    EXPECT_TRUE(json_content.contains("creation_time")) << "Missing creation_time field";
    EXPECT_TRUE(json_content.contains("last_update_time")) << "Missing last_update_time field";
    EXPECT_TRUE(json_content.contains("scenes")) << "Missing scenes field";

    EXPECT_EQ(json_content["file_info"].get<std::string>(), "PipeScene Visualization File");
    EXPECT_EQ(json_content["version"].get<std::string>(), "0.1.0");
}

TEST_F(PipelineFileTest, MultipleRandomVisualizations) {
    for (int test_case = 0; test_case < 10; ++test_case) {
        SCOPED_TRACE("Test case: " + std::to_string(test_case));

        auto original_data = generateRandomVisualizationData();
        std::filesystem::path temp_file = temp_dir_ / ("test_" + std::to_string(test_case) + ps::management::PipelineFile::EXTENSION);

        ps::management::PipelineFile file(original_data);
        ASSERT_TRUE(file.writeToFile(temp_file));
        ASSERT_TRUE(std::filesystem::exists(temp_file));

        ps::management::PipelineFile loaded;
        ASSERT_TRUE(loaded.readFromFile(temp_file));
        EXPECT_TRUE(compareVisualizationData(original_data, loaded.getData()));
    }
}

TEST_F(PipelineFileTest, EmptySceneListHandling) {
    auto data = generateRandomVisualizationData();
    data.scenes.clear();

    std::filesystem::path temp_file = temp_dir_ / ("empty" + ps::management::PipelineFile::EXTENSION);

    ps::management::PipelineFile file(data);
    ASSERT_TRUE(file.writeToFile(temp_file));

    ps::management::PipelineFile loaded;
    ASSERT_TRUE(loaded.readFromFile(temp_file));
    EXPECT_TRUE(compareVisualizationData(data, loaded.getData()));
    EXPECT_TRUE(loaded.getData().scenes.empty());
}

TEST_F(PipelineFileTest, UnknownFieldsSurviveRewrite) {
    auto data = generateRandomVisualizationData();
    const auto path = temp_dir_ / ("extra" + ps::management::PipelineFile::EXTENSION);

    ps::management::PipelineFile file(data);
    ASSERT_TRUE(file.writeToFile(path));

    std::ifstream in(path);
    nlohmann::json json = nlohmann::json::parse(in);
    in.close();
    json["camera"] = {{"zoom", 2.5}};
    writeJson(path, json);

    ps::management::PipelineFile loaded;
    ASSERT_TRUE(loaded.readFromFile(path));
    ASSERT_TRUE(loaded.getData().additional_fields.contains("camera"));

    const auto rewritten = temp_dir_ / ("rewritten" + ps::management::PipelineFile::EXTENSION);
    ASSERT_TRUE(loaded.writeToFile(rewritten));

    std::ifstream again(rewritten);
    const auto reread = nlohmann::json::parse(again);
    EXPECT_DOUBLE_EQ(reread["camera"]["zoom"].get<double>(), 2.5);
}

TEST_F(PipelineFileTest, MigratesOldFiles) {
    const auto path = temp_dir_ / ("old" + ps::management::PipelineFile::EXTENSION);
    nlohmann::json old;
    old["file_info"] = ps::management::PipelineFile::FILE_HEADER;
    old["version"] = "0.0.3";
    old["creation_time"] = "2024-11-02T08:00:00Z";
    old["last_update_time"] = "2024-11-02T09:00:00Z";
    old["pipelines"] = nlohmann::json::array({generateRandomSceneState()});
    writeJson(path, old);

    ps::management::PipelineFile file;
    ASSERT_TRUE(file.readFromFile(path));

    const auto& data = file.getData();
    EXPECT_EQ(data.version, ps::management::PipelineFile::CURRENT_VERSION);
    EXPECT_TRUE(data.name.empty());
    EXPECT_EQ(data.creation_time, "2024-11-02T08:00:00Z");
    ASSERT_EQ(data.scenes.size(), 1u);
    EXPECT_EQ(ps::state::class_name_of(data.scenes[0]), "Scene");
    EXPECT_FALSE(data.additional_fields.contains("pipelines"));
}

TEST_F(PipelineFileTest, RejectsNewerFiles) {
    auto data = generateRandomVisualizationData();
    data.version = ps::management::Version(0, 2, 0);

    const auto path = temp_dir_ / ("newer" + ps::management::PipelineFile::EXTENSION);
    ps::management::PipelineFile file(data);
    ASSERT_TRUE(file.writeToFile(path));

    ps::management::PipelineFile loaded;
    EXPECT_FALSE(loaded.readFromFile(path));
}

TEST_F(PipelineFileTest, RejectsBrokenFiles) {
    ps::management::PipelineFile file;

    EXPECT_FALSE(file.readFromFile(temp_dir_ / "missing.psv"));

    const auto wrong_header = temp_dir_ / "header.psv";
    writeJson(wrong_header, {{"file_info", "Something else"},
                             {"version", "0.1.0"},
                             {"creation_time", ""},
                             {"last_update_time", ""},
                             {"scenes", nlohmann::json::array()}});
    EXPECT_FALSE(file.readFromFile(wrong_header));

    const auto no_scenes = temp_dir_ / "no_scenes.psv";
    writeJson(no_scenes, {{"file_info", ps::management::PipelineFile::FILE_HEADER},
                          {"version", "0.1.0"},
                          {"creation_time", ""},
                          {"last_update_time", ""}});
    EXPECT_FALSE(file.readFromFile(no_scenes));

    const nlohmann::json no_metadata = {{"name", "no metadata"}};
    const auto bad_scene = temp_dir_ / "bad_scene.psv";
    writeJson(bad_scene, {{"file_info", ps::management::PipelineFile::FILE_HEADER},
                          {"version", "0.1.0"},
                          {"creation_time", ""},
                          {"last_update_time", ""},
                          {"scenes", nlohmann::json::array({no_metadata})}});
    EXPECT_FALSE(file.readFromFile(bad_scene));

    const auto not_json = temp_dir_ / "garbage.psv";
    std::ofstream(not_json) << "{ not json";
    EXPECT_FALSE(file.readFromFile(not_json));
}

TEST_F(PipelineFileTest, RefusesToWriteInvalidData) {
    auto data = generateRandomVisualizationData();
    const nlohmann::json no_metadata = {{"name", "no metadata"}};
    data.scenes.push_back(no_metadata);
    const auto path = temp_dir_ / ("invalid" + ps::management::PipelineFile::EXTENSION);

    ps::management::PipelineFile file(data);
    EXPECT_FALSE(file.validateData());
    EXPECT_FALSE(file.writeToFile(path));
    EXPECT_FALSE(std::filesystem::exists(path)) << "Nothing is written for invalid data";

    data.scenes.pop_back();
    data.creation_time.clear();
    ps::management::PipelineFile undated(data);
    EXPECT_FALSE(undated.validateData());
    EXPECT_FALSE(undated.writeToFile(path));

    ps::management::PipelineFile fresh;
    EXPECT_TRUE(fresh.validateData());
    EXPECT_TRUE(fresh.writeToFile(path));
}

TEST_F(PipelineFileTest, OutputFileNameChecks) {
    ps::management::PipelineFile file;
    file.setName("session");

    file.setOutputFileName(temp_dir_);
    EXPECT_EQ(file.getOutputPath(), temp_dir_ / "session.psv");

    EXPECT_THROW(file.setOutputFileName(temp_dir_ / "session.json"), std::runtime_error);

    EXPECT_FALSE(file.writeToFile(temp_dir_ / "wrong.json"));
    EXPECT_FALSE(file.writeToFile(temp_dir_ / "missing_dir" / "a.psv"));
    EXPECT_FALSE(file.writeToFile(temp_dir_));

    ps::management::PipelineFile unnamed;
    EXPECT_FALSE(unnamed.writeToFile()) << "No output file was set";
}

TEST_F(PipelineFileTest, VersionOrdering) {
    using ps::management::Version;
    EXPECT_LT(Version("0.0.9"), Version("0.1.0"));
    EXPECT_GT(Version(1, 0, 0), Version(0, 9, 9));
    EXPECT_EQ(Version("0.1.0").toString(), "0.1.0");
    EXPECT_TRUE(ps::management::PipelineFile().isCompatible(Version(0, 0, 1)));
    EXPECT_FALSE(ps::management::PipelineFile().isCompatible(Version(0, 1, 1)));
}
