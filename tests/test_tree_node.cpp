#include "core/events.hpp"
#include "core/preferences.hpp"
#include "pipeline/base.hpp"
#include "pipeline/module.hpp"
#include "pipeline/scene.hpp"
#include "pipeline/source.hpp"
#include "render/native.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <functional>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <variant>
#include <vector>

using namespace ps;

namespace {

    std::vector<std::string> action_names(const pipeline::Menu& menu) {
        std::vector<std::string> names;
        for (const auto* action : menu.actions()) {
            names.push_back(action->name);
        }
        return names;
    }

} // namespace

class TreeNodeTest : public ::testing::Test {
protected:
    void SetUp() override {
        param::preference_manager().reset();
        temp_dir_ = std::filesystem::temp_directory_path() / "pipescene_tree_node_test";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        param::preference_manager().reset();
        if (std::filesystem::exists(temp_dir_)) {
            std::filesystem::remove_all(temp_dir_);
        }
    }

    void updatePreferences(const std::function<void(param::Preferences&)>& edit) {
        auto prefs = param::preference_manager().current();
        edit(prefs);
        param::preference_manager().set(prefs);
    }

    std::unique_ptr<pipeline::Scene> makeRunningScene() {
        auto scene = std::make_unique<pipeline::Scene>(std::make_unique<render::OffscreenRenderWindow>(32, 32));
        scene->start();
        return scene;
    }

    std::filesystem::path temp_dir_;
};

TEST_F(TreeNodeTest, LabelFallsBackToClassName) {
    pipeline::ThresholdFilter filter;
    EXPECT_TRUE(filter.name().empty());
    EXPECT_EQ(filter.treeLabel(), "ThresholdFilter");
    EXPECT_EQ(filter.name(), "ThresholdFilter");

    filter.setName("clip");
    EXPECT_EQ(filter.treeLabel(), "clip");
}

TEST_F(TreeNodeTest, HidingAppendsSuffixOnce) {
    pipeline::Base node;
    node.setName("gauge");

    node.setVisible(false);
    EXPECT_EQ(node.name(), "gauge [Hidden]");
    EXPECT_FALSE(node.visible());

    node.setVisible(false);
    EXPECT_EQ(node.name(), "gauge [Hidden]");

    node.hideShow();
    EXPECT_TRUE(node.visible());
    EXPECT_EQ(node.name(), "gauge");
}

TEST_F(TreeNodeTest, HidingUnnamedNodeLabelsItFirst) {
    pipeline::Base node;
    node.setVisible(false);
    EXPECT_EQ(node.name(), "Base [Hidden]");
}

TEST_F(TreeNodeTest, ShowingStripsEveryHiddenSuffix) {
    pipeline::Base node;
    node.setName("x [Hidden] [Hidden]");
    node.setVisible(false);
    EXPECT_EQ(node.name(), "x [Hidden] [Hidden]");

    node.setVisible(true);
    EXPECT_EQ(node.name(), "x");
}

TEST_F(TreeNodeTest, VisibilityAndNameChangesAreNotified) {
    std::vector<bool> visibility;
    std::vector<std::string> names;
    event::ScopedSubscription<events::node::VisibilityChanged> vis(
        events::node::VisibilityChanged::when([&visibility](const auto& e) { visibility.push_back(e.visible); }));
    event::ScopedSubscription<events::node::NameChanged> nam(
        events::node::NameChanged::when([&names](const auto& e) { names.push_back(e.new_name); }));

    pipeline::Base node;
    node.setName("n");
    node.hideShow();
    node.hideShow();

    EXPECT_EQ(visibility, (std::vector<bool>{false, true}));
    EXPECT_EQ(names, (std::vector<std::string>{"n", "n [Hidden]", "n"}));
}

TEST_F(TreeNodeTest, DefaultMenuLayout) {
    pipeline::Base node;
    const auto* menu = node.treeMenu();
    ASSERT_NE(menu, nullptr);

    // [sep] [sep, Hide/Show, sep] [sep, Cut, Copy, Paste, sep, Rename, Delete, sep]
    ASSERT_EQ(menu->size(), 12u);
    EXPECT_TRUE(std::holds_alternative<pipeline::Separator>(menu->items()[0]));
    EXPECT_TRUE(std::holds_alternative<pipeline::Separator>(menu->items()[1]));
    EXPECT_EQ(std::get<pipeline::Action>(menu->items()[2]), pipeline::hideShowAction());
    EXPECT_EQ(action_names(*menu),
              (std::vector<std::string>{"Hide/Show", "Cut", "Copy", "Paste", "Rename", "Delete"}));

    const auto* copy = menu->findAction("Copy");
    ASSERT_NE(copy, nullptr);
    EXPECT_EQ(copy->action, "editor._menu_copy_node");
    EXPECT_EQ(copy->enabled_when, "editor._is_copyable(object)");
}

TEST_F(TreeNodeTest, SourceMenuPutsHelperActionsFirst) {
    pipeline::ParametricSource source;
    const auto* menu = source.treeMenu();
    ASSERT_NE(menu, nullptr);

    EXPECT_EQ(action_names(*menu),
              (std::vector<std::string>{"Add Outline", "Add Surface", "Add Threshold",
                                        "Hide/Show", "Cut", "Copy", "Paste", "Rename", "Delete"}));
    EXPECT_TRUE(std::holds_alternative<pipeline::Separator>(menu->items()[0]));
    EXPECT_EQ(std::get<pipeline::Action>(menu->items()[1]).name, "Add Outline");
}

TEST_F(TreeNodeTest, MenuIsBuiltOnceAndCanBeReplacedOrCleared) {
    pipeline::Base node;
    const auto* first = node.treeMenu();
    EXPECT_EQ(node.treeMenu(), first);

    node.clearMenu();
    EXPECT_EQ(node.treeMenu(), nullptr);

    node.setMenu(pipeline::Menu({pipeline::copyAction()}));
    ASSERT_NE(node.treeMenu(), nullptr);
    EXPECT_EQ(node.treeMenu()->size(), 1u);
}

TEST_F(TreeNodeTest, ConfirmDeleteFollowsPreference) {
    pipeline::Base node;
    EXPECT_FALSE(node.treeConfirmDelete().has_value()) << "The user is asked by default";

    updatePreferences([](param::Preferences& p) { p.root.confirm_delete = false; });
    ASSERT_TRUE(node.treeConfirmDelete().has_value());
    EXPECT_TRUE(*node.treeConfirmDelete());
}

TEST_F(TreeNodeTest, DeleteChildSkipsHelperNode) {
    auto scene = makeRunningScene();
    scene->addChild(std::make_unique<pipeline::ParametricSource>());
    auto* source = scene->child(0);
    source->addChild(std::make_unique<pipeline::OutlineModule>());
    source->addChild(std::make_unique<pipeline::SurfaceModule>());

    const auto ui = source->childrenUiList();
    ASSERT_EQ(ui.size(), 3u);
    EXPECT_EQ(ui[0]->className(), "AdderNode");
    EXPECT_EQ(ui[0]->name(), "Add module or filter");

    EXPECT_THROW(source->treeDeleteChild(0), std::out_of_range);

    source->treeDeleteChild(1);
    ASSERT_EQ(source->childCount(), 1u);
    EXPECT_EQ(source->child(0)->className(), "SurfaceModule");

    EXPECT_THROW(source->treeDeleteChild(2), std::out_of_range);
}

TEST_F(TreeNodeTest, DeleteChildWithoutHelperNodes) {
    updatePreferences([](param::Preferences& p) { p.root.show_helper_nodes = false; });

    auto scene = makeRunningScene();
    scene->addChild(std::make_unique<pipeline::ParametricSource>());
    auto* source = scene->child(0);
    source->addChild(std::make_unique<pipeline::OutlineModule>());
    source->addChild(std::make_unique<pipeline::SurfaceModule>());

    ASSERT_EQ(source->childrenUiList().size(), 2u);
    source->treeDeleteChild(0);
    ASSERT_EQ(source->childCount(), 1u);
    EXPECT_EQ(source->child(0)->className(), "SurfaceModule");

    scene->treeDeleteChild(0);
    EXPECT_EQ(scene->childCount(), 0u);
}

TEST_F(TreeNodeTest, DialogViewUsesTypeNameAndIcon) {
    updatePreferences([](param::Preferences& p) { p.ui.resource_path = "/opt/pipescene"; });

    pipeline::ThresholdFilter filter;
    filter.setName("clip");
    const auto view = filter.dialogView();

    EXPECT_EQ(view.title, "Edit filter: clip");
    EXPECT_EQ(view.icon, (std::filesystem::path("/opt/pipescene") / "images" / "filter.ico").string());
    EXPECT_EQ(view.buttons, (std::vector<std::string>{"OK", "Cancel"}));

    const auto& items = view.items;
    EXPECT_NE(std::find(items.begin(), items.end(), "lower"), items.end());
    EXPECT_NE(std::find(items.begin(), items.end(), "upper"), items.end());
    EXPECT_EQ(std::find(items.begin(), items.end(), "children"), items.end());
}

TEST_F(TreeNodeTest, TraitViewReadsExternalViewFile) {
    updatePreferences([this](param::Preferences& p) { p.ui.view_root = temp_dir_; });

    const auto ui_dir = temp_dir_ / "filters" / "ui";
    std::filesystem::create_directories(ui_dir);
    std::ofstream(ui_dir / "threshold_filter.json")
        << R"({"view": {"title": "Threshold", "items": ["lower", "upper"]}})";

    pipeline::ThresholdFilter filter;
    const auto view = filter.traitView();
    EXPECT_EQ(view.title, "Threshold");
    EXPECT_EQ(view.items, (std::vector<std::string>{"lower", "upper"}));
}

TEST_F(TreeNodeTest, TraitViewFallsBackToDefault) {
    updatePreferences([this](param::Preferences& p) { p.ui.view_root = temp_dir_; });

    // Broken file is ignored like a missing one
    const auto ui_dir = temp_dir_ / "modules" / "ui";
    std::filesystem::create_directories(ui_dir);
    std::ofstream(ui_dir / "outline_module.json") << R"({"no_view": true})";

    pipeline::OutlineModule outline;
    const auto view = outline.traitView();
    EXPECT_EQ(view.kind, "live");
    EXPECT_NE(std::find(view.items.begin(), view.items.end(), "line_width"), view.items.end());

    pipeline::SurfaceModule surface;
    const auto surface_view = surface.traitView();
    EXPECT_NE(std::find(surface_view.items.begin(), surface_view.items.end(), "opacity"), surface_view.items.end());
}

TEST_F(TreeNodeTest, NamedTraitViews) {
    pipeline::Base node;
    node.setTraitView("compact", pipeline::View{.title = "Compact", .items = {"name"}});

    EXPECT_EQ(node.traitView("compact").title, "Compact");
    EXPECT_TRUE(node.traitView("missing").title.empty());
}

TEST_F(TreeNodeTest, TreeViewIsSubpanel) {
    pipeline::Base node;
    EXPECT_EQ(node.treeView().kind, "subpanel");
}

TEST_F(TreeNodeTest, TreeIcons) {
    updatePreferences([](param::Preferences& p) { p.ui.resource_path = "/icons"; });

    pipeline::ParametricSource source;
    pipeline::OutlineModule module;
    EXPECT_EQ(source.treeIcon(false), "source.ico");
    EXPECT_EQ(module.treeIcon(true), "module.ico");
    EXPECT_EQ(source.treeIconPath(), std::filesystem::path("/icons"));

    module.setIconPath("/elsewhere");
    EXPECT_EQ(module.treeIconPath(), std::filesystem::path("/elsewhere"));
}
