#include "core/events.hpp"
#include "core/preferences.hpp"
#include "pipeline/module.hpp"
#include "pipeline/scene.hpp"
#include "pipeline/source.hpp"
#include "pipeline/tree_editor.hpp"
#include "render/native.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

using namespace ps;

class TreeEditorTest : public ::testing::Test {
protected:
    void SetUp() override {
        param::preference_manager().reset();

        scene_ = std::make_unique<pipeline::Scene>(std::make_unique<render::OffscreenRenderWindow>(32, 32));
        scene_->start();

        auto source = std::make_unique<pipeline::ParametricSource>();
        source->setName("sphere");
        scene_->addChild(std::move(source));
        source_ = dynamic_cast<pipeline::ParametricSource*>(scene_->child(0));
        ASSERT_NE(source_, nullptr);

        auto outline = std::make_unique<pipeline::OutlineModule>();
        outline->setName("outline");
        source_->addChild(std::move(outline));
        outline_ = source_->child(0);
    }

    void TearDown() override {
        scene_.reset();
        param::preference_manager().reset();
    }

    void setConfirmDeletePreference(bool confirm) {
        auto prefs = param::preference_manager().current();
        prefs.root.confirm_delete = confirm;
        param::preference_manager().set(prefs);
    }

    pipeline::TreeEditor editor_;
    std::unique_ptr<pipeline::Scene> scene_;
    pipeline::ParametricSource* source_ = nullptr;
    pipeline::Base* outline_ = nullptr;
};

TEST_F(TreeEditorTest, Predicates) {
    EXPECT_TRUE(editor_.isCopyable(*source_));
    EXPECT_TRUE(editor_.isDeletable(*source_));
    EXPECT_TRUE(editor_.isCutable(*source_));
    EXPECT_TRUE(editor_.isRenameable(*source_));

    // The scene is a root
    EXPECT_TRUE(editor_.isCopyable(*scene_));
    EXPECT_FALSE(editor_.isDeletable(*scene_));
    EXPECT_FALSE(editor_.isCutable(*scene_));

    const auto ui = source_->childrenUiList();
    ASSERT_FALSE(ui.empty());
    const auto* adder = ui.front();
    EXPECT_FALSE(editor_.isCopyable(*adder));
    EXPECT_FALSE(editor_.isDeletable(*adder));
    EXPECT_FALSE(editor_.isRenameable(*adder));
    EXPECT_FALSE(editor_.isPasteable(*adder));
}

TEST_F(TreeEditorTest, PasteNeedsCompatibleClipboard) {
    EXPECT_FALSE(editor_.isPasteable(*source_)) << "Empty clipboard";

    editor_.copy(*outline_);
    EXPECT_TRUE(editor_.isPasteable(*source_));
    EXPECT_FALSE(editor_.isPasteable(*scene_)) << "Scenes only take sources";
    EXPECT_FALSE(editor_.isPasteable(*outline_)) << "Modules take no children";

    EXPECT_THROW(editor_.paste(*scene_), std::invalid_argument);
}

TEST_F(TreeEditorTest, CopyPasteAddsRunningDuplicate) {
    source_->setResolution(12);
    editor_.copy(*source_);

    ASSERT_NE(editor_.clipboard(), nullptr);
    EXPECT_FALSE(editor_.clipboard()->running());

    auto* pasted = editor_.paste(*scene_);
    ASSERT_NE(pasted, nullptr);
    ASSERT_EQ(scene_->childCount(), 2u);
    EXPECT_EQ(scene_->child(1), pasted);
    EXPECT_TRUE(pasted->running());
    EXPECT_EQ(pasted->name(), "sphere");

    auto* copy = dynamic_cast<pipeline::ParametricSource*>(pasted);
    ASSERT_NE(copy, nullptr);
    EXPECT_EQ(copy->resolution(), 12);
    ASSERT_EQ(copy->childCount(), 1u);
    EXPECT_EQ(copy->child(0)->className(), "OutlineModule");

    // The clipboard survives, a second paste is possible
    editor_.paste(*scene_);
    EXPECT_EQ(scene_->childCount(), 3u);
}

TEST_F(TreeEditorTest, CutMovesNode) {
    editor_.cut(*outline_);
    EXPECT_EQ(source_->childCount(), 0u);
    ASSERT_NE(editor_.clipboard(), nullptr);
    EXPECT_EQ(editor_.clipboard()->name(), "outline");

    auto filter = std::make_unique<pipeline::ThresholdFilter>();
    source_->addChild(std::move(filter));
    auto* pasted = editor_.paste(*source_->child(0));
    EXPECT_EQ(pasted->className(), "OutlineModule");
    EXPECT_TRUE(pasted->running());
}

TEST_F(TreeEditorTest, CutRejectsRoot) {
    EXPECT_THROW(editor_.cut(*scene_), std::invalid_argument);
    EXPECT_EQ(editor_.clipboard(), nullptr);
}

TEST_F(TreeEditorTest, RemoveAsksConfirmation) {
    std::vector<std::string> asked;
    editor_.setConfirmDelete([&asked](const pipeline::Base& node) {
        asked.push_back(node.name());
        return false;
    });

    EXPECT_FALSE(editor_.remove(*outline_));
    EXPECT_EQ(source_->childCount(), 1u);

    editor_.setConfirmDelete([&asked](const pipeline::Base& node) {
        asked.push_back(node.name());
        return true;
    });
    EXPECT_TRUE(editor_.remove(*outline_));
    EXPECT_EQ(source_->childCount(), 0u);
    EXPECT_EQ(asked, (std::vector<std::string>{"outline", "outline"}));
}

TEST_F(TreeEditorTest, RemoveWithoutConfirmCallbackDeclines) {
    EXPECT_FALSE(editor_.remove(*outline_));
    EXPECT_EQ(source_->childCount(), 1u);
}

TEST_F(TreeEditorTest, RemoveSkipsConfirmationWhenPreferenceSaysSo) {
    setConfirmDeletePreference(false);
    bool asked = false;
    editor_.setConfirmDelete([&asked](const pipeline::Base&) {
        asked = true;
        return false;
    });

    EXPECT_TRUE(editor_.remove(*source_));
    EXPECT_FALSE(asked);
    EXPECT_EQ(scene_->childCount(), 0u);
}

TEST_F(TreeEditorTest, RemoveRejectsRoot) {
    EXPECT_THROW(editor_.remove(*scene_), std::invalid_argument);
}

TEST_F(TreeEditorTest, Rename) {
    editor_.rename(*source_, "ball");
    EXPECT_EQ(source_->name(), "ball");
    EXPECT_THROW(editor_.rename(*source_, ""), std::invalid_argument);
    EXPECT_THROW(editor_.rename(*source_->childrenUiList().front(), "x"), std::invalid_argument);
}

TEST_F(TreeEditorTest, EnabledEvaluatesMenuPredicates) {
    EXPECT_TRUE(editor_.enabled(pipeline::copyAction(), *source_));
    EXPECT_TRUE(editor_.enabled(pipeline::hideShowAction(), *source_));
    EXPECT_FALSE(editor_.enabled(pipeline::pasteAction(), *source_));
    EXPECT_FALSE(editor_.enabled(pipeline::deleteAction(), *scene_));

    const pipeline::Action unknown{.name = "X", .action = "editor.x", .enabled_when = "editor._is_magic(object)"};
    EXPECT_FALSE(editor_.enabled(unknown, *source_));

    const pipeline::Action foreign{.name = "Y", .action = "editor.y", .enabled_when = "object.ready"};
    EXPECT_FALSE(editor_.enabled(foreign, *source_));
}

TEST_F(TreeEditorTest, InvokeRunsEveryMenuAction) {
    const auto* menu = source_->treeMenu();
    ASSERT_NE(menu, nullptr);

    for (const auto* action : menu->actions()) {
        EXPECT_EQ(editor_.enabled(*action, *source_), action->name != "Paste") << action->name;
    }

    EXPECT_TRUE(editor_.invoke(*menu->findAction("Hide/Show"), *source_));
    EXPECT_FALSE(source_->visible());

    EXPECT_TRUE(editor_.invoke(*menu->findAction("Rename"), *source_, "ball"));
    EXPECT_EQ(source_->name(), "ball");

    EXPECT_TRUE(editor_.invoke(*menu->findAction("Copy"), *source_));
    EXPECT_NE(editor_.clipboard(), nullptr);

    // Modules take no children, scenes take sources
    EXPECT_FALSE(editor_.invoke(pipeline::pasteAction(), *outline_));
    EXPECT_TRUE(editor_.invoke(pipeline::pasteAction(), *scene_));
    EXPECT_EQ(scene_->childCount(), 2u);
}

TEST_F(TreeEditorTest, InvokeRoutesHelperActions) {
    const auto* menu = source_->treeMenu();
    ASSERT_NE(menu, nullptr);
    const auto* add_surface = menu->findAction("Add Surface");
    ASSERT_NE(add_surface, nullptr);

    EXPECT_TRUE(editor_.invoke(*add_surface, *source_));
    ASSERT_EQ(source_->childCount(), 2u);
    EXPECT_EQ(source_->child(1)->className(), "SurfaceModule");
    EXPECT_TRUE(source_->child(1)->running());
}

TEST_F(TreeEditorTest, InvokeReportsUnknownAction) {
    const pipeline::Action unknown{.name = "Explode", .action = "editor._menu_explode", .enabled_when = ""};
    EXPECT_FALSE(editor_.invoke(unknown, *source_));
}

TEST_F(TreeEditorTest, InvokePublishesFailures) {
    std::vector<std::string> errors;
    event::ScopedSubscription<events::notify::Error> sub(
        events::notify::Error::when([&errors](const auto& e) { errors.push_back(e.message); }));

    // A helper action adding a node the outline cannot hold
    const pipeline::Action add{.name = "Add Outline",
                               .action = std::string(pipeline::SourceMenuHelper::ADD_PREFIX) + "OutlineModule",
                               .enabled_when = ""};
    auto helper = std::make_shared<pipeline::SourceMenuHelper>();
    outline_->setMenuHelper(helper);

    EXPECT_FALSE(editor_.invoke(add, *outline_));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "Action 'Add Outline' on 'outline' failed");

    EXPECT_FALSE(editor_.invoke(pipeline::renameAction(), *source_, ""));
    EXPECT_EQ(errors.size(), 2u);
}
