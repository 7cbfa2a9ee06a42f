/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "pipeline/base.hpp"
#include "core/events.hpp"
#include "core/logger.hpp"
#include "core/preferences.hpp"
#include "pipeline/node_factory.hpp"
#include "render/native.hpp"

#include <algorithm>
#include <format>

namespace ps::pipeline {

    Base::Base()
        : icon_path_(param::preference_manager().current().ui.resource_path) {
    }

    Base::~Base() = default;

    // ------------------------------------------------------------------
    // Persistence
    // ------------------------------------------------------------------

    state::State Base::getPureState() const {
        state::State s = state::State::object();
        s["name"] = name_;
        s["visible"] = visible_;

        auto children = state::State::array();
        for (const auto& c : children_) {
            children.push_back(c->currentState());
        }
        s[state::CHILDREN_KEY] = std::move(children);
        return s;
    }

    void Base::setPureState(const state::State& state) {
        const std::string name = state::field(state, "name", name_);
        const bool visible = state::field(state, "visible", visible_);
        setName(name);
        setVisible(visible);
        if (state.contains(state::CHILDREN_KEY)) {
            setChildrenState(state[state::CHILDREN_KEY]);
        }
    }

    std::string Base::serialize() const {
        if (!saved_state_.empty()) {
            return saved_state_;
        }
        return state::dumps(*this);
    }

    void Base::restore(const std::string& serialized) {
        state::State s = state::loads_state(serialized);
        // Class versions are registered along with the factory
        NodeFactory::get();
        state::update_state(s);
        setState(s);
    }

    void Base::setState(const state::State& state) {
        const std::string class_name = state::class_name_of(state);
        if (class_name != className()) {
            throw state::StateError(std::format("Cannot restore a {} state into a {}", class_name, className()));
        }

        saved_state_ = state::dumps_state(state);
        if (running_) {
            loadSavedState();
        } else {
            LOG_TRACE("{} '{}' is stopped, state deferred until start", className(), name_);
            events::node::StateDeferred{.node = this, .class_name = class_name}.emit();
        }
    }

    std::unique_ptr<Base> Base::deepCopy() const {
        auto copy = NodeFactory::get().create(className());
        copy->saved_state_ = saved_state_.empty() ? state::dumps(*this) : saved_state_;
        // Fresh instances are stopped, this only matters for nodes that start themselves
        if (copy->running()) {
            copy->loadSavedState();
        }
        return copy;
    }

    state::State Base::currentState() const {
        if (!saved_state_.empty()) {
            return state::loads_state(saved_state_);
        }
        return state::get_state(*this);
    }

    void Base::loadSavedState() {
        if (saved_state_.empty()) {
            return;
        }
        if (!running_) {
            LOG_DEBUG("Not loading saved state of stopped {} '{}'", className(), name_);
            return;
        }

        // Consumed up front, a state that fails to apply is dropped
        const std::string saved = std::move(saved_state_);
        saved_state_.clear();
        state::set_state(*this, state::loads_state(saved));

        LOG_TRACE("Applied saved state to {} '{}'", className(), name_);
        events::node::StateApplied{.node = this, .class_name = className()}.emit();
    }

    // ------------------------------------------------------------------
    // Lifecycle
    // ------------------------------------------------------------------

    void Base::start() {
        setRunning(true);
        loadSavedState();
    }

    void Base::stop() {
        setRunning(false);
    }

    void Base::setRunning(bool running) {
        if (running_ == running) {
            return;
        }
        const bool old = running_;
        running_ = running;
        events::node::RunningChanged{.node = this, .old_value = old, .new_value = running}.emit();
    }

    // ------------------------------------------------------------------
    // Tree structure
    // ------------------------------------------------------------------

    bool Base::canAddChild(const Base&) const {
        return false;
    }

    void Base::addChild(std::unique_ptr<Base>) {
        throw NotImplementedError(std::format("{} does not implement addChild", className()));
    }

    std::unique_ptr<Base> Base::removeChild(Base*) {
        throw NotImplementedError(std::format("{} does not implement removeChild", className()));
    }

    std::unique_ptr<Base> Base::remove() {
        if (parent_) {
            return parent_->removeChild(this);
        }
        return nullptr;
    }

    Base* Base::child(size_t index) const {
        if (index >= children_.size()) {
            throw std::out_of_range(std::format("{} '{}' has no child {}", className(), name_, index));
        }
        return children_[index].get();
    }

    std::vector<Base*> Base::childrenUiList() const {
        std::vector<Base*> list;
        list.reserve(children_.size());
        for (const auto& c : children_) {
            list.push_back(c.get());
        }
        return list;
    }

    void Base::appendChild(std::unique_ptr<Base> child) {
        Base* raw = child.get();
        raw->parent_ = this;
        raw->setScene(scene_);
        children_.push_back(std::move(child));

        events::node::ChildrenChanged{.node = this, .child_count = children_.size()}.emit();

        if (running_) {
            raw->start();
        }
    }

    std::unique_ptr<Base> Base::detachChild(Base* child) {
        auto it = std::find_if(children_.begin(), children_.end(),
                               [child](const auto& c) { return c.get() == child; });
        if (it == children_.end()) {
            return nullptr;
        }

        if ((*it)->running()) {
            (*it)->stop();
        }

        std::unique_ptr<Base> owned = std::move(*it);
        children_.erase(it);
        owned->parent_ = nullptr;
        owned->setScene(nullptr);

        events::node::ChildrenChanged{.node = this, .child_count = children_.size()}.emit();
        return owned;
    }

    void Base::stopChildren() {
        for (auto it = children_.rbegin(); it != children_.rend(); ++it) {
            if ((*it)->running()) {
                (*it)->stop();
            }
        }
    }

    void Base::startChildren() {
        for (const auto& c : children_) {
            if (!c->running()) {
                c->start();
            }
        }
    }

    void Base::destroyChildren() {
        stopChildren();
        children_.clear();
    }

    void Base::setChildrenState(const state::State& children_state) {
        if (!children_state.is_array()) {
            throw state::StateError(std::format("Children state of {} is not a list", className()));
        }

        // Keep the leading children whose class matches the state, rebuild the rest
        size_t keep = 0;
        const size_t common = std::min(children_.size(), children_state.size());
        while (keep < common &&
               children_[keep]->className() == state::class_name_of(children_state[keep])) {
            ++keep;
        }

        while (children_.size() > keep) {
            detachChild(children_.back().get());
        }

        for (size_t i = 0; i < keep; ++i) {
            children_[i]->setState(children_state[i]);
        }

        for (size_t i = keep; i < children_state.size(); ++i) {
            auto node = create_instance(children_state[i]);
            if (!canAddChild(*node)) {
                throw state::StateError(std::format("{} cannot hold a {} child",
                                                    className(), node->className()));
            }
            appendChild(std::move(node));
        }
    }

    // ------------------------------------------------------------------
    // Scene
    // ------------------------------------------------------------------

    void Base::render() {
        if (scene_) {
            scene_->render();
        }
    }

    void Base::setScene(render::RenderWindow* scene) {
        scene_ = scene;
        for (const auto& c : children_) {
            c->setScene(scene);
        }
    }

    // ------------------------------------------------------------------
    // Views
    // ------------------------------------------------------------------

    View Base::defaultView() const {
        View view;
        const state::State pure = getPureState();
        for (const auto& [key, value] : pure.items()) {
            if (key != state::CHILDREN_KEY) {
                view.items.push_back(key);
            }
        }
        return view;
    }

    View Base::dialogView() const {
        View view = traitView();
        view.icon = (icon_path_ / "images" / icon_).string();
        view.title = std::format("Edit{}: {}", type_, name_);
        view.buttons = {"OK", "Cancel"};
        return view;
    }

    View Base::traitView(const std::string& name) const {
        if (!name.empty()) {
            if (auto it = named_views_.find(name); it != named_views_.end()) {
                return it->second;
            }
            return defaultView();
        }

        const auto root = param::preference_manager().current().ui.view_root;
        const auto view_file = root / moduleDir() / "ui" / (to_snake_case(className()) + ".json");

        if (!root.empty() && std::filesystem::exists(view_file)) {
            auto view = load_view_file(view_file);
            if (view) {
                return *view;
            }
            LOG_WARN("Ignoring view file for [{}]: {}", className(), view.error());
        } else {
            LOG_DEBUG("No view found for [{}] in [{}]. Using the default view instead.",
                      className(), view_file.string());
        }
        return defaultView();
    }

    void Base::setTraitView(const std::string& name, View view) {
        named_views_[name] = std::move(view);
    }

    // ------------------------------------------------------------------
    // Tree node interface
    // ------------------------------------------------------------------

    std::string Base::treeLabel() {
        if (name_.empty()) {
            setName(className());
        }
        return name_;
    }

    View Base::treeView() const {
        View view = traitView();
        view.kind = "subpanel";
        return view;
    }

    std::optional<bool> Base::treeConfirmDelete() const {
        if (param::preference_manager().current().root.confirm_delete) {
            return std::nullopt;
        }
        return true;
    }

    const Menu* Base::treeMenu() {
        if (menu_cleared_) {
            return nullptr;
        }
        if (!menu_) {
            menu_ = defaultMenu();
        }
        return &*menu_;
    }

    Menu Base::defaultMenu() const {
        std::vector<MenuItem> items{Separator{}};
        if (menu_helper_) {
            auto extras = menu_helper_->actions();
            items.insert(items.end(), extras.begin(), extras.end());
        }
        items.insert(items.end(), {Separator{}, hideShowAction(), Separator{}});

        auto standard = standardMenuActions();
        items.insert(items.end(), standard.begin(), standard.end());
        return Menu(std::move(items));
    }

    std::string Base::treeIcon(bool) const {
        return icon_;
    }

    std::filesystem::path Base::treeIconPath() const {
        return icon_path_;
    }

    void Base::treeDeleteChild(size_t index) {
        // The tree shows helper nodes ahead of the children
        if (childrenUiList().size() > children_.size()) {
            if (index == 0) {
                throw std::out_of_range("Helper nodes cannot be deleted");
            }
            --index;
        }
        if (index >= children_.size()) {
            throw std::out_of_range(std::format("{} '{}' has no child {}", className(), name_, index));
        }
        detachChild(children_[index].get());
    }

    // ------------------------------------------------------------------
    // Properties
    // ------------------------------------------------------------------

    void Base::setName(const std::string& name) {
        if (name == name_) {
            return;
        }
        std::string old = std::move(name_);
        name_ = name;
        events::node::NameChanged{.node = this, .old_name = std::move(old), .new_name = name_}.emit();
    }

    void Base::setVisible(bool visible) {
        if (visible == visible_) {
            return;
        }
        visible_ = visible;

        // The label is only computed when a tree shows us, make sure we have a name
        if (name_.empty()) {
            treeLabel();
        }

        const std::string suffix = HIDDEN_SUFFIX;
        if (visible) {
            std::string n = name_;
            for (auto pos = n.find(suffix); pos != std::string::npos; pos = n.find(suffix)) {
                n.erase(pos, suffix.size());
            }
            setName(n);
        } else if (name_.find(suffix) == std::string::npos) {
            setName(name_ + suffix);
        }

        onVisibleChanged(visible);
        events::node::VisibilityChanged{.node = this, .visible = visible}.emit();
    }

    void Base::hideShow() {
        setVisible(!visible_);
    }

    void Base::onVisibleChanged(bool) {
    }

    void Base::setMenuHelper(std::shared_ptr<MenuHelper> helper) {
        menu_helper_ = std::move(helper);
    }

    void Base::setMenu(Menu menu) {
        menu_ = std::move(menu);
        menu_cleared_ = false;
    }

    void Base::clearMenu() {
        menu_.reset();
        menu_cleared_ = true;
    }

} // namespace ps::pipeline
