/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "pipeline/tree_editor.hpp"
#include "core/logger.hpp"
#include "pipeline/base.hpp"
#include "pipeline/source.hpp"

#include <format>

namespace ps::pipeline {

    namespace {

        bool is_helper(const Base& node) {
            return dynamic_cast<const AdderNode*>(&node) != nullptr;
        }

        constexpr std::string_view EDITOR_PREFIX = "editor.";
        constexpr std::string_view PREDICATE_SUFFIX = "(object)";

    } // namespace

    bool TreeEditor::isCutable(const Base& node) const {
        return isCopyable(node) && isDeletable(node);
    }

    bool TreeEditor::isCopyable(const Base& node) const {
        return !is_helper(node);
    }

    bool TreeEditor::isPasteable(const Base& node) const {
        return clipboard_ && !is_helper(node) && node.canAddChild(*clipboard_);
    }

    bool TreeEditor::isDeletable(const Base& node) const {
        return !is_helper(node) && node.parent() != nullptr;
    }

    bool TreeEditor::isRenameable(const Base& node) const {
        return !is_helper(node);
    }

    void TreeEditor::copy(const Base& node) {
        clipboard_ = node.deepCopy();
        LOG_DEBUG("Copied {} '{}' to the clipboard", node.className(), node.name());
    }

    void TreeEditor::cut(Base& node) {
        if (!isCutable(node)) {
            throw std::invalid_argument(std::format("{} '{}' cannot be cut", node.className(), node.name()));
        }
        copy(node);
        auto detached = node.remove();
        LOG_DEBUG("Cut {} '{}'", detached->className(), detached->name());
    }

    Base* TreeEditor::paste(Base& target) {
        if (!isPasteable(target)) {
            throw std::invalid_argument(std::format("Nothing on the clipboard can be pasted into {} '{}'",
                                                    target.className(), target.name()));
        }
        target.addChild(clipboard_->deepCopy());
        Base* pasted = target.children().back().get();
        LOG_DEBUG("Pasted {} into '{}'", pasted->className(), target.name());
        return pasted;
    }

    bool TreeEditor::remove(Base& node) {
        if (!isDeletable(node)) {
            throw std::invalid_argument(std::format("{} '{}' cannot be deleted", node.className(), node.name()));
        }

        const std::optional<bool> confirmed = node.treeConfirmDelete();
        bool proceed = false;
        if (confirmed.has_value()) {
            proceed = *confirmed;
        } else if (confirm_delete_) {
            proceed = confirm_delete_(node);
        } else {
            LOG_WARN("Deleting '{}' needs confirmation but no one can be asked", node.name());
        }

        if (!proceed) {
            LOG_DEBUG("Deletion of '{}' declined", node.name());
            return false;
        }

        auto removed = node.remove();
        LOG_DEBUG("Deleted {} '{}'", removed->className(), removed->name());
        return true;
    }

    void TreeEditor::rename(Base& node, const std::string& name) {
        if (!isRenameable(node)) {
            throw std::invalid_argument(std::format("{} '{}' cannot be renamed", node.className(), node.name()));
        }
        if (name.empty()) {
            throw std::invalid_argument("A node name cannot be empty");
        }
        node.setName(name);
    }

    bool TreeEditor::enabled(const Action& action, const Base& node) const {
        std::string_view predicate = action.enabled_when;
        if (predicate.empty()) {
            return true;
        }
        if (!predicate.starts_with(EDITOR_PREFIX) || !predicate.ends_with(PREDICATE_SUFFIX)) {
            LOG_WARN("Cannot evaluate '{}' for action '{}'", action.enabled_when, action.name);
            return false;
        }
        predicate.remove_prefix(EDITOR_PREFIX.size());
        predicate.remove_suffix(PREDICATE_SUFFIX.size());

        if (predicate == "_is_cutable")
            return isCutable(node);
        if (predicate == "_is_copyable")
            return isCopyable(node);
        if (predicate == "_is_pasteable")
            return isPasteable(node);
        if (predicate == "_is_deletable")
            return isDeletable(node);
        if (predicate == "_is_renameable")
            return isRenameable(node);

        LOG_WARN("Unknown editor predicate '{}'", action.enabled_when);
        return false;
    }

    bool TreeEditor::invoke(const Action& action, Base& node, const std::string& arg) {
        if (!enabled(action, node)) {
            LOG_DEBUG("Action '{}' is disabled for '{}'", action.name, node.name());
            return false;
        }

        try {
            return dispatch(action, node, arg);
        } catch (const std::exception& e) {
            error_handler_.publishException(std::format("Action '{}' on '{}'", action.name, node.name()), e);
            return false;
        }
    }

    bool TreeEditor::dispatch(const Action& action, Base& node, const std::string& arg) {
        const std::string& name = action.action;

        if (name == cutAction().action) {
            cut(node);
        } else if (name == copyAction().action) {
            copy(node);
        } else if (name == pasteAction().action) {
            paste(node);
        } else if (name == deleteAction().action) {
            return remove(node);
        } else if (name == renameAction().action) {
            rename(node, arg);
        } else if (name == hideShowAction().action) {
            node.hideShow();
        } else if (MenuHelper* helper = node.menuHelper(); helper && helper->perform(action, node)) {
            return true;
        } else {
            LOG_WARN("No handler for action '{}' on {} '{}'", name, node.className(), node.name());
            return false;
        }
        return true;
    }

} // namespace ps::pipeline
