/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error_handler.hpp"
#include "pipeline/menu.hpp"

#include <functional>
#include <memory>
#include <string>

namespace ps::pipeline {

    class Base;

    /**
     * @brief The editing side of the pipeline tree, without any widgets.
     *
     * Menu actions name editor operations ("editor._menu_copy_node") and their
     * enablement predicates ("editor._is_copyable(object)"); invoke() and enabled()
     * resolve those strings. Actions the editor does not know go to the node's
     * menu helper.
     */
    class TreeEditor {
    public:
        // Asked before deleting a node whose treeConfirmDelete() leaves it to the user
        using ConfirmDelete = std::function<bool(const Base&)>;

        TreeEditor() = default;

        void setConfirmDelete(ConfirmDelete confirm) { confirm_delete_ = std::move(confirm); }

        bool isCutable(const Base& node) const;
        bool isCopyable(const Base& node) const;
        bool isPasteable(const Base& node) const;
        bool isDeletable(const Base& node) const;
        bool isRenameable(const Base& node) const;

        void copy(const Base& node);
        // Copies the node to the clipboard and detaches it from its parent
        void cut(Base& node);
        // Adds a copy of the clipboard to the target, returns the new child
        Base* paste(Base& target);
        // Returns false when the deletion was declined
        bool remove(Base& node);
        void rename(Base& node, const std::string& name);

        bool enabled(const Action& action, const Base& node) const;

        // Runs a menu action on the node, arg carries the new name for Rename.
        // Failures are published as notify::Error events and reported as false.
        bool invoke(const Action& action, Base& node, const std::string& arg = {});

        const Base* clipboard() const { return clipboard_.get(); }
        void clearClipboard() { clipboard_.reset(); }

    private:
        bool dispatch(const Action& action, Base& node, const std::string& arg);

        std::unique_ptr<Base> clipboard_;
        ConfirmDelete confirm_delete_;
        ErrorHandler error_handler_;
    };

} // namespace ps::pipeline
