/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "pipeline/menu.hpp"

namespace ps::pipeline {

    std::vector<const Action*> Menu::actions() const {
        std::vector<const Action*> result;
        for (const auto& item : items_) {
            if (const auto* action = std::get_if<Action>(&item)) {
                result.push_back(action);
            }
        }
        return result;
    }

    const Action* Menu::findAction(std::string_view name) const {
        for (const auto& item : items_) {
            if (const auto* action = std::get_if<Action>(&item); action && action->name == name) {
                return action;
            }
        }
        return nullptr;
    }

    const Action& cutAction() {
        static const Action action{.name = "Cut",
                                   .action = "editor._menu_cut_node",
                                   .enabled_when = "editor._is_cutable(object)"};
        return action;
    }

    const Action& copyAction() {
        static const Action action{.name = "Copy",
                                   .action = "editor._menu_copy_node",
                                   .enabled_when = "editor._is_copyable(object)"};
        return action;
    }

    const Action& pasteAction() {
        static const Action action{.name = "Paste",
                                   .action = "editor._menu_paste_node",
                                   .enabled_when = "editor._is_pasteable(object)"};
        return action;
    }

    const Action& deleteAction() {
        static const Action action{.name = "Delete",
                                   .action = "editor._menu_delete_node",
                                   .enabled_when = "editor._is_deletable(object)"};
        return action;
    }

    const Action& renameAction() {
        static const Action action{.name = "Rename",
                                   .action = "editor._menu_rename_node",
                                   .enabled_when = "editor._is_renameable(object)"};
        return action;
    }

    const Action& hideShowAction() {
        static const Action action{.name = "Hide/Show",
                                   .action = "object._hideshow",
                                   .enabled_when = ""};
        return action;
    }

    std::vector<MenuItem> standardMenuActions() {
        return {Separator{}, cutAction(), copyAction(), pasteAction(),
                Separator{},
                renameAction(), deleteAction(), Separator{}};
    }

} // namespace ps::pipeline
