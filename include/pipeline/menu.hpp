/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace ps::pipeline {

    class Base;

    struct Separator {
        bool operator==(const Separator&) const = default;
    };

    struct Action {
        std::string name;
        std::string action;       // what the editor invokes, e.g. "editor._menu_copy_node"
        std::string enabled_when; // predicate evaluated by the editor, empty means always

        bool operator==(const Action&) const = default;
    };

    using MenuItem = std::variant<Separator, Action>;

    class Menu {
    public:
        Menu() = default;
        explicit Menu(std::vector<MenuItem> items) : items_(std::move(items)) {}

        const std::vector<MenuItem>& items() const { return items_; }
        size_t size() const { return items_.size(); }

        std::vector<const Action*> actions() const;
        const Action* findAction(std::string_view name) const;

    private:
        std::vector<MenuItem> items_;
    };

    // Standard tree node actions
    const Action& cutAction();
    const Action& copyAction();
    const Action& pasteAction();
    const Action& deleteAction();
    const Action& renameAction();
    const Action& hideShowAction();

    // [sep, Cut, Copy, Paste, sep, Rename, Delete, sep], a fresh copy on every call
    std::vector<MenuItem> standardMenuActions();

    // Supplies node specific actions shown ahead of Hide/Show
    class MenuHelper {
    public:
        virtual ~MenuHelper() = default;
        virtual std::vector<MenuItem> actions() const = 0;

        // Returns false when the action is not one of ours
        virtual bool perform(const Action& action, Base& object) = 0;
    };

} // namespace ps::pipeline
