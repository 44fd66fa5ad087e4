#include "ui/navigation_view.h"

#include <algorithm>
#include <iostream>

NavigationView::NavigationView()
    : Gtk::Box(Gtk::Orientation::HORIZONTAL)
{
    add_css_class("navigation-view");

    sidebar_.add_css_class("navigation-sidebar");
    items_list_.set_vexpand(true);
    items_list_.add_css_class("navigation-sidebar");
    footer_list_.add_css_class("navigation-sidebar");
    items_list_.signal_row_activated().connect([this](Gtk::ListBoxRow* row) {
        on_row_activated(row, &item_ids_);
    });
    footer_list_.signal_row_activated().connect([this](Gtk::ListBoxRow* row) {
        on_row_activated(row, &footer_ids_);
    });
    sidebar_.append(items_list_);
    sidebar_.append(footer_list_);

    stack_.set_hexpand(true);
    stack_.set_vexpand(true);
    stack_.set_transition_type(Gtk::StackTransitionType::CROSSFADE);

    append(sidebar_);
    append(stack_);
}

NavigationView::~NavigationView() {
    for (auto& entry : pages_) {
        stack_.remove(*entry.second);
    }
}

void NavigationView::add_item(const std::string& id, const std::string& title, const std::string& icon_name, Gtk::Widget& page) {
    add_entry(items_list_, item_ids_, id, title, icon_name, page);
}

void NavigationView::add_footer_item(const std::string& id, const std::string& title, const std::string& icon_name, Gtk::Widget& page) {
    add_entry(footer_list_, footer_ids_, id, title, icon_name, page);
}

void NavigationView::add_entry(Gtk::ListBox& list, std::vector<std::string>& ids,
                               const std::string& id, const std::string& title, const std::string& icon_name, Gtk::Widget& page) {
    if (pages_.count(id)) {
        std::cerr << "⚠️  NavigationView: page already registered: " << id << std::endl;
        return;
    }

    auto* row_box = Gtk::make_managed<Gtk::Box>(Gtk::Orientation::HORIZONTAL, 10);
    row_box->set_margin(8);
    auto* icon = Gtk::make_managed<Gtk::Image>();
    icon->set_from_icon_name(icon_name);
    auto* label = Gtk::make_managed<Gtk::Label>(title);
    label->set_xalign(0.0f);
    row_box->append(*icon);
    row_box->append(*label);
    row_box->set_tooltip_text(title);
    list.append(*row_box);

    stack_.add(page, id, title);
    pages_[id] = &page;
    ids.push_back(id);
}

bool NavigationView::navigate(const std::string& id) {
    auto it = pages_.find(id);
    if (it == pages_.end()) {
        std::cerr << "⚠️  NavigationView: unknown page " << id << std::endl;
        return false;
    }
    if (id == current_page_id_) {
        return true;
    }

    NavigatingCancelArgs args;
    args.target_page = id;
    signal_navigating_.emit(args);
    if (args.cancel) {
        sync_selection();
        return false;
    }

    stack_.set_visible_child(*it->second);
    current_page_id_ = id;
    sync_selection();
    signal_navigated_.emit(dynamic_cast<NavigationPage*>(it->second));
    return true;
}

void NavigationView::on_row_activated(Gtk::ListBoxRow* row, const std::vector<std::string>* ids) {
    if (!row || syncing_selection_) {
        return;
    }
    int index = row->get_index();
    if (index < 0 || static_cast<size_t>(index) >= ids->size()) {
        return;
    }
    navigate((*ids)[index]);
}

void NavigationView::sync_selection() {
    syncing_selection_ = true;

    auto select_in = [this](Gtk::ListBox& list, const std::vector<std::string>& ids) {
        auto it = std::find(ids.begin(), ids.end(), current_page_id_);
        if (it == ids.end()) {
            list.unselect_all();
            return;
        }
        if (auto* row = list.get_row_at_index(static_cast<int>(it - ids.begin()))) {
            list.select_row(*row);
        }
    };
    select_in(items_list_, item_ids_);
    select_in(footer_list_, footer_ids_);

    syncing_selection_ = false;
}
