#pragma once

#include <gtkmm.h>
#include <map>
#include <string>
#include <vector>

#include "services/navigation_page.h"

// Sidebar of navigation items (main list and footer list) driving a stack
// of pages. Pages are owned by the caller.
class NavigationView : public Gtk::Box {
public:
    NavigationView();
    virtual ~NavigationView();

    void add_item(const std::string& id, const std::string& title, const std::string& icon_name, Gtk::Widget& page);
    void add_footer_item(const std::string& id, const std::string& title, const std::string& icon_name, Gtk::Widget& page);

    // Returns false when the page is unknown or a navigating handler cancelled.
    bool navigate(const std::string& id);

    const std::string& current_page_id() const { return current_page_id_; }

    sigc::signal<void(NavigatingCancelArgs&)>& signal_navigating() { return signal_navigating_; }
    sigc::signal<void(NavigationPage*)>& signal_navigated() { return signal_navigated_; }

private:
    void add_entry(Gtk::ListBox& list, std::vector<std::string>& ids,
                   const std::string& id, const std::string& title, const std::string& icon_name, Gtk::Widget& page);
    void on_row_activated(Gtk::ListBoxRow* row, const std::vector<std::string>* ids);
    void sync_selection();

    Gtk::Box sidebar_{Gtk::Orientation::VERTICAL};
    Gtk::ListBox items_list_;
    Gtk::ListBox footer_list_;
    Gtk::Stack stack_;

    std::map<std::string, Gtk::Widget*> pages_;
    std::vector<std::string> item_ids_;
    std::vector<std::string> footer_ids_;
    std::string current_page_id_;
    bool syncing_selection_ = false;

    sigc::signal<void(NavigatingCancelArgs&)> signal_navigating_;
    sigc::signal<void(NavigationPage*)> signal_navigated_;
};
