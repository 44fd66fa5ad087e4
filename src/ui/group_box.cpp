#include "ui/group_box.h"

GroupBox::GroupBox() {
    add_css_class("group-box");
    header_label_.add_css_class("group-box-header");
    set_label_widget(header_label_);
}

GroupBox::GroupBox(const std::string& header) : GroupBox() {
    set_header(header);
}

void GroupBox::set_header(const std::string& header) {
    header_label_.set_text(header);
    if (get_label_widget() != &header_label_) {
        set_label_widget(header_label_);
    }
}

void GroupBox::set_header_widget(Gtk::Widget& header) {
    set_label_widget(header);
}

void GroupBox::set_content(Gtk::Widget& content) {
    content.set_margin(10);
    set_child(content);
}
