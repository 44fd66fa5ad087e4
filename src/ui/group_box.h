#pragma once

#include <gtkmm.h>
#include <string>

// Titled frame around a single child.
class GroupBox : public Gtk::Frame {
public:
    GroupBox();
    explicit GroupBox(const std::string& header);
    virtual ~GroupBox() = default;

    void set_header(const std::string& header);
    void set_header_widget(Gtk::Widget& header);
    std::string get_header() const { return header_label_.get_text(); }

    void set_content(Gtk::Widget& content);

private:
    Gtk::Label header_label_;
};
