#pragma once

#include <gtkmm.h>
#include <string>
#include <utility>
#include <vector>

#include "ui/editors/editor.h"

struct FileFilterSpec {
    std::string name;
    std::vector<std::string> patterns;
};

// Parses "Images|*.png;*.jpg|All files|*.*" into name/pattern pairs. A
// trailing name without patterns is dropped.
std::vector<FileFilterSpec> parse_file_filters(const std::string& filter);

// Path editor with a browse button and an open-containing-folder button.
// The latter is only sensitive while the folder exists.
class PathEditor : public Editor<std::string> {
public:
    explicit PathEditor(Gtk::FileChooser::Action action);
    virtual ~PathEditor() = default;

    void set_dialog_title(const std::string& title) { dialog_title_ = title; }

protected:
    // Folder opened by the open-folder button for the current value.
    virtual std::string folder_of(const std::string& path) const = 0;
    virtual void configure_dialog(Gtk::FileChooserNative& dialog) { (void)dialog; }

private:
    void browse();
    void open_folder();
    void update_open_folder_sensitivity();

    Gtk::FileChooser::Action action_;
    std::string dialog_title_;
    Gtk::Button browse_button_;
    Gtk::Button open_folder_button_;
    Glib::RefPtr<Gtk::FileChooserNative> dialog_;
};

class FileEditor : public PathEditor {
public:
    FileEditor();

    void set_filter(const std::string& filter) { filter_ = filter; }

protected:
    std::string folder_of(const std::string& path) const override;
    void configure_dialog(Gtk::FileChooserNative& dialog) override;

private:
    std::string filter_;
};

class FolderEditor : public PathEditor {
public:
    FolderEditor();

protected:
    std::string folder_of(const std::string& path) const override { return path; }
};
