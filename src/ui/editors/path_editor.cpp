#include "ui/editors/path_editor.h"

#include <filesystem>
#include <iostream>
#include <sstream>

#include "converters/value_converter_factory.h"

namespace fs = std::filesystem;

std::vector<FileFilterSpec> parse_file_filters(const std::string& filter) {
    std::vector<std::string> parts;
    std::stringstream stream(filter);
    std::string part;
    while (std::getline(stream, part, '|')) {
        parts.push_back(part);
    }

    std::vector<FileFilterSpec> filters;
    for (size_t i = 0; i + 1 < parts.size(); i += 2) {
        FileFilterSpec spec;
        spec.name = parts[i];

        std::stringstream patterns(parts[i + 1]);
        std::string pattern;
        while (std::getline(patterns, pattern, ';')) {
            if (!pattern.empty()) {
                spec.patterns.push_back(pattern);
            }
        }
        if (!spec.patterns.empty()) {
            filters.push_back(std::move(spec));
        }
    }
    return filters;
}

PathEditor::PathEditor(Gtk::FileChooser::Action action)
    : Editor<std::string>(ValueConverterFactory::create_default_string_value_converter())
    , action_(action)
{
    set_update_value_when_text_changed(true);

    browse_button_.set_icon_name(action == Gtk::FileChooser::Action::SELECT_FOLDER
                                     ? "folder-symbolic" : "document-open-symbolic");
    browse_button_.set_tooltip_text("Browse");
    browse_button_.signal_clicked().connect(sigc::mem_fun(*this, &PathEditor::browse));
    add_button(browse_button_);

    open_folder_button_.set_icon_name("folder-open-symbolic");
    open_folder_button_.set_tooltip_text("Open folder");
    open_folder_button_.signal_clicked().connect(sigc::mem_fun(*this, &PathEditor::open_folder));
    add_button(open_folder_button_);

    signal_value_changed().connect([this](const std::optional<std::string>&) {
        update_open_folder_sensitivity();
    });
    open_folder_button_.set_sensitive(false);
}

void PathEditor::browse() {
    std::string title = dialog_title_.empty() ? get_title() : dialog_title_;
    if (auto* parent = dynamic_cast<Gtk::Window*>(get_root())) {
        dialog_ = Gtk::FileChooserNative::create(title, *parent, action_, "_Select", "_Cancel");
    } else {
        dialog_ = Gtk::FileChooserNative::create(title, action_, "_Select", "_Cancel");
    }
    dialog_->set_modal(true);

    const auto& value = get_value();
    if (value && !value->empty()) {
        std::string folder = folder_of(*value);
        std::error_code ec;
        if (fs::is_directory(folder, ec)) {
            try {
                dialog_->set_current_folder(Gio::File::create_for_path(folder));
            } catch (const Glib::Error& e) {
                std::cerr << "⚠️  Cannot preselect folder " << folder << ": " << e.what() << std::endl;
            }
        }
    }
    configure_dialog(*dialog_);

    dialog_->signal_response().connect([this](int response) {
        if (response == static_cast<int>(Gtk::ResponseType::ACCEPT)) {
            auto file = dialog_->get_file();
            if (file) {
                set_value(file->get_path());
            }
        }
        dialog_->hide();
    });
    dialog_->show();
}

void PathEditor::open_folder() {
    const auto& value = get_value();
    if (!value) {
        return;
    }
    std::string folder = folder_of(*value);
    try {
        Gio::AppInfo::launch_default_for_uri(Glib::filename_to_uri(folder));
    } catch (const Glib::Error& e) {
        std::cerr << "❌ Cannot open folder " << folder << ": " << e.what() << std::endl;
    }
}

void PathEditor::update_open_folder_sensitivity() {
    const auto& value = get_value();
    std::error_code ec;
    bool exists = value && !value->empty() && fs::is_directory(folder_of(*value), ec);
    open_folder_button_.set_sensitive(exists);
}

FileEditor::FileEditor()
    : PathEditor(Gtk::FileChooser::Action::OPEN) {}

std::string FileEditor::folder_of(const std::string& path) const {
    return fs::path(path).parent_path().string();
}

void FileEditor::configure_dialog(Gtk::FileChooserNative& dialog) {
    for (const auto& spec : parse_file_filters(filter_)) {
        auto filter = Gtk::FileFilter::create();
        filter->set_name(spec.name);
        for (const auto& pattern : spec.patterns) {
            filter->add_pattern(pattern);
        }
        dialog.add_filter(filter);
    }
}

FolderEditor::FolderEditor()
    : PathEditor(Gtk::FileChooser::Action::SELECT_FOLDER) {}
