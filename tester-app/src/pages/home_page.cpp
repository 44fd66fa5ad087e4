#include "pages/home_page.h"

#include <vector>

namespace {
std::vector<Glib::ustring> severity_names() {
    return {"Informational", "Success", "Warning", "Error"};
}
}

HomePage::HomePage(std::shared_ptr<HomeViewModel> view_model)
    : view_model_(std::move(view_model))
    , severity_selector_(severity_names())
{
    set_policy(Gtk::PolicyType::NEVER, Gtk::PolicyType::AUTOMATIC);
    content_.set_margin(16);

    build_editors();
    build_feedback();

    set_child(content_);
}

void HomePage::build_editors() {
    name_editor_.set_title("Name");
    name_editor_.set_placeholder("Required");

    length_editor_.set_title("Length");
    length_editor_.set_suffix("mm");
    length_editor_.set_value_format("%.2f");

    count_editor_.set_title("Count");
    count_editor_.set_value(3);

    port_editor_.set_title("Port");
    port_editor_.set_value(static_cast<unsigned short>(8080));

    scale_editor_.set_title("Scale");
    scale_editor_.set_value(1.0f);

    offset_editor_.set_title("Offset");
    offset_editor_.set_value(static_cast<short>(-5));

    retries_editor_.set_title("Retries");
    retries_editor_.set_value(3u);

    ticks_editor_.set_title("Ticks");
    ticks_editor_.set_update_value_when_text_changed(true);

    size_editor_.set_title("Size");
    size_editor_.set_suffix("bytes");
    size_editor_.set_read_only(true);

    data_editor_.set_title("Data");
    data_editor_.set_value(Bytes{0xde, 0xad, 0xbe, 0xef});
    data_editor_.signal_value_changed().connect([this](const std::optional<Bytes>& data) {
        size_editor_.set_value(static_cast<unsigned long long>(data ? data->size() : 0));
    });
    size_editor_.set_value(4ULL);

    file_editor_.set_title("File");
    file_editor_.set_filter("Text files|*.txt;*.md|All files|*");

    folder_editor_.set_title("Folder");

    for (EditorBase* editor : std::vector<EditorBase*>{&name_editor_, &length_editor_, &count_editor_, &port_editor_,
                                                       &scale_editor_, &offset_editor_, &retries_editor_, &ticks_editor_,
                                                       &size_editor_, &data_editor_, &file_editor_, &folder_editor_}) {
        editors_box_.append(*editor);
    }
    editors_box_.set_margin(8);
    editors_group_.set_content(editors_box_);
    content_.append(editors_group_);
}

void HomePage::build_feedback() {
    info_message_entry_.set_text("Hello from the info bar.");
    info_message_entry_.set_hexpand(true);
    show_info_bar_button_.signal_clicked().connect(sigc::mem_fun(*this, &HomePage::on_show_info_bar));
    info_bar_row_.append(severity_selector_);
    info_bar_row_.append(info_message_entry_);
    info_bar_row_.append(show_info_bar_button_);

    validate_button_.signal_clicked().connect(sigc::mem_fun(*this, &HomePage::on_validate));
    progress_button_.signal_clicked().connect([this]() {
        view_model_->run_long_operation();
    });

    feedback_box_.set_margin(8);
    feedback_box_.append(info_bar_row_);
    feedback_box_.append(validate_button_);
    feedback_box_.append(progress_button_);
    feedback_group_.set_content(feedback_box_);
    content_.append(feedback_group_);
}

void HomePage::on_validate() {
    HomeInputs inputs;
    inputs.name = name_editor_.get_value();
    inputs.length = length_editor_.get_value();
    inputs.count = count_editor_.get_value();
    view_model_->validate(inputs);
}

void HomePage::on_show_info_bar() {
    auto severity = static_cast<InfoBarSeverity>(severity_selector_.get_selected());
    view_model_->show_info_bar(severity, info_message_entry_.get_text());
}
