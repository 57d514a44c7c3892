#include "synth/UiContext.hpp"
#include <sstream>
#include "text_utils.hpp"

namespace chatty {

using ordered_json = nlohmann::ordered_json;

namespace {

// Client documents come from JavaScript, so "open" follows its truthiness.
bool is_truthy(const ordered_json& v) {
    switch (v.type()) {
        case ordered_json::value_t::boolean: return v.get<bool>();
        case ordered_json::value_t::number_integer: return v.get<int64_t>() != 0;
        case ordered_json::value_t::number_unsigned: return v.get<uint64_t>() != 0;
        case ordered_json::value_t::number_float: {
            double d = v.get<double>();
            return d != 0.0 && d == d;
        }
        case ordered_json::value_t::string: return !v.get_ref<const std::string&>().empty();
        case ordered_json::value_t::object:
        case ordered_json::value_t::array: return true;
        default: return false;
    }
}

std::optional<std::string> non_empty_string(const ordered_json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    std::string value = trim(it->get<std::string>());
    if (value.empty()) return std::nullopt;
    return value;
}

std::optional<bool> boolean_field(const ordered_json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_boolean()) return std::nullopt;
    return it->get<bool>();
}

std::vector<std::pair<std::string, bool>> truthiness_map(const ordered_json& obj, const char* key) {
    std::vector<std::pair<std::string, bool>> out;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_object()) return out;
    for (const auto& [name, value] : it->items()) {
        out.emplace_back(name, is_truthy(value));
    }
    return out;
}

}

UiContext parse_ui_context(const ordered_json& doc) {
    UiContext ui;
    if (!doc.is_object()) return ui;

    ui.route = non_empty_string(doc, "route");
    ui.active_panel = non_empty_string(doc, "activePanel");

    auto sidebar = doc.find("sidebar");
    if (sidebar != doc.end() && sidebar->is_object()) {
        ui.sidebar_collapsed = boolean_field(*sidebar, "collapsed");
    }

    ui.modals = truthiness_map(doc, "modals");

    auto composer = doc.find("composer");
    if (composer != doc.end() && composer->is_object()) {
        ComposerState state;
        auto count = composer->find("attachmentCount");
        if (count != composer->end()) {
            if (count->is_number_unsigned()) {
                state.attachment_count = static_cast<int64_t>(count->get<uint64_t>());
            } else if (count->is_number_integer() && count->get<int64_t>() >= 0) {
                state.attachment_count = count->get<int64_t>();
            }
        }
        state.options_menu_open = boolean_field(*composer, "optionsMenuOpen");
        state.focused = boolean_field(*composer, "focused");
        ui.composer = state;
    }

    ui.feature_flags = truthiness_map(doc, "featureFlags");
    ui.theme = non_empty_string(doc, "theme");
    ui.synth_mode = non_empty_string(doc, "synthMode");

    auto notes = doc.find("notes");
    if (notes != doc.end() && notes->is_array()) {
        for (const auto& note : *notes) {
            if (!note.is_string()) continue;
            std::string text = trim(note.get<std::string>());
            if (!text.empty()) ui.notes.push_back(text);
        }
    }
    return ui;
}

std::string render_ui_context(const UiContext& ui) {
    std::vector<std::string> lines;

    if (ui.route) lines.push_back("- Route: " + *ui.route);
    if (ui.active_panel) lines.push_back("- Active panel: " + *ui.active_panel);
    if (ui.sidebar_collapsed) {
        lines.push_back(*ui.sidebar_collapsed ? "- Sidebar is collapsed" : "- Sidebar is expanded");
    }

    for (const auto& [name, open] : ui.modals) {
        if (open) lines.push_back("- Modal \"" + name + "\" is open");
    }

    if (ui.composer) {
        const auto& c = *ui.composer;
        if (c.attachment_count) {
            lines.push_back("- Composer has " + std::to_string(*c.attachment_count)
                            + (*c.attachment_count == 1 ? " attachment" : " attachments"));
        }
        if (c.options_menu_open) {
            lines.push_back(*c.options_menu_open ? "- Composer options menu is open"
                                                 : "- Composer options menu is closed");
        }
        if (c.focused) {
            lines.push_back(*c.focused ? "- Composer is focused" : "- Composer is not focused");
        }
    }

    for (const auto& [name, enabled] : ui.feature_flags) {
        lines.push_back("- Feature \"" + name + "\" is " + (enabled ? "enabled" : "disabled"));
    }

    if (ui.theme) lines.push_back("- Theme: " + *ui.theme);
    if (ui.synth_mode) lines.push_back("- Synth mode: " + *ui.synth_mode);

    for (const auto& note : ui.notes) {
        lines.push_back("- Note: " + note);
    }

    std::ostringstream out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i) out << "\n";
        out << lines[i];
    }
    return out.str();
}

}
