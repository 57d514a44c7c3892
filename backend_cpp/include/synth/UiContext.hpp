#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace chatty {

struct ComposerState {
    std::optional<int64_t> attachment_count;
    std::optional<bool> options_menu_open;
    std::optional<bool> focused;
};

/**
 * Snapshot of the client UI sent along with a prompt. Every recognized key is
 * optional; values of the wrong shape are dropped while parsing and unknown
 * keys are ignored. Modals and feature flags keep the document's key order.
 */
struct UiContext {
    std::optional<std::string> route;
    std::optional<std::string> active_panel;
    std::optional<bool> sidebar_collapsed;
    std::vector<std::pair<std::string, bool>> modals;         // name, open
    std::optional<ComposerState> composer;
    std::vector<std::pair<std::string, bool>> feature_flags;  // name, enabled
    std::optional<std::string> theme;
    std::optional<std::string> synth_mode;
    std::vector<std::string> notes;
};

UiContext parse_ui_context(const nlohmann::ordered_json& doc);

// One "- ..." line per rendered field, joined with '\n'. Empty if nothing renders.
std::string render_ui_context(const UiContext& ui);

}
