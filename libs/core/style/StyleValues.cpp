#include "StyleValues.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace veneer {
namespace StyleValues {

namespace {

bool isHexDigit(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

bool startsWithUrl(std::string_view s, size_t i) {
    if (i + 4 > s.size()) return false;
    return std::tolower(static_cast<unsigned char>(s[i])) == 'u'
        && std::tolower(static_cast<unsigned char>(s[i + 1])) == 'r'
        && std::tolower(static_cast<unsigned char>(s[i + 2])) == 'l'
        && s[i + 3] == '(';
}

std::string_view trimmed(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

// Index of the ')' closing the url( that opens at `open`, honoring quotes.
size_t urlEnd(std::string_view s, size_t open) {
    char quote = 0;
    for (size_t i = open; i < s.size(); ++i) {
        if (quote) {
            if (s[i] == quote) quote = 0;
        } else if (s[i] == '"' || s[i] == '\'') {
            quote = s[i];
        } else if (s[i] == ')') {
            return i;
        }
    }
    return std::string_view::npos;
}

const std::unordered_set<std::string_view>& knownProperties() {
    static const std::unordered_set<std::string_view> properties = {
        "accent-color", "alternate-background-color", "background", "background-attachment",
        "background-clip", "background-color", "background-image", "background-origin",
        "background-position", "background-repeat", "border", "border-bottom",
        "border-bottom-color", "border-bottom-left-radius", "border-bottom-right-radius",
        "border-bottom-style", "border-bottom-width", "border-color", "border-image",
        "border-left", "border-left-color", "border-left-style", "border-left-width",
        "border-radius", "border-right", "border-right-color", "border-right-style",
        "border-right-width", "border-style", "border-top", "border-top-color",
        "border-top-left-radius", "border-top-right-radius", "border-top-style",
        "border-top-width", "border-width", "bottom", "button-layout", "color",
        "dialogbuttonbox-buttons-have-icons", "font", "font-family", "font-size", "font-style",
        "font-weight", "gridline-color", "height", "icon", "icon-size", "image",
        "image-position", "left", "lineedit-password-character",
        "lineedit-password-mask-delay", "margin", "margin-bottom", "margin-left",
        "margin-right", "margin-top", "max-height", "max-width",
        "messagebox-text-interaction-flags", "min-height", "min-width", "opacity", "outline",
        "outline-bottom-left-radius", "outline-bottom-right-radius", "outline-color",
        "outline-offset", "outline-radius", "outline-style", "outline-top-left-radius",
        "outline-top-right-radius", "padding", "padding-bottom", "padding-left",
        "padding-right", "padding-top", "paint-alternating-row-colors-for-empty-area",
        "placeholder-text-color", "position", "right", "selection-background-color",
        "selection-color", "show-decoration-selected", "spacing", "subcontrol-origin",
        "subcontrol-position", "text-align", "text-decoration",
        "titlebar-show-tooltips-on-buttons", "top", "widget-animation-duration", "width",
        // Standard icon overrides
        "backward-icon", "cd-icon", "computer-icon", "desktop-icon", "dialog-apply-icon",
        "dialog-cancel-icon", "dialog-close-icon", "dialog-discard-icon", "dialog-help-icon",
        "dialog-no-icon", "dialog-ok-icon", "dialog-open-icon", "dialog-reset-icon",
        "dialog-save-icon", "dialog-yes-icon", "directory-closed-icon", "directory-icon",
        "directory-link-icon", "directory-open-icon", "dockwidget-close-icon",
        "downarrow-icon", "dvd-icon", "file-icon", "file-link-icon",
        "filedialog-contentsview-icon", "filedialog-detailedview-icon",
        "filedialog-end-icon", "filedialog-infoview-icon", "filedialog-listview-icon",
        "filedialog-new-directory-icon", "filedialog-parent-directory-icon",
        "filedialog-start-icon", "floppy-icon", "forward-icon", "harddisk-icon", "home-icon",
        "leftarrow-icon", "messagebox-critical-icon", "messagebox-information-icon",
        "messagebox-question-icon", "messagebox-warning-icon", "network-icon",
        "rightarrow-icon", "titlebar-close-icon", "titlebar-contexthelp-icon",
        "titlebar-maximize-icon", "titlebar-menu-icon", "titlebar-minimize-icon",
        "titlebar-normal-icon", "titlebar-shade-icon", "titlebar-unshade-icon", "trash-icon",
        "uparrow-icon",
    };
    return properties;
}

const std::unordered_set<std::string_view>& knownPseudoStates() {
    static const std::unordered_set<std::string_view> states = {
        "active", "adjoins-item", "alternate", "bottom", "checked", "closable", "closed",
        "default", "disabled", "editable", "edit-focus", "enabled", "exclusive", "first",
        "flat", "floatable", "focus", "has-children", "has-siblings", "horizontal", "hover",
        "indeterminate", "last", "left", "maximized", "middle", "minimized", "movable",
        "next-selected", "no-frame", "non-exclusive", "off", "on", "only-one", "open",
        "pressed", "previous-selected", "read-only", "right", "selected", "top", "unchecked",
        "vertical", "window",
    };
    return states;
}

const std::unordered_set<std::string_view>& knownSubControls() {
    static const std::unordered_set<std::string_view> controls = {
        "add-line", "add-page", "branch", "chunk", "close-button", "corner", "down-arrow",
        "down-button", "drop-down", "float-button", "groove", "handle", "icon", "indicator",
        "item", "left-arrow", "left-corner", "menu-arrow", "menu-button", "menu-indicator",
        "pane", "right-arrow", "right-corner", "scroller", "section", "separator", "sub-line",
        "sub-page", "tab", "tab-bar", "tear", "tearoff", "text", "title", "up-arrow",
        "up-button",
    };
    return controls;
}

} // namespace

std::vector<std::string> extractUrls(std::string_view value) {
    std::vector<std::string> urls;
    size_t i = 0;
    while (i < value.size()) {
        if (!startsWithUrl(value, i)) {
            ++i;
            continue;
        }
        const size_t open = i + 4;
        const size_t close = urlEnd(value, open);
        if (close == std::string_view::npos) break;

        auto target = trimmed(value.substr(open, close - open));
        if (target.size() >= 2 && (target.front() == '"' || target.front() == '\'')
            && target.back() == target.front()) {
            target = target.substr(1, target.size() - 2);
        }
        urls.emplace_back(target);
        i = close + 1;
    }
    return urls;
}

std::vector<std::string> extractHexColors(std::string_view value) {
    std::vector<std::string> colors;
    char quote = 0;
    size_t i = 0;
    while (i < value.size()) {
        const char c = value[i];
        if (quote) {
            if (c == quote) quote = 0;
            ++i;
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
            ++i;
            continue;
        }
        if (startsWithUrl(value, i)) {
            const size_t close = urlEnd(value, i + 4);
            if (close == std::string_view::npos) break;
            i = close + 1;
            continue;
        }
        if (c == '#') {
            size_t end = i + 1;
            while (end < value.size() && std::isalnum(static_cast<unsigned char>(value[end]))) ++end;
            colors.emplace_back(value.substr(i, end - i));
            i = end;
            continue;
        }
        ++i;
    }
    return colors;
}

bool isValidHexColor(std::string_view literal) {
    return literal.size() == 7 && literal[0] == '#'
        && std::all_of(literal.begin() + 1, literal.end(), isHexDigit);
}

bool isQtHexColor(std::string_view literal) {
    if (literal.empty() || literal[0] != '#') return false;
    const size_t digits = literal.size() - 1;
    if (digits != 3 && digits != 6 && digits != 8 && digits != 9 && digits != 12) return false;
    return std::all_of(literal.begin() + 1, literal.end(), isHexDigit);
}

bool isKnownProperty(std::string_view property) {
    if (property.rfind("qproperty-", 0) == 0) return property.size() > 10;
    if (property.rfind("-qt-", 0) == 0) return true;
    return knownProperties().count(property) > 0;
}

bool isKnownPseudoState(std::string_view state) {
    return knownPseudoStates().count(state) > 0;
}

bool isKnownSubControl(std::string_view subControl) {
    return knownSubControls().count(subControl) > 0;
}

} // namespace StyleValues
} // namespace veneer
