#include "tui/BrowserScreen.hpp"

#include <algorithm>
#include <string>

#include "tinydc/EntryFilter.hpp"
#include "tinydc/Navigator.hpp"
#include "tinydc/Utf8.hpp"

namespace {
constexpr int kMargin = 1;
constexpr int kHeaderRows = 1;
constexpr int kStatusRows = 1;
constexpr int kLabelWidth = 3;

// Code points are drawn one column each.
int Columns(const std::string& text) {
    return static_cast<int>(CodePointCount(text));
}

std::string Clip(const std::string& text, int width) {
    return width <= 0 ? std::string() : ClipUtf8(text, static_cast<std::size_t>(width));
}
}

BrowserScreen::BrowserScreen(Navigator& navigator)
    : BaseScreen(navigator),
      list_subframe_(navigator),
      status_subframe_(navigator) {}

void BrowserScreen::Draw(StateMachine& machine, ncpp::Plane& stdplane) {
    (void)machine;
    stdplane.erase();
    stdplane.perimeter_rounded(0, 0, 0);

    unsigned rows = 0;
    unsigned cols = 0;
    stdplane.get_dim(rows, cols);

    const bool frecent = navigator_.GetCategory() == Category::Frecent;
    PutCentered(stdplane, 0, frecent ? " Frecent " : " Directories ");

    const int path_width = static_cast<int>(cols) - 2 * (kMargin + 1);
    stdplane.set_fg_rgb8(150, 200, 255);
    stdplane.putstr(kMargin, kMargin + 1, Clip(navigator_.CurrentPath().string(), path_width).c_str());
    stdplane.set_fg_default();

    const bool list_fits = list_subframe_.Resize(stdplane, rows, cols);
    status_subframe_.Resize(stdplane, rows, cols);

    // The list height decides which rows are visible and therefore labelled.
    navigator_.SetViewportHeight(list_fits ? list_subframe_.Rows() : 1u);

    list_subframe_.Draw();
    status_subframe_.Draw();
}

Subframe::Region BrowserScreen::ListSubframe::Place(unsigned parent_rows, unsigned parent_cols) const {
    const int top = kMargin + kHeaderRows;
    return Region{top, kMargin, static_cast<int>(parent_rows) - top - kStatusRows - kMargin,
                  static_cast<int>(parent_cols) - 2 * kMargin};
}

void BrowserScreen::ListSubframe::DrawContents() {
    const int width = static_cast<int>(cached_cols_);
    const int bar_col = width - 1;
    const int text_col = kLabelWidth + 1;
    const int text_width = std::max(0, bar_col - text_col);

    const std::vector<Entry>& entries = navigator_.Entries();
    if (entries.empty()) {
        const std::string message = navigator_.SearchBuffer().empty() ? "(no directories)" : "(no matches)";
        plane_->set_fg_rgb8(128, 128, 128);
        plane_->putstr(0, ncpp::NCAlign::Center, message.c_str());
        plane_->set_fg_default();
        return;
    }

    const std::vector<std::string>& labels = navigator_.VisibleLabels();
    const std::size_t offset = navigator_.ScrollOffset();
    const std::size_t visible = navigator_.VisibleCount();
    const std::string& query = navigator_.SearchBuffer();

    for (std::size_t i = 0; i < visible && offset + i < entries.size(); ++i) {
        const int row = static_cast<int>(i);
        const std::size_t index = offset + i;
        const Entry& entry = entries[index];
        const bool is_selected = index == navigator_.Cursor();

        if (i < labels.size() && !labels[i].empty()) {
            plane_->set_bg_rgb8(80, 200, 120);
            plane_->set_fg_rgb8(0, 0, 0);
            plane_->putstr(row, 1, labels[i].c_str());
            plane_->set_bg_default();
            plane_->set_fg_default();
        }

        if (is_selected) {
            plane_->set_bg_rgb8(255, 255, 255);
            plane_->set_fg_rgb8(0, 0, 0);
            for (int col = text_col - 1; col < bar_col; ++col) {
                plane_->putstr(row, col, " ");
            }
        }

        const std::string text = Clip(entry.display_name + "/", text_width);
        const std::size_t hit = query.empty() ? std::string::npos : MatchPosition(entry.display_name, query);
        if (hit == std::string::npos || hit >= text.size()) {
            plane_->putstr(row, text_col, text.c_str());
        } else {
            const std::size_t hit_len = std::min(query.size(), text.size() - hit);
            const std::string before = text.substr(0, hit);
            const std::string match = text.substr(hit, hit_len);
            plane_->putstr(row, text_col, before.c_str());
            plane_->set_fg_rgb8(230, 160, 0);
            plane_->putstr(row, text_col + Columns(before), match.c_str());
            if (is_selected) {
                plane_->set_fg_rgb8(0, 0, 0);
            } else {
                plane_->set_fg_default();
            }
            plane_->putstr(row, text_col + Columns(before) + Columns(match), text.substr(hit + hit_len).c_str());
        }

        plane_->set_bg_default();
        plane_->set_fg_default();
    }

    DrawScrollbar(bar_col);
}

void BrowserScreen::ListSubframe::DrawScrollbar(int bar_col) {
    const int item_count = static_cast<int>(navigator_.Entries().size());
    const int visible_rows = static_cast<int>(cached_rows_);
    const int scroll_offset = static_cast<int>(navigator_.ScrollOffset());
    if (item_count <= visible_rows || visible_rows <= 0) {
        return;
    }

    const int thumb_height = std::max(1, (visible_rows * visible_rows) / item_count);
    const int max_thumb_start = visible_rows - thumb_height;
    const int thumb_start = (max_thumb_start * scroll_offset) / (item_count - visible_rows);
    plane_->set_bg_rgb8(200, 200, 200);
    plane_->set_fg_rgb8(0, 0, 0);
    for (int i = 0; i < thumb_height; ++i) {
        plane_->putstr(thumb_start + i, bar_col, " ");
    }
    plane_->set_bg_default();
    plane_->set_fg_default();
}

Subframe::Region BrowserScreen::StatusSubframe::Place(unsigned parent_rows, unsigned parent_cols) const {
    // Sits on the last row inside the border, and only once the header has room above it.
    const int bottom = static_cast<int>(parent_rows) - kMargin - kStatusRows;
    return Region{bottom, kMargin, bottom > kMargin + kHeaderRows ? kStatusRows : 0,
                  static_cast<int>(parent_cols) - 2 * kMargin};
}

void BrowserScreen::StatusSubframe::DrawContents() {
    const int width = static_cast<int>(cached_cols_);
    const std::size_t total = navigator_.Entries().size();
    const std::string counter = total == 0 ? "0/0"
        : std::to_string(navigator_.Cursor() + 1) + "/" + std::to_string(total);
    const int counter_col = std::max(0, width - static_cast<int>(counter.size()) - 1);
    const int left_width = std::max(0, counter_col - 2);

    std::string left;
    if (navigator_.GetMode() == Navigator::Mode::Searching) {
        left = "/" + navigator_.SearchBuffer() + "_";
    } else if (!navigator_.Warning().empty()) {
        plane_->set_fg_rgb8(255, 110, 110);
        left = "! " + navigator_.Warning();
    } else if (!navigator_.PendingPrefix().empty()) {
        left = navigator_.PendingPrefix() + "-";
    } else if (!navigator_.SearchBuffer().empty()) {
        left = "filter: " + navigator_.SearchBuffer() + "  (_ to clear)";
    } else {
        left = "? help  . choose  / search  q quit";
    }
    plane_->putstr(0, 1, Clip(left, left_width).c_str());
    plane_->set_fg_default();
    plane_->putstr(0, counter_col, counter.c_str());
}
