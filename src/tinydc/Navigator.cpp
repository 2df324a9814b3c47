#include "tinydc/Navigator.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "tinydc/EntryFilter.hpp"
#include "tinydc/EntrySource.hpp"
#include "tinydc/Utf8.hpp"

namespace {
bool IsPrintable(char32_t ch) {
    return ch >= 0x20 && ch != 0x7F;
}

// Drops from alphabet every key that would extend the search toward one of entries.
std::string WithoutContinuations(std::string alphabet, const std::vector<Entry>& entries, const std::string& query) {
    for (const Entry& entry : entries) {
        const std::size_t hit = MatchPosition(entry.display_name, query);
        if (hit == std::string::npos || hit + query.size() >= entry.display_name.size()) {
            continue;
        }
        const unsigned char next = static_cast<unsigned char>(entry.display_name[hit + query.size()]);
        const char folded = static_cast<char>(std::tolower(next));
        alphabet.erase(std::remove(alphabet.begin(), alphabet.end(), folded), alphabet.end());
    }
    return alphabet;
}
}

Navigator::Navigator(EntrySource& source, std::filesystem::path start, NavigatorOptions options)
    : source_(source),
      options_(std::move(options)),
      mode_(Mode::Browsing),
      category_(Category::Children),
      current_path_(std::move(start)),
      cursor_(0),
      scroll_offset_(0),
      viewport_height_(0) {
    Listing frecent = source_.Frecent(options_.frecent_limit);
    if (!frecent.entries.empty()) {
        category_ = Category::Frecent;
        entries_ = std::move(frecent.entries);
        warning_ = std::move(frecent.warning);
        Refilter();
    } else {
        Rebuild();
    }
}

void Navigator::HandleKey(const Key& key) {
    HandleKey(key, std::chrono::steady_clock::now());
}

void Navigator::HandleKey(const Key& key, TimePoint now) {
    if (mode_ == Mode::Exiting) {
        return;
    }
    if (key.code == Key::Code::Char && key.ctrl && (key.ch == 'c' || key.ch == 'C')) {
        Quit();
        return;
    }

    switch (mode_) {
    case Mode::Browsing:
        HandleBrowsingKey(key, now);
        break;
    case Mode::Searching:
        HandleSearchingKey(key, now);
        break;
    case Mode::HelpOverlay:
        HandleHelpKey(key);
        break;
    case Mode::Exiting:
        break;
    }
}

void Navigator::Tick(TimePoint now) {
    if (!pending_prefix_.empty() && now - pending_since_ >= options_.key_sequence_timeout) {
        ClearPending();
    }
}

void Navigator::HandleBrowsingKey(const Key& key, TimePoint now) {
    if (!pending_prefix_.empty()) {
        if (now - pending_since_ >= options_.key_sequence_timeout) {
            ClearPending();
        } else if (HandlePendingPrefix(key)) {
            return;
        }
    }

    switch (key.code) {
    case Key::Code::Up:
        MoveCursor(-1);
        return;
    case Key::Code::Down:
        MoveCursor(1);
        return;
    case Key::Code::Left:
        GoToParent();
        return;
    case Key::Code::Right:
    case Key::Code::Enter:
        EnterSelected();
        return;
    case Key::Code::Home:
        SelectFirst();
        return;
    case Key::Code::End:
        SelectLast();
        return;
    case Key::Code::PageUp:
        MoveCursor(-static_cast<long>(std::max<std::size_t>(1, viewport_height_)));
        return;
    case Key::Code::PageDown:
        MoveCursor(static_cast<long>(std::max<std::size_t>(1, viewport_height_)));
        return;
    case Key::Code::Escape:
        Quit();
        return;
    case Key::Code::Char:
        break;
    default:
        return;
    }

    if (key.ctrl) {
        if (key.ch == 'f' || key.ch == 'F') {
            SwitchCategory(Category::Frecent);
        } else if (key.ch == 'd' || key.ch == 'D') {
            SwitchCategory(Category::Children);
        }
        return;
    }

    switch (key.ch) {
    case 'j':
        MoveCursor(1);
        return;
    case 'k':
        MoveCursor(-1);
        return;
    case 'h':
        GoToParent();
        return;
    case 'l':
        EnterSelected();
        return;
    case 'g':
        pending_prefix_ = "g";
        pending_since_ = now;
        return;
    case 'G':
        SelectLast();
        return;
    case 'q':
        Quit();
        return;
    case '/':
        BeginSearch();
        return;
    case '?':
        ToggleHelp();
        return;
    case '_':
        ClearSearch();
        return;
    case '.':
        ChooseCurrentDirectory();
        return;
    default:
        break;
    }

    HandleShortcutKey(key.ch, now);
}

// Returns true when the key was consumed by the pending sequence.
bool Navigator::HandlePendingPrefix(const Key& key) {
    const std::string prefix = pending_prefix_;
    ClearPending();
    if (key.code != Key::Code::Char || key.ctrl || key.ch >= 0x80) {
        return false;
    }

    if (prefix == "g") {
        if (key.ch == 'g') {
            SelectFirst();
            return true;
        }
        return false;
    }

    const std::string typed = prefix + static_cast<char>(key.ch);
    const std::size_t row = FindShortcut(labels_, typed);
    if (row != std::string::npos) {
        EnterEntry(scroll_offset_ + row);
        return true;
    }
    return false;
}

bool Navigator::HandleShortcutKey(char32_t ch, TimePoint now) {
    if (ch >= 0x80) {
        return false;
    }
    const std::string typed(1, static_cast<char>(ch));
    const std::size_t row = FindShortcut(labels_, typed);
    if (row != std::string::npos) {
        EnterEntry(scroll_offset_ + row);
        return true;
    }
    if (IsShortcutPrefix(labels_, typed)) {
        pending_prefix_ = typed;
        pending_since_ = now;
        return true;
    }
    return false;
}

void Navigator::HandleSearchingKey(const Key& key, TimePoint now) {
    if (!pending_prefix_.empty()) {
        if (now - pending_since_ >= options_.key_sequence_timeout) {
            ClearPending();
        } else if (HandlePendingPrefix(key)) {
            return;
        }
    }

    switch (key.code) {
    case Key::Code::Escape:
        EndSearch(false);
        return;
    case Key::Code::Enter:
        EndSearch(true);
        return;
    case Key::Code::Backspace:
        if (!search_buffer_.empty()) {
            PopUtf8(search_buffer_);
            Refilter();
        }
        return;
    case Key::Code::Up:
        MoveCursor(-1);
        return;
    case Key::Code::Down:
        MoveCursor(1);
        return;
    case Key::Code::Char:
        if (!key.ctrl && IsPrintable(key.ch)) {
            if (HandleShortcutKey(key.ch, now)) {
                return;
            }
            AppendUtf8(search_buffer_, key.ch);
            Refilter();
        }
        return;
    default:
        return;
    }
}

void Navigator::HandleHelpKey(const Key& key) {
    if (key.code == Key::Code::Escape
        || (key.code == Key::Code::Char && !key.ctrl && (key.ch == '?' || key.ch == 'q'))) {
        ToggleHelp();
    }
}

void Navigator::SetViewportHeight(std::size_t rows) {
    if (rows == viewport_height_) {
        return;
    }
    viewport_height_ = rows;
    UpdateViewport();
}

void Navigator::MoveCursor(long delta) {
    if (filtered_.empty()) {
        return;
    }
    const long last = static_cast<long>(filtered_.size()) - 1;
    const long target = std::clamp(static_cast<long>(cursor_) + delta, 0L, last);
    SetCursor(static_cast<std::size_t>(target));
}

void Navigator::SelectFirst() {
    SetCursor(0);
}

void Navigator::SelectLast() {
    SetCursor(filtered_.empty() ? 0 : filtered_.size() - 1);
}

void Navigator::EnterSelected() {
    EnterEntry(cursor_);
}

void Navigator::EnterEntry(std::size_t index) {
    if (index >= filtered_.size()) {
        return;
    }
    const std::filesystem::path target = filtered_[index].path;
    ChangeDirectory(target);
}

void Navigator::GoToParent() {
    const std::filesystem::path came_from = current_path_;
    std::filesystem::path parent = current_path_.parent_path();
    if (parent.empty() || !current_path_.has_relative_path()) {
        parent = current_path_;
    }

    ChangeDirectory(parent);

    const std::string came_from_name = came_from.filename().string();
    for (std::size_t i = 0; i < filtered_.size(); ++i) {
        if (filtered_[i].display_name == came_from_name) {
            SetCursor(i);
            break;
        }
    }
}

void Navigator::SwitchCategory(Category category) {
    category_ = category;
    search_buffer_.clear();
    if (mode_ == Mode::Searching) {
        mode_ = Mode::Browsing;
    }
    Rebuild();
    SetCursor(0);
}

void Navigator::BeginSearch() {
    ClearPending();
    search_buffer_.clear();
    mode_ = Mode::Searching;
    Refilter();
}

void Navigator::EndSearch(bool keep_filter) {
    mode_ = Mode::Browsing;
    ClearPending();
    if (!keep_filter) {
        search_buffer_.clear();
        Refilter();
    } else {
        UpdateViewport();
    }
}

void Navigator::ClearSearch() {
    if (search_buffer_.empty()) {
        return;
    }
    search_buffer_.clear();
    Refilter();
}

void Navigator::ToggleHelp() {
    ClearPending();
    mode_ = mode_ == Mode::HelpOverlay ? Mode::Browsing : Mode::HelpOverlay;
}

void Navigator::ChooseCurrentDirectory() {
    exit_path_ = current_path_.string();
    mode_ = Mode::Exiting;
}

void Navigator::Quit() {
    exit_path_.reset();
    mode_ = Mode::Exiting;
}

const Entry* Navigator::SelectedEntry() const {
    if (cursor_ >= filtered_.size()) {
        return nullptr;
    }
    return &filtered_[cursor_];
}

std::size_t Navigator::VisibleCount() const {
    if (viewport_height_ == 0) {
        return filtered_.size();
    }
    return std::min(viewport_height_, filtered_.size() - scroll_offset_);
}

void Navigator::ChangeDirectory(const std::filesystem::path& path) {
    current_path_ = path;
    category_ = Category::Children;
    search_buffer_.clear();
    if (mode_ == Mode::Searching) {
        mode_ = Mode::Browsing;
    }
    Rebuild();
    SetCursor(0);
}

void Navigator::Rebuild() {
    ClearPending();
    Listing listing = category_ == Category::Frecent ? source_.Frecent(options_.frecent_limit)
                                                     : source_.Children(current_path_);
    entries_ = std::move(listing.entries);
    warning_ = std::move(listing.warning);
    filtered_.clear();
    cursor_ = 0;
    Refilter();
}

// Re-applies the search buffer, keeping the cursor on the same entry when it survives.
void Navigator::Refilter() {
    ClearPending();
    std::string selected_path;
    if (cursor_ < filtered_.size()) {
        selected_path = filtered_[cursor_].path;
    }

    filtered_ = ApplyFilter(entries_, search_buffer_);

    std::size_t cursor = 0;
    if (!selected_path.empty()) {
        for (std::size_t i = 0; i < filtered_.size(); ++i) {
            if (filtered_[i].path == selected_path) {
                cursor = i;
                break;
            }
        }
    }
    cursor_ = cursor;
    UpdateViewport();
}

void Navigator::SetCursor(std::size_t index) {
    cursor_ = filtered_.empty() ? 0 : std::min(index, filtered_.size() - 1);
    UpdateViewport();
}

// Keeps the cursor inside the scroll window and relabels the rows it shows.
void Navigator::UpdateViewport() {
    if (viewport_height_ == 0 || filtered_.size() <= viewport_height_) {
        scroll_offset_ = 0;
    } else {
        if (cursor_ < scroll_offset_) {
            scroll_offset_ = cursor_;
        } else if (cursor_ >= scroll_offset_ + viewport_height_) {
            scroll_offset_ = cursor_ - viewport_height_ + 1;
        }
        scroll_offset_ = std::min(scroll_offset_, filtered_.size() - viewport_height_);
    }
    if (mode_ == Mode::Searching) {
        labels_ = AssignShortcuts(VisibleCount(),
                                  WithoutContinuations(options_.shortcut_alphabet, filtered_, search_buffer_));
    } else {
        labels_ = AssignShortcuts(VisibleCount(), options_.shortcut_alphabet);
    }
}

void Navigator::ClearPending() {
    pending_prefix_.clear();
}
