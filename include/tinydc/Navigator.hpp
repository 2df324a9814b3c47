#ifndef TINYDC_NAVIGATOR_HPP
#define TINYDC_NAVIGATOR_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "tinydc/Entry.hpp"
#include "tinydc/Key.hpp"
#include "tinydc/ShortcutAssigner.hpp"

class EntrySource;

struct NavigatorOptions {
    std::size_t frecent_limit = 200;
    std::chrono::milliseconds key_sequence_timeout{1000};
    std::string shortcut_alphabet = kDefaultShortcutAlphabet;
};

// Keyboard driven browser state. Owns the cursor, the browsing context and the search buffer,
// and turns key events into transitions. Rendering only reads it, apart from reporting the
// list height through SetViewportHeight().
class Navigator {
public:
    enum class Mode {
        Browsing,
        Searching,
        HelpOverlay,
        Exiting
    };

    using TimePoint = std::chrono::steady_clock::time_point;

    Navigator(EntrySource& source, std::filesystem::path start, NavigatorOptions options = NavigatorOptions());

    void HandleKey(const Key& key);
    void HandleKey(const Key& key, TimePoint now);

    // Drops a pending key prefix ("g", or the first key of a two-key shortcut) once it timed out.
    void Tick(TimePoint now);

    // Rows available to the list; 0 shows every entry.
    void SetViewportHeight(std::size_t rows);

    // Actions, also reachable through HandleKey.
    void MoveCursor(long delta);
    void SelectFirst();
    void SelectLast();
    void EnterSelected();
    void EnterEntry(std::size_t index);
    void GoToParent();
    void SwitchCategory(Category category);
    void BeginSearch();
    void EndSearch(bool keep_filter);
    void ClearSearch();
    void ToggleHelp();
    void ChooseCurrentDirectory();
    void Quit();

    Mode GetMode() const { return mode_; }
    Category GetCategory() const { return category_; }
    const std::filesystem::path& CurrentPath() const { return current_path_; }
    std::size_t Cursor() const { return cursor_; }
    std::size_t ScrollOffset() const { return scroll_offset_; }
    const std::vector<Entry>& Entries() const { return filtered_; }
    const Entry* SelectedEntry() const;
    const std::string& SearchBuffer() const { return search_buffer_; }
    const std::string& PendingPrefix() const { return pending_prefix_; }
    const std::string& Warning() const { return warning_; }

    // Rows [ScrollOffset(), ScrollOffset() + VisibleCount()) are on screen.
    std::size_t VisibleCount() const;
    // Label of each visible row, in row order.
    const std::vector<std::string>& VisibleLabels() const { return labels_; }

    bool Finished() const { return mode_ == Mode::Exiting; }
    const std::optional<std::string>& ExitPath() const { return exit_path_; }

private:
    void HandleBrowsingKey(const Key& key, TimePoint now);
    void HandleSearchingKey(const Key& key, TimePoint now);
    void HandleHelpKey(const Key& key);
    bool HandlePendingPrefix(const Key& key);
    bool HandleShortcutKey(char32_t ch, TimePoint now);

    void ChangeDirectory(const std::filesystem::path& path);
    void Rebuild();
    void Refilter();
    void SetCursor(std::size_t index);
    void UpdateViewport();
    void ClearPending();

    EntrySource& source_;
    NavigatorOptions options_;

    Mode mode_;
    Category category_;
    std::filesystem::path current_path_;

    std::vector<Entry> entries_;
    std::vector<Entry> filtered_;
    std::size_t cursor_;
    std::size_t scroll_offset_;
    std::size_t viewport_height_;
    std::vector<std::string> labels_;

    std::string search_buffer_;
    std::string pending_prefix_;
    TimePoint pending_since_;
    std::string warning_;
    std::optional<std::string> exit_path_;
};

#endif // TINYDC_NAVIGATOR_HPP
