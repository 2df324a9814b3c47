#ifndef TUI_BROWSERSCREEN_HPP
#define TUI_BROWSERSCREEN_HPP

#include "tui/BaseScreen.hpp"
#include "tui/Subframe.hpp"

class Navigator;

// Main screen: current path, the entry list with shortcut labels and a status line.
class BrowserScreen : public BaseScreen {
public:
    explicit BrowserScreen(Navigator& navigator);

    void Draw(StateMachine& machine, ncpp::Plane& stdplane) override;

private:
    class ListSubframe : public Subframe {
    public:
        explicit ListSubframe(const Navigator& navigator) : navigator_(navigator) {}

    protected:
        Region Place(unsigned parent_rows, unsigned parent_cols) const override;
        void DrawContents() override;

    private:
        void DrawScrollbar(int bar_col);

        const Navigator& navigator_;
    };

    class StatusSubframe : public Subframe {
    public:
        explicit StatusSubframe(const Navigator& navigator) : navigator_(navigator) {}

    protected:
        Region Place(unsigned parent_rows, unsigned parent_cols) const override;
        void DrawContents() override;

    private:
        const Navigator& navigator_;
    };

    ListSubframe list_subframe_;
    StatusSubframe status_subframe_;
};

#endif // TUI_BROWSERSCREEN_HPP
