#ifndef TUI_HELPSCREEN_HPP
#define TUI_HELPSCREEN_HPP

#include "tui/BaseScreen.hpp"

// Key reference shown while the navigator is in its help overlay.
class HelpScreen : public BaseScreen {
public:
    explicit HelpScreen(Navigator& navigator) : BaseScreen(navigator) {}

    void Draw(StateMachine& machine, ncpp::Plane& stdplane) override;
};

#endif // TUI_HELPSCREEN_HPP
