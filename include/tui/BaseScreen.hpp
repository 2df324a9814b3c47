#ifndef TUI_BASESCREEN_HPP
#define TUI_BASESCREEN_HPP

#include <string>
#include <vector>

#include <ncpp/Plane.hh>

#include "tui/State.hpp"

class Navigator;

// Base class for screens that project the navigator onto the terminal.
class BaseScreen : public State {
public:
    explicit BaseScreen(Navigator& navigator) : navigator_(navigator) {}

    void Enter(StateMachine& machine, ncpp::Plane& stdplane) override {}
    void Exit(StateMachine& machine, ncpp::Plane& stdplane) override {}

    // Expires pending key sequences and follows mode changes into the matching screen.
    void Update(StateMachine& machine, ncpp::Plane& stdplane) override;

    virtual void Draw(StateMachine& machine, ncpp::Plane& stdplane) override = 0;

    // Feeds the key to the navigator, then syncs the active screen with its mode.
    void HandleInput(StateMachine& machine, ncpp::Plane& stdplane, const ncinput& details) override;

protected:
    // Clears the plane and writes each line centered vertically around mid-row.
    void ClearAndCenterLines(ncpp::Plane& plane, const std::vector<std::string>& lines);
    // Convenience for a single centered line.
    void PutCentered(ncpp::Plane& plane, int row, const std::string& text);

    void SyncWithNavigator(StateMachine& machine, ncpp::Plane& stdplane);

    Navigator& navigator_;
};

#endif // TUI_BASESCREEN_HPP
