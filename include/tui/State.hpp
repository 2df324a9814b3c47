#ifndef TUI_STATE_HPP
#define TUI_STATE_HPP

#include <ncpp/NotCurses.hh>
#include <ncpp/Plane.hh>

class StateMachine;

// Interface for a screen driven by the state machine.
class State {
public:
    virtual ~State() = default;

    // Called when the screen becomes active.
    virtual void Enter(StateMachine& machine, ncpp::Plane& stdplane) = 0;
    // Called when transitioning away from the screen.
    virtual void Exit(StateMachine& machine, ncpp::Plane& stdplane) = 0;
    // Paints the current frame onto the provided plane.
    virtual void Draw(StateMachine& machine, ncpp::Plane& stdplane) = 0;
    // Polled after every input and on each poll timeout.
    virtual void Update(StateMachine& machine, ncpp::Plane& stdplane) = 0;
    // Handles a single key press.
    virtual void HandleInput(StateMachine& machine, ncpp::Plane& stdplane, const ncinput& details) = 0;
};

#endif // TUI_STATE_HPP
