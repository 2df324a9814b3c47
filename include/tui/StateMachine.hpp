#ifndef TUI_STATEMACHINE_HPP
#define TUI_STATEMACHINE_HPP

#include <memory>
#include <string>
#include <unordered_map>

#include <ncpp/NotCurses.hh>
#include <ncpp/Plane.hh>

class State;

// Swaps between screens and runs the draw/poll/dispatch loop.
class StateMachine {
public:
    StateMachine();
    ~StateMachine();

    void AddState(const std::string& name, std::shared_ptr<State> state);
    void TransitionTo(const std::string& name, ncpp::Plane& stdplane);

    void RequestStop();

    // Runs until a state calls RequestStop(), a stop signal arrives or input fails.
    void Run(ncpp::NotCurses& nc, ncpp::Plane& stdplane);

private:
    std::unordered_map<std::string, std::shared_ptr<State>> states_;
    std::shared_ptr<State> current_state_;
    bool running_;
};

#endif // TUI_STATEMACHINE_HPP
