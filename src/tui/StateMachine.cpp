#include "tui/StateMachine.hpp"

#include <cstdint>
#include <ctime>
#include <notcurses/notcurses.h>

#include "tui/Signal.hpp"
#include "tui/State.hpp"

StateMachine::StateMachine() : current_state_(nullptr), running_(true) {}

StateMachine::~StateMachine() = default;

void StateMachine::AddState(const std::string& name, std::shared_ptr<State> state) {
    states_[name] = state;
}

void StateMachine::TransitionTo(const std::string& name, ncpp::Plane& stdplane) {
    std::unordered_map<std::string, std::shared_ptr<State>>::const_iterator it = states_.find(name);
    if (it == states_.cend() || it->second == current_state_) {
        return;
    }

    if (current_state_ != nullptr) {
        current_state_->Exit(*this, stdplane);
    }

    current_state_ = it->second;
    current_state_->Enter(*this, stdplane);
}

void StateMachine::RequestStop() {
    running_ = false;
}

void StateMachine::Run(ncpp::NotCurses& nc, ncpp::Plane& stdplane) {
    running_ = true;

    // Short poll so pending key sequences can time out while the user is idle.
    const timespec poll_timeout{0, 100'000'000}; // 100ms

    while (running_) {
        if (current_state_ == nullptr) {
            break;
        }

        current_state_->Draw(*this, stdplane);
        nc.render();

        ncinput input_details{};
        uint32_t ch = notcurses_get(nc, &poll_timeout, &input_details);

        if (g_stop_requested.load(std::memory_order_relaxed)) {
            running_ = false;
            break;
        }

        if (ch == 0) {
            current_state_->Update(*this, stdplane);
            continue;
        }

        if (static_cast<int32_t>(ch) == -1) {
            // Input error from notcurses_get; bail out to restore the terminal.
            running_ = false;
            break;
        }

        // Key releases and repeats from terminals that report them carry no new intent.
        if (input_details.evtype == NCTYPE_RELEASE) {
            continue;
        }

        // States may swap the current state while handling input; keep the dispatching one alive.
        std::shared_ptr<State> active = current_state_;
        active->HandleInput(*this, stdplane, input_details);
        if (current_state_ != nullptr) {
            current_state_->Update(*this, stdplane);
        }
    }

    if (current_state_ != nullptr) {
        current_state_->Exit(*this, stdplane);
    }
}
