#include "tui/HelpScreen.hpp"

#include <string>
#include <vector>

void HelpScreen::Draw(StateMachine& machine, ncpp::Plane& stdplane) {
    (void)machine;
    static const std::vector<std::string> kLines{
        "j / k, arrows      move down / up",
        "gg / Home          first entry",
        "G / End            last entry",
        "PgUp / PgDn        move one page",
        "l, Right, Enter    enter selected directory",
        "h, Left            go to parent directory",
        "a s d f ...        enter the labelled directory, also while searching",
        ".                  choose current directory and exit",
        "/                  search (Enter keeps filter, Esc clears)",
        "_                  clear search filter",
        "Ctrl+f / Ctrl+d    frecent / directory list",
        "q, Esc             quit without changing directory",
        "",
        "Press ? or Esc to close this help",
    };

    ClearAndCenterLines(stdplane, kLines);
    stdplane.perimeter_rounded(0, 0, 0);
    PutCentered(stdplane, 0, " Keys ");
}
