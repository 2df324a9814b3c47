#include "tinydc/Commands.hpp"

#include <optional>

#include "tinydc/FrecencyIndex.hpp"

namespace {
const char kPosixInit[] = R"sh(dc() {
    local dir
    dir="$(command tinydc)" && [ -n "$dir" ] && cd -- "$dir"
}

z() {
    local dir
    dir="$(command tinydc z "$@")" && cd -- "$dir"
}

_tinydc_hook() {
    if [ "$PWD" != "$_TINYDC_LAST" ]; then
        _TINYDC_LAST="$PWD"
        command tinydc push "$PWD" >/dev/null 2>&1
    fi
}
)sh";

const char kBashHook[] = R"sh(case ";$PROMPT_COMMAND;" in
    *";_tinydc_hook;"*) ;;
    *) PROMPT_COMMAND="_tinydc_hook${PROMPT_COMMAND:+;$PROMPT_COMMAND}" ;;
esac
)sh";

const char kZshHook[] = R"sh(autoload -Uz add-zsh-hook
add-zsh-hook chpwd _tinydc_hook
)sh";

const char kFishInit[] = R"sh(function dc
    set -l dir (command tinydc)
    and test -n "$dir"
    and cd -- $dir
end

function z
    set -l dir (command tinydc z $argv)
    and cd -- $dir
end

function __tinydc_hook --on-variable PWD
    command tinydc push "$PWD" >/dev/null 2>&1
end
)sh";
}

int RunPush(FrecencyIndex& index, const std::string& path, std::ostream& err) {
    if (!index.RecordVisit(path)) {
        err << "Warning: " << path << " is not a directory that can be indexed; not recorded.\n";
        return 0;
    }
    if (!index.Flush()) {
        err << "Error: could not write index " << index.File() << "\n";
        return 1;
    }
    return 0;
}

int RunJump(const FrecencyIndex& index, const std::string& query, std::ostream& out) {
    std::optional<std::string> match = index.BestMatch(query);
    if (!match) {
        return 1;
    }
    out << *match << "\n";
    return 0;
}

int RunPrune(FrecencyIndex& index, std::ostream& err) {
    index.RemoveStale();
    if (!index.Flush()) {
        err << "Error: could not write index " << index.File() << "\n";
        return 1;
    }
    return 0;
}

int RunInit(const std::string& shell, std::ostream& out, std::ostream& err) {
    if (shell == "bash") {
        out << kPosixInit << "\n" << kBashHook;
        return 0;
    }
    if (shell == "zsh") {
        out << kPosixInit << "\n" << kZshHook;
        return 0;
    }
    if (shell == "fish") {
        out << kFishInit;
        return 0;
    }
    err << "Unknown shell '" << shell << "'; expected bash, zsh or fish.\n";
    return 2;
}
