#include <plume/error.hpp>

namespace plume {

const char* PlumeError::code_name(Code c) {
    switch (c) {
        case UnterminatedPlaceholder: return "UnterminatedPlaceholder";
        case UnterminatedLoop:        return "UnterminatedLoop";
        case UnmatchedLoopEnd:        return "UnmatchedLoopEnd";
        case InvalidSyntax:           return "InvalidSyntax";
        case UnknownKey:              return "UnknownKey";
        case TypeMismatch:            return "TypeMismatch";
        case Timeout:                 return "Timeout";
        case IO:                      return "IO";
        case Parse:                   return "Parse";
        case Config:                  return "Config";
        case InvalidArg:              return "InvalidArg";
    }
    return "Unknown";
}

PlumeError PlumeError::unknown_key(const std::string& path) {
    PlumeError e{UnknownKey, "undefined key '" + path + "'"};
    e.path = path;
    return e;
}

PlumeError PlumeError::type_mismatch(const std::string& path,
                                     const std::string& expected,
                                     const std::string& actual) {
    PlumeError e{TypeMismatch,
        "'" + path + "' is " + actual + ", expected " + expected};
    e.path = path;
    e.expected = expected;
    e.actual = actual;
    if (expected == "List") {
        e.hint = "only lists can be iterated with {{each " + path + " |item|}}";
    } else if (actual == "List") {
        e.hint = "iterate it with {{each " + path + " |item|}} ... {{/each}}";
    } else if (actual == "Table") {
        e.hint = "use a nested key such as " + path + ".field";
    }
    return e;
}

PlumeError PlumeError::timeout(std::size_t max_steps) {
    return PlumeError{Timeout,
        "template rendering exceeded the step budget of " +
            std::to_string(max_steps),
        "check for runaway {{each}} nesting or raise [render] max-steps"};
}

PlumeError& PlumeError::at(const std::string& f, int l, int c, std::size_t off) {
    file = f;
    line = l;
    col = c;
    offset = off;
    return *this;
}

std::string PlumeError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
            if (col > 0) {
                result += ":";
                result += std::to_string(col);
            }
        }
    }

    return result;
}

} // namespace plume
