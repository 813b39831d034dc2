#pragma once
#include <optional>
#include <stdexcept>
#include <string>

#include "token.hpp"

// Every way a useless program can go wrong.
enum class ErrorKind {
    NameNotFound,
    TypeMismatch,
    DivisionByZero,
    IndexOutOfVacation,
    EmptyRecordAccess,
    PromiseAbandoned,
    PromiseRejected,
    SaveAlwaysFails,
    TeapotError,
    TaskFailedSuccessfully,
    CreativeBreakage,
    PerfectlyWrong,
    StylePoints,
    CoffeeBreak
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NameNotFound: return "NameNotFound";
        case ErrorKind::TypeMismatch: return "TypeMismatch";
        case ErrorKind::DivisionByZero: return "DivisionByZero";
        case ErrorKind::IndexOutOfVacation: return "IndexOutOfVacation";
        case ErrorKind::EmptyRecordAccess: return "EmptyRecordAccess";
        case ErrorKind::PromiseAbandoned: return "PromiseAbandoned";
        case ErrorKind::PromiseRejected: return "PromiseRejected";
        case ErrorKind::SaveAlwaysFails: return "SaveAlwaysFails";
        case ErrorKind::TeapotError: return "TeapotError";
        case ErrorKind::TaskFailedSuccessfully: return "TaskFailedSuccessfully";
        case ErrorKind::CreativeBreakage: return "CreativeBreakage";
        case ErrorKind::PerfectlyWrong: return "PerfectlyWrong";
        case ErrorKind::StylePoints: return "StylePoints";
        case ErrorKind::CoffeeBreak: return "CoffeeBreak";
    }
    return "UnknownError";
}

// Fatal kinds bypass every try/catch.
inline bool is_fatal(ErrorKind kind) {
    return kind == ErrorKind::SaveAlwaysFails;
}

struct ErrorValue {
    ErrorKind kind = ErrorKind::TypeMismatch;
    std::string message;
    std::optional<TokenLocation> span;
};

class ChaosError : public std::runtime_error {
   public:
    ChaosError(ErrorKind kind, const std::string& message, const TokenLocation& loc)
        : std::runtime_error(format_message(kind, message, &loc)), err_{kind, message, loc} {}

    // Errors raised outside any source position (scheduler, program end).
    ChaosError(ErrorKind kind, const std::string& message)
        : std::runtime_error(format_message(kind, message, nullptr)), err_{kind, message, std::nullopt} {}

    explicit ChaosError(const ErrorValue& err)
        : std::runtime_error(format_message(err.kind, err.message, err.span ? &*err.span : nullptr)), err_(err) {}

    const ErrorValue& error() const noexcept { return err_; }
    ErrorKind kind() const noexcept { return err_.kind; }
    bool fatal() const noexcept { return is_fatal(err_.kind); }

   private:
    ErrorValue err_;

    static std::string format_message(ErrorKind kind, const std::string& message, const TokenLocation* loc) {
        if (!loc) {
            return std::string(error_kind_name(kind)) + "\n" + message;
        }
        return std::string(error_kind_name(kind)) + " at " + loc->to_string() + "\n" +
            message + "\n" +
            " --> Traced at:\n" +
            loc->get_line_trace();
    }
};

namespace messages {
inline const std::string division_by_zero = "Division by zero. Congratulations, you've broken mathematics! 🎉";
inline const std::string browser_error =
    "Failed to open browser tab. Either your internet is as reliable as a chocolate teapot, or the universe is working exactly as intended.";
inline const std::string save_error = "Saving is overrated. Maybe try writing it down with a crayon instead? 📝";
inline const std::string task_failed_successfully = "Task failed successfully! Error code: 42";
inline const std::string perfectly_wrong = "Your code is running exactly as intended... which means everything is wrong";
inline const std::string teapot = "Error 418: I'm a teapot. Yes, really. No, I won't make coffee. ☕";
inline const std::string style_points = "Your code is so bad, it's good. Task failed successfully with style! 🎨";
inline const std::string creative_breakage = "Congratulations! You've discovered a new way to break things! 🎈";
inline const std::string math_is_hard = "Math is hard, let's go shopping! 🛍️";

inline std::string coffee_break(const std::string& function) {
    return "Function " + function + " went to get coffee ☕";
}
inline const std::string empty_record = "This record is emptier than a fridge on release day. There is nothing to access 🕳️";
}  // namespace messages
