#include "Presenter.hpp"
#include "UselessError.hpp"
#include "colors.hpp"

ConsolePresenter::ConsolePresenter(std::ostream& out, std::ostream& err)
    : out_(out),
      err_(err),
      color_out_(&out == &std::cout && Color::supports_color(STDOUT_FILENO)),
      color_err_(&err == &std::cerr && Color::supports_color(STDERR_FILENO)) {}

void ConsolePresenter::present(const Value& v) {
    out_ << value_to_string(v) << std::endl;
}

void ConsolePresenter::present_error(const std::string& message) {
    err_ << Color::paint(message, Color::bright_red, color_err_) << std::endl;
}

void ConsolePresenter::present_browser_error(const Value& v) {
    out_ << Color::paint("🌐 " + messages::browser_error, Color::yellow, color_out_) << std::endl;
    out_ << Color::paint("   (it was going to show: " + value_to_string(v) + ")", Color::bright_black, color_out_) << std::endl;
}
