#pragma once
#include <iostream>
#include <string>

#include "value.hpp"

// Output capability injected into the evaluator.
class Presenter {
   public:
    virtual ~Presenter() = default;

    virtual void present(const Value& v) = 0;
    virtual void present_error(const std::string& message) = 0;
    // print's browser-error variant
    virtual void present_browser_error(const Value& v) = 0;
};

// Writes values to `out` and errors to `err`, coloured when attached to a terminal.
class ConsolePresenter : public Presenter {
   public:
    ConsolePresenter(std::ostream& out = std::cout, std::ostream& err = std::cerr);

    void present(const Value& v) override;
    void present_error(const std::string& message) override;
    void present_browser_error(const Value& v) override;

   private:
    std::ostream& out_;
    std::ostream& err_;
    bool color_out_;
    bool color_err_;
};
