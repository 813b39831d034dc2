#pragma once

#include <string>
#include <vector>

#include "Presenter.hpp"
#include "value.hpp"

// Collects everything the evaluator would have shown.
class RecordingPresenter : public Presenter {
   public:
    std::vector<std::string> printed;
    std::vector<std::string> errors;
    int browser_errors = 0;

    void present(const Value& v) override {
        printed.push_back(value_to_string(v));
    }
    void present_error(const std::string& message) override {
        errors.push_back(message);
    }
    void present_browser_error(const Value&) override {
        ++browser_errors;
    }

    size_t events() const { return printed.size() + browser_errors; }

    bool error_mentions(const std::string& needle) const {
        for (const auto& e : errors) {
            if (e.find(needle) != std::string::npos) return true;
        }
        return false;
    }
};
