#include "ChaosPolicy.hpp"

#include <cmath>
#include <iostream>
#include <sstream>

#include "UselessError.hpp"
#include "colors.hpp"

static uint64_t fresh_seed() {
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd());
}

ChaosRng::ChaosRng(std::optional<uint64_t> seed)
    : seed_(seed ? *seed : fresh_seed()), engine_(seed_) {}

double ChaosRng::next_unit() {
    ++draws_;
    // 53 random bits -> [0, 1)
    return static_cast<double>(engine_() >> 11) * 0x1.0p-53;
}

size_t ChaosRng::next_index(size_t n) {
    ++draws_;
    return static_cast<size_t>(engine_() % n);
}

bool ChaosRng::next_bool() {
    return next_unit() < 0.5;
}

const char* arith_op_name(ArithOp op) {
    switch (op) {
        case ArithOp::Add: return "add";
        case ArithOp::Subtract: return "subtract";
        case ArithOp::Multiply: return "multiply";
        case ArithOp::Divide: return "divide";
    }
    return "?";
}

ChaosPolicy::ChaosPolicy(ChaosRng& rng, ChaosOptions options)
    : rng_(rng), options_(options) {}

void ChaosPolicy::trace(const std::string& point, const std::string& outcome) const {
    if (!options_.trace) return;
    bool color = Color::supports_color(STDERR_FILENO);
    std::cerr << Color::paint("[chaos] ", Color::bright_black, color) << point << " -> " << outcome << "\n";
}

Value ChaosPolicy::maybe_randomize_expression_result(const Value& v) {
    if (rng_.next_unit() >= chaos_odds::randomize_expression) return v;
    bool coin = rng_.next_bool();
    trace("expression", coin ? "random true" : "random false");
    return coin;
}

BooleanFlip ChaosPolicy::draw_boolean_flip() {
    double x = rng_.next_unit();
    if (x < chaos_odds::flip_opposite) return BooleanFlip::Opposite;
    x -= chaos_odds::flip_opposite;
    if (x < chaos_odds::flip_stringified) return BooleanFlip::Stringified;
    x -= chaos_odds::flip_stringified;
    if (x < chaos_odds::flip_numeric) return BooleanFlip::Numeric;
    return BooleanFlip::Unchanged;
}

Value ChaosPolicy::maybe_flip_boolean(bool b) {
    switch (draw_boolean_flip()) {
        case BooleanFlip::Opposite:
            trace("boolean", "opposite");
            return !b;
        case BooleanFlip::Stringified:
            trace("boolean", "stringified");
            return std::string(b ? "false" : "true");
        case BooleanFlip::Numeric:
            trace("boolean", "numeric");
            return b ? 0.0 : 1.0;
        case BooleanFlip::Unchanged:
            break;
    }
    return b;
}

ArithOp ChaosPolicy::pick_arith_alt(ArithOp requested) {
    ArithOp chosen = requested;
    switch (requested) {
        case ArithOp::Add:
            chosen = rng_.next_unit() < chaos_odds::add_becomes_subtract ? ArithOp::Subtract : ArithOp::Multiply;
            break;
        case ArithOp::Multiply:
            chosen = rng_.next_unit() < chaos_odds::multiply_becomes_divide ? ArithOp::Divide : ArithOp::Add;
            break;
        case ArithOp::Subtract:
        case ArithOp::Divide:
            break;
    }
    trace(arith_op_name(requested), arith_op_name(chosen));
    return chosen;
}

std::optional<size_t> ChaosPolicy::pick_container_index(size_t len, int64_t requested) {
    if (requested < 0 || static_cast<uint64_t>(requested) >= len) return std::nullopt;
    if (rng_.next_unit() < chaos_odds::random_container_index) {
        size_t picked = rng_.next_index(len);
        trace("index " + std::to_string(requested), "index " + std::to_string(picked));
        return picked;
    }
    return static_cast<size_t>(requested);
}

std::optional<std::string> ChaosPolicy::pick_field(const RecordValue& record, const std::string& requested) {
    if (record.empty()) return std::nullopt;
    if (rng_.next_unit() < chaos_odds::random_record_field) {
        const std::string& picked = record.fields[rng_.next_index(record.size())].first;
        trace("access \"" + requested + "\"", "\"" + picked + "\"");
        return picked;
    }
    return requested;
}

bool ChaosPolicy::surface_type_mismatch() {
    bool surface = rng_.next_unit() < chaos_odds::surface_type_mismatch;
    trace("type mismatch", surface ? "surface" : "random boolean");
    return surface;
}

bool ChaosPolicy::random_boolean() {
    return rng_.next_bool();
}

bool ChaosPolicy::browser_error_on_print() {
    bool hit = rng_.next_unit() < chaos_odds::print_browser_error;
    if (hit) trace("print", "browser error");
    return hit;
}

bool ChaosPolicy::teapot() {
    bool hit = rng_.next_unit() < chaos_odds::teapot;
    if (hit) trace("primitive", "teapot");
    return hit;
}

Settlement ChaosPolicy::settle_pending() {
    double x = rng_.next_unit();
    if (x < chaos_odds::promise_resolve) return Settlement::Resolve;
    if (x < chaos_odds::promise_resolve + chaos_odds::promise_abandon) return Settlement::Abandon;
    return Settlement::Stay;
}

bool ChaosPolicy::mind_change_at_creation() {
    return rng_.next_unit() < chaos_odds::promise_mind_change;
}

bool ChaosPolicy::flip_now() {
    return rng_.next_unit() < chaos_odds::promise_flip;
}

bool ChaosPolicy::mischief_draw(double odds, const char* point) {
    if (!options_.mischief) return false;
    bool hit = rng_.next_unit() < odds;
    if (hit) trace(point, "mischief");
    return hit;
}

bool ChaosPolicy::mischief_teapot_at_start() {
    return mischief_draw(chaos_odds::mischief_teapot_at_start, "program start");
}

bool ChaosPolicy::mischief_party_number() {
    return mischief_draw(chaos_odds::mischief_party_number, "number literal");
}

bool ChaosPolicy::mischief_identifier_vacation() {
    return mischief_draw(chaos_odds::mischief_identifier_vacation, "identifier");
}

bool ChaosPolicy::mischief_lost_binding() {
    return mischief_draw(chaos_odds::mischief_lost_binding, "let");
}

bool ChaosPolicy::mischief_loop_failure() {
    return mischief_draw(chaos_odds::mischief_loop_failure, "loop");
}

bool ChaosPolicy::mischief_creative_else() {
    return mischief_draw(chaos_odds::mischief_creative_else, "else");
}

bool ChaosPolicy::mischief_perfectly_wrong() {
    return mischief_draw(chaos_odds::mischief_perfectly_wrong, "program end");
}

bool ChaosPolicy::mischief_style_points() {
    return mischief_draw(chaos_odds::mischief_style_points, "print");
}

CallMischief ChaosPolicy::mischief_function_call() {
    if (!options_.mischief) return CallMischief::None;
    double x = rng_.next_unit();
    if (x < chaos_odds::mischief_call_null) {
        trace("call", "null");
        return CallMischief::ReturnNull;
    }
    if (x < chaos_odds::mischief_call_task_failed) {
        trace("call", "task failed successfully");
        return CallMischief::TaskFailed;
    }
    trace("call", "coffee break");
    return CallMischief::CoffeeBreak;
}

std::string ChaosPolicy::pick_save_message() {
    double x = rng_.next_unit();
    if (x < chaos_odds::save_plain) return messages::save_error;
    if (x < chaos_odds::save_creative) return messages::creative_breakage;
    return messages::style_points;
}

std::string party_text(double n) {
    static const std::string party = "🎉🎊🎈";
    double reps = std::floor(std::fabs(n));
    if (!(reps < 64.0)) reps = 64.0;  // also catches NaN
    std::string out;
    for (int i = 0; i < static_cast<int>(reps); ++i) out += party;
    return out;
}
